#pragma once

#include "ast.h"
#include "mapper.h"
#include "mappers.h"
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace lateval {

// ============================================================================
// Component Types
// ============================================================================

enum class ComponentType {
    Fixed,
    Offset,
    Const,
    IID,
    Other
};

// Parse "fixed", "offset", "const", "iid"; any other name is ComponentType::Other
ComponentType parseComponentType(const std::string& name);
std::string componentTypeToString(ComponentType type);

// True for types that carry no latent state of their own (offset, const)
inline bool isOffsetType(ComponentType type) {
    return type == ComponentType::Offset || type == ComponentType::Const;
}

// ============================================================================
// Component Definition
// ============================================================================

/**
 * @brief Raw definition of one model component.
 *
 * Input expressions are kept as source text; an empty `main` means the
 * constant 1, empty `group`/`replicate` mean a single block and an
 * empty `weights` means no scaling.
 */
struct ComponentDefinition {
    std::string label;
    ComponentType type = ComponentType::Fixed;
    std::string model;          // Solver model name; derived from type when empty
    std::string main;
    std::string group;
    std::string replicate;
    std::string weights;
    MapperPtr mapper;           // Main mapper
    size_t nGroup = 1;
    size_t nReplicate = 1;
};

// ============================================================================
// Component
// ============================================================================

/**
 * @brief A named model effect: input expressions plus a mapper pipeline.
 *
 * The main mapper is wrapped in a ComponentMapper handling the
 * group/replicate blocks and weights. Immutable after construction.
 */
class Component {
public:
    explicit Component(const ComponentDefinition& definition);

    const std::string& label() const { return label_; }
    ComponentType type() const { return type_; }
    const std::string& model() const { return model_; }

    // Full pipeline: main mapper, group/replicate blocks, weights
    const MapperPtr& mapper() const { return mapper_; }

    // Input expressions; null when not given
    const ExprPtr& mainExpr() const { return main_; }
    const ExprPtr& groupExpr() const { return group_; }
    const ExprPtr& replicateExpr() const { return replicate_; }
    const ExprPtr& weightsExpr() const { return weights_; }

    size_t latentSize() const { return mapper_->latentSize(); }

    // Term contributed to the solver formula, e.g. f(u, model = "iid")
    std::string formulaTerm() const;

private:
    std::string label_;
    ComponentType type_;
    std::string model_;
    MapperPtr mapper_;
    ExprPtr main_;
    ExprPtr group_;
    ExprPtr replicate_;
    ExprPtr weights_;
};

// ============================================================================
// Component List
// ============================================================================

/**
 * @brief Ordered, label-unique component collection.
 *
 * Insertion order is the canonical order for every downstream operation.
 */
class ComponentList {
public:
    ComponentList() = default;
    ComponentList(std::initializer_list<ComponentDefinition> definitions);

    // Throws ConfigurationError on a duplicate label
    void add(Component component);
    void add(const ComponentDefinition& definition) { add(Component(definition)); }

    bool has(const std::string& label) const;
    const Component* find(const std::string& label) const;

    // Throws ConfigurationError "Unknown component label" when absent
    const Component& get(const std::string& label) const;

    std::vector<std::string> labels() const;

    size_t size() const { return components_.size(); }
    bool empty() const { return components_.empty(); }

    std::vector<Component>::const_iterator begin() const { return components_.begin(); }
    std::vector<Component>::const_iterator end() const { return components_.end(); }

private:
    std::vector<Component> components_;
    std::map<std::string, size_t> index_;
};

}  // namespace lateval

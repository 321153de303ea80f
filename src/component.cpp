#include "lateval/component.h"
#include "lateval/errors.h"
#include "lateval/parser.h"

namespace lateval {

ComponentType parseComponentType(const std::string& name) {
    if (name == "fixed" || name == "linear") return ComponentType::Fixed;
    if (name == "offset") return ComponentType::Offset;
    if (name == "const") return ComponentType::Const;
    if (name == "iid") return ComponentType::IID;
    return ComponentType::Other;
}

std::string componentTypeToString(ComponentType type) {
    switch (type) {
        case ComponentType::Fixed: return "fixed";
        case ComponentType::Offset: return "offset";
        case ComponentType::Const: return "const";
        case ComponentType::IID: return "iid";
        case ComponentType::Other: return "other";
    }
    return "other";
}

static ExprPtr parseOptional(const std::string& source) {
    if (source.empty()) return nullptr;
    return parseExpression(source);
}

// ============================================================================
// Component
// ============================================================================

Component::Component(const ComponentDefinition& definition)
    : label_(definition.label), type_(definition.type), model_(definition.model) {
    if (label_.empty()) {
        throw ConfigurationError("Component label must not be empty");
    }
    if (!definition.mapper) {
        throw ConfigurationError("Component '" + label_ + "' has no mapper");
    }
    if (model_.empty()) {
        switch (type_) {
            case ComponentType::Fixed: model_ = "linear"; break;
            case ComponentType::Offset: model_ = "offset"; break;
            case ComponentType::Const: model_ = "const"; break;
            case ComponentType::IID: model_ = "iid"; break;
            case ComponentType::Other:
                throw ConfigurationError("Component '" + label_ + "' needs a model name");
        }
    }

    mapper_ = std::make_shared<ComponentMapper>(definition.mapper, definition.nGroup, definition.nReplicate);
    main_ = parseOptional(definition.main);
    group_ = parseOptional(definition.group);
    replicate_ = parseOptional(definition.replicate);
    weights_ = parseOptional(definition.weights);
}

std::string Component::formulaTerm() const {
    switch (type_) {
        case ComponentType::Fixed: return label_;
        case ComponentType::Offset:
        case ComponentType::Const: return "offset(" + label_ + ")";
        case ComponentType::IID: return "f(" + label_ + ", model = \"iid\")";
        case ComponentType::Other: break;
    }
    return "f(" + label_ + ", model = \"" + model_ + "\")";
}

// ============================================================================
// ComponentList
// ============================================================================

ComponentList::ComponentList(std::initializer_list<ComponentDefinition> definitions) {
    for (const auto& definition : definitions) {
        add(definition);
    }
}

void ComponentList::add(Component component) {
    if (index_.count(component.label())) {
        throw ConfigurationError("Duplicate component label '" + component.label() + "'");
    }
    index_[component.label()] = components_.size();
    components_.push_back(std::move(component));
}

bool ComponentList::has(const std::string& label) const {
    return index_.count(label) > 0;
}

const Component* ComponentList::find(const std::string& label) const {
    auto it = index_.find(label);
    if (it == index_.end()) return nullptr;
    return &components_[it->second];
}

const Component& ComponentList::get(const std::string& label) const {
    const Component* component = find(label);
    if (!component) {
        throw ConfigurationError("Unknown component label '" + label + "'");
    }
    return *component;
}

std::vector<std::string> ComponentList::labels() const {
    std::vector<std::string> result;
    result.reserve(components_.size());
    for (const auto& component : components_) {
        result.push_back(component.label());
    }
    return result;
}

}  // namespace lateval

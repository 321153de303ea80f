#pragma once

#include "component.h"
#include "data.h"
#include "random.h"
#include "value.h"
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <variant>

namespace lateval {

// ============================================================================
// Evaluation Scope
// ============================================================================

/**
 * @brief Callable `<label>_eval` binding for one component.
 */
struct ComponentEvaluator {
    const Component* component = nullptr;
};

using Binding = std::variant<Value, ComponentEvaluator>;

/**
 * @brief Symbol table of one evaluation call.
 *
 * Names are bound either to a value or to a component evaluator.
 * Rebinding a name replaces the previous binding.
 */
class EvaluationScope {
public:
    void bind(const std::string& name, Value value);
    void bindEvaluator(const std::string& name, const Component& component);

    // Bind every data field by name and the whole set as `.data.`
    void bindData(const DataSet& data);

    bool has(const std::string& name) const { return bindings_.count(name) > 0; }
    bool hasValue(const std::string& name) const;

    // Null when the name is unbound
    const Binding* lookup(const std::string& name) const;

    // Throws EvaluationError "Undefined name" when unbound or not a value
    const Value& value(const std::string& name) const;

    size_t size() const { return bindings_.size(); }

private:
    std::map<std::string, Binding> bindings_;
};

// ============================================================================
// IID Cache
// ============================================================================

/**
 * @brief Deviates substituted for invalid IID outputs, keyed by
 * (component label, lookup key).
 *
 * The cache belongs to one state: reset() discards every deviate when
 * the active state changes.
 */
class IIDCache {
public:
    void reset(size_t stateIndex);
    size_t stateIndex() const { return stateIndex_; }

    bool contains(const std::string& label, const std::string& key) const;

    // Cached deviate for the key, drawing and storing one on first use
    double get(const std::string& label, const std::string& key, const std::function<double()>& draw);

    size_t size() const { return values_.size(); }

private:
    std::map<std::pair<std::string, std::string>, double> values_;
    size_t stateIndex_ = 0;
};

// ============================================================================
// Evaluation Context
// ============================================================================

/**
 * @brief Per-call evaluation state threaded through every nested
 * evaluator invocation.
 */
struct EvaluationContext {
    EvaluationScope scope;
    IIDCache iidCache;
    RandomSource* random = nullptr;
    size_t activeStateIndex = 0;

    explicit EvaluationContext(RandomSource* source = nullptr)
        : random(source ? source : &processRandomSource()) {}

    // Make state k active; clears the IID cache
    void beginState(size_t k) {
        activeStateIndex = k;
        iidCache.reset(k);
    }
};

}  // namespace lateval

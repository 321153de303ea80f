#include "lateval/scope.h"
#include "lateval/errors.h"

namespace lateval {

// ============================================================================
// EvaluationScope
// ============================================================================

void EvaluationScope::bind(const std::string& name, Value value) {
    bindings_[name] = std::move(value);
}

void EvaluationScope::bindEvaluator(const std::string& name, const Component& component) {
    bindings_[name] = ComponentEvaluator{&component};
}

void EvaluationScope::bindData(const DataSet& data) {
    for (const auto& [name, value] : data.fields()) {
        bind(name, value);
    }
    bind(".data.", data.toValue());
}

bool EvaluationScope::hasValue(const std::string& name) const {
    auto it = bindings_.find(name);
    return it != bindings_.end() && std::holds_alternative<Value>(it->second);
}

const Binding* EvaluationScope::lookup(const std::string& name) const {
    auto it = bindings_.find(name);
    if (it == bindings_.end()) return nullptr;
    return &it->second;
}

const Value& EvaluationScope::value(const std::string& name) const {
    auto it = bindings_.find(name);
    if (it == bindings_.end()) {
        throw EvaluationError("Undefined name: " + name);
    }
    if (!std::holds_alternative<Value>(it->second)) {
        throw EvaluationError("Name '" + name + "' is a component evaluator, call it as " + name + "(...)");
    }
    return std::get<Value>(it->second);
}

// ============================================================================
// IIDCache
// ============================================================================

void IIDCache::reset(size_t stateIndex) {
    values_.clear();
    stateIndex_ = stateIndex;
}

bool IIDCache::contains(const std::string& label, const std::string& key) const {
    return values_.count({label, key}) > 0;
}

double IIDCache::get(const std::string& label, const std::string& key, const std::function<double()>& draw) {
    auto it = values_.find({label, key});
    if (it != values_.end()) return it->second;
    double value = draw();
    values_.emplace(std::make_pair(label, key), value);
    return value;
}

}  // namespace lateval

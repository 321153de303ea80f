#include "lateval/model.h"
#include "lateval/errors.h"
#include "lateval/inclusion.h"
#include <nlohmann/json.hpp>
#include <iomanip>
#include <set>
#include <sstream>

namespace lateval {

// ============================================================================
// Model
// ============================================================================

Model Model::build(ComponentList components, std::vector<Likelihood> likelihoods) {
    Model model;
    model.components_ = std::move(components);
    model.likelihoods_ = std::move(likelihoods);

    const std::vector<std::string> labels = model.components_.labels();
    std::set<std::string> used;
    if (model.likelihoods_.empty()) {
        used.insert(labels.begin(), labels.end());
    }
    for (const auto& likelihood : model.likelihoods_) {
        model.linear_ = model.linear_ && likelihood.linear;
        for (const auto& label : resolveInclusion(labels, likelihood.include, likelihood.exclude)) {
            used.insert(label);
        }
    }

    std::ostringstream formula;
    formula << "BRU_response ~ -1";
    for (const auto& component : model.components_) {
        if (!used.count(component.label())) continue;
        model.included_.push_back(component.label());
        if (!model.linear_ && isOffsetType(component.type())) continue;
        formula << " + " << component.formulaTerm();
    }
    model.formula_ = formula.str();
    return model;
}

std::string Model::summary() const {
    std::ostringstream oss;
    oss << "Model formula: " << formula_ << "\n";
    oss << "Components:\n";
    for (const auto& component : components_) {
        oss << "  " << std::left << std::setw(16) << component.label()
            << " type=" << std::setw(7) << componentTypeToString(component.type())
            << " model=" << std::setw(10) << component.model()
            << " mapper=" << component.mapper()->name()
            << " n=" << component.latentSize() << "\n";
    }
    oss << "Likelihoods: " << likelihoods_.size() << (linear_ ? " (all linear)" : " (nonlinear)") << "\n";
    return oss.str();
}

std::string Model::toJSON() const {
    nlohmann::json j;
    j["formula"] = formula_;
    j["linear"] = linear_;
    j["included"] = included_;

    nlohmann::json comps = nlohmann::json::array();
    for (const auto& component : components_) {
        nlohmann::json c;
        c["label"] = component.label();
        c["type"] = componentTypeToString(component.type());
        c["model"] = component.model();
        c["mapper"] = component.mapper()->name();
        c["latentSize"] = component.latentSize();
        c["linear"] = component.mapper()->isLinear();
        comps.push_back(c);
    }
    j["components"] = comps;

    nlohmann::json lhoods = nlohmann::json::array();
    for (const auto& likelihood : likelihoods_) {
        nlohmann::json l;
        l["family"] = likelihood.family;
        l["linear"] = likelihood.linear;
        l["components"] = resolveInclusion(components_.labels(), likelihood.include, likelihood.exclude);
        lhoods.push_back(l);
    }
    j["likelihoods"] = lhoods;
    return j.dump(2);
}

// ============================================================================
// Per-Likelihood Helpers
// ============================================================================

InputLists evaluateInputs(const Model& model, const std::vector<Likelihood>& likelihoods) {
    const std::vector<std::string> labels = model.components().labels();
    InputLists inputs;
    inputs.reserve(likelihoods.size());
    for (const auto& likelihood : likelihoods) {
        auto used = resolveInclusion(labels, likelihood.include, likelihood.exclude);
        inputs.push_back(evaluateComponentInputs(model.components(), likelihood.data, used));
    }
    return inputs;
}

std::vector<SimplifiedMappers> simplifyModel(const Model& model, const InputLists& inputs) {
    std::vector<SimplifiedMappers> result;
    result.reserve(inputs.size());
    for (const auto& input : inputs) {
        result.push_back(simplifyComponents(model.components(), input));
    }
    return result;
}

std::vector<SimplifiedMappers> linearizeModel(const Model& model, const InputLists& inputs, const State& state) {
    std::vector<SimplifiedMappers> result;
    result.reserve(inputs.size());
    for (const auto& input : inputs) {
        result.push_back(linearizeComponents(model.components(), input, state));
    }
    return result;
}

StateSequence evaluateState(const Model& model,
                            const FittedResult* result,
                            const std::string& property,
                            size_t n,
                            uint64_t seed,
                            const std::string& numThreads,
                            bool internalHyperpar) {
    return evaluateState(model.components(), result, property, n, seed, numThreads, internalHyperpar);
}

}  // namespace lateval

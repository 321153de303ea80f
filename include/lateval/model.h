#pragma once

#include "component.h"
#include "data.h"
#include "input.h"
#include "simplifier.h"
#include "state.h"
#include <optional>
#include <string>
#include <vector>

namespace lateval {

// ============================================================================
// Likelihood
// ============================================================================

/**
 * @brief Observation model attached to the joint model.
 *
 * Only the parts the evaluation engine needs: linearity of the predictor,
 * the components it uses and the data its inputs are evaluated against.
 */
struct Likelihood {
    std::string family = "gaussian";
    bool linear = true;
    std::optional<std::vector<std::string>> include;
    std::optional<std::vector<std::string>> exclude;
    DataSet data;
};

// ============================================================================
// Model
// ============================================================================

/**
 * @brief Components plus the joint formula handed to the external solver.
 */
class Model {
public:
    /**
     * @brief Build the joint model.
     *
     * The formula starts from `BRU_response ~ -1` and gains one term per
     * component used by any likelihood, in component order. Offset and
     * const components become offset() terms only when every likelihood
     * is linear. Without likelihoods every component is used.
     */
    static Model build(ComponentList components, std::vector<Likelihood> likelihoods = {});

    const ComponentList& components() const { return components_; }
    const std::vector<Likelihood>& likelihoods() const { return likelihoods_; }
    const std::string& formula() const { return formula_; }

    // Union of the components used by the likelihoods, in component order
    const std::vector<std::string>& includedLabels() const { return included_; }

    bool isLinear() const { return linear_; }

    // Component table for printing
    std::string summary() const;

    std::string toJSON() const;

private:
    ComponentList components_;
    std::vector<Likelihood> likelihoods_;
    std::vector<std::string> included_;
    std::string formula_;
    bool linear_ = true;
};

// ============================================================================
// Per-Likelihood Helpers
// ============================================================================

using InputLists = std::vector<InputMap>;

// Inputs of the components each likelihood uses, evaluated against its data
InputLists evaluateInputs(const Model& model, const std::vector<Likelihood>& likelihoods);

// simplifyComponents() for each likelihood's inputs
std::vector<SimplifiedMappers> simplifyModel(const Model& model, const InputLists& inputs);

// linearizeComponents() for each likelihood's inputs at a reference state
std::vector<SimplifiedMappers> linearizeModel(const Model& model, const InputLists& inputs, const State& state);

// evaluateState() over the model's components
StateSequence evaluateState(const Model& model,
                            const FittedResult* result,
                            const std::string& property = "mode",
                            size_t n = 1,
                            uint64_t seed = 0,
                            const std::string& numThreads = "",
                            bool internalHyperpar = false);

}  // namespace lateval

#pragma once

#include "config.h"
#include "data.h"
#include "effects.h"
#include "input.h"
#include "model.h"
#include "predictor.h"
#include "simplifier.h"
#include "state.h"
#include <string>
#include <variant>
#include <vector>

namespace lateval {

// ============================================================================
// Model Evaluation
// ============================================================================

/**
 * @brief Effects per state (no predictor) or predictor values.
 */
struct ModelEvaluation {
    std::variant<EffectsSequence, PredictorResult> node;
    std::vector<std::string> warnings;

    template<typename T>
    bool is() const { return std::holds_alternative<T>(node); }

    template<typename T>
    const T& as() const { return std::get<T>(node); }
};

/**
 * @brief Evaluate component effects and, optionally, a predictor.
 *
 * Inputs are evaluated from `data` unless given, and simplified unless
 * given; effects are computed when inputs are available. With an empty
 * predictor the effects are returned, otherwise the predictor result
 * with the effects bound by component label.
 *
 * @param inputs Precomputed inputs, or nullptr
 * @param simplified Precomputed simplified mappers, or nullptr
 * @throws ConfigurationError for empty states or unknown labels/format
 */
ModelEvaluation evaluateModel(const Model& model,
                              const StateSequence& states,
                              const DataSet& data,
                              const std::string& predictor = "",
                              const EvaluationOptions& options = EvaluationOptions(),
                              const InputMap* inputs = nullptr,
                              const SimplifiedMappers* simplified = nullptr);

/**
 * @brief evaluateState() with the options' property, sample count, seed
 * and threading, followed by evaluateModel().
 */
ModelEvaluation evaluateModel(const Model& model,
                              const FittedResult* result,
                              const DataSet& data,
                              const std::string& predictor = "",
                              const EvaluationOptions& options = EvaluationOptions());

}  // namespace lateval

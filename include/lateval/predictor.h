#pragma once

#include "ast.h"
#include "data.h"
#include "effects.h"
#include "model.h"
#include "random.h"
#include "state.h"
#include "value.h"
#include <Eigen/Dense>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lateval {

// ============================================================================
// Output Format
// ============================================================================

enum class OutputFormat {
    Auto,
    Matrix,
    List
};

// Throws ConfigurationError "Unknown output format" for anything else
OutputFormat parseOutputFormat(const std::string& text);
std::string outputFormatToString(OutputFormat format);

// ============================================================================
// Predictor Result
// ============================================================================

// One column per state, rows named from the first state's result
struct PredictorMatrix {
    Eigen::MatrixXd values;
    std::vector<std::string> rowNames;
};

// One slot per state
struct PredictorList {
    std::vector<Value> values;
};

struct PredictorResult {
    std::variant<PredictorMatrix, PredictorList> node;

    template<typename T>
    bool is() const { return std::holds_alternative<T>(node); }

    template<typename T>
    const T& as() const { return std::get<T>(node); }

    // Number of states
    size_t size() const;

    std::string toJSON() const;
};

// ============================================================================
// Predictor Evaluation
// ============================================================================

struct PredictorOptions {
    OutputFormat format = OutputFormat::Auto;
    std::optional<std::vector<std::string>> include;
    std::optional<std::vector<std::string>> exclude;
    uint64_t seed = 0;                 // Nonzero: reproducible IID deviates
    RandomSource* random = nullptr;    // Takes precedence over seed
    bool verbose = false;
};

/**
 * @brief Evaluate a predictor expression once per state.
 *
 * The scope holds the data fields, `.data.`, `<label>_latent`,
 * `<label>_eval(main, group, replicate, weights, state)` for every
 * included component present in the first state, the state's
 * hyperparameters and, when given, the precomputed effects by label.
 * IID deviates are cached per state.
 *
 * @param effects Precomputed effects, one entry per state, or empty
 * @throws ConfigurationError if states is empty
 * @throws EvaluationError for unbound names, unknown functions and
 *         evaluation failures
 */
PredictorResult evaluatePredictor(const Model& model,
                                  const StateSequence& states,
                                  const DataSet& data,
                                  const EffectsSequence& effects,
                                  const ExprPtr& predictor,
                                  const PredictorOptions& options = PredictorOptions());

// Parses `predictor` (a leading '~' is allowed) and evaluates it
PredictorResult evaluatePredictor(const Model& model,
                                  const StateSequence& states,
                                  const DataSet& data,
                                  const EffectsSequence& effects,
                                  const std::string& predictor,
                                  const PredictorOptions& options = PredictorOptions());

}  // namespace lateval

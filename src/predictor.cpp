#include "lateval/predictor.h"
#include "lateval/errors.h"
#include "lateval/evaluator.h"
#include "lateval/inclusion.h"
#include "lateval/parser.h"
#include "lateval/scope.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace lateval {

OutputFormat parseOutputFormat(const std::string& text) {
    if (text == "auto") return OutputFormat::Auto;
    if (text == "matrix") return OutputFormat::Matrix;
    if (text == "list") return OutputFormat::List;
    throw ConfigurationError("Unknown output format '" + text + "'");
}

std::string outputFormatToString(OutputFormat format) {
    switch (format) {
        case OutputFormat::Auto: return "auto";
        case OutputFormat::Matrix: return "matrix";
        case OutputFormat::List: return "list";
    }
    return "auto";
}

// ============================================================================
// PredictorResult
// ============================================================================

size_t PredictorResult::size() const {
    if (is<PredictorMatrix>()) {
        return static_cast<size_t>(as<PredictorMatrix>().values.cols());
    }
    return as<PredictorList>().values.size();
}

static nlohmann::json valueToJSON(const Value& value) {
    if (value.is<Text>()) {
        return value.as<Text>().values;
    }
    if (value.is<NamedList>()) {
        const auto& list = value.as<NamedList>();
        nlohmann::json j = nlohmann::json::object();
        for (size_t i = 0; i < list.items.size(); ++i) {
            std::string key = list.names[i].empty() ? std::to_string(i + 1) : list.names[i];
            j[key] = valueToJSON(list.items[i]);
        }
        return j;
    }
    const auto& num = value.as<Numeric>();
    nlohmann::json j = nlohmann::json::array();
    if (!num.isMatrix) {
        for (Eigen::Index i = 0; i < num.data.size(); ++i) j.push_back(num.data.data()[i]);
        return j;
    }
    for (Eigen::Index r = 0; r < num.data.rows(); ++r) {
        nlohmann::json row = nlohmann::json::array();
        for (Eigen::Index c = 0; c < num.data.cols(); ++c) row.push_back(num.data(r, c));
        j.push_back(row);
    }
    return j;
}

std::string PredictorResult::toJSON() const {
    nlohmann::json j;
    if (is<PredictorMatrix>()) {
        const auto& m = as<PredictorMatrix>();
        j["format"] = "matrix";
        j["rowNames"] = m.rowNames;
        nlohmann::json rows = nlohmann::json::array();
        for (Eigen::Index r = 0; r < m.values.rows(); ++r) {
            nlohmann::json row = nlohmann::json::array();
            for (Eigen::Index c = 0; c < m.values.cols(); ++c) row.push_back(m.values(r, c));
            rows.push_back(row);
        }
        j["values"] = rows;
    } else {
        j["format"] = "list";
        nlohmann::json values = nlohmann::json::array();
        for (const auto& v : as<PredictorList>().values) values.push_back(valueToJSON(v));
        j["values"] = values;
    }
    return j.dump(2);
}

// ============================================================================
// Predictor Evaluation
// ============================================================================

PredictorResult evaluatePredictor(const Model& model,
                                  const StateSequence& states,
                                  const DataSet& data,
                                  const EffectsSequence& effects,
                                  const ExprPtr& predictor,
                                  const PredictorOptions& options) {
    if (states.empty()) {
        throw ConfigurationError("Not enough information to evaluate the predictor: no states given");
    }
    if (!effects.empty() && effects.size() != states.size()) {
        throw ConfigurationError("Got effects for " + std::to_string(effects.size()) + " states, expected " +
                                 std::to_string(states.size()));
    }

    const ComponentList& components = model.components();
    const auto included = resolveInclusion(components.labels(), options.include, options.exclude);

    std::unique_ptr<EngineRandomSource> seeded;
    RandomSource* random = options.random;
    if (!random && options.seed != 0) {
        seeded = std::make_unique<EngineRandomSource>(options.seed);
        random = seeded.get();
    }

    EvaluationContext context(random);
    context.scope.bindData(data);
    for (const auto& label : included) {
        if (states[0].count(label)) {
            context.scope.bindEvaluator(label + "_eval", components.get(label));
        }
    }

    ExpressionEvaluator evaluator(context);
    OutputFormat format = options.format;
    const size_t n = states.size();
    PredictorMatrix matrix;
    PredictorList list;

    for (size_t k = 0; k < n; ++k) {
        context.beginState(k);

        for (const auto& [name, values] : states[k]) {
            if (components.has(name)) {
                context.scope.bind(name + "_latent", Value::vector(values));
            } else {
                context.scope.bind(name, Value::vector(values));
            }
        }
        if (!effects.empty()) {
            for (const auto& [name, values] : effects[k]) {
                context.scope.bind(name, Value::vector(values));
            }
        }

        if (options.verbose) {
            std::cerr << "Evaluating predictor for state " << (k + 1) << "/" << n << std::endl;
        }
        Value result = evaluator.evaluate(predictor);

        if (k == 0) {
            // Decided from the first state only; later shapes are not reconciled
            if (format == OutputFormat::Auto) {
                format = result.isColumnLike() ? OutputFormat::Matrix : OutputFormat::List;
            }
            if (format == OutputFormat::Matrix) {
                if (!result.is<Numeric>()) {
                    throw EvaluationError("Evaluation failed: matrix output needs a numeric result, got " +
                                          result.typeName());
                }
                matrix.values = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(result.rows()),
                                                      static_cast<Eigen::Index>(n));
                matrix.rowNames = result.as<Numeric>().rowNames;
            } else {
                list.values.reserve(n);
            }
        }

        if (format == OutputFormat::List) {
            list.values.push_back(std::move(result));
            continue;
        }

        Eigen::VectorXd column = result.toVector();
        const auto rows = matrix.values.rows();
        if (column.size() == rows) {
            matrix.values.col(static_cast<Eigen::Index>(k)) = column;
        } else if (column.size() == 1) {
            matrix.values.col(static_cast<Eigen::Index>(k)).setConstant(column(0));
        } else {
            throw EvaluationError("Evaluation failed: result for state " + std::to_string(k + 1) + " has " +
                                  std::to_string(column.size()) + " values, expected " + std::to_string(rows));
        }
    }

    if (format == OutputFormat::List) {
        return PredictorResult{std::move(list)};
    }
    return PredictorResult{std::move(matrix)};
}

PredictorResult evaluatePredictor(const Model& model,
                                  const StateSequence& states,
                                  const DataSet& data,
                                  const EffectsSequence& effects,
                                  const std::string& predictor,
                                  const PredictorOptions& options) {
    return evaluatePredictor(model, states, data, effects, parseExpression(predictor), options);
}

}  // namespace lateval

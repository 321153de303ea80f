#include "lateval/evaluate.h"
#include "lateval/errors.h"
#include "lateval/inclusion.h"
#include <iostream>

namespace lateval {

ModelEvaluation evaluateModel(const Model& model,
                              const StateSequence& states,
                              const DataSet& data,
                              const std::string& predictor,
                              const EvaluationOptions& options,
                              const InputMap* inputs,
                              const SimplifiedMappers* simplified) {
    const ComponentList& components = model.components();
    const auto included = resolveInclusion(components.labels(), options.include, options.exclude);

    if (states.empty()) {
        throw ConfigurationError("Not enough information to evaluate model states");
    }
    OutputFormat format = parseOutputFormat(options.format);

    ModelEvaluation evaluation;

    InputMap evaluatedInputs;
    if (!inputs && !data.empty()) {
        evaluatedInputs = evaluateComponentInputs(components, data, included);
        inputs = &evaluatedInputs;
    }

    SimplifiedMappers evaluatedMappers;
    if (!simplified && inputs) {
        evaluatedMappers = simplifyComponents(components, *inputs);
        simplified = &evaluatedMappers;
        evaluation.warnings = evaluatedMappers.warnings;
    }

    EffectsSequence effects;
    if (simplified && inputs) {
        if (options.verbose) {
            std::cerr << "Evaluating " << simplified->size() << " component effects for "
                      << states.size() << " state(s)" << std::endl;
        }
        effects = evaluateEffectsMulti(*simplified, *inputs, states);
    }

    if (predictor.empty()) {
        evaluation.node = std::move(effects);
        return evaluation;
    }

    PredictorOptions predictorOptions;
    predictorOptions.format = format;
    predictorOptions.include = options.include;
    predictorOptions.exclude = options.exclude;
    predictorOptions.seed = options.seed;
    predictorOptions.random = options.random;
    predictorOptions.verbose = options.verbose;
    evaluation.node = evaluatePredictor(model, states, data, effects, predictor, predictorOptions);
    return evaluation;
}

ModelEvaluation evaluateModel(const Model& model,
                              const FittedResult* result,
                              const DataSet& data,
                              const std::string& predictor,
                              const EvaluationOptions& options) {
    StateSequence states = evaluateState(model, result, options.property, options.samples,
                                         options.seed, options.numThreads, options.internalHyperpar);
    return evaluateModel(model, states, data, predictor, options);
}

}  // namespace lateval

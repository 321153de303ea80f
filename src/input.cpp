#include "lateval/input.h"
#include "lateval/errors.h"
#include "lateval/evaluator.h"
#include <algorithm>

namespace lateval {

MapperInput evaluateInput(const Component& component, const DataSet& data) {
    MapperInput input;
    try {
        if (component.mainExpr()) {
            input.main = evaluateInData(component.mainExpr(), data);
        } else {
            input.main = Value::constant(1.0, std::max<size_t>(data.rows(), 1));
        }
        const size_t n = input.main.rows();
        input.group = component.groupExpr() ? evaluateInData(component.groupExpr(), data)
                                            : Value::constant(1.0, n);
        input.replicate = component.replicateExpr() ? evaluateInData(component.replicateExpr(), data)
                                                    : Value::constant(1.0, n);
        if (component.weightsExpr()) {
            input.scale = evaluateInData(component.weightsExpr(), data).toVector();
        }
    } catch (const EvaluationError& e) {
        throw EvaluationError("Evaluation failed for inputs of component '" + component.label() + "': " + e.what());
    }
    return input;
}

InputMap evaluateComponentInputs(const ComponentList& components,
                                 const DataSet& data,
                                 const std::vector<std::string>& labels) {
    InputMap inputs;
    for (const auto& component : components) {
        if (std::find(labels.begin(), labels.end(), component.label()) == labels.end()) continue;
        inputs.emplace(component.label(), evaluateInput(component, data));
    }
    return inputs;
}

}  // namespace lateval

#include "lateval/simplifier.h"
#include "lateval/errors.h"
#include <iostream>

namespace lateval {

const Mapper& SimplifiedMappers::at(const std::string& label) const {
    auto it = mappers.find(label);
    if (it == mappers.end()) {
        throw EvaluationError("Evaluation failed: no simplified mapper for component '" + label + "'");
    }
    return *it->second;
}

SimplifiedMappers simplifyComponents(const ComponentList& components, const InputMap& inputs) {
    SimplifiedMappers result;
    bool warned = false;

    for (const auto& component : components) {
        auto input = inputs.find(component.label());
        if (input == inputs.end()) continue;

        result.labels.push_back(component.label());
        const MapperPtr& mapper = component.mapper();
        if (mapper->isLinear()) {
            Eigen::VectorXd zero = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(mapper->latentSize()));
            result.mappers[component.label()] = linearize(*mapper, input->second, zero);
        } else {
            result.mappers[component.label()] = mapper;
            if (!warned) {
                std::cerr << "Warning: " << nonlinearMapperWarning()
                          << " (component '" << component.label() << "')" << std::endl;
                result.warnings.push_back(nonlinearMapperWarning());
                warned = true;
            }
        }
    }
    return result;
}

SimplifiedMappers linearizeComponents(const ComponentList& components,
                                      const InputMap& inputs,
                                      const State& state) {
    SimplifiedMappers result;
    for (const auto& component : components) {
        auto input = inputs.find(component.label());
        if (input == inputs.end()) continue;

        const MapperPtr& mapper = component.mapper();
        const auto size = static_cast<Eigen::Index>(mapper->latentSize());
        Eigen::VectorXd state0 = Eigen::VectorXd::Zero(size);
        auto entry = state.find(component.label());
        if (entry != state.end()) {
            if (entry->second.size() != size) {
                throw EvaluationError("State vector size mismatch for '" + component.label() + "': expected " +
                                      std::to_string(size) + ", got " + std::to_string(entry->second.size()));
            }
            state0 = entry->second;
        }

        result.labels.push_back(component.label());
        result.mappers[component.label()] = linearize(*mapper, input->second, state0);
    }
    return result;
}

}  // namespace lateval

#include "lateval/effects.h"
#include "lateval/errors.h"
#include <type_traits>

namespace lateval {

Effects evaluateEffects(const SimplifiedMappers& simplified, const InputMap& inputs, const State& state) {
    Effects effects;
    for (const auto& label : simplified.labels) {
        const Mapper& mapper = simplified.at(label);

        auto input = inputs.find(label);
        if (input == inputs.end()) {
            throw EvaluationError("Evaluation failed: no input for component '" + label + "'");
        }

        auto entry = state.find(label);
        Eigen::VectorXd latent(0);
        if (entry != state.end()) {
            latent = entry->second;
        } else if (mapper.latentSize() > 0) {
            throw EvaluationError("Evaluation failed: state has no entry for component '" + label + "'");
        }

        effects[label] = mapper.evaluate(input->second, latent);
    }
    return effects;
}

EffectsSequence evaluateEffectsMulti(const SimplifiedMappers& simplified,
                                     const InputMap& inputs,
                                     const StateSequence& states) {
    EffectsSequence result;
    result.reserve(states.size());
    for (const auto& state : states) {
        result.push_back(evaluateEffects(simplified, inputs, state));
    }
    return result;
}

EffectResult evaluateEffect(const EffectSource& source, const InputMap& inputs, const StateArgument& state) {
    return std::visit([&inputs](const auto& src, const auto& st) -> EffectResult {
        using S = std::decay_t<decltype(src.get())>;
        using T = std::decay_t<decltype(st.get())>;

        SimplifiedMappers simplified;
        const SimplifiedMappers* mappers = nullptr;
        if constexpr (std::is_same_v<S, ComponentList>) {
            simplified = simplifyComponents(src.get(), inputs);
            mappers = &simplified;
        } else {
            mappers = &src.get();
        }

        if constexpr (std::is_same_v<T, State>) {
            return evaluateEffects(*mappers, inputs, st.get());
        } else {
            return evaluateEffectsMulti(*mappers, inputs, st.get());
        }
    }, source, state);
}

}  // namespace lateval

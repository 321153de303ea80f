#pragma once

#include "component.h"
#include "input.h"
#include "simplifier.h"
#include "state.h"
#include <Eigen/Dense>
#include <functional>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace lateval {

// ============================================================================
// Effects
// ============================================================================

// Per component label, the contribution to the linear predictor
using Effects = std::map<std::string, Eigen::VectorXd>;
using EffectsSequence = std::vector<Effects>;

/**
 * @brief Evaluate every simplified mapper against its input and the
 * state's vector for its label.
 *
 * Pure and deterministic. A component whose label is missing from the
 * state is an EvaluationError unless it has no latent variables.
 */
Effects evaluateEffects(const SimplifiedMappers& simplified, const InputMap& inputs, const State& state);

// evaluateEffects() for each state independently
EffectsSequence evaluateEffectsMulti(const SimplifiedMappers& simplified,
                                     const InputMap& inputs,
                                     const StateSequence& states);

// ============================================================================
// Dispatch
// ============================================================================

using EffectSource = std::variant<std::reference_wrapper<const ComponentList>,
                                  std::reference_wrapper<const SimplifiedMappers>>;
using StateArgument = std::variant<std::reference_wrapper<const State>,
                                   std::reference_wrapper<const StateSequence>>;
using EffectResult = std::variant<Effects, EffectsSequence>;

/**
 * @brief Evaluate effects for any combination of source and state kind.
 *
 * A ComponentList source is simplified against `inputs` first; a single
 * State yields Effects, a StateSequence yields EffectsSequence.
 */
EffectResult evaluateEffect(const EffectSource& source, const InputMap& inputs, const StateArgument& state);

}  // namespace lateval

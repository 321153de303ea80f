#pragma once

#include "component.h"
#include "input.h"
#include "mapper.h"
#include "state.h"
#include <map>
#include <string>
#include <vector>

namespace lateval {

// ============================================================================
// Simplified Mappers
// ============================================================================

/**
 * @brief Per-component mappers ready for repeated evaluation.
 *
 * Linear components carry a LinearizedMapper built against their input;
 * nonlinear ones carry the component pipeline unchanged. `labels` is in
 * ComponentList order.
 */
struct SimplifiedMappers {
    std::vector<std::string> labels;
    std::map<std::string, MapperPtr> mappers;
    std::vector<std::string> warnings;

    const Mapper& at(const std::string& label) const;
    size_t size() const { return labels.size(); }
};

/**
 * @brief Linearize every linear component that has an input; pass
 * nonlinear ones through with a warning.
 *
 * The affine operator is built once from the mapper's value and Jacobian
 * at the zero state. Components without an entry in `inputs` are skipped.
 */
SimplifiedMappers simplifyComponents(const ComponentList& components, const InputMap& inputs);

/**
 * @brief First-order Taylor linearization of every component with an
 * input at a reference state.
 *
 * Components missing from `state` are linearized at the zero state.
 */
SimplifiedMappers linearizeComponents(const ComponentList& components,
                                      const InputMap& inputs,
                                      const State& state);

}  // namespace lateval

#pragma once

#include "component.h"
#include "data.h"
#include "mapper.h"
#include <map>
#include <string>
#include <vector>

namespace lateval {

// ============================================================================
// Component Inputs
// ============================================================================

// Evaluated inputs by component label
using InputMap = std::map<std::string, MapperInput>;

/**
 * @brief Evaluate a component's main/group/replicate/weights expressions
 * against a data set.
 *
 * A missing main is the constant 1 repeated for every data row (a single
 * 1 when the data set is empty); group/replicate default to constant-1
 * vectors of the length of main.
 */
MapperInput evaluateInput(const Component& component, const DataSet& data);

/**
 * @brief Inputs of the given components (ComponentList order is kept;
 * labels not in `labels` are skipped).
 */
InputMap evaluateComponentInputs(const ComponentList& components,
                                 const DataSet& data,
                                 const std::vector<std::string>& labels);

}  // namespace lateval

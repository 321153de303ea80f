#pragma once

#include <optional>
#include <string>
#include <vector>

namespace lateval {

/**
 * @brief Ordered subset of labels selected by include/exclude filters.
 *
 * result = (include or all labels) minus (exclude or nothing), in the
 * order of `labels`. Exclude wins over include.
 *
 * @throws ConfigurationError if include or exclude names an unknown label
 */
std::vector<std::string> resolveInclusion(const std::vector<std::string>& labels,
                                          const std::optional<std::vector<std::string>>& include = std::nullopt,
                                          const std::optional<std::vector<std::string>>& exclude = std::nullopt);

}  // namespace lateval

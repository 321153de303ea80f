#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lateval {

class RandomSource;

// ============================================================================
// Evaluation Options
// ============================================================================

struct EvaluationOptions {
    std::string property = "mode";     // mode, mean, sd, <p>quant, sample
    size_t samples = 100;              // Number of draws for "sample"
    uint64_t seed = 0;                 // 0 = non-deterministic
    std::string numThreads;            // Empty = solver default
    bool internalHyperpar = false;     // Hyperparameters on the internal scale
    std::string format = "auto";       // auto, matrix, list
    std::optional<std::vector<std::string>> include;
    std::optional<std::vector<std::string>> exclude;
    bool verbose = false;              // Print progress to stderr

    RandomSource* random = nullptr;    // Overrides the IID deviate source when set
};

/**
 * @brief Load options from a `key = value` file.
 *
 * Lines starting with '#' and blank lines are ignored. include/exclude
 * take comma-separated labels. Keys not present in the file keep their
 * current values.
 *
 * @return false if the file cannot be opened
 * @throws ConfigurationError for unknown keys or malformed values
 */
bool loadEvaluationOptionsFromFile(const std::string& path, EvaluationOptions& options);

}  // namespace lateval

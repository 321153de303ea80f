#pragma once

#include <stdexcept>
#include <string>

namespace lateval {

// ============================================================================
// Error Types
// ============================================================================

/**
 * @brief Deterministic misconfiguration: unknown labels, empty state
 * sequences, unknown property or format names, bad option values.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Failure while evaluating an expression or a mapper: unbound
 * names, unknown functions, parse failures, shape mismatches.
 */
class EvaluationError : public std::runtime_error {
public:
    explicit EvaluationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Categories for reporting.
 */
enum class ErrorCategory {
    None,
    Configuration,
    UndefinedName,
    UnknownFunction,
    ParseError,
    Evaluation,
    Other
};

/**
 * @brief Categorize an error message into a high-level category.
 */
ErrorCategory categorizeError(const std::string& errorMsg);

/**
 * @brief Convert ErrorCategory to string.
 */
std::string categoryToString(ErrorCategory category);

// Message of the non-fatal warning issued when a nonlinear mapper is used
inline const char* nonlinearMapperWarning() {
    return "Non-linear mappers are experimental!";
}

}  // namespace lateval

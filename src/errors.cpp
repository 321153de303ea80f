#include "lateval/errors.h"

namespace lateval {

// ============================================================================
// Error Categorization
// ============================================================================

ErrorCategory categorizeError(const std::string& errorMsg) {
    if (errorMsg.empty()) return ErrorCategory::None;
    if (errorMsg.find("Undefined name") != std::string::npos)
        return ErrorCategory::UndefinedName;
    if (errorMsg.find("Unknown function") != std::string::npos)
        return ErrorCategory::UnknownFunction;
    if (errorMsg.find("Parse error") != std::string::npos)
        return ErrorCategory::ParseError;
    if (errorMsg.find("Unknown component label") != std::string::npos ||
        errorMsg.find("Unknown state property") != std::string::npos ||
        errorMsg.find("Unknown output format") != std::string::npos ||
        errorMsg.find("Not enough information") != std::string::npos)
        return ErrorCategory::Configuration;
    if (errorMsg.find("Evaluation failed") != std::string::npos)
        return ErrorCategory::Evaluation;
    return ErrorCategory::Other;
}

std::string categoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None: return "None";
        case ErrorCategory::Configuration: return "Configuration";
        case ErrorCategory::UndefinedName: return "UndefinedName";
        case ErrorCategory::UnknownFunction: return "UnknownFunction";
        case ErrorCategory::ParseError: return "ParseError";
        case ErrorCategory::Evaluation: return "Evaluation";
        case ErrorCategory::Other: return "Other";
        default: return "Unknown";
    }
}

}  // namespace lateval

#pragma once

#include "ast.h"
#include <memory>
#include <string>
#include <vector>

namespace lateval {

// ============================================================================
// Parser Error
// ============================================================================

struct ParseError {
    int line;
    int column;
    std::string message;
};

// ============================================================================
// Parser Result
// ============================================================================

struct ParseResult {
    bool success = false;
    ExprPtr expression;
    std::vector<ParseError> errors;
};

// ============================================================================
// Predictor Expression Parser
// ============================================================================

/**
 * @brief Parses predictor and component input expressions.
 *
 * The language is a small R-flavoured subset: arithmetic, indexing,
 * list field access and function application with named arguments.
 * A leading '~' (formula right-hand side) is accepted and ignored.
 */
class PredictorParser {
public:
    PredictorParser();
    ~PredictorParser();

    ParseResult parse(const std::string& source);

    // Get the last error message for debugging
    std::string getLastError() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// ============================================================================
// Utility functions
// ============================================================================

// Parse an expression or throw EvaluationError with the parser diagnostics
ExprPtr parseExpression(const std::string& source);

// Collect all variable names referenced by an expression
void collectVariables(const ExprPtr& expr, std::vector<std::string>& vars);

// Collect all function names called by an expression
void collectFunctions(const ExprPtr& expr, std::vector<std::string>& names);

// Convert AST to string representation (for debugging)
std::string astToString(const ExprPtr& expr);

}  // namespace lateval

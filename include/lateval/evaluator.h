#pragma once

#include "ast.h"
#include "scope.h"
#include "value.h"
#include <string>
#include <vector>

namespace lateval {

// ============================================================================
// Expression Evaluator
// ============================================================================

/**
 * @brief Restricted interpreter for predictor and input expressions.
 *
 * Names resolve in the context's scope only. Arithmetic is elementwise
 * with length-1 operands broadcast; functions are the builtins listed by
 * builtinFunctions() plus the `<label>_eval` component evaluators bound
 * in the scope. Every failure is reported as EvaluationError.
 */
class ExpressionEvaluator {
public:
    explicit ExpressionEvaluator(EvaluationContext& context);

    Value evaluate(const ExprPtr& expr);

private:
    EvaluationContext& context_;

    Value evaluateNumber(const NumberLiteral& num);
    Value evaluateString(const StringLiteral& str);
    Value evaluateVariable(const Variable& var);
    Value evaluateUnaryOp(const UnaryOp& op);
    Value evaluateBinaryOp(const BinaryOp& op);
    Value evaluateIndex(const IndexOp& op);
    Value evaluateFunctionCall(const FunctionCall& call);

    // `<label>_eval(main, group, replicate, weights, state)`
    Value evaluateComponent(const Component& component, const FunctionCall& call);

    Value callBuiltin(const std::string& name,
                      const std::vector<Value>& args,
                      const std::vector<std::pair<std::string, Value>>& namedArgs);
};

// Names of the builtin functions
const std::vector<std::string>& builtinFunctions();

bool isBuiltinFunction(const std::string& name);

/**
 * @brief Evaluate an expression against a data set (fields and `.data.`).
 */
Value evaluateInData(const ExprPtr& expr, const DataSet& data);

}  // namespace lateval

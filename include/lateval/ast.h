#pragma once

#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace lateval {

// Forward declarations
struct Expression;

// Type aliases for smart pointers
using ExprPtr = std::shared_ptr<Expression>;

// ============================================================================
// Expression Types
// ============================================================================

struct NumberLiteral {
    double value;
};

struct StringLiteral {
    std::string value;
};

struct Variable {
    std::string name;
};

struct UnaryOp {
    std::string op;  // "-", "+"
    ExprPtr operand;
};

struct BinaryOp {
    std::string op;  // "+", "-", "*", "/", "^"
    ExprPtr left;
    ExprPtr right;
};

// Postfix access: x[i] (index) or x$name (field)
struct IndexOp {
    ExprPtr object;
    ExprPtr index;        // null for field access
    std::string field;    // empty for index access
};

struct FunctionCall {
    std::string name;
    std::vector<ExprPtr> args;
    // Named arguments like group = g, weights = w
    std::vector<std::pair<std::string, ExprPtr>> namedArgs;
};

// Expression is a variant of all possible expression types
struct Expression {
    std::variant<
        NumberLiteral,
        StringLiteral,
        Variable,
        UnaryOp,
        BinaryOp,
        IndexOp,
        FunctionCall
    > node;

    int sourceColumn = 0;  // For error reporting

    template<typename T>
    bool is() const { return std::holds_alternative<T>(node); }

    template<typename T>
    const T& as() const { return std::get<T>(node); }

    template<typename T>
    T& as() { return std::get<T>(node); }
};

// ============================================================================
// Helper functions for AST construction
// ============================================================================

inline ExprPtr makeNumber(double value, int column = 0) {
    auto expr = std::make_shared<Expression>();
    expr->node = NumberLiteral{value};
    expr->sourceColumn = column;
    return expr;
}

inline ExprPtr makeString(const std::string& value, int column = 0) {
    auto expr = std::make_shared<Expression>();
    expr->node = StringLiteral{value};
    expr->sourceColumn = column;
    return expr;
}

inline ExprPtr makeVariable(const std::string& name, int column = 0) {
    auto expr = std::make_shared<Expression>();
    expr->node = Variable{name};
    expr->sourceColumn = column;
    return expr;
}

inline ExprPtr makeUnaryOp(const std::string& op, ExprPtr operand, int column = 0) {
    auto expr = std::make_shared<Expression>();
    expr->node = UnaryOp{op, std::move(operand)};
    expr->sourceColumn = column;
    return expr;
}

inline ExprPtr makeBinaryOp(const std::string& op, ExprPtr left, ExprPtr right, int column = 0) {
    auto expr = std::make_shared<Expression>();
    expr->node = BinaryOp{op, std::move(left), std::move(right)};
    expr->sourceColumn = column;
    return expr;
}

inline ExprPtr makeIndex(ExprPtr object, ExprPtr index, int column = 0) {
    auto expr = std::make_shared<Expression>();
    expr->node = IndexOp{std::move(object), std::move(index), ""};
    expr->sourceColumn = column;
    return expr;
}

inline ExprPtr makeField(ExprPtr object, const std::string& field, int column = 0) {
    auto expr = std::make_shared<Expression>();
    expr->node = IndexOp{std::move(object), nullptr, field};
    expr->sourceColumn = column;
    return expr;
}

inline ExprPtr makeFunctionCall(const std::string& name, std::vector<ExprPtr> args,
                                std::vector<std::pair<std::string, ExprPtr>> namedArgs = {},
                                int column = 0) {
    auto expr = std::make_shared<Expression>();
    expr->node = FunctionCall{name, std::move(args), std::move(namedArgs)};
    expr->sourceColumn = column;
    return expr;
}

}  // namespace lateval

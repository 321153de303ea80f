#pragma once

#include <Eigen/Dense>
#include <string>
#include <variant>
#include <vector>

namespace lateval {

struct Value;

// ============================================================================
// Value Types
// ============================================================================

/**
 * @brief Numeric data. Vectors are stored as n x 1 with isMatrix == false;
 * matrices keep their dimensions and optional row names.
 */
struct Numeric {
    Eigen::MatrixXd data;
    bool isMatrix = false;
    std::vector<std::string> rowNames;
};

struct Text {
    std::vector<std::string> values;
};

struct NamedList {
    std::vector<std::string> names;
    std::vector<Value> items;

    const Value* find(const std::string& name) const;
};

/**
 * @brief Runtime value of the expression interpreter.
 */
struct Value {
    std::variant<Numeric, Text, NamedList> node;

    template<typename T>
    bool is() const { return std::holds_alternative<T>(node); }

    template<typename T>
    const T& as() const { return std::get<T>(node); }

    template<typename T>
    T& as() { return std::get<T>(node); }

    // Number of rows (NROW): vector length, matrix rows, list length
    size_t rows() const;

    // Number of columns (NCOL); 1 for vectors and text
    size_t cols() const;

    // Short type description for diagnostics
    std::string typeName() const;

    // A flat numeric vector or a single-column numeric matrix
    bool isColumnLike() const;

    // Numeric content as a flat vector; throws EvaluationError for non-numeric values
    Eigen::VectorXd toVector() const;

    // Element i rendered as a lookup key ("5", "0.1", "a")
    std::string keyAt(size_t i) const;

    static Value scalar(double value);
    static Value vector(const Eigen::VectorXd& values);
    static Value column(const Eigen::VectorXd& values);
    static Value matrix(const Eigen::MatrixXd& values, std::vector<std::string> rowNames = {});
    static Value text(std::vector<std::string> values);
    static Value list(std::vector<std::string> names, std::vector<Value> items);
    static Value constant(double value, size_t length);
};

// Render a double the way keys and labels are printed (up to 15 significant digits)
std::string formatNumber(double value);

// Rows of a numeric or character value; lists are not row-selectable
Value selectRows(const Value& value, const std::vector<size_t>& rows);

// Debug representation
std::string valueToString(const Value& value);

}  // namespace lateval

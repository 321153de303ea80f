#include "lateval/value.h"
#include "lateval/errors.h"
#include <iomanip>
#include <sstream>

namespace lateval {

const Value* NamedList::find(const std::string& name) const {
    for (size_t i = 0; i < names.size(); ++i) {
        if (names[i] == name) return &items[i];
    }
    return nullptr;
}

size_t Value::rows() const {
    return std::visit([](const auto& node) -> size_t {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, Numeric>) {
            return static_cast<size_t>(node.data.rows());
        } else if constexpr (std::is_same_v<T, Text>) {
            return node.values.size();
        } else {
            return node.items.size();
        }
    }, node);
}

size_t Value::cols() const {
    if (is<Numeric>()) return static_cast<size_t>(as<Numeric>().data.cols());
    return 1;
}

std::string Value::typeName() const {
    return std::visit([](const auto& node) -> std::string {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, Numeric>) {
            if (!node.isMatrix) return "numeric vector";
            return "numeric matrix (" + std::to_string(node.data.rows()) + "x" +
                   std::to_string(node.data.cols()) + ")";
        } else if constexpr (std::is_same_v<T, Text>) {
            return "character vector";
        } else {
            return "list";
        }
    }, node);
}

bool Value::isColumnLike() const {
    if (!is<Numeric>()) return false;
    const auto& num = as<Numeric>();
    return !num.isMatrix || num.data.cols() == 1;
}

Eigen::VectorXd Value::toVector() const {
    if (!is<Numeric>()) {
        throw EvaluationError("Expected a numeric value, got " + typeName());
    }
    const auto& m = as<Numeric>().data;
    // Column-major flattening, as.vector() order
    return Eigen::Map<const Eigen::VectorXd>(m.data(), m.size());
}

std::string Value::keyAt(size_t i) const {
    if (is<Text>()) {
        return as<Text>().values.at(i);
    }
    if (is<Numeric>()) {
        const auto& m = as<Numeric>().data;
        if (static_cast<Eigen::Index>(i) >= m.size()) {
            throw EvaluationError("Key index out of range");
        }
        return formatNumber(m.data()[i]);
    }
    throw EvaluationError("Cannot use a list as a lookup key");
}

Value Value::scalar(double value) {
    Numeric num;
    num.data = Eigen::MatrixXd::Constant(1, 1, value);
    return Value{num};
}

Value Value::vector(const Eigen::VectorXd& values) {
    Numeric num;
    num.data = values;
    return Value{num};
}

Value Value::column(const Eigen::VectorXd& values) {
    Numeric num;
    num.data = values;
    num.isMatrix = true;
    return Value{num};
}

Value Value::matrix(const Eigen::MatrixXd& values, std::vector<std::string> rowNames) {
    Numeric num;
    num.data = values;
    num.isMatrix = true;
    num.rowNames = std::move(rowNames);
    return Value{num};
}

Value Value::text(std::vector<std::string> values) {
    return Value{Text{std::move(values)}};
}

Value Value::list(std::vector<std::string> names, std::vector<Value> items) {
    NamedList list;
    list.names = std::move(names);
    list.items = std::move(items);
    list.names.resize(list.items.size());
    return Value{std::move(list)};
}

Value Value::constant(double value, size_t length) {
    return vector(Eigen::VectorXd::Constant(static_cast<Eigen::Index>(length), value));
}

std::string formatNumber(double value) {
    std::ostringstream oss;
    oss << std::setprecision(15) << value;
    return oss.str();
}

Value selectRows(const Value& value, const std::vector<size_t>& rows) {
    if (value.is<Text>()) {
        const auto& src = value.as<Text>().values;
        std::vector<std::string> out;
        out.reserve(rows.size());
        for (size_t r : rows) out.push_back(src.at(r));
        return Value::text(std::move(out));
    }
    if (value.is<Numeric>()) {
        const auto& src = value.as<Numeric>();
        Numeric out;
        out.isMatrix = src.isMatrix;
        out.data.resize(static_cast<Eigen::Index>(rows.size()), src.data.cols());
        for (size_t i = 0; i < rows.size(); ++i) {
            if (static_cast<Eigen::Index>(rows[i]) >= src.data.rows()) {
                throw EvaluationError("Row index out of range");
            }
            out.data.row(static_cast<Eigen::Index>(i)) = src.data.row(static_cast<Eigen::Index>(rows[i]));
            if (!src.rowNames.empty()) out.rowNames.push_back(src.rowNames[rows[i]]);
        }
        return Value{out};
    }
    throw EvaluationError("Cannot select rows of a list");
}

std::string valueToString(const Value& value) {
    std::ostringstream oss;
    std::visit([&oss](const auto& node) {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, Numeric>) {
            if (node.isMatrix) {
                oss << "[" << node.data.rows() << "x" << node.data.cols() << "]";
            }
            oss << "[";
            for (Eigen::Index i = 0; i < node.data.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << formatNumber(node.data.data()[i]);
            }
            oss << "]";
        } else if constexpr (std::is_same_v<T, Text>) {
            oss << "[";
            for (size_t i = 0; i < node.values.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << "'" << node.values[i] << "'";
            }
            oss << "]";
        } else {
            oss << "list(";
            for (size_t i = 0; i < node.items.size(); ++i) {
                if (i > 0) oss << ", ";
                if (!node.names[i].empty()) oss << node.names[i] << " = ";
                oss << valueToString(node.items[i]);
            }
            oss << ")";
        }
    }, value.node);
    return oss.str();
}

}  // namespace lateval

#include "lateval/data.h"
#include "lateval/errors.h"
#include <nlohmann/json.hpp>
#include <algorithm>

namespace lateval {

void DataSet::set(const std::string& name, Value value) {
    for (auto& [fieldName, fieldValue] : fields_) {
        if (fieldName == name) {
            fieldValue = std::move(value);
            return;
        }
    }
    fields_.emplace_back(name, std::move(value));
}

void DataSet::setNumeric(const std::string& name, const Eigen::VectorXd& values) {
    set(name, Value::vector(values));
}

void DataSet::setText(const std::string& name, std::vector<std::string> values) {
    set(name, Value::text(std::move(values)));
}

bool DataSet::has(const std::string& name) const {
    return std::any_of(fields_.begin(), fields_.end(),
                       [&name](const auto& field) { return field.first == name; });
}

const Value& DataSet::get(const std::string& name) const {
    for (const auto& [fieldName, fieldValue] : fields_) {
        if (fieldName == name) return fieldValue;
    }
    throw EvaluationError("Undefined name: data field '" + name + "' not found");
}

size_t DataSet::rows() const {
    size_t n = 0;
    for (const auto& field : fields_) {
        n = std::max(n, field.second.rows());
    }
    return n;
}

Value DataSet::toValue() const {
    std::vector<std::string> names;
    std::vector<Value> items;
    names.reserve(fields_.size());
    items.reserve(fields_.size());
    for (const auto& [name, value] : fields_) {
        names.push_back(name);
        items.push_back(value);
    }
    return Value::list(std::move(names), std::move(items));
}

// ============================================================================
// JSON Loading
// ============================================================================

static Value jsonToValue(const nlohmann::ordered_json& j, const std::string& name) {
    if (j.is_number()) {
        return Value::scalar(j.get<double>());
    }
    if (j.is_string()) {
        return Value::text({j.get<std::string>()});
    }
    if (j.is_object()) {
        std::vector<std::string> names;
        std::vector<Value> items;
        for (auto it = j.begin(); it != j.end(); ++it) {
            names.push_back(it.key());
            items.push_back(jsonToValue(it.value(), name + "$" + it.key()));
        }
        return Value::list(std::move(names), std::move(items));
    }
    if (j.is_array()) {
        bool allNumbers = std::all_of(j.begin(), j.end(), [](const nlohmann::ordered_json& e) { return e.is_number(); });
        bool allStrings = std::all_of(j.begin(), j.end(), [](const nlohmann::ordered_json& e) { return e.is_string(); });
        if (allNumbers) {
            Eigen::VectorXd values(static_cast<Eigen::Index>(j.size()));
            for (size_t i = 0; i < j.size(); ++i) {
                values(static_cast<Eigen::Index>(i)) = j[i].get<double>();
            }
            return Value::vector(values);
        }
        if (allStrings) {
            std::vector<std::string> values;
            for (const auto& e : j) values.push_back(e.get<std::string>());
            return Value::text(std::move(values));
        }
    }
    throw ConfigurationError("Unsupported JSON value for data field '" + name + "'");
}

DataSet DataSet::fromJSON(const std::string& jsonText) {
    nlohmann::ordered_json j;
    try {
        j = nlohmann::ordered_json::parse(jsonText);
    } catch (const nlohmann::ordered_json::parse_error& e) {
        throw ConfigurationError(std::string("Invalid data JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw ConfigurationError("Data JSON must be an object of named fields");
    }

    DataSet data;
    for (auto it = j.begin(); it != j.end(); ++it) {
        data.set(it.key(), jsonToValue(it.value(), it.key()));
    }
    return data;
}

}  // namespace lateval

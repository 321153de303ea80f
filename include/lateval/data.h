#pragma once

#include "value.h"
#include <string>
#include <utility>
#include <vector>

namespace lateval {

// ============================================================================
// Data Set
// ============================================================================

/**
 * @brief Ordered collection of named fields (columns or list elements).
 *
 * Fields are bound by name in evaluation scopes; the whole set is also
 * available as a named list under `.data.`.
 */
class DataSet {
public:
    DataSet() = default;

    // Add or replace a field, keeping first-insertion order
    void set(const std::string& name, Value value);
    void setNumeric(const std::string& name, const Eigen::VectorXd& values);
    void setText(const std::string& name, std::vector<std::string> values);

    bool has(const std::string& name) const;
    const Value& get(const std::string& name) const;

    const std::vector<std::pair<std::string, Value>>& fields() const { return fields_; }
    size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }

    // Largest NROW among the fields
    size_t rows() const;

    // The whole data set as a named list (the `.data.` binding)
    Value toValue() const;

    /**
     * @brief Build a data set from a JSON object.
     *
     * Arrays of numbers become numeric columns, arrays of strings become
     * character columns, scalars become length-1 columns and nested objects
     * become named lists.
     */
    static DataSet fromJSON(const std::string& jsonText);

private:
    std::vector<std::pair<std::string, Value>> fields_;
};

}  // namespace lateval

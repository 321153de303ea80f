#include "lateval/state.h"
#include "lateval/errors.h"
#include "lateval/value.h"
#include <nlohmann/json.hpp>
#include <random>
#include <stdexcept>

namespace lateval {

// ============================================================================
// StateProperty
// ============================================================================

StateProperty StateProperty::parse(const std::string& text) {
    StateProperty property;
    if (text == "mode") {
        property.kind = Kind::Mode;
    } else if (text == "mean") {
        property.kind = Kind::Mean;
    } else if (text == "sd") {
        property.kind = Kind::Sd;
    } else if (text == "sample") {
        property.kind = Kind::Sample;
    } else {
        const std::string suffix = "quant";
        if (text.size() <= suffix.size() || text.compare(text.size() - suffix.size(), suffix.size(), suffix) != 0) {
            throw ConfigurationError("Unknown state property '" + text + "'");
        }
        std::string number = text.substr(0, text.size() - suffix.size());
        size_t consumed = 0;
        double p = 0.0;
        try {
            p = std::stod(number, &consumed);
        } catch (const std::invalid_argument&) {
            throw ConfigurationError("Unknown state property '" + text + "'");
        } catch (const std::out_of_range&) {
            throw ConfigurationError("Unknown state property '" + text + "'");
        }
        if (consumed != number.size() || p < 0.0 || p > 1.0) {
            throw ConfigurationError("Unknown state property '" + text + "'");
        }
        property.kind = Kind::Quantile;
        property.probability = p;
    }
    return property;
}

std::string StateProperty::toString() const {
    switch (kind) {
        case Kind::Mode: return "mode";
        case Kind::Mean: return "mean";
        case Kind::Sd: return "sd";
        case Kind::Quantile: return formatNumber(probability) + "quant";
        case Kind::Sample: return "sample";
    }
    return "mode";
}

// ============================================================================
// SummaryTable
// ============================================================================

const Eigen::VectorXd& SummaryTable::column(const StateProperty& property, const std::string& name) const {
    const Eigen::VectorXd* col = nullptr;
    switch (property.kind) {
        case StateProperty::Kind::Mode: col = &mode; break;
        case StateProperty::Kind::Mean: col = &mean; break;
        case StateProperty::Kind::Sd: col = &sd; break;
        case StateProperty::Kind::Quantile: {
            auto it = quantiles.find(formatNumber(property.probability));
            if (it != quantiles.end()) col = &it->second;
            break;
        }
        case StateProperty::Kind::Sample:
            throw ConfigurationError("Samples are not a summary property");
    }
    if (!col || (col->size() == 0 && mean.size() != 0)) {
        throw ConfigurationError("Summary property '" + property.toString() + "' is not tabulated for '" + name + "'");
    }
    return *col;
}

// ============================================================================
// SummaryResult
// ============================================================================

std::string hyperparameterName(const std::string& name) {
    std::string result = name;
    for (char& c : result) {
        if (c == ' ') c = '_';
    }
    return result;
}

void SummaryResult::addLatent(const std::string& label, SummaryTable table) {
    latent_[label] = std::move(table);
}

// Hyperparameters are reported as length-1 state entries
static void requireScalarSummary(const std::string& name, const SummaryTable& table) {
    if (table.mean.size() == 0) {
        throw ConfigurationError("Summary of hyperparameter '" + name + "' has an empty mean");
    }
}

void SummaryResult::addHyperparameter(const std::string& name, SummaryTable table) {
    requireScalarSummary(name, table);
    hyper_[hyperparameterName(name)] = std::move(table);
}

void SummaryResult::addInternalHyperparameter(const std::string& name, SummaryTable table) {
    requireScalarSummary(name, table);
    internalHyper_[hyperparameterName(name)] = std::move(table);
}

State SummaryResult::extractProperty(const StateProperty& property, bool internalHyperpar) const {
    State state;
    for (const auto& [label, table] : latent_) {
        state[label] = table.column(property, label);
    }
    const auto& hyper = internalHyperpar ? internalHyper_ : hyper_;
    for (const auto& [name, table] : hyper) {
        state[name] = table.column(property, name).head(1);
    }
    return state;
}

static Eigen::VectorXd drawGaussian(const SummaryTable& table, std::mt19937_64& engine) {
    std::normal_distribution<double> standard(0.0, 1.0);
    Eigen::VectorXd draw(table.mean.size());
    for (Eigen::Index i = 0; i < draw.size(); ++i) {
        double sd = i < table.sd.size() ? table.sd(i) : 0.0;
        draw(i) = table.mean(i) + sd * standard(engine);
    }
    return draw;
}

StateSequence SummaryResult::samplePosterior(size_t n, uint64_t seed, const std::string& /*numThreads*/) const {
    std::mt19937_64 engine(seed != 0 ? seed : std::random_device{}());
    StateSequence states;
    states.reserve(n);
    for (size_t k = 0; k < n; ++k) {
        State state;
        for (const auto& [label, table] : latent_) {
            state[label] = drawGaussian(table, engine);
        }
        for (const auto& [name, table] : hyper_) {
            state[name] = drawGaussian(table, engine).head(1);
        }
        states.push_back(std::move(state));
    }
    return states;
}

// ============================================================================
// JSON Loading
// ============================================================================

static Eigen::VectorXd jsonToVector(const nlohmann::json& j, const std::string& context) {
    if (j.is_number()) {
        return Eigen::VectorXd::Constant(1, j.get<double>());
    }
    if (!j.is_array()) {
        throw ConfigurationError("Expected a number or an array of numbers for " + context);
    }
    Eigen::VectorXd values(static_cast<Eigen::Index>(j.size()));
    for (size_t i = 0; i < j.size(); ++i) {
        if (!j[i].is_number()) {
            throw ConfigurationError("Non-numeric entry in " + context);
        }
        values(static_cast<Eigen::Index>(i)) = j[i].get<double>();
    }
    return values;
}

static SummaryTable jsonToTable(const nlohmann::json& j, const std::string& name) {
    if (!j.is_object()) {
        throw ConfigurationError("Summary of '" + name + "' must be an object");
    }
    SummaryTable table;
    if (!j.contains("mean")) {
        throw ConfigurationError("Summary of '" + name + "' has no mean");
    }
    table.mean = jsonToVector(j.at("mean"), name + ".mean");
    table.sd = j.contains("sd") ? jsonToVector(j.at("sd"), name + ".sd")
                                : Eigen::VectorXd::Zero(table.mean.size());
    if (j.contains("mode")) {
        table.mode = jsonToVector(j.at("mode"), name + ".mode");
    }
    if (j.contains("quantiles")) {
        for (const auto& [key, column] : j.at("quantiles").items()) {
            double p = 0.0;
            try {
                p = std::stod(key);
            } catch (const std::invalid_argument&) {
                throw ConfigurationError("Invalid quantile '" + key + "' for '" + name + "'");
            } catch (const std::out_of_range&) {
                throw ConfigurationError("Invalid quantile '" + key + "' for '" + name + "'");
            }
            table.quantiles[formatNumber(p)] = jsonToVector(column, name + ".quantiles." + key);
        }
    }
    for (const Eigen::VectorXd* col : {&table.sd, &table.mode}) {
        if (col->size() != 0 && col->size() != table.mean.size()) {
            throw ConfigurationError("Summary columns of '" + name + "' differ in length");
        }
    }
    return table;
}

SummaryResult SummaryResult::fromJSON(const std::string& jsonText) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(jsonText);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError(std::string("Invalid summary JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw ConfigurationError("Summary JSON must be an object");
    }

    SummaryResult result;
    if (j.contains("latent")) {
        for (const auto& [label, table] : j.at("latent").items()) {
            result.addLatent(label, jsonToTable(table, label));
        }
    }
    if (j.contains("hyperpar")) {
        for (const auto& [name, table] : j.at("hyperpar").items()) {
            result.addHyperparameter(name, jsonToTable(table, name));
        }
    }
    if (j.contains("internal_hyperpar")) {
        for (const auto& [name, table] : j.at("internal_hyperpar").items()) {
            result.addInternalHyperparameter(name, jsonToTable(table, name));
        }
    }
    return result;
}

// ============================================================================
// State Provider
// ============================================================================

StateSequence evaluateState(const ComponentList& components,
                            const FittedResult* result,
                            const std::string& property,
                            size_t n,
                            uint64_t seed,
                            const std::string& numThreads,
                            bool internalHyperpar) {
    StateProperty prop = StateProperty::parse(property);

    if (!result) {
        State zero;
        for (const auto& component : components) {
            zero[component.label()] = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(component.latentSize()));
        }
        return {zero};
    }

    if (prop.isSample()) {
        if (n == 0) {
            throw ConfigurationError("Number of samples must be positive");
        }
        // Reproducible sampling needs a single thread
        std::string threads = seed != 0 ? "1:1" : numThreads;
        return result->samplePosterior(n, seed, threads);
    }

    return {result->extractProperty(prop, internalHyperpar)};
}

}  // namespace lateval

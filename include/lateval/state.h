#pragma once

#include "component.h"
#include <Eigen/Dense>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace lateval {

// ============================================================================
// States
// ============================================================================

/**
 * @brief One realization of the latent variables.
 *
 * Component labels map to their latent coefficients; any other name is a
 * hyperparameter stored as a length-1 vector (e.g. Precision_for_u).
 */
using State = std::map<std::string, Eigen::VectorXd>;
using StateSequence = std::vector<State>;

// ============================================================================
// State Property
// ============================================================================

/**
 * @brief Requested summary property: mode, mean, sd, `<p>quant`, sample.
 */
struct StateProperty {
    enum class Kind {
        Mode,
        Mean,
        Sd,
        Quantile,
        Sample
    };

    Kind kind = Kind::Mode;
    double probability = 0.0;  // Quantile only

    // Throws ConfigurationError for anything outside the enumerated set
    static StateProperty parse(const std::string& text);

    std::string toString() const;
    bool isSample() const { return kind == Kind::Sample; }
};

// ============================================================================
// Fitted Result Interface
// ============================================================================

/**
 * @brief Result of the external inference engine.
 */
class FittedResult {
public:
    virtual ~FittedResult() = default;

    /**
     * @brief One state built from the summary tables.
     * @param property Summary property (never Sample)
     * @param internalHyperpar Report hyperparameters on the internal scale
     */
    virtual State extractProperty(const StateProperty& property, bool internalHyperpar) const = 0;

    /**
     * @brief Posterior draws.
     * @param seed 0 for non-deterministic sampling
     * @param numThreads Thread specification ("" for the solver default)
     */
    virtual StateSequence samplePosterior(size_t n, uint64_t seed, const std::string& numThreads) const = 0;
};

// ============================================================================
// Summary Tables
// ============================================================================

/**
 * @brief Marginal summaries of one latent vector or hyperparameter.
 *
 * Quantile columns are keyed by the probability as printed by
 * formatNumber ("0.025", "0.5", ...).
 */
struct SummaryTable {
    Eigen::VectorXd mean;
    Eigen::VectorXd sd;
    Eigen::VectorXd mode;
    std::map<std::string, Eigen::VectorXd> quantiles;

    // Column for a summary property; throws ConfigurationError if not tabulated
    const Eigen::VectorXd& column(const StateProperty& property, const std::string& name) const;
};

/**
 * @brief FittedResult backed by summary tables.
 *
 * Posterior samples are drawn independently from Gaussian marginals with
 * the tabulated mean and sd. Hyperparameter names have spaces replaced
 * by underscores.
 */
class SummaryResult : public FittedResult {
public:
    void addLatent(const std::string& label, SummaryTable table);
    void addHyperparameter(const std::string& name, SummaryTable table);
    void addInternalHyperparameter(const std::string& name, SummaryTable table);

    const std::map<std::string, SummaryTable>& latent() const { return latent_; }
    const std::map<std::string, SummaryTable>& hyperparameters() const { return hyper_; }

    State extractProperty(const StateProperty& property, bool internalHyperpar) const override;
    StateSequence samplePosterior(size_t n, uint64_t seed, const std::string& numThreads) const override;

    /**
     * @brief Load summary tables from JSON.
     *
     * {"latent": {"x": {"mean": [...], "sd": [...], "mode": [...],
     *                   "quantiles": {"0.025": [...]}}},
     *  "hyperpar": {"Precision for u": {...}},
     *  "internal_hyperpar": {"Log precision for u": {...}}}
     */
    static SummaryResult fromJSON(const std::string& jsonText);

private:
    std::map<std::string, SummaryTable> latent_;
    std::map<std::string, SummaryTable> hyper_;
    std::map<std::string, SummaryTable> internalHyper_;
};

// "Precision for u" -> "Precision_for_u"
std::string hyperparameterName(const std::string& name);

// ============================================================================
// State Provider
// ============================================================================

/**
 * @brief Latent states for evaluation.
 *
 * Without a result: one all-zero state sized by each component's latent
 * dimension. For "sample": n posterior draws; a nonzero seed forces
 * numThreads "1:1". Otherwise one state from the summary tables.
 *
 * @throws ConfigurationError for an unknown property (checked first)
 */
StateSequence evaluateState(const ComponentList& components,
                            const FittedResult* result,
                            const std::string& property = "mode",
                            size_t n = 1,
                            uint64_t seed = 0,
                            const std::string& numThreads = "",
                            bool internalHyperpar = false);

}  // namespace lateval

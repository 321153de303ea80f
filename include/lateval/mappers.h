#pragma once

#include "mapper.h"
#include <map>
#include <string>
#include <vector>

namespace lateval {

// ============================================================================
// Reference Mappers
// ============================================================================
// A small concrete mapper set: enough to describe fixed effects, offsets,
// indexed and factor-level random effects, with group/replicate blocks.

/**
 * @brief Covariate effect: value_i = main_i * beta.
 */
class LinearMapper : public Mapper {
public:
    std::string name() const override { return "linear"; }
    size_t latentSize() const override { return 1; }
    bool isLinear() const override { return true; }
    Eigen::VectorXd evaluate(const MapperInput& input, const Eigen::VectorXd& state) const override;
    Eigen::MatrixXd jacobian(const MapperInput& input, const Eigen::VectorXd& state) const override;
};

/**
 * @brief Known offset: value_i = main_i. No latent state.
 */
class ConstMapper : public Mapper {
public:
    std::string name() const override { return "const"; }
    size_t latentSize() const override { return 0; }
    bool isLinear() const override { return true; }
    Eigen::VectorXd evaluate(const MapperInput& input, const Eigen::VectorXd& state) const override;
    Eigen::MatrixXd jacobian(const MapperInput& input, const Eigen::VectorXd& state) const override;
};

/**
 * @brief Integer index into the latent vector: value_i = state[main_i - 1].
 *
 * Indices outside 1..n (or non-integer) are invalid outputs and map to 0.
 */
class IndexMapper : public Mapper {
public:
    explicit IndexMapper(size_t n) : n_(n) {}

    std::string name() const override { return "index"; }
    size_t latentSize() const override { return n_; }
    bool isLinear() const override { return true; }
    Eigen::VectorXd evaluate(const MapperInput& input, const Eigen::VectorXd& state) const override;
    std::vector<bool> invalidOutput(const MapperInput& input, const Eigen::VectorXd& state) const override;
    Eigen::MatrixXd jacobian(const MapperInput& input, const Eigen::VectorXd& state) const override;

private:
    size_t n_;

    // 0-based position, or -1 when invalid
    long position(const Value& main, size_t i) const;
};

/**
 * @brief Factor levels: value_i = state[level(main_i)].
 *
 * main values are matched by their key form ("a", "3"); levels not seen
 * when the mapper was built are invalid outputs and map to 0.
 */
class FactorMapper : public Mapper {
public:
    explicit FactorMapper(std::vector<std::string> levels);

    std::string name() const override { return "factor"; }
    size_t latentSize() const override { return levels_.size(); }
    bool isLinear() const override { return true; }
    Eigen::VectorXd evaluate(const MapperInput& input, const Eigen::VectorXd& state) const override;
    std::vector<bool> invalidOutput(const MapperInput& input, const Eigen::VectorXd& state) const override;
    Eigen::MatrixXd jacobian(const MapperInput& input, const Eigen::VectorXd& state) const override;

    const std::vector<std::string>& levels() const { return levels_; }

private:
    std::vector<std::string> levels_;
    std::map<std::string, size_t> levelIndex_;

    long position(const Value& main, size_t i) const;
};

/**
 * @brief Component pipeline: main mapper, group/replicate blocks, scaling.
 *
 * The latent vector is laid out as nReplicate blocks of nGroup blocks of
 * the main mapper's latent vector; row i uses block
 * (group_i - 1) + nGroup * (replicate_i - 1). Output is multiplied by the
 * input scale when present.
 */
class ComponentMapper : public Mapper {
public:
    ComponentMapper(MapperPtr main, size_t nGroup = 1, size_t nReplicate = 1);

    std::string name() const override { return "component(" + main_->name() + ")"; }
    size_t latentSize() const override { return main_->latentSize() * nGroup_ * nReplicate_; }
    bool isLinear() const override { return main_->isLinear(); }
    Eigen::VectorXd evaluate(const MapperInput& input, const Eigen::VectorXd& state) const override;
    Eigen::MatrixXd jacobian(const MapperInput& input, const Eigen::VectorXd& state) const override;
    const Mapper& firstStage() const override { return *main_; }

    size_t groups() const { return nGroup_; }
    size_t replicates() const { return nReplicate_; }

private:
    MapperPtr main_;
    size_t nGroup_;
    size_t nReplicate_;

    // Rows of the input belonging to each latent block
    std::map<size_t, std::vector<size_t>> blockRows(const MapperInput& input) const;
    Eigen::VectorXd scaleFactors(const MapperInput& input) const;
};

}  // namespace lateval

#pragma once

#include "value.h"
#include <Eigen/Dense>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lateval {

// ============================================================================
// Mapper Input
// ============================================================================

/**
 * @brief Evaluated inputs of one component: where to evaluate it.
 *
 * group and replicate are 1-based block indices; scale multiplies the
 * mapped values elementwise.
 */
struct MapperInput {
    Value main;
    Value group;
    Value replicate;
    std::optional<Eigen::VectorXd> scale;

    size_t size() const { return main.rows(); }

    // Input with the given main values and constant-1 group/replicate
    static MapperInput fromMain(Value main);
};

// ============================================================================
// Mapper Interface
// ============================================================================

/**
 * @brief Maps component inputs and a latent state vector to effect values.
 *
 * Implementations are supplied by the mapper library; the evaluation engine
 * only relies on this interface.
 */
class Mapper {
public:
    virtual ~Mapper() = default;

    virtual std::string name() const = 0;

    // Length of the latent state vector this mapper expects
    virtual size_t latentSize() const = 0;

    // True if evaluate() is affine in the state
    virtual bool isLinear() const = 0;

    virtual Eigen::VectorXd evaluate(const MapperInput& input, const Eigen::VectorXd& state) const = 0;

    /**
     * @brief Output positions that cannot be mapped (e.g. unseen factor levels).
     * Default: none.
     */
    virtual std::vector<bool> invalidOutput(const MapperInput& input, const Eigen::VectorXd& state) const;

    /**
     * @brief Derivative of evaluate() with respect to the state.
     * Default: central finite differences.
     */
    virtual Eigen::MatrixXd jacobian(const MapperInput& input, const Eigen::VectorXd& state) const;

    // First stage of a mapper pipeline; the mapper itself when not a pipeline
    virtual const Mapper& firstStage() const { return *this; }
};

using MapperPtr = std::shared_ptr<const Mapper>;

// ============================================================================
// Linearized Mapper
// ============================================================================

/**
 * @brief Affine mapper offset + A * state, precomputed for one input.
 *
 * The input passed to evaluate() is not consulted; the operator was
 * built against the input the component was linearized for.
 */
class LinearizedMapper : public Mapper {
public:
    LinearizedMapper(Eigen::VectorXd offset, Eigen::MatrixXd A, std::string origin);

    std::string name() const override { return "linearized(" + origin_ + ")"; }
    size_t latentSize() const override { return static_cast<size_t>(A_.cols()); }
    bool isLinear() const override { return true; }

    Eigen::VectorXd evaluate(const MapperInput& input, const Eigen::VectorXd& state) const override;
    Eigen::MatrixXd jacobian(const MapperInput& input, const Eigen::VectorXd& state) const override;

    const Eigen::VectorXd& offset() const { return offset_; }
    const Eigen::MatrixXd& matrix() const { return A_; }

private:
    Eigen::VectorXd offset_;
    Eigen::MatrixXd A_;
    std::string origin_;
};

/**
 * @brief First-order Taylor expansion of a mapper at a reference state.
 *
 * For affine mappers the result is exact for every state.
 */
std::shared_ptr<LinearizedMapper> linearize(const Mapper& mapper,
                                            const MapperInput& input,
                                            const Eigen::VectorXd& state0);

/**
 * @brief Compare a mapper's Jacobian with central finite differences.
 * @return Maximum absolute difference
 */
double compareJacobianWithFiniteDifferences(const Mapper& mapper,
                                            const MapperInput& input,
                                            const Eigen::VectorXd& state,
                                            double epsilon = 1e-7);

}  // namespace lateval

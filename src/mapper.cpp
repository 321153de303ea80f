#include "lateval/mapper.h"
#include "lateval/errors.h"
#include <algorithm>
#include <cmath>

namespace lateval {

MapperInput MapperInput::fromMain(Value main) {
    MapperInput input;
    size_t n = main.rows();
    input.main = std::move(main);
    input.group = Value::constant(1.0, n);
    input.replicate = Value::constant(1.0, n);
    return input;
}

// ============================================================================
// Mapper Defaults
// ============================================================================

std::vector<bool> Mapper::invalidOutput(const MapperInput& input, const Eigen::VectorXd& /*state*/) const {
    return std::vector<bool>(input.size(), false);
}

Eigen::MatrixXd Mapper::jacobian(const MapperInput& input, const Eigen::VectorXd& state) const {
    const double epsilon = 1e-7;
    Eigen::VectorXd value0 = evaluate(input, state);
    Eigen::MatrixXd J(value0.size(), state.size());

    for (Eigen::Index j = 0; j < state.size(); ++j) {
        Eigen::VectorXd xPlus = state;
        Eigen::VectorXd xMinus = state;
        xPlus(j) += epsilon;
        xMinus(j) -= epsilon;
        J.col(j) = (evaluate(input, xPlus) - evaluate(input, xMinus)) / (2.0 * epsilon);
    }
    return J;
}

// ============================================================================
// LinearizedMapper Implementation
// ============================================================================

LinearizedMapper::LinearizedMapper(Eigen::VectorXd offset, Eigen::MatrixXd A, std::string origin)
    : offset_(std::move(offset)), A_(std::move(A)), origin_(std::move(origin)) {
    if (offset_.size() != A_.rows()) {
        throw EvaluationError("Linearized mapper offset has " + std::to_string(offset_.size()) +
                              " rows, operator has " + std::to_string(A_.rows()));
    }
}

Eigen::VectorXd LinearizedMapper::evaluate(const MapperInput& /*input*/, const Eigen::VectorXd& state) const {
    if (A_.cols() == 0) return offset_;
    if (state.size() != A_.cols()) {
        throw EvaluationError("State vector size mismatch for " + name() + ": expected " +
                              std::to_string(A_.cols()) + ", got " + std::to_string(state.size()));
    }
    return offset_ + A_ * state;
}

Eigen::MatrixXd LinearizedMapper::jacobian(const MapperInput& /*input*/, const Eigen::VectorXd& /*state*/) const {
    return A_;
}

std::shared_ptr<LinearizedMapper> linearize(const Mapper& mapper,
                                            const MapperInput& input,
                                            const Eigen::VectorXd& state0) {
    Eigen::VectorXd value0 = mapper.evaluate(input, state0);
    Eigen::MatrixXd J = mapper.jacobian(input, state0);
    if (J.cols() != state0.size()) {
        throw EvaluationError("Jacobian of " + mapper.name() + " has " + std::to_string(J.cols()) +
                              " columns, state has " + std::to_string(state0.size()));
    }
    // value(x) ~= value0 + J (x - x0) = (value0 - J x0) + J x
    Eigen::VectorXd offset = state0.size() > 0 ? Eigen::VectorXd(value0 - J * state0) : value0;
    return std::make_shared<LinearizedMapper>(offset, J, mapper.name());
}

double compareJacobianWithFiniteDifferences(const Mapper& mapper,
                                            const MapperInput& input,
                                            const Eigen::VectorXd& state,
                                            double epsilon) {
    Eigen::MatrixXd J = mapper.jacobian(input, state);
    double maxDiff = 0.0;
    for (Eigen::Index j = 0; j < state.size(); ++j) {
        Eigen::VectorXd xPlus = state;
        Eigen::VectorXd xMinus = state;
        xPlus(j) += epsilon;
        xMinus(j) -= epsilon;
        Eigen::VectorXd column = (mapper.evaluate(input, xPlus) - mapper.evaluate(input, xMinus)) / (2.0 * epsilon);
        for (Eigen::Index i = 0; i < column.size(); ++i) {
            maxDiff = std::max(maxDiff, std::abs(J(i, j) - column(i)));
        }
    }
    return maxDiff;
}

}  // namespace lateval

#include "lateval/mappers.h"
#include "lateval/errors.h"
#include <cmath>

namespace lateval {

// ============================================================================
// LinearMapper
// ============================================================================

Eigen::VectorXd LinearMapper::evaluate(const MapperInput& input, const Eigen::VectorXd& state) const {
    if (state.size() != 1) {
        throw EvaluationError("linear mapper expects a state of length 1, got " + std::to_string(state.size()));
    }
    return input.main.toVector() * state(0);
}

Eigen::MatrixXd LinearMapper::jacobian(const MapperInput& input, const Eigen::VectorXd& /*state*/) const {
    return input.main.toVector();
}

// ============================================================================
// ConstMapper
// ============================================================================

Eigen::VectorXd ConstMapper::evaluate(const MapperInput& input, const Eigen::VectorXd& /*state*/) const {
    return input.main.toVector();
}

Eigen::MatrixXd ConstMapper::jacobian(const MapperInput& input, const Eigen::VectorXd& /*state*/) const {
    return Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(input.size()), 0);
}

// ============================================================================
// IndexMapper
// ============================================================================

long IndexMapper::position(const Value& main, size_t i) const {
    if (!main.is<Numeric>()) return -1;
    double v = main.as<Numeric>().data.data()[i];
    if (!std::isfinite(v) || v != std::floor(v)) return -1;
    if (v < 1.0 || v > static_cast<double>(n_)) return -1;
    return static_cast<long>(v) - 1;
}

Eigen::VectorXd IndexMapper::evaluate(const MapperInput& input, const Eigen::VectorXd& state) const {
    if (static_cast<size_t>(state.size()) != n_) {
        throw EvaluationError("index mapper expects a state of length " + std::to_string(n_) +
                              ", got " + std::to_string(state.size()));
    }
    size_t n = input.size();
    Eigen::VectorXd values = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(n));
    for (size_t i = 0; i < n; ++i) {
        long pos = position(input.main, i);
        if (pos >= 0) values(static_cast<Eigen::Index>(i)) = state(pos);
    }
    return values;
}

std::vector<bool> IndexMapper::invalidOutput(const MapperInput& input, const Eigen::VectorXd& /*state*/) const {
    std::vector<bool> invalid(input.size(), false);
    for (size_t i = 0; i < invalid.size(); ++i) {
        invalid[i] = position(input.main, i) < 0;
    }
    return invalid;
}

Eigen::MatrixXd IndexMapper::jacobian(const MapperInput& input, const Eigen::VectorXd& /*state*/) const {
    size_t n = input.size();
    Eigen::MatrixXd A = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(n_));
    for (size_t i = 0; i < n; ++i) {
        long pos = position(input.main, i);
        if (pos >= 0) A(static_cast<Eigen::Index>(i), pos) = 1.0;
    }
    return A;
}

// ============================================================================
// FactorMapper
// ============================================================================

FactorMapper::FactorMapper(std::vector<std::string> levels) : levels_(std::move(levels)) {
    for (size_t i = 0; i < levels_.size(); ++i) {
        if (!levelIndex_.emplace(levels_[i], i).second) {
            throw ConfigurationError("Duplicate factor level '" + levels_[i] + "'");
        }
    }
}

long FactorMapper::position(const Value& main, size_t i) const {
    auto it = levelIndex_.find(main.keyAt(i));
    if (it == levelIndex_.end()) return -1;
    return static_cast<long>(it->second);
}

Eigen::VectorXd FactorMapper::evaluate(const MapperInput& input, const Eigen::VectorXd& state) const {
    if (static_cast<size_t>(state.size()) != levels_.size()) {
        throw EvaluationError("factor mapper expects a state of length " + std::to_string(levels_.size()) +
                              ", got " + std::to_string(state.size()));
    }
    size_t n = input.size();
    Eigen::VectorXd values = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(n));
    for (size_t i = 0; i < n; ++i) {
        long pos = position(input.main, i);
        if (pos >= 0) values(static_cast<Eigen::Index>(i)) = state(pos);
    }
    return values;
}

std::vector<bool> FactorMapper::invalidOutput(const MapperInput& input, const Eigen::VectorXd& /*state*/) const {
    std::vector<bool> invalid(input.size(), false);
    for (size_t i = 0; i < invalid.size(); ++i) {
        invalid[i] = position(input.main, i) < 0;
    }
    return invalid;
}

Eigen::MatrixXd FactorMapper::jacobian(const MapperInput& input, const Eigen::VectorXd& /*state*/) const {
    size_t n = input.size();
    Eigen::MatrixXd A = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(n),
                                              static_cast<Eigen::Index>(levels_.size()));
    for (size_t i = 0; i < n; ++i) {
        long pos = position(input.main, i);
        if (pos >= 0) A(static_cast<Eigen::Index>(i), pos) = 1.0;
    }
    return A;
}

// ============================================================================
// ComponentMapper
// ============================================================================

ComponentMapper::ComponentMapper(MapperPtr main, size_t nGroup, size_t nReplicate)
    : main_(std::move(main)), nGroup_(nGroup), nReplicate_(nReplicate) {
    if (!main_) {
        throw ConfigurationError("Component mapper requires a main mapper");
    }
    if (nGroup_ == 0 || nReplicate_ == 0) {
        throw ConfigurationError("Component mapper requires at least one group and one replicate");
    }
}

static size_t blockIndex(const Value& v, size_t i, size_t count, const char* what) {
    if (!v.is<Numeric>()) {
        throw EvaluationError(std::string(what) + " must be numeric");
    }
    const auto& m = v.as<Numeric>().data;
    if (m.size() != 1 && static_cast<Eigen::Index>(i) >= m.size()) {
        throw EvaluationError(std::string(what) + " has " + std::to_string(m.size()) +
                              " entries, main has more");
    }
    double x = m.size() == 1 ? m(0, 0) : m.data()[i];
    if (x != std::floor(x) || x < 1.0 || x > static_cast<double>(count)) {
        throw EvaluationError(std::string(what) + " index " + formatNumber(x) + " outside 1.." + std::to_string(count));
    }
    return static_cast<size_t>(x) - 1;
}

std::map<size_t, std::vector<size_t>> ComponentMapper::blockRows(const MapperInput& input) const {
    std::map<size_t, std::vector<size_t>> blocks;
    size_t n = input.size();
    for (size_t i = 0; i < n; ++i) {
        size_t g = blockIndex(input.group, i, nGroup_, "group");
        size_t r = blockIndex(input.replicate, i, nReplicate_, "replicate");
        blocks[g + nGroup_ * r].push_back(i);
    }
    return blocks;
}

Eigen::VectorXd ComponentMapper::scaleFactors(const MapperInput& input) const {
    auto n = static_cast<Eigen::Index>(input.size());
    if (!input.scale) return Eigen::VectorXd::Ones(n);
    const Eigen::VectorXd& scale = *input.scale;
    if (scale.size() == 1) return Eigen::VectorXd::Constant(n, scale(0));
    if (scale.size() != n) {
        throw EvaluationError("weights have length " + std::to_string(scale.size()) +
                              ", expected " + std::to_string(n));
    }
    return scale;
}

Eigen::VectorXd ComponentMapper::evaluate(const MapperInput& input, const Eigen::VectorXd& state) const {
    const size_t blockSize = main_->latentSize();
    if (static_cast<size_t>(state.size()) != latentSize()) {
        throw EvaluationError("State vector size mismatch for " + name() + ": expected " +
                              std::to_string(latentSize()) + ", got " + std::to_string(state.size()));
    }

    Eigen::VectorXd values = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(input.size()));
    for (const auto& [block, rows] : blockRows(input)) {
        MapperInput sub = MapperInput::fromMain(selectRows(input.main, rows));
        Eigen::VectorXd slice = state.segment(static_cast<Eigen::Index>(block * blockSize),
                                              static_cast<Eigen::Index>(blockSize));
        Eigen::VectorXd blockValues = main_->evaluate(sub, slice);
        for (size_t k = 0; k < rows.size(); ++k) {
            values(static_cast<Eigen::Index>(rows[k])) = blockValues(static_cast<Eigen::Index>(k));
        }
    }
    return values.cwiseProduct(scaleFactors(input));
}

Eigen::MatrixXd ComponentMapper::jacobian(const MapperInput& input, const Eigen::VectorXd& state) const {
    if (!main_->isLinear()) {
        return Mapper::jacobian(input, state);
    }
    const size_t blockSize = main_->latentSize();
    Eigen::MatrixXd J = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(input.size()),
                                              static_cast<Eigen::Index>(latentSize()));
    for (const auto& [block, rows] : blockRows(input)) {
        MapperInput sub = MapperInput::fromMain(selectRows(input.main, rows));
        Eigen::VectorXd slice = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(blockSize));
        Eigen::MatrixXd blockJ = main_->jacobian(sub, slice);
        for (size_t k = 0; k < rows.size(); ++k) {
            J.block(static_cast<Eigen::Index>(rows[k]), static_cast<Eigen::Index>(block * blockSize),
                    1, static_cast<Eigen::Index>(blockSize)) = blockJ.row(static_cast<Eigen::Index>(k));
        }
    }
    return scaleFactors(input).asDiagonal() * J;
}

}  // namespace lateval

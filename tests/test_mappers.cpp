#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "lateval/errors.h"
#include "lateval/mapper.h"
#include "lateval/mappers.h"
#include <cmath>

using Catch::Matchers::WithinAbs;

using namespace lateval;

namespace {

// value_i = exp(main_i * state_0); used to exercise the nonlinear paths
class ExpMapper : public Mapper {
public:
    std::string name() const override { return "exp"; }
    size_t latentSize() const override { return 1; }
    bool isLinear() const override { return false; }
    Eigen::VectorXd evaluate(const MapperInput& input, const Eigen::VectorXd& state) const override {
        return (input.main.toVector() * state(0)).array().exp().matrix();
    }
};

bool sameValues(const Eigen::VectorXd& a, const Eigen::VectorXd& b, double tol = 0.0) {
    if (a.size() != b.size()) return false;
    for (Eigen::Index i = 0; i < a.size(); ++i) {
        if (std::abs(a(i) - b(i)) > tol) return false;
    }
    return true;
}

MapperInput inputOf(std::initializer_list<double> values) {
    Eigen::VectorXd main(static_cast<Eigen::Index>(values.size()));
    Eigen::Index i = 0;
    for (double v : values) main(i++) = v;
    return MapperInput::fromMain(Value::vector(main));
}

}  // namespace

TEST_CASE("Linear and const mappers", "[mapper]") {
    auto input = inputOf({1.0, 2.0, 3.0});

    SECTION("Linear mapper scales the covariate") {
        LinearMapper mapper;
        auto values = mapper.evaluate(input, Eigen::VectorXd::Constant(1, 0.5));
        REQUIRE(values.size() == 3);
        REQUIRE(values(2) == 1.5);
        REQUIRE(sameValues(mapper.jacobian(input, Eigen::VectorXd::Zero(1)).col(0), input.main.toVector()));
        REQUIRE_THROWS_AS(mapper.evaluate(input, Eigen::VectorXd::Zero(2)), EvaluationError);
    }

    SECTION("Const mapper returns main and has no latent state") {
        ConstMapper mapper;
        REQUIRE(mapper.latentSize() == 0);
        auto values = mapper.evaluate(input, Eigen::VectorXd(0));
        REQUIRE(values(1) == 2.0);
        REQUIRE(mapper.jacobian(input, Eigen::VectorXd(0)).cols() == 0);
    }
}

TEST_CASE("Index mapper flags invalid outputs", "[mapper]") {
    IndexMapper mapper(3);
    auto input = inputOf({1.0, 3.0, 5.0, 2.5});
    Eigen::VectorXd state(3);
    state << 10.0, 20.0, 30.0;

    auto values = mapper.evaluate(input, state);
    REQUIRE(values(0) == 10.0);
    REQUIRE(values(1) == 30.0);
    REQUIRE(values(2) == 0.0);
    REQUIRE(values(3) == 0.0);

    auto invalid = mapper.invalidOutput(input, state);
    REQUIRE(invalid == std::vector<bool>{false, false, true, true});

    auto A = mapper.jacobian(input, state);
    REQUIRE(A.rows() == 4);
    REQUIRE(A.cols() == 3);
    REQUIRE(A(1, 2) == 1.0);
    REQUIRE(A.row(2).sum() == 0.0);
}

TEST_CASE("Factor mapper matches levels by key", "[mapper]") {
    FactorMapper mapper({"a", "b", "c"});
    auto input = MapperInput::fromMain(Value::text({"c", "a", "z"}));
    Eigen::VectorXd state(3);
    state << 1.0, 2.0, 3.0;

    auto values = mapper.evaluate(input, state);
    REQUIRE(values(0) == 3.0);
    REQUIRE(values(1) == 1.0);
    REQUIRE(values(2) == 0.0);
    REQUIRE(mapper.invalidOutput(input, state) == std::vector<bool>{false, false, true});

    REQUIRE_THROWS_AS(FactorMapper({"a", "a"}), ConfigurationError);
}

TEST_CASE("Component mapper with groups, replicates and weights", "[mapper]") {
    ComponentMapper mapper(std::make_shared<IndexMapper>(2), 2, 2);
    REQUIRE(mapper.latentSize() == 8);
    REQUIRE(mapper.isLinear());
    REQUIRE(mapper.firstStage().name() == "index");

    Eigen::VectorXd main(4), group(4), replicate(4);
    main << 1, 2, 1, 2;
    group << 1, 1, 2, 2;
    replicate << 1, 2, 1, 2;
    MapperInput input;
    input.main = Value::vector(main);
    input.group = Value::vector(group);
    input.replicate = Value::vector(replicate);

    Eigen::VectorXd state(8);
    state << 1, 2, 3, 4, 5, 6, 7, 8;

    SECTION("Block layout") {
        // block = (group - 1) + 2 * (replicate - 1), each block holds 2 values
        auto values = mapper.evaluate(input, state);
        REQUIRE(values(0) == 1.0);  // block 0, index 1
        REQUIRE(values(1) == 6.0);  // block 2, index 2
        REQUIRE(values(2) == 3.0);  // block 1, index 1
        REQUIRE(values(3) == 8.0);  // block 3, index 2
    }

    SECTION("Weights scale the output") {
        input.scale = Eigen::VectorXd::Constant(4, 2.0);
        auto values = mapper.evaluate(input, state);
        REQUIRE(values(3) == 16.0);
    }

    SECTION("Analytic Jacobian matches finite differences") {
        input.scale = Eigen::VectorXd::Constant(1, 0.5);
        REQUIRE(compareJacobianWithFiniteDifferences(mapper, input, state) < 1e-8);
    }

    SECTION("Out of range group is an evaluation error") {
        group(0) = 3;
        input.group = Value::vector(group);
        REQUIRE_THROWS_AS(mapper.evaluate(input, state), EvaluationError);
    }

    SECTION("Wrong state length is an evaluation error") {
        REQUIRE_THROWS_AS(mapper.evaluate(input, Eigen::VectorXd::Zero(3)), EvaluationError);
    }
}

TEST_CASE("Linearization", "[mapper][linearize]") {
    auto input = inputOf({0.5, 1.0, 2.0});

    SECTION("Affine mappers are reproduced exactly") {
        ComponentMapper mapper(std::make_shared<LinearMapper>());
        auto linear = linearize(mapper, input, Eigen::VectorXd::Zero(1));
        Eigen::VectorXd state = Eigen::VectorXd::Constant(1, 3.0);
        REQUIRE(sameValues(linear->evaluate(input, state), mapper.evaluate(input, state), 1e-12));
        REQUIRE(linear->latentSize() == 1);
    }

    SECTION("Nonlinear mappers are expanded at the reference state") {
        ExpMapper mapper;
        Eigen::VectorXd state0 = Eigen::VectorXd::Constant(1, 0.4);
        auto linear = linearize(mapper, input, state0);

        auto at0 = linear->evaluate(input, state0);
        auto exact = mapper.evaluate(input, state0);
        for (Eigen::Index i = 0; i < at0.size(); ++i) {
            REQUIRE_THAT(at0(i), WithinAbs(exact(i), 1e-8));
        }
        // d/dbeta exp(m * beta) = m * exp(m * beta)
        REQUIRE_THAT(linear->matrix()(2, 0), WithinAbs(2.0 * std::exp(0.8), 1e-5));
    }

    SECTION("Finite difference Jacobian of a nonlinear mapper") {
        ExpMapper mapper;
        REQUIRE(compareJacobianWithFiniteDifferences(mapper, input, Eigen::VectorXd::Constant(1, 0.1)) < 1e-5);
    }

    SECTION("Const pipeline linearizes to its offset") {
        ComponentMapper mapper(std::make_shared<ConstMapper>());
        auto linear = linearize(mapper, input, Eigen::VectorXd(0));
        REQUIRE(linear->latentSize() == 0);
        REQUIRE(sameValues(linear->evaluate(input, Eigen::VectorXd(0)), input.main.toVector()));
    }
}

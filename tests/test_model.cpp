#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "lateval/errors.h"
#include "lateval/evaluate.h"
#include "lateval/mappers.h"
#include <cmath>

using Catch::Matchers::WithinAbs;

using namespace lateval;

namespace {

// value_i = main_i * state_0^2
class SquareMapper : public Mapper {
public:
    std::string name() const override { return "square"; }
    size_t latentSize() const override { return 1; }
    bool isLinear() const override { return false; }
    Eigen::VectorXd evaluate(const MapperInput& input, const Eigen::VectorXd& state) const override {
        return input.main.toVector() * (state(0) * state(0));
    }
};

ComponentList makeComponents() {
    ComponentDefinition intercept;
    intercept.label = "intercept";
    intercept.type = ComponentType::Fixed;
    intercept.mapper = std::make_shared<LinearMapper>();

    ComponentDefinition x;
    x.label = "x";
    x.type = ComponentType::Fixed;
    x.main = "cov";
    x.mapper = std::make_shared<LinearMapper>();

    ComponentDefinition off;
    off.label = "off";
    off.type = ComponentType::Offset;
    off.main = "log(exposure)";
    off.mapper = std::make_shared<ConstMapper>();

    ComponentDefinition u;
    u.label = "u";
    u.type = ComponentType::IID;
    u.main = "idx";
    u.mapper = std::make_shared<IndexMapper>(3);

    return ComponentList{intercept, x, off, u};
}

DataSet makeData() {
    DataSet data;
    data.setNumeric("cov", Eigen::Vector3d(1.0, 2.0, 3.0));
    data.setNumeric("exposure", Eigen::Vector3d(1.0, 1.0, std::exp(1.0)));
    data.setNumeric("idx", Eigen::Vector3d(3.0, 2.0, 1.0));
    return data;
}

State makeState() {
    State state;
    state["intercept"] = Eigen::VectorXd::Constant(1, 2.0);
    state["x"] = Eigen::VectorXd::Constant(1, 0.5);
    state["u"] = Eigen::Vector3d(0.1, 0.2, 0.3);
    state["Precision_for_u"] = Eigen::VectorXd::Constant(1, 1.0);
    return state;
}

}  // namespace

TEST_CASE("Component definitions", "[model][component]") {
    REQUIRE(parseComponentType("linear") == ComponentType::Fixed);
    REQUIRE(parseComponentType("iid") == ComponentType::IID);
    REQUIRE(parseComponentType("ar1") == ComponentType::Other);
    REQUIRE(isOffsetType(ComponentType::Const));
    REQUIRE_FALSE(isOffsetType(ComponentType::IID));

    auto components = makeComponents();
    REQUIRE(components.size() == 4);
    REQUIRE(components.get("u").model() == "iid");
    REQUIRE(components.get("u").latentSize() == 3);
    REQUIRE(components.get("off").latentSize() == 0);
    REQUIRE(components.labels() == std::vector<std::string>{"intercept", "x", "off", "u"});

    SECTION("Duplicate labels") {
        ComponentDefinition again;
        again.label = "x";
        again.mapper = std::make_shared<LinearMapper>();
        REQUIRE_THROWS_AS(components.add(again), ConfigurationError);
    }

    SECTION("Unknown label lookup") {
        REQUIRE_FALSE(components.has("v"));
        REQUIRE(components.find("v") == nullptr);
        REQUIRE_THROWS_AS(components.get("v"), ConfigurationError);
    }

    SECTION("Invalid definitions") {
        ComponentDefinition noLabel;
        noLabel.mapper = std::make_shared<LinearMapper>();
        REQUIRE_THROWS_AS(Component(noLabel), ConfigurationError);

        ComponentDefinition noMapper;
        noMapper.label = "z";
        REQUIRE_THROWS_AS(Component(noMapper), ConfigurationError);

        ComponentDefinition noModel;
        noModel.label = "z";
        noModel.type = ComponentType::Other;
        noModel.mapper = std::make_shared<LinearMapper>();
        REQUIRE_THROWS_AS(Component(noModel), ConfigurationError);

        ComponentDefinition badMain;
        badMain.label = "z";
        badMain.main = "cov +";
        badMain.mapper = std::make_shared<LinearMapper>();
        REQUIRE_THROWS_AS(Component(badMain), EvaluationError);
    }
}

TEST_CASE("Model formula", "[model]") {
    SECTION("Every component without likelihoods") {
        auto model = Model::build(makeComponents());
        REQUIRE(model.isLinear());
        REQUIRE(model.formula() == "BRU_response ~ -1 + intercept + x + offset(off) + f(u, model = \"iid\")");
        REQUIRE(model.includedLabels().size() == 4);
    }

    SECTION("Offsets are dropped for nonlinear likelihoods") {
        Likelihood poisson;
        poisson.family = "poisson";
        poisson.linear = false;
        auto model = Model::build(makeComponents(), {poisson});
        REQUIRE_FALSE(model.isLinear());
        REQUIRE(model.formula() == "BRU_response ~ -1 + intercept + x + f(u, model = \"iid\")");
        REQUIRE(model.includedLabels().size() == 4);
    }

    SECTION("Union of the likelihoods' components in component order") {
        Likelihood first;
        first.include = std::vector<std::string>{"u"};
        Likelihood second;
        second.include = std::vector<std::string>{"x", "u"};
        second.exclude = std::vector<std::string>{"u"};
        auto model = Model::build(makeComponents(), {first, second});
        REQUIRE(model.formula() == "BRU_response ~ -1 + x + f(u, model = \"iid\")");
        REQUIRE(model.includedLabels() == std::vector<std::string>{"x", "u"});
    }

    SECTION("Unknown likelihood labels") {
        Likelihood bad;
        bad.include = std::vector<std::string>{"nope"};
        REQUIRE_THROWS_AS(Model::build(makeComponents(), {bad}), ConfigurationError);
    }

    SECTION("Summary and JSON") {
        auto model = Model::build(makeComponents());
        std::string summary = model.summary();
        REQUIRE(summary.find("Model formula: BRU_response ~ -1") != std::string::npos);
        REQUIRE(summary.find("mapper=component(index)") != std::string::npos);

        std::string json = model.toJSON();
        REQUIRE(json.find("\"formula\"") != std::string::npos);
        REQUIRE(json.find("\"latentSize\": 3") != std::string::npos);
    }
}

TEST_CASE("Per-likelihood inputs", "[model][input]") {
    Likelihood first;
    first.include = std::vector<std::string>{"x"};
    first.data = makeData();

    Likelihood second;
    second.include = std::vector<std::string>{"u"};
    second.data.setNumeric("idx", Eigen::Vector2d(1.0, 4.0));

    auto model = Model::build(makeComponents(), {first, second});
    auto inputs = evaluateInputs(model, model.likelihoods());

    REQUIRE(inputs.size() == 2);
    REQUIRE(inputs[0].size() == 1);
    REQUIRE(inputs[0].at("x").size() == 3);
    REQUIRE(inputs[1].count("x") == 0);
    REQUIRE(inputs[1].at("u").size() == 2);

    SECTION("Simplified per likelihood") {
        auto simplified = simplifyModel(model, inputs);
        REQUIRE(simplified.size() == 2);
        REQUIRE(simplified[0].labels == std::vector<std::string>{"x"});
        auto effects = evaluateEffects(simplified[1], inputs[1], makeState());
        REQUIRE_THAT(effects.at("u")(0), WithinAbs(0.1, 1e-12));
        REQUIRE(effects.at("u")(1) == 0.0);
    }

    SECTION("Linearized per likelihood") {
        auto linearized = linearizeModel(model, inputs, makeState());
        REQUIRE(linearized.size() == 2);
        REQUIRE(linearized[0].at("x").isLinear());
    }

    SECTION("Input failures name the component") {
        Likelihood missing;
        missing.include = std::vector<std::string>{"x"};
        try {
            evaluateInputs(model, {missing});
            FAIL("Expected an EvaluationError");
        } catch (const EvaluationError& e) {
            REQUIRE(std::string(e.what()).find("'x'") != std::string::npos);
        }
    }
}

TEST_CASE("Model evaluation", "[model][evaluate]") {
    auto model = Model::build(makeComponents());
    auto data = makeData();

    SECTION("Effects without a predictor") {
        auto evaluation = evaluateModel(model, {makeState()}, data);
        REQUIRE(evaluation.is<EffectsSequence>());
        const auto& effects = evaluation.as<EffectsSequence>();
        REQUIRE(effects.size() == 1);
        REQUIRE_THAT(effects[0].at("intercept")(1), WithinAbs(2.0, 1e-12));
        REQUIRE_THAT(effects[0].at("x")(2), WithinAbs(1.5, 1e-12));
        REQUIRE_THAT(effects[0].at("off")(2), WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(effects[0].at("u")(0), WithinAbs(0.3, 1e-12));
        REQUIRE(evaluation.warnings.empty());
    }

    SECTION("Included components only") {
        EvaluationOptions options;
        options.include = std::vector<std::string>{"x", "u"};
        options.exclude = std::vector<std::string>{"u"};
        auto evaluation = evaluateModel(model, {makeState()}, data, "", options);
        const auto& effects = evaluation.as<EffectsSequence>();
        REQUIRE(effects[0].size() == 1);
        REQUIRE(effects[0].count("x") == 1);
    }

    SECTION("No data means no effects") {
        auto evaluation = evaluateModel(model, {makeState()}, DataSet());
        REQUIRE(evaluation.as<EffectsSequence>().empty());
    }

    SECTION("Predictor over effects and evaluators") {
        auto evaluation = evaluateModel(model, {makeState()}, data, "intercept + x + off - x_eval(cov)");
        REQUIRE(evaluation.is<PredictorResult>());
        const auto& m = evaluation.as<PredictorResult>().as<PredictorMatrix>().values;
        REQUIRE(m.rows() == 3);
        REQUIRE_THAT(m(0, 0), WithinAbs(2.0, 1e-12));
        REQUIRE_THAT(m(2, 0), WithinAbs(3.0, 1e-12));
    }

    SECTION("Predictor output format option") {
        EvaluationOptions options;
        options.format = "list";
        auto evaluation = evaluateModel(model, {makeState()}, data, "x", options);
        REQUIRE(evaluation.as<PredictorResult>().is<PredictorList>());

        options.format = "grid";
        REQUIRE_THROWS_AS(evaluateModel(model, {makeState()}, data, "x", options), ConfigurationError);
    }

    SECTION("Precomputed inputs and mappers are used as given") {
        auto inputs = evaluateComponentInputs(model.components(), data, model.includedLabels());
        auto simplified = simplifyComponents(model.components(), inputs);
        auto evaluation = evaluateModel(model, {makeState()}, DataSet(), "", EvaluationOptions(), &inputs, &simplified);
        REQUIRE(evaluation.as<EffectsSequence>()[0].size() == 4);
    }

    SECTION("Empty state sequence") {
        REQUIRE_THROWS_AS(evaluateModel(model, StateSequence{}, data), ConfigurationError);
    }

    SECTION("Nonlinear components are reported") {
        ComponentDefinition sq;
        sq.label = "sq";
        sq.type = ComponentType::Other;
        sq.model = "custom";
        sq.main = "cov";
        sq.mapper = std::make_shared<SquareMapper>();
        ComponentList components = makeComponents();
        components.add(sq);
        auto nonlinear = Model::build(components);

        State state = makeState();
        state["sq"] = Eigen::VectorXd::Constant(1, 3.0);
        auto evaluation = evaluateModel(nonlinear, {state}, data);
        REQUIRE(evaluation.warnings.size() == 1);
        REQUIRE_THAT(evaluation.as<EffectsSequence>()[0].at("sq")(1), WithinAbs(18.0, 1e-12));
    }
}

TEST_CASE("Model evaluation from a fitted result", "[model][evaluate][summary]") {
    auto model = Model::build(makeComponents());
    auto data = makeData();
    auto result = SummaryResult::fromJSON(R"({
        "latent": {
            "intercept": {"mean": [1.0], "sd": [0.1], "mode": [1.0]},
            "x": {"mean": [2.0], "sd": [0.1], "mode": [1.5]},
            "u": {"mean": [0, 0, 0], "sd": [1, 1, 1], "mode": [0, 0, 0]}
        },
        "hyperpar": {"Precision for u": {"mean": 1.0, "sd": 0.1, "mode": 1.0}}
    })");

    SECTION("Mean state") {
        EvaluationOptions options;
        options.property = "mean";
        auto evaluation = evaluateModel(model, &result, data, "x_eval(cov)", options);
        REQUIRE_THAT(evaluation.as<PredictorResult>().as<PredictorMatrix>().values(2, 0), WithinAbs(6.0, 1e-12));
    }

    SECTION("Posterior samples") {
        EvaluationOptions options;
        options.property = "sample";
        options.samples = 4;
        options.seed = 7;
        auto evaluation = evaluateModel(model, &result, data, "x_eval(cov)", options);
        REQUIRE(evaluation.as<PredictorResult>().size() == 4);
    }

    SECTION("Without a result the state is zero") {
        auto evaluation = evaluateModel(model, nullptr, data, "x_eval(cov) + intercept_eval()");
        REQUIRE(evaluation.as<PredictorResult>().as<PredictorMatrix>().values.isZero());
    }
}

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "lateval/errors.h"
#include "lateval/evaluator.h"
#include "lateval/parser.h"
#include <cmath>

using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

using namespace lateval;

static Value evalIn(EvaluationContext& context, const std::string& source) {
    ExpressionEvaluator evaluator(context);
    return evaluator.evaluate(parseExpression(source));
}

static EvaluationContext makeContext() {
    EvaluationContext context;
    Eigen::VectorXd x(3);
    x << 1.0, 2.0, 3.0;
    context.scope.bind("x", Value::vector(x));
    context.scope.bind("name", Value::text({"a", "b", "c"}));
    context.scope.bind("beta", Value::scalar(0.5));
    return context;
}

TEST_CASE("ExpressionEvaluator arithmetic", "[evaluator]") {
    auto context = makeContext();

    SECTION("Scalar arithmetic") {
        auto v = evalIn(context, "1 + 2 * 3 - 4 / 2").toVector();
        REQUIRE(v.size() == 1);
        REQUIRE_THAT(v(0), WithinAbs(5.0, 1e-15));
    }

    SECTION("Length-1 operands are broadcast") {
        auto v = evalIn(context, "x * beta + 1").toVector();
        REQUIRE(v.size() == 3);
        REQUIRE_THAT(v(0), WithinAbs(1.5, 1e-15));
        REQUIRE_THAT(v(1), WithinAbs(2.0, 1e-15));
        REQUIRE_THAT(v(2), WithinAbs(2.5, 1e-15));
    }

    SECTION("Elementwise vector operations") {
        auto v = evalIn(context, "x * x - x").toVector();
        REQUIRE_THAT(v(2), WithinAbs(6.0, 1e-15));
    }

    SECTION("Power and unary minus") {
        REQUIRE_THAT(evalIn(context, "-2^2").toVector()(0), WithinAbs(-4.0, 1e-15));
        REQUIRE_THAT(evalIn(context, "2^3^2").toVector()(0), WithinAbs(512.0, 1e-12));
    }

    SECTION("Mismatched lengths are rejected") {
        REQUIRE_THROWS_AS(evalIn(context, "x + c(1, 2)"), EvaluationError);
    }

    SECTION("Arithmetic on text is rejected") {
        REQUIRE_THROWS_AS(evalIn(context, "name + 1"), EvaluationError);
    }

    SECTION("Matrix shape is kept") {
        auto m = evalIn(context, "cbind(x) * 2");
        REQUIRE(m.is<Numeric>());
        REQUIRE(m.as<Numeric>().isMatrix);
        REQUIRE(m.rows() == 3);
        REQUIRE(m.cols() == 1);
    }
}

TEST_CASE("ExpressionEvaluator builtins", "[evaluator]") {
    auto context = makeContext();

    SECTION("Elementwise math") {
        auto v = evalIn(context, "exp(log(x))").toVector();
        REQUIRE_THAT(v(1), WithinRel(2.0, 1e-12));
        REQUIRE_THAT(evalIn(context, "sqrt(abs(-16))").toVector()(0), WithinAbs(4.0, 1e-15));
        REQUIRE_THAT(evalIn(context, "log1p(expm1(0.25))").toVector()(0), WithinAbs(0.25, 1e-14));
    }

    SECTION("Logistic and normal CDF") {
        REQUIRE_THAT(evalIn(context, "plogis(0)").toVector()(0), WithinAbs(0.5, 1e-15));
        REQUIRE_THAT(evalIn(context, "qlogis(plogis(1.3))").toVector()(0), WithinAbs(1.3, 1e-12));
        REQUIRE_THAT(evalIn(context, "pnorm(0)").toVector()(0), WithinAbs(0.5, 1e-15));
        REQUIRE_THAT(evalIn(context, "pnorm(1.959963984540054)").toVector()(0), WithinAbs(0.975, 1e-12));
        REQUIRE_THAT(evalIn(context, "pnorm(3, mean = 3, sd = 2)").toVector()(0), WithinAbs(0.5, 1e-15));
    }

    SECTION("Reductions") {
        REQUIRE(evalIn(context, "sum(x)").toVector()(0) == 6.0);
        REQUIRE(evalIn(context, "sum(x, 10)").toVector()(0) == 16.0);
        REQUIRE(evalIn(context, "mean(x)").toVector()(0) == 2.0);
        REQUIRE(evalIn(context, "min(x)").toVector()(0) == 1.0);
        REQUIRE(evalIn(context, "max(x, 7)").toVector()(0) == 7.0);
        REQUIRE(evalIn(context, "length(name)").toVector()(0) == 3.0);
        REQUIRE(evalIn(context, "nrow(cbind(x, x))").toVector()(0) == 3.0);
    }

    SECTION("Constructors") {
        auto v = evalIn(context, "c(x, 4)").toVector();
        REQUIRE(v.size() == 4);
        REQUIRE(v(3) == 4.0);

        auto r = evalIn(context, "rep(c(1, 2), 2)").toVector();
        REQUIRE(r.size() == 4);
        REQUIRE(r(2) == 1.0);

        auto each = evalIn(context, "rep(c(1, 2), each = 2)").toVector();
        REQUIRE(each(1) == 1.0);
        REQUIRE(each(2) == 2.0);

        auto m = evalIn(context, "cbind(x, 1)");
        REQUIRE(m.rows() == 3);
        REQUIRE(m.cols() == 2);
        REQUIRE(m.as<Numeric>().data(2, 1) == 1.0);

        auto text = evalIn(context, "c(name, 'd')");
        REQUIRE(text.is<Text>());
        REQUIRE(text.as<Text>().values.back() == "d");
    }

    SECTION("Lists, field access and indexing") {
        auto item = evalIn(context, "list(a = x, b = 2)$a[2]").toVector();
        REQUIRE(item.size() == 1);
        REQUIRE(item(0) == 2.0);
        REQUIRE(evalIn(context, "list(a = x, b = 2)['b']").toVector()(0) == 2.0);
        REQUIRE(evalIn(context, "name[2]").as<Text>().values[0] == "b");
        REQUIRE(evalIn(context, "x[c(3, 1)]").toVector()(0) == 3.0);
        REQUIRE_THROWS_AS(evalIn(context, "x[4]"), EvaluationError);
    }
}

TEST_CASE("ExpressionEvaluator must reject invalid rep() counts", "[evaluator][errors]") {
    auto context = makeContext();

    SECTION("Negative count") {
        REQUIRE_THROWS_AS(evalIn(context, "rep(1, -1)"), EvaluationError);
        REQUIRE_THROWS_AS(evalIn(context, "rep(x, each = -2)"), EvaluationError);
    }

    SECTION("Fractional and non-finite counts") {
        REQUIRE_THROWS_AS(evalIn(context, "rep(1, 2.5)"), EvaluationError);
        REQUIRE_THROWS_AS(evalIn(context, "rep(1, 1 / 0)"), EvaluationError);
        REQUIRE_THROWS_AS(evalIn(context, "rep(1, log(-1))"), EvaluationError);
    }

    SECTION("Oversized results") {
        REQUIRE_THROWS_AS(evalIn(context, "rep(1, 1e12)"), EvaluationError);
        REQUIRE_THROWS_AS(evalIn(context, "rep(x, 1e8, each = 1e8)"), EvaluationError);
    }

    SECTION("Zero count gives an empty vector") {
        REQUIRE(evalIn(context, "rep(x, 0)").toVector().size() == 0);
    }

    SECTION("Error is categorized as an evaluation failure") {
        try {
            evalIn(context, "rep(1, -1)");
            FAIL("Expected an EvaluationError");
        } catch (const EvaluationError& e) {
            REQUIRE(categorizeError(e.what()) == ErrorCategory::Evaluation);
        }
    }
}

TEST_CASE("ExpressionEvaluator data binding", "[evaluator]") {
    DataSet data;
    data.setNumeric("cov", Eigen::Vector3d(1.0, 2.0, 3.0));
    data.setText("site", {"n", "s", "n"});

    SECTION("Fields and .data. resolve") {
        auto v = evaluateInData(parseExpression("cov + .data.$cov"), data).toVector();
        REQUIRE(v(2) == 6.0);
        auto site = evaluateInData(parseExpression(".data.$site"), data);
        REQUIRE(site.as<Text>().values[1] == "s");
    }

    SECTION("Data sets load from JSON") {
        auto loaded = DataSet::fromJSON(R"({"cov": [1, 2, 3], "site": ["n", "s", "n"], "k": 2})");
        REQUIRE(loaded.size() == 3);
        REQUIRE(loaded.fields()[0].first == "cov");
        REQUIRE(loaded.rows() == 3);
        REQUIRE(evaluateInData(parseExpression("sum(cov) * k"), loaded).toVector()(0) == 12.0);
    }

    SECTION("Invalid JSON is a configuration error") {
        REQUIRE_THROWS_AS(DataSet::fromJSON("[1, 2"), ConfigurationError);
    }
}

TEST_CASE("ExpressionEvaluator must throw for undefined names", "[evaluator][errors]") {
    auto context = makeContext();

    try {
        evalIn(context, "x + missing");
        FAIL("Expected an EvaluationError");
    } catch (const EvaluationError& e) {
        std::string msg = e.what();
        REQUIRE(msg.find("missing") != std::string::npos);
        REQUIRE(categorizeError(msg) == ErrorCategory::UndefinedName);
    }

    REQUIRE_THROWS_AS(evalIn(context, "list(a = 1)$b"), EvaluationError);
}

TEST_CASE("ExpressionEvaluator must throw for unknown functions", "[evaluator][errors]") {
    auto context = makeContext();

    SECTION("Unknown function") {
        try {
            evalIn(context, "unknown_function(x)");
            FAIL("Expected an EvaluationError");
        } catch (const EvaluationError& e) {
            REQUIRE(categorizeError(e.what()) == ErrorCategory::UnknownFunction);
        }
    }

    SECTION("A bound value is not callable") {
        REQUIRE_THROWS_AS(evalIn(context, "beta(1)"), EvaluationError);
    }

    SECTION("Generic component evaluator is rejected") {
        try {
            evalIn(context, "component_eval(x)");
            FAIL("Expected an EvaluationError");
        } catch (const EvaluationError& e) {
            std::string msg = e.what();
            REQUIRE(msg.find("_eval") != std::string::npos);
        }
    }
}

TEST_CASE("Error categorization", "[errors]") {
    REQUIRE(categorizeError("") == ErrorCategory::None);
    REQUIRE(categorizeError("Undefined name: z") == ErrorCategory::UndefinedName);
    REQUIRE(categorizeError("Unknown component label 'q' in include") == ErrorCategory::Configuration);
    REQUIRE(categorizeError("Evaluation failed: operands of '+' have lengths 3 and 2") == ErrorCategory::Evaluation);
    REQUIRE(categorizeError("something else") == ErrorCategory::Other);
    REQUIRE(categoryToString(ErrorCategory::ParseError) == "ParseError");
}

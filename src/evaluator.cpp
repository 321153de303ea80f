#include "lateval/evaluator.h"
#include "lateval/errors.h"
#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>

namespace lateval {

// ============================================================================
// Numeric Helpers
// ============================================================================

static const Numeric& numericArg(const Value& value, const std::string& context) {
    if (!value.is<Numeric>()) {
        throw EvaluationError("Evaluation failed: " + context + " expects a numeric value, got " + value.typeName());
    }
    return value.as<Numeric>();
}

template<typename F>
static Value mapElementwise(const Value& value, const std::string& name, F f) {
    Numeric result = numericArg(value, name + "()");
    result.data = result.data.unaryExpr(f);
    return Value{result};
}

// Shape of an elementwise result: the operand that has the full length
// (preferring the left one) provides dimensions and row names
template<typename F>
static Value combineElementwise(const Value& left, const Value& right, const std::string& op, F f) {
    const Numeric& a = numericArg(left, "operator '" + op + "'");
    const Numeric& b = numericArg(right, "operator '" + op + "'");
    const Eigen::Index na = a.data.size();
    const Eigen::Index nb = b.data.size();

    if (na == 0 || nb == 0) {
        return Value::vector(Eigen::VectorXd(0));
    }
    if (na != nb && na != 1 && nb != 1) {
        throw EvaluationError("Evaluation failed: operands of '" + op + "' have lengths " +
                              std::to_string(na) + " and " + std::to_string(nb));
    }

    Numeric result;
    if (na == nb) {
        result = (!a.isMatrix && b.isMatrix) ? b : a;
    } else {
        result = na == 1 ? b : a;
    }
    const Eigen::Index n = std::max(na, nb);
    for (Eigen::Index i = 0; i < n; ++i) {
        double x = a.data.data()[na == 1 ? 0 : i];
        double y = b.data.data()[nb == 1 ? 0 : i];
        result.data.data()[i] = f(x, y);
    }
    return Value{result};
}

static double plogis(double x) { return 1.0 / (1.0 + std::exp(-x)); }
static double qlogis(double p) { return std::log(p / (1.0 - p)); }

static double pnorm(double q, double mean, double sd) {
    return 0.5 * std::erfc(-(q - mean) / (sd * std::sqrt(2.0)));
}

// Upper bound on the length of a rep() result
static constexpr size_t MAX_REP_LENGTH = 100000000;

// 1-based positions of an index value
static std::vector<size_t> indexPositions(const Value& index, size_t length) {
    const Numeric& idx = numericArg(index, "indexing");
    std::vector<size_t> positions;
    positions.reserve(static_cast<size_t>(idx.data.size()));
    for (Eigen::Index i = 0; i < idx.data.size(); ++i) {
        double v = idx.data.data()[i];
        if (v != std::floor(v) || v < 1.0 || v > static_cast<double>(length)) {
            throw EvaluationError("Evaluation failed: index " + formatNumber(v) +
                                  " out of range 1.." + std::to_string(length));
        }
        positions.push_back(static_cast<size_t>(v) - 1);
    }
    return positions;
}

// ============================================================================
// Builtin Table
// ============================================================================

const std::vector<std::string>& builtinFunctions() {
    static const std::vector<std::string> names = {
        "exp", "log", "log1p", "expm1", "sqrt", "abs", "sin", "cos", "tan", "tanh",
        "plogis", "qlogis", "pnorm",
        "sum", "mean", "min", "max", "length", "nrow",
        "c", "cbind", "rep", "list"
    };
    return names;
}

bool isBuiltinFunction(const std::string& name) {
    const auto& names = builtinFunctions();
    return std::find(names.begin(), names.end(), name) != names.end();
}

// ============================================================================
// ExpressionEvaluator
// ============================================================================

ExpressionEvaluator::ExpressionEvaluator(EvaluationContext& context) : context_(context) {}

Value ExpressionEvaluator::evaluate(const ExprPtr& expr) {
    if (!expr) {
        throw EvaluationError("Evaluation failed: null expression");
    }

    if (expr->is<NumberLiteral>()) {
        return evaluateNumber(expr->as<NumberLiteral>());
    } else if (expr->is<StringLiteral>()) {
        return evaluateString(expr->as<StringLiteral>());
    } else if (expr->is<Variable>()) {
        return evaluateVariable(expr->as<Variable>());
    } else if (expr->is<UnaryOp>()) {
        return evaluateUnaryOp(expr->as<UnaryOp>());
    } else if (expr->is<BinaryOp>()) {
        return evaluateBinaryOp(expr->as<BinaryOp>());
    } else if (expr->is<IndexOp>()) {
        return evaluateIndex(expr->as<IndexOp>());
    } else if (expr->is<FunctionCall>()) {
        return evaluateFunctionCall(expr->as<FunctionCall>());
    }

    throw EvaluationError("Evaluation failed: unknown expression type");
}

Value ExpressionEvaluator::evaluateNumber(const NumberLiteral& num) {
    return Value::scalar(num.value);
}

Value ExpressionEvaluator::evaluateString(const StringLiteral& str) {
    return Value::text({str.value});
}

Value ExpressionEvaluator::evaluateVariable(const Variable& var) {
    return context_.scope.value(var.name);
}

Value ExpressionEvaluator::evaluateUnaryOp(const UnaryOp& op) {
    Value operand = evaluate(op.operand);

    if (op.op == "-") {
        return mapElementwise(operand, "unary minus", [](double x) { return -x; });
    } else if (op.op == "+") {
        numericArg(operand, "unary plus");
        return operand;
    }

    throw EvaluationError("Evaluation failed: unknown unary operator " + op.op);
}

Value ExpressionEvaluator::evaluateBinaryOp(const BinaryOp& op) {
    Value left = evaluate(op.left);
    Value right = evaluate(op.right);

    if (op.op == "+") {
        return combineElementwise(left, right, op.op, [](double x, double y) { return x + y; });
    } else if (op.op == "-") {
        return combineElementwise(left, right, op.op, [](double x, double y) { return x - y; });
    } else if (op.op == "*") {
        return combineElementwise(left, right, op.op, [](double x, double y) { return x * y; });
    } else if (op.op == "/") {
        return combineElementwise(left, right, op.op, [](double x, double y) { return x / y; });
    } else if (op.op == "^") {
        return combineElementwise(left, right, op.op, [](double x, double y) { return std::pow(x, y); });
    }

    throw EvaluationError("Evaluation failed: unknown binary operator " + op.op);
}

Value ExpressionEvaluator::evaluateIndex(const IndexOp& op) {
    Value object = evaluate(op.object);

    // x$name
    if (!op.index) {
        if (!object.is<NamedList>()) {
            throw EvaluationError("Evaluation failed: $ applied to a " + object.typeName());
        }
        const Value* item = object.as<NamedList>().find(op.field);
        if (!item) {
            throw EvaluationError("Undefined name: list element '" + op.field + "'");
        }
        return *item;
    }

    Value index = evaluate(op.index);

    if (object.is<NamedList>()) {
        const auto& list = object.as<NamedList>();
        if (index.is<Text>() && index.as<Text>().values.size() == 1) {
            const std::string& name = index.as<Text>().values[0];
            const Value* item = list.find(name);
            if (!item) {
                throw EvaluationError("Undefined name: list element '" + name + "'");
            }
            return *item;
        }
        auto positions = indexPositions(index, list.items.size());
        if (positions.size() != 1) {
            throw EvaluationError("Evaluation failed: list elements are selected one at a time");
        }
        return list.items[positions[0]];
    }

    if (object.is<Text>()) {
        const auto& values = object.as<Text>().values;
        std::vector<std::string> selected;
        for (size_t pos : indexPositions(index, values.size())) {
            selected.push_back(values[pos]);
        }
        return Value::text(std::move(selected));
    }

    // Numeric: column-major element positions, the result is a flat vector
    const auto& data = object.as<Numeric>().data;
    auto positions = indexPositions(index, static_cast<size_t>(data.size()));
    Eigen::VectorXd selected(static_cast<Eigen::Index>(positions.size()));
    for (size_t i = 0; i < positions.size(); ++i) {
        selected(static_cast<Eigen::Index>(i)) = data.data()[positions[i]];
    }
    return Value::vector(selected);
}

Value ExpressionEvaluator::evaluateFunctionCall(const FunctionCall& call) {
    const Binding* binding = context_.scope.lookup(call.name);
    if (binding && std::holds_alternative<ComponentEvaluator>(*binding)) {
        return evaluateComponent(*std::get<ComponentEvaluator>(*binding).component, call);
    }

    if (call.name == "component_eval") {
        throw EvaluationError("Evaluation failed: component_eval() cannot be called directly; "
                              "use <label>_eval(...) to evaluate the component called <label>");
    }

    if (!isBuiltinFunction(call.name)) {
        throw EvaluationError("Unknown function: " + call.name);
    }

    std::vector<Value> args;
    args.reserve(call.args.size());
    for (const auto& arg : call.args) {
        args.push_back(evaluate(arg));
    }
    std::vector<std::pair<std::string, Value>> namedArgs;
    for (const auto& [name, arg] : call.namedArgs) {
        namedArgs.emplace_back(name, evaluate(arg));
    }
    return callBuiltin(call.name, args, namedArgs);
}

// ============================================================================
// Component Evaluators
// ============================================================================

Value ExpressionEvaluator::evaluateComponent(const Component& component, const FunctionCall& call) {
    static const std::vector<std::string> parameters = {"main", "group", "replicate", "weights", "state"};

    if (call.args.size() > parameters.size()) {
        throw EvaluationError("Evaluation failed: " + call.name + "() takes at most " +
                              std::to_string(parameters.size()) + " arguments");
    }
    std::map<std::string, Value> given;
    for (size_t i = 0; i < call.args.size(); ++i) {
        given.emplace(parameters[i], evaluate(call.args[i]));
    }
    for (const auto& [argName, arg] : call.namedArgs) {
        std::string name = argName == ".state" ? "state" : argName;
        if (std::find(parameters.begin(), parameters.end(), name) == parameters.end()) {
            throw EvaluationError("Evaluation failed: unused argument '" + argName + "' in " + call.name + "()");
        }
        if (given.count(name)) {
            throw EvaluationError("Evaluation failed: argument '" + name + "' given twice in " + call.name + "()");
        }
        given.emplace(name, evaluate(arg));
    }

    MapperInput input;
    input.main = given.count("main") ? given.at("main") : Value::scalar(1.0);
    const size_t n = input.main.rows();
    input.group = given.count("group") ? given.at("group") : Value::constant(1.0, n);
    input.replicate = given.count("replicate") ? given.at("replicate") : Value::constant(1.0, n);
    if (given.count("weights")) {
        input.scale = given.at("weights").toVector();
    }

    const std::string& label = component.label();
    const std::string latentName = label + "_latent";
    Eigen::VectorXd state(0);
    if (given.count("state")) {
        state = given.at("state").toVector();
    } else if (isOffsetType(component.type())) {
        if (component.latentSize() > 0 && context_.scope.hasValue(latentName)) {
            state = context_.scope.value(latentName).toVector();
        }
    } else {
        state = context_.scope.value(latentName).toVector();
    }

    Eigen::VectorXd values = component.mapper()->evaluate(input, state);

    if (component.type() == ComponentType::IID) {
        // Validity is decided by the first pipeline stage; later stages
        // keep the length and validity of its output
        const Mapper& first = component.mapper()->firstStage();
        const auto firstSize = static_cast<Eigen::Index>(first.latentSize());
        Eigen::VectorXd firstState = state.size() >= firstSize ? Eigen::VectorXd(state.head(firstSize)) : state;
        std::vector<bool> invalid = first.invalidOutput(MapperInput::fromMain(input.main), firstState);

        for (size_t i = 0; i < invalid.size() && i < static_cast<size_t>(values.size()); ++i) {
            if (!invalid[i]) continue;
            values(static_cast<Eigen::Index>(i)) = context_.iidCache.get(label, input.main.keyAt(i), [&]() {
                Eigen::VectorXd precision = context_.scope.value("Precision_for_" + label).toVector();
                if (precision.size() == 0) {
                    throw EvaluationError("Evaluation failed: Precision_for_" + label + " is empty");
                }
                return context_.random->normal(0.0, std::pow(precision(0), -0.5));
            });
        }
    }

    return Value::column(values);
}

// ============================================================================
// Builtins
// ============================================================================

Value ExpressionEvaluator::callBuiltin(const std::string& name,
                                       const std::vector<Value>& args,
                                       const std::vector<std::pair<std::string, Value>>& namedArgs) {
    auto named = [&namedArgs](const std::string& key) -> const Value* {
        for (const auto& [argName, value] : namedArgs) {
            if (argName == key) return &value;
        }
        return nullptr;
    };
    auto requireArgs = [&](size_t count) {
        if (args.size() != count || !namedArgs.empty()) {
            throw EvaluationError("Evaluation failed: " + name + "() expects " + std::to_string(count) +
                                  " argument" + (count == 1 ? "" : "s"));
        }
    };
    auto scalarArg = [&](const Value& value, const std::string& what) {
        const Numeric& num = numericArg(value, name + "()");
        if (num.data.size() != 1) {
            throw EvaluationError("Evaluation failed: " + what + " of " + name + "() must have length 1");
        }
        return num.data(0, 0);
    };

    // Elementwise math
    static const std::map<std::string, double (*)(double)> unaryMath = {
        {"exp", [](double x) { return std::exp(x); }},
        {"log", [](double x) { return std::log(x); }},
        {"log1p", [](double x) { return std::log1p(x); }},
        {"expm1", [](double x) { return std::expm1(x); }},
        {"sqrt", [](double x) { return std::sqrt(x); }},
        {"abs", [](double x) { return std::abs(x); }},
        {"sin", [](double x) { return std::sin(x); }},
        {"cos", [](double x) { return std::cos(x); }},
        {"tan", [](double x) { return std::tan(x); }},
        {"tanh", [](double x) { return std::tanh(x); }},
        {"plogis", &plogis},
        {"qlogis", &qlogis}
    };
    auto math = unaryMath.find(name);
    if (math != unaryMath.end()) {
        requireArgs(1);
        auto fn = math->second;
        return mapElementwise(args[0], name, [fn](double x) { return fn(x); });
    }

    if (name == "pnorm") {
        if (args.empty() || args.size() > 3) {
            throw EvaluationError("Evaluation failed: pnorm() expects 1 to 3 arguments");
        }
        double mean = 0.0;
        double sd = 1.0;
        if (args.size() > 1) mean = scalarArg(args[1], "mean");
        if (args.size() > 2) sd = scalarArg(args[2], "sd");
        if (const Value* v = named("mean")) mean = scalarArg(*v, "mean");
        if (const Value* v = named("sd")) sd = scalarArg(*v, "sd");
        return mapElementwise(args[0], name, [mean, sd](double x) { return pnorm(x, mean, sd); });
    }

    // Reductions
    if (name == "sum" || name == "min" || name == "max") {
        if (!namedArgs.empty()) {
            throw EvaluationError("Evaluation failed: " + name + "() takes no named arguments");
        }
        std::vector<double> all;
        for (const auto& arg : args) {
            const auto& data = numericArg(arg, name + "()").data;
            all.insert(all.end(), data.data(), data.data() + data.size());
        }
        if (name == "sum") {
            return Value::scalar(std::accumulate(all.begin(), all.end(), 0.0));
        }
        if (all.empty()) {
            throw EvaluationError("Evaluation failed: " + name + "() of an empty vector");
        }
        return Value::scalar(name == "min" ? *std::min_element(all.begin(), all.end())
                                           : *std::max_element(all.begin(), all.end()));
    }
    if (name == "mean") {
        requireArgs(1);
        const auto& data = numericArg(args[0], "mean()").data;
        if (data.size() == 0) {
            throw EvaluationError("Evaluation failed: mean() of an empty vector");
        }
        return Value::scalar(data.mean());
    }
    if (name == "length") {
        requireArgs(1);
        const Value& v = args[0];
        if (v.is<Numeric>()) return Value::scalar(static_cast<double>(v.as<Numeric>().data.size()));
        return Value::scalar(static_cast<double>(v.rows()));
    }
    if (name == "nrow") {
        requireArgs(1);
        return Value::scalar(static_cast<double>(args[0].rows()));
    }

    // Constructors
    if (name == "list") {
        std::vector<std::string> names(args.size());
        std::vector<Value> items(args.begin(), args.end());
        for (const auto& [argName, value] : namedArgs) {
            names.push_back(argName);
            items.push_back(value);
        }
        return Value::list(std::move(names), std::move(items));
    }

    std::vector<Value> all(args.begin(), args.end());
    for (const auto& entry : namedArgs) all.push_back(entry.second);

    if (name == "c") {
        bool anyText = false;
        for (const auto& v : all) {
            if (v.is<NamedList>()) {
                throw EvaluationError("Evaluation failed: c() does not combine lists");
            }
            anyText = anyText || v.is<Text>();
        }
        if (anyText) {
            std::vector<std::string> values;
            for (const auto& v : all) {
                for (size_t i = 0; i < static_cast<size_t>(v.is<Text>() ? v.rows() : v.as<Numeric>().data.size()); ++i) {
                    values.push_back(v.keyAt(i));
                }
            }
            return Value::text(std::move(values));
        }
        std::vector<double> values;
        for (const auto& v : all) {
            const auto& data = v.as<Numeric>().data;
            values.insert(values.end(), data.data(), data.data() + data.size());
        }
        return Value::vector(Eigen::Map<const Eigen::VectorXd>(values.data(), static_cast<Eigen::Index>(values.size())));
    }

    if (name == "cbind") {
        if (all.empty()) {
            throw EvaluationError("Evaluation failed: cbind() needs at least one argument");
        }
        Eigen::Index rows = 1;
        Eigen::Index cols = 0;
        std::vector<std::string> rowNames;
        for (const auto& v : all) {
            const Numeric& num = numericArg(v, "cbind()");
            rows = std::max(rows, num.data.rows());
            cols += num.data.cols();
            if (rowNames.empty()) rowNames = num.rowNames;
        }
        Eigen::MatrixXd result(rows, cols);
        Eigen::Index col = 0;
        for (const auto& v : all) {
            const auto& data = v.as<Numeric>().data;
            if (data.rows() != rows && data.size() != 1) {
                throw EvaluationError("Evaluation failed: cbind() arguments have " + std::to_string(data.rows()) +
                                      " and " + std::to_string(rows) + " rows");
            }
            if (data.size() == 1) {
                result.col(col++).setConstant(data(0, 0));
            } else {
                result.block(0, col, rows, data.cols()) = data;
                col += data.cols();
            }
        }
        if (static_cast<Eigen::Index>(rowNames.size()) != rows) rowNames.clear();
        return Value::matrix(result, rowNames);
    }

    if (name == "rep") {
        if (args.empty() || args.size() > 2) {
            throw EvaluationError("Evaluation failed: rep() expects x and optionally times");
        }
        // Counts must be whole numbers in [0, MAX_REP_LENGTH]
        auto countArg = [&](const Value& value, const std::string& what) {
            double count = scalarArg(value, what);
            if (!std::isfinite(count) || count < 0.0 || count != std::floor(count) ||
                count > static_cast<double>(MAX_REP_LENGTH)) {
                throw EvaluationError("Evaluation failed: invalid '" + what + "' argument " +
                                      formatNumber(count) + " in rep()");
            }
            return static_cast<size_t>(count);
        };
        size_t times = 1;
        size_t each = 1;
        if (args.size() == 2) times = countArg(args[1], "times");
        if (const Value* v = named("times")) times = countArg(*v, "times");
        if (const Value* v = named("each")) each = countArg(*v, "each");

        const Value& x = args[0];
        size_t n = x.is<Numeric>() ? static_cast<size_t>(x.as<Numeric>().data.size()) : x.rows();
        if (n != 0 && times * each > MAX_REP_LENGTH / n) {
            throw EvaluationError("Evaluation failed: rep() result longer than " +
                                  std::to_string(MAX_REP_LENGTH) + " elements");
        }
        std::vector<size_t> order;
        for (size_t t = 0; t < times; ++t) {
            for (size_t i = 0; i < n; ++i) {
                for (size_t e = 0; e < each; ++e) order.push_back(i);
            }
        }
        if (x.is<Text>()) {
            std::vector<std::string> values;
            for (size_t i : order) values.push_back(x.as<Text>().values[i]);
            return Value::text(std::move(values));
        }
        const auto& data = numericArg(x, "rep()").data;
        Eigen::VectorXd values(static_cast<Eigen::Index>(order.size()));
        for (size_t k = 0; k < order.size(); ++k) {
            values(static_cast<Eigen::Index>(k)) = data.data()[order[k]];
        }
        return Value::vector(values);
    }

    throw EvaluationError("Unknown function: " + name);
}

// ============================================================================
// Data Evaluation
// ============================================================================

Value evaluateInData(const ExprPtr& expr, const DataSet& data) {
    EvaluationContext context;
    context.scope.bindData(data);
    ExpressionEvaluator evaluator(context);
    return evaluator.evaluate(expr);
}

}  // namespace lateval

#include "lateval/parser.h"
#include "lateval/errors.h"
#include <peglib.h>
#include <any>
#include <sstream>

namespace lateval {

// ============================================================================
// Predictor Grammar (PEG format)
// ============================================================================

// Note: '^' binds tighter than unary minus (-2^2 == -4) and is right
// associative; names may contain and start with '.', so `.data.` and
// `.state` are plain names.

static const char* PREDICTOR_GRAMMAR = R"(
    # Top-level: optional formula marker
    Predictor       <- '~'? Expression

    # Expressions with operator precedence
    Expression      <- Additive
    Additive        <- Multiplicative (AddOp Multiplicative)*
    Multiplicative  <- Unary (MulOp Unary)*
    Unary           <- UnaryOp Unary / Power
    Power           <- Postfix ('^' Unary)?

    # Indexing and list field access
    Postfix         <- Primary Suffix*
    Suffix          <- '[' Expression ']' / '$' Name

    # Primary expressions
    Primary         <- Number / FunctionCall / String / Name / '(' Expression ')'

    # Function calls: f(x), x_eval(x, group = g)
    FunctionCall    <- Name '(' ArgList? ')'
    ArgList         <- Arg (',' Arg)*
    Arg             <- NamedArg / Expression
    NamedArg        <- Name '=' Expression

    # Operators
    AddOp           <- < [-+] >
    MulOp           <- < [*/] >
    UnaryOp         <- < [-+] >

    # Names
    Name            <- < [a-zA-Z._] [a-zA-Z0-9._]* >

    # Numbers: integer, float, scientific notation
    Number          <- < [0-9]+ ('.' [0-9]*)? ([eE] [-+]? [0-9]+)? > / < '.' [0-9]+ ([eE] [-+]? [0-9]+)? >

    # String literals, quotes stripped by the action
    String          <- < '"' (!'"' .)* '"' > / < "'" (!"'" .)* "'" >

    %whitespace     <- [ \t\r\n]*
)";

namespace {

struct Suffix {
    ExprPtr index;
    std::string field;
};

struct CallArg {
    std::string name;
    ExprPtr value;
};

}  // namespace

// ============================================================================
// Parser Implementation
// ============================================================================

class PredictorParser::Impl {
public:
    Impl() {
        initializeGrammar();
    }

    ParseResult parse(const std::string& source) {
        ParseResult result;
        errors_.clear();

        if (!grammarValid_) {
            result.errors.push_back({0, 0, "Grammar initialization failed: " + lastError_});
            return result;
        }

        ExprPtr expression;
        bool ok = false;
        try {
            ok = parser_.parse(source, expression);
        } catch (const std::bad_any_cast& e) {
            errors_.push_back({0, 0, std::string("Internal parser error: ") + e.what()});
            ok = false;
        }

        result.errors = errors_;
        if (!ok || !expression) {
            if (result.errors.empty()) {
                result.errors.push_back({1, 1, "Could not parse expression"});
            }
            lastError_ = result.errors.front().message;
            return result;
        }

        result.success = true;
        result.expression = expression;
        return result;
    }

    std::string getLastError() const { return lastError_; }

private:
    peg::parser parser_;
    bool grammarValid_ = false;
    std::string lastError_;
    std::vector<ParseError> errors_;

    void initializeGrammar() {
        parser_.set_logger([this](size_t line, size_t col, const std::string& msg) {
            errors_.push_back({static_cast<int>(line), static_cast<int>(col), msg});
            lastError_ = msg;
        });

        grammarValid_ = parser_.load_grammar(PREDICTOR_GRAMMAR);
        if (!grammarValid_) return;

        parser_["Predictor"] = [](const peg::SemanticValues& vs) {
            return std::any_cast<ExprPtr>(vs[0]);
        };

        parser_["Expression"] = [](const peg::SemanticValues& vs) {
            return std::any_cast<ExprPtr>(vs[0]);
        };

        // Left associative chains: operand (op operand)*
        auto leftFold = [](const peg::SemanticValues& vs) {
            ExprPtr result = std::any_cast<ExprPtr>(vs[0]);
            for (size_t i = 1; i + 1 < vs.size(); i += 2) {
                auto op = std::any_cast<std::string>(vs[i]);
                auto rhs = std::any_cast<ExprPtr>(vs[i + 1]);
                result = makeBinaryOp(op, result, rhs);
            }
            return result;
        };
        parser_["Additive"] = leftFold;
        parser_["Multiplicative"] = leftFold;

        parser_["Unary"] = [](const peg::SemanticValues& vs) {
            if (vs.choice() == 0) {
                auto op = std::any_cast<std::string>(vs[0]);
                auto operand = std::any_cast<ExprPtr>(vs[1]);
                return makeUnaryOp(op, operand);
            }
            return std::any_cast<ExprPtr>(vs[0]);
        };

        parser_["Power"] = [](const peg::SemanticValues& vs) {
            auto base = std::any_cast<ExprPtr>(vs[0]);
            if (vs.size() == 1) return base;
            return makeBinaryOp("^", base, std::any_cast<ExprPtr>(vs[1]));
        };

        parser_["Postfix"] = [](const peg::SemanticValues& vs) {
            ExprPtr result = std::any_cast<ExprPtr>(vs[0]);
            for (size_t i = 1; i < vs.size(); ++i) {
                auto suffix = std::any_cast<Suffix>(vs[i]);
                if (suffix.index) {
                    result = makeIndex(result, suffix.index);
                } else {
                    result = makeField(result, suffix.field);
                }
            }
            return result;
        };

        parser_["Suffix"] = [](const peg::SemanticValues& vs) {
            if (vs.choice() == 0) {
                return Suffix{std::any_cast<ExprPtr>(vs[0]), ""};
            }
            return Suffix{nullptr, std::any_cast<std::string>(vs[0])};
        };

        parser_["Primary"] = [](const peg::SemanticValues& vs) {
            int column = static_cast<int>(vs.line_info().second);
            if (vs.choice() == 3) {
                return makeVariable(std::any_cast<std::string>(vs[0]), column);
            }
            auto expr = std::any_cast<ExprPtr>(vs[0]);
            if (expr->sourceColumn == 0) expr->sourceColumn = column;
            return expr;
        };

        parser_["FunctionCall"] = [](const peg::SemanticValues& vs) {
            auto name = std::any_cast<std::string>(vs[0]);
            std::vector<ExprPtr> args;
            std::vector<std::pair<std::string, ExprPtr>> namedArgs;
            if (vs.size() > 1) {
                for (const auto& arg : std::any_cast<std::vector<CallArg>>(vs[1])) {
                    if (arg.name.empty()) {
                        args.push_back(arg.value);
                    } else {
                        namedArgs.emplace_back(arg.name, arg.value);
                    }
                }
            }
            return makeFunctionCall(name, std::move(args), std::move(namedArgs));
        };

        parser_["ArgList"] = [](const peg::SemanticValues& vs) {
            std::vector<CallArg> args;
            for (size_t i = 0; i < vs.size(); ++i) {
                args.push_back(std::any_cast<CallArg>(vs[i]));
            }
            return args;
        };

        parser_["Arg"] = [](const peg::SemanticValues& vs) {
            if (vs.choice() == 0) {
                return std::any_cast<CallArg>(vs[0]);
            }
            return CallArg{"", std::any_cast<ExprPtr>(vs[0])};
        };

        parser_["NamedArg"] = [](const peg::SemanticValues& vs) {
            return CallArg{std::any_cast<std::string>(vs[0]), std::any_cast<ExprPtr>(vs[1])};
        };

        auto token = [](const peg::SemanticValues& vs) {
            return vs.token_to_string();
        };
        parser_["AddOp"] = token;
        parser_["MulOp"] = token;
        parser_["UnaryOp"] = token;
        parser_["Name"] = token;

        parser_["Number"] = [](const peg::SemanticValues& vs) {
            return makeNumber(std::stod(vs.token_to_string()));
        };

        parser_["String"] = [](const peg::SemanticValues& vs) {
            std::string quoted = vs.token_to_string();
            return makeString(quoted.substr(1, quoted.size() - 2));
        };

        parser_.enable_packrat_parsing();
    }
};

// ============================================================================
// PredictorParser Public Interface
// ============================================================================

PredictorParser::PredictorParser() : pImpl(std::make_unique<Impl>()) {}
PredictorParser::~PredictorParser() = default;

ParseResult PredictorParser::parse(const std::string& source) {
    return pImpl->parse(source);
}

std::string PredictorParser::getLastError() const {
    return pImpl->getLastError();
}

// ============================================================================
// Utility Functions
// ============================================================================

ExprPtr parseExpression(const std::string& source) {
    PredictorParser parser;
    auto result = parser.parse(source);
    if (!result.success) {
        std::ostringstream oss;
        oss << "Parse error in expression '" << source << "'";
        for (const auto& err : result.errors) {
            oss << "\n  " << err.line << ":" << err.column << ": " << err.message;
        }
        throw EvaluationError(oss.str());
    }
    return result.expression;
}

void collectVariables(const ExprPtr& expr, std::vector<std::string>& vars) {
    if (!expr) return;

    std::visit([&vars](const auto& node) {
        using T = std::decay_t<decltype(node)>;

        if constexpr (std::is_same_v<T, Variable>) {
            vars.push_back(node.name);
        } else if constexpr (std::is_same_v<T, UnaryOp>) {
            collectVariables(node.operand, vars);
        } else if constexpr (std::is_same_v<T, BinaryOp>) {
            collectVariables(node.left, vars);
            collectVariables(node.right, vars);
        } else if constexpr (std::is_same_v<T, IndexOp>) {
            collectVariables(node.object, vars);
            collectVariables(node.index, vars);
        } else if constexpr (std::is_same_v<T, FunctionCall>) {
            for (const auto& arg : node.args) {
                collectVariables(arg, vars);
            }
            for (const auto& [name, arg] : node.namedArgs) {
                collectVariables(arg, vars);
            }
        }
    }, expr->node);
}

void collectFunctions(const ExprPtr& expr, std::vector<std::string>& names) {
    if (!expr) return;

    std::visit([&names](const auto& node) {
        using T = std::decay_t<decltype(node)>;

        if constexpr (std::is_same_v<T, UnaryOp>) {
            collectFunctions(node.operand, names);
        } else if constexpr (std::is_same_v<T, BinaryOp>) {
            collectFunctions(node.left, names);
            collectFunctions(node.right, names);
        } else if constexpr (std::is_same_v<T, IndexOp>) {
            collectFunctions(node.object, names);
            collectFunctions(node.index, names);
        } else if constexpr (std::is_same_v<T, FunctionCall>) {
            names.push_back(node.name);
            for (const auto& arg : node.args) {
                collectFunctions(arg, names);
            }
            for (const auto& [name, arg] : node.namedArgs) {
                collectFunctions(arg, names);
            }
        }
    }, expr->node);
}

std::string astToString(const ExprPtr& expr) {
    if (!expr) return "<null>";

    return std::visit([](const auto& node) -> std::string {
        using T = std::decay_t<decltype(node)>;

        if constexpr (std::is_same_v<T, NumberLiteral>) {
            std::ostringstream oss;
            oss << node.value;
            return oss.str();
        } else if constexpr (std::is_same_v<T, StringLiteral>) {
            return "'" + node.value + "'";
        } else if constexpr (std::is_same_v<T, Variable>) {
            return node.name;
        } else if constexpr (std::is_same_v<T, UnaryOp>) {
            return "(" + node.op + astToString(node.operand) + ")";
        } else if constexpr (std::is_same_v<T, BinaryOp>) {
            return "(" + astToString(node.left) + " " + node.op + " " + astToString(node.right) + ")";
        } else if constexpr (std::is_same_v<T, IndexOp>) {
            if (node.index) {
                return astToString(node.object) + "[" + astToString(node.index) + "]";
            }
            return astToString(node.object) + "$" + node.field;
        } else if constexpr (std::is_same_v<T, FunctionCall>) {
            std::string result = node.name + "(";
            bool first = true;
            for (const auto& arg : node.args) {
                if (!first) result += ", ";
                result += astToString(arg);
                first = false;
            }
            for (const auto& [name, arg] : node.namedArgs) {
                if (!first) result += ", ";
                result += name + "=" + astToString(arg);
                first = false;
            }
            result += ")";
            return result;
        }
        return "<unknown>";
    }, expr->node);
}

}  // namespace lateval

#include "eqpp/binder.hpp"

#include "eqpp/errors.hpp"

#include <sstream>
#include <utility>

namespace eqpp {

namespace {

struct FunctionAlias {
    const char *name;
    Function fn;
};

const FunctionAlias kFunctionAliases[] = {
    { "sin", Function::Sin },   { "Sin", Function::Sin },     { "cos", Function::Cos },   { "Cos", Function::Cos },
    { "exp", Function::Exp },   { "Exp", Function::Exp },     { "log", Function::Log },   { "Log", Function::Log },
    { "sqrt", Function::Sqrt }, { "Sqrt", Function::Sqrt },   { "abs", Function::Abs },   { "Abs", Function::Abs },
    { "pow", Function::Pow },   { "Power", Function::Pow },   { "min", Function::Min },   { "Min", Function::Min },
    { "max", Function::Max },   { "Max", Function::Max },
};

BoundExprPtr
make_constant(double value) {
    auto node = std::make_shared<BoundExpr>();
    node->kind = BoundKind::Constant;
    node->value = value;
    return node;
}

BoundExprPtr
make_state(std::size_t index) {
    auto node = std::make_shared<BoundExpr>();
    node->kind = BoundKind::State;
    node->index = index;
    return node;
}

BoundExprPtr
make_time() {
    auto node = std::make_shared<BoundExpr>();
    node->kind = BoundKind::Time;
    return node;
}

// Value of a literal operand as written in the source: 3, -3, (-(3)).
std::optional<double>
literal_value(const Expr &expr) {
    if (expr.kind == ExprKind::Number) { return expr.value; }
    if (expr.kind == ExprKind::Negate) {
        auto inner = literal_value(*expr.args[0]);
        if (inner) { return -*inner; }
    }
    return std::nullopt;
}

class Binder {
  public:
    Binder(const SystemAst &ast, const BindOptions &options)
      : ast_(ast)
      , options_(options) {}

    SystemSpec run() {
        collect_state_variables();
        check_parameters();

        std::vector<BoundExprPtr> rhs(state_index_.size());
        for (const EquationGroup &group : ast_.groups) {
            if (group.lhs.size() != group.rhs.size()) {
                std::ostringstream oss;
                oss << "left-hand list has " << group.lhs.size() << " derivatives but right-hand list has "
                    << group.rhs.size() << " expressions";
                throw BindError(
                  BindErrorKind::ArityMismatch, "", group.offset, oss.str(), group.lhs.size(), group.rhs.size());
            }
            for (std::size_t i = 0; i < group.lhs.size(); ++i) {
                rhs[state_index_.at(group.lhs[i].variable)] = bind_expr(*group.rhs[i]);
            }
        }

        SystemSpec spec;
        spec.state_variables = state_order_;
        spec.independent_variable = options_.independent_variable;
        spec.rhs = std::move(rhs);
        spec.parameters = options_.parameters;
        return spec;
    }

  private:
    const SystemAst &ast_;
    const BindOptions &options_;
    std::vector<std::string> state_order_;
    std::map<std::string, std::size_t> state_index_;

    const std::string &time_name() const { return options_.independent_variable; }

    void check_time_argument(const std::optional<std::string> &arg, std::size_t offset) const {
        if (arg && *arg != time_name()) {
            throw BindError(BindErrorKind::UnsupportedConstruct,
                            *arg,
                            offset,
                            "derivative taken with respect to '" + *arg + "' but the independent variable is '"
                              + time_name() + "'");
        }
    }

    void collect_state_variables() {
        for (const EquationGroup &group : ast_.groups) {
            for (const Derivative &d : group.lhs) {
                if (d.variable == time_name()) {
                    throw BindError(BindErrorKind::UnsupportedConstruct,
                                    d.variable,
                                    d.offset,
                                    "'" + d.variable + "' is the independent variable and cannot be a state variable");
                }
                check_time_argument(d.access_argument, d.offset);
                check_time_argument(d.with_respect_to, d.offset);
                if (state_index_.count(d.variable) != 0) {
                    throw BindError(BindErrorKind::DuplicateDerivative,
                                    d.variable,
                                    d.offset,
                                    "derivative of '" + d.variable + "' is defined more than once");
                }
                state_index_.emplace(d.variable, state_order_.size());
                state_order_.push_back(d.variable);
            }
        }
    }

    void check_parameters() const {
        for (const auto &param : options_.parameters) {
            const std::string &name = param.first;
            if (state_index_.count(name) != 0 || name == time_name()) {
                throw BindError(BindErrorKind::UnsupportedConstruct,
                                name,
                                0,
                                "parameter '" + name + "' shadows a state variable or the independent variable");
            }
        }
    }

    BoundExprPtr bind_identifier(const Expr &expr) const {
        auto state = state_index_.find(expr.name);
        if (state != state_index_.end()) { return make_state(state->second); }
        if (expr.name == time_name()) { return make_time(); }
        auto param = options_.parameters.find(expr.name);
        if (param != options_.parameters.end()) { return make_constant(param->second); }
        throw BindError(
          BindErrorKind::UnknownIdentifier, expr.name, expr.offset, "unknown identifier '" + expr.name + "'");
    }

    bool is_time_access(const Expr &call) const {
        return call.args.size() == 1 && call.args[0]->kind == ExprKind::Variable && call.args[0]->name == time_name();
    }

    BoundExprPtr bind_call(const Expr &expr) const {
        // x(t) / x[t] reads the state variable x.
        auto state = state_index_.find(expr.name);
        if (state != state_index_.end()) {
            if (!is_time_access(expr)) {
                throw BindError(BindErrorKind::UnsupportedConstruct,
                                expr.name,
                                expr.offset,
                                "state variable '" + expr.name + "' may only be accessed as " + expr.name + "("
                                  + time_name() + ")");
            }
            return make_state(state->second);
        }

        auto fn = lookup_function(expr.name);
        if (!fn) {
            if (expr.name == "D") {
                throw BindError(BindErrorKind::UnsupportedConstruct,
                                expr.name,
                                expr.offset,
                                "derivatives are not allowed on the right-hand side");
            }
            if (is_time_access(expr) && options_.parameters.count(expr.name) == 0) {
                throw BindError(
                  BindErrorKind::UnknownIdentifier, expr.name, expr.offset, "unknown identifier '" + expr.name + "'");
            }
            throw BindError(BindErrorKind::UnsupportedConstruct,
                            expr.name,
                            expr.offset,
                            "'" + expr.name + "' is not a built-in function");
        }

        const std::size_t arity = function_arity(*fn);
        if (expr.args.size() != arity) {
            std::ostringstream oss;
            oss << "'" << expr.name << "' takes " << arity << " argument" << (arity == 1 ? "" : "s") << ", got "
                << expr.args.size();
            throw BindError(BindErrorKind::ArityMismatch, expr.name, expr.offset, oss.str(), arity, expr.args.size());
        }

        auto node = std::make_shared<BoundExpr>();
        node->kind = BoundKind::Call;
        node->fn = *fn;
        for (const ExprPtr &arg : expr.args) { node->args.push_back(bind_expr(*arg)); }
        return node;
    }

    BoundExprPtr bind_binary(const Expr &expr) const {
        const Expr &lhs = *expr.args[0];
        const Expr &rhs = *expr.args[1];
        if (expr.op == BinaryOp::Div) {
            auto divisor = literal_value(rhs);
            if (divisor && *divisor == 0.0) {
                throw BindError(BindErrorKind::DivisionByZero, "", expr.offset, "division by literal zero");
            }
        }
        if (expr.op == BinaryOp::Pow) {
            auto base = literal_value(lhs);
            auto exponent = literal_value(rhs);
            if (base && exponent && *base == 0.0 && *exponent < 0.0) {
                throw BindError(
                  BindErrorKind::DivisionByZero, "", expr.offset, "zero raised to a negative power");
            }
        }

        auto node = std::make_shared<BoundExpr>();
        node->kind = BoundKind::Binary;
        node->op = expr.op;
        node->args.push_back(bind_expr(lhs));
        node->args.push_back(bind_expr(rhs));
        return node;
    }

    BoundExprPtr bind_expr(const Expr &expr) const {
        switch (expr.kind) {
            case ExprKind::Number:
                return make_constant(expr.value);
            case ExprKind::Variable:
                return bind_identifier(expr);
            case ExprKind::Negate: {
                auto node = std::make_shared<BoundExpr>();
                node->kind = BoundKind::Negate;
                node->args.push_back(bind_expr(*expr.args[0]));
                return node;
            }
            case ExprKind::Binary:
                return bind_binary(expr);
            case ExprKind::Call:
                return bind_call(expr);
            case ExprKind::Derivative:
                throw BindError(BindErrorKind::UnsupportedConstruct,
                                expr.name,
                                expr.offset,
                                "derivative of '" + expr.name + "' is not allowed on the right-hand side");
        }
        throw BindError(BindErrorKind::UnsupportedConstruct, "", expr.offset, "unsupported expression");
    }
};

} // namespace

std::optional<Function>
lookup_function(const std::string &name) {
    for (const FunctionAlias &alias : kFunctionAliases) {
        if (name == alias.name) { return alias.fn; }
    }
    return std::nullopt;
}

std::size_t
function_arity(Function fn) {
    switch (fn) {
        case Function::Pow:
        case Function::Min:
        case Function::Max:
            return 2;
        default:
            return 1;
    }
}

std::string
function_name(Function fn) {
    switch (fn) {
        case Function::Sin:
            return "sin";
        case Function::Cos:
            return "cos";
        case Function::Exp:
            return "exp";
        case Function::Log:
            return "log";
        case Function::Sqrt:
            return "sqrt";
        case Function::Abs:
            return "abs";
        case Function::Pow:
            return "pow";
        case Function::Min:
            return "min";
        case Function::Max:
            return "max";
    }
    return "?";
}

SystemSpec
bind(const SystemAst &ast, const BindOptions &options) {
    Binder binder(ast, options);
    return binder.run();
}

} // namespace eqpp

#include "eqpp/ast.hpp"

#include <iomanip>
#include <ostream>
#include <sstream>
#include <utility>

namespace eqpp {

char
binary_op_symbol(BinaryOp op) {
    switch (op) {
        case BinaryOp::Add:
            return '+';
        case BinaryOp::Sub:
            return '-';
        case BinaryOp::Mul:
            return '*';
        case BinaryOp::Div:
            return '/';
        case BinaryOp::Pow:
            return '^';
    }
    return '?';
}

ExprPtr
Expr::number(double value, std::size_t offset) {
    auto node = std::make_shared<Expr>();
    node->kind = ExprKind::Number;
    node->value = value;
    node->offset = offset;
    return node;
}

ExprPtr
Expr::variable(std::string name, std::size_t offset) {
    auto node = std::make_shared<Expr>();
    node->kind = ExprKind::Variable;
    node->name = std::move(name);
    node->offset = offset;
    return node;
}

ExprPtr
Expr::negate(ExprPtr operand, std::size_t offset) {
    auto node = std::make_shared<Expr>();
    node->kind = ExprKind::Negate;
    node->args.push_back(std::move(operand));
    node->offset = offset;
    return node;
}

ExprPtr
Expr::binary(BinaryOp op, ExprPtr lhs, ExprPtr rhs, std::size_t offset) {
    auto node = std::make_shared<Expr>();
    node->kind = ExprKind::Binary;
    node->op = op;
    node->args.push_back(std::move(lhs));
    node->args.push_back(std::move(rhs));
    node->offset = offset;
    return node;
}

ExprPtr
Expr::call(std::string name, std::vector<ExprPtr> args, std::size_t offset) {
    auto node = std::make_shared<Expr>();
    node->kind = ExprKind::Call;
    node->name = std::move(name);
    node->args = std::move(args);
    node->offset = offset;
    return node;
}

ExprPtr
Expr::derivative(std::string name, std::size_t offset) {
    auto node = std::make_shared<Expr>();
    node->kind = ExprKind::Derivative;
    node->name = std::move(name);
    node->offset = offset;
    return node;
}

// Fully parenthesized so that the printed form parses back to the same tree.
std::ostream &
operator<<(std::ostream &os, const Expr &expr) {
    switch (expr.kind) {
        case ExprKind::Number: {
            const std::streamsize precision = os.precision();
            os << std::setprecision(17) << expr.value << std::setprecision(precision);
            break;
        }
        case ExprKind::Variable:
            os << expr.name;
            break;
        case ExprKind::Negate:
            os << "(-" << *expr.args[0] << ")";
            break;
        case ExprKind::Binary:
            os << "(" << *expr.args[0] << " " << binary_op_symbol(expr.op) << " " << *expr.args[1] << ")";
            break;
        case ExprKind::Call:
            os << expr.name << "(";
            for (std::size_t i = 0; i < expr.args.size(); ++i) {
                if (i > 0) { os << ", "; }
                os << *expr.args[i];
            }
            os << ")";
            break;
        case ExprKind::Derivative:
            os << expr.name << "'";
            break;
    }
    return os;
}

std::string
to_string(const Expr &expr) {
    std::stringstream ss;
    ss << expr;
    return ss.str();
}

} // namespace eqpp

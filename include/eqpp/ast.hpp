#ifndef EQPP_AST_HPP
#define EQPP_AST_HPP

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace eqpp {

//-----------------------------------------------------------------------------
// Expression tree produced by the parser. Nodes are immutable once built and
// only ever shared as pointers-to-const, so the structure is always a tree.
//-----------------------------------------------------------------------------
enum class ExprKind {
    Number,     // numeric literal
    Variable,   // bare identifier
    Negate,     // unary minus
    Binary,     // + - * / ^
    Call,       // name(args...) or name[args...]
    Derivative, // x' inside an expression (never valid on a right-hand side)
};

enum class BinaryOp { Add, Sub, Mul, Div, Pow };

char
binary_op_symbol(BinaryOp op);

struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

struct Expr {
    ExprKind kind = ExprKind::Number;
    std::size_t offset = 0; // byte offset into the source
    double value = 0.0;     // Number
    std::string name;       // Variable, Call, Derivative
    BinaryOp op = BinaryOp::Add;
    std::vector<ExprPtr> args; // Negate: 1, Binary: 2, Call: n, Derivative: 0

    static ExprPtr number(double value, std::size_t offset);
    static ExprPtr variable(std::string name, std::size_t offset);
    static ExprPtr negate(ExprPtr operand, std::size_t offset);
    static ExprPtr binary(BinaryOp op, ExprPtr lhs, ExprPtr rhs, std::size_t offset);
    static ExprPtr call(std::string name, std::vector<ExprPtr> args, std::size_t offset);
    static ExprPtr derivative(std::string name, std::size_t offset);
};

/**
 * @brief Left-hand side element: the derivative of a state variable.
 *
 * `access_argument` holds the `t` of `x[t]`, `x'(t)` or `D[x[t], t]`;
 * `with_respect_to` holds the second argument of `D[x[t], t]`.
 */
struct Derivative {
    std::string variable;
    std::optional<std::string> access_argument;
    std::optional<std::string> with_respect_to;
    std::size_t offset = 0;
};

/**
 * @brief One `lhs == rhs` construct. The list form keeps both sides as written so
 * that the binder can report arity mismatches.
 */
struct EquationGroup {
    std::vector<Derivative> lhs;
    std::vector<ExprPtr> rhs;
    bool list_form = false;
    std::size_t offset = 0;
};

struct SystemAst {
    std::vector<EquationGroup> groups;
};

std::ostream &
operator<<(std::ostream &os, const Expr &expr);

std::string
to_string(const Expr &expr);

} // namespace eqpp

#endif // EQPP_AST_HPP

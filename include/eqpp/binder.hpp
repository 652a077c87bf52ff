#ifndef EQPP_BINDER_HPP
#define EQPP_BINDER_HPP

#include "eqpp/ast.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace eqpp {

//-----------------------------------------------------------------------------
// Closed set of built-in functions
//-----------------------------------------------------------------------------
enum class Function { Sin, Cos, Exp, Log, Sqrt, Abs, Pow, Min, Max };

/**
 * @brief Looks up a built-in by its source spelling. Both lower case (sin) and
 * Mathematica spelling (Sin, Power) are accepted.
 */
std::optional<Function>
lookup_function(const std::string &name);

std::size_t
function_arity(Function fn);

std::string
function_name(Function fn);

//-----------------------------------------------------------------------------
// Bound expression: every name already resolved
//-----------------------------------------------------------------------------
enum class BoundKind { Constant, State, Time, Negate, Binary, Call };

struct BoundExpr;
using BoundExprPtr = std::shared_ptr<const BoundExpr>;

struct BoundExpr {
    BoundKind kind = BoundKind::Constant;
    double value = 0.0;    // Constant
    std::size_t index = 0; // State: position in the state vector
    BinaryOp op = BinaryOp::Add;
    Function fn = Function::Sin;
    std::vector<BoundExprPtr> args;
};

/**
 * @brief Binder output. Ready for compilation, not yet runnable.
 */
struct SystemSpec {
    std::vector<std::string> state_variables; // index order
    std::string independent_variable;
    std::vector<BoundExprPtr> rhs; // rhs[i] is d(state_variables[i])/dt
    std::map<std::string, double> parameters;
    std::string normalized_source;

    std::size_t dimension() const { return state_variables.size(); }
};

struct BindOptions {
    std::string independent_variable = "t";
    std::map<std::string, double> parameters; // names bound to constants
};

/**
 * @brief Resolves names in a parsed system.
 *
 * - State variables are the derivative targets, in first-seen order.
 * - Right-hand identifiers must be state variables, the independent variable or
 *   supplied parameters.
 * - List forms must have equally long sides.
 * - Only the closed function set is callable, with its fixed arity.
 * - Literal division by zero is rejected; every other numeric problem is left
 *   to evaluation time.
 *
 * @throws BindError
 */
SystemSpec
bind(const SystemAst &ast, const BindOptions &options = {});

} // namespace eqpp

#endif // EQPP_BINDER_HPP

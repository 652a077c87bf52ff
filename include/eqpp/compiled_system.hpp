#ifndef EQPP_COMPILED_SYSTEM_HPP
#define EQPP_COMPILED_SYSTEM_HPP

#include "eqpp/binder.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace eqpp {

using State = std::vector<double>;

enum class OpCode : std::uint8_t {
    Const,
    State,
    Time,
    Neg,
    Add,
    Sub,
    Mul,
    Div,
    Pow,
    Sin,
    Cos,
    Exp,
    Log,
    Sqrt,
    Abs,
    Min,
    Max,
};

/**
 * @brief One node of a flattened expression. Operands refer to earlier
 * instructions of the same program, so the last instruction is the root.
 */
struct Instruction {
    OpCode op = OpCode::Const;
    double value = 0.0;    // Const
    std::size_t index = 0; // State
    std::uint32_t a = 0;   // first operand
    std::uint32_t b = 0;   // second operand
};

using Program = std::vector<Instruction>;

/**
 * @brief Immutable, thread-safe right-hand side f(t, x) of a bound system.
 *
 * Evaluation is one forward pass over each Program with a fixed-size local
 * stack. It never allocates, never throws and touches no shared mutable
 * state. Domain errors come out as NaN (log of a non-positive value, sqrt of
 * a negative value, negative base to a non-integer power); division by zero
 * follows IEEE rules.
 */
class CompiledSystem {
  public:
    // @throws std::invalid_argument if a right-hand side is missing or too deep to evaluate
    explicit CompiledSystem(const SystemSpec &spec);

    std::size_t dimension() const { return state_variables_.size(); }
    const std::vector<std::string> &state_variables() const { return state_variables_; }
    const std::string &independent_variable() const { return independent_variable_; }
    const std::string &normalized_source() const { return normalized_source_; }
    const std::map<std::string, double> &parameters() const { return parameters_; }
    const Program &program(std::size_t component) const { return programs_.at(component); }

    double evaluate_component(std::size_t component, double t, const double *state) const;

    // Writes dimension() derivatives to `out`.
    void evaluate(double t, const double *state, double *out) const;

    // @throws std::invalid_argument if state.size() != dimension()
    State evaluate(double t, const State &state) const;

    // odeint system signature
    void operator()(const State &x, State &dxdt, double t) const;

  private:
    std::vector<std::string> state_variables_;
    std::string independent_variable_;
    std::string normalized_source_;
    std::map<std::string, double> parameters_;
    std::vector<Program> programs_;
};

using CompiledSystemPtr = std::shared_ptr<const CompiledSystem>;

CompiledSystemPtr
compile(const SystemSpec &spec);

/**
 * @brief parse + bind + compile in one call.
 * @throws ParseError, BindError
 */
CompiledSystemPtr
compile_source(const std::string &source, const BindOptions &options = {});

} // namespace eqpp

#endif // EQPP_COMPILED_SYSTEM_HPP

#include "eqpp/compiled_system.hpp"

#include "eqpp/parser.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace eqpp {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

double
apply_unary(OpCode op, double x) {
    switch (op) {
        case OpCode::Neg:
            return -x;
        case OpCode::Sin:
            return std::sin(x);
        case OpCode::Cos:
            return std::cos(x);
        case OpCode::Exp:
            return std::exp(x);
        case OpCode::Log:
            return x > 0.0 ? std::log(x) : kNaN;
        case OpCode::Sqrt:
            return x >= 0.0 ? std::sqrt(x) : kNaN;
        case OpCode::Abs:
            return std::abs(x);
        default:
            return kNaN;
    }
}

double
apply_binary(OpCode op, double a, double b) {
    switch (op) {
        case OpCode::Add:
            return a + b;
        case OpCode::Sub:
            return a - b;
        case OpCode::Mul:
            return a * b;
        case OpCode::Div:
            return a / b;
        case OpCode::Pow:
            return std::pow(a, b);
        // std::fmin/fmax would hide a NaN operand
        case OpCode::Min:
            return (std::isnan(a) || std::isnan(b)) ? kNaN : (b < a ? b : a);
        case OpCode::Max:
            return (std::isnan(a) || std::isnan(b)) ? kNaN : (a < b ? b : a);
        default:
            return kNaN;
    }
}

bool
is_binary(OpCode op) {
    switch (op) {
        case OpCode::Add:
        case OpCode::Sub:
        case OpCode::Mul:
        case OpCode::Div:
        case OpCode::Pow:
        case OpCode::Min:
        case OpCode::Max:
            return true;
        default:
            return false;
    }
}

OpCode
opcode_for(BinaryOp op) {
    switch (op) {
        case BinaryOp::Add:
            return OpCode::Add;
        case BinaryOp::Sub:
            return OpCode::Sub;
        case BinaryOp::Mul:
            return OpCode::Mul;
        case BinaryOp::Div:
            return OpCode::Div;
        case BinaryOp::Pow:
            return OpCode::Pow;
    }
    return OpCode::Add;
}

OpCode
opcode_for(Function fn) {
    switch (fn) {
        case Function::Sin:
            return OpCode::Sin;
        case Function::Cos:
            return OpCode::Cos;
        case Function::Exp:
            return OpCode::Exp;
        case Function::Log:
            return OpCode::Log;
        case Function::Sqrt:
            return OpCode::Sqrt;
        case Function::Abs:
            return OpCode::Abs;
        case Function::Pow:
            return OpCode::Pow;
        case Function::Min:
            return OpCode::Min;
        case Function::Max:
            return OpCode::Max;
    }
    return OpCode::Abs;
}

// Post-order lowering of a bound tree. Subtrees made only of constants are
// folded into a single Const instruction.
class Lowering {
  public:
    explicit Lowering(Program &program)
      : program_(program) {}

    std::uint32_t lower(const BoundExpr &expr) {
        switch (expr.kind) {
            case BoundKind::Constant:
                return emit_const(expr.value);
            case BoundKind::State: {
                Instruction ins;
                ins.op = OpCode::State;
                ins.index = expr.index;
                return emit(ins);
            }
            case BoundKind::Time: {
                Instruction ins;
                ins.op = OpCode::Time;
                return emit(ins);
            }
            case BoundKind::Negate:
                return lower_unary(OpCode::Neg, *expr.args[0]);
            case BoundKind::Binary:
                return lower_binary(opcode_for(expr.op), *expr.args[0], *expr.args[1]);
            case BoundKind::Call:
                if (expr.args.size() == 2) { return lower_binary(opcode_for(expr.fn), *expr.args[0], *expr.args[1]); }
                return lower_unary(opcode_for(expr.fn), *expr.args[0]);
        }
        throw std::logic_error("unhandled bound expression kind");
    }

  private:
    Program &program_;

    std::uint32_t emit(const Instruction &ins) {
        program_.push_back(ins);
        return static_cast<std::uint32_t>(program_.size() - 1);
    }

    std::uint32_t emit_const(double value) {
        Instruction ins;
        ins.op = OpCode::Const;
        ins.value = value;
        return emit(ins);
    }

    bool is_const(std::uint32_t slot) const { return program_[slot].op == OpCode::Const; }

    // Operands are always the tail of the program, so folding can pop them.
    void truncate(std::uint32_t first_slot) { program_.resize(first_slot); }

    std::uint32_t lower_unary(OpCode op, const BoundExpr &operand) {
        const std::uint32_t a = lower(operand);
        if (is_const(a)) {
            const double folded = apply_unary(op, program_[a].value);
            truncate(a);
            return emit_const(folded);
        }
        Instruction ins;
        ins.op = op;
        ins.a = a;
        return emit(ins);
    }

    std::uint32_t lower_binary(OpCode op, const BoundExpr &lhs, const BoundExpr &rhs) {
        const std::uint32_t first = static_cast<std::uint32_t>(program_.size());
        const std::uint32_t a = lower(lhs);
        const std::uint32_t b = lower(rhs);
        if (is_const(a) && is_const(b)) {
            const double folded = apply_binary(op, program_[a].value, program_[b].value);
            truncate(first);
            return emit_const(folded);
        }
        Instruction ins;
        ins.op = op;
        ins.a = a;
        ins.b = b;
        return emit(ins);
    }
};

// Lowering emits each operand immediately before its user, so a program is
// also a stack program: leaves push, unary ops replace the top, binary ops
// pop two and push one.
constexpr std::size_t kMaxStackDepth = 2048;

std::size_t
stack_depth(const Program &program) {
    std::size_t depth = 0;
    std::size_t peak = 0;
    for (const Instruction &ins : program) {
        switch (ins.op) {
            case OpCode::Const:
            case OpCode::State:
            case OpCode::Time:
                ++depth;
                break;
            default:
                if (is_binary(ins.op)) { --depth; }
                break;
        }
        if (depth > peak) { peak = depth; }
    }
    return peak;
}

double
run(const Program &program, double t, const double *state) {
    double stack[kMaxStackDepth];
    std::size_t top = 0;
    for (const Instruction &ins : program) {
        switch (ins.op) {
            case OpCode::Const:
                stack[top++] = ins.value;
                break;
            case OpCode::State:
                stack[top++] = state[ins.index];
                break;
            case OpCode::Time:
                stack[top++] = t;
                break;
            default:
                if (is_binary(ins.op)) {
                    --top;
                    stack[top - 1] = apply_binary(ins.op, stack[top - 1], stack[top]);
                } else {
                    stack[top - 1] = apply_unary(ins.op, stack[top - 1]);
                }
                break;
        }
    }
    return stack[0];
}

} // namespace

CompiledSystem::CompiledSystem(const SystemSpec &spec)
  : state_variables_(spec.state_variables)
  , independent_variable_(spec.independent_variable)
  , normalized_source_(spec.normalized_source)
  , parameters_(spec.parameters) {
    if (spec.rhs.size() != spec.state_variables.size()) {
        throw std::invalid_argument("CompiledSystem: expected " + std::to_string(spec.state_variables.size())
                                    + " right-hand sides, got " + std::to_string(spec.rhs.size()));
    }
    programs_.resize(spec.rhs.size());
    for (std::size_t i = 0; i < spec.rhs.size(); ++i) {
        if (!spec.rhs[i]) {
            throw std::invalid_argument("CompiledSystem: missing right-hand side for '" + spec.state_variables[i]
                                        + "'");
        }
        Lowering lowering(programs_[i]);
        lowering.lower(*spec.rhs[i]);
        if (stack_depth(programs_[i]) > kMaxStackDepth) {
            throw std::invalid_argument("CompiledSystem: right-hand side for '" + spec.state_variables[i]
                                        + "' is nested too deeply");
        }
    }
}

double
CompiledSystem::evaluate_component(std::size_t component, double t, const double *state) const {
    const Program &program = programs_[component];
    return run(program, t, state);
}

void
CompiledSystem::evaluate(double t, const double *state, double *out) const {
    for (std::size_t i = 0; i < programs_.size(); ++i) { out[i] = evaluate_component(i, t, state); }
}

State
CompiledSystem::evaluate(double t, const State &state) const {
    if (state.size() != dimension()) {
        throw std::invalid_argument("CompiledSystem::evaluate: state has " + std::to_string(state.size())
                                    + " entries, system dimension is " + std::to_string(dimension()));
    }
    State out(dimension());
    evaluate(t, state.data(), out.data());
    return out;
}

void
CompiledSystem::operator()(const State &x, State &dxdt, double t) const {
    dxdt.resize(programs_.size());
    evaluate(t, x.data(), dxdt.data());
}

CompiledSystemPtr
compile(const SystemSpec &spec) {
    return std::make_shared<const CompiledSystem>(spec);
}

CompiledSystemPtr
compile_source(const std::string &source, const BindOptions &options) {
    SystemSpec spec = bind(parse(source), options);
    spec.normalized_source = normalize_source(source);
    return compile(spec);
}

} // namespace eqpp

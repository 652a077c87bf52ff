#include "eqpp/solver_backend.hpp"

#include "eqpp/errors.hpp"
#include "eqpp/integration_loop.hpp"

#include <boost/numeric/odeint.hpp>
#include <boost/numeric/odeint/stepper/rosenbrock4.hpp>
#include <boost/numeric/odeint/stepper/rosenbrock4_controller.hpp>
#include <boost/numeric/ublas/matrix.hpp>
#include <boost/numeric/ublas/vector.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace eqpp {

namespace odeint = boost::numeric::odeint;
namespace ublas = boost::numeric::ublas;

namespace {

// Sub-steps per sample interval; kept below 2^63 so the size_t cast is defined.
constexpr double kMaxSubsteps = 9.0e18;

void
check_dimension(const CompiledSystem &system, const State &initial) {
    if (initial.size() != system.dimension()) { throw DimensionMismatchError(0, system.dimension(), initial.size()); }
}

// Adapts the compiled system to odeint without copying its programs.
struct VectorRhs {
    const CompiledSystem *system;

    void operator()(const State &x, State &dxdt, double t) const { system->evaluate(t, x.data(), dxdt.data()); }
};

using ublas_vector = ublas::vector<double>;
using ublas_matrix = ublas::matrix<double>;

struct UblasRhs {
    const CompiledSystem *system;

    void operator()(const ublas_vector &x, ublas_vector &dxdt, double t) const {
        system->evaluate(t, &x[0], &dxdt[0]);
    }
};

// Forward-difference Jacobian J = df/dx and explicit time derivative df/dt.
struct FiniteDifferenceJacobian {
    const CompiledSystem *system;

    void operator()(const ublas_vector &x, ublas_matrix &jac, const double &t, ublas_vector &dfdt) const {
        const std::size_t n = x.size();
        const double root_eps = std::sqrt(std::numeric_limits<double>::epsilon());

        ublas_vector f0(n);
        ublas_vector f1(n);
        ublas_vector shifted(x);
        system->evaluate(t, &x[0], &f0[0]);

        for (std::size_t j = 0; j < n; ++j) {
            const double h = root_eps * std::max(std::abs(x[j]), 1.0);
            shifted[j] = x[j] + h;
            system->evaluate(t, &shifted[0], &f1[0]);
            // Re-read the perturbation actually applied after rounding.
            const double applied = shifted[j] - x[j];
            for (std::size_t i = 0; i < n; ++i) { jac(i, j) = (f1[i] - f0[i]) / applied; }
            shifted[j] = x[j];
        }

        const double ht = root_eps * std::max(std::abs(t), 1.0);
        system->evaluate(t + ht, &x[0], &f1[0]);
        for (std::size_t i = 0; i < n; ++i) { dfdt[i] = (f1[i] - f0[i]) / ht; }
    }
};

template<typename ErrorStepper>
void
run_adaptive(const CompiledSystem &system,
             const State &initial,
             const TimeSpan &span,
             const SolverOptions &options,
             IntegrationOutcome &outcome) {
    auto controller = odeint::make_controlled(options.abs_tol, options.rel_tol, ErrorStepper());
    internal::integrate_controlled(controller, VectorRhs{ &system }, initial, span, options, outcome);
}

} // namespace

//-----------------------------------------------------------------------------
// AdaptiveRungeKuttaBackend
//-----------------------------------------------------------------------------
AdaptiveRungeKuttaBackend::AdaptiveRungeKuttaBackend(BackendKind kind)
  : kind_(kind) {
    if (kind != BackendKind::Dopri5 && kind != BackendKind::CashKarp54 && kind != BackendKind::Fehlberg78) {
        throw std::invalid_argument("AdaptiveRungeKuttaBackend: " + to_string(kind) + " is not an explicit RK pair");
    }
}

IntegrationOutcome
AdaptiveRungeKuttaBackend::integrate(const CompiledSystem &system,
                                     const State &initial,
                                     const TimeSpan &span,
                                     const SolverOptions &options) const {
    check_dimension(system, initial);
    IntegrationOutcome outcome;
    outcome.backend_name = name();
    switch (kind_) {
        case BackendKind::Dopri5:
            run_adaptive<odeint::runge_kutta_dopri5<State>>(system, initial, span, options, outcome);
            break;
        case BackendKind::CashKarp54:
            run_adaptive<odeint::runge_kutta_cash_karp54<State>>(system, initial, span, options, outcome);
            break;
        case BackendKind::Fehlberg78:
            run_adaptive<odeint::runge_kutta_fehlberg78<State>>(system, initial, span, options, outcome);
            break;
        default:
            break;
    }
    return outcome;
}

//-----------------------------------------------------------------------------
// RosenbrockBackend
//-----------------------------------------------------------------------------
IntegrationOutcome
RosenbrockBackend::integrate(const CompiledSystem &system,
                             const State &initial,
                             const TimeSpan &span,
                             const SolverOptions &options) const {
    check_dimension(system, initial);
    IntegrationOutcome outcome;
    outcome.backend_name = name();

    ublas_vector x(initial.size());
    std::copy(initial.begin(), initial.end(), x.begin());

    odeint::rosenbrock4_controller<odeint::rosenbrock4<double>> controller(options.abs_tol, options.rel_tol);
    internal::integrate_controlled(controller,
                                   std::make_pair(UblasRhs{ &system }, FiniteDifferenceJacobian{ &system }),
                                   x,
                                   span,
                                   options,
                                   outcome);
    return outcome;
}

//-----------------------------------------------------------------------------
// FixedStepRk4Backend
//-----------------------------------------------------------------------------
IntegrationOutcome
FixedStepRk4Backend::integrate(const CompiledSystem &system,
                               const State &initial,
                               const TimeSpan &span,
                               const SolverOptions &options) const {
    check_dimension(system, initial);
    IntegrationOutcome outcome;
    outcome.backend_name = name();

    internal::StepGuard guard(span, options, outcome);
    const std::vector<double> &times = guard.times();
    odeint::runge_kutta4<State> stepper;
    const VectorRhs rhs{ &system };

    State x = initial;
    double t = span.t0;
    if (!guard.check_state(t, x)) { return outcome; }
    guard.record(t, x);

    for (std::size_t next = 1; next < times.size(); ++next) {
        const double target = times[next];
        const double interval = target - t;
        std::size_t substeps = 1;
        if (options.max_step > 0.0) {
            // Checked in double: the quotient can be far beyond any size_t.
            const double needed = std::ceil(interval / options.max_step);
            const double remaining = std::min(static_cast<double>(options.max_steps - outcome.steps), kMaxSubsteps);
            if (!(needed <= remaining)) {
                std::ostringstream oss;
                oss << "reaching t = " << target << " with max_step " << options.max_step << " needs " << needed
                    << " steps, more than the " << (options.max_steps - outcome.steps) << " left of the step limit";
                guard.fail(SolveErrorKind::StepCountExceeded, t, oss.str());
                return outcome;
            }
            substeps = std::max<std::size_t>(1, static_cast<std::size_t>(needed));
        }
        const double h = interval / static_cast<double>(substeps);

        for (std::size_t s = 0; s < substeps; ++s) {
            stepper.do_step(rhs, x, t, h);
            ++outcome.steps;
            t = s + 1 == substeps ? target : t + h;
            if (!guard.check_state(t, x)) { return outcome; }
            const bool last = next + 1 == times.size() && s + 1 == substeps;
            if (!last && !guard.check_budget(t)) {
                if (s + 1 == substeps) { guard.record(t, x); }
                return outcome;
            }
        }
        guard.record(t, x);
    }
    return outcome;
}

//-----------------------------------------------------------------------------
// Factory
//-----------------------------------------------------------------------------
std::unique_ptr<SolverBackend>
make_backend(BackendKind kind) {
    switch (kind) {
        case BackendKind::Dopri5:
        case BackendKind::CashKarp54:
        case BackendKind::Fehlberg78:
            return std::make_unique<AdaptiveRungeKuttaBackend>(kind);
        case BackendKind::Rosenbrock4:
            return std::make_unique<RosenbrockBackend>();
        case BackendKind::FixedRk4:
            return std::make_unique<FixedStepRk4Backend>();
    }
    throw std::invalid_argument("make_backend: unknown backend kind");
}

} // namespace eqpp

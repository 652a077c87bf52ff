#ifndef EQPP_SOLVER_OPTIONS_HPP
#define EQPP_SOLVER_OPTIONS_HPP

#include "eqpp/compiled_system.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace eqpp {

struct TimeSpan {
    double t0 = 0.0;
    double tf = 10.0;
};

enum class BackendKind { Dopri5, CashKarp54, Fehlberg78, Rosenbrock4, FixedRk4 };

std::string
to_string(BackendKind kind);

/**
 * @brief Case-insensitive lookup of a method name, including the names used by
 * other ODE front ends (rk45, dop853, radau, bdf, ...).
 */
std::optional<BackendKind>
parse_backend_kind(const std::string &name);

struct SolverOptions {
    BackendKind backend = BackendKind::Dopri5;
    double rel_tol = 1e-6;
    double abs_tol = 1e-9;
    std::size_t max_steps = 100000; // accepted steps per trajectory
    double max_wall_seconds = 0.0;  // 0 = unlimited
    std::size_t num_points = 201;   // reported samples, t0 and tf included
    double max_step = 0.0;          // 0 = unbounded
    double initial_step = 0.0;      // 0 = automatic
    double divergence_bound = 1e15; // max |x_i| before the run counts as diverged
    bool allow_fallback = true;     // retry with Rosenbrock4 on StepCountExceeded
};

/**
 * @brief Sampled solution: states[k] is the state at times[k].
 */
struct Trajectory {
    std::vector<double> times;
    std::vector<State> states;

    std::size_t size() const { return times.size(); }
    bool empty() const { return times.empty(); }
};

enum class SolveErrorKind { NonFiniteState, StepCountExceeded, WallClockExceeded, Diverged };

std::string
to_string(SolveErrorKind kind);

std::optional<SolveErrorKind>
parse_solve_error_kind(const std::string &name);

struct SolveFailure {
    SolveErrorKind kind = SolveErrorKind::NonFiniteState;
    double time = 0.0; // time at which the problem was detected
    std::string message;
};

struct IntegrationOutcome {
    Trajectory trajectory; // partial when failure is set
    std::optional<SolveFailure> failure;
    std::size_t steps = 0;        // accepted steps
    std::size_t rejected = 0;     // rejected step attempts
    std::string backend_name;

    bool ok() const { return !failure.has_value(); }
};

/**
 * @brief Evenly spaced reporting grid over [t0, tf]. Both end points are exact;
 * t0 == tf yields a single sample.
 */
std::vector<double>
sample_times(const TimeSpan &span, std::size_t num_points);

} // namespace eqpp

#endif // EQPP_SOLVER_OPTIONS_HPP

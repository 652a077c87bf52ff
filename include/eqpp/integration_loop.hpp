#ifndef EQPP_INTEGRATION_LOOP_HPP
#define EQPP_INTEGRATION_LOOP_HPP

#include "eqpp/solver_options.hpp"

#include <boost/numeric/odeint.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace eqpp {
namespace internal {

namespace odeint = boost::numeric::odeint;

// Consecutive rejected attempts before the controlled loop gives up.
constexpr std::size_t kMaxConsecutiveRejections = 500;

template<typename StateT>
State
to_state(const StateT &x) {
    return State(x.begin(), x.end());
}

template<typename StateT>
bool
all_finite(const StateT &x) {
    return std::all_of(x.begin(), x.end(), [](double v) { return std::isfinite(v); });
}

template<typename StateT>
double
max_abs(const StateT &x) {
    double m = 0.0;
    for (double v : x) { m = std::max(m, std::abs(v)); }
    return m;
}

/**
 * @brief Bookkeeping shared by every backend: sample grid, wall clock and the
 * divergence / finiteness checks. Backends drive it step by step.
 */
class StepGuard {
  public:
    StepGuard(const TimeSpan &span, const SolverOptions &options, IntegrationOutcome &outcome)
      : span_(span)
      , options_(options)
      , outcome_(outcome)
      , times_(sample_times(span, options.num_points))
      , start_(std::chrono::steady_clock::now()) {}

    const std::vector<double> &times() const { return times_; }

    template<typename StateT>
    void record(double t, const StateT &x) {
        outcome_.trajectory.times.push_back(t);
        outcome_.trajectory.states.push_back(to_state(x));
    }

    void fail(SolveErrorKind kind, double t, const std::string &message) {
        outcome_.failure = SolveFailure{ kind, t, message };
    }

    // Checks a freshly computed state; sets the failure and returns false if it is unusable.
    template<typename StateT>
    bool check_state(double t, const StateT &x) {
        if (!all_finite(x)) {
            std::ostringstream oss;
            oss << "state became non-finite at t = " << t;
            fail(SolveErrorKind::NonFiniteState, t, oss.str());
            return false;
        }
        const double magnitude = max_abs(x);
        if (magnitude > options_.divergence_bound) {
            std::ostringstream oss;
            oss << "max |x| = " << magnitude << " exceeded the divergence bound " << options_.divergence_bound
                << " at t = " << t;
            fail(SolveErrorKind::Diverged, t, oss.str());
            return false;
        }
        return true;
    }

    // Step budget and wall clock; called after each accepted step.
    bool check_budget(double t) {
        if (outcome_.steps >= options_.max_steps) {
            std::ostringstream oss;
            oss << "step limit of " << options_.max_steps << " reached at t = " << t;
            fail(SolveErrorKind::StepCountExceeded, t, oss.str());
            return false;
        }
        if (options_.max_wall_seconds > 0.0) {
            const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
            if (elapsed.count() > options_.max_wall_seconds) {
                std::ostringstream oss;
                oss << "wall-clock limit of " << options_.max_wall_seconds << " s reached at t = " << t;
                fail(SolveErrorKind::WallClockExceeded, t, oss.str());
                return false;
            }
        }
        return true;
    }

    double initial_step() const {
        double dt = options_.initial_step;
        if (dt <= 0.0) {
            const double intervals = static_cast<double>(std::max<std::size_t>(times_.size() - 1, 1));
            dt = (span_.tf - span_.t0) / (intervals * 10.0);
        }
        if (options_.max_step > 0.0) { dt = std::min(dt, options_.max_step); }
        return dt;
    }

  private:
    const TimeSpan &span_;
    const SolverOptions &options_;
    IntegrationOutcome &outcome_;
    std::vector<double> times_;
    std::chrono::steady_clock::time_point start_;
};

// odeint systems are either a functor or a (functor, jacobian) pair.
template<typename System, typename StateT>
void
invoke_rhs(System &system, const StateT &x, StateT &dxdt, double t) {
    system(x, dxdt, t);
}

template<typename System, typename Jacobian, typename StateT>
void
invoke_rhs(std::pair<System, Jacobian> &system, const StateT &x, StateT &dxdt, double t) {
    system.first(x, dxdt, t);
}

/**
 * @brief Adaptive integration with any odeint controlled stepper.
 *
 * Steps are clamped so that every sample time is hit exactly. The loop stops
 * at the first failure and leaves the samples gathered so far in the outcome.
 * The system is evaluated once at t0 so that a right-hand side that is already
 * non-finite at the initial state is reported before any step is taken.
 */
template<typename Controller, typename System, typename StateT>
void
integrate_controlled(Controller &controller,
                     System system,
                     StateT x,
                     const TimeSpan &span,
                     const SolverOptions &options,
                     IntegrationOutcome &outcome) {
    StepGuard guard(span, options, outcome);
    const std::vector<double> &times = guard.times();

    double t = span.t0;
    if (!guard.check_state(t, x)) { return; }
    guard.record(t, x);
    if (times.size() < 2) { return; }

    StateT dxdt = x;
    invoke_rhs(system, x, dxdt, t);
    if (!all_finite(dxdt)) {
        guard.fail(SolveErrorKind::NonFiniteState, t, "right-hand side is non-finite at the initial state");
        return;
    }

    double dt = guard.initial_step();
    std::size_t consecutive_rejections = 0;
    std::size_t next = 1;

    while (next < times.size()) {
        const double target = times[next];
        if (options.max_step > 0.0) { dt = std::min(dt, options.max_step); }
        const bool clamped = t + dt >= target;
        double dt_try = clamped ? target - t : dt;
        double t_try = t;

        const odeint::controlled_step_result result = controller.try_step(system, x, t_try, dt_try);
        if (result == odeint::fail) {
            ++outcome.rejected;
            dt = dt_try;
            if (!std::isfinite(dt)) {
                guard.fail(SolveErrorKind::NonFiniteState, t, "error estimate became non-finite");
                return;
            }
            const double min_step = 16.0 * std::numeric_limits<double>::epsilon() * std::max(1.0, std::abs(t));
            if (++consecutive_rejections > kMaxConsecutiveRejections || !(dt > min_step)) {
                std::ostringstream oss;
                oss << "step size control failed at t = " << t << " (dt = " << dt << ")";
                guard.fail(SolveErrorKind::StepCountExceeded, t, oss.str());
                return;
            }
            continue;
        }

        consecutive_rejections = 0;
        ++outcome.steps;
        t = clamped ? target : t_try;
        dt = clamped ? std::max(dt, dt_try) : dt_try;

        if (!guard.check_state(t, x)) { return; }
        if (clamped) {
            guard.record(t, x);
            ++next;
        }
        if (next < times.size() && !guard.check_budget(t)) { return; }
    }
}

} // namespace internal
} // namespace eqpp

#endif // EQPP_INTEGRATION_LOOP_HPP

#include "eqpp/solver_options.hpp"

#include <algorithm>
#include <cctype>

namespace eqpp {

namespace {

std::string
lower(const std::string &text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

} // namespace

std::string
to_string(BackendKind kind) {
    switch (kind) {
        case BackendKind::Dopri5:
            return "dopri5";
        case BackendKind::CashKarp54:
            return "cash_karp54";
        case BackendKind::Fehlberg78:
            return "fehlberg78";
        case BackendKind::Rosenbrock4:
            return "rosenbrock4";
        case BackendKind::FixedRk4:
            return "rk4";
    }
    return "unknown";
}

std::optional<BackendKind>
parse_backend_kind(const std::string &name) {
    const std::string key = lower(name);
    if (key == "dopri5" || key == "rk45") { return BackendKind::Dopri5; }
    if (key == "cash_karp54" || key == "rkck54") { return BackendKind::CashKarp54; }
    if (key == "fehlberg78" || key == "rkf78" || key == "dop853") { return BackendKind::Fehlberg78; }
    if (key == "rosenbrock4" || key == "radau" || key == "bdf" || key == "stiff") { return BackendKind::Rosenbrock4; }
    if (key == "rk4" || key == "fixed_rk4" || key == "numba") { return BackendKind::FixedRk4; }
    return std::nullopt;
}

std::string
to_string(SolveErrorKind kind) {
    switch (kind) {
        case SolveErrorKind::NonFiniteState:
            return "non_finite_state";
        case SolveErrorKind::StepCountExceeded:
            return "step_count_exceeded";
        case SolveErrorKind::WallClockExceeded:
            return "wall_clock_exceeded";
        case SolveErrorKind::Diverged:
            return "diverged";
    }
    return "unknown";
}

std::optional<SolveErrorKind>
parse_solve_error_kind(const std::string &name) {
    for (SolveErrorKind kind : { SolveErrorKind::NonFiniteState,
                                 SolveErrorKind::StepCountExceeded,
                                 SolveErrorKind::WallClockExceeded,
                                 SolveErrorKind::Diverged }) {
        if (to_string(kind) == name) { return kind; }
    }
    return std::nullopt;
}

std::vector<double>
sample_times(const TimeSpan &span, std::size_t num_points) {
    std::vector<double> times;
    if (span.tf == span.t0 || num_points < 2) {
        times.push_back(span.t0);
        if (span.tf != span.t0) { times.push_back(span.tf); }
        return times;
    }
    times.reserve(num_points);
    const double width = span.tf - span.t0;
    const auto intervals = static_cast<double>(num_points - 1);
    for (std::size_t k = 0; k < num_points; ++k) {
        const double t = k + 1 == num_points ? span.tf : span.t0 + width * (static_cast<double>(k) / intervals);
        // Rounding on tiny spans can repeat a value; keep the grid strictly increasing.
        if (!times.empty() && t <= times.back()) { continue; }
        times.push_back(t);
    }
    if (times.back() != span.tf) { times.back() = span.tf; }
    return times;
}

} // namespace eqpp

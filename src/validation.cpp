#include "eqpp/validation.hpp"

#include <cctype>
#include <cmath>
#include <string>
#include <utility>

namespace eqpp {

namespace {

bool
is_blank(const std::string &text) {
    for (char ch : text) {
        if (std::isspace(static_cast<unsigned char>(ch)) == 0) { return false; }
    }
    return true;
}

bool
is_identifier(const std::string &name) {
    if (name.empty() || std::isalpha(static_cast<unsigned char>(name[0])) == 0) { return false; }
    for (char ch : name) {
        if (std::isalnum(static_cast<unsigned char>(ch)) == 0) { return false; }
    }
    return true;
}

} // namespace

std::vector<FieldError>
validate_request(const JobRequest &request) {
    std::vector<FieldError> errors;
    auto add = [&errors](const std::string &field, const std::string &message) {
        errors.push_back(FieldError{ field, message });
    };

    if (is_blank(request.equations)) { add("equations", "equations must be a non-empty string"); }

    const TimeSpan &span = request.time_span;
    if (!std::isfinite(span.t0) || !std::isfinite(span.tf)) {
        add("timespan", "timespan values must be finite numbers");
    } else if (span.tf < span.t0) {
        add("timespan", "timespan must satisfy t0 <= tf");
    }

    for (std::size_t i = 0; i < request.initial_conditions.size(); ++i) {
        for (double value : request.initial_conditions[i]) {
            if (!std::isfinite(value)) {
                add("initial_conditions[" + std::to_string(i) + "]", "initial condition values must be finite");
                break;
            }
        }
    }

    for (const auto &param : request.parameters) {
        if (!is_identifier(param.first)) {
            add("parameters", "parameter name '" + param.first + "' is not an identifier");
        }
        if (!std::isfinite(param.second)) {
            add("parameters." + param.first, "parameter values must be finite numbers");
        }
    }

    const SolverOptions &opt = request.options;
    if (!(opt.rel_tol > 0.0) || !std::isfinite(opt.rel_tol)) { add("integrator.rtol", "rtol must be positive"); }
    if (!(opt.abs_tol > 0.0) || !std::isfinite(opt.abs_tol)) { add("integrator.atol", "atol must be positive"); }
    if (opt.max_steps == 0) { add("integrator.max_steps", "max_steps must be positive"); }
    if (!(opt.max_wall_seconds >= 0.0)) { add("integrator.max_wall_time", "max_wall_time must be >= 0"); }
    if (opt.num_points < 2) { add("integrator.num_points", "num_points must be at least 2"); }
    if (!(opt.max_step >= 0.0)) { add("integrator.max_step", "max_step must be positive or 0 (unbounded)"); }
    if (!(opt.initial_step >= 0.0)) {
        add("integrator.initial_step", "initial_step must be positive or 0 (automatic)");
    }
    if (!(opt.divergence_bound > 0.0)) {
        add("integrator.divergence_bound", "divergence_bound must be positive");
    }

    return errors;
}

void
require_valid_request(const JobRequest &request) {
    auto errors = validate_request(request);
    if (!errors.empty()) { throw InvalidRequestError(std::move(errors)); }
}

} // namespace eqpp

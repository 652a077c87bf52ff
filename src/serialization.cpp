#include "eqpp/serialization.hpp"

#include <cstdint>
#include <string>

namespace eqpp {

namespace {

nlohmann::json
optional_string(const std::string &value) {
    return value.empty() ? nlohmann::json(nullptr) : nlohmann::json(value);
}

std::string
string_or_empty(const nlohmann::json &j, const char *key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) { return {}; }
    return it->get<std::string>();
}

nlohmann::json
states_to_json(const std::vector<State> &states) {
    nlohmann::json rows = nlohmann::json::array();
    for (const State &row : states) { rows.push_back(row); }
    return rows;
}

// Reads a number field if present; records a field error on a type mismatch.
void
read_number(const nlohmann::json &obj,
            const char *key,
            double &out,
            bool nullable,
            const std::string &prefix,
            std::vector<FieldError> &errors) {
    auto it = obj.find(key);
    if (it == obj.end()) { return; }
    if (it->is_null() && nullable) {
        out = 0.0;
        return;
    }
    if (!it->is_number()) {
        errors.push_back(
          FieldError{ prefix + "." + key, std::string(key) + (nullable ? " must be a number or null" : " must be a number") });
        return;
    }
    out = it->get<double>();
}

void
read_count(const nlohmann::json &obj,
           const char *key,
           std::size_t &out,
           const std::string &prefix,
           std::vector<FieldError> &errors) {
    auto it = obj.find(key);
    if (it == obj.end()) { return; }
    if (!it->is_number_integer() || it->get<std::int64_t>() < 0) {
        errors.push_back(FieldError{ prefix + "." + key, std::string(key) + " must be a non-negative integer" });
        return;
    }
    out = static_cast<std::size_t>(it->get<std::int64_t>());
}

bool
read_vector(const nlohmann::json &j, State &out) {
    if (!j.is_array()) { return false; }
    out.clear();
    out.reserve(j.size());
    for (const auto &v : j) {
        if (!v.is_number()) { return false; }
        out.push_back(v.get<double>());
    }
    return true;
}

} // namespace

//-----------------------------------------------------------------------------
// Requests
//-----------------------------------------------------------------------------
void
to_json(nlohmann::json &j, const SolverOptions &options) {
    j = nlohmann::json{ { "method", to_string(options.backend) },
                        { "rtol", options.rel_tol },
                        { "atol", options.abs_tol },
                        { "max_step", options.max_step > 0.0 ? nlohmann::json(options.max_step) : nlohmann::json(nullptr) },
                        { "max_steps", options.max_steps },
                        { "max_wall_time", options.max_wall_seconds },
                        { "num_points", options.num_points },
                        { "initial_step",
                          options.initial_step > 0.0 ? nlohmann::json(options.initial_step) : nlohmann::json(nullptr) },
                        { "divergence_bound", options.divergence_bound },
                        { "fallback", options.allow_fallback } };
}

void
to_json(nlohmann::json &j, const JobRequest &request) {
    j = nlohmann::json{ { "equations", request.equations },
                        { "name", request.name },
                        { "parameters", request.parameters },
                        { "timespan", { request.time_span.t0, request.time_span.tf } },
                        { "initial_conditions", states_to_json(request.initial_conditions) },
                        { "integrator", request.options } };
}

SolverOptions
parse_solver_options(const nlohmann::json &j,
                     const SolverOptions &defaults,
                     const std::string &prefix,
                     std::vector<FieldError> &errors) {
    SolverOptions options = defaults;
    if (j.is_null()) { return options; }
    if (!j.is_object()) {
        errors.push_back(FieldError{ prefix, prefix + " must be an object" });
        return options;
    }

    // "backend" is the older spelling and wins when both are present.
    for (const char *key : { "method", "backend" }) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) { continue; }
        if (!it->is_string()) {
            errors.push_back(FieldError{ prefix + "." + key, std::string(key) + " must be a string" });
            continue;
        }
        auto kind = parse_backend_kind(it->get<std::string>());
        if (!kind) {
            errors.push_back(FieldError{ prefix + "." + key,
                                         "unsupported integrator method: " + it->get<std::string>()
                                           + " (allowed: dopri5/rk45, cash_karp54, fehlberg78/dop853, "
                                             "rosenbrock4/radau/bdf, rk4)" });
            continue;
        }
        options.backend = *kind;
    }

    read_number(j, "rtol", options.rel_tol, false, prefix, errors);
    read_number(j, "atol", options.abs_tol, false, prefix, errors);
    read_number(j, "max_step", options.max_step, true, prefix, errors);
    read_count(j, "max_steps", options.max_steps, prefix, errors);
    read_number(j, "max_wall_time", options.max_wall_seconds, false, prefix, errors);
    read_count(j, "num_points", options.num_points, prefix, errors);
    read_number(j, "initial_step", options.initial_step, true, prefix, errors);
    read_number(j, "divergence_bound", options.divergence_bound, false, prefix, errors);

    auto fallback = j.find("fallback");
    if (fallback != j.end()) {
        if (fallback->is_boolean()) {
            options.allow_fallback = fallback->get<bool>();
        } else {
            errors.push_back(FieldError{ prefix + ".fallback", "fallback must be a boolean" });
        }
    }
    return options;
}

JobRequest
parse_request(const nlohmann::json &j, const SolverOptions &defaults) {
    std::vector<FieldError> errors;
    JobRequest request;
    request.options = defaults;

    if (!j.is_object()) { throw InvalidRequestError({ FieldError{ "request", "request must be a JSON object" } }); }

    auto equations = j.find("equations");
    if (equations == j.end() || !equations->is_string()) {
        errors.push_back(FieldError{ "equations", "equations must be a non-empty string" });
    } else {
        request.equations = equations->get<std::string>();
    }

    auto name = j.find("name");
    if (name != j.end() && !name->is_null()) {
        if (name->is_string()) {
            request.name = name->get<std::string>();
        } else {
            errors.push_back(FieldError{ "name", "name must be a string" });
        }
    }

    auto params = j.find("parameters");
    if (params != j.end() && !params->is_null()) {
        if (!params->is_object()) {
            errors.push_back(FieldError{ "parameters", "parameters must be an object mapping names to numbers" });
        } else {
            for (auto it = params->begin(); it != params->end(); ++it) {
                if (!it.value().is_number()) {
                    errors.push_back(FieldError{ "parameters." + it.key(), "parameter values must be numeric" });
                    continue;
                }
                request.parameters[it.key()] = it.value().get<double>();
            }
        }
    }

    auto span = j.find("timespan");
    if (span == j.end() || !span->is_array() || span->size() != 2 || !(*span)[0].is_number()
        || !(*span)[1].is_number()) {
        errors.push_back(FieldError{ "timespan", "timespan must be an array of two numbers [t0, tf]" });
    } else {
        request.time_span.t0 = (*span)[0].get<double>();
        request.time_span.tf = (*span)[1].get<double>();
    }

    auto ics = j.find("initial_conditions");
    if (ics == j.end() || !ics->is_array()) {
        errors.push_back(FieldError{ "initial_conditions", "initial_conditions must be an array of vectors" });
    } else {
        for (std::size_t i = 0; i < ics->size(); ++i) {
            State row;
            if (!read_vector((*ics)[i], row)) {
                errors.push_back(FieldError{ "initial_conditions[" + std::to_string(i) + "]",
                                             "each initial condition must be an array of numbers" });
                continue;
            }
            request.initial_conditions.push_back(std::move(row));
        }
    }

    auto integrator = j.find("integrator");
    if (integrator != j.end()) { request.options = parse_solver_options(*integrator, defaults, "integrator", errors); }

    if (!errors.empty()) { throw InvalidRequestError(std::move(errors)); }
    return request;
}

//-----------------------------------------------------------------------------
// Results
//-----------------------------------------------------------------------------
void
to_json(nlohmann::json &j, const Trajectory &trajectory) {
    j = nlohmann::json{ { "times", trajectory.times }, { "states", states_to_json(trajectory.states) } };
}

void
from_json(const nlohmann::json &j, Trajectory &trajectory) {
    trajectory.times = j.at("times").get<std::vector<double>>();
    trajectory.states = j.at("states").get<std::vector<State>>();
}

void
to_json(nlohmann::json &j, const SolveFailure &failure) {
    j = nlohmann::json{ { "kind", to_string(failure.kind) }, { "time", failure.time }, { "message", failure.message } };
}

void
from_json(const nlohmann::json &j, SolveFailure &failure) {
    const std::string kind = j.at("kind").get<std::string>();
    auto parsed = parse_solve_error_kind(kind);
    if (!parsed) { throw std::runtime_error("unknown solve error kind: " + kind); }
    failure.kind = *parsed;
    failure.time = j.at("time").get<double>();
    failure.message = j.value("message", std::string());
}

void
to_json(nlohmann::json &j, const JobFailure &failure) {
    j = nlohmann::json{ { "trajectory_index", failure.trajectory_index },
                        { "error", failure.error },
                        { "partial", failure.partial } };
}

void
from_json(const nlohmann::json &j, JobFailure &failure) {
    failure.trajectory_index = j.at("trajectory_index").get<std::size_t>();
    failure.error = j.at("error").get<SolveFailure>();
    failure.partial = j.at("partial").get<Trajectory>();
}

void
to_json(nlohmann::json &j, const JobResult &result) {
    nlohmann::json trajectories = nlohmann::json::array();
    for (const Trajectory &traj : result.trajectories) { trajectories.push_back(states_to_json(traj.states)); }
    j = nlohmann::json{ { "state", to_string(result.state) },
                        { "reason", result.reason },
                        { "state_variables", result.state_variables },
                        { "times", result.times },
                        { "trajectories", trajectories },
                        { "warnings", result.warnings },
                        { "failure", result.failure ? nlohmann::json(*result.failure) : nlohmann::json(nullptr) } };
}

void
from_json(const nlohmann::json &j, JobResult &result) {
    const std::string state = j.at("state").get<std::string>();
    auto parsed = parse_job_state(state);
    if (!parsed) { throw std::runtime_error("unknown job state: " + state); }
    result.state = *parsed;
    result.reason = j.value("reason", std::string());
    result.state_variables = j.value("state_variables", std::vector<std::string>());
    result.times = j.value("times", std::vector<double>());
    result.trajectories.clear();
    for (const auto &rows : j.at("trajectories")) {
        Trajectory traj;
        traj.times = result.times;
        traj.states = rows.get<std::vector<State>>();
        result.trajectories.push_back(std::move(traj));
    }
    result.warnings = j.value("warnings", std::vector<std::string>());
    result.failure.reset();
    if (j.contains("failure") && !j.at("failure").is_null()) { result.failure = j.at("failure").get<JobFailure>(); }
}

//-----------------------------------------------------------------------------
// Records
//-----------------------------------------------------------------------------
void
to_json(nlohmann::json &j, const JobRecord &record) {
    j = nlohmann::json{ { "id", record.id },
                        { "state", to_string(record.state) },
                        { "request", record.request },
                        { "reason", optional_string(record.reason) },
                        { "failure", record.failure ? nlohmann::json(*record.failure) : nlohmann::json(nullptr) },
                        { "result", record.result ? nlohmann::json(*record.result) : nlohmann::json(nullptr) },
                        { "completed_trajectories", record.completed_trajectories },
                        { "warnings", record.warnings },
                        { "created_at", record.created_at },
                        { "finished_at", optional_string(record.finished_at) } };
}

void
from_json(const nlohmann::json &j, JobRecord &record) {
    record.id = j.at("id").get<std::string>();
    const std::string state = j.at("state").get<std::string>();
    auto parsed = parse_job_state(state);
    if (!parsed) { throw std::runtime_error("unknown job state: " + state); }
    record.state = *parsed;
    record.request = parse_request(j.at("request"));
    record.reason = string_or_empty(j, "reason");
    record.failure.reset();
    if (j.contains("failure") && !j.at("failure").is_null()) { record.failure = j.at("failure").get<JobFailure>(); }
    record.result.reset();
    if (j.contains("result") && !j.at("result").is_null()) { record.result = j.at("result").get<JobResult>(); }
    record.completed_trajectories = j.value("completed_trajectories", std::size_t{ 0 });
    record.warnings = j.value("warnings", std::vector<std::string>());
    record.created_at = string_or_empty(j, "created_at");
    record.finished_at = string_or_empty(j, "finished_at");
}

//-----------------------------------------------------------------------------
// Events and errors
//-----------------------------------------------------------------------------
void
to_json(nlohmann::json &j, const JobEvent &event) {
    j = nlohmann::json{ { "type", to_string(event.kind) },
                        { "job_id", event.job_id },
                        { "sequence", event.sequence },
                        { "state", to_string(event.state) } };
    switch (event.kind) {
        case EventKind::StatusChanged:
            break;
        case EventKind::TrajectoryCompleted:
            j["index"] = event.trajectory_index;
            j["fraction_complete"] = event.fraction_complete;
            if (event.trajectory) { j["trajectory"] = *event.trajectory; }
            break;
        case EventKind::JobFailed:
            if (event.failure) { j["failure"] = *event.failure; }
            break;
        case EventKind::JobFinished:
            if (event.result) { j["result"] = *event.result; }
            break;
    }
}

void
to_json(nlohmann::json &j, const FieldError &error) {
    j = nlohmann::json{ { "field", error.field }, { "message", error.message } };
}

} // namespace eqpp

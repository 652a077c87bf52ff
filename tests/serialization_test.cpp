#include "eqpp/serialization.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <memory>

using namespace eqpp;
using json = nlohmann::json;

namespace {

std::vector<FieldError>
request_errors(const json &j) {
    try {
        parse_request(j);
    } catch (const InvalidRequestError &e) {
        return e.errors();
    }
    return {};
}

bool
has_field(const std::vector<FieldError> &errors, const std::string &field) {
    return std::any_of(errors.begin(), errors.end(), [&](const FieldError &e) { return e.field == field; });
}

json
base_request() {
    return json{ { "equations", "{D(x), D(y)} == {x - y, x*y}" },
                 { "name", "coupled" },
                 { "timespan", { 0, 10 } },
                 { "initial_conditions", { { 1.0, 0.0 }, { 0.5, 0.5 } } } };
}

} // namespace

TEST(SerializationTest, ParsesFullRequest) {
    json j = base_request();
    j["parameters"] = { { "k", 0.5 } };
    j["integrator"] = { { "method", "RK45" },
                        { "rtol", 1e-8 },
                        { "atol", 1e-10 },
                        { "max_step", nullptr },
                        { "max_steps", 5000 },
                        { "num_points", 11 },
                        { "fallback", false } };

    const JobRequest request = parse_request(j);
    EXPECT_EQ(request.equations, "{D(x), D(y)} == {x - y, x*y}");
    EXPECT_EQ(request.name, "coupled");
    EXPECT_EQ(request.parameters.at("k"), 0.5);
    EXPECT_EQ(request.time_span.t0, 0.0);
    EXPECT_EQ(request.time_span.tf, 10.0);
    ASSERT_EQ(request.initial_conditions.size(), 2u);
    EXPECT_EQ(request.initial_conditions[1], (State{ 0.5, 0.5 }));
    EXPECT_EQ(request.options.backend, BackendKind::Dopri5);
    EXPECT_EQ(request.options.rel_tol, 1e-8);
    EXPECT_EQ(request.options.abs_tol, 1e-10);
    EXPECT_EQ(request.options.max_step, 0.0);
    EXPECT_EQ(request.options.max_steps, 5000u);
    EXPECT_EQ(request.options.num_points, 11u);
    EXPECT_FALSE(request.options.allow_fallback);
}

TEST(SerializationTest, MissingIntegratorUsesDefaults) {
    SolverOptions defaults;
    defaults.backend = BackendKind::Rosenbrock4;
    defaults.num_points = 51;
    const JobRequest request = parse_request(base_request(), defaults);
    EXPECT_EQ(request.options.backend, BackendKind::Rosenbrock4);
    EXPECT_EQ(request.options.num_points, 51u);
}

TEST(SerializationTest, BackendKeyOverridesMethod) {
    json j = base_request();
    j["integrator"] = { { "method", "rk45" }, { "backend", "radau" } };
    EXPECT_EQ(parse_request(j).options.backend, BackendKind::Rosenbrock4);
}

TEST(SerializationTest, ReportsEveryMalformedField) {
    json j = base_request();
    j["timespan"] = { 0 };
    j["initial_conditions"] = { { 1.0, "a" }, { 2.0, 3.0 } };
    j["parameters"] = { { "k", "fast" } };
    j["integrator"] = { { "method", "Euler" }, { "rtol", "tight" }, { "max_steps", -5 } };

    const auto errors = request_errors(j);
    EXPECT_TRUE(has_field(errors, "timespan"));
    EXPECT_TRUE(has_field(errors, "initial_conditions[0]"));
    EXPECT_FALSE(has_field(errors, "initial_conditions[1]"));
    EXPECT_TRUE(has_field(errors, "parameters.k"));
    EXPECT_TRUE(has_field(errors, "integrator.method"));
    EXPECT_TRUE(has_field(errors, "integrator.rtol"));
    EXPECT_TRUE(has_field(errors, "integrator.max_steps"));
}

TEST(SerializationTest, RejectsNonObjects) {
    EXPECT_TRUE(has_field(request_errors(json::array()), "request"));

    json j = base_request();
    j.erase("equations");
    EXPECT_TRUE(has_field(request_errors(j), "equations"));

    j = base_request();
    j["integrator"] = "dopri5";
    EXPECT_TRUE(has_field(request_errors(j), "integrator"));
}

TEST(SerializationTest, FieldErrorsAsJson) {
    const json j = FieldError{ "timespan", "bad" };
    EXPECT_EQ(j.at("field"), "timespan");
    EXPECT_EQ(j.at("message"), "bad");
}

TEST(SerializationTest, ResultLayout) {
    JobResult result;
    result.state = JobState::Finished;
    result.reason = kReasonCompleted;
    result.state_variables = { "x", "y" };
    result.times = { 0.0, 1.0 };
    Trajectory traj;
    traj.times = result.times;
    traj.states = { { 1.0, 0.0 }, { 2.0, 3.0 } };
    result.trajectories.push_back(traj);

    const json j = result;
    EXPECT_EQ(j.at("state"), "finished");
    EXPECT_EQ(j.at("reason"), "completed");
    EXPECT_EQ(j.at("times"), json({ 0.0, 1.0 }));
    EXPECT_EQ(j.at("trajectories"), json::parse("[[[1.0, 0.0], [2.0, 3.0]]]"));
    EXPECT_TRUE(j.at("failure").is_null());

    const JobResult back = j.get<JobResult>();
    ASSERT_EQ(back.trajectories.size(), 1u);
    EXPECT_EQ(back.trajectories[0].times, result.times);
    EXPECT_EQ(back.trajectories[0].states, traj.states);
}

TEST(SerializationTest, FailedRecordSurvivesJson) {
    JobRecord record;
    record.id = "0a1b";
    record.state = JobState::Failed;
    record.request.equations = "D(x) == x";
    record.request.initial_conditions = { { 1.0 } };
    record.request.time_span = TimeSpan{ 0.0, 100.0 };
    record.request.options.backend = BackendKind::FixedRk4;
    record.reason = kReasonSolveError;
    JobFailure failure;
    failure.trajectory_index = 0;
    failure.error = SolveFailure{ SolveErrorKind::Diverged, 6.5, "too big" };
    failure.partial.times = { 0.0, 0.5 };
    failure.partial.states = { { 1.0 }, { 1.6 } };
    record.failure = failure;
    record.created_at = "2026-01-01T00:00:00Z";
    record.finished_at = "2026-01-01T00:00:01Z";

    const json j = record;
    EXPECT_EQ(j.at("state"), "failed");
    EXPECT_EQ(j.at("failure").at("error").at("kind"), "diverged");
    EXPECT_TRUE(j.at("result").is_null());

    const JobRecord back = j.get<JobRecord>();
    EXPECT_EQ(back.id, record.id);
    EXPECT_EQ(back.state, JobState::Failed);
    EXPECT_EQ(back.reason, kReasonSolveError);
    EXPECT_EQ(back.request.options.backend, BackendKind::FixedRk4);
    ASSERT_TRUE(back.failure.has_value());
    EXPECT_EQ(back.failure->error.kind, SolveErrorKind::Diverged);
    EXPECT_EQ(back.failure->partial.states, failure.partial.states);
    EXPECT_EQ(back.finished_at, record.finished_at);
    EXPECT_EQ(json(back), j);
}

TEST(SerializationTest, QueuedRecordHasNullReason) {
    JobRecord record;
    record.id = "q";
    record.request.equations = "D(x) == 1";
    const json j = record;
    EXPECT_TRUE(j.at("reason").is_null());
    EXPECT_TRUE(j.at("finished_at").is_null());
    EXPECT_EQ(j.get<JobRecord>().reason, "");
}

TEST(SerializationTest, EventLayout) {
    auto trajectory = std::make_shared<Trajectory>();
    trajectory->times = { 0.0 };
    trajectory->states = { { 1.0 } };
    JobEvent event = JobEvent::trajectory_completed("job", 1, trajectory, 0.5);
    event.sequence = 4;

    const json j = event;
    EXPECT_EQ(j.at("type"), "trajectory");
    EXPECT_EQ(j.at("job_id"), "job");
    EXPECT_EQ(j.at("sequence"), 4);
    EXPECT_EQ(j.at("state"), "running");
    EXPECT_EQ(j.at("index"), 1);
    EXPECT_EQ(j.at("fraction_complete"), 0.5);
    EXPECT_EQ(j.at("trajectory").at("times"), json({ 0.0 }));
}

#ifndef EQPP_JOB_HPP
#define EQPP_JOB_HPP

#include "eqpp/compiled_system.hpp"
#include "eqpp/solver_options.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace eqpp {

//-----------------------------------------------------------------------------
// Lifecycle
//-----------------------------------------------------------------------------
enum class JobState { Queued, Running, Finished, Failed, Cancelled };

std::string
to_string(JobState state);

std::optional<JobState>
parse_job_state(const std::string &name);

inline bool
is_terminal(JobState state) {
    return state == JobState::Finished || state == JobState::Failed || state == JobState::Cancelled;
}

// Reason codes stored with terminal records.
inline const std::string kReasonCompleted = "completed";
inline const std::string kReasonSolveError = "solve_error";
inline const std::string kReasonCancelled = "cancelled";
// A backend threw instead of returning a SolveFailure (out of memory, for example).
inline const std::string kReasonBackendError = "backend_error";

//-----------------------------------------------------------------------------
// Submission
//-----------------------------------------------------------------------------
struct JobRequest {
    std::string equations;
    std::string name;
    std::map<std::string, double> parameters;
    std::vector<State> initial_conditions;
    TimeSpan time_span;
    SolverOptions options;
};

struct JobHandle {
    std::string id;
    std::size_t dimension = 0;
    std::vector<std::string> state_variables;
};

/**
 * @brief Unit of work dispatched to a worker: one initial condition of one job.
 */
struct SolveRequest {
    std::string job_id;
    std::size_t index = 0;
    CompiledSystemPtr system;
    State initial;
    TimeSpan span;
    SolverOptions options;
};

//-----------------------------------------------------------------------------
// Results
//-----------------------------------------------------------------------------
struct JobFailure {
    std::size_t trajectory_index = 0;
    SolveFailure error;
    Trajectory partial;
};

struct JobResult {
    JobState state = JobState::Finished;
    std::string reason;
    std::vector<std::string> state_variables;
    std::vector<double> times;            // shared sample grid
    std::vector<Trajectory> trajectories; // finished jobs only: one per initial condition, in submission order
    std::vector<std::string> warnings;
    std::optional<JobFailure> failure;
};

/**
 * @brief Persisted view of a job. Written by the orchestrator on every state
 * transition; immutable once the state is terminal.
 */
struct JobRecord {
    std::string id;
    JobState state = JobState::Queued;
    JobRequest request;
    std::string reason; // empty until terminal
    std::optional<JobFailure> failure;
    std::optional<JobResult> result;
    std::size_t completed_trajectories = 0;
    std::vector<std::string> warnings;
    std::string created_at;  // ISO-8601 UTC
    std::string finished_at; // empty until terminal
};

} // namespace eqpp

#endif // EQPP_JOB_HPP

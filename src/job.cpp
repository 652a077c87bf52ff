#include "eqpp/job.hpp"

namespace eqpp {

std::string
to_string(JobState state) {
    switch (state) {
        case JobState::Queued:
            return "queued";
        case JobState::Running:
            return "running";
        case JobState::Finished:
            return "finished";
        case JobState::Failed:
            return "failed";
        case JobState::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

std::optional<JobState>
parse_job_state(const std::string &name) {
    for (JobState state :
         { JobState::Queued, JobState::Running, JobState::Finished, JobState::Failed, JobState::Cancelled }) {
        if (to_string(state) == name) { return state; }
    }
    return std::nullopt;
}

} // namespace eqpp

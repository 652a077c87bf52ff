#ifndef EQPP_JOB_ORCHESTRATOR_HPP
#define EQPP_JOB_ORCHESTRATOR_HPP

#include "eqpp/config.hpp"
#include "eqpp/job.hpp"
#include "eqpp/job_store.hpp"
#include "eqpp/notification_channel.hpp"
#include "eqpp/solver_backend.hpp"
#include "eqpp/system_cache.hpp"
#include "eqpp/worker_pool.hpp"

#include <boost/uuid/random_generator.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace eqpp {

/**
 * @brief Owns the lifecycle of jobs: validation, compilation, scheduling of
 * one solve per initial condition, persistence and event publication.
 *
 * Job states move queued -> running -> finished | failed, with cancelled
 * reachable from queued or running. Every transition is saved to the JobStore
 * and published on the NotificationChannel while holding one mutex, so a
 * job's events are totally ordered and its terminal event is always last.
 * Status and result queries read the JobStore.
 */
class JobOrchestrator {
  public:
    // `backends` builds the integrator for each solve, including the Rosenbrock4 fallback.
    explicit JobOrchestrator(OrchestratorConfig config = {},
                             std::shared_ptr<JobStore> store = std::make_shared<InMemoryJobStore>(),
                             std::shared_ptr<NotificationChannel> channel = std::make_shared<NotificationChannel>(),
                             BackendFactory backends = make_backend);

    // Cancels whatever is still active and joins the workers.
    ~JobOrchestrator();

    JobOrchestrator(const JobOrchestrator &) = delete;
    JobOrchestrator &operator=(const JobOrchestrator &) = delete;

    /**
     * @brief Creates a job and queues one solve per initial condition.
     *
     * Checks run in this order and nothing is created if any fails:
     * field validation, parse/bind/compile, initial condition dimension,
     * pending capacity, initial record save.
     *
     * @throws InvalidRequestError, ParseError, BindError, DimensionMismatchError,
     *         CapacityError, StoreError
     */
    JobHandle submit(const JobRequest &request);

    // Same as above with no parameters; options default to the configured ones.
    JobHandle submit(const std::string &equations,
                     const std::vector<State> &initial_conditions,
                     const TimeSpan &span,
                     const std::optional<SolverOptions> &options = std::nullopt);

    /**
     * @return true if the job was queued or running and is now cancelled (or
     * will be once its in-flight solves drain); false if it was already terminal.
     * @throws JobNotFoundError
     */
    bool cancel(const std::string &id);

    // @throws JobNotFoundError
    JobState get_status(const std::string &id) const;

    // @throws JobNotFoundError, JobNotReadyError
    JobResult get_result(const std::string &id) const;

    // @throws JobNotFoundError
    JobRecord get_record(const std::string &id) const;

    /**
     * @brief Blocks until the job is terminal or `timeout` expires.
     * @return true if the job is terminal.
     * @throws JobNotFoundError
     */
    bool wait(const std::string &id, std::chrono::milliseconds timeout) const;

    // Events published after this call. @throws JobNotFoundError
    Subscription subscribe(const std::string &id);

    std::size_t pending_requests() const;
    std::size_t active_jobs() const;

    const OrchestratorConfig &config() const { return config_; }
    const SystemCache &cache() const { return cache_; }
    const std::shared_ptr<JobStore> &store() const { return store_; }
    const std::shared_ptr<NotificationChannel> &channel() const { return channel_; }

  private:
    struct ActiveJob {
        JobRecord record;
        CompiledSystemPtr system;
        std::vector<double> grid;
        std::vector<std::optional<Trajectory>> trajectories;
        std::size_t in_flight = 0;
        std::size_t completed = 0;
        bool cancel_requested = false;
    };
    using ActiveJobPtr = std::shared_ptr<ActiveJob>;

    struct SolveOutcome {
        IntegrationOutcome integration;
        std::vector<std::string> warnings;
        bool backend_error = false; // the backend threw; integration.failure describes it
    };

    OrchestratorConfig config_;
    std::shared_ptr<JobStore> store_;
    std::shared_ptr<NotificationChannel> channel_;
    BackendFactory backends_;
    SystemCache cache_;

    mutable std::mutex mutex_;
    mutable std::condition_variable terminal_cv_;
    std::map<std::string, ActiveJobPtr> active_;
    std::deque<SolveRequest> pending_;
    boost::uuids::random_generator uuid_generator_;

    // Declared last: its threads must stop before the members above go away.
    WorkerPool pool_;

    void run_next();
    std::unique_ptr<SolverBackend> make_solver(BackendKind kind) const;
    SolveOutcome run_solve(const SolveRequest &request) const;

    void on_solve_done_locked(const ActiveJobPtr &job, std::size_t index, SolveOutcome solved);
    void transition_locked(ActiveJob &job, JobState state);
    void fail_locked(ActiveJob &job, JobFailure failure, const std::string &reason);
    void finish_locked(ActiveJob &job);
    void finalize_cancel_locked(ActiveJob &job);
    bool cancel_locked(ActiveJob &job);
    void persist_locked(ActiveJob &job);
    void publish_locked(const std::string &id, JobEvent event);
    void purge_pending_locked(const std::string &id);
    void retire_if_drained_locked(const std::string &id);
    JobResult make_result(const ActiveJob &job, JobState state) const;

    JobRecord load_record(const std::string &id) const;
};

} // namespace eqpp

#endif // EQPP_JOB_ORCHESTRATOR_HPP

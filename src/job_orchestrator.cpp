#include "eqpp/job_orchestrator.hpp"

#include "eqpp/errors.hpp"
#include "eqpp/log.hpp"
#include "eqpp/solver_backend.hpp"
#include "eqpp/validation.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <ctime>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace eqpp {

namespace {

const char *const kComponent = "JobOrchestrator";

std::string
utc_timestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

bool
is_explicit_adaptive(BackendKind kind) {
    return kind == BackendKind::Dopri5 || kind == BackendKind::CashKarp54 || kind == BackendKind::Fehlberg78;
}

} // namespace

JobOrchestrator::JobOrchestrator(OrchestratorConfig config,
                                 std::shared_ptr<JobStore> store,
                                 std::shared_ptr<NotificationChannel> channel,
                                 BackendFactory backends)
  : config_(std::move(config))
  , store_(std::move(store))
  , channel_(std::move(channel))
  , backends_(std::move(backends))
  , cache_(config_.system_cache_capacity)
  , pool_(config_.worker_threads) {
    if (!store_) { throw std::invalid_argument("JobOrchestrator: store must not be null"); }
    if (!channel_) { throw std::invalid_argument("JobOrchestrator: channel must not be null"); }
    if (!backends_) { throw std::invalid_argument("JobOrchestrator: backend factory must not be empty"); }
    if (config_.verbose) { log::set_verbose(true); }

    std::ostringstream oss;
    oss << "Started with " << pool_.size() << " worker(s), store: " << store_->name();
    log::info(kComponent, oss.str());
}

JobOrchestrator::~JobOrchestrator() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ActiveJobPtr> jobs;
        for (const auto &entry : active_) { jobs.push_back(entry.second); }
        for (const auto &job : jobs) { cancel_locked(*job); }
    }
    pool_.shutdown();
    log::info(kComponent, "Shut down");
}

//-----------------------------------------------------------------------------
// Submission
//-----------------------------------------------------------------------------
JobHandle
JobOrchestrator::submit(const JobRequest &request) {
    require_valid_request(request);

    BindOptions bind_options;
    bind_options.parameters = request.parameters;
    CompiledSystemPtr system = cache_.get_or_compile(request.equations, bind_options);

    for (std::size_t i = 0; i < request.initial_conditions.size(); ++i) {
        if (request.initial_conditions[i].size() != system->dimension()) {
            throw DimensionMismatchError(i, system->dimension(), request.initial_conditions[i].size());
        }
    }

    const std::size_t n = request.initial_conditions.size();
    std::lock_guard<std::mutex> lock(mutex_);

    if (config_.max_pending_requests > 0 && pending_.size() + n > config_.max_pending_requests) {
        std::ostringstream oss;
        oss << "pending queue is full (" << pending_.size() << " of " << config_.max_pending_requests
            << " solve requests waiting, this job needs " << n << ")";
        throw CapacityError(oss.str());
    }

    auto job = std::make_shared<ActiveJob>();
    job->record.id = boost::uuids::to_string(uuid_generator_());
    job->record.state = JobState::Queued;
    job->record.request = request;
    job->record.created_at = utc_timestamp();
    job->system = system;
    job->grid = sample_times(request.time_span, request.options.num_points);
    job->trajectories.resize(n);

    // The first save is the point of creation; a failure here leaves nothing behind.
    store_->save(job->record.id, job->record);

    const std::string id = job->record.id;
    JobHandle handle{ id, system->dimension(), system->state_variables() };

    std::ostringstream oss;
    oss << "Job " << id << " queued: " << n << " trajectory(ies), dimension " << system->dimension() << ", "
        << to_string(request.options.backend);
    log::info(kComponent, oss.str());

    active_.emplace(id, job);
    publish_locked(id, JobEvent::status_changed(id, JobState::Queued));

    if (n == 0) {
        transition_locked(*job, JobState::Running);
        finish_locked(*job);
        return handle;
    }

    for (std::size_t i = 0; i < n; ++i) {
        SolveRequest solve;
        solve.job_id = id;
        solve.index = i;
        solve.system = system;
        solve.initial = request.initial_conditions[i];
        solve.span = request.time_span;
        solve.options = request.options;
        pending_.push_back(std::move(solve));
    }
    for (std::size_t i = 0; i < n; ++i) {
        if (!pool_.post([this] { run_next(); })) {
            log::error(kComponent, "Worker pool is shut down; job " + id + " cannot be scheduled");
            cancel_locked(*job);
            break;
        }
    }
    return handle;
}

JobHandle
JobOrchestrator::submit(const std::string &equations,
                        const std::vector<State> &initial_conditions,
                        const TimeSpan &span,
                        const std::optional<SolverOptions> &options) {
    JobRequest request;
    request.equations = equations;
    request.initial_conditions = initial_conditions;
    request.time_span = span;
    request.options = options ? *options : config_.default_options;
    return submit(request);
}

//-----------------------------------------------------------------------------
// Execution
//-----------------------------------------------------------------------------
void
JobOrchestrator::run_next() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (pending_.empty()) { return; }
    SolveRequest request = std::move(pending_.front());
    pending_.pop_front();

    auto it = active_.find(request.job_id);
    if (it == active_.end()) { return; }
    ActiveJobPtr job = it->second;
    if (is_terminal(job->record.state) || job->cancel_requested) { return; }

    if (job->record.state == JobState::Queued) { transition_locked(*job, JobState::Running); }
    ++job->in_flight;
    lock.unlock();

    SolveOutcome solved = run_solve(request);

    lock.lock();
    --job->in_flight;
    on_solve_done_locked(job, request.index, std::move(solved));
}

std::unique_ptr<SolverBackend>
JobOrchestrator::make_solver(BackendKind kind) const {
    std::unique_ptr<SolverBackend> backend = backends_(kind);
    if (!backend) { throw std::runtime_error("backend factory returned nothing for " + to_string(kind)); }
    return backend;
}

JobOrchestrator::SolveOutcome
JobOrchestrator::run_solve(const SolveRequest &request) const {
    const SolverOptions &options = request.options;
    SolveOutcome solved;
    IntegrationOutcome &outcome = solved.integration;
    try {
        auto backend = make_solver(options.backend);
        outcome = backend->integrate(*request.system, request.initial, request.span, options);

        if (outcome.failure && outcome.failure->kind == SolveErrorKind::StepCountExceeded && options.allow_fallback
            && is_explicit_adaptive(options.backend)) {
            std::ostringstream oss;
            oss << "trajectory " << request.index << ": " << backend->name() << " failed ("
                << outcome.failure->message << "); retried with rosenbrock4";
            solved.warnings.push_back(oss.str());
            log::warning(kComponent, "Job " + request.job_id + " " + oss.str());

            outcome = make_solver(BackendKind::Rosenbrock4)
                        ->integrate(*request.system, request.initial, request.span, options);
        }
    } catch (const std::exception &e) {
        // Backends report numerical trouble as values; anything thrown is a resource or internal problem.
        log::error(kComponent, "Job " + request.job_id + ": backend error: " + e.what());
        solved.backend_error = true;
        outcome.trajectory = Trajectory{};
        outcome.failure =
          SolveFailure{ SolveErrorKind::NonFiniteState, request.span.t0, std::string("backend error: ") + e.what() };
    }
    return solved;
}

void
JobOrchestrator::on_solve_done_locked(const ActiveJobPtr &job, std::size_t index, SolveOutcome solved) {
    const std::string id = job->record.id;

    // Failed earlier: results of siblings that were still in flight are dropped.
    if (is_terminal(job->record.state)) {
        retire_if_drained_locked(id);
        return;
    }
    if (job->cancel_requested) {
        if (job->in_flight == 0) { finalize_cancel_locked(*job); }
        return;
    }

    for (auto &w : solved.warnings) { job->record.warnings.push_back(std::move(w)); }
    IntegrationOutcome &outcome = solved.integration;

    if (outcome.failure) {
        std::ostringstream oss;
        oss << "Job " << id << " trajectory " << index << " failed: " << outcome.failure->message;
        log::warning(kComponent, oss.str());

        JobFailure failure;
        failure.trajectory_index = index;
        failure.error = *outcome.failure;
        failure.partial = std::move(outcome.trajectory);
        fail_locked(*job, std::move(failure), solved.backend_error ? kReasonBackendError : kReasonSolveError);
        return;
    }

    job->trajectories[index] = outcome.trajectory;
    ++job->completed;
    job->record.completed_trajectories = job->completed;
    persist_locked(*job);

    const double fraction = static_cast<double>(job->completed) / static_cast<double>(job->trajectories.size());
    publish_locked(id,
                   JobEvent::trajectory_completed(
                     id, index, std::make_shared<const Trajectory>(std::move(outcome.trajectory)), fraction));

    if (job->completed == job->trajectories.size()) { finish_locked(*job); }
}

//-----------------------------------------------------------------------------
// Transitions
//-----------------------------------------------------------------------------
void
JobOrchestrator::transition_locked(ActiveJob &job, JobState state) {
    job.record.state = state;
    persist_locked(job);
    publish_locked(job.record.id, JobEvent::status_changed(job.record.id, state));
    log::info(kComponent, "Job " + job.record.id + " -> " + to_string(state));
}

JobResult
JobOrchestrator::make_result(const ActiveJob &job, JobState state) const {
    JobResult result;
    result.state = state;
    result.reason = job.record.reason;
    result.state_variables = job.system->state_variables();
    result.times = job.grid;
    result.warnings = job.record.warnings;
    result.failure = job.record.failure;
    if (state == JobState::Finished) {
        for (const auto &traj : job.trajectories) { result.trajectories.push_back(traj ? *traj : Trajectory{}); }
    }
    return result;
}

void
JobOrchestrator::fail_locked(ActiveJob &job, JobFailure failure, const std::string &reason) {
    const std::string id = job.record.id;
    purge_pending_locked(id);

    job.record.reason = reason;
    job.record.failure = failure;
    job.record.finished_at = utc_timestamp();
    job.record.result = make_result(job, JobState::Failed);
    transition_locked(job, JobState::Failed);
    publish_locked(id, JobEvent::job_failed(id, std::move(failure)));

    terminal_cv_.notify_all();
    retire_if_drained_locked(id);
}

void
JobOrchestrator::finish_locked(ActiveJob &job) {
    const std::string id = job.record.id;
    job.record.reason = kReasonCompleted;
    job.record.finished_at = utc_timestamp();
    job.record.result = make_result(job, JobState::Finished);
    auto result = std::make_shared<const JobResult>(*job.record.result);
    transition_locked(job, JobState::Finished);
    publish_locked(id, JobEvent::job_finished(id, std::move(result)));

    terminal_cv_.notify_all();
    retire_if_drained_locked(id);
}

void
JobOrchestrator::finalize_cancel_locked(ActiveJob &job) {
    const std::string id = job.record.id;
    job.record.reason = kReasonCancelled;
    job.record.finished_at = utc_timestamp();
    job.record.result = make_result(job, JobState::Cancelled);
    transition_locked(job, JobState::Cancelled);

    terminal_cv_.notify_all();
    retire_if_drained_locked(id);
}

bool
JobOrchestrator::cancel_locked(ActiveJob &job) {
    if (is_terminal(job.record.state) || job.cancel_requested) { return false; }
    job.cancel_requested = true;
    purge_pending_locked(job.record.id);
    // Running jobs with solves in flight become cancelled when the last one returns.
    if (job.in_flight == 0) { finalize_cancel_locked(job); }
    return true;
}

void
JobOrchestrator::persist_locked(ActiveJob &job) {
    try {
        store_->save(job.record.id, job.record);
    } catch (const StoreError &e) {
        const std::string warning = std::string("record could not be saved: ") + e.what();
        log::warning(kComponent, "Job " + job.record.id + " " + warning);
        if (std::find(job.record.warnings.begin(), job.record.warnings.end(), warning) == job.record.warnings.end()) {
            job.record.warnings.push_back(warning);
        }
    }
}

void
JobOrchestrator::publish_locked(const std::string &id, JobEvent event) {
    channel_->publish(id, std::move(event));
}

void
JobOrchestrator::purge_pending_locked(const std::string &id) {
    pending_.erase(std::remove_if(pending_.begin(),
                                  pending_.end(),
                                  [&id](const SolveRequest &request) { return request.job_id == id; }),
                   pending_.end());
}

void
JobOrchestrator::retire_if_drained_locked(const std::string &id) {
    auto it = active_.find(id);
    if (it != active_.end() && is_terminal(it->second->record.state) && it->second->in_flight == 0) {
        active_.erase(it);
    }
}

//-----------------------------------------------------------------------------
// Queries
//-----------------------------------------------------------------------------
bool
JobOrchestrator::cancel(const std::string &id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(id);
    if (it == active_.end()) {
        load_record(id); // throws JobNotFoundError for unknown ids
        return false;
    }
    ActiveJobPtr job = it->second;
    const bool cancelled = cancel_locked(*job);
    if (cancelled) { log::info(kComponent, "Job " + id + " cancel requested"); }
    return cancelled;
}

JobRecord
JobOrchestrator::load_record(const std::string &id) const {
    auto record = store_->load(id);
    if (!record) { throw JobNotFoundError(id); }
    return *record;
}

JobState
JobOrchestrator::get_status(const std::string &id) const {
    return load_record(id).state;
}

JobResult
JobOrchestrator::get_result(const std::string &id) const {
    JobRecord record = load_record(id);
    if (!is_terminal(record.state) || !record.result) { throw JobNotReadyError(id, to_string(record.state)); }
    return *record.result;
}

JobRecord
JobOrchestrator::get_record(const std::string &id) const {
    return load_record(id);
}

bool
JobOrchestrator::wait(const std::string &id, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    auto done = [this, &id] {
        auto it = active_.find(id);
        return it == active_.end() || is_terminal(it->second->record.state);
    };
    if (active_.count(id) == 0) { return is_terminal(load_record(id).state); }
    terminal_cv_.wait_for(lock, timeout, done);
    return done();
}

Subscription
JobOrchestrator::subscribe(const std::string &id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(id);
    if (it != active_.end() && !is_terminal(it->second->record.state)) { return channel_->subscribe(id); }
    // Terminal or retired: its stream is over. Throws JobNotFoundError for unknown ids.
    load_record(id);
    return Subscription::already_ended(id);
}

std::size_t
JobOrchestrator::pending_requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::size_t
JobOrchestrator::active_jobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

} // namespace eqpp

#ifndef EQPP_NOTIFICATION_CHANNEL_HPP
#define EQPP_NOTIFICATION_CHANNEL_HPP

#include "eqpp/job.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace eqpp {

enum class EventKind { StatusChanged, TrajectoryCompleted, JobFailed, JobFinished };

std::string
to_string(EventKind kind);

struct JobEvent {
    EventKind kind = EventKind::StatusChanged;
    std::string job_id;
    std::uint64_t sequence = 0; // assigned by the channel, per job, starting at 1
    JobState state = JobState::Queued;

    // TrajectoryCompleted
    std::size_t trajectory_index = 0;
    std::shared_ptr<const Trajectory> trajectory;
    double fraction_complete = 0.0;

    // JobFailed
    std::optional<JobFailure> failure;

    // JobFinished
    std::shared_ptr<const JobResult> result;

    static JobEvent status_changed(const std::string &job_id, JobState state);
    static JobEvent trajectory_completed(const std::string &job_id,
                                         std::size_t index,
                                         std::shared_ptr<const Trajectory> trajectory,
                                         double fraction_complete);
    static JobEvent job_failed(const std::string &job_id, JobFailure failure);
    static JobEvent job_finished(const std::string &job_id, std::shared_ptr<const JobResult> result);
};

// True for the last event a job ever publishes.
bool
ends_stream(const JobEvent &event);

class NotificationChannel;

/**
 * @brief Finite, blocking sequence of one job's events.
 *
 * Events arrive in publication order, each at most once. The sequence ends
 * after the terminal event or after close(). Destroying the subscription
 * closes it.
 */
class Subscription {
  public:
    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;
    Subscription(Subscription &&) noexcept = default;
    Subscription &operator=(Subscription &&) noexcept = default;
    ~Subscription();

    // A subscription that has already ended, for jobs whose stream is over.
    static Subscription already_ended(std::string job_id);

    const std::string &job_id() const { return job_id_; }

    // Blocks until an event arrives; std::nullopt once the sequence has ended.
    std::optional<JobEvent> next();

    // As next() but gives up after `timeout`; check ended() to tell the two apart.
    std::optional<JobEvent> next_for(std::chrono::milliseconds timeout);

    std::optional<JobEvent> try_next();

    void close();

    // No further event will ever be returned.
    bool ended() const;

  private:
    friend class NotificationChannel;

    struct Queue {
        mutable std::mutex mutex;
        std::condition_variable cv;
        std::deque<JobEvent> events;
        bool finished = false; // terminal event queued
        bool closed = false;
    };

    Subscription(std::string job_id, std::shared_ptr<Queue> queue)
      : job_id_(std::move(job_id))
      , queue_(std::move(queue)) {}

    static std::optional<JobEvent> pop_locked(Queue &queue);

    std::string job_id_;
    std::shared_ptr<Queue> queue_;
};

/**
 * @brief Per-job publish/subscribe fan-out. No replay: a subscriber sees only
 * events published after it subscribed. Subscribing to a job whose stream has
 * ended returns an ended subscription as long as the job is among the last
 * `ended_history` streams to end; older ones are forgotten.
 */
class NotificationChannel {
  public:
    explicit NotificationChannel(std::size_t ended_history = 1024)
      : ended_history_(ended_history) {}

    // Assigns the per-job sequence number and delivers to current subscribers.
    void publish(const std::string &job_id, JobEvent event);

    Subscription subscribe(const std::string &job_id);

    std::size_t subscriber_count(const std::string &job_id) const;

    bool stream_ended(const std::string &job_id) const;

  private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<std::weak_ptr<Subscription::Queue>>> subscribers_;
    std::map<std::string, std::uint64_t> sequences_;
    std::size_t ended_history_;
    std::set<std::string> ended_;
    std::deque<std::string> ended_order_;
};

} // namespace eqpp

#endif // EQPP_NOTIFICATION_CHANNEL_HPP

#include "eqpp/notification_channel.hpp"

#include <algorithm>
#include <utility>

namespace eqpp {

std::string
to_string(EventKind kind) {
    switch (kind) {
        case EventKind::StatusChanged:
            return "status";
        case EventKind::TrajectoryCompleted:
            return "trajectory";
        case EventKind::JobFailed:
            return "failed";
        case EventKind::JobFinished:
            return "finished";
    }
    return "unknown";
}

JobEvent
JobEvent::status_changed(const std::string &job_id, JobState state) {
    JobEvent event;
    event.kind = EventKind::StatusChanged;
    event.job_id = job_id;
    event.state = state;
    return event;
}

JobEvent
JobEvent::trajectory_completed(const std::string &job_id,
                               std::size_t index,
                               std::shared_ptr<const Trajectory> trajectory,
                               double fraction_complete) {
    JobEvent event;
    event.kind = EventKind::TrajectoryCompleted;
    event.job_id = job_id;
    event.state = JobState::Running;
    event.trajectory_index = index;
    event.trajectory = std::move(trajectory);
    event.fraction_complete = fraction_complete;
    return event;
}

JobEvent
JobEvent::job_failed(const std::string &job_id, JobFailure failure) {
    JobEvent event;
    event.kind = EventKind::JobFailed;
    event.job_id = job_id;
    event.state = JobState::Failed;
    event.trajectory_index = failure.trajectory_index;
    event.failure = std::move(failure);
    return event;
}

JobEvent
JobEvent::job_finished(const std::string &job_id, std::shared_ptr<const JobResult> result) {
    JobEvent event;
    event.kind = EventKind::JobFinished;
    event.job_id = job_id;
    event.state = JobState::Finished;
    event.result = std::move(result);
    return event;
}

bool
ends_stream(const JobEvent &event) {
    return event.kind == EventKind::JobFinished || event.kind == EventKind::JobFailed
           || (event.kind == EventKind::StatusChanged && event.state == JobState::Cancelled);
}

//-----------------------------------------------------------------------------
// Subscription
//-----------------------------------------------------------------------------
Subscription::~Subscription() {
    close();
}

std::optional<JobEvent>
Subscription::pop_locked(Queue &queue) {
    if (queue.closed || queue.events.empty()) { return std::nullopt; }
    JobEvent event = std::move(queue.events.front());
    queue.events.pop_front();
    return event;
}

std::optional<JobEvent>
Subscription::next() {
    if (!queue_) { return std::nullopt; }
    std::unique_lock<std::mutex> lock(queue_->mutex);
    queue_->cv.wait(lock, [this] { return queue_->closed || queue_->finished || !queue_->events.empty(); });
    return pop_locked(*queue_);
}

std::optional<JobEvent>
Subscription::next_for(std::chrono::milliseconds timeout) {
    if (!queue_) { return std::nullopt; }
    std::unique_lock<std::mutex> lock(queue_->mutex);
    queue_->cv.wait_for(
      lock, timeout, [this] { return queue_->closed || queue_->finished || !queue_->events.empty(); });
    return pop_locked(*queue_);
}

std::optional<JobEvent>
Subscription::try_next() {
    if (!queue_) { return std::nullopt; }
    std::lock_guard<std::mutex> lock(queue_->mutex);
    return pop_locked(*queue_);
}

void
Subscription::close() {
    if (!queue_) { return; }
    {
        std::lock_guard<std::mutex> lock(queue_->mutex);
        queue_->closed = true;
        queue_->events.clear();
    }
    queue_->cv.notify_all();
}

bool
Subscription::ended() const {
    if (!queue_) { return true; }
    std::lock_guard<std::mutex> lock(queue_->mutex);
    return queue_->closed || (queue_->finished && queue_->events.empty());
}

Subscription
Subscription::already_ended(std::string job_id) {
    auto queue = std::make_shared<Queue>();
    queue->finished = true;
    return Subscription(std::move(job_id), std::move(queue));
}

//-----------------------------------------------------------------------------
// NotificationChannel
//-----------------------------------------------------------------------------
void
NotificationChannel::publish(const std::string &job_id, JobEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ended_.count(job_id) != 0) { return; }

    event.job_id = job_id;
    event.sequence = ++sequences_[job_id];
    const bool terminal = ends_stream(event);

    auto it = subscribers_.find(job_id);
    if (it != subscribers_.end()) {
        for (const auto &weak : it->second) {
            auto queue = weak.lock();
            if (!queue) { continue; }
            {
                std::lock_guard<std::mutex> qlock(queue->mutex);
                if (queue->closed) { continue; }
                queue->events.push_back(event);
                if (terminal) { queue->finished = true; }
            }
            queue->cv.notify_all();
        }
        // Drop subscribers that went away.
        auto &subs = it->second;
        subs.erase(std::remove_if(subs.begin(), subs.end(), [](const auto &w) { return w.expired(); }), subs.end());
    }

    if (terminal) {
        subscribers_.erase(job_id);
        sequences_.erase(job_id);
        ended_.insert(job_id);
        ended_order_.push_back(job_id);
        while (ended_order_.size() > ended_history_) {
            ended_.erase(ended_order_.front());
            ended_order_.pop_front();
        }
    }
}

Subscription
NotificationChannel::subscribe(const std::string &job_id) {
    auto queue = std::make_shared<Subscription::Queue>();
    std::lock_guard<std::mutex> lock(mutex_);
    if (ended_.count(job_id) != 0) {
        queue->finished = true;
    } else {
        subscribers_[job_id].push_back(queue);
    }
    return Subscription(job_id, std::move(queue));
}

std::size_t
NotificationChannel::subscriber_count(const std::string &job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(job_id);
    if (it == subscribers_.end()) { return 0; }
    return static_cast<std::size_t>(
      std::count_if(it->second.begin(), it->second.end(), [](const auto &w) { return !w.expired(); }));
}

bool
NotificationChannel::stream_ended(const std::string &job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ended_.count(job_id) != 0;
}

} // namespace eqpp

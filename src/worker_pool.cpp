#include "eqpp/worker_pool.hpp"

#include "eqpp/log.hpp"

#include <exception>
#include <string>
#include <utility>

namespace eqpp {

WorkerPool::WorkerPool(std::size_t num_threads) {
    if (num_threads == 0) { num_threads = 1; }
    threads_.reserve(num_threads);
    for (std::size_t i = 0; i < num_threads; ++i) { threads_.emplace_back([this] { worker_loop(); }); }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool
WorkerPool::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (should_terminate_) { return false; }
        tasks_.push(std::move(task));
    }
    cv_task_.notify_one();
    return true;
}

void
WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (should_terminate_ && threads_.empty()) { return; }
        should_terminate_ = true;
    }
    cv_task_.notify_all();
    for (auto &thread : threads_) {
        if (thread.joinable()) { thread.join(); }
    }
    threads_.clear();
}

void
WorkerPool::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_idle_.wait(lock, [this] { return tasks_.empty() && busy_ == 0; });
}

void
WorkerPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_task_.wait(lock, [this] { return should_terminate_ || !tasks_.empty(); });
            if (tasks_.empty()) { return; } // terminating and drained
            task = std::move(tasks_.front());
            tasks_.pop();
            ++busy_;
        }

        try {
            task();
        } catch (const std::exception &e) {
            log::error("WorkerPool", std::string("task threw: ") + e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --busy_;
            if (tasks_.empty() && busy_ == 0) { cv_idle_.notify_all(); }
        }
    }
}

} // namespace eqpp

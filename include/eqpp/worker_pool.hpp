#ifndef EQPP_WORKER_POOL_HPP
#define EQPP_WORKER_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace eqpp {

/**
 * @brief Fixed set of worker threads draining a FIFO of tasks.
 *
 * The pool size is the system-wide bound on concurrently running solves.
 * shutdown() (also run by the destructor) lets queued tasks finish, then joins.
 */
class WorkerPool {
  public:
    explicit WorkerPool(std::size_t num_threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    // Returns false if the pool is shutting down and the task was not queued.
    bool post(std::function<void()> task);

    void shutdown();

    // Blocks until no task is queued or running.
    void wait_idle();

    std::size_t size() const { return threads_.size(); }

  private:
    void worker_loop();

    std::vector<std::thread> threads_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_task_;
    std::condition_variable cv_idle_;
    std::size_t busy_ = 0;
    bool should_terminate_ = false;
};

} // namespace eqpp

#endif // EQPP_WORKER_POOL_HPP

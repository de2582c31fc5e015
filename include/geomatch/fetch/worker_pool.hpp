#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace geomatch::fetch {

/// Fixed-size pool of worker threads pulling tasks from one FIFO queue.
///
/// Tasks must not throw. wait_idle() is the join barrier: it returns once
/// every submitted task has finished. The destructor drains the queue before
/// joining the workers.
class WorkerPool {
   public:
    explicit WorkerPool(std::size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    auto operator=(const WorkerPool&) -> WorkerPool& = delete;
    WorkerPool(WorkerPool&&) = delete;
    auto operator=(WorkerPool&&) -> WorkerPool& = delete;

    void submit(std::function<void()> task);

    /// Block until no task is queued or running.
    void wait_idle();

    /// Like wait_idle() but gives up after `timeout`; returns true when idle.
    [[nodiscard]] auto wait_idle_for(std::chrono::milliseconds timeout) -> bool;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return workers_.size(); }

   private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::size_t pending_ = 0;
    bool stopping_ = false;
};

}  // namespace geomatch::fetch

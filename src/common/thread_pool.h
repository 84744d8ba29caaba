#pragma once

/// @file thread_pool.h
/// @brief Fixed worker pool that runs analysis jobs in the background

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <absl/status/status.h>

namespace runlens {

/// @brief FIFO task queue drained by a fixed set of worker threads
///
/// Tasks queued before Shutdown() still run. Exceptions escaping a task are
/// logged and do not stop the worker.
class ThreadPool {
public:
    using Task = std::function<void()>;

    /// @param num_threads Worker count, 0 picks the hardware concurrency
    /// @param name Pool name used in log messages
    explicit ThreadPool(size_t num_threads = 0, std::string name = "workers");

    /// @brief Calls Shutdown()
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// @brief Queue @p task
    /// @return Unavailable once the pool is shut down
    absl::Status Execute(Task task);

    /// @brief Block until the queue is empty and no task is running
    void Wait();

    /// @brief Stop accepting tasks, drain the queue and join the workers
    void Shutdown();

    size_t Size() const { return workers_.size(); }

    /// @brief Queued plus running tasks
    size_t PendingTasks() const;

    const std::string& Name() const { return name_; }

private:
    void WorkerLoop();

    std::string name_;
    std::vector<std::thread> workers_;

    mutable std::mutex mutex_;
    std::condition_variable work_available_;
    std::condition_variable idle_;
    std::deque<Task> queue_;
    size_t running_ = 0;
    bool stopping_ = false;
};

}  // namespace runlens

#include "thread_pool.h"

#include <algorithm>
#include <exception>

#include <absl/strings/str_cat.h>

#include "logging.h"

namespace runlens {

ThreadPool::ThreadPool(size_t num_threads, std::string name) : name_(std::move(name)) {
    if (num_threads == 0) {
        num_threads = std::max(1u, std::thread::hardware_concurrency());
    }
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&ThreadPool::WorkerLoop, this);
    }
    RUNLENS_LOG_DEBUG("Pool '{}' started {} workers", name_, num_threads);
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

absl::Status ThreadPool::Execute(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return absl::UnavailableError(absl::StrCat("Pool '", name_, "' is shut down"));
        }
        queue_.push_back(std::move(task));
    }
    work_available_.notify_one();
    return absl::OkStatus();
}

void ThreadPool::Wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return queue_.empty() && running_ == 0; });
}

void ThreadPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    work_available_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t ThreadPool::PendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size() + running_;
}

void ThreadPool::WorkerLoop() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_available_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;  // stopping and drained
            }
            task = std::move(queue_.front());
            queue_.pop_front();
            ++running_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            RUNLENS_LOG_ERROR("Task in pool '{}' threw: {}", name_, e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --running_;
        }
        idle_.notify_all();
    }
}

}  // namespace runlens

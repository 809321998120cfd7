/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 */

#include "executor/thread_pool.hpp"

namespace sandbox_orchestrator {

ThreadPool::ThreadPool(size_t num_threads, std::string name)
    : name_(std::move(name)) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard lock(queue_mutex_);
        if (!accepting_ && workers_.empty()) return;
        accepting_ = false;
    }
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
    std::lock_guard lock(queue_mutex_);
    workers_.clear();
}

bool ThreadPool::enqueue(std::function<void(std::stop_token)> task) {
    {
        std::lock_guard lock(queue_mutex_);
        if (!accepting_) return false;
        task_queue_.push(std::move(task));
    }
    queue_cv_.notify_one();
    return true;
}

void ThreadPool::worker_loop(std::stop_token stop) {
    while (true) {
        std::function<void(std::stop_token)> task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !task_queue_.empty(); });

            // Drain before exiting so no promise is left unsatisfied
            if (task_queue_.empty()) {
                if (stop.stop_requested()) return;
                continue;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        ++active_tasks_;
        task(stop);
        --active_tasks_;
    }
}

size_t ThreadPool::active_count() const noexcept {
    return active_tasks_.load();
}

size_t ThreadPool::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return task_queue_.size();
}

size_t ThreadPool::thread_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return workers_.size();
}

}  // namespace sandbox_orchestrator

/**
 * @file bounded_queue.hpp
 * @brief Bounded, closable, thread-safe FIFO.
 *
 * Backs the container pool's idle queue and the per-execution event
 * channels. Waiting pops take a deadline and a stop_token so callers can
 * be cancelled cooperatively.
 */

#pragma once

#include "core/types.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>
#include <vector>

namespace sandbox_orchestrator {

template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /// Push without blocking. `value` is moved from only when this returns true.
    bool try_push(T&& value) {
        {
            std::lock_guard lock(mutex_);
            if (closed_ || items_.size() >= capacity_) return false;
            items_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    [[nodiscard]] std::optional<T> try_pop() {
        std::lock_guard lock(mutex_);
        return pop_locked();
    }

    /**
     * @brief Wait for an item until `deadline`.
     *
     * Returns nullopt on deadline, stop request, or when the queue is
     * closed and drained.
     */
    [[nodiscard]] std::optional<T> pop_until(SteadyTime deadline,
                                             std::stop_token stop = {}) {
        std::unique_lock lock(mutex_);
        cv_.wait_until(lock, stop, deadline, [this] {
            return !items_.empty() || closed_;
        });
        return pop_locked();
    }

    template <typename Rep, typename Period>
    [[nodiscard]] std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout,
                                           std::stop_token stop = {}) {
        return pop_until(std::chrono::steady_clock::now()
                             + std::chrono::duration_cast<std::chrono::steady_clock::duration>(timeout),
                         std::move(stop));
    }

    /// Reject further pushes and wake every waiter. Queued items stay poppable.
    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    /// Remove and return everything currently queued.
    [[nodiscard]] std::vector<T> drain() {
        std::lock_guard lock(mutex_);
        std::vector<T> out;
        out.reserve(items_.size());
        while (!items_.empty()) {
            out.push_back(std::move(items_.front()));
            items_.pop_front();
        }
        return out;
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

private:
    std::optional<T> pop_locked() {
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    const size_t capacity_;
    std::deque<T> items_;
    bool closed_{false};
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
};

}  // namespace sandbox_orchestrator

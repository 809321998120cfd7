/**
 * @file container_pool.hpp
 * @brief Bounded pool of pre-warmed sandbox containers.
 *
 * Hides container start-up latency by keeping `capacity` started
 * containers idle. Handles move between owners only through acquire()
 * and release(); a handle the pool considers dead or dirty is destroyed,
 * never handed out again.
 *
 * Per handle:  Creating → Idle ⇄ InUse → Cleaning → Idle | Destroyed
 */

#pragma once

#include "core/bounded_queue.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/thread_pool.hpp"
#include "pool/container_handle.hpp"
#include "sandbox/runtime.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>

namespace sandbox_orchestrator {

class ContainerPool {
public:
    /**
     * @param runtime       Engine every container call goes through
     * @param config        Capacity, retry and cleanup policy
     * @param base_spec     Template for created containers; the name is
     *                      replaced by a unique one per container
     * @param logger        Shared logger
     * @param engine_threads Workers for background creation
     */
    ContainerPool(std::shared_ptr<ISandboxRuntime> runtime,
                  PoolConfig config,
                  ContainerSpec base_spec,
                  Logger& logger,
                  size_t engine_threads = 2);
    ~ContainerPool();

    ContainerPool(const ContainerPool&) = delete;
    ContainerPool& operator=(const ContainerPool&) = delete;

    /// Start creating containers until the pool holds `capacity`. Returns immediately.
    void warm_up();

    /// Block until no creation is in flight. False on timeout.
    bool wait_until_ready(std::chrono::milliseconds timeout);

    /**
     * @brief Check out a live container.
     *
     * Waits up to `timeout` for an idle pooled container, then falls back
     * to an ephemeral one. Fails only when the stop token fires
     * (ErrorKind::Cancelled), the pool is shut down, or the ephemeral
     * container cannot be created.
     */
    Result<Acquired> acquire(std::chrono::milliseconds timeout, std::stop_token stop = {});

    /**
     * @brief Return a container.
     *
     * Scrubs it and puts it back, or destroys it. Releasing a handle that
     * is not checked out is a no-op.
     */
    void release(const Acquired& acquired, ReleaseMode mode = ReleaseMode::Normal);

    [[nodiscard]] PoolStats get_stats() const;

    /// Remove idle containers and refuse further acquires. Idempotent.
    void shutdown();

    [[nodiscard]] size_t capacity() const noexcept { return config_.capacity; }

private:
    struct Entry {
        ContainerState state;
        bool ephemeral;
    };

    /// create + start with bounded retries.
    Result<ContainerHandle> create_container(bool ephemeral);
    /// Queue one background creation unless the pool is full or closing.
    bool spawn_creation();
    bool is_alive(const ContainerId& id);
    bool scrub(const ContainerHandle& handle);

    /// Remove from the engine and the registry. Replenishes if asked.
    void destroy(const ContainerHandle& handle, bool was_pooled, bool replenish);

    std::string next_name();

    std::shared_ptr<ISandboxRuntime> runtime_;
    PoolConfig config_;
    ContainerSpec base_spec_;
    Logger& logger_;
    std::string name_tag_;

    BoundedQueue<ContainerHandle> idle_;

    mutable std::mutex mutex_;
    std::condition_variable creations_cv_;
    std::unordered_map<ContainerId, Entry> registry_;
    size_t pooled_count_{0};          ///< Pooled handles alive, any state but Creating
    size_t creating_{0};              ///< Pooled creations in flight
    bool shutting_down_{false};

    std::atomic<uint64_t> name_seq_{0};
    std::atomic<uint64_t> total_acquired_{0};
    std::atomic<uint64_t> total_released_{0};
    std::atomic<uint64_t> total_destroyed_{0};
    std::atomic<uint64_t> total_ephemeral_{0};

    // Last member: joined first, while everything its tasks touch is alive
    ThreadPool engine_pool_;
};

/**
 * @brief Scoped owner of an acquired container.
 *
 * Releases on destruction unless released explicitly, so every exit
 * path of an execution gives the container back exactly once.
 */
class ContainerLease {
public:
    ContainerLease(ContainerPool& pool, Acquired acquired);
    ~ContainerLease();

    ContainerLease(ContainerLease&& other) noexcept;
    ContainerLease& operator=(ContainerLease&&) = delete;
    ContainerLease(const ContainerLease&) = delete;
    ContainerLease& operator=(const ContainerLease&) = delete;

    /// Release as Tainted instead of Normal.
    void taint() noexcept { mode_ = ReleaseMode::Tainted; }
    [[nodiscard]] bool tainted() const noexcept { return mode_ == ReleaseMode::Tainted; }

    void release();

    [[nodiscard]] const ContainerHandle& handle() const noexcept { return handle_of(acquired_); }
    [[nodiscard]] const ContainerId& id() const noexcept { return handle().id; }
    [[nodiscard]] bool ephemeral() const noexcept { return is_ephemeral(acquired_); }

private:
    ContainerPool* pool_;
    Acquired acquired_;
    ReleaseMode mode_{ReleaseMode::Normal};
};

}  // namespace sandbox_orchestrator

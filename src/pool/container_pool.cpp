/**
 * @file container_pool.cpp
 * @brief ContainerPool and ContainerLease implementation.
 */

#include "pool/container_pool.hpp"

#include <algorithm>
#include <cstdio>
#include <random>
#include <thread>
#include <utility>

namespace sandbox_orchestrator {

namespace {

constexpr std::string_view kComponent = "pool";
constexpr size_t kMaxCleanupDiagnostics = 512;

std::string random_tag() {
    std::random_device rd;
    std::uniform_int_distribution<uint32_t> dist(0, 0xffffff);
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%06x", dist(rd));
    return buf;
}

}  // anonymous namespace

ContainerPool::ContainerPool(std::shared_ptr<ISandboxRuntime> runtime,
                             PoolConfig config,
                             ContainerSpec base_spec,
                             Logger& logger,
                             size_t engine_threads)
    : runtime_(std::move(runtime))
    , config_(std::move(config))
    , base_spec_(std::move(base_spec))
    , logger_(logger)
    , name_tag_(random_tag())
    , idle_(config_.capacity)
    , engine_pool_(std::max<size_t>(1, engine_threads), "engine") {
    if (base_spec_.name.empty()) {
        base_spec_.name = "sandbox";
    }
}

ContainerPool::~ContainerPool() {
    shutdown();
    engine_pool_.shutdown();
}

std::string ContainerPool::next_name() {
    return base_spec_.name + "_" + name_tag_ + "_" + std::to_string(++name_seq_);
}

// ─────────────────────────────────────────────
// Creation
// ─────────────────────────────────────────────

Result<ContainerHandle> ContainerPool::create_container(bool ephemeral) {
    const uint32_t attempts = config_.create_retries + 1;
    std::string last_error;

    for (uint32_t attempt = 1; attempt <= attempts; ++attempt) {
        if (attempt > 1) {
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.retry_backoff_ms));
        }

        ContainerSpec spec = base_spec_;
        spec.name = next_name();
        spec.labels["sandbox_orchestrator.role"] = ephemeral ? "ephemeral" : "pooled";

        auto id = runtime_->create(spec);
        if (!id) {
            last_error = id.error().message;
            logger_.log(LogLevel::Warn, kComponent,
                        "Create attempt " + std::to_string(attempt) + "/"
                        + std::to_string(attempts) + " failed: " + last_error);
            continue;
        }

        auto started = runtime_->start(*id);
        if (!started) {
            last_error = started.error().message;
            logger_.log(LogLevel::Warn, kComponent,
                        "Start of " + *id + " failed (attempt " + std::to_string(attempt)
                        + "): " + last_error);
            if (auto removed = runtime_->remove(*id); !removed) {
                logger_.log(LogLevel::Warn, kComponent,
                            "Could not remove unstarted container " + *id + ": "
                            + removed.error().message);
            }
            continue;
        }

        logger_.log(LogLevel::Debug, kComponent,
                    "Created " + std::string(ephemeral ? "ephemeral" : "pooled")
                    + " container " + spec.name + " (" + *id + ")");
        return ContainerHandle{
            .id = *id,
            .name = spec.name,
            .state = ContainerState::Idle,
            .last_borrowed = {},
            .ephemeral = ephemeral
        };
    }

    return Error{"Container creation failed after " + std::to_string(attempts)
                 + " attempts: " + last_error};
}

bool ContainerPool::spawn_creation() {
    {
        std::lock_guard lock(mutex_);
        if (shutting_down_ || pooled_count_ + creating_ >= config_.capacity) {
            return false;
        }
        ++creating_;
    }

    engine_pool_.submit([this] {
        auto created = create_container(false);
        bool queued = false;

        if (created) {
            std::lock_guard lock(mutex_);
            if (!shutting_down_) {
                ContainerHandle copy = *created;
                queued = idle_.try_push(std::move(copy));
                if (queued) {
                    registry_[created->id] = Entry{ContainerState::Idle, false};
                    ++pooled_count_;
                }
            }
        } else {
            logger_.log(LogLevel::Error, kComponent,
                        "Pool running below capacity: " + created.error().message);
        }

        if (created && !queued) {
            if (auto removed = runtime_->remove(created->id); !removed) {
                logger_.log(LogLevel::Warn, kComponent,
                            "Could not remove surplus container " + created->id + ": "
                            + removed.error().message);
            }
        }

        {
            std::lock_guard lock(mutex_);
            --creating_;
        }
        creations_cv_.notify_all();
    });
    return true;
}

void ContainerPool::warm_up() {
    size_t spawned = 0;
    while (spawn_creation()) {
        ++spawned;
    }
    logger_.log(LogLevel::Info, kComponent,
                "Warming up " + std::to_string(spawned) + " container(s), capacity "
                + std::to_string(config_.capacity));
}

bool ContainerPool::wait_until_ready(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    bool ready = creations_cv_.wait_for(lock, timeout, [this] { return creating_ == 0; });
    if (ready) {
        logger_.log(LogLevel::Info, kComponent,
                    "Pool ready: " + std::to_string(idle_.size()) + "/"
                    + std::to_string(config_.capacity) + " idle");
    }
    return ready;
}

// ─────────────────────────────────────────────
// Acquire / Release
// ─────────────────────────────────────────────

bool ContainerPool::is_alive(const ContainerId& id) {
    auto status = runtime_->inspect(id);
    if (!status) {
        logger_.log(LogLevel::Debug, kComponent,
                    "Liveness check of " + id + " failed: " + status.error().message);
        return false;
    }
    return status->running;
}

Result<Acquired> ContainerPool::acquire(std::chrono::milliseconds timeout, std::stop_token stop) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        if (stop.stop_requested()) {
            return Error{"Container acquisition cancelled", ErrorKind::Cancelled};
        }
        {
            std::lock_guard lock(mutex_);
            if (shutting_down_) {
                return Error{"Container pool is shut down"};
            }
            // Nothing could ever arrive in the idle queue
            if (pooled_count_ == 0 && creating_ == 0) break;
        }

        auto candidate = idle_.pop_until(deadline, stop);
        if (!candidate) {
            if (stop.stop_requested()) {
                return Error{"Container acquisition cancelled", ErrorKind::Cancelled};
            }
            if (std::chrono::steady_clock::now() >= deadline) break;
            continue;
        }

        if (!is_alive(candidate->id)) {
            logger_.log(LogLevel::Debug, kComponent,
                        "Discarding dead container " + candidate->id);
            destroy(*candidate, true, true);
            continue;
        }

        candidate->state = ContainerState::InUse;
        candidate->last_borrowed = std::chrono::system_clock::now();
        {
            std::lock_guard lock(mutex_);
            registry_[candidate->id].state = ContainerState::InUse;
        }
        ++total_acquired_;
        return Acquired{Pooled{std::move(*candidate)}};
    }

    logger_.log(LogLevel::Warn, kComponent,
                "Container pool exhausted (capacity " + std::to_string(config_.capacity)
                + "); creating an ephemeral container");

    auto created = create_container(true);
    if (!created) {
        return Error{"Failed to create ephemeral container: " + created.error().message,
                     ErrorKind::Infrastructure};
    }

    created->state = ContainerState::InUse;
    created->last_borrowed = std::chrono::system_clock::now();
    {
        std::lock_guard lock(mutex_);
        registry_[created->id] = Entry{ContainerState::InUse, true};
    }
    ++total_acquired_;
    ++total_ephemeral_;
    return Acquired{Ephemeral{std::move(*created)}};
}

bool ContainerPool::scrub(const ContainerHandle& handle) {
    ExecSpec spec{
        .argv = {"sh", "-c", config_.cleanup_command},
        .workdir = "/",
        .env = {}
    };
    std::string diagnostics;
    auto collect = [&diagnostics](StreamKind, std::string_view chunk) {
        if (diagnostics.size() < kMaxCleanupDiagnostics) {
            diagnostics.append(chunk.substr(0, kMaxCleanupDiagnostics - diagnostics.size()));
        }
    };

    auto outcome = runtime_->exec(
        handle.id, spec, collect,
        std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.cleanup_timeout_ms),
        {});
    if (!outcome) {
        logger_.log(LogLevel::Warn, kComponent,
                    "Cleanup of " + handle.id + " could not run: " + outcome.error().message);
        return false;
    }
    if (outcome->timed_out || outcome->exit_code != 0) {
        logger_.log(LogLevel::Warn, kComponent,
                    "Cleanup of " + handle.id + " failed (exit "
                    + std::to_string(outcome->exit_code) + "): " + diagnostics);
        return false;
    }
    if (!is_alive(handle.id)) {
        logger_.log(LogLevel::Warn, kComponent, "Container " + handle.id + " died during cleanup");
        return false;
    }
    return true;
}

void ContainerPool::release(const Acquired& acquired, ReleaseMode mode) {
    const auto& handle = handle_of(acquired);
    bool ephemeral = false;
    {
        std::lock_guard lock(mutex_);
        auto it = registry_.find(handle.id);
        if (it == registry_.end() || it->second.state != ContainerState::InUse) {
            logger_.log(LogLevel::Debug, kComponent,
                        "Ignoring release of " + handle.id + ": not checked out");
            return;
        }
        it->second.state = ContainerState::Cleaning;
        ephemeral = it->second.ephemeral;
    }
    ++total_released_;

    bool reusable = scrub(handle);
    if (reusable && mode == ReleaseMode::Tainted && !config_.recycle_after_timeout) {
        logger_.log(LogLevel::Debug, kComponent, "Retiring tainted container " + handle.id);
        reusable = false;
    }
    if (!reusable) {
        destroy(handle, !ephemeral, !ephemeral);
        return;
    }

    bool pooled = !ephemeral;
    {
        std::lock_guard lock(mutex_);
        bool accept = !shutting_down_;
        if (accept && ephemeral) {
            accept = pooled_count_ + creating_ < config_.capacity;
            if (accept) {
                ++pooled_count_;
                registry_[handle.id].ephemeral = false;
                pooled = true;
            }
        }
        if (accept) {
            ContainerHandle returned = handle;
            returned.state = ContainerState::Idle;
            returned.ephemeral = false;
            registry_[handle.id].state = ContainerState::Idle;
            if (idle_.try_push(std::move(returned))) {
                if (ephemeral) {
                    logger_.log(LogLevel::Info, kComponent,
                                "Adopted ephemeral container " + handle.id + " into the pool");
                }
                return;
            }
            registry_[handle.id].state = ContainerState::Cleaning;
        }
    }

    // Surplus: the pool is full or closing
    destroy(handle, pooled, false);
}

void ContainerPool::destroy(const ContainerHandle& handle, bool was_pooled, bool replenish) {
    if (auto removed = runtime_->remove(handle.id); !removed) {
        logger_.log(LogLevel::Warn, kComponent,
                    "Failed to remove container " + handle.id + ": " + removed.error().message);
    }
    {
        std::lock_guard lock(mutex_);
        registry_.erase(handle.id);
        if (was_pooled && pooled_count_ > 0) {
            --pooled_count_;
        }
    }
    ++total_destroyed_;

    if (replenish && was_pooled && config_.replenish && spawn_creation()) {
        logger_.log(LogLevel::Debug, kComponent, "Replenishing after destroying " + handle.id);
    }
}

// ─────────────────────────────────────────────
// Observation / Shutdown
// ─────────────────────────────────────────────

PoolStats ContainerPool::get_stats() const {
    PoolStats stats;
    stats.capacity = config_.capacity;
    {
        // One pass under one lock: a handle popped by acquire() stays Idle
        // here until it is marked InUse, so it is never counted twice.
        std::lock_guard lock(mutex_);
        for (const auto& [id, entry] : registry_) {
            if (entry.state == ContainerState::Idle) {
                ++stats.available;
                continue;
            }
            if (entry.ephemeral) {
                ++stats.ephemeral_in_use;
            } else {
                ++stats.in_use;
            }
        }
    }
    stats.total_acquired = total_acquired_.load();
    stats.total_released = total_released_.load();
    stats.total_destroyed = total_destroyed_.load();
    stats.total_ephemeral = total_ephemeral_.load();
    return stats;
}

void ContainerPool::shutdown() {
    {
        std::unique_lock lock(mutex_);
        if (shutting_down_) return;
        shutting_down_ = true;
        creations_cv_.wait(lock, [this] { return creating_ == 0; });
    }
    idle_.close();

    auto idle = idle_.drain();
    for (const auto& handle : idle) {
        destroy(handle, true, false);
    }
    logger_.log(LogLevel::Info, kComponent,
                "Pool shut down, removed " + std::to_string(idle.size()) + " idle container(s)");
}

// ─────────────────────────────────────────────
// ContainerLease
// ─────────────────────────────────────────────

ContainerLease::ContainerLease(ContainerPool& pool, Acquired acquired)
    : pool_(&pool), acquired_(std::move(acquired)) {}

ContainerLease::ContainerLease(ContainerLease&& other) noexcept
    : pool_(std::exchange(other.pool_, nullptr))
    , acquired_(std::move(other.acquired_))
    , mode_(other.mode_) {}

ContainerLease::~ContainerLease() {
    release();
}

void ContainerLease::release() {
    if (auto* pool = std::exchange(pool_, nullptr)) {
        pool->release(acquired_, mode_);
    }
}

}  // namespace sandbox_orchestrator

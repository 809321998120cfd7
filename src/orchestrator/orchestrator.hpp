/**
 * @file orchestrator.hpp
 * @brief Top-level Orchestrator facade — ties all modules together.
 *
 * Provides a single entry point for:
 *   1. Running a script in a pooled sandbox (execute / submit)
 *   2. Observing an execution while it runs (callbacks or channels)
 *   3. Cancelling in-flight executions and inspecting the pool
 *
 * The container engine is injected through ISandboxRuntime, so tests run
 * the full pipeline against FakeRuntime.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "events/event_registry.hpp"
#include "executor/thread_pool.hpp"
#include "orchestrator/execution.hpp"
#include "pool/container_pool.hpp"
#include "sandbox/runtime.hpp"
#include "telemetry/metrics_collector.hpp"
#include "workspace/workspace.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>

namespace sandbox_orchestrator {

/**
 * @brief Build the engine client named by `engine.kind`.
 */
Result<std::shared_ptr<ISandboxRuntime>> make_runtime(const EngineConfig& engine);

/**
 * @brief Container template derived from the engine section.
 */
ContainerSpec container_spec_from(const EngineConfig& engine);

/// Pool section with the cleanup command resolved against the container workspace.
PoolConfig pool_config_from(const Config& config);

class Orchestrator {
public:
    struct Options {
        Config config;
        std::shared_ptr<ISandboxRuntime> runtime;     ///< Null: built from config.engine
        std::unique_ptr<ILogSink> log_sink;           ///< Null: stderr
        LogLevel log_level = LogLevel::Info;
        std::unique_ptr<ILogSink> metrics_sink;       ///< Null: discarded
    };

    explicit Orchestrator(Options opts);
    ~Orchestrator();

    // Non-copyable, non-movable
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // ── Lifecycle ────────────────────────────
    /// Validate configuration and warm up the container pool.
    Result<void> start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ── Execution ────────────────────────────
    /**
     * @brief Run one request to completion on the calling thread.
     *
     * Always returns a terminal status. The workspace, the container and
     * the event registration are released before returning, whatever
     * happened.
     */
    ExecutionResult execute(const ExecutionRequest& request, std::stop_token stop = {});

    /// Run on the execution thread pool.
    std::future<ExecutionResult> submit(ExecutionRequest request);

    /// Request cancellation of an in-flight execution. False if unknown.
    bool cancel(const ExecutionId& id);

    // ── Observation ──────────────────────────
    void register_event_sink(const ExecutionId& id, EventCallback callback);
    std::shared_ptr<EventChannel> open_event_channel(const ExecutionId& id, size_t capacity = 0);
    [[nodiscard]] PoolStats get_pool_stats() const { return pool_.get_stats(); }

    // ── Accessors (for testing) ─────────────
    Logger& logger() { return logger_; }
    const Config& config() const { return config_; }
    MetricsCollector& metrics() { return metrics_; }
    ContainerPool& pool() { return pool_; }
    EventSinkRegistry& events() { return events_; }
    ISandboxRuntime& runtime() { return *runtime_; }

private:
    /// Output as seen by the caller, capped per stream.
    struct OutputCapture {
        size_t limit;
        std::string out;
        std::string err;
        bool truncated = false;

        void append(StreamKind kind, std::string_view chunk);
    };

    void run_steps(const ExecutionRequest& request,
                   std::stop_token stop,
                   ExecutionResult& result,
                   std::optional<Workspace>& workspace,
                   std::optional<ContainerLease>& lease);

    void install_dependencies(const ExecutionRequest& request,
                              ContainerLease& lease,
                              std::stop_token stop);

    void collect_results(const ExecutionRequest& request,
                         const Workspace& workspace,
                         const ContainerLease& lease,
                         ExecutionResult& result);

    void publish_status(const ExecutionId& id, std::string_view status,
                        std::string_view message = {});
    void publish_terminal(const ExecutionResult& result, std::chrono::seconds timeout);
    void log_outcome(const ExecutionResult& result);

    bool track(const ExecutionId& id, std::stop_source source);
    void untrack(const ExecutionId& id);

    [[nodiscard]] std::chrono::seconds timeout_for(const ExecutionRequest& request) const;

    Config config_;
    Logger logger_;
    std::shared_ptr<ISandboxRuntime> runtime_;

    // Telemetry
    MetricsCollector metrics_;
    EventSinkRegistry events_;

    WorkspaceBuilder workspaces_;
    ContainerPool pool_;

    std::mutex inflight_mutex_;
    std::unordered_map<ExecutionId, std::stop_source> inflight_;

    std::atomic<bool> running_{false};

    // Joined first on destruction
    ThreadPool execution_pool_;
};

}  // namespace sandbox_orchestrator

/**
 * @file fake_environment.hpp
 * @brief An Orchestrator wired to FakeRuntime with scratch and script dirs.
 */

#pragma once

#include "orchestrator/orchestrator.hpp"
#include "sandbox/fake_runtime.hpp"
#include "support/test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sandbox_orchestrator::testing {

/// Thread-safe record of the events one execution emitted.
class EventLog {
public:
    EventCallback callback() {
        return [this](const Event& event) {
            {
                std::lock_guard lock(mutex_);
                events_.push_back(event);
            }
            cv_.notify_all();
        };
    }

    [[nodiscard]] std::vector<Event> events() const {
        std::lock_guard lock(mutex_);
        return events_;
    }

    /// Status names in publication order.
    [[nodiscard]] std::vector<std::string> statuses() const {
        std::lock_guard lock(mutex_);
        std::vector<std::string> out;
        for (const auto& e : events_) {
            if (e.type == EventType::Status) out.push_back(e.data["status"].asString());
        }
        return out;
    }

    [[nodiscard]] size_t count(EventType type) const {
        std::lock_guard lock(mutex_);
        size_t n = 0;
        for (const auto& e : events_) {
            if (e.type == type) ++n;
        }
        return n;
    }

    /// Block until an event of `type` arrives. False on timeout.
    bool wait_for(EventType type, std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] {
            for (const auto& e : events_) {
                if (e.type == type) return true;
            }
            return false;
        });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Event> events_;
};

class FakeEnvironment {
public:
    explicit FakeEnvironment(uint32_t capacity = 2) {
        config.engine.kind = "fake";
        config.pool.capacity = capacity;
        config.pool.acquire_timeout_ms = 300;
        config.pool.create_retries = 0;
        config.pool.retry_backoff_ms = 1;
        config.pool.cleanup_timeout_ms = 2000;
        config.executor.engine_threads = 2;
        config.executor.execution_threads = 4;
        config.execution.timeout_s = 30;
        config.execution.dependency_timeout_s = 5;
        config.execution.scratch_root = scratch.path() / "runs";
        config.execution.scripts_root = scripts.path();
    }

    /// Create scripts/<name> on the host so the workspace can stage it.
    void add_script(const std::string& name, FakeProgram program,
                    const std::string& content = "# stand-in\n") {
        write_file(scripts.path() / "scripts" / name, content);
        runtime->register_program(name, std::move(program));
    }

    Orchestrator& start() {
        orchestrator = std::make_unique<Orchestrator>(Orchestrator::Options{
            .config = config,
            .runtime = runtime,
            .log_sink = std::make_unique<CaptureSink>(log_lines),
            .log_level = LogLevel::Debug,
            .metrics_sink = std::make_unique<CaptureSink>(metric_lines)
        });
        auto started = orchestrator->start();
        EXPECT_TRUE(started) << (started ? "" : started.error().message);
        return *orchestrator;
    }

    static ExecutionRequest request(const std::string& id, const std::string& script) {
        ExecutionRequest r;
        r.id = id;
        r.script = "scripts/" + script;
        return r;
    }

    /// Workspaces still on disk.
    [[nodiscard]] size_t leftover_workspaces() const {
        return count_entries(config.execution.scratch_root);
    }

    TempDir scratch{"so_scratch"};
    TempDir scripts{"so_scripts"};
    std::shared_ptr<FakeRuntime> runtime = std::make_shared<FakeRuntime>();
    std::shared_ptr<CapturedLines> log_lines = std::make_shared<CapturedLines>();
    std::shared_ptr<CapturedLines> metric_lines = std::make_shared<CapturedLines>();
    Config config = default_config();
    std::unique_ptr<Orchestrator> orchestrator;
};

}  // namespace sandbox_orchestrator::testing

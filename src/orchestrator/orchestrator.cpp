/**
 * @file orchestrator.cpp
 * @brief Orchestrator implementation: the per-execution pipeline.
 */

#include "orchestrator/orchestrator.hpp"
#include "sandbox/docker_runtime.hpp"
#include "sandbox/fake_runtime.hpp"
#include "telemetry/json_sink.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>

namespace sandbox_orchestrator {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kComponent = "orchestrator";
constexpr size_t kMaxInstallDiagnostics = 2048;
constexpr auto kCancelledMessage = "cancelled";

std::shared_ptr<ISandboxRuntime> resolve_runtime(std::shared_ptr<ISandboxRuntime> runtime,
                                                 const EngineConfig& engine) {
    if (runtime) return runtime;
    auto made = make_runtime(engine);
    if (!made) {
        throw std::invalid_argument(made.error().message);
    }
    return *made;
}

template <typename FallbackSink>
std::unique_ptr<ILogSink> sink_or(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<FallbackSink>();
}

void set_failure(ExecutionResult& result, ExecutionStatus status, std::string message) {
    result.status = status;
    result.error = std::move(message);
}

Duration elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Free functions
// ─────────────────────────────────────────────

Result<std::shared_ptr<ISandboxRuntime>> make_runtime(const EngineConfig& engine) {
    if (engine.kind == "docker") {
        return std::shared_ptr<ISandboxRuntime>(std::make_shared<DockerCliRuntime>(engine));
    }
    if (engine.kind == "fake") {
        return std::shared_ptr<ISandboxRuntime>(std::make_shared<FakeRuntime>());
    }
    return Error{"Unknown engine kind: " + engine.kind, ErrorKind::Config};
}

ContainerSpec container_spec_from(const EngineConfig& engine) {
    return ContainerSpec{
        .name = engine.name_prefix,
        .image = engine.image,
        .memory_limit = engine.memory_limit,
        .cpus = engine.cpus,
        .pids_limit = engine.pids_limit,
        .network = engine.network,
        .labels = {{"sandbox_orchestrator", "1"}}
    };
}

PoolConfig pool_config_from(const Config& config) {
    PoolConfig pool = config.pool;
    pool.cleanup_command = resolve_cleanup_command(config);
    return pool;
}

// ─────────────────────────────────────────────
// Construction / lifecycle
// ─────────────────────────────────────────────

Orchestrator::Orchestrator(Options opts)
    : config_(std::move(opts.config))
    , logger_(sink_or<StderrSink>(std::move(opts.log_sink)), opts.log_level)
    , runtime_(resolve_runtime(std::move(opts.runtime), config_.engine))
    , metrics_(sink_or<NullSink>(std::move(opts.metrics_sink)))
    , events_(logger_)
    , workspaces_(config_.execution.scratch_root,
                  config_.execution.scripts_root,
                  fs::path(config_.execution.container_workspace).filename().string())
    , pool_(runtime_, pool_config_from(config_), container_spec_from(config_.engine), logger_,
            config_.executor.engine_threads)
    , execution_pool_(config_.executor.execution_threads, "executions") {
}

Orchestrator::~Orchestrator() {
    stop();
}

Result<void> Orchestrator::start() {
    if (auto valid = validate_config(config_); !valid) {
        return valid.error();
    }
    if (running_.exchange(true)) {
        return Error{"Already running"};
    }

    logger_.log(LogLevel::Info, kComponent,
                "Orchestrator starting: engine=" + std::string(runtime_->name())
                + " image=" + config_.engine.image
                + " capacity=" + std::to_string(config_.pool.capacity));

    pool_.warm_up();
    if (!pool_.wait_until_ready(std::chrono::milliseconds(config_.pool.acquire_timeout_ms))) {
        logger_.log(LogLevel::Warn, kComponent,
                    "Pool warm-up still in progress; accepting executions anyway");
    }
    metrics_.record_pool_stats(pool_.get_stats());

    logger_.log(LogLevel::Info, kComponent, "Orchestrator started successfully");
    return Result<void>{};
}

void Orchestrator::stop() {
    if (!running_.exchange(false)) return;

    logger_.log(LogLevel::Info, kComponent, "Orchestrator shutting down...");
    {
        std::lock_guard lock(inflight_mutex_);
        for (auto& [id, source] : inflight_) {
            source.request_stop();
        }
    }
    execution_pool_.shutdown();
    pool_.shutdown();

    metrics_.record_pool_stats(pool_.get_stats());
    metrics_.flush();
    logger_.log(LogLevel::Info, kComponent, "Orchestrator stopped");
    logger_.flush();
}

// ─────────────────────────────────────────────
// Observation / cancellation
// ─────────────────────────────────────────────

void Orchestrator::register_event_sink(const ExecutionId& id, EventCallback callback) {
    events_.register_sink(id, std::move(callback));
}

std::shared_ptr<EventChannel> Orchestrator::open_event_channel(const ExecutionId& id,
                                                               size_t capacity) {
    return events_.open_channel(
        id, capacity == 0 ? config_.execution.event_channel_capacity : capacity);
}

bool Orchestrator::cancel(const ExecutionId& id) {
    std::lock_guard lock(inflight_mutex_);
    auto it = inflight_.find(id);
    if (it == inflight_.end()) return false;
    it->second.request_stop();
    logger_.log(LogLevel::Info, kComponent, "Cancellation requested for " + id);
    return true;
}

bool Orchestrator::track(const ExecutionId& id, std::stop_source source) {
    std::lock_guard lock(inflight_mutex_);
    return inflight_.emplace(id, std::move(source)).second;
}

void Orchestrator::untrack(const ExecutionId& id) {
    std::lock_guard lock(inflight_mutex_);
    inflight_.erase(id);
}

std::chrono::seconds Orchestrator::timeout_for(const ExecutionRequest& request) const {
    if (request.timeout && request.timeout->count() > 0) {
        return *request.timeout;
    }
    return std::chrono::seconds(config_.execution.timeout_s);
}

// ─────────────────────────────────────────────
// Execution
// ─────────────────────────────────────────────

std::future<ExecutionResult> Orchestrator::submit(ExecutionRequest request) {
    if (!running_.load()) {
        std::promise<ExecutionResult> rejected;
        ExecutionResult result;
        result.id = request.id;
        set_failure(result, ExecutionStatus::Error, "Orchestrator is not running");
        rejected.set_value(std::move(result));
        return rejected.get_future();
    }
    return execution_pool_.submit([this, req = std::move(request)] {
        return execute(req);
    });
}

ExecutionResult Orchestrator::execute(const ExecutionRequest& request, std::stop_token caller_stop) {
    ExecutionResult result;
    result.id = request.id;

    if (!running_.load() || request.id.empty()) {
        set_failure(result, ExecutionStatus::Error,
                    request.id.empty() ? "Execution id must not be empty"
                                       : "Orchestrator is not running");
        publish_terminal(result, timeout_for(request));
        events_.unregister(request.id);
        return result;
    }

    std::stop_source stop_source;
    if (!track(request.id, stop_source)) {
        // Leave the in-flight execution's observers alone
        logger_.log(LogLevel::Warn, kComponent, "Rejected duplicate execution id " + request.id);
        set_failure(result, ExecutionStatus::Error,
                    "Execution " + request.id + " is already in flight");
        return result;
    }
    std::stop_callback forward_stop(caller_stop, [&stop_source] { stop_source.request_stop(); });

    result.status = ExecutionStatus::Running;
    logger_.log(LogLevel::Info, kComponent,
                "Execution " + request.id + " started: script=" + request.script);

    std::optional<Workspace> workspace;
    std::optional<ContainerLease> lease;

    try {
        run_steps(request, stop_source.get_token(), result, workspace, lease);
    } catch (const std::exception& e) {
        set_failure(result, ExecutionStatus::Error, std::string("Unexpected failure: ") + e.what());
        if (lease) lease->taint();
    }

    publish_terminal(result, timeout_for(request));

    lease.reset();
    workspace.reset();
    events_.unregister(request.id);
    untrack(request.id);

    metrics_.record_execution(result);
    metrics_.record_pool_stats(pool_.get_stats());
    log_outcome(result);
    return result;
}

void Orchestrator::run_steps(const ExecutionRequest& request,
                             std::stop_token stop,
                             ExecutionResult& result,
                             std::optional<Workspace>& workspace,
                             std::optional<ContainerLease>& lease) {
    const auto& id = request.id;
    const auto& container_ws = config_.execution.container_workspace;

    // 1. Workspace
    publish_status(id, "preparing_workspace");
    if (auto deps = WorkspaceBuilder::check_dependencies(request.dependencies); !deps) {
        set_failure(result, ExecutionStatus::Error, deps.error().message);
        return;
    }
    auto built = workspaces_.build(id, request.script, request.params, request.overrides);
    if (!built) {
        set_failure(result, ExecutionStatus::Error, built.error().message);
        return;
    }
    workspace.emplace(std::move(built).value());

    // 2. Container
    publish_status(id, "acquiring_container");
    auto acquire_started = std::chrono::steady_clock::now();
    auto acquired = pool_.acquire(std::chrono::milliseconds(config_.pool.acquire_timeout_ms), stop);
    if (!acquired) {
        bool cancelled = acquired.error().kind == ErrorKind::Cancelled;
        set_failure(result, ExecutionStatus::Error,
                    cancelled ? kCancelledMessage : acquired.error().message);
        return;
    }
    metrics_.record_acquisition(id, is_ephemeral(*acquired), elapsed_since(acquire_started));
    lease.emplace(pool_, std::move(*acquired));
    result.ephemeral_container = lease->ephemeral();

    // 3. Dependencies (best-effort)
    if (!request.dependencies.empty()) {
        publish_status(id, "installing_dependencies");
        install_dependencies(request, *lease, stop);
        if (stop.stop_requested()) {
            lease->taint();
            set_failure(result, ExecutionStatus::Error, kCancelledMessage);
            return;
        }
    }

    // 4. Upload and run
    publish_status(id, "uploading");
    auto run_started = std::chrono::steady_clock::now();
    auto container_parent = fs::path(container_ws).parent_path().string();
    if (auto uploaded = runtime_->put_archive(lease->id(), workspace->dir(), container_parent);
        !uploaded) {
        set_failure(result, ExecutionStatus::Error, "Upload failed: " + uploaded.error().message);
        return;
    }

    publish_status(id, "running");
    ExecSpec spec{
        .argv = {config_.execution.interpreter, workspace->script_name()},
        .workdir = container_ws + "/code",
        .env = {{"PARAMS_FILE", container_ws + "/params.json"}}
    };
    const auto timeout = timeout_for(request);

    // 5. Stream output
    OutputCapture capture{.limit = config_.execution.max_output_bytes};
    auto on_chunk = [&](StreamKind kind, std::string_view chunk) {
        capture.append(kind, chunk);
        Json::Value data;
        data["text"] = std::string(chunk);
        events_.publish(id, kind == StreamKind::Stdout ? EventType::Output : EventType::ErrorOutput,
                        std::move(data));
    };

    auto outcome = runtime_->exec(lease->id(), spec, on_chunk,
                                  std::chrono::steady_clock::now() + timeout, stop);
    result.duration = elapsed_since(run_started);
    result.output_truncated = capture.truncated;

    if (!outcome) {
        set_failure(result, ExecutionStatus::Error,
                    "Execution could not start: " + outcome.error().message);
        return;
    }

    // 7. Deadline: only the streamed events carry partial output
    if (outcome->timed_out) {
        lease->taint();
        set_failure(result, ExecutionStatus::Timeout,
                    "Execution timed out after " + std::to_string(timeout.count()) + "s");
        return;
    }
    if (outcome->cancelled) {
        lease->taint();
        set_failure(result, ExecutionStatus::Error, kCancelledMessage);
        return;
    }

    // 6. Normal completion
    result.output = std::move(capture.out);
    if (!capture.err.empty()) {
        result.error = std::move(capture.err);
    }
    result.exit_code = outcome->exit_code;

    if (outcome->exit_code != 0) {
        result.status = ExecutionStatus::Failed;
        if (!result.error) {
            result.error = "Script exited with code " + std::to_string(outcome->exit_code);
        }
        return;
    }

    result.status = ExecutionStatus::Completed;
    publish_status(id, "collecting_results");
    collect_results(request, *workspace, *lease, result);
}

void Orchestrator::install_dependencies(const ExecutionRequest& request,
                                        ContainerLease& lease,
                                        std::stop_token stop) {
    ExecSpec spec{
        .argv = {config_.execution.interpreter, "-m", "pip", "install", "--quiet",
                 "--disable-pip-version-check"},
        .workdir = "/",
        .env = {}
    };
    spec.argv.insert(spec.argv.end(), request.dependencies.begin(), request.dependencies.end());

    std::string diagnostics;
    auto collect = [&diagnostics](StreamKind, std::string_view chunk) {
        if (diagnostics.size() < kMaxInstallDiagnostics) {
            diagnostics.append(chunk.substr(0, kMaxInstallDiagnostics - diagnostics.size()));
        }
    };

    auto budget = std::chrono::seconds(config_.execution.dependency_timeout_s);
    auto outcome = runtime_->exec(lease.id(), spec, collect,
                                  std::chrono::steady_clock::now() + budget, stop);

    std::string failure;
    if (!outcome) {
        failure = outcome.error().message;
    } else if (outcome->cancelled) {
        return;
    } else if (outcome->timed_out) {
        failure = "dependency installation timed out after " + std::to_string(budget.count()) + "s";
    } else if (outcome->exit_code != 0) {
        failure = "pip exited with code " + std::to_string(outcome->exit_code);
        if (!diagnostics.empty()) failure += ": " + diagnostics;
    }

    if (failure.empty()) {
        logger_.log(LogLevel::Info, kComponent,
                    "Installed " + std::to_string(request.dependencies.size())
                    + " dependencies for " + request.id);
        return;
    }

    // The container may be half-modified; never hand it to another execution
    lease.taint();
    logger_.log(LogLevel::Warn, kComponent,
                "Dependency installation for " + request.id + " failed, continuing: " + failure);
    publish_status(request.id, "installing_dependencies", failure);
}

void Orchestrator::collect_results(const ExecutionRequest& request,
                                   const Workspace& workspace,
                                   const ContainerLease& lease,
                                   ExecutionResult& result) {
    std::error_code ec;
    fs::create_directories(workspace.collect_dir(), ec);
    if (ec) {
        logger_.log(LogLevel::Warn, kComponent,
                    "Cannot create result directory for " + request.id + ": " + ec.message());
        return;
    }

    auto copied = runtime_->copy_from(lease.id(),
                                      config_.execution.container_workspace + "/code",
                                      workspace.collect_dir());
    if (!copied) {
        logger_.log(LogLevel::Warn, kComponent,
                    "Result collection for " + request.id + " failed: " + copied.error().message);
        return;
    }
    result.result_files = collect_result_files(workspace.collect_dir() / "code",
                                               workspace.manifest());
}

// ─────────────────────────────────────────────
// Events / logging
// ─────────────────────────────────────────────

void Orchestrator::OutputCapture::append(StreamKind kind, std::string_view chunk) {
    auto& target = kind == StreamKind::Stdout ? out : err;
    if (target.size() >= limit) {
        truncated = truncated || !chunk.empty();
        return;
    }
    size_t room = limit - target.size();
    if (chunk.size() > room) {
        truncated = true;
        chunk = chunk.substr(0, room);
    }
    target.append(chunk);
}

void Orchestrator::publish_status(const ExecutionId& id, std::string_view status,
                                  std::string_view message) {
    Json::Value data;
    data["status"] = std::string(status);
    if (!message.empty()) {
        data["message"] = std::string(message);
    }
    events_.publish(id, EventType::Status, std::move(data));
}

void Orchestrator::publish_terminal(const ExecutionResult& result, std::chrono::seconds timeout) {
    Json::Value data;
    EventType type = EventType::Error;

    switch (result.status) {
        case ExecutionStatus::Completed:
            type = EventType::Completed;
            data["execution_time"] =
                std::chrono::duration<double>(result.duration).count();
            data["result_files"] = to_json(result.result_files);
            break;
        case ExecutionStatus::Failed:
            type = EventType::Failed;
            data["error"] = result.error.value_or("");
            data["exit_code"] = result.exit_code.value_or(-1);
            break;
        case ExecutionStatus::Timeout:
            type = EventType::Timeout;
            data["timeout_s"] = static_cast<Json::Int64>(timeout.count());
            break;
        default:
            type = EventType::Error;
            data["error"] = result.error.value_or("unknown error");
            break;
    }
    events_.publish(result.id, type, std::move(data));
}

void Orchestrator::log_outcome(const ExecutionResult& result) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(result.duration).count();
    std::string summary = "Execution " + result.id + " " + std::string(to_string(result.status));

    switch (result.status) {
        case ExecutionStatus::Completed:
            logger_.log(LogLevel::Info, kComponent,
                        summary + " in " + std::to_string(ms) + "ms, "
                        + std::to_string(result.result_files.size()) + " result file(s)");
            break;
        case ExecutionStatus::Failed:
        case ExecutionStatus::Timeout:
            logger_.log(LogLevel::Warn, kComponent,
                        summary + " after " + std::to_string(ms) + "ms");
            break;
        default:
            logger_.log(LogLevel::Error, kComponent,
                        summary + ": " + result.error.value_or("unknown error"));
            break;
    }
}

// ─────────────────────────────────────────────
// ExecutionResult serialization
// ─────────────────────────────────────────────

Json::Value to_json(const ExecutionResult& result) {
    Json::Value json;
    json["id"] = result.id;
    json["status"] = std::string(to_string(result.status));
    json["output"] = result.output;
    json["error"] = result.error ? Json::Value(*result.error) : Json::Value();
    json["exit_code"] = result.exit_code ? Json::Value(*result.exit_code) : Json::Value();
    json["execution_time"] = std::chrono::duration<double>(result.duration).count();
    json["result_files"] = to_json(result.result_files);
    json["ephemeral_container"] = result.ephemeral_container;
    json["output_truncated"] = result.output_truncated;
    return json;
}

}  // namespace sandbox_orchestrator

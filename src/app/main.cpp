/**
 * @file main.cpp
 * @brief SandboxOrchestrator command-line entry point.
 *
 * Runs one execution end to end:
 *   Config → Logger → Orchestrator (pool warm-up) → execute → result JSON
 *
 * Events stream to stdout as NDJSON while the script runs; the final
 * result follows as a JSON document. Logs go to stderr or log_dir.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "orchestrator/orchestrator.hpp"
#include "sandbox/fake_runtime.hpp"
#include "telemetry/json_sink.hpp"

#include <json/json.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace sandbox_orchestrator;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

constexpr int kExitCompleted = 0;
constexpr int kExitFailed = 1;
constexpr int kExitTimeout = 2;
constexpr int kExitError = 3;

struct CLIArgs {
    std::optional<std::filesystem::path> config_path;
    std::string script;
    std::string id;
    std::string params = "{}";
    std::vector<std::pair<std::string, std::filesystem::path>> overrides;
    std::vector<std::string> dependencies;
    std::optional<uint32_t> timeout_s;
    std::string log_dir;
    std::string log_level;
    bool fake = false;
    bool stats = false;
};

void print_usage() {
    std::cout << "Usage: sandbox_orchestrator --script <path> [OPTIONS]\n"
              << "  --script <path>          Script to run (relative to execution.scripts_root)\n"
              << "  --id <id>                Execution id (default: generated)\n"
              << "  --params <json>          Parameters as a JSON object\n"
              << "  --override <rel>=<file>  Replace code/<rel> with the contents of <file>\n"
              << "  --dep <spec>             Extra pip requirement (repeatable)\n"
              << "  --timeout <seconds>      Wall-clock limit for the script\n"
              << "  --config <path>          Configuration file (default: config/default.toml)\n"
              << "  --log-dir <path>         Write logs to rotating files instead of stderr\n"
              << "  --log-level <level>      debug | info | warn | error\n"
              << "  --fake                   Use the in-process engine instead of docker\n"
              << "  --stats                  Print pool statistics after the run\n"
              << "  --help, -h               Show this help message\n"
              << "Exit status: 0 completed, 1 failed, 2 timeout, 3 error\n";
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    auto need_value = [&](int i, const std::string& flag) -> Result<std::string> {
        if (i + 1 >= argc) return Error{flag + " requires a value", ErrorKind::Config};
        return std::string(argv[i + 1]);
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        }
        if (arg == "--fake") { args.fake = true; continue; }
        if (arg == "--stats") { args.stats = true; continue; }

        auto value = need_value(i, arg);
        if (!value) return value.error();
        ++i;

        if (arg == "--script") {
            args.script = *value;
        } else if (arg == "--id") {
            args.id = *value;
        } else if (arg == "--params") {
            args.params = *value;
        } else if (arg == "--override") {
            auto eq = value->find('=');
            if (eq == std::string::npos || eq == 0 || eq + 1 == value->size()) {
                return Error{"--override expects <relative path>=<host file>", ErrorKind::Config};
            }
            args.overrides.emplace_back(value->substr(0, eq), value->substr(eq + 1));
        } else if (arg == "--dep") {
            args.dependencies.push_back(*value);
        } else if (arg == "--timeout") {
            try {
                auto seconds = std::stoul(*value);
                if (seconds == 0) throw std::out_of_range("zero");
                args.timeout_s = static_cast<uint32_t>(seconds);
            } catch (const std::exception&) {
                return Error{"--timeout expects a positive number of seconds", ErrorKind::Config};
            }
        } else if (arg == "--config") {
            args.config_path = *value;
        } else if (arg == "--log-dir") {
            args.log_dir = *value;
        } else if (arg == "--log-level") {
            args.log_level = *value;
        } else {
            return Error{"Unknown option: " + arg, ErrorKind::Config};
        }
    }

    if (args.script.empty()) {
        return Error{"--script is required", ErrorKind::Config};
    }
    return args;
}

Result<Config> resolve_config(const CLIArgs& args) {
    Config config = default_config();
    if (args.config_path) {
        auto loaded = load_config(*args.config_path);
        if (!loaded) return loaded.error();
        config = *loaded;
    } else if (std::filesystem::exists("config/default.toml")) {
        auto loaded = load_config("config/default.toml");
        if (!loaded) return loaded.error();
        config = *loaded;
    }

    // Apply CLI overrides
    if (args.fake) config.engine.kind = "fake";
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;

    if (auto valid = validate_config(config); !valid) return valid.error();
    return config;
}

Result<ExecutionRequest> build_request(const CLIArgs& args) {
    ExecutionRequest request;
    request.id = args.id.empty()
        ? "cli-" + std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::system_clock::now().time_since_epoch()).count())
        : args.id;
    request.script = args.script;
    request.dependencies = args.dependencies;
    if (args.timeout_s) request.timeout = std::chrono::seconds(*args.timeout_s);

    Json::CharReaderBuilder reader;
    std::istringstream params_stream(args.params);
    std::string errors;
    if (!Json::parseFromStream(reader, params_stream, &request.params, &errors)) {
        return Error{"--params is not valid JSON: " + errors, ErrorKind::Config};
    }

    for (const auto& [relative, host_file] : args.overrides) {
        std::ifstream in(host_file, std::ios::binary);
        if (!in) {
            return Error{"Cannot read override file " + host_file.string(), ErrorKind::Config};
        }
        std::ostringstream content;
        content << in.rdbuf();
        request.overrides[relative] = content.str();
    }
    return request;
}

/// In --fake mode the interpreter only reports what it would have run.
void install_fake_interpreter(FakeRuntime& runtime, const std::string& interpreter) {
    runtime.register_program(
        std::filesystem::path(interpreter).filename().string(),
        [](FakeProcess& proc) {
            std::string line = "[fake engine]";
            for (const auto& arg : proc.spec().argv) line += " " + arg;
            proc.out(line + "\n");
            return 0;
        });
}

int exit_code_for(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::Completed: return kExitCompleted;
        case ExecutionStatus::Failed:    return kExitFailed;
        case ExecutionStatus::Timeout:   return kExitTimeout;
        default:                         return kExitError;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        std::cerr << args.error().message << "\n";
        print_usage();
        return kExitError;
    }

    auto config = resolve_config(*args);
    if (!config) {
        std::cerr << "Invalid configuration: " << config.error().message << std::endl;
        return kExitError;
    }

    auto request = build_request(*args);
    if (!request) {
        std::cerr << request.error().message << std::endl;
        return kExitError;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    const auto& telemetry = config->telemetry;
    if (!telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(telemetry.log_dir, "sandbox_orchestrator",
                                                  telemetry.max_file_size_mb,
                                                  telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StderrSink>();
    }
    std::unique_ptr<ILogSink> metrics_sink;
    if (!telemetry.log_dir.empty()) {
        metrics_sink = std::make_unique<JsonFileSink>(telemetry.log_dir, "metrics",
                                                      telemetry.max_file_size_mb,
                                                      telemetry.rotate_count);
    }

    // ── Initialize Engine ────────────────────
    auto runtime = make_runtime(config->engine);
    if (!runtime) {
        std::cerr << runtime.error().message << std::endl;
        return kExitError;
    }
    if (auto* fake = dynamic_cast<FakeRuntime*>(runtime->get())) {
        install_fake_interpreter(*fake, config->execution.interpreter);
    }

    Orchestrator orchestrator(Orchestrator::Options{
        .config = *config,
        .runtime = *runtime,
        .log_sink = std::move(log_sink),
        .log_level = parse_log_level(telemetry.log_level).value_or(LogLevel::Info),
        .metrics_sink = std::move(metrics_sink)
    });

    if (auto started = orchestrator.start(); !started) {
        std::cerr << "Failed to start: " << started.error().message << std::endl;
        return kExitError;
    }

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::mutex stdout_mutex;
    orchestrator.register_event_sink(request->id, [&stdout_mutex](const Event& event) {
        std::lock_guard lock(stdout_mutex);
        std::cout << to_ndjson(event) << '\n' << std::flush;
    });

    auto pending = orchestrator.submit(*request);
    bool cancel_sent = false;
    while (pending.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        // Retried until the execution is tracked; a queued run cannot be cancelled yet
        if (g_shutdown_requested && !cancel_sent) {
            cancel_sent = orchestrator.cancel(request->id);
            if (cancel_sent) {
                orchestrator.logger().warn("Interrupted; cancelled " + request->id);
            }
        }
    }
    auto result = pending.get();

    {
        std::lock_guard lock(stdout_mutex);
        Json::StreamWriterBuilder writer;
        writer["indentation"] = "  ";
        std::cout << Json::writeString(writer, to_json(result)) << std::endl;
    }

    if (args->stats) {
        auto stats = orchestrator.get_pool_stats();
        std::cerr << "pool: available=" << stats.available
                  << " in_use=" << stats.in_use
                  << " capacity=" << stats.capacity
                  << " acquired=" << stats.total_acquired
                  << " released=" << stats.total_released
                  << " destroyed=" << stats.total_destroyed
                  << " ephemeral=" << stats.total_ephemeral << std::endl;
    }

    orchestrator.stop();
    return exit_code_for(result.status);
}

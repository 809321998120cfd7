/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace sandbox_orchestrator {

namespace {

/// Reads non-negative integer keys, keeping the first out-of-range one as an error.
class UnsignedReader {
public:
    template <typename T>
    void read(toml::node_view<toml::node> table, std::string_view section,
              std::string_view key, T& out) {
        auto raw = table[key].value<int64_t>();
        if (!raw) return;
        constexpr auto kMax = std::numeric_limits<T>::max();
        if (*raw < 0 || static_cast<uint64_t>(*raw) > kMax) {
            if (!error_) {
                error_ = Error{std::string(section) + "." + std::string(key)
                               + " must be between 0 and " + std::to_string(kMax)
                               + ", got " + std::to_string(*raw),
                               ErrorKind::Config};
            }
            return;
        }
        out = static_cast<T>(*raw);
    }

    [[nodiscard]] const std::optional<Error>& error() const noexcept { return error_; }

private:
    std::optional<Error> error_;
};

/// True when `path` appears in `command` as a whole word, or the placeholder does.
bool cleans_path(std::string_view command, std::string_view path) {
    if (command.find(kWorkspacePlaceholder) != std::string_view::npos) return true;
    for (auto pos = command.find(path); pos != std::string_view::npos;
         pos = command.find(path, pos + 1)) {
        auto end = pos + path.size();
        bool starts_word = pos == 0 || command[pos - 1] == ' ' || command[pos - 1] == '"'
                        || command[pos - 1] == '\'';
        bool ends_word = end == command.size()
                      || std::string_view(" ;/\"'").find(command[end]) != std::string_view::npos;
        if (starts_word && ends_word) return true;
    }
    return false;
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string(), ErrorKind::Config};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;
        UnsignedReader ints;

        // [engine]
        if (auto engine = tbl["engine"]; engine.is_table()) {
            auto& e = config.engine;
            e.kind = engine["kind"].value_or(e.kind);
            e.docker_binary = engine["docker_binary"].value_or(e.docker_binary);
            e.image = engine["image"].value_or(e.image);
            e.memory_limit = engine["memory_limit"].value_or(e.memory_limit);
            e.cpus = engine["cpus"].value_or(e.cpus);
            ints.read(engine, "engine", "pids_limit", e.pids_limit);
            e.network = engine["network"].value_or(e.network);
            e.name_prefix = engine["name_prefix"].value_or(e.name_prefix);
            ints.read(engine, "engine", "command_timeout_ms", e.command_timeout_ms);
        }

        // [pool]
        if (auto pool = tbl["pool"]; pool.is_table()) {
            auto& p = config.pool;
            ints.read(pool, "pool", "capacity", p.capacity);
            ints.read(pool, "pool", "acquire_timeout_ms", p.acquire_timeout_ms);
            ints.read(pool, "pool", "create_retries", p.create_retries);
            ints.read(pool, "pool", "retry_backoff_ms", p.retry_backoff_ms);
            p.recycle_after_timeout = pool["recycle_after_timeout"].value_or(p.recycle_after_timeout);
            p.replenish = pool["replenish"].value_or(p.replenish);
            p.cleanup_command = pool["cleanup_command"].value_or(p.cleanup_command);
            ints.read(pool, "pool", "cleanup_timeout_ms", p.cleanup_timeout_ms);
        }

        // [executor]
        if (auto executor = tbl["executor"]; executor.is_table()) {
            ints.read(executor, "executor", "engine_threads", config.executor.engine_threads);
            ints.read(executor, "executor", "execution_threads", config.executor.execution_threads);
        }

        // [execution]
        if (auto execution = tbl["execution"]; execution.is_table()) {
            auto& x = config.execution;
            ints.read(execution, "execution", "timeout_s", x.timeout_s);
            ints.read(execution, "execution", "dependency_timeout_s", x.dependency_timeout_s);
            x.scratch_root = execution["scratch_root"].value_or(x.scratch_root.string());
            x.scripts_root = execution["scripts_root"].value_or(x.scripts_root.string());
            x.interpreter = execution["interpreter"].value_or(x.interpreter);
            x.container_workspace = execution["container_workspace"].value_or(x.container_workspace);
            ints.read(execution, "execution", "max_output_bytes", x.max_output_bytes);
            ints.read(execution, "execution", "event_channel_capacity", x.event_channel_capacity);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            auto& t = config.telemetry;
            t.log_dir = telemetry["log_dir"].value_or(std::string{});
            ints.read(telemetry, "telemetry", "max_file_size_mb", t.max_file_size_mb);
            ints.read(telemetry, "telemetry", "rotate_count", t.rotate_count);
            t.log_level = telemetry["log_level"].value_or(t.log_level);
        }

        if (ints.error()) {
            return *ints.error();
        }
        if (auto valid = validate_config(config); !valid) {
            return valid.error();
        }
        return config;

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()},
                     ErrorKind::Config};
    }
}

Config default_config() {
    return Config{};
}

Result<void> validate_config(const Config& config) {
    if (config.engine.kind != "docker" && config.engine.kind != "fake") {
        return Error{"engine.kind must be \"docker\" or \"fake\", got \"" + config.engine.kind + "\"",
                     ErrorKind::Config};
    }
    if (config.engine.image.empty()) {
        return Error{"engine.image must not be empty", ErrorKind::Config};
    }
    if (config.executor.engine_threads == 0) {
        return Error{"executor.engine_threads must be at least 1", ErrorKind::Config};
    }
    if (config.execution.timeout_s == 0) {
        return Error{"execution.timeout_s must be positive", ErrorKind::Config};
    }
    if (config.execution.dependency_timeout_s == 0) {
        return Error{"execution.dependency_timeout_s must be positive", ErrorKind::Config};
    }
    if (config.execution.scratch_root.empty()) {
        return Error{"execution.scratch_root must not be empty", ErrorKind::Config};
    }
    std::filesystem::path container_ws{config.execution.container_workspace};
    if (!container_ws.is_absolute() || container_ws.filename().empty()) {
        return Error{"execution.container_workspace must be an absolute path below /, got \""
                     + config.execution.container_workspace + "\"", ErrorKind::Config};
    }
    if (!cleans_path(config.pool.cleanup_command, config.execution.container_workspace)) {
        return Error{"pool.cleanup_command does not wipe execution.container_workspace \""
                     + config.execution.container_workspace + "\"; name it or use "
                     + std::string(kWorkspacePlaceholder), ErrorKind::Config};
    }
    if (config.execution.interpreter.empty()) {
        return Error{"execution.interpreter must not be empty", ErrorKind::Config};
    }
    if (config.pool.cleanup_timeout_ms == 0) {
        return Error{"pool.cleanup_timeout_ms must be positive", ErrorKind::Config};
    }
    if (config.execution.event_channel_capacity == 0) {
        return Error{"execution.event_channel_capacity must be at least 1", ErrorKind::Config};
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return Error{"Unknown telemetry.log_level: " + config.telemetry.log_level, ErrorKind::Config};
    }
    return Result<void>{};
}

std::string resolve_cleanup_command(const Config& config) {
    std::string command = config.pool.cleanup_command;
    const auto& workspace = config.execution.container_workspace;
    for (auto pos = command.find(kWorkspacePlaceholder); pos != std::string::npos;
         pos = command.find(kWorkspacePlaceholder, pos + workspace.size())) {
        command.replace(pos, kWorkspacePlaceholder.size(), workspace);
    }
    return command;
}

}  // namespace sandbox_orchestrator

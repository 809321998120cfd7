/**
 * @file config.hpp
 * @brief Orchestrator configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "core/result.hpp"

namespace sandbox_orchestrator {

struct EngineConfig {
    std::string kind = "docker";            ///< "docker" or "fake"
    std::string docker_binary = "docker";
    std::string image = "python:3.11-slim";
    std::string memory_limit = "1g";
    double cpus = 2.0;
    uint32_t pids_limit = 128;
    std::string network = "none";
    std::string name_prefix = "exec_container";
    uint32_t command_timeout_ms = 60000;    ///< Bound on create/start/cp/rm calls
};

struct PoolConfig {
    uint32_t capacity = 5;
    uint32_t acquire_timeout_ms = 30000;
    uint32_t create_retries = 3;
    uint32_t retry_backoff_ms = 200;
    bool recycle_after_timeout = false;     ///< Reuse tainted containers if cleanup passes
    bool replenish = true;                  ///< Recreate pooled containers that were destroyed
    uint32_t cleanup_timeout_ms = 30000;
    /// Must wipe the container workspace, either literally or via {workspace}
    std::string cleanup_command =
        "kill -9 -1 2>/dev/null; rm -rf /workspace /tmp/* 2>/dev/null; exit 0";
};

struct ExecutorConfig {
    uint32_t engine_threads = 4;            ///< Workers for container engine calls
    uint32_t execution_threads = 0;         ///< 0 = hardware_concurrency
};

struct ExecutionConfig {
    uint32_t timeout_s = 300;
    uint32_t dependency_timeout_s = 120;
    std::filesystem::path scratch_root = "/tmp/sandbox_orchestrator";
    std::filesystem::path scripts_root = ".";
    std::string interpreter = "python3";
    std::string container_workspace = "/workspace";
    uint64_t max_output_bytes = 10ULL * 1024 * 1024;
    uint32_t event_channel_capacity = 1024;
};

struct TelemetryConfig {
    std::filesystem::path log_dir;          ///< Empty = log to stderr
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    EngineConfig engine;
    PoolConfig pool;
    ExecutorConfig executor;
    ExecutionConfig execution;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Reject values the orchestrator cannot run with.
 */
Result<void> validate_config(const Config& config);

/// Stands for execution.container_workspace inside pool.cleanup_command.
inline constexpr std::string_view kWorkspacePlaceholder = "{workspace}";

/// pool.cleanup_command with every placeholder expanded.
std::string resolve_cleanup_command(const Config& config);

}  // namespace sandbox_orchestrator

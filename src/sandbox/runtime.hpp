/**
 * @file runtime.hpp
 * @brief Container engine client interface.
 *
 * ISandboxRuntime is the only way the rest of the system talks to a
 * container engine. DockerCliRuntime drives the docker CLI; FakeRuntime
 * simulates an engine in-process for tests and dry runs. Virtual dispatch
 * is fine here: every call is dominated by engine I/O.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace sandbox_orchestrator {

/**
 * @brief Parameters for creating one long-lived sandbox container.
 */
struct ContainerSpec {
    std::string name;
    std::string image;
    std::string memory_limit;        ///< Engine syntax, e.g. "1g"
    double cpus = 0.0;               ///< 0 = uncapped
    uint32_t pids_limit = 0;         ///< 0 = uncapped
    std::string network = "none";
    std::map<std::string, std::string> labels;
};

/**
 * @brief Engine-reported container status.
 */
struct ContainerStatus {
    bool running = false;
    std::string state;               ///< Raw engine state, e.g. "running", "exited"
};

/**
 * @brief A command to run inside a container.
 */
struct ExecSpec {
    std::vector<std::string> argv;
    std::string workdir;
    std::map<std::string, std::string> env;
};

enum class StreamKind : uint8_t { Stdout, Stderr };

/// Receives output as it arrives. Called on the thread that invoked exec().
using ChunkCallback = std::function<void(StreamKind, std::string_view)>;

/**
 * @brief How an exec ended.
 *
 * An engine failure (exec could not be started) is reported through
 * Result's error instead.
 */
struct ExecOutcome {
    int exit_code = -1;
    bool timed_out = false;          ///< Killed at the deadline
    bool cancelled = false;          ///< Killed because stop was requested
    Duration elapsed{0};
};

class ISandboxRuntime {
public:
    virtual ~ISandboxRuntime() = default;

    /// Create (but do not start) a container. Returns the engine id.
    virtual Result<ContainerId> create(const ContainerSpec& spec) = 0;
    virtual Result<void> start(const ContainerId& id) = 0;

    /// Re-query the engine for the container's current state.
    virtual Result<ContainerStatus> inspect(const ContainerId& id) = 0;

    /**
     * @brief Run a command inside a running container.
     *
     * Blocks until the command exits, `deadline` passes or `stop` is
     * requested. Output is streamed through `on_chunk` in arrival order.
     */
    virtual Result<ExecOutcome> exec(const ContainerId& id,
                                     const ExecSpec& spec,
                                     const ChunkCallback& on_chunk,
                                     SteadyTime deadline,
                                     std::stop_token stop) = 0;

    /// Copy the host directory `host_dir` (itself, not only its contents) into `container_parent`.
    virtual Result<void> put_archive(const ContainerId& id,
                                     const std::filesystem::path& host_dir,
                                     const std::string& container_parent) = 0;

    /// Copy `container_path` into the host directory `host_parent`.
    virtual Result<void> copy_from(const ContainerId& id,
                                   const std::string& container_path,
                                   const std::filesystem::path& host_parent) = 0;

    /// Force-remove the container. Removing an unknown container is not an error.
    virtual Result<void> remove(const ContainerId& id) = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace sandbox_orchestrator

/**
 * @file docker_runtime.hpp
 * @brief ISandboxRuntime backed by the docker command-line client.
 */

#pragma once

#include "core/config.hpp"
#include "sandbox/runtime.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace sandbox_orchestrator {

/**
 * @brief Drives `docker create/start/inspect/exec/cp/rm`.
 *
 * Every call spawns the CLI as a child process. Management calls are
 * bounded by EngineConfig::command_timeout_ms; exec is bounded by the
 * caller's deadline. Killing a timed-out `docker exec` only stops the
 * client: processes left inside the container are reaped by the pool's
 * cleanup command on release.
 */
class DockerCliRuntime : public ISandboxRuntime {
public:
    explicit DockerCliRuntime(EngineConfig config);

    Result<ContainerId> create(const ContainerSpec& spec) override;
    Result<void> start(const ContainerId& id) override;
    Result<ContainerStatus> inspect(const ContainerId& id) override;
    Result<ExecOutcome> exec(const ContainerId& id,
                             const ExecSpec& spec,
                             const ChunkCallback& on_chunk,
                             SteadyTime deadline,
                             std::stop_token stop) override;
    Result<void> put_archive(const ContainerId& id,
                             const std::filesystem::path& host_dir,
                             const std::string& container_parent) override;
    Result<void> copy_from(const ContainerId& id,
                           const std::string& container_path,
                           const std::filesystem::path& host_parent) override;
    Result<void> remove(const ContainerId& id) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "docker"; }

    // Command-line builders, exposed for tests
    [[nodiscard]] std::vector<std::string> create_args(const ContainerSpec& spec) const;
    [[nodiscard]] std::vector<std::string> exec_args(const ContainerId& id,
                                                     const ExecSpec& spec) const;

private:
    Result<std::string> run_management(std::vector<std::string> args) const;

    EngineConfig config_;
    std::chrono::milliseconds command_timeout_;
};

}  // namespace sandbox_orchestrator

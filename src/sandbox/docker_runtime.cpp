/**
 * @file docker_runtime.cpp
 * @brief DockerCliRuntime implementation.
 */

#include "sandbox/docker_runtime.hpp"
#include "sandbox/process.hpp"

#include <sstream>

namespace sandbox_orchestrator {

namespace {

std::string trim(std::string text) {
    const char* ws = " \t\r\n";
    auto begin = text.find_first_not_of(ws);
    if (begin == std::string::npos) return {};
    auto end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}

std::string format_cpus(double cpus) {
    std::ostringstream oss;
    oss << cpus;
    return oss.str();
}

}  // anonymous namespace

DockerCliRuntime::DockerCliRuntime(EngineConfig config)
    : config_(std::move(config))
    , command_timeout_(config_.command_timeout_ms) {}

Result<std::string> DockerCliRuntime::run_management(std::vector<std::string> args) const {
    args.insert(args.begin(), config_.docker_binary);
    auto captured = run_captured(args, command_timeout_);
    if (!captured) {
        return captured.error();
    }
    if (captured->outcome.timed_out) {
        return Error{"'" + join_argv(args) + "' timed out", ErrorKind::Timeout};
    }
    if (captured->outcome.exit_code != 0) {
        auto message = trim(captured->err);
        if (message.empty()) message = "exit code " + std::to_string(captured->outcome.exit_code);
        return Error{"'" + join_argv(args) + "' failed: " + message};
    }
    return trim(std::move(captured->out));
}

std::vector<std::string> DockerCliRuntime::create_args(const ContainerSpec& spec) const {
    std::vector<std::string> args = {config_.docker_binary, "create"};
    if (!spec.name.empty()) {
        args.insert(args.end(), {"--name", spec.name});
    }
    if (!spec.memory_limit.empty()) {
        // Equal memory and memory+swap limits disable swap
        args.insert(args.end(), {"--memory", spec.memory_limit,
                                 "--memory-swap", spec.memory_limit});
    }
    if (spec.cpus > 0.0) {
        args.insert(args.end(), {"--cpus", format_cpus(spec.cpus)});
    }
    if (spec.pids_limit > 0) {
        args.insert(args.end(), {"--pids-limit", std::to_string(spec.pids_limit)});
    }
    if (!spec.network.empty()) {
        args.insert(args.end(), {"--network", spec.network});
    }
    for (const auto& [key, value] : spec.labels) {
        args.insert(args.end(), {"--label", key + "=" + value});
    }
    args.insert(args.end(), {spec.image, "tail", "-f", "/dev/null"});
    return args;
}

std::vector<std::string> DockerCliRuntime::exec_args(const ContainerId& id,
                                                     const ExecSpec& spec) const {
    std::vector<std::string> args = {config_.docker_binary, "exec"};
    if (!spec.workdir.empty()) {
        args.insert(args.end(), {"--workdir", spec.workdir});
    }
    for (const auto& [key, value] : spec.env) {
        args.insert(args.end(), {"--env", key + "=" + value});
    }
    args.push_back(id);
    args.insert(args.end(), spec.argv.begin(), spec.argv.end());
    return args;
}

Result<ContainerId> DockerCliRuntime::create(const ContainerSpec& spec) {
    auto args = create_args(spec);
    args.erase(args.begin());
    auto out = run_management(std::move(args));
    if (!out) return out.error();
    if (out->empty()) {
        return Error{"docker create returned no container id"};
    }
    // Pull progress may precede the id; the id is the last line
    auto last_newline = out->find_last_of('\n');
    return last_newline == std::string::npos ? *out : out->substr(last_newline + 1);
}

Result<void> DockerCliRuntime::start(const ContainerId& id) {
    auto out = run_management({"start", id});
    if (!out) return out.error();
    return Result<void>{};
}

Result<ContainerStatus> DockerCliRuntime::inspect(const ContainerId& id) {
    auto out = run_management({"inspect", "--format", "{{.State.Status}}", id});
    if (!out) return Error{out.error().message, ErrorKind::Liveness};
    return ContainerStatus{.running = (*out == "running"), .state = *out};
}

Result<ExecOutcome> DockerCliRuntime::exec(const ContainerId& id,
                                           const ExecSpec& spec,
                                           const ChunkCallback& on_chunk,
                                           SteadyTime deadline,
                                           std::stop_token stop) {
    if (spec.argv.empty()) {
        return Error{"exec requires a command"};
    }
    auto result = run_process(exec_args(id, spec), on_chunk, deadline, std::move(stop));
    if (!result) return result.error();

    // 125 is also what the docker client returns when the exec never ran
    // (daemon error, container gone). A running container means the
    // command itself exited 125.
    if (!result->timed_out && !result->cancelled && result->exit_code == 125) {
        auto status = inspect(id);
        if (!status || !status->running) {
            return Error{"docker exec failed to start in container " + id};
        }
    }

    return ExecOutcome{
        .exit_code = result->exit_code,
        .timed_out = result->timed_out,
        .cancelled = result->cancelled,
        .elapsed = result->elapsed
    };
}

Result<void> DockerCliRuntime::put_archive(const ContainerId& id,
                                           const std::filesystem::path& host_dir,
                                           const std::string& container_parent) {
    auto out = run_management({"cp", host_dir.string(), id + ":" + container_parent});
    if (!out) return out.error();
    return Result<void>{};
}

Result<void> DockerCliRuntime::copy_from(const ContainerId& id,
                                         const std::string& container_path,
                                         const std::filesystem::path& host_parent) {
    auto out = run_management({"cp", id + ":" + container_path, host_parent.string()});
    if (!out) return out.error();
    return Result<void>{};
}

Result<void> DockerCliRuntime::remove(const ContainerId& id) {
    auto out = run_management({"rm", "--force", id});
    if (!out) {
        if (out.error().message.find("No such container") != std::string::npos) {
            return Result<void>{};
        }
        return out.error();
    }
    return Result<void>{};
}

}  // namespace sandbox_orchestrator

/**
 * @file process.hpp
 * @brief Child process execution with streamed output and a hard deadline.
 *
 * Used by DockerCliRuntime to drive the docker CLI. The child runs in its
 * own process group so a deadline or stop request kills everything it
 * spawned.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "sandbox/runtime.hpp"

#include <chrono>
#include <stop_token>
#include <string>
#include <vector>

namespace sandbox_orchestrator {

struct ProcessOutcome {
    int exit_code = -1;              ///< -signal when killed by a signal
    bool timed_out = false;
    bool cancelled = false;
    Duration elapsed{0};
};

/**
 * @brief Spawn `argv`, stream stdout/stderr to `on_chunk`, wait for exit.
 *
 * Fails (Error) only when the process cannot be started at all.
 */
Result<ProcessOutcome> run_process(const std::vector<std::string>& argv,
                                   const ChunkCallback& on_chunk,
                                   SteadyTime deadline,
                                   std::stop_token stop = {});

struct CapturedProcess {
    ProcessOutcome outcome;
    std::string out;
    std::string err;
};

/// run_process() collecting both streams into strings.
Result<CapturedProcess> run_captured(const std::vector<std::string>& argv,
                                     std::chrono::milliseconds timeout);

/// Render argv for log messages.
std::string join_argv(const std::vector<std::string>& argv);

}  // namespace sandbox_orchestrator

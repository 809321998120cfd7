/**
 * @file types.hpp
 * @brief Fundamental types used throughout SandboxOrchestrator.
 *
 * Defines ExecutionId, ContainerId, ExecutionStatus, EventType and other
 * shared vocabulary types. All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace sandbox_orchestrator {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using ExecutionId = std::string;
using ContainerId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Execution Status
// ─────────────────────────────────────────────

enum class ExecutionStatus : uint8_t {
    Pending,       ///< Accepted, nothing started yet
    Running,       ///< Workspace prepared, script in flight
    Completed,     ///< Script exited with code 0
    Failed,        ///< Script exited non-zero
    Timeout,       ///< Wall-clock budget exceeded
    Error          ///< Infrastructure failure outside the script
};

[[nodiscard]] constexpr std::string_view to_string(ExecutionStatus status) noexcept {
    switch (status) {
        case ExecutionStatus::Pending:   return "pending";
        case ExecutionStatus::Running:   return "running";
        case ExecutionStatus::Completed: return "completed";
        case ExecutionStatus::Failed:    return "failed";
        case ExecutionStatus::Timeout:   return "timeout";
        case ExecutionStatus::Error:     return "error";
    }
    return "unknown";
}

/// True for the four statuses a caller may receive.
[[nodiscard]] constexpr bool is_terminal(ExecutionStatus status) noexcept {
    return status == ExecutionStatus::Completed
        || status == ExecutionStatus::Failed
        || status == ExecutionStatus::Timeout
        || status == ExecutionStatus::Error;
}

// ─────────────────────────────────────────────
// Event Type
// ─────────────────────────────────────────────

enum class EventType : uint8_t {
    Status,
    Output,
    ErrorOutput,
    Completed,
    Failed,
    Timeout,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(EventType type) noexcept {
    switch (type) {
        case EventType::Status:      return "status";
        case EventType::Output:      return "output";
        case EventType::ErrorOutput: return "error_output";
        case EventType::Completed:   return "completed";
        case EventType::Failed:      return "failed";
        case EventType::Timeout:     return "timeout";
        case EventType::Error:       return "error";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Container State
// ─────────────────────────────────────────────

enum class ContainerState : uint8_t {
    Creating,
    Idle,          ///< Waiting in the pool
    InUse,         ///< Checked out by one execution
    Cleaning,      ///< Being scrubbed after release
    Destroyed
};

[[nodiscard]] constexpr std::string_view to_string(ContainerState state) noexcept {
    switch (state) {
        case ContainerState::Creating:  return "creating";
        case ContainerState::Idle:      return "idle";
        case ContainerState::InUse:     return "in_use";
        case ContainerState::Cleaning:  return "cleaning";
        case ContainerState::Destroyed: return "destroyed";
    }
    return "unknown";
}

/**
 * @brief Format a wall-clock time point as ISO 8601 UTC with milliseconds.
 */
std::string format_timestamp(Timestamp ts);

}  // namespace sandbox_orchestrator

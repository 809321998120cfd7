/**
 * @file execution.hpp
 * @brief Execution request and result records.
 */

#pragma once

#include "core/types.hpp"
#include "results/result_assembler.hpp"

#include <json/json.h>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sandbox_orchestrator {

/**
 * @brief One request to run a script in a sandbox. Immutable once submitted.
 */
struct ExecutionRequest {
    ExecutionId id;
    std::string script;                                  ///< Path, relative to scripts_root unless absolute
    Json::Value params{Json::objectValue};
    std::map<std::string, std::string> overrides;        ///< Relative path → file content
    std::vector<std::string> dependencies;               ///< pip requirement specifiers
    std::optional<std::chrono::seconds> timeout;         ///< Replaces execution.timeout_s
};

struct ExecutionResult {
    ExecutionId id;
    ExecutionStatus status = ExecutionStatus::Pending;
    std::string output;                                  ///< Captured stdout
    std::optional<std::string> error;                    ///< Captured stderr or failure message
    std::optional<int> exit_code;
    Duration duration{0};
    std::vector<ResultFile> result_files;
    bool ephemeral_container = false;
    bool output_truncated = false;
};

[[nodiscard]] Json::Value to_json(const ExecutionResult& result);

}  // namespace sandbox_orchestrator

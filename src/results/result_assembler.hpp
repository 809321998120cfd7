/**
 * @file result_assembler.hpp
 * @brief Classifies files a script produced into result descriptors.
 */

#pragma once

#include "workspace/workspace.hpp"

#include <json/json.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sandbox_orchestrator {

enum class ResultKind : uint8_t {
    Plot,
    Table,
    Data,
    Report,
    Video,
    Animation
};

[[nodiscard]] constexpr std::string_view to_string(ResultKind kind) noexcept {
    switch (kind) {
        case ResultKind::Plot:      return "plot";
        case ResultKind::Table:     return "table";
        case ResultKind::Data:      return "data";
        case ResultKind::Report:    return "report";
        case ResultKind::Video:     return "video";
        case ResultKind::Animation: return "animation";
    }
    return "unknown";
}

/// Kind by file extension (case-insensitive); nullopt if not an artifact type.
[[nodiscard]] std::optional<ResultKind> detect_kind(const std::filesystem::path& file);

struct ResultFile {
    ResultKind kind;
    std::string name;               ///< File name
    std::string path;               ///< Relative to the code directory, '/'-separated
    uint64_t size = 0;
};

/**
 * @brief Enumerate artifact files below `dir`, sorted by relative path.
 *
 * Files listed in `inputs` with an unchanged size were staged, not
 * produced, and are skipped. File contents are never read.
 */
[[nodiscard]] std::vector<ResultFile> collect_result_files(const std::filesystem::path& dir,
                                                           const Manifest& inputs = {});

[[nodiscard]] Json::Value to_json(const ResultFile& file);
[[nodiscard]] Json::Value to_json(const std::vector<ResultFile>& files);

}  // namespace sandbox_orchestrator

/**
 * @file result_assembler.cpp
 * @brief Result file discovery and classification.
 */

#include "results/result_assembler.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace sandbox_orchestrator {

namespace fs = std::filesystem;

namespace {

constexpr std::array<std::pair<std::string_view, ResultKind>, 13> kExtensionKinds{{
    {".png",  ResultKind::Plot},
    {".jpg",  ResultKind::Plot},
    {".jpeg", ResultKind::Plot},
    {".svg",  ResultKind::Plot},
    {".csv",  ResultKind::Table},
    {".xlsx", ResultKind::Table},
    {".json", ResultKind::Data},
    {".md",   ResultKind::Report},
    {".txt",  ResultKind::Report},
    {".html", ResultKind::Report},
    {".pdf",  ResultKind::Report},
    {".mp4",  ResultKind::Video},
    {".gif",  ResultKind::Animation},
}};

}  // anonymous namespace

std::optional<ResultKind> detect_kind(const fs::path& file) {
    auto ext = file.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& [known, kind] : kExtensionKinds) {
        if (ext == known) return kind;
    }
    return std::nullopt;
}

std::vector<ResultFile> collect_result_files(const fs::path& dir, const Manifest& inputs) {
    std::vector<ResultFile> files;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return files;

    for (auto it = fs::recursive_directory_iterator(dir, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) continue;

        auto kind = detect_kind(it->path());
        if (!kind) continue;

        auto size = it->file_size(entry_ec);
        if (entry_ec) continue;

        auto relative = it->path().lexically_relative(dir).generic_string();
        if (auto staged = inputs.find(relative); staged != inputs.end() && staged->second == size) {
            continue;
        }

        files.push_back(ResultFile{
            .kind = *kind,
            .name = it->path().filename().string(),
            .path = std::move(relative),
            .size = size
        });
    }

    std::sort(files.begin(), files.end(),
              [](const ResultFile& a, const ResultFile& b) { return a.path < b.path; });
    return files;
}

Json::Value to_json(const ResultFile& file) {
    Json::Value json;
    json["type"] = std::string(to_string(file.kind));
    json["name"] = file.name;
    json["path"] = file.path;
    json["size"] = static_cast<Json::UInt64>(file.size);
    return json;
}

Json::Value to_json(const std::vector<ResultFile>& files) {
    Json::Value array(Json::arrayValue);
    for (const auto& file : files) {
        array.append(to_json(file));
    }
    return array;
}

}  // namespace sandbox_orchestrator

/**
 * @file workspace.cpp
 * @brief Workspace staging implementation.
 */

#include "workspace/workspace.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>

namespace sandbox_orchestrator {

namespace fs = std::filesystem;

namespace {

constexpr size_t kMaxIdInDirName = 64;

Error workspace_error(std::string message) {
    return Error{std::move(message), ErrorKind::Workspace};
}

Error workspace_error(const std::string& what, const std::error_code& ec) {
    return Error{what + ": " + ec.message(), ErrorKind::Workspace};
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Workspace
// ─────────────────────────────────────────────

Workspace::Workspace(fs::path root, std::string dir_name)
    : root_(std::move(root)), dir_(root_ / dir_name) {}

Workspace::~Workspace() {
    remove();
}

Workspace::Workspace(Workspace&& other) noexcept
    : root_(std::move(other.root_))
    , dir_(std::move(other.dir_))
    , script_name_(std::move(other.script_name_))
    , manifest_(std::move(other.manifest_)) {
    other.root_.clear();
}

Workspace& Workspace::operator=(Workspace&& other) noexcept {
    if (this != &other) {
        remove();
        root_ = std::move(other.root_);
        dir_ = std::move(other.dir_);
        script_name_ = std::move(other.script_name_);
        manifest_ = std::move(other.manifest_);
        other.root_.clear();
    }
    return *this;
}

void Workspace::remove() noexcept {
    if (root_.empty()) return;
    std::error_code ec;
    fs::remove_all(root_, ec);
    root_.clear();
}

// ─────────────────────────────────────────────
// WorkspaceBuilder
// ─────────────────────────────────────────────

WorkspaceBuilder::WorkspaceBuilder(fs::path scratch_root,
                                   fs::path scripts_root,
                                   std::string dir_name)
    : scratch_root_(std::move(scratch_root))
    , scripts_root_(std::move(scripts_root))
    , dir_name_(std::move(dir_name)) {}

std::string WorkspaceBuilder::sanitize_id(std::string_view id) {
    std::string out;
    out.reserve(std::min(id.size(), kMaxIdInDirName));
    for (char c : id.substr(0, kMaxIdInDirName)) {
        bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
                 || (c >= '0' && c <= '9') || c == '-' || c == '_';
        out += keep ? c : '_';
    }
    return out;
}

Result<fs::path> WorkspaceBuilder::resolve_script(const std::string& script_ref) const {
    if (script_ref.empty()) {
        return workspace_error("Empty script reference");
    }
    fs::path path(script_ref);
    if (path.is_relative()) {
        path = scripts_root_ / path;
    }
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return workspace_error("Script not found: " + path.string());
    }
    return path;
}

Result<fs::path> WorkspaceBuilder::check_override_path(std::string_view relative) {
    if (relative.empty()) {
        return workspace_error("Empty override path");
    }
    fs::path path(relative);
    if (path.has_root_path()) {
        return workspace_error("Override path must be relative: " + std::string(relative));
    }
    for (const auto& part : path) {
        if (part == "..") {
            return workspace_error("Override path escapes the code directory: "
                                   + std::string(relative));
        }
    }
    path = path.lexically_normal();
    if (path.empty() || path == "." || !path.has_filename()) {
        return workspace_error("Override path names no file: " + std::string(relative));
    }
    return path;
}

Result<void> WorkspaceBuilder::check_dependencies(const std::vector<std::string>& specs) {
    for (const auto& spec : specs) {
        if (spec.empty()) {
            return workspace_error("Empty dependency specifier");
        }
        if (spec.front() == '-') {
            return workspace_error("Dependency specifier looks like an option: " + spec);
        }
        if (spec.find_first_of("\r\n") != std::string::npos) {
            return workspace_error("Dependency specifier contains a line break");
        }
    }
    return Result<void>{};
}

Result<Workspace> WorkspaceBuilder::build(const ExecutionId& id,
                                          const std::string& script_ref,
                                          const Json::Value& params,
                                          const std::map<std::string, std::string>& overrides) const {
    auto script = resolve_script(script_ref);
    if (!script) return script.error();

    if (!params.isNull() && !params.isObject()) {
        return workspace_error("Parameters must be a JSON object");
    }

    std::vector<std::pair<fs::path, const std::string*>> staged_overrides;
    staged_overrides.reserve(overrides.size());
    for (const auto& [relative, content] : overrides) {
        auto checked = check_override_path(relative);
        if (!checked) return checked.error();
        staged_overrides.emplace_back(*checked, &content);
    }

    std::error_code ec;
    fs::create_directories(scratch_root_, ec);
    if (ec) return workspace_error("Cannot create " + scratch_root_.string(), ec);

    std::string pattern = (scratch_root_ / ("exec_" + sanitize_id(id) + "_XXXXXX")).string();
    if (::mkdtemp(pattern.data()) == nullptr) {
        return workspace_error("mkdtemp failed under " + scratch_root_.string() + ": "
                               + std::strerror(errno));
    }

    // Owns the directory from here on; every early return removes it
    Workspace ws(fs::path(pattern), dir_name_);
    ws.script_name_ = script->filename().string();

    auto code_dir = ws.code_dir();
    fs::create_directories(code_dir, ec);
    if (ec) return workspace_error("Cannot create " + code_dir.string(), ec);

    fs::copy(script->parent_path(), code_dir,
             fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
    if (ec) return workspace_error("Cannot copy " + script->parent_path().string(), ec);

    for (const auto& [relative, content] : staged_overrides) {
        auto target = code_dir / relative;
        fs::create_directories(target.parent_path(), ec);
        if (ec) return workspace_error("Cannot create " + target.parent_path().string(), ec);

        std::ofstream ofs(target, std::ios::binary | std::ios::trunc);
        ofs.write(content->data(), static_cast<std::streamsize>(content->size()));
        if (!ofs) return workspace_error("Cannot write override " + relative.string());
    }

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    std::ofstream params_out(ws.params_file(), std::ios::trunc);
    params_out << Json::writeString(writer, params.isNull() ? Json::Value(Json::objectValue) : params);
    params_out.close();
    if (!params_out) return workspace_error("Cannot write " + ws.params_file().string());

    ws.manifest_ = scan_manifest(code_dir);
    return Result<Workspace>(std::move(ws));
}

Manifest scan_manifest(const fs::path& dir) {
    Manifest manifest;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(dir, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) continue;
        auto size = it->file_size(entry_ec);
        if (entry_ec) continue;
        manifest[it->path().lexically_relative(dir).generic_string()] = size;
    }
    return manifest;
}

}  // namespace sandbox_orchestrator

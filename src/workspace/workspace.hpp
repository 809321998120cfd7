/**
 * @file workspace.hpp
 * @brief Per-execution scratch directory on the host.
 *
 * Layout:
 *   <scratch_root>/exec_<id>_XXXXXX/
 *       workspace/code/        copy of the script's directory, overrides applied
 *       workspace/params.json  input parameters
 *       collected/             results copied back from the container
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <json/json.h>

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace sandbox_orchestrator {

/// Relative path (generic form) → size in bytes of every staged input file.
using Manifest = std::map<std::string, uint64_t>;

/**
 * @brief Owns one execution's scratch directory; removes it when destroyed.
 */
class Workspace {
public:
    ~Workspace();

    Workspace(Workspace&& other) noexcept;
    Workspace& operator=(Workspace&& other) noexcept;
    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    /// The directory uploaded into the container.
    [[nodiscard]] const std::filesystem::path& dir() const noexcept { return dir_; }
    [[nodiscard]] std::filesystem::path code_dir() const { return dir_ / "code"; }
    [[nodiscard]] std::filesystem::path params_file() const { return dir_ / "params.json"; }
    [[nodiscard]] std::filesystem::path collect_dir() const { return root_ / "collected"; }

    /// File name of the entry script inside code/.
    [[nodiscard]] const std::string& script_name() const noexcept { return script_name_; }
    [[nodiscard]] const Manifest& manifest() const noexcept { return manifest_; }

private:
    friend class WorkspaceBuilder;
    Workspace(std::filesystem::path root, std::string dir_name);

    void remove() noexcept;

    std::filesystem::path root_;
    std::filesystem::path dir_;
    std::string script_name_;
    Manifest manifest_;
};

/**
 * @brief Stages scripts, overrides and parameters into a fresh Workspace.
 *
 * Every failure is reported as ErrorKind::Workspace and leaves nothing
 * behind on disk.
 */
class WorkspaceBuilder {
public:
    /**
     * @param scratch_root Parent of all workspaces; created on demand
     * @param scripts_root Base for relative script references
     * @param dir_name     Name of the uploaded directory; must match the
     *                     last component of the container workspace path
     */
    WorkspaceBuilder(std::filesystem::path scratch_root,
                     std::filesystem::path scripts_root,
                     std::string dir_name = "workspace");

    [[nodiscard]] Result<Workspace> build(const ExecutionId& id,
                                          const std::string& script_ref,
                                          const Json::Value& params,
                                          const std::map<std::string, std::string>& overrides) const;

    /// Resolve a script reference to an existing regular file.
    [[nodiscard]] Result<std::filesystem::path> resolve_script(const std::string& script_ref) const;

    /// Reject absolute paths and anything that climbs out of code/.
    [[nodiscard]] static Result<std::filesystem::path> check_override_path(std::string_view relative);

    /// Reject empty specifiers and anything pip would read as an option.
    [[nodiscard]] static Result<void> check_dependencies(const std::vector<std::string>& specs);

    [[nodiscard]] static std::string sanitize_id(std::string_view id);

    [[nodiscard]] const std::filesystem::path& scratch_root() const noexcept { return scratch_root_; }

private:
    std::filesystem::path scratch_root_;
    std::filesystem::path scripts_root_;
    std::string dir_name_;
};

/// Build the manifest of every regular file below `dir`.
Manifest scan_manifest(const std::filesystem::path& dir);

}  // namespace sandbox_orchestrator

/**
 * @file fake_runtime.hpp
 * @brief In-process container engine for testing and dry runs.
 *
 * Each fake container is a directory on the host; container paths map
 * below it. Commands run as registered C++ "programs" chosen by the
 * basename of an argv element, so tests can script output, exit codes,
 * sleeps and produced files, and inject engine faults per operation.
 */

#pragma once

#include "sandbox/runtime.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sandbox_orchestrator {

enum class FakeOp : uint8_t {
    Create,
    Start,
    Inspect,
    Exec,
    PutArchive,
    CopyFrom,
    Remove
};

/**
 * @brief The view a fake program gets of its own execution.
 */
class FakeProcess {
public:
    FakeProcess(const ExecSpec& spec,
                std::filesystem::path container_root,
                const ChunkCallback& on_chunk,
                SteadyTime deadline,
                std::stop_token stop);

    void out(std::string_view text);
    void err(std::string_view text);

    /// Sleep, waking early at the deadline or on stop. False if woken early.
    bool sleep_for(Duration duration);

    /// Write `content` to `relative` under the working directory.
    bool write_file(const std::filesystem::path& relative, std::string_view content);

    /// Host location of an absolute container path.
    [[nodiscard]] std::filesystem::path host_path(std::string_view container_path) const;
    [[nodiscard]] std::filesystem::path workdir() const { return host_path(spec_.workdir); }
    [[nodiscard]] const ExecSpec& spec() const noexcept { return spec_; }

    [[nodiscard]] bool interrupted() const noexcept { return timed_out_ || cancelled_; }
    [[nodiscard]] bool timed_out() const noexcept { return timed_out_; }
    [[nodiscard]] bool cancelled() const noexcept { return cancelled_; }

private:
    const ExecSpec& spec_;
    std::filesystem::path root_;
    const ChunkCallback& on_chunk_;
    SteadyTime deadline_;
    std::stop_token stop_;
    bool timed_out_{false};
    bool cancelled_{false};
};

/// Returns the exit code.
using FakeProgram = std::function<int(FakeProcess&)>;

class FakeRuntime : public ISandboxRuntime {
public:
    /// An empty `root` creates a private directory under the system temp dir.
    explicit FakeRuntime(std::filesystem::path root = {});
    ~FakeRuntime() override;

    FakeRuntime(const FakeRuntime&) = delete;
    FakeRuntime& operator=(const FakeRuntime&) = delete;

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

    [[nodiscard]] std::string_view name() const noexcept override { return "fake"; }

    // ── Scripting ──────────────────────────────

    /// Programs are matched against argv basenames, last element first.
    void register_program(std::string name, FakeProgram program);

    /// Make the next `times` calls of `op` fail with an engine error.
    void fail_next(FakeOp op, int times = 1, std::string message = "injected engine fault");

    /// Delay added to every create(), to model slow container startup.
    void set_create_delay(Duration delay);

    /// Mark a container as exited, as if it crashed.
    void kill_container(const ContainerId& id);

    // ── Observation ────────────────────────────

    [[nodiscard]] size_t live_containers() const;
    [[nodiscard]] size_t created_total() const noexcept { return created_total_.load(); }
    [[nodiscard]] size_t removed_total() const noexcept { return removed_total_.load(); }
    [[nodiscard]] std::vector<ContainerId> container_ids() const;
    [[nodiscard]] std::vector<ExecSpec> exec_history() const;
    [[nodiscard]] std::filesystem::path container_root(const ContainerId& id) const;
    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    struct FakeContainer {
        std::string name;
        std::filesystem::path root;
        bool running{false};
    };

    Result<void> take_fault(FakeOp op);
    Result<std::filesystem::path> running_root(const ContainerId& id) const;
    FakeProgram find_program(const ExecSpec& spec) const;

    std::filesystem::path root_;
    bool owns_root_{false};

    mutable std::mutex mutex_;
    std::unordered_map<ContainerId, FakeContainer> containers_;
    std::map<std::string, FakeProgram, std::less<>> programs_;
    std::map<FakeOp, std::pair<int, std::string>> faults_;
    std::vector<ExecSpec> exec_history_;
    Duration create_delay_{0};
    uint64_t next_id_{1};

    std::atomic<size_t> created_total_{0};
    std::atomic<size_t> removed_total_{0};
};

}  // namespace sandbox_orchestrator

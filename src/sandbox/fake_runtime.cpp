/**
 * @file fake_runtime.cpp
 * @brief FakeRuntime implementation: directory-backed containers and scripted programs.
 */

#include "sandbox/fake_runtime.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <thread>

namespace sandbox_orchestrator {

namespace fs = std::filesystem;

namespace {

constexpr auto kSleepSlice = std::chrono::milliseconds(5);

std::string_view strip_leading_slash(std::string_view path) {
    while (!path.empty() && path.front() == '/') path.remove_prefix(1);
    return path;
}

/// Paths following each `rm -rf` in a shell command, up to the next `;`, `&&` or redirect.
std::vector<std::string> removal_targets(const std::string& command) {
    std::vector<std::string> targets;
    std::istringstream words(command);
    std::string word;
    std::string previous;
    bool collecting = false;
    while (words >> word) {
        if (previous == "rm" && word == "-rf") {
            collecting = true;
        } else if (collecting) {
            bool ends_clause = word.back() == ';';
            if (ends_clause) word.pop_back();
            if (word == "&&" || word.find('>') != std::string::npos) {
                collecting = false;
            } else if (!word.empty()) {
                targets.push_back(word);
            }
            if (ends_clause) collecting = false;
        }
        previous = word;
    }
    return targets;
}

/// Stands in for the pool's cleanup shell script: honours its `rm -rf` targets.
int simulated_cleanup(FakeProcess& proc) {
    const auto& argv = proc.spec().argv;
    if (argv.empty()) return 1;

    std::error_code ec;
    for (const auto& target : removal_targets(argv.back())) {
        if (target.size() > 2 && target.ends_with("/*")) {
            auto dir = proc.host_path(target.substr(0, target.size() - 2));
            if (!fs::exists(dir, ec)) continue;
            for (const auto& entry : fs::directory_iterator(dir, ec)) {
                fs::remove_all(entry.path(), ec);
            }
        } else {
            fs::remove_all(proc.host_path(target), ec);
        }
        if (ec) return 1;
    }
    return 0;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// FakeProcess
// ─────────────────────────────────────────────

FakeProcess::FakeProcess(const ExecSpec& spec,
                         fs::path container_root,
                         const ChunkCallback& on_chunk,
                         SteadyTime deadline,
                         std::stop_token stop)
    : spec_(spec)
    , root_(std::move(container_root))
    , on_chunk_(on_chunk)
    , deadline_(deadline)
    , stop_(std::move(stop)) {}

void FakeProcess::out(std::string_view text) {
    if (on_chunk_) on_chunk_(StreamKind::Stdout, text);
}

void FakeProcess::err(std::string_view text) {
    if (on_chunk_) on_chunk_(StreamKind::Stderr, text);
}

bool FakeProcess::sleep_for(Duration duration) {
    auto until = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < until) {
        if (stop_.stop_requested()) {
            cancelled_ = true;
            return false;
        }
        if (std::chrono::steady_clock::now() >= deadline_) {
            timed_out_ = true;
            return false;
        }
        std::this_thread::sleep_for(kSleepSlice);
    }
    return true;
}

bool FakeProcess::write_file(const fs::path& relative, std::string_view content) {
    auto target = workdir() / relative;
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) return false;
    std::ofstream ofs(target, std::ios::binary | std::ios::trunc);
    ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
    return static_cast<bool>(ofs);
}

fs::path FakeProcess::host_path(std::string_view container_path) const {
    return root_ / strip_leading_slash(container_path);
}

// ─────────────────────────────────────────────
// FakeRuntime
// ─────────────────────────────────────────────

FakeRuntime::FakeRuntime(fs::path root) : root_(std::move(root)) {
    if (root_.empty()) {
        std::string pattern = (fs::temp_directory_path() / "fake_engine_XXXXXX").string();
        if (char* made = ::mkdtemp(pattern.data())) {
            root_ = made;
            owns_root_ = true;
        } else {
            root_ = fs::temp_directory_path() / "fake_engine";
        }
    }
    std::error_code ec;
    fs::create_directories(root_, ec);

    programs_.emplace("sh", simulated_cleanup);
}

FakeRuntime::~FakeRuntime() {
    if (owns_root_) {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }
}

Result<void> FakeRuntime::take_fault(FakeOp op) {
    std::lock_guard lock(mutex_);
    auto it = faults_.find(op);
    if (it == faults_.end() || it->second.first <= 0) {
        return Result<void>{};
    }
    auto message = it->second.second;
    if (--it->second.first == 0) {
        faults_.erase(it);
    }
    return Error{message};
}

Result<fs::path> FakeRuntime::running_root(const ContainerId& id) const {
    std::lock_guard lock(mutex_);
    auto it = containers_.find(id);
    if (it == containers_.end()) {
        return Error{"No such container: " + id};
    }
    if (!it->second.running) {
        return Error{"Container " + id + " is not running"};
    }
    return it->second.root;
}

Result<ContainerId> FakeRuntime::create(const ContainerSpec& spec) {
    Duration delay;
    {
        std::lock_guard lock(mutex_);
        delay = create_delay_;
    }
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
    if (auto fault = take_fault(FakeOp::Create); !fault) return fault.error();

    std::lock_guard lock(mutex_);
    ContainerId id = "fake-" + std::to_string(next_id_++);
    FakeContainer container{.name = spec.name, .root = root_ / id, .running = false};

    std::error_code ec;
    fs::create_directories(container.root / "tmp", ec);
    if (ec) {
        return Error{"Cannot create container root: " + ec.message()};
    }
    containers_.emplace(id, std::move(container));
    ++created_total_;
    return id;
}

Result<void> FakeRuntime::start(const ContainerId& id) {
    if (auto fault = take_fault(FakeOp::Start); !fault) return fault;

    std::lock_guard lock(mutex_);
    auto it = containers_.find(id);
    if (it == containers_.end()) {
        return Error{"No such container: " + id};
    }
    it->second.running = true;
    return Result<void>{};
}

Result<ContainerStatus> FakeRuntime::inspect(const ContainerId& id) {
    if (auto fault = take_fault(FakeOp::Inspect); !fault) {
        return Error{fault.error().message, ErrorKind::Liveness};
    }

    std::lock_guard lock(mutex_);
    auto it = containers_.find(id);
    if (it == containers_.end()) {
        return Error{"No such container: " + id, ErrorKind::Liveness};
    }
    bool running = it->second.running;
    return ContainerStatus{.running = running, .state = running ? "running" : "exited"};
}

Result<ExecOutcome> FakeRuntime::exec(const ContainerId& id,
                                      const ExecSpec& spec,
                                      const ChunkCallback& on_chunk,
                                      SteadyTime deadline,
                                      std::stop_token stop) {
    if (spec.argv.empty()) {
        return Error{"exec requires a command"};
    }
    if (auto fault = take_fault(FakeOp::Exec); !fault) return fault.error();

    auto root = running_root(id);
    if (!root) return root.error();

    FakeProgram program;
    {
        std::lock_guard lock(mutex_);
        exec_history_.push_back(spec);
    }
    program = find_program(spec);

    auto start = std::chrono::steady_clock::now();
    FakeProcess process(spec, *root, on_chunk, deadline, std::move(stop));
    int exit_code = program ? program(process) : 0;

    ExecOutcome outcome;
    outcome.timed_out = process.timed_out();
    outcome.cancelled = process.cancelled();
    outcome.exit_code = process.interrupted() ? -9 : exit_code;
    outcome.elapsed = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - start);
    return outcome;
}

Result<void> FakeRuntime::put_archive(const ContainerId& id,
                                      const fs::path& host_dir,
                                      const std::string& container_parent) {
    if (auto fault = take_fault(FakeOp::PutArchive); !fault) return fault;

    auto root = running_root(id);
    if (!root) return root.error();

    auto target = *root / strip_leading_slash(container_parent) / host_dir.filename();
    std::error_code ec;
    fs::create_directories(target, ec);
    if (!ec) {
        fs::copy(host_dir, target,
                 fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
    }
    if (ec) {
        return Error{"put_archive into " + id + " failed: " + ec.message()};
    }
    return Result<void>{};
}

Result<void> FakeRuntime::copy_from(const ContainerId& id,
                                    const std::string& container_path,
                                    const fs::path& host_parent) {
    if (auto fault = take_fault(FakeOp::CopyFrom); !fault) return fault;

    auto root = running_root(id);
    if (!root) return root.error();

    auto source = *root / strip_leading_slash(container_path);
    std::error_code ec;
    if (!fs::exists(source, ec)) {
        return Error{"No such path in container " + id + ": " + container_path};
    }
    auto target = host_parent / source.filename();
    fs::create_directories(target, ec);
    if (!ec) {
        fs::copy(source, target,
                 fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
    }
    if (ec) {
        return Error{"copy_from " + id + " failed: " + ec.message()};
    }
    return Result<void>{};
}

Result<void> FakeRuntime::remove(const ContainerId& id) {
    if (auto fault = take_fault(FakeOp::Remove); !fault) return fault;

    fs::path root;
    {
        std::lock_guard lock(mutex_);
        auto it = containers_.find(id);
        if (it == containers_.end()) {
            return Result<void>{};
        }
        root = it->second.root;
        containers_.erase(it);
    }
    ++removed_total_;
    std::error_code ec;
    fs::remove_all(root, ec);
    return Result<void>{};
}

void FakeRuntime::register_program(std::string name, FakeProgram program) {
    std::lock_guard lock(mutex_);
    programs_.insert_or_assign(std::move(name), std::move(program));
}

void FakeRuntime::fail_next(FakeOp op, int times, std::string message) {
    std::lock_guard lock(mutex_);
    faults_[op] = {times, std::move(message)};
}

void FakeRuntime::set_create_delay(Duration delay) {
    std::lock_guard lock(mutex_);
    create_delay_ = delay;
}

void FakeRuntime::kill_container(const ContainerId& id) {
    std::lock_guard lock(mutex_);
    if (auto it = containers_.find(id); it != containers_.end()) {
        it->second.running = false;
    }
}

size_t FakeRuntime::live_containers() const {
    std::lock_guard lock(mutex_);
    return containers_.size();
}

std::vector<ContainerId> FakeRuntime::container_ids() const {
    std::lock_guard lock(mutex_);
    std::vector<ContainerId> ids;
    ids.reserve(containers_.size());
    for (const auto& [id, _] : containers_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<ExecSpec> FakeRuntime::exec_history() const {
    std::lock_guard lock(mutex_);
    return exec_history_;
}

fs::path FakeRuntime::container_root(const ContainerId& id) const {
    std::lock_guard lock(mutex_);
    auto it = containers_.find(id);
    return it == containers_.end() ? fs::path{} : it->second.root;
}

FakeProgram FakeRuntime::find_program(const ExecSpec& spec) const {
    std::lock_guard lock(mutex_);
    for (auto it = spec.argv.rbegin(); it != spec.argv.rend(); ++it) {
        auto base = fs::path(*it).filename().string();
        if (auto found = programs_.find(base); found != programs_.end()) {
            return found->second;
        }
    }
    return {};
}

}  // namespace sandbox_orchestrator

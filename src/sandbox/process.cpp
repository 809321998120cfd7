/**
 * @file process.cpp
 * @brief fork/exec with piped output, polled until exit or deadline.
 */

#include "sandbox/process.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace sandbox_orchestrator {

namespace {

constexpr size_t kReadChunk = 4096;
constexpr int kPollSliceMs = 50;

/**
 * @brief Owns a pipe pair; closes whatever ends are still open.
 */
struct Pipe {
    int fds[2] = {-1, -1};

    ~Pipe() {
        close_read();
        close_write();
    }

    bool open() { return ::pipe2(fds, O_CLOEXEC) == 0; }

    void close_read() {
        if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; }
    }
    void close_write() {
        if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; }
    }
};

int remaining_ms(SteadyTime deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    if (left <= 0) return 0;
    return static_cast<int>(std::min<long long>(left, kPollSliceMs));
}

/// Runs in the forked child: only async-signal-safe calls from here on.
[[noreturn]] void exec_child(char* const* args, Pipe& out, Pipe& err, Pipe& status) {
    ::setpgid(0, 0);
    ::dup2(out.fds[1], STDOUT_FILENO);
    ::dup2(err.fds[1], STDERR_FILENO);

    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
        ::close(devnull);
    }

    ::execvp(args[0], args);

    // Report errno through the CLOEXEC status pipe
    int code = errno;
    ssize_t ignored = ::write(status.fds[1], &code, sizeof(code));
    (void)ignored;
    ::_exit(127);
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return -WTERMSIG(status);
    return -1;
}

}  // anonymous namespace

std::string join_argv(const std::vector<std::string>& argv) {
    std::string joined;
    for (const auto& arg : argv) {
        if (!joined.empty()) joined += ' ';
        joined += arg;
    }
    return joined;
}

Result<ProcessOutcome> run_process(const std::vector<std::string>& argv,
                                   const ChunkCallback& on_chunk,
                                   SteadyTime deadline,
                                   std::stop_token stop) {
    if (argv.empty()) {
        return Error{"Empty command line"};
    }

    Pipe out, err, status;
    if (!out.open() || !err.open() || !status.open()) {
        return Error{"Failed to create pipes: " + std::string(std::strerror(errno))};
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    auto start = std::chrono::steady_clock::now();

    pid_t pid = ::fork();
    if (pid < 0) {
        return Error{"Failed to fork: " + std::string(std::strerror(errno))};
    }
    if (pid == 0) {
        exec_child(args.data(), out, err, status);
    }

    ::setpgid(pid, pid);
    out.close_write();
    err.close_write();
    status.close_write();

    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(status.fds[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int ignored = 0;
        ::waitpid(pid, &ignored, 0);
        return Error{"Failed to execute '" + argv.front() + "': " + std::strerror(exec_errno)};
    }

    ProcessOutcome outcome;
    bool killed = false;
    auto kill_group = [&](bool timed_out) {
        if (killed) return;
        killed = true;
        outcome.timed_out = timed_out;
        outcome.cancelled = !timed_out;
        ::kill(-pid, SIGKILL);
    };

    pollfd fds[2] = {
        {out.fds[0], POLLIN, 0},
        {err.fds[0], POLLIN, 0},
    };
    char buffer[kReadChunk];

    while (fds[0].fd >= 0 || fds[1].fd >= 0) {
        if (!killed) {
            if (stop.stop_requested()) {
                kill_group(false);
            } else if (std::chrono::steady_clock::now() >= deadline) {
                kill_group(true);
            }
        }

        int ready = ::poll(fds, 2, killed ? kPollSliceMs : remaining_ms(deadline));
        if (ready < 0) {
            if (errno == EINTR) continue;
            kill_group(false);
            break;
        }
        if (ready == 0) continue;

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t got = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (got > 0) {
                if (on_chunk) {
                    on_chunk(i == 0 ? StreamKind::Stdout : StreamKind::Stderr,
                             std::string_view(buffer, static_cast<size_t>(got)));
                }
            } else if (got == 0 || (errno != EINTR && errno != EAGAIN)) {
                fds[i].fd = -1;
            }
        }
    }

    // Pipes are closed; the child may still be running without them
    int wait_status = 0;
    while (true) {
        pid_t done = ::waitpid(pid, &wait_status, WNOHANG);
        if (done == pid) break;
        if (done < 0 && errno != EINTR) {
            wait_status = 0;
            break;
        }
        if (!killed) {
            if (stop.stop_requested()) {
                kill_group(false);
            } else if (std::chrono::steady_clock::now() >= deadline) {
                kill_group(true);
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    outcome.exit_code = decode_wait_status(wait_status);
    outcome.elapsed = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - start);
    return outcome;
}

Result<CapturedProcess> run_captured(const std::vector<std::string>& argv,
                                     std::chrono::milliseconds timeout) {
    CapturedProcess captured;
    auto result = run_process(
        argv,
        [&captured](StreamKind kind, std::string_view chunk) {
            (kind == StreamKind::Stdout ? captured.out : captured.err).append(chunk);
        },
        std::chrono::steady_clock::now() + timeout);
    if (!result) {
        return result.error();
    }
    captured.outcome = *result;
    return captured;
}

}  // namespace sandbox_orchestrator

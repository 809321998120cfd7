/**
 * @file test_process.cpp
 * @brief Unit tests for the child process runner.
 */

#include "sandbox/process.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace sandbox_orchestrator;
using namespace std::chrono_literals;

namespace {

SteadyTime in(std::chrono::milliseconds ms) {
    return std::chrono::steady_clock::now() + ms;
}

}  // namespace

TEST(ProcessTest, CapturesStdout) {
    auto result = run_captured({"/bin/echo", "hello"}, 5000ms);
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result->outcome.exit_code, 0);
    EXPECT_EQ(result->out, "hello\n");
    EXPECT_TRUE(result->err.empty());
}

TEST(ProcessTest, SeparatesStreamsAndReportsExitCode) {
    auto result = run_captured({"/bin/sh", "-c", "echo out; echo err >&2; exit 7"}, 5000ms);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->outcome.exit_code, 7);
    EXPECT_EQ(result->out, "out\n");
    EXPECT_EQ(result->err, "err\n");
    EXPECT_FALSE(result->outcome.timed_out);
}

TEST(ProcessTest, DeadlineKillsProcessGroup) {
    auto start = std::chrono::steady_clock::now();
    auto result = run_process({"/bin/sh", "-c", "sleep 30 & sleep 30"}, {}, in(100ms));
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->timed_out);
    EXPECT_FALSE(result->cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_NE(result->exit_code, 0);
}

TEST(ProcessTest, StopRequestCancels) {
    std::stop_source source;
    std::jthread canceller([&source] {
        std::this_thread::sleep_for(50ms);
        source.request_stop();
    });
    auto result = run_process({"/bin/sleep", "30"}, {}, in(30000ms), source.get_token());
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->cancelled);
    EXPECT_FALSE(result->timed_out);
}

TEST(ProcessTest, StreamsChunksInOrder) {
    std::string seen;
    auto result = run_process({"/bin/sh", "-c", "printf a; sleep 0.05; printf b"},
        [&seen](StreamKind kind, std::string_view chunk) {
            if (kind == StreamKind::Stdout) seen.append(chunk);
        }, in(5000ms));
    ASSERT_TRUE(result);
    EXPECT_EQ(seen, "ab");
}

TEST(ProcessTest, MissingBinaryIsError) {
    auto result = run_process({"/nonexistent/binary"}, {}, in(1000ms));
    ASSERT_FALSE(result);
    EXPECT_NE(result.error().message.find("/nonexistent/binary"), std::string::npos);
}

TEST(ProcessTest, EmptyCommandIsError) {
    EXPECT_FALSE(run_process({}, {}, in(1000ms)));
}

TEST(ProcessTest, JoinArgv) {
    EXPECT_EQ(join_argv({"docker", "rm", "--force", "abc"}), "docker rm --force abc");
    EXPECT_EQ(join_argv({}), "");
}

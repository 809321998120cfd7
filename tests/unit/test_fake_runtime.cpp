/**
 * @file test_fake_runtime.cpp
 * @brief Unit tests for the in-process container engine.
 */

#include "sandbox/fake_runtime.hpp"
#include "support/test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stop_token>
#include <thread>

using namespace sandbox_orchestrator;
using namespace sandbox_orchestrator::testing;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class FakeRuntimeTest : public ::testing::Test {
protected:
    FakeRuntime runtime_;

    ContainerId started_container() {
        auto id = runtime_.create(ContainerSpec{.name = "c", .image = "python:3.11-slim"});
        EXPECT_TRUE(id);
        EXPECT_TRUE(runtime_.start(*id));
        return *id;
    }

    static SteadyTime in(std::chrono::milliseconds ms) {
        return std::chrono::steady_clock::now() + ms;
    }
};

TEST_F(FakeRuntimeTest, CreateStartInspectRemove) {
    auto id = runtime_.create(ContainerSpec{.name = "c1"});
    ASSERT_TRUE(id);
    auto status = runtime_.inspect(*id);
    ASSERT_TRUE(status);
    EXPECT_FALSE(status->running);
    EXPECT_EQ(status->state, "exited");

    ASSERT_TRUE(runtime_.start(*id));
    EXPECT_TRUE(runtime_.inspect(*id)->running);
    EXPECT_EQ(runtime_.live_containers(), 1u);

    ASSERT_TRUE(runtime_.remove(*id));
    EXPECT_EQ(runtime_.live_containers(), 0u);
    EXPECT_EQ(runtime_.removed_total(), 1u);
    EXPECT_EQ(runtime_.inspect(*id).error().kind, ErrorKind::Liveness);

    // Unknown containers remove cleanly
    EXPECT_TRUE(runtime_.remove("fake-999"));
}

TEST_F(FakeRuntimeTest, FaultInjectionCountsDown) {
    runtime_.fail_next(FakeOp::Create, 2, "daemon down");
    auto first = runtime_.create(ContainerSpec{});
    auto second = runtime_.create(ContainerSpec{});
    auto third = runtime_.create(ContainerSpec{});
    ASSERT_FALSE(first);
    EXPECT_EQ(first.error().message, "daemon down");
    EXPECT_FALSE(second);
    EXPECT_TRUE(third);
    EXPECT_EQ(runtime_.created_total(), 1u);
}

TEST_F(FakeRuntimeTest, ExecRunsProgramAndStreams) {
    auto id = started_container();
    runtime_.register_program("main.py", [](FakeProcess& proc) {
        proc.out("hello ");
        proc.out("world\n");
        proc.err("warning\n");
        return 3;
    });

    std::string out;
    std::string err;
    auto outcome = runtime_.exec(id, ExecSpec{.argv = {"python3", "main.py"}, .workdir = "/workspace/code"},
        [&](StreamKind kind, std::string_view chunk) {
            (kind == StreamKind::Stdout ? out : err).append(chunk);
        }, in(1000ms), {});

    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome->exit_code, 3);
    EXPECT_FALSE(outcome->timed_out);
    EXPECT_EQ(out, "hello world\n");
    EXPECT_EQ(err, "warning\n");
    ASSERT_EQ(runtime_.exec_history().size(), 1u);
    EXPECT_EQ(runtime_.exec_history()[0].workdir, "/workspace/code");
}

TEST_F(FakeRuntimeTest, UnknownProgramSucceedsSilently) {
    auto id = started_container();
    auto outcome = runtime_.exec(id, ExecSpec{.argv = {"true"}}, {}, in(100ms), {});
    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome->exit_code, 0);
}

TEST_F(FakeRuntimeTest, ExecNeedsRunningContainer) {
    auto id = runtime_.create(ContainerSpec{});
    ASSERT_TRUE(id);
    EXPECT_FALSE(runtime_.exec(*id, ExecSpec{.argv = {"true"}}, {}, in(100ms), {}));

    ASSERT_TRUE(runtime_.start(*id));
    runtime_.kill_container(*id);
    EXPECT_FALSE(runtime_.inspect(*id)->running);
    EXPECT_FALSE(runtime_.exec(*id, ExecSpec{.argv = {"true"}}, {}, in(100ms), {}));
    EXPECT_FALSE(runtime_.exec(*id, ExecSpec{}, {}, in(100ms), {}));
}

TEST_F(FakeRuntimeTest, DeadlineInterruptsSleepingProgram) {
    auto id = started_container();
    runtime_.register_program("slow.py", [](FakeProcess& proc) {
        proc.sleep_for(std::chrono::seconds(10));
        return 0;
    });

    auto start = std::chrono::steady_clock::now();
    auto outcome = runtime_.exec(id, ExecSpec{.argv = {"python3", "slow.py"}}, {}, in(50ms), {});
    ASSERT_TRUE(outcome);
    EXPECT_TRUE(outcome->timed_out);
    EXPECT_EQ(outcome->exit_code, -9);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST_F(FakeRuntimeTest, StopInterruptsSleepingProgram) {
    auto id = started_container();
    runtime_.register_program("slow.py", [](FakeProcess& proc) {
        proc.sleep_for(std::chrono::seconds(10));
        return 0;
    });

    std::stop_source source;
    std::jthread canceller([&source] {
        std::this_thread::sleep_for(20ms);
        source.request_stop();
    });
    auto outcome = runtime_.exec(id, ExecSpec{.argv = {"python3", "slow.py"}}, {}, in(10000ms),
                                 source.get_token());
    ASSERT_TRUE(outcome);
    EXPECT_TRUE(outcome->cancelled);
    EXPECT_FALSE(outcome->timed_out);
}

TEST_F(FakeRuntimeTest, PutArchiveAndCopyFromRoundTripFiles) {
    auto id = started_container();
    TempDir host("so_fake_host");
    write_file(host.path() / "workspace" / "code" / "main.py", "print()");

    ASSERT_TRUE(runtime_.put_archive(id, host.path() / "workspace", "/"));
    auto in_container = runtime_.container_root(id) / "workspace" / "code" / "main.py";
    EXPECT_TRUE(fs::exists(in_container));

    runtime_.register_program("main.py", [](FakeProcess& proc) {
        return proc.write_file("out/plot.png", "PNG") ? 0 : 1;
    });
    auto outcome = runtime_.exec(id, ExecSpec{.argv = {"python3", "main.py"},
                                              .workdir = "/workspace/code"},
                                 {}, in(1000ms), {});
    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome->exit_code, 0);

    auto collected = host.path() / "collected";
    ASSERT_TRUE(runtime_.copy_from(id, "/workspace/code", collected));
    EXPECT_EQ(read_file(collected / "code" / "out" / "plot.png"), "PNG");

    EXPECT_FALSE(runtime_.copy_from(id, "/missing", collected));
}

TEST_F(FakeRuntimeTest, CleanupCommandWipesWritableDirs) {
    auto id = started_container();
    auto root = runtime_.container_root(id);
    write_file(root / "workspace" / "code" / "main.py", "print()");
    write_file(root / "tmp" / "scratch.bin", "x");

    auto outcome = runtime_.exec(id, ExecSpec{.argv = {"sh", "-c", "rm -rf /workspace /tmp/*"},
                                              .workdir = "/"},
                                 {}, in(1000ms), {});
    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome->exit_code, 0);
    EXPECT_FALSE(fs::exists(root / "workspace"));
    EXPECT_TRUE(fs::exists(root / "tmp"));
    EXPECT_EQ(count_entries(root / "tmp"), 0u);
}

TEST_F(FakeRuntimeTest, CleanupRemovesOnlyNamedPaths) {
    auto id = started_container();
    auto root = runtime_.container_root(id);
    write_file(root / "work" / "code" / "out.png", "PNG");
    write_file(root / "workspace" / "code" / "main.py", "print()");

    auto outcome = runtime_.exec(
        id, ExecSpec{.argv = {"sh", "-c", "kill -9 -1 2>/dev/null; rm -rf /work 2>/dev/null; exit 0"},
                     .workdir = "/"},
        {}, in(1000ms), {});
    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome->exit_code, 0);
    EXPECT_FALSE(fs::exists(root / "work"));
    EXPECT_TRUE(fs::exists(root / "workspace" / "code" / "main.py"));
}

TEST(FakeRuntimeLifetimeTest, OwnedRootRemovedOnDestruction) {
    fs::path root;
    {
        FakeRuntime runtime;
        root = runtime.root();
        EXPECT_TRUE(fs::exists(root));
    }
    EXPECT_FALSE(fs::exists(root));
}

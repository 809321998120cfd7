/**
 * @file test_workspace.cpp
 * @brief Unit tests for Workspace staging.
 */

#include "support/test_support.hpp"
#include "workspace/workspace.hpp"

#include <gtest/gtest.h>
#include <json/json.h>

#include <sstream>

using namespace sandbox_orchestrator;
using namespace sandbox_orchestrator::testing;
namespace fs = std::filesystem;

class WorkspaceTest : public ::testing::Test {
protected:
    TempDir scratch_{"so_scratch"};
    TempDir scripts_{"so_scripts"};

    void SetUp() override {
        write_file(scripts_.path() / "analysis" / "main.py", "print('hi')\n");
        write_file(scripts_.path() / "analysis" / "helpers" / "util.py", "X = 1\n");
    }

    WorkspaceBuilder builder() const {
        return WorkspaceBuilder(scratch_.path() / "runs", scripts_.path());
    }
};

TEST_F(WorkspaceTest, StagesScriptDirectoryAndParams) {
    Json::Value params;
    params["n"] = 3;
    params["label"] = "x";

    auto ws = builder().build("exec-1", "analysis/main.py", params, {});
    ASSERT_TRUE(ws.has_value()) << ws.error().message;

    EXPECT_EQ(ws->script_name(), "main.py");
    EXPECT_EQ(ws->dir().filename(), "workspace");
    EXPECT_TRUE(fs::exists(ws->code_dir() / "main.py"));
    EXPECT_TRUE(fs::exists(ws->code_dir() / "helpers" / "util.py"));
    EXPECT_TRUE(ws->root().filename().string().starts_with("exec_exec-1_"));

    Json::Value written;
    Json::CharReaderBuilder reader;
    std::istringstream in(read_file(ws->params_file()));
    std::string errors;
    ASSERT_TRUE(Json::parseFromStream(reader, in, &written, &errors));
    EXPECT_EQ(written, params);

    ASSERT_EQ(ws->manifest().size(), 2u);
    EXPECT_EQ(ws->manifest().at("main.py"), 12u);
    EXPECT_TRUE(ws->manifest().count("helpers/util.py"));
}

TEST_F(WorkspaceTest, NullParamsBecomeEmptyObject) {
    auto ws = builder().build("exec-2", "analysis/main.py", Json::Value(), {});
    ASSERT_TRUE(ws);
    EXPECT_EQ(read_file(ws->params_file()), "{}");
}

TEST_F(WorkspaceTest, OverridesReplaceAndAddFiles) {
    std::map<std::string, std::string> overrides{
        {"main.py", "print('patched')\n"},
        {"data/input.csv", "a,b\n1,2\n"},
    };
    auto ws = builder().build("exec-3", "analysis/main.py", Json::Value(Json::objectValue), overrides);
    ASSERT_TRUE(ws) << ws.error().message;

    EXPECT_EQ(read_file(ws->code_dir() / "main.py"), "print('patched')\n");
    EXPECT_EQ(read_file(ws->code_dir() / "data" / "input.csv"), "a,b\n1,2\n");
    EXPECT_TRUE(ws->manifest().count("data/input.csv"));
    // The source tree is untouched
    EXPECT_EQ(read_file(scripts_.path() / "analysis" / "main.py"), "print('hi')\n");
}

TEST_F(WorkspaceTest, DestructorRemovesDirectory) {
    fs::path root;
    {
        auto ws = builder().build("exec-4", "analysis/main.py", Json::Value(), {});
        ASSERT_TRUE(ws);
        root = ws->root();
        EXPECT_TRUE(fs::exists(root));
    }
    EXPECT_FALSE(fs::exists(root));
    EXPECT_EQ(count_entries(scratch_.path() / "runs"), 0u);
}

TEST_F(WorkspaceTest, MovedFromWorkspaceDoesNotRemove) {
    auto built = builder().build("exec-5", "analysis/main.py", Json::Value(), {});
    ASSERT_TRUE(built);
    std::optional<Workspace> holder;
    {
        Workspace moved = std::move(built).value();
        holder.emplace(std::move(moved));
    }
    EXPECT_TRUE(fs::exists(holder->code_dir() / "main.py"));
}

TEST_F(WorkspaceTest, MissingScriptIsWorkspaceError) {
    auto ws = builder().build("exec-6", "analysis/absent.py", Json::Value(), {});
    ASSERT_FALSE(ws);
    EXPECT_EQ(ws.error().kind, ErrorKind::Workspace);
    EXPECT_EQ(count_entries(scratch_.path() / "runs"), 0u);
}

TEST_F(WorkspaceTest, NonObjectParamsRejected) {
    Json::Value params(Json::arrayValue);
    params.append(1);
    auto ws = builder().build("exec-7", "analysis/main.py", params, {});
    ASSERT_FALSE(ws);
    EXPECT_EQ(ws.error().kind, ErrorKind::Workspace);
}

TEST_F(WorkspaceTest, EscapingOverrideLeavesNothingBehind) {
    std::map<std::string, std::string> overrides{{"../evil.py", "x"}};
    auto ws = builder().build("exec-8", "analysis/main.py", Json::Value(), overrides);
    ASSERT_FALSE(ws);
    EXPECT_EQ(ws.error().kind, ErrorKind::Workspace);
    EXPECT_EQ(count_entries(scratch_.path() / "runs"), 0u);
    EXPECT_FALSE(fs::exists(scripts_.path() / "evil.py"));
}

TEST(WorkspaceBuilderTest, OverridePathChecks) {
    EXPECT_TRUE(WorkspaceBuilder::check_override_path("a/b.py"));
    EXPECT_EQ(*WorkspaceBuilder::check_override_path("a/./b.py"), fs::path("a/b.py"));
    EXPECT_FALSE(WorkspaceBuilder::check_override_path(""));
    EXPECT_FALSE(WorkspaceBuilder::check_override_path("/etc/passwd"));
    EXPECT_FALSE(WorkspaceBuilder::check_override_path("a/../../b"));
    EXPECT_FALSE(WorkspaceBuilder::check_override_path("a/.."));
    EXPECT_FALSE(WorkspaceBuilder::check_override_path("."));
}

TEST(WorkspaceBuilderTest, DependencyChecks) {
    EXPECT_TRUE(WorkspaceBuilder::check_dependencies({}));
    EXPECT_TRUE(WorkspaceBuilder::check_dependencies({"numpy", "pandas>=2.0"}));
    EXPECT_FALSE(WorkspaceBuilder::check_dependencies({""}));
    EXPECT_FALSE(WorkspaceBuilder::check_dependencies({"--index-url=http://x"}));
    EXPECT_FALSE(WorkspaceBuilder::check_dependencies({"numpy\n-e ."}));
}

TEST(WorkspaceBuilderTest, SanitizeId) {
    EXPECT_EQ(WorkspaceBuilder::sanitize_id("run-1_ok"), "run-1_ok");
    EXPECT_EQ(WorkspaceBuilder::sanitize_id("../x y"), "___x_y");
    EXPECT_EQ(WorkspaceBuilder::sanitize_id(std::string(100, 'a')).size(), 64u);
}

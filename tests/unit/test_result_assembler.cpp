/**
 * @file test_result_assembler.cpp
 * @brief Unit tests for result file classification.
 */

#include "results/result_assembler.hpp"
#include "support/test_support.hpp"

#include <gtest/gtest.h>

using namespace sandbox_orchestrator;
using namespace sandbox_orchestrator::testing;

TEST(DetectKindTest, KnownExtensions) {
    EXPECT_EQ(detect_kind("plot.png"), ResultKind::Plot);
    EXPECT_EQ(detect_kind("photo.JPEG"), ResultKind::Plot);
    EXPECT_EQ(detect_kind("chart.svg"), ResultKind::Plot);
    EXPECT_EQ(detect_kind("table.csv"), ResultKind::Table);
    EXPECT_EQ(detect_kind("book.xlsx"), ResultKind::Table);
    EXPECT_EQ(detect_kind("out.json"), ResultKind::Data);
    EXPECT_EQ(detect_kind("notes.md"), ResultKind::Report);
    EXPECT_EQ(detect_kind("page.html"), ResultKind::Report);
    EXPECT_EQ(detect_kind("paper.pdf"), ResultKind::Report);
    EXPECT_EQ(detect_kind("clip.mp4"), ResultKind::Video);
    EXPECT_EQ(detect_kind("loop.GIF"), ResultKind::Animation);
}

TEST(DetectKindTest, UnknownExtensions) {
    EXPECT_FALSE(detect_kind("main.py").has_value());
    EXPECT_FALSE(detect_kind("Makefile").has_value());
    EXPECT_FALSE(detect_kind("archive.tar.gz").has_value());
}

TEST(CollectResultFilesTest, ClassifiesAndSorts) {
    TempDir dir("so_results");
    write_file(dir.path() / "z.csv", "a,b\n");
    write_file(dir.path() / "figs" / "a.png", "PNG");
    write_file(dir.path() / "main.py", "print()");

    auto files = collect_result_files(dir.path());
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].path, "figs/a.png");
    EXPECT_EQ(files[0].name, "a.png");
    EXPECT_EQ(files[0].kind, ResultKind::Plot);
    EXPECT_EQ(files[0].size, 3u);
    EXPECT_EQ(files[1].path, "z.csv");
    EXPECT_EQ(files[1].kind, ResultKind::Table);
}

TEST(CollectResultFilesTest, SkipsUnchangedInputs) {
    TempDir dir("so_results");
    write_file(dir.path() / "input.csv", "1,2\n");
    write_file(dir.path() / "edited.json", "{\"a\":1}");
    write_file(dir.path() / "new.txt", "hello");

    Manifest inputs{{"input.csv", 4}, {"edited.json", 2}};
    auto files = collect_result_files(dir.path(), inputs);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].path, "edited.json");
    EXPECT_EQ(files[1].path, "new.txt");
}

TEST(CollectResultFilesTest, MissingDirectoryYieldsNothing) {
    EXPECT_TRUE(collect_result_files("/nonexistent/so_results").empty());
}

TEST(ResultFileJsonTest, Descriptor) {
    ResultFile file{.kind = ResultKind::Report, .name = "r.md", .path = "out/r.md", .size = 10};
    auto json = to_json(file);
    EXPECT_EQ(json["type"].asString(), "report");
    EXPECT_EQ(json["name"].asString(), "r.md");
    EXPECT_EQ(json["path"].asString(), "out/r.md");
    EXPECT_EQ(json["size"].asUInt64(), 10u);

    auto array = to_json(std::vector<ResultFile>{file, file});
    EXPECT_TRUE(array.isArray());
    EXPECT_EQ(array.size(), 2u);
}

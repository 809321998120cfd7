/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger, the NDJSON sinks and MetricsCollector.
 */

#include "core/logger.hpp"
#include "support/test_support.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <json/json.h>

#include <memory>
#include <sstream>

using namespace sandbox_orchestrator;
using namespace sandbox_orchestrator::testing;

namespace {

Json::Value parse_line(const std::string& line) {
    Json::CharReaderBuilder builder;
    Json::Value value;
    std::string errors;
    std::istringstream in(line);
    EXPECT_TRUE(Json::parseFromStream(builder, in, &value, &errors)) << errors << " in " << line;
    return value;
}

}  // namespace

TEST(LoggerTest, WritesOneJsonObjectPerRecord) {
    auto lines = std::make_shared<CapturedLines>();
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Debug);

    logger.log(LogLevel::Warn, "pool", "Container pool exhausted");
    logger.info("plain");

    auto out = lines->lines();
    ASSERT_EQ(out.size(), 2u);
    auto first = parse_line(out[0]);
    EXPECT_EQ(first["level"].asString(), "warn");
    EXPECT_EQ(first["component"].asString(), "pool");
    EXPECT_EQ(first["msg"].asString(), "Container pool exhausted");
    EXPECT_TRUE(first["ts"].asString().ends_with("Z"));

    auto second = parse_line(out[1]);
    EXPECT_FALSE(second.isMember("component"));
}

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    auto lines = std::make_shared<CapturedLines>();
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Warn);

    logger.debug("hidden");
    logger.info("hidden");
    logger.error("shown");
    EXPECT_EQ(lines->lines().size(), 1u);

    logger.set_level(LogLevel::Debug);
    logger.debug("now shown");
    EXPECT_EQ(lines->lines().size(), 2u);
    EXPECT_EQ(logger.level(), LogLevel::Debug);
}

TEST(LoggerTest, EscapesControlCharacters) {
    auto lines = std::make_shared<CapturedLines>();
    Logger logger(std::make_unique<CaptureSink>(lines));

    logger.info("quote \" backslash \\ newline \n tab \t bell \x07");
    auto parsed = parse_line(lines->lines().at(0));
    EXPECT_EQ(parsed["msg"].asString(), "quote \" backslash \\ newline \n tab \t bell \x07");
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_FALSE(parse_log_level("loud").has_value());
}

TEST(JsonFileSinkTest, AppendsToActiveFile) {
    TempDir dir("so_sink");
    {
        JsonFileSink sink(dir.path(), "app");
        sink.write(R"({"a":1})");
        sink.write(R"({"a":2})");
        sink.flush();
    }
    EXPECT_EQ(read_file(dir.path() / "app.ndjson"), "{\"a\":1}\n{\"a\":2}\n");
}

TEST(JsonFileSinkTest, RotatesAndKeepsBoundedHistory) {
    TempDir dir("so_sink");
    JsonFileSink sink(dir.path(), "app", 1, 2);
    sink.set_max_file_size_bytes(16);

    // Each line is 11 bytes with the newline: every second write rotates
    for (int i = 0; i < 10; ++i) {
        sink.write("{\"n\":" + std::to_string(i) + "0000}");
    }
    sink.flush();

    EXPECT_TRUE(std::filesystem::exists(dir.path() / "app.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "app.1.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "app.2.ndjson"));
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "app.3.ndjson"));
    EXPECT_EQ(count_entries(dir.path()), 3u);

    // Newest record is in the active file
    EXPECT_NE(read_file(sink.current_path()).find("{\"n\":90000}"), std::string::npos);
}

TEST(MetricsCollectorTest, ExecutionRecordCarriesOutcome) {
    auto lines = std::make_shared<CapturedLines>();
    MetricsCollector metrics(std::make_unique<CaptureSink>(lines));

    ExecutionResult result;
    result.id = "exec-1";
    result.status = ExecutionStatus::Failed;
    result.exit_code = 3;
    result.duration = Duration{1500};
    result.ephemeral_container = true;
    metrics.record_execution(result);

    auto parsed = parse_line(lines->lines().at(0));
    EXPECT_EQ(parsed["event"].asString(), "execution_finished");
    EXPECT_EQ(parsed["id"].asString(), "exec-1");
    EXPECT_EQ(parsed["status"].asString(), "failed");
    EXPECT_EQ(parsed["exit_code"].asInt(), 3);
    EXPECT_EQ(parsed["duration_us"].asInt64(), 1500);
    EXPECT_TRUE(parsed["ephemeral"].asBool());
    EXPECT_TRUE(parsed.isMember("ts"));
}

TEST(MetricsCollectorTest, PoolStatsAndAcquisition) {
    auto lines = std::make_shared<CapturedLines>();
    MetricsCollector metrics(std::make_unique<CaptureSink>(lines));

    PoolStats stats;
    stats.available = 2;
    stats.in_use = 1;
    stats.capacity = 3;
    metrics.record_pool_stats(stats);
    metrics.record_acquisition("exec-2", false, Duration{42});

    auto out = lines->lines();
    ASSERT_EQ(out.size(), 2u);
    auto pool = parse_line(out[0]);
    EXPECT_EQ(pool["event"].asString(), "pool_stats");
    EXPECT_EQ(pool["capacity"].asUInt64(), 3u);
    auto acquired = parse_line(out[1]);
    EXPECT_EQ(acquired["kind"].asString(), "pooled");
    EXPECT_EQ(acquired["wait_us"].asInt64(), 42);
}

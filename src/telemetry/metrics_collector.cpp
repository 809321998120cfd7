/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <chrono>

namespace sandbox_orchestrator {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_execution(const ExecutionResult& result) {
    Json::Value fields;
    fields["id"] = result.id;
    fields["status"] = std::string(to_string(result.status));
    fields["duration_us"] = static_cast<Json::Int64>(result.duration.count());
    fields["exit_code"] = result.exit_code ? Json::Value(*result.exit_code) : Json::Value();
    fields["result_files"] = static_cast<Json::UInt64>(result.result_files.size());
    fields["ephemeral"] = result.ephemeral_container;
    fields["truncated"] = result.output_truncated;
    emit("execution_finished", std::move(fields));
}

void MetricsCollector::record_acquisition(const ExecutionId& id, bool ephemeral, Duration waited) {
    Json::Value fields;
    fields["id"] = id;
    fields["kind"] = ephemeral ? "ephemeral" : "pooled";
    fields["wait_us"] = static_cast<Json::Int64>(waited.count());
    emit("container_acquired", std::move(fields));
}

void MetricsCollector::record_pool_stats(const PoolStats& stats) {
    Json::Value fields;
    fields["available"] = static_cast<Json::UInt64>(stats.available);
    fields["in_use"] = static_cast<Json::UInt64>(stats.in_use);
    fields["capacity"] = static_cast<Json::UInt64>(stats.capacity);
    fields["ephemeral_in_use"] = static_cast<Json::UInt64>(stats.ephemeral_in_use);
    fields["total_acquired"] = static_cast<Json::UInt64>(stats.total_acquired);
    fields["total_released"] = static_cast<Json::UInt64>(stats.total_released);
    fields["total_destroyed"] = static_cast<Json::UInt64>(stats.total_destroyed);
    fields["total_ephemeral"] = static_cast<Json::UInt64>(stats.total_ephemeral);
    emit("pool_stats", std::move(fields));
}

void MetricsCollector::emit(std::string_view event, Json::Value fields) {
    fields["event"] = std::string(event);
    fields["ts"] = format_timestamp(std::chrono::system_clock::now());

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    auto line = Json::writeString(writer, fields);

    std::lock_guard lock(write_mutex_);
    sink_->write(line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace sandbox_orchestrator

/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "orchestrator/execution.hpp"
#include "pool/container_handle.hpp"

#include <json/json.h>

#include <memory>
#include <mutex>
#include <string_view>

namespace sandbox_orchestrator {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 *
 * Every line carries "event" and "ts"; the remaining fields depend on
 * the event.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_execution(const ExecutionResult& result);
    void record_acquisition(const ExecutionId& id, bool ephemeral, Duration waited);
    void record_pool_stats(const PoolStats& stats);

    void flush();

private:
    void emit(std::string_view event, Json::Value fields);

    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;
};

}  // namespace sandbox_orchestrator

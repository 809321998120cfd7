/**
 * @file event.hpp
 * @brief Lifecycle and output events pushed to execution observers.
 */

#pragma once

#include "core/types.hpp"

#include <json/json.h>

#include <string>

namespace sandbox_orchestrator {

struct Event {
    EventType type = EventType::Status;
    Json::Value data{Json::objectValue};
    Timestamp timestamp{};
};

/// Stamp an event with the current wall-clock time.
[[nodiscard]] Event make_event(EventType type, Json::Value data = Json::Value(Json::objectValue));

/// {"type": ..., "data": ..., "timestamp": "...Z"}
[[nodiscard]] Json::Value to_json(const Event& event);

/// to_json() rendered on a single line.
[[nodiscard]] std::string to_ndjson(const Event& event);

}  // namespace sandbox_orchestrator

/**
 * @file event_registry.cpp
 * @brief Event construction and EventSinkRegistry implementation.
 */

#include "events/event_registry.hpp"

#include <chrono>
#include <exception>
#include <utility>

namespace sandbox_orchestrator {

namespace {
constexpr std::string_view kComponent = "events";
}

// ── Event ────────────────────────────────────

Event make_event(EventType type, Json::Value data) {
    return Event{
        .type = type,
        .data = std::move(data),
        .timestamp = std::chrono::system_clock::now()
    };
}

Json::Value to_json(const Event& event) {
    Json::Value json;
    json["type"] = std::string(to_string(event.type));
    json["data"] = event.data;
    json["timestamp"] = format_timestamp(event.timestamp);
    return json;
}

std::string to_ndjson(const Event& event) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, to_json(event));
}

// ── EventSinkRegistry ────────────────────────

EventSinkRegistry::EventSinkRegistry(Logger& logger) : logger_(logger) {}

void EventSinkRegistry::register_sink(const ExecutionId& id, EventCallback callback) {
    std::lock_guard lock(mutex_);
    observers_[id].callback = std::move(callback);
}

std::shared_ptr<EventChannel> EventSinkRegistry::open_channel(const ExecutionId& id,
                                                              size_t capacity) {
    auto channel = std::make_shared<EventChannel>(capacity);
    std::shared_ptr<EventChannel> previous;
    {
        std::lock_guard lock(mutex_);
        auto& entry = observers_[id];
        previous = std::exchange(entry.channel, channel);
    }
    if (previous) previous->close();
    return channel;
}

void EventSinkRegistry::publish(const ExecutionId& id, EventType type, Json::Value data) {
    EventCallback callback;
    std::shared_ptr<EventChannel> channel;
    {
        std::lock_guard lock(mutex_);
        auto it = observers_.find(id);
        if (it == observers_.end()) return;
        callback = it->second.callback;
        channel = it->second.channel;
    }

    auto event = make_event(type, std::move(data));

    if (callback) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            logger_.log(LogLevel::Warn, kComponent,
                        "Event callback for " + id + " threw: " + e.what());
        }
    }

    if (channel && !channel->try_push(std::move(event))) {
        uint64_t dropped = 0;
        {
            std::lock_guard lock(mutex_);
            if (auto it = observers_.find(id); it != observers_.end()) {
                dropped = ++it->second.dropped;
            }
        }
        if (dropped == 1) {
            logger_.log(LogLevel::Warn, kComponent,
                        "Event channel for " + id + " is full; dropping events");
        }
    }
}

void EventSinkRegistry::unregister(const ExecutionId& id) {
    Observers removed;
    {
        std::lock_guard lock(mutex_);
        auto it = observers_.find(id);
        if (it == observers_.end()) return;
        removed = std::move(it->second);
        observers_.erase(it);
    }
    if (removed.channel) removed.channel->close();
    if (removed.dropped > 0) {
        logger_.log(LogLevel::Warn, kComponent,
                    "Dropped " + std::to_string(removed.dropped) + " event(s) for " + id);
    }
}

bool EventSinkRegistry::has_observer(const ExecutionId& id) const {
    std::lock_guard lock(mutex_);
    return observers_.contains(id);
}

size_t EventSinkRegistry::size() const {
    std::lock_guard lock(mutex_);
    return observers_.size();
}

}  // namespace sandbox_orchestrator

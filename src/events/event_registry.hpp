/**
 * @file event_registry.hpp
 * @brief Per-execution observer table.
 *
 * An execution may have a callback, a bounded channel, or both. Delivery
 * is best-effort: a throwing callback or a full channel is logged and the
 * execution carries on. Events of one execution are delivered in the
 * order they were published.
 */

#pragma once

#include "core/bounded_queue.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "events/event.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace sandbox_orchestrator {

using EventCallback = std::function<void(const Event&)>;
using EventChannel = BoundedQueue<Event>;

class EventSinkRegistry {
public:
    explicit EventSinkRegistry(Logger& logger);

    /// One callback per execution; registering again replaces it.
    void register_sink(const ExecutionId& id, EventCallback callback);

    /**
     * @brief Attach a bounded channel the observer pops from.
     *
     * The channel is closed on unregister(); events already queued stay
     * poppable. Opening again replaces (and closes) the previous one.
     */
    std::shared_ptr<EventChannel> open_channel(const ExecutionId& id, size_t capacity);

    void publish(const ExecutionId& id, EventType type,
                 Json::Value data = Json::Value(Json::objectValue));

    /// Drop every observer of `id`. Safe to call when none is registered.
    void unregister(const ExecutionId& id);

    [[nodiscard]] bool has_observer(const ExecutionId& id) const;
    [[nodiscard]] size_t size() const;

private:
    struct Observers {
        EventCallback callback;
        std::shared_ptr<EventChannel> channel;
        uint64_t dropped = 0;
    };

    Logger& logger_;
    mutable std::mutex mutex_;
    std::unordered_map<ExecutionId, Observers> observers_;
};

}  // namespace sandbox_orchestrator

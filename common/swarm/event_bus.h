#pragma once

#include "event.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace swarm {

struct event_bus_config {
    bool log_events = false;  // Log every published event at DBG

    static event_bus_config default_config() { return event_bus_config(); }

    // Log every event, useful for demos and tests
    static event_bus_config verbose() {
        event_bus_config config;
        config.log_events = true;
        return config;
    }
};

struct event_bus_stats {
    int64_t published = 0;
    int64_t delivered = 0;
    int64_t handler_failures = 0;

    json to_json() const;
};

using event_handler = std::function<void(const event&)>;
using event_filter  = std::function<bool(const event&)>;

// Typed publish/subscribe backbone.
// Constructed explicitly and passed by reference to the components that need
// it; there is no global instance.
//
// Events go through one FIFO queue. Handlers run on whichever thread drains
// the queue, one event at a time, with no bus lock held, so a handler may call
// back into any component. An event published from inside a handler is
// delivered after the current one.
class event_bus {
public:
    explicit event_bus(const event_bus_config& config = event_bus_config::default_config());
    ~event_bus();

    event_bus(const event_bus&) = delete;
    event_bus& operator=(const event_bus&) = delete;

    // post + dispatch, returns the event id
    std::string publish(event ev);

    // Convenience: wrap payload with make_event and publish
    std::string publish(const std::string& source, event_payload payload);

    // Queue an event without delivering it. Never blocks on handlers, so it
    // may be called while holding a component lock; queue order is delivery
    // order. Missing id/timestamp/type are filled in.
    std::string post(event ev);
    std::string post(const std::string& source, event_payload payload);

    // Drain the queue on this thread unless another drain is in progress,
    // in which case that drain delivers everything queued so far
    void dispatch();

    // Events queued but not yet delivered
    size_t pending_count() const;

    // Subscribe to one event type; filter is optional
    std::string subscribe(const std::string& type, event_handler handler,
                          event_filter filter = nullptr);

    // Subscribe to every event type
    std::string subscribe_all(event_handler handler, event_filter filter = nullptr);

    // Remove subscription, false when unknown
    bool unsubscribe(const std::string& subscription_id);

    // Remove all subscriptions
    void clear();

    size_t subscription_count() const;

    event_bus_stats stats() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace swarm

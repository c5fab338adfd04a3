#include "event_bus.h"
#include "log.h"

#include <atomic>
#include <deque>
#include <exception>
#include <mutex>
#include <vector>

namespace swarm {

json event_bus_stats::to_json() const {
    return json{
        {"published", published},
        {"delivered", delivered},
        {"handler_failures", handler_failures}
    };
}

namespace {

struct subscription {
    std::string id;
    std::string type;  // Empty = wildcard
    event_handler handler;
    event_filter filter;
};

} // namespace

struct event_bus::impl {
    event_bus_config config;

    // Subscriptions in registration order
    std::vector<std::shared_ptr<subscription>> subscriptions;
    mutable std::mutex subs_mutex;

    // Leaf lock: nothing else is acquired while it is held
    mutable std::mutex queue_mutex;
    std::deque<event> pending;
    bool draining = false;

    std::atomic<int64_t> published{0};
    std::atomic<int64_t> delivered{0};
    std::atomic<int64_t> handler_failures{0};

    explicit impl(const event_bus_config& cfg) : config(cfg) {}

    std::vector<std::shared_ptr<subscription>> matching(const std::string& type) {
        std::lock_guard<std::mutex> lock(subs_mutex);
        std::vector<std::shared_ptr<subscription>> out;
        for (const auto& sub : subscriptions) {
            if (sub->type.empty() || sub->type == type) {
                out.push_back(sub);
            }
        }
        return out;
    }

    // Runs handlers with no bus lock held; handler failures are contained
    void deliver(const event& ev) {
        if (config.log_events) {
            LOG_DBG("event %s from %s: %s\n", ev.type.c_str(), ev.source.c_str(),
                    event_payload_to_json(ev.payload).dump().c_str());
        }

        for (const auto& sub : matching(ev.type)) {
            if (!sub->handler) {
                continue;
            }
            try {
                if (sub->filter && !sub->filter(ev)) {
                    continue;
                }
                delivered++;
                sub->handler(ev);
            } catch (const std::exception& e) {
                handler_failures++;
                LOG_ERR("event handler %s failed on %s: %s\n",
                        sub->id.c_str(), ev.type.c_str(), e.what());
            } catch (...) {
                handler_failures++;
                LOG_ERR("event handler %s failed on %s: unknown exception\n",
                        sub->id.c_str(), ev.type.c_str());
            }
        }
    }

    std::string add(const std::string& type, event_handler handler, event_filter filter) {
        auto sub = std::make_shared<subscription>();
        sub->id = generate_id("sub");
        sub->type = type;
        sub->handler = std::move(handler);
        sub->filter = std::move(filter);

        std::lock_guard<std::mutex> lock(subs_mutex);
        subscriptions.push_back(sub);
        return sub->id;
    }
};

event_bus::event_bus(const event_bus_config& config)
    : pimpl(std::make_unique<impl>(config)) {}

event_bus::~event_bus() = default;

std::string event_bus::post(event ev) {
    if (ev.id.empty()) {
        ev.id = generate_id("event");
    }
    if (ev.timestamp == 0) {
        ev.timestamp = get_timestamp_ms();
    }
    if (ev.type.empty()) {
        ev.type = event_type_of(ev.payload);
    }

    std::string id = ev.id;
    {
        std::lock_guard<std::mutex> lock(pimpl->queue_mutex);
        pimpl->pending.push_back(std::move(ev));
        pimpl->published++;
    }
    return id;
}

std::string event_bus::post(const std::string& source, event_payload payload) {
    return post(make_event(source, std::move(payload)));
}

void event_bus::dispatch() {
    std::unique_lock<std::mutex> lock(pimpl->queue_mutex);
    if (pimpl->draining) {
        return;
    }
    pimpl->draining = true;

    while (!pimpl->pending.empty()) {
        event ev = std::move(pimpl->pending.front());
        pimpl->pending.pop_front();
        lock.unlock();
        pimpl->deliver(ev);
        lock.lock();
    }

    pimpl->draining = false;
}

std::string event_bus::publish(event ev) {
    std::string id = post(std::move(ev));
    dispatch();
    return id;
}

std::string event_bus::publish(const std::string& source, event_payload payload) {
    return publish(make_event(source, std::move(payload)));
}

size_t event_bus::pending_count() const {
    std::lock_guard<std::mutex> lock(pimpl->queue_mutex);
    return pimpl->pending.size();
}

std::string event_bus::subscribe(const std::string& type, event_handler handler,
                                 event_filter filter) {
    if (type.empty()) {
        return subscribe_all(std::move(handler), std::move(filter));
    }
    return pimpl->add(type, std::move(handler), std::move(filter));
}

std::string event_bus::subscribe_all(event_handler handler, event_filter filter) {
    return pimpl->add("", std::move(handler), std::move(filter));
}

bool event_bus::unsubscribe(const std::string& subscription_id) {
    std::lock_guard<std::mutex> lock(pimpl->subs_mutex);
    auto& subs = pimpl->subscriptions;
    for (auto it = subs.begin(); it != subs.end(); ++it) {
        if ((*it)->id == subscription_id) {
            subs.erase(it);
            return true;
        }
    }
    return false;
}

void event_bus::clear() {
    std::lock_guard<std::mutex> lock(pimpl->subs_mutex);
    pimpl->subscriptions.clear();
}

size_t event_bus::subscription_count() const {
    std::lock_guard<std::mutex> lock(pimpl->subs_mutex);
    return pimpl->subscriptions.size();
}

event_bus_stats event_bus::stats() const {
    event_bus_stats s;
    s.published = pimpl->published.load();
    s.delivered = pimpl->delivered.load();
    s.handler_failures = pimpl->handler_failures.load();
    return s;
}

} // namespace swarm

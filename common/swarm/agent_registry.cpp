#include "agent_registry.h"
#include "log.h"

#include <algorithm>
#include <map>
#include <mutex>
#include <shared_mutex>

namespace swarm {

static const char * REGISTRY_SOURCE = "agent_registry";

struct agent_registry::impl {
    event_bus& bus;

    std::map<std::string, agent_info> agents;
    // Events are posted while this is held so they queue in mutation order;
    // delivery happens after it is released
    mutable std::shared_mutex mutex;

    explicit impl(event_bus& b) : bus(b) {}
};

agent_registry::agent_registry(event_bus& bus) : pimpl(std::make_unique<impl>(bus)) {}

agent_registry::~agent_registry() = default;

status agent_registry::register_agent(const agent_info& agent) {
    if (agent.id.empty()) {
        LOG_WRN("register_agent: rejected agent with empty id\n");
        return status::failure(ERROR_TYPE_VALIDATION, "Agent id must not be empty");
    }
    if (agent.capacity <= 0) {
        LOG_WRN("register_agent: agent %s has capacity %d\n", agent.id.c_str(), agent.capacity);
        return status::failure(ERROR_TYPE_VALIDATION,
                               "Agent " + agent.id + " capacity must be positive");
    }
    if (agent.workload < 0) {
        LOG_WRN("register_agent: agent %s has workload %d\n", agent.id.c_str(), agent.workload);
        return status::failure(ERROR_TYPE_VALIDATION,
                               "Agent " + agent.id + " workload must not be negative");
    }

    agent_registered_payload payload;
    payload.agent_id = agent.id;
    payload.name = agent.name;
    payload.agent_type = agent_type_to_string(agent.type);
    payload.expertise = agent.expertise;
    payload.capacity = agent.capacity;

    bool replaced = false;
    {
        std::unique_lock<std::shared_mutex> lock(pimpl->mutex);
        replaced = pimpl->agents.count(agent.id) > 0;
        pimpl->agents[agent.id] = agent;
        pimpl->bus.post(REGISTRY_SOURCE, payload);
    }

    LOG_INF("%s agent %s (%s, capacity %d)\n", replaced ? "replaced" : "registered",
            agent.id.c_str(), agent_type_to_string(agent.type), agent.capacity);
    pimpl->bus.dispatch();

    return status::success();
}

status agent_registry::unregister_agent(const std::string& agent_id) {
    {
        std::unique_lock<std::shared_mutex> lock(pimpl->mutex);
        auto it = pimpl->agents.find(agent_id);
        if (it == pimpl->agents.end()) {
            return status::failure(ERROR_TYPE_VALIDATION, "Agent not found: " + agent_id);
        }
        pimpl->agents.erase(it);

        agent_unregistered_payload payload;
        payload.agent_id = agent_id;
        pimpl->bus.post(REGISTRY_SOURCE, payload);
    }

    LOG_INF("unregistered agent %s\n", agent_id.c_str());
    pimpl->bus.dispatch();

    return status::success();
}

status agent_registry::update_workload(const std::string& agent_id, int workload) {
    if (workload < 0) {
        return status::failure(ERROR_TYPE_VALIDATION,
                               "Workload for " + agent_id + " must not be negative");
    }

    agent_workload_updated_payload payload;
    {
        std::unique_lock<std::shared_mutex> lock(pimpl->mutex);
        auto it = pimpl->agents.find(agent_id);
        if (it == pimpl->agents.end()) {
            return status::failure(ERROR_TYPE_VALIDATION, "Agent not found: " + agent_id);
        }
        it->second.workload = workload;
        payload.agent_id = agent_id;
        payload.workload = workload;
        payload.capacity = it->second.capacity;
        pimpl->bus.post(REGISTRY_SOURCE, payload);
    }

    LOG_DBG("agent %s workload %d/%d\n", agent_id.c_str(), payload.workload, payload.capacity);
    pimpl->bus.dispatch();

    return status::success();
}

result<int> agent_registry::adjust_workload(const std::string& agent_id, int delta) {
    agent_workload_updated_payload payload;
    {
        std::unique_lock<std::shared_mutex> lock(pimpl->mutex);
        auto it = pimpl->agents.find(agent_id);
        if (it == pimpl->agents.end()) {
            return result<int>::failure(ERROR_TYPE_VALIDATION, "Agent not found: " + agent_id);
        }
        it->second.workload = std::max(0, it->second.workload + delta);
        payload.agent_id = agent_id;
        payload.workload = it->second.workload;
        payload.capacity = it->second.capacity;
        pimpl->bus.post(REGISTRY_SOURCE, payload);
    }

    LOG_DBG("agent %s workload %+d -> %d/%d\n", agent_id.c_str(), delta,
            payload.workload, payload.capacity);
    pimpl->bus.dispatch();

    return result<int>::success(payload.workload);
}

std::optional<agent_info> agent_registry::get_agent(const std::string& agent_id) const {
    std::shared_lock<std::shared_mutex> lock(pimpl->mutex);
    auto it = pimpl->agents.find(agent_id);
    if (it == pimpl->agents.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool agent_registry::contains(const std::string& agent_id) const {
    std::shared_lock<std::shared_mutex> lock(pimpl->mutex);
    return pimpl->agents.count(agent_id) > 0;
}

std::vector<agent_info> agent_registry::list_agents() const {
    std::shared_lock<std::shared_mutex> lock(pimpl->mutex);

    std::vector<agent_info> agents;
    agents.reserve(pimpl->agents.size());
    for (const auto& [id, agent] : pimpl->agents) {
        agents.push_back(agent);
    }
    return agents;
}

size_t agent_registry::size() const {
    std::shared_lock<std::shared_mutex> lock(pimpl->mutex);
    return pimpl->agents.size();
}

} // namespace swarm

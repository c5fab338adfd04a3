#pragma once

#include "error.h"
#include "event_bus.h"
#include "types.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace swarm {

// Shared agent pool used by the task router and the voting engine.
// All mutations of one registry are serialized, so workload updates for an id
// never lose writes; reads take a shared lock.
class agent_registry {
public:
    explicit agent_registry(event_bus& bus);
    ~agent_registry();

    agent_registry(const agent_registry&) = delete;
    agent_registry& operator=(const agent_registry&) = delete;

    // Register or replace an agent profile
    status register_agent(const agent_info& agent);

    // Remove an agent
    status unregister_agent(const std::string& agent_id);

    // Set absolute workload (>= 0)
    status update_workload(const std::string& agent_id, int workload);

    // Atomically add delta to the workload, clamped at 0. Returns new workload.
    result<int> adjust_workload(const std::string& agent_id, int delta);

    std::optional<agent_info> get_agent(const std::string& agent_id) const;

    bool contains(const std::string& agent_id) const;

    // Snapshot sorted by id
    std::vector<agent_info> list_agents() const;

    size_t size() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace swarm

#pragma once

#include "agent_registry.h"
#include "error.h"
#include "event_bus.h"
#include "types.h"

#include <memory>
#include <string>
#include <vector>

namespace swarm {

struct router_config {
    double expertise_weight = 0.5;
    double capacity_weight  = 0.3;
    double priority_weight  = 0.2;
    double degraded_confidence = 0.3;   // Returned when every candidate is at capacity
    size_t history_limit = 100;         // Routing decisions kept per agent
    double overloaded_threshold = 0.9;
    double underutilized_threshold = 0.3;

    static router_config default_config() { return router_config(); }

    // Rank purely on expertise match
    static router_config expertise_first() {
        router_config config;
        config.expertise_weight = 0.8;
        config.capacity_weight = 0.2;
        config.priority_weight = 0.0;
        return config;
    }

    json to_json() const;
};

struct routing_result {
    agent_info agent;
    double confidence = 0.0;   // In (degraded, 1] or exactly degraded
    double score = 0.0;        // Raw weighted score in [0, 1]
    bool degraded = false;
    std::string reasoning;

    json to_json() const;
};

struct routing_record {
    std::string task_id;
    std::string task_type;
    std::string agent_id;
    double confidence = 0.0;
    bool degraded = false;
    int64_t timestamp = 0;

    json to_json() const;
};

struct load_balancing_report {
    std::vector<std::string> overloaded;     // Utilization above the overloaded threshold
    std::vector<std::string> underutilized;  // Utilization below the underutilized threshold
    std::vector<std::string> recommendations;

    json to_json() const;
};

// Agent types that may take a task type. Empty for unknown task types,
// meaning every agent type is acceptable.
std::vector<agent_type> compatible_agent_types(const std::string& task_type);

// Workload-aware agent selection
class task_router {
public:
    task_router(agent_registry& registry, event_bus& bus,
                const router_config& config = router_config::default_config());
    ~task_router();

    task_router(const task_router&) = delete;
    task_router& operator=(const task_router&) = delete;

    // Forwarded to the shared registry
    status register_agent(const agent_info& agent);
    status unregister_agent(const std::string& agent_id);
    status update_agent_workload(const std::string& agent_id, int workload);

    // Pick the best registered agent for a task.
    // Fails with CapacityError only when no agent is registered.
    result<routing_result> route_task(const task& t);

    // Most recent routing decisions for an agent, oldest first
    std::vector<routing_record> get_routing_history(const std::string& agent_id) const;

    load_balancing_report get_load_balancing_recommendations() const;

    const router_config& config() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace swarm

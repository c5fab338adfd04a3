#include "task_router.h"
#include "log.h"

#include <algorithm>
#include <cstdio>
#include <deque>
#include <map>
#include <mutex>

namespace swarm {

static const char * ROUTER_SOURCE = "task_router";

json router_config::to_json() const {
    return json{
        {"expertise_weight", expertise_weight},
        {"capacity_weight", capacity_weight},
        {"priority_weight", priority_weight},
        {"degraded_confidence", degraded_confidence},
        {"history_limit", history_limit},
        {"overloaded_threshold", overloaded_threshold},
        {"underutilized_threshold", underutilized_threshold}
    };
}

json routing_result::to_json() const {
    return json{
        {"agent", agent.to_json()},
        {"confidence", confidence},
        {"score", score},
        {"degraded", degraded},
        {"reasoning", reasoning}
    };
}

json routing_record::to_json() const {
    return json{
        {"task_id", task_id},
        {"task_type", task_type},
        {"agent_id", agent_id},
        {"confidence", confidence},
        {"degraded", degraded},
        {"timestamp", timestamp}
    };
}

json load_balancing_report::to_json() const {
    return json{
        {"overloaded", overloaded},
        {"underutilized", underutilized},
        {"recommendations", recommendations}
    };
}

std::vector<agent_type> compatible_agent_types(const std::string& task_type) {
    static const std::map<std::string, std::vector<agent_type>> table = {
        {"code_generation", {AGENT_TYPE_CODER}},
        {"code_review",     {AGENT_TYPE_REVIEWER}},
        {"testing",         {AGENT_TYPE_TESTER}},
        {"debugging",       {AGENT_TYPE_DEBUGGER, AGENT_TYPE_CODER}},
        {"optimization",    {AGENT_TYPE_OPTIMIZER, AGENT_TYPE_CODER}},
        {"planning",        {AGENT_TYPE_PLANNER}},
        {"research",        {AGENT_TYPE_RESEARCHER}},
        {"documentation",   {AGENT_TYPE_RESEARCHER, AGENT_TYPE_CODER, AGENT_TYPE_PLANNER}},
    };

    auto it = table.find(to_lower(task_type));
    if (it == table.end()) {
        return {};
    }
    return it->second;
}

namespace {

// Fraction of the agent's expertise tags mentioned in the task
double expertise_match(const task& t, const agent_info& agent) {
    if (agent.expertise.empty()) {
        return 0.0;
    }
    const std::string haystack = to_lower(t.description) + " " + to_lower(t.type);
    int matches = 0;
    for (const auto& tag : agent.expertise) {
        if (!tag.empty() && haystack.find(to_lower(tag)) != std::string::npos) {
            matches++;
        }
    }
    return static_cast<double>(matches) / static_cast<double>(agent.expertise.size());
}

struct candidate {
    agent_info agent;
    double score = 0.0;
    double expertise = 0.0;
    double spare = 0.0;
};

} // namespace

struct task_router::impl {
    agent_registry& registry;
    event_bus& bus;
    router_config config;

    std::map<std::string, std::deque<routing_record>> history;
    mutable std::mutex history_mutex;

    impl(agent_registry& r, event_bus& b, const router_config& c)
        : registry(r), bus(b), config(c) {}

    double score(const task& t, const agent_info& agent, candidate& out) const {
        const double p = std::clamp(t.priority, 0, 10) / 10.0;
        out.expertise = expertise_match(t, agent);
        out.spare = agent.spare_ratio();
        const double alignment = 1.0 - p * (1.0 - out.spare);
        return config.expertise_weight * out.expertise +
               config.capacity_weight  * out.spare +
               config.priority_weight  * alignment;
    }

    void record(const task& t, const routing_result& res) {
        routing_record rec;
        rec.task_id = t.id;
        rec.task_type = t.type;
        rec.agent_id = res.agent.id;
        rec.confidence = res.confidence;
        rec.degraded = res.degraded;
        rec.timestamp = get_timestamp_ms();

        std::lock_guard<std::mutex> lock(history_mutex);
        auto& entries = history[res.agent.id];
        entries.push_back(rec);
        while (entries.size() > config.history_limit) {
            entries.pop_front();
        }
    }
};

task_router::task_router(agent_registry& registry, event_bus& bus, const router_config& config)
    : pimpl(std::make_unique<impl>(registry, bus, config)) {}

task_router::~task_router() = default;

status task_router::register_agent(const agent_info& agent) {
    return pimpl->registry.register_agent(agent);
}

status task_router::unregister_agent(const std::string& agent_id) {
    auto st = pimpl->registry.unregister_agent(agent_id);
    if (!st) {
        return st;
    }
    std::lock_guard<std::mutex> lock(pimpl->history_mutex);
    pimpl->history.erase(agent_id);
    return st;
}

status task_router::update_agent_workload(const std::string& agent_id, int workload) {
    return pimpl->registry.update_workload(agent_id, workload);
}

result<routing_result> task_router::route_task(const task& t) {
    // One snapshot, so the chosen id was registered at selection time
    const auto agents = pimpl->registry.list_agents();
    if (agents.empty()) {
        LOG_WRN("route_task %s: no agents registered\n", t.id.c_str());
        return result<routing_result>::failure(ERROR_TYPE_CAPACITY,
                                               "No agents registered with the router");
    }

    const auto types = compatible_agent_types(t.type);
    std::vector<agent_info> compatible;
    for (const auto& agent : agents) {
        if (types.empty() || std::find(types.begin(), types.end(), agent.type) != types.end()) {
            compatible.push_back(agent);
        }
    }
    if (compatible.empty()) {
        LOG_WRN("route_task %s: no agent compatible with task type '%s', considering all agents\n",
                t.id.c_str(), t.type.c_str());
        compatible = agents;
    }

    routing_result res;

    std::vector<candidate> available;
    for (const auto& agent : compatible) {
        if (agent.at_capacity()) {
            continue;
        }
        candidate c;
        c.agent = agent;
        c.score = pimpl->score(t, agent, c);
        available.push_back(c);
    }

    if (available.empty()) {
        // Everyone is saturated: least overloaded agent, flagged as degraded
        const auto least = std::min_element(compatible.begin(), compatible.end(),
            [](const agent_info& a, const agent_info& b) {
                if (a.utilization() != b.utilization()) return a.utilization() < b.utilization();
                if (a.workload != b.workload) return a.workload < b.workload;
                return a.id < b.id;
            });
        res.agent = *least;
        res.confidence = pimpl->config.degraded_confidence;
        res.score = 0.0;
        res.degraded = true;
        res.reasoning = "All compatible agents at capacity, selecting least loaded agent";
        LOG_WRN("route_task %s: degraded selection of %s (%d/%d)\n", t.id.c_str(),
                res.agent.id.c_str(), res.agent.workload, res.agent.capacity);
    } else {
        const auto best = std::min_element(available.begin(), available.end(),
            [](const candidate& a, const candidate& b) {
                if (a.score != b.score) return a.score > b.score;
                if (a.agent.workload != b.agent.workload) return a.agent.workload < b.agent.workload;
                return a.agent.id < b.agent.id;
            });
        const double floor = pimpl->config.degraded_confidence;
        res.agent = best->agent;
        res.score = best->score;
        res.confidence = std::min(1.0, floor + (1.0 - floor) * best->score);
        res.degraded = false;

        char buf[128];
        snprintf(buf, sizeof(buf), "Expertise match: %.1f%%, spare capacity: %.1f%%",
                 best->expertise * 100.0, best->spare * 100.0);
        res.reasoning = buf;
        LOG_INF("route_task %s (%s) -> %s, confidence %.3f\n", t.id.c_str(), t.type.c_str(),
                res.agent.id.c_str(), res.confidence);
    }

    pimpl->record(t, res);

    task_routed_payload payload;
    payload.task_id = t.id;
    payload.agent_id = res.agent.id;
    payload.confidence = res.confidence;
    payload.degraded = res.degraded;
    pimpl->bus.publish(ROUTER_SOURCE, payload);

    return result<routing_result>::success(res);
}

std::vector<routing_record> task_router::get_routing_history(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(pimpl->history_mutex);
    auto it = pimpl->history.find(agent_id);
    if (it == pimpl->history.end()) {
        return {};
    }
    return std::vector<routing_record>(it->second.begin(), it->second.end());
}

load_balancing_report task_router::get_load_balancing_recommendations() const {
    load_balancing_report report;
    for (const auto& agent : pimpl->registry.list_agents()) {
        const double utilization = agent.utilization();
        char buf[256];
        if (utilization > pimpl->config.overloaded_threshold) {
            report.overloaded.push_back(agent.id);
            snprintf(buf, sizeof(buf), "Agent %s is at %.0f%% utilization, route new %s work elsewhere",
                     agent.id.c_str(), utilization * 100.0, agent_type_to_string(agent.type));
            report.recommendations.push_back(buf);
        } else if (utilization < pimpl->config.underutilized_threshold) {
            report.underutilized.push_back(agent.id);
            snprintf(buf, sizeof(buf), "Agent %s is at %.0f%% utilization and can take more work",
                     agent.id.c_str(), utilization * 100.0);
            report.recommendations.push_back(buf);
        }
    }
    return report;
}

const router_config& task_router::config() const {
    return pimpl->config;
}

} // namespace swarm

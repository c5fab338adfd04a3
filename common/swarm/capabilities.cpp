#include "capabilities.h"
#include "log.h"

#include <exception>
#include <map>

namespace swarm {

std::string task_type_for_agent_type(const std::string& agent_type) {
    static const std::map<std::string, std::string> table = {
        {"planner",    "planning"},
        {"coder",      "code_generation"},
        {"reviewer",   "code_review"},
        {"debugger",   "debugging"},
        {"optimizer",  "optimization"},
        {"tester",     "testing"},
        {"researcher", "research"},
    };
    auto it = table.find(to_lower(agent_type));
    return it == table.end() ? agent_type : it->second;
}

//
// routed_agent_invoker
//

routed_agent_invoker::routed_agent_invoker(task_router& router, agent_execution_engine& engine,
                                           agent_registry* registry)
    : router_(router), engine_(engine), registry_(registry) {}

task routed_agent_invoker::make_task(const graph_node& node, const std::string& agent_type,
                                     const json& context) const {
    task t;
    t.id = node.id;
    t.description = node.label;
    t.type = task_type_for_agent_type(agent_type);
    if (node.metadata.contains("priority") && node.metadata["priority"].is_number_integer()) {
        t.priority = node.metadata["priority"].get<int>();
    }
    t.context = context;
    return t;
}

result<agent_info> routed_agent_invoker::select_agent(const graph_node& node, const agent_step& step,
                                                      const json& context) {
    auto routed = router_.route_task(make_task(node, step.agent_type, context));
    if (!routed) {
        return result<agent_info>::failure(routed.error());
    }
    return result<agent_info>::success(routed.value().agent);
}

namespace {

// Gives back the workload slot taken for a running agent step
struct workload_hold {
    agent_registry* registry;
    std::string agent_id;

    workload_hold(agent_registry* r, std::string id) : registry(r), agent_id(std::move(id)) {}
    workload_hold(const workload_hold&) = delete;
    workload_hold& operator=(const workload_hold&) = delete;

    ~workload_hold() {
        if (!registry) {
            return;
        }
        auto released = registry->adjust_workload(agent_id, -1);
        if (!released) {
            // Agent was unregistered while running
            LOG_WRN("agent %s: %s\n", agent_id.c_str(), released.error().message.c_str());
        }
    }
};

} // namespace

result<json> routed_agent_invoker::invoke(const agent_info& agent, const graph_node& node,
                                          const json& context) {
    const auto* step = std::get_if<agent_step>(&node.kind);
    const task t = make_task(node, step ? step->agent_type : agent_type_to_string(agent.type), context);

    if (registry_) {
        auto held = registry_->adjust_workload(agent.id, 1);
        if (!held) {
            return result<json>::failure(held.error());
        }
    }
    workload_hold hold(registry_, agent.id);

    execution_result exec;
    try {
        exec = engine_.execute_task(t, agent);
    } catch (const std::exception& e) {
        exec = execution_result();
        exec.error = e.what();
    } catch (...) {
        exec = execution_result();
        exec.error = "unknown exception";
    }

    if (!exec.success) {
        return result<json>::failure(ERROR_TYPE_INTERNAL,
                                     "Agent " + agent.id + " failed: " + exec.error);
    }
    LOG_DBG("agent %s finished node %s in %lld ms\n", agent.id.c_str(), node.id.c_str(),
            static_cast<long long>(exec.execution_time_ms));
    return result<json>::success(exec.result);
}

//
// voting_decision_voter
//

voting_decision_voter::voting_decision_voter(consensus_voting& voting, ballot_fn ballot,
                                             voting_algorithm algorithm, std::string no_consensus_outcome)
    : voting_(voting), ballot_(std::move(ballot)), algorithm_(algorithm),
      no_consensus_outcome_(std::move(no_consensus_outcome)) {}

result<std::string> voting_decision_voter::decide(const graph_node& node, const decision_step& step,
                                                  const json& context) {
    std::vector<vote_option> options;
    for (const auto& outcome : step.outcomes) {
        options.push_back(vote_option{outcome, outcome, json()});
    }

    auto session = voting_.create_voting_session(node.label, options);
    if (!session) {
        return result<std::string>::failure(session.error());
    }
    if (ballot_) {
        ballot_(voting_, session.value(), node, context);
    }

    auto closed = voting_.close_voting_session(session.value(), algorithm_);
    if (!closed) {
        return result<std::string>::failure(closed.error());
    }

    const vote_result& res = closed.value();
    if (!res.consensus_reached || !res.winning_option) {
        LOG_INF("decision %s: no consensus (%s)\n", node.id.c_str(), res.details.c_str());
        return result<std::string>::success(no_consensus_outcome_);
    }
    return result<std::string>::success(res.winning_option->id);
}

//
// handoff_context_transfer
//

handoff_context_transfer::handoff_context_transfer(context_handoff_manager& handoff, task_priority priority)
    : handoff_(handoff), priority_(priority) {}

result<json> handoff_context_transfer::transfer(const std::string& source_agent_id,
                                                const std::string& target_agent_id,
                                                const std::string& task_id, const json& context) {
    handoff_request request;
    request.source_agent_id = source_agent_id;
    request.target_agent_id = target_agent_id;
    request.task_id = task_id;
    request.context = context;
    request.priority = priority_;

    auto initiated = handoff_.initiate_handoff(request);
    if (!initiated) {
        return result<json>::failure(initiated.error());
    }
    return handoff_.complete_handoff(initiated.value().handoff_id, target_agent_id);
}

} // namespace swarm

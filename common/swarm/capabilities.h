#pragma once

// Adapters binding the workflow orchestrator's capability interfaces to the
// concrete router, voting and handoff engines.

#include "agent_registry.h"
#include "collaborators.h"
#include "consensus_voting.h"
#include "context_handoff.h"
#include "task_router.h"
#include "workflow.h"

#include <functional>
#include <string>
#include <vector>

namespace swarm {

// Task type routed for an agent role ("coder" -> "code_generation")
std::string task_type_for_agent_type(const std::string& agent_type);

// Routes agent nodes through the task router and runs them on an
// execution engine. The chosen agent's workload is held for the duration of
// the call when a registry is given.
class routed_agent_invoker : public agent_invoker {
public:
    routed_agent_invoker(task_router& router, agent_execution_engine& engine,
                         agent_registry* registry = nullptr);

    result<agent_info> select_agent(const graph_node& node, const agent_step& step,
                                    const json& context) override;

    result<json> invoke(const agent_info& agent, const graph_node& node,
                        const json& context) override;

private:
    task make_task(const graph_node& node, const std::string& agent_type, const json& context) const;

    task_router& router_;
    agent_execution_engine& engine_;
    agent_registry* registry_;
};

// Decides decision nodes by opening a voting session over the node's
// outcomes. The ballot callback casts the votes.
class voting_decision_voter : public decision_voter {
public:
    using ballot_fn = std::function<void(consensus_voting& voting, const std::string& session_id,
                                         const graph_node& node, const json& context)>;

    voting_decision_voter(consensus_voting& voting, ballot_fn ballot,
                          voting_algorithm algorithm = VOTING_ALGORITHM_SIMPLE_MAJORITY,
                          std::string no_consensus_outcome = "undecided");

    result<std::string> decide(const graph_node& node, const decision_step& step,
                               const json& context) override;

private:
    consensus_voting& voting_;
    ballot_fn ballot_;
    voting_algorithm algorithm_;
    std::string no_consensus_outcome_;
};

// Moves workflow context between agents through a compressed handoff
class handoff_context_transfer : public context_transfer {
public:
    explicit handoff_context_transfer(context_handoff_manager& handoff,
                                      task_priority priority = TASK_PRIORITY_MEDIUM);

    result<json> transfer(const std::string& source_agent_id, const std::string& target_agent_id,
                          const std::string& task_id, const json& context) override;

private:
    context_handoff_manager& handoff_;
    task_priority priority_;
};

} // namespace swarm

#pragma once

#include "error.h"
#include "event_bus.h"
#include "types.h"

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace swarm {

//
// Graph model
//

// Step run by an agent of the given role
struct agent_step {
    std::string agent_type;   // e.g. "coder"
};

// Generic transform step
struct process_step {
    json params = json::object();
};

// Branch point. Execution still follows the first outbound edge; the outcome
// is recorded in the context.
struct decision_step {
    std::vector<std::string> outcomes = {"positive", "negative"};
};

using node_kind = std::variant<agent_step, process_step, decision_step>;

// "agent", "process" or "decision"
const char* node_kind_to_string(const node_kind& kind);

struct graph_node {
    std::string id;
    std::string label;
    node_kind kind;
    json metadata = json::object();

    const char* kind_name() const { return node_kind_to_string(kind); }

    json to_json() const;

    // {id, type, label, agentType?, metadata?}; unknown type is a ValidationError
    static result<graph_node> from_json(const json& j);

    static graph_node agent(const std::string& id, const std::string& label, const std::string& agent_type);
    static graph_node process(const std::string& id, const std::string& label);
    static graph_node decision(const std::string& id, const std::string& label);
};

struct graph_edge {
    std::string id;
    std::string source;
    std::string target;
    std::string condition;   // Informational only
    json metadata = json::object();

    json to_json() const;
    static result<graph_edge> from_json(const json& j);
};

//
// Capabilities the orchestrator consumes. Concrete router, voting and
// handoff adapters live in capabilities.h.
//

class agent_invoker {
public:
    virtual ~agent_invoker() = default;

    // Pick the agent that runs an agent node
    virtual result<agent_info> select_agent(const graph_node& node, const agent_step& step,
                                            const json& context) = 0;

    // Run the agent, returns output to merge into the context
    virtual result<json> invoke(const agent_info& agent, const graph_node& node,
                                const json& context) = 0;
};

class decision_voter {
public:
    virtual ~decision_voter() = default;

    // Outcome of a decision node, one of step.outcomes when possible
    virtual result<std::string> decide(const graph_node& node, const decision_step& step,
                                       const json& context) = 0;
};

class context_transfer {
public:
    virtual ~context_transfer() = default;

    // Move context from one agent to the next, returns what the target received
    virtual result<json> transfer(const std::string& source_agent_id, const std::string& target_agent_id,
                                  const std::string& task_id, const json& context) = 0;
};

//
// Execution
//

struct workflow_config {
    std::string initial_node_id = "start";
    int max_iterations = 100;
    bool yield_between_nodes = true;

    static workflow_config default_config() { return workflow_config(); }

    json to_json() const;
};

struct workflow_step {
    std::string node_id;
    std::string node_kind;
    int64_t timestamp = 0;
    json input;
    json output;
    std::string agent_id;   // Agent nodes run through an invoker

    json to_json() const;
};

struct workflow_result {
    std::string workflow_id;
    bool success = false;
    std::vector<std::string> execution_path;   // Kept on failure
    json final_context = json::object();
    json output;                               // Last node output
    std::vector<workflow_step> history;
    std::optional<swarm_error> error;
    int64_t duration_ms = 0;

    json to_json() const;
};

// Returns true to stop at the next node boundary
using cancel_predicate = std::function<bool()>;

// Sequential state machine over a directed graph of agent/process/decision
// nodes. Graph edits and executions may happen from several threads; each
// execution works on a snapshot of the graph.
class workflow_orchestrator {
public:
    explicit workflow_orchestrator(event_bus& bus,
                                   const workflow_config& config = workflow_config::default_config());
    ~workflow_orchestrator();

    workflow_orchestrator(const workflow_orchestrator&) = delete;
    workflow_orchestrator& operator=(const workflow_orchestrator&) = delete;

    // Insert or replace by id
    status add_node(const graph_node& node);

    // Insert or replace by id, replacement keeps the original position.
    // Endpoints are checked at execution time, not here.
    status add_edge(const graph_edge& edge);

    // {initialNode?, nodes: [...], edges: [...]}
    status load_graph(const json& graph);

    std::vector<graph_node> get_nodes() const;
    std::vector<graph_edge> get_edges() const;

    // Edges leaving a node, in insertion order
    std::vector<graph_edge> get_outbound_edges(const std::string& node_id) const;

    void set_initial_node(const std::string& node_id);
    std::string initial_node() const;

    void set_agent_invoker(agent_invoker* invoker);
    void set_decision_voter(decision_voter* voter);
    void set_context_transfer(context_transfer* transfer);

    // Fails fast only when the initial node is missing or the context is not
    // an object; every later failure is reported inside the workflow_result.
    result<workflow_result> execute_workflow(const json& initial_context,
                                             cancel_predicate cancel = nullptr);

    std::future<result<workflow_result>> execute_workflow_async(json initial_context,
                                                                cancel_predicate cancel = nullptr);

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace swarm

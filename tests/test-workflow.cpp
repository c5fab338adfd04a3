// Tests for the workflow orchestrator and its capability adapters

#include "testing.h"

#include "../common/swarm/agent_registry.h"
#include "../common/swarm/capabilities.h"
#include "../common/swarm/collaborators.h"
#include "../common/swarm/consensus_voting.h"
#include "../common/swarm/context_handoff.h"
#include "../common/swarm/event_bus.h"
#include "../common/swarm/log.h"
#include "../common/swarm/task_router.h"
#include "../common/swarm/workflow.h"

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

using namespace swarm;

static graph_edge make_edge(const std::string& id, const std::string& source, const std::string& target) {
    graph_edge edge;
    edge.id = id;
    edge.source = source;
    edge.target = target;
    return edge;
}

static agent_info make_agent(const std::string& id, agent_type type) {
    agent_info agent;
    agent.id = id;
    agent.type = type;
    agent.name = id;
    agent.capacity = 4;
    return agent;
}

// Scenario E
static bool test_first_edge_is_followed() {
    event_bus bus;
    workflow_orchestrator orchestrator(bus);
    orchestrator.add_node(graph_node::process("start", "Start"));
    orchestrator.add_node(graph_node::decision("decision", "Decide"));
    orchestrator.add_node(graph_node::process("pathA", "Path A"));
    orchestrator.add_node(graph_node::process("pathB", "Path B"));
    orchestrator.add_edge(make_edge("e1", "start", "decision"));
    orchestrator.add_edge(make_edge("e2", "decision", "pathA"));
    orchestrator.add_edge(make_edge("e3", "decision", "pathB"));

    auto res = orchestrator.execute_workflow(json::object());
    TEST_ASSERT(res.ok(), "Workflow runs");
    const workflow_result& wf = res.value();
    TEST_ASSERT(wf.success, "Workflow succeeds");
    TEST_ASSERT(wf.execution_path == std::vector<std::string>({"start", "decision", "pathA"}), "Path follows first edge");
    TEST_ASSERT(wf.history.size() == 3, "One step per node");
    TEST_ASSERT(wf.history[1].node_kind == "decision", "Decision step recorded");
    TEST_ASSERT(wf.final_context["decision"] == "positive", "Default outcome recorded");
    TEST_ASSERT(wf.final_context["result"] == "Executed process Path A", "Last node output kept");
    TEST_ASSERT(wf.output == wf.final_context, "Output is the final context");
    TEST_ASSERT(!wf.error.has_value(), "No error");
    return true;
}

static bool test_cycle_hits_iteration_cap() {
    event_bus bus;
    workflow_config config;
    config.max_iterations = 10;
    workflow_orchestrator orchestrator(bus, config);
    orchestrator.add_node(graph_node::process("start", "A"));
    orchestrator.add_node(graph_node::process("b", "B"));
    orchestrator.add_edge(make_edge("e1", "start", "b"));
    orchestrator.add_edge(make_edge("e2", "b", "start"));

    std::vector<std::string> failures;
    bus.subscribe("workflow.failed", [&](const event& ev) {
        const auto* payload = ev.get_if<workflow_failed_payload>();
        if (payload) {
            failures.push_back(payload->error);
        }
    });

    auto res = orchestrator.execute_workflow(json{{"seed", 1}});
    TEST_ASSERT(res.ok(), "Run completes with a result");
    TEST_ASSERT(!res.value().success, "Run failed");
    TEST_ASSERT(res.value().error && res.value().error->message == "MaxIterationsExceeded", "Cap reported");
    TEST_ASSERT(res.value().execution_path.size() == 10, "Partial path kept");
    TEST_ASSERT(res.value().final_context["seed"] == 1, "Context kept");
    TEST_ASSERT(failures.size() == 1 && failures[0] == "MaxIterationsExceeded", "Failure announced");
    return true;
}

static bool test_missing_nodes() {
    event_bus bus;
    workflow_orchestrator orchestrator(bus);

    auto empty = orchestrator.execute_workflow(json::object());
    TEST_ASSERT(!empty.ok(), "Missing initial node fails fast");
    TEST_ASSERT(empty.error().message == "Initial state node start not found", "Initial node named");

    orchestrator.add_node(graph_node::process("start", "Start"));
    orchestrator.add_edge(make_edge("e1", "start", "ghost"));

    auto dangling = orchestrator.execute_workflow(json::object());
    TEST_ASSERT(dangling.ok() && !dangling.value().success, "Dangling edge fails the run");
    TEST_ASSERT(dangling.value().error->message == "Node ghost not found during execution", "Missing node named");
    TEST_ASSERT(dangling.value().execution_path == std::vector<std::string>({"start"}), "Path up to the failure");

    TEST_ASSERT(!orchestrator.execute_workflow(json::array()).ok(), "Context must be an object");

    orchestrator.set_initial_node("elsewhere");
    TEST_ASSERT(!orchestrator.execute_workflow(json::object()).ok(), "Changed initial node checked");
    return true;
}

static bool test_graph_from_json() {
    auto bad = graph_node::from_json(json{{"id", "n1"}, {"type", "loop"}});
    TEST_ASSERT(!bad.ok(), "Unknown node type rejected");
    TEST_ASSERT(bad.error().type == ERROR_TYPE_VALIDATION, "ValidationError");
    TEST_ASSERT(bad.error().message == "Unknown node type: loop", "Type named");

    TEST_ASSERT(!graph_node::from_json(json{{"id", "n2"}, {"type", "agent"}}).ok(), "Agent node needs agentType");

    auto agent = graph_node::from_json(json{{"id", "n3"}, {"type", "agent"}, {"agentType", "coder"}});
    TEST_ASSERT(agent.ok() && std::holds_alternative<agent_step>(agent.value().kind), "Agent node parsed");
    TEST_ASSERT(agent.value().label == "n3", "Label defaults to id");

    event_bus bus;
    workflow_orchestrator orchestrator(bus);
    json graph = {
        {"initialNode", "begin"},
        {"nodes", json::array({
            {{"id", "begin"}, {"type", "process"}, {"label", "Begin"}},
            {{"id", "vote"}, {"type", "decision"}, {"outcomes", {"ship", "hold"}}}
        })},
        {"edges", json::array({
            {{"id", "e1"}, {"source", "begin"}, {"target", "vote"}}
        })}
    };
    TEST_ASSERT(orchestrator.load_graph(graph).ok(), "Graph loads");
    TEST_ASSERT(orchestrator.initial_node() == "begin", "Initial node taken from graph");
    TEST_ASSERT(orchestrator.get_nodes().size() == 2, "Nodes loaded");

    auto res = orchestrator.execute_workflow(json::object());
    TEST_ASSERT(res.ok() && res.value().success, "Loaded graph runs");
    TEST_ASSERT(res.value().final_context["decision"] == "ship", "First outcome is the default");

    json broken = {{"nodes", json::array({{{"id", "x"}, {"type", "loop"}}})}};
    TEST_ASSERT(!orchestrator.load_graph(broken).ok(), "Bad graph rejected");
    TEST_ASSERT(orchestrator.get_nodes().size() == 2, "Bad graph leaves nodes untouched");
    return true;
}

static bool test_graph_editing() {
    event_bus bus;
    workflow_orchestrator orchestrator(bus);
    orchestrator.add_edge(make_edge("e1", "start", "x"));
    orchestrator.add_edge(make_edge("e2", "start", "y"));
    orchestrator.add_edge(make_edge("e1", "start", "z"));

    auto outbound = orchestrator.get_outbound_edges("start");
    TEST_ASSERT(outbound.size() == 2, "Replacement does not duplicate");
    TEST_ASSERT(outbound[0].target == "z", "Replacement keeps position");
    TEST_ASSERT(outbound[1].target == "y", "Other edge untouched");

    orchestrator.add_node(graph_node::process("start", "One"));
    orchestrator.add_node(graph_node::agent("start", "Two", "coder"));
    auto nodes = orchestrator.get_nodes();
    TEST_ASSERT(nodes.size() == 1 && nodes[0].label == "Two", "Node replaced by id");
    TEST_ASSERT(std::string(nodes[0].kind_name()) == "agent", "Kind replaced");

    TEST_ASSERT(!orchestrator.add_edge(make_edge("", "a", "b")).ok(), "Edge id required");
    TEST_ASSERT(!orchestrator.add_node(graph_node::process("", "nameless")).ok(), "Node id required");
    return true;
}

static bool test_events_and_default_agent_output() {
    event_bus bus;
    workflow_orchestrator orchestrator(bus);
    orchestrator.add_node(graph_node::agent("start", "Coder", "coder"));
    orchestrator.add_node(graph_node::process("finish", "Finish"));
    orchestrator.add_edge(make_edge("e1", "start", "finish"));

    std::vector<std::string> types;
    bus.subscribe_all([&](const event& ev) { types.push_back(ev.type); });

    auto res = orchestrator.execute_workflow(json::object());
    TEST_ASSERT(res.ok() && res.value().success, "Workflow succeeds");
    TEST_ASSERT(res.value().history[0].output["result"] == "Processed by Coder agent", "Agent node output");

    const std::vector<std::string> expected = {
        "workflow.started", "workflow.node.executed", "workflow.node.executed", "workflow.completed"
    };
    TEST_ASSERT(types == expected, "Lifecycle events in order");
    return true;
}

static bool test_routed_agents_with_handoff() {
    event_bus bus;
    agent_registry registry(bus);
    task_router router(registry, bus);
    context_handoff_manager handoff(bus);

    router.register_agent(make_agent("coder-1", AGENT_TYPE_CODER));
    router.register_agent(make_agent("reviewer-1", AGENT_TYPE_REVIEWER));

    std::atomic<int> peak_workload{0};
    callback_execution_engine engine([&](const task& t, const agent_info& agent) {
        auto live = registry.get_agent(agent.id);
        if (live) {
            peak_workload = std::max(peak_workload.load(), live->workload);
        }
        execution_result out;
        out.success = true;
        out.result = json{{t.id + "_by", agent.id}};
        return out;
    });

    routed_agent_invoker invoker(router, engine, &registry);
    handoff_context_transfer transfer(handoff);

    workflow_orchestrator orchestrator(bus);
    orchestrator.set_agent_invoker(&invoker);
    orchestrator.set_context_transfer(&transfer);
    orchestrator.add_node(graph_node::agent("start", "Write", "coder"));
    orchestrator.add_node(graph_node::agent("review", "Review", "reviewer"));
    orchestrator.add_edge(make_edge("e1", "start", "review"));

    int handoffs = 0;
    bus.subscribe("handoff.completed", [&](const event&) { handoffs++; });

    auto res = orchestrator.execute_workflow(json{{"repo", "demo"}});
    TEST_ASSERT(res.ok() && res.value().success, "Workflow succeeds");

    const workflow_result& wf = res.value();
    TEST_ASSERT(wf.history[0].agent_id == "coder-1", "Coder routed");
    TEST_ASSERT(wf.history[1].agent_id == "reviewer-1", "Reviewer routed");
    TEST_ASSERT(wf.final_context["start_by"] == "coder-1", "Coder output merged");
    TEST_ASSERT(wf.final_context["review_by"] == "reviewer-1", "Reviewer output merged");
    TEST_ASSERT(wf.final_context["repo"] == "demo", "Initial context carried");
    TEST_ASSERT(handoffs == 1, "Context handed off between roles");

    TEST_ASSERT(peak_workload == 1, "Workload held while running");
    TEST_ASSERT(registry.get_agent("coder-1")->workload == 0, "Workload released");
    TEST_ASSERT(router.get_routing_history("coder-1").size() == 1, "Routing recorded");

    TEST_ASSERT(task_type_for_agent_type("Coder") == "code_generation", "Role mapped to task type");
    TEST_ASSERT(task_type_for_agent_type("custom") == "custom", "Unknown role passes through");
    return true;
}

static bool test_agent_failure_fails_run() {
    event_bus bus;
    agent_registry registry(bus);
    task_router router(registry, bus);
    router.register_agent(make_agent("coder-1", AGENT_TYPE_CODER));

    callback_execution_engine engine([](const task&, const agent_info&) -> execution_result {
        throw std::runtime_error("model crashed");
    });
    routed_agent_invoker invoker(router, engine, &registry);

    workflow_orchestrator orchestrator(bus);
    orchestrator.set_agent_invoker(&invoker);
    orchestrator.add_node(graph_node::agent("start", "Write", "coder"));

    auto res = orchestrator.execute_workflow(json::object());
    TEST_ASSERT(res.ok() && !res.value().success, "Run failed");
    TEST_ASSERT(res.value().error->message.find("model crashed") != std::string::npos, "Engine error surfaced");
    TEST_ASSERT(res.value().execution_path.size() == 1, "Failed node on the path");
    TEST_ASSERT(registry.get_agent("coder-1")->workload == 0, "Workload released after failure");

    agent_registry empty_registry(bus);
    task_router empty_router(empty_registry, bus);
    routed_agent_invoker nobody(empty_router, engine);
    orchestrator.set_agent_invoker(&nobody);
    auto unrouted = orchestrator.execute_workflow(json::object());
    TEST_ASSERT(unrouted.ok() && unrouted.value().error->type == ERROR_TYPE_CAPACITY, "No agents is a capacity failure");
    return true;
}

namespace {

struct throwing_engine : agent_execution_engine {
    execution_result execute_task(const task&, const agent_info&) override {
        throw 42;
    }
};

} // namespace

static bool test_non_standard_throw_fails_run() {
    event_bus bus;
    agent_registry registry(bus);
    task_router router(registry, bus);
    router.register_agent(make_agent("coder-1", AGENT_TYPE_CODER));

    workflow_orchestrator orchestrator(bus);
    orchestrator.add_node(graph_node::agent("start", "Write", "coder"));

    callback_execution_engine callback_engine([](const task&, const agent_info&) -> execution_result {
        throw 42;
    });
    routed_agent_invoker via_callback(router, callback_engine, &registry);
    orchestrator.set_agent_invoker(&via_callback);

    auto res = orchestrator.execute_workflow(json::object());
    TEST_ASSERT(res.ok() && !res.value().success, "Callback throw fails the run");
    TEST_ASSERT(res.value().error->type == ERROR_TYPE_INTERNAL, "Reported as internal");
    TEST_ASSERT(registry.get_agent("coder-1")->workload == 0, "Workload released after callback throw");

    json j = res.value().to_json();
    TEST_ASSERT(j["error"].is_object(), "Error serialized as an object");
    TEST_ASSERT(j["error"]["type"] == "internal", "Error kind serialized");
    swarm_error back = swarm_error::from_json(j["error"]);
    TEST_ASSERT(back.type == ERROR_TYPE_INTERNAL && back.message == res.value().error->message,
                "Error restored from its JSON form");

    throwing_engine engine;
    routed_agent_invoker direct(router, engine, &registry);
    orchestrator.set_agent_invoker(&direct);

    auto again = orchestrator.execute_workflow(json::object());
    TEST_ASSERT(again.ok() && !again.value().success, "Engine throw fails the run");
    TEST_ASSERT(again.value().error->message.find("unknown exception") != std::string::npos,
                "Unknown exception surfaced");
    TEST_ASSERT(registry.get_agent("coder-1")->workload == 0, "Workload released after engine throw");
    return true;
}

static bool test_voting_decisions() {
    event_bus bus;
    agent_registry registry(bus);
    consensus_voting voting(registry, bus);
    voting.register_agent(make_agent("a1", AGENT_TYPE_REVIEWER));
    voting.register_agent(make_agent("a2", AGENT_TYPE_TESTER));

    voting_decision_voter voter(voting, [](consensus_voting& v, const std::string& session_id,
                                           const graph_node&, const json&) {
        v.cast_vote(session_id, "a1", "negative");
        v.cast_vote(session_id, "a2", "negative");
    });

    workflow_orchestrator orchestrator(bus);
    orchestrator.set_decision_voter(&voter);
    orchestrator.add_node(graph_node::decision("start", "Ship it?"));
    orchestrator.add_node(graph_node::process("yes", "Yes"));
    orchestrator.add_node(graph_node::process("no", "No"));
    orchestrator.add_edge(make_edge("e1", "start", "yes"));
    orchestrator.add_edge(make_edge("e2", "start", "no"));

    auto res = orchestrator.execute_workflow(json::object());
    TEST_ASSERT(res.ok() && res.value().success, "Workflow succeeds");
    TEST_ASSERT(res.value().history[0].output["decision"] == "negative", "Voted outcome recorded");
    TEST_ASSERT(res.value().execution_path.back() == "yes", "First edge still followed");
    TEST_ASSERT(voting.list_voting_sessions().size() == 1, "One session per decision");

    voting_decision_voter silent(voting, nullptr);
    orchestrator.set_decision_voter(&silent);
    auto undecided = orchestrator.execute_workflow(json::object());
    TEST_ASSERT(undecided.ok(), "Silent vote runs");
    TEST_ASSERT(undecided.value().history[0].output["decision"] == "undecided", "No consensus outcome");
    return true;
}

static bool test_async_and_cancel() {
    event_bus bus;
    workflow_orchestrator orchestrator(bus);
    orchestrator.add_node(graph_node::process("start", "A"));
    orchestrator.add_node(graph_node::process("b", "B"));
    orchestrator.add_node(graph_node::process("c", "C"));
    orchestrator.add_edge(make_edge("e1", "start", "b"));
    orchestrator.add_edge(make_edge("e2", "b", "c"));

    auto future = orchestrator.execute_workflow_async(json{{"async", true}});
    auto res = future.get();
    TEST_ASSERT(res.ok() && res.value().success, "Async run succeeds");
    TEST_ASSERT(res.value().execution_path.size() == 3, "Async run visits every node");

    int checks = 0;
    auto cancelled = orchestrator.execute_workflow(json::object(), [&]() { return ++checks > 2; });
    TEST_ASSERT(cancelled.ok() && !cancelled.value().success, "Cancelled run fails");
    TEST_ASSERT(cancelled.value().error->message == "Cancelled", "Cancellation reported");
    TEST_ASSERT(cancelled.value().execution_path.size() == 2, "Stopped at a node boundary");
    return true;
}

int main() {
    std::cout << "=== Workflow Orchestrator Tests ===" << std::endl << std::endl;
    log_set_level(LOG_LEVEL_OFF);

    int total = 0;
    int passed = 0;
    int failed = 0;

    RUN_TEST(test_first_edge_is_followed);
    RUN_TEST(test_cycle_hits_iteration_cap);
    RUN_TEST(test_missing_nodes);
    RUN_TEST(test_graph_from_json);
    RUN_TEST(test_graph_editing);
    RUN_TEST(test_events_and_default_agent_output);
    RUN_TEST(test_routed_agents_with_handoff);
    RUN_TEST(test_agent_failure_fails_run);
    RUN_TEST(test_non_standard_throw_fails_run);
    RUN_TEST(test_voting_decisions);
    RUN_TEST(test_async_and_cancel);

    return report_results(total, passed, failed);
}

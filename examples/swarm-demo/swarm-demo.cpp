#include "../../common/swarm/capabilities.h"
#include "../../common/swarm/collaborators.h"
#include "../../common/swarm/config.h"
#include "../../common/swarm/core.h"
#include "../../common/swarm/log.h"

#include <iostream>
#include <string>

using namespace swarm;

// ============================================================================
// Agents
// ============================================================================

static agent_info make_agent(const std::string& id, agent_type type,
                             std::vector<std::string> expertise, int capacity) {
    agent_info agent;
    agent.id = id;
    agent.type = type;
    agent.name = id;
    agent.expertise = std::move(expertise);
    agent.capacity = capacity;
    return agent;
}

// Pretends to run the task and reports who handled it
static execution_result simulated_agent(const task& t, const agent_info& agent) {
    execution_result out;
    out.success = true;
    out.result = json{
        {t.id + "_status", "done"},
        {t.id + "_agent", agent.id}
    };
    return out;
}

// ============================================================================
// Demo steps
// ============================================================================

static bool demo_routing(coordination_core& core) {
    std::cout << std::endl << "--- Task routing ---" << std::endl;

    task t;
    t.id = "task-parser";
    t.description = "Implement the JSON parser in C++ with unit tests";
    t.type = "code_generation";
    t.priority = 8;

    auto routed = core.router().route_task(t);
    if (!routed) {
        LOG_ERR("routing failed: %s\n", routed.error().to_string().c_str());
        return false;
    }
    std::cout << routed.value().to_json().dump(2) << std::endl;

    auto report = core.router().get_load_balancing_recommendations();
    std::cout << report.to_json().dump(2) << std::endl;
    return true;
}

static bool demo_voting(coordination_core& core) {
    std::cout << std::endl << "--- Consensus voting ---" << std::endl;

    std::vector<vote_option> options = {
        {"merge", "Merge now", json()},
        {"revise", "Request changes", json()},
    };
    auto session = core.voting().create_voting_session("Merge the parser?", options);
    if (!session) {
        LOG_ERR("cannot open session: %s\n", session.error().to_string().c_str());
        return false;
    }

    core.voting().cast_vote(session.value(), "coder-1", "merge", "tests pass");
    core.voting().cast_vote(session.value(), "reviewer-1", "merge");
    core.voting().cast_vote(session.value(), "tester-1", "revise", "edge cases missing");

    auto closed = core.voting().close_voting_session(session.value(), VOTING_ALGORITHM_WEIGHTED_MAJORITY);
    if (!closed) {
        LOG_ERR("cannot close session: %s\n", closed.error().to_string().c_str());
        return false;
    }
    std::cout << closed.value().to_json().dump(2) << std::endl;
    return true;
}

static bool demo_handshake(coordination_core& core) {
    std::cout << std::endl << "--- Agent handshake ---" << std::endl;

    core.mediator().register_agent("reviewer-1", "1.1", {"review", "lint"});
    core.mediator().register_agent("legacy-1", "2.0", {"review"});

    handshake_request req;
    req.source_agent_id = "coder-1";
    req.target_agent_id = "reviewer-1";
    req.capabilities = {"code", "review"};
    auto hs = core.mediator().initiate_handshake(req);
    if (!hs) {
        LOG_ERR("handshake failed: %s\n", hs.error().to_string().c_str());
        return false;
    }
    std::cout << hs.value().to_json().dump(2) << std::endl;

    req.target_agent_id = "legacy-1";
    auto mismatch = core.mediator().initiate_handshake(req);
    if (mismatch) {
        std::cout << mismatch.value().to_json().dump(2) << std::endl;
    }

    task_negotiation_request neg;
    neg.source_agent_id = "coder-1";
    neg.target_agent_id = "reviewer-1";
    neg.handshake_id = hs.value().handshake_id;
    neg.t.id = "task-review";
    neg.t.description = "Review the parser";
    neg.context = {{"files", {"parser.cpp", "parser.h"}}};
    auto negotiated = core.mediator().negotiate_task(neg);
    if (!negotiated) {
        LOG_ERR("negotiation failed: %s\n", negotiated.error().to_string().c_str());
        return false;
    }
    std::cout << negotiated.value().to_json().dump(2) << std::endl;

    auto ctx = core.handoff().complete_handoff(negotiated.value().handoff_id, "reviewer-1");
    if (!ctx) {
        LOG_ERR("handoff failed: %s\n", ctx.error().to_string().c_str());
        return false;
    }
    std::cout << "reviewer-1 received: " << ctx.value().dump() << std::endl;
    return true;
}

static bool demo_workflow(coordination_core& core) {
    std::cout << std::endl << "--- Workflow ---" << std::endl;

    callback_execution_engine engine(simulated_agent);
    routed_agent_invoker invoker(core.router(), engine, &core.registry());
    handoff_context_transfer transfer(core.handoff());
    voting_decision_voter voter(core.voting(),
        [](consensus_voting& voting, const std::string& session_id, const graph_node&, const json&) {
            voting.cast_vote(session_id, "planner-1", "positive");
            voting.cast_vote(session_id, "reviewer-1", "positive");
            voting.cast_vote(session_id, "tester-1", "negative");
        });

    workflow_orchestrator& wf = core.orchestrator();
    wf.set_agent_invoker(&invoker);
    wf.set_context_transfer(&transfer);
    wf.set_decision_voter(&voter);

    json graph = {
        {"initialNode", "start"},
        {"nodes", json::array({
            {{"id", "start"}, {"type", "process"}, {"label", "Collect requirements"}},
            {{"id", "implement"}, {"type", "agent"}, {"label", "Implement"}, {"agentType", "coder"}},
            {{"id", "review"}, {"type", "agent"}, {"label", "Review"}, {"agentType", "reviewer"}},
            {{"id", "gate"}, {"type", "decision"}, {"label", "Ready to ship?"}},
            {{"id", "ship"}, {"type", "process"}, {"label", "Ship"}},
            {{"id", "rework"}, {"type", "process"}, {"label", "Rework"}}
        })},
        {"edges", json::array({
            {{"id", "e1"}, {"source", "start"}, {"target", "implement"}},
            {{"id", "e2"}, {"source", "implement"}, {"target", "review"}},
            {{"id", "e3"}, {"source", "review"}, {"target", "gate"}},
            {{"id", "e4"}, {"source", "gate"}, {"target", "ship"}, {"condition", "positive"}},
            {{"id", "e5"}, {"source", "gate"}, {"target", "rework"}, {"condition", "negative"}}
        })}
    };
    auto loaded = wf.load_graph(graph);
    if (!loaded) {
        LOG_ERR("bad workflow graph: %s\n", loaded.error().to_string().c_str());
        return false;
    }

    auto res = wf.execute_workflow(json{{"project", "json-parser"}});

    // Capabilities are stack objects, detach before they go away
    wf.set_agent_invoker(nullptr);
    wf.set_context_transfer(nullptr);
    wf.set_decision_voter(nullptr);

    if (!res) {
        LOG_ERR("workflow rejected: %s\n", res.error().to_string().c_str());
        return false;
    }
    std::cout << res.value().to_json().dump(2) << std::endl;
    return res.value().success;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char ** argv) {
    swarm_config config = swarm_config::default_config();
    if (argc > 1) {
        auto loaded = load_config_file(argv[1]);
        if (!loaded) {
            std::cerr << "error: " << loaded.error().to_string() << std::endl;
            return 1;
        }
        config = loaded.value();
    }
    log_configure(config.log);

    coordination_core core(config);

    int events = 0;
    core.bus().subscribe_all([&events](const event&) { events++; });

    core.router().register_agent(make_agent("planner-1", AGENT_TYPE_PLANNER, {"architecture", "planning"}, 3));
    core.router().register_agent(make_agent("coder-1", AGENT_TYPE_CODER, {"c++", "json", "parser"}, 5));
    core.router().register_agent(make_agent("coder-2", AGENT_TYPE_CODER, {"python"}, 5));
    core.router().register_agent(make_agent("reviewer-1", AGENT_TYPE_REVIEWER, {"c++", "security"}, 4));
    core.router().register_agent(make_agent("tester-1", AGENT_TYPE_TESTER, {"unit", "fuzzing"}, 4));
    core.router().update_agent_workload("coder-2", 4);

    memory_persistence_store store;
    core.set_persistence_store(&store);

    bool ok = demo_routing(core) &&
              demo_voting(core) &&
              demo_handshake(core) &&
              demo_workflow(core);

    std::cout << std::endl << "--- Summary ---" << std::endl;
    std::cout << "events published: " << events << std::endl;
    std::cout << "bus stats: " << core.bus().stats().to_json().dump() << std::endl;
    std::cout << "closed sessions persisted: " << store.list("voting_session").size() << std::endl;
    std::cout << "handoffs persisted: " << store.list("handoff").size() << std::endl;

    LOG_INF("swarm demo %s\n", ok ? "finished" : "failed");
    return ok ? 0 : 1;
}

#include "workflow.h"
#include "log.h"

#include <atomic>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <type_traits>

namespace swarm {

static const char * WORKFLOW_SOURCE = "workflow_orchestrator";

template<typename T>
struct always_false : std::false_type {};

const char* node_kind_to_string(const node_kind& kind) {
    return std::visit([](const auto& step) -> const char* {
        using T = std::decay_t<decltype(step)>;
        if constexpr (std::is_same_v<T, agent_step>) {
            return "agent";
        } else if constexpr (std::is_same_v<T, process_step>) {
            return "process";
        } else if constexpr (std::is_same_v<T, decision_step>) {
            return "decision";
        } else {
            static_assert(always_false<T>::value, "unhandled node kind");
        }
    }, kind);
}

json graph_node::to_json() const {
    json j{{"id", id}, {"type", kind_name()}, {"label", label}};
    if (const auto* step = std::get_if<agent_step>(&kind)) {
        j["agentType"] = step->agent_type;
    } else if (const auto* step = std::get_if<process_step>(&kind)) {
        if (!step->params.empty()) {
            j["params"] = step->params;
        }
    } else if (const auto* step = std::get_if<decision_step>(&kind)) {
        j["outcomes"] = step->outcomes;
    }
    if (!metadata.empty()) {
        j["metadata"] = metadata;
    }
    return j;
}

result<graph_node> graph_node::from_json(const json& j) {
    if (!j.is_object()) {
        return result<graph_node>::failure(ERROR_TYPE_VALIDATION, "Graph node must be a JSON object");
    }
    if (!j.contains("id") || !j["id"].is_string() || j["id"].get<std::string>().empty()) {
        return result<graph_node>::failure(ERROR_TYPE_VALIDATION, "Graph node needs a non-empty string id");
    }
    if (!j.contains("type") || !j["type"].is_string()) {
        return result<graph_node>::failure(ERROR_TYPE_VALIDATION, "Graph node needs a string type");
    }

    graph_node node;
    node.id = j["id"].get<std::string>();
    node.label = j.value("label", node.id);
    if (j.contains("metadata") && j["metadata"].is_object()) {
        node.metadata = j["metadata"];
    }

    const std::string type = j["type"].get<std::string>();
    if (type == "agent") {
        if (!j.contains("agentType") || !j["agentType"].is_string()) {
            return result<graph_node>::failure(ERROR_TYPE_VALIDATION,
                                               "Agent node " + node.id + " needs an agentType");
        }
        node.kind = agent_step{j["agentType"].get<std::string>()};
    } else if (type == "process") {
        process_step step;
        if (j.contains("params") && j["params"].is_object()) {
            step.params = j["params"];
        }
        node.kind = step;
    } else if (type == "decision") {
        decision_step step;
        if (j.contains("outcomes") && j["outcomes"].is_array() && !j["outcomes"].empty()) {
            step.outcomes.clear();
            for (const auto& outcome : j["outcomes"]) {
                if (!outcome.is_string()) {
                    return result<graph_node>::failure(ERROR_TYPE_VALIDATION,
                                                       "Decision node " + node.id + " outcomes must be strings");
                }
                step.outcomes.push_back(outcome.get<std::string>());
            }
        }
        node.kind = step;
    } else {
        return result<graph_node>::failure(ERROR_TYPE_VALIDATION, "Unknown node type: " + type);
    }
    return result<graph_node>::success(node);
}

graph_node graph_node::agent(const std::string& id, const std::string& label, const std::string& agent_type) {
    graph_node node;
    node.id = id;
    node.label = label;
    node.kind = agent_step{agent_type};
    return node;
}

graph_node graph_node::process(const std::string& id, const std::string& label) {
    graph_node node;
    node.id = id;
    node.label = label;
    node.kind = process_step{};
    return node;
}

graph_node graph_node::decision(const std::string& id, const std::string& label) {
    graph_node node;
    node.id = id;
    node.label = label;
    node.kind = decision_step{};
    return node;
}

json graph_edge::to_json() const {
    json j{{"id", id}, {"source", source}, {"target", target}};
    if (!condition.empty()) {
        j["condition"] = condition;
    }
    if (!metadata.empty()) {
        j["metadata"] = metadata;
    }
    return j;
}

result<graph_edge> graph_edge::from_json(const json& j) {
    if (!j.is_object()) {
        return result<graph_edge>::failure(ERROR_TYPE_VALIDATION, "Graph edge must be a JSON object");
    }
    for (const char* key : {"id", "source", "target"}) {
        if (!j.contains(key) || !j[key].is_string()) {
            return result<graph_edge>::failure(ERROR_TYPE_VALIDATION,
                                               std::string("Graph edge needs a string ") + key);
        }
    }
    graph_edge edge;
    edge.id = j["id"].get<std::string>();
    edge.source = j["source"].get<std::string>();
    edge.target = j["target"].get<std::string>();
    edge.condition = j.value("condition", "");
    if (j.contains("metadata") && j["metadata"].is_object()) {
        edge.metadata = j["metadata"];
    }
    return result<graph_edge>::success(edge);
}

json workflow_config::to_json() const {
    return json{
        {"initial_node_id", initial_node_id},
        {"max_iterations", max_iterations},
        {"yield_between_nodes", yield_between_nodes}
    };
}

json workflow_step::to_json() const {
    json j{
        {"node_id", node_id},
        {"node_kind", node_kind},
        {"timestamp", timestamp},
        {"input", input},
        {"output", output}
    };
    if (!agent_id.empty()) {
        j["agent_id"] = agent_id;
    }
    return j;
}

json workflow_result::to_json() const {
    json steps = json::array();
    for (const auto& step : history) {
        steps.push_back(step.to_json());
    }
    json j{
        {"workflow_id", workflow_id},
        {"success", success},
        {"execution_path", execution_path},
        {"final_context", final_context},
        {"output", output},
        {"history", steps},
        {"duration_ms", duration_ms}
    };
    if (error) {
        j["error"] = error->to_json();
    }
    return j;
}

namespace {

// Graph copy taken at the start of an execution
struct graph_snapshot {
    std::map<std::string, graph_node> nodes;
    std::vector<graph_edge> edges;

    std::vector<graph_edge> outbound(const std::string& node_id) const {
        std::vector<graph_edge> out;
        for (const auto& edge : edges) {
            if (edge.source == node_id) {
                out.push_back(edge);
            }
        }
        return out;
    }
};

// State of one execute_workflow call
struct run_state {
    std::string workflow_id;
    json context;
    std::optional<agent_info> previous_agent;
    std::string agent_id;   // Agent that ran the current node
};

} // namespace

struct workflow_orchestrator::impl {
    event_bus& bus;
    workflow_config config;

    std::map<std::string, graph_node> nodes;
    std::vector<graph_edge> edges;   // Insertion order
    mutable std::shared_mutex mutex;

    std::atomic<agent_invoker*> invoker{nullptr};
    std::atomic<decision_voter*> voter{nullptr};
    std::atomic<context_transfer*> transfer{nullptr};

    impl(event_bus& b, const workflow_config& c) : bus(b), config(c) {}

    result<json> run_agent(const graph_node& node, const agent_step& step, run_state& state) {
        json out = state.context;
        agent_invoker* inv = invoker.load();
        if (!inv) {
            out["processedBy"] = node.label;
            out["result"] = "Processed by " + node.label + " agent";
            return result<json>::success(out);
        }

        auto selected = inv->select_agent(node, step, state.context);
        if (!selected) {
            return result<json>::failure(selected.error());
        }
        const agent_info& agent = selected.value();

        context_transfer* xfer = transfer.load();
        if (xfer && state.previous_agent && state.previous_agent->type != agent.type &&
            state.previous_agent->id != agent.id) {
            auto moved = xfer->transfer(state.previous_agent->id, agent.id,
                                        state.workflow_id + ":" + node.id, out);
            if (!moved) {
                return result<json>::failure(moved.error());
            }
            out = moved.value();
        }

        auto produced = inv->invoke(agent, node, out);
        if (!produced) {
            return result<json>::failure(produced.error());
        }
        if (produced.value().is_object()) {
            for (auto it = produced.value().begin(); it != produced.value().end(); ++it) {
                out[it.key()] = it.value();
            }
        } else if (!produced.value().is_null()) {
            out["output"] = produced.value();
        }
        out["processedBy"] = node.label;
        out["agentId"] = agent.id;
        if (!out.contains("result")) {
            out["result"] = "Processed by " + node.label + " agent";
        }

        state.previous_agent = agent;
        state.agent_id = agent.id;
        return result<json>::success(out);
    }

    result<json> run_decision(const graph_node& node, const decision_step& step, run_state& state) {
        std::string outcome = step.outcomes.empty() ? "positive" : step.outcomes.front();
        decision_voter* v = voter.load();
        if (v) {
            auto decided = v->decide(node, step, state.context);
            if (!decided) {
                return result<json>::failure(decided.error());
            }
            outcome = decided.value();
        }

        json out = state.context;
        out["processedBy"] = node.label;
        out["decision"] = outcome;
        out["result"] = "Decision made: " + outcome;
        return result<json>::success(out);
    }

    result<json> process_node(const graph_node& node, run_state& state) {
        state.agent_id.clear();
        return std::visit([&](const auto& step) -> result<json> {
            using T = std::decay_t<decltype(step)>;
            if constexpr (std::is_same_v<T, agent_step>) {
                return run_agent(node, step, state);
            } else if constexpr (std::is_same_v<T, process_step>) {
                json out = state.context;
                out["processedBy"] = node.label;
                out["result"] = "Executed process " + node.label;
                return result<json>::success(out);
            } else if constexpr (std::is_same_v<T, decision_step>) {
                return run_decision(node, step, state);
            } else {
                static_assert(always_false<T>::value, "unhandled node kind");
            }
        }, node.kind);
    }

    void finish_failed(workflow_result& res, error_type type, const std::string& message, int64_t start) {
        res.success = false;
        res.error = swarm_error(type, message);
        res.duration_ms = get_timestamp_ms() - start;

        LOG_ERR("workflow %s failed after %zu nodes: %s\n", res.workflow_id.c_str(),
                res.execution_path.size(), message.c_str());

        workflow_failed_payload payload;
        payload.workflow_id = res.workflow_id;
        payload.error_type = error_type_to_string(type);
        payload.error = message;
        payload.execution_path = res.execution_path;
        bus.publish(WORKFLOW_SOURCE, payload);
    }
};

workflow_orchestrator::workflow_orchestrator(event_bus& bus, const workflow_config& config)
    : pimpl(std::make_unique<impl>(bus, config)) {}

workflow_orchestrator::~workflow_orchestrator() = default;

status workflow_orchestrator::add_node(const graph_node& node) {
    if (node.id.empty()) {
        return status::failure(ERROR_TYPE_VALIDATION, "Graph node id must not be empty");
    }
    std::unique_lock<std::shared_mutex> lock(pimpl->mutex);
    pimpl->nodes[node.id] = node;
    LOG_DBG("added %s node %s (%s)\n", node.kind_name(), node.id.c_str(), node.label.c_str());
    return status::success();
}

status workflow_orchestrator::add_edge(const graph_edge& edge) {
    if (edge.id.empty() || edge.source.empty() || edge.target.empty()) {
        return status::failure(ERROR_TYPE_VALIDATION, "Graph edge needs id, source and target");
    }
    std::unique_lock<std::shared_mutex> lock(pimpl->mutex);
    for (auto& existing : pimpl->edges) {
        if (existing.id == edge.id) {
            existing = edge;
            return status::success();
        }
    }
    pimpl->edges.push_back(edge);
    LOG_DBG("added edge %s: %s -> %s\n", edge.id.c_str(), edge.source.c_str(), edge.target.c_str());
    return status::success();
}

status workflow_orchestrator::load_graph(const json& graph) {
    if (!graph.is_object()) {
        return status::failure(ERROR_TYPE_VALIDATION, "Workflow graph must be a JSON object");
    }

    // Parse everything first so a bad entry leaves the graph untouched
    std::vector<graph_node> nodes;
    std::vector<graph_edge> edges;
    if (graph.contains("nodes")) {
        if (!graph["nodes"].is_array()) {
            return status::failure(ERROR_TYPE_VALIDATION, "Workflow graph nodes must be an array");
        }
        for (const auto& j : graph["nodes"]) {
            auto node = graph_node::from_json(j);
            if (!node) {
                return status::failure(node.error().type, node.error().message);
            }
            nodes.push_back(node.value());
        }
    }
    if (graph.contains("edges")) {
        if (!graph["edges"].is_array()) {
            return status::failure(ERROR_TYPE_VALIDATION, "Workflow graph edges must be an array");
        }
        for (const auto& j : graph["edges"]) {
            auto edge = graph_edge::from_json(j);
            if (!edge) {
                return status::failure(edge.error().type, edge.error().message);
            }
            edges.push_back(edge.value());
        }
    }

    for (const auto& node : nodes) {
        auto st = add_node(node);
        if (!st) return st;
    }
    for (const auto& edge : edges) {
        auto st = add_edge(edge);
        if (!st) return st;
    }
    if (graph.contains("initialNode") && graph["initialNode"].is_string()) {
        set_initial_node(graph["initialNode"].get<std::string>());
    }

    LOG_INF("loaded workflow graph: %zu nodes, %zu edges\n", nodes.size(), edges.size());
    return status::success();
}

std::vector<graph_node> workflow_orchestrator::get_nodes() const {
    std::shared_lock<std::shared_mutex> lock(pimpl->mutex);
    std::vector<graph_node> out;
    out.reserve(pimpl->nodes.size());
    for (const auto& [id, node] : pimpl->nodes) {
        out.push_back(node);
    }
    return out;
}

std::vector<graph_edge> workflow_orchestrator::get_edges() const {
    std::shared_lock<std::shared_mutex> lock(pimpl->mutex);
    return pimpl->edges;
}

std::vector<graph_edge> workflow_orchestrator::get_outbound_edges(const std::string& node_id) const {
    std::shared_lock<std::shared_mutex> lock(pimpl->mutex);
    std::vector<graph_edge> out;
    for (const auto& edge : pimpl->edges) {
        if (edge.source == node_id) {
            out.push_back(edge);
        }
    }
    return out;
}

void workflow_orchestrator::set_initial_node(const std::string& node_id) {
    std::unique_lock<std::shared_mutex> lock(pimpl->mutex);
    pimpl->config.initial_node_id = node_id;
}

std::string workflow_orchestrator::initial_node() const {
    std::shared_lock<std::shared_mutex> lock(pimpl->mutex);
    return pimpl->config.initial_node_id;
}

void workflow_orchestrator::set_agent_invoker(agent_invoker* invoker) {
    pimpl->invoker = invoker;
}

void workflow_orchestrator::set_decision_voter(decision_voter* voter) {
    pimpl->voter = voter;
}

void workflow_orchestrator::set_context_transfer(context_transfer* transfer) {
    pimpl->transfer = transfer;
}

result<workflow_result> workflow_orchestrator::execute_workflow(const json& initial_context,
                                                                cancel_predicate cancel) {
    graph_snapshot graph;
    workflow_config config;
    {
        std::shared_lock<std::shared_mutex> lock(pimpl->mutex);
        graph.nodes = pimpl->nodes;
        graph.edges = pimpl->edges;
        config = pimpl->config;
    }

    if (graph.nodes.find(config.initial_node_id) == graph.nodes.end()) {
        LOG_WRN("workflow rejected: initial state node %s not found\n", config.initial_node_id.c_str());
        return result<workflow_result>::failure(ERROR_TYPE_VALIDATION,
            "Initial state node " + config.initial_node_id + " not found");
    }
    if (!initial_context.is_object()) {
        return result<workflow_result>::failure(ERROR_TYPE_VALIDATION,
            "Initial workflow context must be a JSON object");
    }

    const int64_t start = get_timestamp_ms();

    workflow_result res;
    res.workflow_id = generate_id("workflow");

    run_state state;
    state.workflow_id = res.workflow_id;
    state.context = initial_context;

    LOG_INF("workflow %s starting at %s\n", res.workflow_id.c_str(), config.initial_node_id.c_str());

    workflow_started_payload started;
    started.workflow_id = res.workflow_id;
    started.initial_node_id = config.initial_node_id;
    pimpl->bus.publish(WORKFLOW_SOURCE, started);

    std::string current = config.initial_node_id;
    int iterations = 0;

    while (true) {
        if (iterations >= config.max_iterations) {
            res.final_context = state.context;
            pimpl->finish_failed(res, ERROR_TYPE_INTERNAL, "MaxIterationsExceeded", start);
            return result<workflow_result>::success(res);
        }
        if (cancel && cancel()) {
            res.final_context = state.context;
            pimpl->finish_failed(res, ERROR_TYPE_INTERNAL, "Cancelled", start);
            return result<workflow_result>::success(res);
        }

        auto node_it = graph.nodes.find(current);
        if (node_it == graph.nodes.end()) {
            res.final_context = state.context;
            pimpl->finish_failed(res, ERROR_TYPE_VALIDATION,
                                 "Node " + current + " not found during execution", start);
            return result<workflow_result>::success(res);
        }
        const graph_node& node = node_it->second;

        res.execution_path.push_back(node.id);
        LOG_DBG("workflow %s iteration %d: %s node %s\n", res.workflow_id.c_str(), iterations,
                node.kind_name(), node.id.c_str());

        auto output = pimpl->process_node(node, state);
        if (!output) {
            res.final_context = state.context;
            pimpl->finish_failed(res, output.error().type,
                                 "Node " + node.id + ": " + output.error().message, start);
            return result<workflow_result>::success(res);
        }

        workflow_step step;
        step.node_id = node.id;
        step.node_kind = node.kind_name();
        step.timestamp = get_timestamp_ms();
        step.input = state.context;
        step.output = output.value();
        step.agent_id = state.agent_id;
        res.history.push_back(std::move(step));

        state.context = output.value();

        workflow_node_executed_payload executed;
        executed.workflow_id = res.workflow_id;
        executed.node_id = node.id;
        executed.node_kind = node.kind_name();
        executed.iteration = iterations;
        pimpl->bus.publish(WORKFLOW_SOURCE, executed);

        const auto outbound = graph.outbound(node.id);
        if (outbound.empty()) {
            res.success = true;
            res.output = state.context;
            res.final_context = state.context;
            res.duration_ms = get_timestamp_ms() - start;

            LOG_INF("workflow %s completed at %s (%zu nodes, %lld ms)\n", res.workflow_id.c_str(),
                    node.id.c_str(), res.execution_path.size(), static_cast<long long>(res.duration_ms));

            workflow_completed_payload completed;
            completed.workflow_id = res.workflow_id;
            completed.execution_path = res.execution_path;
            completed.duration_ms = res.duration_ms;
            pimpl->bus.publish(WORKFLOW_SOURCE, completed);

            return result<workflow_result>::success(res);
        }

        // TODO: branch on the decision outcome once edge conditions are defined
        current = outbound.front().target;
        iterations++;

        if (config.yield_between_nodes) {
            std::this_thread::yield();
        }
    }
}

std::future<result<workflow_result>> workflow_orchestrator::execute_workflow_async(json initial_context,
                                                                                   cancel_predicate cancel) {
    return std::async(std::launch::async, [this, ctx = std::move(initial_context), cancel = std::move(cancel)]() {
        return execute_workflow(ctx, cancel);
    });
}

} // namespace swarm

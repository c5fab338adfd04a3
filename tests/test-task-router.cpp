// Tests for the shared agent registry and workload-aware routing

#include "testing.h"

#include "../common/swarm/agent_registry.h"
#include "../common/swarm/event_bus.h"
#include "../common/swarm/log.h"
#include "../common/swarm/task_router.h"

#include <atomic>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace swarm;

static agent_info make_agent(const std::string& id, agent_type type, int capacity = 10, int workload = 0,
                             std::vector<std::string> expertise = {}) {
    agent_info a;
    a.id = id;
    a.type = type;
    a.name = id;
    a.capacity = capacity;
    a.workload = workload;
    a.expertise = std::move(expertise);
    return a;
}

static task make_task(const std::string& id, const std::string& type, const std::string& description = "",
                      int priority = 5) {
    task t;
    t.id = id;
    t.type = type;
    t.description = description;
    t.priority = priority;
    return t;
}

static bool test_register_validation() {
    event_bus bus;
    agent_registry registry(bus);

    TEST_ASSERT(!registry.register_agent(make_agent("", AGENT_TYPE_CODER)), "Empty id rejected");

    auto zero = registry.register_agent(make_agent("a", AGENT_TYPE_CODER, 0));
    TEST_ASSERT(!zero, "Zero capacity rejected");
    TEST_ASSERT(zero.error().type == ERROR_TYPE_VALIDATION, "Validation error kind");

    TEST_ASSERT(!registry.register_agent(make_agent("a", AGENT_TYPE_CODER, 5, -1)), "Negative workload rejected");
    TEST_ASSERT(registry.size() == 0, "Nothing registered");

    TEST_ASSERT(registry.register_agent(make_agent("a", AGENT_TYPE_CODER, 5)), "Valid agent accepted");
    TEST_ASSERT(registry.register_agent(make_agent("a", AGENT_TYPE_TESTER, 7)), "Re-register replaces");
    TEST_ASSERT(registry.size() == 1, "Still one agent");
    TEST_ASSERT(registry.get_agent("a")->type == AGENT_TYPE_TESTER, "Profile replaced");
    return true;
}

static bool test_registry_events_and_listing() {
    event_bus bus;
    agent_registry registry(bus);
    std::vector<std::string> types;
    bus.subscribe_all([&](const event& ev) { types.push_back(ev.type); });

    registry.register_agent(make_agent("b", AGENT_TYPE_CODER));
    registry.register_agent(make_agent("a", AGENT_TYPE_REVIEWER));
    registry.update_workload("a", 3);
    registry.unregister_agent("b");

    TEST_ASSERT(types.size() == 4, "Four registry events");
    TEST_ASSERT(types[0] == "agent.registered", "Registered event");
    TEST_ASSERT(types[2] == "agent.workload.updated", "Workload event");
    TEST_ASSERT(types[3] == "agent.unregistered", "Unregistered event");

    auto list = registry.list_agents();
    TEST_ASSERT(list.size() == 1 && list[0].id == "a", "Listing reflects removal");
    TEST_ASSERT(list[0].workload == 3, "Workload updated");

    TEST_ASSERT(!registry.unregister_agent("missing"), "Unknown id fails");
    TEST_ASSERT(!registry.update_workload("a", -2), "Negative workload rejected");
    return true;
}

static bool test_adjust_workload_is_atomic() {
    event_bus bus;
    agent_registry registry(bus);
    registry.register_agent(make_agent("a", AGENT_TYPE_CODER, 1000));

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&registry]() {
            for (int i = 0; i < 100; i++) {
                auto r = registry.adjust_workload("a", 1);
                (void) r;
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    TEST_ASSERT(registry.get_agent("a")->workload == 800, "No lost updates");

    auto r = registry.adjust_workload("a", -5000);
    TEST_ASSERT(r.ok() && r.value() == 0, "Workload clamps at zero");
    TEST_ASSERT(!registry.adjust_workload("missing", 1), "Unknown agent fails");
    return true;
}

// Scenario A
static bool test_route_code_generation_to_coder() {
    event_bus bus;
    agent_registry registry(bus);
    task_router router(registry, bus);

    router.register_agent(make_agent("coder-1", AGENT_TYPE_CODER));
    router.register_agent(make_agent("reviewer-1", AGENT_TYPE_REVIEWER));
    router.register_agent(make_agent("tester-1", AGENT_TYPE_TESTER));

    auto r = router.route_task(make_task("t1", "code_generation", "Implement a parser"));
    TEST_ASSERT(r.ok(), "Routing should succeed");
    TEST_ASSERT(r.value().agent.id == "coder-1", "Coder selected");
    TEST_ASSERT(r.value().confidence > 0.3, "Confidence above degraded value");
    TEST_ASSERT(r.value().confidence <= 1.0, "Confidence at most 1");
    TEST_ASSERT(!r.value().degraded, "Not degraded");
    return true;
}

static bool test_no_agents_is_capacity_error() {
    event_bus bus;
    agent_registry registry(bus);
    task_router router(registry, bus);

    auto r = router.route_task(make_task("t1", "code_generation"));
    TEST_ASSERT(!r.ok(), "Routing should fail");
    TEST_ASSERT(r.error().type == ERROR_TYPE_CAPACITY, "CapacityError expected");
    return true;
}

static bool test_degraded_when_all_at_capacity() {
    event_bus bus;
    agent_registry registry(bus);
    task_router router(registry, bus);

    router.register_agent(make_agent("coder-a", AGENT_TYPE_CODER, 2, 4));
    router.register_agent(make_agent("coder-b", AGENT_TYPE_CODER, 4, 5));

    auto r = router.route_task(make_task("t1", "code_generation"));
    TEST_ASSERT(r.ok(), "Degraded routing still succeeds");
    TEST_ASSERT(r.value().degraded, "Marked degraded");
    TEST_ASSERT(r.value().confidence == 0.3, "Fixed degraded confidence");
    TEST_ASSERT(r.value().agent.id == "coder-b", "Least overloaded agent chosen");
    return true;
}

static bool test_tie_break_by_workload_then_id() {
    event_bus bus;
    agent_registry registry(bus);
    task_router router(registry, bus);

    router.register_agent(make_agent("coder-b", AGENT_TYPE_CODER, 10, 0));
    router.register_agent(make_agent("coder-a", AGENT_TYPE_CODER, 10, 0));

    auto r = router.route_task(make_task("t1", "code_generation"));
    TEST_ASSERT(r.ok() && r.value().agent.id == "coder-a", "Equal scores break ties by id");

    router.update_agent_workload("coder-a", 5);
    r = router.route_task(make_task("t2", "code_generation"));
    TEST_ASSERT(r.ok() && r.value().agent.id == "coder-b", "Spare capacity wins");
    return true;
}

static bool test_expertise_match_and_compatibility() {
    event_bus bus;
    agent_registry registry(bus);
    task_router router(registry, bus);

    router.register_agent(make_agent("dbg", AGENT_TYPE_DEBUGGER, 10, 0, {"memory", "leak"}));
    router.register_agent(make_agent("coder", AGENT_TYPE_CODER, 10, 0, {"ui"}));
    router.register_agent(make_agent("planner", AGENT_TYPE_PLANNER, 10, 0, {"memory", "leak"}));

    auto r = router.route_task(make_task("t1", "debugging", "Find the memory leak in the cache"));
    TEST_ASSERT(r.ok() && r.value().agent.id == "dbg", "Expertise match decides among compatible agents");

    auto types = compatible_agent_types("debugging");
    TEST_ASSERT(types.size() == 2, "Debugging accepts debugger and coder");
    TEST_ASSERT(compatible_agent_types("unheard_of").empty(), "Unknown task type is unrestricted");
    return true;
}

static bool test_fallback_when_no_compatible_type() {
    event_bus bus;
    agent_registry registry(bus);
    task_router router(registry, bus);

    router.register_agent(make_agent("reviewer", AGENT_TYPE_REVIEWER));

    auto r = router.route_task(make_task("t1", "testing"));
    TEST_ASSERT(r.ok() && r.value().agent.id == "reviewer", "Falls back to any registered agent");
    return true;
}

static bool test_routed_agent_is_always_registered() {
    event_bus bus;
    agent_registry registry(bus);
    task_router router(registry, bus);

    std::set<std::string> ids;
    for (int i = 0; i < 6; i++) {
        std::string id = "agent-" + std::to_string(i);
        agent_type type = static_cast<agent_type>(i % 7);
        router.register_agent(make_agent(id, type, 1 + i, i % 3));
        ids.insert(id);
    }
    router.unregister_agent("agent-0");
    ids.erase("agent-0");

    const char* types[] = {"code_generation", "code_review", "testing", "debugging", "planning", "other"};
    for (int i = 0; i < 30; i++) {
        auto r = router.route_task(make_task("t" + std::to_string(i), types[i % 6], "", i % 11));
        TEST_ASSERT(r.ok(), "Routing succeeds while agents exist");
        TEST_ASSERT(ids.count(r.value().agent.id) == 1, "Routed id is registered");
        router.update_agent_workload(r.value().agent.id, (i * 7) % 9);
    }
    return true;
}

static bool test_history_and_events() {
    event_bus bus;
    agent_registry registry(bus);
    router_config config;
    config.history_limit = 3;
    task_router router(registry, bus, config);

    int routed_events = 0;
    bus.subscribe("task.routed", [&](const event&) { routed_events++; });

    router.register_agent(make_agent("coder", AGENT_TYPE_CODER));
    for (int i = 0; i < 5; i++) {
        auto r = router.route_task(make_task("t" + std::to_string(i), "code_generation"));
        TEST_ASSERT(r.ok(), "Routing succeeds");
    }

    auto history = router.get_routing_history("coder");
    TEST_ASSERT(routed_events == 5, "One task.routed per decision");
    TEST_ASSERT(history.size() == 3, "History is bounded");
    TEST_ASSERT(history.front().task_id == "t2" && history.back().task_id == "t4", "Oldest entries dropped");
    TEST_ASSERT(router.get_routing_history("nobody").empty(), "Unknown agent has no history");
    return true;
}

static bool test_unregister_drops_history() {
    event_bus bus;
    agent_registry registry(bus);
    task_router router(registry, bus);

    router.register_agent(make_agent("coder", AGENT_TYPE_CODER));
    TEST_ASSERT(router.route_task(make_task("t1", "code_generation")).ok(), "Routing succeeds");
    TEST_ASSERT(router.get_routing_history("coder").size() == 1, "Decision recorded");

    TEST_ASSERT(router.unregister_agent("coder").ok(), "Unregistered");
    TEST_ASSERT(router.get_routing_history("coder").empty(), "History dropped with the agent");

    router.register_agent(make_agent("coder", AGENT_TYPE_CODER));
    TEST_ASSERT(router.get_routing_history("coder").empty(), "Re-registered agent starts clean");

    TEST_ASSERT(!router.unregister_agent("nobody").ok(), "Unknown agent rejected");
    return true;
}

static bool test_load_balancing_recommendations() {
    event_bus bus;
    agent_registry registry(bus);
    task_router router(registry, bus);

    router.register_agent(make_agent("busy", AGENT_TYPE_CODER, 10, 10));
    router.register_agent(make_agent("idle", AGENT_TYPE_CODER, 10, 1));
    router.register_agent(make_agent("steady", AGENT_TYPE_CODER, 10, 5));

    auto report = router.get_load_balancing_recommendations();
    TEST_ASSERT(report.overloaded.size() == 1 && report.overloaded[0] == "busy", "Overloaded agent");
    TEST_ASSERT(report.underutilized.size() == 1 && report.underutilized[0] == "idle", "Underutilized agent");
    TEST_ASSERT(report.recommendations.size() == 2, "One recommendation each");
    return true;
}

int main() {
    std::cout << "=== Task Router Tests ===" << std::endl << std::endl;
    log_set_level(LOG_LEVEL_WARN);

    int total = 0;
    int passed = 0;
    int failed = 0;

    // Registry
    RUN_TEST(test_register_validation);
    RUN_TEST(test_registry_events_and_listing);
    RUN_TEST(test_adjust_workload_is_atomic);

    // Routing
    RUN_TEST(test_route_code_generation_to_coder);
    RUN_TEST(test_no_agents_is_capacity_error);
    RUN_TEST(test_degraded_when_all_at_capacity);
    RUN_TEST(test_tie_break_by_workload_then_id);
    RUN_TEST(test_expertise_match_and_compatibility);
    RUN_TEST(test_fallback_when_no_compatible_type);
    RUN_TEST(test_routed_agent_is_always_registered);
    RUN_TEST(test_history_and_events);
    RUN_TEST(test_unregister_drops_history);
    RUN_TEST(test_load_balancing_recommendations);

    return report_results(total, passed, failed);
}

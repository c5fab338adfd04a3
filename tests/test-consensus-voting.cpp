// Tests for quorum-based voting sessions

#include "testing.h"

#include "../common/swarm/agent_registry.h"
#include "../common/swarm/collaborators.h"
#include "../common/swarm/consensus_voting.h"
#include "../common/swarm/event_bus.h"
#include "../common/swarm/log.h"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace swarm;

static agent_info voter(const std::string& id, std::vector<std::string> expertise = {}) {
    agent_info a;
    a.id = id;
    a.type = AGENT_TYPE_REVIEWER;
    a.name = id;
    a.capacity = 5;
    a.expertise = std::move(expertise);
    return a;
}

static std::vector<vote_option> options(std::initializer_list<const char*> ids) {
    std::vector<vote_option> out;
    for (const char* id : ids) {
        out.push_back(vote_option{id, std::string("Option ") + id, json()});
    }
    return out;
}

struct voting_fixture {
    event_bus bus;
    agent_registry registry{bus};
    consensus_voting voting{registry, bus};

    void register_voters(int n) {
        for (int i = 0; i < n; i++) {
            voting.register_agent(voter("agent-" + std::to_string(i)));
        }
    }
};

static bool test_create_session_validation() {
    voting_fixture f;

    auto empty = f.voting.create_voting_session("topic", {});
    TEST_ASSERT(!empty.ok() && empty.error().type == ERROR_TYPE_VALIDATION, "No options rejected");

    auto dup = f.voting.create_voting_session("topic", options({"a", "a"}));
    TEST_ASSERT(!dup.ok(), "Duplicate option ids rejected");

    auto bad_quorum = f.voting.create_voting_session("topic", options({"a", "b"}), 0);
    TEST_ASSERT(!bad_quorum.ok(), "Quorum of zero rejected");

    auto ok = f.voting.create_voting_session("topic", options({"a", "b"}));
    TEST_ASSERT(ok.ok(), "Valid session created");
    return true;
}

static bool test_default_quorum_is_strict_majority() {
    voting_fixture f;
    f.register_voters(5);

    auto id = f.voting.create_voting_session("topic", options({"a", "b"}));
    TEST_ASSERT(id.ok(), "Session created");
    TEST_ASSERT(f.voting.get_voting_session(id.value())->quorum == 3, "5 agents -> quorum 3");

    f.voting.register_agent(voter("agent-late"));
    TEST_ASSERT(f.voting.get_voting_session(id.value())->quorum == 3, "Quorum fixed at creation");
    return true;
}

static bool test_cast_vote_rejections() {
    voting_fixture f;
    f.register_voters(3);
    auto id = f.voting.create_voting_session("topic", options({"a", "b"})).value();

    TEST_ASSERT(!f.voting.cast_vote("missing", "agent-0", "a"), "Unknown session");
    TEST_ASSERT(!f.voting.cast_vote(id, "agent-0", "zzz"), "Unknown option");
    TEST_ASSERT(f.voting.get_voting_session(id)->votes.empty(), "Rejected votes leave no trace");

    TEST_ASSERT(f.voting.cast_vote(id, "agent-0", "a"), "Valid vote");
    TEST_ASSERT(f.voting.close_voting_session(id).ok(), "Close");
    TEST_ASSERT(!f.voting.cast_vote(id, "agent-1", "a"), "Closed session");
    TEST_ASSERT(f.voting.get_voting_session(id)->votes.size() == 1, "No vote after close");
    return true;
}

static bool test_last_vote_wins() {
    voting_fixture f;
    f.register_voters(3);
    auto id = f.voting.create_voting_session("topic", options({"a", "b"}), 1).value();

    std::vector<std::string> replaced;
    f.bus.subscribe("voting.vote.cast", [&](const event& ev) {
        replaced.push_back(ev.get_if<vote_cast_payload>()->replaced_option_id);
    });

    TEST_ASSERT(f.voting.cast_vote(id, "agent-0", "a"), "First vote");
    TEST_ASSERT(f.voting.cast_vote(id, "agent-0", "b"), "Overwrite");

    auto session = f.voting.get_voting_session(id);
    TEST_ASSERT(session->votes.size() == 1, "One entry per agent");
    TEST_ASSERT(session->votes[0].option_id == "b", "Latest vote kept");
    TEST_ASSERT(replaced.size() == 2 && replaced[0].empty() && replaced[1] == "a", "Replacement reported");

    auto res = f.voting.close_voting_session(id);
    TEST_ASSERT(res.ok() && res.value().winning_option->id == "b", "Overwritten vote counts");
    return true;
}

// Scenario B
static bool test_quorum_not_met() {
    voting_fixture f;
    f.register_voters(5);
    auto id = f.voting.create_voting_session("topic", options({"a", "b"}), 3).value();

    f.voting.cast_vote(id, "agent-0", "a");
    f.voting.cast_vote(id, "agent-1", "a");

    auto res = f.voting.close_voting_session(id);
    TEST_ASSERT(res.ok(), "Close succeeds");
    TEST_ASSERT(!res.value().consensus_reached, "No consensus below quorum");
    TEST_ASSERT(!res.value().winning_option, "No winner below quorum");
    TEST_ASSERT(res.value().details == "Quorum not met (2/3 votes)", "Quorum detail");
    TEST_ASSERT(res.value().tally.at("a") == 2.0, "Tally still reported");
    return true;
}

// Scenario C
static bool test_simple_majority() {
    voting_fixture f;
    f.register_voters(10);
    auto id = f.voting.create_voting_session("topic", options({"a", "b", "c"})).value();

    for (int i = 0; i < 10; i++) {
        const char* choice = i < 6 ? "a" : (i < 9 ? "b" : "c");
        TEST_ASSERT(f.voting.cast_vote(id, "agent-" + std::to_string(i), choice), "Vote accepted");
    }

    auto res = f.voting.close_voting_session(id, VOTING_ALGORITHM_SIMPLE_MAJORITY, 0.5);
    TEST_ASSERT(res.ok(), "Close succeeds");
    TEST_ASSERT(res.value().winning_option && res.value().winning_option->id == "a", "a wins");
    TEST_ASSERT(res.value().consensus_reached, "Majority reached");
    TEST_ASSERT(res.value().confidence == 0.6, "Confidence is leader share");
    TEST_ASSERT(res.value().tally.at("c") == 1.0, "Tally covers every option");
    return true;
}

static bool test_tie_has_no_consensus() {
    voting_fixture f;
    f.register_voters(4);
    auto id = f.voting.create_voting_session("topic", options({"a", "b"})).value();

    f.voting.cast_vote(id, "agent-0", "a");
    f.voting.cast_vote(id, "agent-1", "a");
    f.voting.cast_vote(id, "agent-2", "b");
    f.voting.cast_vote(id, "agent-3", "b");

    auto res = f.voting.close_voting_session(id);
    TEST_ASSERT(res.ok() && !res.value().consensus_reached, "Tie yields no consensus");
    TEST_ASSERT(!res.value().winning_option, "Tie yields no winner");
    return true;
}

static bool test_weighted_majority() {
    voting_fixture f;
    f.voting.register_agent(voter("expert", {"c++", "perf", "memory", "simd", "cache", "threads"}));
    f.voting.register_agent(voter("novice-1"));
    f.voting.register_agent(voter("novice-2"));

    TEST_ASSERT(agent_vote_weight(*f.registry.get_agent("expert")) == 3.0, "Six tags -> weight 3");
    TEST_ASSERT(agent_vote_weight(*f.registry.get_agent("novice-1")) == 1.0, "Weight floor is 1");

    auto id = f.voting.create_voting_session("topic", options({"a", "b"}), 3).value();
    f.voting.cast_vote(id, "expert", "a");
    f.voting.cast_vote(id, "novice-1", "b");
    f.voting.cast_vote(id, "novice-2", "b");

    auto res = f.voting.close_voting_session(id, VOTING_ALGORITHM_WEIGHTED_MAJORITY);
    TEST_ASSERT(res.ok(), "Close succeeds");
    TEST_ASSERT(res.value().winning_option->id == "a", "Weight outvotes headcount");
    TEST_ASSERT(res.value().consensus_reached, "3 of 5 weight is a majority");
    TEST_ASSERT(res.value().tally.at("b") == 2.0, "Weighted tally");
    return true;
}

static bool test_supermajority() {
    voting_fixture f;
    f.register_voters(5);

    auto low = f.voting.create_voting_session("low", options({"a", "b"})).value();
    auto high = f.voting.create_voting_session("high", options({"a", "b"})).value();
    for (int i = 0; i < 5; i++) {
        const std::string agent = "agent-" + std::to_string(i);
        f.voting.cast_vote(low, agent, i < 3 ? "a" : "b");   // 60%
        f.voting.cast_vote(high, agent, i < 3 ? "a" : "b");
    }

    auto default_threshold = f.voting.close_voting_session(low, VOTING_ALGORITHM_SUPERMAJORITY);
    TEST_ASSERT(default_threshold.ok() && default_threshold.value().consensus_reached,
                "60% meets the default 0.6 threshold");
    TEST_ASSERT(default_threshold.value().threshold == 0.6, "Default threshold recorded");

    auto strict = f.voting.close_voting_session(high, VOTING_ALGORITHM_SUPERMAJORITY, 0.75);
    TEST_ASSERT(strict.ok() && !strict.value().consensus_reached, "60% misses a 0.75 threshold");
    return true;
}

static bool test_consensus_threshold() {
    voting_fixture f;
    f.register_voters(3);

    auto all = f.voting.create_voting_session("all", options({"a", "b"})).value();
    auto partial = f.voting.create_voting_session("partial", options({"a", "b"})).value();
    for (int i = 0; i < 3; i++) {
        f.voting.cast_vote(all, "agent-" + std::to_string(i), "a");
    }
    f.voting.cast_vote(partial, "agent-0", "a");
    f.voting.cast_vote(partial, "agent-1", "a");

    auto unanimous = f.voting.close_voting_session(all, VOTING_ALGORITHM_CONSENSUS_THRESHOLD);
    TEST_ASSERT(unanimous.ok() && unanimous.value().consensus_reached, "Every agent agreed");
    TEST_ASSERT(unanimous.value().winning_option->id == "a", "Agreed option wins");

    auto missing = f.voting.close_voting_session(partial, VOTING_ALGORITHM_CONSENSUS_THRESHOLD);
    TEST_ASSERT(missing.ok() && !missing.value().consensus_reached, "A silent agent blocks consensus");
    TEST_ASSERT(!missing.value().winning_option, "No winner without consensus");
    return true;
}

static bool test_close_is_idempotent() {
    voting_fixture f;
    f.register_voters(3);
    auto id = f.voting.create_voting_session("topic", options({"a", "b"})).value();
    f.voting.cast_vote(id, "agent-0", "a");
    f.voting.cast_vote(id, "agent-1", "a");

    int closed_events = 0;
    f.bus.subscribe("voting.session.closed", [&](const event&) { closed_events++; });

    auto first = f.voting.close_voting_session(id);
    auto second = f.voting.close_voting_session(id, VOTING_ALGORITHM_SUPERMAJORITY, 0.99);

    TEST_ASSERT(first.ok() && second.ok(), "Both closes succeed");
    TEST_ASSERT(first.value().to_json().dump() == second.value().to_json().dump(), "Identical results");
    TEST_ASSERT(closed_events == 1, "Closed event published once");

    auto out_of_range = f.voting.close_voting_session(id, VOTING_ALGORITHM_CONSENSUS_THRESHOLD, 1.5);
    TEST_ASSERT(out_of_range.ok(), "Closed session ignores an out of range threshold");
    TEST_ASSERT(out_of_range.value().to_json().dump() == first.value().to_json().dump(),
                "Cached result returned");

    auto open_id = f.voting.create_voting_session("topic", options({"a", "b"})).value();
    auto rejected = f.voting.close_voting_session(open_id, VOTING_ALGORITHM_CONSENSUS_THRESHOLD, 1.5);
    TEST_ASSERT(!rejected.ok() && rejected.error().type == ERROR_TYPE_VALIDATION,
                "Open session rejects an out of range threshold");
    TEST_ASSERT(f.voting.get_voting_session(open_id)->status == VOTING_SESSION_OPEN,
                "Rejected close leaves the session open");

    auto unknown = f.voting.close_voting_session("missing");
    TEST_ASSERT(!unknown.ok() && unknown.error().type == ERROR_TYPE_VALIDATION, "Unknown session");
    return true;
}

static bool test_quorum_law_over_tally_shapes() {
    voting_fixture f;
    f.register_voters(6);
    const voting_algorithm algorithms[] = {
        VOTING_ALGORITHM_SIMPLE_MAJORITY, VOTING_ALGORITHM_WEIGHTED_MAJORITY,
        VOTING_ALGORITHM_SUPERMAJORITY, VOTING_ALGORITHM_CONSENSUS_THRESHOLD,
    };

    for (const auto algorithm : algorithms) {
        for (int votes = 0; votes < 5; votes++) {
            auto id = f.voting.create_voting_session("topic", options({"a", "b"}), 5).value();
            for (int i = 0; i < votes; i++) {
                f.voting.cast_vote(id, "agent-" + std::to_string(i), "a");
            }
            auto res = f.voting.close_voting_session(id, algorithm);
            TEST_ASSERT(res.ok(), "Close succeeds");
            TEST_ASSERT(!res.value().consensus_reached, "Below quorum never reaches consensus");
        }
    }
    return true;
}

static bool test_event_order_open_votes_close() {
    voting_fixture f;
    f.register_voters(3);

    std::vector<std::string> order;
    f.bus.subscribe_all([&](const event& ev) {
        if (ev.type.rfind("voting.", 0) == 0) {
            order.push_back(ev.type);
        }
    });

    auto id = f.voting.create_voting_session("topic", options({"a", "b"})).value();
    std::vector<std::thread> threads;
    for (int i = 0; i < 3; i++) {
        threads.emplace_back([&f, id, i]() {
            f.voting.cast_vote(id, "agent-" + std::to_string(i), "a");
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    f.voting.close_voting_session(id);

    TEST_ASSERT(order.size() == 5, "Created, three votes, closed");
    TEST_ASSERT(order.front() == "voting.session.created", "Created first");
    TEST_ASSERT(order.back() == "voting.session.closed", "Closed last");
    return true;
}

static bool test_concurrent_close_single_writer() {
    voting_fixture f;
    f.register_voters(3);
    auto id = f.voting.create_voting_session("topic", options({"a", "b"})).value();
    f.voting.cast_vote(id, "agent-0", "a");
    f.voting.cast_vote(id, "agent-1", "a");

    std::atomic<int> closed_events{0};
    f.bus.subscribe("voting.session.closed", [&](const event&) { closed_events++; });

    std::vector<std::string> dumps(4);
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; i++) {
        threads.emplace_back([&f, &dumps, id, i]() {
            auto res = f.voting.close_voting_session(id);
            if (res.ok()) {
                dumps[i] = res.value().to_json().dump();
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    TEST_ASSERT(closed_events == 1, "Exactly one close transition");
    for (int i = 1; i < 4; i++) {
        TEST_ASSERT(!dumps[i].empty() && dumps[i] == dumps[0], "All closers see the same result");
    }
    return true;
}

static bool test_persistence_of_closed_sessions() {
    voting_fixture f;
    memory_persistence_store store;
    f.voting.set_persistence_store(&store);
    f.register_voters(1);

    auto id = f.voting.create_voting_session("topic", options({"a"})).value();
    f.voting.cast_vote(id, "agent-0", "a");
    f.voting.close_voting_session(id);

    auto saved = store.load("voting_session", id);
    TEST_ASSERT(saved.has_value(), "Closed session persisted");
    TEST_ASSERT((*saved)["result"]["consensus_reached"] == true, "Result persisted");
    TEST_ASSERT(f.voting.list_voting_sessions().size() == 1, "Listing");
    return true;
}

static bool test_algorithm_names() {
    auto parsed = voting_algorithm_from_string("weighted-majority");
    TEST_ASSERT(parsed.ok() && parsed.value() == VOTING_ALGORITHM_WEIGHTED_MAJORITY, "Known name");

    auto unknown = voting_algorithm_from_string("ranked-choice");
    TEST_ASSERT(!unknown.ok() && unknown.error().type == ERROR_TYPE_VALIDATION, "Unknown name");

    TEST_ASSERT(std::string(voting_algorithm_to_string(VOTING_ALGORITHM_CONSENSUS_THRESHOLD)) ==
                "consensus-threshold", "Round name");
    return true;
}

int main() {
    std::cout << "=== Consensus Voting Tests ===" << std::endl << std::endl;
    log_set_level(LOG_LEVEL_WARN);

    int total = 0;
    int passed = 0;
    int failed = 0;

    RUN_TEST(test_create_session_validation);
    RUN_TEST(test_default_quorum_is_strict_majority);
    RUN_TEST(test_cast_vote_rejections);
    RUN_TEST(test_last_vote_wins);
    RUN_TEST(test_quorum_not_met);
    RUN_TEST(test_simple_majority);
    RUN_TEST(test_tie_has_no_consensus);
    RUN_TEST(test_weighted_majority);
    RUN_TEST(test_supermajority);
    RUN_TEST(test_consensus_threshold);
    RUN_TEST(test_close_is_idempotent);
    RUN_TEST(test_quorum_law_over_tally_shapes);
    RUN_TEST(test_event_order_open_votes_close);
    RUN_TEST(test_concurrent_close_single_writer);
    RUN_TEST(test_persistence_of_closed_sessions);
    RUN_TEST(test_algorithm_names);

    return report_results(total, passed, failed);
}

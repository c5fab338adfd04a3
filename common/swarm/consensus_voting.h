#pragma once

#include "agent_registry.h"
#include "collaborators.h"
#include "error.h"
#include "event_bus.h"
#include "types.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace swarm {

enum voting_algorithm {
    VOTING_ALGORITHM_SIMPLE_MAJORITY,     // One agent, one vote; leader needs > half
    VOTING_ALGORITHM_WEIGHTED_MAJORITY,   // Votes weighted by agent expertise
    VOTING_ALGORITHM_SUPERMAJORITY,       // Leader needs >= threshold of cast votes
    VOTING_ALGORITHM_CONSENSUS_THRESHOLD  // Every registered agent agrees
};

const char* voting_algorithm_to_string(voting_algorithm algorithm);

// "simple-majority", "weighted-majority", "supermajority", "consensus-threshold"
result<voting_algorithm> voting_algorithm_from_string(const std::string& str);

struct voting_config {
    voting_algorithm default_algorithm = VOTING_ALGORITHM_SIMPLE_MAJORITY;
    double supermajority_threshold = 0.6;
    double consensus_threshold = 0.67;

    static voting_config default_config() { return voting_config(); }

    // Weighted tally by default
    static voting_config expertise_weighted() {
        voting_config config;
        config.default_algorithm = VOTING_ALGORITHM_WEIGHTED_MAJORITY;
        return config;
    }

    json to_json() const;
};

struct vote_option {
    std::string id;
    std::string label;
    json value;   // Opaque caller data

    json to_json() const;
};

struct vote_record {
    std::string agent_id;
    std::string option_id;
    double weight = 1.0;
    int64_t timestamp = 0;
    std::string rationale;

    json to_json() const;
};

enum voting_session_status {
    VOTING_SESSION_OPEN,
    VOTING_SESSION_CLOSED
};

const char* voting_session_status_to_string(voting_session_status status);

struct voting_session {
    std::string id;
    std::string topic;
    std::vector<vote_option> options;
    std::vector<vote_record> votes;   // One per agent, in first-vote order
    int quorum = 0;
    voting_session_status status = VOTING_SESSION_OPEN;
    int64_t created_at = 0;
    int64_t closed_at = 0;

    json to_json() const;
};

struct vote_result {
    std::string session_id;
    std::optional<vote_option> winning_option;
    double confidence = 0.0;               // Leader share of the tally
    std::map<std::string, double> tally;   // Every option, counts or weights
    bool consensus_reached = false;
    int vote_count = 0;
    int quorum = 0;
    voting_algorithm algorithm = VOTING_ALGORITHM_SIMPLE_MAJORITY;
    double threshold = 0.0;
    std::string details;

    json to_json() const;
};

// Voting weight of an agent: max(1, |expertise| / 2)
double agent_vote_weight(const agent_info& agent);

// Quorum-based multi-agent decisions
class consensus_voting {
public:
    consensus_voting(agent_registry& registry, event_bus& bus,
                     const voting_config& config = voting_config::default_config());
    ~consensus_voting();

    consensus_voting(const consensus_voting&) = delete;
    consensus_voting& operator=(const consensus_voting&) = delete;

    // Forwarded to the shared registry
    status register_agent(const agent_info& agent);
    status unregister_agent(const std::string& agent_id);

    // Open a session. Without quorum, a strict majority of the agents
    // registered now is required.
    result<std::string> create_voting_session(const std::string& topic,
                                              const std::vector<vote_option>& options,
                                              std::optional<int> quorum = std::nullopt);

    // Record or overwrite an agent's vote. False for unknown session, closed
    // session or unknown option.
    bool cast_vote(const std::string& session_id, const std::string& agent_id,
                   const std::string& option_id, const std::string& rationale = "");

    // Close and compute the result. Repeat calls return the first result.
    result<vote_result> close_voting_session(const std::string& session_id,
                                             std::optional<voting_algorithm> algorithm = std::nullopt,
                                             std::optional<double> threshold = std::nullopt);

    std::optional<voting_session> get_voting_session(const std::string& session_id) const;

    std::vector<voting_session> list_voting_sessions() const;

    // Closed sessions are written here when attached
    void set_persistence_store(persistence_store* store);

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace swarm

#include "consensus_voting.h"
#include "log.h"

#include <algorithm>
#include <cstdio>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <unordered_map>

namespace swarm {

static const char * VOTING_SOURCE = "consensus_voting";

const char* voting_algorithm_to_string(voting_algorithm algorithm) {
    switch (algorithm) {
        case VOTING_ALGORITHM_SIMPLE_MAJORITY:     return "simple-majority";
        case VOTING_ALGORITHM_WEIGHTED_MAJORITY:   return "weighted-majority";
        case VOTING_ALGORITHM_SUPERMAJORITY:       return "supermajority";
        case VOTING_ALGORITHM_CONSENSUS_THRESHOLD: return "consensus-threshold";
        default:                                   return "unknown";
    }
}

result<voting_algorithm> voting_algorithm_from_string(const std::string& str) {
    const std::string s = to_lower(str);
    if (s == "simple-majority")     return result<voting_algorithm>::success(VOTING_ALGORITHM_SIMPLE_MAJORITY);
    if (s == "weighted-majority")   return result<voting_algorithm>::success(VOTING_ALGORITHM_WEIGHTED_MAJORITY);
    if (s == "supermajority")       return result<voting_algorithm>::success(VOTING_ALGORITHM_SUPERMAJORITY);
    if (s == "consensus-threshold") return result<voting_algorithm>::success(VOTING_ALGORITHM_CONSENSUS_THRESHOLD);
    return result<voting_algorithm>::failure(ERROR_TYPE_VALIDATION, "Unknown voting algorithm: " + str);
}

const char* voting_session_status_to_string(voting_session_status status) {
    switch (status) {
        case VOTING_SESSION_OPEN:   return "open";
        case VOTING_SESSION_CLOSED: return "closed";
        default:                    return "unknown";
    }
}

json voting_config::to_json() const {
    return json{
        {"default_algorithm", voting_algorithm_to_string(default_algorithm)},
        {"supermajority_threshold", supermajority_threshold},
        {"consensus_threshold", consensus_threshold}
    };
}

json vote_option::to_json() const {
    json j{{"id", id}, {"label", label}};
    if (!value.is_null()) {
        j["value"] = value;
    }
    return j;
}

json vote_record::to_json() const {
    json j{
        {"agent_id", agent_id},
        {"option_id", option_id},
        {"weight", weight},
        {"timestamp", timestamp}
    };
    if (!rationale.empty()) {
        j["rationale"] = rationale;
    }
    return j;
}

json voting_session::to_json() const {
    json opts = json::array();
    for (const auto& opt : options) {
        opts.push_back(opt.to_json());
    }
    json vs = json::array();
    for (const auto& v : votes) {
        vs.push_back(v.to_json());
    }
    return json{
        {"id", id},
        {"topic", topic},
        {"options", opts},
        {"votes", vs},
        {"quorum", quorum},
        {"status", voting_session_status_to_string(status)},
        {"created_at", created_at},
        {"closed_at", closed_at}
    };
}

json vote_result::to_json() const {
    json t = json::object();
    for (const auto& [option_id, value] : tally) {
        t[option_id] = value;
    }
    return json{
        {"session_id", session_id},
        {"winning_option", winning_option ? winning_option->to_json() : json(nullptr)},
        {"confidence", confidence},
        {"tally", t},
        {"consensus_reached", consensus_reached},
        {"vote_count", vote_count},
        {"quorum", quorum},
        {"algorithm", voting_algorithm_to_string(algorithm)},
        {"threshold", threshold},
        {"details", details}
    };
}

double agent_vote_weight(const agent_info& agent) {
    return std::max(1.0, static_cast<double>(agent.expertise.size()) / 2.0);
}

namespace {

struct session_state {
    // Guards session and cached result. Vote and close events are posted
    // while it is held, so they queue in the order the session changed, and
    // only one closer computes the result.
    std::mutex mutex;

    voting_session session;
    std::unordered_map<std::string, size_t> vote_index;  // agent id -> votes[]
    std::optional<vote_result> result;
};

std::string format_share(const char* label, double leader, double total, const char* unit) {
    char buf[160];
    snprintf(buf, sizeof(buf), "%s: %g/%g %s", label, leader, total, unit);
    return buf;
}

} // namespace

struct consensus_voting::impl {
    agent_registry& registry;
    event_bus& bus;
    voting_config config;
    persistence_store* store = nullptr;

    std::map<std::string, std::shared_ptr<session_state>> sessions;
    mutable std::shared_mutex sessions_mutex;

    impl(agent_registry& r, event_bus& b, const voting_config& c)
        : registry(r), bus(b), config(c) {}

    std::shared_ptr<session_state> find(const std::string& session_id) const {
        std::shared_lock<std::shared_mutex> lock(sessions_mutex);
        auto it = sessions.find(session_id);
        return it == sessions.end() ? nullptr : it->second;
    }

    vote_result compute(const voting_session& session, voting_algorithm algorithm, double threshold) const {
        vote_result res;
        res.session_id = session.id;
        res.vote_count = static_cast<int>(session.votes.size());
        res.quorum = session.quorum;
        res.algorithm = algorithm;
        res.threshold = threshold;

        for (const auto& opt : session.options) {
            res.tally[opt.id] = 0.0;
        }

        if (session.votes.empty()) {
            res.details = "No votes cast";
            return res;
        }

        const bool weighted = algorithm == VOTING_ALGORITHM_WEIGHTED_MAJORITY ||
                              algorithm == VOTING_ALGORITHM_CONSENSUS_THRESHOLD;
        double total = 0.0;
        for (const auto& v : session.votes) {
            const double w = weighted ? v.weight : 1.0;
            res.tally[v.option_id] += w;
            total += w;
        }

        if (res.vote_count < session.quorum) {
            res.details = "Quorum not met (" + std::to_string(res.vote_count) + "/" +
                          std::to_string(session.quorum) + " votes)";
            return res;
        }

        // Leader in option order; ties leave no winner
        const vote_option* leader = nullptr;
        double max_value = 0.0;
        int leaders = 0;
        for (const auto& opt : session.options) {
            const double value = res.tally[opt.id];
            if (value > max_value) {
                max_value = value;
                leader = &opt;
                leaders = 1;
            } else if (value == max_value && value > 0.0) {
                leaders++;
            }
        }
        const bool tie = leaders > 1;
        res.confidence = total > 0.0 ? max_value / total : 0.0;

        switch (algorithm) {
            case VOTING_ALGORITHM_SIMPLE_MAJORITY:
                res.consensus_reached = !tie && max_value > total / 2.0;
                res.details = format_share("Simple majority", max_value, total, "votes");
                break;
            case VOTING_ALGORITHM_WEIGHTED_MAJORITY:
                res.consensus_reached = !tie && max_value > total / 2.0;
                res.details = format_share("Weighted majority", max_value, total, "weight");
                break;
            case VOTING_ALGORITHM_SUPERMAJORITY: {
                res.consensus_reached = !tie && max_value >= total * threshold;
                char label[64];
                snprintf(label, sizeof(label), "Supermajority (%.1f%%)", threshold * 100.0);
                res.details = format_share(label, max_value, total, "votes");
                break;
            }
            case VOTING_ALGORITHM_CONSENSUS_THRESHOLD: {
                std::set<std::string> chosen;
                for (const auto& v : session.votes) {
                    chosen.insert(v.option_id);
                }
                const auto agents = registry.list_agents();
                bool everyone_voted = !agents.empty();
                double registered_weight = 0.0;
                for (const auto& agent : agents) {
                    registered_weight += agent_vote_weight(agent);
                    if (!std::any_of(session.votes.begin(), session.votes.end(),
                                     [&](const vote_record& v) { return v.agent_id == agent.id; })) {
                        everyone_voted = false;
                    }
                }
                res.consensus_reached = chosen.size() == 1 && everyone_voted &&
                                        total >= registered_weight * threshold;
                res.details = res.consensus_reached
                    ? "Consensus reached by all " + std::to_string(agents.size()) + " agents"
                    : "Consensus not reached (" + std::to_string(chosen.size()) + " distinct options, " +
                      std::to_string(res.vote_count) + "/" + std::to_string(agents.size()) + " agents voted)";
                if (!res.consensus_reached) {
                    leader = nullptr;
                }
                break;
            }
        }

        if (tie) {
            res.details += " (tie)";
        } else if (leader) {
            res.winning_option = *leader;
        }
        return res;
    }
};

consensus_voting::consensus_voting(agent_registry& registry, event_bus& bus, const voting_config& config)
    : pimpl(std::make_unique<impl>(registry, bus, config)) {}

consensus_voting::~consensus_voting() = default;

status consensus_voting::register_agent(const agent_info& agent) {
    return pimpl->registry.register_agent(agent);
}

status consensus_voting::unregister_agent(const std::string& agent_id) {
    return pimpl->registry.unregister_agent(agent_id);
}

result<std::string> consensus_voting::create_voting_session(const std::string& topic,
                                                            const std::vector<vote_option>& options,
                                                            std::optional<int> quorum) {
    if (options.empty()) {
        return result<std::string>::failure(ERROR_TYPE_VALIDATION, "Voting session needs at least one option");
    }
    std::set<std::string> ids;
    for (const auto& opt : options) {
        if (opt.id.empty()) {
            return result<std::string>::failure(ERROR_TYPE_VALIDATION, "Vote option id must not be empty");
        }
        if (!ids.insert(opt.id).second) {
            return result<std::string>::failure(ERROR_TYPE_VALIDATION, "Duplicate vote option id: " + opt.id);
        }
    }
    if (quorum && *quorum <= 0) {
        return result<std::string>::failure(ERROR_TYPE_VALIDATION,
                                            "Quorum must be positive, got " + std::to_string(*quorum));
    }

    auto state = std::make_shared<session_state>();
    state->session.id = generate_id("vote");
    state->session.topic = topic;
    state->session.options = options;
    state->session.quorum = quorum ? *quorum : static_cast<int>(pimpl->registry.size()) / 2 + 1;
    state->session.status = VOTING_SESSION_OPEN;
    state->session.created_at = get_timestamp_ms();

    const std::string session_id = state->session.id;

    voting_session_created_payload payload;
    payload.session_id = session_id;
    payload.topic = topic;
    for (const auto& opt : options) {
        payload.option_ids.push_back(opt.id);
    }
    payload.quorum = state->session.quorum;

    {
        // Posted before the session becomes visible, so no vote event can
        // queue ahead of it
        std::unique_lock<std::shared_mutex> lock(pimpl->sessions_mutex);
        pimpl->sessions[session_id] = state;
        pimpl->bus.post(VOTING_SOURCE, payload);
    }

    LOG_INF("created voting session %s for '%s' (%zu options, quorum %d)\n", session_id.c_str(),
            topic.c_str(), options.size(), state->session.quorum);
    pimpl->bus.dispatch();

    return result<std::string>::success(session_id);
}

bool consensus_voting::cast_vote(const std::string& session_id, const std::string& agent_id,
                                 const std::string& option_id, const std::string& rationale) {
    auto state = pimpl->find(session_id);
    if (!state) {
        LOG_WRN("cast_vote: voting session %s not found\n", session_id.c_str());
        return false;
    }

    // Unknown agents vote with weight 1
    const auto agent = pimpl->registry.get_agent(agent_id);
    const double weight = agent ? agent_vote_weight(*agent) : 1.0;

    vote_cast_payload payload;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        auto& session = state->session;
        if (session.status != VOTING_SESSION_OPEN) {
            LOG_WRN("cast_vote: voting session %s is closed\n", session_id.c_str());
            return false;
        }
        const bool valid = std::any_of(session.options.begin(), session.options.end(),
                                       [&](const vote_option& opt) { return opt.id == option_id; });
        if (!valid) {
            LOG_WRN("cast_vote: invalid option %s for session %s\n", option_id.c_str(), session_id.c_str());
            return false;
        }

        vote_record rec;
        rec.agent_id = agent_id;
        rec.option_id = option_id;
        rec.weight = weight;
        rec.timestamp = get_timestamp_ms();
        rec.rationale = rationale;

        payload.session_id = session_id;
        payload.agent_id = agent_id;
        payload.option_id = option_id;

        auto it = state->vote_index.find(agent_id);
        if (it != state->vote_index.end()) {
            payload.replaced_option_id = session.votes[it->second].option_id;
            session.votes[it->second] = rec;
        } else {
            state->vote_index[agent_id] = session.votes.size();
            session.votes.push_back(rec);
        }
        pimpl->bus.post(VOTING_SOURCE, payload);
    }

    LOG_DBG("agent %s voted %s in session %s\n", agent_id.c_str(), option_id.c_str(), session_id.c_str());
    pimpl->bus.dispatch();
    return true;
}

result<vote_result> consensus_voting::close_voting_session(const std::string& session_id,
                                                           std::optional<voting_algorithm> algorithm,
                                                           std::optional<double> threshold) {
    auto state = pimpl->find(session_id);
    if (!state) {
        return result<vote_result>::failure(ERROR_TYPE_VALIDATION, "Voting session not found: " + session_id);
    }

    const voting_algorithm algo = algorithm.value_or(pimpl->config.default_algorithm);
    const double thr = threshold.value_or(algo == VOTING_ALGORITHM_CONSENSUS_THRESHOLD
                                        ? pimpl->config.consensus_threshold
                                        : pimpl->config.supermajority_threshold);

    vote_result res;
    voting_session snapshot;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        // A closed session answers with its cached result whatever the arguments
        if (state->result) {
            return result<vote_result>::success(*state->result);
        }
        if (thr < 0.0 || thr > 1.0) {
            return result<vote_result>::failure(ERROR_TYPE_VALIDATION, "Threshold must be within [0, 1]");
        }
        state->session.status = VOTING_SESSION_CLOSED;
        state->session.closed_at = get_timestamp_ms();
        state->result = pimpl->compute(state->session, algo, thr);
        res = *state->result;
        snapshot = state->session;

        voting_session_closed_payload payload;
        payload.session_id = session_id;
        payload.winning_option_id = res.winning_option ? res.winning_option->id : "";
        payload.consensus_reached = res.consensus_reached;
        payload.vote_count = res.vote_count;
        payload.algorithm = voting_algorithm_to_string(algo);
        pimpl->bus.post(VOTING_SOURCE, payload);
    }

    LOG_INF("closed voting session %s (%s): %s\n", session_id.c_str(),
            voting_algorithm_to_string(algo), res.details.c_str());
    pimpl->bus.dispatch();

    if (pimpl->store) {
        json record{{"session", snapshot.to_json()}, {"result", res.to_json()}};
        auto saved = pimpl->store->save("voting_session", session_id, record);
        if (!saved) {
            LOG_WRN("failed to persist voting session %s: %s\n", session_id.c_str(),
                    saved.error().to_string().c_str());
        }
    }

    return result<vote_result>::success(res);
}

std::optional<voting_session> consensus_voting::get_voting_session(const std::string& session_id) const {
    auto state = pimpl->find(session_id);
    if (!state) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->session;
}

std::vector<voting_session> consensus_voting::list_voting_sessions() const {
    std::vector<std::shared_ptr<session_state>> states;
    {
        std::shared_lock<std::shared_mutex> lock(pimpl->sessions_mutex);
        for (const auto& [id, state] : pimpl->sessions) {
            states.push_back(state);
        }
    }

    std::vector<voting_session> out;
    out.reserve(states.size());
    for (const auto& state : states) {
        std::lock_guard<std::mutex> lock(state->mutex);
        out.push_back(state->session);
    }
    std::sort(out.begin(), out.end(), [](const voting_session& a, const voting_session& b) {
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        return a.id < b.id;
    });
    return out;
}

void consensus_voting::set_persistence_store(persistence_store* store) {
    pimpl->store = store;
}

} // namespace swarm

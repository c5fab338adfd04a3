#include "config.h"

#include <cstdint>
#include <fstream>
#include <sstream>
#include <type_traits>

namespace swarm {

namespace {

// Overwrite out with j[key] when present; wrong JSON type is an error
template<typename T>
status read_key(const json& section, const std::string& section_name, const char* key, T& out) {
    if (!section.contains(key)) {
        return status::success();
    }
    const json& v = section[key];
    bool ok = false;
    if constexpr (std::is_same_v<T, bool>) {
        ok = v.is_boolean();
    } else if constexpr (std::is_same_v<T, std::string>) {
        ok = v.is_string();
    } else if constexpr (std::is_unsigned_v<T>) {
        ok = v.is_number_unsigned() || (v.is_number_integer() && v.get<int64_t>() >= 0);
    } else if constexpr (std::is_integral_v<T>) {
        ok = v.is_number_integer();
    } else if constexpr (std::is_floating_point_v<T>) {
        ok = v.is_number();
    }
    if (!ok) {
        return status::failure(ERROR_TYPE_VALIDATION,
                                "Config key " + section_name + "." + key + " has the wrong type");
    }
    out = v.get<T>();
    return status::success();
}

// Section object or error; missing section yields an empty object
result<json> read_section(const json& root, const char* name) {
    if (!root.contains(name)) {
        return result<json>::success(json::object());
    }
    if (!root[name].is_object()) {
        return result<json>::failure(ERROR_TYPE_VALIDATION,
                                     std::string("Config section ") + name + " must be an object");
    }
    return result<json>::success(root[name]);
}

#define SWARM_READ(section, name, key, field)                 \
    do {                                                      \
        auto st_ = read_key((section), (name), (key), (field)); \
        if (!st_) return result<swarm_config>::failure(st_.error()); \
    } while (0)

} // namespace

json swarm_config::to_json() const {
    return json{
        {"log", {
            {"level", log_level_to_string(log.level)},
            {"pattern", log.pattern},
            {"file", log.file}
        }},
        {"events", {
            {"log_events", events.log_events}
        }},
        {"router", router.to_json()},
        {"voting", voting.to_json()},
        {"handoff", handoff.to_json()},
        {"handshake", handshake.to_json()},
        {"workflow", workflow.to_json()}
    };
}

result<swarm_config> swarm_config::from_json(const json& j) {
    if (!j.is_object()) {
        return result<swarm_config>::failure(ERROR_TYPE_VALIDATION, "Config root must be a JSON object");
    }

    swarm_config config;

    const char* names[] = {"log", "events", "router", "voting", "handoff", "handshake", "workflow"};
    json sections[7];
    for (int i = 0; i < 7; i++) {
        auto s = read_section(j, names[i]);
        if (!s) {
            return result<swarm_config>::failure(s.error());
        }
        sections[i] = s.value();
    }
    const json& log_j       = sections[0];
    const json& events_j    = sections[1];
    const json& router_j    = sections[2];
    const json& voting_j    = sections[3];
    const json& handoff_j   = sections[4];
    const json& handshake_j = sections[5];
    const json& workflow_j  = sections[6];

    std::string level = log_level_to_string(config.log.level);
    SWARM_READ(log_j, "log", "level", level);
    config.log.level = log_level_from_string(level);
    SWARM_READ(log_j, "log", "pattern", config.log.pattern);
    SWARM_READ(log_j, "log", "file", config.log.file);

    SWARM_READ(events_j, "events", "log_events", config.events.log_events);

    SWARM_READ(router_j, "router", "expertise_weight", config.router.expertise_weight);
    SWARM_READ(router_j, "router", "capacity_weight", config.router.capacity_weight);
    SWARM_READ(router_j, "router", "priority_weight", config.router.priority_weight);
    SWARM_READ(router_j, "router", "degraded_confidence", config.router.degraded_confidence);
    SWARM_READ(router_j, "router", "history_limit", config.router.history_limit);
    SWARM_READ(router_j, "router", "overloaded_threshold", config.router.overloaded_threshold);
    SWARM_READ(router_j, "router", "underutilized_threshold", config.router.underutilized_threshold);

    std::string algorithm = voting_algorithm_to_string(config.voting.default_algorithm);
    SWARM_READ(voting_j, "voting", "default_algorithm", algorithm);
    auto algo = voting_algorithm_from_string(algorithm);
    if (!algo) {
        return result<swarm_config>::failure(algo.error());
    }
    config.voting.default_algorithm = algo.value();
    SWARM_READ(voting_j, "voting", "supermajority_threshold", config.voting.supermajority_threshold);
    SWARM_READ(voting_j, "voting", "consensus_threshold", config.voting.consensus_threshold);

    SWARM_READ(handoff_j, "handoff", "high_priority_level", config.handoff.high_priority_level);
    SWARM_READ(handoff_j, "handoff", "medium_priority_level", config.handoff.medium_priority_level);
    SWARM_READ(handoff_j, "handoff", "low_priority_level", config.handoff.low_priority_level);

    SWARM_READ(handshake_j, "handshake", "protocol_version", config.handshake.protocol_version);
    SWARM_READ(handshake_j, "handshake", "enable_handshake", config.handshake.enable_handshake);
    SWARM_READ(handshake_j, "handshake", "enable_task_negotiation", config.handshake.enable_task_negotiation);
    SWARM_READ(handshake_j, "handshake", "enable_state_sync", config.handshake.enable_state_sync);
    SWARM_READ(handshake_j, "handshake", "max_concurrent_handshakes", config.handshake.max_concurrent_handshakes);

    SWARM_READ(workflow_j, "workflow", "initial_node_id", config.workflow.initial_node_id);
    SWARM_READ(workflow_j, "workflow", "max_iterations", config.workflow.max_iterations);
    SWARM_READ(workflow_j, "workflow", "yield_between_nodes", config.workflow.yield_between_nodes);

    if (config.workflow.max_iterations <= 0) {
        return result<swarm_config>::failure(ERROR_TYPE_VALIDATION, "workflow.max_iterations must be positive");
    }
    if (config.handshake.max_concurrent_handshakes <= 0) {
        return result<swarm_config>::failure(ERROR_TYPE_VALIDATION,
                                             "handshake.max_concurrent_handshakes must be positive");
    }

    return result<swarm_config>::success(config);
}

#undef SWARM_READ

result<swarm_config> load_config_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return result<swarm_config>::failure(ERROR_TYPE_VALIDATION, "Cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    json j = json::parse(buffer.str(), nullptr, false);
    if (j.is_discarded()) {
        return result<swarm_config>::failure(ERROR_TYPE_VALIDATION, "Config file is not valid JSON: " + path);
    }
    return swarm_config::from_json(j);
}

} // namespace swarm

#pragma once

#include "types.h"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace swarm {

//
// Event payloads, one struct per event type. The set is closed: subscribers
// visit event::payload instead of casting.
//

struct agent_registered_payload {
    static constexpr const char* event_type = "agent.registered";
    std::string agent_id;
    std::string name;
    std::string agent_type;
    std::vector<std::string> expertise;
    int capacity = 0;
};

struct agent_unregistered_payload {
    static constexpr const char* event_type = "agent.unregistered";
    std::string agent_id;
};

struct agent_workload_updated_payload {
    static constexpr const char* event_type = "agent.workload.updated";
    std::string agent_id;
    int workload = 0;
    int capacity = 0;
};

struct task_routed_payload {
    static constexpr const char* event_type = "task.routed";
    std::string task_id;
    std::string agent_id;
    double confidence = 0.0;
    bool degraded = false;
};

struct voting_session_created_payload {
    static constexpr const char* event_type = "voting.session.created";
    std::string session_id;
    std::string topic;
    std::vector<std::string> option_ids;
    int quorum = 0;
};

struct vote_cast_payload {
    static constexpr const char* event_type = "voting.vote.cast";
    std::string session_id;
    std::string agent_id;
    std::string option_id;
    std::string replaced_option_id;  // Empty when this is the agent's first vote
};

struct voting_session_closed_payload {
    static constexpr const char* event_type = "voting.session.closed";
    std::string session_id;
    std::string winning_option_id;   // Empty when there is no winner
    bool consensus_reached = false;
    int vote_count = 0;
    std::string algorithm;
};

struct handoff_initiated_payload {
    static constexpr const char* event_type = "handoff.initiated";
    std::string handoff_id;
    std::string source_agent_id;
    std::string target_agent_id;
    std::string task_id;
    std::string priority;
    size_t original_size = 0;
    size_t compressed_size = 0;
};

struct handoff_completed_payload {
    static constexpr const char* event_type = "handoff.completed";
    std::string handoff_id;
    std::string source_agent_id;
    std::string target_agent_id;
    std::string task_id;
    int64_t duration_ms = 0;
};

struct handoff_failed_payload {
    static constexpr const char* event_type = "handoff.failed";
    std::string handoff_id;
    std::string source_agent_id;
    std::string target_agent_id;
    std::string task_id;
    std::string error;
    int64_t duration_ms = 0;
};

struct context_compressed_payload {
    static constexpr const char* event_type = "context.compressed";
    size_t original_size = 0;
    size_t compressed_size = 0;
    double compression_ratio = 0.0;
    std::string algorithm;
};

struct context_decompressed_payload {
    static constexpr const char* event_type = "context.decompressed";
    size_t compressed_size = 0;
    size_t decompressed_size = 0;
    std::string algorithm;
};

struct handshake_request_payload {
    static constexpr const char* event_type = "a2a.handshake.request";
    std::string handshake_id;
    std::string source_agent_id;
    std::string target_agent_id;
    std::vector<std::string> capabilities;
    std::string protocol_version;
};

struct handshake_response_payload {
    static constexpr const char* event_type = "a2a.handshake.response";
    std::string handshake_id;
    std::string source_agent_id;
    std::string target_agent_id;
    bool accepted = false;
    std::string protocol_version;
    std::string reason;
};

struct task_negotiation_request_payload {
    static constexpr const char* event_type = "a2a.task.negotiation.request";
    std::string handshake_id;
    std::string source_agent_id;
    std::string target_agent_id;
    std::string task_id;
};

struct task_negotiation_response_payload {
    static constexpr const char* event_type = "a2a.task.negotiation.response";
    std::string negotiation_id;
    std::string handshake_id;
    bool accepted = false;
    int64_t estimated_latency_ms = 0;
    std::string handoff_id;
};

struct state_sync_request_payload {
    static constexpr const char* event_type = "a2a.state.sync.request";
    std::string handshake_id;
    std::string source_agent_id;
    std::string target_agent_id;
    std::string sync_type;
    std::vector<std::string> keys;
};

struct state_sync_response_payload {
    static constexpr const char* event_type = "a2a.state.sync.response";
    std::string sync_id;
    std::string handshake_id;
    bool acknowledged = false;
};

struct workflow_started_payload {
    static constexpr const char* event_type = "workflow.started";
    std::string workflow_id;
    std::string initial_node_id;
};

struct workflow_node_executed_payload {
    static constexpr const char* event_type = "workflow.node.executed";
    std::string workflow_id;
    std::string node_id;
    std::string node_kind;
    int iteration = 0;
};

struct workflow_completed_payload {
    static constexpr const char* event_type = "workflow.completed";
    std::string workflow_id;
    std::vector<std::string> execution_path;
    int64_t duration_ms = 0;
};

struct workflow_failed_payload {
    static constexpr const char* event_type = "workflow.failed";
    std::string workflow_id;
    std::string error_type;
    std::string error;
    std::vector<std::string> execution_path;
};

using event_payload = std::variant<
    agent_registered_payload,
    agent_unregistered_payload,
    agent_workload_updated_payload,
    task_routed_payload,
    voting_session_created_payload,
    vote_cast_payload,
    voting_session_closed_payload,
    handoff_initiated_payload,
    handoff_completed_payload,
    handoff_failed_payload,
    context_compressed_payload,
    context_decompressed_payload,
    handshake_request_payload,
    handshake_response_payload,
    task_negotiation_request_payload,
    task_negotiation_response_payload,
    state_sync_request_payload,
    state_sync_response_payload,
    workflow_started_payload,
    workflow_node_executed_payload,
    workflow_completed_payload,
    workflow_failed_payload
>;

// Dot-namespaced type string of a payload
const char* event_type_of(const event_payload& payload);

// Payload as JSON object
json event_payload_to_json(const event_payload& payload);

// Event envelope, immutable once published
struct event {
    std::string id;
    std::string type;
    int64_t timestamp = 0;   // Unix epoch ms
    std::string source;
    event_payload payload;

    // {id, type, timestamp, source, payload}
    json to_json() const;

    // Payload of a given alternative, nullptr when the event carries another
    template<typename T>
    const T* get_if() const { return std::get_if<T>(&payload); }
};

// Build an event with fresh id, current timestamp and derived type
event make_event(const std::string& source, event_payload payload);

} // namespace swarm

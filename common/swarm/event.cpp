#include "event.h"

#include <type_traits>

namespace swarm {

namespace {

json payload_json(const agent_registered_payload& p) {
    return json{{"agentId", p.agent_id}, {"name", p.name}, {"type", p.agent_type},
                {"expertise", p.expertise}, {"capacity", p.capacity}};
}

json payload_json(const agent_unregistered_payload& p) {
    return json{{"agentId", p.agent_id}};
}

json payload_json(const agent_workload_updated_payload& p) {
    return json{{"agentId", p.agent_id}, {"workload", p.workload}, {"capacity", p.capacity}};
}

json payload_json(const task_routed_payload& p) {
    return json{{"taskId", p.task_id}, {"agentId", p.agent_id},
                {"confidence", p.confidence}, {"degraded", p.degraded}};
}

json payload_json(const voting_session_created_payload& p) {
    return json{{"sessionId", p.session_id}, {"topic", p.topic},
                {"options", p.option_ids}, {"quorum", p.quorum}};
}

json payload_json(const vote_cast_payload& p) {
    json j{{"sessionId", p.session_id}, {"agentId", p.agent_id}, {"optionId", p.option_id}};
    if (!p.replaced_option_id.empty()) {
        j["replacedOptionId"] = p.replaced_option_id;
    }
    return j;
}

json payload_json(const voting_session_closed_payload& p) {
    json j{{"sessionId", p.session_id}, {"consensusReached", p.consensus_reached},
           {"voteCount", p.vote_count}, {"algorithm", p.algorithm}};
    j["winningOption"] = p.winning_option_id.empty() ? json(nullptr) : json(p.winning_option_id);
    return j;
}

json payload_json(const handoff_initiated_payload& p) {
    return json{{"handoffId", p.handoff_id}, {"sourceAgentId", p.source_agent_id},
                {"targetAgentId", p.target_agent_id}, {"taskId", p.task_id},
                {"priority", p.priority}, {"originalSize", p.original_size},
                {"compressedSize", p.compressed_size}};
}

json payload_json(const handoff_completed_payload& p) {
    return json{{"handoffId", p.handoff_id}, {"sourceAgentId", p.source_agent_id},
                {"targetAgentId", p.target_agent_id}, {"taskId", p.task_id},
                {"duration", p.duration_ms}};
}

json payload_json(const handoff_failed_payload& p) {
    return json{{"handoffId", p.handoff_id}, {"sourceAgentId", p.source_agent_id},
                {"targetAgentId", p.target_agent_id}, {"taskId", p.task_id},
                {"error", p.error}, {"duration", p.duration_ms}};
}

json payload_json(const context_compressed_payload& p) {
    return json{{"originalSize", p.original_size}, {"compressedSize", p.compressed_size},
                {"compressionRatio", p.compression_ratio}, {"algorithm", p.algorithm}};
}

json payload_json(const context_decompressed_payload& p) {
    return json{{"compressedSize", p.compressed_size}, {"decompressedSize", p.decompressed_size},
                {"algorithm", p.algorithm}};
}

json payload_json(const handshake_request_payload& p) {
    return json{{"handshakeId", p.handshake_id}, {"sourceAgentId", p.source_agent_id},
                {"targetAgentId", p.target_agent_id}, {"capabilities", p.capabilities},
                {"protocolVersion", p.protocol_version}};
}

json payload_json(const handshake_response_payload& p) {
    return json{{"handshakeId", p.handshake_id}, {"sourceAgentId", p.source_agent_id},
                {"targetAgentId", p.target_agent_id}, {"accepted", p.accepted},
                {"protocolVersion", p.protocol_version}, {"reason", p.reason}};
}

json payload_json(const task_negotiation_request_payload& p) {
    return json{{"handshakeId", p.handshake_id}, {"sourceAgentId", p.source_agent_id},
                {"targetAgentId", p.target_agent_id}, {"taskId", p.task_id}};
}

json payload_json(const task_negotiation_response_payload& p) {
    json j{{"negotiationId", p.negotiation_id}, {"handshakeId", p.handshake_id},
           {"accepted", p.accepted}, {"estimatedLatency", p.estimated_latency_ms}};
    if (!p.handoff_id.empty()) {
        j["handoffId"] = p.handoff_id;
    }
    return j;
}

json payload_json(const state_sync_request_payload& p) {
    return json{{"handshakeId", p.handshake_id}, {"sourceAgentId", p.source_agent_id},
                {"targetAgentId", p.target_agent_id}, {"syncType", p.sync_type},
                {"keys", p.keys}};
}

json payload_json(const state_sync_response_payload& p) {
    return json{{"syncId", p.sync_id}, {"handshakeId", p.handshake_id},
                {"acknowledged", p.acknowledged}};
}

json payload_json(const workflow_started_payload& p) {
    return json{{"workflowId", p.workflow_id}, {"initialNodeId", p.initial_node_id}};
}

json payload_json(const workflow_node_executed_payload& p) {
    return json{{"workflowId", p.workflow_id}, {"nodeId", p.node_id},
                {"nodeKind", p.node_kind}, {"iteration", p.iteration}};
}

json payload_json(const workflow_completed_payload& p) {
    return json{{"workflowId", p.workflow_id}, {"executionPath", p.execution_path},
                {"duration", p.duration_ms}};
}

json payload_json(const workflow_failed_payload& p) {
    return json{{"workflowId", p.workflow_id}, {"errorType", p.error_type},
                {"error", p.error}, {"executionPath", p.execution_path}};
}

} // namespace

const char* event_type_of(const event_payload& payload) {
    return std::visit([](const auto& p) -> const char* {
        return std::decay_t<decltype(p)>::event_type;
    }, payload);
}

json event_payload_to_json(const event_payload& payload) {
    return std::visit([](const auto& p) { return payload_json(p); }, payload);
}

json event::to_json() const {
    return json{
        {"id", id},
        {"type", type},
        {"timestamp", timestamp},
        {"source", source},
        {"payload", event_payload_to_json(payload)}
    };
}

event make_event(const std::string& source, event_payload payload) {
    event ev;
    ev.id = generate_id("event");
    ev.type = event_type_of(payload);
    ev.timestamp = get_timestamp_ms();
    ev.source = source;
    ev.payload = std::move(payload);
    return ev;
}

} // namespace swarm

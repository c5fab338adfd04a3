#pragma once

#include "context_handoff.h"
#include "error.h"
#include "event_bus.h"
#include "types.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace swarm {

struct handshake_config {
    std::string protocol_version = "1.0";
    bool enable_handshake = true;
    bool enable_task_negotiation = true;
    bool enable_state_sync = true;
    int max_concurrent_handshakes = 10;

    static handshake_config default_config() { return handshake_config(); }

    // Handshakes only, no negotiation or state sync
    static handshake_config handshake_only() {
        handshake_config config;
        config.enable_task_negotiation = false;
        config.enable_state_sync = false;
        return config;
    }

    json to_json() const;
};

// Same major version ("1.0" and "1.3" agree, "1.0" and "2.0" do not)
bool protocol_versions_compatible(const std::string& a, const std::string& b);

struct handshake_request {
    std::string source_agent_id;
    std::string target_agent_id;
    std::vector<std::string> capabilities;
    std::string protocol_version;   // Empty = mediator's version
    json metadata = json::object();
};

struct handshake_response {
    bool success = false;    // Request processed
    bool accepted = false;   // Parties agreed
    std::string handshake_id;
    std::vector<std::string> capabilities;
    std::string protocol_version;
    std::string reason;
    swarm_error error;       // Set when rejected

    json to_json() const;
};

struct handshake_record {
    std::string handshake_id;
    std::string source_agent_id;
    std::string target_agent_id;
    std::vector<std::string> capabilities;
    std::string protocol_version;
    bool accepted = false;
    std::string reason;
    int64_t created_at = 0;

    json to_json() const;
};

struct task_negotiation_request {
    std::string source_agent_id;
    std::string target_agent_id;
    std::string handshake_id;
    task t;
    json context = json::object();   // Handed off to the target when non-empty
    task_priority priority = TASK_PRIORITY_MEDIUM;
};

struct task_negotiation_response {
    bool success = false;
    bool accepted = false;
    std::string negotiation_id;
    int64_t estimated_latency_ms = 0;
    std::string handoff_id;   // Empty when no context was handed off

    json to_json() const;
};

enum state_sync_type {
    STATE_SYNC_FULL,          // Replace shared state
    STATE_SYNC_INCREMENTAL    // Merge top-level keys
};

const char* state_sync_type_to_string(state_sync_type type);
result<state_sync_type> state_sync_type_from_string(const std::string& str);

struct state_sync_request {
    std::string source_agent_id;
    std::string target_agent_id;
    std::string handshake_id;
    json state = json::object();
    state_sync_type sync_type = STATE_SYNC_FULL;
};

struct state_sync_response {
    bool success = false;
    bool acknowledged = false;
    std::string sync_id;

    json to_json() const;
};

// Latency estimate for a negotiated task: 100 ms + 0.1 ms per description
// character, capped at 1 s
int64_t estimate_task_latency_ms(const task& t);

// Pairwise agent negotiation: version/capability handshake, task
// negotiation and shared state sync
class handshake_mediator {
public:
    explicit handshake_mediator(event_bus& bus,
                                const handshake_config& config = handshake_config::default_config(),
                                context_handoff_manager* handoff = nullptr);
    ~handshake_mediator();

    handshake_mediator(const handshake_mediator&) = delete;
    handshake_mediator& operator=(const handshake_mediator&) = delete;

    // Declare the version and capabilities an agent answers handshakes with
    status register_agent(const std::string& agent_id, const std::string& protocol_version,
                          const std::vector<std::string>& capabilities);

    // A version mismatch is a processed request: success=true, accepted=false
    result<handshake_response> initiate_handshake(const handshake_request& request);

    result<task_negotiation_response> negotiate_task(const task_negotiation_request& request);

    result<state_sync_response> sync_state(const state_sync_request& request);

    std::optional<handshake_record> get_handshake(const std::string& handshake_id) const;

    // Shared state established through sync_state
    std::optional<json> get_shared_state(const std::string& handshake_id) const;

    void set_handoff_manager(context_handoff_manager* handoff);

    const handshake_config& config() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace swarm

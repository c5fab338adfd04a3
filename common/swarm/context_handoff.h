#pragma once

#include "collaborators.h"
#include "compression.h"
#include "error.h"
#include "event_bus.h"
#include "types.h"

#include <memory>
#include <optional>
#include <string>

namespace swarm {

struct handoff_config {
    // zlib level per priority: faster for urgent work, smaller for the rest
    int high_priority_level = 6;
    int medium_priority_level = 8;
    int low_priority_level = 9;

    int level_for(task_priority priority) const;

    static handoff_config default_config() { return handoff_config(); }

    // Minimal compression effort at every priority
    static handoff_config fastest() {
        handoff_config config;
        config.high_priority_level = 1;
        config.medium_priority_level = 1;
        config.low_priority_level = 1;
        return config;
    }

    json to_json() const;
};

struct handoff_request {
    std::string source_agent_id;
    std::string target_agent_id;
    std::string task_id;
    json context = json::object();
    task_priority priority = TASK_PRIORITY_MEDIUM;

    json to_json() const;
};

enum handoff_status {
    HANDOFF_STATUS_PENDING,
    HANDOFF_STATUS_COMPLETED,
    HANDOFF_STATUS_FAILED
};

const char* handoff_status_to_string(handoff_status status);

struct handoff_record {
    std::string handoff_id;
    std::string source_agent_id;
    std::string target_agent_id;
    std::string task_id;
    task_priority priority = TASK_PRIORITY_MEDIUM;
    byte_buffer compressed_payload;   // Released once the record is terminal
    size_t original_size = 0;
    size_t compressed_size = 0;
    handoff_status status = HANDOFF_STATUS_PENDING;
    std::string error;
    int64_t created_at = 0;
    int64_t finished_at = 0;

    // Metadata only, payload bytes are not serialized
    json to_json() const;
};

struct handoff_initiation {
    bool success = false;
    std::string handoff_id;
    size_t original_size = 0;
    size_t compressed_size = 0;
    int64_t transfer_time_ms = 0;

    json to_json() const;
};

// One-time transfer of task context between agents
class context_handoff_manager {
public:
    // provider defaults to zlib when null
    explicit context_handoff_manager(event_bus& bus,
                                     const handoff_config& config = handoff_config::default_config(),
                                     std::unique_ptr<compression_provider> provider = nullptr);
    ~context_handoff_manager();

    context_handoff_manager(const context_handoff_manager&) = delete;
    context_handoff_manager& operator=(const context_handoff_manager&) = delete;

    // Compress the context and store a pending record. A compression failure
    // leaves no record behind.
    result<handoff_initiation> initiate_handoff(const handoff_request& request);

    // Consume a pending handoff and return its context. Exactly one call per
    // handoff succeeds; later calls fail with ConflictError.
    result<json> complete_handoff(const std::string& handoff_id, const std::string& target_agent_id);

    // Fail a pending handoff
    status cancel_handoff(const std::string& handoff_id);

    std::optional<handoff_record> get_handoff(const std::string& handoff_id) const;

    size_t pending_count() const;

    // Terminal records are written here when attached
    void set_persistence_store(persistence_store* store);

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace swarm

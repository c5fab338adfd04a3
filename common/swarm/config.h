#pragma once

#include "consensus_voting.h"
#include "context_handoff.h"
#include "error.h"
#include "event_bus.h"
#include "handshake.h"
#include "log.h"
#include "task_router.h"
#include "types.h"
#include "workflow.h"

#include <string>

namespace swarm {

// Settings for every component of a coordination core
struct swarm_config {
    log_config log;
    event_bus_config events;
    router_config router;
    voting_config voting;
    handoff_config handoff;
    handshake_config handshake;
    workflow_config workflow;

    static swarm_config default_config() { return swarm_config(); }

    json to_json() const;

    // Sections and keys may be omitted and keep their defaults.
    // A key with the wrong type is a ValidationError.
    static result<swarm_config> from_json(const json& j);
};

// Read a JSON config file
result<swarm_config> load_config_file(const std::string& path);

} // namespace swarm

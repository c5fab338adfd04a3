#pragma once

#include "agent_registry.h"
#include "config.h"
#include "consensus_voting.h"
#include "context_handoff.h"
#include "event_bus.h"
#include "handshake.h"
#include "task_router.h"
#include "workflow.h"

#include <memory>

namespace swarm {

// One independent coordination core: a bus and every engine wired to it.
// Several cores can live in one process without sharing state.
class coordination_core {
public:
    explicit coordination_core(const swarm_config& config = swarm_config::default_config(),
                               std::unique_ptr<compression_provider> compression = nullptr);
    ~coordination_core();

    coordination_core(const coordination_core&) = delete;
    coordination_core& operator=(const coordination_core&) = delete;

    event_bus&               bus()          { return *bus_; }
    agent_registry&          registry()     { return *registry_; }
    task_router&             router()       { return *router_; }
    consensus_voting&        voting()       { return *voting_; }
    context_handoff_manager& handoff()      { return *handoff_; }
    handshake_mediator&      mediator()     { return *mediator_; }
    workflow_orchestrator&   orchestrator() { return *orchestrator_; }

    const swarm_config& config() const { return config_; }

    // Attach a store to every engine that writes terminal records
    void set_persistence_store(persistence_store* store);

private:
    swarm_config config_;
    std::unique_ptr<event_bus> bus_;
    std::unique_ptr<agent_registry> registry_;
    std::unique_ptr<task_router> router_;
    std::unique_ptr<consensus_voting> voting_;
    std::unique_ptr<context_handoff_manager> handoff_;
    std::unique_ptr<handshake_mediator> mediator_;
    std::unique_ptr<workflow_orchestrator> orchestrator_;
};

} // namespace swarm

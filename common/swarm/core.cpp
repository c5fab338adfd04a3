#include "core.h"

namespace swarm {

coordination_core::coordination_core(const swarm_config& config,
                                     std::unique_ptr<compression_provider> compression)
    : config_(config) {
    bus_          = std::make_unique<event_bus>(config_.events);
    registry_     = std::make_unique<agent_registry>(*bus_);
    router_       = std::make_unique<task_router>(*registry_, *bus_, config_.router);
    voting_       = std::make_unique<consensus_voting>(*registry_, *bus_, config_.voting);
    handoff_      = std::make_unique<context_handoff_manager>(*bus_, config_.handoff, std::move(compression));
    mediator_     = std::make_unique<handshake_mediator>(*bus_, config_.handshake, handoff_.get());
    orchestrator_ = std::make_unique<workflow_orchestrator>(*bus_, config_.workflow);
}

// Engines hold references to the bus and registry, tear down in reverse
coordination_core::~coordination_core() {
    orchestrator_.reset();
    mediator_.reset();
    handoff_.reset();
    voting_.reset();
    router_.reset();
    registry_.reset();
    bus_.reset();
}

void coordination_core::set_persistence_store(persistence_store* store) {
    voting_->set_persistence_store(store);
    handoff_->set_persistence_store(store);
}

} // namespace swarm

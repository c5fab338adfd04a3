#include "handshake.h"
#include "log.h"

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <shared_mutex>

namespace swarm {

static const char * MEDIATOR_SOURCE = "a2a_mediator";

json handshake_config::to_json() const {
    return json{
        {"protocol_version", protocol_version},
        {"enable_handshake", enable_handshake},
        {"enable_task_negotiation", enable_task_negotiation},
        {"enable_state_sync", enable_state_sync},
        {"max_concurrent_handshakes", max_concurrent_handshakes}
    };
}

static std::string major_version(const std::string& version) {
    return version.substr(0, version.find('.'));
}

bool protocol_versions_compatible(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) {
        return false;
    }
    return a == b || major_version(a) == major_version(b);
}

json handshake_response::to_json() const {
    json j{
        {"success", success},
        {"accepted", accepted},
        {"handshake_id", handshake_id},
        {"capabilities", capabilities},
        {"protocol_version", protocol_version},
        {"reason", reason}
    };
    if (error.type != ERROR_TYPE_NONE) {
        j["error"] = error.to_json();
    }
    return j;
}

json handshake_record::to_json() const {
    return json{
        {"handshake_id", handshake_id},
        {"source_agent_id", source_agent_id},
        {"target_agent_id", target_agent_id},
        {"capabilities", capabilities},
        {"protocol_version", protocol_version},
        {"accepted", accepted},
        {"reason", reason},
        {"created_at", created_at}
    };
}

json task_negotiation_response::to_json() const {
    json j{
        {"success", success},
        {"accepted", accepted},
        {"negotiation_id", negotiation_id},
        {"estimated_latency_ms", estimated_latency_ms}
    };
    if (!handoff_id.empty()) {
        j["handoff_id"] = handoff_id;
    }
    return j;
}

const char* state_sync_type_to_string(state_sync_type type) {
    switch (type) {
        case STATE_SYNC_FULL:        return "full";
        case STATE_SYNC_INCREMENTAL: return "incremental";
        default:                     return "unknown";
    }
}

result<state_sync_type> state_sync_type_from_string(const std::string& str) {
    const std::string s = to_lower(str);
    if (s == "full")        return result<state_sync_type>::success(STATE_SYNC_FULL);
    if (s == "incremental") return result<state_sync_type>::success(STATE_SYNC_INCREMENTAL);
    return result<state_sync_type>::failure(ERROR_TYPE_VALIDATION, "Unknown sync type: " + str);
}

json state_sync_response::to_json() const {
    return json{
        {"success", success},
        {"acknowledged", acknowledged},
        {"sync_id", sync_id}
    };
}

int64_t estimate_task_latency_ms(const task& t) {
    const double latency = 100.0 + static_cast<double>(t.description.size()) * 0.1;
    return static_cast<int64_t>(std::min(latency, 1000.0));
}

namespace {

struct registered_peer {
    std::string protocol_version;
    std::vector<std::string> capabilities;
};

} // namespace

struct handshake_mediator::impl {
    event_bus& bus;
    handshake_config config;
    std::atomic<context_handoff_manager*> handoff;

    std::map<std::string, registered_peer> peers;
    std::map<std::string, handshake_record> handshakes;
    std::map<std::string, json> shared_state;   // handshake id -> state
    mutable std::shared_mutex mutex;

    std::atomic<int> active_handshakes{0};

    impl(event_bus& b, const handshake_config& c, context_handoff_manager* h)
        : bus(b), config(c), handoff(h) {}

    // Accepted handshake or the error explaining why there is none
    result<handshake_record> accepted_handshake(const std::string& handshake_id) const {
        std::shared_lock<std::shared_mutex> lock(mutex);
        auto it = handshakes.find(handshake_id);
        if (it == handshakes.end()) {
            return result<handshake_record>::failure(ERROR_TYPE_VALIDATION,
                                                     "Handshake not found: " + handshake_id);
        }
        if (!it->second.accepted) {
            return result<handshake_record>::failure(ERROR_TYPE_PROTOCOL,
                                                     "Handshake " + handshake_id + " was not accepted");
        }
        return result<handshake_record>::success(it->second);
    }
};

handshake_mediator::handshake_mediator(event_bus& bus, const handshake_config& config,
                                       context_handoff_manager* handoff)
    : pimpl(std::make_unique<impl>(bus, config, handoff)) {}

handshake_mediator::~handshake_mediator() = default;

status handshake_mediator::register_agent(const std::string& agent_id, const std::string& protocol_version,
                                          const std::vector<std::string>& capabilities) {
    if (agent_id.empty() || protocol_version.empty()) {
        return status::failure(ERROR_TYPE_VALIDATION, "Agent id and protocol version must not be empty");
    }

    std::unique_lock<std::shared_mutex> lock(pimpl->mutex);
    registered_peer& peer = pimpl->peers[agent_id];
    peer.protocol_version = protocol_version;
    peer.capabilities = capabilities;

    LOG_INF("a2a: registered agent %s (protocol %s, %zu capabilities)\n", agent_id.c_str(),
            protocol_version.c_str(), capabilities.size());
    return status::success();
}

result<handshake_response> handshake_mediator::initiate_handshake(const handshake_request& request) {
    if (!pimpl->config.enable_handshake) {
        return result<handshake_response>::failure(ERROR_TYPE_PROTOCOL, "Handshake is disabled");
    }
    if (request.source_agent_id.empty() || request.target_agent_id.empty()) {
        return result<handshake_response>::failure(ERROR_TYPE_VALIDATION,
                                                   "Handshake needs both source and target agent ids");
    }

    if (pimpl->active_handshakes.fetch_add(1) >= pimpl->config.max_concurrent_handshakes) {
        pimpl->active_handshakes--;
        LOG_WRN("a2a: rejecting handshake from %s, %d handshakes in flight\n",
                request.source_agent_id.c_str(), pimpl->config.max_concurrent_handshakes);
        return result<handshake_response>::failure(ERROR_TYPE_CAPACITY,
            "Maximum concurrent handshakes (" + std::to_string(pimpl->config.max_concurrent_handshakes) + ") reached");
    }

    const std::string source_version = request.protocol_version.empty()
        ? pimpl->config.protocol_version
        : request.protocol_version;

    handshake_record rec;
    rec.handshake_id = generate_id("handshake");
    rec.source_agent_id = request.source_agent_id;
    rec.target_agent_id = request.target_agent_id;
    rec.created_at = get_timestamp_ms();

    std::string target_version = pimpl->config.protocol_version;
    std::vector<std::string> target_capabilities;
    {
        std::shared_lock<std::shared_mutex> lock(pimpl->mutex);
        auto it = pimpl->peers.find(request.target_agent_id);
        if (it != pimpl->peers.end()) {
            target_version = it->second.protocol_version;
            target_capabilities = it->second.capabilities;
        }
    }

    LOG_INF("a2a: handshake %s from %s (v%s) to %s (v%s)\n", rec.handshake_id.c_str(),
            request.source_agent_id.c_str(), source_version.c_str(),
            request.target_agent_id.c_str(), target_version.c_str());

    handshake_request_payload req_payload;
    req_payload.handshake_id = rec.handshake_id;
    req_payload.source_agent_id = request.source_agent_id;
    req_payload.target_agent_id = request.target_agent_id;
    req_payload.capabilities = request.capabilities;
    req_payload.protocol_version = source_version;
    pimpl->bus.publish(MEDIATOR_SOURCE, req_payload);

    handshake_response resp;
    resp.success = true;
    resp.handshake_id = rec.handshake_id;

    if (protocol_versions_compatible(source_version, target_version)) {
        rec.accepted = true;
        rec.protocol_version = source_version;
        if (target_capabilities.empty()) {
            rec.capabilities = request.capabilities;
        } else {
            for (const auto& cap : request.capabilities) {
                if (std::find(target_capabilities.begin(), target_capabilities.end(), cap) != target_capabilities.end()) {
                    rec.capabilities.push_back(cap);
                }
            }
        }
        rec.reason = "Handshake accepted successfully";
    } else {
        rec.accepted = false;
        rec.protocol_version = source_version;
        rec.reason = "Protocol version mismatch: " + source_version + " vs " + target_version;
        resp.error = swarm_error(ERROR_TYPE_PROTOCOL, rec.reason);
    }

    resp.accepted = rec.accepted;
    resp.capabilities = rec.capabilities;
    resp.protocol_version = rec.protocol_version;
    resp.reason = rec.reason;

    {
        std::unique_lock<std::shared_mutex> lock(pimpl->mutex);
        pimpl->handshakes[rec.handshake_id] = rec;
        if (rec.accepted) {
            registered_peer& peer = pimpl->peers[rec.target_agent_id];
            if (peer.protocol_version.empty()) {
                peer.protocol_version = target_version;
            }
        }
    }
    pimpl->active_handshakes--;

    if (rec.accepted) {
        LOG_INF("a2a: handshake %s accepted (%zu shared capabilities)\n", rec.handshake_id.c_str(),
                rec.capabilities.size());
    } else {
        LOG_WRN("a2a: handshake %s rejected: %s\n", rec.handshake_id.c_str(), rec.reason.c_str());
    }

    handshake_response_payload resp_payload;
    resp_payload.handshake_id = rec.handshake_id;
    resp_payload.source_agent_id = rec.source_agent_id;
    resp_payload.target_agent_id = rec.target_agent_id;
    resp_payload.accepted = rec.accepted;
    resp_payload.protocol_version = rec.protocol_version;
    resp_payload.reason = rec.reason;
    pimpl->bus.publish(MEDIATOR_SOURCE, resp_payload);

    return result<handshake_response>::success(resp);
}

result<task_negotiation_response> handshake_mediator::negotiate_task(const task_negotiation_request& request) {
    if (!pimpl->config.enable_task_negotiation) {
        return result<task_negotiation_response>::failure(ERROR_TYPE_PROTOCOL, "Task negotiation is disabled");
    }

    auto hs = pimpl->accepted_handshake(request.handshake_id);
    if (!hs) {
        LOG_WRN("a2a: negotiation for task %s refused: %s\n", request.t.id.c_str(),
                hs.error().message.c_str());
        return result<task_negotiation_response>::failure(hs.error());
    }

    LOG_INF("a2a: negotiating task %s from %s to %s\n", request.t.id.c_str(),
            request.source_agent_id.c_str(), request.target_agent_id.c_str());

    task_negotiation_request_payload req_payload;
    req_payload.handshake_id = request.handshake_id;
    req_payload.source_agent_id = request.source_agent_id;
    req_payload.target_agent_id = request.target_agent_id;
    req_payload.task_id = request.t.id;
    pimpl->bus.publish(MEDIATOR_SOURCE, req_payload);

    task_negotiation_response resp;
    resp.success = true;
    resp.accepted = true;
    resp.negotiation_id = generate_id("negotiation");
    resp.estimated_latency_ms = estimate_task_latency_ms(request.t);

    context_handoff_manager* handoff = pimpl->handoff.load();
    if (handoff && request.context.is_object() && !request.context.empty()) {
        handoff_request hreq;
        hreq.source_agent_id = request.source_agent_id;
        hreq.target_agent_id = request.target_agent_id;
        hreq.task_id = request.t.id;
        hreq.context = request.context;
        hreq.priority = request.priority;

        auto initiated = handoff->initiate_handoff(hreq);
        if (!initiated) {
            LOG_ERR("a2a: context handoff for task %s failed: %s\n", request.t.id.c_str(),
                    initiated.error().message.c_str());
            return result<task_negotiation_response>::failure(initiated.error());
        }
        resp.handoff_id = initiated.value().handoff_id;
    }

    task_negotiation_response_payload resp_payload;
    resp_payload.negotiation_id = resp.negotiation_id;
    resp_payload.handshake_id = request.handshake_id;
    resp_payload.accepted = resp.accepted;
    resp_payload.estimated_latency_ms = resp.estimated_latency_ms;
    resp_payload.handoff_id = resp.handoff_id;
    pimpl->bus.publish(MEDIATOR_SOURCE, resp_payload);

    LOG_INF("a2a: negotiation %s done, estimated latency %lld ms\n", resp.negotiation_id.c_str(),
            static_cast<long long>(resp.estimated_latency_ms));

    return result<task_negotiation_response>::success(resp);
}

result<state_sync_response> handshake_mediator::sync_state(const state_sync_request& request) {
    if (!pimpl->config.enable_state_sync) {
        return result<state_sync_response>::failure(ERROR_TYPE_PROTOCOL, "State synchronization is disabled");
    }
    if (!request.state.is_object()) {
        return result<state_sync_response>::failure(ERROR_TYPE_VALIDATION, "Synced state must be a JSON object");
    }

    auto hs = pimpl->accepted_handshake(request.handshake_id);
    if (!hs) {
        LOG_WRN("a2a: state sync refused: %s\n", hs.error().message.c_str());
        return result<state_sync_response>::failure(hs.error());
    }

    state_sync_request_payload req_payload;
    req_payload.handshake_id = request.handshake_id;
    req_payload.source_agent_id = request.source_agent_id;
    req_payload.target_agent_id = request.target_agent_id;
    req_payload.sync_type = state_sync_type_to_string(request.sync_type);
    for (auto it = request.state.begin(); it != request.state.end(); ++it) {
        req_payload.keys.push_back(it.key());
    }
    pimpl->bus.publish(MEDIATOR_SOURCE, req_payload);

    {
        std::unique_lock<std::shared_mutex> lock(pimpl->mutex);
        json& shared = pimpl->shared_state[request.handshake_id];
        if (request.sync_type == STATE_SYNC_FULL || !shared.is_object()) {
            shared = request.state;
        } else {
            for (auto it = request.state.begin(); it != request.state.end(); ++it) {
                shared[it.key()] = it.value();
            }
        }
    }

    state_sync_response resp;
    resp.success = true;
    resp.acknowledged = true;
    resp.sync_id = generate_id("sync");

    LOG_INF("a2a: %s state sync %s on handshake %s (%zu keys)\n",
            state_sync_type_to_string(request.sync_type), resp.sync_id.c_str(),
            request.handshake_id.c_str(), req_payload.keys.size());

    state_sync_response_payload resp_payload;
    resp_payload.sync_id = resp.sync_id;
    resp_payload.handshake_id = request.handshake_id;
    resp_payload.acknowledged = resp.acknowledged;
    pimpl->bus.publish(MEDIATOR_SOURCE, resp_payload);

    return result<state_sync_response>::success(resp);
}

std::optional<handshake_record> handshake_mediator::get_handshake(const std::string& handshake_id) const {
    std::shared_lock<std::shared_mutex> lock(pimpl->mutex);
    auto it = pimpl->handshakes.find(handshake_id);
    if (it == pimpl->handshakes.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<json> handshake_mediator::get_shared_state(const std::string& handshake_id) const {
    std::shared_lock<std::shared_mutex> lock(pimpl->mutex);
    auto it = pimpl->shared_state.find(handshake_id);
    if (it == pimpl->shared_state.end()) {
        return std::nullopt;
    }
    return it->second;
}

void handshake_mediator::set_handoff_manager(context_handoff_manager* handoff) {
    pimpl->handoff = handoff;
}

const handshake_config& handshake_mediator::config() const {
    return pimpl->config;
}

} // namespace swarm

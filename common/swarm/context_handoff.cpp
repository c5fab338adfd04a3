#include "context_handoff.h"
#include "log.h"

#include <map>
#include <mutex>
#include <shared_mutex>

namespace swarm {

static const char * HANDOFF_SOURCE = "context_handoff";

int handoff_config::level_for(task_priority priority) const {
    switch (priority) {
        case TASK_PRIORITY_HIGH:   return high_priority_level;
        case TASK_PRIORITY_MEDIUM: return medium_priority_level;
        case TASK_PRIORITY_LOW:    return low_priority_level;
        default:                   return medium_priority_level;
    }
}

json handoff_config::to_json() const {
    return json{
        {"high_priority_level", high_priority_level},
        {"medium_priority_level", medium_priority_level},
        {"low_priority_level", low_priority_level}
    };
}

json handoff_request::to_json() const {
    return json{
        {"source_agent_id", source_agent_id},
        {"target_agent_id", target_agent_id},
        {"task_id", task_id},
        {"context", context},
        {"priority", task_priority_to_string(priority)}
    };
}

const char* handoff_status_to_string(handoff_status status) {
    switch (status) {
        case HANDOFF_STATUS_PENDING:   return "pending";
        case HANDOFF_STATUS_COMPLETED: return "completed";
        case HANDOFF_STATUS_FAILED:    return "failed";
        default:                       return "unknown";
    }
}

json handoff_record::to_json() const {
    json j{
        {"handoff_id", handoff_id},
        {"source_agent_id", source_agent_id},
        {"target_agent_id", target_agent_id},
        {"task_id", task_id},
        {"priority", task_priority_to_string(priority)},
        {"original_size", original_size},
        {"compressed_size", compressed_size},
        {"status", handoff_status_to_string(status)},
        {"created_at", created_at},
        {"finished_at", finished_at}
    };
    if (!error.empty()) {
        j["error"] = error;
    }
    return j;
}

json handoff_initiation::to_json() const {
    return json{
        {"success", success},
        {"handoff_id", handoff_id},
        {"original_size", original_size},
        {"compressed_size", compressed_size},
        {"transfer_time_ms", transfer_time_ms}
    };
}

namespace {

struct handoff_entry {
    // Guards record; transition events are posted while it is held
    std::mutex mutex;
    handoff_record record;
};

} // namespace

struct context_handoff_manager::impl {
    event_bus& bus;
    handoff_config config;
    std::unique_ptr<compression_provider> provider;
    persistence_store* store = nullptr;

    std::map<std::string, std::shared_ptr<handoff_entry>> handoffs;
    mutable std::shared_mutex mutex;

    impl(event_bus& b, const handoff_config& c, std::unique_ptr<compression_provider> p)
        : bus(b), config(c), provider(std::move(p)) {
        if (!provider) {
            provider = make_default_compression_provider();
        }
    }

    std::shared_ptr<handoff_entry> find(const std::string& handoff_id) const {
        std::shared_lock<std::shared_mutex> lock(mutex);
        auto it = handoffs.find(handoff_id);
        return it == handoffs.end() ? nullptr : it->second;
    }

    // Queue only, callers dispatch once their locks are released
    void post_failed(const handoff_record& rec) {
        handoff_failed_payload payload;
        payload.handoff_id = rec.handoff_id;
        payload.source_agent_id = rec.source_agent_id;
        payload.target_agent_id = rec.target_agent_id;
        payload.task_id = rec.task_id;
        payload.error = rec.error;
        payload.duration_ms = (rec.finished_at > 0 ? rec.finished_at : get_timestamp_ms()) - rec.created_at;
        bus.post(HANDOFF_SOURCE, payload);
    }

    void persist(const handoff_record& rec) {
        if (!store) {
            return;
        }
        auto saved = store->save("handoff", rec.handoff_id, rec.to_json());
        if (!saved) {
            LOG_WRN("failed to persist handoff %s: %s\n", rec.handoff_id.c_str(),
                    saved.error().to_string().c_str());
        }
    }

    // Caller holds entry->mutex
    void fail_locked(handoff_entry& entry, const std::string& error) {
        entry.record.status = HANDOFF_STATUS_FAILED;
        entry.record.error = error;
        entry.record.finished_at = get_timestamp_ms();
        entry.record.compressed_payload.clear();
        entry.record.compressed_payload.shrink_to_fit();
    }
};

context_handoff_manager::context_handoff_manager(event_bus& bus, const handoff_config& config,
                                                 std::unique_ptr<compression_provider> provider)
    : pimpl(std::make_unique<impl>(bus, config, std::move(provider))) {}

context_handoff_manager::~context_handoff_manager() = default;

result<handoff_initiation> context_handoff_manager::initiate_handoff(const handoff_request& request) {
    if (request.source_agent_id.empty() || request.target_agent_id.empty()) {
        return result<handoff_initiation>::failure(ERROR_TYPE_VALIDATION,
                                                   "Handoff needs both source and target agent ids");
    }
    if (!request.context.is_object()) {
        return result<handoff_initiation>::failure(ERROR_TYPE_VALIDATION,
                                                   "Handoff context must be a JSON object");
    }

    LOG_INF("initiating context handoff from %s to %s (task %s)\n", request.source_agent_id.c_str(),
            request.target_agent_id.c_str(), request.task_id.c_str());

    auto entry = std::make_shared<handoff_entry>();
    handoff_record& rec = entry->record;
    rec.handoff_id = generate_id("handoff");
    rec.source_agent_id = request.source_agent_id;
    rec.target_agent_id = request.target_agent_id;
    rec.task_id = request.task_id;
    rec.priority = request.priority;
    rec.created_at = get_timestamp_ms();

    const std::string text = request.context.dump();
    rec.original_size = text.size();

    const int level = pimpl->config.level_for(request.priority);
    auto compressed = pimpl->provider->compress(text, level);
    if (!compressed) {
        // Nothing stored: the id only appears in the failure event
        rec.status = HANDOFF_STATUS_FAILED;
        rec.error = compressed.error().message;
        rec.finished_at = get_timestamp_ms();
        LOG_ERR("handoff %s: compression failed: %s\n", rec.handoff_id.c_str(), rec.error.c_str());
        pimpl->post_failed(rec);
        pimpl->bus.dispatch();
        return result<handoff_initiation>::failure(compressed.error());
    }

    rec.compressed_payload = std::move(compressed.value());
    rec.compressed_size = rec.compressed_payload.size();

    handoff_initiation out;
    out.success = true;
    out.handoff_id = rec.handoff_id;
    out.original_size = rec.original_size;
    out.compressed_size = rec.compressed_size;
    out.transfer_time_ms = get_timestamp_ms() - rec.created_at;

    context_compressed_payload compressed_payload;
    compressed_payload.original_size = rec.original_size;
    compressed_payload.compressed_size = rec.compressed_size;
    compressed_payload.compression_ratio = rec.original_size > 0
        ? static_cast<double>(rec.compressed_size) / static_cast<double>(rec.original_size)
        : 0.0;
    compressed_payload.algorithm = pimpl->provider->name();

    handoff_initiated_payload initiated;
    initiated.handoff_id = rec.handoff_id;
    initiated.source_agent_id = rec.source_agent_id;
    initiated.target_agent_id = rec.target_agent_id;
    initiated.task_id = rec.task_id;
    initiated.priority = task_priority_to_string(rec.priority);
    initiated.original_size = rec.original_size;
    initiated.compressed_size = rec.compressed_size;

    {
        // Queued before the handoff becomes visible, so completion or
        // cancellation events always follow them
        std::unique_lock<std::shared_mutex> lock(pimpl->mutex);
        pimpl->handoffs[rec.handoff_id] = entry;
        pimpl->bus.post(HANDOFF_SOURCE, compressed_payload);
        pimpl->bus.post(HANDOFF_SOURCE, initiated);
    }

    LOG_INF("handoff %s initiated: %zu -> %zu bytes (level %d)\n", out.handoff_id.c_str(),
            out.original_size, out.compressed_size, level);
    pimpl->bus.dispatch();

    return result<handoff_initiation>::success(out);
}

result<json> context_handoff_manager::complete_handoff(const std::string& handoff_id,
                                                       const std::string& target_agent_id) {
    auto entry = pimpl->find(handoff_id);
    if (!entry) {
        return result<json>::failure(ERROR_TYPE_VALIDATION, "Handoff " + handoff_id + " not found");
    }

    std::unique_lock<std::mutex> lock(entry->mutex);
    handoff_record& rec = entry->record;

    if (rec.status == HANDOFF_STATUS_COMPLETED) {
        LOG_WRN("handoff %s already completed\n", handoff_id.c_str());
        return result<json>::failure(ERROR_TYPE_CONFLICT, "AlreadyCompleted");
    }
    if (rec.status == HANDOFF_STATUS_FAILED) {
        LOG_WRN("handoff %s already failed\n", handoff_id.c_str());
        return result<json>::failure(ERROR_TYPE_CONFLICT, "Handoff " + handoff_id + " already failed");
    }
    if (rec.target_agent_id != target_agent_id) {
        LOG_WRN("handoff %s is not intended for agent %s\n", handoff_id.c_str(), target_agent_id.c_str());
        return result<json>::failure(ERROR_TYPE_VALIDATION,
                                     "Handoff " + handoff_id + " is not intended for agent " + target_agent_id);
    }

    auto text = pimpl->provider->decompress(rec.compressed_payload);
    json context;
    if (text) {
        context = json::parse(text.value(), nullptr, false);
    }
    if (!text || context.is_discarded()) {
        const std::string error = !text
            ? text.error().message
            : "Failed to parse decompressed context as JSON";
        pimpl->fail_locked(*entry, error);
        const handoff_record snapshot = rec;
        pimpl->post_failed(snapshot);
        lock.unlock();

        LOG_ERR("handoff %s failed: %s\n", handoff_id.c_str(), error.c_str());
        pimpl->bus.dispatch();
        pimpl->persist(snapshot);
        return result<json>::failure(ERROR_TYPE_INTERNAL, error);
    }

    const size_t decompressed_size = text.value().size();
    rec.status = HANDOFF_STATUS_COMPLETED;
    rec.finished_at = get_timestamp_ms();
    rec.compressed_payload.clear();
    rec.compressed_payload.shrink_to_fit();
    const handoff_record snapshot = rec;

    context_decompressed_payload decompressed;
    decompressed.compressed_size = snapshot.compressed_size;
    decompressed.decompressed_size = decompressed_size;
    decompressed.algorithm = pimpl->provider->name();
    pimpl->bus.post(HANDOFF_SOURCE, decompressed);

    handoff_completed_payload completed;
    completed.handoff_id = snapshot.handoff_id;
    completed.source_agent_id = snapshot.source_agent_id;
    completed.target_agent_id = snapshot.target_agent_id;
    completed.task_id = snapshot.task_id;
    completed.duration_ms = snapshot.finished_at - snapshot.created_at;
    pimpl->bus.post(HANDOFF_SOURCE, completed);
    lock.unlock();

    LOG_INF("handoff %s completed by %s in %lld ms\n", handoff_id.c_str(), target_agent_id.c_str(),
            static_cast<long long>(snapshot.finished_at - snapshot.created_at));
    pimpl->bus.dispatch();
    pimpl->persist(snapshot);

    return result<json>::success(std::move(context));
}

status context_handoff_manager::cancel_handoff(const std::string& handoff_id) {
    auto entry = pimpl->find(handoff_id);
    if (!entry) {
        return status::failure(ERROR_TYPE_VALIDATION, "Handoff " + handoff_id + " not found");
    }

    handoff_record snapshot;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->record.status != HANDOFF_STATUS_PENDING) {
            return status::failure(ERROR_TYPE_CONFLICT,
                                   "Handoff " + handoff_id + " is already " +
                                   handoff_status_to_string(entry->record.status));
        }
        pimpl->fail_locked(*entry, "Cancelled");
        snapshot = entry->record;
        pimpl->post_failed(snapshot);
    }

    LOG_INF("cancelled handoff %s\n", handoff_id.c_str());
    pimpl->bus.dispatch();
    pimpl->persist(snapshot);
    return status::success();
}

std::optional<handoff_record> context_handoff_manager::get_handoff(const std::string& handoff_id) const {
    auto entry = pimpl->find(handoff_id);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->record;
}

size_t context_handoff_manager::pending_count() const {
    std::vector<std::shared_ptr<handoff_entry>> entries;
    {
        std::shared_lock<std::shared_mutex> lock(pimpl->mutex);
        for (const auto& [id, entry] : pimpl->handoffs) {
            entries.push_back(entry);
        }
    }
    size_t pending = 0;
    for (const auto& entry : entries) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->record.status == HANDOFF_STATUS_PENDING) {
            pending++;
        }
    }
    return pending;
}

void context_handoff_manager::set_persistence_store(persistence_store* store) {
    pimpl->store = store;
}

} // namespace swarm

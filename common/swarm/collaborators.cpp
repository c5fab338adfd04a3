#include "collaborators.h"
#include "log.h"

#include <exception>

namespace swarm {

json execution_result::to_json() const {
    json j{
        {"success", success},
        {"result", result},
        {"execution_time_ms", execution_time_ms}
    };
    if (!error.empty()) {
        j["error"] = error;
    }
    return j;
}

callback_execution_engine::callback_execution_engine(callback cb) : cb_(std::move(cb)) {}

execution_result callback_execution_engine::execute_task(const task& t, const agent_info& agent) {
    execution_result res;
    if (!cb_) {
        res.error = "No execution callback configured";
        return res;
    }

    const int64_t start = get_timestamp_ms();
    try {
        res = cb_(t, agent);
    } catch (const std::exception& e) {
        LOG_ERR("agent %s failed on task %s: %s\n", agent.id.c_str(), t.id.c_str(), e.what());
        res = execution_result();
        res.error = e.what();
    } catch (...) {
        LOG_ERR("agent %s failed on task %s: unknown exception\n", agent.id.c_str(), t.id.c_str());
        res = execution_result();
        res.error = "unknown exception";
    }
    if (res.execution_time_ms == 0) {
        res.execution_time_ms = get_timestamp_ms() - start;
    }
    return res;
}

status memory_persistence_store::save(const std::string& kind, const std::string& id,
                                      const json& record) {
    if (kind.empty() || id.empty()) {
        return status::failure(ERROR_TYPE_VALIDATION, "Persistence kind and id must not be empty");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    records_[kind][id] = record;
    return status::success();
}

std::optional<json> memory_persistence_store::load(const std::string& kind,
                                                   const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto kind_it = records_.find(kind);
    if (kind_it == records_.end()) {
        return std::nullopt;
    }
    auto it = kind_it->second.find(id);
    if (it == kind_it->second.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> memory_persistence_store::list(const std::string& kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    auto kind_it = records_.find(kind);
    if (kind_it != records_.end()) {
        for (const auto& [id, record] : kind_it->second) {
            ids.push_back(id);
        }
    }
    return ids;
}

} // namespace swarm

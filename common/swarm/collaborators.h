#pragma once

#include "error.h"
#include "types.h"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace swarm {

//
// Agent execution
//

struct execution_result {
    bool success = false;
    json result = json::object();   // Output merged into workflow context
    int64_t execution_time_ms = 0;
    std::string error;

    json to_json() const;
};

// Runs a routed agent on a task. Model invocation lives behind this interface.
class agent_execution_engine {
public:
    virtual ~agent_execution_engine() = default;

    virtual execution_result execute_task(const task& t, const agent_info& agent) = 0;
};

// Execution engine backed by a callable, used by tests and the demo
class callback_execution_engine : public agent_execution_engine {
public:
    using callback = std::function<execution_result(const task&, const agent_info&)>;

    explicit callback_execution_engine(callback cb);

    // Callback exceptions are reported as failed results; execution time is
    // filled in when the callback leaves it at 0.
    execution_result execute_task(const task& t, const agent_info& agent) override;

private:
    callback cb_;
};

//
// Persistence
//

// Optional durable storage for terminal records (closed sessions, finished
// handoffs). The core runs without one.
class persistence_store {
public:
    virtual ~persistence_store() = default;

    virtual status save(const std::string& kind, const std::string& id, const json& record) = 0;

    virtual std::optional<json> load(const std::string& kind, const std::string& id) const = 0;
};

// Process-local store
class memory_persistence_store : public persistence_store {
public:
    status save(const std::string& kind, const std::string& id, const json& record) override;
    std::optional<json> load(const std::string& kind, const std::string& id) const override;

    // Ids saved under a kind, sorted
    std::vector<std::string> list(const std::string& kind) const;

private:
    std::map<std::string, std::map<std::string, json>> records_;
    mutable std::mutex mutex_;
};

} // namespace swarm

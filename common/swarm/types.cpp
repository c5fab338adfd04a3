#include "types.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <random>
#include <sstream>
#include <mutex>

namespace swarm {

const char* agent_type_to_string(agent_type type) {
    switch (type) {
        case AGENT_TYPE_PLANNER:    return "planner";
        case AGENT_TYPE_CODER:      return "coder";
        case AGENT_TYPE_REVIEWER:   return "reviewer";
        case AGENT_TYPE_DEBUGGER:   return "debugger";
        case AGENT_TYPE_OPTIMIZER:  return "optimizer";
        case AGENT_TYPE_TESTER:     return "tester";
        case AGENT_TYPE_RESEARCHER: return "researcher";
        default:                    return "unknown";
    }
}

agent_type agent_type_from_string(const std::string& str) {
    if (str == "planner")    return AGENT_TYPE_PLANNER;
    if (str == "coder")      return AGENT_TYPE_CODER;
    if (str == "reviewer")   return AGENT_TYPE_REVIEWER;
    if (str == "debugger")   return AGENT_TYPE_DEBUGGER;
    if (str == "optimizer")  return AGENT_TYPE_OPTIMIZER;
    if (str == "tester")     return AGENT_TYPE_TESTER;
    if (str == "researcher") return AGENT_TYPE_RESEARCHER;
    return AGENT_TYPE_UNKNOWN;
}

double agent_info::utilization() const {
    if (capacity <= 0) {
        return 1.0;
    }
    return static_cast<double>(workload) / static_cast<double>(capacity);
}

double agent_info::spare_ratio() const {
    if (capacity <= 0) {
        return 0.0;
    }
    double spare = static_cast<double>(capacity - workload) / static_cast<double>(capacity);
    return std::max(0.0, std::min(1.0, spare));
}

json agent_info::to_json() const {
    return json{
        {"id", id},
        {"type", agent_type_to_string(type)},
        {"name", name},
        {"expertise", expertise},
        {"workload", workload},
        {"capacity", capacity}
    };
}

agent_info agent_info::from_json(const json& j) {
    agent_info info;
    info.id = j.value("id", "");
    info.type = agent_type_from_string(j.value("type", "unknown"));
    info.name = j.value("name", "");
    info.expertise = j.value("expertise", std::vector<std::string>());
    info.workload = j.value("workload", 0);
    info.capacity = j.value("capacity", 1);
    return info;
}

json task::to_json() const {
    return json{
        {"id", id},
        {"description", description},
        {"type", type},
        {"priority", priority},
        {"context", context}
    };
}

task task::from_json(const json& j) {
    task t;
    t.id = j.value("id", "");
    t.description = j.value("description", "");
    t.type = j.value("type", "");
    t.priority = j.value("priority", 5);
    t.context = j.contains("context") ? j.at("context") : json::object();
    return t;
}

const char* task_priority_to_string(task_priority priority) {
    switch (priority) {
        case TASK_PRIORITY_LOW:    return "low";
        case TASK_PRIORITY_MEDIUM: return "medium";
        case TASK_PRIORITY_HIGH:   return "high";
        default:                   return "medium";
    }
}

task_priority task_priority_from_string(const std::string& str) {
    if (str == "low")  return TASK_PRIORITY_LOW;
    if (str == "high") return TASK_PRIORITY_HIGH;
    return TASK_PRIORITY_MEDIUM;
}

std::string generate_uuid() {
    static std::mutex mutex;
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<> dis(0, 15);
    static std::uniform_int_distribution<> dis2(8, 11);

    std::lock_guard<std::mutex> lock(mutex);

    std::stringstream ss;
    ss << std::hex;
    for (int i = 0; i < 8; i++) {
        ss << dis(gen);
    }
    ss << "-";
    for (int i = 0; i < 4; i++) {
        ss << dis(gen);
    }
    ss << "-4";
    for (int i = 0; i < 3; i++) {
        ss << dis(gen);
    }
    ss << "-";
    ss << dis2(gen);
    for (int i = 0; i < 3; i++) {
        ss << dis(gen);
    }
    ss << "-";
    for (int i = 0; i < 12; i++) {
        ss << dis(gen);
    }
    return ss.str();
}

std::string generate_id(const std::string& prefix) {
    return prefix + "_" + generate_uuid();
}

int64_t get_timestamp_ms() {
    auto now = std::chrono::system_clock::now();
    auto duration = now.time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

std::string to_lower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace swarm

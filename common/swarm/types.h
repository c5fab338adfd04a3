#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace swarm {

using json = nlohmann::ordered_json;

// Agent roles in the swarm
enum agent_type {
    AGENT_TYPE_PLANNER,     // Task planning and decomposition
    AGENT_TYPE_CODER,       // Code generation and implementation
    AGENT_TYPE_REVIEWER,    // Code review
    AGENT_TYPE_DEBUGGER,    // Bug detection and fixing
    AGENT_TYPE_OPTIMIZER,   // Performance work
    AGENT_TYPE_TESTER,      // Test creation and execution
    AGENT_TYPE_RESEARCHER,  // Information gathering
    AGENT_TYPE_UNKNOWN
};

// Convert agent type to string
const char* agent_type_to_string(agent_type type);

// Parse agent type string
agent_type agent_type_from_string(const std::string& str);

// Agent profile
struct agent_info {
    std::string id;                       // Unique, never changes
    agent_type type = AGENT_TYPE_UNKNOWN; // Role tag
    std::string name;
    std::vector<std::string> expertise;
    int workload = 0;                     // Active tasks, >= 0
    int capacity = 1;                     // Max concurrent tasks, > 0

    // workload / capacity
    double utilization() const;

    // (capacity - workload) / capacity, clamped to [0, 1]
    double spare_ratio() const;

    bool at_capacity() const { return workload >= capacity; }

    json to_json() const;
    static agent_info from_json(const json& j);
};

// Unit of work submitted by a caller
struct task {
    std::string id;
    std::string description;
    std::string type;      // e.g. "code_generation"
    int priority = 5;      // 0-10, higher = more urgent
    json context = json::object();

    json to_json() const;
    static task from_json(const json& j);
};

// Handoff priority
enum task_priority {
    TASK_PRIORITY_LOW,
    TASK_PRIORITY_MEDIUM,
    TASK_PRIORITY_HIGH
};

const char* task_priority_to_string(task_priority priority);
task_priority task_priority_from_string(const std::string& str);

// Generate UUID v4 for events, sessions and records
std::string generate_uuid();

// Generate "<prefix>_<uuid>"
std::string generate_id(const std::string& prefix);

// Get current timestamp in milliseconds
int64_t get_timestamp_ms();

// Lowercase ASCII copy
std::string to_lower(const std::string& str);

} // namespace swarm

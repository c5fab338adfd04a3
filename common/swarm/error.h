#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <optional>
#include <utility>

namespace swarm {

// Error kinds surfaced by every public operation
enum error_type {
    ERROR_TYPE_NONE,
    ERROR_TYPE_VALIDATION,   // Bad or unknown id, malformed request
    ERROR_TYPE_CAPACITY,     // No eligible agent
    ERROR_TYPE_CONFLICT,     // Terminal record touched twice
    ERROR_TYPE_PROTOCOL,     // Handshake version mismatch, disabled feature
    ERROR_TYPE_INTERNAL      // Iteration cap exceeded, unexpected state
};

// Convert error type to string
const char* error_type_to_string(error_type type);

// Parse error type string, unknown strings map to ERROR_TYPE_INTERNAL
error_type error_type_from_string(const std::string& str);

// Error kind + human readable detail
struct swarm_error {
    error_type type = ERROR_TYPE_NONE;
    std::string message;

    swarm_error() = default;
    swarm_error(error_type type_, std::string message_)
        : type(type_), message(std::move(message_)) {}

    // "<kind>: <message>"
    std::string to_string() const;

    // {"type": "<kind>", "message": "..."}
    nlohmann::ordered_json to_json() const;

    // Missing fields fall back to internal / empty message
    static swarm_error from_json(const nlohmann::ordered_json& j);
};

// Value-or-error return type
template<typename T>
class result {
public:
    static result success(T value) {
        result r;
        r.value_ = std::move(value);
        return r;
    }

    static result failure(error_type type, std::string message) {
        result r;
        r.error_ = swarm_error(type, std::move(message));
        return r;
    }

    static result failure(swarm_error error) {
        result r;
        r.error_ = std::move(error);
        return r;
    }

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    const swarm_error& error() const { return error_; }

private:
    result() = default;

    std::optional<T> value_;
    swarm_error error_;
};

// Success/failure without a value
class status {
public:
    static status success() { return status(); }

    static status failure(error_type type, std::string message) {
        status s;
        s.error_ = swarm_error(type, std::move(message));
        return s;
    }

    bool ok() const { return error_.type == ERROR_TYPE_NONE; }
    explicit operator bool() const { return ok(); }

    const swarm_error& error() const { return error_; }

private:
    status() = default;

    swarm_error error_;
};

} // namespace swarm

#include "error.h"

namespace swarm {

using json = nlohmann::ordered_json;

const char* error_type_to_string(error_type type) {
    switch (type) {
        case ERROR_TYPE_NONE:       return "none";
        case ERROR_TYPE_VALIDATION: return "validation";
        case ERROR_TYPE_CAPACITY:   return "capacity";
        case ERROR_TYPE_CONFLICT:   return "conflict";
        case ERROR_TYPE_PROTOCOL:   return "protocol";
        case ERROR_TYPE_INTERNAL:   return "internal";
        default:                    return "internal";
    }
}

error_type error_type_from_string(const std::string& str) {
    if (str == "none")       return ERROR_TYPE_NONE;
    if (str == "validation") return ERROR_TYPE_VALIDATION;
    if (str == "capacity")   return ERROR_TYPE_CAPACITY;
    if (str == "conflict")   return ERROR_TYPE_CONFLICT;
    if (str == "protocol")   return ERROR_TYPE_PROTOCOL;
    return ERROR_TYPE_INTERNAL;
}

std::string swarm_error::to_string() const {
    return std::string(error_type_to_string(type)) + ": " + message;
}

json swarm_error::to_json() const {
    return json{
        {"type", error_type_to_string(type)},
        {"message", message}
    };
}

swarm_error swarm_error::from_json(const json& j) {
    swarm_error err;
    if (!j.is_object()) {
        err.type = ERROR_TYPE_INTERNAL;
        return err;
    }
    err.type = error_type_from_string(j.value("type", "internal"));
    err.message = j.value("message", "");
    return err;
}

} // namespace swarm

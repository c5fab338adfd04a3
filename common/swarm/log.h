#pragma once

#include <string>

namespace swarm {

// Log verbosity, lowest to highest severity
enum log_level {
    LOG_LEVEL_DEBUG,
    LOG_LEVEL_INFO,
    LOG_LEVEL_WARN,
    LOG_LEVEL_ERROR,
    LOG_LEVEL_OFF
};

// Convert log level to string
const char* log_level_to_string(log_level level);

// Parse log level ("debug", "info", "warn", "error", "off"), defaults to info
log_level log_level_from_string(const std::string& str);

// Logger configuration
struct log_config {
    log_level level = LOG_LEVEL_INFO;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
    std::string file;  // Optional log file, appended alongside stderr
};

// (Re)configure the shared "swarm" logger
void log_configure(const log_config& config);

// Change verbosity without touching sinks
void log_set_level(log_level level);

// Current verbosity
log_level log_get_level();

// Format and emit a message (printf-style)
void log_printf(log_level level, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

} // namespace swarm

#define LOG_DBG(...) ::swarm::log_printf(::swarm::LOG_LEVEL_DEBUG, __VA_ARGS__)
#define LOG_INF(...) ::swarm::log_printf(::swarm::LOG_LEVEL_INFO,  __VA_ARGS__)
#define LOG_WRN(...) ::swarm::log_printf(::swarm::LOG_LEVEL_WARN,  __VA_ARGS__)
#define LOG_ERR(...) ::swarm::log_printf(::swarm::LOG_LEVEL_ERROR, __VA_ARGS__)

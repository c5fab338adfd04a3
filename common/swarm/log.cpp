#include "log.h"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdarg>
#include <cstdio>
#include <memory>
#include <mutex>
#include <vector>

namespace swarm {

namespace {

std::mutex g_log_mutex;
std::shared_ptr<spdlog::logger> g_logger;

spdlog::level::level_enum to_spdlog_level(log_level level) {
    switch (level) {
        case LOG_LEVEL_DEBUG: return spdlog::level::debug;
        case LOG_LEVEL_INFO:  return spdlog::level::info;
        case LOG_LEVEL_WARN:  return spdlog::level::warn;
        case LOG_LEVEL_ERROR: return spdlog::level::err;
        case LOG_LEVEL_OFF:   return spdlog::level::off;
        default:              return spdlog::level::info;
    }
}

std::shared_ptr<spdlog::logger> build_logger(const log_config& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!config.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file, false));
        } catch (const spdlog::spdlog_ex& e) {
            std::fprintf(stderr, "swarm: cannot open log file %s: %s\n", config.file.c_str(), e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("swarm", sinks.begin(), sinks.end());
    logger->set_pattern(config.pattern);
    logger->set_level(to_spdlog_level(config.level));
    logger->flush_on(spdlog::level::warn);
    return logger;
}

std::shared_ptr<spdlog::logger> get_logger() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_logger) {
        g_logger = build_logger(log_config{});
    }
    return g_logger;
}

} // namespace

const char* log_level_to_string(log_level level) {
    switch (level) {
        case LOG_LEVEL_DEBUG: return "debug";
        case LOG_LEVEL_INFO:  return "info";
        case LOG_LEVEL_WARN:  return "warn";
        case LOG_LEVEL_ERROR: return "error";
        case LOG_LEVEL_OFF:   return "off";
        default:              return "info";
    }
}

log_level log_level_from_string(const std::string& str) {
    if (str == "debug") return LOG_LEVEL_DEBUG;
    if (str == "warn")  return LOG_LEVEL_WARN;
    if (str == "error") return LOG_LEVEL_ERROR;
    if (str == "off")   return LOG_LEVEL_OFF;
    return LOG_LEVEL_INFO;
}

void log_configure(const log_config& config) {
    auto logger = build_logger(config);
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_logger) {
        g_logger->flush();
    }
    g_logger = logger;
}

void log_set_level(log_level level) {
    get_logger()->set_level(to_spdlog_level(level));
}

log_level log_get_level() {
    switch (get_logger()->level()) {
        case spdlog::level::trace:
        case spdlog::level::debug: return LOG_LEVEL_DEBUG;
        case spdlog::level::info:  return LOG_LEVEL_INFO;
        case spdlog::level::warn:  return LOG_LEVEL_WARN;
        case spdlog::level::err:
        case spdlog::level::critical: return LOG_LEVEL_ERROR;
        default: return LOG_LEVEL_OFF;
    }
}

void log_printf(log_level level, const char* fmt, ...) {
    auto logger = get_logger();
    auto lvl = to_spdlog_level(level);
    if (!logger->should_log(lvl)) {
        return;
    }

    va_list args;
    va_start(args, fmt);
    va_list args_copy;
    va_copy(args_copy, args);

    char buf[512];
    int n = std::vsnprintf(buf, sizeof(buf), fmt, args);
    std::string msg;
    if (n >= 0 && static_cast<size_t>(n) < sizeof(buf)) {
        msg.assign(buf, n);
    } else if (n >= 0) {
        msg.resize(static_cast<size_t>(n) + 1);
        std::vsnprintf(&msg[0], msg.size(), fmt, args_copy);
        msg.resize(static_cast<size_t>(n));
    }
    va_end(args_copy);
    va_end(args);

    // LOG_* format strings end with a newline, spdlog adds its own
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) {
        msg.pop_back();
    }

    logger->log(lvl, "{}", msg);
}

} // namespace swarm

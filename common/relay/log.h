#pragma once

#include <string>

// Minimal leveled logger for the relay library.
// Usage mirrors printf: LOG_INF("routed %s to %s\n", id.c_str(), target.c_str());

enum relay_log_level {
    RELAY_LOG_LEVEL_DEBUG = 0,
    RELAY_LOG_LEVEL_INFO  = 1,
    RELAY_LOG_LEVEL_WARN  = 2,
    RELAY_LOG_LEVEL_ERROR = 3,
    RELAY_LOG_LEVEL_NONE  = 4,
};

// Set the minimum level that is written (default: INFO)
void relay_log_set_level(relay_log_level level);
relay_log_level relay_log_get_level();

// Parse "debug", "info", "warn", "error", "none" (unknown -> INFO)
relay_log_level relay_log_level_from_string(const std::string & str);
const char * relay_log_level_to_string(relay_log_level level);

// Enable/disable the elapsed-time prefix
void relay_log_set_timestamps(bool enabled);

#if defined(__GNUC__)
__attribute__((format(printf, 2, 3)))
#endif
void relay_log_write(relay_log_level level, const char * fmt, ...);

#define LOG_DBG(...) relay_log_write(RELAY_LOG_LEVEL_DEBUG, __VA_ARGS__)
#define LOG_INF(...) relay_log_write(RELAY_LOG_LEVEL_INFO,  __VA_ARGS__)
#define LOG_WRN(...) relay_log_write(RELAY_LOG_LEVEL_WARN,  __VA_ARGS__)
#define LOG_ERR(...) relay_log_write(RELAY_LOG_LEVEL_ERROR, __VA_ARGS__)

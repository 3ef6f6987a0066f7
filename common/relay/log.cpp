#include "log.h"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <vector>

namespace {

std::atomic<int> g_level{RELAY_LOG_LEVEL_INFO};
std::atomic<bool> g_timestamps{true};
std::mutex g_mutex;

const auto g_start = std::chrono::steady_clock::now();

const char * level_prefix(relay_log_level level) {
    switch (level) {
        case RELAY_LOG_LEVEL_DEBUG: return "D";
        case RELAY_LOG_LEVEL_INFO:  return "I";
        case RELAY_LOG_LEVEL_WARN:  return "W";
        case RELAY_LOG_LEVEL_ERROR: return "E";
        default:                    return "?";
    }
}

} // namespace

void relay_log_set_level(relay_log_level level) {
    g_level.store(level);
}

relay_log_level relay_log_get_level() {
    return static_cast<relay_log_level>(g_level.load());
}

relay_log_level relay_log_level_from_string(const std::string & str) {
    if (str == "debug") return RELAY_LOG_LEVEL_DEBUG;
    if (str == "info")  return RELAY_LOG_LEVEL_INFO;
    if (str == "warn")  return RELAY_LOG_LEVEL_WARN;
    if (str == "error") return RELAY_LOG_LEVEL_ERROR;
    if (str == "none")  return RELAY_LOG_LEVEL_NONE;
    return RELAY_LOG_LEVEL_INFO;
}

const char * relay_log_level_to_string(relay_log_level level) {
    switch (level) {
        case RELAY_LOG_LEVEL_DEBUG: return "debug";
        case RELAY_LOG_LEVEL_INFO:  return "info";
        case RELAY_LOG_LEVEL_WARN:  return "warn";
        case RELAY_LOG_LEVEL_ERROR: return "error";
        case RELAY_LOG_LEVEL_NONE:  return "none";
        default:                    return "info";
    }
}

void relay_log_set_timestamps(bool enabled) {
    g_timestamps.store(enabled);
}

void relay_log_write(relay_log_level level, const char * fmt, ...) {
    if (level < g_level.load() || level >= RELAY_LOG_LEVEL_NONE) {
        return;
    }

    va_list args;
    va_start(args, fmt);
    va_list args_copy;
    va_copy(args_copy, args);

    std::vector<char> buf(256);
    int n = vsnprintf(buf.data(), buf.size(), fmt, args);
    if (n >= static_cast<int>(buf.size())) {
        buf.resize(n + 1);
        vsnprintf(buf.data(), buf.size(), fmt, args_copy);
    }
    va_end(args_copy);
    va_end(args);

    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_timestamps.load()) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - g_start).count();
        fprintf(stderr, "%s %lld.%03lld ", level_prefix(level),
                static_cast<long long>(elapsed / 1000),
                static_cast<long long>(elapsed % 1000));
    } else {
        fprintf(stderr, "%s ", level_prefix(level));
    }
    fputs(buf.data(), stderr);
    fflush(stderr);
}

#pragma once

#include "message.h"

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace relay {

struct latency_metrics {
    double min_ms = 0.0;
    double max_ms = 0.0;
    double average_ms = 0.0;
    double p50_ms = 0.0;
    double p95_ms = 0.0;
    double p99_ms = 0.0;
    size_t samples = 0;

    json to_json() const;
};

struct error_event {
    int64_t timestamp = 0;
    std::string type;
    std::string server;
    std::string message;

    json to_json() const;
};

struct error_metrics {
    int64_t total_errors = 0;
    double error_rate = 0.0;  // percent of dispatched messages
    std::map<std::string, int64_t> errors_by_type;
    std::map<std::string, int64_t> errors_by_server;
    std::vector<error_event> recent_errors;  // last 10

    json to_json() const;
};

// Latency samples and error events recorded per dispatch
class performance_monitor {
public:
    static constexpr size_t MAX_SAMPLES = 1000;
    static constexpr int64_t ERROR_RETENTION_MS = 3600000;

    explicit performance_monitor(double max_latency_ms = 50.0);

    void record_latency(double latency_ms, const base_message & message);
    void record_error(const std::string & type, const std::string & server, const std::string & message);

    latency_metrics get_latency_metrics() const;
    error_metrics get_error_metrics() const;

    // 0..100, penalized by latency over budget and by error rate
    double health_score() const;

    int64_t message_count() const;

    void set_max_latency(double max_latency_ms);
    void reset();

    json to_json() const;

private:
    mutable std::mutex mutex;
    double max_latency_ms;
    int64_t messages = 0;
    int64_t slow_messages = 0;
    std::deque<double> latency_samples;
    std::deque<error_event> errors;

    void prune_errors_locked(int64_t now);
};

} // namespace relay

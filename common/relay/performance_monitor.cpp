#include "performance_monitor.h"
#include "log.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace relay {

json latency_metrics::to_json() const {
    return json{
        {"min", min_ms},
        {"max", max_ms},
        {"average", average_ms},
        {"p50", p50_ms},
        {"p95", p95_ms},
        {"p99", p99_ms},
        {"samples", samples}
    };
}

json error_event::to_json() const {
    return json{
        {"timestamp", timestamp},
        {"type", type},
        {"server", server},
        {"message", message}
    };
}

json error_metrics::to_json() const {
    json recent = json::array();
    for (const auto & e : recent_errors) {
        recent.push_back(e.to_json());
    }
    return json{
        {"totalErrors", total_errors},
        {"errorRate", error_rate},
        {"errorsByType", errors_by_type},
        {"errorsByServer", errors_by_server},
        {"recentErrors", recent}
    };
}

// nearest-rank on an ascending array
static double percentile(const std::vector<double> & sorted, double p) {
    if (sorted.empty()) {
        return 0.0;
    }
    long idx = static_cast<long>(std::ceil(p / 100.0 * sorted.size())) - 1;
    idx = std::max(0L, std::min(idx, static_cast<long>(sorted.size()) - 1));
    return sorted[idx];
}

performance_monitor::performance_monitor(double max_latency_ms)
    : max_latency_ms(max_latency_ms) {}

void performance_monitor::record_latency(double latency_ms, const base_message & message) {
    std::lock_guard<std::mutex> lock(mutex);
    messages++;
    latency_samples.push_back(latency_ms);
    if (latency_samples.size() > MAX_SAMPLES) {
        latency_samples.pop_front();
    }
    if (latency_ms > max_latency_ms) {
        slow_messages++;
        LOG_DBG("slow dispatch: %s from %s took %.2f ms (budget %.0f ms)\n",
                message.header.message_id.c_str(), message.header.source.c_str(), latency_ms, max_latency_ms);
    }
}

void performance_monitor::record_error(const std::string & type, const std::string & server,
                                       const std::string & message) {
    std::lock_guard<std::mutex> lock(mutex);
    messages++;

    error_event e;
    e.timestamp = get_timestamp_ms();
    e.type = type;
    e.server = server;
    e.message = message;
    errors.push_back(e);

    prune_errors_locked(e.timestamp);
}

void performance_monitor::prune_errors_locked(int64_t now) {
    while (!errors.empty() && now - errors.front().timestamp > ERROR_RETENTION_MS) {
        errors.pop_front();
    }
}

latency_metrics performance_monitor::get_latency_metrics() const {
    std::vector<double> sorted;
    {
        std::lock_guard<std::mutex> lock(mutex);
        sorted.assign(latency_samples.begin(), latency_samples.end());
    }

    latency_metrics m;
    if (sorted.empty()) {
        return m;
    }

    std::sort(sorted.begin(), sorted.end());
    m.min_ms     = sorted.front();
    m.max_ms     = sorted.back();
    m.average_ms = std::accumulate(sorted.begin(), sorted.end(), 0.0) / sorted.size();
    m.p50_ms     = percentile(sorted, 50);
    m.p95_ms     = percentile(sorted, 95);
    m.p99_ms     = percentile(sorted, 99);
    m.samples    = sorted.size();
    return m;
}

error_metrics performance_monitor::get_error_metrics() const {
    std::lock_guard<std::mutex> lock(mutex);

    error_metrics m;
    m.total_errors = static_cast<int64_t>(errors.size());
    m.error_rate = messages > 0 ? static_cast<double>(errors.size()) / messages * 100.0 : 0.0;
    for (const auto & e : errors) {
        m.errors_by_type[e.type]++;
        m.errors_by_server[e.server]++;
    }

    size_t first = errors.size() > 10 ? errors.size() - 10 : 0;
    for (size_t i = first; i < errors.size(); i++) {
        m.recent_errors.push_back(errors[i]);
    }
    return m;
}

double performance_monitor::health_score() const {
    latency_metrics latency = get_latency_metrics();
    error_metrics err = get_error_metrics();

    double budget;
    {
        std::lock_guard<std::mutex> lock(mutex);
        budget = max_latency_ms;
    }

    double score = 100.0;
    if (budget > 0 && latency.average_ms > budget) {
        score -= std::min(30.0, latency.average_ms / budget * 10.0);
    }
    score -= std::min(45.0, err.error_rate * 10.0);
    return std::max(0.0, score);
}

int64_t performance_monitor::message_count() const {
    std::lock_guard<std::mutex> lock(mutex);
    return messages;
}

void performance_monitor::set_max_latency(double value) {
    std::lock_guard<std::mutex> lock(mutex);
    max_latency_ms = value;
}

void performance_monitor::reset() {
    std::lock_guard<std::mutex> lock(mutex);
    messages = 0;
    slow_messages = 0;
    latency_samples.clear();
    errors.clear();
}

json performance_monitor::to_json() const {
    int64_t total;
    int64_t slow;
    {
        std::lock_guard<std::mutex> lock(mutex);
        total = messages;
        slow = slow_messages;
    }
    return json{
        {"messages", total},
        {"slowMessages", slow},
        {"latency", get_latency_metrics().to_json()},
        {"errors", get_error_metrics().to_json()},
        {"healthScore", health_score()}
    };
}

} // namespace relay

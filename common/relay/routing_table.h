#pragma once

#include "message.h"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace relay {

enum health_status {
    HEALTH_STATUS_HEALTHY,
    HEALTH_STATUS_DEGRADED,
    HEALTH_STATUS_UNHEALTHY
};

std::string health_status_to_str(health_status status);
health_status str_to_health_status(const std::string & str);

struct server_health {
    health_status status = HEALTH_STATUS_HEALTHY;
    int64_t last_check = 0;
    double response_time_ms = 0.0;
    double error_rate = 0.0;     // percent
    double uptime = 100.0;       // percent of successful probes
    int64_t probes_total = 0;
    int64_t probes_ok = 0;

    json to_json() const;
};

struct server_performance {
    double average_latency_ms = 100.0;
    double throughput = 0.0;     // deliveries / s since registration
    double error_rate = 0.0;     // percent
    double success_rate = 100.0; // percent
    int64_t last_measurement = 0;
    int64_t deliveries = 0;

    json to_json() const;
};

struct routing_table_entry {
    std::string server_id;
    std::vector<std::string> endpoints;
    std::set<std::string> capabilities;
    server_health health;
    double load = 0.0;           // 0..100
    int64_t last_update = 0;
    int64_t registered_at = 0;
    server_performance performance;

    bool shares_capability(const routing_table_entry & other) const;

    json to_json() const;
    static routing_table_entry from_json(const json & j);
};

enum routing_update_type {
    ROUTING_UPDATE_ADD,
    ROUTING_UPDATE_UPDATE,
    ROUTING_UPDATE_REMOVE
};

std::string routing_update_type_to_str(routing_update_type type);

// add: entry required; update: set fields are applied; remove: server_id only
struct routing_table_update {
    std::string server_id;
    routing_update_type type = ROUTING_UPDATE_UPDATE;
    std::optional<routing_table_entry> entry;
    std::optional<std::vector<std::string>> endpoints;
    std::optional<std::set<std::string>> capabilities;
    std::optional<double> load;
    std::optional<health_status> status;

    json to_json() const;
};

// Per-server health/performance records, keyed by server id
class routing_table {
public:
    static constexpr double EMA_ALPHA = 0.1;

    routing_table() = default;

    // Returns false if the update referred to an unknown server (update/remove)
    bool apply(const routing_table_update & update);

    void upsert(const routing_table_entry & entry);
    bool remove(const std::string & server_id);
    bool contains(const std::string & server_id) const;
    size_t size() const;

    std::optional<routing_table_entry> get(const std::string & server_id) const;
    std::vector<routing_table_entry> snapshot() const;
    std::vector<std::string> server_ids() const;

    // EMA update of latency and success rate after a delivery
    void record_outcome(const std::string & server_id, bool success, double latency_ms);

    // Health probe result; std::nullopt means the probe failed
    std::optional<server_health> record_probe(const std::string & server_id,
                                              std::optional<double> response_time_ms);

    void set_load(const std::string & server_id, double load);

private:
    mutable std::shared_mutex mutex;
    std::map<std::string, routing_table_entry> entries;
};

} // namespace relay

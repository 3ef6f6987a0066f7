#include "routing_table.h"

#include <algorithm>
#include <mutex>

namespace relay {

std::string health_status_to_str(health_status status) {
    switch (status) {
        case HEALTH_STATUS_HEALTHY:   return "healthy";
        case HEALTH_STATUS_DEGRADED:  return "degraded";
        case HEALTH_STATUS_UNHEALTHY: return "unhealthy";
        default:                      return "healthy";
    }
}

health_status str_to_health_status(const std::string & str) {
    if (str == "degraded")  return HEALTH_STATUS_DEGRADED;
    if (str == "unhealthy") return HEALTH_STATUS_UNHEALTHY;
    return HEALTH_STATUS_HEALTHY;
}

std::string routing_update_type_to_str(routing_update_type type) {
    switch (type) {
        case ROUTING_UPDATE_ADD:    return "add";
        case ROUTING_UPDATE_UPDATE: return "update";
        case ROUTING_UPDATE_REMOVE: return "remove";
        default:                    return "update";
    }
}

json server_health::to_json() const {
    return json{
        {"status", health_status_to_str(status)},
        {"lastCheck", last_check},
        {"responseTime", response_time_ms},
        {"errorRate", error_rate},
        {"uptime", uptime}
    };
}

json server_performance::to_json() const {
    return json{
        {"averageLatency", average_latency_ms},
        {"throughput", throughput},
        {"errorRate", error_rate},
        {"successRate", success_rate},
        {"lastMeasurement", last_measurement}
    };
}

bool routing_table_entry::shares_capability(const routing_table_entry & other) const {
    for (const auto & cap : capabilities) {
        if (other.capabilities.count(cap) > 0) {
            return true;
        }
    }
    return false;
}

json routing_table_entry::to_json() const {
    return json{
        {"serverId", server_id},
        {"endpoints", endpoints},
        {"capabilities", capabilities},
        {"health", health.to_json()},
        {"load", load},
        {"lastUpdate", last_update},
        {"performance", performance.to_json()}
    };
}

routing_table_entry routing_table_entry::from_json(const json & j) {
    routing_table_entry entry;
    entry.server_id    = j.value("serverId", "");
    entry.endpoints    = j.value("endpoints", std::vector<std::string>());
    entry.capabilities = j.value("capabilities", std::set<std::string>());
    entry.load         = std::clamp(j.value("load", 0.0), 0.0, 100.0);
    if (j.contains("health")) {
        entry.health.status = str_to_health_status(j.at("health").value("status", "healthy"));
    }
    if (j.contains("performance")) {
        const json & p = j.at("performance");
        entry.performance.average_latency_ms = p.value("averageLatency", entry.performance.average_latency_ms);
        entry.performance.success_rate       = p.value("successRate", entry.performance.success_rate);
        entry.performance.error_rate         = p.value("errorRate", entry.performance.error_rate);
    }
    return entry;
}

json routing_table_update::to_json() const {
    json j{
        {"serverId", server_id},
        {"updateType", routing_update_type_to_str(type)}
    };
    if (entry) {
        j["data"] = entry->to_json();
    }
    return j;
}

bool routing_table::apply(const routing_table_update & update) {
    switch (update.type) {
        case ROUTING_UPDATE_REMOVE:
            return remove(update.server_id);
        case ROUTING_UPDATE_ADD:
            {
                routing_table_entry entry = update.entry.value_or(routing_table_entry());
                entry.server_id = update.server_id;
                if (update.endpoints)    entry.endpoints = *update.endpoints;
                if (update.capabilities) entry.capabilities = *update.capabilities;
                if (update.load)         entry.load = std::clamp(*update.load, 0.0, 100.0);
                if (update.status)       entry.health.status = *update.status;
                upsert(entry);
                return true;
            }
        case ROUTING_UPDATE_UPDATE:
        default:
            break;
    }

    std::unique_lock<std::shared_mutex> lock(mutex);
    auto it = entries.find(update.server_id);
    if (it == entries.end()) {
        if (!update.entry) {
            return false;
        }
        lock.unlock();
        routing_table_update as_add = update;
        as_add.type = ROUTING_UPDATE_ADD;
        return apply(as_add);
    }

    auto & entry = it->second;
    if (update.entry) {
        entry.endpoints    = update.entry->endpoints;
        entry.capabilities = update.entry->capabilities;
        entry.load         = std::clamp(update.entry->load, 0.0, 100.0);
    }
    if (update.endpoints)    entry.endpoints = *update.endpoints;
    if (update.capabilities) entry.capabilities = *update.capabilities;
    if (update.load)         entry.load = std::clamp(*update.load, 0.0, 100.0);
    if (update.status)       entry.health.status = *update.status;
    entry.last_update = get_timestamp_ms();
    return true;
}

void routing_table::upsert(const routing_table_entry & entry) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    routing_table_entry copy = entry;
    int64_t now = get_timestamp_ms();
    copy.last_update = now;
    if (copy.registered_at == 0) {
        auto it = entries.find(entry.server_id);
        copy.registered_at = it != entries.end() ? it->second.registered_at : now;
    }
    if (copy.performance.last_measurement == 0) {
        copy.performance.last_measurement = now;
    }
    entries[entry.server_id] = copy;
}

bool routing_table::remove(const std::string & server_id) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    return entries.erase(server_id) > 0;
}

bool routing_table::contains(const std::string & server_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return entries.count(server_id) > 0;
}

size_t routing_table::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return entries.size();
}

std::optional<routing_table_entry> routing_table::get(const std::string & server_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = entries.find(server_id);
    if (it == entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<routing_table_entry> routing_table::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    std::vector<routing_table_entry> out;
    out.reserve(entries.size());
    for (const auto & [id, entry] : entries) {
        out.push_back(entry);
    }
    return out;
}

std::vector<std::string> routing_table::server_ids() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    std::vector<std::string> out;
    out.reserve(entries.size());
    for (const auto & [id, entry] : entries) {
        out.push_back(id);
    }
    return out;
}

void routing_table::record_outcome(const std::string & server_id, bool success, double latency_ms) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    auto it = entries.find(server_id);
    if (it == entries.end()) {
        return;
    }

    auto & perf = it->second.performance;
    int64_t now = get_timestamp_ms();

    perf.average_latency_ms = EMA_ALPHA * latency_ms + (1.0 - EMA_ALPHA) * perf.average_latency_ms;
    perf.success_rate = EMA_ALPHA * (success ? 100.0 : 0.0) + (1.0 - EMA_ALPHA) * perf.success_rate;
    perf.error_rate = 100.0 - perf.success_rate;
    perf.deliveries++;

    double elapsed_s = (now - it->second.registered_at) / 1000.0;
    perf.throughput = elapsed_s > 0 ? perf.deliveries / elapsed_s : static_cast<double>(perf.deliveries);
    perf.last_measurement = now;
}

std::optional<server_health> routing_table::record_probe(const std::string & server_id,
                                                         std::optional<double> response_time_ms) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    auto it = entries.find(server_id);
    if (it == entries.end()) {
        return std::nullopt;
    }

    auto & entry = it->second;
    auto & health = entry.health;
    int64_t now = get_timestamp_ms();

    health.probes_total++;
    if (response_time_ms) {
        health.probes_ok++;
        health.response_time_ms = *response_time_ms;
        health.status = *response_time_ms < 1000.0 ? HEALTH_STATUS_HEALTHY : HEALTH_STATUS_DEGRADED;
        health.error_rate = entry.performance.error_rate;
    } else {
        health.status = HEALTH_STATUS_UNHEALTHY;
        health.error_rate = 100.0;
    }
    health.uptime = 100.0 * static_cast<double>(health.probes_ok) / static_cast<double>(health.probes_total);
    health.last_check = now;
    entry.last_update = now;

    return health;
}

void routing_table::set_load(const std::string & server_id, double load) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    auto it = entries.find(server_id);
    if (it != entries.end()) {
        it->second.load = std::clamp(load, 0.0, 100.0);
    }
}

} // namespace relay

#include "router.h"
#include "log.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace relay {

static constexpr int64_t STALE_ENTRY_MS = 5 * 60 * 1000;
static constexpr double OVERLOAD_FACTOR = 1.5;

static double elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

json routing_result::to_json() const {
    json j{
        {"success", success},
        {"targetServer", target_server},
        {"routingPath", routing_path},
        {"latency", latency_ms}
    };
    if (!error.empty()) {
        j["error"] = error;
    }
    if (!response.is_null()) {
        j["response"] = response;
    }
    return j;
}

json broadcast_result::to_json() const {
    return json{
        {"success", success},
        {"deliveredCount", delivered_count},
        {"failedTargets", failed_targets},
        {"averageLatency", average_latency_ms}
    };
}

json load_balancing_result::to_json() const {
    return json{
        {"selectedServer", selected_server},
        {"loadDistribution", load_distribution},
        {"balancingStrategy", routing_strategy_to_str(strategy)}
    };
}

json failover_result::to_json() const {
    json j{
        {"success", success},
        {"failedServer", failed_server},
        {"failoverTime", failover_time_ms}
    };
    if (!new_target.empty()) {
        j["newTarget"] = new_target;
    }
    return j;
}

json routing_optimization::to_json() const {
    return json{
        {"staleEntriesRefreshed", stale_entries_refreshed},
        {"overloadedServers", overloaded_servers},
        {"breakersHalfOpened", breakers_half_opened},
        {"averageLoad", average_load}
    };
}

json routing_metrics::to_json() const {
    return json{
        {"totalMessages", total_messages},
        {"routingLatency", routing_latency_ms},
        {"successRate", success_rate},
        {"failoverCount", failover_count},
        {"loadBalance", load_balance}
    };
}

static double priority_factor(message_priority priority) {
    switch (priority) {
        case MESSAGE_PRIORITY_CRITICAL:   return 0.8;
        case MESSAGE_PRIORITY_BACKGROUND: return 1.5;
        default:                          return 1.0;
    }
}

static double performance_score(const routing_table_entry & entry) {
    double latency_score = 1000.0 / std::max(entry.performance.average_latency_ms, 1.0);
    double success_score = entry.performance.success_rate;
    double load_score    = 100.0 - entry.load;
    double health_score  = entry.health.status == HEALTH_STATUS_HEALTHY  ? 100.0 :
                           entry.health.status == HEALTH_STATUS_DEGRADED ?  50.0 : 0.0;
    return (latency_score + success_score + load_score + health_score) / 4.0;
}

struct message_router::impl {
    relay_config config;
    mutable std::mutex config_mutex;

    std::shared_ptr<message_transport> transport;
    routing_table table;
    circuit_breaker_registry breakers;

    routing_metrics metrics;
    mutable std::mutex metrics_mutex;

    std::vector<routing_table_listener> listeners;
    event_callback on_event;
    std::mutex callback_mutex;

    std::atomic<bool> running{false};
    std::thread health_thread;
    std::mutex loop_mutex;
    std::condition_variable loop_cv;

    impl(const relay_config & cfg, std::shared_ptr<message_transport> t)
        : config(cfg),
          transport(std::move(t)),
          breakers(cfg.performance.circuit_breaker_threshold, cfg.performance.circuit_breaker_cooldown_ms) {}

    relay_config get_config() const {
        std::lock_guard<std::mutex> lock(config_mutex);
        return config;
    }

    void emit(const std::string & event, const json & data) {
        event_callback cb;
        {
            std::lock_guard<std::mutex> lock(callback_mutex);
            cb = on_event;
        }
        if (cb) {
            cb(event, data);
        }
    }

    void notify_listeners(const std::vector<routing_table_update> & updates) {
        std::vector<routing_table_listener> copy;
        {
            std::lock_guard<std::mutex> lock(callback_mutex);
            copy = listeners;
        }
        for (const auto & listener : copy) {
            listener(updates);
        }
    }

    // Healthy server other than `failed` sharing a capability, breaker not open
    std::optional<std::string> find_alternative(const std::string & failed) {
        auto failed_entry = table.get(failed);
        if (!failed_entry) {
            return std::nullopt;
        }
        for (const auto & entry : table.snapshot()) {
            if (entry.server_id == failed) {
                continue;
            }
            if (entry.health.status != HEALTH_STATUS_HEALTHY) {
                continue;
            }
            if (!failed_entry->shares_capability(entry)) {
                continue;
            }
            if (breakers.is_open(entry.server_id)) {
                continue;
            }
            return entry.server_id;
        }
        return std::nullopt;
    }

    route compute_route(const std::string & target, message_priority priority, int depth) {
        auto entry = table.get(target);
        if (!entry) {
            throw std::runtime_error("No routing entry found for server: " + target);
        }

        if (entry->health.status == HEALTH_STATUS_UNHEALTHY) {
            auto alternative = depth == 0 ? find_alternative(target) : std::nullopt;
            if (!alternative) {
                throw std::runtime_error("Target server " + target + " is unhealthy and no alternative found");
            }
            LOG_DBG("%s is unhealthy, routing to %s\n", target.c_str(), alternative->c_str());
            return compute_route(*alternative, priority, depth + 1);
        }

        route r;
        r.target_server = target;
        r.path = {target};
        r.estimated_latency_ms = entry->performance.average_latency_ms * priority_factor(priority)
                               * (1.0 + entry->load / 100.0);

        r.reliability = entry->performance.success_rate / 100.0;
        if (entry->health.status == HEALTH_STATUS_DEGRADED) {
            r.reliability *= 0.8;
        }

        r.cost = entry->performance.average_latency_ms + entry->load * 10.0
               + static_cast<int>(priority) * 5.0;
        return r;
    }

    void record_routing(double latency, bool success, const std::string & target) {
        std::lock_guard<std::mutex> lock(metrics_mutex);
        int64_t n = std::max<int64_t>(metrics.total_messages, 1);
        metrics.routing_latency_ms = n == 1 ? latency : (metrics.routing_latency_ms + latency) / 2.0;
        metrics.success_rate = (metrics.success_rate * (n - 1) + (success ? 100.0 : 0.0)) / n;
        if (success && !target.empty()) {
            metrics.load_balance[target]++;
        }
    }

    std::optional<server_health> check_health(const std::string & server_id) {
        auto before = table.get(server_id);
        if (!before) {
            return std::nullopt;
        }

        std::optional<double> response_time;
        try {
            response_time = transport->probe(server_id);
        } catch (const std::exception & e) {
            LOG_WRN("health probe for %s failed: %s\n", server_id.c_str(), e.what());
            response_time = std::nullopt;
        }

        auto health = table.record_probe(server_id, response_time);
        if (!health) {
            return std::nullopt;
        }

        if (health->status != before->health.status) {
            LOG_INF("server %s is now %s\n", server_id.c_str(), health_status_to_str(health->status).c_str());
            emit("server_health_changed", json{
                {"serverId", server_id},
                {"previous", health_status_to_str(before->health.status)},
                {"health", health->to_json()}
            });
        }
        return health;
    }

    void check_all() {
        for (const auto & id : table.server_ids()) {
            check_health(id);
        }
    }

    void health_loop() {
        while (running.load()) {
            int64_t interval = get_config().routing.health_check_interval_ms;
            {
                std::unique_lock<std::mutex> lock(loop_mutex);
                loop_cv.wait_for(lock, std::chrono::milliseconds(interval), [this] { return !running.load(); });
            }
            if (!running.load()) {
                break;
            }
            check_all();
        }
    }
};

message_router::message_router(const relay_config & config, std::shared_ptr<message_transport> transport) {
    if (!transport) {
        throw std::invalid_argument("message_router requires a transport");
    }
    pimpl = std::make_unique<impl>(config, std::move(transport));
}

message_router::~message_router() {
    stop();
}

void message_router::start() {
    if (pimpl->running.exchange(true)) {
        return;
    }
    pimpl->health_thread = std::thread(&impl::health_loop, pimpl.get());
    LOG_INF("message router started (strategy: %s)\n",
            routing_strategy_to_str(pimpl->get_config().routing.strategy).c_str());
}

void message_router::stop() {
    if (!pimpl->running.exchange(false)) {
        return;
    }
    pimpl->loop_cv.notify_all();
    if (pimpl->health_thread.joinable()) {
        pimpl->health_thread.join();
    }
    LOG_INF("message router stopped\n");
}

bool message_router::is_running() const {
    return pimpl->running.load();
}

routing_result message_router::route_message(const base_message & message) {
    auto start = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(pimpl->metrics_mutex);
        pimpl->metrics.total_messages++;
    }

    routing_result result;
    try {
        route r = calculate_optimal_route(message);

        if (pimpl->breakers.is_open(r.target_server)) {
            bool failover_enabled = pimpl->get_config().routing.enable_failover;
            failover_result fo;
            if (failover_enabled) {
                fo = handle_server_failure(r.target_server);
            }
            if (!fo.success) {
                throw std::runtime_error("circuit breaker open for " + r.target_server + " and no failover available");
            }
            LOG_DBG("circuit open for %s, failing over to %s\n", r.target_server.c_str(), fo.new_target.c_str());
            r.path.push_back(fo.new_target);
            r.target_server = fo.new_target;
        }

        delivery_result delivery;
        try {
            delivery = pimpl->transport->deliver(r.target_server, message);
        } catch (const std::exception & e) {
            delivery = delivery_result::fail(e.what());
        }

        double latency = elapsed_ms(start);
        pimpl->table.record_outcome(r.target_server, delivery.success, latency);
        if (delivery.success) {
            pimpl->breakers.record_success(r.target_server);
        } else {
            pimpl->breakers.record_failure(r.target_server);
            LOG_WRN("delivery of %s to %s failed: %s\n",
                    message.header.message_id.c_str(), r.target_server.c_str(), delivery.error.c_str());
        }
        pimpl->record_routing(latency, delivery.success, r.target_server);

        result.success = delivery.success;
        result.target_server = r.target_server;
        result.routing_path = r.path;
        result.latency_ms = latency;
        result.error = delivery.error;
        result.response = delivery.response;
        LOG_DBG("routed %s to %s in %.2f ms\n", message.header.message_id.c_str(),
                r.target_server.c_str(), latency);
    } catch (const std::exception & e) {
        double latency = elapsed_ms(start);
        pimpl->record_routing(latency, false, "");
        result.success = false;
        result.latency_ms = latency;
        result.error = e.what();
        LOG_WRN("routing %s failed: %s\n", message.header.message_id.c_str(), e.what());
    }
    return result;
}

broadcast_result message_router::broadcast_message(const base_message & message,
                                                   const std::optional<std::vector<std::string>> & targets) {
    auto start = std::chrono::steady_clock::now();
    std::vector<std::string> target_servers = targets ? *targets : pimpl->table.server_ids();

    broadcast_result result;
    if (target_servers.empty()) {
        return result;
    }

    std::vector<std::future<routing_result>> futures;
    futures.reserve(target_servers.size());
    for (const auto & target : target_servers) {
        base_message copy = message;
        copy.header.target = target;
        futures.push_back(std::async(std::launch::async, [this, copy]() {
            return route_message(copy);
        }));
    }

    for (size_t i = 0; i < futures.size(); i++) {
        routing_result r = futures[i].get();
        if (r.success) {
            result.delivered_count++;
        } else {
            result.failed_targets.push_back(target_servers[i]);
        }
    }

    result.success = result.delivered_count > 0;
    result.average_latency_ms = elapsed_ms(start) / static_cast<double>(target_servers.size());
    return result;
}

route message_router::calculate_optimal_route(const base_message & message) {
    return pimpl->compute_route(message.header.target, message.header.priority, 0);
}

std::optional<std::string> message_router::select_target_server(const selection_criteria & criteria) {
    std::vector<routing_table_entry> candidates;
    for (const auto & entry : pimpl->table.snapshot()) {
        if (entry.health.status == HEALTH_STATUS_UNHEALTHY) {
            continue;
        }
        if (std::find(criteria.exclude_servers.begin(), criteria.exclude_servers.end(),
                      entry.server_id) != criteria.exclude_servers.end()) {
            continue;
        }
        if (pimpl->breakers.is_open(entry.server_id)) {
            continue;
        }
        bool has_all = std::all_of(criteria.required_capabilities.begin(), criteria.required_capabilities.end(),
                                   [&entry](const std::string & cap) { return entry.capabilities.count(cap) > 0; });
        if (has_all) {
            candidates.push_back(entry);
        }
    }

    if (candidates.empty()) {
        return std::nullopt;
    }

    const routing_table_entry * best = &candidates[0];
    for (const auto & entry : candidates) {
        if (criteria.prioritize_latency) {
            if (entry.performance.average_latency_ms < best->performance.average_latency_ms) best = &entry;
        } else if (criteria.prioritize_reliability) {
            if (entry.performance.success_rate > best->performance.success_rate) best = &entry;
        } else {
            if (entry.load < best->load) best = &entry;
        }
    }
    return best->server_id;
}

std::optional<load_balancing_result> message_router::balance_load(const base_message & message) {
    (void) message;

    std::vector<routing_table_entry> available;
    for (const auto & entry : pimpl->table.snapshot()) {
        if (entry.health.status != HEALTH_STATUS_UNHEALTHY) {
            available.push_back(entry);
        }
    }
    if (available.empty()) {
        return std::nullopt;
    }

    load_balancing_result result;
    result.strategy = pimpl->get_config().routing.strategy;

    const routing_table_entry * selected = &available[0];
    switch (result.strategy) {
        case ROUTING_STRATEGY_ROUND_ROBIN:
            {
                int64_t total;
                {
                    std::lock_guard<std::mutex> lock(pimpl->metrics_mutex);
                    total = pimpl->metrics.total_messages;
                }
                selected = &available[static_cast<size_t>(total) % available.size()];
            } break;
        case ROUTING_STRATEGY_LEAST_CONNECTIONS:
            for (const auto & entry : available) {
                if (entry.load < selected->load) selected = &entry;
            }
            break;
        case ROUTING_STRATEGY_PERFORMANCE:
        default:
            for (const auto & entry : available) {
                if (performance_score(entry) > performance_score(*selected)) selected = &entry;
            }
            break;
    }

    result.selected_server = selected->server_id;
    for (const auto & entry : available) {
        result.load_distribution[entry.server_id] = entry.load;
    }
    return result;
}

std::optional<server_health> message_router::check_server_health(const std::string & server_id) {
    return pimpl->check_health(server_id);
}

void message_router::check_all_servers() {
    pimpl->check_all();
}

failover_result message_router::handle_server_failure(const std::string & server_id) {
    auto start = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(pimpl->metrics_mutex);
        pimpl->metrics.failover_count++;
    }

    failover_result result;
    result.failed_server = server_id;

    auto alternative = pimpl->find_alternative(server_id);
    if (alternative) {
        pimpl->breakers.record_failure(server_id);
        result.success = true;
        result.new_target = *alternative;
        LOG_INF("failover %s -> %s\n", server_id.c_str(), alternative->c_str());
    } else {
        LOG_WRN("no failover target for %s\n", server_id.c_str());
    }
    result.failover_time_ms = elapsed_ms(start);

    pimpl->emit("server_failover", result.to_json());
    return result;
}

void message_router::update_routing_table(const std::vector<routing_table_update> & updates) {
    std::vector<routing_table_update> applied;
    for (const auto & update : updates) {
        if (pimpl->table.apply(update)) {
            if (update.type == ROUTING_UPDATE_REMOVE) {
                pimpl->breakers.remove(update.server_id);
            } else {
                pimpl->breakers.ensure(update.server_id);
            }
            applied.push_back(update);
        } else {
            LOG_WRN("routing table %s for unknown server %s ignored\n",
                    routing_update_type_to_str(update.type).c_str(), update.server_id.c_str());
        }
    }

    if (applied.empty()) {
        return;
    }

    pimpl->notify_listeners(applied);

    json data = json::array();
    for (const auto & update : applied) {
        data.push_back(update.to_json());
    }
    pimpl->emit("routing_table_updated", data);
}

void message_router::add_routing_table_listener(routing_table_listener listener) {
    std::lock_guard<std::mutex> lock(pimpl->callback_mutex);
    pimpl->listeners.push_back(std::move(listener));
}

routing_optimization message_router::optimize_routing() {
    routing_optimization result;
    int64_t now = get_timestamp_ms();

    for (const auto & entry : pimpl->table.snapshot()) {
        if (now - entry.last_update > STALE_ENTRY_MS) {
            if (pimpl->check_health(entry.server_id)) {
                result.stale_entries_refreshed++;
            }
        }
    }

    auto entries = pimpl->table.snapshot();
    if (!entries.empty()) {
        double total = 0.0;
        for (const auto & entry : entries) {
            total += entry.load;
        }
        result.average_load = total / entries.size();
        for (const auto & entry : entries) {
            if (result.average_load > 0 && entry.load > result.average_load * OVERLOAD_FACTOR) {
                result.overloaded_servers.push_back(entry.server_id);
            }
        }
    }

    result.breakers_half_opened = pimpl->breakers.refresh();

    LOG_DBG("routing optimized: %d stale, %zu overloaded, %d breakers half-open\n",
            result.stale_entries_refreshed, result.overloaded_servers.size(), result.breakers_half_opened);
    return result;
}

routing_metrics message_router::get_routing_metrics() const {
    std::lock_guard<std::mutex> lock(pimpl->metrics_mutex);
    return pimpl->metrics;
}

circuit_state message_router::get_circuit_state(const std::string & server_id) const {
    return pimpl->breakers.get_state(server_id);
}

circuit_breaker::stats message_router::get_circuit_stats(const std::string & server_id) const {
    return pimpl->breakers.get_stats(server_id);
}

std::optional<routing_table_entry> message_router::get_routing_entry(const std::string & server_id) const {
    return pimpl->table.get(server_id);
}

std::vector<routing_table_entry> message_router::get_routing_entries() const {
    return pimpl->table.snapshot();
}

void message_router::update_config(const relay_config & config) {
    {
        std::lock_guard<std::mutex> lock(pimpl->config_mutex);
        pimpl->config = config;
    }
    pimpl->breakers.configure(config.performance.circuit_breaker_threshold,
                              config.performance.circuit_breaker_cooldown_ms);
    pimpl->loop_cv.notify_all();
}

void message_router::set_event_callback(event_callback callback) {
    std::lock_guard<std::mutex> lock(pimpl->callback_mutex);
    pimpl->on_event = std::move(callback);
}

} // namespace relay

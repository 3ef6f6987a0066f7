#pragma once

#include "config.h"
#include "failure.h"
#include "message.h"
#include "routing_table.h"
#include "transport.h"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace relay {

struct routing_result {
    bool success = false;
    std::string target_server;
    std::vector<std::string> routing_path;
    double latency_ms = 0.0;
    std::string error;
    json response;

    json to_json() const;
};

struct broadcast_result {
    bool success = false;
    int delivered_count = 0;
    std::vector<std::string> failed_targets;
    double average_latency_ms = 0.0;

    json to_json() const;
};

struct route {
    std::string target_server;
    std::vector<std::string> path;
    double estimated_latency_ms = 0.0;
    double reliability = 0.0;    // 0..1
    double cost = 0.0;
};

struct selection_criteria {
    std::vector<std::string> required_capabilities;
    std::vector<std::string> exclude_servers;
    bool prioritize_latency = false;
    bool prioritize_reliability = false;
};

struct load_balancing_result {
    std::string selected_server;
    std::map<std::string, double> load_distribution;
    routing_strategy strategy = ROUTING_STRATEGY_PERFORMANCE;

    json to_json() const;
};

struct failover_result {
    bool success = false;
    std::string new_target;
    std::string failed_server;
    double failover_time_ms = 0.0;

    json to_json() const;
};

struct routing_optimization {
    int stale_entries_refreshed = 0;
    std::vector<std::string> overloaded_servers;
    int breakers_half_opened = 0;
    double average_load = 0.0;

    json to_json() const;
};

struct routing_metrics {
    int64_t total_messages = 0;
    double routing_latency_ms = 0.0;   // smoothed
    double success_rate = 100.0;       // percent over all routed messages
    int64_t failover_count = 0;
    std::map<std::string, int64_t> load_balance;  // server_id -> successful deliveries

    json to_json() const;
};

// Routes messages to servers, balancing load and isolating failing targets.
// Routing failures are reported through routing_result, never thrown.
class message_router {
public:
    using routing_table_listener = std::function<void(const std::vector<routing_table_update> &)>;
    using event_callback = std::function<void(const std::string & event, const json & data)>;

    message_router(const relay_config & config, std::shared_ptr<message_transport> transport);
    ~message_router();

    message_router(const message_router &) = delete;
    message_router & operator=(const message_router &) = delete;

    // Periodic health checks every routing.health_check_interval_ms
    void start();
    void stop();
    bool is_running() const;

    routing_result route_message(const base_message & message);

    // std::nullopt targets = every server in the routing table
    broadcast_result broadcast_message(const base_message & message,
                                       const std::optional<std::vector<std::string>> & targets = std::nullopt);

    // Throws std::runtime_error if no usable route exists
    route calculate_optimal_route(const base_message & message);

    std::optional<std::string> select_target_server(const selection_criteria & criteria);

    // Picks a server with the configured strategy; std::nullopt if none is available
    std::optional<load_balancing_result> balance_load(const base_message & message);

    // Probe one server and record the outcome; std::nullopt for unknown servers
    std::optional<server_health> check_server_health(const std::string & server_id);
    void check_all_servers();

    failover_result handle_server_failure(const std::string & server_id);

    void update_routing_table(const std::vector<routing_table_update> & updates);
    void add_routing_table_listener(routing_table_listener listener);

    routing_optimization optimize_routing();

    routing_metrics get_routing_metrics() const;
    circuit_state get_circuit_state(const std::string & server_id) const;
    circuit_breaker::stats get_circuit_stats(const std::string & server_id) const;
    std::optional<routing_table_entry> get_routing_entry(const std::string & server_id) const;
    std::vector<routing_table_entry> get_routing_entries() const;

    // Applies strategy, failover flag, breaker settings and health interval
    void update_config(const relay_config & config);

    void set_event_callback(event_callback callback);

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace relay

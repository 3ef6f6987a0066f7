#pragma once

#include "log.h"
#include "message.h"

#include <cstdint>
#include <string>

namespace relay {

enum routing_strategy {
    ROUTING_STRATEGY_PERFORMANCE,
    ROUTING_STRATEGY_ROUND_ROBIN,
    ROUTING_STRATEGY_LEAST_CONNECTIONS
};

std::string routing_strategy_to_str(routing_strategy strategy);
// Unknown names throw std::invalid_argument
routing_strategy str_to_routing_strategy(const std::string & str);

struct performance_config {
    double max_latency_ms           = 50.0;
    double throughput_target        = 10000.0;  // messages / s
    double delivery_reliability     = 99.9;     // percent
    int concurrent_connections      = 100;
    int64_t message_timeout_ms      = 5000;
    int retry_attempts              = 3;
    int circuit_breaker_threshold   = 5;
    int64_t circuit_breaker_cooldown_ms = 30000;
};

struct routing_config {
    bool enable_failover            = true;
    routing_strategy strategy       = ROUTING_STRATEGY_PERFORMANCE;
    int64_t health_check_interval_ms = 30000;
};

struct orchestration_config {
    bool enable_wave_coordination          = false;
    bool enable_persona_chains             = false;
    bool enable_quality_gate_coordination  = false;
    bool enable_sub_agent_delegation       = true;
    int max_concurrent_sub_agents          = 15;
    int max_concurrent_tasks               = 1000;
    int64_t task_timeout_ms                = 300000;
    int64_t heartbeat_interval_ms          = 30000;
    int64_t poll_interval_ms               = 1000;
    int64_t task_retention_ms              = 300000;  // finished assign_task records are kept this long
};

struct relay_config {
    performance_config performance;
    routing_config routing;
    orchestration_config orchestration;
    relay_log_level log_level = RELAY_LOG_LEVEL_INFO;

    static relay_config defaults() { return relay_config(); }

    // Throws std::invalid_argument describing the first offending field
    void validate() const;

    json to_json() const;

    // Missing keys keep their defaults; throws on malformed values
    static relay_config from_json(const json & j);

    // Parse a JSON file; throws std::runtime_error if it cannot be read
    static relay_config load(const std::string & path);
};

} // namespace relay

#include "config.h"

#include <fstream>
#include <stdexcept>

namespace relay {

std::string routing_strategy_to_str(routing_strategy strategy) {
    switch (strategy) {
        case ROUTING_STRATEGY_PERFORMANCE:       return "performance";
        case ROUTING_STRATEGY_ROUND_ROBIN:       return "round-robin";
        case ROUTING_STRATEGY_LEAST_CONNECTIONS: return "least-connections";
        default:                                 return "performance";
    }
}

routing_strategy str_to_routing_strategy(const std::string & str) {
    if (str == "performance")       return ROUTING_STRATEGY_PERFORMANCE;
    if (str == "round-robin")       return ROUTING_STRATEGY_ROUND_ROBIN;
    if (str == "least-connections") return ROUTING_STRATEGY_LEAST_CONNECTIONS;
    throw std::invalid_argument("unknown routing strategy: " + str);
}

void relay_config::validate() const {
    if (performance.max_latency_ms <= 0) {
        throw std::invalid_argument("maxLatency must be positive");
    }
    if (performance.throughput_target <= 0) {
        throw std::invalid_argument("throughputTarget must be positive");
    }
    if (performance.delivery_reliability < 0 || performance.delivery_reliability > 100) {
        throw std::invalid_argument("deliveryReliability must be between 0 and 100");
    }
    if (performance.concurrent_connections <= 0) {
        throw std::invalid_argument("concurrentConnections must be positive");
    }
    if (performance.message_timeout_ms <= 0) {
        throw std::invalid_argument("messageTimeoutDefault must be positive");
    }
    if (performance.retry_attempts < 0) {
        throw std::invalid_argument("retryAttempts must not be negative");
    }
    if (performance.circuit_breaker_threshold <= 0) {
        throw std::invalid_argument("circuitBreakerThreshold must be positive");
    }
    if (performance.circuit_breaker_cooldown_ms < 0) {
        throw std::invalid_argument("circuitBreakerCooldown must not be negative");
    }
    if (routing.health_check_interval_ms <= 0) {
        throw std::invalid_argument("healthCheckInterval must be positive");
    }
    if (orchestration.max_concurrent_sub_agents <= 0) {
        throw std::invalid_argument("maxConcurrentSubAgents must be positive");
    }
    if (orchestration.max_concurrent_tasks <= 0) {
        throw std::invalid_argument("maxConcurrentTasks must be positive");
    }
    if (orchestration.task_timeout_ms <= 0) {
        throw std::invalid_argument("taskTimeout must be positive");
    }
    if (orchestration.heartbeat_interval_ms <= 0) {
        throw std::invalid_argument("heartbeatInterval must be positive");
    }
    if (orchestration.poll_interval_ms <= 0) {
        throw std::invalid_argument("pollInterval must be positive");
    }
    if (orchestration.task_retention_ms < 0) {
        throw std::invalid_argument("taskRetention must not be negative");
    }
}

json relay_config::to_json() const {
    return json{
        {"performance", {
            {"maxLatency", performance.max_latency_ms},
            {"throughputTarget", performance.throughput_target},
            {"deliveryReliability", performance.delivery_reliability},
            {"concurrentConnections", performance.concurrent_connections},
            {"messageTimeoutDefault", performance.message_timeout_ms},
            {"retryAttempts", performance.retry_attempts},
            {"circuitBreakerThreshold", performance.circuit_breaker_threshold},
            {"circuitBreakerCooldown", performance.circuit_breaker_cooldown_ms}
        }},
        {"routing", {
            {"enableFailover", routing.enable_failover},
            {"routingStrategy", routing_strategy_to_str(routing.strategy)},
            {"healthCheckInterval", routing.health_check_interval_ms}
        }},
        {"orchestration", {
            {"enableWaveCoordination", orchestration.enable_wave_coordination},
            {"enablePersonaChains", orchestration.enable_persona_chains},
            {"enableQualityGateCoordination", orchestration.enable_quality_gate_coordination},
            {"enableSubAgentDelegation", orchestration.enable_sub_agent_delegation},
            {"maxConcurrentSubAgents", orchestration.max_concurrent_sub_agents},
            {"maxConcurrentTasks", orchestration.max_concurrent_tasks},
            {"taskTimeout", orchestration.task_timeout_ms},
            {"heartbeatInterval", orchestration.heartbeat_interval_ms},
            {"pollInterval", orchestration.poll_interval_ms},
            {"taskRetention", orchestration.task_retention_ms}
        }},
        {"logLevel", relay_log_level_to_string(log_level)}
    };
}

relay_config relay_config::from_json(const json & j) {
    relay_config cfg;

    if (j.contains("performance")) {
        const json & p = j.at("performance");
        auto & perf = cfg.performance;
        perf.max_latency_ms              = p.value("maxLatency", perf.max_latency_ms);
        perf.throughput_target           = p.value("throughputTarget", perf.throughput_target);
        perf.delivery_reliability        = p.value("deliveryReliability", perf.delivery_reliability);
        perf.concurrent_connections      = p.value("concurrentConnections", perf.concurrent_connections);
        perf.message_timeout_ms          = p.value("messageTimeoutDefault", perf.message_timeout_ms);
        perf.retry_attempts              = p.value("retryAttempts", perf.retry_attempts);
        perf.circuit_breaker_threshold   = p.value("circuitBreakerThreshold", perf.circuit_breaker_threshold);
        perf.circuit_breaker_cooldown_ms = p.value("circuitBreakerCooldown", perf.circuit_breaker_cooldown_ms);
    }

    if (j.contains("routing")) {
        const json & r = j.at("routing");
        cfg.routing.enable_failover          = r.value("enableFailover", cfg.routing.enable_failover);
        cfg.routing.health_check_interval_ms = r.value("healthCheckInterval", cfg.routing.health_check_interval_ms);
        if (r.contains("routingStrategy")) {
            cfg.routing.strategy = str_to_routing_strategy(r.at("routingStrategy").get<std::string>());
        }
    }

    if (j.contains("orchestration")) {
        const json & o = j.at("orchestration");
        auto & orch = cfg.orchestration;
        orch.enable_wave_coordination         = o.value("enableWaveCoordination", orch.enable_wave_coordination);
        orch.enable_persona_chains            = o.value("enablePersonaChains", orch.enable_persona_chains);
        orch.enable_quality_gate_coordination = o.value("enableQualityGateCoordination", orch.enable_quality_gate_coordination);
        orch.enable_sub_agent_delegation      = o.value("enableSubAgentDelegation", orch.enable_sub_agent_delegation);
        orch.max_concurrent_sub_agents        = o.value("maxConcurrentSubAgents", orch.max_concurrent_sub_agents);
        orch.max_concurrent_tasks             = o.value("maxConcurrentTasks", orch.max_concurrent_tasks);
        orch.task_timeout_ms                  = o.value("taskTimeout", orch.task_timeout_ms);
        orch.heartbeat_interval_ms            = o.value("heartbeatInterval", orch.heartbeat_interval_ms);
        orch.poll_interval_ms                 = o.value("pollInterval", orch.poll_interval_ms);
        orch.task_retention_ms                = o.value("taskRetention", orch.task_retention_ms);
    }

    if (j.contains("logLevel")) {
        cfg.log_level = relay_log_level_from_string(j.at("logLevel").get<std::string>());
    }

    return cfg;
}

relay_config relay_config::load(const std::string & path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error & e) {
        throw std::runtime_error("failed to parse config file " + path + ": " + e.what());
    }

    return from_json(j);
}

} // namespace relay

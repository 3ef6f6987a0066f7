#include "comm_service.h"
#include "log.h"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <stdexcept>

namespace relay {

json component_health::to_json() const {
    json j{
        {"component", component},
        {"status", health_status_to_str(status)},
        {"details", details}
    };
    if (!metrics.is_null()) {
        j["metrics"] = metrics;
    }
    return j;
}

json system_health::to_json() const {
    json list = json::array();
    for (const auto & c : components) {
        list.push_back(c.to_json());
    }
    return json{
        {"overall", health_status_to_str(overall)},
        {"components", list},
        {"timestamp", timestamp}
    };
}

struct communication_service::impl {
    relay_config config;
    mutable std::mutex config_mutex;

    message_router router;
    sub_agent_coordinator coordinator;
    performance_monitor monitor;

    std::map<message_type, coordinator_handler> handlers;
    event_callback on_event;
    mutable std::mutex callback_mutex;

    std::atomic<bool> running{false};

    impl(const relay_config & cfg, std::shared_ptr<message_transport> transport)
        : config(cfg),
          router(cfg, std::move(transport)),
          coordinator(router, cfg),
          monitor(static_cast<double>(cfg.performance.max_latency_ms)) {}

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

    relay_config current_config() const {
        std::lock_guard<std::mutex> lock(config_mutex);
        return config;
    }

    void require_running() const {
        if (!running.load()) {
            throw std::runtime_error("Communication service is not running");
        }
    }

    void require_delegation() const {
        if (!current_config().orchestration.enable_sub_agent_delegation) {
            throw std::runtime_error("Sub-agent coordination is not enabled");
        }
    }

    json dispatch_external(const base_message & message) {
        const auto cfg = current_config();
        const auto type = message.header.type;

        bool enabled = false;
        const char * label = "";
        switch (type) {
            case MESSAGE_TYPE_WAVE_COORDINATION:
                enabled = cfg.orchestration.enable_wave_coordination;
                label = "Wave coordination";
                break;
            case MESSAGE_TYPE_PERSONA_CHAIN:
                enabled = cfg.orchestration.enable_persona_chains;
                label = "Persona chain coordination";
                break;
            case MESSAGE_TYPE_QUALITY_GATE:
                enabled = cfg.orchestration.enable_quality_gate_coordination;
                label = "Quality gate coordination";
                break;
            default:
                break;
        }
        if (!enabled) {
            throw std::runtime_error(std::string(label) + " is not enabled");
        }

        coordinator_handler handler;
        {
            std::lock_guard<std::mutex> lock(callback_mutex);
            auto it = handlers.find(type);
            if (it != handlers.end()) {
                handler = it->second;
            }
        }
        if (!handler) {
            throw std::runtime_error("no handler registered for " + message_type_to_str(type) + " messages");
        }
        return handler(message);
    }

    json dispatch_sub_agent(const base_message & message) {
        require_delegation();

        const std::string & op = message.header.operation;
        const json & data = message.payload.data;

        if (op == "delegate_tasks") {
            return coordinator.delegate_tasks(delegation_request::from_json(data)).to_json();
        }
        if (op == "assign_task") {
            return coordinator.assign_task(sub_agent_task::from_json(data)).to_json();
        }
        if (op == "register_agent") {
            sub_agent agent = sub_agent::from_json(data);
            coordinator.register_agent(agent);
            return json{{"success", true}, {"agentId", agent.agent_id}};
        }
        if (op == "unregister_agent") {
            return json{{"success", coordinator.unregister_agent(data.value("agentId", ""))}};
        }
        if (op == "agent_heartbeat") {
            return json{{"success", coordinator.agent_heartbeat(data.value("agentId", ""))}};
        }
        if (op == "task_result") {
            std::string task_id = data.value("taskId", "");
            bool accepted;
            if (data.value("success", true)) {
                std::optional<task_metrics> metrics;
                if (data.contains("metrics") && data.at("metrics").is_object()) {
                    metrics = task_metrics::from_json(data.at("metrics"));
                }
                accepted = coordinator.complete_task(task_id, data.contains("result") ? data.at("result") : json(), metrics);
            } else {
                accepted = coordinator.fail_task(task_id, data.value("error", "task failed"));
            }
            return json{{"success", accepted}, {"taskId", task_id}};
        }

        return route(message);
    }

    json route(const base_message & message) {
        routing_result result = router.route_message(message);
        if (!result.success) {
            monitor.record_error("delivery_failure", message.header.target, result.error);
        }
        return result.to_json();
    }

    json dispatch(const base_message & message) {
        switch (message.header.type) {
            case MESSAGE_TYPE_SUB_AGENT_DELEGATION:
                return dispatch_sub_agent(message);
            case MESSAGE_TYPE_WAVE_COORDINATION:
            case MESSAGE_TYPE_PERSONA_CHAIN:
            case MESSAGE_TYPE_QUALITY_GATE:
                return dispatch_external(message);
            case MESSAGE_TYPE_BROADCAST:
                return router.broadcast_message(message).to_json();
            default:
                return route(message);
        }
    }
};

communication_service::communication_service(const relay_config & config, std::shared_ptr<message_transport> transport)
    : pimpl(std::make_unique<impl>(config, std::move(transport))) {
    auto forward = [this](const std::string & event, const json & data) {
        pimpl->emit(event, data);
    };
    pimpl->router.set_event_callback(forward);
    pimpl->coordinator.set_event_callback(forward);
}

communication_service::~communication_service() {
    stop();
    // the loops may have been started directly; they call back into impl
    pimpl->coordinator.stop();
    pimpl->router.stop();
}

void communication_service::start() {
    if (pimpl->running.load()) {
        throw std::runtime_error("Communication service is already running");
    }

    const auto cfg = pimpl->current_config();
    cfg.validate();
    relay_log_set_level(cfg.log_level);

    pimpl->router.start();
    if (cfg.orchestration.enable_sub_agent_delegation) {
        pimpl->coordinator.start();
    }
    pimpl->running.store(true);

    LOG_INF("communication service started (strategy: %s, failover: %s)\n",
            routing_strategy_to_str(cfg.routing.strategy).c_str(),
            cfg.routing.enable_failover ? "on" : "off");
    pimpl->emit("service_started", json{{"timestamp", get_timestamp_ms()}, {"config", cfg.to_json()}});
}

void communication_service::stop() {
    if (!pimpl->running.exchange(false)) {
        return;
    }
    pimpl->coordinator.stop();
    pimpl->router.stop();

    LOG_INF("communication service stopped\n");
    pimpl->emit("service_stopped", json{{"timestamp", get_timestamp_ms()}});
}

bool communication_service::is_running() const {
    return pimpl->running.load();
}

json communication_service::send_message(const base_message & message) {
    pimpl->require_running();

    auto start = std::chrono::steady_clock::now();
    LOG_DBG("dispatching %s message %s (%s -> %s)\n",
            message_type_to_str(message.header.type).c_str(), message.header.message_id.c_str(),
            message.header.source.c_str(), message.header.target.c_str());

    try {
        json result = pimpl->dispatch(message);
        double latency = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
        pimpl->monitor.record_latency(latency, message);
        return result;
    } catch (const std::exception & e) {
        pimpl->monitor.record_error("message_routing_error", message.header.source, e.what());
        LOG_WRN("dispatch of %s failed: %s\n", message.header.message_id.c_str(), e.what());
        throw;
    }
}

broadcast_result communication_service::broadcast_message(const base_message & message,
                                                          const std::optional<std::vector<std::string>> & targets) {
    pimpl->require_running();
    return pimpl->router.broadcast_message(message, targets);
}

delegation_result communication_service::delegate_tasks(const delegation_request & request) {
    pimpl->require_running();
    pimpl->require_delegation();
    return pimpl->coordinator.delegate_tasks(request);
}

void communication_service::register_agent(const sub_agent & agent) {
    pimpl->require_delegation();
    pimpl->coordinator.register_agent(agent);
}

bool communication_service::unregister_agent(const std::string & agent_id) {
    pimpl->require_delegation();
    return pimpl->coordinator.unregister_agent(agent_id);
}

bool communication_service::agent_heartbeat(const std::string & agent_id) {
    return pimpl->coordinator.agent_heartbeat(agent_id);
}

void communication_service::register_server(const routing_table_entry & entry) {
    routing_table_update update;
    update.server_id = entry.server_id;
    update.type = ROUTING_UPDATE_ADD;
    update.entry = entry;
    pimpl->router.update_routing_table({update});
}

void communication_service::remove_server(const std::string & server_id) {
    routing_table_update update;
    update.server_id = server_id;
    update.type = ROUTING_UPDATE_REMOVE;
    pimpl->router.update_routing_table({update});
}

bool communication_service::report_task_result(const std::string & task_id, bool success, const json & result,
                                               const std::string & error,
                                               const std::optional<task_metrics> & metrics) {
    if (success) {
        return pimpl->coordinator.complete_task(task_id, result, metrics);
    }
    return pimpl->coordinator.fail_task(task_id, error.empty() ? "task failed" : error);
}

void communication_service::set_coordinator_handler(message_type type, coordinator_handler handler) {
    std::lock_guard<std::mutex> lock(pimpl->callback_mutex);
    pimpl->handlers[type] = std::move(handler);
}

system_health communication_service::get_system_health() const {
    system_health health;
    health.timestamp = get_timestamp_ms();

    routing_metrics rm = pimpl->router.get_routing_metrics();
    component_health router_health;
    router_health.component = "message_router";
    router_health.status = rm.success_rate > 95.0 ? HEALTH_STATUS_HEALTHY : HEALTH_STATUS_DEGRADED;
    router_health.details = "success rate: " + std::to_string(rm.success_rate) + "%";
    router_health.metrics = rm.to_json();
    health.components.push_back(router_health);

    error_metrics em = pimpl->monitor.get_error_metrics();
    component_health monitor_health;
    monitor_health.component = "performance_monitor";
    monitor_health.status = em.error_rate < 5.0 ? HEALTH_STATUS_HEALTHY : HEALTH_STATUS_DEGRADED;
    monitor_health.details = "error rate: " + std::to_string(em.error_rate) + "%";
    monitor_health.metrics = em.to_json();
    health.components.push_back(monitor_health);

    if (pimpl->current_config().orchestration.enable_sub_agent_delegation) {
        coordination_metrics cm = pimpl->coordinator.get_coordination_metrics();
        component_health coord_health;
        coord_health.component = "sub_agent_coordinator";
        coord_health.status = HEALTH_STATUS_HEALTHY;
        if (cm.total_agents > 0 && cm.agents_by_status["offline"] == cm.total_agents) {
            coord_health.status = HEALTH_STATUS_DEGRADED;
        }
        coord_health.details = std::to_string(cm.total_agents) + " agents, " +
                               std::to_string(cm.active_tasks) + " active tasks";
        coord_health.metrics = cm.to_json();
        health.components.push_back(coord_health);
    }

    // worst component wins
    for (const auto & c : health.components) {
        if (c.status > health.overall) {
            health.overall = c.status;
        }
    }
    return health;
}

json communication_service::get_metrics() const {
    json j{
        {"messageRouter", pimpl->router.get_routing_metrics().to_json()},
        {"performance", pimpl->monitor.to_json()}
    };
    if (pimpl->current_config().orchestration.enable_sub_agent_delegation) {
        j["subAgents"] = pimpl->coordinator.get_coordination_metrics().to_json();
    }
    return j;
}

relay_config communication_service::get_configuration() const {
    return pimpl->current_config();
}

void communication_service::update_configuration(const relay_config & config) {
    config.validate();
    {
        std::lock_guard<std::mutex> lock(pimpl->config_mutex);
        pimpl->config = config;
    }
    pimpl->router.update_config(config);
    pimpl->coordinator.update_config(config);
    pimpl->monitor.set_max_latency(static_cast<double>(config.performance.max_latency_ms));
    relay_log_set_level(config.log_level);

    LOG_INF("configuration updated (strategy: %s, breaker threshold: %d)\n",
            routing_strategy_to_str(config.routing.strategy).c_str(),
            config.performance.circuit_breaker_threshold);
    pimpl->emit("configuration_updated", config.to_json());
}

void communication_service::set_event_callback(event_callback callback) {
    std::lock_guard<std::mutex> lock(pimpl->callback_mutex);
    pimpl->on_event = std::move(callback);
}

message_router & communication_service::router() {
    return pimpl->router;
}

sub_agent_coordinator & communication_service::coordinator() {
    return pimpl->coordinator;
}

const performance_monitor & communication_service::monitor() const {
    return pimpl->monitor;
}

} // namespace relay

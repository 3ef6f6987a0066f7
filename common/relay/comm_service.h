#pragma once

#include "config.h"
#include "coordinator.h"
#include "message.h"
#include "performance_monitor.h"
#include "router.h"
#include "transport.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace relay {

struct component_health {
    std::string component;
    health_status status = HEALTH_STATUS_HEALTHY;
    std::string details;
    json metrics;

    json to_json() const;
};

struct system_health {
    health_status overall = HEALTH_STATUS_HEALTHY;
    std::vector<component_health> components;
    int64_t timestamp = 0;

    json to_json() const;
};

// Entry point of the engine. Classifies inbound messages by type and
// dispatches them to the router or the sub-agent coordinator, recording
// per-dispatch telemetry.
class communication_service {
public:
    using event_callback = std::function<void(const std::string & event, const json & data)>;

    // Handles wave_coordination / persona_chain / quality_gate messages
    using coordinator_handler = std::function<json(const base_message & message)>;

    communication_service(const relay_config & config, std::shared_ptr<message_transport> transport);
    ~communication_service();

    communication_service(const communication_service &) = delete;
    communication_service & operator=(const communication_service &) = delete;

    // Validates the configuration and starts the periodic loops.
    // Throws std::invalid_argument on bad config, std::runtime_error if already running.
    void start();
    void stop();
    bool is_running() const;

    // Throws std::runtime_error when stopped or the target coordinator is disabled
    json send_message(const base_message & message);

    broadcast_result broadcast_message(const base_message & message,
                                       const std::optional<std::vector<std::string>> & targets = std::nullopt);

    delegation_result delegate_tasks(const delegation_request & request);

    void register_agent(const sub_agent & agent);
    bool unregister_agent(const std::string & agent_id);
    bool agent_heartbeat(const std::string & agent_id);

    void register_server(const routing_table_entry & entry);
    void remove_server(const std::string & server_id);

    // Outcome of a delegated subtask reported by the agent that ran it
    bool report_task_result(const std::string & task_id, bool success, const json & result,
                            const std::string & error = "",
                            const std::optional<task_metrics> & metrics = std::nullopt);

    void set_coordinator_handler(message_type type, coordinator_handler handler);

    system_health get_system_health() const;
    json get_metrics() const;

    relay_config get_configuration() const;

    // Validate then apply; the running loops pick up the new values
    void update_configuration(const relay_config & config);

    void set_event_callback(event_callback callback);

    message_router & router();
    sub_agent_coordinator & coordinator();
    const performance_monitor & monitor() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace relay

#pragma once

#include "agent_registry.h"
#include "config.h"
#include "router.h"
#include "task.h"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace relay {

struct agent_load_balancing_result {
    std::string selected_agent;             // empty if no agent can run the task
    std::map<std::string, double> load_distribution;
    std::string reason;
    std::vector<std::string> alternatives;  // up to three, least loaded first

    json to_json() const;
};

enum scaling_action {
    SCALING_ACTION_SCALE_UP,
    SCALING_ACTION_SCALE_DOWN,
    SCALING_ACTION_MAINTAIN
};

std::string scaling_action_to_str(scaling_action action);

struct scaling_decision {
    scaling_action action = SCALING_ACTION_MAINTAIN;
    int target_agents = 0;
    std::string reason;
    double estimated_impact = 0.0;
    double confidence = 0.0;

    json to_json() const;
};

enum suggestion_priority {
    SUGGESTION_PRIORITY_CRITICAL = 0,
    SUGGESTION_PRIORITY_HIGH     = 1,
    SUGGESTION_PRIORITY_MEDIUM   = 2,
    SUGGESTION_PRIORITY_LOW      = 3
};

struct optimization_suggestion {
    std::string type;            // task_distribution, agent_allocation, workflow_optimization
    suggestion_priority priority = SUGGESTION_PRIORITY_MEDIUM;
    std::string description;
    std::vector<std::string> agents;

    json to_json() const;
};

struct coordination_metrics {
    std::map<std::string, int> agents_by_status;
    int total_agents = 0;
    int active_tasks = 0;
    int64_t completed_tasks = 0;
    int64_t failed_tasks = 0;
    int64_t unassignable_tasks = 0;
    int64_t delegations = 0;
    double system_load = 0.0;

    json to_json() const;
};

// Assigns subtasks to registered sub-agents, dispatches them through the
// router and waits for their outcomes according to a delegation strategy.
// Agents report back with complete_task() / fail_task().
class sub_agent_coordinator {
public:
    using event_callback   = std::function<void(const std::string & event, const json & data)>;
    using resource_sampler = std::function<resource_utilization()>;

    static constexpr int ASSUMED_AGENT_CAPACITY = 10;

    sub_agent_coordinator(message_router & router, const relay_config & config);
    ~sub_agent_coordinator();

    sub_agent_coordinator(const sub_agent_coordinator &) = delete;
    sub_agent_coordinator & operator=(const sub_agent_coordinator &) = delete;

    // Agent health monitor every orchestration.heartbeat_interval_ms
    void start();
    void stop();
    bool is_running() const;

    // Throws std::invalid_argument for a malformed request; task failures are
    // reported through the result
    delegation_result delegate_tasks(const delegation_request & request);

    // Never throws; failures come back as a failed execution
    task_execution assign_task(const sub_agent_task & task);

    // Applies the timeout rule; std::nullopt for unknown task ids
    std::optional<task_execution> monitor_task_progress(const std::string & task_id);

    json aggregate_results(const std::vector<task_execution> & executions, const aggregation_rules & rules) const;

    // Agent outcome reports; false if the task is unknown or no longer running
    bool complete_task(const std::string & task_id, const json & result,
                       const std::optional<task_metrics> & metrics = std::nullopt);
    bool fail_task(const std::string & task_id, const std::string & error);

    // Throws std::invalid_argument on validation failure
    void register_agent(const sub_agent & agent);

    // Reassigns in-flight tasks, then removes the agent; false if unknown
    bool unregister_agent(const std::string & agent_id);

    bool agent_heartbeat(const std::string & agent_id);

    std::vector<agent_load_balancing_result> balance_load(const std::vector<sub_agent_task> & tasks) const;
    scaling_decision scale_agents(int demand) const;
    std::vector<optimization_suggestion> optimize_performance() const;

    std::vector<agent_health_status> get_agent_health(const std::optional<std::string> & agent_id = std::nullopt) const;

    // One pass of the periodic monitor: heartbeats, health issues, task timeouts
    void run_health_check();

    coordination_metrics get_coordination_metrics() const;

    std::optional<sub_agent> get_agent(const std::string & agent_id) const;
    std::vector<sub_agent> list_agents() const;

    void set_event_callback(event_callback callback);
    void set_resource_sampler(resource_sampler sampler);

    void update_config(const relay_config & config);

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace relay

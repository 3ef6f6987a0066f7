#pragma once

#include "message.h"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace relay {

enum agent_status {
    AGENT_STATUS_AVAILABLE,
    AGENT_STATUS_BUSY,
    AGENT_STATUS_OVERLOADED,
    AGENT_STATUS_OFFLINE,
    AGENT_STATUS_ERROR
};

std::string agent_status_to_str(agent_status status);
agent_status str_to_agent_status(const std::string & str);

struct agent_performance {
    double average_execution_time_ms = 0.0;
    double success_rate  = 1.0;    // 0..1
    double error_rate    = 0.0;    // 0..1
    double efficiency    = 100.0;  // 0..100
    double quality_score = 100.0;  // 0..100
    int64_t tasks_completed = 0;
    int64_t tasks_failed    = 0;

    json to_json() const;
    static agent_performance from_json(const json & j);
};

struct sub_agent {
    std::string agent_id;
    std::string server_id;
    std::set<std::string> capabilities;     // "*" matches any operation
    std::set<std::string> specializations;
    agent_status status = AGENT_STATUS_AVAILABLE;
    std::vector<std::string> current_tasks;
    int max_concurrent_tasks = 1;
    agent_performance performance;
    int64_t last_heartbeat = 0;
    bool draining = false;                  // being unregistered; never selected or revived

    double current_load() const;
    bool has_capacity() const;
    bool can_handle(const std::string & operation) const;

    json to_json() const;
    static sub_agent from_json(const json & j);
};

struct agent_health_status {
    std::string agent_id;
    agent_status status = AGENT_STATUS_AVAILABLE;
    double current_load = 0.0;
    double response_time_ms = 0.0;
    double error_rate = 0.0;
    int64_t last_check = 0;
    std::vector<std::string> issues;

    json to_json() const;
};

// Sub-agent records keyed by agent id. Readers get copies.
class agent_registry {
public:
    static constexpr double EMA_ALPHA = 0.1;

    explicit agent_registry(int max_agents = 15);

    void set_max_agents(int max_agents);

    // Throws std::invalid_argument and leaves the registry unchanged on bad input
    void register_agent(const sub_agent & agent);

    bool remove(const std::string & agent_id);
    bool contains(const std::string & agent_id) const;
    size_t size() const;

    std::optional<sub_agent> get(const std::string & agent_id) const;
    std::vector<sub_agent> list() const;

    // Pick the best-scoring agent able to run `operation` and reserve a slot for task_id
    std::optional<sub_agent> reserve(const std::string & task_id, const std::string & operation);

    // Free the slot held by task_id; no-op if the agent is gone
    void release(const std::string & agent_id, const std::string & task_id);

    // Feed a task outcome into the agent's performance record
    void record_outcome(const std::string & agent_id, bool success, double duration_ms,
                        std::optional<double> quality_score = std::nullopt);

    // Refresh liveness; an offline agent returns to service unless it is draining
    bool heartbeat(const std::string & agent_id);

    // Take the agent out of selection for good while its tasks move elsewhere
    bool begin_drain(const std::string & agent_id);

    // Agents silent for longer than max_silence_ms go offline; returns the ids that changed
    std::vector<std::string> mark_missed_heartbeats(int64_t max_silence_ms);

    std::vector<agent_health_status> health(const std::optional<std::string> & agent_id,
                                            int64_t heartbeat_interval_ms) const;

    int total_capacity() const;
    int active_slots() const;

private:
    static double score(const sub_agent & agent, const std::string & operation);
    static agent_health_status check(const sub_agent & agent, int64_t now, int64_t heartbeat_interval_ms);

    mutable std::mutex mutex;
    std::map<std::string, sub_agent> agents;
    int max_agents;
};

} // namespace relay

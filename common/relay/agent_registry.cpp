#include "agent_registry.h"
#include "log.h"

#include <algorithm>
#include <stdexcept>

namespace relay {

std::string agent_status_to_str(agent_status status) {
    switch (status) {
        case AGENT_STATUS_AVAILABLE:  return "available";
        case AGENT_STATUS_BUSY:       return "busy";
        case AGENT_STATUS_OVERLOADED: return "overloaded";
        case AGENT_STATUS_OFFLINE:    return "offline";
        case AGENT_STATUS_ERROR:      return "error";
        default:                      return "available";
    }
}

agent_status str_to_agent_status(const std::string & str) {
    if (str == "busy")       return AGENT_STATUS_BUSY;
    if (str == "overloaded") return AGENT_STATUS_OVERLOADED;
    if (str == "offline")    return AGENT_STATUS_OFFLINE;
    if (str == "error")      return AGENT_STATUS_ERROR;
    return AGENT_STATUS_AVAILABLE;
}

json agent_performance::to_json() const {
    return json{
        {"averageExecutionTime", average_execution_time_ms},
        {"successRate", success_rate},
        {"errorRate", error_rate},
        {"efficiency", efficiency},
        {"qualityScore", quality_score},
        {"tasksCompleted", tasks_completed},
        {"tasksFailed", tasks_failed}
    };
}

agent_performance agent_performance::from_json(const json & j) {
    agent_performance p;
    p.average_execution_time_ms = j.value("averageExecutionTime", p.average_execution_time_ms);
    p.success_rate  = j.value("successRate", p.success_rate);
    p.error_rate    = j.value("errorRate", p.error_rate);
    p.efficiency    = j.value("efficiency", p.efficiency);
    p.quality_score = j.value("qualityScore", p.quality_score);
    return p;
}

double sub_agent::current_load() const {
    if (max_concurrent_tasks <= 0) {
        return 1.0;
    }
    return static_cast<double>(current_tasks.size()) / max_concurrent_tasks;
}

bool sub_agent::has_capacity() const {
    return static_cast<int>(current_tasks.size()) < max_concurrent_tasks;
}

bool sub_agent::can_handle(const std::string & operation) const {
    return capabilities.count(operation) > 0 || capabilities.count("*") > 0;
}

json sub_agent::to_json() const {
    return json{
        {"agentId", agent_id},
        {"serverId", server_id},
        {"capabilities", capabilities},
        {"specializations", specializations},
        {"status", agent_status_to_str(status)},
        {"currentTasks", current_tasks},
        {"maxConcurrentTasks", max_concurrent_tasks},
        {"performance", performance.to_json()},
        {"lastHeartbeat", last_heartbeat},
        {"draining", draining}
    };
}

sub_agent sub_agent::from_json(const json & j) {
    sub_agent a;
    a.agent_id             = j.value("agentId", "");
    a.server_id            = j.value("serverId", "");
    a.capabilities         = j.value("capabilities", std::set<std::string>());
    a.specializations      = j.value("specializations", std::set<std::string>());
    a.max_concurrent_tasks = j.value("maxConcurrentTasks", 1);
    if (j.contains("performance")) {
        a.performance = agent_performance::from_json(j.at("performance"));
    }
    return a;
}

json agent_health_status::to_json() const {
    return json{
        {"agentId", agent_id},
        {"status", agent_status_to_str(status)},
        {"currentLoad", current_load},
        {"responseTime", response_time_ms},
        {"errorRate", error_rate},
        {"lastCheck", last_check},
        {"issues", issues}
    };
}

agent_registry::agent_registry(int max_agents) : max_agents(max_agents) {}

void agent_registry::set_max_agents(int value) {
    std::lock_guard<std::mutex> lock(mutex);
    max_agents = value;
}

void agent_registry::register_agent(const sub_agent & agent) {
    if (agent.agent_id.empty()) {
        throw std::invalid_argument("Agent validation failed: missing agent ID");
    }
    if (agent.server_id.empty()) {
        throw std::invalid_argument("Agent validation failed: missing server ID");
    }
    if (agent.capabilities.empty()) {
        throw std::invalid_argument("Agent validation failed: no capabilities specified");
    }
    if (agent.max_concurrent_tasks <= 0) {
        throw std::invalid_argument("Agent validation failed: maxConcurrentTasks must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex);
    if (agents.count(agent.agent_id) > 0) {
        throw std::invalid_argument("Agent validation failed: " + agent.agent_id + " is already registered");
    }
    if (static_cast<int>(agents.size()) >= max_agents) {
        throw std::invalid_argument("Agent validation failed: registry is full ("
                                    + std::to_string(max_agents) + " agents)");
    }

    sub_agent record = agent;
    record.status = AGENT_STATUS_AVAILABLE;
    record.current_tasks.clear();
    record.draining = false;
    record.last_heartbeat = get_timestamp_ms();
    agents.emplace(record.agent_id, std::move(record));
}

bool agent_registry::remove(const std::string & agent_id) {
    std::lock_guard<std::mutex> lock(mutex);
    return agents.erase(agent_id) > 0;
}

bool agent_registry::contains(const std::string & agent_id) const {
    std::lock_guard<std::mutex> lock(mutex);
    return agents.count(agent_id) > 0;
}

size_t agent_registry::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return agents.size();
}

std::optional<sub_agent> agent_registry::get(const std::string & agent_id) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = agents.find(agent_id);
    if (it == agents.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<sub_agent> agent_registry::list() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<sub_agent> out;
    out.reserve(agents.size());
    for (const auto & [id, agent] : agents) {
        out.push_back(agent);
    }
    return out;
}

double agent_registry::score(const sub_agent & agent, const std::string & operation) {
    double load_factor = 1.0 - agent.current_load();
    double performance_factor = agent.performance.efficiency / 100.0;
    double capability_match = agent.specializations.count(operation) > 0 ? 1.2 : 1.0;
    return load_factor * performance_factor * capability_match;
}

std::optional<sub_agent> agent_registry::reserve(const std::string & task_id, const std::string & operation) {
    std::lock_guard<std::mutex> lock(mutex);

    sub_agent * best = nullptr;
    double best_score = 0.0;
    for (auto & [id, agent] : agents) {
        bool eligible = !agent.draining &&
                        (agent.status == AGENT_STATUS_AVAILABLE ||
                         (agent.status == AGENT_STATUS_BUSY && agent.has_capacity()));
        if (!eligible || !agent.has_capacity() || !agent.can_handle(operation)) {
            continue;
        }
        double s = score(agent, operation);
        if (best == nullptr || s > best_score) {
            best = &agent;
            best_score = s;
        }
    }

    if (best == nullptr) {
        return std::nullopt;
    }

    best->current_tasks.push_back(task_id);
    if (!best->has_capacity()) {
        best->status = AGENT_STATUS_BUSY;
    }
    return *best;
}

void agent_registry::release(const std::string & agent_id, const std::string & task_id) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = agents.find(agent_id);
    if (it == agents.end()) {
        return;
    }

    auto & agent = it->second;
    auto pos = std::find(agent.current_tasks.begin(), agent.current_tasks.end(), task_id);
    if (pos != agent.current_tasks.end()) {
        agent.current_tasks.erase(pos);
    }
    if (agent.status == AGENT_STATUS_BUSY && agent.has_capacity() && !agent.draining) {
        agent.status = AGENT_STATUS_AVAILABLE;
    }
}

void agent_registry::record_outcome(const std::string & agent_id, bool success, double duration_ms,
                                    std::optional<double> quality_score) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = agents.find(agent_id);
    if (it == agents.end()) {
        return;
    }

    auto & perf = it->second.performance;
    if (success) {
        perf.tasks_completed++;
    } else {
        perf.tasks_failed++;
    }

    perf.success_rate = EMA_ALPHA * (success ? 1.0 : 0.0) + (1.0 - EMA_ALPHA) * perf.success_rate;
    perf.error_rate = 1.0 - perf.success_rate;

    if (perf.tasks_completed + perf.tasks_failed == 1) {
        perf.average_execution_time_ms = duration_ms;
    } else {
        perf.average_execution_time_ms = EMA_ALPHA * duration_ms + (1.0 - EMA_ALPHA) * perf.average_execution_time_ms;
    }

    if (quality_score) {
        perf.quality_score = EMA_ALPHA * *quality_score + (1.0 - EMA_ALPHA) * perf.quality_score;
    }
}

bool agent_registry::heartbeat(const std::string & agent_id) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = agents.find(agent_id);
    if (it == agents.end()) {
        return false;
    }

    auto & agent = it->second;
    agent.last_heartbeat = get_timestamp_ms();
    if (agent.status == AGENT_STATUS_OFFLINE && !agent.draining) {
        agent.status = agent.has_capacity() ? AGENT_STATUS_AVAILABLE : AGENT_STATUS_BUSY;
        LOG_INF("agent %s is back online\n", agent_id.c_str());
    }
    return true;
}

bool agent_registry::begin_drain(const std::string & agent_id) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = agents.find(agent_id);
    if (it == agents.end()) {
        return false;
    }
    it->second.draining = true;
    it->second.status = AGENT_STATUS_OFFLINE;
    return true;
}

std::vector<std::string> agent_registry::mark_missed_heartbeats(int64_t max_silence_ms) {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::string> changed;
    int64_t now = get_timestamp_ms();
    for (auto & [id, agent] : agents) {
        if (agent.status != AGENT_STATUS_OFFLINE && now - agent.last_heartbeat > max_silence_ms) {
            agent.status = AGENT_STATUS_OFFLINE;
            changed.push_back(id);
        }
    }
    return changed;
}

agent_health_status agent_registry::check(const sub_agent & agent, int64_t now, int64_t heartbeat_interval_ms) {
    agent_health_status h;
    h.agent_id = agent.agent_id;
    h.status = agent.status;
    h.current_load = agent.current_load();
    h.response_time_ms = agent.performance.average_execution_time_ms;
    h.error_rate = agent.performance.error_rate;
    h.last_check = now;

    if (h.current_load > 0.9) {
        h.issues.push_back("High load");
    }
    if (agent.performance.error_rate > 0.1) {
        h.issues.push_back("High error rate");
    }
    if (now - agent.last_heartbeat > heartbeat_interval_ms * 2) {
        h.issues.push_back("Missed heartbeat");
    }
    return h;
}

std::vector<agent_health_status> agent_registry::health(const std::optional<std::string> & agent_id,
                                                        int64_t heartbeat_interval_ms) const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<agent_health_status> out;
    int64_t now = get_timestamp_ms();

    if (agent_id) {
        auto it = agents.find(*agent_id);
        if (it != agents.end()) {
            out.push_back(check(it->second, now, heartbeat_interval_ms));
        }
        return out;
    }

    for (const auto & [id, agent] : agents) {
        out.push_back(check(agent, now, heartbeat_interval_ms));
    }
    return out;
}

int agent_registry::total_capacity() const {
    std::lock_guard<std::mutex> lock(mutex);
    int total = 0;
    for (const auto & [id, agent] : agents) {
        total += agent.max_concurrent_tasks;
    }
    return total;
}

int agent_registry::active_slots() const {
    std::lock_guard<std::mutex> lock(mutex);
    int total = 0;
    for (const auto & [id, agent] : agents) {
        total += static_cast<int>(agent.current_tasks.size());
    }
    return total;
}

} // namespace relay

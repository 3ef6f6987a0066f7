#include "coordinator.h"
#include "aggregation.h"
#include "log.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

namespace relay {

static const char * COORDINATOR_SOURCE = "sub_agent_coordinator";

std::string scaling_action_to_str(scaling_action action) {
    switch (action) {
        case SCALING_ACTION_SCALE_UP:   return "scale_up";
        case SCALING_ACTION_SCALE_DOWN: return "scale_down";
        case SCALING_ACTION_MAINTAIN:   return "maintain";
        default:                        return "maintain";
    }
}

static std::string suggestion_priority_to_str(suggestion_priority priority) {
    switch (priority) {
        case SUGGESTION_PRIORITY_CRITICAL: return "critical";
        case SUGGESTION_PRIORITY_HIGH:     return "high";
        case SUGGESTION_PRIORITY_MEDIUM:   return "medium";
        case SUGGESTION_PRIORITY_LOW:      return "low";
        default:                           return "medium";
    }
}

json agent_load_balancing_result::to_json() const {
    return json{
        {"selectedAgent", selected_agent},
        {"loadDistribution", load_distribution},
        {"balancingReason", reason},
        {"alternatives", alternatives}
    };
}

json scaling_decision::to_json() const {
    return json{
        {"action", scaling_action_to_str(action)},
        {"targetAgents", target_agents},
        {"reason", reason},
        {"estimatedImpact", estimated_impact},
        {"confidence", confidence}
    };
}

json optimization_suggestion::to_json() const {
    return json{
        {"type", type},
        {"priority", suggestion_priority_to_str(priority)},
        {"description", description},
        {"agents", agents}
    };
}

json coordination_metrics::to_json() const {
    return json{
        {"agentsByStatus", agents_by_status},
        {"totalAgents", total_agents},
        {"activeTasks", active_tasks},
        {"completedTasks", completed_tasks},
        {"failedTasks", failed_tasks},
        {"unassignableTasks", unassignable_tasks},
        {"delegations", delegations},
        {"systemLoad", system_load}
    };
}

namespace {

struct task_record {
    sub_agent_task task;
    task_execution exec;
    int64_t deadline = 0;
    bool delegated = false;     // owned by a running delegate_tasks call
    std::chrono::steady_clock::time_point started;
};

double ms_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

struct sub_agent_coordinator::impl {
    message_router & router;
    relay_config config;
    agent_registry registry;

    mutable std::mutex mutex;
    std::condition_variable cv;
    std::map<std::string, task_record> records;

    int64_t completed_count = 0;
    int64_t failed_count = 0;
    int64_t unassignable_count = 0;
    int64_t delegation_count = 0;

    event_callback on_event;
    resource_sampler sampler;
    mutable std::mutex callback_mutex;

    std::atomic<bool> running{false};
    std::thread monitor_thread;
    std::mutex loop_mutex;
    std::condition_variable loop_cv;

    impl(message_router & r, const relay_config & cfg)
        : router(r), config(cfg), registry(cfg.orchestration.max_concurrent_sub_agents) {}

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

    // Emit with the record lock released so callbacks may re-enter
    void emit_unlocked(std::unique_lock<std::mutex> & lock, const std::string & event, const json & data) {
        lock.unlock();
        emit(event, data);
        lock.lock();
    }

    int active_task_count_locked() const {
        int active = 0;
        for (const auto & [id, rec] : records) {
            if (!rec.exec.is_terminal()) {
                active++;
            }
        }
        return active;
    }

    double system_load_locked() const {
        int capacity = registry.total_capacity();
        return capacity > 0 ? static_cast<double>(active_task_count_locked()) / capacity : 0.0;
    }

    base_message build_task_message(const sub_agent_task & task, const sub_agent & agent, int64_t timeout) const {
        json data{
            {"taskId", task.task_id},
            {"agentId", agent.agent_id},
            {"operation", task.operation},
            {"input", task.input},
            {"timeout", timeout},
            {"expectedOutput", task.expected_output}
        };

        base_message msg = base_message::make(COORDINATOR_SOURCE, agent.server_id, "execute_task",
                                              MESSAGE_TYPE_SUB_AGENT_DELEGATION, data, task.priority);
        msg.header.correlation_id = task.task_id;
        msg.metadata.ttl = timeout;
        msg.metadata.routing_hints["sub_agent_task"] = agent.agent_id;
        msg.metadata.performance_hints["priority"] = std::to_string(static_cast<int>(task.priority));
        return msg;
    }

    // Caller holds the lock; ends an execution that is still running
    void finish_locked(task_record & rec, task_status status, const std::string & error) {
        auto & exec = rec.exec;
        exec.status = status;
        exec.error = error;
        exec.end_time = get_timestamp_ms();
        exec.duration_ms = ms_since(rec.started);
        registry.release(exec.agent_id, exec.task_id);
        if (status == TASK_STATUS_COMPLETED) {
            completed_count++;
        } else {
            failed_count++;
        }
    }

    // Caller holds the lock
    bool check_timeout_locked(task_record & rec, int64_t now) {
        auto status = rec.exec.status;
        if (status != TASK_STATUS_ASSIGNED && status != TASK_STATUS_IN_PROGRESS) {
            return false;
        }
        if (now <= rec.deadline) {
            return false;
        }
        finish_locked(rec, TASK_STATUS_TIMEOUT, "Task timeout");
        registry.record_outcome(rec.exec.agent_id, false, rec.exec.duration_ms);
        LOG_WRN("task %s timed out on agent %s\n", rec.exec.task_id.c_str(), rec.exec.agent_id.c_str());
        return true;
    }

    // Select an agent, record the assignment and route the task message.
    // Called with the lock held; the lock is released while routing.
    task_execution dispatch(std::unique_lock<std::mutex> & lock, const sub_agent_task & task, bool delegated) {
        task_record rec;
        rec.task = task;
        rec.delegated = delegated;
        rec.exec.task_id = task.task_id;
        rec.started = std::chrono::steady_clock::now();

        auto agent = registry.reserve(task.task_id, task.operation);
        if (!agent) {
            rec.exec.status = TASK_STATUS_FAILED;
            rec.exec.error = "No suitable agent found for task " + task.task_id;
            rec.exec.end_time = get_timestamp_ms();
            unassignable_count++;
            failed_count++;
            records[task.task_id] = rec;
            LOG_WRN("%s\n", rec.exec.error.c_str());
            emit_unlocked(lock, "task_failed", rec.exec.to_json());
            return rec.exec;
        }

        int64_t timeout = task.timeout_ms > 0 ? task.timeout_ms : config.orchestration.task_timeout_ms;
        rec.exec.agent_id = agent->agent_id;
        rec.exec.status = TASK_STATUS_ASSIGNED;
        rec.exec.start_time = get_timestamp_ms();
        rec.deadline = rec.exec.start_time + timeout;
        records[task.task_id] = rec;

        base_message msg = build_task_message(task, *agent, timeout);
        LOG_DBG("task %s assigned to %s\n", task.task_id.c_str(), agent->agent_id.c_str());

        lock.unlock();
        emit("task_assigned", json{{"taskId", task.task_id}, {"agentId", agent->agent_id}});
        routing_result routed = router.route_message(msg);
        lock.lock();

        auto it = records.find(task.task_id);
        if (it == records.end()) {
            return rec.exec;
        }

        auto & current = it->second;
        if (current.exec.agent_id != agent->agent_id) {
            // reassigned while routing
            return current.exec;
        }

        if (routed.success) {
            if (current.exec.status == TASK_STATUS_ASSIGNED) {
                current.exec.status = TASK_STATUS_IN_PROGRESS;
            }
        } else if (!current.exec.is_terminal()) {
            finish_locked(current, TASK_STATUS_FAILED, "Task dispatch failed: " + routed.error);
            cv.notify_all();
            task_execution failed = current.exec;
            LOG_WRN("task %s dispatch failed: %s\n", task.task_id.c_str(), routed.error.c_str());
            emit_unlocked(lock, "task_failed", failed.to_json());
            return failed;
        }
        return current.exec;
    }

    // Block until every listed task is terminal, applying task and delegation timeouts
    std::vector<task_execution> wait_for(std::unique_lock<std::mutex> & lock,
                                         const std::vector<std::string> & task_ids,
                                         int64_t delegation_deadline) {
        while (true) {
            int64_t now = get_timestamp_ms();
            std::vector<task_execution> expired;
            bool pending = false;

            for (const auto & id : task_ids) {
                auto it = records.find(id);
                if (it == records.end()) {
                    continue;
                }
                auto & rec = it->second;
                if (check_timeout_locked(rec, now)) {
                    expired.push_back(rec.exec);
                } else if (delegation_deadline > 0 && now > delegation_deadline && !rec.exec.is_terminal()) {
                    finish_locked(rec, TASK_STATUS_TIMEOUT, "Delegation timeout");
                    expired.push_back(rec.exec);
                }
                if (!rec.exec.is_terminal()) {
                    pending = true;
                }
            }

            if (!expired.empty()) {
                cv.notify_all();
                for (const auto & exec : expired) {
                    emit_unlocked(lock, "task_timeout", exec.to_json());
                }
                continue;
            }

            if (!pending) {
                break;
            }
            cv.wait_for(lock, std::chrono::milliseconds(config.orchestration.poll_interval_ms));
        }

        std::vector<task_execution> out;
        out.reserve(task_ids.size());
        for (const auto & id : task_ids) {
            auto it = records.find(id);
            if (it != records.end()) {
                out.push_back(it->second.exec);
            }
        }
        return out;
    }

    void monitor_loop() {
        while (running.load()) {
            int64_t interval;
            {
                std::lock_guard<std::mutex> lock(mutex);
                interval = config.orchestration.heartbeat_interval_ms;
            }
            {
                std::unique_lock<std::mutex> lock(loop_mutex);
                loop_cv.wait_for(lock, std::chrono::milliseconds(interval), [this] { return !running.load(); });
            }
            if (!running.load()) {
                break;
            }
            health_pass();
        }
    }

    // Caller holds the lock. Delegation-owned records are erased by their delegation.
    size_t prune_finished_locked(int64_t now) {
        size_t pruned = 0;
        int64_t retention = config.orchestration.task_retention_ms;
        for (auto it = records.begin(); it != records.end();) {
            const auto & rec = it->second;
            if (!rec.delegated && rec.exec.is_terminal() && now - rec.exec.end_time >= retention) {
                it = records.erase(it);
                pruned++;
            } else {
                ++it;
            }
        }
        return pruned;
    }

    void health_pass() {
        int64_t interval;
        {
            std::lock_guard<std::mutex> lock(mutex);
            interval = config.orchestration.heartbeat_interval_ms;
        }

        for (const auto & id : registry.mark_missed_heartbeats(interval * 2)) {
            LOG_WRN("agent %s missed its heartbeat, marked offline\n", id.c_str());
            emit("agent_offline", json{{"agentId", id}});
        }

        for (const auto & health : registry.health(std::nullopt, interval)) {
            if (!health.issues.empty()) {
                emit("agent_health_issue", health.to_json());
            }
        }

        std::unique_lock<std::mutex> lock(mutex);
        std::vector<task_execution> expired;
        int64_t now = get_timestamp_ms();
        for (auto & [id, rec] : records) {
            if (check_timeout_locked(rec, now)) {
                expired.push_back(rec.exec);
            }
        }
        if (!expired.empty()) {
            cv.notify_all();
        }
        size_t pruned = prune_finished_locked(now);
        lock.unlock();
        if (pruned > 0) {
            LOG_DBG("dropped %zu finished task records\n", pruned);
        }
        for (const auto & exec : expired) {
            emit("task_timeout", exec.to_json());
        }
    }

    delegation_metrics compute_metrics(const std::vector<task_execution> & executions, double wall_ms) {
        delegation_metrics m;

        double serial_ms = 0.0;
        int completed = 0;
        int scored = 0;
        for (const auto & exec : executions) {
            serial_ms += exec.duration_ms;
            if (!exec.agent_id.empty()) {
                m.agent_utilization[exec.agent_id]++;
            }
            if (exec.status != TASK_STATUS_COMPLETED) {
                continue;
            }
            completed++;
            m.total_execution_time_ms += exec.duration_ms;
            if (exec.metrics) {
                scored++;
                m.quality.accuracy      += exec.metrics->accuracy;
                m.quality.completeness  += exec.metrics->completeness;
                m.quality.confidence    += exec.metrics->confidence;
                m.quality.quality_score += exec.metrics->quality_score;
            }
        }

        if (completed > 0) {
            m.average_task_time_ms = m.total_execution_time_ms / completed;
        }
        if (scored > 0) {
            m.quality.accuracy      /= scored;
            m.quality.completeness  /= scored;
            m.quality.confidence    /= scored;
            m.quality.quality_score /= scored;
        }

        m.parallel_efficiency = wall_ms > 0 ? std::min(100.0, serial_ms / wall_ms * 100.0) : 0.0;

        resource_sampler s;
        {
            std::lock_guard<std::mutex> lock(callback_mutex);
            s = sampler;
        }
        if (s) {
            m.resources = s();
        }
        return m;
    }
};

sub_agent_coordinator::sub_agent_coordinator(message_router & router, const relay_config & config)
    : pimpl(std::make_unique<impl>(router, config)) {}

sub_agent_coordinator::~sub_agent_coordinator() {
    stop();
}

void sub_agent_coordinator::start() {
    if (pimpl->running.exchange(true)) {
        return;
    }
    pimpl->monitor_thread = std::thread(&impl::monitor_loop, pimpl.get());
    LOG_INF("sub-agent coordinator started\n");
}

void sub_agent_coordinator::stop() {
    if (!pimpl->running.exchange(false)) {
        return;
    }
    pimpl->loop_cv.notify_all();
    if (pimpl->monitor_thread.joinable()) {
        pimpl->monitor_thread.join();
    }
    LOG_INF("sub-agent coordinator stopped\n");
}

bool sub_agent_coordinator::is_running() const {
    return pimpl->running.load();
}

delegation_result sub_agent_coordinator::delegate_tasks(const delegation_request & request) {
    if (request.delegation_id.empty()) {
        throw std::invalid_argument("Delegation validation failed: missing delegation ID");
    }
    if (request.tasks.empty()) {
        throw std::invalid_argument("Delegation validation failed: no tasks specified");
    }

    std::unique_lock<std::mutex> lock(pimpl->mutex);

    if (static_cast<int>(request.tasks.size()) > pimpl->config.orchestration.max_concurrent_tasks) {
        throw std::invalid_argument("Delegation validation failed: too many tasks for current capacity");
    }

    std::set<std::string> seen;
    for (const auto & task : request.tasks) {
        if (task.task_id.empty()) {
            throw std::invalid_argument("Delegation validation failed: task without ID");
        }
        if (!seen.insert(task.task_id).second) {
            throw std::invalid_argument("Delegation validation failed: duplicate task ID " + task.task_id);
        }
        auto it = pimpl->records.find(task.task_id);
        if (it != pimpl->records.end() && !it->second.exec.is_terminal()) {
            throw std::invalid_argument("Delegation validation failed: task " + task.task_id + " is already active");
        }
    }

    pimpl->delegation_count++;
    auto start = std::chrono::steady_clock::now();
    int64_t deadline = request.timeout_ms > 0 ? get_timestamp_ms() + request.timeout_ms : 0;

    delegation_strategy strategy = request.strategy;
    if (strategy == DELEGATION_STRATEGY_ADAPTIVE) {
        double load = pimpl->system_load_locked();
        strategy = load > 0.8 ? DELEGATION_STRATEGY_SEQUENTIAL : DELEGATION_STRATEGY_PARALLEL;
        LOG_DBG("adaptive delegation %s: system load %.2f, running %s\n", request.delegation_id.c_str(),
                load, delegation_strategy_to_str(strategy).c_str());
    }

    LOG_INF("delegation %s started: %zu tasks, %s\n", request.delegation_id.c_str(),
            request.tasks.size(), delegation_strategy_to_str(strategy).c_str());

    std::vector<task_execution> executions;
    switch (strategy) {
        case DELEGATION_STRATEGY_SEQUENTIAL:
            for (const auto & task : request.tasks) {
                pimpl->dispatch(lock, task, true);
                auto done = pimpl->wait_for(lock, {task.task_id}, deadline);
                if (done.empty()) {
                    break;
                }
                executions.push_back(done[0]);
                if (done[0].status == TASK_STATUS_FAILED) {
                    break;
                }
            }
            break;
        case DELEGATION_STRATEGY_PIPELINE:
            {
                json previous;
                bool has_previous = false;
                for (const auto & original : request.tasks) {
                    sub_agent_task task = original;
                    if (has_previous) {
                        if (task.input.is_null()) {
                            task.input = json::object();
                        } else if (!task.input.is_object()) {
                            task.input = json{{"input", task.input}};
                        }
                        task.input["pipelineInput"] = previous;
                    }
                    pimpl->dispatch(lock, task, true);
                    auto done = pimpl->wait_for(lock, {task.task_id}, deadline);
                    if (done.empty()) {
                        break;
                    }
                    executions.push_back(done[0]);
                    if (done[0].status != TASK_STATUS_COMPLETED) {
                        break;
                    }
                    previous = done[0].result;
                    has_previous = true;
                }
            } break;
        case DELEGATION_STRATEGY_PARALLEL:
        default:
            {
                std::vector<std::string> ids;
                ids.reserve(request.tasks.size());
                for (const auto & task : request.tasks) {
                    pimpl->dispatch(lock, task, true);
                    ids.push_back(task.task_id);
                }
                executions = pimpl->wait_for(lock, ids, deadline);
            } break;
    }

    for (const auto & exec : executions) {
        pimpl->records.erase(exec.task_id);
    }
    lock.unlock();

    delegation_result result;
    result.delegation_id = request.delegation_id;
    result.total_tasks = static_cast<int>(request.tasks.size());
    for (const auto & exec : executions) {
        if (exec.status == TASK_STATUS_COMPLETED) {
            result.completed_tasks++;
        } else if (exec.status == TASK_STATUS_FAILED || exec.status == TASK_STATUS_TIMEOUT ||
                   exec.status == TASK_STATUS_CANCELLED) {
            result.failed_tasks++;
        }
    }
    result.skipped_tasks = result.total_tasks - static_cast<int>(executions.size());

    try {
        result.aggregated_result = relay::aggregate_results(executions, request.aggregation);
        result.success = true;
    } catch (const std::runtime_error & e) {
        result.success = false;
        result.error = e.what();
    }

    result.duration_ms = ms_since(start);
    result.metrics = pimpl->compute_metrics(executions, result.duration_ms);
    result.task_results = std::move(executions);

    LOG_INF("delegation %s finished: %d completed, %d failed, %d skipped in %.1f ms\n",
            request.delegation_id.c_str(), result.completed_tasks, result.failed_tasks,
            result.skipped_tasks, result.duration_ms);

    json summary{
        {"delegationId", result.delegation_id},
        {"totalTasks", result.total_tasks},
        {"duration", result.duration_ms},
        {"success", result.success}
    };
    if (result.success) {
        pimpl->emit("delegation_completed", summary);
    } else {
        summary["error"] = result.error;
        pimpl->emit("delegation_failed", summary);
    }
    return result;
}

task_execution sub_agent_coordinator::assign_task(const sub_agent_task & task) {
    std::unique_lock<std::mutex> lock(pimpl->mutex);

    auto it = pimpl->records.find(task.task_id);
    if (it != pimpl->records.end() && !it->second.exec.is_terminal()) {
        task_execution rejected;
        rejected.task_id = task.task_id;
        rejected.status = TASK_STATUS_FAILED;
        rejected.error = "Task " + task.task_id + " is already active";
        return rejected;
    }

    return pimpl->dispatch(lock, task, false);
}

std::optional<task_execution> sub_agent_coordinator::monitor_task_progress(const std::string & task_id) {
    std::unique_lock<std::mutex> lock(pimpl->mutex);
    auto it = pimpl->records.find(task_id);
    if (it == pimpl->records.end()) {
        return std::nullopt;
    }

    bool expired = pimpl->check_timeout_locked(it->second, get_timestamp_ms());
    task_execution exec = it->second.exec;
    lock.unlock();

    if (expired) {
        pimpl->cv.notify_all();
        pimpl->emit("task_timeout", exec.to_json());
    }
    return exec;
}

json sub_agent_coordinator::aggregate_results(const std::vector<task_execution> & executions,
                                              const aggregation_rules & rules) const {
    return relay::aggregate_results(executions, rules);
}

bool sub_agent_coordinator::complete_task(const std::string & task_id, const json & result,
                                          const std::optional<task_metrics> & metrics) {
    std::unique_lock<std::mutex> lock(pimpl->mutex);
    auto it = pimpl->records.find(task_id);
    if (it == pimpl->records.end()) {
        return false;
    }

    auto & rec = it->second;
    if (rec.exec.status != TASK_STATUS_ASSIGNED && rec.exec.status != TASK_STATUS_IN_PROGRESS) {
        LOG_DBG("ignoring late result for task %s (%s)\n", task_id.c_str(),
                task_status_to_str(rec.exec.status).c_str());
        return false;
    }

    rec.exec.result = result;
    rec.exec.metrics = metrics;
    pimpl->finish_locked(rec, TASK_STATUS_COMPLETED, "");
    if (rec.exec.metrics && rec.exec.metrics->execution_time_ms == 0.0) {
        rec.exec.metrics->execution_time_ms = rec.exec.duration_ms;
    }

    std::optional<double> quality;
    if (metrics) {
        quality = metrics->quality_score;
    }
    pimpl->registry.record_outcome(rec.exec.agent_id, true, rec.exec.duration_ms, quality);

    task_execution done = rec.exec;
    lock.unlock();

    pimpl->cv.notify_all();
    pimpl->emit("task_completed", done.to_json());
    return true;
}

bool sub_agent_coordinator::fail_task(const std::string & task_id, const std::string & error) {
    std::unique_lock<std::mutex> lock(pimpl->mutex);
    auto it = pimpl->records.find(task_id);
    if (it == pimpl->records.end()) {
        return false;
    }

    auto & rec = it->second;
    if (rec.exec.status != TASK_STATUS_ASSIGNED && rec.exec.status != TASK_STATUS_IN_PROGRESS) {
        return false;
    }

    pimpl->finish_locked(rec, TASK_STATUS_FAILED, error);
    pimpl->registry.record_outcome(rec.exec.agent_id, false, rec.exec.duration_ms);

    task_execution done = rec.exec;
    lock.unlock();

    LOG_WRN("task %s failed on agent %s: %s\n", task_id.c_str(), done.agent_id.c_str(), error.c_str());
    pimpl->cv.notify_all();
    pimpl->emit("task_failed", done.to_json());
    return true;
}

void sub_agent_coordinator::register_agent(const sub_agent & agent) {
    pimpl->registry.register_agent(agent);
    LOG_INF("agent registered: %s (server: %s, max tasks: %d)\n",
            agent.agent_id.c_str(), agent.server_id.c_str(), agent.max_concurrent_tasks);
    pimpl->emit("agent_registered", json{
        {"agentId", agent.agent_id},
        {"capabilities", agent.capabilities},
        {"maxConcurrentTasks", agent.max_concurrent_tasks}
    });
}

bool sub_agent_coordinator::unregister_agent(const std::string & agent_id) {
    std::unique_lock<std::mutex> lock(pimpl->mutex);
    if (!pimpl->registry.contains(agent_id)) {
        return false;
    }

    // Heartbeats arriving while tasks move elsewhere must not bring it back
    pimpl->registry.begin_drain(agent_id);

    std::vector<sub_agent_task> in_flight;
    for (const auto & [id, rec] : pimpl->records) {
        if (rec.exec.agent_id == agent_id && !rec.exec.is_terminal()) {
            in_flight.push_back(rec.task);
        }
    }

    for (const auto & task : in_flight) {
        auto it = pimpl->records.find(task.task_id);
        if (it == pimpl->records.end() || it->second.exec.agent_id != agent_id || it->second.exec.is_terminal()) {
            continue;
        }
        bool delegated = it->second.delegated;
        task_execution retired = it->second.exec;
        retired.status = TASK_STATUS_CANCELLED;
        retired.error = "Agent " + agent_id + " unregistered";
        retired.end_time = get_timestamp_ms();
        pimpl->registry.release(agent_id, task.task_id);

        LOG_INF("reassigning task %s from %s\n", task.task_id.c_str(), agent_id.c_str());
        pimpl->emit_unlocked(lock, "task_reassigned", retired.to_json());
        pimpl->dispatch(lock, task, delegated);
    }

    pimpl->registry.remove(agent_id);
    lock.unlock();

    pimpl->cv.notify_all();
    LOG_INF("agent unregistered: %s\n", agent_id.c_str());
    pimpl->emit("agent_unregistered", json{{"agentId", agent_id}});
    return true;
}

bool sub_agent_coordinator::agent_heartbeat(const std::string & agent_id) {
    return pimpl->registry.heartbeat(agent_id);
}

std::vector<agent_load_balancing_result> sub_agent_coordinator::balance_load(
        const std::vector<sub_agent_task> & tasks) const {
    std::vector<sub_agent> agents;
    for (const auto & agent : pimpl->registry.list()) {
        if (agent.status != AGENT_STATUS_OFFLINE) {
            agents.push_back(agent);
        }
    }

    // Projected slot usage so consecutive tasks spread across agents
    std::map<std::string, int> projected;
    for (const auto & agent : agents) {
        projected[agent.agent_id] = static_cast<int>(agent.current_tasks.size());
    }

    std::vector<agent_load_balancing_result> results;
    results.reserve(tasks.size());
    for (const auto & task : tasks) {
        agent_load_balancing_result r;

        std::vector<std::pair<std::string, double>> loads;
        for (const auto & agent : agents) {
            if (agent.can_handle(task.operation)) {
                loads.emplace_back(agent.agent_id,
                                   static_cast<double>(projected[agent.agent_id]) / agent.max_concurrent_tasks);
            }
        }

        if (loads.empty()) {
            r.reason = "no_capable_agent";
            results.push_back(r);
            continue;
        }

        for (const auto & [id, load] : loads) {
            r.load_distribution[id] = load;
        }

        std::stable_sort(loads.begin(), loads.end(),
                         [](const auto & a, const auto & b) { return a.second < b.second; });
        r.selected_agent = loads[0].first;
        r.reason = "least_loaded";
        for (size_t i = 1; i < loads.size() && r.alternatives.size() < 3; i++) {
            r.alternatives.push_back(loads[i].first);
        }

        projected[r.selected_agent]++;
        results.push_back(r);
    }
    return results;
}

scaling_decision sub_agent_coordinator::scale_agents(int demand) const {
    int agent_count = static_cast<int>(pimpl->registry.size());
    int active;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        active = pimpl->active_task_count_locked();
    }

    scaling_decision d;
    if (agent_count == 0) {
        if (demand > 0) {
            d.action = SCALING_ACTION_SCALE_UP;
            d.target_agents = std::max(1, static_cast<int>(std::ceil(demand / 8.0)));
            d.reason = "No agents registered";
            d.estimated_impact = 25;
            d.confidence = 85;
        } else {
            d.reason = "No agents and no demand";
            d.confidence = 90;
        }
        return d;
    }

    double utilization = static_cast<double>(active) / (agent_count * ASSUMED_AGENT_CAPACITY);
    if (utilization > 0.8) {
        d.action = SCALING_ACTION_SCALE_UP;
        d.target_agents = static_cast<int>(std::ceil(demand / 8.0));
        d.reason = "High utilization detected";
        d.estimated_impact = 25;
        d.confidence = 85;
    } else if (utilization < 0.3 && agent_count > 1) {
        d.action = SCALING_ACTION_SCALE_DOWN;
        d.target_agents = std::max(1, static_cast<int>(std::floor(demand / 3.0)));
        d.reason = "Low utilization detected";
        d.estimated_impact = 15;
        d.confidence = 75;
    } else {
        d.action = SCALING_ACTION_MAINTAIN;
        d.target_agents = agent_count;
        d.reason = "Optimal utilization";
        d.estimated_impact = 0;
        d.confidence = 90;
    }
    return d;
}

std::vector<optimization_suggestion> sub_agent_coordinator::optimize_performance() const {
    std::vector<optimization_suggestion> suggestions;
    auto agents = pimpl->registry.list();

    if (!agents.empty()) {
        double mean = 0.0;
        for (const auto & agent : agents) {
            mean += agent.current_load();
        }
        mean /= agents.size();

        double variance = 0.0;
        for (const auto & agent : agents) {
            double d = agent.current_load() - mean;
            variance += d * d;
        }
        variance /= agents.size();

        if (std::sqrt(variance) > 0.3) {
            optimization_suggestion s;
            s.type = "task_distribution";
            s.priority = SUGGESTION_PRIORITY_HIGH;
            s.description = "Agent load is unevenly distributed; rebalance task assignment";
            suggestions.push_back(s);
        }
    }

    optimization_suggestion under;
    under.type = "agent_allocation";
    under.priority = SUGGESTION_PRIORITY_MEDIUM;
    under.description = "Reassign work away from underperforming agents";
    for (const auto & agent : agents) {
        if (agent.performance.efficiency < 70 || agent.performance.error_rate > 0.1) {
            under.agents.push_back(agent.agent_id);
        }
    }
    if (!under.agents.empty()) {
        suggestions.push_back(under);
    }

    int64_t unassignable;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        unassignable = pimpl->unassignable_count;
    }
    if (unassignable > 0) {
        optimization_suggestion s;
        s.type = "workflow_optimization";
        s.priority = SUGGESTION_PRIORITY_HIGH;
        s.description = std::to_string(unassignable) + " tasks found no capable agent with free capacity";
        suggestions.push_back(s);
    }

    std::stable_sort(suggestions.begin(), suggestions.end(),
                     [](const optimization_suggestion & a, const optimization_suggestion & b) {
                         return a.priority < b.priority;
                     });
    return suggestions;
}

std::vector<agent_health_status> sub_agent_coordinator::get_agent_health(
        const std::optional<std::string> & agent_id) const {
    int64_t interval;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        interval = pimpl->config.orchestration.heartbeat_interval_ms;
    }
    return pimpl->registry.health(agent_id, interval);
}

void sub_agent_coordinator::run_health_check() {
    pimpl->health_pass();
}

coordination_metrics sub_agent_coordinator::get_coordination_metrics() const {
    coordination_metrics m;
    for (const auto & agent : pimpl->registry.list()) {
        m.agents_by_status[agent_status_to_str(agent.status)]++;
        m.total_agents++;
    }

    std::lock_guard<std::mutex> lock(pimpl->mutex);
    m.active_tasks       = pimpl->active_task_count_locked();
    m.completed_tasks    = pimpl->completed_count;
    m.failed_tasks       = pimpl->failed_count;
    m.unassignable_tasks = pimpl->unassignable_count;
    m.delegations        = pimpl->delegation_count;
    m.system_load        = pimpl->system_load_locked();
    return m;
}

std::optional<sub_agent> sub_agent_coordinator::get_agent(const std::string & agent_id) const {
    return pimpl->registry.get(agent_id);
}

std::vector<sub_agent> sub_agent_coordinator::list_agents() const {
    return pimpl->registry.list();
}

void sub_agent_coordinator::set_event_callback(event_callback callback) {
    std::lock_guard<std::mutex> lock(pimpl->callback_mutex);
    pimpl->on_event = std::move(callback);
}

void sub_agent_coordinator::set_resource_sampler(resource_sampler sampler) {
    std::lock_guard<std::mutex> lock(pimpl->callback_mutex);
    pimpl->sampler = std::move(sampler);
}

void sub_agent_coordinator::update_config(const relay_config & config) {
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        pimpl->config = config;
    }
    pimpl->registry.set_max_agents(config.orchestration.max_concurrent_sub_agents);
}

} // namespace relay

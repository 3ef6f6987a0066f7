#include "task.h"

#include <stdexcept>

namespace relay {

std::string task_status_to_str(task_status status) {
    switch (status) {
        case TASK_STATUS_PENDING:     return "pending";
        case TASK_STATUS_ASSIGNED:    return "assigned";
        case TASK_STATUS_IN_PROGRESS: return "in_progress";
        case TASK_STATUS_COMPLETED:   return "completed";
        case TASK_STATUS_FAILED:      return "failed";
        case TASK_STATUS_CANCELLED:   return "cancelled";
        case TASK_STATUS_TIMEOUT:     return "timeout";
        default:                      return "pending";
    }
}

task_status str_to_task_status(const std::string & str) {
    if (str == "assigned")    return TASK_STATUS_ASSIGNED;
    if (str == "in_progress") return TASK_STATUS_IN_PROGRESS;
    if (str == "completed")   return TASK_STATUS_COMPLETED;
    if (str == "failed")      return TASK_STATUS_FAILED;
    if (str == "cancelled")   return TASK_STATUS_CANCELLED;
    if (str == "timeout")     return TASK_STATUS_TIMEOUT;
    return TASK_STATUS_PENDING;
}

bool task_status_is_terminal(task_status status) {
    return status == TASK_STATUS_COMPLETED ||
           status == TASK_STATUS_FAILED ||
           status == TASK_STATUS_CANCELLED ||
           status == TASK_STATUS_TIMEOUT;
}

std::string delegation_strategy_to_str(delegation_strategy strategy) {
    switch (strategy) {
        case DELEGATION_STRATEGY_PARALLEL:   return "parallel";
        case DELEGATION_STRATEGY_SEQUENTIAL: return "sequential";
        case DELEGATION_STRATEGY_PIPELINE:   return "pipeline";
        case DELEGATION_STRATEGY_ADAPTIVE:   return "adaptive";
        default:                             return "parallel";
    }
}

delegation_strategy str_to_delegation_strategy(const std::string & str) {
    if (str == "parallel")   return DELEGATION_STRATEGY_PARALLEL;
    if (str == "sequential") return DELEGATION_STRATEGY_SEQUENTIAL;
    if (str == "pipeline")   return DELEGATION_STRATEGY_PIPELINE;
    if (str == "adaptive")   return DELEGATION_STRATEGY_ADAPTIVE;
    throw std::invalid_argument("unknown delegation strategy: " + str);
}

std::string aggregation_method_to_str(aggregation_method method) {
    switch (method) {
        case AGGREGATION_METHOD_MERGE:            return "merge";
        case AGGREGATION_METHOD_SELECT_BEST:      return "select_best";
        case AGGREGATION_METHOD_VOTE:             return "vote";
        case AGGREGATION_METHOD_WEIGHTED_AVERAGE: return "weighted_average";
        case AGGREGATION_METHOD_CUSTOM:           return "custom";
        default:                                  return "merge";
    }
}

aggregation_method str_to_aggregation_method(const std::string & str) {
    if (str == "merge")            return AGGREGATION_METHOD_MERGE;
    if (str == "select_best")      return AGGREGATION_METHOD_SELECT_BEST;
    if (str == "vote")             return AGGREGATION_METHOD_VOTE;
    if (str == "weighted_average") return AGGREGATION_METHOD_WEIGHTED_AVERAGE;
    if (str == "custom")           return AGGREGATION_METHOD_CUSTOM;
    throw std::invalid_argument("unknown aggregation method: " + str);
}

json task_metrics::to_json() const {
    return json{
        {"executionTime", execution_time_ms},
        {"qualityScore", quality_score},
        {"accuracy", accuracy},
        {"completeness", completeness},
        {"confidence", confidence}
    };
}

task_metrics task_metrics::from_json(const json & j) {
    task_metrics m;
    m.execution_time_ms = j.value("executionTime", 0.0);
    m.quality_score     = j.value("qualityScore", 0.0);
    m.accuracy          = j.value("accuracy", 0.0);
    m.completeness      = j.value("completeness", 0.0);
    m.confidence        = j.value("confidence", 0.0);
    return m;
}

json sub_agent_task::to_json() const {
    return json{
        {"taskId", task_id},
        {"operation", operation},
        {"input", input},
        {"priority", static_cast<int>(priority)},
        {"timeout", timeout_ms},
        {"dependencies", dependencies},
        {"retries", retries},
        {"maxRetries", max_retries},
        {"expectedOutput", expected_output}
    };
}

sub_agent_task sub_agent_task::from_json(const json & j) {
    sub_agent_task t;
    t.task_id         = j.value("taskId", "");
    t.operation       = j.value("operation", "");
    t.input           = j.contains("input") ? j.at("input") : json::object();
    t.priority        = int_to_message_priority(j.value("priority", static_cast<int>(MESSAGE_PRIORITY_NORMAL)));
    t.timeout_ms      = j.value("timeout", static_cast<int64_t>(0));
    t.dependencies    = j.value("dependencies", std::vector<std::string>());
    t.retries         = j.value("retries", 0);
    t.max_retries     = j.value("maxRetries", 3);
    t.expected_output = j.contains("expectedOutput") ? j.at("expectedOutput") : json();
    return t;
}

json task_execution::to_json() const {
    json j{
        {"taskId", task_id},
        {"agentId", agent_id},
        {"status", task_status_to_str(status)},
        {"startTime", start_time},
        {"endTime", end_time},
        {"duration", duration_ms},
        {"result", result}
    };
    if (!error.empty()) {
        j["error"] = error;
    }
    if (metrics) {
        j["metrics"] = metrics->to_json();
    }
    return j;
}

json aggregation_rules::to_json() const {
    return json{
        {"method", aggregation_method_to_str(method)},
        {"qualityThreshold", quality_threshold}
    };
}

aggregation_rules aggregation_rules::from_json(const json & j) {
    aggregation_rules r;
    r.method = str_to_aggregation_method(j.value("method", "merge"));
    r.quality_threshold = j.value("qualityThreshold", 0.0);
    return r;
}

json delegation_request::to_json() const {
    json tasks_json = json::array();
    for (const auto & task : tasks) {
        tasks_json.push_back(task.to_json());
    }
    return json{
        {"delegationId", delegation_id},
        {"tasks", tasks_json},
        {"strategy", {{"type", delegation_strategy_to_str(strategy)}}},
        {"aggregationRules", aggregation.to_json()},
        {"timeout", timeout_ms}
    };
}

delegation_request delegation_request::from_json(const json & j) {
    delegation_request r;
    r.delegation_id = j.value("delegationId", "");
    if (j.contains("tasks")) {
        for (const auto & t : j.at("tasks")) {
            r.tasks.push_back(sub_agent_task::from_json(t));
        }
    }
    if (j.contains("strategy")) {
        const json & s = j.at("strategy");
        r.strategy = str_to_delegation_strategy(s.is_string() ? s.get<std::string>() : s.value("type", "parallel"));
    }
    if (j.contains("aggregationRules")) {
        r.aggregation = aggregation_rules::from_json(j.at("aggregationRules"));
    }
    r.timeout_ms = j.value("timeout", static_cast<int64_t>(0));
    return r;
}

json resource_utilization::to_json() const {
    return json{
        {"cpu", cpu},
        {"memory", memory},
        {"network", network},
        {"storage", storage}
    };
}

json quality_metrics::to_json() const {
    return json{
        {"accuracy", accuracy},
        {"completeness", completeness},
        {"confidence", confidence},
        {"qualityScore", quality_score}
    };
}

json delegation_metrics::to_json() const {
    return json{
        {"totalExecutionTime", total_execution_time_ms},
        {"averageTaskTime", average_task_time_ms},
        {"parallelEfficiency", parallel_efficiency},
        {"resourceUtilization", resources.to_json()},
        {"qualityMetrics", quality.to_json()},
        {"agentUtilization", agent_utilization}
    };
}

json delegation_result::to_json() const {
    json results = json::array();
    for (const auto & exec : task_results) {
        results.push_back(exec.to_json());
    }
    json j{
        {"delegationId", delegation_id},
        {"success", success},
        {"totalTasks", total_tasks},
        {"completedTasks", completed_tasks},
        {"failedTasks", failed_tasks},
        {"skippedTasks", skipped_tasks},
        {"aggregatedResult", aggregated_result},
        {"duration", duration_ms},
        {"taskResults", results},
        {"metrics", metrics.to_json()}
    };
    if (!error.empty()) {
        j["error"] = error;
    }
    return j;
}

} // namespace relay

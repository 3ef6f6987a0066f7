#pragma once

#include "message.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace relay {

enum task_status {
    TASK_STATUS_PENDING,
    TASK_STATUS_ASSIGNED,
    TASK_STATUS_IN_PROGRESS,
    TASK_STATUS_COMPLETED,
    TASK_STATUS_FAILED,
    TASK_STATUS_CANCELLED,
    TASK_STATUS_TIMEOUT
};

std::string task_status_to_str(task_status status);
task_status str_to_task_status(const std::string & str);

// completed, failed, cancelled or timeout
bool task_status_is_terminal(task_status status);

enum delegation_strategy {
    DELEGATION_STRATEGY_PARALLEL,
    DELEGATION_STRATEGY_SEQUENTIAL,
    DELEGATION_STRATEGY_PIPELINE,
    DELEGATION_STRATEGY_ADAPTIVE
};

std::string delegation_strategy_to_str(delegation_strategy strategy);
delegation_strategy str_to_delegation_strategy(const std::string & str);

enum aggregation_method {
    AGGREGATION_METHOD_MERGE,
    AGGREGATION_METHOD_SELECT_BEST,
    AGGREGATION_METHOD_VOTE,
    AGGREGATION_METHOD_WEIGHTED_AVERAGE,
    AGGREGATION_METHOD_CUSTOM
};

std::string aggregation_method_to_str(aggregation_method method);
aggregation_method str_to_aggregation_method(const std::string & str);

struct task_metrics {
    double execution_time_ms = 0.0;
    double quality_score = 0.0;
    double accuracy = 0.0;
    double completeness = 0.0;
    double confidence = 0.0;

    json to_json() const;
    static task_metrics from_json(const json & j);
};

struct sub_agent_task {
    std::string task_id;
    std::string operation;
    json input = json::object();
    message_priority priority = MESSAGE_PRIORITY_NORMAL;
    int64_t timeout_ms = 0;      // 0 = coordinator default
    std::vector<std::string> dependencies;
    int retries = 0;
    int max_retries = 3;
    json expected_output;

    json to_json() const;
    static sub_agent_task from_json(const json & j);
};

struct task_execution {
    std::string task_id;
    std::string agent_id;        // fixed once assigned
    task_status status = TASK_STATUS_PENDING;
    int64_t start_time = 0;
    int64_t end_time = 0;
    double duration_ms = 0.0;
    json result;
    std::string error;
    std::optional<task_metrics> metrics;

    bool is_terminal() const { return task_status_is_terminal(status); }

    json to_json() const;
};

struct aggregation_rules {
    aggregation_method method = AGGREGATION_METHOD_MERGE;
    double quality_threshold = 0.0;  // > 0 drops results scored below it

    json to_json() const;
    static aggregation_rules from_json(const json & j);
};

struct delegation_request {
    std::string delegation_id;
    std::vector<sub_agent_task> tasks;
    delegation_strategy strategy = DELEGATION_STRATEGY_PARALLEL;
    aggregation_rules aggregation;
    int64_t timeout_ms = 0;      // whole delegation, 0 = none

    json to_json() const;
    static delegation_request from_json(const json & j);
};

struct resource_utilization {
    double cpu = 0.0;
    double memory = 0.0;
    double network = 0.0;
    double storage = 0.0;

    json to_json() const;
};

struct quality_metrics {
    double accuracy = 0.0;
    double completeness = 0.0;
    double confidence = 0.0;
    double quality_score = 0.0;

    json to_json() const;
};

struct delegation_metrics {
    double total_execution_time_ms = 0.0;
    double average_task_time_ms = 0.0;
    double parallel_efficiency = 0.0;
    resource_utilization resources;
    quality_metrics quality;
    std::map<std::string, int> agent_utilization;

    json to_json() const;
};

struct delegation_result {
    std::string delegation_id;
    bool success = false;
    int total_tasks = 0;
    int completed_tasks = 0;
    int failed_tasks = 0;        // failed + timeout + cancelled
    int skipped_tasks = 0;       // never assigned (sequential/pipeline halt)
    json aggregated_result;
    double duration_ms = 0.0;
    std::vector<task_execution> task_results;
    delegation_metrics metrics;
    std::string error;

    json to_json() const;
};

} // namespace relay

#include "aggregation.h"

#include <map>
#include <stdexcept>
#include <utility>

namespace relay {

static bool is_empty_result(const json & result) {
    if (result.is_null()) {
        return true;
    }
    if (result.is_object() || result.is_array() || result.is_string()) {
        return result.empty() || (result.is_string() && result.get<std::string>().empty());
    }
    return false;
}

static double quality_of(const task_execution & execution) {
    return execution.metrics ? execution.metrics->quality_score : 0.0;
}

bool result_qualifies(const task_execution & execution, const aggregation_rules & rules) {
    if (execution.status != TASK_STATUS_COMPLETED || is_empty_result(execution.result)) {
        return false;
    }
    if (rules.quality_threshold > 0 && quality_of(execution) < rules.quality_threshold) {
        return false;
    }
    return true;
}

json merge_results(const std::vector<json> & results) {
    if (results.size() == 1) {
        return results[0];
    }

    json merged = json::object();
    for (const auto & result : results) {
        if (!result.is_object()) {
            continue;
        }
        for (auto it = result.begin(); it != result.end(); ++it) {
            merged[it.key()] = it.value();
        }
    }
    return merged;
}

static json select_best(const std::vector<const task_execution *> & executions) {
    const task_execution * best = executions[0];
    for (const auto * exec : executions) {
        if (quality_of(*exec) > quality_of(*best)) {
            best = exec;
        }
    }
    return best->result;
}

static json vote(const std::vector<const task_execution *> & executions) {
    std::vector<std::pair<json, int>> tally;
    for (const auto * exec : executions) {
        bool found = false;
        for (auto & [value, count] : tally) {
            if (value == exec->result) {
                count++;
                found = true;
                break;
            }
        }
        if (!found) {
            tally.emplace_back(exec->result, 1);
        }
    }

    size_t winner = 0;
    for (size_t i = 1; i < tally.size(); i++) {
        if (tally[i].second > tally[winner].second) {
            winner = i;
        }
    }
    return tally[winner].first;
}

static json weighted_average(const std::vector<const task_execution *> & executions) {
    double total_weight = 0.0;
    std::map<std::string, double> weighted_sum;

    for (const auto * exec : executions) {
        double weight = quality_of(*exec);
        if (weight == 0.0) {
            weight = 1.0;
        }
        total_weight += weight;

        if (!exec->result.is_object()) {
            continue;
        }
        for (auto it = exec->result.begin(); it != exec->result.end(); ++it) {
            if (it.value().is_number()) {
                weighted_sum[it.key()] += it.value().get<double>() * weight;
            }
        }
    }

    json averaged = json::object();
    for (const auto & [key, sum] : weighted_sum) {
        averaged[key] = sum / total_weight;
    }
    return averaged;
}

json aggregate_results(const std::vector<task_execution> & executions, const aggregation_rules & rules) {
    std::vector<const task_execution *> qualifying;
    for (const auto & exec : executions) {
        if (result_qualifies(exec, rules)) {
            qualifying.push_back(&exec);
        }
    }

    if (qualifying.empty()) {
        throw std::runtime_error("No successful task results to aggregate");
    }

    switch (rules.method) {
        case AGGREGATION_METHOD_SELECT_BEST:
            return select_best(qualifying);
        case AGGREGATION_METHOD_VOTE:
            return vote(qualifying);
        case AGGREGATION_METHOD_WEIGHTED_AVERAGE:
            return weighted_average(qualifying);
        case AGGREGATION_METHOD_MERGE:
        case AGGREGATION_METHOD_CUSTOM:
        default:
            {
                std::vector<json> results;
                results.reserve(qualifying.size());
                for (const auto * exec : qualifying) {
                    results.push_back(exec->result);
                }
                return merge_results(results);
            }
    }
}

} // namespace relay

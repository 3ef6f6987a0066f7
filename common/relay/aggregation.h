#pragma once

#include "task.h"

#include <vector>

namespace relay {

// True if the execution completed with a non-empty result that meets the threshold
bool result_qualifies(const task_execution & execution, const aggregation_rules & rules);

// Combine the results of qualifying executions:
//   merge            - shallow union of object results (later keys win)
//   select_best      - result with the highest metrics.quality_score
//   vote             - most frequent result by deep equality, first seen wins ties
//   weighted_average - per numeric field sum(value * w) / sum(w), w = quality_score (1 if unset)
//   custom           - same as merge
// Throws std::runtime_error when no execution qualifies.
json aggregate_results(const std::vector<task_execution> & executions, const aggregation_rules & rules);

json merge_results(const std::vector<json> & results);

} // namespace relay

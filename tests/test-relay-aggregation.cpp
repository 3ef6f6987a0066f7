// Test suite for result aggregation and the task model

#include "../common/relay/aggregation.h"
#include "../common/relay/log.h"
#include "../common/relay/task.h"

#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace relay;

// Test helpers
#define TEST_ASSERT(cond, msg) do { \
    if (!(cond)) { \
        std::cerr << "FAIL: " << msg << " at " << __FILE__ << ":" << __LINE__ << std::endl; \
        return false; \
    } \
} while(0)

#define RUN_TEST(test_func) do { \
    std::cout << "Running " << #test_func << "..." << std::endl; \
    if (test_func()) { \
        std::cout << "  PASS" << std::endl; \
        passed++; \
    } else { \
        std::cout << "  FAIL" << std::endl; \
        failed++; \
    } \
    total++; \
} while(0)

static task_execution completed(const std::string & id, const json & result, double quality = -1) {
    task_execution e;
    e.task_id = id;
    e.agent_id = "agent-" + id;
    e.status = TASK_STATUS_COMPLETED;
    e.result = result;
    if (quality >= 0) {
        task_metrics m;
        m.quality_score = quality;
        e.metrics = m;
    }
    return e;
}

static aggregation_rules rules_for(aggregation_method method, double threshold = 0.0) {
    aggregation_rules r;
    r.method = method;
    r.quality_threshold = threshold;
    return r;
}

// Forward declarations
static bool test_merge_single_result();
static bool test_merge_union();
static bool test_select_best();
static bool test_vote();
static bool test_weighted_average();
static bool test_quality_threshold();
static bool test_no_qualifying_results();
static bool test_task_status_helpers();
static bool test_delegation_request_from_json();
static bool test_task_execution_json();

// Test 1: A single result is returned as-is
static bool test_merge_single_result() {
    json arr = json::array({1, 2, 3});
    json out = aggregate_results({completed("a", arr)}, rules_for(AGGREGATION_METHOD_MERGE));
    TEST_ASSERT(out == arr, "single result should pass through unchanged");

    json text = "summary";
    out = aggregate_results({completed("a", text)}, rules_for(AGGREGATION_METHOD_CUSTOM));
    TEST_ASSERT(out == text, "custom behaves like merge");

    return true;
}

// Test 2: Object results are unioned, later keys win
static bool test_merge_union() {
    json out = aggregate_results({
        completed("a", json{{"x", 1}, {"shared", "first"}}),
        completed("b", json{{"y", 2}, {"shared", "second"}}),
    }, rules_for(AGGREGATION_METHOD_MERGE));

    TEST_ASSERT(out["x"] == 1 && out["y"] == 2, "keys from both results");
    TEST_ASSERT(out["shared"] == "second", "later result wins");

    json skipped = merge_results({json{{"x", 1}}, json::array({5})});
    TEST_ASSERT(skipped == json({{"x", 1}}), "non-object results are skipped when merging");

    return true;
}

// Test 3: Highest quality wins
static bool test_select_best() {
    json out = aggregate_results({
        completed("a", json{{"answer", "ok"}}, 60),
        completed("b", json{{"answer", "good"}}, 90),
        completed("c", json{{"answer", "fine"}}, 75),
    }, rules_for(AGGREGATION_METHOD_SELECT_BEST));
    TEST_ASSERT(out["answer"] == "good", "highest quality result selected");

    out = aggregate_results({
        completed("a", json{{"answer", "first"}}),
        completed("b", json{{"answer", "second"}}),
    }, rules_for(AGGREGATION_METHOD_SELECT_BEST));
    TEST_ASSERT(out["answer"] == "first", "first result wins without metrics");

    return true;
}

// Test 4: Most frequent result by deep equality
static bool test_vote() {
    json yes = json{{"label", "spam"}, {"tags", json::array({"a", "b"})}};
    json no  = json{{"label", "ham"}};

    json out = aggregate_results({
        completed("a", no),
        completed("b", yes),
        completed("c", yes),
    }, rules_for(AGGREGATION_METHOD_VOTE));
    TEST_ASSERT(out == yes, "majority result wins");

    out = aggregate_results({
        completed("a", no),
        completed("b", yes),
    }, rules_for(AGGREGATION_METHOD_VOTE));
    TEST_ASSERT(out == no, "first seen wins a tie");

    return true;
}

// Test 5: Quality-weighted numeric fields
static bool test_weighted_average() {
    json out = aggregate_results({
        completed("a", json{{"score", 10}, {"label", "x"}}, 0.8),
        completed("b", json{{"score", 20}}, 0.2),
    }, rules_for(AGGREGATION_METHOD_WEIGHTED_AVERAGE));

    TEST_ASSERT(std::abs(out["score"].get<double>() - 12.0) < 1e-9, "weighted score");
    TEST_ASSERT(!out.contains("label"), "non-numeric fields are dropped");

    out = aggregate_results({
        completed("a", json{{"v", 1}}),
        completed("b", json{{"v", 3}}),
    }, rules_for(AGGREGATION_METHOD_WEIGHTED_AVERAGE));
    TEST_ASSERT(std::abs(out["v"].get<double>() - 2.0) < 1e-9, "unscored results weigh 1");

    return true;
}

// Test 6: Threshold filters low-quality and empty results
static bool test_quality_threshold() {
    std::vector<task_execution> execs = {
        completed("low", json{{"low", true}}, 40),
        completed("high", json{{"high", true}}, 85),
        completed("empty", json::object(), 95),
    };

    aggregation_rules rules = rules_for(AGGREGATION_METHOD_MERGE, 50);
    TEST_ASSERT(!result_qualifies(execs[0], rules), "below threshold");
    TEST_ASSERT(result_qualifies(execs[1], rules), "above threshold");
    TEST_ASSERT(!result_qualifies(execs[2], rules), "empty result never qualifies");

    json out = aggregate_results(execs, rules);
    TEST_ASSERT(out == json({{"high", true}}), "only the qualifying result remains");

    task_execution failed = completed("f", json{{"x", 1}}, 99);
    failed.status = TASK_STATUS_FAILED;
    TEST_ASSERT(!result_qualifies(failed, rules_for(AGGREGATION_METHOD_MERGE)), "failed tasks never qualify");

    return true;
}

// Test 7: Nothing to aggregate
static bool test_no_qualifying_results() {
    task_execution timed_out;
    timed_out.task_id = "t";
    timed_out.status = TASK_STATUS_TIMEOUT;

    bool threw = false;
    try {
        aggregate_results({timed_out, completed("e", json())}, rules_for(AGGREGATION_METHOD_MERGE));
    } catch (const std::runtime_error & e) {
        threw = std::string(e.what()) == "No successful task results to aggregate";
    }
    TEST_ASSERT(threw, "empty aggregation should throw");

    threw = false;
    try {
        aggregate_results({}, rules_for(AGGREGATION_METHOD_VOTE));
    } catch (const std::runtime_error &) {
        threw = true;
    }
    TEST_ASSERT(threw, "no executions should throw");

    return true;
}

// Test 8: Status and strategy names
static bool test_task_status_helpers() {
    TEST_ASSERT(task_status_is_terminal(TASK_STATUS_TIMEOUT), "timeout is terminal");
    TEST_ASSERT(task_status_is_terminal(TASK_STATUS_CANCELLED), "cancelled is terminal");
    TEST_ASSERT(!task_status_is_terminal(TASK_STATUS_IN_PROGRESS), "in progress is not terminal");
    TEST_ASSERT(str_to_task_status(task_status_to_str(TASK_STATUS_IN_PROGRESS)) == TASK_STATUS_IN_PROGRESS, "status names");

    TEST_ASSERT(str_to_delegation_strategy("pipeline") == DELEGATION_STRATEGY_PIPELINE, "strategy name");
    TEST_ASSERT(str_to_aggregation_method("weighted_average") == AGGREGATION_METHOD_WEIGHTED_AVERAGE, "method name");

    bool threw = false;
    try {
        str_to_delegation_strategy("round_robin");
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    TEST_ASSERT(threw, "unknown strategy should throw");

    return true;
}

// Test 9: Delegation request wire form
static bool test_delegation_request_from_json() {
    json j = json::parse(R"({
        "delegationId": "d-1",
        "tasks": [
            {"taskId": "t1", "operation": "analyze", "input": {"doc": 1}, "priority": 1, "timeout": 500},
            {"taskId": "t2", "operation": "summarize"}
        ],
        "strategy": {"type": "sequential"},
        "aggregationRules": {"method": "select_best", "qualityThreshold": 70},
        "timeout": 2000
    })");

    delegation_request r = delegation_request::from_json(j);
    TEST_ASSERT(r.delegation_id == "d-1", "delegation id");
    TEST_ASSERT(r.tasks.size() == 2, "two tasks");
    TEST_ASSERT(r.tasks[0].input["doc"] == 1, "task input");
    TEST_ASSERT(r.tasks[0].priority == MESSAGE_PRIORITY_HIGH, "task priority");
    TEST_ASSERT(r.tasks[0].timeout_ms == 500, "task timeout");
    TEST_ASSERT(r.tasks[1].input.is_object() && r.tasks[1].input.empty(), "missing input defaults to an object");
    TEST_ASSERT(r.tasks[1].max_retries == 3, "default retries");
    TEST_ASSERT(r.strategy == DELEGATION_STRATEGY_SEQUENTIAL, "strategy");
    TEST_ASSERT(r.aggregation.method == AGGREGATION_METHOD_SELECT_BEST, "aggregation method");
    TEST_ASSERT(r.aggregation.quality_threshold == 70, "quality threshold");
    TEST_ASSERT(r.timeout_ms == 2000, "delegation timeout");

    json plain = json{{"delegationId", "d-2"}, {"strategy", "pipeline"}};
    TEST_ASSERT(delegation_request::from_json(plain).strategy == DELEGATION_STRATEGY_PIPELINE, "string strategy");

    return true;
}

// Test 10: Execution records serialize their outcome
static bool test_task_execution_json() {
    task_execution ok = completed("t1", json{{"v", 1}}, 88);
    json j = ok.to_json();
    TEST_ASSERT(j["status"] == "completed", "status name");
    TEST_ASSERT(j["metrics"]["qualityScore"] == 88.0, "metrics included");
    TEST_ASSERT(!j.contains("error"), "no error on success");

    task_execution bad;
    bad.task_id = "t2";
    bad.status = TASK_STATUS_FAILED;
    bad.error = "boom";
    j = bad.to_json();
    TEST_ASSERT(j["error"] == "boom", "error included");
    TEST_ASSERT(!j.contains("metrics"), "no metrics without a report");

    return true;
}

int main() {
    std::cout << "=== Relay Aggregation Tests ===" << std::endl << std::endl;
    relay_log_set_level(RELAY_LOG_LEVEL_ERROR);

    int total = 0;
    int passed = 0;
    int failed = 0;

    // Aggregation
    RUN_TEST(test_merge_single_result);
    RUN_TEST(test_merge_union);
    RUN_TEST(test_select_best);
    RUN_TEST(test_vote);
    RUN_TEST(test_weighted_average);
    RUN_TEST(test_quality_threshold);
    RUN_TEST(test_no_qualifying_results);

    // Task model
    RUN_TEST(test_task_status_helpers);
    RUN_TEST(test_delegation_request_from_json);
    RUN_TEST(test_task_execution_json);

    std::cout << std::endl << "=== Test Results ===" << std::endl;
    std::cout << "Total:  " << total << std::endl;
    std::cout << "Passed: " << passed << std::endl;
    std::cout << "Failed: " << failed << std::endl;

    if (failed == 0) {
        std::cout << std::endl << "All tests passed! ✓" << std::endl;
        return 0;
    } else {
        std::cout << std::endl << "Some tests failed! ✗" << std::endl;
        return 1;
    }
}

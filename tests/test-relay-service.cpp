// Test suite for the communication service facade

#include "../common/relay/comm_service.h"
#include "../common/relay/config.h"
#include "../common/relay/log.h"
#include "../common/relay/message.h"
#include "../common/relay/transport.h"

#include <algorithm>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

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

static relay_config service_config() {
    relay_config cfg;
    cfg.log_level = RELAY_LOG_LEVEL_ERROR;
    cfg.orchestration.poll_interval_ms = 10;
    cfg.orchestration.task_timeout_ms = 2000;
    return cfg;
}

static routing_table_entry server(const std::string & id) {
    routing_table_entry e;
    e.server_id = id;
    e.capabilities = {"agents"};
    return e;
}

static bool throws_runtime(const std::function<void()> & fn, const std::string & expected) {
    try {
        fn();
    } catch (const std::runtime_error & e) {
        return std::string(e.what()).find(expected) != std::string::npos;
    }
    return false;
}

// Forward declarations
static bool test_lifecycle();
static bool test_start_rejects_invalid_config();
static bool test_route_request();
static bool test_route_failure_recorded();
static bool test_broadcast_message();
static bool test_external_coordinators();
static bool test_sub_agent_messages();
static bool test_delegate_through_messages();
static bool test_delegation_disabled();
static bool test_system_health();
static bool test_update_configuration();
static bool test_metrics_snapshot();
static bool test_destructor_stops_direct_loops();

// Test 1: Start, stop and the running guard
static bool test_lifecycle() {
    std::vector<std::string> events;
    auto transport = std::make_shared<local_transport>();
    communication_service service(service_config(), transport);
    service.set_event_callback([&](const std::string & event, const json &) { events.push_back(event); });

    base_message msg = base_message::make("client", "srv-a", "ping", MESSAGE_TYPE_REQUEST);
    TEST_ASSERT(throws_runtime([&] { service.send_message(msg); }, "Communication service is not running"),
                "stopped service rejects messages");

    service.start();
    TEST_ASSERT(service.is_running(), "service running");
    TEST_ASSERT(throws_runtime([&] { service.start(); }, "already running"), "double start rejected");

    service.stop();
    TEST_ASSERT(!service.is_running(), "service stopped");
    service.stop();

    TEST_ASSERT(events.size() == 2, "start and stop events only");
    TEST_ASSERT(events[0] == "service_started" && events[1] == "service_stopped", "lifecycle events");

    return true;
}

// Test 2: Configuration is checked before anything starts
static bool test_start_rejects_invalid_config() {
    relay_config cfg = service_config();
    cfg.performance.max_latency_ms = 0;
    communication_service service(cfg, std::make_shared<local_transport>());

    bool threw = false;
    try {
        service.start();
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    TEST_ASSERT(threw, "invalid config rejected");
    TEST_ASSERT(!service.is_running(), "service did not start");

    return true;
}

// Test 3: Plain requests go to the router
static bool test_route_request() {
    auto transport = std::make_shared<local_transport>();
    communication_service service(service_config(), transport);
    service.register_server(server("srv-a"));

    std::string received_op;
    transport->set_handler("srv-a", [&](const base_message & m) {
        received_op = m.header.operation;
        return delivery_result::ok(json{{"pong", true}});
    });

    service.start();
    json out = service.send_message(base_message::make("client", "srv-a", "ping", MESSAGE_TYPE_REQUEST));

    TEST_ASSERT(out["success"] == true, "delivered");
    TEST_ASSERT(out["targetServer"] == "srv-a", "target server reported");
    TEST_ASSERT(out["response"]["pong"] == true, "server response returned");
    TEST_ASSERT(received_op == "ping", "handler saw the message");
    TEST_ASSERT(service.monitor().message_count() == 1, "dispatch recorded");
    TEST_ASSERT(service.monitor().get_latency_metrics().samples == 1, "latency sampled");

    return true;
}

// Test 4: Undeliverable messages are reported, not thrown
static bool test_route_failure_recorded() {
    auto transport = std::make_shared<local_transport>();
    communication_service service(service_config(), transport);
    service.start();

    json out = service.send_message(base_message::make("client", "srv-missing", "ping", MESSAGE_TYPE_REQUEST));
    TEST_ASSERT(out["success"] == false, "routing failed");
    TEST_ASSERT(out.contains("error"), "routing error reported");

    error_metrics em = service.monitor().get_error_metrics();
    TEST_ASSERT(em.total_errors == 1, "one error recorded");
    TEST_ASSERT(em.errors_by_type["delivery_failure"] == 1, "recorded as delivery failure");
    TEST_ASSERT(em.errors_by_server["srv-missing"] == 1, "attributed to the target");

    return true;
}

// Test 5: Broadcast messages fan out
static bool test_broadcast_message() {
    auto transport = std::make_shared<local_transport>();
    communication_service service(service_config(), transport);
    service.register_server(server("srv-a"));
    service.register_server(server("srv-b"));
    service.register_server(server("srv-c"));

    auto ok = [](const base_message &) { return delivery_result::ok(); };
    transport->set_handler("srv-a", ok);
    transport->set_handler("srv-b", ok);

    service.start();
    json out = service.send_message(base_message::make("client", "", "announce", MESSAGE_TYPE_BROADCAST));
    TEST_ASSERT(out["success"] == true, "broadcast delivered somewhere");
    TEST_ASSERT(out["deliveredCount"] == 2, "two deliveries");
    TEST_ASSERT(out["failedTargets"].size() == 1 && out["failedTargets"][0] == "srv-c", "srv-c failed");

    broadcast_result subset = service.broadcast_message(base_message::make("client", "", "announce", MESSAGE_TYPE_BROADCAST),
                                                        std::vector<std::string>{"srv-b"});
    TEST_ASSERT(subset.success && subset.delivered_count == 1, "explicit target list");

    return true;
}

// Test 6: Wave, persona chain and quality gate messages
static bool test_external_coordinators() {
    relay_config cfg = service_config();
    cfg.orchestration.enable_persona_chains = true;
    cfg.orchestration.enable_quality_gate_coordination = true;

    communication_service service(cfg, std::make_shared<local_transport>());
    service.start();

    base_message wave = base_message::make("client", "", "start_wave", MESSAGE_TYPE_WAVE_COORDINATION);
    TEST_ASSERT(throws_runtime([&] { service.send_message(wave); }, "Wave coordination is not enabled"),
                "disabled coordinator rejected");
    TEST_ASSERT(service.monitor().get_error_metrics().errors_by_type["message_routing_error"] == 1,
                "rejection recorded");

    base_message chain = base_message::make("client", "", "run_chain", MESSAGE_TYPE_PERSONA_CHAIN);
    TEST_ASSERT(throws_runtime([&] { service.send_message(chain); }, "no handler registered for persona_chain messages"),
                "enabled coordinator without handler rejected");

    service.set_coordinator_handler(MESSAGE_TYPE_PERSONA_CHAIN, [](const base_message & m) {
        return json{{"handled", m.header.operation}};
    });
    json out = service.send_message(chain);
    TEST_ASSERT(out["handled"] == "run_chain", "handler output returned");

    service.set_coordinator_handler(MESSAGE_TYPE_QUALITY_GATE, [](const base_message &) -> json {
        throw std::runtime_error("gate rejected");
    });
    base_message gate = base_message::make("client", "", "check", MESSAGE_TYPE_QUALITY_GATE);
    TEST_ASSERT(throws_runtime([&] { service.send_message(gate); }, "gate rejected"), "handler errors propagate");

    return true;
}

// Test 7: Agent management and task results as messages
static bool test_sub_agent_messages() {
    std::vector<std::string> events;
    auto transport = std::make_shared<local_transport>();
    communication_service service(service_config(), transport);
    service.register_server(server("srv-agents"));
    transport->set_handler("srv-agents", [](const base_message &) { return delivery_result::ok(); });

    service.set_event_callback([&](const std::string & event, const json &) { events.push_back(event); });
    service.start();

    json reg = service.send_message(base_message::make("client", "", "register_agent", MESSAGE_TYPE_SUB_AGENT_DELEGATION,
        json{{"agentId", "worker-1"}, {"serverId", "srv-agents"}, {"capabilities", {"analysis"}}, {"maxConcurrentTasks", 2}}));
    TEST_ASSERT(reg["success"] == true && reg["agentId"] == "worker-1", "agent registered");
    TEST_ASSERT(std::find(events.begin(), events.end(), "agent_registered") != events.end(), "coordinator events forwarded");

    json assigned = service.send_message(base_message::make("client", "", "assign_task", MESSAGE_TYPE_SUB_AGENT_DELEGATION,
        json{{"taskId", "job-1"}, {"operation", "analysis"}, {"input", {{"doc", "a"}}}}));
    TEST_ASSERT(assigned["status"] == "in_progress", "task dispatched");
    TEST_ASSERT(assigned["agentId"] == "worker-1", "task on worker-1");

    json reported = service.send_message(base_message::make("worker-1", "", "task_result", MESSAGE_TYPE_SUB_AGENT_DELEGATION,
        json{{"taskId", "job-1"}, {"result", {{"summary", "done"}}}, {"metrics", {{"qualityScore", 80}}}}));
    TEST_ASSERT(reported["success"] == true, "result accepted");

    auto exec = service.coordinator().monitor_task_progress("job-1");
    TEST_ASSERT(exec && exec->status == TASK_STATUS_COMPLETED, "task completed");
    TEST_ASSERT(exec->result["summary"] == "done", "result stored");
    TEST_ASSERT(exec->metrics && exec->metrics->quality_score == 80, "metrics stored");

    json again = service.send_message(base_message::make("worker-1", "", "task_result", MESSAGE_TYPE_SUB_AGENT_DELEGATION,
        json{{"taskId", "job-1"}, {"success", false}, {"error", "late"}}));
    TEST_ASSERT(again["success"] == false, "finished task cannot be reported again");

    json beat = service.send_message(base_message::make("worker-1", "", "agent_heartbeat", MESSAGE_TYPE_SUB_AGENT_DELEGATION,
        json{{"agentId", "worker-1"}}));
    TEST_ASSERT(beat["success"] == true, "heartbeat accepted");

    json gone = service.send_message(base_message::make("client", "", "unregister_agent", MESSAGE_TYPE_SUB_AGENT_DELEGATION,
        json{{"agentId", "worker-1"}}));
    TEST_ASSERT(gone["success"] == true, "agent unregistered");
    TEST_ASSERT(service.coordinator().list_agents().empty(), "no agents left");

    bool threw = false;
    try {
        service.send_message(base_message::make("client", "", "register_agent", MESSAGE_TYPE_SUB_AGENT_DELEGATION,
            json{{"agentId", "worker-2"}, {"serverId", "srv-agents"}}));
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    TEST_ASSERT(threw, "agent without capabilities rejected");

    return true;
}

// Test 8: A delegation request carried in a message
static bool test_delegate_through_messages() {
    auto transport = std::make_shared<local_transport>();
    communication_service service(service_config(), transport);
    service.register_server(server("srv-agents"));

    communication_service * svc = &service;
    transport->set_handler("srv-agents", [svc](const base_message & m) {
        const json & data = m.payload.data;
        std::string task_id = data.value("taskId", "");
        svc->report_task_result(task_id, true, json{{task_id, data["input"]}});
        return delivery_result::ok();
    });

    sub_agent agent;
    agent.agent_id = "worker-1";
    agent.server_id = "srv-agents";
    agent.capabilities = {"*"};
    agent.max_concurrent_tasks = 4;
    service.register_agent(agent);
    service.start();

    json request = json::parse(R"({
        "delegationId": "d-msg",
        "tasks": [
            {"taskId": "a", "operation": "embed", "input": {"n": 1}},
            {"taskId": "b", "operation": "embed", "input": {"n": 2}}
        ],
        "strategy": {"type": "parallel"},
        "aggregationRules": {"method": "merge"}
    })");

    json out = service.send_message(base_message::make("client", "", "delegate_tasks",
                                                       MESSAGE_TYPE_SUB_AGENT_DELEGATION, request));
    TEST_ASSERT(out["success"] == true, "delegation succeeded");
    TEST_ASSERT(out["completedTasks"] == 2, "both tasks completed");
    TEST_ASSERT(out["aggregatedResult"]["a"]["n"] == 1 && out["aggregatedResult"]["b"]["n"] == 2, "merged result");

    delegation_request direct = delegation_request::from_json(request);
    direct.delegation_id = "d-direct";
    delegation_result r = service.delegate_tasks(direct);
    TEST_ASSERT(r.success && r.completed_tasks == 2, "facade delegation");

    return true;
}

// Test 9: With delegation off, sub-agent traffic is refused
static bool test_delegation_disabled() {
    relay_config cfg = service_config();
    cfg.orchestration.enable_sub_agent_delegation = false;
    communication_service service(cfg, std::make_shared<local_transport>());
    service.start();

    base_message msg = base_message::make("client", "", "assign_task", MESSAGE_TYPE_SUB_AGENT_DELEGATION,
                                          json{{"taskId", "t"}, {"operation", "x"}});
    TEST_ASSERT(throws_runtime([&] { service.send_message(msg); }, "Sub-agent coordination is not enabled"),
                "delegation messages refused");

    sub_agent agent;
    agent.agent_id = "worker-1";
    agent.server_id = "srv";
    agent.capabilities = {"x"};
    TEST_ASSERT(throws_runtime([&] { service.register_agent(agent); }, "Sub-agent coordination is not enabled"),
                "agent registration refused");

    TEST_ASSERT(service.get_system_health().components.size() == 2, "no coordinator component");
    TEST_ASSERT(!service.get_metrics().contains("subAgents"), "no coordinator metrics");
    TEST_ASSERT(!service.coordinator().is_running(), "coordinator loop not started");

    return true;
}

// Test 10: Component health rolls up to the worst status
static bool test_system_health() {
    relay_config cfg = service_config();
    cfg.orchestration.heartbeat_interval_ms = 20;
    auto transport = std::make_shared<local_transport>();
    communication_service service(cfg, transport);
    service.start();

    system_health health = service.get_system_health();
    TEST_ASSERT(health.overall == HEALTH_STATUS_HEALTHY, "fresh service is healthy");
    TEST_ASSERT(health.components.size() == 3, "three components");
    TEST_ASSERT(health.components[0].component == "message_router", "router first");

    sub_agent agent;
    agent.agent_id = "worker-1";
    agent.server_id = "srv-agents";
    agent.capabilities = {"x"};
    service.register_agent(agent);

    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    service.coordinator().run_health_check();

    health = service.get_system_health();
    TEST_ASSERT(health.components[2].component == "sub_agent_coordinator", "coordinator component");
    TEST_ASSERT(health.components[2].status == HEALTH_STATUS_DEGRADED, "all agents offline");
    TEST_ASSERT(health.overall == HEALTH_STATUS_DEGRADED, "overall follows the worst component");

    json j = health.to_json();
    TEST_ASSERT(j["overall"] == "degraded", "health serializes");
    TEST_ASSERT(j["components"].size() == 3, "components serialize");

    service.agent_heartbeat("worker-1");
    service.send_message(base_message::make("client", "srv-missing", "ping", MESSAGE_TYPE_REQUEST));
    health = service.get_system_health();
    TEST_ASSERT(health.components[0].status == HEALTH_STATUS_DEGRADED, "failed routing degrades the router");
    TEST_ASSERT(health.components[1].status == HEALTH_STATUS_DEGRADED, "error rate degrades the monitor");

    return true;
}

// Test 11: Runtime reconfiguration
static bool test_update_configuration() {
    std::vector<std::string> events;
    communication_service service(service_config(), std::make_shared<local_transport>());
    service.set_event_callback([&](const std::string & event, const json &) { events.push_back(event); });
    service.start();

    relay_config bad = service.get_configuration();
    bad.performance.circuit_breaker_threshold = 0;
    bool threw = false;
    try {
        service.update_configuration(bad);
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    TEST_ASSERT(threw, "invalid update rejected");
    TEST_ASSERT(service.get_configuration().performance.circuit_breaker_threshold == 5, "old config kept");

    relay_config next = service.get_configuration();
    next.routing.strategy = ROUTING_STRATEGY_LEAST_CONNECTIONS;
    next.performance.max_latency_ms = 10;
    next.orchestration.enable_wave_coordination = true;
    service.update_configuration(next);

    relay_config current = service.get_configuration();
    TEST_ASSERT(current.routing.strategy == ROUTING_STRATEGY_LEAST_CONNECTIONS, "strategy applied");
    TEST_ASSERT(current.performance.max_latency_ms == 10, "latency budget applied");
    TEST_ASSERT(std::find(events.begin(), events.end(), "configuration_updated") != events.end(), "update event");

    service.set_coordinator_handler(MESSAGE_TYPE_WAVE_COORDINATION, [](const base_message &) {
        return json{{"wave", 1}};
    });
    json out = service.send_message(base_message::make("client", "", "start_wave", MESSAGE_TYPE_WAVE_COORDINATION));
    TEST_ASSERT(out["wave"] == 1, "newly enabled coordinator reachable");

    return true;
}

// Test 12: Metrics snapshot
static bool test_metrics_snapshot() {
    auto transport = std::make_shared<local_transport>();
    communication_service service(service_config(), transport);
    service.register_server(server("srv-a"));
    transport->set_handler("srv-a", [](const base_message &) { return delivery_result::ok(); });
    service.start();

    for (int i = 0; i < 3; i++) {
        service.send_message(base_message::make("client", "srv-a", "ping", MESSAGE_TYPE_REQUEST));
    }

    json m = service.get_metrics();
    TEST_ASSERT(m["messageRouter"]["totalMessages"] == 3, "router counted messages");
    TEST_ASSERT(m["performance"]["messages"] == 3, "monitor counted messages");
    TEST_ASSERT(m["performance"]["latency"]["samples"] == 3, "latency samples");
    TEST_ASSERT(m.contains("subAgents"), "coordinator metrics included");
    TEST_ASSERT(m["performance"]["healthScore"].get<double>() > 0, "health score");

    service.remove_server("srv-a");
    TEST_ASSERT(!service.router().get_routing_entry("srv-a"), "server removed");

    return true;
}

// Test 13: Loops started directly on the components stop with the service
static bool test_destructor_stops_direct_loops() {
    std::mutex events_mutex;
    size_t offline_events = 0;
    size_t total_events = 0;

    {
        relay_config cfg = service_config();
        cfg.orchestration.heartbeat_interval_ms = 5;
        communication_service service(cfg, std::make_shared<local_transport>());
        service.set_event_callback([&](const std::string & event, const json &) {
            std::lock_guard<std::mutex> lock(events_mutex);
            total_events++;
            if (event == "agent_offline") {
                offline_events++;
            }
        });

        sub_agent agent;
        agent.agent_id = "quiet";
        agent.server_id = "srv-a";
        agent.capabilities = {"work"};
        service.register_agent(agent);

        service.coordinator().start();
        for (int i = 0; i < 100; i++) {
            {
                std::lock_guard<std::mutex> lock(events_mutex);
                if (offline_events > 0) {
                    break;
                }
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        TEST_ASSERT(!service.is_running(), "service itself never started");
    }

    size_t seen;
    {
        std::lock_guard<std::mutex> lock(events_mutex);
        TEST_ASSERT(offline_events == 1, "monitor loop ran through the service callback");
        seen = total_events;
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    std::lock_guard<std::mutex> lock(events_mutex);
    TEST_ASSERT(total_events == seen, "no events after destruction");

    return true;
}

int main() {
    std::cout << "=== Relay Service Tests ===" << std::endl << std::endl;
    relay_log_set_level(RELAY_LOG_LEVEL_ERROR);

    int total = 0;
    int passed = 0;
    int failed = 0;

    // Lifecycle
    RUN_TEST(test_lifecycle);
    RUN_TEST(test_start_rejects_invalid_config);

    // Dispatch
    RUN_TEST(test_route_request);
    RUN_TEST(test_route_failure_recorded);
    RUN_TEST(test_broadcast_message);
    RUN_TEST(test_external_coordinators);
    RUN_TEST(test_sub_agent_messages);
    RUN_TEST(test_delegate_through_messages);
    RUN_TEST(test_delegation_disabled);

    // Health and configuration
    RUN_TEST(test_system_health);
    RUN_TEST(test_update_configuration);
    RUN_TEST(test_metrics_snapshot);
    RUN_TEST(test_destructor_stops_direct_loops);

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

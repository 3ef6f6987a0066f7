#include "relay/comm_service.h"
#include "relay/config.h"
#include "relay/log.h"
#include "relay/transport.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

using namespace relay;

// ============================================================================
// Example Worker Agent
// ============================================================================

// Receives execute_task messages and reports the outcome from its own thread
class worker_agent {
public:
    worker_agent(const std::string & id, communication_service & service, int work_ms)
        : id(id), service(service), work_ms(work_ms) {}

    ~worker_agent() { stop(); }

    void start() {
        running = true;
        thread = std::thread([this] { run(); });
    }

    void stop() {
        if (!running.exchange(false)) {
            return;
        }
        cv.notify_all();
        if (thread.joinable()) {
            thread.join();
        }
    }

    delivery_result on_message(const base_message & msg) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            inbox.push_back(msg);
        }
        cv.notify_all();
        return delivery_result::ok(json{{"accepted", true}});
    }

private:
    std::string id;
    communication_service & service;
    int work_ms;

    std::atomic<bool> running{false};
    std::thread thread;
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<base_message> inbox;

    void run() {
        while (true) {
            base_message msg;
            {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait(lock, [this] { return !running || !inbox.empty(); });
                if (!running) {
                    return;
                }
                msg = inbox.front();
                inbox.pop_front();
            }
            process_task(msg.payload.data);
        }
    }

    void process_task(const json & data) {
        std::string task_id = data.value("taskId", "");
        std::string operation = data.value("operation", "");
        std::cout << "[" << id << "] " << operation << " " << task_id << std::endl;

        // Simulate work
        std::this_thread::sleep_for(std::chrono::milliseconds(work_ms));

        if (operation == "flaky") {
            service.report_task_result(task_id, false, json(), "simulated failure");
            return;
        }

        task_metrics m;
        m.quality_score = 70 + static_cast<double>(task_id.size() % 3) * 10;
        m.accuracy = 0.9;
        m.completeness = 1.0;
        m.confidence = 0.8;

        json result = data["input"].is_object() ? data["input"] : json::object();
        result[task_id] = id;
        service.report_task_result(task_id, true, result, "", m);
    }
};

static sub_agent make_agent(const std::string & id, const std::string & server_id, int max_tasks) {
    sub_agent agent;
    agent.agent_id = id;
    agent.server_id = server_id;
    agent.capabilities = {"analysis", "summarize", "flaky"};
    agent.max_concurrent_tasks = max_tasks;
    return agent;
}

static routing_table_entry make_server(const std::string & id, std::set<std::string> caps) {
    routing_table_entry entry;
    entry.server_id = id;
    entry.endpoints = {"local://" + id};
    entry.capabilities = std::move(caps);
    return entry;
}

// ============================================================================
// Demo Functions
// ============================================================================

void demo_routing_failover(const relay_config & base) {
    std::cout << "\n=== Demo 1: Routing with Circuit Breaker Failover ===" << std::endl;

    relay_config config = base;
    config.performance.circuit_breaker_threshold = 3;

    auto transport = std::make_shared<local_transport>();
    communication_service service(config, transport);

    service.register_server(make_server("search-primary", {"search", "analysis"}));
    service.register_server(make_server("search-backup", {"search"}));

    std::atomic<bool> primary_down{false};
    transport->set_handler("search-primary", [&](const base_message &) {
        if (primary_down) {
            return delivery_result::fail("connection refused");
        }
        return delivery_result::ok(json{{"served_by", "search-primary"}});
    });
    transport->set_handler("search-backup", [](const base_message &) {
        return delivery_result::ok(json{{"served_by", "search-backup"}});
    });

    service.start();

    auto query = [&](int i) {
        base_message msg = base_message::make("client", "search-primary", "query", MESSAGE_TYPE_REQUEST,
                                              json{{"q", "item " + std::to_string(i)}});
        json result = service.send_message(msg);
        std::cout << "query " << i << ": success=" << result["success"]
                  << " target=" << result["targetServer"]
                  << " breaker=" << circuit_state_to_str(service.router().get_circuit_state("search-primary"))
                  << std::endl;
    };

    query(0);

    std::cout << "\nSimulating search-primary outage..." << std::endl;
    primary_down = true;
    for (int i = 1; i <= 4; i++) {
        query(i);
    }

    std::cout << "\nRouting metrics: " << service.router().get_routing_metrics().to_json().dump() << std::endl;

    service.stop();
    std::cout << "Demo 1 completed\n" << std::endl;
}

void demo_delegation(const relay_config & base) {
    std::cout << "\n=== Demo 2: Sub-Agent Delegation Strategies ===" << std::endl;

    relay_config config = base;
    config.orchestration.poll_interval_ms = 20;
    config.orchestration.task_timeout_ms = 5000;

    auto transport = std::make_shared<local_transport>();
    communication_service service(config, transport);

    worker_agent worker1("worker1", service, 100);
    worker_agent worker2("worker2", service, 150);

    service.register_server(make_server("agents-1", {"agents"}));
    service.register_server(make_server("agents-2", {"agents"}));
    transport->set_handler("agents-1", [&](const base_message & m) { return worker1.on_message(m); });
    transport->set_handler("agents-2", [&](const base_message & m) { return worker2.on_message(m); });

    service.register_agent(make_agent("worker1", "agents-1", 3));
    service.register_agent(make_agent("worker2", "agents-2", 3));

    service.set_event_callback([](const std::string & event, const json & data) {
        if (event == "delegation_completed" || event == "delegation_failed" || event == "task_failed") {
            std::cout << "  event " << event << ": " << data.dump() << std::endl;
        }
    });

    worker1.start();
    worker2.start();
    service.start();

    auto run = [&](const std::string & id, delegation_strategy strategy, aggregation_method method,
                   std::vector<std::string> ops) {
        delegation_request req;
        req.delegation_id = id;
        req.strategy = strategy;
        req.aggregation.method = method;
        for (size_t i = 0; i < ops.size(); i++) {
            sub_agent_task task;
            task.task_id = id + "-t" + std::to_string(i);
            task.operation = ops[i];
            task.input = json{{"chunk", static_cast<int>(i)}};
            req.tasks.push_back(task);
        }

        std::cout << "\nDelegation " << id << " (" << delegation_strategy_to_str(strategy) << ", "
                  << ops.size() << " tasks)" << std::endl;
        delegation_result r = service.delegate_tasks(req);
        std::cout << "completed=" << r.completed_tasks << " failed=" << r.failed_tasks
                  << " skipped=" << r.skipped_tasks << " duration=" << r.duration_ms << "ms" << std::endl;
        std::cout << "result: " << (r.success ? r.aggregated_result.dump() : r.error) << std::endl;
    };

    run("parallel", DELEGATION_STRATEGY_PARALLEL, AGGREGATION_METHOD_MERGE,
        {"analysis", "analysis", "analysis", "summarize", "summarize"});
    run("pipeline", DELEGATION_STRATEGY_PIPELINE, AGGREGATION_METHOD_SELECT_BEST,
        {"analysis", "summarize"});
    run("sequential", DELEGATION_STRATEGY_SEQUENTIAL, AGGREGATION_METHOD_MERGE,
        {"analysis", "flaky", "summarize"});

    std::cout << "\nScaling advice for 40 queued tasks: " << service.coordinator().scale_agents(40).to_json().dump() << std::endl;
    for (const auto & s : service.coordinator().optimize_performance()) {
        std::cout << "Suggestion: " << s.to_json().dump() << std::endl;
    }

    std::cout << "\nSystem health: " << service.get_system_health().to_json().dump(2) << std::endl;

    service.stop();
    worker1.stop();
    worker2.stop();
    std::cout << "Demo 2 completed\n" << std::endl;
}

int main(int argc, char ** argv) {
    relay_config config;
    if (argc > 1) {
        try {
            config = relay_config::load(argv[1]);
            config.validate();
        } catch (const std::exception & e) {
            LOG_ERR("%s\n", e.what());
            return 1;
        }
    }
    relay_log_set_level(config.log_level);

    std::cout << "relay demo" << std::endl;
    std::cout << "==========" << std::endl;

    demo_routing_failover(config);
    demo_delegation(config);

    std::cout << "\nAll demos completed!" << std::endl;
    return 0;
}

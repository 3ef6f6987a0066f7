#pragma once

#include "message.h"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace relay {

// Circuit breaker state
enum circuit_state {
    CIRCUIT_CLOSED,   // Normal operation
    CIRCUIT_OPEN,     // Too many failures, reject requests
    CIRCUIT_HALF_OPEN // Cool-down elapsed, next request is a trial
};

std::string circuit_state_to_str(circuit_state state);

// Per-target failure detector.
// closed -> open when failure_count reaches the threshold,
// open -> half-open once the cool-down has elapsed (evaluated on every read),
// half-open -> closed after success_threshold successes,
// half-open -> open on any failure.
class circuit_breaker {
public:
    circuit_breaker(int failure_threshold = 5,
                    int64_t cooldown_ms = 30000,
                    int success_threshold = 1);
    ~circuit_breaker();

    void record_success();
    void record_failure();

    // False only while open and still cooling down
    bool allow_request();

    circuit_state get_state() const;

    // Apply a pending open -> half-open transition; true if one happened
    bool refresh();

    void reset();

    void set_failure_threshold(int threshold);
    void set_cooldown(int64_t cooldown_ms);

    struct stats {
        circuit_state state;
        int failure_count;
        int success_count;
        int64_t last_failure_time;
        int64_t last_state_change;

        json to_json() const;
    };
    stats get_stats() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

// One breaker per server id, created on first use
class circuit_breaker_registry {
public:
    circuit_breaker_registry(int failure_threshold = 5, int64_t cooldown_ms = 30000);

    void record_success(const std::string & server_id);
    void record_failure(const std::string & server_id);

    // Unknown servers report CIRCUIT_CLOSED
    circuit_state get_state(const std::string & server_id) const;
    bool is_open(const std::string & server_id) const;

    circuit_breaker::stats get_stats(const std::string & server_id) const;

    void ensure(const std::string & server_id);
    void remove(const std::string & server_id);
    void reset(const std::string & server_id);

    // Applies to existing and future breakers
    void configure(int failure_threshold, int64_t cooldown_ms);

    // Re-evaluate cool-downs; returns how many breakers moved to half-open
    int refresh();

    std::map<std::string, circuit_breaker::stats> snapshot() const;

private:
    circuit_breaker & get_or_create(const std::string & server_id);

    mutable std::mutex mutex;
    std::map<std::string, std::unique_ptr<circuit_breaker>> breakers;
    int failure_threshold;
    int64_t cooldown_ms;
};

} // namespace relay

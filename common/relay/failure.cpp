#include "failure.h"
#include "log.h"

namespace relay {

std::string circuit_state_to_str(circuit_state state) {
    switch (state) {
        case CIRCUIT_CLOSED:    return "closed";
        case CIRCUIT_OPEN:      return "open";
        case CIRCUIT_HALF_OPEN: return "half-open";
        default:                return "closed";
    }
}

json circuit_breaker::stats::to_json() const {
    return json{
        {"state", circuit_state_to_str(state)},
        {"failureCount", failure_count},
        {"successCount", success_count},
        {"lastFailure", last_failure_time},
        {"lastStateChange", last_state_change}
    };
}

struct circuit_breaker::impl {
    int failure_threshold;
    int64_t cooldown_ms;
    int success_threshold;
    circuit_state state;
    int failure_count;
    int success_count;
    int64_t last_failure_time;
    int64_t last_state_change;
    mutable std::mutex mutex;

    impl(int fail_thresh, int64_t cooldown, int success_thresh)
        : failure_threshold(fail_thresh),
          cooldown_ms(cooldown),
          success_threshold(success_thresh),
          state(CIRCUIT_CLOSED),
          failure_count(0),
          success_count(0),
          last_failure_time(0),
          last_state_change(get_timestamp_ms()) {}

    // Caller holds the mutex
    bool refresh_locked() {
        if (state != CIRCUIT_OPEN) {
            return false;
        }
        int64_t now = get_timestamp_ms();
        if (now - last_state_change < cooldown_ms) {
            return false;
        }
        state = CIRCUIT_HALF_OPEN;
        success_count = 0;
        last_state_change = now;
        return true;
    }
};

circuit_breaker::circuit_breaker(int failure_threshold, int64_t cooldown_ms, int success_threshold)
    : pimpl(std::make_unique<impl>(failure_threshold, cooldown_ms, success_threshold)) {}

circuit_breaker::~circuit_breaker() = default;

void circuit_breaker::record_success() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->refresh_locked();

    if (pimpl->state == CIRCUIT_HALF_OPEN) {
        pimpl->success_count++;
        if (pimpl->success_count >= pimpl->success_threshold) {
            pimpl->state = CIRCUIT_CLOSED;
            pimpl->failure_count = 0;
            pimpl->success_count = 0;
            pimpl->last_state_change = get_timestamp_ms();
        }
    } else if (pimpl->state == CIRCUIT_CLOSED) {
        pimpl->failure_count = 0;
    }
}

void circuit_breaker::record_failure() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->refresh_locked();

    pimpl->last_failure_time = get_timestamp_ms();

    if (pimpl->state == CIRCUIT_CLOSED) {
        pimpl->failure_count++;
        if (pimpl->failure_count >= pimpl->failure_threshold) {
            pimpl->state = CIRCUIT_OPEN;
            pimpl->last_state_change = pimpl->last_failure_time;
        }
    } else if (pimpl->state == CIRCUIT_HALF_OPEN) {
        pimpl->state = CIRCUIT_OPEN;
        pimpl->failure_count++;
        pimpl->success_count = 0;
        pimpl->last_state_change = pimpl->last_failure_time;
    }
}

bool circuit_breaker::allow_request() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->refresh_locked();
    return pimpl->state != CIRCUIT_OPEN;
}

circuit_state circuit_breaker::get_state() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->refresh_locked();
    return pimpl->state;
}

bool circuit_breaker::refresh() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->refresh_locked();
}

void circuit_breaker::reset() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->state = CIRCUIT_CLOSED;
    pimpl->failure_count = 0;
    pimpl->success_count = 0;
    pimpl->last_state_change = get_timestamp_ms();
}

void circuit_breaker::set_failure_threshold(int threshold) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->failure_threshold = threshold;
}

void circuit_breaker::set_cooldown(int64_t cooldown_ms) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->cooldown_ms = cooldown_ms;
}

circuit_breaker::stats circuit_breaker::get_stats() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->refresh_locked();
    stats s;
    s.state = pimpl->state;
    s.failure_count = pimpl->failure_count;
    s.success_count = pimpl->success_count;
    s.last_failure_time = pimpl->last_failure_time;
    s.last_state_change = pimpl->last_state_change;
    return s;
}

// circuit_breaker_registry implementation

circuit_breaker_registry::circuit_breaker_registry(int failure_threshold, int64_t cooldown_ms)
    : failure_threshold(failure_threshold), cooldown_ms(cooldown_ms) {}

circuit_breaker & circuit_breaker_registry::get_or_create(const std::string & server_id) {
    auto it = breakers.find(server_id);
    if (it == breakers.end()) {
        it = breakers.emplace(server_id,
                              std::make_unique<circuit_breaker>(failure_threshold, cooldown_ms)).first;
    }
    return *it->second;
}

void circuit_breaker_registry::record_success(const std::string & server_id) {
    std::lock_guard<std::mutex> lock(mutex);
    auto & breaker = get_or_create(server_id);
    circuit_state before = breaker.get_state();
    breaker.record_success();
    if (before != CIRCUIT_CLOSED && breaker.get_state() == CIRCUIT_CLOSED) {
        LOG_INF("circuit breaker closed for %s\n", server_id.c_str());
    }
}

void circuit_breaker_registry::record_failure(const std::string & server_id) {
    std::lock_guard<std::mutex> lock(mutex);
    auto & breaker = get_or_create(server_id);
    circuit_state before = breaker.get_state();
    breaker.record_failure();
    if (before != CIRCUIT_OPEN && breaker.get_state() == CIRCUIT_OPEN) {
        LOG_WRN("circuit breaker opened for %s\n", server_id.c_str());
    }
}

circuit_state circuit_breaker_registry::get_state(const std::string & server_id) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = breakers.find(server_id);
    if (it == breakers.end()) {
        return CIRCUIT_CLOSED;
    }
    return it->second->get_state();
}

bool circuit_breaker_registry::is_open(const std::string & server_id) const {
    return get_state(server_id) == CIRCUIT_OPEN;
}

circuit_breaker::stats circuit_breaker_registry::get_stats(const std::string & server_id) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = breakers.find(server_id);
    if (it == breakers.end()) {
        return circuit_breaker::stats{CIRCUIT_CLOSED, 0, 0, 0, 0};
    }
    return it->second->get_stats();
}

void circuit_breaker_registry::ensure(const std::string & server_id) {
    std::lock_guard<std::mutex> lock(mutex);
    get_or_create(server_id);
}

void circuit_breaker_registry::remove(const std::string & server_id) {
    std::lock_guard<std::mutex> lock(mutex);
    breakers.erase(server_id);
}

void circuit_breaker_registry::reset(const std::string & server_id) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = breakers.find(server_id);
    if (it != breakers.end()) {
        it->second->reset();
    }
}

void circuit_breaker_registry::configure(int threshold, int64_t cooldown) {
    std::lock_guard<std::mutex> lock(mutex);
    failure_threshold = threshold;
    cooldown_ms = cooldown;
    for (auto & [id, breaker] : breakers) {
        breaker->set_failure_threshold(threshold);
        breaker->set_cooldown(cooldown);
    }
}

int circuit_breaker_registry::refresh() {
    std::lock_guard<std::mutex> lock(mutex);
    int transitioned = 0;
    for (auto & [id, breaker] : breakers) {
        if (breaker->refresh()) {
            LOG_DBG("circuit breaker half-open for %s\n", id.c_str());
            transitioned++;
        }
    }
    return transitioned;
}

std::map<std::string, circuit_breaker::stats> circuit_breaker_registry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::map<std::string, circuit_breaker::stats> out;
    for (const auto & [id, breaker] : breakers) {
        out[id] = breaker->get_stats();
    }
    return out;
}

} // namespace relay

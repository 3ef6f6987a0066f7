#pragma once

#include "message.h"

#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>

namespace relay {

struct delivery_result {
    bool success = false;
    std::string error;
    json response;

    static delivery_result ok(const json & response = json::object()) {
        delivery_result r;
        r.success = true;
        r.response = response;
        return r;
    }

    static delivery_result fail(const std::string & error) {
        delivery_result r;
        r.error = error;
        return r;
    }
};

// Outbound delivery mechanism used by the router
class message_transport {
public:
    virtual ~message_transport() = default;

    // Deliver one message to a server
    virtual delivery_result deliver(const std::string & server_id, const base_message & message) = 0;

    // Response time in ms, std::nullopt if the server cannot be reached
    virtual std::optional<double> probe(const std::string & server_id) = 0;
};

// In-process transport: one handler callback per server id
class local_transport : public message_transport {
public:
    using handler_fn = std::function<delivery_result(const base_message &)>;
    using probe_fn   = std::function<std::optional<double>()>;

    local_transport() = default;

    void set_handler(const std::string & server_id, handler_fn handler);
    void remove_handler(const std::string & server_id);
    bool has_handler(const std::string & server_id) const;

    // Overrides the default probe (handler present -> measured lookup time)
    void set_probe(const std::string & server_id, probe_fn probe);

    delivery_result deliver(const std::string & server_id, const base_message & message) override;
    std::optional<double> probe(const std::string & server_id) override;

private:
    mutable std::shared_mutex mutex;
    std::map<std::string, handler_fn> handlers;
    std::map<std::string, probe_fn> probes;
};

} // namespace relay

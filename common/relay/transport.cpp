#include "transport.h"
#include "log.h"

#include <chrono>
#include <mutex>
#include <stdexcept>

namespace relay {

void local_transport::set_handler(const std::string & server_id, handler_fn handler) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    handlers[server_id] = std::move(handler);
}

void local_transport::remove_handler(const std::string & server_id) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    handlers.erase(server_id);
    probes.erase(server_id);
}

bool local_transport::has_handler(const std::string & server_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return handlers.count(server_id) > 0;
}

void local_transport::set_probe(const std::string & server_id, probe_fn probe) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    probes[server_id] = std::move(probe);
}

delivery_result local_transport::deliver(const std::string & server_id, const base_message & message) {
    handler_fn handler;
    {
        std::shared_lock<std::shared_mutex> lock(mutex);
        auto it = handlers.find(server_id);
        if (it == handlers.end()) {
            return delivery_result::fail("no handler registered for server: " + server_id);
        }
        handler = it->second;
    }

    // Handlers run without the lock so they may re-enter the transport
    try {
        return handler(message);
    } catch (const std::exception & e) {
        LOG_WRN("handler for %s threw: %s\n", server_id.c_str(), e.what());
        return delivery_result::fail(e.what());
    }
}

std::optional<double> local_transport::probe(const std::string & server_id) {
    probe_fn custom;
    {
        std::shared_lock<std::shared_mutex> lock(mutex);
        auto pit = probes.find(server_id);
        if (pit != probes.end()) {
            custom = pit->second;
        } else if (handlers.count(server_id) == 0) {
            return std::nullopt;
        }
    }

    if (custom) {
        return custom();
    }

    auto start = std::chrono::steady_clock::now();
    bool present = has_handler(server_id);
    auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    if (!present) {
        return std::nullopt;
    }
    return elapsed;
}

} // namespace relay

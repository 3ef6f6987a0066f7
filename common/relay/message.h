#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>

namespace relay {

using json = nlohmann::json;

// Message kinds understood by the communication service
enum message_type {
    MESSAGE_TYPE_COMMAND,
    MESSAGE_TYPE_EVENT,
    MESSAGE_TYPE_REQUEST,
    MESSAGE_TYPE_RESPONSE,
    MESSAGE_TYPE_BROADCAST,
    MESSAGE_TYPE_WAVE_COORDINATION,
    MESSAGE_TYPE_PERSONA_CHAIN,
    MESSAGE_TYPE_QUALITY_GATE,
    MESSAGE_TYPE_SUB_AGENT_DELEGATION
};

// Lower value = more urgent
enum message_priority {
    MESSAGE_PRIORITY_CRITICAL   = 0,
    MESSAGE_PRIORITY_HIGH       = 1,
    MESSAGE_PRIORITY_NORMAL     = 2,
    MESSAGE_PRIORITY_LOW        = 3,
    MESSAGE_PRIORITY_BACKGROUND = 4
};

std::string message_type_to_str(message_type type);
message_type str_to_message_type(const std::string & str);

std::string message_priority_to_str(message_priority priority);
// Out-of-range values clamp to NORMAL
message_priority int_to_message_priority(int value);

struct message_header {
    std::string message_id;
    std::string correlation_id;
    std::string source;
    std::string target;          // Server id; may be rewritten during broadcast fan-out
    std::string operation;
    message_type type = MESSAGE_TYPE_REQUEST;
    message_priority priority = MESSAGE_PRIORITY_NORMAL;

    json to_json() const;
    static message_header from_json(const json & j);
};

struct message_payload {
    json data;
    std::string schema;
    std::string encoding = "json";

    json to_json() const;
    static message_payload from_json(const json & j);
};

struct message_metadata {
    int64_t timestamp = 0;       // Unix epoch ms
    int64_t ttl = 0;             // ms, 0 = no expiry
    int retry_count = 0;
    std::map<std::string, std::string> routing_hints;
    std::map<std::string, std::string> performance_hints;

    json to_json() const;
    static message_metadata from_json(const json & j);
};

struct base_message {
    message_header header;
    message_payload payload;
    message_metadata metadata;

    json to_json() const;
    static base_message from_json(const json & j);

    // Convenience builder: fresh id, current timestamp
    static base_message make(const std::string & source,
                             const std::string & target,
                             const std::string & operation,
                             message_type type,
                             const json & data = json::object(),
                             message_priority priority = MESSAGE_PRIORITY_NORMAL);
};

// Generate UUID v4 string
std::string generate_uuid();

// Prefixed unique id, e.g. "msg_1718000000000_3f2a9c1d"
std::string generate_id(const std::string & prefix);

// Current wall-clock time in milliseconds
int64_t get_timestamp_ms();

} // namespace relay

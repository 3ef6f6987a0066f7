#include "message.h"

#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>

namespace relay {

std::string generate_uuid() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);
    std::uniform_int_distribution<> dis2(8, 11);

    std::stringstream ss;
    ss << std::hex;
    for (int i = 0; i < 8; i++) {
        ss << dis(gen);
    }
    ss << "-";
    for (int i = 0; i < 4; i++) {
        ss << dis(gen);
    }
    ss << "-4";
    for (int i = 0; i < 3; i++) {
        ss << dis(gen);
    }
    ss << "-";
    ss << dis2(gen);
    for (int i = 0; i < 3; i++) {
        ss << dis(gen);
    }
    ss << "-";
    for (int i = 0; i < 12; i++) {
        ss << dis(gen);
    }
    return ss.str();
}

std::string generate_id(const std::string & prefix) {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<uint32_t> dis;

    std::stringstream ss;
    ss << prefix << "_" << get_timestamp_ms() << "_"
       << std::hex << std::setw(8) << std::setfill('0') << dis(gen);
    return ss.str();
}

int64_t get_timestamp_ms() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

std::string message_type_to_str(message_type type) {
    switch (type) {
        case MESSAGE_TYPE_COMMAND:              return "command";
        case MESSAGE_TYPE_EVENT:                return "event";
        case MESSAGE_TYPE_REQUEST:              return "request";
        case MESSAGE_TYPE_RESPONSE:             return "response";
        case MESSAGE_TYPE_BROADCAST:            return "broadcast";
        case MESSAGE_TYPE_WAVE_COORDINATION:    return "wave_coordination";
        case MESSAGE_TYPE_PERSONA_CHAIN:        return "persona_chain";
        case MESSAGE_TYPE_QUALITY_GATE:         return "quality_gate";
        case MESSAGE_TYPE_SUB_AGENT_DELEGATION: return "sub_agent_delegation";
        default:                                return "request";
    }
}

message_type str_to_message_type(const std::string & str) {
    if (str == "command")              return MESSAGE_TYPE_COMMAND;
    if (str == "event")                return MESSAGE_TYPE_EVENT;
    if (str == "response")             return MESSAGE_TYPE_RESPONSE;
    if (str == "broadcast")            return MESSAGE_TYPE_BROADCAST;
    if (str == "wave_coordination")    return MESSAGE_TYPE_WAVE_COORDINATION;
    if (str == "persona_chain")        return MESSAGE_TYPE_PERSONA_CHAIN;
    if (str == "quality_gate")         return MESSAGE_TYPE_QUALITY_GATE;
    if (str == "sub_agent_delegation") return MESSAGE_TYPE_SUB_AGENT_DELEGATION;
    return MESSAGE_TYPE_REQUEST;
}

std::string message_priority_to_str(message_priority priority) {
    switch (priority) {
        case MESSAGE_PRIORITY_CRITICAL:   return "critical";
        case MESSAGE_PRIORITY_HIGH:       return "high";
        case MESSAGE_PRIORITY_NORMAL:     return "normal";
        case MESSAGE_PRIORITY_LOW:        return "low";
        case MESSAGE_PRIORITY_BACKGROUND: return "background";
        default:                          return "normal";
    }
}

message_priority int_to_message_priority(int value) {
    if (value < MESSAGE_PRIORITY_CRITICAL || value > MESSAGE_PRIORITY_BACKGROUND) {
        return MESSAGE_PRIORITY_NORMAL;
    }
    return static_cast<message_priority>(value);
}

json message_header::to_json() const {
    return json{
        {"messageId", message_id},
        {"correlationId", correlation_id},
        {"source", source},
        {"target", target},
        {"operation", operation},
        {"messageType", message_type_to_str(type)},
        {"priority", static_cast<int>(priority)}
    };
}

message_header message_header::from_json(const json & j) {
    message_header h;
    h.message_id     = j.value("messageId", "");
    h.correlation_id = j.value("correlationId", "");
    h.source         = j.value("source", "");
    h.target         = j.value("target", "");
    h.operation      = j.value("operation", "");
    h.type           = str_to_message_type(j.value("messageType", "request"));
    h.priority       = int_to_message_priority(j.value("priority", static_cast<int>(MESSAGE_PRIORITY_NORMAL)));
    return h;
}

json message_payload::to_json() const {
    return json{
        {"data", data},
        {"schema", schema},
        {"encoding", encoding}
    };
}

message_payload message_payload::from_json(const json & j) {
    message_payload p;
    p.data     = j.contains("data") ? j.at("data") : json::object();
    p.schema   = j.value("schema", "");
    p.encoding = j.value("encoding", "json");
    return p;
}

json message_metadata::to_json() const {
    return json{
        {"timestamp", timestamp},
        {"ttl", ttl},
        {"retryCount", retry_count},
        {"routingHints", routing_hints},
        {"performanceHints", performance_hints}
    };
}

message_metadata message_metadata::from_json(const json & j) {
    message_metadata m;
    m.timestamp         = j.value("timestamp", get_timestamp_ms());
    m.ttl               = j.value("ttl", static_cast<int64_t>(0));
    m.retry_count       = j.value("retryCount", 0);
    m.routing_hints     = j.value("routingHints", std::map<std::string, std::string>());
    m.performance_hints = j.value("performanceHints", std::map<std::string, std::string>());
    return m;
}

json base_message::to_json() const {
    return json{
        {"header", header.to_json()},
        {"payload", payload.to_json()},
        {"metadata", metadata.to_json()}
    };
}

base_message base_message::from_json(const json & j) {
    base_message msg;
    msg.header   = message_header::from_json(j.value("header", json::object()));
    msg.payload  = message_payload::from_json(j.value("payload", json::object()));
    msg.metadata = message_metadata::from_json(j.value("metadata", json::object()));
    return msg;
}

base_message base_message::make(const std::string & source,
                                const std::string & target,
                                const std::string & operation,
                                message_type type,
                                const json & data,
                                message_priority priority) {
    base_message msg;
    msg.header.message_id = generate_id("msg");
    msg.header.source     = source;
    msg.header.target     = target;
    msg.header.operation  = operation;
    msg.header.type       = type;
    msg.header.priority   = priority;
    msg.payload.data      = data;
    msg.metadata.timestamp = get_timestamp_ms();
    return msg;
}

} // namespace relay

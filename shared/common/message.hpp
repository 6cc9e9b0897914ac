#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>


namespace message {

// single-level parameter -> one topic level
// multi-level parameter  -> ordered sequence of topic levels
using ParameterValue = std::variant<std::string, std::vector<std::string>>;
using Parameters = std::map<std::string, ParameterValue>;

enum class QoS : uint8_t {
    AtMostOnce  = 0,
    AtLeastOnce = 1,
    ExactlyOnce = 2,
};

// Inbound message as delivered to label listeners.
struct Packet {
    std::string topic;
    std::string payload;
    QoS qos = QoS::AtMostOnce;
    bool retain = false;
    bool dup = false;
    uint16_t message_id = 0;

    Parameters params;      // filled by the dispatcher from the matching label
};

// Protocol metadata handed over by a transport with every inbound message.
struct PacketMeta {
    QoS qos = QoS::AtMostOnce;
    bool retain = false;
    bool dup = false;
    uint16_t message_id = 0;
};

inline const std::string* asLevel(const ParameterValue& v) {
    return std::get_if<std::string>(&v);
}

inline const std::vector<std::string>* asLevels(const ParameterValue& v) {
    return std::get_if<std::vector<std::string>>(&v);
}

} // namespace message

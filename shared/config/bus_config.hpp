#pragma once
#include <string>
#include <vector>

#include "transport.hpp"

namespace config {

// ---------------------------
// label -> pattern
// ---------------------------
struct PatternEntry {
    std::string label;
    std::string pattern;            // e.g. devices/+deviceId/config/#keys
};

// ---------------------------
// transport selection
// ---------------------------
struct TransportConfig {
    std::string type = "memory";    // memory | zmq
    std::string publish_endpoint;   // zmq only: proxy XSUB side
    int poll_interval_ms = 50;      // zmq only
};

// ---------------------------
// whole file
// ---------------------------
struct BusConfig {
    std::string url;
    std::string client_id;
    transport::Options options;
    TransportConfig transport;
    std::vector<PatternEntry> patterns;     // file order = dispatch precedence
};

} // namespace config

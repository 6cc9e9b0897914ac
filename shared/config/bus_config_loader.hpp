#pragma once
#include <string>

#include <yaml-cpp/yaml.h>

#include "result.h"
#include "bus_config.hpp"

namespace bus {
class Bus;
}

namespace config {

class BusConfigLoader {
public:
    static constexpr const char* LOG_TAG = "BusConfigLoader";

    static Result<BusConfig> load(const std::string& path);
    static Result<BusConfig> parse(const std::string& text);

private:
    static Result<BusConfig> fromNode(const YAML::Node& root);
};

// Registers cfg.patterns in file order. Stops at the first failure.
Result<void> applyPatterns(bus::Bus& bus, const BusConfig& cfg);

} // namespace config

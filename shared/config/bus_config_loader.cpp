#include "bus_config_loader.hpp"
#include "bus.hpp"
#include "logging.hpp"
#include "result_helper.hpp"

#include <fmt/format.h>

namespace config {

namespace {

Result<message::QoS> toQoS(int value) {
    switch (value) {
    case 0: return Result<message::QoS>::OK(message::QoS::AtMostOnce);
    case 1: return Result<message::QoS>::OK(message::QoS::AtLeastOnce);
    case 2: return Result<message::QoS>::OK(message::QoS::ExactlyOnce);
    default:
        return Result<message::QoS>::Error(ResultCode::InvalidArgument, fmt::format("invalid qos ({})", value));
    }
}

} // namespace

Result<BusConfig> BusConfigLoader::load(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        return Result<BusConfig>::Error(ResultCode::InvalidArgument, fmt::format("{}: {}", path, e.what()));
    }

    auto cfg = fromNode(root);
    if (cfg) {
        LOG_INFO(LOG_TAG, "loaded {} ({} patterns, transport {})", path, cfg.value().patterns.size(),
                 cfg.value().transport.type);
    }
    return cfg;
}

Result<BusConfig> BusConfigLoader::parse(const std::string& text) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        return Result<BusConfig>::Error(ResultCode::InvalidArgument, e.what());
    }
    return fromNode(root);
}

Result<BusConfig> BusConfigLoader::fromNode(const YAML::Node& root) {
    if (!root.IsMap()) {
        return Result<BusConfig>::Error(ResultCode::InvalidArgument, "bus config must be a map");
    }

    BusConfig m;
    try {
        // ---------------------------
        // connection
        // ---------------------------
        m.url = root["url"].as<std::string>("");
        m.client_id = root["client_id"].as<std::string>("");
        if (m.url.empty()) {
            return Result<BusConfig>::Error(ResultCode::InvalidArgument, "missing 'url'");
        }
        if (m.client_id.empty()) {
            return Result<BusConfig>::Error(ResultCode::InvalidArgument, "missing 'client_id'");
        }
        m.options.client_id = m.client_id;

        if (const auto opts = root["options"]) {
            m.options.keepalive_s = opts["keepalive_s"].as<int>(m.options.keepalive_s);
            m.options.clean = opts["clean"].as<bool>(m.options.clean);
            m.options.reconnect_period_ms = opts["reconnect_period_ms"].as<int>(m.options.reconnect_period_ms);
            m.options.connect_timeout_ms = opts["connect_timeout_ms"].as<int>(m.options.connect_timeout_ms);
            m.options.username = opts["username"].as<std::string>("");
            m.options.password = opts["password"].as<std::string>("");

            if (const auto will = opts["will"]) {
                transport::Will w;
                w.topic = will["topic"].as<std::string>("");
                w.payload = will["payload"].as<std::string>("");
                w.retain = will["retain"].as<bool>(false);
                auto qos = toQoS(will["qos"].as<int>(0));
                if (!qos) return Result<BusConfig>::Error(qos.code(), qos.error());
                w.qos = qos.value();
                if (w.topic.empty()) {
                    return Result<BusConfig>::Error(ResultCode::InvalidArgument, "will without topic");
                }
                m.options.will = std::move(w);
            }
        }

        // ---------------------------
        // transport
        // ---------------------------
        if (const auto tr = root["transport"]) {
            m.transport.type = tr["type"].as<std::string>(m.transport.type);
            m.transport.publish_endpoint = tr["publish_endpoint"].as<std::string>("");
            m.transport.poll_interval_ms = tr["poll_interval_ms"].as<int>(m.transport.poll_interval_ms);
        }
        if (m.transport.type != "memory" && m.transport.type != "zmq") {
            return Result<BusConfig>::Error(ResultCode::InvalidArgument,
                                            fmt::format("unknown transport type ({})", m.transport.type));
        }

        // ---------------------------
        // patterns, in file order
        // ---------------------------
        if (const auto patterns = root["patterns"]) {
            if (!patterns.IsSequence()) {
                return Result<BusConfig>::Error(ResultCode::InvalidArgument, "'patterns' must be a list");
            }
            for (const auto& node : patterns) {
                PatternEntry p;
                p.label = node["label"].as<std::string>("");
                p.pattern = node["pattern"].as<std::string>("");
                if (p.label.empty() || p.pattern.empty()) {
                    return Result<BusConfig>::Error(ResultCode::InvalidArgument,
                                                    "pattern entries need 'label' and 'pattern'");
                }
                m.patterns.push_back(std::move(p));
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<BusConfig>::Error(ResultCode::InvalidArgument, e.what());
    }

    return Result<BusConfig>::OK(std::move(m));
}

Result<void> applyPatterns(bus::Bus& bus, const BusConfig& cfg) {
    for (const auto& p : cfg.patterns) {
        auto r = bus.setPattern(p.label, p.pattern);
        if (!r) LOG_ERROR(BusConfigLoader::LOG_TAG, "pattern '{}' ({}): {}", p.label, p.pattern, to_string(r));
        RETURN_IF_ERR_MSG(r, fmt::format("patterns[{}]", p.label));
    }
    return OK();
}

} // namespace config

#include "logging.hpp"
#include "bus.hpp"
#include "bus_config_loader.hpp"
#include "memory_transport.hpp"
#ifdef TOPICBUS_WITH_ZMQ
#include "zmq_transport.hpp"
#endif

#include <atomic>
#include <chrono>
#include <csignal>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

static constexpr const char* TAG = "Host";

namespace {

std::atomic<bool> g_running{true};

void onSignal(int) {
    g_running = false;
}

std::string formatParams(const message::Parameters& params) {
    std::vector<std::string> parts;
    for (const auto& [name, value] : params) {
        if (auto level = message::asLevel(value)) {
            parts.push_back(fmt::format("{}={}", name, *level));
        } else if (auto levels = message::asLevels(value)) {
            parts.push_back(fmt::format("{}=[{}]", name, fmt::join(*levels, ", ")));
        }
    }
    return fmt::format("{{{}}}", fmt::join(parts, ", "));
}

std::shared_ptr<transport::Transport> makeTransport(const config::BusConfig& cfg,
                                                    std::shared_ptr<transport::MemoryBroker>& broker) {
    if (cfg.transport.type == "memory") {
        broker = std::make_shared<transport::MemoryBroker>();
        return std::make_shared<transport::MemoryTransport>(broker);
    }
#ifdef TOPICBUS_WITH_ZMQ
    transport::ZmqTransportConfig zc;
    zc.publish_endpoint = cfg.transport.publish_endpoint;
    zc.poll_interval_ms = cfg.transport.poll_interval_ms;
    return std::make_shared<transport::ZmqTransport>(zc);
#else
    LOG_ERROR(TAG, "transport '{}' is not built in", cfg.transport.type);
    return nullptr;
#endif
}

} // namespace

// usage: topicbus_host [bus.yaml] [logging.yaml] [topic=payload ...]
//   topic=payload pairs are injected into the memory broker after subscribing.
int main(int argc, char** argv) {
    const std::string bus_file = argc > 1 ? argv[1] : "bus.yaml";
    const std::string log_file = argc > 2 ? argv[2] : "logging.yaml";

    auto r = logging::init(logging::Type::SpdLog, log_file);
    if (!r) {
        r = logging::init(logging::Type::SpdLog);
        LOG_WARN(TAG, "logging config '{}' not applied ({}), console only", log_file, to_string(r));
    }

    auto cfg = config::BusConfigLoader::load(bus_file);
    if (!cfg) {
        LOG_FATAL(TAG, "bus config: {}", to_string(cfg));
        return 1;
    }

    std::shared_ptr<transport::MemoryBroker> broker;
    auto tr = makeTransport(cfg.value(), broker);
    if (!tr) return 1;

    auto hub = bus::Bus::create(cfg.value().client_id, cfg.value().url, tr, cfg.value().options);
    hub->onStatusChange([](bus::Status status, const std::optional<bus::StatusError>& err) {
        if (err) {
            LOG_WARN(TAG, "status {} ({})", bus::to_string(status), to_string(*err));
        } else {
            LOG_INFO(TAG, "status {}", bus::to_string(status));
        }
    });

    r = config::applyPatterns(*hub, cfg.value());
    if (!r) return 1;

    for (const auto& label : hub->getLabels()) {
        auto id = hub->on(label, [label](const message::Packet& p) {
            LOG_INFO(TAG, "[{}] {} {} payload='{}'", label, p.topic, formatParams(p.params), p.payload);
        });
        if (!id) LOG_ERROR(TAG, "listen '{}': {}", label, to_string(id));
    }

    auto connected = hub->connect().get();
    if (!connected) {
        LOG_FATAL(TAG, "connect: {}", to_string(connected));
        return 1;
    }

    for (const auto& label : hub->getLabels()) {
        auto granted = hub->subscribe(label).get();
        if (!granted) {
            LOG_ERROR(TAG, "subscribe '{}': {}", label, to_string(granted));
        }
    }

    if (broker) {
        for (int i = 3; i < argc; ++i) {
            std::string arg = argv[i];
            auto eq = arg.find('=');
            auto topic = arg.substr(0, eq);
            auto payload = eq == std::string::npos ? std::string() : arg.substr(eq + 1);
            auto n = broker->inject(topic, payload);
            LOG_DEBUG(TAG, "injected {} -> {} session(s)", topic, n);
        }
    } else {
        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);
        LOG_INFO(TAG, "listening on {}, Ctrl-C to stop", cfg.value().url);
        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    auto ended = hub->end().get();
    if (!ended) {
        LOG_WARN(TAG, "end: {}", to_string(ended));
    }
    hub.reset();
    logging::Logger::instance().shutdown();
    return 0;
}

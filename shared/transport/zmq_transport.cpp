#include "zmq_transport.hpp"
#include "logging.hpp"
#include "topic_filter.hpp"

#include <zmq.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <deque>
#include <functional>
#include <map>
#include <vector>

#include <fmt/format.h>

namespace transport {

namespace {

std::atomic<uint64_t> g_monitor_seq{0};

Result<void> socketError(const char* what) {
    return Error(ResultCode::SocketError, fmt::format("{}: {}", what, zmq_strerror(zmq_errno())));
}

std::string frameString(zmq_msg_t& frame) {
    return std::string(static_cast<const char*>(zmq_msg_data(&frame)), zmq_msg_size(&frame));
}

} // namespace

// ----------------------------------------------------------------------------
// ZmqClient::Impl - shared between the client handle and its poll thread
// ----------------------------------------------------------------------------

struct ZmqClient::Impl {
    static constexpr const char* LOG_TAG = "ZmqClient";

    struct Command {
        std::function<void(Impl&)> run;
        std::function<void()> cancel;
    };

    ~Impl() { closeSockets(0); }

    Result<void> openSockets();
    void closeSockets(int linger_ms);

    void post(Command cmd);
    void drainCommands();
    void cancelCommands();

    void pollLoop();
    void handleMonitorEvents();
    void onMonitorEvent(uint16_t event, const std::string& address);
    void receiveMessages();

    Result<void> addFilter(const std::string& filter);
    Result<void> removeFilter(const std::string& filter);

    std::shared_ptr<void> context;
    Listener* listener = nullptr;
    std::string url;
    std::string publish_endpoint;
    std::string monitor_endpoint;
    Options options;
    int poll_interval_ms = 50;

    void* sub = nullptr;
    void* pub = nullptr;
    void* monitor = nullptr;
    bool open = false;

    std::atomic<bool> alive{true};          // cleared when the client handle dies
    std::atomic<bool> connected{false};
    std::atomic<bool> reconnecting{false};
    std::atomic<bool> ended{false};
    bool ever_connected = false;

    std::mutex mutex;
    std::deque<Command> commands;

    // poll thread only
    std::vector<std::string> filters;
    std::map<std::string, int> prefixes;    // literal prefix -> filter count
};

Result<void> ZmqClient::Impl::openSockets() {
    void* ctx = context.get();

    sub = zmq_socket(ctx, ZMQ_SUB);
    if (!sub) return socketError("create SUB socket");

    int linger = 0;
    int reconnect_ivl = options.reconnect_period_ms;
    int connect_timeout = options.connect_timeout_ms;
    zmq_setsockopt(sub, ZMQ_LINGER, &linger, sizeof(linger));
    if (zmq_setsockopt(sub, ZMQ_RECONNECT_IVL, &reconnect_ivl, sizeof(reconnect_ivl)) != 0) {
        return socketError("set reconnect interval");
    }
    if (connect_timeout > 0 &&
        zmq_setsockopt(sub, ZMQ_CONNECT_TIMEOUT, &connect_timeout, sizeof(connect_timeout)) != 0) {
        return socketError("set connect timeout");
    }
    if (options.keepalive_s > 0) {
        int on = 1;
        int idle = options.keepalive_s;
        zmq_setsockopt(sub, ZMQ_TCP_KEEPALIVE, &on, sizeof(on));
        zmq_setsockopt(sub, ZMQ_TCP_KEEPALIVE_IDLE, &idle, sizeof(idle));
    }
    if (!options.username.empty()) {
        zmq_setsockopt(sub, ZMQ_PLAIN_USERNAME, options.username.data(), options.username.size());
        zmq_setsockopt(sub, ZMQ_PLAIN_PASSWORD, options.password.data(), options.password.size());
    }

    // monitor before connect, otherwise the first CONNECTED is lost
    monitor_endpoint = fmt::format("inproc://topicbus-monitor-{}", g_monitor_seq++);
    const int events = ZMQ_EVENT_CONNECTED | ZMQ_EVENT_CONNECT_RETRIED | ZMQ_EVENT_DISCONNECTED;
    if (zmq_socket_monitor(sub, monitor_endpoint.c_str(), events) != 0) {
        return socketError("start socket monitor");
    }
    monitor = zmq_socket(ctx, ZMQ_PAIR);
    if (!monitor) return socketError("create monitor socket");
    zmq_setsockopt(monitor, ZMQ_LINGER, &linger, sizeof(linger));
    if (zmq_connect(monitor, monitor_endpoint.c_str()) != 0) {
        return socketError("connect monitor socket");
    }

    if (zmq_connect(sub, url.c_str()) != 0) {
        return Error(ResultCode::ConnectionFail,
                     fmt::format("connect {}: {}", url, zmq_strerror(zmq_errno())));
    }

    if (!publish_endpoint.empty()) {
        pub = zmq_socket(ctx, ZMQ_PUB);
        if (!pub) return socketError("create PUB socket");
        if (zmq_connect(pub, publish_endpoint.c_str()) != 0) {
            return Error(ResultCode::ConnectionFail,
                         fmt::format("connect {}: {}", publish_endpoint, zmq_strerror(zmq_errno())));
        }
    }

    open = true;
    return OK();
}

void ZmqClient::Impl::closeSockets(int linger_ms) {
    if (pub) {
        zmq_setsockopt(pub, ZMQ_LINGER, &linger_ms, sizeof(linger_ms));
        zmq_close(pub);
        pub = nullptr;
    }
    if (sub) {
        zmq_socket_monitor(sub, nullptr, 0);
        zmq_close(sub);
        sub = nullptr;
    }
    if (monitor) {
        zmq_close(monitor);
        monitor = nullptr;
    }
    open = false;
    connected = false;
    reconnecting = false;
}

void ZmqClient::Impl::post(Command cmd) {
    std::lock_guard<std::mutex> lock(mutex);
    commands.push_back(std::move(cmd));
}

void ZmqClient::Impl::drainCommands() {
    std::deque<Command> batch;
    {
        std::lock_guard<std::mutex> lock(mutex);
        batch.swap(commands);
    }
    for (auto& cmd : batch) {
        // a completion may destroy the client half way through the batch
        if (alive) {
            cmd.run(*this);
        } else {
            cmd.cancel();
        }
    }
}

void ZmqClient::Impl::cancelCommands() {
    std::deque<Command> batch;
    {
        std::lock_guard<std::mutex> lock(mutex);
        batch.swap(commands);
    }
    for (auto& cmd : batch) {
        cmd.cancel();
    }
}

void ZmqClient::Impl::pollLoop() {
    using clock = std::chrono::steady_clock;
    const auto started = clock::now();

    while (alive) {
        drainCommands();
        if (!alive) break;

        if (!open) {
            // ended or failed; keep serving commands until the handle goes away
            std::this_thread::sleep_for(std::chrono::milliseconds(poll_interval_ms));
            continue;
        }

        zmq_pollitem_t items[] = {
            { sub, 0, ZMQ_POLLIN, 0 },
            { monitor, 0, ZMQ_POLLIN, 0 },
        };
        int rc = zmq_poll(items, 2, poll_interval_ms);
        if (rc < 0) {
            if (zmq_errno() == EINTR) continue;
            auto err = socketError("poll");
            LOGE("{}", to_string(err));
            closeSockets(0);
            if (alive) listener->onError(err);
            continue;
        }

        if (items[1].revents & ZMQ_POLLIN) handleMonitorEvents();
        if (!alive || !open) continue;
        if (items[0].revents & ZMQ_POLLIN) receiveMessages();
        if (!alive || !open) continue;

        if (!ever_connected && options.connect_timeout_ms > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - started);
            if (elapsed.count() >= options.connect_timeout_ms) {
                closeSockets(0);
                auto err = Error(ResultCode::Timeout,
                                 fmt::format("connect {} timed out after {} ms", url, elapsed.count()));
                LOGW("{}", to_string(err));
                if (alive) listener->onError(err);
            }
        }
    }

    closeSockets(0);
    cancelCommands();
}

void ZmqClient::Impl::handleMonitorEvents() {
    while (alive && open) {
        zmq_msg_t frame;
        zmq_msg_init(&frame);
        if (zmq_msg_recv(&frame, monitor, ZMQ_DONTWAIT) < 0) {
            zmq_msg_close(&frame);
            break;
        }

        // frame 0: uint16 event + uint32 value, frame 1: endpoint
        uint16_t event = 0;
        if (zmq_msg_size(&frame) >= sizeof(uint16_t) + sizeof(uint32_t)) {
            std::memcpy(&event, zmq_msg_data(&frame), sizeof(event));
        }
        bool more = zmq_msg_more(&frame);
        zmq_msg_close(&frame);

        std::string address;
        if (more) {
            zmq_msg_init(&frame);
            if (zmq_msg_recv(&frame, monitor, 0) >= 0) address = frameString(frame);
            zmq_msg_close(&frame);
        }
        onMonitorEvent(event, address);
    }
}

void ZmqClient::Impl::onMonitorEvent(uint16_t event, const std::string& address) {
    switch (event) {
    case ZMQ_EVENT_CONNECTED: {
        if (connected) return;
        connected = true;
        reconnecting = false;
        ever_connected = true;
        LOGI("connected {}", address);
        if (alive) listener->onConnect(ConnAck{});
        break;
    }
    case ZMQ_EVENT_CONNECT_RETRIED:
        // retries before the first connect are covered by the connect timeout
        if (!ever_connected || connected || reconnecting) return;
        reconnecting = true;
        LOGD("reconnecting {}", address);
        if (alive) listener->onReconnect();
        break;
    case ZMQ_EVENT_DISCONNECTED:
        if (!connected) return;
        connected = false;
        LOGW("disconnected {}", address);
        if (alive) listener->onOffline();
        break;
    default:
        LOGT("monitor event {} ({})", event, address);
        break;
    }
}

void ZmqClient::Impl::receiveMessages() {
    while (alive && open) {
        zmq_msg_t frame;
        zmq_msg_init(&frame);
        if (zmq_msg_recv(&frame, sub, ZMQ_DONTWAIT) < 0) {
            zmq_msg_close(&frame);
            break;
        }
        std::string topic = frameString(frame);
        bool more = zmq_msg_more(&frame);
        zmq_msg_close(&frame);

        std::string payload;
        bool first = true;
        while (more) {
            zmq_msg_init(&frame);
            if (zmq_msg_recv(&frame, sub, 0) < 0) {
                zmq_msg_close(&frame);
                break;
            }
            if (first) payload = frameString(frame);
            first = false;
            more = zmq_msg_more(&frame);
            zmq_msg_close(&frame);
        }

        bool matched = std::any_of(filters.begin(), filters.end(),
                                   [&](const std::string& f) { return pattern::topicMatches(f, topic); });
        if (!matched) {
            LOGT("drop {} (prefix match only)", topic);
            continue;
        }

        message::PacketMeta meta;
        if (alive) listener->onMessage(topic, payload, meta);
    }
}

Result<void> ZmqClient::Impl::addFilter(const std::string& filter) {
    if (std::find(filters.begin(), filters.end(), filter) != filters.end()) return OK();

    auto prefix = pattern::literalPrefix(filter);
    if (prefixes[prefix]++ == 0) {
        if (zmq_setsockopt(sub, ZMQ_SUBSCRIBE, prefix.data(), prefix.size()) != 0) {
            if (--prefixes[prefix] == 0) prefixes.erase(prefix);
            return socketError("subscribe");
        }
    }
    filters.push_back(filter);
    return OK();
}

Result<void> ZmqClient::Impl::removeFilter(const std::string& filter) {
    auto it = std::find(filters.begin(), filters.end(), filter);
    if (it == filters.end()) return OK();
    filters.erase(it);

    auto prefix = pattern::literalPrefix(filter);
    auto ref = prefixes.find(prefix);
    if (ref != prefixes.end() && --ref->second == 0) {
        prefixes.erase(ref);
        if (zmq_setsockopt(sub, ZMQ_UNSUBSCRIBE, prefix.data(), prefix.size()) != 0) {
            return socketError("unsubscribe");
        }
    }
    return OK();
}

// ----------------------------------------------------------------------------
// ZmqClient
// ----------------------------------------------------------------------------

ZmqClient::~ZmqClient() {
    impl_->alive = false;
    if (thread_.joinable()) {
        if (thread_.get_id() == std::this_thread::get_id()) {
            // destroyed from one of our own callbacks; the loop exits on return
            thread_.detach();
        } else {
            thread_.join();
        }
    }
    impl_->cancelCommands();
}

void ZmqClient::start() {
    auto impl = impl_;
    thread_ = std::thread([impl] { impl->pollLoop(); });
}

bool ZmqClient::isConnected() const {
    return !impl_->ended && impl_->connected;
}

bool ZmqClient::isReconnecting() const {
    return !impl_->ended && impl_->reconnecting;
}

void ZmqClient::subscribe(const std::string& filter, const SubscribeOptions& options,
                          Completion<SubscriptionGrant> done) {
    using Grant = SubscriptionGrant;
    if (options.qos != message::QoS::AtMostOnce) {
        LOGD("{} granted at most once delivery", filter);
    }
    impl_->post({
        [filter, done](Impl& impl) {
            if (!impl.open) {
                done(Result<Grant>::Error(ResultCode::ConnectionLost, "client not connected"));
                return;
            }
            if (!pattern::isValidTopicFilter(filter)) {
                done(Result<Grant>::Error(ResultCode::InvalidArgument,
                                          fmt::format("invalid topic filter ({})", filter)));
                return;
            }
            auto r = impl.addFilter(filter);
            if (!r) {
                done(r);
                return;
            }
            Grant grant;
            grant.topic = filter;
            grant.qos = message::QoS::AtMostOnce;
            done(Result<Grant>::OK(std::move(grant)));
        },
        [done] { done(Result<Grant>::Error(ResultCode::Cancelled, "client destroyed")); },
    });
}

void ZmqClient::unsubscribe(const std::string& filter, Completion<void> done) {
    impl_->post({
        [filter, done](Impl& impl) {
            if (!impl.open) {
                done(Error(ResultCode::ConnectionLost, "client not connected"));
                return;
            }
            done(impl.removeFilter(filter));
        },
        [done] { done(Error(ResultCode::Cancelled, "client destroyed")); },
    });
}

void ZmqClient::publish(const std::string& topic, const std::string& payload,
                        const PublishOptions& options, Completion<void> done) {
    if (options.retain) {
        LOGD("retain flag ignored for {}", topic);
    }
    impl_->post({
        [topic, payload, done](Impl& impl) {
            if (!impl.open) {
                done(Error(ResultCode::ConnectionLost, "client not connected"));
                return;
            }
            if (!impl.pub) {
                done(Error(ResultCode::NotSupported, "no publish endpoint configured"));
                return;
            }
            if (!pattern::isValidTopicName(topic)) {
                done(Error(ResultCode::InvalidArgument, fmt::format("invalid topic name ({})", topic)));
                return;
            }
            if (zmq_send(impl.pub, topic.data(), topic.size(), ZMQ_SNDMORE | ZMQ_DONTWAIT) < 0 ||
                zmq_send(impl.pub, payload.data(), payload.size(), ZMQ_DONTWAIT) < 0) {
                done(socketError("publish"));
                return;
            }
            done(OK());
        },
        [done] { done(Error(ResultCode::Cancelled, "client destroyed")); },
    });
}

void ZmqClient::end(bool force, Completion<void> done) {
    impl_->post({
        [force, done](Impl& impl) {
            if (!impl.open) {
                done(Error(ResultCode::InvalidState, "client already ended"));
                return;
            }
            impl.ended = true;
            impl.closeSockets(force ? 0 : 1000);
            LOG_INFO(Impl::LOG_TAG, "closed {} (force={})", impl.url, force);
            if (impl.alive) impl.listener->onClose();
            // may destroy the client handle
            done(OK());
        },
        [done] { done(Error(ResultCode::Cancelled, "client destroyed")); },
    });
}

// ----------------------------------------------------------------------------
// ZmqTransport
// ----------------------------------------------------------------------------

ZmqTransport::ZmqTransport(ZmqTransportConfig config) : config_(std::move(config)) {
}

Result<void> ZmqTransport::ensureContext() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (context_) return OK();

    void* ctx = zmq_ctx_new();
    if (!ctx) return Error(ResultCode::InternalError, "failed to create zmq context");
    context_ = std::shared_ptr<void>(ctx, [](void* c) { zmq_ctx_term(c); });
    return OK();
}

std::unique_ptr<Client> ZmqTransport::connect(const std::string& url, const Options& options,
                                              Listener& listener) {
    auto impl = std::make_shared<ZmqClient::Impl>();
    impl->listener = &listener;
    impl->url = url;
    impl->publish_endpoint = config_.publish_endpoint;
    impl->options = options;
    impl->poll_interval_ms = config_.poll_interval_ms > 0 ? config_.poll_interval_ms : 50;

    std::unique_ptr<ZmqClient> client(new ZmqClient(impl));

    auto ctx = ensureContext();
    if (!ctx) {
        LOGE("{}", to_string(ctx));
        listener.onError(ctx);
        return client;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        impl->context = context_;
    }

    if (options.will) {
        LOGW("will message for '{}' is not supported, ignored", options.client_id);
    }

    auto opened = impl->openSockets();
    if (!opened) {
        impl->closeSockets(0);
        LOGE("connect '{}' to {} failed: {}", options.client_id, url, to_string(opened));
        listener.onError(opened);
        return client;
    }

    LOGI("client '{}' connecting to {} (publish: {})", options.client_id, url,
         config_.publish_endpoint.empty() ? "-" : config_.publish_endpoint);
    client->start();
    return client;
}

} // namespace transport

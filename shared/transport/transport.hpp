#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "result.h"
#include "message.hpp"

namespace transport {

struct Will {
    std::string topic;
    std::string payload;
    message::QoS qos = message::QoS::AtMostOnce;
    bool retain = false;
};

// Connection options handed to the transport unchanged.
struct Options {
    std::string client_id;
    int keepalive_s = 60;
    bool clean = true;
    int reconnect_period_ms = 1000;
    int connect_timeout_ms = 30000;
    std::string username;
    std::string password;
    std::optional<Will> will;
};

struct ConnAck {
    bool session_present = false;
    uint8_t return_code = 0;
};

struct SubscribeOptions {
    message::QoS qos = message::QoS::AtMostOnce;
};

struct SubscriptionGrant {
    std::string topic;
    message::QoS qos = message::QoS::AtMostOnce;
};

struct PublishOptions {
    message::QoS qos = message::QoS::AtMostOnce;
    bool retain = false;
    bool dup = false;
};

template <typename T>
using Completion = std::function<void(Result<T>)>;

// Lifecycle and inbound message events of one client connection.
// Events of one connection are never delivered concurrently.
class Listener {
public:
    virtual ~Listener() = default;

    virtual void onConnect(const ConnAck& ack) = 0;
    virtual void onReconnect() = 0;
    virtual void onOffline() = 0;
    virtual void onClose() = 0;
    virtual void onError(const Result<void>& error) = 0;
    virtual void onMessage(const std::string& topic, const std::string& payload,
                           const message::PacketMeta& meta) = 0;
};

// Handle to one connection.
//
// A Client may be destroyed from inside any of its own callbacks. Once
// destroyed it delivers no further events, and every completion still pending
// is invoked with ResultCode::Cancelled. Every completion is invoked exactly once.
class Client {
public:
    virtual ~Client() = default;

    virtual bool isConnected() const = 0;
    virtual bool isReconnecting() const = 0;

    virtual void subscribe(const std::string& filter, const SubscribeOptions& options,
                           Completion<SubscriptionGrant> done) = 0;
    virtual void unsubscribe(const std::string& filter, Completion<void> done) = 0;
    virtual void publish(const std::string& topic, const std::string& payload,
                         const PublishOptions& options, Completion<void> done) = 0;
    // force: do not wait for in-flight messages
    virtual void end(bool force, Completion<void> done) = 0;
};

class Transport {
public:
    virtual ~Transport() = default;

    // Starts connecting. The outcome arrives as listener.onConnect or
    // listener.onError, possibly before this call returns.
    virtual std::unique_ptr<Client> connect(const std::string& url, const Options& options,
                                            Listener& listener) = 0;
};

} // namespace transport

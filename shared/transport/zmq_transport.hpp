#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "result.h"
#include "transport.hpp"

namespace transport {

struct ZmqTransportConfig {
    // XSUB side of the proxy. Empty: publish fails with NotSupported.
    std::string publish_endpoint;
    int poll_interval_ms = 50;
};

// ZeroMQ client for an XSUB/XPUB proxy.
//
// The connect url is the proxy's XPUB endpoint (e.g. "tcp://127.0.0.1:5556").
// Messages are two frames [topic][payload]. SUB sockets only filter on a
// prefix, so each MQTT filter subscribes its literal prefix and inbound
// topics are matched against the filters again before delivery.
// All socket work and every listener call happen on one poll thread per client.
class ZmqClient : public Client {
public:
    static constexpr const char* LOG_TAG = "ZmqClient";

    ~ZmqClient() override;

    bool isConnected() const override;
    bool isReconnecting() const override;

    void subscribe(const std::string& filter, const SubscribeOptions& options,
                   Completion<SubscriptionGrant> done) override;
    void unsubscribe(const std::string& filter, Completion<void> done) override;
    void publish(const std::string& topic, const std::string& payload,
                 const PublishOptions& options, Completion<void> done) override;
    void end(bool force, Completion<void> done) override;

private:
    friend class ZmqTransport;
    struct Impl;

    explicit ZmqClient(std::shared_ptr<Impl> impl) : impl_(std::move(impl)) {}
    void start();

    std::shared_ptr<Impl> impl_;
    std::thread thread_;
};

class ZmqTransport : public Transport {
public:
    static constexpr const char* LOG_TAG = "ZmqTransport";

    explicit ZmqTransport(ZmqTransportConfig config = {});

    std::unique_ptr<Client> connect(const std::string& url, const Options& options,
                                    Listener& listener) override;

private:
    Result<void> ensureContext();

    ZmqTransportConfig config_;
    std::mutex mutex_;
    std::shared_ptr<void> context_;     // outlives every client socket
};

} // namespace transport

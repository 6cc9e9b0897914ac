#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "result.h"
#include "message.hpp"
#include "transport.hpp"

namespace transport {

class MemoryClient;

// In-process broker. Routes every publish to each connected session with a
// matching subscription filter. Delivery is synchronous on the publishing thread.
//
// url form: "memory://<anything>"
class MemoryBroker {
public:
    static constexpr const char* LOG_TAG = "MemoryBroker";
    static constexpr const char* URL_SCHEME = "memory://";

    MemoryBroker() = default;
    MemoryBroker(const MemoryBroker&) = delete;
    MemoryBroker& operator=(const MemoryBroker&) = delete;

    // While refused, connects fail with the given error (ConnectionFail by default).
    void refuseConnections(std::optional<Result<void>> error);

    // Drops the session of client_id: the client goes offline and keeps its filters.
    Result<void> disconnect(const std::string& client_id);
    // Brings an offline client back: reconnect, then connect.
    Result<void> reconnect(const std::string& client_id);

    // Injects a message as if published by another client.
    std::size_t inject(const std::string& topic, const std::string& payload,
                       const PublishOptions& options = {});

    std::size_t sessionCount() const;
    std::vector<std::string> filters(const std::string& client_id) const;

private:
    friend class MemoryClient;
    friend class MemoryTransport;

    struct Session {
        std::string client_id;
        Listener* listener = nullptr;
        std::vector<std::string> filters;
        std::atomic<bool> alive{true};
        std::atomic<bool> online{false};
    };

    std::shared_ptr<Session> attach(const std::string& client_id, Listener& listener);
    void detach(const std::shared_ptr<Session>& session);
    std::shared_ptr<Session> findLocked(const std::string& client_id) const;
    std::size_t route(const std::string& topic, const std::string& payload, const PublishOptions& options);

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<Session>> sessions_;
    std::optional<Result<void>> refusal_;
    uint16_t next_message_id_ = 1;
};

class MemoryClient : public Client {
public:
    static constexpr const char* LOG_TAG = "MemoryClient";

    MemoryClient(std::shared_ptr<MemoryBroker> broker, std::shared_ptr<MemoryBroker::Session> session);
    ~MemoryClient() override;

    bool isConnected() const override;
    bool isReconnecting() const override { return false; }

    void subscribe(const std::string& filter, const SubscribeOptions& options,
                   Completion<SubscriptionGrant> done) override;
    void unsubscribe(const std::string& filter, Completion<void> done) override;
    void publish(const std::string& topic, const std::string& payload,
                 const PublishOptions& options, Completion<void> done) override;
    void end(bool force, Completion<void> done) override;

private:
    std::shared_ptr<MemoryBroker> broker_;
    std::shared_ptr<MemoryBroker::Session> session_;
    std::shared_ptr<bool> token_ = std::make_shared<bool>(true);     // expires with the client
    bool ended_ = false;
};

class MemoryTransport : public Transport {
public:
    static constexpr const char* LOG_TAG = "MemoryTransport";

    explicit MemoryTransport(std::shared_ptr<MemoryBroker> broker) : broker_(std::move(broker)) {}

    std::unique_ptr<Client> connect(const std::string& url, const Options& options,
                                    Listener& listener) override;

    const std::shared_ptr<MemoryBroker>& broker() const noexcept { return broker_; }

private:
    std::shared_ptr<MemoryBroker> broker_;
};

} // namespace transport

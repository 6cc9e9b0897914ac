#pragma once

#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "result.h"
#include "message.hpp"
#include "transport.hpp"
#include "label_registry.hpp"
#include "dispatcher.hpp"
#include "connection_state.hpp"

namespace bus {

// Label based publish/subscribe on top of a transport client.
//
// Patterns are registered under labels; subscribe/publish/listen use the
// label and parameter maps instead of raw topics. Every public method and
// every transport event is serialized on one recursive mutex, so listeners
// and status observers may call back into the bus.
class Bus {
public:
    static constexpr const char* LOG_TAG = "Bus";

    static std::unique_ptr<Bus> create(const std::string& client_id, const std::string& url,
                                       std::shared_ptr<transport::Transport> transport,
                                       transport::Options options = {});

    Bus(std::string url, transport::Options options, std::shared_ptr<transport::Transport> transport);
    ~Bus();

    Bus(const Bus&) = delete;
    Bus& operator=(const Bus&) = delete;

    const std::string& getId() const noexcept { return options_.client_id; }
    const std::string& getUrl() const noexcept { return url_; }

    // true when a client exists and is connected or reconnecting
    bool isAvailable() const;
    Status getStatus() const;
    std::optional<StatusError> getStatusError() const;
    void onStatusChange(StatusCallback fn);

    // patterns
    Result<void> setPattern(const std::string& label, const std::string& pattern);
    Result<void> removePattern(const std::string& label);
    Result<std::string> getTopic(const std::string& label) const;
    std::vector<std::string> getLabels() const;
    std::vector<std::string> getSubscriptions() const;

    // listeners
    Result<ListenerId> on(const std::string& label, Listener fn);
    Result<ListenerId> once(const std::string& label, Listener fn);
    Result<void> removeListener(const std::string& label, ListenerId id);
    Result<void> removeAllListeners(const std::string& label);
    void removeAllListeners();

    // transport round-trips
    std::future<Result<transport::ConnAck>> connect();
    std::future<Result<void>> end(bool force = false);
    std::future<Result<transport::SubscriptionGrant>> subscribe(const std::string& label,
                                                                transport::SubscribeOptions options = {});
    std::future<Result<void>> unsubscribe(const std::string& label, bool remove_listeners = false);
    std::future<Result<void>> publish(const std::string& label, const message::Parameters& params,
                                      const std::string& payload, transport::PublishOptions options = {});

private:
    class Link;
    struct Connection;

    // Outlives the bus inside transport completions; alive is cleared by ~Bus.
    struct Guard {
        std::recursive_mutex mutex;
        bool alive = true;
    };

    // transport events, dropped unless epoch is the current one
    void handleConnect(uint64_t epoch, const transport::ConnAck& ack);
    void handleLifecycle(uint64_t epoch, Status status);
    void handleError(uint64_t epoch, const Result<void>& error);
    void handleMessage(uint64_t epoch, const std::string& topic, const std::string& payload,
                       const message::PacketMeta& meta);

    bool availableLocked() const;
    // Returns the dropped connection so it can be destroyed outside the lock.
    std::unique_ptr<Connection> reset();
    void failPendingConnect(const Result<void>& error);

    std::shared_ptr<Guard> guard_ = std::make_shared<Guard>();
    std::recursive_mutex& mutex_ = guard_->mutex;

    std::string url_;
    transport::Options options_;
    std::shared_ptr<transport::Transport> transport_;

    ConnectionState state_;
    LabelRegistry registry_;
    Dispatcher dispatcher_{registry_};
    std::map<std::string, std::string> subscriptions_;     // topic -> owning label

    bool connecting_ = false;
    uint64_t epoch_ = 0;                                  // bumped on every reset
    std::shared_ptr<std::promise<Result<transport::ConnAck>>> pending_connect_;

    std::unique_ptr<Connection> conn_;
};

} // namespace bus

#include "bus.hpp"
#include "logging.hpp"
#include "result_helper.hpp"

#include <fmt/format.h>
#include <utility>

namespace bus {

namespace {

template <typename T>
std::future<Result<T>> ready(Result<T> r) {
    std::promise<Result<T>> p;
    auto f = p.get_future();
    p.set_value(std::move(r));
    return f;
}

Result<void> notAvailable() {
    return Error(ResultCode::NotAvailable, "bus not available");
}

Result<void> unknownLabel(const std::string& label) {
    return Error(ResultCode::UnknownLabel, fmt::format("unknown label ({})", label));
}

// Result for a completion that arrives after its bus was destroyed.
template <typename T>
Result<T> orphaned(Result<T> r) {
    if (r) return Error(ResultCode::Cancelled, "bus destroyed");
    return r;
}

} // namespace

// Listener handed to the transport for one connection attempt.
class Bus::Link : public transport::Listener {
public:
    Link(Bus& bus, uint64_t epoch) : bus_(bus), epoch_(epoch) {}

    void onConnect(const transport::ConnAck& ack) override { bus_.handleConnect(epoch_, ack); }
    void onReconnect() override { bus_.handleLifecycle(epoch_, Status::Reconnecting); }
    void onOffline() override { bus_.handleLifecycle(epoch_, Status::Offline); }
    void onClose() override { bus_.handleLifecycle(epoch_, Status::Closed); }
    void onError(const Result<void>& error) override { bus_.handleError(epoch_, error); }
    void onMessage(const std::string& topic, const std::string& payload,
                   const message::PacketMeta& meta) override {
        bus_.handleMessage(epoch_, topic, payload, meta);
    }

private:
    Bus& bus_;
    const uint64_t epoch_;
};

struct Bus::Connection {
    Connection(Bus& bus, uint64_t epoch) : link(bus, epoch) {}

    Link link;
    std::unique_ptr<transport::Client> client;      // destroyed before link
};

std::unique_ptr<Bus> Bus::create(const std::string& client_id, const std::string& url,
                                 std::shared_ptr<transport::Transport> transport,
                                 transport::Options options) {
    options.client_id = client_id;
    return std::make_unique<Bus>(url, std::move(options), std::move(transport));
}

Bus::Bus(std::string url, transport::Options options, std::shared_ptr<transport::Transport> transport)
    : url_(std::move(url)), options_(std::move(options)), transport_(std::move(transport)) {
}

Bus::~Bus() {
    std::unique_ptr<Connection> dropped;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        guard_->alive = false;
        failPendingConnect(Error(ResultCode::Cancelled, "bus destroyed"));
        connecting_ = false;
        ++epoch_;
        dropped = std::move(conn_);
    }
    // completions fired from here on only see guard_
    dropped.reset();
}

bool Bus::isAvailable() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return availableLocked();
}

bool Bus::availableLocked() const {
    if (!conn_ || !conn_->client) return false;
    return conn_->client->isConnected() || conn_->client->isReconnecting();
}

Status Bus::getStatus() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.status();
}

std::optional<StatusError> Bus::getStatusError() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.lastError();
}

void Bus::onStatusChange(StatusCallback fn) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    state_.setObserver(std::move(fn));
}

// ----------------------------------------------------------------------------
// patterns
// ----------------------------------------------------------------------------

Result<void> Bus::setPattern(const std::string& label, const std::string& pattern) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return registry_.add(label, pattern);
}

Result<void> Bus::removePattern(const std::string& label) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto entry = registry_.find(label);
    if (!entry) return unknownLabel(label);

    entry->listeners.clear();

    const std::string topic = entry->pattern.topic();
    auto sub = subscriptions_.find(topic);
    if (sub != subscriptions_.end() && sub->second == label) {
        subscriptions_.erase(sub);
        if (availableLocked()) {
            conn_->client->unsubscribe(topic, [topic](Result<void> r) {
                if (!r) LOG_WARN(LOG_TAG, "unsubscribe '{}' on pattern removal failed: {}", topic, to_string(r));
            });
        }
    }

    return registry_.remove(label);
}

Result<std::string> Bus::getTopic(const std::string& label) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto entry = registry_.find(label);
    if (!entry) return unknownLabel(label);
    return Result<std::string>::OK(entry->pattern.topic());
}

std::vector<std::string> Bus::getLabels() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return registry_.labels();
}

std::vector<std::string> Bus::getSubscriptions() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<std::string> topics;
    topics.reserve(subscriptions_.size());
    for (const auto& sub : subscriptions_) {
        topics.push_back(sub.first);
    }
    return topics;
}

// ----------------------------------------------------------------------------
// listeners
// ----------------------------------------------------------------------------

Result<ListenerId> Bus::on(const std::string& label, Listener fn) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return dispatcher_.addListener(label, std::move(fn));
}

Result<ListenerId> Bus::once(const std::string& label, Listener fn) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return dispatcher_.addOnceListener(label, std::move(fn));
}

Result<void> Bus::removeListener(const std::string& label, ListenerId id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return dispatcher_.removeListener(label, id);
}

Result<void> Bus::removeAllListeners(const std::string& label) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return dispatcher_.removeAllListeners(label);
}

void Bus::removeAllListeners() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    dispatcher_.removeAllListeners();
}

// ----------------------------------------------------------------------------
// transport round-trips
// ----------------------------------------------------------------------------

std::future<Result<transport::ConnAck>> Bus::connect() {
    using ConnAck = transport::ConnAck;

    // released after mutex_
    std::unique_ptr<Connection> stale;
    std::unique_ptr<transport::Client> orphan;
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (availableLocked()) {
        return ready<ConnAck>(Error(ResultCode::AlreadyAvailable, "connect: bus already available"));
    }
    if (connecting_) {
        return ready<ConnAck>(Error(ResultCode::ResourceBusy, "connect: already connecting"));
    }
    if (!transport_) {
        return ready<ConnAck>(Error(ResultCode::InvalidState, "connect: no transport"));
    }

    stale = reset();

    auto promise = std::make_shared<std::promise<Result<ConnAck>>>();
    auto future = promise->get_future();
    pending_connect_ = promise;
    connecting_ = true;

    LOGI("connecting to {} as '{}'", url_, options_.client_id);
    state_.transition(Status::Connecting);

    const auto epoch = epoch_;
    conn_ = std::make_unique<Connection>(*this, epoch);
    auto client = transport_->connect(url_, options_, conn_->link);

    if (epoch != epoch_) {
        // a status observer started over while the transport was connecting
        orphan = std::move(client);
        return future;
    }
    if (!client) {
        connecting_ = false;
        auto err = Error(ResultCode::ConnectionFail, "transport returned no client");
        state_.transition(Status::Error, err);
        failPendingConnect(err);
        return future;
    }
    conn_->client = std::move(client);
    return future;
}

std::future<Result<void>> Bus::end(bool force) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!availableLocked()) return ready<void>(notAvailable());

    LOGI("ending connection to {} (force={})", url_, force);

    auto promise = std::make_shared<std::promise<Result<void>>>();
    auto future = promise->get_future();
    const auto epoch = epoch_;

    conn_->client->end(force, [this, guard = guard_, promise, epoch](Result<void> r) {
        std::unique_ptr<Connection> dropped;        // released after mutex_
        std::lock_guard<std::recursive_mutex> lock(guard->mutex);
        if (!guard->alive) {
            promise->set_value(orphaned(std::move(r)));
            return;
        }
        if (!r) {
            LOGW("end failed: {}", to_string(r));
        } else if (epoch == epoch_) {
            dropped = reset();
        }
        promise->set_value(std::move(r));
    });
    return future;
}

std::future<Result<transport::SubscriptionGrant>> Bus::subscribe(const std::string& label,
                                                                 transport::SubscribeOptions options) {
    using Grant = transport::SubscriptionGrant;
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!availableLocked()) return ready<Grant>(notAvailable());

    auto entry = registry_.find(label);
    if (!entry) return ready<Grant>(unknownLabel(label));

    const std::string topic = entry->pattern.topic();
    if (subscriptions_.count(topic) > 0) {
        return ready<Grant>(Error(ResultCode::AlreadySubscribed,
                                  fmt::format("already subscribed to topic ({})", topic)));
    }

    auto promise = std::make_shared<std::promise<Result<Grant>>>();
    auto future = promise->get_future();
    const auto epoch = epoch_;

    conn_->client->subscribe(topic, options, [this, guard = guard_, promise, label, topic, epoch](Result<Grant> r) {
        std::lock_guard<std::recursive_mutex> lock(guard->mutex);
        if (!guard->alive) {
            promise->set_value(orphaned(std::move(r)));
            return;
        }
        if (r && epoch != epoch_) {
            r = Result<Grant>::Error(ResultCode::Cancelled, "connection was reset");
        }
        if (r) {
            auto e = registry_.find(label);
            if (!e || e->pattern.topic() != topic) {
                // label removed or repointed while the request was in flight
                LOGW("dropping {}, label '{}' changed while subscribing", topic, label);
                if (conn_ && conn_->client) {
                    conn_->client->unsubscribe(topic, [topic](Result<void> u) {
                        if (!u) LOG_WARN(LOG_TAG, "unsubscribe '{}' after label removal failed: {}", topic, to_string(u));
                    });
                }
                r = Result<Grant>::Error(ResultCode::UnknownLabel,
                                         fmt::format("label removed while subscribing ({})", label));
            }
        }
        if (r) {
            subscriptions_.emplace(topic, label);
            if (auto e = registry_.find(label)) e->subscribed = true;
            LOGI("subscribed '{}' -> {}", label, topic);
        } else {
            LOGW("subscribe '{}' failed: {}", label, to_string(r));
        }
        promise->set_value(std::move(r));
    });
    return future;
}

std::future<Result<void>> Bus::unsubscribe(const std::string& label, bool remove_listeners) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!availableLocked()) return ready<void>(notAvailable());

    auto entry = registry_.find(label);
    if (!entry) return ready<void>(unknownLabel(label));

    const std::string topic = entry->pattern.topic();
    if (subscriptions_.count(topic) == 0) {
        return ready<void>(Error(ResultCode::NotSubscribed,
                                 fmt::format("not subscribed to topic ({})", topic)));
    }

    auto promise = std::make_shared<std::promise<Result<void>>>();
    auto future = promise->get_future();
    const auto epoch = epoch_;

    conn_->client->unsubscribe(topic, [this, guard = guard_, promise, label, topic, remove_listeners,
                                        epoch](Result<void> r) {
        std::lock_guard<std::recursive_mutex> lock(guard->mutex);
        if (!guard->alive) {
            promise->set_value(orphaned(std::move(r)));
            return;
        }
        if (!r) {
            LOGW("unsubscribe '{}' failed: {}", label, to_string(r));
            promise->set_value(std::move(r));
            return;
        }

        if (epoch == epoch_) {
            auto sub = subscriptions_.find(topic);
            if (sub != subscriptions_.end()) {
                if (auto owner = registry_.find(sub->second)) owner->subscribed = false;
                subscriptions_.erase(sub);
            }
        }
        if (remove_listeners && registry_.contains(label)) {
            auto cleared = dispatcher_.removeAllListeners(label);
            LOG_IF_ERR(cleared);
        }
        LOGI("unsubscribed '{}' <- {}", label, topic);
        promise->set_value(std::move(r));
    });
    return future;
}

std::future<Result<void>> Bus::publish(const std::string& label, const message::Parameters& params,
                                       const std::string& payload, transport::PublishOptions options) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!availableLocked()) return ready<void>(notAvailable());

    auto entry = registry_.find(label);
    if (!entry) return ready<void>(unknownLabel(label));

    const auto expected = entry->pattern.parameterCount();
    if (params.size() != expected) {
        return ready<void>(Error(ResultCode::ParameterCountMismatch,
            fmt::format("wrong parameter count, got {}, expected {}", params.size(), expected)));
    }

    auto topic = entry->pattern.buildTopic(params);
    if (!topic) return ready<void>(Error(topic.code(), topic.error()));

    auto promise = std::make_shared<std::promise<Result<void>>>();
    auto future = promise->get_future();

    LOGT("publish '{}' -> {} ({} bytes)", label, topic.value(), payload.size());
    conn_->client->publish(topic.value(), payload, options, [promise, label](Result<void> r) {
        if (!r) LOG_WARN(LOG_TAG, "publish '{}' failed: {}", label, to_string(r));
        promise->set_value(std::move(r));
    });
    return future;
}

// ----------------------------------------------------------------------------
// transport events
// ----------------------------------------------------------------------------

void Bus::handleConnect(uint64_t epoch, const transport::ConnAck& ack) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (epoch != epoch_) return;

    if (connecting_) {
        connecting_ = false;
        LOGI("connected to {} (session present: {})", url_, ack.session_present);
        state_.transition(Status::Connected);
        if (pending_connect_) {
            auto promise = std::move(pending_connect_);
            promise->set_value(Result<transport::ConnAck>::OK(ack));
        }
        return;
    }
    state_.transition(Status::Connected);
}

void Bus::handleLifecycle(uint64_t epoch, Status status) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (epoch != epoch_ || connecting_) return;
    LOGD("transport event -> {}", to_string(status));
    state_.transition(status);
}

void Bus::handleError(uint64_t epoch, const Result<void>& error) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (epoch != epoch_) return;

    if (connecting_) {
        connecting_ = false;
        LOGE("connect to {} failed: {}", url_, to_string(error));
        state_.transition(Status::Error, error);
        failPendingConnect(error);
        return;
    }
    LOGW("transport error: {}", to_string(error));
    state_.transition(Status::Error, error);
}

void Bus::handleMessage(uint64_t epoch, const std::string& topic, const std::string& payload,
                        const message::PacketMeta& meta) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (epoch != epoch_ || connecting_) return;

    message::Packet packet;
    packet.topic = topic;
    packet.payload = payload;
    packet.qos = meta.qos;
    packet.retain = meta.retain;
    packet.dup = meta.dup;
    packet.message_id = meta.message_id;
    dispatcher_.dispatch(std::move(packet));
}

// ----------------------------------------------------------------------------

void Bus::failPendingConnect(const Result<void>& error) {
    if (!pending_connect_) return;
    auto promise = std::move(pending_connect_);
    promise->set_value(Result<transport::ConnAck>(error));
}

std::unique_ptr<Bus::Connection> Bus::reset() {
    failPendingConnect(Error(ResultCode::Cancelled, "connection reset"));
    state_.reset();
    subscriptions_.clear();
    for (auto& entry : registry_.entries()) {
        entry.subscribed = false;
    }
    connecting_ = false;
    ++epoch_;
    return std::move(conn_);
}

} // namespace bus

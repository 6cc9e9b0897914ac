#include "memory_transport.hpp"
#include "logging.hpp"
#include "topic_filter.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace transport {

// ----------------------------------------------------------------------------
// MemoryBroker
// ----------------------------------------------------------------------------

void MemoryBroker::refuseConnections(std::optional<Result<void>> error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (error && !error->hasError()) {
        error = Error(ResultCode::ConnectionFail, "connection refused");
    }
    refusal_ = std::move(error);
}

std::shared_ptr<MemoryBroker::Session> MemoryBroker::attach(const std::string& client_id, Listener& listener) {
    auto session = std::make_shared<Session>();
    session->client_id = client_id;
    session->listener = &listener;
    session->online = true;

    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.push_back(session);
    LOG_DEBUG(LOG_TAG, "session '{}' attached ({} total)", client_id, sessions_.size());
    return session;
}

void MemoryBroker::detach(const std::shared_ptr<Session>& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(sessions_.begin(), sessions_.end(), session);
    if (it == sessions_.end()) return;
    sessions_.erase(it);
    LOG_DEBUG(LOG_TAG, "session '{}' detached ({} left)", session->client_id, sessions_.size());
}

std::shared_ptr<MemoryBroker::Session> MemoryBroker::findLocked(const std::string& client_id) const {
    for (const auto& s : sessions_) {
        if (s->client_id == client_id) return s;
    }
    return nullptr;
}

Result<void> MemoryBroker::disconnect(const std::string& client_id) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = findLocked(client_id);
    }
    if (!session) return Error(ResultCode::NotFound, fmt::format("no session ({})", client_id));
    if (!session->online.exchange(false)) {
        return Error(ResultCode::InvalidState, fmt::format("session already offline ({})", client_id));
    }

    LOG_INFO(LOG_TAG, "dropping session '{}'", client_id);
    if (session->alive) session->listener->onOffline();
    return OK();
}

Result<void> MemoryBroker::reconnect(const std::string& client_id) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = findLocked(client_id);
    }
    if (!session) return Error(ResultCode::NotFound, fmt::format("no session ({})", client_id));
    if (session->online) {
        return Error(ResultCode::InvalidState, fmt::format("session is online ({})", client_id));
    }

    LOG_INFO(LOG_TAG, "restoring session '{}'", client_id);
    if (!session->alive) return OK();
    session->listener->onReconnect();
    if (!session->alive) return OK();

    session->online = true;
    ConnAck ack;
    ack.session_present = true;
    session->listener->onConnect(ack);
    return OK();
}

std::size_t MemoryBroker::inject(const std::string& topic, const std::string& payload,
                                 const PublishOptions& options) {
    return route(topic, payload, options);
}

std::size_t MemoryBroker::route(const std::string& topic, const std::string& payload,
                                const PublishOptions& options) {
    std::vector<std::shared_ptr<Session>> targets;
    message::PacketMeta meta;
    meta.qos = options.qos;
    meta.retain = options.retain;
    meta.dup = options.dup;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& s : sessions_) {
            if (!s->online) continue;
            bool matched = std::any_of(s->filters.begin(), s->filters.end(),
                                       [&](const std::string& f) { return pattern::topicMatches(f, topic); });
            if (matched) targets.push_back(s);
        }
        if (meta.qos != message::QoS::AtMostOnce) {
            meta.message_id = next_message_id_++;
            if (next_message_id_ == 0) next_message_id_ = 1;
        }
    }

    std::size_t delivered = 0;
    for (const auto& s : targets) {
        // a listener may tear down other clients while we deliver
        if (!s->alive || !s->online) continue;
        s->listener->onMessage(topic, payload, meta);
        ++delivered;
    }
    LOG_TRACE(LOG_TAG, "routed {} to {} session(s)", topic, delivered);
    return delivered;
}

std::size_t MemoryBroker::sessionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> MemoryBroker::filters(const std::string& client_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto session = findLocked(client_id);
    return session ? session->filters : std::vector<std::string>{};
}

// ----------------------------------------------------------------------------
// MemoryClient
// ----------------------------------------------------------------------------

MemoryClient::MemoryClient(std::shared_ptr<MemoryBroker> broker, std::shared_ptr<MemoryBroker::Session> session)
    : broker_(std::move(broker)), session_(std::move(session)) {
}

MemoryClient::~MemoryClient() {
    session_->alive = false;
    session_->online = false;
    broker_->detach(session_);
}

bool MemoryClient::isConnected() const {
    return !ended_ && session_->online;
}

void MemoryClient::subscribe(const std::string& filter, const SubscribeOptions& options,
                             Completion<SubscriptionGrant> done) {
    using Grant = SubscriptionGrant;
    if (!isConnected()) {
        done(Result<Grant>::Error(ResultCode::ConnectionLost, "client not connected"));
        return;
    }
    if (!pattern::isValidTopicFilter(filter)) {
        done(Result<Grant>::Error(ResultCode::InvalidArgument, fmt::format("invalid topic filter ({})", filter)));
        return;
    }
    {
        std::lock_guard<std::mutex> lock(broker_->mutex_);
        auto& filters = session_->filters;
        if (std::find(filters.begin(), filters.end(), filter) == filters.end()) {
            filters.push_back(filter);
        }
    }
    Grant grant;
    grant.topic = filter;
    grant.qos = options.qos;
    done(Result<Grant>::OK(std::move(grant)));
}

void MemoryClient::unsubscribe(const std::string& filter, Completion<void> done) {
    if (!isConnected()) {
        done(Error(ResultCode::ConnectionLost, "client not connected"));
        return;
    }
    {
        std::lock_guard<std::mutex> lock(broker_->mutex_);
        auto& filters = session_->filters;
        filters.erase(std::remove(filters.begin(), filters.end(), filter), filters.end());
    }
    done(OK());
}

void MemoryClient::publish(const std::string& topic, const std::string& payload,
                           const PublishOptions& options, Completion<void> done) {
    if (!isConnected()) {
        done(Error(ResultCode::ConnectionLost, "client not connected"));
        return;
    }
    if (!pattern::isValidTopicName(topic)) {
        done(Error(ResultCode::InvalidArgument, fmt::format("invalid topic name ({})", topic)));
        return;
    }

    std::weak_ptr<bool> token = token_;
    auto broker = broker_;
    broker->route(topic, payload, options);
    if (token.expired()) {
        done(Error(ResultCode::Cancelled, "client destroyed during delivery"));
        return;
    }
    done(OK());
}

void MemoryClient::end(bool force, Completion<void> done) {
    if (ended_) {
        done(Error(ResultCode::InvalidState, "client already ended"));
        return;
    }
    ended_ = true;
    LOG_DEBUG(LOG_TAG, "ending session '{}' (force={})", session_->client_id, force);

    session_->online = false;
    broker_->detach(session_);

    std::weak_ptr<bool> token = token_;
    if (session_->alive) session_->listener->onClose();
    if (token.expired()) {
        done(Error(ResultCode::Cancelled, "client destroyed while closing"));
        return;
    }
    // may destroy this client
    done(OK());
}

// ----------------------------------------------------------------------------
// MemoryTransport
// ----------------------------------------------------------------------------

std::unique_ptr<Client> MemoryTransport::connect(const std::string& url, const Options& options,
                                                 Listener& listener) {
    auto session_error = [&]() -> std::optional<Result<void>> {
        if (url.rfind(MemoryBroker::URL_SCHEME, 0) != 0) {
            return Error(ResultCode::InvalidArgument, fmt::format("unsupported url ({})", url));
        }
        if (options.client_id.empty()) {
            return Error(ResultCode::InvalidArgument, "empty client id");
        }
        std::lock_guard<std::mutex> lock(broker_->mutex_);
        if (broker_->refusal_) return broker_->refusal_;
        if (broker_->findLocked(options.client_id)) {
            return Error(ResultCode::ConnectionFail, fmt::format("client id in use ({})", options.client_id));
        }
        return std::nullopt;
    }();

    if (session_error) {
        LOG_WARN(LOG_TAG, "connect '{}' to {} failed: {}", options.client_id, url, to_string(*session_error));
        auto session = std::make_shared<MemoryBroker::Session>();
        session->client_id = options.client_id;
        session->listener = &listener;
        auto client = std::make_unique<MemoryClient>(broker_, session);
        listener.onError(*session_error);
        return client;
    }

    auto client = std::make_unique<MemoryClient>(broker_, broker_->attach(options.client_id, listener));
    LOG_INFO(LOG_TAG, "client '{}' connected to {}", options.client_id, url);
    listener.onConnect(ConnAck{});
    return client;
}

} // namespace transport

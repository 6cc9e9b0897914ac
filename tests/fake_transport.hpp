#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "transport.hpp"

namespace fake {

// Everything the fake saw, shared with the test so it outlives the client.
struct Script {
    enum class OnConnect { Nothing, Connect, Fail };

    OnConnect on_connect = OnConnect::Connect;
    Result<void> connect_error = Error(ResultCode::ConnectionFail, "refused");
    bool return_null = false;
    // false: completions are parked until the test completes them
    bool auto_complete = true;

    transport::Listener* listener = nullptr;
    std::string url;
    transport::Options options;
    int connects = 0;
    int clients = 0;            // id of the newest client
    bool client_alive = false;
    bool connected = false;
    bool reconnecting = false;

    struct Subscribe {
        std::string filter;
        transport::SubscribeOptions options;
        transport::Completion<transport::SubscriptionGrant> done;
    };
    struct Unsubscribe {
        std::string filter;
        transport::Completion<void> done;
    };
    struct Publish {
        std::string topic;
        std::string payload;
        transport::PublishOptions options;
        transport::Completion<void> done;
    };
    struct End {
        bool force = false;
        transport::Completion<void> done;
    };

    std::vector<Subscribe> subscribes;
    std::vector<Unsubscribe> unsubscribes;
    std::vector<Publish> publishes;
    std::vector<End> ends;

    // parked completions
    std::vector<transport::Completion<transport::SubscriptionGrant>> pending_subscribes;
    std::vector<transport::Completion<void>> pending_voids;

    // lifecycle helpers, as the transport would raise them
    void raiseConnect() { connected = true; reconnecting = false; listener->onConnect(transport::ConnAck{}); }
    void raiseReconnect() { reconnecting = true; listener->onReconnect(); }
    void raiseOffline() { connected = false; listener->onOffline(); }
    void raiseClose() { connected = false; reconnecting = false; listener->onClose(); }
    void raiseError(const Result<void>& e) { listener->onError(e); }
    void raiseMessage(const std::string& topic, const std::string& payload,
                      message::PacketMeta meta = {}) {
        listener->onMessage(topic, payload, meta);
    }
};

class Client : public transport::Client {
public:
    explicit Client(std::shared_ptr<Script> s) : s_(std::move(s)), id_(++s_->clients) { s_->client_alive = true; }

    ~Client() override {
        // an older client going away must not touch the newest one's state
        if (id_ != s_->clients) return;
        s_->client_alive = false;
        s_->connected = false;
        s_->reconnecting = false;
        auto subs = std::move(s_->pending_subscribes);
        auto voids = std::move(s_->pending_voids);
        for (auto& done : subs) {
            done(Result<transport::SubscriptionGrant>::Error(ResultCode::Cancelled, "client destroyed"));
        }
        for (auto& done : voids) {
            done(Error(ResultCode::Cancelled, "client destroyed"));
        }
    }

    bool isConnected() const override { return s_->connected; }
    bool isReconnecting() const override { return s_->reconnecting; }

    void subscribe(const std::string& filter, const transport::SubscribeOptions& options,
                   transport::Completion<transport::SubscriptionGrant> done) override {
        s_->subscribes.push_back({filter, options, done});
        if (!s_->auto_complete) {
            s_->pending_subscribes.push_back(std::move(done));
            return;
        }
        transport::SubscriptionGrant grant;
        grant.topic = filter;
        grant.qos = options.qos;
        done(Result<transport::SubscriptionGrant>::OK(grant));
    }

    void unsubscribe(const std::string& filter, transport::Completion<void> done) override {
        s_->unsubscribes.push_back({filter, done});
        if (!s_->auto_complete) {
            s_->pending_voids.push_back(std::move(done));
            return;
        }
        done(OK());
    }

    void publish(const std::string& topic, const std::string& payload,
                 const transport::PublishOptions& options, transport::Completion<void> done) override {
        s_->publishes.push_back({topic, payload, options, done});
        if (!s_->auto_complete) {
            s_->pending_voids.push_back(std::move(done));
            return;
        }
        done(OK());
    }

    void end(bool force, transport::Completion<void> done) override {
        s_->ends.push_back({force, done});
        if (!s_->auto_complete) {
            s_->pending_voids.push_back(std::move(done));
            return;
        }
        auto s = s_;
        s->raiseClose();
        // may destroy this client
        done(OK());
    }

private:
    std::shared_ptr<Script> s_;
    const int id_;
};

class Transport : public transport::Transport {
public:
    explicit Transport(std::shared_ptr<Script> s) : s_(std::move(s)) {}

    std::unique_ptr<transport::Client> connect(const std::string& url, const transport::Options& options,
                                               transport::Listener& listener) override {
        ++s_->connects;
        s_->url = url;
        s_->options = options;
        s_->listener = &listener;
        if (s_->return_null) return nullptr;

        auto client = std::make_unique<Client>(s_);
        switch (s_->on_connect) {
        case Script::OnConnect::Connect:
            s_->raiseConnect();
            break;
        case Script::OnConnect::Fail:
            s_->raiseError(s_->connect_error);
            break;
        case Script::OnConnect::Nothing:
            break;
        }
        return client;
    }

private:
    std::shared_ptr<Script> s_;
};

} // namespace fake

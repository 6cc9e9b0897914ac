#include <gtest/gtest.h>

#include <zmq.h>

#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "bus.hpp"
#include "zmq_transport.hpp"

using bus::Bus;
using bus::Status;

namespace {

// XSUB/XPUB forwarder on loopback tcp, torn down by shutting its context.
class Proxy {
public:
    Proxy() {
        ctx_ = zmq_ctx_new();
        xsub_ = zmq_socket(ctx_, ZMQ_XSUB);
        xpub_ = zmq_socket(ctx_, ZMQ_XPUB);
        int linger = 0;
        zmq_setsockopt(xsub_, ZMQ_LINGER, &linger, sizeof(linger));
        zmq_setsockopt(xpub_, ZMQ_LINGER, &linger, sizeof(linger));
        ok_ = zmq_bind(xsub_, "tcp://127.0.0.1:*") == 0 && zmq_bind(xpub_, "tcp://127.0.0.1:*") == 0;
        if (ok_) {
            publish_endpoint_ = lastEndpoint(xsub_);
            subscribe_endpoint_ = lastEndpoint(xpub_);
            thread_ = std::thread([this] { zmq_proxy(xsub_, xpub_, nullptr); });
        }
    }

    ~Proxy() {
        zmq_ctx_shutdown(ctx_);
        if (thread_.joinable()) thread_.join();
        zmq_close(xsub_);
        zmq_close(xpub_);
        zmq_ctx_term(ctx_);
    }

    bool ok() const { return ok_; }
    const std::string& publishEndpoint() const { return publish_endpoint_; }
    const std::string& subscribeEndpoint() const { return subscribe_endpoint_; }

private:
    static std::string lastEndpoint(void* socket) {
        char buf[256] = {};
        size_t len = sizeof(buf);
        zmq_getsockopt(socket, ZMQ_LAST_ENDPOINT, buf, &len);
        return buf;
    }

    void* ctx_ = nullptr;
    void* xsub_ = nullptr;
    void* xpub_ = nullptr;
    bool ok_ = false;
    std::string publish_endpoint_;
    std::string subscribe_endpoint_;
    std::thread thread_;
};

template <typename T>
Result<T> waitFor(std::future<Result<T>>& f, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    if (f.wait_for(timeout) != std::future_status::ready) {
        return Result<T>::Error(ResultCode::Timeout, "test wait timed out");
    }
    return f.get();
}

} // namespace

TEST(ZmqTransport, PublishThroughProxy) {
    Proxy proxy;
    ASSERT_TRUE(proxy.ok());

    transport::ZmqTransportConfig cfg;
    cfg.publish_endpoint = proxy.publishEndpoint();
    cfg.poll_interval_ms = 10;
    auto transport = std::make_shared<transport::ZmqTransport>(cfg);

    auto sender = Bus::create("sender", proxy.subscribeEndpoint(), transport);
    auto receiver = Bus::create("receiver", proxy.subscribeEndpoint(), transport);
    ASSERT_TRUE(sender->setPattern("cfg", "devices/+deviceId/config/#keys"));
    ASSERT_TRUE(receiver->setPattern("cfg", "devices/+deviceId/config/#keys"));

    auto c1 = sender->connect();
    auto c2 = receiver->connect();
    ASSERT_TRUE(waitFor(c1));
    ASSERT_TRUE(waitFor(c2));
    EXPECT_EQ(receiver->getStatus(), Status::Connected);

    std::mutex mutex;
    std::condition_variable cv;
    message::Packet got;
    bool received = false;
    ASSERT_TRUE(receiver->on("cfg", [&](const message::Packet& p) {
        std::lock_guard<std::mutex> lock(mutex);
        got = p;
        received = true;
        cv.notify_all();
    }));
    auto sub = receiver->subscribe("cfg");
    ASSERT_TRUE(waitFor(sub));

    // subscriptions reach the proxy asynchronously; keep publishing until one lands
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    std::unique_lock<std::mutex> lock(mutex);
    while (!received && std::chrono::steady_clock::now() < deadline) {
        lock.unlock();
        auto pub = sender->publish("cfg",
                                   {{"deviceId", std::string("d1")},
                                    {"keys", std::vector<std::string>{"http", "port"}}},
                                   "8080");
        ASSERT_TRUE(waitFor(pub));
        lock.lock();
        cv.wait_for(lock, std::chrono::milliseconds(50), [&] { return received; });
    }
    ASSERT_TRUE(received);
    EXPECT_EQ(got.topic, "devices/d1/config/http/port");
    EXPECT_EQ(got.payload, "8080");
    EXPECT_EQ(*message::asLevel(got.params.at("deviceId")), "d1");
    lock.unlock();

    auto end = receiver->end();
    ASSERT_TRUE(waitFor(end));
    EXPECT_EQ(receiver->getStatus(), Status::Ready);
}

TEST(ZmqTransport, PrefixMatchesAreFilteredAgain) {
    Proxy proxy;
    ASSERT_TRUE(proxy.ok());

    transport::ZmqTransportConfig cfg;
    cfg.publish_endpoint = proxy.publishEndpoint();
    cfg.poll_interval_ms = 10;
    auto transport = std::make_shared<transport::ZmqTransport>(cfg);

    auto b = Bus::create("solo", proxy.subscribeEndpoint(), transport);
    ASSERT_TRUE(b->setPattern("exact", "a/+x/c"));
    ASSERT_TRUE(b->setPattern("other", "a/+x/d"));
    auto c = b->connect();
    ASSERT_TRUE(waitFor(c));

    std::mutex mutex;
    std::condition_variable cv;
    int exact = 0;
    ASSERT_TRUE(b->on("exact", [&](const message::Packet&) {
        std::lock_guard<std::mutex> lock(mutex);
        ++exact;
        cv.notify_all();
    }));
    auto sub = b->subscribe("exact");
    ASSERT_TRUE(waitFor(sub));

    // "a/1/d" shares the SUB prefix "a/" but not the filter
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    std::unique_lock<std::mutex> lock(mutex);
    while (exact == 0 && std::chrono::steady_clock::now() < deadline) {
        lock.unlock();
        auto miss = b->publish("other", {{"x", std::string("1")}}, "");
        auto hit = b->publish("exact", {{"x", std::string("1")}}, "");
        ASSERT_TRUE(waitFor(miss));
        ASSERT_TRUE(waitFor(hit));
        lock.lock();
        cv.wait_for(lock, std::chrono::milliseconds(50), [&] { return exact > 0; });
    }
    EXPECT_GT(exact, 0);
    lock.unlock();
    // stop the poll thread before the listener's captures go away
    b.reset();
}

TEST(ZmqTransport, ConnectTimesOutWithoutPeer) {
    transport::ZmqTransportConfig cfg;
    cfg.poll_interval_ms = 10;
    auto transport = std::make_shared<transport::ZmqTransport>(cfg);

    transport::Options options;
    options.connect_timeout_ms = 200;
    options.reconnect_period_ms = 50;
    auto b = Bus::create("lonely", "tcp://127.0.0.1:1", transport, options);

    auto c = b->connect();
    auto r = waitFor(c);
    EXPECT_EQ(r.code(), ResultCode::Timeout);
    EXPECT_EQ(b->getStatus(), Status::Error);
}

TEST(ZmqTransport, PublishWithoutEndpointNotSupported) {
    Proxy proxy;
    ASSERT_TRUE(proxy.ok());

    auto transport = std::make_shared<transport::ZmqTransport>();
    auto b = Bus::create("reader", proxy.subscribeEndpoint(), transport);
    ASSERT_TRUE(b->setPattern("a", "a/+x"));
    auto c = b->connect();
    ASSERT_TRUE(waitFor(c));

    auto pub = b->publish("a", {{"x", std::string("1")}}, "");
    EXPECT_EQ(waitFor(pub).code(), ResultCode::NotSupported);
}

TEST(ZmqTransport, BadEndpointFailsImmediately) {
    auto transport = std::make_shared<transport::ZmqTransport>();
    auto b = Bus::create("x", "not-an-endpoint", transport);

    auto c = b->connect();
    EXPECT_EQ(waitFor(c).code(), ResultCode::ConnectionFail);
}

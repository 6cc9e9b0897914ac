#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "dispatcher.hpp"
#include "label_registry.hpp"

using bus::Dispatcher;
using bus::LabelRegistry;

namespace {

message::Packet packet(const std::string& topic, const std::string& payload = "") {
    message::Packet p;
    p.topic = topic;
    p.payload = payload;
    return p;
}

class DispatcherTest : public ::testing::Test {
protected:
    LabelRegistry registry_;
    Dispatcher dispatcher_{registry_};
};

} // namespace

TEST_F(DispatcherTest, FirstRegisteredLabelWins) {
    ASSERT_TRUE(registry_.add("a", "x/+p"));
    ASSERT_TRUE(registry_.add("b", "x/#p"));

    int a = 0, b = 0;
    ASSERT_TRUE(dispatcher_.addListener("a", [&](const message::Packet&) { ++a; }));
    ASSERT_TRUE(dispatcher_.addListener("b", [&](const message::Packet&) { ++b; }));

    auto handled = dispatcher_.dispatch(packet("x/1"));
    ASSERT_TRUE(handled);
    EXPECT_EQ(*handled, "a");
    EXPECT_EQ(a, 1);
    EXPECT_EQ(b, 0);

    // only "b" matches deeper topics
    handled = dispatcher_.dispatch(packet("x/1/2"));
    ASSERT_TRUE(handled);
    EXPECT_EQ(*handled, "b");
    EXPECT_EQ(b, 1);
}

TEST_F(DispatcherTest, ParametersAttached) {
    ASSERT_TRUE(registry_.add("cfg", "devices/+deviceId/config/#keys"));

    message::Parameters seen;
    std::string payload;
    ASSERT_TRUE(dispatcher_.addListener("cfg", [&](const message::Packet& p) {
        seen = p.params;
        payload = p.payload;
    }));

    ASSERT_TRUE(dispatcher_.dispatch(packet("devices/d1/config/http/host", "8080")));

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(*message::asLevel(seen.at("deviceId")), "d1");
    EXPECT_EQ(*message::asLevels(seen.at("keys")), (std::vector<std::string>{"http", "host"}));
    EXPECT_EQ(payload, "8080");
}

TEST_F(DispatcherTest, UnmatchedTopicIsDropped) {
    ASSERT_TRUE(registry_.add("a", "x/+p"));
    int calls = 0;
    ASSERT_TRUE(dispatcher_.addListener("a", [&](const message::Packet&) { ++calls; }));

    EXPECT_FALSE(dispatcher_.dispatch(packet("y/1")));
    EXPECT_EQ(calls, 0);
}

TEST_F(DispatcherTest, MatchingLabelWithoutListenersStillConsumes) {
    ASSERT_TRUE(registry_.add("a", "x/+p"));
    ASSERT_TRUE(registry_.add("b", "x/#p"));
    int b = 0;
    ASSERT_TRUE(dispatcher_.addListener("b", [&](const message::Packet&) { ++b; }));

    auto handled = dispatcher_.dispatch(packet("x/1"));
    ASSERT_TRUE(handled);
    EXPECT_EQ(*handled, "a");
    EXPECT_EQ(b, 0);
}

TEST_F(DispatcherTest, ListenersRunInRegistrationOrder) {
    ASSERT_TRUE(registry_.add("a", "x/+p"));
    std::vector<int> order;
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(dispatcher_.addListener("a", [&order, i](const message::Packet&) { order.push_back(i); }));
    }
    dispatcher_.dispatch(packet("x/1"));
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2}));
}

TEST_F(DispatcherTest, OnceListenerFiresOnce) {
    ASSERT_TRUE(registry_.add("a", "x/+p"));
    int once = 0, every = 0;
    ASSERT_TRUE(dispatcher_.addOnceListener("a", [&](const message::Packet&) { ++once; }));
    ASSERT_TRUE(dispatcher_.addListener("a", [&](const message::Packet&) { ++every; }));

    dispatcher_.dispatch(packet("x/1"));
    dispatcher_.dispatch(packet("x/2"));
    dispatcher_.dispatch(packet("x/3"));

    EXPECT_EQ(once, 1);
    EXPECT_EQ(every, 3);
    EXPECT_EQ(dispatcher_.listenerCount("a"), 1u);
}

TEST_F(DispatcherTest, OnceListenerRemovedBeforeItRuns) {
    ASSERT_TRUE(registry_.add("a", "x/+p"));
    std::size_t count_inside = 99;
    ASSERT_TRUE(dispatcher_.addOnceListener("a", [&](const message::Packet&) {
        count_inside = dispatcher_.listenerCount("a");
    }));
    dispatcher_.dispatch(packet("x/1"));
    EXPECT_EQ(count_inside, 0u);
}

TEST_F(DispatcherTest, ReentrantOnceListenerDoesNotFireTwice) {
    ASSERT_TRUE(registry_.add("a", "x/+p"));
    int once = 0;
    ASSERT_TRUE(dispatcher_.addOnceListener("a", [&](const message::Packet&) {
        ++once;
        dispatcher_.dispatch(packet("x/again"));
    }));
    dispatcher_.dispatch(packet("x/1"));
    EXPECT_EQ(once, 1);
}

TEST_F(DispatcherTest, ListenerAddedDuringDispatchWaitsForNextMessage) {
    ASSERT_TRUE(registry_.add("a", "x/+p"));
    int late = 0;
    bool added = false;
    ASSERT_TRUE(dispatcher_.addListener("a", [&](const message::Packet&) {
        if (!added) {
            added = true;
            ASSERT_TRUE(dispatcher_.addListener("a", [&](const message::Packet&) { ++late; }));
        }
    }));

    dispatcher_.dispatch(packet("x/1"));
    EXPECT_EQ(late, 0);
    dispatcher_.dispatch(packet("x/2"));
    EXPECT_EQ(late, 1);
}

TEST_F(DispatcherTest, ListenerRemovedDuringDispatchStillRunsThisTime) {
    ASSERT_TRUE(registry_.add("a", "x/+p"));
    int second = 0;
    bus::ListenerId second_id = 0;
    ASSERT_TRUE(dispatcher_.addListener("a", [&](const message::Packet&) {
        ASSERT_TRUE(dispatcher_.removeListener("a", second_id));
    }));
    auto id = dispatcher_.addListener("a", [&](const message::Packet&) { ++second; });
    ASSERT_TRUE(id);
    second_id = id.value();

    dispatcher_.dispatch(packet("x/1"));
    EXPECT_EQ(second, 1);
    dispatcher_.dispatch(packet("x/2"));
    EXPECT_EQ(second, 1);
}

TEST_F(DispatcherTest, SameCallableTwiceFiresTwice) {
    ASSERT_TRUE(registry_.add("a", "x/+p"));
    int calls = 0;
    auto fn = [&](const message::Packet&) { ++calls; };
    auto id1 = dispatcher_.addListener("a", fn);
    auto id2 = dispatcher_.addListener("a", fn);
    ASSERT_TRUE(id1);
    ASSERT_TRUE(id2);
    EXPECT_NE(id1.value(), id2.value());

    dispatcher_.dispatch(packet("x/1"));
    EXPECT_EQ(calls, 2);

    ASSERT_TRUE(dispatcher_.removeListener("a", id1.value()));
    dispatcher_.dispatch(packet("x/1"));
    EXPECT_EQ(calls, 3);
}

TEST_F(DispatcherTest, RemoveAll) {
    ASSERT_TRUE(registry_.add("a", "x/+p"));
    ASSERT_TRUE(registry_.add("b", "y/+p"));
    ASSERT_TRUE(dispatcher_.addListener("a", [](const message::Packet&) {}));
    ASSERT_TRUE(dispatcher_.addListener("b", [](const message::Packet&) {}));

    ASSERT_TRUE(dispatcher_.removeAllListeners("a"));
    EXPECT_EQ(dispatcher_.listenerCount("a"), 0u);
    EXPECT_EQ(dispatcher_.listenerCount("b"), 1u);

    dispatcher_.removeAllListeners();
    EXPECT_EQ(dispatcher_.listenerCount("b"), 0u);
}

TEST_F(DispatcherTest, UnknownLabelRejected) {
    EXPECT_EQ(dispatcher_.addListener("nope", [](const message::Packet&) {}).code(), ResultCode::UnknownLabel);
    EXPECT_EQ(dispatcher_.addOnceListener("nope", [](const message::Packet&) {}).code(), ResultCode::UnknownLabel);
    EXPECT_EQ(dispatcher_.removeListener("nope", 1).code(), ResultCode::UnknownLabel);
    EXPECT_EQ(dispatcher_.removeAllListeners("nope").code(), ResultCode::UnknownLabel);
}

TEST_F(DispatcherTest, EmptyListenerRejected) {
    ASSERT_TRUE(registry_.add("a", "x/+p"));
    EXPECT_EQ(dispatcher_.addListener("a", bus::Listener{}).code(), ResultCode::InvalidArgument);
}

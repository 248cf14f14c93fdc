#include "gtest/gtest.h"
#include "jsonkeyspace/event_bus.h"
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace jsonkeyspace;

class LocalEventBusTest : public ::testing::Test {
protected:
    LocalEventBus bus;
    std::vector<std::pair<std::string, std::string>> received;

    LocalEventBus::ChangeCallback recorder() {
        return [this](const std::string& event_name, const std::string& key) {
            received.emplace_back(event_name, key);
        };
    }
};

TEST_F(LocalEventBusTest, DeliversToAnyChangeSubscribers) {
    bus.on_any_change(recorder());
    bus.publish_change("json.set", "doc");
    bus.publish_change("json.del", "doc");

    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0], std::make_pair(std::string("json.set"), std::string("doc")));
    EXPECT_EQ(received[1].first, "json.del");
    EXPECT_EQ(bus.published_count(), 2u);
}

TEST_F(LocalEventBusTest, NamedSubscribersOnlySeeTheirEvent) {
    bus.on_change("json.arrpop", recorder());
    bus.publish_change("json.set", "a");
    bus.publish_change("json.arrpop", "b");

    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].second, "b");
}

TEST_F(LocalEventBusTest, OffChangeUnregisters) {
    size_t handle = bus.on_any_change(recorder());
    EXPECT_NE(handle, 0u);
    bus.off_change(handle);
    bus.publish_change("json.set", "doc");
    EXPECT_TRUE(received.empty());

    EXPECT_EQ(bus.on_any_change(nullptr), 0u);
}

TEST_F(LocalEventBusTest, DisabledBusDropsEvents) {
    bus.on_any_change(recorder());
    bus.enable_events(false);
    EXPECT_FALSE(bus.are_events_enabled());
    bus.publish_change("json.set", "doc");
    EXPECT_TRUE(received.empty());
    EXPECT_EQ(bus.published_count(), 0u);
}

TEST_F(LocalEventBusTest, ThrowingSubscriberDoesNotStopOthers) {
    bus.on_any_change([](const std::string&, const std::string&) { throw std::runtime_error("boom"); });
    bus.on_any_change(recorder());
    EXPECT_NO_THROW(bus.publish_change("json.toggle", "doc"));
    ASSERT_EQ(received.size(), 1u);
}

TEST_F(LocalEventBusTest, CallbackMayUnregisterItself) {
    size_t handle = 0;
    handle = bus.on_any_change([this, &handle](const std::string& event_name, const std::string& key) {
        received.emplace_back(event_name, key);
        bus.off_change(handle);
    });
    bus.publish_change("json.set", "doc");
    bus.publish_change("json.set", "doc");
    EXPECT_EQ(received.size(), 1u);
}

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "jsonkeyspace/notification_dispatcher.h"
#include <stdexcept>

using namespace jsonkeyspace;
using ::testing::StrictMock;
using ::testing::Throw;

class MockEventBus : public EventBus {
public:
    MOCK_METHOD(void, publish_change, (const std::string& event_name, const std::string& key), (override));
};

TEST(NotificationDispatcherTest, AppliedEmitsExactlyOnce) {
    StrictMock<MockEventBus> bus;
    NotificationDispatcher dispatcher(bus);
    EXPECT_CALL(bus, publish_change("json.arrappend", "doc")).Times(1);

    // Many changed locations still make a single event
    EXPECT_TRUE(dispatcher.dispatch(AggregateResult::applied(5), "json.arrappend", "doc"));
}

TEST(NotificationDispatcherTest, NoMatchAndErrorStaySilent) {
    StrictMock<MockEventBus> bus;
    NotificationDispatcher dispatcher(bus);

    EXPECT_FALSE(dispatcher.dispatch(AggregateResult::no_match(), "json.del", "doc"));
    EXPECT_FALSE(dispatcher.dispatch(AggregateResult::error(ErrorCode::INVALID_ARGUMENT, "x"), "json.set", "doc"));
}

TEST(NotificationDispatcherTest, DisabledNotificationsStaySilent) {
    StrictMock<MockEventBus> bus;
    KeyspaceConfig config;
    config.notifications_enabled = false;
    NotificationDispatcher dispatcher(bus, config);
    EXPECT_FALSE(dispatcher.is_enabled());
    EXPECT_FALSE(dispatcher.dispatch(AggregateResult::applied(1), "json.set", "doc"));

    dispatcher.set_enabled(true);
    EXPECT_CALL(bus, publish_change("json.set", "doc")).Times(1);
    EXPECT_TRUE(dispatcher.dispatch(AggregateResult::applied(1), "json.set", "doc"));
}

TEST(NotificationDispatcherTest, BusFailureIsSwallowedAndReported) {
    StrictMock<MockEventBus> bus;
    NotificationDispatcher dispatcher(bus);
    EXPECT_CALL(bus, publish_change("json.clear", "doc")).WillOnce(Throw(std::runtime_error("bus down")));

    bool emitted = true;
    EXPECT_NO_THROW(emitted = dispatcher.dispatch(AggregateResult::applied(1), "json.clear", "doc"));
    EXPECT_FALSE(emitted);
}

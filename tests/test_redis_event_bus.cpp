#include "gtest/gtest.h"
#include "jsonkeyspace/redis_event_bus.h"
#include "jsonkeyspace/exceptions.h"
#include <hiredis/hiredis.h>
#include <cstring>

using namespace jsonkeyspace;

TEST(RedisEventBusChannelsTest, ChannelNamesFollowKeyspaceNotifications) {
    RedisBusConfig config;
    config.database = 2;
    RedisEventBus bus(config);
    EXPECT_EQ(bus.keyspace_channel("doc:1"), "__keyspace@2__:doc:1");
    EXPECT_EQ(bus.keyevent_channel("json.set"), "__keyevent@2__:json.set");
}

TEST(RedisEventBusChannelsTest, UnreachableServerIsCountedNotThrown) {
    RedisBusConfig config;
    config.host = "127.0.0.1";
    config.port = 1; // Nothing listens here
    config.timeout = std::chrono::milliseconds(200);
    RedisEventBus bus(config);

    EXPECT_THROW(bus.connect(), ConnectionException);
    EXPECT_NO_THROW(bus.publish_change("json.set", "doc"));
    EXPECT_EQ(bus.published_messages(), 0u);
    EXPECT_EQ(bus.failed_messages(), 2u);
}

// The remaining tests need a live server and skip without one
class RedisEventBusTest : public ::testing::Test {
protected:
    RedisBusConfig config;

    bool isRedisAvailable() {
        redisContext* c = redisConnectWithTimeout(config.host.c_str(), config.port, {1, 0});
        if (c == NULL || c->err) {
            if (c) redisFree(c);
            return false;
        }
        redisReply* reply = (redisReply*)redisCommand(c, "PING");
        bool available = (reply != NULL && reply->type == REDIS_REPLY_STATUS && strcmp(reply->str, "PONG") == 0);
        if (reply) freeReplyObject(reply);
        redisFree(c);
        return available;
    }

    void SetUp() override {
        config.host = "127.0.0.1";
        config.port = 6379;
        config.database = 15;
        config.timeout = std::chrono::milliseconds(500);
        if (!isRedisAvailable()) {
            GTEST_SKIP() << "Redis server not available at " << config.host << ":" << config.port
                         << ". Skipping RedisEventBus tests.";
        }
    }

    // Subscribes on a separate context and returns it, or nullptr on failure
    redisContext* subscribe(const std::string& pattern) {
        redisContext* c = redisConnectWithTimeout(config.host.c_str(), config.port, {1, 0});
        if (c == NULL || c->err) {
            if (c) redisFree(c);
            return nullptr;
        }
        redisReply* reply = (redisReply*)redisCommand(c, "PSUBSCRIBE %s", pattern.c_str());
        if (reply) freeReplyObject(reply);
        return c;
    }

    // Reads one pmessage and returns {channel, payload}
    std::pair<std::string, std::string> next_message(redisContext* c) {
        void* raw = nullptr;
        if (redisGetReply(c, &raw) != REDIS_OK || raw == nullptr) {
            return {};
        }
        redisReply* reply = static_cast<redisReply*>(raw);
        std::pair<std::string, std::string> message;
        if (reply->type == REDIS_REPLY_ARRAY && reply->elements == 4) {
            message.first.assign(reply->element[2]->str, reply->element[2]->len);
            message.second.assign(reply->element[3]->str, reply->element[3]->len);
        }
        freeReplyObject(reply);
        return message;
    }
};

TEST_F(RedisEventBusTest, PublishesKeyspaceThenKeyevent) {
    redisContext* subscriber = subscribe("__key*@15__:*");
    ASSERT_NE(subscriber, nullptr);

    RedisEventBus bus(config);
    bus.connect();
    bus.publish_change("json.strappend", "jsonkeyspace_test:doc");

    auto keyspace = next_message(subscriber);
    auto keyevent = next_message(subscriber);
    redisFree(subscriber);

    EXPECT_EQ(keyspace.first, "__keyspace@15__:jsonkeyspace_test:doc");
    EXPECT_EQ(keyspace.second, "json.strappend");
    EXPECT_EQ(keyevent.first, "__keyevent@15__:json.strappend");
    EXPECT_EQ(keyevent.second, "jsonkeyspace_test:doc");
    EXPECT_EQ(bus.published_messages(), 2u);
    EXPECT_EQ(bus.failed_messages(), 0u);
}

TEST_F(RedisEventBusTest, ChannelFamiliesCanBeDisabled) {
    config.keyspace_channels = false;
    RedisEventBus bus(config);
    bus.publish_change("json.del", "jsonkeyspace_test:doc");
    EXPECT_EQ(bus.published_messages(), 1u);
}

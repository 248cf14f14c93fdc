#include "gtest/gtest.h"
#include "jsonkeyspace/common_types.h"
#include "jsonkeyspace/exceptions.h"
#include <cstdio>
#include <fstream>
#include <string>

using namespace jsonkeyspace;

class ConfigTest : public ::testing::Test {
protected:
    std::string path = ::testing::TempDir() + "jsonkeyspace_config_test.json";

    void write(const std::string& content) {
        std::ofstream out(path);
        out << content;
    }

    void TearDown() override { std::remove(path.c_str()); }
};

TEST_F(ConfigTest, DefaultsWhenSectionsAreMissing) {
    write("{}");
    Config config = load_config(path);
    EXPECT_TRUE(config.keyspace.notifications_enabled);
    EXPECT_EQ(config.redis_bus.host, "127.0.0.1");
    EXPECT_EQ(config.redis_bus.port, 6379);
    EXPECT_EQ(config.redis_bus.database, 0);
    EXPECT_EQ(config.redis_bus.timeout, std::chrono::milliseconds(5000));
    EXPECT_TRUE(config.redis_bus.keyspace_channels);
    EXPECT_TRUE(config.redis_bus.keyevent_channels);
}

TEST_F(ConfigTest, ReadsAllFields) {
    write(R"({
        "keyspace": {"notifications_enabled": false},
        "redis_bus": {"host": "redis.local", "port": 6380, "password": "secret", "database": 3,
                      "timeout_ms": 250, "keyspace_channels": false}
    })");
    Config config = load_config(path);
    EXPECT_FALSE(config.keyspace.notifications_enabled);
    EXPECT_EQ(config.redis_bus.host, "redis.local");
    EXPECT_EQ(config.redis_bus.port, 6380);
    EXPECT_EQ(config.redis_bus.password, "secret");
    EXPECT_EQ(config.redis_bus.database, 3);
    EXPECT_EQ(config.redis_bus.timeout, std::chrono::milliseconds(250));
    EXPECT_FALSE(config.redis_bus.keyspace_channels);
    EXPECT_TRUE(config.redis_bus.keyevent_channels);
}

TEST_F(ConfigTest, RejectsOutOfRangeValues) {
    write(R"({"redis_bus": {"port": 70000}})");
    EXPECT_THROW(load_config(path), InvalidArgumentException);

    write(R"({"redis_bus": {"database": -1}})");
    EXPECT_THROW(load_config(path), InvalidArgumentException);
}

TEST_F(ConfigTest, RejectsMalformedFiles) {
    write("{ not json");
    EXPECT_THROW(load_config(path), JsonParsingException);

    write(R"({"redis_bus": {"port": "six"}})");
    EXPECT_THROW(load_config(path), JsonParsingException);

    write("[]");
    EXPECT_THROW(load_config(path), JsonParsingException);

    EXPECT_THROW(load_config(path + ".missing"), JsonParsingException);
}

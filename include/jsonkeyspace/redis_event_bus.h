#pragma once

#include "common_types.h"
#include "event_bus.h"
#include "redis_connection.h"
#include <atomic>
#include <mutex>
#include <string>

namespace jsonkeyspace {

/**
 * Forwards change events to a Redis server the way keyspace notifications are
 * delivered: PUBLISH __keyspace@<db>__:<key> <event>, then
 * PUBLISH __keyevent@<db>__:<event> <key>.
 * Each channel family can be switched off through RedisBusConfig.
 * Failures are counted and logged; publish_change never throws.
 */
class RedisEventBus : public EventBus {
public:
    explicit RedisEventBus(const RedisBusConfig& config);

    RedisEventBus(const RedisEventBus&) = delete;
    RedisEventBus& operator=(const RedisEventBus&) = delete;

    // Eager connection check. Throws ConnectionException if the server is unreachable.
    void connect();

    void publish_change(const std::string& event_name, const std::string& key) override;

    std::string keyspace_channel(const std::string& key) const;
    std::string keyevent_channel(const std::string& event_name) const;

    uint64_t published_messages() const { return published_.load(); }
    uint64_t failed_messages() const { return failed_.load(); }

private:
    bool publish(const std::string& channel, const std::string& message);

    RedisBusConfig config_;
    RedisConnection connection_;
    std::mutex connection_mutex_;
    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> failed_{0};
};

} // namespace jsonkeyspace

#include "jsonkeyspace/redis_event_bus.h"
#include <glog/logging.h>

namespace jsonkeyspace {

RedisEventBus::RedisEventBus(const RedisBusConfig& config)
    : config_(config),
      connection_(config.host, config.port, config.password, config.timeout) {}

void RedisEventBus::connect() {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    if (!connection_.connect()) {
        throw ConnectionException(connection_.get_last_error());
    }
    if (!connection_.ping()) {
        std::string error = connection_.get_last_error();
        connection_.disconnect();
        throw ConnectionException(error.empty() ? "PING to " + config_.host + " got no PONG" : error);
    }
}

std::string RedisEventBus::keyspace_channel(const std::string& key) const {
    return "__keyspace@" + std::to_string(config_.database) + "__:" + key;
}

std::string RedisEventBus::keyevent_channel(const std::string& event_name) const {
    return "__keyevent@" + std::to_string(config_.database) + "__:" + event_name;
}

void RedisEventBus::publish_change(const std::string& event_name, const std::string& key) {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    if (!connection_.connect()) {
        failed_ += (config_.keyspace_channels ? 1 : 0) + (config_.keyevent_channels ? 1 : 0);
        LOG(ERROR) << "Dropping " << event_name << " for key '" << key << "': " << connection_.get_last_error();
        return;
    }
    if (config_.keyspace_channels) {
        publish(keyspace_channel(key), event_name);
    }
    if (config_.keyevent_channels) {
        publish(keyevent_channel(event_name), key);
    }
}

bool RedisEventBus::publish(const std::string& channel, const std::string& message) {
    // %b keeps binary-safe keys intact
    RedisReplyPtr reply = connection_.command("PUBLISH %b %b", channel.data(), channel.size(),
                                              message.data(), message.size());
    if (!reply) {
        ++failed_;
        LOG(ERROR) << "PUBLISH " << channel << " failed: " << connection_.get_last_error();
        connection_.disconnect();
        return false;
    }
    if (reply->type == REDIS_REPLY_ERROR) {
        ++failed_;
        LOG(ERROR) << "PUBLISH " << channel << " rejected: " << (reply->str ? reply->str : "unknown error");
        return false;
    }
    ++published_;
    VLOG(2) << "PUBLISH " << channel << " " << message << " reached " << reply->integer << " subscribers";
    return true;
}

} // namespace jsonkeyspace

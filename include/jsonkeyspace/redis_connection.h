#pragma once

#include "exceptions.h"
#include <hiredis/hiredis.h>
#include <chrono>
#include <memory> // For std::unique_ptr
#include <string>

namespace jsonkeyspace {

// Custom deleter for redisReply
struct RedisReplyDeleter {
    void operator()(redisReply* r) const {
        if (r) {
            freeReplyObject(r);
        }
    }
};

using RedisReplyPtr = std::unique_ptr<redisReply, RedisReplyDeleter>;

// One blocking hiredis connection. Not thread safe.
class RedisConnection {
public:
    RedisConnection(const std::string& host, int port, const std::string& password,
                    std::chrono::milliseconds timeout_ms);
    ~RedisConnection();

    RedisConnection(const RedisConnection&) = delete;
    RedisConnection& operator=(const RedisConnection&) = delete;

    bool connect();
    void disconnect();
    bool is_connected() const;

    // nullptr on I/O failure, after which the connection counts as closed.
    RedisReplyPtr command(const char* format, ...);

    bool ping();
    const std::string& get_last_error() const { return last_error_message_; }

private:
    std::string host_;
    int port_;
    std::string password_;
    std::chrono::milliseconds connect_timeout_ms_;
    redisContext* context_ = nullptr;
    bool connected_ = false;
    std::string last_error_message_;

    bool authenticate();
};

} // namespace jsonkeyspace

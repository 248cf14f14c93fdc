#include "jsonkeyspace/redis_connection.h"
#include <cstdarg> // For va_list, va_start, va_end
#include <cstring> // For strcmp

namespace jsonkeyspace {

RedisConnection::RedisConnection(const std::string& host, int port, const std::string& password,
                                 std::chrono::milliseconds timeout_ms)
    : host_(host), port_(port), password_(password), connect_timeout_ms_(timeout_ms),
      context_(nullptr), connected_(false) {}

RedisConnection::~RedisConnection() {
    disconnect();
}

bool RedisConnection::connect() {
    if (is_connected()) return true;
    disconnect(); // Drop a context left in an error state
    last_error_message_.clear();

    struct timeval tv_timeout;
    tv_timeout.tv_sec = connect_timeout_ms_.count() / 1000;
    tv_timeout.tv_usec = (connect_timeout_ms_.count() % 1000) * 1000;

    context_ = redisConnectWithTimeout(host_.c_str(), port_, tv_timeout);

    if (context_ == nullptr || context_->err) {
        if (context_) {
            last_error_message_ = "connect to " + host_ + ":" + std::to_string(port_) + " failed: " +
                                  std::string(context_->errstr) + " (code: " + std::to_string(context_->err) + ")";
            redisFree(context_);
            context_ = nullptr;
        } else {
            last_error_message_ = "hiredis failed to allocate context";
        }
        connected_ = false;
        return false;
    }

    if (redisSetTimeout(context_, tv_timeout) != REDIS_OK) {
        last_error_message_ = "redisSetTimeout failed: " + std::string(context_->errstr) +
                              " (code: " + std::to_string(context_->err) + ")";
        disconnect();
        return false;
    }

    if (!authenticate()) {
        if (last_error_message_.empty()) last_error_message_ = "Authentication failed";
        disconnect();
        return false;
    }

    connected_ = true;
    return true;
}

void RedisConnection::disconnect() {
    if (context_) {
        redisFree(context_);
        context_ = nullptr;
    }
    connected_ = false;
}

bool RedisConnection::is_connected() const {
    return connected_ && context_ != nullptr && context_->err == 0;
}

bool RedisConnection::authenticate() {
    if (password_.empty()) {
        return true;
    }
    RedisReplyPtr reply(static_cast<redisReply*>(redisCommand(context_, "AUTH %s", password_.c_str())));
    if (!reply || reply->type == REDIS_REPLY_ERROR) {
        if (reply && reply->str) {
            last_error_message_ = "Authentication failed: " + std::string(reply->str);
        } else if (context_->err != 0) {
            last_error_message_ = "Authentication failed: " + std::string(context_->errstr) +
                                  " (code: " + std::to_string(context_->err) + ")";
        } else {
            last_error_message_ = "Authentication failed: No reply or unknown error.";
        }
        return false;
    }
    return true;
}

bool RedisConnection::ping() {
    RedisReplyPtr reply = command("PING");
    if (!reply) {
        return false;
    }
    return reply->type == REDIS_REPLY_STATUS && strcmp(reply->str, "PONG") == 0;
}

RedisReplyPtr RedisConnection::command(const char* format, ...) {
    if (!is_connected()) {
        return nullptr;
    }
    va_list ap;
    va_start(ap, format);
    RedisReplyPtr reply(static_cast<redisReply*>(redisvCommand(context_, format, ap)));
    va_end(ap);

    if (!reply) {
        last_error_message_ = context_->err ? std::string(context_->errstr) : "no reply from server";
        connected_ = false;
    }
    return reply;
}

} // namespace jsonkeyspace

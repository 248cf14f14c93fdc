#include "jsonkeyspace/common_types.h"
#include "jsonkeyspace/exceptions.h"
#include <fstream>

namespace jsonkeyspace {

void from_json(const nlohmann::json& j, KeyspaceConfig& cfg) {
    cfg.notifications_enabled = j.value("notifications_enabled", cfg.notifications_enabled);
}

void from_json(const nlohmann::json& j, RedisBusConfig& cfg) {
    cfg.host = j.value("host", cfg.host);
    cfg.port = j.value("port", cfg.port);
    cfg.password = j.value("password", cfg.password);
    cfg.database = j.value("database", cfg.database);
    if (j.contains("timeout_ms")) {
        cfg.timeout = std::chrono::milliseconds(j.at("timeout_ms").get<long long>());
    }
    cfg.keyspace_channels = j.value("keyspace_channels", cfg.keyspace_channels);
    cfg.keyevent_channels = j.value("keyevent_channels", cfg.keyevent_channels);

    if (cfg.port <= 0 || cfg.port > 65535) {
        throw InvalidArgumentException("redis_bus.port out of range: " + std::to_string(cfg.port));
    }
    if (cfg.database < 0) {
        throw InvalidArgumentException("redis_bus.database must not be negative");
    }
}

void from_json(const nlohmann::json& j, Config& cfg) {
    if (!j.is_object()) {
        throw JsonParsingException("configuration root must be an object");
    }
    if (j.contains("keyspace")) {
        cfg.keyspace = j.at("keyspace").get<KeyspaceConfig>();
    }
    if (j.contains("redis_bus")) {
        cfg.redis_bus = j.at("redis_bus").get<RedisBusConfig>();
    }
}

Config load_config(const std::string& file_path) {
    std::ifstream in(file_path);
    if (!in) {
        throw JsonParsingException("cannot open configuration file '" + file_path + "'");
    }
    try {
        return nlohmann::json::parse(in).get<Config>();
    } catch (const nlohmann::json::exception& e) {
        throw JsonParsingException("configuration file '" + file_path + "': " + e.what());
    }
}

} // namespace jsonkeyspace

#pragma once

#include <string>
#include <chrono> // For std::chrono::milliseconds
#include <nlohmann/json.hpp>

namespace jsonkeyspace {

// Documents keep object members in insertion order so that OBJKEYS and
// wildcard matches follow the order the client wrote them in.
using json = nlohmann::ordered_json;

// Enum for SET command conditions (NX, XX)
enum class SetCmdCondition {
    NONE, // No condition
    NX,   // Set only if the path (or key) does not exist
    XX    // Set only if the path (or key) already exists
};

// Behaviour of the keyspace/executor pair
struct KeyspaceConfig {
    // Equivalent of notify-keyspace-events: when false no change event leaves the dispatcher.
    bool notifications_enabled = true;
};

// Connection settings for publishing change events to a Redis server
struct RedisBusConfig {
    std::string host = "127.0.0.1";
    int port = 6379;
    std::string password; // Empty if no password
    int database = 0;     // Used in the __keyspace@<db>__ channel names as well
    std::chrono::milliseconds timeout = std::chrono::milliseconds(5000); // Connect and command timeout

    bool keyspace_channels = true; // PUBLISH __keyspace@<db>__:<key> <event>
    bool keyevent_channels = true; // PUBLISH __keyevent@<db>__:<event> <key>
};

// Top-level configuration file layout:
// { "keyspace": { ... }, "redis_bus": { ... } }
struct Config {
    KeyspaceConfig keyspace;
    RedisBusConfig redis_bus;
};

void from_json(const nlohmann::json& j, KeyspaceConfig& cfg);
void from_json(const nlohmann::json& j, RedisBusConfig& cfg);
void from_json(const nlohmann::json& j, Config& cfg);

// Reads and validates a JSON configuration file.
// Throws JsonParsingException if the file cannot be read or parsed.
Config load_config(const std::string& file_path);

} // namespace jsonkeyspace

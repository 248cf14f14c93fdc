#include "jsonkeyspace/common_types.h"
#include "jsonkeyspace/event_bus.h"
#include "jsonkeyspace/exceptions.h"
#include "jsonkeyspace/json_command_executor.h"
#include "jsonkeyspace/keyspace.h"
#include "jsonkeyspace/redis_event_bus.h"
#include <glog/logging.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <cstdlib> // For std::getenv

using jsonkeyspace::json;

static void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <file>] [--redis] [--demo]\n"
              << "  --config <file>  JSON configuration file (keyspace, redis_bus sections)\n"
              << "  --redis          publish change events to Redis instead of printing them\n"
              << "  --demo           run a fixed command script instead of reading stdin\n"
              << "Reads JSON.* commands, one per line, e.g.\n"
              << "  JSON.SET doc $ '{\"foo\":\"bar\"}'" << std::endl;
}

static void print_reply(const json& reply, const std::string& indent = "") {
    if (reply.is_null()) {
        std::cout << indent << "(nil)" << std::endl;
    } else if (reply.is_number_integer()) {
        std::cout << indent << "(integer) " << reply.get<long long>() << std::endl;
    } else if (reply.is_string()) {
        std::cout << indent << reply.dump() << std::endl;
    } else if (reply.is_array()) {
        if (reply.empty()) {
            std::cout << indent << "(empty array)" << std::endl;
        }
        for (size_t i = 0; i < reply.size(); ++i) {
            std::cout << indent << (i + 1) << ") ";
            print_reply(reply[i]);
        }
    } else {
        std::cout << indent << reply.dump() << std::endl;
    }
}

static void run_line(jsonkeyspace::JsonCommandExecutor& executor, const std::string& line) {
    std::vector<std::string> argv;
    try {
        argv = jsonkeyspace::CommandParser::tokenize(line);
    } catch (const jsonkeyspace::JsonKeyspaceException& e) {
        std::cout << "(error) " << e.what() << std::endl;
        return;
    }
    if (argv.empty()) {
        return;
    }
    jsonkeyspace::CommandResponse response = executor.execute_args(argv);
    if (response.result.is_error()) {
        std::cout << "(error) " << response.result.message() << std::endl;
        return;
    }
    print_reply(response.reply);
}

static const std::vector<std::string> DEMO_SCRIPT = {
    "JSON.SET doc $ '{\"foo\":\"bar\"}'",
    "JSON.SET doc $.foo.a '\"nono\"'",
    "JSON.SET doc $.foo '\"gogo\"'",
    "JSON.STRAPPEND doc $.foo '\"toto\"'",
    "JSON.GET doc $.foo",
    "JSON.DEL doc $.foo",
    "JSON.DEL doc $.foo",
    "JSON.SET doc $.foo 1",
    "JSON.NUMINCRBY doc $.foo 3",
    "JSON.SET doc $.foo '[\"gogo1\",\"gogo3\",\"gogo4\",\"gogo2\"]'",
    "JSON.ARRPOP doc $.foo 1",
    "JSON.ARRLEN doc $.foo",
    "JSON.TYPE doc $.foo",
};

int main(int argc, char** argv) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = 1;

    std::string config_file;
    bool use_redis = false;
    bool demo = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--redis") {
            use_redis = true;
        } else if (arg == "--demo") {
            demo = true;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    jsonkeyspace::Config config;
    try {
        if (!config_file.empty()) {
            config = jsonkeyspace::load_config(config_file);
        }
    } catch (const jsonkeyspace::JsonKeyspaceException& e) {
        std::cerr << "CRITICAL: " << e.what() << std::endl;
        return 1;
    }

    const char* redis_host_env = std::getenv("REDIS_HOST");
    if (redis_host_env) config.redis_bus.host = redis_host_env;
    const char* redis_port_env = std::getenv("REDIS_PORT");
    if (redis_port_env) {
        try {
            config.redis_bus.port = std::stoi(redis_port_env);
        } catch (const std::exception&) {
            LOG(WARNING) << "Ignoring invalid REDIS_PORT '" << redis_port_env << "'";
        }
    }
    const char* redis_password_env = std::getenv("REDIS_PASSWORD");
    if (redis_password_env) config.redis_bus.password = redis_password_env;

    std::unique_ptr<jsonkeyspace::EventBus> bus;
    if (use_redis) {
        auto redis_bus = std::make_unique<jsonkeyspace::RedisEventBus>(config.redis_bus);
        try {
            redis_bus->connect();
        } catch (const jsonkeyspace::ConnectionException& e) {
            std::cerr << "CRITICAL: Could not connect to Redis. " << e.what() << std::endl;
            std::cerr << "Ensure Redis is running at " << config.redis_bus.host << ":" << config.redis_bus.port
                      << " or set REDIS_HOST/REDIS_PORT environment variables." << std::endl;
            return 1;
        }
        bus = std::move(redis_bus);
    } else {
        auto local_bus = std::make_unique<jsonkeyspace::LocalEventBus>();
        local_bus->on_any_change([](const std::string& event_name, const std::string& key) {
            std::cout << "  -> notify " << event_name << " " << key << std::endl;
        });
        bus = std::move(local_bus);
    }

    jsonkeyspace::Keyspace keyspace;
    jsonkeyspace::JsonCommandExecutor executor(keyspace, *bus, config.keyspace);

    if (demo) {
        for (const auto& line : DEMO_SCRIPT) {
            std::cout << "> " << line << std::endl;
            run_line(executor, line);
        }
        return 0;
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line == "quit" || line == "exit") {
            break;
        }
        run_line(executor, line);
    }
    return 0;
}

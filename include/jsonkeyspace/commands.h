#pragma once

#include "common_types.h"
#include "reply_formatter.h"
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace jsonkeyspace {

// One struct per JSON command. kName is the canonical lowercase command name,
// kEvent the notification it emits when it changes data (nullptr for read-only
// commands) and kMutating whether it may change data at all.
// Paths are stored as the client sent them; the executor compiles them.

struct SetCommand {
    static constexpr const char* kName = "json.set";
    static constexpr const char* kEvent = "json.set";
    static constexpr bool kMutating = true;
    std::string key;
    std::string path;
    json value;
    SetCmdCondition condition = SetCmdCondition::NONE;
};

struct DelCommand {
    static constexpr const char* kName = "json.del";
    static constexpr const char* kEvent = "json.del";
    static constexpr bool kMutating = true;
    std::string key;
    std::string path = ".";
};

// Alias of DEL, reported under the same event
struct ForgetCommand {
    static constexpr const char* kName = "json.forget";
    static constexpr const char* kEvent = "json.del";
    static constexpr bool kMutating = true;
    std::string key;
    std::string path = ".";
};

struct StrAppendCommand {
    static constexpr const char* kName = "json.strappend";
    static constexpr const char* kEvent = "json.strappend";
    static constexpr bool kMutating = true;
    std::string key;
    std::string path = ".";
    std::string suffix; // Decoded from the JSON string argument
};

struct ArrAppendCommand {
    static constexpr const char* kName = "json.arrappend";
    static constexpr const char* kEvent = "json.arrappend";
    static constexpr bool kMutating = true;
    std::string key;
    std::string path;
    std::vector<json> values;
};

struct ArrInsertCommand {
    static constexpr const char* kName = "json.arrinsert";
    static constexpr const char* kEvent = "json.arrinsert";
    static constexpr bool kMutating = true;
    std::string key;
    std::string path;
    long long index = 0;
    std::vector<json> values;
};

struct ArrPopCommand {
    static constexpr const char* kName = "json.arrpop";
    static constexpr const char* kEvent = "json.arrpop";
    static constexpr bool kMutating = true;
    std::string key;
    std::string path = ".";
    std::optional<long long> index; // Last element when absent
};

struct ArrTrimCommand {
    static constexpr const char* kName = "json.arrtrim";
    static constexpr const char* kEvent = "json.arrtrim";
    static constexpr bool kMutating = true;
    std::string key;
    std::string path;
    long long start = 0;
    long long stop = 0; // Inclusive
};

struct NumIncrByCommand {
    static constexpr const char* kName = "json.numincrby";
    static constexpr const char* kEvent = "json.numincrby";
    static constexpr bool kMutating = true;
    std::string key;
    std::string path;
    json operand;
};

struct NumMultByCommand {
    static constexpr const char* kName = "json.nummultby";
    static constexpr const char* kEvent = "json.nummultby";
    static constexpr bool kMutating = true;
    std::string key;
    std::string path;
    json operand;
};

struct NumPowByCommand {
    static constexpr const char* kName = "json.numpowby";
    static constexpr const char* kEvent = "json.numpowby";
    static constexpr bool kMutating = true;
    std::string key;
    std::string path;
    json operand;
};

struct ToggleCommand {
    static constexpr const char* kName = "json.toggle";
    static constexpr const char* kEvent = "json.toggle";
    static constexpr bool kMutating = true;
    std::string key;
    std::string path;
};

struct ClearCommand {
    static constexpr const char* kName = "json.clear";
    static constexpr const char* kEvent = "json.clear";
    static constexpr bool kMutating = true;
    std::string key;
    std::string path = ".";
};

struct GetCommand {
    static constexpr const char* kName = "json.get";
    static constexpr const char* kEvent = nullptr;
    static constexpr bool kMutating = false;
    std::string key;
    std::vector<std::string> paths; // Empty means the legacy root "."
    FormatOptions format;
};

struct MGetCommand {
    static constexpr const char* kName = "json.mget";
    static constexpr const char* kEvent = nullptr;
    static constexpr bool kMutating = false;
    std::vector<std::string> keys;
    std::string path;
};

struct StrLenCommand {
    static constexpr const char* kName = "json.strlen";
    static constexpr const char* kEvent = nullptr;
    static constexpr bool kMutating = false;
    std::string key;
    std::string path = ".";
};

struct ObjKeysCommand {
    static constexpr const char* kName = "json.objkeys";
    static constexpr const char* kEvent = nullptr;
    static constexpr bool kMutating = false;
    std::string key;
    std::string path = ".";
};

struct ObjLenCommand {
    static constexpr const char* kName = "json.objlen";
    static constexpr const char* kEvent = nullptr;
    static constexpr bool kMutating = false;
    std::string key;
    std::string path = ".";
};

struct ArrIndexCommand {
    static constexpr const char* kName = "json.arrindex";
    static constexpr const char* kEvent = nullptr;
    static constexpr bool kMutating = false;
    std::string key;
    std::string path;
    json scalar;
    long long start = 0;
    long long stop = 0; // 0 means the end of the array
};

struct ArrLenCommand {
    static constexpr const char* kName = "json.arrlen";
    static constexpr const char* kEvent = nullptr;
    static constexpr bool kMutating = false;
    std::string key;
    std::string path = ".";
};

struct TypeCommand {
    static constexpr const char* kName = "json.type";
    static constexpr const char* kEvent = nullptr;
    static constexpr bool kMutating = false;
    std::string key;
    std::string path = ".";
};

// Document re-encoded in the store's reply types, see resp_reply()
struct RespCommand {
    static constexpr const char* kName = "json.resp";
    static constexpr const char* kEvent = nullptr;
    static constexpr bool kMutating = false;
    std::string key;
    std::string path = ".";
};

struct DebugCommand {
    enum class Subcommand { MEMORY, HELP };

    static constexpr const char* kName = "json.debug";
    static constexpr const char* kEvent = nullptr;
    static constexpr bool kMutating = false;
    Subcommand subcommand = Subcommand::HELP;
    std::string key; // MEMORY only
    std::string path = ".";
};

using Command = std::variant<SetCommand, DelCommand, ForgetCommand, StrAppendCommand, ArrAppendCommand,
                             ArrInsertCommand, ArrPopCommand, ArrTrimCommand, NumIncrByCommand,
                             NumMultByCommand, NumPowByCommand, ToggleCommand, ClearCommand,
                             GetCommand, MGetCommand, StrLenCommand, ObjKeysCommand, ObjLenCommand,
                             ArrIndexCommand, ArrLenCommand, TypeCommand, RespCommand, DebugCommand>;

inline std::string command_name(const Command& command) {
    return std::visit([](const auto& cmd) { return std::string(std::decay_t<decltype(cmd)>::kName); }, command);
}

inline bool is_mutating(const Command& command) {
    return std::visit([](const auto& cmd) { return std::decay_t<decltype(cmd)>::kMutating; }, command);
}

} // namespace jsonkeyspace

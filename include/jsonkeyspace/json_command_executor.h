#pragma once

#include "command_parser.h"
#include "commands.h"
#include "common_types.h"
#include "event_bus.h"
#include "json_modifier.h"
#include "keyspace.h"
#include "notification_dispatcher.h"
#include "outcome.h"
#include "path_evaluator.h"
#include "path_parser.h"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace jsonkeyspace {

struct CommandResponse {
    AggregateResult result = AggregateResult::no_match();
    // Client reply: null for nil, integers, strings (bulk and status), arrays.
    json reply;
    // True when the dispatcher handed a change event to the bus
    bool emitted = false;
};

/**
 * Runs typed JSON commands against a borrowed keyspace.
 * Each command kind is resolved to its handler at compile time; mutating
 * commands pass their aggregate result to the notification dispatcher, read-only
 * commands never reach it. Library exceptions raised while handling a command
 * become an Error result and leave the document untouched.
 */
class JsonCommandExecutor {
public:
    JsonCommandExecutor(Keyspace& keyspace, EventBus& bus, const KeyspaceConfig& config = KeyspaceConfig());

    JsonCommandExecutor(const JsonCommandExecutor&) = delete;
    JsonCommandExecutor& operator=(const JsonCommandExecutor&) = delete;

    CommandResponse execute(const Command& command);

    // Parses argv with CommandParser first; parse failures come back as Error results.
    CommandResponse execute_args(const std::vector<std::string>& argv);

    NotificationDispatcher& dispatcher() { return dispatcher_; }

private:
    template <typename Cmd>
    CommandResponse run(const Cmd& cmd);

    CommandResponse handle(const SetCommand& cmd);
    CommandResponse handle(const DelCommand& cmd);
    CommandResponse handle(const ForgetCommand& cmd);
    CommandResponse handle(const StrAppendCommand& cmd);
    CommandResponse handle(const ArrAppendCommand& cmd);
    CommandResponse handle(const ArrInsertCommand& cmd);
    CommandResponse handle(const ArrPopCommand& cmd);
    CommandResponse handle(const ArrTrimCommand& cmd);
    CommandResponse handle(const NumIncrByCommand& cmd);
    CommandResponse handle(const NumMultByCommand& cmd);
    CommandResponse handle(const NumPowByCommand& cmd);
    CommandResponse handle(const ToggleCommand& cmd);
    CommandResponse handle(const ClearCommand& cmd);
    CommandResponse handle(const GetCommand& cmd);
    CommandResponse handle(const MGetCommand& cmd);
    CommandResponse handle(const StrLenCommand& cmd);
    CommandResponse handle(const ObjKeysCommand& cmd);
    CommandResponse handle(const ObjLenCommand& cmd);
    CommandResponse handle(const ArrIndexCommand& cmd);
    CommandResponse handle(const ArrLenCommand& cmd);
    CommandResponse handle(const TypeCommand& cmd);
    CommandResponse handle(const RespCommand& cmd);
    CommandResponse handle(const DebugCommand& cmd);

    using LocationOp = std::function<Outcome(json& document, const Location& location)>;

    // Runs op at every match. nullopt when the key does not exist.
    std::optional<std::vector<Outcome>> apply_to_matches(const std::string& key, const std::string& path,
                                                         const LocationOp& op);
    CommandResponse delete_paths(const std::string& key, const std::string& path);
    CommandResponse numeric(const std::string& key, const std::string& path, NumericOp op, const json& operand);

    struct Match {
        const json* document = nullptr; // nullptr when the key does not exist
        std::optional<Location> location;
    };
    // First match of path in the key's document
    Match first_match(const std::string& key, const std::string& path) const;

    Keyspace& keyspace_;
    NotificationDispatcher dispatcher_;
    CommandParser command_parser_;
    PathParser path_parser_;
    PathEvaluator evaluator_;
    JSONModifier modifier_;
};

} // namespace jsonkeyspace

#include "jsonkeyspace/json_command_executor.h"
#include "jsonkeyspace/exceptions.h"
#include "jsonkeyspace/reply_formatter.h"
#include <glog/logging.h>
#include <utility>

namespace jsonkeyspace {

// Reply built from the last changed location, nil when nothing changed.
static CommandResponse respond_with_last(const std::vector<Outcome>& outcomes, bool as_text) {
    CommandResponse response;
    response.result = CommandOutcomeAggregator::aggregate(outcomes);
    const json* last = CommandOutcomeAggregator::last_changed_value(outcomes);
    if (last) {
        response.reply = as_text ? json(last->dump()) : *last;
    }
    return response;
}

JsonCommandExecutor::JsonCommandExecutor(Keyspace& keyspace, EventBus& bus, const KeyspaceConfig& config)
    : keyspace_(keyspace), dispatcher_(bus, config) {}

CommandResponse JsonCommandExecutor::execute(const Command& command) {
    return std::visit([this](const auto& cmd) { return run(cmd); }, command);
}

CommandResponse JsonCommandExecutor::execute_args(const std::vector<std::string>& argv) {
    Command command;
    try {
        command = command_parser_.parse(argv);
    } catch (const JsonKeyspaceException& e) {
        VLOG(1) << "Rejected " << (argv.empty() ? std::string("<empty>") : argv[0]) << ": " << e.what();
        CommandResponse response;
        response.result = AggregateResult::error(e.error_code().value_or(ErrorCode::UNKNOWN_ERROR), e.what());
        return response;
    } catch (const json::exception& e) {
        VLOG(1) << "Rejected " << (argv.empty() ? std::string("<empty>") : argv[0]) << ": " << e.what();
        CommandResponse response;
        response.result = AggregateResult::error(ErrorCode::JSON_PARSING_ERROR, e.what());
        return response;
    }
    return execute(command);
}

template <typename Cmd>
CommandResponse JsonCommandExecutor::run(const Cmd& cmd) {
    CommandResponse response;
    try {
        response = handle(cmd);
    } catch (const JsonKeyspaceException& e) {
        VLOG(1) << Cmd::kName << " failed: " << e.what();
        response = CommandResponse();
        response.result = AggregateResult::error(e.error_code().value_or(ErrorCode::UNKNOWN_ERROR), e.what());
        return response;
    } catch (const json::exception& e) {
        // nlohmann errors, e.g. serialising a member name that is not valid UTF-8
        VLOG(1) << Cmd::kName << " failed: " << e.what();
        response = CommandResponse();
        response.result = AggregateResult::error(ErrorCode::JSON_PARSING_ERROR, e.what());
        return response;
    }
    if constexpr (Cmd::kMutating) {
        response.emitted = dispatcher_.dispatch(response.result, Cmd::kEvent, cmd.key);
    }
    return response;
}

std::optional<std::vector<Outcome>> JsonCommandExecutor::apply_to_matches(const std::string& key,
                                                                          const std::string& path,
                                                                          const LocationOp& op) {
    PathParser::ParsedPath parsed = path_parser_.compile(path);
    json* document = keyspace_.find_mutable(key);
    if (!document) {
        return std::nullopt;
    }
    std::vector<Outcome> outcomes;
    for (const auto& location : evaluator_.evaluate(*document, parsed)) {
        outcomes.push_back(op(*document, location));
    }
    return outcomes;
}

JsonCommandExecutor::Match JsonCommandExecutor::first_match(const std::string& key, const std::string& path) const {
    PathParser::ParsedPath parsed = path_parser_.compile(path);
    Match match;
    match.document = keyspace_.find(key);
    if (!match.document) {
        return match;
    }
    std::vector<Location> matches = evaluator_.evaluate(*match.document, parsed);
    if (!matches.empty()) {
        match.location = matches.front();
    }
    return match;
}

// -- Mutating commands --

CommandResponse JsonCommandExecutor::handle(const SetCommand& cmd) {
    PathParser::ParsedPath path = path_parser_.compile(cmd.path);
    CommandResponse response;
    json* document = keyspace_.find_mutable(cmd.key);

    if (!document) {
        if (!path.is_root()) {
            throw InvalidArgumentException("new objects must be created at the root");
        }
        if (cmd.condition == SetCmdCondition::XX) {
            return response;
        }
        keyspace_.insert_or_assign(cmd.key, cmd.value);
        response.result = AggregateResult::applied(1);
        response.reply = "OK";
        return response;
    }

    if (path.is_root()) {
        if (cmd.condition == SetCmdCondition::NX) {
            return response;
        }
        *document = cmd.value;
        response.result = AggregateResult::applied(1);
        response.reply = "OK";
        return response;
    }

    std::vector<Outcome> outcomes;
    std::vector<Location> matches = evaluator_.evaluate(*document, path);
    if (!matches.empty()) {
        if (cmd.condition != SetCmdCondition::NX) {
            for (const auto& location : matches) {
                outcomes.push_back(modifier_.set_value(*document, location, cmd.value));
            }
        }
    } else if (cmd.condition != SetCmdCondition::XX && path.is_static() && path.ends_with_key()) {
        const std::string& member = path.elements.back().key_name;
        for (const auto& parent : evaluator_.evaluate(*document, path.parent())) {
            outcomes.push_back(modifier_.add_member(*document, parent, member, cmd.value));
        }
    }

    response.result = CommandOutcomeAggregator::aggregate(outcomes);
    if (response.result.is_applied()) {
        response.reply = "OK";
    }
    return response;
}

CommandResponse JsonCommandExecutor::delete_paths(const std::string& key, const std::string& path) {
    PathParser::ParsedPath parsed = path_parser_.compile(path);
    CommandResponse response;
    response.reply = 0;
    json* document = keyspace_.find_mutable(key);
    if (!document) {
        return response;
    }
    if (parsed.is_root()) {
        keyspace_.erase(key);
        response.result = AggregateResult::applied(1);
        response.reply = 1;
        return response;
    }
    std::vector<Outcome> outcomes = modifier_.del_all(*document, evaluator_.evaluate(*document, parsed));
    response.result = CommandOutcomeAggregator::aggregate(outcomes);
    response.reply = response.result.count();
    return response;
}

CommandResponse JsonCommandExecutor::handle(const DelCommand& cmd) {
    return delete_paths(cmd.key, cmd.path);
}

CommandResponse JsonCommandExecutor::handle(const ForgetCommand& cmd) {
    return delete_paths(cmd.key, cmd.path);
}

CommandResponse JsonCommandExecutor::handle(const StrAppendCommand& cmd) {
    auto outcomes = apply_to_matches(cmd.key, cmd.path, [&](json& document, const Location& location) {
        return modifier_.str_append(document, location, cmd.suffix);
    });
    return outcomes ? respond_with_last(*outcomes, false) : CommandResponse();
}

CommandResponse JsonCommandExecutor::handle(const ArrAppendCommand& cmd) {
    auto outcomes = apply_to_matches(cmd.key, cmd.path, [&](json& document, const Location& location) {
        return modifier_.array_append(document, location, cmd.values);
    });
    return outcomes ? respond_with_last(*outcomes, false) : CommandResponse();
}

CommandResponse JsonCommandExecutor::handle(const ArrInsertCommand& cmd) {
    auto outcomes = apply_to_matches(cmd.key, cmd.path, [&](json& document, const Location& location) {
        return modifier_.array_insert(document, location, cmd.index, cmd.values);
    });
    return outcomes ? respond_with_last(*outcomes, false) : CommandResponse();
}

CommandResponse JsonCommandExecutor::handle(const ArrPopCommand& cmd) {
    auto outcomes = apply_to_matches(cmd.key, cmd.path, [&](json& document, const Location& location) {
        return modifier_.array_pop(document, location, cmd.index);
    });
    return outcomes ? respond_with_last(*outcomes, true) : CommandResponse();
}

CommandResponse JsonCommandExecutor::handle(const ArrTrimCommand& cmd) {
    auto outcomes = apply_to_matches(cmd.key, cmd.path, [&](json& document, const Location& location) {
        return modifier_.array_trim(document, location, cmd.start, cmd.stop);
    });
    return outcomes ? respond_with_last(*outcomes, false) : CommandResponse();
}

CommandResponse JsonCommandExecutor::numeric(const std::string& key, const std::string& path, NumericOp op,
                                             const json& operand) {
    PathParser::ParsedPath parsed = path_parser_.compile(path);
    json* document = keyspace_.find_mutable(key);
    if (!document) {
        return CommandResponse();
    }

    // Matches are updated one after another on a staged copy, which is committed only
    // when every step succeeded. A Location matched twice is updated twice.
    json staged = *document;
    std::vector<Outcome> outcomes;
    for (const auto& location : evaluator_.evaluate(*document, parsed)) {
        std::optional<json> result = modifier_.numeric_result(staged, location, op, operand);
        if (result) {
            outcomes.push_back(modifier_.set_value(staged, location, *result));
        } else {
            outcomes.push_back(Outcome::unchanged(UnchangedReason::TYPE_MISMATCH));
        }
    }
    CommandResponse response = respond_with_last(outcomes, true);
    if (response.result.is_applied()) {
        *document = std::move(staged);
    }
    return response;
}

CommandResponse JsonCommandExecutor::handle(const NumIncrByCommand& cmd) {
    return numeric(cmd.key, cmd.path, NumericOp::INCR, cmd.operand);
}

CommandResponse JsonCommandExecutor::handle(const NumMultByCommand& cmd) {
    return numeric(cmd.key, cmd.path, NumericOp::MULT, cmd.operand);
}

CommandResponse JsonCommandExecutor::handle(const NumPowByCommand& cmd) {
    return numeric(cmd.key, cmd.path, NumericOp::POW, cmd.operand);
}

CommandResponse JsonCommandExecutor::handle(const ToggleCommand& cmd) {
    auto outcomes = apply_to_matches(cmd.key, cmd.path, [&](json& document, const Location& location) {
        return modifier_.toggle(document, location);
    });
    return outcomes ? respond_with_last(*outcomes, true) : CommandResponse();
}

CommandResponse JsonCommandExecutor::handle(const ClearCommand& cmd) {
    auto outcomes = apply_to_matches(cmd.key, cmd.path, [&](json& document, const Location& location) {
        return modifier_.clear(document, location);
    });
    CommandResponse response;
    response.reply = 0;
    if (outcomes) {
        response.result = CommandOutcomeAggregator::aggregate(*outcomes);
        response.reply = response.result.count();
    }
    return response;
}

// -- Read-only commands: the result is always NoMatch --

CommandResponse JsonCommandExecutor::handle(const GetCommand& cmd) {
    std::vector<std::string> paths = cmd.paths;
    if (paths.empty()) {
        paths.push_back(".");
    }
    std::vector<PathParser::ParsedPath> compiled;
    for (const auto& path : paths) {
        compiled.push_back(path_parser_.compile(path));
    }

    CommandResponse response;
    const json* document = keyspace_.find(cmd.key);
    if (!document) {
        return response;
    }

    if (compiled.size() == 1) {
        std::vector<Location> matches = evaluator_.evaluate(*document, compiled.front());
        if (!matches.empty()) {
            response.reply = format_json(document->at(matches.front()), cmd.format);
        }
        return response;
    }

    json combined = json::object();
    for (const auto& path : compiled) {
        std::vector<Location> matches = evaluator_.evaluate(*document, path);
        combined[path.original] = matches.empty() ? json() : document->at(matches.front());
    }
    response.reply = format_json(combined, cmd.format);
    return response;
}

CommandResponse JsonCommandExecutor::handle(const MGetCommand& cmd) {
    CommandResponse response;
    response.reply = json::array();
    for (const auto& key : cmd.keys) {
        Match match = first_match(key, cmd.path);
        const json* value = match.location ? modifier_.get(*match.document, *match.location) : nullptr;
        response.reply.push_back(value ? json(value->dump()) : json());
    }
    return response;
}

CommandResponse JsonCommandExecutor::handle(const StrLenCommand& cmd) {
    CommandResponse response;
    Match match = first_match(cmd.key, cmd.path);
    if (match.location) {
        if (auto length = modifier_.string_length(*match.document, *match.location)) {
            response.reply = *length;
        }
    }
    return response;
}

CommandResponse JsonCommandExecutor::handle(const ObjKeysCommand& cmd) {
    CommandResponse response;
    Match match = first_match(cmd.key, cmd.path);
    if (match.location) {
        if (auto keys = modifier_.object_keys(*match.document, *match.location)) {
            response.reply = *keys;
        }
    }
    return response;
}

CommandResponse JsonCommandExecutor::handle(const ObjLenCommand& cmd) {
    CommandResponse response;
    Match match = first_match(cmd.key, cmd.path);
    if (match.location) {
        if (auto length = modifier_.object_length(*match.document, *match.location)) {
            response.reply = *length;
        }
    }
    return response;
}

CommandResponse JsonCommandExecutor::handle(const ArrIndexCommand& cmd) {
    CommandResponse response;
    response.reply = -1;
    Match match = first_match(cmd.key, cmd.path);
    if (match.location) {
        response.reply = modifier_.array_index(*match.document, *match.location, cmd.scalar, cmd.start, cmd.stop)
                             .value_or(-1);
    }
    return response;
}

CommandResponse JsonCommandExecutor::handle(const ArrLenCommand& cmd) {
    CommandResponse response;
    Match match = first_match(cmd.key, cmd.path);
    if (match.location) {
        if (auto length = modifier_.array_length(*match.document, *match.location)) {
            response.reply = *length;
        }
    }
    return response;
}

CommandResponse JsonCommandExecutor::handle(const TypeCommand& cmd) {
    CommandResponse response;
    Match match = first_match(cmd.key, cmd.path);
    if (match.location) {
        if (auto name = modifier_.type_name(*match.document, *match.location)) {
            response.reply = *name;
        }
    }
    return response;
}

CommandResponse JsonCommandExecutor::handle(const RespCommand& cmd) {
    CommandResponse response;
    Match match = first_match(cmd.key, cmd.path);
    if (!match.document) {
        return response;
    }
    if (!match.location) {
        throw PathNotFoundException(cmd.key, cmd.path);
    }
    response.reply = resp_reply(*modifier_.get(*match.document, *match.location));
    return response;
}

CommandResponse JsonCommandExecutor::handle(const DebugCommand& cmd) {
    CommandResponse response;
    if (cmd.subcommand == DebugCommand::Subcommand::HELP) {
        response.reply = json::array({"MEMORY <key> [path] - reports memory usage",
                                      "HELP                - this message"});
        return response;
    }

    // Memory is reported as the size of the compact serialisation
    response.reply = 0;
    Match match = first_match(cmd.key, cmd.path);
    if (!match.document) {
        return response;
    }
    if (!match.location) {
        throw PathNotFoundException(cmd.key, cmd.path);
    }
    response.reply = modifier_.get(*match.document, *match.location)->dump().size();
    return response;
}

} // namespace jsonkeyspace

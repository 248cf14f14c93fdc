#include "jsonkeyspace/command_parser.h"
#include "jsonkeyspace/exceptions.h"
#include <algorithm>
#include <cctype>
#include <cstdint> // For SIZE_MAX
#include <stdexcept> // For std::invalid_argument, std::out_of_range

namespace jsonkeyspace {

using Args = std::vector<std::string>;

static std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

static void require_arity(const Args& argv, size_t min_args, size_t max_args) {
    if (argv.size() < min_args || argv.size() > max_args) {
        throw WrongArityException(argv.empty() ? std::string() : argv[0]);
    }
}

static long long parse_integer(const std::string& text) {
    try {
        size_t chars_processed = 0;
        long long value = std::stoll(text, &chars_processed);
        if (chars_processed != text.length()) {
            throw InvalidArgumentException("value is not an integer or out of range: " + text);
        }
        return value;
    } catch (const std::invalid_argument&) {
        throw InvalidArgumentException("value is not an integer or out of range: " + text);
    } catch (const std::out_of_range&) {
        throw InvalidArgumentException("value is not an integer or out of range: " + text);
    }
}

static json parse_json_argument(const std::string& text) {
    try {
        return json::parse(text);
    } catch (const json::exception& e) {
        // Covers out_of_range as well, e.g. a number that overflows a double
        throw JsonParsingException(e.what());
    }
}

static json parse_number_argument(const std::string& text) {
    json value = parse_json_argument(text);
    if (!value.is_number()) {
        throw InvalidArgumentException("expected a number but found '" + text + "'");
    }
    return value;
}

static std::vector<json> parse_json_values(const Args& argv, size_t first) {
    std::vector<json> values;
    for (size_t i = first; i < argv.size(); ++i) {
        values.push_back(parse_json_argument(argv[i]));
    }
    return values;
}

// Builds the commands whose only arguments are a key and an optional path.
template <typename Cmd>
static Command key_and_optional_path(const Args& argv) {
    require_arity(argv, 2, 3);
    Cmd cmd;
    cmd.key = argv[1];
    if (argv.size() == 3) cmd.path = argv[2];
    return cmd;
}

template <typename Cmd>
static Command numeric_command(const Args& argv) {
    require_arity(argv, 4, 4);
    Cmd cmd;
    cmd.key = argv[1];
    cmd.path = argv[2];
    cmd.operand = parse_number_argument(argv[3]);
    return cmd;
}

// FORMAT argument of SET and GET. Only JSON is implemented; BSON is recognised and refused.
static void check_format(const std::string& format) {
    std::string name = to_upper(format);
    if (name == "JSON") {
        return;
    }
    if (name == "BSON") {
        throw InvalidArgumentException("BSON format is not supported");
    }
    throw InvalidArgumentException("unknown format '" + format + "'");
}

static Command parse_set(const Args& argv) {
    require_arity(argv, 4, 7);
    SetCommand cmd;
    cmd.key = argv[1];
    cmd.path = argv[2];
    for (size_t i = 4; i < argv.size(); ++i) {
        std::string option = to_upper(argv[i]);
        if (option == "NX" && cmd.condition == SetCmdCondition::NONE) {
            cmd.condition = SetCmdCondition::NX;
        } else if (option == "XX" && cmd.condition == SetCmdCondition::NONE) {
            cmd.condition = SetCmdCondition::XX;
        } else if (option == "FORMAT" && i + 1 < argv.size()) {
            check_format(argv[++i]);
        } else {
            throw InvalidArgumentException("syntax error near '" + argv[i] + "'");
        }
    }
    cmd.value = parse_json_argument(argv[3]);
    return cmd;
}

static Command parse_get(const Args& argv) {
    require_arity(argv, 2, SIZE_MAX);
    GetCommand cmd;
    cmd.key = argv[1];
    for (size_t i = 2; i < argv.size(); ++i) {
        std::string option = to_upper(argv[i]);
        std::string* target = nullptr;
        if (option == "INDENT") {
            target = &cmd.format.indent;
        } else if (option == "NEWLINE") {
            target = &cmd.format.newline;
        } else if (option == "SPACE") {
            target = &cmd.format.space;
        } else if (option == "NOESCAPE") {
            continue; // Accepted for compatibility, has no effect
        } else if (option == "FORMAT") {
            if (i + 1 >= argv.size()) {
                throw WrongArityException(argv[0]);
            }
            check_format(argv[++i]);
            continue;
        }
        if (target) {
            if (i + 1 >= argv.size()) {
                throw WrongArityException(argv[0]);
            }
            *target = argv[++i];
        } else {
            cmd.paths.push_back(argv[i]);
        }
    }
    return cmd;
}

static Command parse_mget(const Args& argv) {
    require_arity(argv, 3, SIZE_MAX);
    MGetCommand cmd;
    cmd.keys.assign(argv.begin() + 1, argv.end() - 1);
    cmd.path = argv.back();
    return cmd;
}

static Command parse_strappend(const Args& argv) {
    require_arity(argv, 3, 4);
    StrAppendCommand cmd;
    cmd.key = argv[1];
    if (argv.size() == 4) cmd.path = argv[2];
    json value = parse_json_argument(argv.back());
    if (!value.is_string()) {
        throw InvalidArgumentException("STRAPPEND expects a JSON string, got '" + argv.back() + "'");
    }
    cmd.suffix = value.get<std::string>();
    return cmd;
}

static Command parse_arrappend(const Args& argv) {
    require_arity(argv, 4, SIZE_MAX);
    ArrAppendCommand cmd;
    cmd.key = argv[1];
    cmd.path = argv[2];
    cmd.values = parse_json_values(argv, 3);
    return cmd;
}

static Command parse_arrinsert(const Args& argv) {
    require_arity(argv, 5, SIZE_MAX);
    ArrInsertCommand cmd;
    cmd.key = argv[1];
    cmd.path = argv[2];
    cmd.index = parse_integer(argv[3]);
    cmd.values = parse_json_values(argv, 4);
    return cmd;
}

static Command parse_arrpop(const Args& argv) {
    require_arity(argv, 2, 4);
    ArrPopCommand cmd;
    cmd.key = argv[1];
    if (argv.size() >= 3) cmd.path = argv[2];
    if (argv.size() == 4) cmd.index = parse_integer(argv[3]);
    return cmd;
}

static Command parse_arrtrim(const Args& argv) {
    require_arity(argv, 5, 5);
    ArrTrimCommand cmd;
    cmd.key = argv[1];
    cmd.path = argv[2];
    cmd.start = parse_integer(argv[3]);
    cmd.stop = parse_integer(argv[4]);
    return cmd;
}

static Command parse_arrindex(const Args& argv) {
    require_arity(argv, 4, 6);
    ArrIndexCommand cmd;
    cmd.key = argv[1];
    cmd.path = argv[2];
    cmd.scalar = parse_json_argument(argv[3]);
    if (cmd.scalar.is_structured()) {
        throw InvalidArgumentException("ARRINDEX expects a scalar value, got '" + argv[3] + "'");
    }
    if (argv.size() >= 5) cmd.start = parse_integer(argv[4]);
    if (argv.size() == 6) cmd.stop = parse_integer(argv[5]);
    return cmd;
}

static Command parse_toggle(const Args& argv) {
    require_arity(argv, 3, 3);
    ToggleCommand cmd;
    cmd.key = argv[1];
    cmd.path = argv[2];
    return cmd;
}

static Command parse_debug(const Args& argv) {
    require_arity(argv, 2, 4);
    DebugCommand cmd;
    std::string subcommand = to_upper(argv[1]);
    if (subcommand == "HELP") {
        require_arity(argv, 2, 2);
        cmd.subcommand = DebugCommand::Subcommand::HELP;
    } else if (subcommand == "MEMORY") {
        require_arity(argv, 3, 4);
        cmd.subcommand = DebugCommand::Subcommand::MEMORY;
        cmd.key = argv[2];
        if (argv.size() == 4) cmd.path = argv[3];
    } else {
        throw InvalidArgumentException("unknown subcommand '" + argv[1] + "' - try `JSON.DEBUG HELP`");
    }
    return cmd;
}

CommandParser::CommandParser() {
    builders_ = {
        {"JSON.SET", parse_set},
        {"JSON.DEL", key_and_optional_path<DelCommand>},
        {"JSON.FORGET", key_and_optional_path<ForgetCommand>},
        {"JSON.STRAPPEND", parse_strappend},
        {"JSON.ARRAPPEND", parse_arrappend},
        {"JSON.ARRINSERT", parse_arrinsert},
        {"JSON.ARRPOP", parse_arrpop},
        {"JSON.ARRTRIM", parse_arrtrim},
        {"JSON.NUMINCRBY", numeric_command<NumIncrByCommand>},
        {"JSON.NUMMULTBY", numeric_command<NumMultByCommand>},
        {"JSON.NUMPOWBY", numeric_command<NumPowByCommand>},
        {"JSON.TOGGLE", parse_toggle},
        {"JSON.CLEAR", key_and_optional_path<ClearCommand>},
        {"JSON.GET", parse_get},
        {"JSON.MGET", parse_mget},
        {"JSON.STRLEN", key_and_optional_path<StrLenCommand>},
        {"JSON.OBJKEYS", key_and_optional_path<ObjKeysCommand>},
        {"JSON.OBJLEN", key_and_optional_path<ObjLenCommand>},
        {"JSON.ARRINDEX", parse_arrindex},
        {"JSON.ARRLEN", key_and_optional_path<ArrLenCommand>},
        {"JSON.TYPE", key_and_optional_path<TypeCommand>},
        {"JSON.RESP", key_and_optional_path<RespCommand>},
        {"JSON.DEBUG", parse_debug},
    };
}

bool CommandParser::is_known_command(const std::string& name) const {
    return builders_.count(to_upper(name)) != 0;
}

Command CommandParser::parse(const std::vector<std::string>& argv) const {
    if (argv.empty()) {
        throw InvalidArgumentException("empty command");
    }
    auto it = builders_.find(to_upper(argv[0]));
    if (it == builders_.end()) {
        throw InvalidArgumentException("unknown command '" + argv[0] + "'");
    }
    return it->second(argv);
}

std::vector<std::string> CommandParser::tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::string current;
    bool in_token = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_token) {
                tokens.push_back(current);
                current.clear();
                in_token = false;
            }
            continue;
        }
        in_token = true;
        if (c == '\'' || c == '"') {
            char quote = c;
            bool closed = false;
            for (++i; i < line.size(); ++i) {
                if (line[i] == quote) {
                    closed = true;
                    break;
                }
                if (quote == '"' && line[i] == '\\' && i + 1 < line.size()) {
                    ++i;
                }
                current += line[i];
            }
            if (!closed) {
                throw InvalidArgumentException("unbalanced quotes in request");
            }
        } else {
            current += c;
        }
    }
    if (in_token) {
        tokens.push_back(current);
    }
    return tokens;
}

} // namespace jsonkeyspace

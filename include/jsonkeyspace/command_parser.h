#pragma once

#include "commands.h"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace jsonkeyspace {

// Turns a JSON.* argument vector into a typed Command.
// argv[0] is the command name, matched case-insensitively.
class CommandParser {
public:
    CommandParser();

    /**
     * Throws WrongArityException when the argument count does not fit the command,
     * InvalidArgumentException for unknown commands, options or non-integer indices,
     * and JsonParsingException when a JSON argument does not parse.
     */
    Command parse(const std::vector<std::string>& argv) const;

    bool is_known_command(const std::string& name) const;

    // Splits a command line on whitespace. Single quotes are literal, double quotes
    // honour backslash escapes. Throws InvalidArgumentException on an unterminated quote.
    static std::vector<std::string> tokenize(const std::string& line);

private:
    using Builder = std::function<Command(const std::vector<std::string>&)>;
    std::map<std::string, Builder> builders_; // Keyed by upper-case name
};

} // namespace jsonkeyspace

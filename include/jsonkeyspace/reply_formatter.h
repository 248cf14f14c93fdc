#pragma once

#include "common_types.h"
#include <string>

namespace jsonkeyspace {

// JSON.GET serialisation options. All empty gives the compact form.
struct FormatOptions {
    std::string indent;  // Inserted once per nesting level
    std::string newline; // Written after '{', '[', ',' and before closing brackets
    std::string space;   // Written between a member name's ':' and its value

    bool is_compact() const { return indent.empty() && newline.empty() && space.empty(); }
};

std::string format_json(const json& value, const FormatOptions& options = FormatOptions());

// JSON.RESP encoding: null stays nil, booleans become "true"/"false", numbers and
// strings are kept, arrays become ["[", elements...] and objects
// ["{", key1, value1, ...], recursively.
json resp_reply(const json& value);

} // namespace jsonkeyspace

#include "jsonkeyspace/reply_formatter.h"

namespace jsonkeyspace {

static void write_indent(std::string& out, const FormatOptions& options, size_t level) {
    for (size_t i = 0; i < level; ++i) {
        out += options.indent;
    }
}

static void write_value(std::string& out, const json& value, const FormatOptions& options, size_t level) {
    if (value.is_object()) {
        if (value.empty()) {
            out += "{}";
            return;
        }
        out += '{';
        bool first = true;
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (!first) out += ',';
            first = false;
            out += options.newline;
            write_indent(out, options, level + 1);
            out += json(it.key()).dump();
            out += ':';
            out += options.space;
            write_value(out, it.value(), options, level + 1);
        }
        out += options.newline;
        write_indent(out, options, level);
        out += '}';
    } else if (value.is_array()) {
        if (value.empty()) {
            out += "[]";
            return;
        }
        out += '[';
        bool first = true;
        for (const auto& element : value) {
            if (!first) out += ',';
            first = false;
            out += options.newline;
            write_indent(out, options, level + 1);
            write_value(out, element, options, level + 1);
        }
        out += options.newline;
        write_indent(out, options, level);
        out += ']';
    } else {
        out += value.dump();
    }
}

std::string format_json(const json& value, const FormatOptions& options) {
    if (options.is_compact()) {
        return value.dump();
    }
    std::string out;
    write_value(out, value, options, 0);
    return out;
}

json resp_reply(const json& value) {
    switch (value.type()) {
        case json::value_t::boolean:
            return value.get<bool>() ? "true" : "false";
        case json::value_t::array: {
            json out = json::array({"["});
            for (const auto& element : value) {
                out.push_back(resp_reply(element));
            }
            return out;
        }
        case json::value_t::object: {
            json out = json::array({"{"});
            for (auto it = value.begin(); it != value.end(); ++it) {
                out.push_back(it.key());
                out.push_back(resp_reply(it.value()));
            }
            return out;
        }
        default:
            return value;
    }
}

} // namespace jsonkeyspace

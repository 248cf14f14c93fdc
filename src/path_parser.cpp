#include "jsonkeyspace/path_parser.h"
#include "jsonkeyspace/exceptions.h" // For InvalidPathException
#include <algorithm>
#include <stdexcept> // For std::invalid_argument, std::out_of_range

namespace jsonkeyspace {

// Basic helper to trim whitespace
static std::string trim(const std::string& str) {
    const std::string WHITESPACE = " \n\r\t\f\v";
    size_t start = str.find_first_not_of(WHITESPACE);
    if (start == std::string::npos) return ""; // Empty or all whitespace
    size_t end = str.find_last_not_of(WHITESPACE);
    return str.substr(start, (end - start + 1));
}

static long long parse_integer(const std::string& text, const std::string& what) {
    std::string value = trim(text);
    if (value.empty()) {
        throw InvalidPathException("Empty " + what);
    }
    try {
        size_t chars_processed = 0;
        long long result = std::stoll(value, &chars_processed);
        if (chars_processed != value.length()) {
            throw InvalidPathException("Invalid characters in " + what + ": " + value);
        }
        return result;
    } catch (const std::invalid_argument&) {
        throw InvalidPathException("Invalid " + what + " (not a number): " + value);
    } catch (const std::out_of_range&) {
        throw InvalidPathException(what + " out of range: " + value);
    }
}

// Splits on `separator` wherever it appears outside quotes, brackets and parentheses.
static std::vector<std::string> split_top_level(const std::string& text, const std::string& separator) {
    std::vector<std::string> parts;
    std::string current;
    char quote = 0;
    int depth = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (quote) {
            current += c;
            if (c == '\\' && i + 1 < text.size()) {
                current += text[++i];
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '(' || c == '[') {
            ++depth;
        } else if (c == ')' || c == ']') {
            --depth;
        } else if (depth == 0 && text.compare(i, separator.size(), separator) == 0) {
            parts.push_back(current);
            current.clear();
            i += separator.size() - 1;
            continue;
        }
        current += c;
    }
    if (quote) {
        throw InvalidPathException("Unterminated quoted string in: " + text);
    }
    parts.push_back(current);
    return parts;
}

static std::string unquote(const std::string& quoted) {
    if (quoted.size() < 2 || (quoted.front() != '\'' && quoted.front() != '"') || quoted.back() != quoted.front()) {
        throw InvalidPathException("Invalid quoted key: " + quoted);
    }
    std::string out;
    for (size_t i = 1; i + 1 < quoted.size(); ++i) {
        if (quoted[i] == '\\' && i + 2 < quoted.size()) {
            out += quoted[++i];
        } else {
            out += quoted[i];
        }
    }
    return out;
}

// Index of the ']' closing the '[' at `open`, skipping nested brackets and quoted text.
static size_t find_closing_bracket(const std::string& path, size_t open) {
    char quote = 0;
    int depth = 0;
    for (size_t i = open; i < path.size(); ++i) {
        char c = path[i];
        if (quote) {
            if (c == '\\') {
                ++i;
            } else if (c == quote) {
                quote = 0;
            }
        } else if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '[') {
            ++depth;
        } else if (c == ']') {
            if (--depth == 0) {
                return i;
            }
        }
    }
    throw InvalidPathException("Mismatched brackets in path: '[' without ']'");
}

static FilterTerm parse_filter_term(std::string term) {
    while (term.size() >= 2 && term.front() == '(' && term.back() == ')') {
        term = trim(term.substr(1, term.size() - 2));
    }
    if (term.empty() || term[0] != '@') {
        throw InvalidPathException("Filter term must start with '@': " + term);
    }

    FilterTerm result;
    size_t pos = 1;
    while (pos < term.size()) {
        if (term[pos] == '.') {
            size_t end = term.find_first_of(".[ =!<>", pos + 1);
            if (end == std::string::npos) end = term.size();
            std::string name = term.substr(pos + 1, end - pos - 1);
            if (name.empty()) {
                throw InvalidPathException("Empty key name in filter: " + term);
            }
            PathParser::PathElement el;
            el.type = PathParser::PathElement::Type::KEY;
            el.key_name = name;
            result.relative_path.push_back(el);
            pos = end;
        } else if (term[pos] == '[') {
            size_t close = find_closing_bracket(term, pos);
            std::string content = trim(term.substr(pos + 1, close - pos - 1));
            PathParser::PathElement el;
            if (!content.empty() && (content[0] == '\'' || content[0] == '"')) {
                el.type = PathParser::PathElement::Type::KEY;
                el.key_name = unquote(content);
            } else {
                el.type = PathParser::PathElement::Type::INDEX;
                el.index = parse_integer(content, "filter array index");
            }
            result.relative_path.push_back(el);
            pos = close + 1;
        } else {
            break;
        }
    }

    std::string rest = trim(term.substr(pos));
    if (rest.empty()) {
        result.op = FilterTerm::Op::EXISTS;
        return result;
    }

    static const std::vector<std::pair<std::string, FilterTerm::Op>> OPERATORS = {
        {"==", FilterTerm::Op::EQ}, {"!=", FilterTerm::Op::NE},
        {"<=", FilterTerm::Op::LE}, {">=", FilterTerm::Op::GE},
        {"<", FilterTerm::Op::LT},  {">", FilterTerm::Op::GT},
    };
    auto op_it = std::find_if(OPERATORS.begin(), OPERATORS.end(), [&rest](const auto& candidate) {
        return rest.compare(0, candidate.first.size(), candidate.first) == 0;
    });
    if (op_it == OPERATORS.end()) {
        throw InvalidPathException("Unsupported filter operator in: " + term);
    }
    result.op = op_it->second;

    std::string literal = trim(rest.substr(op_it->first.size()));
    if (literal.empty()) {
        throw InvalidPathException("Missing filter operand in: " + term);
    }
    if (literal[0] == '\'') {
        result.literal = unquote(literal);
    } else {
        try {
            result.literal = json::parse(literal);
        } catch (const json::exception&) {
            throw InvalidPathException("Invalid filter operand: " + literal);
        }
    }
    return result;
}

bool PathParser::ParsedPath::is_static() const {
    return std::all_of(elements.begin(), elements.end(), [](const PathElement& el) {
        return !el.recursive &&
               (el.type == PathElement::Type::KEY || el.type == PathElement::Type::INDEX);
    });
}

bool PathParser::ParsedPath::ends_with_key() const {
    return !elements.empty() && elements.back().type == PathElement::Type::KEY && !elements.back().recursive;
}

PathParser::ParsedPath PathParser::ParsedPath::parent() const {
    if (elements.empty()) {
        throw InvalidPathException("Root path has no parent");
    }
    ParsedPath result = *this;
    result.elements.pop_back();
    result.normalized = PathParser::reconstruct_path(result.elements);
    result.original = result.normalized;
    return result;
}

std::vector<PathParser::PathElement> PathParser::parse(const std::string& path_in) const {
    std::string path = trim(path_in);
    if (path.empty() || path[0] != '$') {
        throw InvalidPathException("Path must start with '$': " + path_in);
    }

    std::vector<PathElement> elements;
    size_t pos = 1;
    while (pos < path.size()) {
        char c = path[pos];
        if (c == '.') {
            bool recursive = false;
            if (pos + 1 < path.size() && path[pos + 1] == '.') {
                recursive = true;
                pos += 2;
            } else {
                pos += 1;
            }
            if (pos >= path.size()) {
                throw InvalidPathException("Path cannot end with '.'");
            }

            if (path[pos] == '[') {
                if (!recursive) {
                    throw InvalidPathException("Unexpected '.[' in path: " + path);
                }
                PathElement el = parse_bracket(path, pos);
                el.recursive = true;
                elements.push_back(std::move(el));
                continue;
            }

            PathElement el;
            el.recursive = recursive;
            if (path[pos] == '*') {
                el.type = PathElement::Type::WILDCARD;
                ++pos;
            } else {
                size_t end = path.find_first_of(".[", pos);
                if (end == std::string::npos) end = path.size();
                std::string name = path.substr(pos, end - pos);
                if (name.empty()) {
                    throw InvalidPathException("Path cannot contain '...'");
                }
                if (name.find_first_of("]'\" \t") != std::string::npos) {
                    throw InvalidPathException("Invalid character in key name '" + name + "' (use ['...'] notation)");
                }
                el.type = PathElement::Type::KEY;
                el.key_name = name;
                pos = end;
            }
            elements.push_back(std::move(el));
        } else if (c == '[') {
            elements.push_back(parse_bracket(path, pos));
        } else {
            if (c == ']') {
                throw InvalidPathException("Mismatched brackets in path: ']' without '['");
            }
            throw InvalidPathException("Unexpected character '" + std::string(1, c) + "' at position " +
                                       std::to_string(pos) + " in path: " + path);
        }
    }
    return elements;
}

PathParser::PathElement PathParser::parse_bracket(const std::string& path, size_t& pos) const {
    size_t closing_bracket = find_closing_bracket(path, pos);
    std::string content = trim(path.substr(pos + 1, closing_bracket - pos - 1));
    pos = closing_bracket + 1;

    if (content.empty()) {
        throw InvalidPathException("Empty brackets [] are not valid (use [*] for wildcard).");
    }

    PathElement elem;
    if (content == "*") {
        elem.type = PathElement::Type::WILDCARD;
        return elem;
    }

    if (content[0] == '?') {
        std::string body = trim(content.substr(1));
        if (body.size() < 2 || body.front() != '(' || body.back() != ')') {
            throw InvalidPathException("Filter must be written as [?(...)]: " + content);
        }
        elem.type = PathElement::Type::FILTER;
        elem.filter_expression = trim(body.substr(1, body.size() - 2));
        elem.filter = parse_filter(elem.filter_expression);
        return elem;
    }

    if (content[0] == '\'' || content[0] == '"') {
        std::vector<std::string> keys;
        for (const auto& part : split_top_level(content, ",")) {
            keys.push_back(unquote(trim(part)));
        }
        if (keys.size() == 1) {
            elem.type = PathElement::Type::KEY;
            elem.key_name = keys.front();
        } else {
            elem.type = PathElement::Type::UNION;
            elem.union_keys = std::move(keys);
        }
        return elem;
    }

    if (content.find(':') != std::string::npos) {
        auto parts = split_top_level(content, ":");
        if (parts.size() > 3) {
            throw InvalidPathException("Invalid slice: [" + content + "]");
        }
        elem.type = PathElement::Type::SLICE;
        if (!trim(parts[0]).empty()) elem.start = parse_integer(parts[0], "slice start");
        if (!trim(parts[1]).empty()) elem.end = parse_integer(parts[1], "slice end");
        if (parts.size() == 3 && !trim(parts[2]).empty()) {
            elem.step = parse_integer(parts[2], "slice step");
            if (elem.step <= 0) {
                throw InvalidPathException("Slice step must be positive: [" + content + "]");
            }
        }
        return elem;
    }

    if (content.find(',') != std::string::npos) {
        elem.type = PathElement::Type::UNION;
        for (const auto& part : split_top_level(content, ",")) {
            elem.union_indices.push_back(parse_integer(part, "array index"));
        }
        return elem;
    }

    elem.type = PathElement::Type::INDEX;
    elem.index = parse_integer(content, "array index");
    return elem;
}

std::shared_ptr<const FilterExpression> PathParser::parse_filter(const std::string& body) const {
    if (body.empty()) {
        throw InvalidPathException("Empty filter expression");
    }
    auto expression = std::make_shared<FilterExpression>();
    for (const auto& disjunct : split_top_level(body, "||")) {
        std::vector<FilterTerm> group;
        for (const auto& conjunct : split_top_level(disjunct, "&&")) {
            group.push_back(parse_filter_term(trim(conjunct)));
        }
        expression->any_of.push_back(std::move(group));
    }
    return expression;
}

bool PathParser::is_valid_path(const std::string& path_str) const {
    try {
        compile(path_str);
        return true;
    } catch (const InvalidPathException&) {
        return false;
    }
}

PathParser::ParsedPath PathParser::compile(const std::string& client_path) const {
    ParsedPath parsed;
    parsed.original = client_path;
    std::string trimmed = trim(client_path);
    parsed.legacy = trimmed.empty() || trimmed[0] != '$';
    parsed.normalized = normalize_path(trimmed);
    parsed.elements = parse(parsed.normalized);
    return parsed;
}

bool PathParser::is_root_path(const std::string& path_str) {
    return normalize_path(path_str) == "$";
}

std::string PathParser::normalize_path(const std::string& client_path) {
    std::string path = trim(client_path);
    if (!path.empty() && path[0] == '$') {
        return path;
    }
    if (path.empty() || path == ".") {
        return "$";
    }
    if (path[0] == '.' || path[0] == '[') {
        return "$" + path;
    }
    return "$." + path;
}

std::string PathParser::escape_key_if_needed(const std::string& key_name) {
    if (!key_name.empty() && key_name.find_first_of(".[]'\"* \t") == std::string::npos) {
        return key_name;
    }
    std::string escaped;
    for (char c : key_name) {
        if (c == '\'' || c == '\\') escaped += '\\';
        escaped += c;
    }
    return "['" + escaped + "']";
}

std::string PathParser::reconstruct_path(const std::vector<PathElement>& path_elements) {
    std::string out = "$";
    for (const auto& el : path_elements) {
        std::string prefix = el.recursive ? ".." : "";
        switch (el.type) {
            case PathElement::Type::KEY: {
                std::string key = escape_key_if_needed(el.key_name);
                if (key[0] == '[') {
                    out += prefix + key;
                } else {
                    out += (el.recursive ? ".." : ".") + key;
                }
                break;
            }
            case PathElement::Type::INDEX:
                out += prefix + "[" + std::to_string(el.index) + "]";
                break;
            case PathElement::Type::WILDCARD:
                out += el.recursive ? "..*" : ".*";
                break;
            case PathElement::Type::SLICE:
                out += prefix + "[" + (el.start ? std::to_string(*el.start) : "") + ":" +
                       (el.end ? std::to_string(*el.end) : "") +
                       (el.step != 1 ? ":" + std::to_string(el.step) : "") + "]";
                break;
            case PathElement::Type::UNION: {
                out += prefix + "[";
                if (!el.union_keys.empty()) {
                    for (size_t i = 0; i < el.union_keys.size(); ++i) {
                        std::string key = escape_key_if_needed(el.union_keys[i]);
                        if (key[0] != '[') key = "['" + key + "']";
                        out += (i ? "," : "") + key.substr(1, key.size() - 2);
                    }
                } else {
                    for (size_t i = 0; i < el.union_indices.size(); ++i) {
                        out += (i ? "," : "") + std::to_string(el.union_indices[i]);
                    }
                }
                out += "]";
                break;
            }
            case PathElement::Type::FILTER:
                out += prefix + "[?(" + el.filter_expression + ")]";
                break;
        }
    }
    return out;
}

} // namespace jsonkeyspace

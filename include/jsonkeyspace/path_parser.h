#pragma once

#include "common_types.h"
#include <string>
#include <vector>
#include <memory>
#include <optional>

namespace jsonkeyspace {

struct FilterExpression;

class PathParser {
public:
    PathParser() = default;

    struct PathElement {
        enum class Type { KEY, INDEX, SLICE, WILDCARD, FILTER, UNION };
        Type type = Type::KEY;
        std::string key_name;
        long long index = 0;
        std::optional<long long> start, end; // SLICE bounds, python semantics
        long long step = 1;
        std::vector<std::string> union_keys;
        std::vector<long long> union_indices;
        std::string filter_expression; // Text between [?( and )]
        std::shared_ptr<const FilterExpression> filter;
        bool recursive = false; // Selector preceded by '..'
    };

    // A client path after the backwards compatibility rewrite.
    // Legacy paths (not starting with '$') address at most one location.
    struct ParsedPath {
        std::string original;
        std::string normalized;
        bool legacy = false;
        std::vector<PathElement> elements;

        bool is_root() const { return elements.empty(); }
        // Only plain keys and indices, no wildcard, slice, union, filter or recursion
        bool is_static() const;
        bool ends_with_key() const;
        // Same path without its last element. Must not be called on the root.
        ParsedPath parent() const;
    };

    // Parses a '$'-rooted JSONPath expression.
    // Throws InvalidPathException on any syntax error.
    std::vector<PathElement> parse(const std::string& path) const;
    bool is_valid_path(const std::string& path) const;

    // Applies the legacy rewrite ('.' -> '$', '.a' -> '$.a', 'a' -> '$.a') then parses.
    ParsedPath compile(const std::string& client_path) const;

    static bool is_root_path(const std::string& path_str);
    static std::string normalize_path(const std::string& client_path);
    static std::string escape_key_if_needed(const std::string& key_name);
    static std::string reconstruct_path(const std::vector<PathElement>& path_elements);

private:
    PathElement parse_bracket(const std::string& path, size_t& pos) const;
    std::shared_ptr<const FilterExpression> parse_filter(const std::string& body) const;
};

// Single comparison inside a [?(...)] filter, evaluated against each candidate '@'.
struct FilterTerm {
    enum class Op { EXISTS, EQ, NE, LT, LE, GT, GE };
    std::vector<PathParser::PathElement> relative_path; // KEY and INDEX elements after '@'
    Op op = Op::EXISTS;
    json literal;
};

// Disjunction of conjunctions: a || b && c is {{a}, {b, c}}
struct FilterExpression {
    std::vector<std::vector<FilterTerm>> any_of;
};

} // namespace jsonkeyspace

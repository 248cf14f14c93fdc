#pragma once

#include "common_types.h"
#include "path_parser.h"
#include <vector>

namespace jsonkeyspace {

// A resolved position inside one document. Only valid for the command that computed it.
using Location = json::json_pointer;

class PathEvaluator {
public:
    /**
     * Resolves a compiled path against a document.
     * Locations come back in document order: object members in insertion order,
     * array elements by index. A legacy path yields at most the first match.
     * The document is never modified.
     */
    std::vector<Location> evaluate(const json& document, const PathParser::ParsedPath& path) const;

    // Every match of an element sequence, without the legacy single-match rule.
    std::vector<Location> evaluate(const json& document,
                                   const std::vector<PathParser::PathElement>& elements) const;

    bool matches_filter(const json& candidate, const FilterExpression& filter) const;

private:
    void select(const json& node, const Location& at, const PathParser::PathElement& element,
                std::vector<Location>& out) const;
    void select_descendants(const json& node, const Location& at, const PathParser::PathElement& element,
                            std::vector<Location>& out) const;
    bool matches_term(const json& candidate, const FilterTerm& term) const;
};

} // namespace jsonkeyspace

#include "jsonkeyspace/path_evaluator.h"
#include <algorithm>

namespace jsonkeyspace {

using Element = PathParser::PathElement;

// Maps a possibly negative index onto [0, size); returns false when it falls outside.
static bool normalize_index(long long index, size_t size, size_t& out) {
    long long actual = index < 0 ? static_cast<long long>(size) + index : index;
    if (actual < 0 || actual >= static_cast<long long>(size)) {
        return false;
    }
    out = static_cast<size_t>(actual);
    return true;
}

static long long clamp_slice_bound(long long bound, long long size) {
    if (bound < 0) bound += size;
    return std::max(0LL, std::min(bound, size));
}

std::vector<Location> PathEvaluator::evaluate(const json& document, const PathParser::ParsedPath& path) const {
    std::vector<Location> matches = evaluate(document, path.elements);
    if (path.legacy && matches.size() > 1) {
        matches.resize(1);
    }
    return matches;
}

std::vector<Location> PathEvaluator::evaluate(const json& document,
                                              const std::vector<PathParser::PathElement>& elements) const {
    std::vector<Location> current{Location()};
    for (const auto& element : elements) {
        std::vector<Location> next;
        for (const auto& location : current) {
            const json& node = document.at(location);
            if (element.recursive) {
                select_descendants(node, location, element, next);
            } else {
                select(node, location, element, next);
            }
        }
        current = std::move(next);
        if (current.empty()) {
            break;
        }
    }
    return current;
}

void PathEvaluator::select_descendants(const json& node, const Location& at, const Element& element,
                                       std::vector<Location>& out) const {
    select(node, at, element, out);
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            select_descendants(it.value(), at / it.key(), element, out);
        }
    } else if (node.is_array()) {
        for (size_t i = 0; i < node.size(); ++i) {
            select_descendants(node[i], at / i, element, out);
        }
    }
}

void PathEvaluator::select(const json& node, const Location& at, const Element& element,
                           std::vector<Location>& out) const {
    switch (element.type) {
        case Element::Type::KEY:
            if (node.is_object() && node.contains(element.key_name)) {
                out.push_back(at / element.key_name);
            }
            break;
        case Element::Type::INDEX: {
            size_t idx = 0;
            if (node.is_array() && normalize_index(element.index, node.size(), idx)) {
                out.push_back(at / idx);
            }
            break;
        }
        case Element::Type::WILDCARD:
            if (node.is_object()) {
                for (auto it = node.begin(); it != node.end(); ++it) {
                    out.push_back(at / it.key());
                }
            } else if (node.is_array()) {
                for (size_t i = 0; i < node.size(); ++i) {
                    out.push_back(at / i);
                }
            }
            break;
        case Element::Type::SLICE: {
            if (!node.is_array()) break;
            long long size = static_cast<long long>(node.size());
            long long start = element.start ? clamp_slice_bound(*element.start, size) : 0;
            long long end = element.end ? clamp_slice_bound(*element.end, size) : size;
            for (long long i = start; i < end; i += element.step) {
                out.push_back(at / static_cast<size_t>(i));
                if (end - i <= element.step) break; // Next step would pass the end or overflow
            }
            break;
        }
        case Element::Type::UNION:
            if (node.is_object()) {
                for (const auto& key : element.union_keys) {
                    if (node.contains(key)) {
                        out.push_back(at / key);
                    }
                }
            } else if (node.is_array()) {
                for (long long index : element.union_indices) {
                    size_t idx = 0;
                    if (normalize_index(index, node.size(), idx)) {
                        out.push_back(at / idx);
                    }
                }
            }
            break;
        case Element::Type::FILTER:
            if (!element.filter) break;
            if (node.is_object()) {
                for (auto it = node.begin(); it != node.end(); ++it) {
                    if (matches_filter(it.value(), *element.filter)) {
                        out.push_back(at / it.key());
                    }
                }
            } else if (node.is_array()) {
                for (size_t i = 0; i < node.size(); ++i) {
                    if (matches_filter(node[i], *element.filter)) {
                        out.push_back(at / i);
                    }
                }
            }
            break;
    }
}

bool PathEvaluator::matches_filter(const json& candidate, const FilterExpression& filter) const {
    return std::any_of(filter.any_of.begin(), filter.any_of.end(), [&](const std::vector<FilterTerm>& group) {
        return std::all_of(group.begin(), group.end(),
                           [&](const FilterTerm& term) { return matches_term(candidate, term); });
    });
}

bool PathEvaluator::matches_term(const json& candidate, const FilterTerm& term) const {
    const json* value = &candidate;
    for (const auto& el : term.relative_path) {
        if (el.type == Element::Type::KEY) {
            if (!value->is_object() || !value->contains(el.key_name)) return false;
            value = &(*value)[el.key_name];
        } else {
            size_t idx = 0;
            if (!value->is_array() || !normalize_index(el.index, value->size(), idx)) return false;
            value = &(*value)[idx];
        }
    }

    if (term.op == FilterTerm::Op::EXISTS) {
        return true;
    }
    if (term.op == FilterTerm::Op::EQ) {
        return *value == term.literal;
    }
    if (term.op == FilterTerm::Op::NE) {
        return *value != term.literal;
    }

    // Ordering only between two numbers or two strings
    bool comparable = (value->is_number() && term.literal.is_number()) ||
                      (value->is_string() && term.literal.is_string());
    if (!comparable) {
        return false;
    }
    switch (term.op) {
        case FilterTerm::Op::LT: return *value < term.literal;
        case FilterTerm::Op::LE: return *value <= term.literal;
        case FilterTerm::Op::GT: return *value > term.literal;
        case FilterTerm::Op::GE: return *value >= term.literal;
        default: return false;
    }
}

} // namespace jsonkeyspace

#include "jsonkeyspace/json_modifier.h"
#include <algorithm>
#include <climits>
#include <cmath>

namespace jsonkeyspace {

// Decoded reference tokens of a location, root first.
static std::vector<std::string> tokens_of(Location location) {
    std::vector<std::string> tokens;
    while (!location.empty()) {
        tokens.push_back(location.back());
        location.pop_back();
    }
    std::reverse(tokens.begin(), tokens.end());
    return tokens;
}

static bool is_array_token(const std::string& token) {
    return !token.empty() && std::all_of(token.begin(), token.end(), [](char c) { return c >= '0' && c <= '9'; });
}

// Document order comparison, array indices compared numerically.
static int compare_tokens(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
        if (a[i] == b[i]) continue;
        if (is_array_token(a[i]) && is_array_token(b[i])) {
            return std::stoull(a[i]) < std::stoull(b[i]) ? -1 : 1;
        }
        return a[i] < b[i] ? -1 : 1;
    }
    if (a.size() == b.size()) return 0;
    return a.size() < b.size() ? -1 : 1;
}

static bool is_strict_prefix(const std::vector<std::string>& prefix, const std::vector<std::string>& tokens) {
    return prefix.size() < tokens.size() && std::equal(prefix.begin(), prefix.end(), tokens.begin());
}

static bool as_int64(const json& value, long long& out) {
    if (!value.is_number_integer()) return false;
    if (value.is_number_unsigned() &&
        value.get<unsigned long long>() > static_cast<unsigned long long>(LLONG_MAX)) {
        return false;
    }
    out = value.get<long long>();
    return true;
}

static bool checked_pow(long long base, long long exp, long long& out) {
    long long result = 1;
    while (exp > 0) {
        if ((exp & 1) && __builtin_mul_overflow(result, base, &result)) return false;
        exp >>= 1;
        if (exp > 0 && __builtin_mul_overflow(base, base, &base)) return false;
    }
    out = result;
    return true;
}

// Numbers of different kinds (integer vs floating point) never match.
static bool strictly_equal(const json& a, const json& b) {
    if (a.is_number() && b.is_number() && a.is_number_float() != b.is_number_float()) {
        return false;
    }
    return a == b;
}

json* JSONModifier::navigate(json& document, const Location& location) const {
    if (!document.contains(location)) {
        return nullptr;
    }
    return &document.at(location);
}

const json* JSONModifier::get(const json& document, const Location& location) const {
    if (!document.contains(location)) {
        return nullptr;
    }
    return &document.at(location);
}

bool JSONModifier::exists(const json& document, const Location& location) const {
    return document.contains(location);
}

Outcome JSONModifier::set_value(json& document, const Location& location, const json& value) const {
    json* target = navigate(document, location);
    if (!target) {
        return Outcome::unchanged(UnchangedReason::PATH_NOT_FOUND);
    }
    *target = value;
    return Outcome::changed(value);
}

Outcome JSONModifier::add_member(json& document, const Location& parent, const std::string& key,
                                 const json& value) const {
    json* target = navigate(document, parent);
    if (!target) {
        return Outcome::unchanged(UnchangedReason::PATH_NOT_FOUND);
    }
    if (!target->is_object()) {
        return Outcome::unchanged(UnchangedReason::TYPE_MISMATCH);
    }
    if (target->contains(key)) {
        return Outcome::unchanged(UnchangedReason::NO_OP_VALUE);
    }
    (*target)[key] = value;
    return Outcome::changed(value);
}

Outcome JSONModifier::del(json& document, const Location& location) const {
    if (location.empty()) {
        throw InvalidPathException("the document root cannot be removed from inside the document");
    }
    json* parent = navigate(document, location.parent_pointer());
    if (!parent) {
        return Outcome::unchanged(UnchangedReason::PATH_NOT_FOUND);
    }
    const std::string& last = location.back();
    if (parent->is_object()) {
        if (parent->erase(last) == 0) {
            return Outcome::unchanged(UnchangedReason::PATH_NOT_FOUND);
        }
        return Outcome::changed(1);
    }
    if (parent->is_array() && is_array_token(last)) {
        size_t idx = std::stoull(last);
        if (idx >= parent->size()) {
            return Outcome::unchanged(UnchangedReason::INDEX_OUT_OF_RANGE);
        }
        parent->erase(idx);
        return Outcome::changed(1);
    }
    return Outcome::unchanged(UnchangedReason::PATH_NOT_FOUND);
}

std::vector<Outcome> JSONModifier::del_all(json& document, std::vector<Location> locations) const {
    std::vector<std::vector<std::string>> tokens;
    tokens.reserve(locations.size());
    for (const auto& location : locations) {
        tokens.push_back(tokens_of(location));
    }
    std::sort(tokens.begin(), tokens.end(),
              [](const auto& a, const auto& b) { return compare_tokens(a, b) > 0; });
    tokens.erase(std::unique(tokens.begin(), tokens.end()), tokens.end());

    std::vector<Outcome> outcomes;
    for (const auto& candidate : tokens) {
        bool covered = std::any_of(tokens.begin(), tokens.end(), [&candidate](const auto& other) {
            return is_strict_prefix(other, candidate);
        });
        if (covered) {
            outcomes.push_back(Outcome::unchanged(UnchangedReason::NO_OP_VALUE));
            continue;
        }
        Location location;
        for (const auto& token : candidate) {
            location.push_back(token);
        }
        outcomes.push_back(del(document, location));
    }
    return outcomes;
}

Outcome JSONModifier::str_append(json& document, const Location& location, const std::string& suffix) const {
    json* target = navigate(document, location);
    if (!target) {
        return Outcome::unchanged(UnchangedReason::PATH_NOT_FOUND);
    }
    if (!target->is_string()) {
        return Outcome::unchanged(UnchangedReason::TYPE_MISMATCH);
    }
    target->get_ref<std::string&>() += suffix;
    return Outcome::changed(target->get_ref<const std::string&>().size());
}

Outcome JSONModifier::array_append(json& document, const Location& location, const std::vector<json>& values) const {
    json* target = navigate(document, location);
    if (!target) {
        return Outcome::unchanged(UnchangedReason::PATH_NOT_FOUND);
    }
    if (!target->is_array()) {
        return Outcome::unchanged(UnchangedReason::TYPE_MISMATCH);
    }
    for (const auto& value : values) {
        target->push_back(value);
    }
    return Outcome::changed(target->size());
}

Outcome JSONModifier::array_insert(json& document, const Location& location, long long index,
                                   const std::vector<json>& values) const {
    json* target = navigate(document, location);
    if (!target) {
        return Outcome::unchanged(UnchangedReason::PATH_NOT_FOUND);
    }
    if (!target->is_array()) {
        return Outcome::unchanged(UnchangedReason::TYPE_MISMATCH);
    }
    long long len = static_cast<long long>(target->size());
    long long actual_index = index < 0 ? len + index : index;
    if (actual_index < 0 || actual_index > len) {
        return Outcome::unchanged(UnchangedReason::INDEX_OUT_OF_RANGE);
    }
    for (size_t i = 0; i < values.size(); ++i) {
        target->insert(target->begin() + actual_index + static_cast<long long>(i), values[i]);
    }
    return Outcome::changed(target->size());
}

Outcome JSONModifier::array_pop(json& document, const Location& location, std::optional<long long> index) const {
    json* target = navigate(document, location);
    if (!target) {
        return Outcome::unchanged(UnchangedReason::PATH_NOT_FOUND);
    }
    if (!target->is_array()) {
        return Outcome::unchanged(UnchangedReason::TYPE_MISMATCH);
    }
    if (target->empty()) {
        return Outcome::unchanged(UnchangedReason::INDEX_OUT_OF_RANGE);
    }
    long long len = static_cast<long long>(target->size());
    long long actual_index = index.value_or(-1);
    if (actual_index < 0) {
        actual_index += len;
    }
    if (actual_index < 0 || actual_index >= len) {
        return Outcome::unchanged(UnchangedReason::INDEX_OUT_OF_RANGE);
    }
    json popped = (*target)[static_cast<size_t>(actual_index)];
    target->erase(static_cast<size_t>(actual_index));
    return Outcome::changed(std::move(popped));
}

Outcome JSONModifier::array_trim(json& document, const Location& location, long long start, long long stop) const {
    json* target = navigate(document, location);
    if (!target) {
        return Outcome::unchanged(UnchangedReason::PATH_NOT_FOUND);
    }
    if (!target->is_array()) {
        return Outcome::unchanged(UnchangedReason::TYPE_MISMATCH);
    }
    long long len = static_cast<long long>(target->size());
    if (len == 0) {
        return Outcome::changed(0);
    }
    if (start < 0) {
        start = std::max(0LL, len + start);
    }
    if (stop < 0) {
        stop = len + stop;
    } else {
        stop = std::min(stop, len - 1);
    }

    json trimmed = json::array();
    if (start < len && start <= stop) {
        for (long long i = start; i <= stop; ++i) {
            trimmed.push_back(std::move((*target)[static_cast<size_t>(i)]));
        }
    }
    *target = std::move(trimmed);
    return Outcome::changed(target->size());
}

std::optional<json> JSONModifier::numeric_result(const json& document, const Location& location,
                                                 NumericOp op, const json& operand) const {
    const json* target = get(document, location);
    if (!target || !target->is_number()) {
        return std::nullopt;
    }
    if (!operand.is_number()) {
        throw InvalidArgumentException("expected a number but found " + type_name_of(operand));
    }

    long long lhs = 0;
    long long rhs = 0;
    if (as_int64(*target, lhs) && as_int64(operand, rhs)) {
        long long result = 0;
        bool fits = false;
        switch (op) {
            case NumericOp::INCR: fits = !__builtin_add_overflow(lhs, rhs, &result); break;
            case NumericOp::MULT: fits = !__builtin_mul_overflow(lhs, rhs, &result); break;
            case NumericOp::POW: fits = rhs >= 0 && checked_pow(lhs, rhs, result); break;
        }
        if (fits) {
            return json(result);
        }
    }

    double a = target->get<double>();
    double b = operand.get<double>();
    double result = 0.0;
    switch (op) {
        case NumericOp::INCR: result = a + b; break;
        case NumericOp::MULT: result = a * b; break;
        case NumericOp::POW: result = std::pow(a, b); break;
    }
    if (!std::isfinite(result)) {
        throw NumericOverflowException("result at '" + location.to_string() + "' is not a finite number");
    }
    return json(result);
}

Outcome JSONModifier::toggle(json& document, const Location& location) const {
    json* target = navigate(document, location);
    if (!target) {
        return Outcome::unchanged(UnchangedReason::PATH_NOT_FOUND);
    }
    if (!target->is_boolean()) {
        return Outcome::unchanged(UnchangedReason::TYPE_MISMATCH);
    }
    *target = !target->get<bool>();
    return Outcome::changed(*target);
}

Outcome JSONModifier::clear(json& document, const Location& location) const {
    json* target = navigate(document, location);
    if (!target) {
        return Outcome::unchanged(UnchangedReason::PATH_NOT_FOUND);
    }
    if (target->is_object() || target->is_array()) {
        target->clear();
    } else if (target->is_number()) {
        *target = 0;
    } else {
        return Outcome::unchanged(UnchangedReason::TYPE_MISMATCH);
    }
    return Outcome::changed(*target);
}

std::optional<size_t> JSONModifier::string_length(const json& document, const Location& location) const {
    const json* target = get(document, location);
    if (!target || !target->is_string()) return std::nullopt;
    return target->get_ref<const std::string&>().size();
}

std::optional<std::vector<std::string>> JSONModifier::object_keys(const json& document,
                                                                  const Location& location) const {
    const json* target = get(document, location);
    if (!target || !target->is_object()) return std::nullopt;
    std::vector<std::string> keys;
    for (auto it = target->begin(); it != target->end(); ++it) {
        keys.push_back(it.key());
    }
    return keys;
}

std::optional<size_t> JSONModifier::object_length(const json& document, const Location& location) const {
    const json* target = get(document, location);
    if (!target || !target->is_object()) return std::nullopt;
    return target->size();
}

std::optional<size_t> JSONModifier::array_length(const json& document, const Location& location) const {
    const json* target = get(document, location);
    if (!target || !target->is_array()) return std::nullopt;
    return target->size();
}

std::optional<long long> JSONModifier::array_index(const json& document, const Location& location,
                                                   const json& scalar, long long start, long long stop) const {
    const json* target = get(document, location);
    if (!target || !target->is_array()) return std::nullopt;

    long long len = static_cast<long long>(target->size());
    if (start < 0) {
        start = std::max(0LL, len + start);
    }
    if (stop == 0) {
        stop = len;
    } else if (stop < 0) {
        stop = len + stop;
    }
    stop = std::min(stop, len);

    for (long long i = start; i < stop; ++i) {
        if (strictly_equal((*target)[static_cast<size_t>(i)], scalar)) {
            return i;
        }
    }
    return -1;
}

std::optional<std::string> JSONModifier::type_name(const json& document, const Location& location) const {
    const json* target = get(document, location);
    if (!target) return std::nullopt;
    return type_name_of(*target);
}

std::string JSONModifier::type_name_of(const json& value) {
    switch (value.type()) {
        case json::value_t::null: return "null";
        case json::value_t::boolean: return "boolean";
        case json::value_t::number_integer:
        case json::value_t::number_unsigned: return "integer";
        case json::value_t::number_float: return "number";
        case json::value_t::string: return "string";
        case json::value_t::array: return "array";
        case json::value_t::object: return "object";
        default: return value.type_name();
    }
}

} // namespace jsonkeyspace

#pragma once

#include "common_types.h"
#include "exceptions.h"   // For custom exceptions
#include "outcome.h"
#include "path_evaluator.h" // For Location
#include <optional>
#include <string>
#include <vector>

namespace jsonkeyspace {

enum class NumericOp {
    INCR, // NUMINCRBY
    MULT, // NUMMULTBY
    POW   // NUMPOWBY
};

// Applies one command family to one Location of a document.
// Locations that are missing or hold the wrong type yield Outcome::unchanged;
// only malformed arguments throw.
class JSONModifier {
public:
    // Basic Operations
    const json* get(const json& document, const Location& location) const;
    bool exists(const json& document, const Location& location) const;

    /**
     * Replaces the value at an existing location. Always Changed, even when
     * the new value equals the old one.
     */
    Outcome set_value(json& document, const Location& location, const json& value) const;

    /**
     * Adds `key` to the object at `parent`.
     * Unchanged when the parent is missing, is not an object or already has the key.
     */
    Outcome add_member(json& document, const Location& parent, const std::string& key, const json& value) const;

    /**
     * Removes the value at the location from its parent container.
     * Throws InvalidPathException for the root location, which only the keyspace can delete.
     */
    Outcome del(json& document, const Location& location) const;

    // Deletes every location, skipping ones whose ancestor is also being deleted.
    // Array siblings are removed from the highest index down so the rest stay valid.
    std::vector<Outcome> del_all(json& document, std::vector<Location> locations) const;

    // String Operations
    Outcome str_append(json& document, const Location& location, const std::string& suffix) const;

    // Array Operations
    Outcome array_append(json& document, const Location& location, const std::vector<json>& values) const;
    // index may be negative; valid range is [-len, len]
    Outcome array_insert(json& document, const Location& location, long long index,
                         const std::vector<json>& values) const;
    // Pops the last element when index is not given
    Outcome array_pop(json& document, const Location& location, std::optional<long long> index) const;
    Outcome array_trim(json& document, const Location& location, long long start, long long stop) const;

    // Numeric Operations
    /**
     * Computes `target op operand` without writing it.
     * Integer arithmetic is kept while it fits in 64 bits and falls back to double otherwise.
     * Returns nullopt when the target is missing or not a number.
     * Throws NumericOverflowException when the result is not finite.
     */
    std::optional<json> numeric_result(const json& document, const Location& location,
                                       NumericOp op, const json& operand) const;

    Outcome toggle(json& document, const Location& location) const;
    // Empties objects and arrays, sets numbers to 0
    Outcome clear(json& document, const Location& location) const;

    // Read-only queries, nullopt when missing or of another type
    std::optional<size_t> string_length(const json& document, const Location& location) const;
    std::optional<std::vector<std::string>> object_keys(const json& document, const Location& location) const;
    std::optional<size_t> object_length(const json& document, const Location& location) const;
    std::optional<size_t> array_length(const json& document, const Location& location) const;
    std::optional<long long> array_index(const json& document, const Location& location, const json& scalar,
                                         long long start, long long stop) const;
    std::optional<std::string> type_name(const json& document, const Location& location) const;

    static std::string type_name_of(const json& value);

private:
    json* navigate(json& document, const Location& location) const;
};

} // namespace jsonkeyspace

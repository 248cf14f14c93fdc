#pragma once

#include "common_types.h"
#include "exceptions.h"
#include <string>
#include <utility>
#include <vector>

namespace jsonkeyspace {

enum class UnchangedReason {
    PATH_NOT_FOUND,
    TYPE_MISMATCH,
    INDEX_OUT_OF_RANGE,
    NO_OP_VALUE
};

// Result of one mutation operation at one Location.
class Outcome {
public:
    static Outcome changed(json value) { return Outcome(true, std::move(value), UnchangedReason::NO_OP_VALUE); }
    static Outcome unchanged(UnchangedReason reason) { return Outcome(false, json(), reason); }

    bool is_changed() const { return changed_; }
    // Operation specific: new length, popped element, resulting number...
    const json& value() const { return value_; }
    UnchangedReason reason() const { return reason_; }

private:
    Outcome(bool changed, json value, UnchangedReason reason)
        : changed_(changed), value_(std::move(value)), reason_(reason) {}

    bool changed_;
    json value_;
    UnchangedReason reason_;
};

// Per-command classification that decides whether a change event is emitted.
class AggregateResult {
public:
    enum class Kind { NO_MATCH, APPLIED, ERROR };

    static AggregateResult no_match() { return AggregateResult(Kind::NO_MATCH, 0, ErrorCode::SUCCESS, ""); }
    static AggregateResult applied(size_t count);
    static AggregateResult error(ErrorCode code, std::string message) {
        return AggregateResult(Kind::ERROR, 0, code, std::move(message));
    }

    Kind kind() const { return kind_; }
    bool is_applied() const { return kind_ == Kind::APPLIED; }
    bool is_no_match() const { return kind_ == Kind::NO_MATCH; }
    bool is_error() const { return kind_ == Kind::ERROR; }

    size_t count() const { return count_; } // Changed Locations, 0 unless APPLIED
    ErrorCode error_code() const { return error_code_; }
    const std::string& message() const { return message_; }

private:
    AggregateResult(Kind kind, size_t count, ErrorCode code, std::string message)
        : kind_(kind), count_(count), error_code_(code), message_(std::move(message)) {}

    Kind kind_;
    size_t count_;
    ErrorCode error_code_;
    std::string message_;
};

class CommandOutcomeAggregator {
public:
    // No outcomes, or only Unchanged ones, is NO_MATCH. Otherwise APPLIED with the Changed count.
    static AggregateResult aggregate(const std::vector<Outcome>& outcomes);

    // Value carried by the last Changed outcome, nullptr if nothing changed.
    static const json* last_changed_value(const std::vector<Outcome>& outcomes);
};

std::string to_string(AggregateResult::Kind kind);

} // namespace jsonkeyspace

#include "jsonkeyspace/outcome.h"
#include <algorithm>

namespace jsonkeyspace {

AggregateResult AggregateResult::applied(size_t count) {
    if (count == 0) {
        throw InvalidArgumentException("an applied result needs at least one changed location");
    }
    return AggregateResult(Kind::APPLIED, count, ErrorCode::SUCCESS, "");
}

AggregateResult CommandOutcomeAggregator::aggregate(const std::vector<Outcome>& outcomes) {
    size_t changed = static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(),
                                                       [](const Outcome& o) { return o.is_changed(); }));
    if (changed == 0) {
        return AggregateResult::no_match();
    }
    return AggregateResult::applied(changed);
}

const json* CommandOutcomeAggregator::last_changed_value(const std::vector<Outcome>& outcomes) {
    auto it = std::find_if(outcomes.rbegin(), outcomes.rend(), [](const Outcome& o) { return o.is_changed(); });
    return it == outcomes.rend() ? nullptr : &it->value();
}

std::string to_string(AggregateResult::Kind kind) {
    switch (kind) {
        case AggregateResult::Kind::NO_MATCH: return "NoMatch";
        case AggregateResult::Kind::APPLIED: return "Applied";
        case AggregateResult::Kind::ERROR: return "Error";
    }
    return "Unknown";
}

} // namespace jsonkeyspace

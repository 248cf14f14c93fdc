#pragma once

#include "common_types.h"
#include "event_bus.h"
#include "outcome.h"
#include <string>

namespace jsonkeyspace {

// Turns a command's aggregate result into at most one publish_change call.
// Holds no per-command state and never throws: bus failures are logged and dropped.
class NotificationDispatcher {
public:
    explicit NotificationDispatcher(EventBus& bus, const KeyspaceConfig& config = KeyspaceConfig());

    // Returns true when an event was handed to the bus.
    bool dispatch(const AggregateResult& result, const std::string& event_name, const std::string& key);

    void set_enabled(bool enabled) { enabled_ = enabled; }
    bool is_enabled() const { return enabled_; }

private:
    EventBus& bus_;
    bool enabled_;
};

} // namespace jsonkeyspace

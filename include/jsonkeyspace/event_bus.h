#pragma once

#include "common_types.h"
#include <string>
#include <vector>
#include <functional>
#include <map>
#include <mutex>

namespace jsonkeyspace {

// The store's notification sink. Called at most once per mutating command.
// Fanning an event out to subscribers (for Redis: one message on the key's
// channel and one on the event's channel) is the implementation's business.
class EventBus {
public:
    virtual ~EventBus() = default;
    virtual void publish_change(const std::string& event_name, const std::string& key) = 0;
};

// In-process bus delivering change events to registered callbacks.
class LocalEventBus : public EventBus {
public:
    using ChangeCallback = std::function<void(const std::string& event_name, const std::string& key)>;

    LocalEventBus();

    // Registers a callback for one event name, or for every event when event_name is empty.
    // Returns a handle for off_change(), 0 if the callback is empty.
    size_t on_change(const std::string& event_name, ChangeCallback callback);
    size_t on_any_change(ChangeCallback callback) { return on_change("", std::move(callback)); }

    void off_change(size_t callback_handle);

    void publish_change(const std::string& event_name, const std::string& key) override;

    // Enables or disables delivery globally.
    void enable_events(bool enabled);
    bool are_events_enabled() const;

    size_t published_count() const;

private:
    struct CallbackInfo {
        size_t id;
        ChangeCallback callback;
    };

    std::map<std::string, std::vector<CallbackInfo>> _listeners;
    mutable std::mutex _mutex;
    bool _events_enabled = true;
    size_t _next_callback_id = 1;
    size_t _published = 0;
};

} // namespace jsonkeyspace

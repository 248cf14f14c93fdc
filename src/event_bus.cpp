#include "jsonkeyspace/event_bus.h"
#include <algorithm> // For std::remove_if
#include <glog/logging.h>

namespace jsonkeyspace {

LocalEventBus::LocalEventBus() : _events_enabled(true), _next_callback_id(1) {}

size_t LocalEventBus::on_change(const std::string& event_name, ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!callback) {
        return 0;
    }
    size_t id = _next_callback_id++;
    _listeners[event_name].push_back({id, std::move(callback)});
    return id;
}

void LocalEventBus::off_change(size_t callback_handle) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (callback_handle == 0) return; // Invalid handle

    for (auto it = _listeners.begin(); it != _listeners.end();) {
        auto& callbacks = it->second;
        callbacks.erase(
            std::remove_if(callbacks.begin(), callbacks.end(),
                           [callback_handle](const CallbackInfo& info) {
                               return info.id == callback_handle;
                           }),
            callbacks.end());
        if (callbacks.empty()) {
            it = _listeners.erase(it);
        } else {
            ++it;
        }
    }
}

void LocalEventBus::publish_change(const std::string& event_name, const std::string& key) {
    // Callbacks run on a copy, without the lock, so they may (un)register themselves.
    std::vector<CallbackInfo> current_listeners;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_events_enabled) {
            return;
        }
        ++_published;
        auto named = _listeners.find(event_name);
        if (named != _listeners.end()) {
            current_listeners = named->second;
        }
        if (!event_name.empty()) {
            auto any = _listeners.find("");
            if (any != _listeners.end()) {
                current_listeners.insert(current_listeners.end(), any->second.begin(), any->second.end());
            }
        }
    }

    for (const auto& listener_info : current_listeners) {
        try {
            listener_info.callback(event_name, key);
        } catch (const std::exception& e) {
            LOG(ERROR) << "Exception in change callback " << listener_info.id << " for " << event_name
                       << " on key '" << key << "': " << e.what();
        }
    }
}

void LocalEventBus::enable_events(bool enabled) {
    std::lock_guard<std::mutex> lock(_mutex);
    _events_enabled = enabled;
}

bool LocalEventBus::are_events_enabled() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _events_enabled;
}

size_t LocalEventBus::published_count() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _published;
}

} // namespace jsonkeyspace

#include "jsonkeyspace/notification_dispatcher.h"
#include <glog/logging.h>

namespace jsonkeyspace {

NotificationDispatcher::NotificationDispatcher(EventBus& bus, const KeyspaceConfig& config)
    : bus_(bus), enabled_(config.notifications_enabled) {}

bool NotificationDispatcher::dispatch(const AggregateResult& result, const std::string& event_name,
                                      const std::string& key) {
    if (!result.is_applied() || !enabled_) {
        return false;
    }
    try {
        bus_.publish_change(event_name, key);
    } catch (const std::exception& e) {
        LOG(ERROR) << "Event bus rejected " << event_name << " for key '" << key << "': " << e.what();
        return false;
    }
    VLOG(1) << "Emitted " << event_name << " for key '" << key << "' (" << result.count() << " changed)";
    return true;
}

} // namespace jsonkeyspace

#include <beacon/core/timestamp.h>
#include <beacon/registry/heartbeat_scheduler.h>

#include <spdlog/spdlog.h>

namespace beacon::registry {

HeartbeatScheduler::HeartbeatScheduler(RegistryStore& store, InstanceProfile profile,
                                       std::chrono::milliseconds interval, ClockFn clock)
    : store_(store), profile_(std::move(profile)), interval_(interval), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return Clock::now(); };
    }
}

InstanceEntry HeartbeatScheduler::makeEntry() const {
    InstanceEntry e;
    e.identity = profile_.identity;
    e.displayName = profile_.displayName;
    e.channelId = profile_.channelId;
    e.legacyPort = profile_.legacyPort;
    e.processId = profile_.processId;
    e.versionTag = profile_.versionTag;
    e.lastSeen = Timestamp::nowString();
    e.active = true;
    return e;
}

bool HeartbeatScheduler::registerOrUpdate() {
    try {
        auto guard = store_.lock();
        auto entries = store_.load();
        auto entry = makeEntry();

        if (auto it = RegistryStore::find(entries, profile_.identity); it != entries.end()) {
            *it = entry;
        } else {
            entries.push_back(entry);
        }

        if (auto saved = store_.save(entries); !saved) {
            spdlog::warn("[HeartbeatScheduler] Failed to register '{}': {}", profile_.identity,
                         saved.error().message);
            return false;
        }
        current_ = std::move(entry);
        spdlog::info("[HeartbeatScheduler] Registered instance: {} (channel: {})",
                     current_->displayName, current_->channelId);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("[HeartbeatScheduler] Failed to register instance: {}", e.what());
        return false;
    }
}

bool HeartbeatScheduler::refreshHeartbeat() {
    try {
        auto guard = store_.lock();
        auto entries = store_.load();
        auto it = RegistryStore::find(entries, profile_.identity);
        if (it == entries.end()) {
            spdlog::info("[HeartbeatScheduler] Entry for '{}' missing, re-registering",
                         profile_.identity);
            return registerOrUpdate();
        }

        it->lastSeen = Timestamp::nowString();
        it->active = true;
        it->legacyPort = profile_.legacyPort;

        if (auto saved = store_.save(entries); !saved) {
            spdlog::warn("[HeartbeatScheduler] Failed to update heartbeat: {}",
                         saved.error().message);
            return false;
        }
        current_ = *it;
        ++heartbeats_;
        spdlog::debug("[HeartbeatScheduler] Heartbeat #{} for {}", heartbeats_, it->displayName);
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("[HeartbeatScheduler] Failed to update heartbeat: {}", e.what());
        return false;
    }
}

bool HeartbeatScheduler::deactivate() {
    try {
        auto guard = store_.lock();
        auto entries = store_.load();
        auto it = RegistryStore::find(entries, profile_.identity);
        if (it == entries.end()) {
            spdlog::debug("[HeartbeatScheduler] Nothing to deactivate for '{}'",
                          profile_.identity);
            return false;
        }

        it->active = false;
        it->lastSeen = Timestamp::nowString();

        if (auto saved = store_.save(entries); !saved) {
            spdlog::warn("[HeartbeatScheduler] Failed to unregister instance: {}",
                         saved.error().message);
            return false;
        }
        current_ = *it;
        spdlog::info("[HeartbeatScheduler] Unregistered instance: {}", it->displayName);
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("[HeartbeatScheduler] Failed to unregister instance: {}", e.what());
        return false;
    }
}

bool HeartbeatScheduler::onTransientSuspend() {
    try {
        auto guard = store_.lock();
        auto entries = store_.load();
        auto it = RegistryStore::find(entries, profile_.identity);
        if (it == entries.end()) {
            return false;
        }

        it->lastSeen = Timestamp::nowString();

        if (auto saved = store_.save(entries); !saved) {
            return false;
        }
        current_ = *it;
        spdlog::debug("[HeartbeatScheduler] Suspending {}, lastSeen refreshed", it->displayName);
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("[HeartbeatScheduler] Failed to record suspend: {}", e.what());
        return false;
    }
}

bool HeartbeatScheduler::onResume() {
    return registerOrUpdate();
}

bool HeartbeatScheduler::tick() {
    const auto now = clock_();
    if (lastTick_ && now - *lastTick_ < interval_) {
        return false;
    }
    lastTick_ = now;
    refreshHeartbeat();
    return true;
}

} // namespace beacon::registry

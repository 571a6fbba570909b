#pragma once

#include <beacon/registry/instance_entry.h>
#include <beacon/registry/registry_store.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace beacon::registry {

// Static description of the owning instance, written into its registry row
struct InstanceProfile {
    std::string identity;
    std::string displayName;
    std::string channelId;
    std::optional<int> legacyPort;
    int processId = 0;
    std::string versionTag;
};

/**
 * @class HeartbeatScheduler
 * @brief Keeps the owning instance's registry row alive.
 *
 * Every operation does a full load/mutate/save against the RegistryStore and never
 * throws; faults are logged and the operation becomes a no-op. The scheduler is not
 * thread-safe and is meant to be driven from the host's event loop.
 *
 * tick() is rate limited on a monotonic clock so that a caller may invoke it as often
 * as it likes (for example every loop iteration) without rewriting the file more than
 * once per interval.
 */
class HeartbeatScheduler {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    static constexpr std::chrono::milliseconds kDefaultInterval{5000};

    HeartbeatScheduler(RegistryStore& store, InstanceProfile profile,
                       std::chrono::milliseconds interval = kDefaultInterval,
                       ClockFn clock = {});

    // Insert or overwrite this instance's row with active=true. Idempotent.
    bool registerOrUpdate();

    // Refresh lastSeen and force active=true; re-registers if the row is gone.
    bool refreshHeartbeat();

    // Mark the row inactive. The row is kept for the eviction sweep.
    bool deactivate();

    // Refresh lastSeen before the process image is replaced in place; active is left as is.
    bool onTransientSuspend();

    // Counterpart of onTransientSuspend(); re-registers.
    bool onResume();

    // Runs refreshHeartbeat() when at least interval() elapsed since the last accepted tick.
    // Returns whether the heartbeat ran.
    bool tick();

    void setLegacyPort(std::optional<int> port) { profile_.legacyPort = port; }

    const InstanceProfile& profile() const noexcept { return profile_; }
    std::chrono::milliseconds interval() const noexcept { return interval_; }
    const std::optional<InstanceEntry>& currentEntry() const noexcept { return current_; }
    uint64_t heartbeatCount() const noexcept { return heartbeats_; }

private:
    InstanceEntry makeEntry() const;

    RegistryStore& store_;
    InstanceProfile profile_;
    std::chrono::milliseconds interval_;
    ClockFn clock_;
    std::optional<Clock::time_point> lastTick_;
    std::optional<InstanceEntry> current_;
    uint64_t heartbeats_{0};
};

} // namespace beacon::registry

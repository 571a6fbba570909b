#pragma once

#include <beacon/core/types.h>
#include <beacon/registry/instance_entry.h>
#include <beacon/registry/registry_store.h>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace beacon::registry {

/**
 * @class DiscoveryQuery
 * @brief Read-side helpers over the shared registry, plus the stale-entry sweep.
 *
 * `selfIdentity` is the identity of the calling process. It is never evicted; pass an
 * empty string from processes that do not own a row.
 */
class DiscoveryQuery {
public:
    using WallClockFn = std::function<TimePoint()>;

    static constexpr int kDefaultActiveThresholdSeconds = 30;
    static constexpr int kDefaultEvictThresholdSeconds = 300;

    explicit DiscoveryQuery(const RegistryStore& store, std::string selfIdentity = {},
                            WallClockFn clock = {});

    std::vector<InstanceEntry> listAll() const;

    // active && (now - lastSeen) < threshold; unparsable timestamps are excluded
    std::vector<InstanceEntry>
    listActive(int staleThresholdSeconds = kDefaultActiveThresholdSeconds) const;

    // Removes inactive entries older than the threshold, except our own.
    // Unparsable timestamps are kept. Returns the number of removed rows.
    size_t evictStale(int staleThresholdSeconds = kDefaultEvictThresholdSeconds) const;

    // Exact identity first, then case-insensitive display name
    std::optional<InstanceEntry> findByIdentityOrName(std::string_view key) const;

    // Age of an entry relative to now, or nullopt when lastSeen does not parse
    std::optional<std::chrono::duration<double>> ageOf(const InstanceEntry& entry) const;

private:
    const RegistryStore& store_;
    std::string self_;
    WallClockFn clock_;
};

} // namespace beacon::registry

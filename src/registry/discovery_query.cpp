#include <beacon/core/timestamp.h>
#include <beacon/registry/discovery_query.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace beacon::registry {

namespace {
bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}
} // namespace

DiscoveryQuery::DiscoveryQuery(const RegistryStore& store, std::string selfIdentity,
                               WallClockFn clock)
    : store_(store), self_(std::move(selfIdentity)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

std::vector<InstanceEntry> DiscoveryQuery::listAll() const {
    return store_.load();
}

std::optional<std::chrono::duration<double>>
DiscoveryQuery::ageOf(const InstanceEntry& entry) const {
    auto seen = Timestamp::parse(entry.lastSeen);
    if (!seen) {
        return std::nullopt;
    }
    return std::chrono::duration<double>(clock_() - *seen);
}

std::vector<InstanceEntry> DiscoveryQuery::listActive(int staleThresholdSeconds) const {
    auto entries = store_.load();
    const std::chrono::duration<double> threshold(staleThresholdSeconds);

    std::vector<InstanceEntry> active;
    for (auto& e : entries) {
        if (!e.active) {
            continue;
        }
        auto age = ageOf(e);
        if (!age) {
            spdlog::debug("[DiscoveryQuery] Unparsable lastSeen '{}' for {}, treating as stale",
                          e.lastSeen, e.identity);
            continue;
        }
        if (*age < threshold) {
            active.push_back(std::move(e));
        }
    }
    return active;
}

size_t DiscoveryQuery::evictStale(int staleThresholdSeconds) const {
    try {
        auto guard = store_.lock();
        auto entries = store_.load();
        const std::chrono::duration<double> threshold(staleThresholdSeconds);
        const auto before = entries.size();

        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [&](const InstanceEntry& e) {
                                         if (e.identity == self_ || e.active) {
                                             return false;
                                         }
                                         auto age = ageOf(e);
                                         return age && *age > threshold;
                                     }),
                      entries.end());

        const auto removed = before - entries.size();
        if (removed == 0) {
            return 0;
        }
        if (auto saved = store_.save(entries); !saved) {
            spdlog::warn("[DiscoveryQuery] Failed to cleanup stale entries: {}",
                         saved.error().message);
            return 0;
        }
        spdlog::info("[DiscoveryQuery] Evicted {} stale registry entr{}", removed,
                     removed == 1 ? "y" : "ies");
        return removed;
    } catch (const std::exception& e) {
        spdlog::warn("[DiscoveryQuery] Failed to cleanup stale entries: {}", e.what());
        return 0;
    }
}

std::optional<InstanceEntry> DiscoveryQuery::findByIdentityOrName(std::string_view key) const {
    auto entries = store_.load();
    if (auto it = RegistryStore::find(entries, key); it != entries.end()) {
        return *it;
    }
    for (auto& e : entries) {
        if (iequals(e.displayName, key)) {
            return e;
        }
    }
    return std::nullopt;
}

} // namespace beacon::registry

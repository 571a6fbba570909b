#pragma once

#include <beacon/core/types.h>
#include <beacon/registry/instance_entry.h>

#include <filesystem>
#include <mutex>
#include <string_view>
#include <vector>

namespace beacon::registry {

/**
 * @class RegistryStore
 * @brief Shared, file-backed list of discoverable instances.
 *
 * The file is a JSON array of InstanceEntry objects shared by every instance on the
 * machine. There is no cross-process locking: callers do a full load, mutate, save
 * cycle and concurrent writers may lose an update (last save wins).
 *
 * Within one process, load() and save() are serialised and every save writes through its
 * own temporary file. Callers doing a load/mutate/save cycle hold lock() across the cycle
 * so that writers in the same process never drop each other's changes.
 *
 * Neither load() nor save() throws. Failures are logged; load() degrades to an empty
 * registry and save() reports the failure through its Result.
 */
class RegistryStore {
public:
    explicit RegistryStore(std::filesystem::path path);

    const std::filesystem::path& path() const noexcept { return path_; }

    std::vector<InstanceEntry> load() const;
    Result<void> save(const std::vector<InstanceEntry>& entries) const;

    // Held across a load/mutate/save cycle; re-entrant with load() and save()
    std::unique_lock<std::recursive_mutex> lock() const;

    static std::vector<InstanceEntry>::iterator find(std::vector<InstanceEntry>& entries,
                                                    std::string_view identity);
    static std::vector<InstanceEntry>::const_iterator
    find(const std::vector<InstanceEntry>& entries, std::string_view identity);

private:
    std::filesystem::path path_;
    mutable std::recursive_mutex mutex_;
};

} // namespace beacon::registry

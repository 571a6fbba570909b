#include <beacon/registry/registry_store.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <fstream>
#include <functional>
#include <thread>
#include <unistd.h>

namespace beacon::registry {

namespace {
std::atomic<uint64_t> g_tempCounter{0};

// <registry>.tmp-<pid>-<thread>-<n>, unique per save within and across processes
std::filesystem::path uniqueTempPath(const std::filesystem::path& target) {
    auto tempPath = target;
    tempPath += ".tmp-" + std::to_string(::getpid()) + "-" +
                std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id())) + "-" +
                std::to_string(g_tempCounter.fetch_add(1, std::memory_order_relaxed));
    return tempPath;
}
} // namespace

RegistryStore::RegistryStore(std::filesystem::path path) : path_(std::move(path)) {}

std::unique_lock<std::recursive_mutex> RegistryStore::lock() const {
    return std::unique_lock<std::recursive_mutex>(mutex_);
}

std::vector<InstanceEntry> RegistryStore::load() const {
    auto guard = lock();
    std::vector<InstanceEntry> entries;

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return entries;
    }

    std::ifstream ifs(path_);
    if (!ifs) {
        spdlog::warn("[RegistryStore] Failed to open registry '{}'", path_.string());
        return entries;
    }

    json j;
    try {
        ifs >> j;
    } catch (const json::exception& e) {
        spdlog::warn("[RegistryStore] Failed to parse registry '{}': {}", path_.string(),
                     e.what());
        return entries;
    }

    if (j.is_null()) {
        return entries;
    }
    if (!j.is_array()) {
        spdlog::warn("[RegistryStore] Registry '{}' is not a JSON array, ignoring contents",
                     path_.string());
        return entries;
    }

    entries.reserve(j.size());
    for (const auto& item : j) {
        auto entry = InstanceEntry::fromJson(item);
        if (!entry) {
            spdlog::warn("[RegistryStore] Skipping malformed registry entry: {}",
                         item.dump().substr(0, 200));
            continue;
        }
        // Collapse duplicates written by older or misbehaving writers; last one wins
        if (auto existing = find(entries, entry->identity); existing != entries.end()) {
            *existing = std::move(*entry);
        } else {
            entries.push_back(std::move(*entry));
        }
    }
    return entries;
}

Result<void> RegistryStore::save(const std::vector<InstanceEntry>& entries) const {
    auto guard = lock();
    try {
        std::error_code ec;
        if (path_.has_parent_path()) {
            std::filesystem::create_directories(path_.parent_path(), ec);
            if (ec) {
                spdlog::error("[RegistryStore] Failed to create registry folder '{}': {}",
                              path_.parent_path().string(), ec.message());
                return Error{ErrorCode::WriteError, "Failed to create registry folder: " +
                                                        ec.message()};
            }
        }

        json j = json::array();
        for (const auto& e : entries) {
            j.push_back(e.toJson());
        }

        const auto tempPath = uniqueTempPath(path_);

        std::ofstream ofs(tempPath, std::ios::trunc);
        if (!ofs) {
            spdlog::error("[RegistryStore] Failed to open '{}' for writing", tempPath.string());
            return Error{ErrorCode::WriteError, "Cannot open registry for writing"};
        }
        ofs << j.dump(2);
        ofs.close();
        if (!ofs) {
            std::filesystem::remove(tempPath, ec);
            spdlog::error("[RegistryStore] Failed to write registry '{}'", tempPath.string());
            return Error{ErrorCode::WriteError, "Failed to write registry"};
        }

        std::filesystem::rename(tempPath, path_, ec);
        if (ec) {
            std::error_code rmEc;
            std::filesystem::remove(tempPath, rmEc);
            spdlog::error("[RegistryStore] Failed to replace registry '{}': {}", path_.string(),
                          ec.message());
            return Error{ErrorCode::WriteError, "Failed to replace registry: " + ec.message()};
        }
        return Result<void>();
    } catch (const std::exception& e) {
        spdlog::error("[RegistryStore] Failed to save registry '{}': {}", path_.string(),
                      e.what());
        return Error{ErrorCode::WriteError, e.what()};
    }
}

std::vector<InstanceEntry>::iterator RegistryStore::find(std::vector<InstanceEntry>& entries,
                                                         std::string_view identity) {
    return std::find_if(entries.begin(), entries.end(),
                        [&](const InstanceEntry& e) { return e.identity == identity; });
}

std::vector<InstanceEntry>::const_iterator
RegistryStore::find(const std::vector<InstanceEntry>& entries, std::string_view identity) {
    return std::find_if(entries.begin(), entries.end(),
                        [&](const InstanceEntry& e) { return e.identity == identity; });
}

} // namespace beacon::registry

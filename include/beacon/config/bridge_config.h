#pragma once

#include <beacon/config/config_helpers.h>
#include <beacon/core/types.h>
#include <beacon/registry/heartbeat_scheduler.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace beacon::config {

inline constexpr int kDefaultLegacyPort = 7890;
inline constexpr const char* kDefaultChannelPrefix = "unityvision";

// ~/.unityvision/projects.json, shared with other bridge implementations on the machine
std::filesystem::path default_registry_path();

struct BridgeConfig {
    // [bridge]
    std::string identity;
    std::string displayName;
    std::string channelPrefix = kDefaultChannelPrefix;
    std::string channelId;
    std::optional<int> legacyPort = kDefaultLegacyPort;
    std::string versionTag;

    // [registry]
    std::filesystem::path registryPath;
    std::chrono::milliseconds heartbeatInterval{5000};
    int activeThresholdSeconds = 30;
    int evictThresholdSeconds = 300;
    bool evictOnStart = true;

    // [logging]
    std::string logLevel = "info";
    std::string logFile;

    // [workers]
    size_t workerThreads = 2;

    // Fill identity-derived fields that are still empty
    void finalize();

    registry::InstanceProfile toProfile() const;
};

// Overlay [bridge]/[registry]/[logging]/[workers] values. Bad numbers are logged and skipped.
void apply_config_map(BridgeConfig& cfg, const ConfigMap& map);

// BEACON_REGISTRY_PATH, BEACON_IDENTITY, BEACON_LOG_LEVEL
void apply_environment(BridgeConfig& cfg);

/**
 * @brief Defaults, then the config file, then the environment.
 *
 * A missing config file is fine unless it was named explicitly through `override_path`.
 * CLI flags are applied by the caller afterwards, followed by finalize().
 */
Result<BridgeConfig> load_bridge_config(const std::string& override_path = "");

} // namespace beacon::config

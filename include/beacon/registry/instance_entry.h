#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace beacon::registry {

using json = nlohmann::json;

// Wire keys of the shared registry file
namespace wire {
constexpr const char* kIdentity = "projectPath";
constexpr const char* kDisplayName = "projectName";
constexpr const char* kChannelId = "pipeName";
constexpr const char* kLegacyPort = "port";
constexpr const char* kProcessId = "pid";
constexpr const char* kVersionTag = "unityVersion";
constexpr const char* kLastSeen = "lastSeen";
constexpr const char* kActive = "isActive";
} // namespace wire

/**
 * @brief One row of the discovery registry
 *
 * `identity` is the key. `lastSeen` is kept as the raw ISO 8601 text so that
 * entries written by other processes survive a load/save cycle unchanged even
 * when their timestamp cannot be parsed.
 */
struct InstanceEntry {
    std::string identity;
    std::string displayName;
    std::string channelId;
    std::optional<int> legacyPort;
    int processId = 0;
    std::string versionTag;
    std::string lastSeen;
    bool active = true;

    json toJson() const;

    // Returns nullopt when the element is not an object or has no string identity
    static std::optional<InstanceEntry> fromJson(const json& j);
};

// Human label for an identity: the last path component, or "Unknown Project"
std::string deriveDisplayName(std::string_view identity);

// "<prefix>-<first 8 hex chars of MD5(identity)>", matching the host bridge pipe names
std::string deriveChannelId(std::string_view identity, std::string_view prefix = "unityvision");

} // namespace beacon::registry

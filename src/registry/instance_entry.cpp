#include <beacon/crypto/hasher.h>
#include <beacon/registry/instance_entry.h>

#include <filesystem>

namespace beacon::registry {

namespace {
template <typename T> T valueOr(const json& j, const char* key, T def) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return def;
    }
    try {
        return it->get<T>();
    } catch (const json::exception&) {
        return def;
    }
}
} // namespace

json InstanceEntry::toJson() const {
    json j;
    j[wire::kIdentity] = identity;
    j[wire::kDisplayName] = displayName;
    j[wire::kChannelId] = channelId;
    j[wire::kLegacyPort] = legacyPort.value_or(0);
    j[wire::kProcessId] = processId;
    j[wire::kVersionTag] = versionTag;
    j[wire::kLastSeen] = lastSeen;
    j[wire::kActive] = active;
    return j;
}

std::optional<InstanceEntry> InstanceEntry::fromJson(const json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }
    auto it = j.find(wire::kIdentity);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }

    InstanceEntry e;
    e.identity = it->get<std::string>();
    e.displayName = valueOr<std::string>(j, wire::kDisplayName, {});
    e.channelId = valueOr<std::string>(j, wire::kChannelId, {});
    if (auto p = j.find(wire::kLegacyPort); p != j.end() && p->is_number_integer()) {
        e.legacyPort = p->get<int>();
    }
    e.processId = valueOr<int>(j, wire::kProcessId, 0);
    e.versionTag = valueOr<std::string>(j, wire::kVersionTag, {});
    e.lastSeen = valueOr<std::string>(j, wire::kLastSeen, {});
    e.active = valueOr<bool>(j, wire::kActive, true);
    return e;
}

std::string deriveDisplayName(std::string_view identity) {
    std::filesystem::path p{std::string(identity)};
    auto name = p.filename().string();
    if (name.empty()) {
        // "/work/game/" has an empty filename; use the parent component
        name = p.parent_path().filename().string();
    }
    return name.empty() ? std::string("Unknown Project") : name;
}

std::string deriveChannelId(std::string_view identity, std::string_view prefix) {
    auto digest = crypto::Hasher::hex(crypto::DigestAlgorithm::MD5, identity);
    return std::string(prefix) + "-" + digest.substr(0, 8);
}

} // namespace beacon::registry

#include <beacon/config/bridge_config.h>
#include <beacon/registry/instance_entry.h>
#include <beacon/version.hpp>

#include <spdlog/spdlog.h>

#include <unistd.h>

#include <limits>

namespace beacon::config {

namespace {
std::optional<long long> parse_number(const std::string& section, const std::string& key,
                                      const std::string& raw) {
    try {
        size_t pos = 0;
        long long v = std::stoll(raw, &pos);
        if (pos == raw.size()) {
            return v;
        }
    } catch (const std::exception&) {
    }
    spdlog::warn("[Config] Ignoring non-numeric value '{}' for {}.{}", raw, section, key);
    return std::nullopt;
}

// Values that do not fit in an int are ignored like non-numeric ones
std::optional<long long> parse_int(const std::string& section, const std::string& key,
                                   const std::string& raw) {
    auto v = parse_number(section, key, raw);
    if (v && *v > std::numeric_limits<int>::max()) {
        spdlog::warn("[Config] Ignoring out-of-range value '{}' for {}.{}", raw, section, key);
        return std::nullopt;
    }
    return v;
}

std::optional<bool> parse_bool(const std::string& section, const std::string& key,
                               const std::string& raw) {
    if (raw == "true" || raw == "1" || raw == "yes" || raw == "on")
        return true;
    if (raw == "false" || raw == "0" || raw == "no" || raw == "off")
        return false;
    spdlog::warn("[Config] Ignoring non-boolean value '{}' for {}.{}", raw, section, key);
    return std::nullopt;
}

const std::string* lookup(const ConfigMap& map, const std::string& section,
                          const std::string& key) {
    if (auto s = map.find(section); s != map.end()) {
        if (auto kv = s->second.find(key); kv != s->second.end()) {
            return &kv->second;
        }
    }
    return nullptr;
}
} // namespace

std::filesystem::path default_registry_path() {
    return expand_tilde("~/.unityvision/projects.json");
}

void BridgeConfig::finalize() {
    if (identity.empty()) {
        std::error_code ec;
        auto cwd = std::filesystem::current_path(ec);
        identity = ec ? std::string(".") : cwd.string();
    }
    if (displayName.empty()) {
        displayName = registry::deriveDisplayName(identity);
    }
    if (channelPrefix.empty()) {
        channelPrefix = kDefaultChannelPrefix;
    }
    if (channelId.empty()) {
        channelId = registry::deriveChannelId(identity, channelPrefix);
    }
    if (versionTag.empty()) {
        versionTag = BEACON_VERSION_STRING;
    }
    if (registryPath.empty()) {
        registryPath = default_registry_path();
    }
    if (workerThreads == 0) {
        workerThreads = 1;
    }
}

registry::InstanceProfile BridgeConfig::toProfile() const {
    registry::InstanceProfile p;
    p.identity = identity;
    p.displayName = displayName;
    p.channelId = channelId;
    p.legacyPort = legacyPort;
    p.processId = static_cast<int>(::getpid());
    p.versionTag = versionTag;
    return p;
}

void apply_config_map(BridgeConfig& cfg, const ConfigMap& map) {
    if (auto v = lookup(map, "bridge", "identity"))
        cfg.identity = expand_tilde(*v).string();
    if (auto v = lookup(map, "bridge", "display_name"))
        cfg.displayName = *v;
    if (auto v = lookup(map, "bridge", "channel_prefix"))
        cfg.channelPrefix = *v;
    if (auto v = lookup(map, "bridge", "channel_id"))
        cfg.channelId = *v;
    if (auto v = lookup(map, "bridge", "port")) {
        if (auto n = parse_int("bridge", "port", *v)) {
            if (*n > 0)
                cfg.legacyPort = static_cast<int>(*n);
            else
                cfg.legacyPort.reset();
        }
    }
    if (auto v = lookup(map, "bridge", "version"))
        cfg.versionTag = *v;

    if (auto v = lookup(map, "registry", "path"))
        cfg.registryPath = expand_tilde(*v);
    if (auto v = lookup(map, "registry", "heartbeat_interval_ms")) {
        if (auto n = parse_number("registry", "heartbeat_interval_ms", *v); n && *n > 0)
            cfg.heartbeatInterval = std::chrono::milliseconds(*n);
    }
    if (auto v = lookup(map, "registry", "active_threshold_s")) {
        if (auto n = parse_int("registry", "active_threshold_s", *v); n && *n > 0)
            cfg.activeThresholdSeconds = static_cast<int>(*n);
    }
    if (auto v = lookup(map, "registry", "evict_threshold_s")) {
        if (auto n = parse_int("registry", "evict_threshold_s", *v); n && *n > 0)
            cfg.evictThresholdSeconds = static_cast<int>(*n);
    }
    if (auto v = lookup(map, "registry", "evict_on_start")) {
        if (auto b = parse_bool("registry", "evict_on_start", *v))
            cfg.evictOnStart = *b;
    }

    if (auto v = lookup(map, "logging", "level"))
        cfg.logLevel = *v;
    if (auto v = lookup(map, "logging", "file"))
        cfg.logFile = expand_tilde(*v).string();

    if (auto v = lookup(map, "workers", "threads")) {
        if (auto n = parse_number("workers", "threads", *v); n && *n > 0)
            cfg.workerThreads = static_cast<size_t>(*n);
    }
}

void apply_environment(BridgeConfig& cfg) {
    if (auto v = env_value("BEACON_REGISTRY_PATH"))
        cfg.registryPath = expand_tilde(*v);
    if (auto v = env_value("BEACON_IDENTITY"))
        cfg.identity = *v;
    if (auto v = env_value("BEACON_LOG_LEVEL"))
        cfg.logLevel = *v;
}

Result<BridgeConfig> load_bridge_config(const std::string& override_path) {
    BridgeConfig cfg;
    auto path = get_config_path(override_path);

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        apply_config_map(cfg, parse_config_file(path));
        spdlog::debug("[Config] Loaded {}", path.string());
    } else if (!override_path.empty()) {
        return Error{ErrorCode::FileNotFound, "Config file not found: " + path.string()};
    } else {
        spdlog::debug("[Config] No config file at {}, using defaults", path.string());
    }

    apply_environment(cfg);
    return cfg;
}

} // namespace beacon::config

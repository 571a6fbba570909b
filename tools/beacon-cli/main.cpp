#include <spdlog/spdlog.h>

#include <iostream>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <beacon/config/bridge_config.h>
#include <beacon/host/logging.h>
#include <beacon/registry/discovery_query.h>
#include <beacon/registry/registry_store.h>
#include <beacon/version.hpp>

using json = nlohmann::json;

namespace {
json entriesToJson(const std::vector<beacon::registry::InstanceEntry>& entries) {
    json arr = json::array();
    for (const auto& e : entries) {
        arr.push_back(e.toJson());
    }
    return arr;
}
} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"Beacon - discover running instances from the shared registry"};
    app.require_subcommand(1);

    std::string registry_path;
    std::string log_level = "warn";
    app.add_option("-r,--registry", registry_path, "Registry file path");
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}))
        ->default_val("warn");
    app.set_version_flag("--version", BEACON_VERSION_STRING);

    auto* listCmd = app.add_subcommand("list", "Print every registry entry");

    int active_threshold = beacon::registry::DiscoveryQuery::kDefaultActiveThresholdSeconds;
    auto* activeCmd = app.add_subcommand("active", "Print entries with a recent heartbeat");
    auto* activeOpt =
        activeCmd->add_option("-t,--threshold", active_threshold, "Staleness threshold in seconds")
            ->check(CLI::PositiveNumber);

    int evict_threshold = beacon::registry::DiscoveryQuery::kDefaultEvictThresholdSeconds;
    std::string self_identity;
    auto* evictCmd = app.add_subcommand("evict", "Remove inactive entries older than a threshold");
    auto* evictOpt =
        evictCmd->add_option("-t,--threshold", evict_threshold, "Minimum age in seconds")
            ->check(CLI::PositiveNumber);
    evictCmd->add_option("--self", self_identity, "Identity that must never be removed");

    std::string find_key;
    auto* findCmd = app.add_subcommand("find", "Look up an entry by identity or display name");
    findCmd->add_option("key", find_key, "Identity or display name")->required();

    auto* pathCmd = app.add_subcommand("path", "Print the registry file location");

    CLI11_PARSE(app, argc, argv);

    beacon::host::LoggingOptions logOpts;
    logOpts.loggerName = "beacon";
    logOpts.level = log_level;
    beacon::host::configure_logging(logOpts);

    // Same resolution order as the host, minus identity-derived fields
    auto loaded = beacon::config::load_bridge_config();
    if (!loaded) {
        std::cerr << "Failed to load config: " << loaded.error().message << std::endl;
        return 1;
    }
    auto cfg = std::move(loaded).value();
    if (!registry_path.empty()) {
        cfg.registryPath = beacon::config::expand_tilde(registry_path);
    }
    if (cfg.registryPath.empty()) {
        cfg.registryPath = beacon::config::default_registry_path();
    }

    // Thresholds from the config file apply unless given on the command line
    if (activeOpt->count() == 0) {
        active_threshold = cfg.activeThresholdSeconds;
    }
    if (evictOpt->count() == 0) {
        evict_threshold = cfg.evictThresholdSeconds;
    }

    beacon::registry::RegistryStore store(cfg.registryPath);

    try {
        if (*pathCmd) {
            std::cout << store.path().string() << std::endl;
        } else if (*listCmd) {
            beacon::registry::DiscoveryQuery query(store);
            std::cout << entriesToJson(query.listAll()).dump(2) << std::endl;
        } else if (*activeCmd) {
            beacon::registry::DiscoveryQuery query(store);
            std::cout << entriesToJson(query.listActive(active_threshold)).dump(2) << std::endl;
        } else if (*evictCmd) {
            beacon::registry::DiscoveryQuery query(store, self_identity);
            auto removed = query.evictStale(evict_threshold);
            std::cout << json{{"removed", removed}}.dump(2) << std::endl;
        } else if (*findCmd) {
            beacon::registry::DiscoveryQuery query(store);
            auto entry = query.findByIdentityOrName(find_key);
            if (!entry) {
                std::cerr << "No instance matches '" << find_key << "'" << std::endl;
                return 2;
            }
            std::cout << entry->toJson().dump(2) << std::endl;
        }
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
    return 0;
}

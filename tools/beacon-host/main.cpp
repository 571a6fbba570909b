#include <spdlog/spdlog.h>

#include <iostream>

#include <CLI/CLI.hpp>

#include <beacon/config/bridge_config.h>
#include <beacon/host/bridge_host.h>
#include <beacon/host/logging.h>
#include <beacon/version.hpp>

int main(int argc, char* argv[]) {
    CLI::App app{"Beacon host - advertises this instance and serves its tool catalog"};

    std::string config_path;
    std::string identity;
    std::string registry_path;
    std::string channel_id;
    int port = 0;
    std::string log_level;
    std::string log_file;
    bool print_tools = false;
    bool once = false;
    bool quiet = false;

    app.add_option("-c,--config", config_path, "Config file path");
    app.add_option("-i,--identity", identity, "Instance identity (default: current directory)");
    app.add_option("-r,--registry", registry_path, "Registry file path");
    app.add_option("--channel-id", channel_id, "Channel id advertised to clients");
    auto* portOpt = app.add_option("-p,--port", port, "Legacy port hint (0 to omit)");
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));
    app.add_option("--log-file", log_file, "Log file path (optional)");
    app.add_flag("--print-tools", print_tools, "Print the tool schema and exit");
    app.add_flag("--once", once, "Register, deactivate and exit");
    app.add_flag("-q,--quiet", quiet, "No console logging");
    app.set_version_flag("--version", BEACON_VERSION_STRING);
    CLI11_PARSE(app, argc, argv);

    auto loaded = beacon::config::load_bridge_config(config_path);
    if (!loaded) {
        std::cerr << "Failed to load config: " << loaded.error().message << std::endl;
        return 1;
    }
    auto cfg = std::move(loaded).value();

    if (!identity.empty())
        cfg.identity = identity;
    if (!registry_path.empty())
        cfg.registryPath = beacon::config::expand_tilde(registry_path);
    if (!channel_id.empty())
        cfg.channelId = channel_id;
    if (portOpt->count() > 0) {
        if (port > 0)
            cfg.legacyPort = port;
        else
            cfg.legacyPort.reset();
    }
    if (!log_level.empty())
        cfg.logLevel = log_level;
    if (!log_file.empty())
        cfg.logFile = log_file;

    try {
        beacon::host::LoggingOptions logOpts;
        logOpts.loggerName = "beacon-host";
        logOpts.level = cfg.logLevel;
        logOpts.file = cfg.logFile;
        logOpts.console = !quiet && !print_tools;
        beacon::host::configure_logging(logOpts);
    } catch (const std::exception& e) {
        std::cerr << "Failed to setup logging: " << e.what() << std::endl;
        return 1;
    }

    try {
        beacon::host::BridgeHost host(std::move(cfg), !once);

        if (print_tools) {
            if (auto r = host.loadCatalog(); !r) {
                std::cerr << "Failed to build tool catalog: " << r.error().message << std::endl;
                return 1;
            }
            std::cout << host.catalog().exportSchema().dump(2) << std::endl;
            return 0;
        }

        spdlog::info("Beacon host v{}", BEACON_VERSION_STRING);
        if (auto r = host.initialize(); !r) {
            spdlog::error("Initialization failed: {}", r.error().message);
            return 1;
        }

        if (once) {
            spdlog::info("Registered {} as {}", host.config().identity, host.config().channelId);
            host.shutdown();
            return 0;
        }

        spdlog::info("Serving '{}' on channel {}", host.config().displayName,
                     host.config().channelId);
        spdlog::info("Press Ctrl+C to stop");
        host.run();

        spdlog::info("Shutting down...");
        host.shutdown();
        spdlog::info("Stopped");
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
    return 0;
}

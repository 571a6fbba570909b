#pragma once

#include <beacon/config/bridge_config.h>
#include <beacon/core/types.h>
#include <beacon/registry/heartbeat_scheduler.h>
#include <beacon/registry/registry_store.h>
#include <beacon/tools/dispatcher.h>
#include <beacon/tools/job_tracker.h>
#include <beacon/tools/tool_catalog.h>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace beacon::host {

using json = nlohmann::json;

/**
 * @class BridgeHost
 * @brief Owns one bridge instance: registry row, heartbeat, tool catalog and dispatcher.
 *
 * Lifecycle:
 *   initialize()  register built-in tools, write the registry row, optional eviction sweep,
 *                 start the heartbeat timer and (optionally) SIGINT/SIGTERM handling
 *   run()         drive the event loop on the calling thread until stop()
 *   shutdown()    stop the loop, mark the row inactive, join workers (idempotent)
 *
 * The heartbeat and every submit() call are serialised on the host's io_context.
 * Asynchronous handlers may complete on the worker pool.
 */
class BridgeHost {
public:
    explicit BridgeHost(config::BridgeConfig config, bool handleSignals = true);
    ~BridgeHost();

    BridgeHost(const BridgeHost&) = delete;
    BridgeHost& operator=(const BridgeHost&) = delete;

    // Registers the built-in tools only; initialize() calls it too
    Result<void> loadCatalog();

    Result<void> initialize();
    void run();
    void stop();
    void shutdown();

    // Dispatch on the event loop; the future is fulfilled once run() services it
    std::future<json> submit(std::string name, json arguments);

    bool suspend();
    bool resume();

    bool isInitialized() const noexcept { return initialized_.load(); }
    bool isRunning() const noexcept { return running_.load(); }

    const config::BridgeConfig& config() const noexcept { return config_; }
    const registry::RegistryStore& store() const noexcept { return store_; }
    tools::ToolCatalog& catalog() noexcept { return catalog_; }
    const tools::Dispatcher& dispatcher() const noexcept { return dispatcher_; }
    registry::HeartbeatScheduler* scheduler() noexcept { return scheduler_.get(); }
    tools::JobTracker& jobs() noexcept { return *jobs_; }
    boost::asio::io_context& ioContext() noexcept { return io_; }

private:
    void launchHeartbeatLoop();
    void installSignalHandlers();

    config::BridgeConfig config_;
    bool handleSignals_;

    boost::asio::io_context io_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
        workGuard_;
    boost::asio::steady_timer heartbeatTimer_;
    std::optional<boost::asio::signal_set> signals_;
    boost::asio::thread_pool workers_;

    registry::RegistryStore store_;
    std::mutex schedulerMutex_;
    std::unique_ptr<registry::HeartbeatScheduler> scheduler_;

    tools::ToolCatalog catalog_;
    tools::Dispatcher dispatcher_;
    std::shared_ptr<tools::JobTracker> jobs_;

    bool catalogLoaded_{false};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<bool> shutdown_{false};
};

} // namespace beacon::host

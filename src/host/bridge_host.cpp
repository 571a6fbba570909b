#include <beacon/host/bridge_host.h>
#include <beacon/registry/discovery_query.h>
#include <beacon/tools/builtin_tools.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>

#include <csignal>

namespace beacon::host {

namespace {
config::BridgeConfig finalized(config::BridgeConfig cfg) {
    cfg.finalize();
    return cfg;
}
} // namespace

BridgeHost::BridgeHost(config::BridgeConfig config, bool handleSignals)
    : config_(finalized(std::move(config))),
      handleSignals_(handleSignals),
      heartbeatTimer_(io_),
      workers_(config_.workerThreads),
      store_(config_.registryPath),
      dispatcher_(catalog_),
      jobs_(std::make_shared<tools::JobTracker>()) {}

BridgeHost::~BridgeHost() {
    shutdown();
}

Result<void> BridgeHost::loadCatalog() {
    if (catalogLoaded_) {
        return Result<void>();
    }
    tools::BuiltinToolContext ctx{store_,
                                  catalog_,
                                  workers_,
                                  jobs_,
                                  config_.identity,
                                  config_.displayName,
                                  config_.versionTag,
                                  config_.activeThresholdSeconds,
                                  config_.evictThresholdSeconds};
    if (auto r = tools::registerBuiltinTools(catalog_, std::move(ctx)); !r) {
        return r;
    }
    catalogLoaded_ = true;
    return Result<void>();
}

Result<void> BridgeHost::initialize() {
    if (initialized_.load()) {
        return Result<void>();
    }
    if (shutdown_.load()) {
        return Error{ErrorCode::InvalidState, "BridgeHost was already shut down"};
    }

    spdlog::info("[BridgeHost] Initializing '{}' (channel {}, registry {})", config_.identity,
                 config_.channelId, config_.registryPath.string());

    if (auto r = loadCatalog(); !r) {
        return r;
    }

    scheduler_ = std::make_unique<registry::HeartbeatScheduler>(store_, config_.toProfile(),
                                                                config_.heartbeatInterval);
    {
        std::lock_guard<std::mutex> lock(schedulerMutex_);
        if (!scheduler_->registerOrUpdate()) {
            spdlog::warn("[BridgeHost] Initial registration failed; heartbeat will retry");
        }
    }

    if (config_.evictOnStart) {
        registry::DiscoveryQuery query(store_, config_.identity);
        query.evictStale(config_.evictThresholdSeconds);
    }

    workGuard_.emplace(boost::asio::make_work_guard(io_));
    launchHeartbeatLoop();
    if (handleSignals_) {
        installSignalHandlers();
    }

    initialized_.store(true);
    spdlog::info("[BridgeHost] Ready with {} tools", catalog_.size());
    return Result<void>();
}

void BridgeHost::launchHeartbeatLoop() {
    auto* self = this;
    boost::asio::co_spawn(
        io_,
        [self]() -> boost::asio::awaitable<void> {
            while (!self->stopping_.load()) {
                self->heartbeatTimer_.expires_after(self->config_.heartbeatInterval);
                try {
                    co_await self->heartbeatTimer_.async_wait(boost::asio::use_awaitable);
                } catch (const boost::system::system_error& e) {
                    if (e.code() == boost::asio::error::operation_aborted) {
                        break;
                    }
                    throw;
                }

                std::lock_guard<std::mutex> lock(self->schedulerMutex_);
                if (self->scheduler_) {
                    self->scheduler_->tick();
                }
            }
            spdlog::debug("[BridgeHost] Heartbeat loop stopped");
            co_return;
        },
        boost::asio::detached);
}

void BridgeHost::installSignalHandlers() {
    signals_.emplace(io_, SIGINT, SIGTERM);
    signals_->async_wait([this](const boost::system::error_code& ec, int signo) {
        if (ec) {
            return;
        }
        spdlog::info("[BridgeHost] Received signal {}, shutting down...", signo);
        stop();
    });
}

void BridgeHost::run() {
    if (!initialized_.load()) {
        spdlog::warn("[BridgeHost] run() called before initialize()");
        return;
    }
    if (io_.stopped()) {
        io_.restart();
    }
    running_.store(true);
    io_.run();
    running_.store(false);
    spdlog::debug("[BridgeHost] Event loop exited");
}

void BridgeHost::stop() {
    stopping_.store(true);
    if (workGuard_) {
        workGuard_->reset();
    }
    io_.stop();
}

void BridgeHost::shutdown() {
    if (shutdown_.exchange(true)) {
        return;
    }
    stop();

    boost::system::error_code ec;
    heartbeatTimer_.cancel();
    if (signals_) {
        signals_->cancel(ec);
    }
    if (!running_.load()) {
        // Let cancelled handlers unwind
        io_.restart();
        io_.poll();
    }

    {
        std::lock_guard<std::mutex> lock(schedulerMutex_);
        if (scheduler_ && initialized_.load()) {
            scheduler_->deactivate();
        }
    }

    workers_.stop();
    workers_.join();
    if (initialized_.load()) {
        spdlog::info("[BridgeHost] Shut down '{}'", config_.identity);
    }
}

std::future<json> BridgeHost::submit(std::string name, json arguments) {
    auto promise = std::make_shared<std::promise<json>>();
    auto future = promise->get_future();
    boost::asio::co_spawn(io_, dispatcher_.callTool(std::move(name), std::move(arguments)),
                          [promise](std::exception_ptr ep, json result) {
                              if (ep) {
                                  promise->set_exception(ep);
                              } else {
                                  promise->set_value(std::move(result));
                              }
                          });
    return future;
}

bool BridgeHost::suspend() {
    std::lock_guard<std::mutex> lock(schedulerMutex_);
    return scheduler_ && scheduler_->onTransientSuspend();
}

bool BridgeHost::resume() {
    std::lock_guard<std::mutex> lock(schedulerMutex_);
    return scheduler_ && scheduler_->onResume();
}

} // namespace beacon::host

#pragma once

#include <beacon/registry/registry_store.h>
#include <beacon/tools/job_tracker.h>
#include <beacon/tools/tool_catalog.h>

#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace beacon::tools {

using json = nlohmann::json;

// Tool names
constexpr const char* kPingTool = "beacon_ping";
constexpr const char* kListInstancesTool = "beacon_list_instances";
constexpr const char* kListToolsTool = "beacon_list_tools";
constexpr const char* kEvictStaleTool = "beacon_evict_stale";
constexpr const char* kStartJobTool = "beacon_start_job";
constexpr const char* kJobStatusTool = "beacon_job_status";

// Built-in tool DTOs
struct PingRequest {
    using RequestType = PingRequest;

    std::string message = "pong";

    static PingRequest fromJson(const json& j);
    json toJson() const;
};

struct PingResponse {
    using ResponseType = PingResponse;

    std::string response;
    std::string timestamp;
    std::string version;
    std::string projectName;

    static PingResponse fromJson(const json& j);
    json toJson() const;
};

struct ListInstancesRequest {
    using RequestType = ListInstancesRequest;

    bool activeOnly = true;
    int staleSeconds = 30;

    static ListInstancesRequest fromJson(const json& j);
    json toJson() const;
};

struct ListInstancesResponse {
    using ResponseType = ListInstancesResponse;

    std::vector<json> instances;

    static ListInstancesResponse fromJson(const json& j);
    json toJson() const;
};

struct EvictStaleRequest {
    using RequestType = EvictStaleRequest;

    int staleSeconds = 300;

    static EvictStaleRequest fromJson(const json& j);
    json toJson() const;
};

struct EvictStaleResponse {
    using ResponseType = EvictStaleResponse;

    size_t removed = 0;

    static EvictStaleResponse fromJson(const json& j);
    json toJson() const;
};

struct StartJobRequest {
    using RequestType = StartJobRequest;

    std::string label;
    int64_t durationMs = 0;

    static StartJobRequest fromJson(const json& j);
    json toJson() const;
};

struct StartJobResponse {
    using ResponseType = StartJobResponse;

    std::string jobId;
    std::string state = "accepted";

    static StartJobResponse fromJson(const json& j);
    json toJson() const;
};

struct JobStatusRequest {
    using RequestType = JobStatusRequest;

    std::string jobId;

    static JobStatusRequest fromJson(const json& j);
    json toJson() const;
};

// Everything the built-in handlers reach into. All references must outlive the catalog.
struct BuiltinToolContext {
    const registry::RegistryStore& store;
    const ToolCatalog& catalog;
    boost::asio::thread_pool& workers;
    std::shared_ptr<JobTracker> jobs;
    std::string selfIdentity;
    std::string displayName;
    std::string version;
    int activeThresholdSeconds = 30;
    int evictThresholdSeconds = 300;
};

// Registers the beacon_* tools. Fails on the first rejected registration.
Result<void> registerBuiltinTools(ToolCatalog& catalog, BuiltinToolContext context);

} // namespace beacon::tools

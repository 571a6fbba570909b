#include <beacon/core/timestamp.h>
#include <beacon/registry/discovery_query.h>
#include <beacon/tools/builtin_tools.h>

#include <spdlog/spdlog.h>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>

namespace beacon::tools {

namespace {
// Tolerant numeric parsing: accept number or numeric-like string
int64_t parse_int_tolerant(const json& j, const char* key, int64_t def) {
    if (!j.contains(key) || j[key].is_null())
        return def;
    if (j[key].is_number_unsigned()) {
        const auto v = j[key].get<uint64_t>();
        return v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())
                   ? std::numeric_limits<int64_t>::max()
                   : static_cast<int64_t>(v);
    }
    if (j[key].is_number_integer())
        return j[key].get<int64_t>();
    if (j[key].is_number_float()) {
        // Saturate before converting; out-of-range double to integer is undefined
        const double d = j[key].get<double>();
        if (std::isnan(d))
            return def;
        if (d >= 9.2e18)
            return std::numeric_limits<int64_t>::max();
        if (d <= -9.2e18)
            return std::numeric_limits<int64_t>::min();
        return static_cast<int64_t>(d);
    }
    if (j[key].is_string()) {
        auto s = j[key].get<std::string>();
        if (s.empty())
            return def;
        try {
            return std::stoll(s);
        } catch (const std::exception&) {
            return def;
        }
    }
    return def;
}

// Second counts are clamped into [0, INT_MAX]
int parse_seconds(const json& j, const char* key, int def) {
    const auto v = parse_int_tolerant(j, key, def);
    return static_cast<int>(std::clamp<int64_t>(v, 0, std::numeric_limits<int>::max()));
}

bool parse_bool_tolerant(const json& j, const char* key, bool def) {
    if (!j.contains(key) || j[key].is_null())
        return def;
    if (j[key].is_boolean())
        return j[key].get<bool>();
    if (j[key].is_string()) {
        auto s = j[key].get<std::string>();
        if (s == "true" || s == "1")
            return true;
        if (s == "false" || s == "0")
            return false;
    }
    return def;
}

ToolParameter param(std::string name, std::string description, ParameterKind kind,
                    bool required = false, std::optional<json> def = std::nullopt) {
    return ToolParameter{std::move(name), std::move(description), kind, required,
                         std::move(def)};
}
} // namespace

// DTO implementations

PingRequest PingRequest::fromJson(const json& j) {
    PingRequest req;
    req.message = j.value("message", std::string("pong"));
    return req;
}

json PingRequest::toJson() const {
    return json{{"message", message}};
}

PingResponse PingResponse::fromJson(const json& j) {
    PingResponse resp;
    resp.response = j.value("response", "");
    resp.timestamp = j.value("timestamp", "");
    resp.version = j.value("version", "");
    resp.projectName = j.value("projectName", "");
    return resp;
}

json PingResponse::toJson() const {
    return json{{"response", response},
                {"timestamp", timestamp},
                {"version", version},
                {"projectName", projectName}};
}

ListInstancesRequest ListInstancesRequest::fromJson(const json& j) {
    ListInstancesRequest req;
    req.activeOnly = parse_bool_tolerant(j, "active_only", true);
    req.staleSeconds = parse_seconds(j, "stale_seconds", 30);
    return req;
}

json ListInstancesRequest::toJson() const {
    return json{{"active_only", activeOnly}, {"stale_seconds", staleSeconds}};
}

ListInstancesResponse ListInstancesResponse::fromJson(const json& j) {
    ListInstancesResponse resp;
    if (j.contains("instances") && j["instances"].is_array()) {
        for (const auto& e : j["instances"]) {
            resp.instances.push_back(e);
        }
    }
    return resp;
}

json ListInstancesResponse::toJson() const {
    return json{{"count", instances.size()}, {"instances", instances}};
}

EvictStaleRequest EvictStaleRequest::fromJson(const json& j) {
    EvictStaleRequest req;
    req.staleSeconds = parse_seconds(j, "stale_seconds", 300);
    return req;
}

json EvictStaleRequest::toJson() const {
    return json{{"stale_seconds", staleSeconds}};
}

EvictStaleResponse EvictStaleResponse::fromJson(const json& j) {
    EvictStaleResponse resp;
    resp.removed = static_cast<size_t>(parse_int_tolerant(j, "removed", 0));
    return resp;
}

json EvictStaleResponse::toJson() const {
    return json{{"removed", removed}};
}

StartJobRequest StartJobRequest::fromJson(const json& j) {
    StartJobRequest req;
    req.label = j.value("label", "");
    req.durationMs = parse_int_tolerant(j, "duration_ms", 0);
    if (req.durationMs < 0)
        req.durationMs = 0;
    return req;
}

json StartJobRequest::toJson() const {
    return json{{"label", label}, {"duration_ms", durationMs}};
}

StartJobResponse StartJobResponse::fromJson(const json& j) {
    StartJobResponse resp;
    resp.jobId = j.value("job_id", "");
    resp.state = j.value("state", "accepted");
    return resp;
}

json StartJobResponse::toJson() const {
    return json{{"job_id", jobId}, {"state", state}};
}

JobStatusRequest JobStatusRequest::fromJson(const json& j) {
    JobStatusRequest req;
    req.jobId = j.value("job_id", "");
    return req;
}

json JobStatusRequest::toJson() const {
    return json{{"job_id", jobId}};
}

// Registration

Result<void> registerBuiltinTools(ToolCatalog& catalog, BuiltinToolContext context) {
    auto ctx = std::make_shared<const BuiltinToolContext>(std::move(context));
    if (!ctx->jobs) {
        return Error{ErrorCode::InvalidArgument, "Built-in tools need a job tracker"};
    }

    std::vector<ToolDescriptor> tools;

    {
        ToolDescriptor d;
        d.name = kPingTool;
        d.description = "Check that this instance is alive and report its version";
        d.parameters = {param("message", "Text echoed back in the response",
                              ParameterKind::String, false, json("pong"))};
        d.handler = ToolWrapper<PingRequest, PingResponse>(
            [ctx](const PingRequest& req) -> Result<PingResponse> {
                PingResponse resp;
                resp.response = req.message;
                resp.timestamp = Timestamp::nowString();
                resp.version = ctx->version;
                resp.projectName = ctx->displayName;
                return resp;
            });
        tools.push_back(std::move(d));
    }

    {
        ToolDescriptor d;
        d.name = kListInstancesTool;
        d.description = "List instances recorded in the discovery registry";
        d.parameters = {
            param("active_only", "Only return instances with a recent heartbeat",
                  ParameterKind::Boolean, false, json(true)),
            param("stale_seconds", "Heartbeat age after which an instance is not active",
                  ParameterKind::Number, false, json(ctx->activeThresholdSeconds))};
        d.handler = ToolWrapper<ListInstancesRequest, ListInstancesResponse>(
            [ctx](const ListInstancesRequest& req) -> Result<ListInstancesResponse> {
                registry::DiscoveryQuery query(ctx->store, ctx->selfIdentity);
                auto entries = req.activeOnly ? query.listActive(req.staleSeconds)
                                              : query.listAll();
                ListInstancesResponse resp;
                resp.instances.reserve(entries.size());
                for (const auto& e : entries) {
                    resp.instances.push_back(e.toJson());
                }
                return resp;
            });
        tools.push_back(std::move(d));
    }

    {
        ToolDescriptor d;
        d.name = kListToolsTool;
        d.description = "Describe every tool this instance exposes";
        d.handler = [ctx](const json&) -> json {
            auto schema = ctx->catalog.exportSchema();
            return json{{"count", schema.size()}, {"tools", std::move(schema)}};
        };
        tools.push_back(std::move(d));
    }

    {
        ToolDescriptor d;
        d.name = kEvictStaleTool;
        d.description = "Remove inactive registry entries older than a threshold";
        d.asynchronous = true;
        d.parameters = {param("stale_seconds", "Minimum age of an inactive entry to remove",
                              ParameterKind::Number, false, json(ctx->evictThresholdSeconds))};
        d.asyncHandler = AsyncToolWrapper<EvictStaleRequest, EvictStaleResponse>(
            [ctx](const EvictStaleRequest& req, CompletionSlot slot) {
                boost::asio::post(ctx->workers, [ctx, req, slot]() mutable {
                    registry::DiscoveryQuery query(ctx->store, ctx->selfIdentity);
                    EvictStaleResponse resp;
                    resp.removed = query.evictStale(req.staleSeconds);
                    slot.resolve(resp.toJson());
                });
            });
        tools.push_back(std::move(d));
    }

    {
        ToolDescriptor d;
        d.name = kStartJobTool;
        d.description = "Start a background job; poll beacon_job_status for progress";
        d.asynchronous = true;
        d.requiresPolling = true;
        d.pollOperation = kJobStatusTool;
        d.parameters = {
            param("label", "Free-form label stored with the job", ParameterKind::String, true),
            param("duration_ms", "How long the job runs before completing",
                  ParameterKind::Number, false, json(0))};
        d.asyncHandler = AsyncToolWrapper<StartJobRequest, StartJobResponse>(
            [ctx](const StartJobRequest& req, CompletionSlot slot) {
                boost::asio::post(ctx->workers, [ctx, req, slot]() mutable {
                    auto jobs = ctx->jobs;
                    auto id = jobs->create(req.label, req.durationMs);

                    StartJobResponse resp;
                    resp.jobId = id;
                    slot.resolve(resp.toJson());

                    jobs->markRunning(id);
                    auto timer = std::make_shared<boost::asio::steady_timer>(
                        ctx->workers.get_executor(), std::chrono::milliseconds(req.durationMs));
                    timer->async_wait([jobs, id, timer](const boost::system::error_code& ec) {
                        if (ec) {
                            spdlog::debug("[BuiltinTools] Job {} timer cancelled: {}", id,
                                          ec.message());
                            return;
                        }
                        jobs->markCompleted(id);
                    });
                });
            });
        tools.push_back(std::move(d));
    }

    {
        ToolDescriptor d;
        d.name = kJobStatusTool;
        d.description = "Report the state of a job started with beacon_start_job";
        d.parameters = {param("job_id", "Identifier returned by beacon_start_job",
                              ParameterKind::String, true)};
        d.handler = [ctx](const json& args) -> json {
            auto req = JobStatusRequest::fromJson(args);
            auto rec = ctx->jobs->get(req.jobId);
            if (!rec) {
                return errorEnvelope(Error{ErrorCode::NotFound, "Unknown job: " + req.jobId});
            }
            return rec->toJson();
        };
        tools.push_back(std::move(d));
    }

    for (auto& d : tools) {
        std::string name = d.name;
        if (auto r = catalog.registerTool(std::move(d)); !r) {
            spdlog::error("[BuiltinTools] Failed to register '{}': {}", name, r.error().message);
            return r;
        }
    }
    spdlog::debug("[BuiltinTools] Registered {} built-in tools", tools.size());
    return Result<void>();
}

} // namespace beacon::tools

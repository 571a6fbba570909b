#pragma once

#include <beacon/core/types.h>
#include <beacon/tools/completion_slot.h>
#include <beacon/tools/envelope.h>

#include <nlohmann/json.hpp>

#include <concepts>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace beacon::tools {

using json = nlohmann::json;

enum class ParameterKind { String, Number, Boolean, Object, Array };

const char* kindToString(ParameterKind kind) noexcept;
std::optional<ParameterKind> kindFromString(std::string_view name) noexcept;

struct ToolParameter {
    std::string name;
    std::string description;
    ParameterKind kind = ParameterKind::String;
    bool required = false;
    std::optional<json> defaultValue;

    // Whether a present, non-null value conforms to `kind`
    bool accepts(const json& value) const;

    json toJson() const;
};

using SyncHandler = std::function<json(const json&)>;
using AsyncHandler = std::function<void(const json&, CompletionSlot)>;

struct ToolDescriptor {
    std::string name;
    std::string description;
    std::vector<ToolParameter> parameters;
    bool structuredOutput = true;
    bool asynchronous = false;
    bool requiresPolling = false;
    std::optional<std::string> pollOperation;

    SyncHandler handler;
    AsyncHandler asyncHandler;

    const ToolParameter* findParameter(std::string_view paramName) const;

    // Schema projection used by ToolCatalog::exportSchema
    json toJson() const;
};

// Error -> error envelope, keeping InvalidArgument distinguishable
inline json errorEnvelope(const Error& error) {
    switch (error.code) {
        case ErrorCode::InvalidArgument:
            return makeError(error_type::kInvalidArgument, error.message);
        case ErrorCode::NotImplemented:
            return makeError(error_type::kImplementationError, error.message);
        default:
            return makeError(error_type::kExecutionError, error.message);
    }
}

// Typed request/response DTOs for handlers that prefer structs over raw json
template <typename T>
concept ToolRequest = requires {
    typename T::RequestType;
    requires std::same_as<T, typename T::RequestType>;
};

template <typename T>
concept ToolResponse = requires {
    typename T::ResponseType;
    requires std::same_as<T, typename T::ResponseType>;
};

template <typename T>
concept ToolSerializable = requires(const T& t, const json& j) {
    { T::fromJson(j) } -> std::same_as<T>;
    { t.toJson() } -> std::same_as<json>;
};

template <ToolRequest RequestType, ToolResponse ResponseType>
requires ToolSerializable<RequestType> && ToolSerializable<ResponseType>
class ToolWrapper {
public:
    using HandlerFn = std::function<Result<ResponseType>(const RequestType&)>;

    explicit ToolWrapper(HandlerFn handler) : handler_(std::move(handler)) {}

    // Failures come back as error envelopes, which the dispatcher passes through
    json operator()(const json& args) const {
        auto result = handler_(RequestType::fromJson(args));
        if (!result) {
            return errorEnvelope(result.error());
        }
        return result.value().toJson();
    }

private:
    HandlerFn handler_;
};

template <ToolRequest RequestType, ToolResponse ResponseType>
requires ToolSerializable<RequestType> && ToolSerializable<ResponseType>
class AsyncToolWrapper {
public:
    using HandlerFn = std::function<void(const RequestType&, CompletionSlot)>;

    explicit AsyncToolWrapper(HandlerFn handler) : handler_(std::move(handler)) {}

    void operator()(const json& args, CompletionSlot slot) const {
        handler_(RequestType::fromJson(args), std::move(slot));
    }

private:
    HandlerFn handler_;
};

} // namespace beacon::tools

#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace beacon::tools {

using json = nlohmann::json;

// Error "type" values carried in error envelopes
namespace error_type {
constexpr const char* kImplementationError = "implementation_error";
constexpr const char* kUnknownTool = "unknown_tool";
constexpr const char* kExecutionError = "execution_error";
constexpr const char* kInvalidArgument = "invalid_argument";
} // namespace error_type

// { "success": true, "result": <value | null> }
inline json makeSuccess(json result) {
    return json{{"success", true}, {"result", std::move(result)}};
}

// { "error": { "type": ..., "message": ... } }
inline json makeError(std::string_view type, std::string_view message) {
    return json{{"error", json{{"type", std::string(type)}, {"message", std::string(message)}}}};
}

inline bool isSuccessEnvelope(const json& j) {
    return j.is_object() && j.size() == 2 && j.contains("result") && j.contains("success") &&
           j["success"].is_boolean() && j["success"].get<bool>();
}

inline bool isErrorEnvelope(const json& j) {
    if (!j.is_object() || j.size() != 1 || !j.contains("error")) {
        return false;
    }
    const auto& err = j["error"];
    return err.is_object() && err.contains("type") && err["type"].is_string() &&
           err.contains("message") && err["message"].is_string();
}

// Handler results of either envelope shape are passed through unwrapped
inline bool isEnvelope(const json& j) {
    return isSuccessEnvelope(j) || isErrorEnvelope(j);
}

inline std::string errorTypeOf(const json& envelope) {
    return isErrorEnvelope(envelope) ? envelope["error"]["type"].get<std::string>()
                                     : std::string{};
}

} // namespace beacon::tools

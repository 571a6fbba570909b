#include <beacon/tools/tool_descriptor.h>

namespace beacon::tools {

const char* kindToString(ParameterKind kind) noexcept {
    switch (kind) {
        case ParameterKind::String:
            return "string";
        case ParameterKind::Number:
            return "number";
        case ParameterKind::Boolean:
            return "boolean";
        case ParameterKind::Object:
            return "object";
        case ParameterKind::Array:
            return "array";
    }
    return "string";
}

std::optional<ParameterKind> kindFromString(std::string_view name) noexcept {
    if (name == "string")
        return ParameterKind::String;
    if (name == "number" || name == "integer")
        return ParameterKind::Number;
    if (name == "boolean")
        return ParameterKind::Boolean;
    if (name == "object")
        return ParameterKind::Object;
    if (name == "array")
        return ParameterKind::Array;
    return std::nullopt;
}

bool ToolParameter::accepts(const json& value) const {
    switch (kind) {
        case ParameterKind::String:
            return value.is_string();
        case ParameterKind::Number:
            return value.is_number();
        case ParameterKind::Boolean:
            return value.is_boolean();
        case ParameterKind::Object:
            return value.is_object();
        case ParameterKind::Array:
            return value.is_array();
    }
    return false;
}

json ToolParameter::toJson() const {
    json j{{"name", name},
           {"description", description},
           {"type", kindToString(kind)},
           {"required", required}};
    if (defaultValue) {
        j["default_value"] = *defaultValue;
    }
    return j;
}

const ToolParameter* ToolDescriptor::findParameter(std::string_view paramName) const {
    for (const auto& p : parameters) {
        if (p.name == paramName) {
            return &p;
        }
    }
    return nullptr;
}

json ToolDescriptor::toJson() const {
    json params = json::array();
    for (const auto& p : parameters) {
        params.push_back(p.toJson());
    }

    json j{{"name", name},
           {"description", description},
           {"structured_output", structuredOutput},
           {"requires_polling", requiresPolling},
           {"parameters", std::move(params)}};
    if (pollOperation) {
        j["poll_action"] = *pollOperation;
    }
    return j;
}

} // namespace beacon::tools

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace beacon::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// "~" and "~/x" expand against $HOME; anything else is returned as is
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~' && (path.size() == 1 || path[1] == '/')) {
        if (const char* home = std::getenv("HOME")) {
            return path.size() <= 2 ? std::filesystem::path(home)
                                    : std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Env lookup that treats empty values as unset
inline std::optional<std::string> env_value(const char* name) {
    if (const char* v = std::getenv(name); v && *v) {
        return std::string(v);
    }
    return std::nullopt;
}

// section -> key -> unquoted value. Keys before any header land in section "".
// Dotted keys ("registry.path") are split into section and key.
using ConfigMap = std::map<std::string, std::map<std::string, std::string>>;

// Parse a TOML subset: [section] headers, key = value lines, # comments, quoted strings.
// A missing or unreadable file yields an empty map.
ConfigMap parse_config_file(const std::filesystem::path& config_path);

// Single lookup over parse_config_file; empty when absent
std::string parse_config_value(const std::filesystem::path& config_path,
                               const std::string& section, const std::string& key);

/// Returns the user config directory: $XDG_CONFIG_HOME/beacon or ~/.config/beacon
std::filesystem::path get_config_dir();

/// Config file location: override, then $BEACON_CONFIG, then get_config_dir()/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace beacon::config

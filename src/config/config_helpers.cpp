#include <beacon/config/config_helpers.h>

#include <fstream>

namespace beacon::config {

ConfigMap parse_config_file(const std::filesystem::path& config_path) {
    ConfigMap out;
    std::ifstream file(config_path);
    if (!file) {
        return out;
    }

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside of quotes
        if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
            size_t close = v.find(v.front(), 1);
            if (close != std::string::npos) {
                v = v.substr(0, close + 1);
            }
        } else if (size_t comment = v.find('#'); comment != std::string::npos) {
            v = v.substr(0, comment);
            trim(v);
        }

        std::string section = currentSection;
        if (size_t dot = k.find('.'); dot != std::string::npos && currentSection.empty()) {
            section = k.substr(0, dot);
            k = k.substr(dot + 1);
        }
        if (!k.empty()) {
            out[section][k] = unquote(v);
        }
    }

    return out;
}

std::string parse_config_value(const std::filesystem::path& config_path,
                               const std::string& section, const std::string& key) {
    auto map = parse_config_file(config_path);
    if (auto s = map.find(section); s != map.end()) {
        if (auto kv = s->second.find(key); kv != s->second.end()) {
            return kv->second;
        }
    }
    return "";
}

std::filesystem::path get_config_dir() {
    if (auto xdg = env_value("XDG_CONFIG_HOME")) {
        return std::filesystem::path(*xdg) / "beacon";
    }
    if (auto home = env_value("HOME")) {
        return std::filesystem::path(*home) / ".config" / "beacon";
    }
    return std::filesystem::path(".config") / "beacon";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (auto env = env_value("BEACON_CONFIG")) {
        return expand_tilde(*env);
    }
    return get_config_dir() / "config.toml";
}

} // namespace beacon::config

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace beacon::host {

struct LoggingOptions {
    std::string loggerName = "beacon";
    std::string level = "info";
    std::string file;      // empty: no file sink
    bool console = true;   // stderr colour sink
};

// "trace".."critical"/"off"; unknown names fall back to info
spdlog::level::level_enum parse_log_level(const std::string& level);

// Replaces the default logger with one built from the requested sinks
void configure_logging(const LoggingOptions& options);

} // namespace beacon::host

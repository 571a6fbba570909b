#include <beacon/host/logging.h>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <vector>

namespace beacon::host {

namespace {
constexpr size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr size_t kMaxLogFiles = 3;
} // namespace

spdlog::level::level_enum parse_log_level(const std::string& level) {
    if (level == "trace")
        return spdlog::level::trace;
    if (level == "debug")
        return spdlog::level::debug;
    if (level == "info")
        return spdlog::level::info;
    if (level == "warn" || level == "warning")
        return spdlog::level::warn;
    if (level == "error")
        return spdlog::level::err;
    if (level == "critical")
        return spdlog::level::critical;
    if (level == "off")
        return spdlog::level::off;
    return spdlog::level::info;
}

void configure_logging(const LoggingOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;
    if (options.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }
    if (!options.file.empty()) {
        try {
            std::filesystem::path p(options.file);
            if (p.has_parent_path()) {
                std::filesystem::create_directories(p.parent_path());
            }
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                options.file, kMaxLogFileSize, kMaxLogFiles));
        } catch (const std::exception& e) {
            spdlog::warn("Failed to open log file {}: {}", options.file, e.what());
        }
    }
    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    auto logger =
        std::make_shared<spdlog::logger>(options.loggerName, sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(parse_log_level(options.level));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
}

} // namespace beacon::host

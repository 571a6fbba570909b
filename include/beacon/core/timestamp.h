#pragma once

#include <beacon/core/types.h>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace beacon {

/**
 * @brief ISO 8601 helpers for registry liveness timestamps
 */
class Timestamp {
public:
    /**
     * @brief Format a time_point as ISO 8601 UTC with millisecond precision
     *
     * Example: "2025-03-01T12:30:05.123Z"
     */
    static std::string format(const TimePoint& tp);

    /**
     * @brief Parse an ISO 8601 date/time string
     *
     * Accepted forms:
     * - "2025-03-01T12:30:05Z"
     * - "2025-03-01T12:30:05.1234567Z" (any number of fractional digits)
     * - "2025-03-01T12:30:05+02:00", "...-0500"
     * - "2025-03-01T12:30:05" (no designator, read as UTC)
     *
     * @return Parsed time point or nullopt if the text is not a timestamp
     */
    static std::optional<TimePoint> parse(std::string_view text);

    /// Current wall-clock time formatted with format()
    static std::string nowString() { return format(std::chrono::system_clock::now()); }
};

} // namespace beacon

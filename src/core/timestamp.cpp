#include <beacon/core/timestamp.h>

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace beacon {

namespace {

bool parseFixedInt(std::string_view s, size_t pos, size_t len, int& out) {
    if (pos + len > s.size()) {
        return false;
    }
    int v = 0;
    for (size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
        v = v * 10 + (s[i] - '0');
    }
    out = v;
    return true;
}

} // namespace

std::string Timestamp::format(const TimePoint& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_utc{};
    gmtime_r(&time_t, &tm_utc);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) %
              std::chrono::seconds(1);
    if (ms.count() < 0) {
        ms += std::chrono::seconds(1);
    }

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::optional<TimePoint> Timestamp::parse(std::string_view text) {
    // YYYY-MM-DDTHH:MM:SS is the mandatory prefix
    if (text.size() < 19 || text[4] != '-' || text[7] != '-' ||
        (text[10] != 'T' && text[10] != 't' && text[10] != ' ') || text[13] != ':' ||
        text[16] != ':') {
        return std::nullopt;
    }

    std::tm tm = {};
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!parseFixedInt(text, 0, 4, year) || !parseFixedInt(text, 5, 2, month) ||
        !parseFixedInt(text, 8, 2, day) || !parseFixedInt(text, 11, 2, hour) ||
        !parseFixedInt(text, 14, 2, minute) || !parseFixedInt(text, 17, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
        second > 60) {
        return std::nullopt;
    }
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

    size_t pos = 19;

    // Fractional seconds, truncated to microseconds
    std::chrono::microseconds fraction{0};
    if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
        ++pos;
        size_t start = pos;
        long long micros = 0;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (pos == start) {
            return std::nullopt;
        }
        while (digits < 6) {
            micros *= 10;
            ++digits;
        }
        fraction = std::chrono::microseconds(micros);
    }

    // Timezone designator
    std::chrono::minutes offset{0};
    if (pos < text.size()) {
        char c = text[pos];
        if (c == 'Z' || c == 'z') {
            ++pos;
        } else if (c == '+' || c == '-') {
            int sign = (c == '+') ? 1 : -1;
            int hours = 0, minutes = 0;
            if (!parseFixedInt(text, pos + 1, 2, hours)) {
                return std::nullopt;
            }
            pos += 3;
            if (pos < text.size() && text[pos] == ':') {
                ++pos;
            }
            if (pos < text.size()) {
                if (!parseFixedInt(text, pos, 2, minutes)) {
                    return std::nullopt;
                }
                pos += 2;
            }
            offset = std::chrono::minutes(sign * (hours * 60 + minutes));
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    std::time_t secs = timegm(&tm);
    if (secs == static_cast<std::time_t>(-1) && !(year == 1969 && month == 12 && day == 31)) {
        return std::nullopt;
    }

    auto tp = std::chrono::system_clock::from_time_t(secs);
    tp += std::chrono::duration_cast<std::chrono::system_clock::duration>(fraction);
    tp -= offset;
    return tp;
}

} // namespace beacon

#pragma once

// Tolerant parsing helpers for user-typed prices and loosely typed API payloads.
// Numbers may carry ',' as decimal separator; timestamps arrive in several shapes.

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace ValueParsing {

inline std::string_view trim(std::string_view str) {
    const auto notSpace = [](char c) { return c != ' ' && c != '\t' && c != '\n' && c != '\r'; };
    const auto first = std::find_if(str.begin(), str.end(), notSpace);
    const auto last = std::find_if(str.rbegin(), str.rend(), notSpace).base();
    if (first >= last) return {};
    return str.substr(static_cast<size_t>(first - str.begin()), static_cast<size_t>(last - first));
}

/**
 * Locale-independent decimal parse.
 * Accepts "2833.5", "2833,5" and "1,234.5" (',' is a thousands separator only
 * when a '.' is also present). The whole string must be consumed.
 * @return Finite value, or nullopt on empty/garbage/non-finite input
 */
inline std::optional<double> parseDecimal(std::string_view str) {
    str = trim(str);
    if (!str.empty() && str.front() == '+') str.remove_prefix(1);
    if (str.empty()) return std::nullopt;

    std::string normalized;
    normalized.reserve(str.size());
    const bool hasDot = str.find('.') != std::string_view::npos;
    for (char c : str) {
        if (c == ',') {
            if (!hasDot) normalized.push_back('.');
        } else {
            normalized.push_back(c);
        }
    }

    double value = 0.0;
    const char* begin = normalized.data();
    const char* end = begin + normalized.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) return std::nullopt;
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

// Largest timestamp accepted from the wire: +/-100 million days around the epoch
inline constexpr double MAX_EPOCH_MS = 8.64e15;

/**
 * Epoch milliseconds from a numeric timestamp: seconds, or milliseconds when
 * the value exceeds 1e12.
 * @return nullopt when non-finite or outside +/-MAX_EPOCH_MS
 */
inline std::optional<int64_t> epochMsFromNumber(double v) {
    if (!std::isfinite(v)) return std::nullopt;
    const double ms = v > 1e12 ? std::floor(v) : std::floor(v) * 1000.0;
    if (ms < -MAX_EPOCH_MS || ms > MAX_EPOCH_MS) return std::nullopt;
    return static_cast<int64_t>(ms);
}

/**
 * Rounds to the nearest int32.
 * @return nullopt when non-finite or outside the int32 range
 */
inline std::optional<int32_t> roundToInt32(double v) {
    if (!std::isfinite(v)) return std::nullopt;
    const double rounded = std::round(v);
    if (rounded < static_cast<double>(std::numeric_limits<int32_t>::min())
        || rounded > static_cast<double>(std::numeric_limits<int32_t>::max())) {
        return std::nullopt;
    }
    return static_cast<int32_t>(rounded);
}

/**
 * Parses two ASCII digits at pos; -1 when out of range or not digits.
 */
inline int twoDigits(std::string_view s, size_t pos) {
    if (pos + 1 >= s.size()) return -1;
    const char a = s[pos];
    const char b = s[pos + 1];
    if (a < '0' || a > '9' || b < '0' || b > '9') return -1;
    return (a - '0') * 10 + (b - '0');
}

/**
 * Epoch milliseconds from any timestamp shape the backend emits:
 *  - numeric epoch seconds, or milliseconds when the value exceeds 1e12,
 *    within +/-MAX_EPOCH_MS
 *  - "YYYY-MM-DD" (UTC midnight)
 *  - "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM]"
 *  - "YYYY-MM-DD HH:MM:SS[.fff] -0300"
 * @return nullopt when the string matches none of them
 */
inline std::optional<int64_t> parseTimestampMs(std::string_view raw) {
    const std::string_view str = trim(raw);
    if (str.empty()) return std::nullopt;

    if (const auto numeric = parseDecimal(str)) {
        return epochMsFromNumber(*numeric);
    }

    if (str.size() < 10 || str[4] != '-' || str[7] != '-') return std::nullopt;

    int yearValue = 0;
    auto [yp, yec] = std::from_chars(str.data(), str.data() + 4, yearValue);
    if (yec != std::errc() || yp != str.data() + 4) return std::nullopt;
    const int monthValue = twoDigits(str, 5);
    const int dayValue = twoDigits(str, 8);
    if (monthValue < 0 || dayValue < 0) return std::nullopt;

    using namespace std::chrono;
    const year_month_day ymd{year{yearValue}, month{static_cast<unsigned>(monthValue)},
                             day{static_cast<unsigned>(dayValue)}};
    if (!ymd.ok()) return std::nullopt;

    sys_time<milliseconds> tp{sys_days{ymd}};
    if (str.size() == 10) {
        return tp.time_since_epoch().count();
    }

    if ((str[10] != 'T' && str[10] != 't' && str[10] != ' ') || str.size() < 19) return std::nullopt;
    const int hourValue = twoDigits(str, 11);
    const int minuteValue = twoDigits(str, 14);
    const int secondValue = twoDigits(str, 17);
    if (hourValue < 0 || minuteValue < 0 || secondValue < 0 || str[13] != ':' || str[16] != ':') {
        return std::nullopt;
    }
    tp += hours(hourValue) + minutes(minuteValue) + seconds(secondValue);

    size_t pos = 19;
    if (pos < str.size() && str[pos] == '.') {
        ++pos;
        int64_t fraction = 0;
        int digits = 0;
        while (pos < str.size() && str[pos] >= '0' && str[pos] <= '9') {
            if (digits < 3) {
                fraction = fraction * 10 + (str[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        while (digits > 0 && digits < 3) {
            fraction *= 10;
            ++digits;
        }
        tp += milliseconds(fraction);
    }

    while (pos < str.size() && str[pos] == ' ') ++pos;
    if (pos < str.size()) {
        const char tz = str[pos];
        if (tz == 'Z' || tz == 'z') {
            ++pos;
        } else if (tz == '+' || tz == '-') {
            const int sign = (tz == '+') ? 1 : -1;
            ++pos;
            const int tzHours = twoDigits(str, pos);
            if (tzHours < 0) return std::nullopt;
            pos += 2;
            if (pos < str.size() && str[pos] == ':') ++pos;
            int tzMinutes = 0;
            if (pos < str.size()) {
                tzMinutes = twoDigits(str, pos);
                if (tzMinutes < 0) return std::nullopt;
                pos += 2;
            }
            // Local time = UTC + offset
            tp -= sign * (hours(tzHours) + minutes(tzMinutes));
        } else {
            return std::nullopt;
        }
        if (pos != str.size()) return std::nullopt;
    }

    return tp.time_since_epoch().count();
}

} // namespace ValueParsing

// include/option_screener/core/time_utils.hpp
#pragma once

#include <time.h>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>

namespace option_screener {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Parse a calendar date in YYYY-MM-DD form as UTC midnight
 *
 * Trailing time components (e.g. "2024-01-02 00:00:00") are ignored.
 *
 * @param text Date string
 * @return Timestamp, or nullopt when the text is not a valid date
 */
inline std::optional<std::chrono::system_clock::time_point> parse_iso_date(
    const std::string& text) {
    int year = 0, month = 0, day = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d", &year, &month, &day) != 3) {
        return std::nullopt;
    }
    if (year < 1900 || month < 1 || month > 12 || day < 1 || day > 31) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
#ifdef _WIN32
    std::time_t t = _mkgmtime(&tm);
#else
    std::time_t t = timegm(&tm);
#endif
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    // timegm normalizes out-of-range days (Feb 30 -> Mar 1); reject those
    if (tm.tm_mday != day || tm.tm_mon != month - 1) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(t);
}

/**
 * @brief Format a timestamp as YYYY-MM-DD in UTC
 */
inline std::string format_iso_date(const std::chrono::system_clock::time_point& tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm result{};
    safe_gmtime(&t, &result);

    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &result);
    return std::string(buffer);
}

}  // namespace core
}  // namespace option_screener

#pragma once

#include <time.h>
#include <chrono>
#include <string>
#include "margin_ledger/core/error.hpp"
#include "margin_ledger/core/types.hpp"

namespace margin_ledger {
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
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
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
 * @brief Get current time as a string with specified format
 *
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 * @return Formatted time string
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    std::tm result;

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief Format a timestamp as ISO-8601 UTC with a nanosecond fraction
 *
 * Example: 2026-10-17T08:15:02.123456789Z. The full fraction is always
 * written so that parse_timestamp(format_timestamp(t)) == t.
 *
 * @param ts Timestamp to format
 * @return Formatted string
 */
std::string format_timestamp(const Timestamp& ts);

/**
 * @brief Parse an ISO-8601 UTC timestamp
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS" with an optional fraction of 1-9 digits and
 * an optional trailing 'Z'.
 *
 * @param text String to parse
 * @return Parsed timestamp or JSON_PARSE_ERROR
 */
Result<Timestamp> parse_timestamp(const std::string& text);

/**
 * @brief Parse a duration string such as "500ms", "30s", "5m", "4h" or "1d"
 *
 * @param text Duration string, a non-negative integer followed by a unit
 * @return Parsed duration or CONFIGURATION_INVALID
 */
Result<Duration> parse_duration(const std::string& text);

/**
 * @brief Format a duration using the largest unit that divides it exactly
 * @param duration Duration to format
 * @return String accepted by parse_duration
 */
std::string format_duration(Duration duration);

}  // namespace core
}  // namespace margin_ledger

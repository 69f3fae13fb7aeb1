// src/core/time_utils.cpp

#include "margin_ledger/core/time_utils.hpp"
#include <cctype>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace margin_ledger {
namespace core {

std::string format_timestamp(const Timestamp& ts) {
    auto since_epoch = ts.time_since_epoch();
    auto secs = std::chrono::floor<std::chrono::seconds>(since_epoch);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - secs).count();

    std::time_t tt = static_cast<std::time_t>(secs.count());
    std::tm time_info;
    safe_gmtime(&tt, &time_info);

    char time_str[32];
    std::strftime(time_str, sizeof(time_str), "%Y-%m-%dT%H:%M:%S", &time_info);

    std::ostringstream ss;
    ss << time_str << "." << std::setw(9) << std::setfill('0') << nanos << "Z";
    return ss.str();
}

Result<Timestamp> parse_timestamp(const std::string& text) {
    std::tm time_info{};
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &time_info.tm_year,
                    &time_info.tm_mon, &time_info.tm_mday, &time_info.tm_hour,
                    &time_info.tm_min, &time_info.tm_sec, &consumed) != 6) {
        return make_error<Timestamp>(ErrorCode::JSON_PARSE_ERROR,
                                     "Invalid timestamp: '" + text + "'", "TimeUtils");
    }
    time_info.tm_year -= 1900;
    time_info.tm_mon -= 1;

    size_t pos = static_cast<size_t>(consumed);
    long long nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 9) {
                nanos = nanos * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) {
            return make_error<Timestamp>(ErrorCode::JSON_PARSE_ERROR,
                                         "Empty fraction in timestamp: '" + text + "'",
                                         "TimeUtils");
        }
        for (; digits < 9; ++digits) {
            nanos *= 10;
        }
    }
    if (pos < text.size() && text[pos] == 'Z') {
        ++pos;
    }
    if (pos != text.size()) {
        return make_error<Timestamp>(ErrorCode::JSON_PARSE_ERROR,
                                     "Trailing characters in timestamp: '" + text + "'",
                                     "TimeUtils");
    }

    std::time_t secs = timegm(&time_info);
    Timestamp ts{std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::seconds(secs) + std::chrono::nanoseconds(nanos))};
    return Result<Timestamp>(ts);
}

Result<Duration> parse_duration(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    if (pos == 0 || pos == text.size()) {
        return make_error<Duration>(ErrorCode::CONFIGURATION_INVALID,
                                    "Invalid duration: '" + text + "'", "TimeUtils");
    }

    long long count = 0;
    try {
        count = std::stoll(text.substr(0, pos));
    } catch (const std::exception& e) {
        return make_error<Duration>(ErrorCode::CONFIGURATION_INVALID,
                                    "Invalid duration: '" + text + "': " + e.what(), "TimeUtils");
    }

    const std::string unit = text.substr(pos);
    if (unit == "ms") {
        return Result<Duration>(Duration(count));
    }
    if (unit == "s") {
        return Result<Duration>(std::chrono::duration_cast<Duration>(std::chrono::seconds(count)));
    }
    if (unit == "m") {
        return Result<Duration>(std::chrono::duration_cast<Duration>(std::chrono::minutes(count)));
    }
    if (unit == "h") {
        return Result<Duration>(std::chrono::duration_cast<Duration>(std::chrono::hours(count)));
    }
    if (unit == "d") {
        return Result<Duration>(
            std::chrono::duration_cast<Duration>(std::chrono::hours(24 * count)));
    }

    return make_error<Duration>(ErrorCode::CONFIGURATION_INVALID,
                                "Unknown duration unit '" + unit + "' in '" + text + "'",
                                "TimeUtils");
}

std::string format_duration(Duration duration) {
    const long long ms = duration.count();
    constexpr long long kSecond = 1000;
    constexpr long long kMinute = 60 * kSecond;
    constexpr long long kHour = 60 * kMinute;
    constexpr long long kDay = 24 * kHour;

    if (ms != 0 && ms % kDay == 0)
        return std::to_string(ms / kDay) + "d";
    if (ms != 0 && ms % kHour == 0)
        return std::to_string(ms / kHour) + "h";
    if (ms != 0 && ms % kMinute == 0)
        return std::to_string(ms / kMinute) + "m";
    if (ms % kSecond == 0)
        return std::to_string(ms / kSecond) + "s";
    return std::to_string(ms) + "ms";
}

}  // namespace core
}  // namespace margin_ledger

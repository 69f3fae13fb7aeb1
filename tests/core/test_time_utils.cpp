#include <gtest/gtest.h>
#include <ctime>
#include <regex>
#include "margin_ledger/core/time_utils.hpp"

using namespace margin_ledger;
using namespace margin_ledger::core;

class TimeUtilsTest : public ::testing::Test {};

TEST_F(TimeUtilsTest, SafeGmtimeEpoch) {
    std::time_t epoch = 0;
    std::tm result;

    std::tm* ret = safe_gmtime(&epoch, &result);

    ASSERT_NE(ret, nullptr);
    EXPECT_EQ(result.tm_year, 70);
    EXPECT_EQ(result.tm_mon, 0);
    EXPECT_EQ(result.tm_mday, 1);
    EXPECT_EQ(result.tm_hour, 0);
}

TEST_F(TimeUtilsTest, FormattedTimeMatchesPattern) {
    std::string stamp = get_formatted_time("%Y%m%d%H%M%S", false);
    EXPECT_TRUE(std::regex_match(stamp, std::regex("\\d{14}"))) << stamp;
}

TEST_F(TimeUtilsTest, FormatTimestampIsIsoWithNanoseconds) {
    Timestamp ts{std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::seconds(1700000000) + std::chrono::nanoseconds(123456789))};

    std::string text = format_timestamp(ts);
    EXPECT_TRUE(std::regex_match(text, std::regex(
                                           "\\d{4}-\\d{2}-\\d{2}T\\d{2}:\\d{2}:\\d{2}\\.\\d{9}Z")))
        << text;
    EXPECT_EQ(text.substr(0, 19), "2023-11-14T22:13:20");
}

TEST_F(TimeUtilsTest, TimestampRoundTripIsLossless) {
    auto now = std::chrono::system_clock::now();
    auto parsed = parse_timestamp(format_timestamp(now));
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value(), now);
}

TEST_F(TimeUtilsTest, ParseTimestampVariants) {
    auto whole = parse_timestamp("2026-10-17T08:15:02");
    ASSERT_TRUE(whole.is_ok());

    auto with_zone = parse_timestamp("2026-10-17T08:15:02Z");
    ASSERT_TRUE(with_zone.is_ok());
    EXPECT_EQ(whole.value(), with_zone.value());

    auto millis = parse_timestamp("2026-10-17T08:15:02.5Z");
    ASSERT_TRUE(millis.is_ok());
    EXPECT_EQ(millis.value() - whole.value(), std::chrono::milliseconds(500));
}

TEST_F(TimeUtilsTest, ParseTimestampRejectsGarbage) {
    for (const std::string bad : {"", "yesterday", "2026-10-17", "2026-10-17T08:15:02.Z",
                                  "2026-10-17T08:15:02+01:00"}) {
        auto parsed = parse_timestamp(bad);
        ASSERT_TRUE(parsed.is_error()) << bad;
        EXPECT_EQ(parsed.error()->code(), ErrorCode::JSON_PARSE_ERROR);
    }
}

TEST_F(TimeUtilsTest, ParseDurationUnits) {
    EXPECT_EQ(parse_duration("500ms").value(), std::chrono::milliseconds(500));
    EXPECT_EQ(parse_duration("30s").value(), std::chrono::seconds(30));
    EXPECT_EQ(parse_duration("5m").value(), std::chrono::minutes(5));
    EXPECT_EQ(parse_duration("4h").value(), std::chrono::hours(4));
    EXPECT_EQ(parse_duration("1d").value(), std::chrono::hours(24));
}

TEST_F(TimeUtilsTest, ParseDurationRejectsInvalid) {
    for (const std::string bad : {"", "h", "10", "-5s", "1.5h", "3w"}) {
        auto parsed = parse_duration(bad);
        ASSERT_TRUE(parsed.is_error()) << bad;
        EXPECT_EQ(parsed.error()->code(), ErrorCode::CONFIGURATION_INVALID);
    }
}

TEST_F(TimeUtilsTest, FormatDurationPicksLargestUnit) {
    EXPECT_EQ(format_duration(std::chrono::hours(48)), "2d");
    EXPECT_EQ(format_duration(std::chrono::hours(4)), "4h");
    EXPECT_EQ(format_duration(std::chrono::minutes(90)), "90m");
    EXPECT_EQ(format_duration(std::chrono::seconds(5)), "5s");
    EXPECT_EQ(format_duration(std::chrono::milliseconds(1500)), "1500ms");
    EXPECT_EQ(format_duration(Duration(0)), "0s");
}

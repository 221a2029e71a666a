#include <gtest/gtest.h>
#include <chrono>
#include <ctime>
#include <regex>
#include "trade_store/core/time_utils.hpp"

using namespace trade_store;
using namespace trade_store::core;

class TimeUtilsTest : public ::testing::Test {};

TEST_F(TimeUtilsTest, SafeGmtimeEpochTime) {
    std::time_t epoch = 0;
    std::tm result;

    std::tm* ret = safe_gmtime(&epoch, &result);

    ASSERT_NE(ret, nullptr);
    EXPECT_EQ(ret, &result);
    EXPECT_EQ(result.tm_year, 70);
    EXPECT_EQ(result.tm_mon, 0);
    EXPECT_EQ(result.tm_mday, 1);
    EXPECT_EQ(result.tm_hour, 0);
}

TEST_F(TimeUtilsTest, SafeTimegmInvertsGmtime) {
    std::time_t original = 1700000000;
    std::tm broken_down;
    ASSERT_NE(safe_gmtime(&original, &broken_down), nullptr);

    EXPECT_EQ(safe_timegm(&broken_down), original);
}

TEST_F(TimeUtilsTest, GetFormattedTimeMatchesPattern) {
    std::string formatted = get_formatted_time("%Y-%m-%d %H:%M:%S", false);
    std::regex pattern(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2})");
    EXPECT_TRUE(std::regex_match(formatted, pattern)) << formatted;
}

TEST_F(TimeUtilsTest, MakeUtcTimestamp) {
    auto ts = make_utc_timestamp(1970, 1, 2);
    EXPECT_EQ(std::chrono::system_clock::to_time_t(ts), 86400);

    auto with_time = make_utc_timestamp(2017, 8, 17, 4, 0, 0);
    EXPECT_EQ(std::chrono::system_clock::to_time_t(with_time), 1502942400);
}

TEST_F(TimeUtilsTest, FormatWholeSeconds) {
    auto ts = make_utc_timestamp(2024, 1, 15, 10, 30, 0);
    EXPECT_EQ(format_timestamp(ts), "2024-01-15 10:30:00");
}

TEST_F(TimeUtilsTest, FormatWritesMicroseconds) {
    auto ts = make_utc_timestamp(2024, 1, 15, 10, 30, 0) + std::chrono::microseconds(42);
    EXPECT_EQ(format_timestamp(ts), "2024-01-15 10:30:00.000042");
}

TEST_F(TimeUtilsTest, ParseSqlForms) {
    auto date_only = parse_timestamp("2024-01-15");
    ASSERT_TRUE(date_only.is_ok()) << date_only.error()->what();
    EXPECT_EQ(date_only.value(), make_utc_timestamp(2024, 1, 15));

    auto with_time = parse_timestamp("2024-01-15 10:30:05");
    ASSERT_TRUE(with_time.is_ok()) << with_time.error()->what();
    EXPECT_EQ(with_time.value(), make_utc_timestamp(2024, 1, 15, 10, 30, 5));
}

TEST_F(TimeUtilsTest, ParseIsoFormWithFractionAndZulu) {
    auto parsed = parse_timestamp("2024-01-15T10:30:05.5Z");
    ASSERT_TRUE(parsed.is_ok()) << parsed.error()->what();
    EXPECT_EQ(parsed.value(),
              make_utc_timestamp(2024, 1, 15, 10, 30, 5) + std::chrono::milliseconds(500));
}

TEST_F(TimeUtilsTest, FormatAndParseAgree) {
    auto ts = make_utc_timestamp(2023, 12, 31, 23, 59, 59) + std::chrono::microseconds(123456);
    auto parsed = parse_timestamp(format_timestamp(ts));
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value(), ts);
}

TEST_F(TimeUtilsTest, ParseRejectsGarbage) {
    auto empty = parse_timestamp("");
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(empty.error()->code(), ErrorCode::CONVERSION_ERROR);

    EXPECT_TRUE(parse_timestamp("yesterday").is_error());
    EXPECT_TRUE(parse_timestamp("2024-01-15 10:30:00 extra").is_error());
    EXPECT_TRUE(parse_timestamp("2024-01-15 10:30:00.").is_error());
}

TEST_F(TimeUtilsTest, TruncateToMicros) {
    auto base = make_utc_timestamp(2024, 1, 15);
    auto fine = base + std::chrono::duration_cast<Timestamp::duration>(
                           std::chrono::nanoseconds(1500));

    EXPECT_EQ(truncate_to_micros(fine), base + std::chrono::microseconds(1));
    EXPECT_EQ(truncate_to_micros(base), base);
}

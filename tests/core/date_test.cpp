#include "hsync/core/date.hpp"
#include "hsync/core/error.hpp"

#include <gtest/gtest.h>

using hsync::Date;

TEST(DateTest, ParsesStrictIsoDates) {
    auto date = Date::parse("2025-01-04");
    ASSERT_TRUE(date.has_value());
    EXPECT_EQ(date->year(), 2025);
    EXPECT_EQ(date->month(), 1u);
    EXPECT_EQ(date->day(), 4u);
    EXPECT_EQ(date->to_string(), "2025-01-04");
}

TEST(DateTest, RejectsMalformedKeys) {
    EXPECT_FALSE(Date::parse("2025-1-04").has_value());
    EXPECT_FALSE(Date::parse("2025/01/04").has_value());
    EXPECT_FALSE(Date::parse("2025-13-01").has_value());
    EXPECT_FALSE(Date::parse("2023-02-29").has_value());
    EXPECT_FALSE(Date::parse("not a date").has_value());
    EXPECT_FALSE(Date::parse("").has_value());
    EXPECT_TRUE(Date::parse("2024-02-29").has_value());
}

TEST(DateTest, DayArithmeticCrossesMonthAndYear) {
    auto date = *Date::parse("2024-12-31");
    EXPECT_EQ(date.add_days(1).to_string(), "2025-01-01");
    EXPECT_EQ(date.add_days(-365).to_string(), "2024-01-01");
    EXPECT_EQ(date.days_until(*Date::parse("2025-03-01")), 60);
}

TEST(DateTest, WeekdayStartsOnSunday) {
    EXPECT_EQ(Date::parse("1970-01-01")->weekday(), 4u);   // Thursday
    EXPECT_EQ(Date::parse("2025-01-01")->weekday(), 3u);   // Wednesday
    EXPECT_EQ(Date::parse("2025-01-05")->weekday(), 0u);   // Sunday
    EXPECT_EQ(Date::parse("1969-12-31")->weekday(), 3u);
}

TEST(DateTest, TimestampParsingAndFormatting) {
    auto ts = hsync::parse_timestamp("2025-01-02 13:45:10");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(hsync::format_timestamp(*ts), "2025-01-02 13:45:10");
    EXPECT_EQ(Date::from_timestamp_utc(*ts).to_string(), "2025-01-02");

    auto midnight = hsync::parse_timestamp("2025-01-02");
    ASSERT_TRUE(midnight.has_value());
    EXPECT_EQ(hsync::format_timestamp(*midnight), "2025-01-02 00:00:00");

    EXPECT_FALSE(hsync::parse_timestamp("2025-01-02 25:00:00").has_value());
    EXPECT_FALSE(hsync::parse_timestamp("2025-01-02T10:00:00").has_value());
}

TEST(DateTest, UnixMillisRoundTrip) {
    auto ts = hsync::from_unix_millis(1735689600123);
    EXPECT_EQ(hsync::to_unix_millis(ts), 1735689600123);
    EXPECT_EQ(Date::from_timestamp_utc(ts).to_string(), "2025-01-01");
}

TEST(ErrorTest, SeverityFollowsCode) {
    EXPECT_EQ(hsync::severity_of(hsync::ErrorCode::InvalidDateKey), hsync::ErrorSeverity::RecoverablePerRecord);
    EXPECT_EQ(hsync::severity_of(hsync::ErrorCode::PersistFailed), hsync::ErrorSeverity::RecoverablePerCycle);
    EXPECT_EQ(hsync::severity_of(hsync::ErrorCode::RemoteFetchFailed), hsync::ErrorSeverity::FatalToRun);
    EXPECT_EQ(hsync::severity_of(hsync::ErrorCode::AlreadyMigrated), hsync::ErrorSeverity::FatalToRun);
    EXPECT_EQ(hsync::severity_of(hsync::ErrorCode::MissingRule), hsync::ErrorSeverity::ConfigurationGap);

    hsync::Error error{hsync::ErrorCode::CommitFailed, "disk full"};
    EXPECT_NE(error.describe().find("disk full"), std::string::npos);
}

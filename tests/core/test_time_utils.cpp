#include <gtest/gtest.h>
#include <chrono>
#include <ctime>
#include "mktflow/core/time_utils.hpp"

using namespace mktflow;
using namespace mktflow::core;

class TimeUtilsTest : public ::testing::Test {};

TEST_F(TimeUtilsTest, SafeGmtimeEpoch) {
    std::time_t epoch = 0;
    std::tm result;

    std::tm* ret = safe_gmtime(&epoch, &result);

    ASSERT_EQ(ret, &result);
    EXPECT_EQ(result.tm_year, 70);
    EXPECT_EQ(result.tm_mon, 0);
    EXPECT_EQ(result.tm_mday, 1);
    EXPECT_EQ(result.tm_wday, 4);  // Thursday
}

TEST_F(TimeUtilsTest, MakeTimestampMatchesGmtime) {
    Timestamp ts = make_timestamp(2024, 2, 29, 13, 45, 10);
    std::time_t time = std::chrono::system_clock::to_time_t(ts);
    std::tm result;
    ASSERT_NE(safe_gmtime(&time, &result), nullptr);

    EXPECT_EQ(result.tm_year, 124);
    EXPECT_EQ(result.tm_mon, 1);
    EXPECT_EQ(result.tm_mday, 29);
    EXPECT_EQ(result.tm_hour, 13);
    EXPECT_EQ(result.tm_min, 45);
    EXPECT_EQ(result.tm_sec, 10);
}

TEST_F(TimeUtilsTest, DayOfWeekAcrossWeek) {
    // 2024-01-07 is a Sunday
    EXPECT_EQ(day_of_week(make_timestamp(2024, 1, 7)), DayOfWeek::SUNDAY);
    EXPECT_EQ(day_of_week(make_timestamp(2024, 1, 8)), DayOfWeek::MONDAY);
    EXPECT_EQ(day_of_week(make_timestamp(2024, 1, 12, 23, 59, 59)), DayOfWeek::FRIDAY);
    EXPECT_EQ(day_of_week(make_timestamp(2024, 1, 13)), DayOfWeek::SATURDAY);
}

TEST_F(TimeUtilsTest, DayOfWeekBeforeEpoch) {
    // 1969-12-31 was a Wednesday
    EXPECT_EQ(day_of_week(make_timestamp(1969, 12, 31, 12, 0, 0)), DayOfWeek::WEDNESDAY);
    EXPECT_EQ(time_of_day(make_timestamp(1969, 12, 31, 12, 0, 0)), std::chrono::hours(12));
}

TEST_F(TimeUtilsTest, TimeOfDayKeepsSubSecondPrecision) {
    Timestamp ts = make_timestamp(2024, 1, 5, 15, 59, 59) + std::chrono::milliseconds(999);
    EXPECT_EQ(time_of_day(ts),
              std::chrono::hours(15) + std::chrono::minutes(59) + std::chrono::milliseconds(59999));
}

TEST_F(TimeUtilsTest, FloorToPeriod) {
    Timestamp ts = make_timestamp(2024, 1, 5, 10, 0, 37);
    EXPECT_EQ(floor_to(ts, std::chrono::minutes(1)), make_timestamp(2024, 1, 5, 10, 0, 0));
    EXPECT_EQ(floor_to(ts, std::chrono::seconds(1)), ts);
    EXPECT_EQ(floor_to(make_timestamp(1969, 12, 31, 23, 59, 30), std::chrono::minutes(1)),
              make_timestamp(1969, 12, 31, 23, 59, 0));
}

TEST_F(TimeUtilsTest, FormatTimestamp) {
    EXPECT_EQ(format_timestamp(make_timestamp(2024, 1, 5, 16, 0, 0)), "2024-01-05 16:00:00");
}

TEST_F(TimeUtilsTest, ParseAndFormatTimeOfDay) {
    auto parsed = parse_time_of_day("17:00:00");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value(), std::chrono::hours(17));

    auto short_form = parse_time_of_day("09:30");
    ASSERT_TRUE(short_form.is_ok());
    EXPECT_EQ(format_time_of_day(short_form.value()), "09:30:00");

    EXPECT_TRUE(parse_time_of_day("25:00:00").is_error());
    EXPECT_TRUE(parse_time_of_day("noon").is_error());
    EXPECT_TRUE(parse_time_of_day("10:00:00pm").is_error());
    EXPECT_TRUE(parse_time_of_day("09:30junk").is_error());
    EXPECT_TRUE(parse_time_of_day("09:30:").is_error());
    EXPECT_TRUE(parse_time_of_day(" 9:5").is_error());
    EXPECT_TRUE(parse_time_of_day("9:30").is_error());
    EXPECT_TRUE(parse_time_of_day("09:30:00.1234567").is_error());
}

TEST_F(TimeUtilsTest, SubSecondTimeOfDay) {
    const TimeOfDay close = std::chrono::hours(24) - std::chrono::microseconds(3600);
    EXPECT_EQ(format_time_of_day(close), "23:59:59.996400");
    EXPECT_EQ(parse_time_of_day("23:59:59.996400").value(), close);
    EXPECT_EQ(parse_time_of_day("12:00:00.5").value(),
              std::chrono::hours(12) + std::chrono::milliseconds(500));
    EXPECT_EQ(format_time_of_day(std::chrono::hours(12) + std::chrono::microseconds(7)),
              "12:00:00.000007");
}

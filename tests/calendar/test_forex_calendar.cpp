#include <gtest/gtest.h>
#include "mktflow/calendar/forex_calendar.hpp"
#include "mktflow/core/time_utils.hpp"

using namespace mktflow;
using core::make_timestamp;

// Week of 2024-01-05 (Friday) through 2024-01-11 (Thursday)
class ForexCalendarTest : public ::testing::Test {
protected:
    ForexCalendar calendar_;
};

TEST_F(ForexCalendarTest, FridayClosesAtFour) {
    EXPECT_TRUE(calendar_.is_open(make_timestamp(2024, 1, 5, 9, 0, 0)));
    EXPECT_TRUE(calendar_.is_open(make_timestamp(2024, 1, 5, 15, 59, 59)));
    EXPECT_TRUE(calendar_.is_open(make_timestamp(2024, 1, 5, 16, 0, 0) -
                                  std::chrono::microseconds(1)));
    EXPECT_FALSE(calendar_.is_open(make_timestamp(2024, 1, 5, 16, 0, 0)));
    EXPECT_FALSE(calendar_.is_open(make_timestamp(2024, 1, 5, 23, 59, 59)));
}

TEST_F(ForexCalendarTest, SaturdayAlwaysClosed) {
    for (int hour = 0; hour < 24; ++hour) {
        EXPECT_FALSE(calendar_.is_open(make_timestamp(2024, 1, 6, hour, 30, 0))) << hour;
    }
    EXPECT_FALSE(calendar_.is_open(make_timestamp(2024, 1, 6, 0, 0, 0)));
    EXPECT_FALSE(calendar_.is_trading_day(make_timestamp(2024, 1, 6, 12, 0, 0)));
}

TEST_F(ForexCalendarTest, SundayOpensAtFive) {
    EXPECT_FALSE(calendar_.is_open(make_timestamp(2024, 1, 7, 0, 0, 0)));
    EXPECT_FALSE(calendar_.is_open(make_timestamp(2024, 1, 7, 16, 59, 59)));
    EXPECT_TRUE(calendar_.is_open(make_timestamp(2024, 1, 7, 17, 0, 0)));
    EXPECT_TRUE(calendar_.is_open(make_timestamp(2024, 1, 7, 23, 59, 59)));
}

TEST_F(ForexCalendarTest, WeekdaysOpenAroundTheClock) {
    for (int day = 8; day <= 11; ++day) {
        EXPECT_TRUE(calendar_.is_open(make_timestamp(2024, 1, day, 0, 0, 0))) << day;
        EXPECT_TRUE(calendar_.is_open(make_timestamp(2024, 1, day, 12, 0, 0))) << day;
        EXPECT_TRUE(calendar_.is_open(make_timestamp(2024, 1, day, 23, 59, 59))) << day;
    }
}

TEST_F(ForexCalendarTest, TradingDayIgnoresTimeOfDay) {
    const TimeOfDay times[] = {TimeOfDay::zero(), std::chrono::hours(12),
                               std::chrono::hours(24) - std::chrono::microseconds(1)};

    // 2024-01-07 is a Sunday
    for (int offset = 0; offset < 7; ++offset) {
        const Timestamp midnight = make_timestamp(2024, 1, 7 + offset);
        const bool saturday = core::day_of_week(midnight) == DayOfWeek::SATURDAY;
        for (const auto& time : times) {
            EXPECT_EQ(calendar_.is_trading_day(midnight + time), !saturday)
                << to_string(core::day_of_week(midnight)) << " "
                << core::format_time_of_day(time);
        }
    }
}

TEST_F(ForexCalendarTest, RepeatedQueriesAgree) {
    auto instant = make_timestamp(2024, 1, 7, 16, 59, 59);
    bool first = calendar_.is_open(instant);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(calendar_.is_open(instant), first);
    }
}

TEST_F(ForexCalendarTest, SessionConstants) {
    EXPECT_EQ(ForexCalendar::TRADING_DAYS_PER_YEAR, 313);
    EXPECT_EQ(ForexCalendar::MARKET_OPEN, TimeOfDay::zero());
    EXPECT_LT(ForexCalendar::MARKET_CLOSE, std::chrono::hours(24));
    EXPECT_GT(ForexCalendar::MARKET_CLOSE, std::chrono::hours(24) - std::chrono::seconds(1));
}

// src/calendar/equity_calendar.cpp
#include "mktflow/calendar/equity_calendar.hpp"
#include "mktflow/core/time_utils.hpp"

namespace mktflow {

bool EquityCalendar::is_trading_day(const Timestamp& timestamp) const {
    const DayOfWeek day = core::day_of_week(timestamp);
    return day != DayOfWeek::SATURDAY && day != DayOfWeek::SUNDAY;
}

bool EquityCalendar::is_open(const Timestamp& timestamp) const {
    if (!is_trading_day(timestamp)) {
        return false;
    }

    const TimeOfDay time = core::time_of_day(timestamp);
    return time >= MARKET_OPEN && time < MARKET_CLOSE;
}

}  // namespace mktflow

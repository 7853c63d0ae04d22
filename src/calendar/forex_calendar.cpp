// src/calendar/forex_calendar.cpp
#include "mktflow/calendar/forex_calendar.hpp"
#include "mktflow/core/time_utils.hpp"

namespace mktflow {

bool ForexCalendar::is_trading_day(const Timestamp& timestamp) const {
    return core::day_of_week(timestamp) != DayOfWeek::SATURDAY;
}

bool ForexCalendar::is_open(const Timestamp& timestamp) const {
    if (!is_trading_day(timestamp)) {
        return false;
    }

    const DayOfWeek day = core::day_of_week(timestamp);
    const TimeOfDay time = core::time_of_day(timestamp);

    if (day == DayOfWeek::FRIDAY && time >= FRIDAY_CLOSE) {
        return false;
    }

    if (day == DayOfWeek::SUNDAY && time < SUNDAY_OPEN) {
        return false;
    }

    return true;
}

}  // namespace mktflow

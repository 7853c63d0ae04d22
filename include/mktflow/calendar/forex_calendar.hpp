// include/mktflow/calendar/forex_calendar.hpp
#pragma once

#include <chrono>
#include "mktflow/core/types.hpp"

namespace mktflow {

/**
 * @brief Spot FX session rules
 *
 * The market trades around the clock except for one weekly gap running from
 * Friday 16:00 up to Sunday 17:00 venue-local time. Saturday is closed at
 * every time of day.
 */
class ForexCalendar {
public:
    // 365 - Saturdays
    static constexpr int TRADING_DAYS_PER_YEAR = 313;

    static constexpr TimeOfDay MARKET_OPEN{0};
    // Officially no close, the market runs over midnight
    static constexpr TimeOfDay MARKET_CLOSE =
        std::chrono::hours(24) - std::chrono::microseconds(3600);

    static constexpr TimeOfDay FRIDAY_CLOSE = std::chrono::hours(16);
    static constexpr TimeOfDay SUNDAY_OPEN = std::chrono::hours(17);

    /**
     * @brief Whether the date of the instant has any trading at all
     */
    bool is_trading_day(const Timestamp& timestamp) const;

    /**
     * @brief Whether the market is open at the instant
     *
     * Friday closes at 16:00:00 inclusive; Sunday stays closed strictly
     * before 17:00:00.
     */
    bool is_open(const Timestamp& timestamp) const;
};

}  // namespace mktflow

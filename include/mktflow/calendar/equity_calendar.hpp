// include/mktflow/calendar/equity_calendar.hpp
#pragma once

#include <chrono>
#include "mktflow/core/types.hpp"

namespace mktflow {

/**
 * @brief US equity regular session, Monday to Friday 09:30 to 16:00
 */
class EquityCalendar {
public:
    static constexpr int TRADING_DAYS_PER_YEAR = 252;

    static constexpr TimeOfDay MARKET_OPEN = std::chrono::hours(9) + std::chrono::minutes(30);
    static constexpr TimeOfDay MARKET_CLOSE = std::chrono::hours(16);

    bool is_trading_day(const Timestamp& timestamp) const;

    /**
     * @brief Open from 09:30:00 inclusive to 16:00:00 exclusive on trading days
     */
    bool is_open(const Timestamp& timestamp) const;
};

}  // namespace mktflow

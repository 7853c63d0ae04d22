// include/mktflow/calendar/trading_calendar.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include "mktflow/calendar/equity_calendar.hpp"
#include "mktflow/calendar/forex_calendar.hpp"
#include "mktflow/core/config_base.hpp"
#include "mktflow/core/error.hpp"
#include "mktflow/core/types.hpp"

namespace mktflow {

/**
 * @brief Venues with a calendar profile
 */
enum class Venue {
    FOREX,
    EQUITY
};

/**
 * @brief Closed set of venue session rules
 */
using CalendarProfile = std::variant<ForexCalendar, EquityCalendar>;

std::string to_string(Venue venue);
Result<Venue> parse_venue(const std::string& name);

/**
 * @brief Calendar settings
 *
 * JSON form: {"venue": "FOREX", "market_open": "00:00:00", "market_close": "23:59:59"}
 * The nominal times are optional and default to the venue's own.
 */
struct CalendarConfig : public ConfigBase {
    Venue venue{Venue::FOREX};
    std::optional<TimeOfDay> market_open;
    std::optional<TimeOfDay> market_close;

    nlohmann::json to_json() const override;

    /**
     * @throws FlowError with INVALID_ARGUMENT for an unknown venue or a
     *         malformed time of day
     */
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Answers whether a venue is open at a given venue-local instant
 *
 * The open/closed decision is a pure function of the instant and the venue
 * profile. The nominal market open and close are advisory session markers
 * for display and statistics; they never gate is_open().
 */
class TradingCalendar {
public:
    /**
     * @brief Forex calendar
     */
    TradingCalendar();

    explicit TradingCalendar(CalendarProfile profile);

    static Result<TradingCalendar> from_config(const CalendarConfig& config);

    Venue venue() const;

    bool is_open(const Timestamp& timestamp) const;

    bool is_trading_day(const Timestamp& timestamp) const;

    /**
     * @brief Trading days per year used for annualizing statistics
     */
    int trading_days_per_year() const;

    TimeOfDay market_open() const {
        return market_open_;
    }
    void set_market_open(TimeOfDay open) {
        market_open_ = open;
    }

    TimeOfDay market_close() const {
        return market_close_;
    }
    void set_market_close(TimeOfDay close) {
        market_close_ = close;
    }

    /**
     * @brief Current venue-local time of the owning security
     */
    void set_local_time(Timestamp timestamp) {
        local_time_ = timestamp;
    }
    Timestamp local_time() const {
        return local_time_;
    }

    /**
     * @brief is_open() evaluated at local_time()
     */
    bool exchange_open() const {
        return is_open(local_time_);
    }

private:
    CalendarProfile profile_;
    TimeOfDay market_open_;
    TimeOfDay market_close_;
    Timestamp local_time_{};
};

}  // namespace mktflow

// src/calendar/trading_calendar.cpp
#include "mktflow/calendar/trading_calendar.hpp"
#include "mktflow/core/logger.hpp"
#include "mktflow/core/time_utils.hpp"

namespace mktflow {

std::string to_string(Venue venue) {
    switch (venue) {
        case Venue::FOREX:
            return "FOREX";
        case Venue::EQUITY:
            return "EQUITY";
        default:
            return "UNKNOWN";
    }
}

Result<Venue> parse_venue(const std::string& name) {
    if (name == "FOREX")
        return Venue::FOREX;
    if (name == "EQUITY")
        return Venue::EQUITY;
    return make_error<Venue>(ErrorCode::INVALID_ARGUMENT, "Unknown venue: " + name,
                             "TradingCalendar");
}

nlohmann::json CalendarConfig::to_json() const {
    nlohmann::json j;
    j["venue"] = to_string(venue);
    if (market_open)
        j["market_open"] = core::format_time_of_day(*market_open);
    if (market_close)
        j["market_close"] = core::format_time_of_day(*market_close);
    return j;
}

void CalendarConfig::from_json(const nlohmann::json& j) {
    if (j.contains("venue"))
        venue = parse_venue(j.at("venue").get<std::string>()).value();
    if (j.contains("market_open"))
        market_open = core::parse_time_of_day(j.at("market_open").get<std::string>()).value();
    if (j.contains("market_close"))
        market_close = core::parse_time_of_day(j.at("market_close").get<std::string>()).value();
}

TradingCalendar::TradingCalendar() : TradingCalendar(ForexCalendar{}) {}

TradingCalendar::TradingCalendar(CalendarProfile profile) : profile_(profile) {
    market_open_ = std::visit([](const auto& p) { return p.MARKET_OPEN; }, profile_);
    market_close_ = std::visit([](const auto& p) { return p.MARKET_CLOSE; }, profile_);
}

Result<TradingCalendar> TradingCalendar::from_config(const CalendarConfig& config) {
    TradingCalendar calendar;
    switch (config.venue) {
        case Venue::FOREX:
            calendar = TradingCalendar(ForexCalendar{});
            break;
        case Venue::EQUITY:
            calendar = TradingCalendar(EquityCalendar{});
            break;
        default:
            return make_error<TradingCalendar>(ErrorCode::INVALID_ARGUMENT,
                                               "Unsupported venue in calendar config",
                                               "TradingCalendar");
    }

    if (config.market_open)
        calendar.set_market_open(*config.market_open);
    if (config.market_close)
        calendar.set_market_close(*config.market_close);

    INFO("Trading calendar for " << to_string(config.venue) << ", nominal session "
                                 << core::format_time_of_day(calendar.market_open()) << "-"
                                 << core::format_time_of_day(calendar.market_close()));
    return calendar;
}

Venue TradingCalendar::venue() const {
    return std::holds_alternative<ForexCalendar>(profile_) ? Venue::FOREX : Venue::EQUITY;
}

bool TradingCalendar::is_open(const Timestamp& timestamp) const {
    return std::visit([&timestamp](const auto& p) { return p.is_open(timestamp); }, profile_);
}

bool TradingCalendar::is_trading_day(const Timestamp& timestamp) const {
    return std::visit([&timestamp](const auto& p) { return p.is_trading_day(timestamp); },
                      profile_);
}

int TradingCalendar::trading_days_per_year() const {
    return std::visit([](const auto& p) { return p.TRADING_DAYS_PER_YEAR; }, profile_);
}

}  // namespace mktflow

// include/mktflow/core/types.hpp

#pragma once

#include <chrono>
#include <string>
#include <variant>
#include "mktflow/core/error.hpp"

namespace mktflow {

/**
 * @brief Timestamp type for consistent time representation
 * Instants are naive venue-local times; no timezone is attached
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Quantity type for trade sizes and bar volume
 */
using Quantity = double;

/**
 * @brief Time elapsed since local midnight
 */
using TimeOfDay = std::chrono::microseconds;

/**
 * @brief Day of week, numbered like std::tm::tm_wday
 */
enum class DayOfWeek {
    SUNDAY = 0,
    MONDAY = 1,
    TUESDAY = 2,
    WEDNESDAY = 3,
    THURSDAY = 4,
    FRIDAY = 5,
    SATURDAY = 6
};

/**
 * @brief Single trade print
 */
struct Tick {
    Timestamp timestamp;
    std::string symbol;
    Price price{0.0};
    Quantity quantity{0.0};

    Tick() = default;
    Tick(Timestamp ts, std::string s, Price p, Quantity q)
        : timestamp(ts), symbol(std::move(s)), price(p), quantity(q) {}
};

/**
 * @brief OHLCV bar covering [timestamp, end_time)
 */
struct TradeBar {
    Timestamp timestamp;  // Bar start
    Timestamp end_time;
    std::string symbol;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    Quantity volume{0.0};

    TradeBar() = default;
    TradeBar(Timestamp ts, Timestamp end, std::string s, Price o, Price h, Price l, Price c,
             Quantity v)
        : timestamp(ts),
          end_time(end),
          symbol(std::move(s)),
          open(o),
          high(h),
          low(l),
          close(c),
          volume(v) {}

    std::chrono::system_clock::duration period() const {
        return end_time - timestamp;
    }
};

/**
 * @brief Any value that can travel through a consolidator
 */
using MarketData = std::variant<Tick, TradeBar>;

/**
 * @brief Type identity tag declared by consolidator inputs and outputs
 *
 * Values mirror the alternative index of MarketData.
 */
enum class DataType {
    TICK = 0,
    TRADE_BAR = 1
};

inline DataType data_type_of(const MarketData& data) {
    return static_cast<DataType>(data.index());
}

inline std::string to_string(DataType type) {
    switch (type) {
        case DataType::TICK:
            return "TICK";
        case DataType::TRADE_BAR:
            return "TRADE_BAR";
        default:
            return "UNKNOWN";
    }
}

inline Result<DataType> parse_data_type(const std::string& name) {
    if (name == "TICK")
        return DataType::TICK;
    if (name == "TRADE_BAR")
        return DataType::TRADE_BAR;
    return make_error<DataType>(ErrorCode::INVALID_ARGUMENT, "Unknown data type: " + name,
                                "DataType");
}

inline std::string to_string(DayOfWeek day) {
    switch (day) {
        case DayOfWeek::SUNDAY:
            return "Sunday";
        case DayOfWeek::MONDAY:
            return "Monday";
        case DayOfWeek::TUESDAY:
            return "Tuesday";
        case DayOfWeek::WEDNESDAY:
            return "Wednesday";
        case DayOfWeek::THURSDAY:
            return "Thursday";
        case DayOfWeek::FRIDAY:
            return "Friday";
        case DayOfWeek::SATURDAY:
            return "Saturday";
        default:
            return "Unknown";
    }
}

}  // namespace mktflow

// include/mktflow/core/time_utils.hpp
#pragma once

#include <time.h>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <regex>
#include <string>
#include "mktflow/core/error.hpp"
#include "mktflow/core/types.hpp"

namespace mktflow {
namespace core {

using Days = std::chrono::duration<int64_t, std::ratio<86400>>;

/**
 * @brief Thread-safe wrapper for localtime
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 *
 * Naive venue-local instants are stored on the UTC axis, so gmtime is the
 * correct breakdown for them.
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian date
 */
inline int64_t days_from_civil(int64_t year, unsigned month, unsigned day) {
    year -= month <= 2;
    const int64_t era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

/**
 * @brief Build a naive venue-local timestamp from calendar fields
 */
inline Timestamp make_timestamp(int year, unsigned month, unsigned day, int hour = 0,
                                int minute = 0, int second = 0) {
    auto days = Days(days_from_civil(year, month, day));
    auto since_epoch = std::chrono::duration_cast<std::chrono::system_clock::duration>(
        days + std::chrono::hours(hour) + std::chrono::minutes(minute) +
        std::chrono::seconds(second));
    return Timestamp(since_epoch);
}

inline DayOfWeek day_of_week(const Timestamp& timestamp) {
    const int64_t days = std::chrono::floor<Days>(timestamp.time_since_epoch()).count();
    // 1970-01-01 was a Thursday
    return static_cast<DayOfWeek>((days % 7 + 11) % 7);
}

inline TimeOfDay time_of_day(const Timestamp& timestamp) {
    const auto since_epoch = timestamp.time_since_epoch();
    const auto midnight = std::chrono::floor<Days>(since_epoch);
    return std::chrono::floor<TimeOfDay>(since_epoch - midnight);
}

/**
 * @brief Round a timestamp down to a multiple of period since the epoch
 */
inline Timestamp floor_to(const Timestamp& timestamp, std::chrono::system_clock::duration period) {
    auto remainder = timestamp.time_since_epoch() % period;
    if (remainder < std::chrono::system_clock::duration::zero()) {
        remainder += period;
    }
    return timestamp - remainder;
}

/**
 * @brief Format a naive timestamp as "YYYY-MM-DD HH:MM:SS"
 */
inline std::string format_timestamp(const Timestamp& timestamp) {
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm result;
    if (safe_gmtime(&time, &result) == nullptr) {
        return "invalid";
    }

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &result);
    return std::string(buffer);
}

/**
 * @brief Format a time of day as "HH:MM:SS", or "HH:MM:SS.ffffff" when it
 *        carries microseconds
 */
inline std::string format_time_of_day(const TimeOfDay& time) {
    const auto total_seconds = std::chrono::duration_cast<std::chrono::seconds>(time).count();
    const auto micros = (time - std::chrono::seconds(total_seconds)).count();
    char buffer[32];
    if (micros == 0) {
        std::snprintf(buffer, sizeof(buffer), "%02lld:%02lld:%02lld",
                      static_cast<long long>(total_seconds / 3600),
                      static_cast<long long>((total_seconds / 60) % 60),
                      static_cast<long long>(total_seconds % 60));
    } else {
        std::snprintf(buffer, sizeof(buffer), "%02lld:%02lld:%02lld.%06lld",
                      static_cast<long long>(total_seconds / 3600),
                      static_cast<long long>((total_seconds / 60) % 60),
                      static_cast<long long>(total_seconds % 60),
                      static_cast<long long>(micros));
    }
    return std::string(buffer);
}

/**
 * @brief Parse "HH:MM", "HH:MM:SS" or "HH:MM:SS.ffffff" into a time of day
 */
inline Result<TimeOfDay> parse_time_of_day(const std::string& text) {
    static const std::regex time_pattern(
        "(\\d{2}):(\\d{2})(?::(\\d{2})(?:\\.(\\d{1,6}))?)?");
    std::smatch matches;
    if (!std::regex_match(text, matches, time_pattern)) {
        return make_error<TimeOfDay>(ErrorCode::INVALID_ARGUMENT,
                                     "Malformed time of day: '" + text + "'", "TimeUtils");
    }

    const int hour = std::stoi(matches[1]);
    const int minute = std::stoi(matches[2]);
    const int second = matches[3].matched ? std::stoi(matches[3]) : 0;
    if (hour > 23 || minute > 59 || second > 59) {
        return make_error<TimeOfDay>(ErrorCode::INVALID_ARGUMENT,
                                     "Time of day out of range: '" + text + "'", "TimeUtils");
    }

    TimeOfDay micros{0};
    if (matches[4].matched) {
        // Right-pad the fraction to six digits
        std::string fraction = matches[4].str();
        fraction.append(6 - fraction.size(), '0');
        micros = TimeOfDay(std::stoll(fraction));
    }

    return TimeOfDay(std::chrono::hours(hour) + std::chrono::minutes(minute) +
                     std::chrono::seconds(second) + micros);
}

}  // namespace core
}  // namespace mktflow

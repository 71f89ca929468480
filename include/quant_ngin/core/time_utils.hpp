// include/quant_ngin/core/time_utils.hpp

#pragma once

#include <time.h>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>
#include "quant_ngin/core/error.hpp"
#include "quant_ngin/core/types.hpp"

namespace quant_ngin {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
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
 * @brief Get current local time as a string with specified strftime format
 */
inline std::string get_formatted_time(const char* format) {
    auto now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm result{};
    safe_localtime(&now_c, &result);

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian civil date
 */
inline long days_from_civil(int year, unsigned month, unsigned day) {
    year -= month <= 2 ? 1 : 0;
    const long era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long>(doe) - 719468;
}

/**
 * @brief Build a UTC-midnight timestamp for a calendar date
 */
inline Timestamp make_date(int year, unsigned month, unsigned day) {
    return Timestamp(std::chrono::hours(24 * days_from_civil(year, month, day)));
}

/**
 * @brief Parse a YYYY-MM-DD (or YYYYMMDD) date into a UTC-midnight timestamp
 */
inline Result<Timestamp> parse_date(const std::string& text) {
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2u-%2u%n", &year, &month, &day, &consumed) != 3 &&
        std::sscanf(text.c_str(), "%4d%2u%2u%n", &year, &month, &day, &consumed) != 3) {
        return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR, "Invalid date: '" + text + "'",
                                     "TimeUtils");
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                     "Date out of range: '" + text + "'", "TimeUtils");
    }
    return make_date(year, month, day);
}

/**
 * @brief Format a timestamp as YYYY-MM-DD in UTC
 */
inline std::string format_date(const Timestamp& ts) {
    auto time_t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    safe_gmtime(&time_t, &tm);
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm);
    return std::string(buffer);
}

/**
 * @brief Truncate a timestamp to the UTC calendar day it falls on
 */
inline Timestamp floor_to_day(const Timestamp& ts) {
    auto days = std::chrono::duration_cast<std::chrono::hours>(ts.time_since_epoch()).count();
    long whole_days = days >= 0 ? days / 24 : (days - 23) / 24;
    return Timestamp(std::chrono::hours(24 * whole_days));
}

}  // namespace core
}  // namespace quant_ngin

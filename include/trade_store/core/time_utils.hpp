#pragma once

#include <time.h>
#include <chrono>
#include <ctime>
#include <string>
#include "trade_store/core/error.hpp"
#include "trade_store/core/types.hpp"

namespace trade_store {
namespace core {

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
 * @brief Inverse of safe_gmtime: interpret a broken-down time as UTC
 */
inline std::time_t safe_timegm(std::tm* time_info) {
#ifdef _WIN32
    return _mkgmtime(time_info);
#else
    return timegm(time_info);
#endif
}

/**
 * @brief Get current time as a string with specified format
 *
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 * @return Formatted time string
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    std::tm result;

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief Truncate a timestamp to the microsecond resolution of a TIMESTAMP column
 */
inline Timestamp truncate_to_micros(const Timestamp& ts) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::floor<std::chrono::microseconds>(ts.time_since_epoch())));
}

/**
 * @brief Format a timestamp as UTC "YYYY-MM-DD HH:MM:SS[.ffffff]"
 *
 * The fractional part is written only when the sub-second component is non-zero.
 */
std::string format_timestamp(const Timestamp& ts);

/**
 * @brief Parse a UTC timestamp in SQL or ISO-8601 form
 *
 * Accepts "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS" and "YYYY-MM-DDTHH:MM:SS", each
 * optionally followed by up to six fractional digits and a trailing "Z".
 *
 * @param text Timestamp text
 * @return Result containing the parsed timestamp
 */
Result<Timestamp> parse_timestamp(const std::string& text);

/**
 * @brief Build a UTC timestamp from calendar fields
 */
Timestamp make_utc_timestamp(int year, int month, int day, int hour = 0, int minute = 0,
                             int second = 0);

}  // namespace core
}  // namespace trade_store

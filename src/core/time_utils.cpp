// src/core/time_utils.cpp

#include "trade_store/core/time_utils.hpp"
#include <cctype>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace trade_store {
namespace core {

std::string format_timestamp(const Timestamp& ts) {
    auto micros = std::chrono::floor<std::chrono::microseconds>(ts.time_since_epoch());
    auto secs = std::chrono::floor<std::chrono::seconds>(micros);
    auto fraction = (micros - secs).count();

    std::time_t time_c = static_cast<std::time_t>(secs.count());
    std::tm time_info{};
    safe_gmtime(&time_c, &time_info);

    std::ostringstream ss;
    ss << std::put_time(&time_info, "%Y-%m-%d %H:%M:%S");
    if (fraction != 0) {
        ss << '.' << std::setw(6) << std::setfill('0') << fraction;
    }
    return ss.str();
}

Result<Timestamp> parse_timestamp(const std::string& text) {
    std::tm time_info{};
    std::istringstream ss(text);

    ss >> std::get_time(&time_info, "%Y-%m-%d");
    if (ss.fail()) {
        return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                     "Invalid timestamp: '" + text + "'", "TimeUtils");
    }

    long long fraction_micros = 0;
    if (ss.peek() == ' ' || ss.peek() == 'T') {
        ss.get();
        ss >> std::get_time(&time_info, "%H:%M:%S");
        if (ss.fail()) {
            return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                         "Invalid time of day in timestamp: '" + text + "'",
                                         "TimeUtils");
        }

        if (ss.peek() == '.') {
            ss.get();
            int digits = 0;
            while (std::isdigit(ss.peek())) {
                char c = static_cast<char>(ss.get());
                if (digits < 6) {
                    fraction_micros = fraction_micros * 10 + (c - '0');
                }
                ++digits;
            }
            if (digits == 0) {
                return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                             "Empty fraction in timestamp: '" + text + "'",
                                             "TimeUtils");
            }
            for (int i = digits; i < 6; ++i) {
                fraction_micros *= 10;
            }
        }
    }

    if (ss.peek() == 'Z') {
        ss.get();
    }
    if (ss.peek() != std::char_traits<char>::eof()) {
        return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                     "Trailing characters in timestamp: '" + text + "'",
                                     "TimeUtils");
    }

    std::time_t seconds = safe_timegm(&time_info);
    auto ts = std::chrono::system_clock::from_time_t(seconds) +
              std::chrono::duration_cast<Timestamp::duration>(
                  std::chrono::microseconds(fraction_micros));
    return Result<Timestamp>(ts);
}

Timestamp make_utc_timestamp(int year, int month, int day, int hour, int minute, int second) {
    std::tm time_info{};
    time_info.tm_year = year - 1900;
    time_info.tm_mon = month - 1;
    time_info.tm_mday = day;
    time_info.tm_hour = hour;
    time_info.tm_min = minute;
    time_info.tm_sec = second;
    return std::chrono::system_clock::from_time_t(safe_timegm(&time_info));
}

}  // namespace core
}  // namespace trade_store

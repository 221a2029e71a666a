// src/data/price_collection.cpp

#include "trade_store/data/price_collection.hpp"
#include <cctype>
#include <stdexcept>
#include "trade_store/core/logger.hpp"
#include "trade_store/core/time_utils.hpp"

namespace trade_store {

Timestamp default_history_start() {
    return core::make_utc_timestamp(2017, 8, 17);
}

const std::vector<std::string>& standard_intervals() {
    static const std::vector<std::string> intervals = {
        "1s", "1m", "3m", "5m", "15m", "30m", "1h", "2h",
        "4h", "6h", "8h", "12h", "1d", "3d", "1w", "1M"};
    return intervals;
}

Result<std::chrono::seconds> parse_interval(const std::string& label) {
    auto invalid = [&label](const std::string& why) {
        return make_error<std::chrono::seconds>(ErrorCode::INVALID_ARGUMENT,
                                                "Invalid interval '" + label + "': " + why,
                                                "PriceCollection");
    };

    if (label.size() < 2) {
        return invalid("expected <count><unit>");
    }

    const std::string digits = label.substr(0, label.size() - 1);
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return invalid("count must be a positive integer");
        }
    }

    long long count = 0;
    try {
        count = std::stoll(digits);
    } catch (const std::out_of_range&) {
        return invalid("count is too large");
    }
    if (count <= 0) {
        return invalid("count must be a positive integer");
    }

    long long unit_seconds = 0;
    switch (label.back()) {
        case 's':
            unit_seconds = 1;
            break;
        case 'm':
            unit_seconds = 60;
            break;
        case 'h':
            unit_seconds = 3600;
            break;
        case 'd':
            unit_seconds = 86400;
            break;
        case 'w':
            unit_seconds = 7 * 86400;
            break;
        case 'M':
            unit_seconds = 30 * 86400;
            break;
        default:
            return invalid("unit must be one of s m h d w M");
    }

    // Bars must stay representable when added to a Timestamp
    const long long max_seconds =
        std::chrono::duration_cast<std::chrono::seconds>(Timestamp::duration::max()).count();
    if (count > max_seconds / unit_seconds) {
        return invalid("count is too large");
    }
    return Result<std::chrono::seconds>(std::chrono::seconds(count * unit_seconds));
}

Result<FetchCursor> next_fetch_start(TradingStore& store, const std::string& symbol,
                                     const std::string& interval) {
    ComponentScope scope("PriceCollection");
    auto length = parse_interval(interval);
    if (length.is_error()) {
        return forward_error<FetchCursor>(length);
    }

    auto last = store.get_last_open_time(symbol, interval);
    if (last.is_error()) {
        return forward_error<FetchCursor>(last);
    }

    FetchCursor cursor{symbol, interval, default_history_start(), false};
    if (last.value()) {
        if (*last.value() > Timestamp::max() - length.value()) {
            return make_error<FetchCursor>(ErrorCode::INVALID_ARGUMENT,
                                           "Interval " + interval + " overflows the last open time",
                                           "PriceCollection");
        }
        cursor.start = *last.value() + length.value();
        cursor.has_history = true;
    }
    DEBUG("Next fetch for " << symbol << " " << interval << " starts at "
                            << core::format_timestamp(cursor.start));
    return cursor;
}

Result<std::vector<FetchCursor>> plan_collection(TradingStore& store,
                                                 const std::vector<std::string>& symbols,
                                                 const std::vector<std::string>& intervals) {
    std::vector<FetchCursor> plan;
    plan.reserve(symbols.size() * intervals.size());
    for (const auto& symbol : symbols) {
        for (const auto& interval : intervals) {
            auto cursor = next_fetch_start(store, symbol, interval);
            if (cursor.is_error()) {
                return forward_error<std::vector<FetchCursor>>(cursor);
            }
            plan.push_back(cursor.value());
        }
    }
    return plan;
}

}  // namespace trade_store

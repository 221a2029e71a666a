// include/trade_store/data/price_collection.hpp

#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "trade_store/core/error.hpp"
#include "trade_store/core/types.hpp"
#include "trade_store/data/store_interface.hpp"

namespace trade_store {

/**
 * @brief Where incremental bar collection resumes for one symbol and interval
 */
struct FetchCursor {
    std::string symbol;
    std::string interval;
    Timestamp start;
    bool has_history{false};  // false when no bar is stored yet
};

/**
 * @brief First open_time requested when a series has no stored bars (2017-08-17 UTC)
 */
Timestamp default_history_start();

/**
 * @brief Exchange interval labels in ascending length: 1s 1m 3m ... 1w 1M
 */
const std::vector<std::string>& standard_intervals();

/**
 * @brief Length of one bar for an interval label
 *
 * Labels are "<n><unit>" with unit s, m, h, d, w or M; a month counts as 30 days.
 *
 * @param label Interval label such as "15m" or "1d"
 * @return Result containing the duration, INVALID_ARGUMENT for a malformed label
 */
Result<std::chrono::seconds> parse_interval(const std::string& label);

/**
 * @brief Open time of the next bar to fetch
 * @return last stored open_time + interval, or default_history_start() when empty
 */
Result<FetchCursor> next_fetch_start(TradingStore& store, const std::string& symbol,
                                     const std::string& interval);

/**
 * @brief One cursor per symbol and interval, symbols outermost
 */
Result<std::vector<FetchCursor>> plan_collection(TradingStore& store,
                                                 const std::vector<std::string>& symbols,
                                                 const std::vector<std::string>& intervals);

}  // namespace trade_store

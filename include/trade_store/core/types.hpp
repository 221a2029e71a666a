// include/trade_store/core/types.hpp

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace trade_store {

/**
 * @brief Timestamp type for consistent time representation
 * Stored values are UTC wall-clock times with microsecond resolution
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Quantity type for trade and position sizes
 * Double to support fractional quantities
 */
using Quantity = double;

/**
 * @brief Caller-assigned account identifier
 */
using AccountId = std::int64_t;

/**
 * @brief Engine-assigned surrogate key
 */
using RowId = std::int64_t;

/**
 * @brief Table names of the trading schema
 */
namespace tables {
constexpr const char* ACCOUNTS = "accounts";
constexpr const char* TRADES = "trades";
constexpr const char* POSITIONS = "positions";
constexpr const char* PRICE_DATA = "price_data";
constexpr const char* STRATEGY_SIGNALS = "strategy_signals";
constexpr const char* PORTFOLIO_HISTORY = "portfolio_history";
}  // namespace tables

}  // namespace trade_store

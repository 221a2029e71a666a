// include/trade_store/schema/records.hpp

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "trade_store/core/types.hpp"

namespace trade_store {

// Stored rows carry every column. The New* structs are insert requests: an
// empty optional means "not supplied" and lets the column DEFAULT apply.

/**
 * @brief One trading account (accounts)
 */
struct Account {
    AccountId account_id{0};
    std::string owner;
    Timestamp created_at;
    double cash_balance{0.0};
    double margin_requirement{0.0};
    double margin_used{0.0};
    std::optional<Timestamp> last_update;
};

struct NewAccount {
    AccountId account_id{0};
    std::string owner;
    std::optional<Timestamp> created_at;
    std::optional<double> cash_balance;
    std::optional<double> margin_requirement;
    std::optional<double> margin_used;
    std::optional<Timestamp> last_update;
};

/**
 * @brief Mutable balance-sheet columns of an account
 */
struct AccountBalances {
    double cash_balance{0.0};
    double margin_requirement{0.0};
    double margin_used{0.0};
    Timestamp last_update;
};

/**
 * @brief One executed fill (trades). Immutable once written.
 */
struct Trade {
    RowId trade_id{0};
    AccountId account_id{0};
    std::string symbol;
    Timestamp timestamp;
    std::string side;
    Quantity quantity{0.0};
    Price price{0.0};
    double fee{0.0};
    double realized_pl{0.0};
    std::optional<std::string> strategy_name;
};

struct NewTrade {
    AccountId account_id{0};
    std::string symbol;
    Timestamp timestamp;
    std::string side;
    Quantity quantity{0.0};
    Price price{0.0};
    std::optional<double> fee;
    std::optional<double> realized_pl;
    std::optional<std::string> strategy_name;
};

/**
 * @brief Long and short legs of one symbol within one account (positions)
 */
struct Position {
    RowId position_id{0};
    AccountId account_id{0};
    std::string symbol;
    Quantity long_qty{0.0};
    Quantity short_qty{0.0};
    double long_cost_basis{0.0};
    double short_cost_basis{0.0};
    double short_margin_used{0.0};
    Timestamp opened_at;
    std::optional<Timestamp> closed_at;

    bool is_open() const {
        return !closed_at.has_value();
    }
};

struct NewPosition {
    AccountId account_id{0};
    std::string symbol;
    std::optional<Quantity> long_qty;
    std::optional<Quantity> short_qty;
    std::optional<double> long_cost_basis;
    std::optional<double> short_cost_basis;
    std::optional<double> short_margin_used;
    Timestamp opened_at;
    std::optional<Timestamp> closed_at;
};

/**
 * @brief Quantity and cost-basis columns rewritten on each fill
 */
struct PositionQuantities {
    Quantity long_qty{0.0};
    Quantity short_qty{0.0};
    double long_cost_basis{0.0};
    double short_cost_basis{0.0};
    double short_margin_used{0.0};
};

/**
 * @brief One OHLCV bar (price_data)
 */
struct PriceDatum {
    RowId id{0};
    std::string symbol;
    std::string interval;
    Timestamp open_time;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};
    Timestamp close_time;
    std::optional<double> quote_volume;
    std::optional<std::int64_t> count;
    std::optional<double> taker_buy_volume;
    std::optional<double> taker_buy_quote_volume;
};

struct NewPriceDatum {
    std::string symbol;
    std::string interval;
    Timestamp open_time;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};
    Timestamp close_time;
    std::optional<double> quote_volume;
    std::optional<std::int64_t> count;
    std::optional<double> taker_buy_volume;
    std::optional<double> taker_buy_quote_volume;
};

/**
 * @brief One signal emitted by a named strategy (strategy_signals)
 *
 * metrics is opaque text; see signal_metrics.hpp for the JSON codec.
 */
struct StrategySignal {
    RowId signal_id{0};
    std::string symbol;
    std::string interval;
    Timestamp timestamp;
    std::string strategy_name;
    std::string signal;
    std::optional<double> confidence;
    std::optional<std::string> metrics;
};

struct NewStrategySignal {
    std::string symbol;
    std::string interval;
    Timestamp timestamp;
    std::string strategy_name;
    std::string signal;
    std::optional<double> confidence;
    std::optional<std::string> metrics;
};

/**
 * @brief One valuation snapshot of an account (portfolio_history)
 */
struct PortfolioHistoryRecord {
    RowId record_id{0};
    AccountId account_id{0};
    Timestamp timestamp;
    double portfolio_value{0.0};
    std::optional<double> long_exposure;
    std::optional<double> short_exposure;
    std::optional<double> gross_exposure;
    std::optional<double> net_exposure;
    std::optional<double> long_short_ratio;
};

struct NewPortfolioHistoryRecord {
    AccountId account_id{0};
    Timestamp timestamp;
    double portfolio_value{0.0};
    std::optional<double> long_exposure;
    std::optional<double> short_exposure;
    std::optional<double> gross_exposure;
    std::optional<double> net_exposure;
    std::optional<double> long_short_ratio;
};

// Row <-> JSON, keyed by column name. Used by MemoryStore snapshots.
// from_json throws nlohmann::json::exception on missing required columns.
void to_json(nlohmann::json& j, const Account& account);
void from_json(const nlohmann::json& j, Account& account);
void to_json(nlohmann::json& j, const Trade& trade);
void from_json(const nlohmann::json& j, Trade& trade);
void to_json(nlohmann::json& j, const Position& position);
void from_json(const nlohmann::json& j, Position& position);
void to_json(nlohmann::json& j, const PriceDatum& datum);
void from_json(const nlohmann::json& j, PriceDatum& datum);
void to_json(nlohmann::json& j, const StrategySignal& signal);
void from_json(const nlohmann::json& j, StrategySignal& signal);
void to_json(nlohmann::json& j, const PortfolioHistoryRecord& record);
void from_json(const nlohmann::json& j, PortfolioHistoryRecord& record);

}  // namespace trade_store

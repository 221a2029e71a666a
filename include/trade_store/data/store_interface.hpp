// include/trade_store/data/store_interface.hpp

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "trade_store/core/error.hpp"
#include "trade_store/core/types.hpp"
#include "trade_store/schema/records.hpp"
#include "trade_store/schema/schema_migration.hpp"

namespace trade_store {

/**
 * @brief Abstract interface of the trading record store
 * Defines the contract that any storage engine must fulfill
 *
 * Every operation on a disconnected store fails with CONNECTION_ERROR.
 * Constraint violations are reported as NOT_NULL_VIOLATION, UNIQUE_VIOLATION
 * or FOREIGN_KEY_VIOLATION and leave the store unchanged.
 */
class TradingStore {
public:
    virtual ~TradingStore() = default;

    /**
     * @brief Connect to the storage engine
     * @return Result indicating success or failure
     */
    virtual Result<void> connect() = 0;

    /**
     * @brief Disconnect from the storage engine
     */
    virtual void disconnect() = 0;

    /**
     * @brief Check if connected
     * @return True if connected
     */
    virtual bool is_connected() const = 0;

    // ============================================================================
    // SCHEMA
    // ============================================================================

    /**
     * @brief Create every table of the trading schema that does not exist yet
     * @return Result indicating success or failure
     */
    virtual Result<void> initialize_schema() = 0;

    /**
     * @brief Read the live catalog (table name to column names)
     * @return Result containing the catalog of trading-schema tables that exist
     */
    virtual Result<ExistingSchema> describe_schema() = 0;

    /**
     * @brief Create missing tables and add missing columns
     * @return Result containing the steps that were applied, in order
     */
    virtual Result<std::vector<MigrationStep>> migrate_schema() = 0;

    // ============================================================================
    // ACCOUNTS
    // ============================================================================

    /**
     * @brief Insert an account with a caller-assigned id
     * @param account Account to insert; unset balances default to 0,
     *                unset created_at defaults to the insertion time
     * @return Result containing the stored row, UNIQUE_VIOLATION if the id is taken
     */
    virtual Result<Account> create_account(const NewAccount& account) = 0;

    /**
     * @brief Fetch one account
     * @return Result containing the row, DATA_NOT_FOUND if absent
     */
    virtual Result<Account> get_account(AccountId account_id) = 0;

    /**
     * @brief All accounts ordered by account_id
     */
    virtual Result<std::vector<Account>> list_accounts() = 0;

    /**
     * @brief Overwrite the balance columns and last_update of an account
     * @return Result containing the updated row, DATA_NOT_FOUND if absent
     */
    virtual Result<Account> update_account_balances(AccountId account_id,
                                                    const AccountBalances& balances) = 0;

    // ============================================================================
    // TRADES
    // ============================================================================

    /**
     * @brief Append a trade
     * @return Result containing the stored row, FOREIGN_KEY_VIOLATION for an unknown account
     */
    virtual Result<Trade> insert_trade(const NewTrade& trade) = 0;

    /**
     * @brief Trades of one account ordered by trade_id
     */
    virtual Result<std::vector<Trade>> get_trades(AccountId account_id) = 0;

    /**
     * @brief Append a trade and update the owning account in one transaction
     *
     * Either both writes happen or neither does.
     *
     * @param trade Trade to append
     * @param balances New balances of trade.account_id
     * @return Result containing the stored trade
     */
    virtual Result<Trade> record_trade(const NewTrade& trade, const AccountBalances& balances) = 0;

    // ============================================================================
    // POSITIONS
    // ============================================================================

    /**
     * @brief Open a position; unset quantities and cost bases default to 0
     * @return Result containing the stored row, FOREIGN_KEY_VIOLATION for an unknown account
     */
    virtual Result<Position> open_position(const NewPosition& position) = 0;

    /**
     * @brief Fetch one position
     * @return Result containing the row, DATA_NOT_FOUND if absent
     */
    virtual Result<Position> get_position(RowId position_id) = 0;

    /**
     * @brief Positions of one account with closed_at unset, ordered by position_id
     */
    virtual Result<std::vector<Position>> get_open_positions(AccountId account_id) = 0;

    /**
     * @brief Rewrite the quantity and cost-basis columns of a position
     * @return Result containing the updated row
     */
    virtual Result<Position> update_position(RowId position_id,
                                             const PositionQuantities& quantities) = 0;

    /**
     * @brief Close a position by setting closed_at; opened_at is left as is
     * @return Result containing the updated row, INVALID_ARGUMENT if already closed
     */
    virtual Result<Position> close_position(RowId position_id, const Timestamp& closed_at) = 0;

    // ============================================================================
    // PRICE DATA
    // ============================================================================

    /**
     * @brief Append one bar. Duplicate (symbol, interval, open_time) is accepted.
     */
    virtual Result<PriceDatum> insert_price_datum(const NewPriceDatum& datum) = 0;

    /**
     * @brief Append a batch of bars in one transaction; an empty batch is a no-op
     * @return Result containing the stored rows in input order
     */
    virtual Result<std::vector<PriceDatum>> insert_price_data(
        const std::vector<NewPriceDatum>& data) = 0;

    /**
     * @brief Bars with open_time in [start, end] ordered by open_time then id
     * @return Result containing the rows, INVALID_ARGUMENT if start is after end
     */
    virtual Result<std::vector<PriceDatum>> get_price_data(const std::string& symbol,
                                                           const std::string& interval,
                                                           const Timestamp& start,
                                                           const Timestamp& end) = 0;

    /**
     * @brief Latest open_time stored for a symbol and interval
     * @return Result containing the timestamp, or nullopt when there are no bars
     */
    virtual Result<std::optional<Timestamp>> get_last_open_time(const std::string& symbol,
                                                                const std::string& interval) = 0;

    // ============================================================================
    // STRATEGY SIGNALS
    // ============================================================================

    virtual Result<StrategySignal> insert_signal(const NewStrategySignal& signal) = 0;

    /**
     * @brief Signals of one strategy for a symbol and interval ordered by timestamp then id
     */
    virtual Result<std::vector<StrategySignal>> get_signals(const std::string& strategy_name,
                                                            const std::string& symbol,
                                                            const std::string& interval) = 0;

    // ============================================================================
    // PORTFOLIO HISTORY
    // ============================================================================

    /**
     * @brief Append a valuation snapshot
     * @return Result containing the stored row, FOREIGN_KEY_VIOLATION for an unknown account
     */
    virtual Result<PortfolioHistoryRecord> insert_portfolio_snapshot(
        const NewPortfolioHistoryRecord& record) = 0;

    /**
     * @brief Snapshots of one account ordered by timestamp then record_id
     */
    virtual Result<std::vector<PortfolioHistoryRecord>> get_portfolio_history(
        AccountId account_id) = 0;

protected:
    /**
     * @brief Helper method to validate an inclusive date range
     * @param start_date Start date
     * @param end_date End date
     * @return Result indicating if date range is valid
     */
    virtual Result<void> validate_date_range(const Timestamp& start_date,
                                             const Timestamp& end_date) const {
        if (start_date > end_date) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Start date must not be after end date", "TradingStore");
        }
        return Result<void>();
    }
};

}  // namespace trade_store

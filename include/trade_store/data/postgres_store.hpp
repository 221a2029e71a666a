// include/trade_store/data/postgres_store.hpp

#pragma once

#include <arrow/api.h>
#include <memory>
#include <mutex>
#include <optional>
#include <pqxx/pqxx>
#include <string>
#include <vector>
#include "trade_store/core/error.hpp"
#include "trade_store/core/logger.hpp"
#include "trade_store/core/types.hpp"
#include "trade_store/data/store_interface.hpp"

namespace trade_store {

/**
 * @brief Trading store backed by PostgreSQL
 *
 * One connection per object, serialized by a mutex; use DatabasePool for
 * concurrency. The session time zone is set to UTC on connect so TIMESTAMP
 * columns hold UTC wall-clock values.
 */
class PostgresStore : public TradingStore {
public:
    /**
     * @brief Constructor
     * @param connection_string libpq connection string or URI
     */
    explicit PostgresStore(std::string connection_string);

    /**
     * @brief Destructor
     */
    ~PostgresStore() override;

    // Delete copy and move operations
    PostgresStore(const PostgresStore&) = delete;
    PostgresStore& operator=(const PostgresStore&) = delete;
    PostgresStore(PostgresStore&&) = delete;
    PostgresStore& operator=(PostgresStore&&) = delete;

    /**
     * @brief Connect to the database
     * @return Result indicating success or failure
     */
    Result<void> connect() override;

    /**
     * @brief Disconnect from the database
     */
    void disconnect() override;

    /**
     * @brief Check if the database connection is active
     * @return True if connected, false otherwise
     */
    bool is_connected() const override;

    Result<void> initialize_schema() override;

    /**
     * @brief Read trading-schema tables and columns from information_schema.columns
     */
    Result<ExistingSchema> describe_schema() override;

    Result<std::vector<MigrationStep>> migrate_schema() override;

    Result<Account> create_account(const NewAccount& account) override;
    Result<Account> get_account(AccountId account_id) override;
    Result<std::vector<Account>> list_accounts() override;
    Result<Account> update_account_balances(AccountId account_id,
                                            const AccountBalances& balances) override;

    Result<Trade> insert_trade(const NewTrade& trade) override;
    Result<std::vector<Trade>> get_trades(AccountId account_id) override;
    Result<Trade> record_trade(const NewTrade& trade, const AccountBalances& balances) override;

    Result<Position> open_position(const NewPosition& position) override;
    Result<Position> get_position(RowId position_id) override;
    Result<std::vector<Position>> get_open_positions(AccountId account_id) override;
    Result<Position> update_position(RowId position_id,
                                     const PositionQuantities& quantities) override;
    Result<Position> close_position(RowId position_id, const Timestamp& closed_at) override;

    Result<PriceDatum> insert_price_datum(const NewPriceDatum& datum) override;
    Result<std::vector<PriceDatum>> insert_price_data(
        const std::vector<NewPriceDatum>& data) override;
    Result<std::vector<PriceDatum>> get_price_data(const std::string& symbol,
                                                   const std::string& interval,
                                                   const Timestamp& start,
                                                   const Timestamp& end) override;
    Result<std::optional<Timestamp>> get_last_open_time(const std::string& symbol,
                                                        const std::string& interval) override;

    Result<StrategySignal> insert_signal(const NewStrategySignal& signal) override;
    Result<std::vector<StrategySignal>> get_signals(const std::string& strategy_name,
                                                    const std::string& symbol,
                                                    const std::string& interval) override;

    Result<PortfolioHistoryRecord> insert_portfolio_snapshot(
        const NewPortfolioHistoryRecord& record) override;
    Result<std::vector<PortfolioHistoryRecord>> get_portfolio_history(
        AccountId account_id) override;

    /**
     * @brief Execute a query and return the result as an Arrow table
     *
     * Every column comes back as utf8; NULL becomes an Arrow null.
     *
     * @param query SQL query to execute
     * @return Result containing the Arrow table
     */
    Result<std::shared_ptr<arrow::Table>> execute_query(const std::string& query);

    /**
     * @brief Execute a direct SQL statement without Arrow table conversion
     * @param query SQL statement to execute
     * @return Result indicating success or failure
     */
    Result<void> execute_direct_query(const std::string& query);

    /**
     * @brief Get the connection string
     * @return Connection string
     */
    const std::string& get_connection_string() const {
        return connection_string_;
    }

private:
    std::string connection_string_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    /**
     * @brief Validate the database connection
     * @return Result indicating success or failure
     */
    Result<void> validate_connection() const;

    /**
     * @brief Run body inside one transaction, committing only on success
     *
     * libpqxx exceptions are translated: integrity violations to their
     * ErrorCode, a lost connection to CONNECTION_ERROR, the rest to
     * DATABASE_ERROR. Any failure rolls the transaction back.
     *
     * @param operation Name used in error messages
     * @param body Callable taking pqxx::work& and returning Result<T>
     */
    template <typename T, typename Func>
    Result<T> with_transaction(const std::string& operation, Func&& body);

    /**
     * @brief Convert a query result to an Arrow table of utf8 columns
     */
    Result<std::shared_ptr<arrow::Table>> convert_generic_to_arrow(
        const pqxx::result& result) const;
};

}  // namespace trade_store

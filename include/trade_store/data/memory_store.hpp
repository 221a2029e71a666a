// include/trade_store/data/memory_store.hpp

#pragma once

#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>
#include "trade_store/core/error.hpp"
#include "trade_store/core/logger.hpp"
#include "trade_store/data/store_interface.hpp"

namespace trade_store {

/**
 * @brief In-process storage engine with the same contract as PostgresStore
 *
 * Tables exist only after initialize_schema() or migrate_schema(); until then
 * every record operation fails with DATABASE_ERROR. Account ids are unique,
 * account_id foreign keys are checked, column defaults are applied and
 * surrogate ids come from per-table sequences that never hand out a value twice.
 *
 * The whole state can be written to and read back from a JSON snapshot.
 */
class MemoryStore : public TradingStore {
public:
    static constexpr int SNAPSHOT_FORMAT_VERSION = 1;

    MemoryStore();
    ~MemoryStore() override = default;

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;
    MemoryStore(MemoryStore&&) = delete;
    MemoryStore& operator=(MemoryStore&&) = delete;

    Result<void> connect() override;
    void disconnect() override;
    bool is_connected() const override;

    Result<void> initialize_schema() override;
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
     * @brief Write tables, rows and id sequences to a JSON file
     * @param filepath Destination file, replaced if it exists
     * @return Result indicating success or failure
     */
    Result<void> save_snapshot(const std::string& filepath) const;

    /**
     * @brief Replace the whole state with the content of a snapshot file
     *
     * Rows are checked against the schema before anything is replaced: a missing
     * required column gives NOT_NULL_VIOLATION, a duplicate key UNIQUE_VIOLATION
     * and a dangling account_id FOREIGN_KEY_VIOLATION. On error the current state
     * is kept.
     *
     * @param filepath Snapshot written by save_snapshot
     * @return Result indicating success or failure
     */
    Result<void> load_snapshot(const std::string& filepath);

    /**
     * @brief Last id handed out for an auto-increment table, 0 if none
     */
    RowId last_sequence_value(const std::string& table) const;

private:
    struct State {
        std::set<std::string> tables;
        std::map<std::string, RowId> sequences;
        std::map<AccountId, Account> accounts;
        std::map<RowId, Trade> trades;
        std::map<RowId, Position> positions;
        std::map<RowId, PriceDatum> price_data;
        std::map<RowId, StrategySignal> signals;
        std::map<RowId, PortfolioHistoryRecord> portfolio_history;
    };

    Result<void> validate_connection() const;
    Result<void> validate_table(const std::string& table) const;
    Result<void> validate_account_reference(const std::string& table, AccountId account_id) const;
    RowId next_id(const std::string& table);

    Trade build_trade(const NewTrade& trade);
    PriceDatum build_price_datum(const NewPriceDatum& datum);
    void create_missing_tables(std::vector<MigrationStep>* applied);

    nlohmann::json snapshot_to_json() const;
    static Result<State> snapshot_from_json(const nlohmann::json& j);

    mutable std::mutex mutex_;
    bool connected_{false};
    State state_;
};

}  // namespace trade_store

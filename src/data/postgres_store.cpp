// src/data/postgres_store.cpp

#include "trade_store/data/postgres_store.hpp"
#include "trade_store/core/query_builder.hpp"
#include "trade_store/core/time_utils.hpp"

namespace trade_store {

namespace {

const char* const COMPONENT = "PostgresStore";

std::string quoted(const std::string& name) {
    return QueryBuilder::quote_identifier(name);
}

std::string select_all(const std::string& table) {
    return "SELECT * FROM " + quoted(table);
}

Timestamp read_timestamp(const pqxx::field& field) {
    auto parsed = core::parse_timestamp(field.as<std::string>());
    if (parsed.is_error()) {
        throw StoreError(ErrorCode::CONVERSION_ERROR,
                         std::string("Column ") + field.name() + ": " + parsed.error()->what(),
                         COMPONENT);
    }
    return parsed.value();
}

std::optional<Timestamp> read_optional_timestamp(const pqxx::field& field) {
    if (field.is_null()) {
        return std::nullopt;
    }
    return read_timestamp(field);
}

template <typename T>
std::optional<T> read_optional(const pqxx::field& field) {
    if (field.is_null()) {
        return std::nullopt;
    }
    return field.as<T>();
}

// Nullable columns declared with DEFAULT 0
double read_or_zero(const pqxx::field& field) {
    return field.is_null() ? 0.0 : field.as<double>();
}

Account account_from_row(const pqxx::row& row) {
    Account account;
    account.account_id = row["account_id"].as<AccountId>();
    account.owner = row["owner"].as<std::string>();
    account.created_at = read_timestamp(row["created_at"]);
    account.cash_balance = row["cash_balance"].as<double>();
    account.margin_requirement = row["margin_requirement"].as<double>();
    account.margin_used = row["margin_used"].as<double>();
    account.last_update = read_optional_timestamp(row["last_update"]);
    return account;
}

Trade trade_from_row(const pqxx::row& row) {
    Trade trade;
    trade.trade_id = row["trade_id"].as<RowId>();
    trade.account_id = row["account_id"].as<AccountId>();
    trade.symbol = row["symbol"].as<std::string>();
    trade.timestamp = read_timestamp(row["timestamp"]);
    trade.side = row["side"].as<std::string>();
    trade.quantity = row["quantity"].as<double>();
    trade.price = row["price"].as<double>();
    trade.fee = read_or_zero(row["fee"]);
    trade.realized_pl = read_or_zero(row["realized_pl"]);
    trade.strategy_name = read_optional<std::string>(row["strategy_name"]);
    return trade;
}

Position position_from_row(const pqxx::row& row) {
    Position position;
    position.position_id = row["position_id"].as<RowId>();
    position.account_id = row["account_id"].as<AccountId>();
    position.symbol = row["symbol"].as<std::string>();
    position.long_qty = read_or_zero(row["long_qty"]);
    position.short_qty = read_or_zero(row["short_qty"]);
    position.long_cost_basis = read_or_zero(row["long_cost_basis"]);
    position.short_cost_basis = read_or_zero(row["short_cost_basis"]);
    position.short_margin_used = read_or_zero(row["short_margin_used"]);
    position.opened_at = read_timestamp(row["opened_at"]);
    position.closed_at = read_optional_timestamp(row["closed_at"]);
    return position;
}

PriceDatum price_datum_from_row(const pqxx::row& row) {
    PriceDatum datum;
    datum.id = row["id"].as<RowId>();
    datum.symbol = row["symbol"].as<std::string>();
    datum.interval = row["interval"].as<std::string>();
    datum.open_time = read_timestamp(row["open_time"]);
    datum.open = row["open"].as<double>();
    datum.high = row["high"].as<double>();
    datum.low = row["low"].as<double>();
    datum.close = row["close"].as<double>();
    datum.volume = row["volume"].as<double>();
    datum.close_time = read_timestamp(row["close_time"]);
    datum.quote_volume = read_optional<double>(row["quote_volume"]);
    datum.count = read_optional<std::int64_t>(row["count"]);
    datum.taker_buy_volume = read_optional<double>(row["taker_buy_volume"]);
    datum.taker_buy_quote_volume = read_optional<double>(row["taker_buy_quote_volume"]);
    return datum;
}

StrategySignal signal_from_row(const pqxx::row& row) {
    StrategySignal signal;
    signal.signal_id = row["signal_id"].as<RowId>();
    signal.symbol = row["symbol"].as<std::string>();
    signal.interval = row["interval"].as<std::string>();
    signal.timestamp = read_timestamp(row["timestamp"]);
    signal.strategy_name = row["strategy_name"].as<std::string>();
    signal.signal = row["signal"].as<std::string>();
    signal.confidence = read_optional<double>(row["confidence"]);
    signal.metrics = read_optional<std::string>(row["metrics"]);
    return signal;
}

PortfolioHistoryRecord portfolio_record_from_row(const pqxx::row& row) {
    PortfolioHistoryRecord record;
    record.record_id = row["record_id"].as<RowId>();
    record.account_id = row["account_id"].as<AccountId>();
    record.timestamp = read_timestamp(row["timestamp"]);
    record.portfolio_value = row["portfolio_value"].as<double>();
    record.long_exposure = read_optional<double>(row["long_exposure"]);
    record.short_exposure = read_optional<double>(row["short_exposure"]);
    record.gross_exposure = read_optional<double>(row["gross_exposure"]);
    record.net_exposure = read_optional<double>(row["net_exposure"]);
    record.long_short_ratio = read_optional<double>(row["long_short_ratio"]);
    return record;
}

template <typename Row, typename Decode>
std::vector<Row> decode_rows(const pqxx::result& result, Decode decode) {
    std::vector<Row> rows;
    rows.reserve(result.size());
    for (const auto& row : result) {
        rows.push_back(decode(row));
    }
    return rows;
}

/**
 * @brief Column list and SQL literals of one INSERT
 *
 * Only supplied values are listed, so omitted columns take their DEFAULT.
 */
class InsertValues {
public:
    explicit InsertValues(pqxx::transaction_base& txn) : txn_(txn) {}

    template <typename T>
    void add(const std::string& column, const T& value) {
        columns_.push_back(column);
        values_.push_back(txn_.quote(value));
    }

    void add(const std::string& column, const Timestamp& value) {
        columns_.push_back(column);
        values_.push_back(txn_.quote(core::format_timestamp(value)));
    }

    template <typename T>
    void add_if(const std::string& column, const std::optional<T>& value) {
        if (value) {
            add(column, *value);
        }
    }

    std::string returning_all(const std::string& table) const {
        return QueryBuilder::insert_into(table, columns_, values_) + " RETURNING *";
    }

private:
    pqxx::transaction_base& txn_;
    std::vector<std::string> columns_;
    std::vector<std::string> values_;
};

std::string insert_price_datum_sql(pqxx::transaction_base& txn, const NewPriceDatum& datum) {
    InsertValues insert(txn);
    insert.add("symbol", datum.symbol);
    insert.add("interval", datum.interval);
    insert.add("open_time", datum.open_time);
    insert.add("open", datum.open);
    insert.add("high", datum.high);
    insert.add("low", datum.low);
    insert.add("close", datum.close);
    insert.add("volume", datum.volume);
    insert.add("close_time", datum.close_time);
    insert.add_if("quote_volume", datum.quote_volume);
    insert.add_if("count", datum.count);
    insert.add_if("taker_buy_volume", datum.taker_buy_volume);
    insert.add_if("taker_buy_quote_volume", datum.taker_buy_quote_volume);
    return insert.returning_all(tables::PRICE_DATA);
}

std::string insert_trade_sql(pqxx::transaction_base& txn, const NewTrade& trade) {
    InsertValues insert(txn);
    insert.add("account_id", trade.account_id);
    insert.add("symbol", trade.symbol);
    insert.add("timestamp", trade.timestamp);
    insert.add("side", trade.side);
    insert.add("quantity", trade.quantity);
    insert.add("price", trade.price);
    insert.add_if("fee", trade.fee);
    insert.add_if("realized_pl", trade.realized_pl);
    insert.add_if("strategy_name", trade.strategy_name);
    return insert.returning_all(tables::TRADES);
}

std::string update_balances_sql() {
    return "UPDATE " + quoted(tables::ACCOUNTS) + " SET " + quoted("cash_balance") + " = $1, " +
           quoted("margin_requirement") + " = $2, " + quoted("margin_used") + " = $3, " +
           quoted("last_update") + " = $4 WHERE " + quoted("account_id") + " = $5 RETURNING *";
}

ExistingSchema read_catalog(pqxx::transaction_base& txn) {
    auto result = txn.exec(
        "SELECT table_name, column_name FROM information_schema.columns "
        "WHERE table_schema = current_schema() ORDER BY table_name, ordinal_position");

    ExistingSchema existing;
    for (const auto& row : result) {
        auto table_name = row["table_name"].as<std::string>();
        if (find_table(table_name).is_ok()) {
            existing[table_name].insert(row["column_name"].as<std::string>());
        }
    }
    return existing;
}

}  // namespace

PostgresStore::PostgresStore(std::string connection_string)
    : connection_string_(std::move(connection_string)), connection_(nullptr) {}

PostgresStore::~PostgresStore() {
    disconnect();
}

Result<void> PostgresStore::connect() {
    ComponentScope scope(COMPONENT);
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        connection_ = std::make_unique<pqxx::connection>(connection_string_);
        if (!connection_->is_open()) {
            connection_.reset();
            return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                    "Failed to open database connection", COMPONENT);
        }

        pqxx::work txn(*connection_);
        txn.exec("SET TIME ZONE 'UTC'");
        txn.commit();

        INFO("Connected to PostgreSQL database " << connection_->dbname());
        return Result<void>();

    } catch (const std::exception& e) {
        connection_.reset();
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "Database connection error: " + std::string(e.what()), COMPONENT);
    }
}

void PostgresStore::disconnect() {
    ComponentScope scope(COMPONENT);
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection_ && connection_->is_open()) {
        connection_->close();
        connection_.reset();
        INFO("Disconnected from PostgreSQL database");
    }
}

bool PostgresStore::is_connected() const {
    return connection_ && connection_->is_open();
}

Result<void> PostgresStore::validate_connection() const {
    if (!is_connected()) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR, "Not connected to database",
                                COMPONENT);
    }
    return Result<void>();
}

template <typename T, typename Func>
Result<T> PostgresStore::with_transaction(const std::string& operation, Func&& body) {
    ComponentScope scope(COMPONENT);
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<T>(validation);
    }

    try {
        pqxx::work txn(*connection_);
        Result<T> result = body(txn);
        if (result.is_ok()) {
            txn.commit();
        }
        return result;

    } catch (const StoreError& e) {
        return make_error<T>(e.code(), operation + ": " + e.what(), COMPONENT);
    } catch (const pqxx::foreign_key_violation& e) {
        WARN(operation << " rejected: foreign key violation");
        return make_error<T>(ErrorCode::FOREIGN_KEY_VIOLATION, operation + ": " + e.what(),
                             COMPONENT);
    } catch (const pqxx::not_null_violation& e) {
        WARN(operation << " rejected: not-null violation");
        return make_error<T>(ErrorCode::NOT_NULL_VIOLATION, operation + ": " + e.what(),
                             COMPONENT);
    } catch (const pqxx::unique_violation& e) {
        WARN(operation << " rejected: unique violation");
        return make_error<T>(ErrorCode::UNIQUE_VIOLATION, operation + ": " + e.what(), COMPONENT);
    } catch (const pqxx::broken_connection& e) {
        ERROR(operation << " lost the database connection: " << e.what());
        return make_error<T>(ErrorCode::CONNECTION_ERROR, operation + ": " + e.what(), COMPONENT);
    } catch (const std::exception& e) {
        ERROR(operation << " failed: " << e.what());
        return make_error<T>(ErrorCode::DATABASE_ERROR, operation + ": " + e.what(), COMPONENT);
    }
}

// ============================================================================
// SCHEMA
// ============================================================================

Result<void> PostgresStore::initialize_schema() {
    return with_transaction<void>("initialize_schema", [](pqxx::work& txn) {
        for (const auto& table : trading_schema()) {
            txn.exec(render_create_table(table, SqlDialect::POSTGRES));
        }
        INFO("Trading schema initialized (" << trading_schema().size() << " tables)");
        return Result<void>();
    });
}

Result<ExistingSchema> PostgresStore::describe_schema() {
    return with_transaction<ExistingSchema>(
        "describe_schema", [](pqxx::work& txn) { return Result<ExistingSchema>(read_catalog(txn)); });
}

Result<std::vector<MigrationStep>> PostgresStore::migrate_schema() {
    return with_transaction<std::vector<MigrationStep>>("migrate_schema", [](pqxx::work& txn) {
        auto plan = plan_migration(read_catalog(txn), SqlDialect::POSTGRES);
        for (const auto& extra : plan.extra_columns) {
            WARN("Column " << extra << " is not part of the trading schema; left in place");
        }
        for (const auto& step : plan.steps) {
            txn.exec(step.statement);
            INFO("Migration: " << step.describe());
        }
        return Result<std::vector<MigrationStep>>(std::move(plan.steps));
    });
}

// ============================================================================
// ACCOUNTS
// ============================================================================

Result<Account> PostgresStore::create_account(const NewAccount& account) {
    return with_transaction<Account>("create_account", [&](pqxx::work& txn) {
        InsertValues insert(txn);
        insert.add("account_id", account.account_id);
        insert.add("owner", account.owner);
        insert.add_if("created_at", account.created_at);
        insert.add_if("cash_balance", account.cash_balance);
        insert.add_if("margin_requirement", account.margin_requirement);
        insert.add_if("margin_used", account.margin_used);
        insert.add_if("last_update", account.last_update);

        auto result = txn.exec(insert.returning_all(tables::ACCOUNTS));
        return Result<Account>(account_from_row(result[0]));
    });
}

Result<Account> PostgresStore::get_account(AccountId account_id) {
    return with_transaction<Account>("get_account", [&](pqxx::work& txn) {
        auto result = txn.exec_params(
            select_all(tables::ACCOUNTS) + " WHERE " + quoted("account_id") + " = $1", account_id);
        if (result.empty()) {
            return make_error<Account>(ErrorCode::DATA_NOT_FOUND,
                                       "Account " + std::to_string(account_id) + " not found",
                                       COMPONENT);
        }
        return Result<Account>(account_from_row(result[0]));
    });
}

Result<std::vector<Account>> PostgresStore::list_accounts() {
    return with_transaction<std::vector<Account>>("list_accounts", [](pqxx::work& txn) {
        auto result =
            txn.exec(select_all(tables::ACCOUNTS) + " ORDER BY " + quoted("account_id"));
        return Result<std::vector<Account>>(decode_rows<Account>(result, account_from_row));
    });
}

Result<Account> PostgresStore::update_account_balances(AccountId account_id,
                                                       const AccountBalances& balances) {
    return with_transaction<Account>("update_account_balances", [&](pqxx::work& txn) {
        auto result = txn.exec_params(update_balances_sql(), balances.cash_balance,
                                      balances.margin_requirement, balances.margin_used,
                                      core::format_timestamp(balances.last_update), account_id);
        if (result.empty()) {
            return make_error<Account>(ErrorCode::DATA_NOT_FOUND,
                                       "Account " + std::to_string(account_id) + " not found",
                                       COMPONENT);
        }
        return Result<Account>(account_from_row(result[0]));
    });
}

// ============================================================================
// TRADES
// ============================================================================

Result<Trade> PostgresStore::insert_trade(const NewTrade& trade) {
    return with_transaction<Trade>("insert_trade", [&](pqxx::work& txn) {
        auto result = txn.exec(insert_trade_sql(txn, trade));
        return Result<Trade>(trade_from_row(result[0]));
    });
}

Result<std::vector<Trade>> PostgresStore::get_trades(AccountId account_id) {
    return with_transaction<std::vector<Trade>>("get_trades", [&](pqxx::work& txn) {
        auto result = txn.exec_params(select_all(tables::TRADES) + " WHERE " +
                                          quoted("account_id") + " = $1 ORDER BY " +
                                          quoted("trade_id"),
                                      account_id);
        return Result<std::vector<Trade>>(decode_rows<Trade>(result, trade_from_row));
    });
}

Result<Trade> PostgresStore::record_trade(const NewTrade& trade, const AccountBalances& balances) {
    return with_transaction<Trade>("record_trade", [&](pqxx::work& txn) {
        auto inserted = txn.exec(insert_trade_sql(txn, trade));
        auto updated = txn.exec_params(update_balances_sql(), balances.cash_balance,
                                       balances.margin_requirement, balances.margin_used,
                                       core::format_timestamp(balances.last_update),
                                       trade.account_id);
        if (updated.empty()) {
            return make_error<Trade>(ErrorCode::DATA_NOT_FOUND,
                                     "Account " + std::to_string(trade.account_id) + " not found",
                                     COMPONENT);
        }
        return Result<Trade>(trade_from_row(inserted[0]));
    });
}

// ============================================================================
// POSITIONS
// ============================================================================

Result<Position> PostgresStore::open_position(const NewPosition& position) {
    return with_transaction<Position>("open_position", [&](pqxx::work& txn) {
        InsertValues insert(txn);
        insert.add("account_id", position.account_id);
        insert.add("symbol", position.symbol);
        insert.add_if("long_qty", position.long_qty);
        insert.add_if("short_qty", position.short_qty);
        insert.add_if("long_cost_basis", position.long_cost_basis);
        insert.add_if("short_cost_basis", position.short_cost_basis);
        insert.add_if("short_margin_used", position.short_margin_used);
        insert.add("opened_at", position.opened_at);
        insert.add_if("closed_at", position.closed_at);

        auto result = txn.exec(insert.returning_all(tables::POSITIONS));
        return Result<Position>(position_from_row(result[0]));
    });
}

Result<Position> PostgresStore::get_position(RowId position_id) {
    return with_transaction<Position>("get_position", [&](pqxx::work& txn) {
        auto result = txn.exec_params(
            select_all(tables::POSITIONS) + " WHERE " + quoted("position_id") + " = $1",
            position_id);
        if (result.empty()) {
            return make_error<Position>(ErrorCode::DATA_NOT_FOUND,
                                        "Position " + std::to_string(position_id) + " not found",
                                        COMPONENT);
        }
        return Result<Position>(position_from_row(result[0]));
    });
}

Result<std::vector<Position>> PostgresStore::get_open_positions(AccountId account_id) {
    return with_transaction<std::vector<Position>>("get_open_positions", [&](pqxx::work& txn) {
        auto result = txn.exec_params(select_all(tables::POSITIONS) + " WHERE " +
                                          quoted("account_id") + " = $1 AND " +
                                          quoted("closed_at") + " IS NULL ORDER BY " +
                                          quoted("position_id"),
                                      account_id);
        return Result<std::vector<Position>>(decode_rows<Position>(result, position_from_row));
    });
}

Result<Position> PostgresStore::update_position(RowId position_id,
                                                const PositionQuantities& quantities) {
    return with_transaction<Position>("update_position", [&](pqxx::work& txn) {
        auto current = txn.exec_params(select_all(tables::POSITIONS) + " WHERE " +
                                           quoted("position_id") + " = $1 FOR UPDATE",
                                       position_id);
        if (current.empty()) {
            return make_error<Position>(ErrorCode::DATA_NOT_FOUND,
                                        "Position " + std::to_string(position_id) + " not found",
                                        COMPONENT);
        }
        if (!current[0]["closed_at"].is_null()) {
            return make_error<Position>(ErrorCode::INVALID_ARGUMENT,
                                        "Position " + std::to_string(position_id) + " is closed",
                                        COMPONENT);
        }

        auto result = txn.exec_params(
            "UPDATE " + quoted(tables::POSITIONS) + " SET " + quoted("long_qty") + " = $1, " +
                quoted("short_qty") + " = $2, " + quoted("long_cost_basis") + " = $3, " +
                quoted("short_cost_basis") + " = $4, " + quoted("short_margin_used") +
                " = $5 WHERE " + quoted("position_id") + " = $6 RETURNING *",
            quantities.long_qty, quantities.short_qty, quantities.long_cost_basis,
            quantities.short_cost_basis, quantities.short_margin_used, position_id);
        return Result<Position>(position_from_row(result[0]));
    });
}

Result<Position> PostgresStore::close_position(RowId position_id, const Timestamp& closed_at) {
    return with_transaction<Position>("close_position", [&](pqxx::work& txn) {
        auto current = txn.exec_params(select_all(tables::POSITIONS) + " WHERE " +
                                           quoted("position_id") + " = $1 FOR UPDATE",
                                       position_id);
        if (current.empty()) {
            return make_error<Position>(ErrorCode::DATA_NOT_FOUND,
                                        "Position " + std::to_string(position_id) + " not found",
                                        COMPONENT);
        }
        if (!current[0]["closed_at"].is_null()) {
            return make_error<Position>(ErrorCode::INVALID_ARGUMENT,
                                        "Position " + std::to_string(position_id) +
                                            " is already closed",
                                        COMPONENT);
        }

        auto result = txn.exec_params("UPDATE " + quoted(tables::POSITIONS) + " SET " +
                                          quoted("closed_at") + " = $1 WHERE " +
                                          quoted("position_id") + " = $2 RETURNING *",
                                      core::format_timestamp(closed_at), position_id);
        return Result<Position>(position_from_row(result[0]));
    });
}

// ============================================================================
// PRICE DATA
// ============================================================================

Result<PriceDatum> PostgresStore::insert_price_datum(const NewPriceDatum& datum) {
    return with_transaction<PriceDatum>("insert_price_datum", [&](pqxx::work& txn) {
        auto result = txn.exec(insert_price_datum_sql(txn, datum));
        return Result<PriceDatum>(price_datum_from_row(result[0]));
    });
}

Result<std::vector<PriceDatum>> PostgresStore::insert_price_data(
    const std::vector<NewPriceDatum>& data) {
    return with_transaction<std::vector<PriceDatum>>("insert_price_data", [&](pqxx::work& txn) {
        std::vector<PriceDatum> stored;
        stored.reserve(data.size());
        for (const auto& datum : data) {
            auto result = txn.exec(insert_price_datum_sql(txn, datum));
            stored.push_back(price_datum_from_row(result[0]));
        }
        if (!stored.empty()) {
            DEBUG("Inserted " << stored.size() << " price bars");
        }
        return Result<std::vector<PriceDatum>>(std::move(stored));
    });
}

Result<std::vector<PriceDatum>> PostgresStore::get_price_data(const std::string& symbol,
                                                              const std::string& interval,
                                                              const Timestamp& start,
                                                              const Timestamp& end) {
    return with_transaction<std::vector<PriceDatum>>("get_price_data", [&](pqxx::work& txn) {
        auto range = validate_date_range(start, end);
        if (range.is_error()) {
            return forward_error<std::vector<PriceDatum>>(range);
        }
        auto result = txn.exec_params(
            select_all(tables::PRICE_DATA) + " WHERE " + quoted("symbol") + " = $1 AND " +
                quoted("interval") + " = $2 AND " + quoted("open_time") + " BETWEEN $3 AND $4" +
                " ORDER BY " + quoted("open_time") + ", " + quoted("id"),
            symbol, interval, core::format_timestamp(start), core::format_timestamp(end));
        return Result<std::vector<PriceDatum>>(
            decode_rows<PriceDatum>(result, price_datum_from_row));
    });
}

Result<std::optional<Timestamp>> PostgresStore::get_last_open_time(const std::string& symbol,
                                                                   const std::string& interval) {
    return with_transaction<std::optional<Timestamp>>("get_last_open_time", [&](pqxx::work& txn) {
        auto result = txn.exec_params("SELECT MAX(" + quoted("open_time") + ") FROM " +
                                          quoted(tables::PRICE_DATA) + " WHERE " +
                                          quoted("symbol") + " = $1 AND " + quoted("interval") +
                                          " = $2",
                                      symbol, interval);
        return Result<std::optional<Timestamp>>(read_optional_timestamp(result[0][0]));
    });
}

// ============================================================================
// STRATEGY SIGNALS
// ============================================================================

Result<StrategySignal> PostgresStore::insert_signal(const NewStrategySignal& signal) {
    return with_transaction<StrategySignal>("insert_signal", [&](pqxx::work& txn) {
        InsertValues insert(txn);
        insert.add("symbol", signal.symbol);
        insert.add("interval", signal.interval);
        insert.add("timestamp", signal.timestamp);
        insert.add("strategy_name", signal.strategy_name);
        insert.add("signal", signal.signal);
        insert.add_if("confidence", signal.confidence);
        insert.add_if("metrics", signal.metrics);

        auto result = txn.exec(insert.returning_all(tables::STRATEGY_SIGNALS));
        return Result<StrategySignal>(signal_from_row(result[0]));
    });
}

Result<std::vector<StrategySignal>> PostgresStore::get_signals(const std::string& strategy_name,
                                                               const std::string& symbol,
                                                               const std::string& interval) {
    return with_transaction<std::vector<StrategySignal>>("get_signals", [&](pqxx::work& txn) {
        auto result = txn.exec_params(
            select_all(tables::STRATEGY_SIGNALS) + " WHERE " + quoted("strategy_name") +
                " = $1 AND " + quoted("symbol") + " = $2 AND " + quoted("interval") +
                " = $3 ORDER BY " + quoted("timestamp") + ", " + quoted("signal_id"),
            strategy_name, symbol, interval);
        return Result<std::vector<StrategySignal>>(
            decode_rows<StrategySignal>(result, signal_from_row));
    });
}

// ============================================================================
// PORTFOLIO HISTORY
// ============================================================================

Result<PortfolioHistoryRecord> PostgresStore::insert_portfolio_snapshot(
    const NewPortfolioHistoryRecord& record) {
    return with_transaction<PortfolioHistoryRecord>(
        "insert_portfolio_snapshot", [&](pqxx::work& txn) {
            InsertValues insert(txn);
            insert.add("account_id", record.account_id);
            insert.add("timestamp", record.timestamp);
            insert.add("portfolio_value", record.portfolio_value);
            insert.add_if("long_exposure", record.long_exposure);
            insert.add_if("short_exposure", record.short_exposure);
            insert.add_if("gross_exposure", record.gross_exposure);
            insert.add_if("net_exposure", record.net_exposure);
            insert.add_if("long_short_ratio", record.long_short_ratio);

            auto result = txn.exec(insert.returning_all(tables::PORTFOLIO_HISTORY));
            return Result<PortfolioHistoryRecord>(portfolio_record_from_row(result[0]));
        });
}

Result<std::vector<PortfolioHistoryRecord>> PostgresStore::get_portfolio_history(
    AccountId account_id) {
    return with_transaction<std::vector<PortfolioHistoryRecord>>(
        "get_portfolio_history", [&](pqxx::work& txn) {
            auto result = txn.exec_params(select_all(tables::PORTFOLIO_HISTORY) + " WHERE " +
                                              quoted("account_id") + " = $1 ORDER BY " +
                                              quoted("timestamp") + ", " + quoted("record_id"),
                                          account_id);
            return Result<std::vector<PortfolioHistoryRecord>>(
                decode_rows<PortfolioHistoryRecord>(result, portfolio_record_from_row));
        });
}

// ============================================================================
// AD HOC QUERIES
// ============================================================================

Result<std::shared_ptr<arrow::Table>> PostgresStore::execute_query(const std::string& query) {
    return with_transaction<std::shared_ptr<arrow::Table>>(
        "execute_query", [&](pqxx::work& txn) { return convert_generic_to_arrow(txn.exec(query)); });
}

Result<void> PostgresStore::execute_direct_query(const std::string& query) {
    return with_transaction<void>("execute_direct_query", [&](pqxx::work& txn) {
        txn.exec(query);
        return Result<void>();
    });
}

Result<std::shared_ptr<arrow::Table>> PostgresStore::convert_generic_to_arrow(
    const pqxx::result& result) const {
    arrow::MemoryPool* pool = arrow::default_memory_pool();
    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;

    // Every column is read back as text; callers cast as needed
    for (pqxx::row::size_type col = 0; col < result.columns(); ++col) {
        std::string col_name = result.column_name(col);
        arrow::StringBuilder builder(pool);

        if (!builder.Reserve(static_cast<int64_t>(result.size())).ok()) {
            return make_error<std::shared_ptr<arrow::Table>>(
                ErrorCode::CONVERSION_ERROR, "Failed to reserve memory for column: " + col_name,
                COMPONENT);
        }

        for (const auto& row : result) {
            arrow::Status status = row[col].is_null()
                                       ? builder.AppendNull()
                                       : builder.Append(row[col].as<std::string>());
            if (!status.ok()) {
                return make_error<std::shared_ptr<arrow::Table>>(
                    ErrorCode::CONVERSION_ERROR,
                    "Failed to append value for column: " + col_name, COMPONENT);
            }
        }

        std::shared_ptr<arrow::Array> array;
        if (!builder.Finish(&array).ok()) {
            return make_error<std::shared_ptr<arrow::Table>>(
                ErrorCode::CONVERSION_ERROR, "Failed to finish array for column: " + col_name,
                COMPONENT);
        }

        fields.push_back(arrow::field(col_name, arrow::utf8()));
        arrays.push_back(array);
    }

    return Result<std::shared_ptr<arrow::Table>>(
        arrow::Table::Make(arrow::schema(fields), arrays, static_cast<int64_t>(result.size())));
}

}  // namespace trade_store

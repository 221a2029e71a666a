// src/data/memory_store.cpp

#include "trade_store/data/memory_store.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include "trade_store/core/time_utils.hpp"

namespace trade_store {

namespace {

using nlohmann::json;

const char* const COMPONENT = "MemoryStore";

const std::vector<std::string>& sequence_tables() {
    static const std::vector<std::string> names = {tables::TRADES, tables::POSITIONS,
                                                   tables::PRICE_DATA, tables::STRATEGY_SIGNALS,
                                                   tables::PORTFOLIO_HISTORY};
    return names;
}

template <typename Row>
json rows_to_json(const std::map<RowId, Row>& rows) {
    json out = json::array();
    for (const auto& [id, row] : rows) {
        out.push_back(row);
    }
    return out;
}

Result<void> check_not_null(const TableDef& table, const json& row) {
    if (!row.is_object()) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "Row of " + table.name + " is not a JSON object", COMPONENT);
    }
    for (const auto& column : table.columns) {
        if (!column.not_null && !column.primary_key) {
            continue;
        }
        if (!row.contains(column.name) || row.at(column.name).is_null()) {
            return make_error<void>(ErrorCode::NOT_NULL_VIOLATION,
                                    "null value in column \"" + column.name + "\" of relation \"" +
                                        table.name + "\"",
                                    COMPONENT);
        }
    }
    return Result<void>();
}

// Parses the rows of one table into a map keyed by its primary key
template <typename Key, typename Row, typename KeyFn>
Result<void> load_rows(const json& snapshot_rows, const std::string& table_name,
                       std::map<Key, Row>& out, KeyFn key_of) {
    if (!snapshot_rows.contains(table_name)) {
        return Result<void>();
    }
    const json& rows = snapshot_rows.at(table_name);
    if (!rows.is_array()) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "Rows of " + table_name + " must be an array", COMPONENT);
    }

    auto table = find_table(table_name);
    if (table.is_error()) {
        return make_error<void>(table.error()->code(), table.error()->what(), COMPONENT);
    }

    for (const auto& row_json : rows) {
        auto not_null = check_not_null(*table.value(), row_json);
        if (not_null.is_error()) {
            return not_null;
        }

        Row row;
        try {
            row = row_json.get<Row>();
        } catch (const json::exception& e) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Malformed row in " + table_name + ": " + e.what(), COMPONENT);
        } catch (const std::invalid_argument& e) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Malformed row in " + table_name + ": " + e.what(), COMPONENT);
        }

        Key key = key_of(row);
        if (!out.emplace(key, std::move(row)).second) {
            return make_error<void>(ErrorCode::UNIQUE_VIOLATION,
                                    "duplicate key " + std::to_string(key) + " in relation \"" +
                                        table_name + "\"",
                                    COMPONENT);
        }
    }
    return Result<void>();
}

template <typename Row>
Result<void> check_references(const std::map<AccountId, Account>& accounts,
                              const std::map<RowId, Row>& rows, const std::string& table_name) {
    for (const auto& [id, row] : rows) {
        if (accounts.count(row.account_id) == 0) {
            return make_error<void>(ErrorCode::FOREIGN_KEY_VIOLATION,
                                    "row " + std::to_string(id) + " of " + table_name +
                                        " references missing account " +
                                        std::to_string(row.account_id),
                                    COMPONENT);
        }
    }
    return Result<void>();
}

template <typename Row>
RowId max_key(const std::map<RowId, Row>& rows) {
    return rows.empty() ? 0 : rows.rbegin()->first;
}

}  // namespace

MemoryStore::MemoryStore() {
    for (const auto& table : sequence_tables()) {
        state_.sequences[table] = 0;
    }
}

Result<void> MemoryStore::connect() {
    ComponentScope scope(COMPONENT);
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = true;
    INFO("Opened in-memory trading store");
    return Result<void>();
}

void MemoryStore::disconnect() {
    ComponentScope scope(COMPONENT);
    std::lock_guard<std::mutex> lock(mutex_);
    if (connected_) {
        connected_ = false;
        INFO("Closed in-memory trading store");
    }
}

bool MemoryStore::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

Result<void> MemoryStore::validate_connection() const {
    if (!connected_) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR, "Not connected to store", COMPONENT);
    }
    return Result<void>();
}

Result<void> MemoryStore::validate_table(const std::string& table) const {
    auto validation = validate_connection();
    if (validation.is_error()) {
        return validation;
    }
    if (state_.tables.count(table) == 0) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "relation \"" + table + "\" does not exist", COMPONENT);
    }
    return Result<void>();
}

Result<void> MemoryStore::validate_account_reference(const std::string& table,
                                                     AccountId account_id) const {
    auto validation = validate_table(table);
    if (validation.is_error()) {
        return validation;
    }
    validation = validate_table(tables::ACCOUNTS);
    if (validation.is_error()) {
        return validation;
    }
    if (state_.accounts.count(account_id) == 0) {
        return make_error<void>(ErrorCode::FOREIGN_KEY_VIOLATION,
                                "insert on \"" + table + "\" references missing account " +
                                    std::to_string(account_id),
                                COMPONENT);
    }
    return Result<void>();
}

RowId MemoryStore::next_id(const std::string& table) {
    return ++state_.sequences[table];
}

RowId MemoryStore::last_sequence_value(const std::string& table) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.sequences.find(table);
    return it == state_.sequences.end() ? 0 : it->second;
}

// ============================================================================
// SCHEMA
// ============================================================================

void MemoryStore::create_missing_tables(std::vector<MigrationStep>* applied) {
    ExistingSchema existing;
    for (const auto& name : state_.tables) {
        auto table = find_table(name);
        if (table.is_ok()) {
            auto columns = table.value()->column_names();
            existing[name] = std::set<std::string>(columns.begin(), columns.end());
        }
    }

    auto plan = plan_migration(existing, SqlDialect::SQLITE);
    for (const auto& step : plan.steps) {
        // In-memory tables always carry every column, so only CREATE_TABLE occurs
        if (step.kind == MigrationStep::Kind::CREATE_TABLE) {
            state_.tables.insert(step.table);
            INFO("Created table " << step.table);
        }
        if (applied) {
            applied->push_back(step);
        }
    }
}

Result<void> MemoryStore::initialize_schema() {
    ComponentScope scope(COMPONENT);
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return validation;
    }
    create_missing_tables(nullptr);
    return Result<void>();
}

Result<ExistingSchema> MemoryStore::describe_schema() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<ExistingSchema>(validation);
    }

    ExistingSchema existing;
    for (const auto& name : state_.tables) {
        auto table = find_table(name);
        if (table.is_error()) {
            return forward_error<ExistingSchema>(table);
        }
        auto columns = table.value()->column_names();
        existing[name] = std::set<std::string>(columns.begin(), columns.end());
    }
    return existing;
}

Result<std::vector<MigrationStep>> MemoryStore::migrate_schema() {
    ComponentScope scope(COMPONENT);
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<std::vector<MigrationStep>>(validation);
    }
    std::vector<MigrationStep> applied;
    create_missing_tables(&applied);
    return applied;
}

// ============================================================================
// ACCOUNTS
// ============================================================================

Result<Account> MemoryStore::create_account(const NewAccount& account) {
    ComponentScope scope(COMPONENT);
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_table(tables::ACCOUNTS);
    if (validation.is_error()) {
        return forward_error<Account>(validation);
    }

    if (state_.accounts.count(account.account_id) > 0) {
        WARN("Rejected duplicate account id " << account.account_id);
        return make_error<Account>(ErrorCode::UNIQUE_VIOLATION,
                                   "duplicate key value violates unique constraint: account_id=" +
                                       std::to_string(account.account_id),
                                   COMPONENT);
    }

    Account row;
    row.account_id = account.account_id;
    row.owner = account.owner;
    row.created_at = core::truncate_to_micros(
        account.created_at.value_or(std::chrono::system_clock::now()));
    row.cash_balance = account.cash_balance.value_or(0.0);
    row.margin_requirement = account.margin_requirement.value_or(0.0);
    row.margin_used = account.margin_used.value_or(0.0);
    if (account.last_update) {
        row.last_update = core::truncate_to_micros(*account.last_update);
    }

    state_.accounts.emplace(row.account_id, row);
    return row;
}

Result<Account> MemoryStore::get_account(AccountId account_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_table(tables::ACCOUNTS);
    if (validation.is_error()) {
        return forward_error<Account>(validation);
    }

    auto it = state_.accounts.find(account_id);
    if (it == state_.accounts.end()) {
        return make_error<Account>(ErrorCode::DATA_NOT_FOUND,
                                   "Account " + std::to_string(account_id) + " not found",
                                   COMPONENT);
    }
    return it->second;
}

Result<std::vector<Account>> MemoryStore::list_accounts() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_table(tables::ACCOUNTS);
    if (validation.is_error()) {
        return forward_error<std::vector<Account>>(validation);
    }

    std::vector<Account> accounts;
    accounts.reserve(state_.accounts.size());
    for (const auto& [id, account] : state_.accounts) {
        accounts.push_back(account);
    }
    return accounts;
}

Result<Account> MemoryStore::update_account_balances(AccountId account_id,
                                                     const AccountBalances& balances) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_table(tables::ACCOUNTS);
    if (validation.is_error()) {
        return forward_error<Account>(validation);
    }

    auto it = state_.accounts.find(account_id);
    if (it == state_.accounts.end()) {
        return make_error<Account>(ErrorCode::DATA_NOT_FOUND,
                                   "Account " + std::to_string(account_id) + " not found",
                                   COMPONENT);
    }

    it->second.cash_balance = balances.cash_balance;
    it->second.margin_requirement = balances.margin_requirement;
    it->second.margin_used = balances.margin_used;
    it->second.last_update = core::truncate_to_micros(balances.last_update);
    return it->second;
}

// ============================================================================
// TRADES
// ============================================================================

Trade MemoryStore::build_trade(const NewTrade& trade) {
    Trade row;
    row.trade_id = next_id(tables::TRADES);
    row.account_id = trade.account_id;
    row.symbol = trade.symbol;
    row.timestamp = core::truncate_to_micros(trade.timestamp);
    row.side = trade.side;
    row.quantity = trade.quantity;
    row.price = trade.price;
    row.fee = trade.fee.value_or(0.0);
    row.realized_pl = trade.realized_pl.value_or(0.0);
    row.strategy_name = trade.strategy_name;
    return row;
}

Result<Trade> MemoryStore::insert_trade(const NewTrade& trade) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_account_reference(tables::TRADES, trade.account_id);
    if (validation.is_error()) {
        return forward_error<Trade>(validation);
    }

    Trade row = build_trade(trade);
    state_.trades.emplace(row.trade_id, row);
    return row;
}

Result<std::vector<Trade>> MemoryStore::get_trades(AccountId account_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_table(tables::TRADES);
    if (validation.is_error()) {
        return forward_error<std::vector<Trade>>(validation);
    }

    std::vector<Trade> trades;
    for (const auto& [id, trade] : state_.trades) {
        if (trade.account_id == account_id) {
            trades.push_back(trade);
        }
    }
    return trades;
}

Result<Trade> MemoryStore::record_trade(const NewTrade& trade, const AccountBalances& balances) {
    ComponentScope scope(COMPONENT);
    std::lock_guard<std::mutex> lock(mutex_);
    // Every check runs before the first write so a failure leaves both tables untouched
    auto validation = validate_account_reference(tables::TRADES, trade.account_id);
    if (validation.is_error()) {
        WARN("record_trade rolled back: " << validation.error()->what());
        return forward_error<Trade>(validation);
    }

    Trade row = build_trade(trade);
    state_.trades.emplace(row.trade_id, row);

    Account& account = state_.accounts.at(trade.account_id);
    account.cash_balance = balances.cash_balance;
    account.margin_requirement = balances.margin_requirement;
    account.margin_used = balances.margin_used;
    account.last_update = core::truncate_to_micros(balances.last_update);
    return row;
}

// ============================================================================
// POSITIONS
// ============================================================================

Result<Position> MemoryStore::open_position(const NewPosition& position) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_account_reference(tables::POSITIONS, position.account_id);
    if (validation.is_error()) {
        return forward_error<Position>(validation);
    }

    Position row;
    row.position_id = next_id(tables::POSITIONS);
    row.account_id = position.account_id;
    row.symbol = position.symbol;
    row.long_qty = position.long_qty.value_or(0.0);
    row.short_qty = position.short_qty.value_or(0.0);
    row.long_cost_basis = position.long_cost_basis.value_or(0.0);
    row.short_cost_basis = position.short_cost_basis.value_or(0.0);
    row.short_margin_used = position.short_margin_used.value_or(0.0);
    row.opened_at = core::truncate_to_micros(position.opened_at);
    if (position.closed_at) {
        row.closed_at = core::truncate_to_micros(*position.closed_at);
    }

    state_.positions.emplace(row.position_id, row);
    return row;
}

Result<Position> MemoryStore::get_position(RowId position_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_table(tables::POSITIONS);
    if (validation.is_error()) {
        return forward_error<Position>(validation);
    }

    auto it = state_.positions.find(position_id);
    if (it == state_.positions.end()) {
        return make_error<Position>(ErrorCode::DATA_NOT_FOUND,
                                    "Position " + std::to_string(position_id) + " not found",
                                    COMPONENT);
    }
    return it->second;
}

Result<std::vector<Position>> MemoryStore::get_open_positions(AccountId account_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_table(tables::POSITIONS);
    if (validation.is_error()) {
        return forward_error<std::vector<Position>>(validation);
    }

    std::vector<Position> positions;
    for (const auto& [id, position] : state_.positions) {
        if (position.account_id == account_id && position.is_open()) {
            positions.push_back(position);
        }
    }
    return positions;
}

Result<Position> MemoryStore::update_position(RowId position_id,
                                              const PositionQuantities& quantities) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_table(tables::POSITIONS);
    if (validation.is_error()) {
        return forward_error<Position>(validation);
    }

    auto it = state_.positions.find(position_id);
    if (it == state_.positions.end()) {
        return make_error<Position>(ErrorCode::DATA_NOT_FOUND,
                                    "Position " + std::to_string(position_id) + " not found",
                                    COMPONENT);
    }
    if (!it->second.is_open()) {
        return make_error<Position>(ErrorCode::INVALID_ARGUMENT,
                                    "Position " + std::to_string(position_id) + " is closed",
                                    COMPONENT);
    }

    it->second.long_qty = quantities.long_qty;
    it->second.short_qty = quantities.short_qty;
    it->second.long_cost_basis = quantities.long_cost_basis;
    it->second.short_cost_basis = quantities.short_cost_basis;
    it->second.short_margin_used = quantities.short_margin_used;
    return it->second;
}

Result<Position> MemoryStore::close_position(RowId position_id, const Timestamp& closed_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_table(tables::POSITIONS);
    if (validation.is_error()) {
        return forward_error<Position>(validation);
    }

    auto it = state_.positions.find(position_id);
    if (it == state_.positions.end()) {
        return make_error<Position>(ErrorCode::DATA_NOT_FOUND,
                                    "Position " + std::to_string(position_id) + " not found",
                                    COMPONENT);
    }
    if (!it->second.is_open()) {
        return make_error<Position>(ErrorCode::INVALID_ARGUMENT,
                                    "Position " + std::to_string(position_id) +
                                        " is already closed",
                                    COMPONENT);
    }

    it->second.closed_at = core::truncate_to_micros(closed_at);
    return it->second;
}

// ============================================================================
// PRICE DATA
// ============================================================================

PriceDatum MemoryStore::build_price_datum(const NewPriceDatum& datum) {
    PriceDatum row;
    row.id = next_id(tables::PRICE_DATA);
    row.symbol = datum.symbol;
    row.interval = datum.interval;
    row.open_time = core::truncate_to_micros(datum.open_time);
    row.open = datum.open;
    row.high = datum.high;
    row.low = datum.low;
    row.close = datum.close;
    row.volume = datum.volume;
    row.close_time = core::truncate_to_micros(datum.close_time);
    row.quote_volume = datum.quote_volume;
    row.count = datum.count;
    row.taker_buy_volume = datum.taker_buy_volume;
    row.taker_buy_quote_volume = datum.taker_buy_quote_volume;
    return row;
}

Result<PriceDatum> MemoryStore::insert_price_datum(const NewPriceDatum& datum) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_table(tables::PRICE_DATA);
    if (validation.is_error()) {
        return forward_error<PriceDatum>(validation);
    }

    PriceDatum row = build_price_datum(datum);
    state_.price_data.emplace(row.id, row);
    return row;
}

Result<std::vector<PriceDatum>> MemoryStore::insert_price_data(
    const std::vector<NewPriceDatum>& data) {
    ComponentScope scope(COMPONENT);
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_table(tables::PRICE_DATA);
    if (validation.is_error()) {
        return forward_error<std::vector<PriceDatum>>(validation);
    }

    std::vector<PriceDatum> stored;
    stored.reserve(data.size());
    for (const auto& datum : data) {
        PriceDatum row = build_price_datum(datum);
        state_.price_data.emplace(row.id, row);
        stored.push_back(std::move(row));
    }

    if (!stored.empty()) {
        DEBUG("Inserted " << stored.size() << " price bars");
    }
    return stored;
}

Result<std::vector<PriceDatum>> MemoryStore::get_price_data(const std::string& symbol,
                                                            const std::string& interval,
                                                            const Timestamp& start,
                                                            const Timestamp& end) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_table(tables::PRICE_DATA);
    if (validation.is_error()) {
        return forward_error<std::vector<PriceDatum>>(validation);
    }
    auto range = validate_date_range(start, end);
    if (range.is_error()) {
        return forward_error<std::vector<PriceDatum>>(range);
    }

    std::vector<PriceDatum> bars;
    for (const auto& [id, bar] : state_.price_data) {
        if (bar.symbol == symbol && bar.interval == interval && bar.open_time >= start &&
            bar.open_time <= end) {
            bars.push_back(bar);
        }
    }
    // Map order is id order, so a stable sort gives (open_time, id)
    std::stable_sort(bars.begin(), bars.end(), [](const PriceDatum& a, const PriceDatum& b) {
        return a.open_time < b.open_time;
    });
    return bars;
}

Result<std::optional<Timestamp>> MemoryStore::get_last_open_time(const std::string& symbol,
                                                                 const std::string& interval) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_table(tables::PRICE_DATA);
    if (validation.is_error()) {
        return forward_error<std::optional<Timestamp>>(validation);
    }

    std::optional<Timestamp> last;
    for (const auto& [id, bar] : state_.price_data) {
        if (bar.symbol == symbol && bar.interval == interval &&
            (!last || bar.open_time > *last)) {
            last = bar.open_time;
        }
    }
    return Result<std::optional<Timestamp>>(last);
}

// ============================================================================
// STRATEGY SIGNALS
// ============================================================================

Result<StrategySignal> MemoryStore::insert_signal(const NewStrategySignal& signal) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_table(tables::STRATEGY_SIGNALS);
    if (validation.is_error()) {
        return forward_error<StrategySignal>(validation);
    }

    StrategySignal row;
    row.signal_id = next_id(tables::STRATEGY_SIGNALS);
    row.symbol = signal.symbol;
    row.interval = signal.interval;
    row.timestamp = core::truncate_to_micros(signal.timestamp);
    row.strategy_name = signal.strategy_name;
    row.signal = signal.signal;
    row.confidence = signal.confidence;
    row.metrics = signal.metrics;

    state_.signals.emplace(row.signal_id, row);
    return row;
}

Result<std::vector<StrategySignal>> MemoryStore::get_signals(const std::string& strategy_name,
                                                             const std::string& symbol,
                                                             const std::string& interval) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_table(tables::STRATEGY_SIGNALS);
    if (validation.is_error()) {
        return forward_error<std::vector<StrategySignal>>(validation);
    }

    std::vector<StrategySignal> signals;
    for (const auto& [id, signal] : state_.signals) {
        if (signal.strategy_name == strategy_name && signal.symbol == symbol &&
            signal.interval == interval) {
            signals.push_back(signal);
        }
    }
    std::stable_sort(signals.begin(), signals.end(),
                     [](const StrategySignal& a, const StrategySignal& b) {
                         return a.timestamp < b.timestamp;
                     });
    return signals;
}

// ============================================================================
// PORTFOLIO HISTORY
// ============================================================================

Result<PortfolioHistoryRecord> MemoryStore::insert_portfolio_snapshot(
    const NewPortfolioHistoryRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_account_reference(tables::PORTFOLIO_HISTORY, record.account_id);
    if (validation.is_error()) {
        return forward_error<PortfolioHistoryRecord>(validation);
    }

    PortfolioHistoryRecord row;
    row.record_id = next_id(tables::PORTFOLIO_HISTORY);
    row.account_id = record.account_id;
    row.timestamp = core::truncate_to_micros(record.timestamp);
    row.portfolio_value = record.portfolio_value;
    row.long_exposure = record.long_exposure;
    row.short_exposure = record.short_exposure;
    row.gross_exposure = record.gross_exposure;
    row.net_exposure = record.net_exposure;
    row.long_short_ratio = record.long_short_ratio;

    state_.portfolio_history.emplace(row.record_id, row);
    return row;
}

Result<std::vector<PortfolioHistoryRecord>> MemoryStore::get_portfolio_history(
    AccountId account_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_table(tables::PORTFOLIO_HISTORY);
    if (validation.is_error()) {
        return forward_error<std::vector<PortfolioHistoryRecord>>(validation);
    }

    std::vector<PortfolioHistoryRecord> history;
    for (const auto& [id, record] : state_.portfolio_history) {
        if (record.account_id == account_id) {
            history.push_back(record);
        }
    }
    std::stable_sort(history.begin(), history.end(),
                     [](const PortfolioHistoryRecord& a, const PortfolioHistoryRecord& b) {
                         return a.timestamp < b.timestamp;
                     });
    return history;
}

// ============================================================================
// SNAPSHOTS
// ============================================================================

json MemoryStore::snapshot_to_json() const {
    json j;
    j["format_version"] = SNAPSHOT_FORMAT_VERSION;
    j["tables"] = state_.tables;
    j["sequences"] = state_.sequences;

    json accounts = json::array();
    for (const auto& [id, account] : state_.accounts) {
        accounts.push_back(account);
    }

    json rows;
    rows[tables::ACCOUNTS] = accounts;
    rows[tables::TRADES] = rows_to_json(state_.trades);
    rows[tables::POSITIONS] = rows_to_json(state_.positions);
    rows[tables::PRICE_DATA] = rows_to_json(state_.price_data);
    rows[tables::STRATEGY_SIGNALS] = rows_to_json(state_.signals);
    rows[tables::PORTFOLIO_HISTORY] = rows_to_json(state_.portfolio_history);
    j["rows"] = rows;
    return j;
}

Result<MemoryStore::State> MemoryStore::snapshot_from_json(const json& j) {
    if (!j.is_object() || !j.contains("format_version") ||
        !j.at("format_version").is_number_integer()) {
        return make_error<State>(ErrorCode::INVALID_DATA, "Snapshot has no format_version",
                                 COMPONENT);
    }
    if (j.at("format_version").get<int>() != SNAPSHOT_FORMAT_VERSION) {
        return make_error<State>(ErrorCode::INVALID_DATA,
                                 "Unsupported snapshot format_version " +
                                     j.at("format_version").dump(),
                                 COMPONENT);
    }

    State state;
    for (const auto& table : sequence_tables()) {
        state.sequences[table] = 0;
    }

    try {
        const json declared = j.value("tables", json::array());
        for (const auto& name : declared) {
            auto table = find_table(name.get<std::string>());
            if (table.is_error()) {
                return forward_error<State>(table);
            }
            state.tables.insert(table.value()->name);
        }
        const json sequences = j.value("sequences", json::object());
        for (const auto& entry : sequences.items()) {
            if (state.sequences.count(entry.key()) == 0) {
                return make_error<State>(ErrorCode::INVALID_DATA,
                                         "Snapshot has a sequence for unknown table " +
                                             entry.key(),
                                         COMPONENT);
            }
            state.sequences[entry.key()] = entry.value().get<RowId>();
        }
    } catch (const json::exception& e) {
        return make_error<State>(ErrorCode::INVALID_DATA,
                                 std::string("Malformed snapshot header: ") + e.what(), COMPONENT);
    }

    const json rows = j.value("rows", json::object());
    if (!rows.is_object()) {
        return make_error<State>(ErrorCode::INVALID_DATA, "Snapshot rows must be an object",
                                 COMPONENT);
    }
    for (const auto& entry : rows.items()) {
        if (state.tables.count(entry.key()) == 0 && !entry.value().empty()) {
            return make_error<State>(ErrorCode::INVALID_DATA,
                                     "Snapshot has rows for table " + entry.key() +
                                         " which it does not declare",
                                     COMPONENT);
        }
    }

    auto loaded = load_rows(rows, tables::ACCOUNTS, state.accounts,
                            [](const Account& row) { return row.account_id; });
    if (loaded.is_ok()) {
        loaded = load_rows(rows, tables::TRADES, state.trades,
                           [](const Trade& row) { return row.trade_id; });
    }
    if (loaded.is_ok()) {
        loaded = load_rows(rows, tables::POSITIONS, state.positions,
                           [](const Position& row) { return row.position_id; });
    }
    if (loaded.is_ok()) {
        loaded = load_rows(rows, tables::PRICE_DATA, state.price_data,
                           [](const PriceDatum& row) { return row.id; });
    }
    if (loaded.is_ok()) {
        loaded = load_rows(rows, tables::STRATEGY_SIGNALS, state.signals,
                           [](const StrategySignal& row) { return row.signal_id; });
    }
    if (loaded.is_ok()) {
        loaded = load_rows(rows, tables::PORTFOLIO_HISTORY, state.portfolio_history,
                           [](const PortfolioHistoryRecord& row) { return row.record_id; });
    }
    if (loaded.is_ok()) {
        loaded = check_references(state.accounts, state.trades, tables::TRADES);
    }
    if (loaded.is_ok()) {
        loaded = check_references(state.accounts, state.positions, tables::POSITIONS);
    }
    if (loaded.is_ok()) {
        loaded = check_references(state.accounts, state.portfolio_history,
                                  tables::PORTFOLIO_HISTORY);
    }
    if (loaded.is_error()) {
        return forward_error<State>(loaded);
    }

    // A sequence never goes below the largest id it has handed out
    auto& seq = state.sequences;
    seq[tables::TRADES] = std::max(seq[tables::TRADES], max_key(state.trades));
    seq[tables::POSITIONS] = std::max(seq[tables::POSITIONS], max_key(state.positions));
    seq[tables::PRICE_DATA] = std::max(seq[tables::PRICE_DATA], max_key(state.price_data));
    seq[tables::STRATEGY_SIGNALS] = std::max(seq[tables::STRATEGY_SIGNALS], max_key(state.signals));
    seq[tables::PORTFOLIO_HISTORY] =
        std::max(seq[tables::PORTFOLIO_HISTORY], max_key(state.portfolio_history));

    return state;
}

Result<void> MemoryStore::save_snapshot(const std::string& filepath) const {
    ComponentScope scope(COMPONENT);
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return validation;
    }

    try {
        json j = snapshot_to_json();
        std::ofstream file(filepath);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open snapshot for writing: " + filepath, COMPONENT);
        }
        file << std::setw(2) << j << std::endl;
        if (!file) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to write snapshot: " + filepath, COMPONENT);
        }
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::UNKNOWN_ERROR,
                                std::string("Error saving snapshot: ") + e.what(), COMPONENT);
    }

    INFO("Saved snapshot to " << filepath);
    return Result<void>();
}

Result<void> MemoryStore::load_snapshot(const std::string& filepath) {
    ComponentScope scope(COMPONENT);
    if (!std::filesystem::exists(filepath)) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND, "Snapshot not found: " + filepath,
                                COMPONENT);
    }

    json j;
    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open snapshot for reading: " + filepath, COMPONENT);
        }
        file >> j;
    } catch (const json::parse_error& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                std::string("Malformed snapshot: ") + e.what(), COMPONENT);
    }

    auto state = snapshot_from_json(j);
    if (state.is_error()) {
        ERROR("Rejected snapshot " << filepath << ": " << state.error()->what());
        return forward_error<void>(state);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return validation;
    }
    state_ = state.take_value();
    INFO("Loaded snapshot from " << filepath << " (" << state_.tables.size() << " tables)");
    return Result<void>();
}

}  // namespace trade_store

// test_db_utils.cpp
#include "test_db_utils.hpp"
#include <chrono>
#include <stdexcept>
#include "trade_store/core/time_utils.hpp"

namespace trade_store {
namespace testing {

Timestamp test_time(int minute_offset) {
    return core::make_utc_timestamp(2024, 1, 15, 9, 30, 0) + std::chrono::minutes(minute_offset);
}

NewAccount make_new_account(AccountId account_id, const std::string& owner) {
    NewAccount account;
    account.account_id = account_id;
    account.owner = owner;
    return account;
}

NewTrade make_new_trade(AccountId account_id, const std::string& symbol, int minute_offset) {
    NewTrade trade;
    trade.account_id = account_id;
    trade.symbol = symbol;
    trade.timestamp = test_time(minute_offset);
    trade.side = "BUY";
    trade.quantity = 0.25;
    trade.price = 42000.0;
    trade.strategy_name = "momentum";
    return trade;
}

NewPosition make_new_position(AccountId account_id, const std::string& symbol,
                              int minute_offset) {
    NewPosition position;
    position.account_id = account_id;
    position.symbol = symbol;
    position.long_qty = 0.25;
    position.long_cost_basis = 10500.0;
    position.opened_at = test_time(minute_offset);
    return position;
}

NewPriceDatum make_new_price_datum(const std::string& symbol, const std::string& interval,
                                   int minute_offset, double close) {
    NewPriceDatum datum;
    datum.symbol = symbol;
    datum.interval = interval;
    datum.open_time = test_time(minute_offset);
    datum.open = close - 1.0;
    datum.high = close + 2.0;
    datum.low = close - 3.0;
    datum.close = close;
    datum.volume = 12.5;
    datum.close_time = test_time(minute_offset + 1) - std::chrono::milliseconds(1);
    datum.quote_volume = 1250.0;
    datum.count = 42;
    return datum;
}

NewStrategySignal make_new_signal(const std::string& strategy_name, const std::string& symbol,
                                  int minute_offset, const std::string& signal) {
    NewStrategySignal row;
    row.symbol = symbol;
    row.interval = "1m";
    row.timestamp = test_time(minute_offset);
    row.strategy_name = strategy_name;
    row.signal = signal;
    return row;
}

NewPortfolioHistoryRecord make_new_portfolio_record(AccountId account_id, int minute_offset,
                                                    double value) {
    NewPortfolioHistoryRecord record;
    record.account_id = account_id;
    record.timestamp = test_time(minute_offset);
    record.portfolio_value = value;
    record.long_exposure = value * 0.6;
    record.short_exposure = value * 0.2;
    return record;
}

std::vector<NewPriceDatum> make_minute_bars(const std::string& symbol, int count) {
    std::vector<NewPriceDatum> bars;
    bars.reserve(count);
    for (int i = 0; i < count; ++i) {
        bars.push_back(make_new_price_datum(symbol, "1m", i, 100.0 + i));
    }
    return bars;
}

std::shared_ptr<MemoryStore> make_initialized_memory_store() {
    auto store = std::make_shared<MemoryStore>();
    auto connected = store->connect();
    if (connected.is_error()) {
        throw std::runtime_error(connected.error()->what());
    }
    auto initialized = store->initialize_schema();
    if (initialized.is_error()) {
        throw std::runtime_error(initialized.error()->what());
    }
    return store;
}

}  // namespace testing
}  // namespace trade_store

#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>
#include "trade_store/core/time_utils.hpp"
#include "trade_store/schema/records.hpp"

using namespace trade_store;

class RecordsTest : public ::testing::Test {
protected:
    Timestamp ts_ = core::make_utc_timestamp(2024, 3, 1, 12, 0, 0) + std::chrono::microseconds(250);
};

TEST_F(RecordsTest, AccountJsonUsesColumnNames) {
    Account account;
    account.account_id = 7;
    account.owner = "desk-a";
    account.created_at = ts_;
    account.cash_balance = 1000.0;

    nlohmann::json j = account;
    EXPECT_EQ(j["account_id"], 7);
    EXPECT_EQ(j["owner"], "desk-a");
    EXPECT_EQ(j["created_at"], "2024-03-01 12:00:00.000250");
    EXPECT_TRUE(j["last_update"].is_null());

    auto restored = j.get<Account>();
    EXPECT_EQ(restored.created_at, ts_);
    EXPECT_DOUBLE_EQ(restored.cash_balance, 1000.0);
    EXPECT_FALSE(restored.last_update.has_value());
}

TEST_F(RecordsTest, TradeNullDefaultsReadAsZero) {
    nlohmann::json j = {{"trade_id", 1},        {"account_id", 7},   {"symbol", "BTCUSDT"},
                        {"timestamp", "2024-03-01 12:00:00"},        {"side", "BUY"},
                        {"quantity", 0.5},      {"price", 60000.0},  {"fee", nullptr},
                        {"strategy_name", "breakout"}};

    auto trade = j.get<Trade>();
    EXPECT_DOUBLE_EQ(trade.fee, 0.0);
    EXPECT_DOUBLE_EQ(trade.realized_pl, 0.0);
    EXPECT_EQ(trade.strategy_name.value(), "breakout");
}

TEST_F(RecordsTest, PriceDatumKeepsOptionalStatistics) {
    PriceDatum datum;
    datum.id = 3;
    datum.symbol = "ETHUSDT";
    datum.interval = "1h";
    datum.open_time = ts_;
    datum.close_time = ts_ + std::chrono::hours(1);
    datum.count = 1200;

    nlohmann::json j = datum;
    EXPECT_EQ(j["count"], 1200);
    EXPECT_TRUE(j["quote_volume"].is_null());

    auto restored = j.get<PriceDatum>();
    EXPECT_EQ(restored.count.value(), 1200);
    EXPECT_FALSE(restored.quote_volume.has_value());
    EXPECT_EQ(restored.close_time, datum.close_time);
}

TEST_F(RecordsTest, MissingRequiredColumnThrows) {
    nlohmann::json j = {{"signal_id", 1}, {"symbol", "BTCUSDT"}, {"interval", "1m"},
                        {"strategy_name", "rsi"}, {"signal", "BUY"}};
    EXPECT_THROW(j.get<StrategySignal>(), std::invalid_argument);

    j["timestamp"] = "2024-03-01 12:00:00";
    j.erase("signal");
    EXPECT_THROW(j.get<StrategySignal>(), nlohmann::json::exception);
}

TEST_F(RecordsTest, BadTimestampTextThrows) {
    nlohmann::json j = {{"record_id", 1}, {"account_id", 7}, {"timestamp", "not a time"},
                        {"portfolio_value", 10.0}};
    EXPECT_THROW(j.get<PortfolioHistoryRecord>(), std::invalid_argument);
}

TEST_F(RecordsTest, PositionOpenUntilClosed) {
    Position position;
    position.opened_at = ts_;
    EXPECT_TRUE(position.is_open());

    position.closed_at = ts_ + std::chrono::minutes(5);
    EXPECT_FALSE(position.is_open());
}

#include <gtest/gtest.h>
#include <cstdlib>
#include <memory>
#include "../core/test_base.hpp"
#include "test_db_utils.hpp"
#include "trade_store/core/query_builder.hpp"
#include "trade_store/data/postgres_store.hpp"
#include "trade_store/schema/schema_definition.hpp"

using namespace trade_store;
using namespace trade_store::testing;

// Runs against a scratch database named by TRADE_STORE_TEST_DATABASE_URL; every table is dropped.
class PostgresStoreTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        const char* url = std::getenv("TRADE_STORE_TEST_DATABASE_URL");
        if (url == nullptr || *url == '\0') {
            GTEST_SKIP() << "TRADE_STORE_TEST_DATABASE_URL is not set";
        }

        db_ = std::make_unique<PostgresStore>(url);
        auto connected = db_->connect();
        ASSERT_TRUE(connected.is_ok()) << connected.error()->what();
        drop_all_tables();
        auto initialized = db_->initialize_schema();
        ASSERT_TRUE(initialized.is_ok()) << initialized.error()->what();
        ASSERT_TRUE(db_->create_account(make_new_account(1)).is_ok());
    }

    void TearDown() override {
        if (db_ && db_->is_connected()) {
            drop_all_tables();
            db_->disconnect();
        }
        TestBase::TearDown();
    }

    void drop_all_tables() {
        for (const auto& table : trading_schema()) {
            auto dropped = db_->execute_direct_query(
                "DROP TABLE IF EXISTS " + QueryBuilder::quote_identifier(table.name) + " CASCADE");
            ASSERT_TRUE(dropped.is_ok()) << dropped.error()->what();
        }
    }

    std::unique_ptr<PostgresStore> db_;
};

TEST_F(PostgresStoreTest, ConnectionLifecycle) {
    EXPECT_TRUE(db_->is_connected());
    db_->disconnect();
    EXPECT_FALSE(db_->is_connected());

    auto result = db_->get_account(1);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONNECTION_ERROR);

    ASSERT_TRUE(db_->connect().is_ok());
}

TEST_F(PostgresStoreTest, SchemaMatchesDefinition) {
    auto schema = db_->describe_schema();
    ASSERT_TRUE(schema.is_ok()) << schema.error()->what();
    for (const auto& table : trading_schema()) {
        ASSERT_EQ(schema.value().count(table.name), 1u) << table.name;
        EXPECT_EQ(schema.value().at(table.name).size(), table.columns.size()) << table.name;
    }

    ASSERT_TRUE(db_->initialize_schema().is_ok());
    auto plan = db_->migrate_schema();
    ASSERT_TRUE(plan.is_ok());
    EXPECT_TRUE(plan.value().empty());
}

TEST_F(PostgresStoreTest, MigrateRecreatesDroppedTable) {
    ASSERT_TRUE(db_->execute_direct_query("DROP TABLE \"portfolio_history\"").is_ok());

    auto plan = db_->migrate_schema();
    ASSERT_TRUE(plan.is_ok()) << plan.error()->what();
    ASSERT_EQ(plan.value().size(), 1u);
    EXPECT_EQ(plan.value()[0].table, tables::PORTFOLIO_HISTORY);
    EXPECT_TRUE(db_->insert_portfolio_snapshot(make_new_portfolio_record(1, 0)).is_ok());
}

TEST_F(PostgresStoreTest, AccountConstraints) {
    auto account = db_->get_account(1);
    ASSERT_TRUE(account.is_ok());
    EXPECT_DOUBLE_EQ(account.value().cash_balance, 0.0);
    EXPECT_FALSE(account.value().last_update.has_value());

    auto duplicate = db_->create_account(make_new_account(1));
    ASSERT_TRUE(duplicate.is_error());
    EXPECT_EQ(duplicate.error()->code(), ErrorCode::UNIQUE_VIOLATION);

    auto missing = db_->get_account(42);
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error()->code(), ErrorCode::DATA_NOT_FOUND);
}

TEST_F(PostgresStoreTest, SixtyFourBitIdentifiersAndCounts) {
    const AccountId wide_id = 3000000000LL;
    auto account = db_->create_account(make_new_account(wide_id));
    ASSERT_TRUE(account.is_ok()) << account.error()->what();
    EXPECT_EQ(db_->get_account(wide_id).value().account_id, wide_id);

    auto trade = db_->insert_trade(make_new_trade(wide_id));
    ASSERT_TRUE(trade.is_ok()) << trade.error()->what();

    NewPriceDatum datum = make_new_price_datum("BTCUSDT", "1d", 0);
    datum.count = 5000000000LL;
    auto bar = db_->insert_price_datum(datum);
    ASSERT_TRUE(bar.is_ok()) << bar.error()->what();
    EXPECT_EQ(bar.value().count.value(), 5000000000LL);
}

TEST_F(PostgresStoreTest, ForeignKeysEnforced) {
    auto trade = db_->insert_trade(make_new_trade(99));
    ASSERT_TRUE(trade.is_error());
    EXPECT_EQ(trade.error()->code(), ErrorCode::FOREIGN_KEY_VIOLATION);

    auto position = db_->open_position(make_new_position(99));
    ASSERT_TRUE(position.is_error());
    EXPECT_EQ(position.error()->code(), ErrorCode::FOREIGN_KEY_VIOLATION);
}

TEST_F(PostgresStoreTest, RecordTradeIsAtomic) {
    AccountBalances balances{39500.0, 0.0, 0.0, test_time(1)};
    auto recorded = db_->record_trade(make_new_trade(1), balances);
    ASSERT_TRUE(recorded.is_ok()) << recorded.error()->what();
    EXPECT_DOUBLE_EQ(db_->get_account(1).value().cash_balance, 39500.0);

    auto failed = db_->record_trade(make_new_trade(77), balances);
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(db_->get_trades(1).value().size(), 1u);
}

TEST_F(PostgresStoreTest, PositionLifecycle) {
    auto opened = db_->open_position(make_new_position(1));
    ASSERT_TRUE(opened.is_ok()) << opened.error()->what();
    auto id = opened.value().position_id;

    PositionQuantities quantities{0.5, 0.0, 21000.0, 0.0, 0.0};
    auto updated = db_->update_position(id, quantities);
    ASSERT_TRUE(updated.is_ok());
    EXPECT_DOUBLE_EQ(updated.value().long_qty, 0.5);

    ASSERT_TRUE(db_->close_position(id, test_time(30)).is_ok());
    EXPECT_TRUE(db_->get_open_positions(1).value().empty());

    auto reclose = db_->close_position(id, test_time(31));
    ASSERT_TRUE(reclose.is_error());
    EXPECT_EQ(reclose.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(PostgresStoreTest, PriceDataRangeAndCursor) {
    ASSERT_TRUE(db_->insert_price_data(make_minute_bars("BTCUSDT", 5)).is_ok());

    auto range = db_->get_price_data("BTCUSDT", "1m", test_time(1), test_time(3));
    ASSERT_TRUE(range.is_ok()) << range.error()->what();
    ASSERT_EQ(range.value().size(), 3u);
    EXPECT_EQ(range.value().front().open_time, test_time(1));
    EXPECT_EQ(range.value().back().open_time, test_time(3));
    EXPECT_EQ(range.value().front().count.value(), 42);

    auto last = db_->get_last_open_time("BTCUSDT", "1m");
    ASSERT_TRUE(last.is_ok());
    EXPECT_EQ(last.value().value(), test_time(4));

    auto table = db_->execute_query("SELECT symbol, close FROM \"price_data\" ORDER BY id");
    ASSERT_TRUE(table.is_ok()) << table.error()->what();
    EXPECT_EQ(table.value()->num_rows(), 5);
    EXPECT_EQ(table.value()->num_columns(), 2);
}

TEST_F(PostgresStoreTest, EmptyPriceBatchIsNoop) {
    auto stored = db_->insert_price_data({});
    ASSERT_TRUE(stored.is_ok());
    EXPECT_TRUE(stored.value().empty());
    EXPECT_FALSE(db_->get_last_open_time("BTCUSDT", "1m").value().has_value());

    db_->disconnect();
    auto inverted = db_->get_price_data("BTCUSDT", "1m", test_time(3), test_time(1));
    ASSERT_TRUE(inverted.is_error());
    EXPECT_EQ(inverted.error()->code(), ErrorCode::CONNECTION_ERROR);
    ASSERT_TRUE(db_->connect().is_ok());
}

TEST_F(PostgresStoreTest, SignalsAndPortfolioHistory) {
    NewStrategySignal signal = make_new_signal("rsi", "BTCUSDT", 0);
    signal.confidence.reset();
    signal.metrics.reset();
    ASSERT_TRUE(db_->insert_signal(signal).is_ok());

    auto signals = db_->get_signals("rsi", "BTCUSDT", "1m");
    ASSERT_TRUE(signals.is_ok());
    ASSERT_EQ(signals.value().size(), 1u);
    EXPECT_FALSE(signals.value()[0].confidence.has_value());
    EXPECT_FALSE(signals.value()[0].metrics.has_value());

    ASSERT_TRUE(db_->insert_portfolio_snapshot(make_new_portfolio_record(1, 5, 11000.0)).is_ok());
    ASSERT_TRUE(db_->insert_portfolio_snapshot(make_new_portfolio_record(1, 1, 10500.0)).is_ok());
    auto history = db_->get_portfolio_history(1);
    ASSERT_TRUE(history.is_ok());
    ASSERT_EQ(history.value().size(), 2u);
    EXPECT_EQ(history.value()[0].timestamp, test_time(1));
}

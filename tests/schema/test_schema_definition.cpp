#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "trade_store/core/types.hpp"
#include "trade_store/schema/schema_definition.hpp"

using namespace trade_store;

class SchemaDefinitionTest : public ::testing::Test {
protected:
    const TableDef& table(const std::string& name) {
        auto result = find_table(name);
        EXPECT_TRUE(result.is_ok()) << "Unknown table " << name;
        return *result.value();
    }
};

TEST_F(SchemaDefinitionTest, TablesInDeclarationOrder) {
    std::vector<std::string> names;
    for (const auto& t : trading_schema()) {
        names.push_back(t.name);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"accounts", "trades", "positions", "price_data",
                                               "strategy_signals", "portfolio_history"}));
}

TEST_F(SchemaDefinitionTest, ColumnNamesMatchTables) {
    EXPECT_EQ(table(tables::ACCOUNTS).column_names(),
              (std::vector<std::string>{"account_id", "owner", "created_at", "cash_balance",
                                        "margin_requirement", "margin_used", "last_update"}));
    EXPECT_EQ(table(tables::TRADES).column_names(),
              (std::vector<std::string>{"trade_id", "account_id", "symbol", "timestamp", "side",
                                        "quantity", "price", "fee", "realized_pl",
                                        "strategy_name"}));
    EXPECT_EQ(table(tables::POSITIONS).column_names(),
              (std::vector<std::string>{"position_id", "account_id", "symbol", "long_qty",
                                        "short_qty", "long_cost_basis", "short_cost_basis",
                                        "short_margin_used", "opened_at", "closed_at"}));
    EXPECT_EQ(table(tables::PRICE_DATA).column_names(),
              (std::vector<std::string>{"id", "symbol", "interval", "open_time", "open", "high",
                                        "low", "close", "volume", "close_time", "quote_volume",
                                        "count", "taker_buy_volume",
                                        "taker_buy_quote_volume"}));
    EXPECT_EQ(table(tables::STRATEGY_SIGNALS).column_names(),
              (std::vector<std::string>{"signal_id", "symbol", "interval", "timestamp",
                                        "strategy_name", "signal", "confidence", "metrics"}));
    EXPECT_EQ(table(tables::PORTFOLIO_HISTORY).column_names(),
              (std::vector<std::string>{"record_id", "account_id", "timestamp",
                                        "portfolio_value", "long_exposure", "short_exposure",
                                        "gross_exposure", "net_exposure", "long_short_ratio"}));
}

TEST_F(SchemaDefinitionTest, PrimaryKeys) {
    EXPECT_EQ(table(tables::ACCOUNTS).primary_key(), "account_id");
    EXPECT_EQ(table(tables::TRADES).primary_key(), "trade_id");
    EXPECT_EQ(table(tables::POSITIONS).primary_key(), "position_id");
    EXPECT_EQ(table(tables::PRICE_DATA).primary_key(), "id");
    EXPECT_EQ(table(tables::STRATEGY_SIGNALS).primary_key(), "signal_id");
    EXPECT_EQ(table(tables::PORTFOLIO_HISTORY).primary_key(), "record_id");

    EXPECT_FALSE(table(tables::ACCOUNTS).find_column("account_id")->auto_increment);
    EXPECT_TRUE(table(tables::TRADES).find_column("trade_id")->auto_increment);
}

TEST_F(SchemaDefinitionTest, DefaultsAndNullability) {
    const auto& accounts = table(tables::ACCOUNTS);
    EXPECT_TRUE(accounts.find_column("owner")->is_required());
    EXPECT_FALSE(accounts.find_column("cash_balance")->is_required());
    EXPECT_EQ(accounts.find_column("created_at")->default_value.value(), "CURRENT_TIMESTAMP");
    EXPECT_FALSE(accounts.find_column("last_update")->not_null);

    const auto& trades = table(tables::TRADES);
    EXPECT_FALSE(trades.find_column("fee")->not_null);
    EXPECT_EQ(trades.find_column("fee")->default_value.value(), "0");
    EXPECT_TRUE(trades.find_column("price")->is_required());

    const auto& prices = table(tables::PRICE_DATA);
    EXPECT_TRUE(prices.find_column("close_time")->is_required());
    EXPECT_FALSE(prices.find_column("count")->not_null);
    EXPECT_FALSE(prices.find_column("count")->default_value.has_value());
}

TEST_F(SchemaDefinitionTest, ForeignKeysReferenceAccounts) {
    for (const auto& name : {tables::TRADES, tables::POSITIONS, tables::PORTFOLIO_HISTORY}) {
        const auto& t = table(name);
        ASSERT_EQ(t.foreign_keys.size(), 1u) << name;
        EXPECT_EQ(t.foreign_keys[0].column, "account_id");
        EXPECT_EQ(t.foreign_keys[0].referenced_table, "accounts");
        EXPECT_EQ(t.foreign_keys[0].referenced_column, "account_id");
    }
    EXPECT_TRUE(table(tables::PRICE_DATA).foreign_keys.empty());
    EXPECT_TRUE(table(tables::STRATEGY_SIGNALS).foreign_keys.empty());
}

TEST_F(SchemaDefinitionTest, UnknownTable) {
    auto result = find_table("orders");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::SCHEMA_ERROR);
}

TEST_F(SchemaDefinitionTest, DialectNames) {
    EXPECT_EQ(dialect_from_string("postgres").value(), SqlDialect::POSTGRES);
    EXPECT_EQ(dialect_from_string("postgresql").value(), SqlDialect::POSTGRES);
    EXPECT_EQ(dialect_from_string("sqlite").value(), SqlDialect::SQLITE);
    EXPECT_EQ(dialect_to_string(SqlDialect::SQLITE), "sqlite");

    auto unknown = dialect_from_string("mysql");
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(SchemaDefinitionTest, SqliteCreateTable) {
    std::string sql = render_create_table(table(tables::TRADES), SqlDialect::SQLITE);

    EXPECT_EQ(sql.rfind("CREATE TABLE IF NOT EXISTS trades (\n", 0), 0u);
    EXPECT_NE(sql.find("    trade_id INTEGER PRIMARY KEY AUTOINCREMENT,\n"), std::string::npos);
    EXPECT_NE(sql.find("    account_id INTEGER NOT NULL,\n"), std::string::npos);
    EXPECT_NE(sql.find("    fee REAL DEFAULT 0,\n"), std::string::npos);
    EXPECT_NE(sql.find("    FOREIGN KEY (account_id) REFERENCES accounts(account_id)\n);"),
              std::string::npos);
}

TEST_F(SchemaDefinitionTest, PostgresCreateTable) {
    std::string sql = render_create_table(table(tables::PRICE_DATA), SqlDialect::POSTGRES);

    EXPECT_EQ(sql.rfind("CREATE TABLE IF NOT EXISTS \"price_data\" (\n", 0), 0u);
    EXPECT_NE(sql.find("\"id\" BIGSERIAL PRIMARY KEY"), std::string::npos);
    EXPECT_NE(sql.find("\"interval\" TEXT NOT NULL"), std::string::npos);
    EXPECT_NE(sql.find("\"open\" DOUBLE PRECISION NOT NULL"), std::string::npos);
    EXPECT_NE(sql.find("\"count\" BIGINT"), std::string::npos);
    EXPECT_EQ(sql.find("REAL"), std::string::npos);
    EXPECT_EQ(sql.find("INTEGER"), std::string::npos);

    std::string accounts = render_create_table(table(tables::ACCOUNTS), SqlDialect::POSTGRES);
    EXPECT_NE(accounts.find("\"account_id\" BIGINT PRIMARY KEY"), std::string::npos);
    EXPECT_NE(accounts.find("\"created_at\" TIMESTAMP NOT NULL DEFAULT CURRENT_TIMESTAMP"),
              std::string::npos);

    std::string trades = render_create_table(table(tables::TRADES), SqlDialect::POSTGRES);
    EXPECT_NE(trades.find("FOREIGN KEY (\"account_id\") REFERENCES \"accounts\" (\"account_id\")"),
              std::string::npos);
}

TEST_F(SchemaDefinitionTest, AddColumn) {
    const auto& positions = table(tables::POSITIONS);
    EXPECT_EQ(render_add_column(positions, *positions.find_column("closed_at"), SqlDialect::SQLITE),
              "ALTER TABLE positions ADD COLUMN closed_at TIMESTAMP;");
    EXPECT_EQ(
        render_add_column(positions, *positions.find_column("long_qty"), SqlDialect::POSTGRES),
        "ALTER TABLE \"positions\" ADD COLUMN \"long_qty\" DOUBLE PRECISION DEFAULT 0;");
}

TEST_F(SchemaDefinitionTest, SchemaScriptListsEveryTable) {
    std::string script = render_schema_sql(SqlDialect::SQLITE);

    EXPECT_EQ(script.rfind("-- SQL initialization script for the trading database\n", 0), 0u);
    size_t previous = 0;
    for (const auto& t : trading_schema()) {
        size_t pos = script.find("CREATE TABLE IF NOT EXISTS " + t.name + " (");
        ASSERT_NE(pos, std::string::npos) << t.name;
        EXPECT_GT(pos, previous);
        previous = pos;
    }
}

#include <gtest/gtest.h>
#include "trade_store/core/query_builder.hpp"

using namespace trade_store;

class QueryBuilderTest : public ::testing::Test {};

TEST_F(QueryBuilderTest, QuoteIdentifier) {
    EXPECT_EQ(QueryBuilder::quote_identifier("interval"), "\"interval\"");
    EXPECT_EQ(QueryBuilder::quote_identifier("odd\"name"), "\"odd\"\"name\"");
}

TEST_F(QueryBuilderTest, Join) {
    EXPECT_EQ(QueryBuilder::join({}, ", "), "");
    EXPECT_EQ(QueryBuilder::join({"a"}, ", "), "a");
    EXPECT_EQ(QueryBuilder::join({"a", "b", "c"}, ", "), "a, b, c");
}

TEST_F(QueryBuilderTest, InsertInto) {
    auto sql = QueryBuilder::insert_into("trades", {"account_id", "symbol"}, {"$1", "$2"});
    EXPECT_EQ(sql, "INSERT INTO \"trades\" (\"account_id\", \"symbol\") VALUES ($1, $2)");
}

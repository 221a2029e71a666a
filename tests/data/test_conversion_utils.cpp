#include <gtest/gtest.h>
#include <arrow/api.h>
#include "test_db_utils.hpp"
#include "trade_store/data/conversion_utils.hpp"

using namespace trade_store;
using namespace trade_store::testing;

class ConversionUtilsTest : public ::testing::Test {
protected:
    std::vector<PriceDatum> sample_bars() {
        std::vector<PriceDatum> bars;
        for (int i = 0; i < 3; ++i) {
            auto source = make_new_price_datum("BTCUSDT", "1m", i, 100.0 + i);
            PriceDatum bar;
            bar.id = i + 1;
            bar.symbol = source.symbol;
            bar.interval = source.interval;
            bar.open_time = source.open_time;
            bar.open = source.open;
            bar.high = source.high;
            bar.low = source.low;
            bar.close = source.close;
            bar.volume = source.volume;
            bar.close_time = source.close_time;
            bar.quote_volume = source.quote_volume;
            bar.count = source.count;
            bars.push_back(bar);
        }
        bars[1].count.reset();
        bars[2].taker_buy_volume = 4.5;
        return bars;
    }
};

TEST_F(ConversionUtilsTest, SchemaMatchesPriceDataColumns) {
    auto schema = DataConversionUtils::price_data_schema();
    ASSERT_EQ(schema->num_fields(), 14);
    EXPECT_EQ(schema->field(0)->name(), "id");
    EXPECT_EQ(schema->field(13)->name(), "taker_buy_quote_volume");
    EXPECT_TRUE(schema->GetFieldByName("open_time")->type()->Equals(
        arrow::timestamp(arrow::TimeUnit::MICRO)));
    EXPECT_FALSE(schema->GetFieldByName("close")->nullable());
    EXPECT_TRUE(schema->GetFieldByName("count")->nullable());
}

TEST_F(ConversionUtilsTest, BarsToTable) {
    auto table = DataConversionUtils::price_data_to_arrow_table(sample_bars());
    ASSERT_TRUE(table.is_ok()) << table.error()->what();
    EXPECT_EQ(table.value()->num_rows(), 3);
    EXPECT_EQ(table.value()->num_columns(), 14);

    auto count = table.value()->GetColumnByName("count");
    ASSERT_NE(count, nullptr);
    EXPECT_EQ(count->null_count(), 1);
    EXPECT_EQ(table.value()->GetColumnByName("taker_buy_volume")->null_count(), 2);
}

TEST_F(ConversionUtilsTest, TableToBarsPreservesValuesAndNulls) {
    auto bars = sample_bars();
    auto table = DataConversionUtils::price_data_to_arrow_table(bars);
    ASSERT_TRUE(table.is_ok());

    auto restored = DataConversionUtils::arrow_table_to_price_data(table.value());
    ASSERT_TRUE(restored.is_ok()) << restored.error()->what();
    ASSERT_EQ(restored.value().size(), 3u);

    const auto& second = restored.value()[1];
    EXPECT_EQ(second.id, 2);
    EXPECT_EQ(second.symbol, "BTCUSDT");
    EXPECT_EQ(second.open_time, bars[1].open_time);
    EXPECT_EQ(second.close_time, bars[1].close_time);
    EXPECT_DOUBLE_EQ(second.close, 101.0);
    EXPECT_FALSE(second.count.has_value());
    EXPECT_EQ(restored.value()[0].count.value(), 42);
    EXPECT_DOUBLE_EQ(restored.value()[2].taker_buy_volume.value(), 4.5);
}

TEST_F(ConversionUtilsTest, EmptyInput) {
    auto table = DataConversionUtils::price_data_to_arrow_table({});
    ASSERT_TRUE(table.is_ok());
    EXPECT_EQ(table.value()->num_rows(), 0);

    auto restored = DataConversionUtils::arrow_table_to_price_data(table.value());
    ASSERT_TRUE(restored.is_ok());
    EXPECT_TRUE(restored.value().empty());
}

TEST_F(ConversionUtilsTest, MissingRequiredColumn) {
    auto table = DataConversionUtils::price_data_to_arrow_table(sample_bars());
    ASSERT_TRUE(table.is_ok());
    auto index = table.value()->schema()->GetFieldIndex("close_time");
    auto without_close_time = table.value()->RemoveColumn(index);
    ASSERT_TRUE(without_close_time.ok());

    auto result = DataConversionUtils::arrow_table_to_price_data(*without_close_time);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONVERSION_ERROR);
}

TEST_F(ConversionUtilsTest, OptionalColumnsMayBeAbsent) {
    auto table = DataConversionUtils::price_data_to_arrow_table(sample_bars());
    ASSERT_TRUE(table.is_ok());
    auto trimmed = table.value();
    for (const auto& name : {"taker_buy_quote_volume", "count", "id"}) {
        auto removed = trimmed->RemoveColumn(trimmed->schema()->GetFieldIndex(name));
        ASSERT_TRUE(removed.ok());
        trimmed = *removed;
    }

    auto result = DataConversionUtils::arrow_table_to_price_data(trimmed);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    EXPECT_EQ(result.value()[0].id, 0);
    EXPECT_FALSE(result.value()[0].count.has_value());
}

TEST_F(ConversionUtilsTest, MistypedColumn) {
    auto table = DataConversionUtils::price_data_to_arrow_table(sample_bars());
    ASSERT_TRUE(table.is_ok());

    arrow::StringBuilder builder;
    ASSERT_TRUE(builder.AppendValues({"1", "2", "3"}).ok());
    std::shared_ptr<arrow::Array> strings;
    ASSERT_TRUE(builder.Finish(&strings).ok());

    auto index = table.value()->schema()->GetFieldIndex("close");
    auto replaced = table.value()->SetColumn(index, arrow::field("close", arrow::utf8()),
                                             std::make_shared<arrow::ChunkedArray>(strings));
    ASSERT_TRUE(replaced.ok());

    auto result = DataConversionUtils::arrow_table_to_price_data(*replaced);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONVERSION_ERROR);
}

TEST_F(ConversionUtilsTest, MultiChunkTable) {
    auto bars = sample_bars();
    auto first = DataConversionUtils::price_data_to_arrow_table({bars[0], bars[1]});
    auto second = DataConversionUtils::price_data_to_arrow_table({bars[2]});
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());

    auto concatenated = arrow::ConcatenateTables({first.value(), second.value()});
    ASSERT_TRUE(concatenated.ok());
    ASSERT_EQ((*concatenated)->GetColumnByName("close")->num_chunks(), 2);

    auto result = DataConversionUtils::arrow_table_to_price_data(*concatenated);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    ASSERT_EQ(result.value().size(), 3u);
    EXPECT_DOUBLE_EQ(result.value()[2].close, 102.0);
    EXPECT_EQ(result.value()[2].id, 3);
}

TEST_F(ConversionUtilsTest, ShortColumnRejected) {
    auto table = DataConversionUtils::price_data_to_arrow_table(sample_bars());
    ASSERT_TRUE(table.is_ok());

    arrow::Int64Builder builder;
    ASSERT_TRUE(builder.Append(42).ok());
    std::shared_ptr<arrow::Array> short_count;
    ASSERT_TRUE(builder.Finish(&short_count).ok());

    auto columns = table.value()->columns();
    auto index = table.value()->schema()->GetFieldIndex("count");
    columns[index] = std::make_shared<arrow::ChunkedArray>(short_count);
    auto malformed = arrow::Table::Make(table.value()->schema(), columns, 3);

    auto result = DataConversionUtils::arrow_table_to_price_data(malformed);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONVERSION_ERROR);
}

TEST_F(ConversionUtilsTest, NullTable) {
    auto result = DataConversionUtils::arrow_table_to_price_data(nullptr);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

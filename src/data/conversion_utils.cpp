// src/data/conversion_utils.cpp
#include "trade_store/data/conversion_utils.hpp"
#include <map>
#include <string>
#include <utility>

namespace trade_store {

namespace {

const char* const COMPONENT = "DataConversionUtils";

template <typename T>
Result<T> conversion_error(const std::string& message) {
    return make_error<T>(ErrorCode::CONVERSION_ERROR, message, COMPONENT);
}

int64_t to_micros(const Timestamp& ts) {
    return std::chrono::duration_cast<std::chrono::microseconds>(ts.time_since_epoch()).count();
}

// Returns the single chunk of a column, or nullptr when the column is absent or empty
Result<std::shared_ptr<arrow::Array>> column_array(const std::shared_ptr<arrow::Table>& table,
                                                   const std::string& name, bool required) {
    auto column = table->GetColumnByName(name);
    if (!column) {
        if (required) {
            return conversion_error<std::shared_ptr<arrow::Array>>("Missing required column: " +
                                                                   name);
        }
        return Result<std::shared_ptr<arrow::Array>>(std::shared_ptr<arrow::Array>());
    }
    if (column->num_chunks() == 0) {
        return Result<std::shared_ptr<arrow::Array>>(std::shared_ptr<arrow::Array>());
    }
    if (column->num_chunks() != 1) {
        return conversion_error<std::shared_ptr<arrow::Array>>(
            "Column " + name + " must have exactly one chunk");
    }
    return Result<std::shared_ptr<arrow::Array>>(column->chunk(0));
}

}  // namespace

std::shared_ptr<arrow::Schema> DataConversionUtils::price_data_schema() {
    auto ts_type = arrow::timestamp(arrow::TimeUnit::MICRO);
    return arrow::schema({arrow::field("id", arrow::int64(), false),
                          arrow::field("symbol", arrow::utf8(), false),
                          arrow::field("interval", arrow::utf8(), false),
                          arrow::field("open_time", ts_type, false),
                          arrow::field("open", arrow::float64(), false),
                          arrow::field("high", arrow::float64(), false),
                          arrow::field("low", arrow::float64(), false),
                          arrow::field("close", arrow::float64(), false),
                          arrow::field("volume", arrow::float64(), false),
                          arrow::field("close_time", ts_type, false),
                          arrow::field("quote_volume", arrow::float64()),
                          arrow::field("count", arrow::int64()),
                          arrow::field("taker_buy_volume", arrow::float64()),
                          arrow::field("taker_buy_quote_volume", arrow::float64())});
}

Result<std::shared_ptr<arrow::Table>> DataConversionUtils::price_data_to_arrow_table(
    const std::vector<PriceDatum>& rows) {
    arrow::MemoryPool* pool = arrow::default_memory_pool();
    auto ts_type = arrow::timestamp(arrow::TimeUnit::MICRO);

    arrow::Int64Builder id_builder(pool);
    arrow::StringBuilder symbol_builder(pool);
    arrow::StringBuilder interval_builder(pool);
    arrow::TimestampBuilder open_time_builder(ts_type, pool);
    arrow::DoubleBuilder open_builder(pool);
    arrow::DoubleBuilder high_builder(pool);
    arrow::DoubleBuilder low_builder(pool);
    arrow::DoubleBuilder close_builder(pool);
    arrow::DoubleBuilder volume_builder(pool);
    arrow::TimestampBuilder close_time_builder(ts_type, pool);
    arrow::DoubleBuilder quote_volume_builder(pool);
    arrow::Int64Builder count_builder(pool);
    arrow::DoubleBuilder taker_buy_volume_builder(pool);
    arrow::DoubleBuilder taker_buy_quote_volume_builder(pool);

    auto append_optional = [](arrow::DoubleBuilder& builder, const std::optional<double>& value) {
        return value ? builder.Append(*value) : builder.AppendNull();
    };

    for (const auto& row : rows) {
        if (!id_builder.Append(row.id).ok() || !symbol_builder.Append(row.symbol).ok() ||
            !interval_builder.Append(row.interval).ok() ||
            !open_time_builder.Append(to_micros(row.open_time)).ok() ||
            !open_builder.Append(row.open).ok() || !high_builder.Append(row.high).ok() ||
            !low_builder.Append(row.low).ok() || !close_builder.Append(row.close).ok() ||
            !volume_builder.Append(row.volume).ok() ||
            !close_time_builder.Append(to_micros(row.close_time)).ok() ||
            !append_optional(quote_volume_builder, row.quote_volume).ok() ||
            !(row.count ? count_builder.Append(*row.count) : count_builder.AppendNull()).ok() ||
            !append_optional(taker_buy_volume_builder, row.taker_buy_volume).ok() ||
            !append_optional(taker_buy_quote_volume_builder, row.taker_buy_quote_volume).ok()) {
            return conversion_error<std::shared_ptr<arrow::Table>>(
                "Failed to append price bar " + std::to_string(row.id));
        }
    }

    std::vector<arrow::ArrayBuilder*> builders = {
        &id_builder,           &symbol_builder,           &interval_builder,
        &open_time_builder,    &open_builder,             &high_builder,
        &low_builder,          &close_builder,            &volume_builder,
        &close_time_builder,   &quote_volume_builder,     &count_builder,
        &taker_buy_volume_builder, &taker_buy_quote_volume_builder};

    std::vector<std::shared_ptr<arrow::Array>> arrays;
    arrays.reserve(builders.size());
    for (auto* builder : builders) {
        std::shared_ptr<arrow::Array> array;
        if (!builder->Finish(&array).ok()) {
            return conversion_error<std::shared_ptr<arrow::Table>>("Failed to finish arrays");
        }
        arrays.push_back(array);
    }

    return Result<std::shared_ptr<arrow::Table>>(
        arrow::Table::Make(price_data_schema(), arrays, static_cast<int64_t>(rows.size())));
}

Result<std::vector<PriceDatum>> DataConversionUtils::arrow_table_to_price_data(
    const std::shared_ptr<arrow::Table>& table) {
    if (!table) {
        return make_error<std::vector<PriceDatum>>(ErrorCode::INVALID_ARGUMENT,
                                                   "Table pointer is null", COMPONENT);
    }

    std::shared_ptr<arrow::Table> combined = table;
    if (table->num_rows() > 0) {
        auto combined_result = table->CombineChunks(arrow::default_memory_pool());
        if (!combined_result.ok()) {
            return conversion_error<std::vector<PriceDatum>>(
                "Failed to combine chunks: " + combined_result.status().ToString());
        }
        combined = *combined_result;
    }

    const std::vector<std::pair<std::string, bool>> columns = {
        {"id", false},          {"symbol", true},       {"interval", true},
        {"open_time", true},    {"open", true},         {"high", true},
        {"low", true},          {"close", true},        {"volume", true},
        {"close_time", true},   {"quote_volume", false}, {"count", false},
        {"taker_buy_volume", false}, {"taker_buy_quote_volume", false}};

    std::map<std::string, std::shared_ptr<arrow::Array>> arrays;
    for (const auto& [name, required] : columns) {
        auto array = column_array(combined, name, required);
        if (array.is_error()) {
            return forward_error<std::vector<PriceDatum>>(array);
        }
        if (array.value() && array.value()->length() != combined->num_rows()) {
            return conversion_error<std::vector<PriceDatum>>(
                "Column " + name + " has " + std::to_string(array.value()->length()) +
                " rows, table has " + std::to_string(combined->num_rows()));
        }
        arrays[name] = array.value();
    }

    std::vector<PriceDatum> rows;
    if (combined->num_rows() == 0) {
        return rows;
    }
    rows.reserve(static_cast<size_t>(combined->num_rows()));

    for (int64_t i = 0; i < combined->num_rows(); ++i) {
        PriceDatum row;

        if (arrays["id"]) {
            auto id = extract_optional_int64(arrays["id"], i);
            if (id.is_error()) {
                return forward_error<std::vector<PriceDatum>>(id);
            }
            row.id = id.value().value_or(0);
        }

        auto symbol = extract_string(arrays["symbol"], i);
        auto interval = extract_string(arrays["interval"], i);
        if (symbol.is_error() || interval.is_error()) {
            return conversion_error<std::vector<PriceDatum>>(
                "Error extracting symbol or interval at row " + std::to_string(i));
        }
        row.symbol = symbol.value();
        row.interval = interval.value();

        auto open_time = extract_timestamp(arrays["open_time"], i);
        auto close_time = extract_timestamp(arrays["close_time"], i);
        if (open_time.is_error()) {
            return forward_error<std::vector<PriceDatum>>(open_time);
        }
        if (close_time.is_error()) {
            return forward_error<std::vector<PriceDatum>>(close_time);
        }
        row.open_time = open_time.value();
        row.close_time = close_time.value();

        auto open = extract_double(arrays["open"], i);
        auto high = extract_double(arrays["high"], i);
        auto low = extract_double(arrays["low"], i);
        auto close = extract_double(arrays["close"], i);
        auto volume = extract_double(arrays["volume"], i);
        if (open.is_error() || high.is_error() || low.is_error() || close.is_error() ||
            volume.is_error()) {
            return conversion_error<std::vector<PriceDatum>>(
                "Error extracting OHLCV values at row " + std::to_string(i));
        }
        row.open = open.value();
        row.high = high.value();
        row.low = low.value();
        row.close = close.value();
        row.volume = volume.value();

        auto quote_volume = extract_optional_double(arrays["quote_volume"], i);
        auto count = extract_optional_int64(arrays["count"], i);
        auto taker_buy_volume = extract_optional_double(arrays["taker_buy_volume"], i);
        auto taker_buy_quote_volume = extract_optional_double(arrays["taker_buy_quote_volume"], i);
        if (quote_volume.is_error() || count.is_error() || taker_buy_volume.is_error() ||
            taker_buy_quote_volume.is_error()) {
            return conversion_error<std::vector<PriceDatum>>(
                "Error extracting trade statistics at row " + std::to_string(i));
        }
        row.quote_volume = quote_volume.value();
        row.count = count.value();
        row.taker_buy_volume = taker_buy_volume.value();
        row.taker_buy_quote_volume = taker_buy_quote_volume.value();

        rows.push_back(std::move(row));
    }

    return rows;
}

Result<Timestamp> DataConversionUtils::extract_timestamp(const std::shared_ptr<arrow::Array>& array,
                                                         int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                     COMPONENT);
    }
    if (array->type_id() != arrow::Type::TIMESTAMP) {
        return conversion_error<Timestamp>("Expected a timestamp column, got " +
                                           array->type()->ToString());
    }
    if (array->IsNull(index)) {
        return conversion_error<Timestamp>("Null timestamp value at index " +
                                           std::to_string(index));
    }

    auto ts_array = std::static_pointer_cast<arrow::TimestampArray>(array);
    const auto& ts_type = static_cast<const arrow::TimestampType&>(*array->type());
    int64_t value = ts_array->Value(index);

    switch (ts_type.unit()) {
        case arrow::TimeUnit::SECOND:
            return Result<Timestamp>(Timestamp(std::chrono::seconds(value)));
        case arrow::TimeUnit::MILLI:
            return Result<Timestamp>(Timestamp(std::chrono::milliseconds(value)));
        case arrow::TimeUnit::MICRO:
            return Result<Timestamp>(Timestamp(std::chrono::microseconds(value)));
        case arrow::TimeUnit::NANO:
            return Result<Timestamp>(Timestamp(
                std::chrono::duration_cast<Timestamp::duration>(std::chrono::nanoseconds(value))));
        default:
            return conversion_error<Timestamp>("Unsupported timestamp unit");
    }
}

Result<double> DataConversionUtils::extract_double(const std::shared_ptr<arrow::Array>& array,
                                                   int64_t index) {
    auto value = extract_optional_double(array, index);
    if (value.is_error()) {
        return forward_error<double>(value);
    }
    if (!value.value()) {
        return conversion_error<double>("Null double value at index " + std::to_string(index));
    }
    return Result<double>(*value.value());
}

Result<std::optional<double>> DataConversionUtils::extract_optional_double(
    const std::shared_ptr<arrow::Array>& array, int64_t index) {
    if (!array) {
        return Result<std::optional<double>>(std::optional<double>());
    }
    if (index < 0 || index >= array->length()) {
        return make_error<std::optional<double>>(ErrorCode::INVALID_ARGUMENT,
                                                 "Invalid array or index", COMPONENT);
    }
    if (array->type_id() != arrow::Type::DOUBLE) {
        return conversion_error<std::optional<double>>("Expected a double column, got " +
                                                       array->type()->ToString());
    }
    if (array->IsNull(index)) {
        return Result<std::optional<double>>(std::optional<double>());
    }
    auto double_array = std::static_pointer_cast<arrow::DoubleArray>(array);
    return Result<std::optional<double>>(std::optional<double>(double_array->Value(index)));
}

Result<std::optional<int64_t>> DataConversionUtils::extract_optional_int64(
    const std::shared_ptr<arrow::Array>& array, int64_t index) {
    if (!array) {
        return Result<std::optional<int64_t>>(std::optional<int64_t>());
    }
    if (index < 0 || index >= array->length()) {
        return make_error<std::optional<int64_t>>(ErrorCode::INVALID_ARGUMENT,
                                                  "Invalid array or index", COMPONENT);
    }
    if (array->type_id() != arrow::Type::INT64) {
        return conversion_error<std::optional<int64_t>>("Expected an int64 column, got " +
                                                        array->type()->ToString());
    }
    if (array->IsNull(index)) {
        return Result<std::optional<int64_t>>(std::optional<int64_t>());
    }
    auto int_array = std::static_pointer_cast<arrow::Int64Array>(array);
    return Result<std::optional<int64_t>>(std::optional<int64_t>(int_array->Value(index)));
}

Result<std::string> DataConversionUtils::extract_string(const std::shared_ptr<arrow::Array>& array,
                                                        int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<std::string>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                       COMPONENT);
    }
    if (array->type_id() != arrow::Type::STRING) {
        return conversion_error<std::string>("Expected a string column, got " +
                                             array->type()->ToString());
    }
    if (array->IsNull(index)) {
        return conversion_error<std::string>("Null string value at index " +
                                             std::to_string(index));
    }
    auto string_array = std::static_pointer_cast<arrow::StringArray>(array);
    return Result<std::string>(string_array->GetString(index));
}

}  // namespace trade_store

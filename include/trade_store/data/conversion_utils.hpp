// include/trade_store/data/conversion_utils.hpp
#pragma once

#include <arrow/api.h>
#include <arrow/type_traits.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>
#include "trade_store/core/error.hpp"
#include "trade_store/core/types.hpp"
#include "trade_store/schema/records.hpp"

namespace trade_store {

class DataConversionUtils {
public:
    /**
     * @brief Arrow schema of a price_data table
     *
     * Column order follows the table definition. Timestamps are timestamp[us],
     * count is int64 and the four trailing statistics columns are nullable.
     */
    static std::shared_ptr<arrow::Schema> price_data_schema();

    /**
     * @brief Convert stored bars to an Arrow table
     * @param rows Bars as read from a store
     * @return Result containing the table
     */
    static Result<std::shared_ptr<arrow::Table>> price_data_to_arrow_table(
        const std::vector<PriceDatum>& rows);

    /**
     * @brief Convert an Arrow table back to bars
     *
     * id and the nullable statistics columns may be absent; every other
     * price_data column is required.
     *
     * @param table Arrow table with price_data columns
     * @return Result containing the bars, CONVERSION_ERROR on missing or mistyped columns
     */
    static Result<std::vector<PriceDatum>> arrow_table_to_price_data(
        const std::shared_ptr<arrow::Table>& table);

private:
    /**
     * @brief Extract timestamp from Arrow array
     * @param array Arrow array containing timestamps of any unit
     * @param index Row index
     * @return Result containing timestamp
     */
    static Result<Timestamp> extract_timestamp(const std::shared_ptr<arrow::Array>& array,
                                               int64_t index);

    /**
     * @brief Extract double value from Arrow array
     * @param array Arrow array containing doubles
     * @param index Row index
     * @return Result containing double value
     */
    static Result<double> extract_double(const std::shared_ptr<arrow::Array>& array,
                                         int64_t index);

    static Result<std::optional<double>> extract_optional_double(
        const std::shared_ptr<arrow::Array>& array, int64_t index);

    static Result<std::optional<int64_t>> extract_optional_int64(
        const std::shared_ptr<arrow::Array>& array, int64_t index);

    /**
     * @brief Extract string value from Arrow array
     * @param array Arrow array containing strings
     * @param index Row index
     * @return Result containing string value
     */
    static Result<std::string> extract_string(const std::shared_ptr<arrow::Array>& array,
                                              int64_t index);
};

}  // namespace trade_store

// include/option_screener/data/conversion_utils.hpp
#pragma once

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "option_screener/core/error.hpp"
#include "option_screener/core/types.hpp"

namespace option_screener {

/**
 * @brief CSV loading and Arrow table conversion shared by the file-backed providers
 */
class DataConversionUtils {
public:
    using ColumnTypes = std::unordered_map<std::string, std::shared_ptr<arrow::DataType>>;

    /**
     * @brief Read a CSV file with a header row into an Arrow table
     * @param path File path
     * @param column_types Explicit types for named columns; others are inferred
     */
    static Result<std::shared_ptr<arrow::Table>> read_csv_file(const std::string& path,
                                                               const ColumnTypes& column_types);

    /**
     * @brief Read CSV text with a header row into an Arrow table
     */
    static Result<std::shared_ptr<arrow::Table>> read_csv_string(const std::string& text,
                                                                 const ColumnTypes& column_types);

    /**
     * @brief Extract a string column as a list of non-empty, trimmed values
     * @param table Source table
     * @param column Column name
     */
    static Result<std::vector<std::string>> arrow_table_to_symbols(
        const std::shared_ptr<arrow::Table>& table, const std::string& column);

    /**
     * @brief Convert a (date, close) table to a validated price series
     * @param table Table with a date column (utf8, date32 or timestamp) and a numeric close column
     * @param symbol Symbol the series belongs to
     * @param date_column Name of the date column
     * @param close_column Name of the adjusted close column
     */
    static Result<PriceSeries> arrow_table_to_price_series(
        const std::shared_ptr<arrow::Table>& table, const std::string& symbol,
        const std::string& date_column, const std::string& close_column);

    /**
     * @brief Sort points ascending by date and reject duplicate dates
     * @return INVALID_DATA if two points share a date
     */
    static Result<PriceSeries> make_price_series(const std::string& symbol,
                                                 std::vector<PricePoint> points);

private:
    static Result<std::shared_ptr<arrow::Table>> read_csv(
        std::shared_ptr<arrow::io::InputStream> input, const ColumnTypes& column_types,
        const std::string& source);

    static Result<Timestamp> extract_date(const std::shared_ptr<arrow::Array>& array,
                                          int64_t index);

    static Result<double> extract_double(const std::shared_ptr<arrow::Array>& array,
                                         int64_t index);
};

}  // namespace option_screener

// src/data/conversion_utils.cpp
#include "option_screener/data/conversion_utils.hpp"
#include <arrow/csv/api.h>
#include <algorithm>
#include <cctype>
#include "option_screener/core/time_utils.hpp"

namespace option_screener {

namespace {

std::string trim(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(),
                                [](unsigned char c) { return std::isspace(c); })
                   .base();
    return begin < end ? std::string(begin, end) : std::string();
}

}  // namespace

Result<std::shared_ptr<arrow::Table>> DataConversionUtils::read_csv_file(
    const std::string& path, const ColumnTypes& column_types) {
    auto file_result = arrow::io::ReadableFile::Open(path);
    if (!file_result.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::FILE_NOT_FOUND,
            "Failed to open " + path + ": " + file_result.status().ToString(),
            "DataConversionUtils");
    }
    return read_csv(*file_result, column_types, path);
}

Result<std::shared_ptr<arrow::Table>> DataConversionUtils::read_csv_string(
    const std::string& text, const ColumnTypes& column_types) {
    auto buffer = arrow::Buffer::FromString(text);
    auto input = std::make_shared<arrow::io::BufferReader>(buffer);
    return read_csv(input, column_types, "<memory>");
}

Result<std::shared_ptr<arrow::Table>> DataConversionUtils::read_csv(
    std::shared_ptr<arrow::io::InputStream> input, const ColumnTypes& column_types,
    const std::string& source) {
    auto read_options = arrow::csv::ReadOptions::Defaults();
    auto parse_options = arrow::csv::ParseOptions::Defaults();
    auto convert_options = arrow::csv::ConvertOptions::Defaults();
    for (const auto& [name, type] : column_types) {
        convert_options.column_types[name] = type;
    }

    auto reader_result =
        arrow::csv::TableReader::Make(arrow::io::default_io_context(), std::move(input),
                                      read_options, parse_options, convert_options);
    if (!reader_result.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR,
            "Failed to create CSV reader for " + source + ": " +
                reader_result.status().ToString(),
            "DataConversionUtils");
    }

    auto table_result = (*reader_result)->Read();
    if (!table_result.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR,
            "Failed to parse CSV " + source + ": " + table_result.status().ToString(),
            "DataConversionUtils");
    }

    return Result<std::shared_ptr<arrow::Table>>(*table_result);
}

Result<std::vector<std::string>> DataConversionUtils::arrow_table_to_symbols(
    const std::shared_ptr<arrow::Table>& table, const std::string& column) {
    if (!table) {
        return make_error<std::vector<std::string>>(ErrorCode::INVALID_ARGUMENT,
                                                    "Table pointer is null", "DataConversionUtils");
    }

    auto chunked = table->GetColumnByName(column);
    if (!chunked) {
        return make_error<std::vector<std::string>>(
            ErrorCode::INVALID_DATA, "Missing required column: " + column, "DataConversionUtils");
    }
    if (chunked->type()->id() != arrow::Type::STRING) {
        return make_error<std::vector<std::string>>(
            ErrorCode::CONVERSION_ERROR,
            "Column " + column + " is not a string column (" + chunked->type()->ToString() + ")",
            "DataConversionUtils");
    }

    std::vector<std::string> symbols;
    symbols.reserve(static_cast<size_t>(table->num_rows()));
    for (int c = 0; c < chunked->num_chunks(); ++c) {
        auto strings = std::static_pointer_cast<arrow::StringArray>(chunked->chunk(c));
        for (int64_t i = 0; i < strings->length(); ++i) {
            if (strings->IsNull(i)) {
                continue;
            }
            std::string symbol = trim(strings->GetString(i));
            if (!symbol.empty()) {
                symbols.push_back(std::move(symbol));
            }
        }
    }

    return Result<std::vector<std::string>>(std::move(symbols));
}

Result<PriceSeries> DataConversionUtils::arrow_table_to_price_series(
    const std::shared_ptr<arrow::Table>& table, const std::string& symbol,
    const std::string& date_column, const std::string& close_column) {
    if (!table) {
        return make_error<PriceSeries>(ErrorCode::INVALID_ARGUMENT, "Table pointer is null",
                                       "DataConversionUtils");
    }

    for (const auto& col : {date_column, close_column}) {
        if (table->GetColumnByName(col) == nullptr) {
            return make_error<PriceSeries>(ErrorCode::INVALID_DATA,
                                           "Missing required column: " + col + " for " + symbol,
                                           "DataConversionUtils");
        }
    }

    auto dates = table->GetColumnByName(date_column);
    auto closes = table->GetColumnByName(close_column);

    std::vector<PricePoint> points;
    points.reserve(static_cast<size_t>(table->num_rows()));

    // Both columns come from the same table, so their chunk layouts match
    for (int c = 0; c < dates->num_chunks(); ++c) {
        auto date_array = dates->chunk(c);
        auto close_array = closes->chunk(c);
        for (int64_t i = 0; i < date_array->length(); ++i) {
            auto date_result = extract_date(date_array, i);
            if (date_result.is_error()) {
                return make_error<PriceSeries>(date_result.error()->code(),
                                               std::string(date_result.error()->what()) +
                                                   " for " + symbol,
                                               "DataConversionUtils");
            }
            auto close_result = extract_double(close_array, i);
            if (close_result.is_error()) {
                return make_error<PriceSeries>(close_result.error()->code(),
                                               std::string(close_result.error()->what()) +
                                                   " for " + symbol,
                                               "DataConversionUtils");
            }
            points.emplace_back(date_result.value(), close_result.value());
        }
    }

    return make_price_series(symbol, std::move(points));
}

Result<PriceSeries> DataConversionUtils::make_price_series(const std::string& symbol,
                                                           std::vector<PricePoint> points) {
    std::stable_sort(points.begin(), points.end(),
                     [](const PricePoint& a, const PricePoint& b) { return a.date < b.date; });

    auto duplicate = std::adjacent_find(
        points.begin(), points.end(),
        [](const PricePoint& a, const PricePoint& b) { return a.date == b.date; });
    if (duplicate != points.end()) {
        return make_error<PriceSeries>(
            ErrorCode::INVALID_DATA,
            "Duplicate date " + core::format_iso_date(duplicate->date) + " for " + symbol,
            "DataConversionUtils");
    }

    PriceSeries series;
    series.symbol = symbol;
    series.points = std::move(points);
    return Result<PriceSeries>(std::move(series));
}

Result<Timestamp> DataConversionUtils::extract_date(const std::shared_ptr<arrow::Array>& array,
                                                    int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                     "DataConversionUtils");
    }
    if (array->IsNull(index)) {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA,
                                     "Null date at row " + std::to_string(index),
                                     "DataConversionUtils");
    }

    switch (array->type_id()) {
        case arrow::Type::STRING: {
            auto strings = std::static_pointer_cast<arrow::StringArray>(array);
            auto parsed = core::parse_iso_date(strings->GetString(index));
            if (!parsed) {
                return make_error<Timestamp>(
                    ErrorCode::CONVERSION_ERROR,
                    "Unparseable date '" + strings->GetString(index) + "' at row " +
                        std::to_string(index),
                    "DataConversionUtils");
            }
            return Result<Timestamp>(*parsed);
        }
        case arrow::Type::DATE32: {
            auto days = std::static_pointer_cast<arrow::Date32Array>(array)->Value(index);
            return Result<Timestamp>(Timestamp(std::chrono::hours(24 * static_cast<int64_t>(days))));
        }
        case arrow::Type::TIMESTAMP: {
            auto ts_array = std::static_pointer_cast<arrow::TimestampArray>(array);
            auto ts_type = std::static_pointer_cast<arrow::TimestampType>(ts_array->type());
            int64_t raw = ts_array->Value(index);
            std::chrono::system_clock::duration since_epoch;
            switch (ts_type->unit()) {
                case arrow::TimeUnit::SECOND:
                    since_epoch = std::chrono::duration_cast<std::chrono::system_clock::duration>(
                        std::chrono::seconds(raw));
                    break;
                case arrow::TimeUnit::MILLI:
                    since_epoch = std::chrono::duration_cast<std::chrono::system_clock::duration>(
                        std::chrono::milliseconds(raw));
                    break;
                case arrow::TimeUnit::MICRO:
                    since_epoch = std::chrono::duration_cast<std::chrono::system_clock::duration>(
                        std::chrono::microseconds(raw));
                    break;
                case arrow::TimeUnit::NANO:
                default:
                    since_epoch = std::chrono::duration_cast<std::chrono::system_clock::duration>(
                        std::chrono::nanoseconds(raw));
                    break;
            }
            return Result<Timestamp>(Timestamp(since_epoch));
        }
        default:
            return make_error<Timestamp>(
                ErrorCode::CONVERSION_ERROR,
                "Unsupported date column type: " + array->type()->ToString(),
                "DataConversionUtils");
    }
}

Result<double> DataConversionUtils::extract_double(const std::shared_ptr<arrow::Array>& array,
                                                   int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                  "DataConversionUtils");
    }
    if (array->IsNull(index)) {
        return make_error<double>(ErrorCode::INVALID_DATA,
                                  "Null close at row " + std::to_string(index),
                                  "DataConversionUtils");
    }

    switch (array->type_id()) {
        case arrow::Type::DOUBLE:
            return Result<double>(std::static_pointer_cast<arrow::DoubleArray>(array)->Value(index));
        case arrow::Type::FLOAT:
            return Result<double>(
                static_cast<double>(std::static_pointer_cast<arrow::FloatArray>(array)->Value(index)));
        case arrow::Type::INT64:
            return Result<double>(
                static_cast<double>(std::static_pointer_cast<arrow::Int64Array>(array)->Value(index)));
        default:
            return make_error<double>(
                ErrorCode::CONVERSION_ERROR,
                "Unsupported close column type: " + array->type()->ToString(),
                "DataConversionUtils");
    }
}

}  // namespace option_screener

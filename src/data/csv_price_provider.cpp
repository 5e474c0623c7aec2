// src/data/csv_price_provider.cpp
#include "option_screener/data/csv_price_provider.hpp"
#include <filesystem>
#include "option_screener/data/conversion_utils.hpp"

namespace option_screener {

CsvPriceProvider::CsvPriceProvider(std::string directory, std::string date_column,
                                   std::string close_column)
    : directory_(std::move(directory)),
      date_column_(std::move(date_column)),
      close_column_(std::move(close_column)) {}

Result<PriceSeries> CsvPriceProvider::fetch_price_series(const std::string& symbol) {
    if (symbol.empty() || symbol.find('/') != std::string::npos ||
        symbol.find("..") != std::string::npos) {
        return make_error<PriceSeries>(ErrorCode::INVALID_ARGUMENT, "Invalid symbol: " + symbol,
                                       "CsvPriceProvider");
    }

    std::filesystem::path path = std::filesystem::path(directory_) / (symbol + ".csv");
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return make_error<PriceSeries>(ErrorCode::DATA_UNAVAILABLE,
                                       "No price file for " + symbol + " at " + path.string(),
                                       "CsvPriceProvider");
    }

    auto table = DataConversionUtils::read_csv_file(
        path.string(), {{date_column_, arrow::utf8()}, {close_column_, arrow::float64()}});
    if (table.is_error()) {
        return make_error<PriceSeries>(table.error()->code(), table.error()->what(),
                                       "CsvPriceProvider");
    }

    return DataConversionUtils::arrow_table_to_price_series(table.value(), symbol, date_column_,
                                                            close_column_);
}

}  // namespace option_screener

// src/data/csv_universe_provider.cpp
#include "option_screener/data/csv_universe_provider.hpp"
#include "option_screener/core/logger.hpp"
#include "option_screener/data/conversion_utils.hpp"

namespace option_screener {

CsvUniverseProvider::CsvUniverseProvider(std::string source, std::string symbol_column,
                                         std::shared_ptr<HttpClient> http)
    : source_(std::move(source)), symbol_column_(std::move(symbol_column)), http_(std::move(http)) {}

bool CsvUniverseProvider::is_url(const std::string& source) {
    return source.rfind("http://", 0) == 0 || source.rfind("https://", 0) == 0;
}

Result<TickerUniverse> CsvUniverseProvider::fetch_ticker_universe() {
    if (!is_url(source_)) {
        auto table = DataConversionUtils::read_csv_file(source_, {{symbol_column_, arrow::utf8()}});
        if (table.is_error()) {
            return make_error<TickerUniverse>(table.error()->code(), table.error()->what(),
                                              "CsvUniverseProvider");
        }
        return from_table(table.value(), symbol_column_);
    }

    if (!http_) {
        return make_error<TickerUniverse>(ErrorCode::INVALID_ARGUMENT,
                                          "No HTTP client for universe source " + source_,
                                          "CsvUniverseProvider");
    }

    auto response = http_->get(source_);
    if (response.is_error()) {
        return make_error<TickerUniverse>(response.error()->code(),
                                          std::string("Universe download failed: ") +
                                              response.error()->what(),
                                          "CsvUniverseProvider");
    }
    if (response.value().status_code != 200) {
        return make_error<TickerUniverse>(
            ErrorCode::DATA_UNAVAILABLE,
            "Universe download returned HTTP " + std::to_string(response.value().status_code),
            "CsvUniverseProvider");
    }

    return parse_csv(response.value().body, symbol_column_);
}

Result<TickerUniverse> CsvUniverseProvider::parse_csv(const std::string& text,
                                                      const std::string& symbol_column) {
    auto table = DataConversionUtils::read_csv_string(text, {{symbol_column, arrow::utf8()}});
    if (table.is_error()) {
        return make_error<TickerUniverse>(table.error()->code(), table.error()->what(),
                                          "CsvUniverseProvider");
    }
    return from_table(table.value(), symbol_column);
}

Result<TickerUniverse> CsvUniverseProvider::from_table(const std::shared_ptr<arrow::Table>& table,
                                                       const std::string& symbol_column) {
    auto symbols = DataConversionUtils::arrow_table_to_symbols(table, symbol_column);
    if (symbols.is_error()) {
        return make_error<TickerUniverse>(symbols.error()->code(), symbols.error()->what(),
                                          "CsvUniverseProvider");
    }
    if (symbols.value().empty()) {
        return make_error<TickerUniverse>(ErrorCode::DATA_UNAVAILABLE,
                                          "Ticker universe is empty", "CsvUniverseProvider");
    }

    TickerUniverse universe;
    universe.symbols = symbols.take_value();
    universe.metadata = table;
    INFO("Loaded ticker universe of " << universe.symbols.size() << " symbols");
    return Result<TickerUniverse>(std::move(universe));
}

}  // namespace option_screener

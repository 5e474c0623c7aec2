// include/option_screener/data/csv_universe_provider.hpp
#pragma once

#include <memory>
#include <string>
#include "option_screener/data/http_client.hpp"
#include "option_screener/data/providers.hpp"

namespace option_screener {

/**
 * @brief Ticker universe from a constituents CSV (one row per company)
 *
 * The source is downloaded when it is an http(s) URL and read from disk
 * otherwise. The symbol column, in file order, becomes the universe; the
 * whole table is kept as metadata.
 */
class CsvUniverseProvider : public ITickerUniverseProvider {
public:
    /**
     * @param source URL or path of the CSV
     * @param symbol_column Header of the symbol column
     * @param http Client used for URL sources, may be null for file sources
     */
    CsvUniverseProvider(std::string source, std::string symbol_column,
                        std::shared_ptr<HttpClient> http = nullptr);

    Result<TickerUniverse> fetch_ticker_universe() override;

    /**
     * @brief Build a universe from CSV text
     */
    static Result<TickerUniverse> parse_csv(const std::string& text,
                                            const std::string& symbol_column);

private:
    static bool is_url(const std::string& source);
    static Result<TickerUniverse> from_table(const std::shared_ptr<arrow::Table>& table,
                                             const std::string& symbol_column);

    std::string source_;
    std::string symbol_column_;
    std::shared_ptr<HttpClient> http_;
};

}  // namespace option_screener

// include/option_screener/data/csv_price_provider.hpp
#pragma once

#include <string>
#include "option_screener/data/providers.hpp"

namespace option_screener {

/**
 * @brief Reads <directory>/<SYMBOL>.csv files with date and adjusted close columns
 *
 * Used for offline runs and reproducible fixtures. A missing file is
 * reported as DATA_UNAVAILABLE, exactly like an unknown symbol upstream.
 */
class CsvPriceProvider : public IPriceSeriesProvider {
public:
    explicit CsvPriceProvider(std::string directory, std::string date_column = "date",
                              std::string close_column = "adjusted_close");

    Result<PriceSeries> fetch_price_series(const std::string& symbol) override;

private:
    std::string directory_;
    std::string date_column_;
    std::string close_column_;
};

}  // namespace option_screener

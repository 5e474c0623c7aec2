// include/option_screener/data/providers.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include <vector>
#include "option_screener/core/error.hpp"
#include "option_screener/core/types.hpp"

namespace option_screener {

/**
 * @brief Symbols to screen plus whatever metadata the source carries
 */
struct TickerUniverse {
    std::vector<std::string> symbols;
    std::shared_ptr<arrow::Table> metadata;  // may be null
};

/**
 * @brief Source of the annualized short-term risk-free rate
 */
class IRiskFreeRateProvider {
public:
    virtual ~IRiskFreeRateProvider() = default;

    /**
     * @brief Fetch the latest rate as a decimal fraction (0.05 = 5%)
     * @return Rate, or an error the caller replaces with its default
     */
    virtual Result<double> fetch_risk_free_rate() = 0;
};

/**
 * @brief Source of daily adjusted closes
 */
class IPriceSeriesProvider {
public:
    virtual ~IPriceSeriesProvider() = default;

    /**
     * @brief Fetch a symbol's series in ascending date order
     *
     * Missing symbols, malformed responses and transport failures are all
     * reported as errors; the pipeline treats every error as unavailable.
     */
    virtual Result<PriceSeries> fetch_price_series(const std::string& symbol) = 0;
};

/**
 * @brief Source of the symbols available for screening
 */
class ITickerUniverseProvider {
public:
    virtual ~ITickerUniverseProvider() = default;

    virtual Result<TickerUniverse> fetch_ticker_universe() = 0;
};

}  // namespace option_screener

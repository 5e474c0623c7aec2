// include/option_screener/data/alpha_vantage_provider.hpp
#pragma once

#include <memory>
#include <string>
#include "option_screener/data/http_client.hpp"
#include "option_screener/data/provider_config.hpp"
#include "option_screener/data/providers.hpp"

namespace option_screener {

/**
 * @brief Daily adjusted closes from Alpha Vantage's TIME_SERIES_DAILY_ADJUSTED
 */
class AlphaVantagePriceProvider : public IPriceSeriesProvider {
public:
    AlphaVantagePriceProvider(std::shared_ptr<HttpClient> http, std::string api_key,
                              const ProviderConfig& config);

    Result<PriceSeries> fetch_price_series(const std::string& symbol) override;

    /**
     * @brief Parse a TIME_SERIES_DAILY_ADJUSTED response body
     *
     * Error and throttling messages in the payload ("Error Message", "Note",
     * "Information") are reported as errors rather than an empty series.
     */
    static Result<PriceSeries> parse_response(const std::string& symbol, const std::string& body);

private:
    std::string build_url(const std::string& symbol) const;

    std::shared_ptr<HttpClient> http_;
    std::string api_key_;
    std::string base_url_;
    std::string output_size_;
};

}  // namespace option_screener

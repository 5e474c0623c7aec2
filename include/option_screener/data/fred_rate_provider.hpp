// include/option_screener/data/fred_rate_provider.hpp
#pragma once

#include <memory>
#include <string>
#include "option_screener/data/http_client.hpp"
#include "option_screener/data/provider_config.hpp"
#include "option_screener/data/providers.hpp"

namespace option_screener {

/**
 * @brief Short-term Treasury yield from the FRED observations API
 */
class FredRateProvider : public IRiskFreeRateProvider {
public:
    FredRateProvider(std::shared_ptr<HttpClient> http, std::string api_key,
                     const ProviderConfig& config);

    Result<double> fetch_risk_free_rate() override;

    /**
     * @brief Latest numeric observation of a series, converted from percent to decimal
     *
     * FRED reports missing days as "."; those observations are ignored.
     */
    static Result<double> parse_response(const std::string& body);

private:
    std::shared_ptr<HttpClient> http_;
    std::string api_key_;
    std::string base_url_;
    std::string series_id_;
};

}  // namespace option_screener

// src/data/alpha_vantage_provider.cpp
#include "option_screener/data/alpha_vantage_provider.hpp"
#include <nlohmann/json.hpp>
#include <vector>
#include "option_screener/core/logger.hpp"
#include "option_screener/core/time_utils.hpp"
#include "option_screener/data/conversion_utils.hpp"

namespace option_screener {

namespace {
const char* const TIME_SERIES_KEY = "Time Series (Daily)";
const char* const ADJUSTED_CLOSE_KEY = "5. adjusted close";
}  // namespace

AlphaVantagePriceProvider::AlphaVantagePriceProvider(std::shared_ptr<HttpClient> http,
                                                     std::string api_key,
                                                     const ProviderConfig& config)
    : http_(std::move(http)),
      api_key_(std::move(api_key)),
      base_url_(config.alpha_vantage_base_url),
      output_size_(config.alpha_vantage_output_size) {}

std::string AlphaVantagePriceProvider::build_url(const std::string& symbol) const {
    return base_url_ + "?function=TIME_SERIES_DAILY_ADJUSTED&symbol=" +
           HttpClient::url_encode(symbol) + "&outputsize=" + output_size_ +
           "&apikey=" + HttpClient::url_encode(api_key_);
}

Result<PriceSeries> AlphaVantagePriceProvider::fetch_price_series(const std::string& symbol) {
    if (symbol.empty()) {
        return make_error<PriceSeries>(ErrorCode::INVALID_ARGUMENT, "Empty symbol",
                                       "AlphaVantagePriceProvider");
    }

    auto response = http_->get(build_url(symbol));
    if (response.is_error()) {
        return make_error<PriceSeries>(response.error()->code(),
                                       "Request for " + symbol + " failed: " +
                                           response.error()->what(),
                                       "AlphaVantagePriceProvider");
    }
    if (response.value().status_code != 200) {
        return make_error<PriceSeries>(
            ErrorCode::DATA_UNAVAILABLE,
            "HTTP " + std::to_string(response.value().status_code) + " for " + symbol,
            "AlphaVantagePriceProvider");
    }

    return parse_response(symbol, response.value().body);
}

Result<PriceSeries> AlphaVantagePriceProvider::parse_response(const std::string& symbol,
                                                              const std::string& body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<PriceSeries>(ErrorCode::JSON_PARSE_ERROR,
                                       "Malformed response for " + symbol + ": " + e.what(),
                                       "AlphaVantagePriceProvider");
    }

    if (!j.is_object()) {
        return make_error<PriceSeries>(ErrorCode::INVALID_DATA,
                                       "Unexpected response shape for " + symbol,
                                       "AlphaVantagePriceProvider");
    }
    if (j.contains("Error Message")) {
        return make_error<PriceSeries>(ErrorCode::DATA_UNAVAILABLE,
                                       "Alpha Vantage rejected " + symbol + ": " +
                                           j["Error Message"].dump(),
                                       "AlphaVantagePriceProvider");
    }
    for (const char* notice : {"Note", "Information"}) {
        if (j.contains(notice)) {
            return make_error<PriceSeries>(ErrorCode::API_ERROR,
                                           "Alpha Vantage notice for " + symbol + ": " +
                                               j[notice].dump(),
                                           "AlphaVantagePriceProvider");
        }
    }
    if (!j.contains(TIME_SERIES_KEY) || !j[TIME_SERIES_KEY].is_object()) {
        return make_error<PriceSeries>(ErrorCode::INVALID_DATA,
                                       "Missing '" + std::string(TIME_SERIES_KEY) + "' for " +
                                           symbol,
                                       "AlphaVantagePriceProvider");
    }

    std::vector<PricePoint> points;
    const auto& series = j[TIME_SERIES_KEY];
    points.reserve(series.size());

    for (auto it = series.begin(); it != series.end(); ++it) {
        auto date = core::parse_iso_date(it.key());
        if (!date) {
            return make_error<PriceSeries>(ErrorCode::INVALID_DATA,
                                           "Bad date '" + it.key() + "' for " + symbol,
                                           "AlphaVantagePriceProvider");
        }
        const auto& bar = it.value();
        if (!bar.is_object() || !bar.contains(ADJUSTED_CLOSE_KEY)) {
            return make_error<PriceSeries>(ErrorCode::INVALID_DATA,
                                           "Missing adjusted close on " + it.key() + " for " +
                                               symbol,
                                           "AlphaVantagePriceProvider");
        }

        double close = 0.0;
        try {
            const auto& field = bar[ADJUSTED_CLOSE_KEY];
            close = field.is_string() ? std::stod(field.get<std::string>()) : field.get<double>();
        } catch (const std::exception& e) {
            return make_error<PriceSeries>(ErrorCode::INVALID_DATA,
                                           "Unparseable adjusted close on " + it.key() + " for " +
                                               symbol + ": " + e.what(),
                                           "AlphaVantagePriceProvider");
        }
        points.emplace_back(*date, close);
    }

    auto series_result = DataConversionUtils::make_price_series(symbol, std::move(points));
    if (series_result.is_ok()) {
        DEBUG("Parsed " << series_result.value().size() << " closes for " << symbol);
    }
    return series_result;
}

}  // namespace option_screener

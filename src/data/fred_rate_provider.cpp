// src/data/fred_rate_provider.cpp
#include "option_screener/data/fred_rate_provider.hpp"
#include <cmath>
#include <nlohmann/json.hpp>
#include <optional>

namespace option_screener {

FredRateProvider::FredRateProvider(std::shared_ptr<HttpClient> http, std::string api_key,
                                   const ProviderConfig& config)
    : http_(std::move(http)),
      api_key_(std::move(api_key)),
      base_url_(config.fred_base_url),
      series_id_(config.fred_series_id) {}

Result<double> FredRateProvider::fetch_risk_free_rate() {
    if (api_key_.empty()) {
        return make_error<double>(ErrorCode::DATA_UNAVAILABLE, "No FRED API key configured",
                                  "FredRateProvider");
    }

    // Newest first; a short window is enough to step over missing days
    std::string url = base_url_ + "?series_id=" + HttpClient::url_encode(series_id_) +
                      "&api_key=" + HttpClient::url_encode(api_key_) +
                      "&file_type=json&sort_order=desc&limit=10";

    auto response = http_->get(url);
    if (response.is_error()) {
        return make_error<double>(response.error()->code(),
                                  std::string("FRED request failed: ") + response.error()->what(),
                                  "FredRateProvider");
    }
    if (response.value().status_code != 200) {
        return make_error<double>(
            ErrorCode::DATA_UNAVAILABLE,
            "FRED returned HTTP " + std::to_string(response.value().status_code),
            "FredRateProvider");
    }

    return parse_response(response.value().body);
}

Result<double> FredRateProvider::parse_response(const std::string& body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<double>(ErrorCode::JSON_PARSE_ERROR,
                                  std::string("Malformed FRED response: ") + e.what(),
                                  "FredRateProvider");
    }

    if (!j.is_object() || !j.contains("observations") || !j["observations"].is_array()) {
        return make_error<double>(ErrorCode::INVALID_DATA, "FRED response has no observations",
                                  "FredRateProvider");
    }

    std::optional<std::string> latest_date;
    double latest_value = 0.0;
    for (const auto& obs : j["observations"]) {
        if (!obs.is_object() || !obs.contains("date") || !obs.contains("value") ||
            !obs["date"].is_string() || !obs["value"].is_string()) {
            continue;
        }
        const std::string value = obs["value"].get<std::string>();
        double percent = 0.0;
        try {
            size_t consumed = 0;
            percent = std::stod(value, &consumed);
            if (consumed != value.size()) {
                continue;
            }
        } catch (const std::exception&) {
            continue;  // "." marks a missing observation
        }
        if (!std::isfinite(percent)) {
            continue;
        }

        // ISO dates compare correctly as strings
        const std::string date = obs["date"].get<std::string>();
        if (!latest_date || date > *latest_date) {
            latest_date = date;
            latest_value = percent;
        }
    }

    if (!latest_date) {
        return make_error<double>(ErrorCode::DATA_UNAVAILABLE,
                                  "FRED response has no numeric observation", "FredRateProvider");
    }
    return Result<double>(latest_value / 100.0);
}

}  // namespace option_screener

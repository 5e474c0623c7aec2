// src/screening/screener_config.cpp
#include "option_screener/screening/screener_config.hpp"
#include <cmath>
#include <sstream>

namespace option_screener {

Result<void> ScreenerConfig::validate() const {
    if (symbol_count <= 0) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                "Number of symbols to screen must be positive", "ScreenerConfig");
    }
    if (symbol_count < min_symbol_count || symbol_count > max_symbol_count) {
        std::ostringstream ss;
        ss << "Number of symbols must be between " << min_symbol_count << " and "
           << max_symbol_count << ", got " << symbol_count;
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION, ss.str(), "ScreenerConfig");
    }
    if (!std::isfinite(capital) || capital <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION, "Capital must be positive",
                                "ScreenerConfig");
    }
    if (capital < min_capital) {
        std::ostringstream ss;
        ss << "Capital must be at least " << min_capital << ", got " << capital;
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION, ss.str(), "ScreenerConfig");
    }
    if (providers.http_timeout_seconds <= 0 || providers.pacing_interval_ms < 0) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                "HTTP timeout must be positive and pacing non-negative",
                                "ScreenerConfig");
    }
    return pipeline.validate();
}

nlohmann::json ScreenerConfig::to_json() const {
    nlohmann::json j;
    j["symbol_count"] = symbol_count;
    j["capital"] = capital;
    j["min_symbol_count"] = min_symbol_count;
    j["max_symbol_count"] = max_symbol_count;
    j["min_capital"] = min_capital;
    j["pipeline"] = pipeline.to_json();
    j["providers"] = providers.to_json();
    j["logging"] = logging.to_json();
    return j;
}

void ScreenerConfig::from_json(const nlohmann::json& j) {
    if (j.contains("symbol_count"))
        symbol_count = j.at("symbol_count").get<int>();
    if (j.contains("capital"))
        capital = j.at("capital").get<double>();
    if (j.contains("min_symbol_count"))
        min_symbol_count = j.at("min_symbol_count").get<int>();
    if (j.contains("max_symbol_count"))
        max_symbol_count = j.at("max_symbol_count").get<int>();
    if (j.contains("min_capital"))
        min_capital = j.at("min_capital").get<double>();
    if (j.contains("pipeline"))
        pipeline.from_json(j.at("pipeline"));
    if (j.contains("providers"))
        providers.from_json(j.at("providers"));
    if (j.contains("logging"))
        logging.from_json(j.at("logging"));
}

}  // namespace option_screener

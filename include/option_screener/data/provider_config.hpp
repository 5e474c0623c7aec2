// include/option_screener/data/provider_config.hpp
#pragma once

#include <string>
#include "option_screener/core/config_base.hpp"

namespace option_screener {

/**
 * @brief Endpoints and transport settings for the external data sources
 */
struct ProviderConfig : public ConfigBase {
    std::string alpha_vantage_base_url{"https://www.alphavantage.co/query"};
    std::string alpha_vantage_output_size{"compact"};  // ~100 most recent sessions
    std::string fred_base_url{"https://api.stlouisfed.org/fred/series/observations"};
    std::string fred_series_id{"DGS1MO"};              // 1-month Treasury, percent
    std::string universe_source{
        "https://datahub.io/core/s-and-p-500-companies/r/constituents.csv"};
    std::string symbol_column{"Symbol"};
    std::string offline_price_directory;               // empty: use Alpha Vantage
    long http_timeout_seconds{10};
    long pacing_interval_ms{800};

    bool use_offline_prices() const {
        return !offline_price_directory.empty();
    }

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["alpha_vantage_base_url"] = alpha_vantage_base_url;
        j["alpha_vantage_output_size"] = alpha_vantage_output_size;
        j["fred_base_url"] = fred_base_url;
        j["fred_series_id"] = fred_series_id;
        j["universe_source"] = universe_source;
        j["symbol_column"] = symbol_column;
        j["offline_price_directory"] = offline_price_directory;
        j["http_timeout_seconds"] = http_timeout_seconds;
        j["pacing_interval_ms"] = pacing_interval_ms;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("alpha_vantage_base_url"))
            alpha_vantage_base_url = j.at("alpha_vantage_base_url").get<std::string>();
        if (j.contains("alpha_vantage_output_size"))
            alpha_vantage_output_size = j.at("alpha_vantage_output_size").get<std::string>();
        if (j.contains("fred_base_url"))
            fred_base_url = j.at("fred_base_url").get<std::string>();
        if (j.contains("fred_series_id"))
            fred_series_id = j.at("fred_series_id").get<std::string>();
        if (j.contains("universe_source"))
            universe_source = j.at("universe_source").get<std::string>();
        if (j.contains("symbol_column"))
            symbol_column = j.at("symbol_column").get<std::string>();
        if (j.contains("offline_price_directory"))
            offline_price_directory = j.at("offline_price_directory").get<std::string>();
        if (j.contains("http_timeout_seconds"))
            http_timeout_seconds = j.at("http_timeout_seconds").get<long>();
        if (j.contains("pacing_interval_ms"))
            pacing_interval_ms = j.at("pacing_interval_ms").get<long>();
    }
};

}  // namespace option_screener

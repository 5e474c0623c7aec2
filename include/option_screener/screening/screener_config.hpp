// include/option_screener/screening/screener_config.hpp
#pragma once

#include <cstddef>
#include "option_screener/core/config_base.hpp"
#include "option_screener/core/logger.hpp"
#include "option_screener/data/provider_config.hpp"
#include "option_screener/screening/screening_pipeline.hpp"

namespace option_screener {

/**
 * @brief Complete configuration of one screener run
 *
 * The two user parameters (symbol_count, capital) are bounded here; the
 * bounds default to the ranges the screener has always offered.
 */
struct ScreenerConfig : public ConfigBase {
    int symbol_count{50};
    double capital{1000.0};

    int min_symbol_count{25};
    int max_symbol_count{150};
    double min_capital{100.0};

    PipelineConfig pipeline;
    ProviderConfig providers;
    LoggerConfig logging;

    /**
     * @brief Check the user parameters and nested configs
     * @return INVALID_CONFIGURATION describing the first violation
     */
    Result<void> validate() const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

}  // namespace option_screener

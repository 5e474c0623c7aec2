// include/option_screener/screening/screening_pipeline.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <vector>
#include "option_screener/core/config_base.hpp"
#include "option_screener/core/error.hpp"
#include "option_screener/core/types.hpp"
#include "option_screener/data/providers.hpp"
#include "option_screener/screening/progress_observer.hpp"
#include "option_screener/screening/rate_limiter.hpp"

namespace option_screener {

/**
 * @brief What to do with a symbol whose estimated volatility is exactly zero
 */
enum class ZeroVolatilityPolicy {
    SKIP,      // No row, recorded as ZERO_VOLATILITY
    INTRINSIC  // Row priced at intrinsic value (0 at the money)
};

inline std::string zero_volatility_policy_to_string(ZeroVolatilityPolicy policy) {
    return policy == ZeroVolatilityPolicy::INTRINSIC ? "INTRINSIC" : "SKIP";
}

/**
 * @brief Parse "SKIP" or "INTRINSIC" (exact spelling)
 * @return Policy, or INVALID_CONFIGURATION for any other string
 */
Result<ZeroVolatilityPolicy> zero_volatility_policy_from_string(const std::string& value);

/**
 * @brief Fixed assumptions applied to every symbol of a run
 */
struct PipelineConfig : public ConfigBase {
    int maturity_days{30};                 // Option life, calendar days
    double days_per_year{365.0};           // Calendar basis for T
    size_t min_history{30};                // Observations required to trust sigma
    double trading_days_per_year{252.0};   // Volatility annualization
    double contract_multiplier{100.0};     // Shares per contract
    size_t leaderboard_size{25};
    double default_risk_free_rate{0.05};   // Used when the rate provider fails
    ZeroVolatilityPolicy zero_volatility_policy{ZeroVolatilityPolicy::SKIP};

    /**
     * @brief Time to expiry in years
     */
    double time_to_expiry() const {
        return static_cast<double>(maturity_days) / days_per_year;
    }

    Result<void> validate() const;

    nlohmann::json to_json() const override;

    /**
     * @throws ScreenerError INVALID_CONFIGURATION for an unknown policy or a
     *         negative count
     */
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Fetch the run's risk-free rate once
 *
 * Provider failure or a non-finite rate falls back to default_rate with a
 * warning; the returned context records which happened.
 */
RateContext resolve_rate_context(IRiskFreeRateProvider& provider, double default_rate);

/**
 * @brief Sequential per-symbol screening: fetch, estimate, price, size, collect
 *
 * No single symbol can abort a run. Every failure becomes a SkipRecord in
 * the report, and the observer is notified after every symbol.
 */
class ScreeningPipeline {
public:
    /**
     * @param config Fixed assumptions
     * @param price_provider Source of price series
     * @param rate_limiter Gate acquired before every price fetch
     * @param observer Optional progress sink, may be null
     */
    ScreeningPipeline(PipelineConfig config, IPriceSeriesProvider& price_provider,
                      IRateLimiter& rate_limiter, IProgressObserver* observer = nullptr);

    /**
     * @brief Screen the first `count` symbols of the universe
     * @param universe Ordered symbols
     * @param count Symbols to process; the whole universe if it is smaller
     * @param capital Capital available for contracts
     * @param rate Rate shared by every evaluation
     * @param cancel Optional flag checked between symbols
     * @return Report, or INVALID_CONFIGURATION for a zero count or non-positive capital
     */
    Result<ScreeningReport> run(const std::vector<std::string>& universe, size_t count,
                                double capital, const RateContext& rate,
                                const std::atomic<bool>* cancel = nullptr);

    /**
     * @brief Evaluate one symbol
     * @param symbol Symbol to fetch and price
     * @param universe_index Position in the universe, used for tie-breaking
     * @param capital Capital available for contracts
     * @param rate Run rate
     */
    SymbolOutcome evaluate_symbol(const std::string& symbol, size_t universe_index,
                                  double capital, const RateContext& rate);

    /**
     * @brief Price an already fetched series; no provider or limiter involved
     */
    SymbolOutcome evaluate_series(const PriceSeries& series, size_t universe_index,
                                  double capital, const RateContext& rate) const;

    const PipelineConfig& config() const {
        return config_;
    }

private:
    PipelineConfig config_;
    IPriceSeriesProvider& price_provider_;
    IRateLimiter& rate_limiter_;
    IProgressObserver* observer_;
};

}  // namespace option_screener

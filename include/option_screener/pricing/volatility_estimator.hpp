// include/option_screener/pricing/volatility_estimator.hpp
#pragma once

#include <Eigen/Dense>
#include "option_screener/core/error.hpp"
#include "option_screener/core/types.hpp"

namespace option_screener {
namespace pricing {

constexpr double DEFAULT_TRADING_DAYS_PER_YEAR = 252.0;

/**
 * @brief Daily log returns ln(P_t / P_{t-1}) of a price series
 * @return Vector of size n-1, INSUFFICIENT_DATA for fewer than two points,
 *         INVALID_DATA for a non-positive or non-finite close
 */
Result<Eigen::VectorXd> log_returns(const PriceSeries& series);

/**
 * @brief Annualized historical volatility of a price series
 *
 * Sample standard deviation (n-1 denominator) of every daily log return in
 * the series, scaled by sqrt(trading_days_per_year). A two-point series has
 * a single return and yields exactly 0. No minimum history is enforced here.
 *
 * @param series Price series in ascending date order
 * @param trading_days_per_year Annualization factor
 * @return Annualized volatility
 */
Result<double> estimate_volatility(const PriceSeries& series,
                                   double trading_days_per_year = DEFAULT_TRADING_DAYS_PER_YEAR);

/**
 * @brief Spot (latest close) and annualized volatility of a series
 * @return Snapshot, or the estimate_volatility error
 */
Result<MarketSnapshot> make_market_snapshot(
    const PriceSeries& series, double trading_days_per_year = DEFAULT_TRADING_DAYS_PER_YEAR);

}  // namespace pricing
}  // namespace option_screener

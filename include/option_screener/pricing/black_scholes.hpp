// include/option_screener/pricing/black_scholes.hpp
#pragma once

#include "option_screener/core/error.hpp"
#include "option_screener/core/types.hpp"

namespace option_screener {
namespace pricing {

/**
 * @brief Standard normal cumulative distribution function
 */
double norm_cdf(double x);

/**
 * @brief Standard normal probability density function
 */
double norm_pdf(double x);

/**
 * @brief Price a European call (no dividends, continuous compounding)
 *
 * Returns the Black-Scholes price together with delta = N(d1) and
 * vega = S * n(d1) * sqrt(T), the latter per unit change in volatility.
 *
 * @param spot Underlying price S, must be positive
 * @param strike Strike K, must be positive
 * @param time_to_expiry T in years, must be positive
 * @param rate Annualized risk-free rate r
 * @param volatility Annualized volatility sigma, must be positive
 * @return Quote, or DEGENERATE_INPUTS when d1/d2 would be undefined or the
 *         result is not finite
 */
Result<OptionQuote> price_call(double spot, double strike, double time_to_expiry, double rate,
                               double volatility);

/**
 * @brief At-the-money call on a snapshot (strike = spot)
 */
Result<OptionQuote> price_atm_call(const MarketSnapshot& snapshot, double time_to_expiry,
                                   double rate);

/**
 * @brief Intrinsic-value quote for a call with no time value
 *
 * price = max(S - K, 0), delta = 1 when S > K and 0 otherwise, vega = 0.
 */
OptionQuote intrinsic_call_quote(double spot, double strike);

}  // namespace pricing
}  // namespace option_screener

// src/pricing/black_scholes.cpp
#include "option_screener/pricing/black_scholes.hpp"
#include <algorithm>
#include <cmath>

namespace option_screener {
namespace pricing {

namespace {
constexpr double SQRT_2PI = 2.506628274631000502415765284811045253006;

bool is_positive_finite(double x) {
    return std::isfinite(x) && x > 0.0;
}
}  // anonymous namespace

double norm_cdf(double x) {
    return 0.5 * std::erfc(-x / std::sqrt(2.0));
}

double norm_pdf(double x) {
    return std::exp(-0.5 * x * x) / SQRT_2PI;
}

Result<OptionQuote> price_call(double spot, double strike, double time_to_expiry, double rate,
                               double volatility) {
    if (!is_positive_finite(volatility) || !is_positive_finite(time_to_expiry)) {
        return make_error<OptionQuote>(
            ErrorCode::DEGENERATE_INPUTS,
            "Volatility and time to expiry must be positive (sigma=" +
                std::to_string(volatility) + ", T=" + std::to_string(time_to_expiry) + ")",
            "BlackScholes");
    }
    if (!is_positive_finite(spot) || !is_positive_finite(strike) || !std::isfinite(rate)) {
        return make_error<OptionQuote>(
            ErrorCode::DEGENERATE_INPUTS,
            "Spot and strike must be positive and rate finite (S=" + std::to_string(spot) +
                ", K=" + std::to_string(strike) + ", r=" + std::to_string(rate) + ")",
            "BlackScholes");
    }

    double sqrt_t = std::sqrt(time_to_expiry);
    double sigma_sqrt_t = volatility * sqrt_t;
    double d1 = (std::log(spot / strike) + (rate + 0.5 * volatility * volatility) * time_to_expiry) /
                sigma_sqrt_t;
    double d2 = d1 - sigma_sqrt_t;

    OptionQuote quote;
    quote.price = spot * norm_cdf(d1) - strike * std::exp(-rate * time_to_expiry) * norm_cdf(d2);
    quote.delta = norm_cdf(d1);
    quote.vega = spot * norm_pdf(d1) * sqrt_t;

    if (!std::isfinite(quote.price) || !std::isfinite(quote.delta) || !std::isfinite(quote.vega)) {
        return make_error<OptionQuote>(ErrorCode::DEGENERATE_INPUTS,
                                       "Pricer produced a non-finite result", "BlackScholes");
    }

    // Cancellation in S*N(d1) - K*exp(-rT)*N(d2) can leave a tiny negative residue deep OTM
    quote.price = std::max(quote.price, 0.0);
    return Result<OptionQuote>(quote);
}

Result<OptionQuote> price_atm_call(const MarketSnapshot& snapshot, double time_to_expiry,
                                   double rate) {
    return price_call(snapshot.spot, snapshot.spot, time_to_expiry, rate, snapshot.volatility);
}

OptionQuote intrinsic_call_quote(double spot, double strike) {
    OptionQuote quote;
    quote.price = std::max(spot - strike, 0.0);
    quote.delta = spot > strike ? 1.0 : 0.0;
    quote.vega = 0.0;
    return quote;
}

}  // namespace pricing
}  // namespace option_screener

// src/pricing/volatility_estimator.cpp
#include "option_screener/pricing/volatility_estimator.hpp"
#include <cmath>

namespace option_screener {
namespace pricing {

Result<Eigen::VectorXd> log_returns(const PriceSeries& series) {
    const auto n = static_cast<Eigen::Index>(series.size());
    if (n < 2) {
        return make_error<Eigen::VectorXd>(
            ErrorCode::INSUFFICIENT_DATA,
            "Need at least 2 prices to compute a return for " + series.symbol + ", got " +
                std::to_string(n),
            "VolatilityEstimator");
    }

    Eigen::VectorXd prices(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        double close = series.points[static_cast<size_t>(i)].adjusted_close;
        if (!std::isfinite(close) || close <= 0.0) {
            return make_error<Eigen::VectorXd>(
                ErrorCode::INVALID_DATA,
                "Non-positive close at index " + std::to_string(i) + " for " + series.symbol,
                "VolatilityEstimator");
        }
        prices(i) = close;
    }

    Eigen::VectorXd returns =
        (prices.tail(n - 1).array() / prices.head(n - 1).array()).log().matrix();
    return Result<Eigen::VectorXd>(std::move(returns));
}

Result<double> estimate_volatility(const PriceSeries& series, double trading_days_per_year) {
    if (!std::isfinite(trading_days_per_year) || trading_days_per_year <= 0.0) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT,
                                  "Trading days per year must be positive",
                                  "VolatilityEstimator");
    }

    auto returns_result = log_returns(series);
    if (returns_result.is_error()) {
        return make_error<double>(returns_result.error()->code(), returns_result.error()->what(),
                                  "VolatilityEstimator");
    }

    const Eigen::VectorXd& returns = returns_result.value();
    if (returns.size() < 2) {
        // Single return: zero sample variance by convention
        return Result<double>(0.0);
    }

    double mean = returns.mean();
    double variance =
        (returns.array() - mean).square().sum() / static_cast<double>(returns.size() - 1);
    double sigma = std::sqrt(variance) * std::sqrt(trading_days_per_year);

    if (!std::isfinite(sigma)) {
        return make_error<double>(ErrorCode::INVALID_DATA,
                                  "Volatility is not finite for " + series.symbol,
                                  "VolatilityEstimator");
    }
    return Result<double>(sigma);
}

Result<MarketSnapshot> make_market_snapshot(const PriceSeries& series,
                                            double trading_days_per_year) {
    auto vol_result = estimate_volatility(series, trading_days_per_year);
    if (vol_result.is_error()) {
        return make_error<MarketSnapshot>(vol_result.error()->code(), vol_result.error()->what(),
                                          "VolatilityEstimator");
    }

    MarketSnapshot snapshot;
    snapshot.symbol = series.symbol;
    snapshot.spot = series.latest_close();
    snapshot.volatility = vol_result.value();
    return Result<MarketSnapshot>(std::move(snapshot));
}

}  // namespace pricing
}  // namespace option_screener

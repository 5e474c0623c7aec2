// src/screening/screening_pipeline.cpp
#include "option_screener/screening/screening_pipeline.hpp"
#include <algorithm>
#include <cmath>
#include "option_screener/core/logger.hpp"
#include "option_screener/pricing/affordability.hpp"
#include "option_screener/pricing/black_scholes.hpp"
#include "option_screener/pricing/volatility_estimator.hpp"

namespace option_screener {

namespace {

SkipReason skip_reason_for_provider_error(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_DATA:
        case ErrorCode::CONVERSION_ERROR:
        case ErrorCode::JSON_PARSE_ERROR:
            return SkipReason::INVALID_DATA;
        default:
            return SkipReason::DATA_UNAVAILABLE;
    }
}

SymbolOutcome make_skip(const std::string& symbol, size_t universe_index, SkipReason reason,
                        std::string detail) {
    SkipRecord record;
    record.symbol = symbol;
    record.universe_index = universe_index;
    record.reason = reason;
    record.detail = std::move(detail);
    return SymbolOutcome::skipped(std::move(record));
}

size_t non_negative_count(const nlohmann::json& j, const std::string& key) {
    const auto value = j.at(key).get<long long>();
    if (value < 0) {
        throw ScreenerError(ErrorCode::INVALID_CONFIGURATION,
                            key + " must not be negative, got " + std::to_string(value),
                            "PipelineConfig");
    }
    return static_cast<size_t>(value);
}

}  // namespace

Result<ZeroVolatilityPolicy> zero_volatility_policy_from_string(const std::string& value) {
    if (value == "SKIP") {
        return Result<ZeroVolatilityPolicy>(ZeroVolatilityPolicy::SKIP);
    }
    if (value == "INTRINSIC") {
        return Result<ZeroVolatilityPolicy>(ZeroVolatilityPolicy::INTRINSIC);
    }
    return make_error<ZeroVolatilityPolicy>(
        ErrorCode::INVALID_CONFIGURATION,
        "Unknown zero_volatility_policy '" + value + "', expected SKIP or INTRINSIC",
        "PipelineConfig");
}

Result<void> PipelineConfig::validate() const {
    if (maturity_days <= 0 || !(days_per_year > 0.0)) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                "maturity_days and days_per_year must be positive",
                                "PipelineConfig");
    }
    if (min_history < 2) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                "min_history must be at least 2 to compute a return",
                                "PipelineConfig");
    }
    if (!(trading_days_per_year > 0.0) || !(contract_multiplier > 0.0)) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                "trading_days_per_year and contract_multiplier must be positive",
                                "PipelineConfig");
    }
    if (leaderboard_size == 0) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                "leaderboard_size must be positive", "PipelineConfig");
    }
    if (!std::isfinite(default_risk_free_rate)) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                "default_risk_free_rate must be finite", "PipelineConfig");
    }
    return Result<void>();
}

nlohmann::json PipelineConfig::to_json() const {
    nlohmann::json j;
    j["maturity_days"] = maturity_days;
    j["days_per_year"] = days_per_year;
    j["min_history"] = min_history;
    j["trading_days_per_year"] = trading_days_per_year;
    j["contract_multiplier"] = contract_multiplier;
    j["leaderboard_size"] = leaderboard_size;
    j["default_risk_free_rate"] = default_risk_free_rate;
    j["zero_volatility_policy"] = zero_volatility_policy_to_string(zero_volatility_policy);
    return j;
}

void PipelineConfig::from_json(const nlohmann::json& j) {
    if (j.contains("maturity_days"))
        maturity_days = j.at("maturity_days").get<int>();
    if (j.contains("days_per_year"))
        days_per_year = j.at("days_per_year").get<double>();
    if (j.contains("min_history"))
        min_history = non_negative_count(j, "min_history");
    if (j.contains("trading_days_per_year"))
        trading_days_per_year = j.at("trading_days_per_year").get<double>();
    if (j.contains("contract_multiplier"))
        contract_multiplier = j.at("contract_multiplier").get<double>();
    if (j.contains("leaderboard_size"))
        leaderboard_size = non_negative_count(j, "leaderboard_size");
    if (j.contains("default_risk_free_rate"))
        default_risk_free_rate = j.at("default_risk_free_rate").get<double>();
    if (j.contains("zero_volatility_policy")) {
        auto policy =
            zero_volatility_policy_from_string(j.at("zero_volatility_policy").get<std::string>());
        if (policy.is_error()) {
            throw ScreenerError(policy.error()->code(), policy.error()->what(), "PipelineConfig");
        }
        zero_volatility_policy = policy.value();
    }
}

RateContext resolve_rate_context(IRiskFreeRateProvider& provider, double default_rate) {
    RateContext context;

    auto rate_result = provider.fetch_risk_free_rate();
    if (rate_result.is_ok() && std::isfinite(rate_result.value())) {
        context.rate = rate_result.value();
        context.is_fallback = false;
        context.source = "provider";
        INFO("Using risk-free rate " << context.rate);
        return context;
    }

    if (rate_result.is_error()) {
        WARN("Failed to fetch risk-free rate (" << rate_result.error()->what()
                                                << "), falling back to " << default_rate);
    } else {
        WARN("Risk-free rate provider returned a non-finite rate, falling back to "
             << default_rate);
    }
    context.rate = default_rate;
    context.is_fallback = true;
    context.source = "default";
    return context;
}

ScreeningPipeline::ScreeningPipeline(PipelineConfig config, IPriceSeriesProvider& price_provider,
                                     IRateLimiter& rate_limiter, IProgressObserver* observer)
    : config_(std::move(config)),
      price_provider_(price_provider),
      rate_limiter_(rate_limiter),
      observer_(observer) {}

Result<ScreeningReport> ScreeningPipeline::run(const std::vector<std::string>& universe,
                                               size_t count, double capital,
                                               const RateContext& rate,
                                               const std::atomic<bool>* cancel) {
    if (count == 0) {
        return make_error<ScreeningReport>(ErrorCode::INVALID_CONFIGURATION,
                                           "Number of symbols to screen must be positive",
                                           "ScreeningPipeline");
    }
    if (!std::isfinite(capital) || capital <= 0.0) {
        return make_error<ScreeningReport>(ErrorCode::INVALID_CONFIGURATION,
                                           "Capital must be positive", "ScreeningPipeline");
    }
    auto config_check = config_.validate();
    if (config_check.is_error()) {
        return make_error<ScreeningReport>(config_check.error()->code(),
                                           config_check.error()->what(), "ScreeningPipeline");
    }

    const size_t total = std::min(count, universe.size());

    ScreeningReport report;
    report.rate = rate;
    report.capital = capital;
    report.requested = count;
    report.results.reserve(total);

    INFO("Screening " << total << " symbols with capital " << capital << ", rate " << rate.rate
                      << (rate.is_fallback ? " (default)" : ""));

    for (size_t i = 0; i < total; ++i) {
        if (cancel && cancel->load(std::memory_order_relaxed)) {
            WARN("Screening cancelled after " << i << " of " << total << " symbols");
            report.cancelled = true;
            break;
        }

        const std::string& symbol = universe[i];
        SymbolOutcome outcome;
        try {
            outcome = evaluate_symbol(symbol, i, capital, rate);
        } catch (const std::exception& e) {
            WARN("Unexpected error while screening " << symbol << ": " << e.what());
            outcome = make_skip(symbol, i, SkipReason::PROVIDER_ERROR, e.what());
        }

        if (outcome.is_ok()) {
            report.results.push_back(*outcome.row);
        } else {
            DEBUG("Skipped " << symbol << ": " << skip_reason_to_string(outcome.skip->reason)
                             << " - " << outcome.skip->detail);
            report.skipped.push_back(*outcome.skip);
        }
        report.processed = i + 1;

        if (observer_) {
            observer_->on_symbol_processed(outcome, i + 1, total);
        }
    }

    INFO("Screening complete: " << report.results.size() << " priced, " << report.skipped.size()
                                << " skipped");
    return Result<ScreeningReport>(std::move(report));
}

SymbolOutcome ScreeningPipeline::evaluate_symbol(const std::string& symbol,
                                                 size_t universe_index, double capital,
                                                 const RateContext& rate) {
    rate_limiter_.acquire();

    auto series_result = price_provider_.fetch_price_series(symbol);
    if (series_result.is_error()) {
        return make_skip(symbol, universe_index,
                         skip_reason_for_provider_error(series_result.error()->code()),
                         series_result.error()->what());
    }

    PriceSeries series = series_result.take_value();
    series.symbol = symbol;
    return evaluate_series(series, universe_index, capital, rate);
}

SymbolOutcome ScreeningPipeline::evaluate_series(const PriceSeries& series,
                                                 size_t universe_index, double capital,
                                                 const RateContext& rate) const {
    const std::string& symbol = series.symbol;

    if (series.size() < config_.min_history) {
        return make_skip(symbol, universe_index, SkipReason::INSUFFICIENT_HISTORY,
                         std::to_string(series.size()) + " observations, need " +
                             std::to_string(config_.min_history));
    }

    auto snapshot_result = pricing::make_market_snapshot(series, config_.trading_days_per_year);
    if (snapshot_result.is_error()) {
        SkipReason reason = snapshot_result.error()->code() == ErrorCode::INSUFFICIENT_DATA
                                ? SkipReason::INSUFFICIENT_DATA
                                : SkipReason::INVALID_DATA;
        return make_skip(symbol, universe_index, reason, snapshot_result.error()->what());
    }
    const MarketSnapshot& snapshot = snapshot_result.value();

    OptionQuote quote;
    if (snapshot.volatility == 0.0) {
        if (config_.zero_volatility_policy == ZeroVolatilityPolicy::SKIP) {
            return make_skip(symbol, universe_index, SkipReason::ZERO_VOLATILITY,
                             "Estimated volatility is zero");
        }
        quote = pricing::intrinsic_call_quote(snapshot.spot, snapshot.spot);
    } else {
        auto quote_result =
            pricing::price_atm_call(snapshot, config_.time_to_expiry(), rate.rate);
        if (quote_result.is_error()) {
            return make_skip(symbol, universe_index, SkipReason::DEGENERATE_INPUTS,
                             quote_result.error()->what());
        }
        quote = quote_result.value();
    }

    ResultRow row;
    row.symbol = symbol;
    row.universe_index = universe_index;
    row.spot = snapshot.spot;
    row.volatility = snapshot.volatility;
    row.call_price = quote.price;
    row.delta = quote.delta;
    row.vega = quote.vega;
    row.affordable_contracts =
        pricing::affordable_contracts(quote.price, capital, config_.contract_multiplier);

    DEBUG(symbol << ": S=" << snapshot.spot << " sigma=" << snapshot.volatility
                 << " call=" << quote.price << " delta=" << quote.delta << " vega=" << quote.vega
                 << " contracts=" << row.affordable_contracts);

    return SymbolOutcome::ok(std::move(row));
}

}  // namespace option_screener

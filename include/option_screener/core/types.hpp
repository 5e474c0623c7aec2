// include/option_screener/core/types.hpp

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace option_screener {

/**
 * @brief Timestamp type for consistent time representation
 * Uses std::chrono for type-safe time handling
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 * Used for all price-related calculations
 */
using Price = double;

/**
 * @brief One daily observation of an adjusted closing price
 */
struct PricePoint {
    Timestamp date;
    Price adjusted_close{0.0};

    PricePoint() = default;
    PricePoint(Timestamp d, Price close) : date(d), adjusted_close(close) {}
};

/**
 * @brief Daily adjusted closes for one symbol
 * Points are strictly increasing in date with no duplicates
 */
struct PriceSeries {
    std::string symbol;
    std::vector<PricePoint> points;

    size_t size() const {
        return points.size();
    }

    bool empty() const {
        return points.empty();
    }

    /**
     * @brief Latest close, used as the spot price
     */
    Price latest_close() const {
        return points.back().adjusted_close;
    }
};

/**
 * @brief Spot and volatility derived from a price series
 */
struct MarketSnapshot {
    std::string symbol;
    Price spot{0.0};
    double volatility{0.0};
};

/**
 * @brief Annualized risk-free rate shared read-only by every evaluation of a run
 */
struct RateContext {
    double rate{0.05};
    bool is_fallback{false};
    std::string source;
};

/**
 * @brief Pricer output for a European call
 */
struct OptionQuote {
    Price price{0.0};
    double delta{0.0};
    double vega{0.0};
};

/**
 * @brief One screened symbol, at full precision
 */
struct ResultRow {
    std::string symbol;
    size_t universe_index{0};
    Price spot{0.0};
    double volatility{0.0};
    Price call_price{0.0};
    double delta{0.0};
    double vega{0.0};
    int64_t affordable_contracts{0};
};

using ResultSet = std::vector<ResultRow>;

/**
 * @brief Why a symbol produced no row
 */
enum class SkipReason {
    DATA_UNAVAILABLE,
    INSUFFICIENT_HISTORY,
    INSUFFICIENT_DATA,
    INVALID_DATA,
    ZERO_VOLATILITY,
    DEGENERATE_INPUTS,
    PROVIDER_ERROR
};

inline std::string skip_reason_to_string(SkipReason reason) {
    switch (reason) {
        case SkipReason::DATA_UNAVAILABLE:
            return "DATA_UNAVAILABLE";
        case SkipReason::INSUFFICIENT_HISTORY:
            return "INSUFFICIENT_HISTORY";
        case SkipReason::INSUFFICIENT_DATA:
            return "INSUFFICIENT_DATA";
        case SkipReason::INVALID_DATA:
            return "INVALID_DATA";
        case SkipReason::ZERO_VOLATILITY:
            return "ZERO_VOLATILITY";
        case SkipReason::DEGENERATE_INPUTS:
            return "DEGENERATE_INPUTS";
        case SkipReason::PROVIDER_ERROR:
            return "PROVIDER_ERROR";
        default:
            return "UNKNOWN";
    }
}

struct SkipRecord {
    std::string symbol;
    size_t universe_index{0};
    SkipReason reason{SkipReason::DATA_UNAVAILABLE};
    std::string detail;
};

/**
 * @brief Per-symbol outcome: exactly one of row or skip is set
 */
struct SymbolOutcome {
    std::optional<ResultRow> row;
    std::optional<SkipRecord> skip;

    static SymbolOutcome ok(ResultRow r) {
        SymbolOutcome outcome;
        outcome.row = std::move(r);
        return outcome;
    }

    static SymbolOutcome skipped(SkipRecord s) {
        SymbolOutcome outcome;
        outcome.skip = std::move(s);
        return outcome;
    }

    bool is_ok() const {
        return row.has_value();
    }
};

/**
 * @brief Everything a screening pass produced
 */
struct ScreeningReport {
    ResultSet results;
    std::vector<SkipRecord> skipped;
    RateContext rate;
    double capital{0.0};
    size_t requested{0};
    size_t processed{0};
    bool cancelled{false};
};

}  // namespace option_screener

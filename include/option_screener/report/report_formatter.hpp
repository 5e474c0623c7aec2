// include/option_screener/report/report_formatter.hpp
#pragma once

#include <cstdint>
#include <map>
#include <ostream>
#include <string>
#include <vector>
#include "option_screener/core/types.hpp"
#include "option_screener/screening/screening_pipeline.hpp"

namespace option_screener {

/**
 * @brief Round half away from zero to a number of decimals
 */
double round_to(double value, int decimals);

/**
 * @brief A result row rounded for display: prices to cents, sigma and Greeks to 4 places
 */
struct DisplayRow {
    std::string symbol;
    double spot{0.0};
    double volatility{0.0};
    double call_price{0.0};
    double delta{0.0};
    double vega{0.0};
    int64_t affordable_contracts{0};
};

DisplayRow to_display_row(const ResultRow& row);

/**
 * @brief Renders a finished run for a terminal
 */
class ReportFormatter {
public:
    explicit ReportFormatter(PipelineConfig config) : config_(std::move(config)) {}

    /**
     * @brief Leaderboard as an aligned text table, or a no-results line when empty
     */
    void write_leaderboard(std::ostream& out, const std::vector<ResultRow>& rows) const;

    /**
     * @brief Footer echoing capital and the fixed pricing assumptions
     */
    std::string summary_line(double capital) const;

    /**
     * @brief Rate fallback warning and skip counts; empty when there is nothing to say
     */
    std::string diagnostics(const ScreeningReport& report) const;

    /**
     * @brief Full report: title, leaderboard, diagnostics and summary
     */
    void write_report(std::ostream& out, const ScreeningReport& report,
                      const std::vector<ResultRow>& rows) const;

    /**
     * @brief Number of skips per reason
     */
    static std::map<SkipReason, size_t> count_skips(const std::vector<SkipRecord>& skipped);

private:
    PipelineConfig config_;
};

}  // namespace option_screener

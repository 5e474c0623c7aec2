// src/report/report_formatter.cpp
#include "option_screener/report/report_formatter.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace option_screener {

double round_to(double value, int decimals) {
    if (!std::isfinite(value)) {
        return value;
    }
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

DisplayRow to_display_row(const ResultRow& row) {
    DisplayRow display;
    display.symbol = row.symbol;
    display.spot = round_to(row.spot, 2);
    display.volatility = round_to(row.volatility, 4);
    display.call_price = round_to(row.call_price, 2);
    display.delta = round_to(row.delta, 4);
    display.vega = round_to(row.vega, 4);
    display.affordable_contracts = row.affordable_contracts;
    return display;
}

void ReportFormatter::write_leaderboard(std::ostream& out,
                                        const std::vector<ResultRow>& rows) const {
    if (rows.empty()) {
        out << "No symbols could be priced." << std::endl;
        return;
    }

    out << std::left << std::setw(6) << "Rank" << std::setw(10) << "Ticker" << std::right
        << std::setw(12) << "Price" << std::setw(12) << "Volatility" << std::setw(12)
        << "Call Price" << std::setw(10) << "Delta" << std::setw(12) << "Vega" << std::setw(12)
        << "Contracts" << std::endl;
    out << std::string(86, '-') << std::endl;

    int rank = 1;
    for (const auto& row : rows) {
        DisplayRow display = to_display_row(row);
        out << std::left << std::setw(6) << rank++ << std::setw(10) << display.symbol
            << std::right << std::fixed << std::setprecision(2) << std::setw(12) << display.spot
            << std::setprecision(4) << std::setw(12) << display.volatility
            << std::setprecision(2) << std::setw(12) << display.call_price
            << std::setprecision(4) << std::setw(10) << display.delta << std::setw(12)
            << display.vega << std::setw(12) << display.affordable_contracts << std::endl;
    }
    out << std::defaultfloat;
}

std::string ReportFormatter::summary_line(double capital) const {
    std::ostringstream ss;
    ss << "Note: assumes an at-the-money strike and " << config_.maturity_days
       << "-day expiration. Volatility is based on the last " << config_.min_history
       << " trading days of adjusted close prices. You entered $" << std::fixed
       << std::setprecision(2) << capital
       << " in liquidity; contract affordability is based on that (1 contract = "
       << std::setprecision(0) << config_.contract_multiplier << " shares).";
    return ss.str();
}

std::map<SkipReason, size_t> ReportFormatter::count_skips(const std::vector<SkipRecord>& skipped) {
    std::map<SkipReason, size_t> counts;
    for (const auto& record : skipped) {
        counts[record.reason]++;
    }
    return counts;
}

std::string ReportFormatter::diagnostics(const ScreeningReport& report) const {
    std::ostringstream ss;
    if (report.rate.is_fallback) {
        ss << "Warning: failed to fetch the risk-free rate; using default " << std::fixed
           << std::setprecision(4) << report.rate.rate << "." << std::endl;
        ss << std::defaultfloat;
    }
    if (report.cancelled) {
        ss << "Warning: run cancelled after " << report.processed << " symbols." << std::endl;
    }
    if (!report.skipped.empty()) {
        ss << "Skipped " << report.skipped.size() << " symbol(s):";
        for (const auto& [reason, count] : count_skips(report.skipped)) {
            ss << " " << skip_reason_to_string(reason) << "=" << count;
        }
        ss << std::endl;
    }
    return ss.str();
}

void ReportFormatter::write_report(std::ostream& out, const ScreeningReport& report,
                                   const std::vector<ResultRow>& rows) const {
    out << "Top " << config_.leaderboard_size << " by Black-Scholes Call Price" << std::endl;
    write_leaderboard(out, rows);
    out << diagnostics(report);
    if (!rows.empty()) {
        out << summary_line(report.capital) << std::endl;
    }
}

}  // namespace option_screener

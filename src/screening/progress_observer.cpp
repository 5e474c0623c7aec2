// src/screening/progress_observer.cpp
#include "option_screener/screening/progress_observer.hpp"
#include <iomanip>
#include "option_screener/core/logger.hpp"

namespace option_screener {

void LoggingProgressObserver::on_symbol_processed(const SymbolOutcome& outcome, size_t completed,
                                                  size_t total) {
    const std::string& symbol = outcome.is_ok() ? outcome.row->symbol : outcome.skip->symbol;
    INFO("[" << completed << "/" << total << "] " << std::fixed << std::setprecision(0)
             << progress_fraction(completed, total) * 100.0 << "% " << symbol
             << (outcome.is_ok() ? " priced"
                                 : " skipped (" + skip_reason_to_string(outcome.skip->reason) +
                                       ")"));
}

}  // namespace option_screener

// include/option_screener/screening/progress_observer.hpp
#pragma once

#include <cstddef>
#include <string>
#include "option_screener/core/types.hpp"

namespace option_screener {

/**
 * @brief Fraction of the run completed, clamped to [0, 1]
 */
inline double progress_fraction(size_t completed, size_t total) {
    if (total == 0) {
        return 1.0;
    }
    if (completed >= total) {
        return 1.0;
    }
    return static_cast<double>(completed) / static_cast<double>(total);
}

/**
 * @brief Receives one notification per screened symbol, whether it produced a row or not
 */
class IProgressObserver {
public:
    virtual ~IProgressObserver() = default;

    /**
     * @param outcome What the symbol produced
     * @param completed Symbols processed so far, including this one
     * @param total Symbols the run will process
     */
    virtual void on_symbol_processed(const SymbolOutcome& outcome, size_t completed,
                                     size_t total) = 0;
};

/**
 * @brief Reports progress through the logger
 */
class LoggingProgressObserver : public IProgressObserver {
public:
    void on_symbol_processed(const SymbolOutcome& outcome, size_t completed,
                             size_t total) override;
};

}  // namespace option_screener

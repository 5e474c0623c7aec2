// src/pricing/affordability.cpp
#include "option_screener/pricing/affordability.hpp"
#include <cmath>
#include <limits>

namespace option_screener {
namespace pricing {

int64_t affordable_contracts(double call_price, double capital, double multiplier) {
    if (!std::isfinite(call_price) || call_price <= 0.0) {
        return 0;
    }
    if (!std::isfinite(capital) || capital <= 0.0) {
        return 0;
    }
    if (!std::isfinite(multiplier) || multiplier <= 0.0) {
        return 0;
    }

    double contracts = std::floor(capital / (call_price * multiplier));

    // Overflow only happens for vanishingly small prices; saturate
    constexpr double max_count = static_cast<double>(std::numeric_limits<int64_t>::max());
    if (!std::isfinite(contracts) || contracts >= max_count) {
        return std::numeric_limits<int64_t>::max();
    }
    return static_cast<int64_t>(contracts);
}

}  // namespace pricing
}  // namespace option_screener

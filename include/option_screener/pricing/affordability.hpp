// include/option_screener/pricing/affordability.hpp
#pragma once

#include <cstdint>

namespace option_screener {
namespace pricing {

constexpr double DEFAULT_CONTRACT_MULTIPLIER = 100.0;

/**
 * @brief Number of whole contracts the capital buys at a given option price
 *
 * One contract covers `multiplier` shares, so the cost per contract is
 * call_price * multiplier and the result is floor(capital / cost).
 * A non-positive or non-finite price, capital or multiplier gives 0.
 */
int64_t affordable_contracts(double call_price, double capital,
                             double multiplier = DEFAULT_CONTRACT_MULTIPLIER);

}  // namespace pricing
}  // namespace option_screener

// include/option_screener/screening/leaderboard.hpp
#pragma once

#include <cstddef>
#include <vector>
#include "option_screener/core/types.hpp"

namespace option_screener {

constexpr size_t DEFAULT_LEADERBOARD_SIZE = 25;

/**
 * @brief Top rows by theoretical call price
 *
 * Sorted by full-precision call price, highest first; equal prices keep
 * universe order. Returns every row when there are fewer than `size`.
 * The input is not modified.
 */
std::vector<ResultRow> leaderboard(const ResultSet& results,
                                   size_t size = DEFAULT_LEADERBOARD_SIZE);

}  // namespace option_screener

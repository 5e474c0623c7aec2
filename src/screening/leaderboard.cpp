// src/screening/leaderboard.cpp
#include "option_screener/screening/leaderboard.hpp"
#include <algorithm>

namespace option_screener {

std::vector<ResultRow> leaderboard(const ResultSet& results, size_t size) {
    std::vector<ResultRow> ranked(results.begin(), results.end());

    std::stable_sort(ranked.begin(), ranked.end(), [](const ResultRow& a, const ResultRow& b) {
        if (a.call_price != b.call_price) {
            return a.call_price > b.call_price;
        }
        return a.universe_index < b.universe_index;
    });

    if (ranked.size() > size) {
        ranked.resize(size);
    }
    return ranked;
}

}  // namespace option_screener

#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "option_screener/screening/leaderboard.hpp"
#include "test_utils.hpp"

using namespace option_screener;
using namespace option_screener::testing;
using ::testing::ElementsAre;
using ::testing::UnorderedElementsAreArray;

class LeaderboardTest : public ::testing::Test {};

TEST_F(LeaderboardTest, KeepsTopTwentyFiveByCallPrice) {
    ResultSet results;
    for (size_t i = 0; i < 30; ++i) {
        results.push_back(make_row("S" + std::to_string(i), i, 1.0 + static_cast<double>(i)));
    }

    auto top = leaderboard(results);
    ASSERT_EQ(top.size(), 25u);
    EXPECT_EQ(top.front().symbol, "S29");
    EXPECT_EQ(top.back().symbol, "S5");
    for (size_t i = 1; i < top.size(); ++i) {
        EXPECT_GT(top[i - 1].call_price, top[i].call_price);
    }

    std::vector<std::string> symbols;
    for (const auto& row : top) {
        symbols.push_back(row.symbol);
    }
    std::vector<std::string> expected;
    for (size_t i = 5; i < 30; ++i) {
        expected.push_back("S" + std::to_string(i));
    }
    EXPECT_THAT(symbols, UnorderedElementsAreArray(expected));
}

TEST_F(LeaderboardTest, FewerRowsThanSizeReturnsAll) {
    ResultSet results = {make_row("A", 0, 1.0), make_row("B", 1, 3.0), make_row("C", 2, 2.0)};
    auto top = leaderboard(results);
    EXPECT_THAT(top, ElementsAre(HasSymbol("B"), HasSymbol("C"), HasSymbol("A")));
}

TEST_F(LeaderboardTest, TiesKeepUniverseOrder) {
    ResultSet results = {make_row("LATE", 7, 2.0), make_row("EARLY", 2, 2.0),
                         make_row("TOP", 5, 4.0)};
    auto top = leaderboard(results);
    EXPECT_THAT(top, ElementsAre(HasSymbol("TOP"), HasSymbol("EARLY"), HasSymbol("LATE")));
}

TEST_F(LeaderboardTest, RanksOnFullPrecision) {
    // Both display as 2.50 but rank by their unrounded values
    ResultSet results = {make_row("LOWER", 0, 2.501), make_row("HIGHER", 1, 2.504)};
    auto top = leaderboard(results);
    EXPECT_THAT(top, ElementsAre(HasSymbol("HIGHER"), HasSymbol("LOWER")));
}

TEST_F(LeaderboardTest, EmptyInput) {
    EXPECT_TRUE(leaderboard(ResultSet{}).empty());
}

TEST_F(LeaderboardTest, InputIsNotModified) {
    ResultSet results = {make_row("A", 0, 1.0), make_row("B", 1, 3.0)};
    auto top = leaderboard(results, 1);
    ASSERT_EQ(top.size(), 1u);
    EXPECT_EQ(top[0].symbol, "B");
    EXPECT_EQ(results[0].symbol, "A");
    EXPECT_EQ(results.size(), 2u);
}

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include "../core/test_base.hpp"
#include "option_screener/data/csv_price_provider.hpp"
#include "option_screener/data/csv_universe_provider.hpp"
#include "test_http_utils.hpp"

using namespace option_screener;
using option_screener::testing::FakeHttpClient;

namespace {

const char* const CONSTITUENTS =
    "Symbol,Security,GICS Sector\n"
    "MMM,3M,Industrials\n"
    "AOS,A. O. Smith,Industrials\n"
    "ABT,Abbott,Health Care\n";

}  // namespace

class CsvProvidersTest : public option_screener::testing::TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        test_dir = std::filesystem::temp_directory_path() / "option_screener_csv_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
        TestBase::TearDown();
    }

    void write_file(const std::string& name, const std::string& content) {
        std::ofstream file(test_dir / name);
        file << content;
    }

    std::filesystem::path test_dir;
};

TEST_F(CsvProvidersTest, UniverseFromText) {
    auto universe = CsvUniverseProvider::parse_csv(CONSTITUENTS, "Symbol");
    ASSERT_TRUE(universe.is_ok()) << universe.error()->what();
    EXPECT_EQ(universe.value().symbols, (std::vector<std::string>{"MMM", "AOS", "ABT"}));
    ASSERT_NE(universe.value().metadata, nullptr);
    EXPECT_EQ(universe.value().metadata->num_columns(), 3);
}

TEST_F(CsvProvidersTest, UniverseFromFile) {
    write_file("constituents.csv", CONSTITUENTS);
    CsvUniverseProvider provider((test_dir / "constituents.csv").string(), "Symbol");

    auto universe = provider.fetch_ticker_universe();
    ASSERT_TRUE(universe.is_ok()) << universe.error()->what();
    EXPECT_EQ(universe.value().symbols.size(), 3u);
    EXPECT_EQ(universe.value().symbols.front(), "MMM");
}

TEST_F(CsvProvidersTest, UniverseFromUrl) {
    auto http = std::make_shared<FakeHttpClient>();
    http->set_response(200, CONSTITUENTS);
    CsvUniverseProvider provider("https://example.com/constituents.csv", "Symbol", http);

    auto universe = provider.fetch_ticker_universe();
    ASSERT_TRUE(universe.is_ok()) << universe.error()->what();
    EXPECT_EQ(universe.value().symbols.size(), 3u);
    ASSERT_EQ(http->requests().size(), 1u);
    EXPECT_EQ(http->requests()[0], "https://example.com/constituents.csv");
}

TEST_F(CsvProvidersTest, UniverseFailures) {
    auto http = std::make_shared<FakeHttpClient>();
    http->set_response(404, "Not Found");
    CsvUniverseProvider not_found("https://example.com/missing.csv", "Symbol", http);
    auto missing = not_found.fetch_ticker_universe();
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error()->code(), ErrorCode::DATA_UNAVAILABLE);

    CsvUniverseProvider no_client("https://example.com/constituents.csv", "Symbol");
    auto no_http = no_client.fetch_ticker_universe();
    ASSERT_TRUE(no_http.is_error());
    EXPECT_EQ(no_http.error()->code(), ErrorCode::INVALID_ARGUMENT);

    CsvUniverseProvider no_file((test_dir / "absent.csv").string(), "Symbol");
    EXPECT_TRUE(no_file.fetch_ticker_universe().is_error());

    auto wrong_column = CsvUniverseProvider::parse_csv(CONSTITUENTS, "Ticker");
    ASSERT_TRUE(wrong_column.is_error());
    EXPECT_EQ(wrong_column.error()->code(), ErrorCode::INVALID_DATA);

    auto empty = CsvUniverseProvider::parse_csv("Symbol,Security\n", "Symbol");
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(empty.error()->code(), ErrorCode::DATA_UNAVAILABLE);
}

TEST_F(CsvProvidersTest, PricesFromDirectory) {
    write_file("MMM.csv",
               "date,adjusted_close\n"
               "2024-01-03,101.0\n"
               "2024-01-02,100.0\n"
               "2024-01-04,102.5\n");
    CsvPriceProvider provider(test_dir.string());

    auto series = provider.fetch_price_series("MMM");
    ASSERT_TRUE(series.is_ok()) << series.error()->what();
    EXPECT_EQ(series.value().symbol, "MMM");
    ASSERT_EQ(series.value().size(), 3u);
    EXPECT_DOUBLE_EQ(series.value().points.front().adjusted_close, 100.0);
    EXPECT_DOUBLE_EQ(series.value().latest_close(), 102.5);
}

TEST_F(CsvProvidersTest, PricesWithCustomColumns) {
    write_file("AOS.csv", "Date,Close,Volume\n2024-01-02,60.5,100\n2024-01-03,61.0,120\n");
    CsvPriceProvider provider(test_dir.string(), "Date", "Close");

    auto series = provider.fetch_price_series("AOS");
    ASSERT_TRUE(series.is_ok()) << series.error()->what();
    EXPECT_EQ(series.value().size(), 2u);
}

TEST_F(CsvProvidersTest, PriceFailures) {
    CsvPriceProvider provider(test_dir.string());

    auto missing = provider.fetch_price_series("NOPE");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error()->code(), ErrorCode::DATA_UNAVAILABLE);

    auto traversal = provider.fetch_price_series("../etc/passwd");
    ASSERT_TRUE(traversal.is_error());
    EXPECT_EQ(traversal.error()->code(), ErrorCode::INVALID_ARGUMENT);

    write_file("DUP.csv", "date,adjusted_close\n2024-01-02,1.0\n2024-01-02,1.1\n");
    auto duplicate = provider.fetch_price_series("DUP");
    ASSERT_TRUE(duplicate.is_error());
    EXPECT_EQ(duplicate.error()->code(), ErrorCode::INVALID_DATA);
}

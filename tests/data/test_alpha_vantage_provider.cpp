#include <gtest/gtest.h>
#include <memory>
#include "../core/test_base.hpp"
#include "option_screener/core/time_utils.hpp"
#include "option_screener/data/alpha_vantage_provider.hpp"
#include "test_http_utils.hpp"

using namespace option_screener;
using option_screener::testing::FakeHttpClient;

namespace {

const char* const DAILY_RESPONSE = R"js({
    "Meta Data": {
        "1. Information": "Daily Time Series with Splits and Dividend Events",
        "2. Symbol": "IBM"
    },
    "Time Series (Daily)": {
        "2024-01-04": {
            "1. open": "160.0",
            "4. close": "161.10",
            "5. adjusted close": "158.25",
            "6. volume": "4000000"
        },
        "2024-01-02": {
            "4. close": "160.00",
            "5. adjusted close": "157.10"
        },
        "2024-01-03": {
            "4. close": "159.50",
            "5. adjusted close": "156.60"
        }
    }
})js";

}  // namespace

class AlphaVantageProviderTest : public option_screener::testing::TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        http_ = std::make_shared<FakeHttpClient>();
    }

    std::shared_ptr<FakeHttpClient> http_;
    ProviderConfig config_;
};

TEST_F(AlphaVantageProviderTest, ParsesAdjustedClosesInDateOrder) {
    auto result = AlphaVantagePriceProvider::parse_response("IBM", DAILY_RESPONSE);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const PriceSeries& series = result.value();
    EXPECT_EQ(series.symbol, "IBM");
    ASSERT_EQ(series.size(), 3u);
    EXPECT_EQ(core::format_iso_date(series.points[0].date), "2024-01-02");
    EXPECT_EQ(core::format_iso_date(series.points[2].date), "2024-01-04");
    EXPECT_DOUBLE_EQ(series.points[0].adjusted_close, 157.10);
    EXPECT_DOUBLE_EQ(series.points[1].adjusted_close, 156.60);
    EXPECT_DOUBLE_EQ(series.latest_close(), 158.25);
}

TEST_F(AlphaVantageProviderTest, ErrorMessageMeansUnavailable) {
    auto result = AlphaVantagePriceProvider::parse_response(
        "NOPE", R"js({"Error Message": "Invalid API call."})js");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::DATA_UNAVAILABLE);
}

TEST_F(AlphaVantageProviderTest, ThrottleNoticeIsApiError) {
    auto note = AlphaVantagePriceProvider::parse_response(
        "IBM", R"js({"Note": "Our standard API call frequency is 5 calls per minute."})js");
    ASSERT_TRUE(note.is_error());
    EXPECT_EQ(note.error()->code(), ErrorCode::API_ERROR);

    auto info = AlphaVantagePriceProvider::parse_response(
        "IBM", R"js({"Information": "This is a premium endpoint."})js");
    ASSERT_TRUE(info.is_error());
    EXPECT_EQ(info.error()->code(), ErrorCode::API_ERROR);
}

TEST_F(AlphaVantageProviderTest, MalformedPayloads) {
    auto not_json = AlphaVantagePriceProvider::parse_response("IBM", "<html>oops</html>");
    ASSERT_TRUE(not_json.is_error());
    EXPECT_EQ(not_json.error()->code(), ErrorCode::JSON_PARSE_ERROR);

    auto no_series = AlphaVantagePriceProvider::parse_response("IBM", R"js({"Meta Data": {}})js");
    ASSERT_TRUE(no_series.is_error());
    EXPECT_EQ(no_series.error()->code(), ErrorCode::INVALID_DATA);

    auto bad_close = AlphaVantagePriceProvider::parse_response(
        "IBM", R"js({"Time Series (Daily)": {"2024-01-02": {"5. adjusted close": "n/a"}}})js");
    ASSERT_TRUE(bad_close.is_error());
    EXPECT_EQ(bad_close.error()->code(), ErrorCode::INVALID_DATA);

    auto missing_close = AlphaVantagePriceProvider::parse_response(
        "IBM", R"js({"Time Series (Daily)": {"2024-01-02": {"4. close": "1.0"}}})js");
    ASSERT_TRUE(missing_close.is_error());
    EXPECT_EQ(missing_close.error()->code(), ErrorCode::INVALID_DATA);

    auto bad_date = AlphaVantagePriceProvider::parse_response(
        "IBM", R"js({"Time Series (Daily)": {"yesterday": {"5. adjusted close": "1.0"}}})js");
    ASSERT_TRUE(bad_date.is_error());
    EXPECT_EQ(bad_date.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(AlphaVantageProviderTest, FetchBuildsRequestAndParses) {
    http_->set_response(200, DAILY_RESPONSE);
    AlphaVantagePriceProvider provider(http_, "DEMOKEY123", config_);

    auto result = provider.fetch_price_series("BRK.B");
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    EXPECT_EQ(result.value().symbol, "BRK.B");

    ASSERT_EQ(http_->requests().size(), 1u);
    const std::string& url = http_->requests()[0];
    EXPECT_EQ(url.rfind("https://www.alphavantage.co/query?", 0), 0u);
    EXPECT_NE(url.find("function=TIME_SERIES_DAILY_ADJUSTED"), std::string::npos);
    EXPECT_NE(url.find("symbol=BRK.B"), std::string::npos);
    EXPECT_NE(url.find("outputsize=compact"), std::string::npos);
    EXPECT_NE(url.find("apikey=DEMOKEY123"), std::string::npos);
}

TEST_F(AlphaVantageProviderTest, TransportAndStatusFailures) {
    AlphaVantagePriceProvider provider(http_, "DEMOKEY123", config_);

    http_->set_failure(ErrorCode::TIMEOUT_ERROR);
    auto timeout = provider.fetch_price_series("IBM");
    ASSERT_TRUE(timeout.is_error());
    EXPECT_EQ(timeout.error()->code(), ErrorCode::TIMEOUT_ERROR);

    http_->set_response(503, "");
    auto unavailable = provider.fetch_price_series("IBM");
    ASSERT_TRUE(unavailable.is_error());
    EXPECT_EQ(unavailable.error()->code(), ErrorCode::DATA_UNAVAILABLE);

    auto empty = provider.fetch_price_series("");
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(empty.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

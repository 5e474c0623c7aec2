#include <gtest/gtest.h>
#include <memory>
#include "../core/test_base.hpp"
#include "option_screener/data/fred_rate_provider.hpp"
#include "test_http_utils.hpp"

using namespace option_screener;
using option_screener::testing::FakeHttpClient;

namespace {

const char* const OBSERVATIONS = R"({
    "realtime_start": "2024-05-06",
    "units": "lin",
    "observations": [
        {"date": "2024-05-03", "value": "."},
        {"date": "2024-05-02", "value": "5.46"},
        {"date": "2024-05-01", "value": "5.45"}
    ]
})";

}  // namespace

class FredRateProviderTest : public option_screener::testing::TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        http_ = std::make_shared<FakeHttpClient>();
    }

    std::shared_ptr<FakeHttpClient> http_;
    ProviderConfig config_;
};

TEST_F(FredRateProviderTest, LatestNumericObservationAsDecimal) {
    auto rate = FredRateProvider::parse_response(OBSERVATIONS);
    ASSERT_TRUE(rate.is_ok()) << rate.error()->what();
    EXPECT_NEAR(rate.value(), 0.0546, 1e-12);
}

TEST_F(FredRateProviderTest, ObservationOrderDoesNotMatter) {
    auto rate = FredRateProvider::parse_response(R"({"observations": [
        {"date": "2024-04-30", "value": "5.40"},
        {"date": "2024-05-02", "value": "5.46"},
        {"date": "2024-05-01", "value": "5.45"}
    ]})");
    ASSERT_TRUE(rate.is_ok());
    EXPECT_NEAR(rate.value(), 0.0546, 1e-12);
}

TEST_F(FredRateProviderTest, NoNumericObservation) {
    auto rate = FredRateProvider::parse_response(
        R"({"observations": [{"date": "2024-05-03", "value": "."}]})");
    ASSERT_TRUE(rate.is_error());
    EXPECT_EQ(rate.error()->code(), ErrorCode::DATA_UNAVAILABLE);

    auto empty = FredRateProvider::parse_response(R"({"observations": []})");
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(empty.error()->code(), ErrorCode::DATA_UNAVAILABLE);
}

TEST_F(FredRateProviderTest, MalformedPayloads) {
    auto not_json = FredRateProvider::parse_response("{");
    ASSERT_TRUE(not_json.is_error());
    EXPECT_EQ(not_json.error()->code(), ErrorCode::JSON_PARSE_ERROR);

    auto no_observations = FredRateProvider::parse_response(
        R"({"error_code": 400, "error_message": "Bad Request."})");
    ASSERT_TRUE(no_observations.is_error());
    EXPECT_EQ(no_observations.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(FredRateProviderTest, MissingKeySkipsRequest) {
    FredRateProvider provider(http_, "", config_);
    auto rate = provider.fetch_risk_free_rate();
    ASSERT_TRUE(rate.is_error());
    EXPECT_EQ(rate.error()->code(), ErrorCode::DATA_UNAVAILABLE);
    EXPECT_TRUE(http_->requests().empty());
}

TEST_F(FredRateProviderTest, FetchBuildsRequest) {
    http_->set_response(200, OBSERVATIONS);
    FredRateProvider provider(http_, "abcdef0123456789", config_);

    auto rate = provider.fetch_risk_free_rate();
    ASSERT_TRUE(rate.is_ok()) << rate.error()->what();
    EXPECT_NEAR(rate.value(), 0.0546, 1e-12);

    ASSERT_EQ(http_->requests().size(), 1u);
    const std::string& url = http_->requests()[0];
    EXPECT_NE(url.find("series_id=DGS1MO"), std::string::npos);
    EXPECT_NE(url.find("api_key=abcdef0123456789"), std::string::npos);
    EXPECT_NE(url.find("file_type=json"), std::string::npos);
}

TEST_F(FredRateProviderTest, TransportAndStatusFailures) {
    FredRateProvider provider(http_, "abcdef0123456789", config_);

    http_->set_failure(ErrorCode::CONNECTION_ERROR);
    auto down = provider.fetch_risk_free_rate();
    ASSERT_TRUE(down.is_error());
    EXPECT_EQ(down.error()->code(), ErrorCode::CONNECTION_ERROR);

    http_->set_response(500, "");
    auto server_error = provider.fetch_risk_free_rate();
    ASSERT_TRUE(server_error.is_error());
    EXPECT_EQ(server_error.error()->code(), ErrorCode::DATA_UNAVAILABLE);
}

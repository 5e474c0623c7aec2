// test_http_utils.hpp
#pragma once

#include <map>
#include <string>
#include <vector>
#include "option_screener/data/http_client.hpp"

namespace option_screener {
namespace testing {

/**
 * @brief HttpClient that answers from canned responses and records requested URLs
 */
class FakeHttpClient : public HttpClient {
public:
    FakeHttpClient() : HttpClient(1) {}

    void set_response(long status_code, std::string body) {
        response_.status_code = status_code;
        response_.body = std::move(body);
        fail_ = false;
    }

    void set_failure(ErrorCode code) {
        fail_ = true;
        failure_code_ = code;
    }

    Result<HttpResponse> get(const std::string& url) override {
        requests_.push_back(url);
        if (fail_) {
            return make_error<HttpResponse>(failure_code_, "Injected transport failure",
                                            "FakeHttpClient");
        }
        return Result<HttpResponse>(response_);
    }

    const std::vector<std::string>& requests() const {
        return requests_;
    }

private:
    HttpResponse response_;
    bool fail_{false};
    ErrorCode failure_code_{ErrorCode::CONNECTION_ERROR};
    std::vector<std::string> requests_;
};

}  // namespace testing
}  // namespace option_screener

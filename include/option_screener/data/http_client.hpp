// include/option_screener/data/http_client.hpp
#pragma once

#include <curl/curl.h>
#include <string>
#include "option_screener/core/error.hpp"

namespace option_screener {

/**
 * @brief Body and status of a completed HTTP exchange
 */
struct HttpResponse {
    long status_code{0};
    std::string body;
};

/**
 * @class HttpClient
 * @brief Minimal libcurl GET client used by the data providers
 *
 * Every request is bounded by a total timeout; a provider that does not
 * answer within it is reported as TIMEOUT_ERROR.
 */
class HttpClient {
public:
    /**
     * @param timeout_seconds Total time allowed for one request
     * @param user_agent User-Agent header value
     */
    explicit HttpClient(long timeout_seconds = 10,
                        std::string user_agent = "option_screener/1.0");

    virtual ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * @brief Perform an HTTP GET request
     * @param url Absolute URL
     * @return Response (any status code), or an error when the transfer failed
     */
    virtual Result<HttpResponse> get(const std::string& url);

    long timeout_seconds() const {
        return timeout_seconds_;
    }

    /**
     * @brief Percent-encode a query parameter value
     */
    static std::string url_encode(const std::string& value);

private:
    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* user_data);

    long timeout_seconds_;
    std::string user_agent_;
};

}  // namespace option_screener

// src/data/http_client.cpp
#include "option_screener/data/http_client.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace option_screener {

HttpClient::HttpClient(long timeout_seconds, std::string user_agent)
    : timeout_seconds_(timeout_seconds), user_agent_(std::move(user_agent)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpClient::~HttpClient() {
    curl_global_cleanup();
}

size_t HttpClient::write_callback(void* contents, size_t size, size_t nmemb,
                                  std::string* user_data) {
    user_data->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

std::string HttpClient::url_encode(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;

    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return escaped.str();
}

Result<HttpResponse> HttpClient::get(const std::string& url) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_error<HttpResponse>(ErrorCode::CONNECTION_ERROR, "Failed to initialize CURL",
                                        "HttpClient");
    }

    HttpResponse response;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, HttpClient::write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    }

    curl_easy_cleanup(curl);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        return make_error<HttpResponse>(
            ErrorCode::TIMEOUT_ERROR,
            "Request timed out after " + std::to_string(timeout_seconds_) + "s",
            "HttpClient");
    }
    if (res != CURLE_OK) {
        return make_error<HttpResponse>(ErrorCode::CONNECTION_ERROR,
                                        "CURL error: " + std::string(curl_easy_strerror(res)),
                                        "HttpClient");
    }

    return Result<HttpResponse>(std::move(response));
}

}  // namespace option_screener

// src/broker/http_client.cpp
#include "rebalancer/broker/http_client.hpp"
#include <curl/curl.h>
#include <mutex>

namespace rebalancer {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response) {
    response->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

void ensure_curl_global_init() {
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

}  // namespace

HttpClient::HttpClient(std::vector<std::string> headers, long timeout_seconds, bool verify_ssl)
    : headers_(std::move(headers)), timeout_seconds_(timeout_seconds), verify_ssl_(verify_ssl) {
    ensure_curl_global_init();
}

Result<HttpResponse> HttpClient::get(const std::string& url) const {
    return perform("GET", url, "");
}

Result<HttpResponse> HttpClient::post(const std::string& url, const std::string& json_body) const {
    return perform("POST", url, json_body);
}

Result<HttpResponse> HttpClient::perform(const std::string& method, const std::string& url,
                                         const std::string& body) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_error<HttpResponse>(ErrorCode::CONNECTION_ERROR, "Failed to initialize curl",
                                        "HttpClient");
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& header : headers_) {
        header_list = curl_slist_append(header_list, header.c_str());
    }

    HttpResponse response;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify_ssl_ ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify_ssl_ ? 2L : 0L);
    if (method == "POST") {
        header_list = curl_slist_append(header_list, "Content-Type: application/json");
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        ErrorCode code =
            res == CURLE_OPERATION_TIMEDOUT ? ErrorCode::TIMEOUT_ERROR : ErrorCode::CONNECTION_ERROR;
        return make_error<HttpResponse>(
            code, method + " " + url + " failed: " + std::string(curl_easy_strerror(res)),
            "HttpClient");
    }

    if (response.status_code < 200 || response.status_code >= 300) {
        return make_error<HttpResponse>(ErrorCode::API_ERROR,
                                        method + " " + url + " returned HTTP " +
                                            std::to_string(response.status_code) + ": " +
                                            response.body,
                                        "HttpClient");
    }

    return Result<HttpResponse>(std::move(response));
}

}  // namespace rebalancer

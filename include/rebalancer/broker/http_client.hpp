// include/rebalancer/broker/http_client.hpp
#pragma once

#include <string>
#include <vector>
#include "rebalancer/core/error.hpp"

namespace rebalancer {

struct HttpResponse {
    long status_code{0};
    std::string body;
};

/**
 * @brief Minimal libcurl wrapper for authenticated JSON requests
 */
class HttpClient {
public:
    /**
     * @param headers Extra request headers, "Name: value"
     * @param timeout_seconds Whole-request timeout
     * @param verify_ssl Verify the peer certificate and host name
     */
    HttpClient(std::vector<std::string> headers, long timeout_seconds, bool verify_ssl);

    /**
     * @brief Issue a GET request
     * @return Body of a 2xx response; CONNECTION_ERROR/TIMEOUT_ERROR on transport
     *         failure, API_ERROR on any other status
     */
    Result<HttpResponse> get(const std::string& url) const;

    /**
     * @brief Issue a POST request with a JSON body
     */
    Result<HttpResponse> post(const std::string& url, const std::string& json_body) const;

private:
    Result<HttpResponse> perform(const std::string& method, const std::string& url,
                                 const std::string& body) const;

    std::vector<std::string> headers_;
    long timeout_seconds_;
    bool verify_ssl_;
};

}  // namespace rebalancer

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

struct HttpRequest {
    std::string method{"GET"};
    std::string url;
    std::vector<std::string> headers;
    std::string body;
};

struct HttpResponse {
    long status{0};
    std::string body;
};

// Blocking libcurl client. Transport failures throw RequestTimeout or
// NetworkError; any HTTP status, error or not, comes back as a response.
class HttpClient {
public:
    explicit HttpClient(std::int64_t timeout_ms, std::string user_agent = "crypto-gateway/1.0");

    HttpResponse send(const HttpRequest& req) const;

    std::int64_t timeout_ms() const { return timeout_ms_; }

private:
    std::int64_t timeout_ms_;
    std::string user_agent_;
};

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// key=value&... with RFC 3986 escaping, in the given order.
std::string build_query(const QueryParams& params);
std::string url_encode(const std::string& s);

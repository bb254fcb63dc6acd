#include "venues/rest/http_client.hpp"

#include <mutex>

#include <curl/curl.h>

#include "errors/exchange_errors.hpp"

// Helper for CURL write callback
static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* s) {
    size_t new_length = size * nmemb;
    s->append(static_cast<char*>(contents), new_length);
    return new_length;
}

HttpClient::HttpClient(std::int64_t timeout_ms, std::string user_agent)
    : timeout_ms_(timeout_ms)
    , user_agent_(std::move(user_agent))
{
    static std::once_flag curl_init;
    std::call_once(curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse HttpClient::send(const HttpRequest& req) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw NetworkError("curl_easy_init failed");
    }

    HttpResponse response;
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, ("User-Agent: " + user_agent_).c_str());
    for (const auto& h : req.headers) {
        headers = curl_slist_append(headers, h.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, req.method.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    if (req.method != "GET" && req.method != "DELETE") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, req.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body.size()));
    }

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        throw RequestTimeout(req.method + " " + req.url + " timed out after " +
            std::to_string(timeout_ms_) + "ms");
    }
    if (res != CURLE_OK) {
        throw NetworkError(req.method + " " + req.url + ": " + curl_easy_strerror(res));
    }
    return response;
}

std::string url_encode(const std::string& s) {
    static const char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string build_query(const QueryParams& params) {
    std::string q;
    for (const auto& [k, v] : params) {
        if (!q.empty()) q += '&';
        q += url_encode(k);
        q += '=';
        q += url_encode(v);
    }
    return q;
}

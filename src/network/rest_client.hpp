#pragma once

#include <atomic>
#include <string>
#include <unordered_map>

namespace xvh {

struct HttpResponse {
    long status_code = 0;
    std::string body;
    long response_time_ms = 0;
    std::string error_message;

    bool IsSuccess() const { return status_code >= 200 && status_code < 300; }
};

struct HttpRequest {
    std::string url;
    std::unordered_map<std::string, std::string> headers;
    long timeout_ms = 5000;
};

// Process-wide curl_global_init/cleanup; create one before any RestClient.
class CurlGlobalGuard {
public:
    CurlGlobalGuard();
    ~CurlGlobalGuard();

    CurlGlobalGuard(const CurlGlobalGuard&) = delete;
    CurlGlobalGuard& operator=(const CurlGlobalGuard&) = delete;
};

class RestClient {
public:
    RestClient();
    virtual ~RestClient() = default;

    void SetUserAgent(const std::string& user_agent);

    // timeout_ms <= 0 uses the default timeout.
    virtual HttpResponse Get(const std::string& url, long timeout_ms = 0,
                             const std::unordered_map<std::string, std::string>& headers = {});

    long long GetTotalRequests() const { return total_requests_; }
    long long GetFailedRequests() const { return failed_requests_; }

private:
    HttpResponse Request(const HttpRequest& request);
    static size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* data);

    std::string user_agent_;
    long default_timeout_ms_;
    long connect_timeout_ms_;

    std::atomic<long long> total_requests_;
    std::atomic<long long> failed_requests_;
};

} // namespace xvh

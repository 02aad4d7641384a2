#include "rest_client.hpp"
#include "network_exception.hpp"
#include "../utils/logger.hpp"
#include <chrono>
#include <memory>
#include <curl/curl.h>

namespace xvh {

CurlGlobalGuard::CurlGlobalGuard() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        throw NetworkException("curl_global_init failed");
    }
}

CurlGlobalGuard::~CurlGlobalGuard() {
    curl_global_cleanup();
}

RestClient::RestClient()
    : user_agent_("xvhedge/1.0")
    , default_timeout_ms_(5000)
    , connect_timeout_ms_(3000)
    , total_requests_(0)
    , failed_requests_(0) {}

void RestClient::SetUserAgent(const std::string& user_agent) {
    user_agent_ = user_agent;
}

HttpResponse RestClient::Get(const std::string& url, long timeout_ms,
                             const std::unordered_map<std::string, std::string>& headers) {
    HttpRequest request;
    request.url = url;
    request.headers = headers;
    request.timeout_ms = timeout_ms > 0 ? timeout_ms : default_timeout_ms_;

    return Request(request);
}

// Transport failures are reported through HttpResponse::error_message with
// status_code 0; a timeout raises TimeoutException.
HttpResponse RestClient::Request(const HttpRequest& request) {
    auto start_time = std::chrono::steady_clock::now();
    total_requests_.fetch_add(1);

    HttpResponse response;

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        failed_requests_.fetch_add(1);
        response.error_message = "Failed to initialize CURL handle";
        LOG_ERROR("Failed to initialize CURL handle");
        return response;
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, RestClient::WriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, request.timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, connect_timeout_ms_);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_list(nullptr, &curl_slist_free_all);
    for (const auto& header : request.headers) {
        std::string header_str = header.first + ": " + header.second;
        curl_slist* appended = curl_slist_append(header_list.get(), header_str.c_str());
        if (!appended) {
            failed_requests_.fetch_add(1);
            response.error_message = "Failed to build request headers";
            return response;
        }
        header_list.release();
        header_list.reset(appended);
    }
    if (header_list) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    }

    CURLcode result = curl_easy_perform(curl.get());

    response.response_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();

    if (result != CURLE_OK) {
        failed_requests_.fetch_add(1);
        response.error_message = curl_easy_strerror(result);
        if (result == CURLE_OPERATION_TIMEDOUT) {
            throw TimeoutException(request.url, request.timeout_ms);
        }
        LOG_DEBUG("GET %s failed: %s", request.url.c_str(), response.error_message.c_str());
        return response;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
    if (!response.IsSuccess()) {
        failed_requests_.fetch_add(1);
    }
    return response;
}

size_t RestClient::WriteCallback(void* contents, size_t size, size_t nmemb, std::string* data) {
    size_t total_size = size * nmemb;
    data->append(static_cast<char*>(contents), total_size);
    return total_size;
}

} // namespace xvh

#pragma once

#include <string>
#include "../core/exceptions.hpp"

namespace xvh {

class NetworkException : public XvhException {
public:
    explicit NetworkException(const std::string& message)
        : XvhException("Network Error: " + message) {}
    NetworkException(const std::string& url, const std::string& message)
        : XvhException("Network Error: " + message + " (" + url + ")"), url_(url) {}

    const std::string& url() const { return url_; }

private:
    std::string url_;
};

class TimeoutException : public NetworkException {
public:
    TimeoutException(const std::string& url, long timeout_ms)
        : NetworkException(url, "timed out after " + std::to_string(timeout_ms) + " ms") {}
};

} // namespace xvh

#include "venue_client.hpp"
#include <cmath>
#include "exchange_exception.hpp"
#include "../network/network_exception.hpp"
#include "../network/rest_client.hpp"
#include "../utils/logger.hpp"

namespace xvh {

VenueClient::VenueClient(const VenueConfig& config, RestClient* rest_client)
    : config_(config), rest_client_(rest_client) {
    if (!rest_client_) {
        throw ExchangeException(config_.name, "venue client requires a REST client");
    }
}

std::string VenueClient::get_name() const {
    return config_.name;
}

std::string VenueClient::fetch(const std::string& url) {
    HttpResponse response;
    try {
        response = rest_client_->Get(url, config_.timeout_ms);
    } catch (const NetworkException& e) {
        throw ExchangeException(config_.name, e.what());
    }
    if (!response.error_message.empty()) {
        throw ExchangeException(config_.name, response.error_message);
    }
    if (!response.IsSuccess()) {
        throw ExchangeException(config_.name, "HTTP " + std::to_string(response.status_code) + " for " + url);
    }
    LOG_DEBUG("%s answered %s in %ld ms", config_.name.c_str(), url.c_str(), response.response_time_ms);
    return response.body;
}

double VenueClient::parse_decimal(const std::string& value, const std::string& venue) {
    size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw ExchangeException(venue, "malformed price '" + value + "'");
    }
    if (consumed != value.size() || !std::isfinite(parsed) || parsed <= 0.0) {
        throw ExchangeException(venue, "invalid price '" + value + "'");
    }
    return parsed;
}

} // namespace xvh

#include "mexc_client.hpp"
#include <cmath>
#include <nlohmann/json.hpp>
#include "exchange_exception.hpp"

namespace xvh {

MexcClient::MexcClient(const VenueConfig& config, RestClient* rest_client)
    : VenueClient(config, rest_client) {}

double MexcClient::get_price(const std::string& asset) {
    std::string url = config_.base_url + "/api/v3/ticker/price?symbol=" + symbol_for(asset);
    return parse_ticker(fetch(url));
}

std::string MexcClient::symbol_for(const std::string& asset) {
    return asset + "USDT";
}

// {"symbol":"XTZUSDT","price":"0.8123"}
double MexcClient::parse_ticker(const std::string& body) {
    try {
        auto json = nlohmann::json::parse(body);
        if (!json.contains("price")) {
            throw ExchangeException("mexc", "ticker response has no price");
        }
        const auto& price = json["price"];
        if (price.is_string()) {
            return parse_decimal(price.get<std::string>(), "mexc");
        }
        if (price.is_number()) {
            double value = price.get<double>();
            if (!std::isfinite(value) || value <= 0.0) {
                throw ExchangeException("mexc", "invalid price " + std::to_string(value));
            }
            return value;
        }
        throw ExchangeException("mexc", "price field has unexpected type");
    } catch (const nlohmann::json::exception& e) {
        throw ExchangeException("mexc", std::string("malformed ticker response: ") + e.what());
    }
}

} // namespace xvh

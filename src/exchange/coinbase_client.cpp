#include "coinbase_client.hpp"
#include <nlohmann/json.hpp>
#include "exchange_exception.hpp"

namespace xvh {

CoinbaseClient::CoinbaseClient(const VenueConfig& config, RestClient* rest_client)
    : VenueClient(config, rest_client) {}

double CoinbaseClient::get_price(const std::string& asset) {
    std::string url = config_.base_url + "/v2/prices/" + symbol_for(asset) + "/spot";
    return parse_spot(fetch(url));
}

std::string CoinbaseClient::symbol_for(const std::string& asset) {
    return asset + "-USD";
}

// {"data":{"amount":"0.81","base":"XTZ","currency":"USD"}}
double CoinbaseClient::parse_spot(const std::string& body) {
    try {
        auto json = nlohmann::json::parse(body);
        if (!json.contains("data") || !json["data"].contains("amount")) {
            throw ExchangeException("coinbase", "spot response has no amount");
        }
        const auto& amount = json["data"]["amount"];
        if (!amount.is_string()) {
            throw ExchangeException("coinbase", "amount field has unexpected type");
        }
        return parse_decimal(amount.get<std::string>(), "coinbase");
    } catch (const nlohmann::json::exception& e) {
        throw ExchangeException("coinbase", std::string("malformed spot response: ") + e.what());
    }
}

} // namespace xvh

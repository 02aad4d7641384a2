#include "exchange_factory.hpp"
#include "mexc_client.hpp"
#include "coinbase_client.hpp"
#include "../core/exceptions.hpp"
#include "../utils/logger.hpp"

namespace xvh {

std::unique_ptr<VenueClient> ExchangeFactory::create_client(const VenueConfig& config, RestClient* rest_client) {
    if (config.name == "mexc") {
        return std::make_unique<MexcClient>(config, rest_client);
    }
    if (config.name == "coinbase") {
        return std::make_unique<CoinbaseClient>(config, rest_client);
    }
    throw ConfigurationError("unsupported venue '" + config.name + "'");
}

std::map<std::string, std::unique_ptr<VenueClient>> ExchangeFactory::create_clients(
    const std::map<std::string, VenueConfig>& configs, RestClient* rest_client) {
    std::map<std::string, std::unique_ptr<VenueClient>> clients;
    for (const auto& [name, config] : configs) {
        if (!config.enabled) {
            LOG_INFO("Venue %s is disabled", name.c_str());
            continue;
        }
        clients[name] = create_client(config, rest_client);
        LOG_INFO("Venue %s ready at %s", name.c_str(), config.base_url.c_str());
    }
    return clients;
}

} // namespace xvh

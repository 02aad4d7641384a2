#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "venue_client.hpp"
#include "../utils/config_types.hpp"

namespace xvh {

class RestClient;

class ExchangeFactory {
public:
    static std::unique_ptr<VenueClient> create_client(const VenueConfig& config, RestClient* rest_client);
    // One client per enabled venue, keyed by venue name.
    static std::map<std::string, std::unique_ptr<VenueClient>> create_clients(
        const std::map<std::string, VenueConfig>& configs, RestClient* rest_client);
};

} // namespace xvh

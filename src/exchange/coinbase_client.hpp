#pragma once

#include "venue_client.hpp"

namespace xvh {

class CoinbaseClient : public VenueClient {
public:
    CoinbaseClient(const VenueConfig& config, RestClient* rest_client);

    double get_price(const std::string& asset) override;

    static std::string symbol_for(const std::string& asset);
    static double parse_spot(const std::string& body);
};

} // namespace xvh

#pragma once

#include "venue_client.hpp"

namespace xvh {

class MexcClient : public VenueClient {
public:
    MexcClient(const VenueConfig& config, RestClient* rest_client);

    double get_price(const std::string& asset) override;

    static std::string symbol_for(const std::string& asset);
    static double parse_ticker(const std::string& body);
};

} // namespace xvh

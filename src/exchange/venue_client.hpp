#pragma once

#include <string>
#include "../utils/config_types.hpp"

namespace xvh {

class RestClient;

// Spot price lookup against one venue's public REST API.
class VenueClient {
public:
    VenueClient(const VenueConfig& config, RestClient* rest_client);
    virtual ~VenueClient() = default;

    virtual std::string get_name() const;
    // USD price of `asset`; throws ExchangeException on any failure.
    virtual double get_price(const std::string& asset) = 0;

protected:
    std::string fetch(const std::string& url);
    static double parse_decimal(const std::string& value, const std::string& venue);

    VenueConfig config_;
    RestClient* rest_client_;
};

} // namespace xvh

#pragma once

#include <map>
#include <memory>
#include <string>
#include "venue_client.hpp"
#include "../core/price_feed.hpp"

namespace xvh {

// PriceFeed over a set of venue clients; every failure becomes "unavailable".
class VenuePriceFeed : public PriceFeed {
public:
    explicit VenuePriceFeed(std::map<std::string, std::unique_ptr<VenueClient>> clients);

    std::optional<double> current_price(const std::string& asset, const std::string& venue) override;

    bool has_venue(const std::string& venue) const;

private:
    std::map<std::string, std::unique_ptr<VenueClient>> clients_;
};

} // namespace xvh

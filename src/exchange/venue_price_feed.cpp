#include "venue_price_feed.hpp"
#include "exchange_exception.hpp"
#include "../utils/logger.hpp"

namespace xvh {

VenuePriceFeed::VenuePriceFeed(std::map<std::string, std::unique_ptr<VenueClient>> clients)
    : clients_(std::move(clients)) {}

std::optional<double> VenuePriceFeed::current_price(const std::string& asset, const std::string& venue) {
    auto it = clients_.find(venue);
    if (it == clients_.end()) {
        LOG_ERROR("No client configured for venue %s", venue.c_str());
        return std::nullopt;
    }

    try {
        return it->second->get_price(asset);
    } catch (const ExchangeException& e) {
        LOG_ERROR("Error fetching price from %s for %s: %s", venue.c_str(), asset.c_str(), e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Unexpected error fetching price from %s for %s: %s", venue.c_str(), asset.c_str(), e.what());
    }
    return std::nullopt;
}

bool VenuePriceFeed::has_venue(const std::string& venue) const {
    return clients_.count(venue) > 0;
}

} // namespace xvh

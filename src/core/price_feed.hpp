#pragma once

#include <optional>
#include <string>

namespace xvh {

// Current price of an asset in USD on a venue. std::nullopt means the price is
// unavailable this time; implementations must not block indefinitely.
class PriceFeed {
public:
    virtual ~PriceFeed() = default;
    virtual std::optional<double> current_price(const std::string& asset, const std::string& venue) = 0;
};

} // namespace xvh

#pragma once

namespace xvh {

class PositionSizer {
public:
    // USD notional for one hedge: scale_factor * max(min_usd / scale_factor, volatility / reference_price).
    // Exactly min_usd whenever the floor term wins.
    double notional(double volatility, double reference_price, double min_usd, double scale_factor) const;
};

} // namespace xvh

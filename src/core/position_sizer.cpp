#include "position_sizer.hpp"
#include <cmath>
#include <string>
#include "exceptions.hpp"

namespace xvh {

double PositionSizer::notional(double volatility, double reference_price, double min_usd, double scale_factor) const {
    if (!std::isfinite(reference_price) || reference_price <= 0.0) {
        throw InvalidPriceError("reference price " + std::to_string(reference_price));
    }
    if (!std::isfinite(scale_factor) || scale_factor <= 0.0) {
        throw ValidationError("trade size factor must be positive");
    }

    double floor_factor = min_usd / scale_factor;
    double volatility_factor = volatility / reference_price;
    if (volatility_factor <= floor_factor) {
        return min_usd;
    }
    return scale_factor * volatility_factor;
}

} // namespace xvh

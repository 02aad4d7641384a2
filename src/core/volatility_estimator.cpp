#include "volatility_estimator.hpp"
#include <cmath>
#include "exceptions.hpp"

namespace xvh {

VolatilityEstimator::VolatilityEstimator(const PriceHistoryBuffer* history)
    : history_(history) {}

Result<double> VolatilityEstimator::true_range_average(const std::string& asset, const std::string& venue, size_t period) const {
    if (period == 0) {
        throw ValidationError("volatility period must be at least 1");
    }

    auto samples = history_->recent(asset, venue, period + 1);
    if (samples.size() < period + 1) {
        return Result<double>::error(ErrorCode::INSUFFICIENT_HISTORY,
            "need " + std::to_string(period + 1) + " samples for " + asset + " on " + venue +
            ", have " + std::to_string(samples.size()));
    }

    double sum = 0.0;
    for (size_t i = 1; i < samples.size(); ++i) {
        sum += std::fabs(samples[i].price - samples[i - 1].price);
    }
    return Result<double>::success(sum / static_cast<double>(period));
}

} // namespace xvh

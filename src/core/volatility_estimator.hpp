#pragma once

#include <string>
#include "price_history_buffer.hpp"
#include "result.hpp"

namespace xvh {

// Average true range over single-tick data: the mean absolute change between
// consecutive samples, over the most recent `period` changes.
class VolatilityEstimator {
public:
    explicit VolatilityEstimator(const PriceHistoryBuffer* history);

    Result<double> true_range_average(const std::string& asset, const std::string& venue, size_t period) const;

private:
    const PriceHistoryBuffer* history_;
};

} // namespace xvh

#include "price_history_buffer.hpp"
#include <algorithm>
#include <cmath>
#include "exceptions.hpp"

namespace xvh {

PriceHistoryBuffer::PriceHistoryBuffer(size_t capacity)
    : capacity_(capacity) {}

void PriceHistoryBuffer::append(const std::string& asset, const std::string& venue, const PriceSample& sample) {
    if (!std::isfinite(sample.price) || sample.price <= 0.0) {
        throw InvalidPriceError(asset + " on " + venue + ": " + std::to_string(sample.price));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& series = series_[Key(asset, venue)];
    if (!series.empty() && sample.timestamp < series.back().timestamp) {
        throw ValidationError("out-of-order price sample for " + asset + " on " + venue);
    }

    series.push_back(sample);
    if (capacity_ > 0 && series.size() > capacity_) {
        series.pop_front();
    }
}

std::vector<PriceSample> PriceHistoryBuffer::recent(const std::string& asset, const std::string& venue, size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = series_.find(Key(asset, venue));
    if (it == series_.end()) {
        return {};
    }

    const auto& series = it->second;
    size_t n = std::min(count, series.size());
    return std::vector<PriceSample>(series.end() - static_cast<std::ptrdiff_t>(n), series.end());
}

size_t PriceHistoryBuffer::size(const std::string& asset, const std::string& venue) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = series_.find(Key(asset, venue));
    return it == series_.end() ? 0 : it->second.size();
}

} // namespace xvh

#pragma once

#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "types.hpp"

namespace xvh {

// Per-(asset, venue) price history. Each key holds at most `capacity` samples
// (0 = unbounded); the oldest sample is dropped once a key is full.
class PriceHistoryBuffer {
public:
    explicit PriceHistoryBuffer(size_t capacity = 0);

    void append(const std::string& asset, const std::string& venue, const PriceSample& sample);
    std::vector<PriceSample> recent(const std::string& asset, const std::string& venue, size_t count) const;

    size_t size(const std::string& asset, const std::string& venue) const;
    size_t capacity() const { return capacity_; }

private:
    using Key = std::pair<std::string, std::string>;

    size_t capacity_;
    mutable std::mutex mutex_;
    std::map<Key, std::deque<PriceSample>> series_;
};

} // namespace xvh

#pragma once

#include <string>
#include <vector>
#include "../core/types.hpp"

namespace xvh {

class HistoryStore {
public:
    virtual ~HistoryStore() = default;
    virtual bool append_sample(const std::string& asset, const std::string& venue, const PriceSample& sample) = 0;
    // Most recent `limit` samples in chronological order.
    virtual std::vector<PriceSample> load_samples(const std::string& asset, const std::string& venue, int limit) = 0;
};

class BalanceStore {
public:
    virtual ~BalanceStore() = default;
    virtual LedgerSnapshot load() = 0;
    virtual bool save(const LedgerSnapshot& snapshot) = 0;
};

class TradeLog {
public:
    virtual ~TradeLog() = default;
    virtual bool append_trade(const TradeRecord& record) = 0;
};

} // namespace xvh

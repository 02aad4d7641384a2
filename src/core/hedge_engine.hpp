#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"
#include "price_feed.hpp"
#include "price_history_buffer.hpp"
#include "volatility_estimator.hpp"
#include "position_sizer.hpp"
#include "hedge_ledger.hpp"
#include "../data/storage.hpp"
#include "../utils/config_types.hpp"

namespace xvh {

class ThreadPool;

// Runs one decision cycle over the tracked pairs: price both venues, size the
// hedge from venue-A volatility, then buy on the cheaper venue and sell on the
// dearer one when the funding venue can cover the notional.
class HedgeEngine {
public:
    using Clock = std::function<Timestamp()>;

    HedgeEngine(const HedgeConfig& config, PriceFeed* price_feed, PriceHistoryBuffer* history, HedgeLedger* ledger);

    void set_trade_log(TradeLog* trade_log);
    void set_history_store(HistoryStore* history_store);
    // Price lookups run on the pool when set; sequentially otherwise.
    void set_thread_pool(ThreadPool* pool);
    void set_clock(Clock clock);

    CycleResult run_cycle(const std::vector<TrackedPair>& pairs);

    // Fetches one price and records it in the history; used for warm-up.
    std::optional<double> sample_price(const std::string& asset, const std::string& venue);
    // Current prices on both venues, leaving the price history untouched.
    VenueQuotes quote(const std::string& asset);

    size_t history_size(const std::string& asset, const std::string& venue) const {
        return history_->size(asset, venue);
    }

    const std::string& venue_a() const { return config_.venue_a; }
    const std::string& venue_b() const { return config_.venue_b; }
    const HedgeConfig& config() const { return config_; }

private:
    std::map<std::string, VenueQuotes> fetch_quotes(const std::vector<TrackedPair>& pairs);
    std::optional<double> fetch_price(const std::string& asset, const std::string& venue);
    std::optional<double> record_price(const std::string& asset, const std::string& venue, std::optional<double> price);

    AssetOutcome process_asset(const std::string& asset, const VenueQuotes& quotes, std::vector<TradeRecord>& trades);
    void execute_hedge(const std::string& asset, double funding_price, double counter_price,
                       AssetOutcome& outcome, std::vector<TradeRecord>& trades);
    void publish(const TradeRecord& record);

    HedgeConfig config_;
    PriceFeed* price_feed_;
    PriceHistoryBuffer* history_;
    HedgeLedger* ledger_;
    TradeLog* trade_log_ = nullptr;
    HistoryStore* history_store_ = nullptr;
    ThreadPool* pool_ = nullptr;
    Clock clock_;
    VolatilityEstimator estimator_;
    PositionSizer sizer_;
};

} // namespace xvh

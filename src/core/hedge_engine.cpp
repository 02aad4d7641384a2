#include "hedge_engine.hpp"
#include <cmath>
#include <future>
#include <utility>
#include "exceptions.hpp"
#include "../utils/logger.hpp"
#include "../utils/thread_pool.hpp"

namespace xvh {

namespace {

void skip(AssetOutcome& outcome, const std::string& reason) {
    outcome.state = HedgeState::SKIPPED;
    outcome.reason = reason;
    LOG_INFO("Skipping %s this cycle: %s", outcome.asset.c_str(), reason.c_str());
}

} // namespace

HedgeEngine::HedgeEngine(const HedgeConfig& config, PriceFeed* price_feed, PriceHistoryBuffer* history, HedgeLedger* ledger)
    : config_(config),
      price_feed_(price_feed),
      history_(history),
      ledger_(ledger),
      clock_([] { return std::chrono::system_clock::now(); }),
      estimator_(history) {
    if (!price_feed_ || !history_ || !ledger_) {
        throw ConfigurationError("hedge engine requires a price feed, a history buffer and a ledger");
    }
    if (config_.venue_a == config_.venue_b) {
        throw ConfigurationError("hedge venues must differ");
    }
    if (!ledger_->has_venue(config_.venue_a) || !ledger_->has_venue(config_.venue_b)) {
        throw ConfigurationError("ledger does not hold both hedge venues");
    }
    if (config_.volatility_period < 1) {
        throw ConfigurationError("volatility period must be at least 1");
    }
}

void HedgeEngine::set_trade_log(TradeLog* trade_log) {
    trade_log_ = trade_log;
}

void HedgeEngine::set_history_store(HistoryStore* history_store) {
    history_store_ = history_store;
}

void HedgeEngine::set_thread_pool(ThreadPool* pool) {
    pool_ = pool;
}

void HedgeEngine::set_clock(Clock clock) {
    clock_ = std::move(clock);
}

CycleResult HedgeEngine::run_cycle(const std::vector<TrackedPair>& pairs) {
    CycleResult result;
    result.quotes = fetch_quotes(pairs);

    for (const auto& pair : pairs) {
        AssetOutcome outcome;
        try {
            outcome = process_asset(pair.asset, result.quotes[pair.asset], result.trades);
        } catch (const InvalidAmountError&) {
            throw;
        } catch (const std::exception& e) {
            outcome.asset = pair.asset;
            LOG_ERROR("Unexpected failure while hedging %s: %s", pair.asset.c_str(), e.what());
            skip(outcome, e.what());
        }
        result.outcomes.push_back(outcome);
    }

    result.snapshot = ledger_->snapshot();
    return result;
}

std::optional<double> HedgeEngine::sample_price(const std::string& asset, const std::string& venue) {
    return record_price(asset, venue, fetch_price(asset, venue));
}

VenueQuotes HedgeEngine::quote(const std::string& asset) {
    auto usable = [](std::optional<double> price) -> std::optional<double> {
        if (price && std::isfinite(*price) && *price > 0.0) {
            return price;
        }
        return std::nullopt;
    };
    VenueQuotes quotes;
    quotes.price_a = usable(fetch_price(asset, config_.venue_a));
    quotes.price_b = usable(fetch_price(asset, config_.venue_b));
    return quotes;
}

// All lookups finish before any asset is sized. A failed lookup only loses
// its own quote.
std::map<std::string, VenueQuotes> HedgeEngine::fetch_quotes(const std::vector<TrackedPair>& pairs) {
    std::vector<std::pair<std::optional<double>, std::optional<double>>> raw(pairs.size());

    if (pool_) {
        std::vector<std::pair<std::future<std::optional<double>>, std::future<std::optional<double>>>> pending;
        for (const auto& pair : pairs) {
            const std::string asset = pair.asset;
            pending.emplace_back(
                pool_->submit([this, asset] { return fetch_price(asset, config_.venue_a); }),
                pool_->submit([this, asset] { return fetch_price(asset, config_.venue_b); }));
        }
        for (size_t i = 0; i < pending.size(); ++i) {
            raw[i].first = pending[i].first.get();
            raw[i].second = pending[i].second.get();
        }
    } else {
        for (size_t i = 0; i < pairs.size(); ++i) {
            raw[i].first = fetch_price(pairs[i].asset, config_.venue_a);
            raw[i].second = fetch_price(pairs[i].asset, config_.venue_b);
        }
    }

    std::map<std::string, VenueQuotes> quotes;
    for (size_t i = 0; i < pairs.size(); ++i) {
        const auto& asset = pairs[i].asset;
        VenueQuotes q;
        q.price_a = record_price(asset, config_.venue_a, raw[i].first);
        q.price_b = record_price(asset, config_.venue_b, raw[i].second);
        quotes[asset] = q;
    }
    return quotes;
}

std::optional<double> HedgeEngine::fetch_price(const std::string& asset, const std::string& venue) {
    try {
        return price_feed_->current_price(asset, venue);
    } catch (const std::exception& e) {
        LOG_ERROR("Error fetching price from %s for %s: %s", venue.c_str(), asset.c_str(), e.what());
        return std::nullopt;
    }
}

std::optional<double> HedgeEngine::record_price(const std::string& asset, const std::string& venue, std::optional<double> price) {
    if (!price) {
        return std::nullopt;
    }

    PriceSample sample{clock_(), *price};
    try {
        history_->append(asset, venue, sample);
    } catch (const InvalidPriceError& e) {
        LOG_WARNING("Discarding price from %s for %s: %s", venue.c_str(), asset.c_str(), e.what());
        return std::nullopt;
    } catch (const ValidationError& e) {
        LOG_WARNING("Price history for %s on %s not extended: %s", asset.c_str(), venue.c_str(), e.what());
        return price;
    }

    if (history_store_ && !history_store_->append_sample(asset, venue, sample)) {
        LOG_WARNING("Failed to persist price sample for %s on %s", asset.c_str(), venue.c_str());
    }
    return price;
}

AssetOutcome HedgeEngine::process_asset(const std::string& asset, const VenueQuotes& quotes, std::vector<TradeRecord>& trades) {
    AssetOutcome outcome;
    outcome.asset = asset;

    if (!quotes.price_a || !quotes.price_b) {
        const std::string& missing = !quotes.price_a ? config_.venue_a : config_.venue_b;
        skip(outcome, "price unavailable on " + missing);
        return outcome;
    }
    outcome.state = HedgeState::PRICED;
    double price_a = *quotes.price_a;
    double price_b = *quotes.price_b;

    auto volatility = estimator_.true_range_average(asset, config_.venue_a,
                                                    static_cast<size_t>(config_.volatility_period));
    if (volatility.is_error()) {
        LOG_WARNING("Volatility for %s unavailable, sizing with zero: %s", asset.c_str(), volatility.error().message.c_str());
        outcome.volatility = 0.0;
    } else {
        outcome.volatility = volatility.value();
    }

    outcome.notional = sizer_.notional(outcome.volatility, price_a, config_.min_trade_usd, config_.trade_size_factor);
    outcome.state = HedgeState::SIZED;
    if (outcome.notional < config_.min_trade_usd) {
        skip(outcome, "notional below minimum trade amount");
        return outcome;
    }

    if (price_a == price_b) {
        skip(outcome, "venues quote the same price");
        return outcome;
    }

    bool fund_on_a = price_a < price_b;
    outcome.funding_venue = fund_on_a ? config_.venue_a : config_.venue_b;
    outcome.counter_venue = fund_on_a ? config_.venue_b : config_.venue_a;
    double funding_price = fund_on_a ? price_a : price_b;
    double counter_price = fund_on_a ? price_b : price_a;

    if (ledger_->cash(outcome.funding_venue) < outcome.notional) {
        skip(outcome, "insufficient cash on " + outcome.funding_venue);
        return outcome;
    }

    execute_hedge(asset, funding_price, counter_price, outcome, trades);
    return outcome;
}

void HedgeEngine::execute_hedge(const std::string& asset, double funding_price, double counter_price,
                                AssetOutcome& outcome, std::vector<TradeRecord>& trades) {
    const double notional = outcome.notional;
    const double crypto_amount = notional / funding_price;
    const double fee = notional * config_.taker_fee_rate;
    const double net_spend = notional - fee;
    const double proceeds = crypto_amount * counter_price;

    // Both legs land or neither does.
    LedgerSnapshot before = ledger_->snapshot();
    try {
        ledger_->debit_cash(outcome.funding_venue, net_spend);
        ledger_->adjust_holding(outcome.funding_venue, asset, crypto_amount);
        // The counter leg settles in cash; the counter venue never holds the asset.
        ledger_->credit_cash(outcome.counter_venue, proceeds);
    } catch (const InsufficientFundsError& e) {
        ledger_->restore(before);
        skip(outcome, e.what());
        return;
    } catch (const InsufficientHoldingError& e) {
        ledger_->restore(before);
        skip(outcome, e.what());
        return;
    } catch (const InvalidAmountError&) {
        ledger_->restore(before);
        throw;
    }

    Timestamp now = clock_();
    TradeRecord buy{now, asset, TradeType::BUY, crypto_amount, funding_price,
                    outcome.funding_venue, crypto_amount * funding_price, fee};
    TradeRecord sell{now, asset, TradeType::SELL, -crypto_amount, counter_price,
                     outcome.counter_venue, proceeds, 0.0};

    LOG_INFO("Arbitrage: Bought %.10f of %s on %s for $%.2f (Fee: $%.2f)",
             crypto_amount, asset.c_str(), outcome.funding_venue.c_str(), net_spend, fee);
    LOG_INFO("Arbitrage: Sold %.10f of %s on %s for $%.2f",
             crypto_amount, asset.c_str(), outcome.counter_venue.c_str(), proceeds);

    publish(buy);
    publish(sell);
    trades.push_back(buy);
    trades.push_back(sell);
    outcome.state = HedgeState::EXECUTED;
}

void HedgeEngine::publish(const TradeRecord& record) {
    if (!trade_log_) {
        return;
    }
    try {
        if (!trade_log_->append_trade(record)) {
            LOG_WARNING("Trade log rejected %s record for %s on %s",
                        to_string(record.type).c_str(), record.asset.c_str(), record.venue.c_str());
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Trade log failure for %s: %s", record.asset.c_str(), e.what());
    }
}

} // namespace xvh

#include "hedge_runner.hpp"
#include <algorithm>
#include "exceptions.hpp"
#include "../utils/logger.hpp"

namespace xvh {

HedgeRunner::HedgeRunner(HedgeEngine* engine, BalanceStore* balance_store, AppState* app_state,
                         std::vector<TrackedPair> pairs)
    : engine_(engine), balance_store_(balance_store), app_state_(app_state), pairs_(std::move(pairs)) {
    if (!engine_ || !balance_store_ || !app_state_) {
        throw ConfigurationError("hedge runner requires an engine, a balance store and an app state");
    }
}

void HedgeRunner::warm_up() {
    const auto& config = engine_->config();
    if (config.warmup_samples <= 0) {
        return;
    }
    const auto required = static_cast<size_t>(config.volatility_period) + 1;
    const auto interval = std::chrono::milliseconds(config.warmup_interval_ms);

    for (const auto& pair : pairs_) {
        for (const auto& venue : {engine_->venue_a(), engine_->venue_b()}) {
            if (!app_state_->is_running()) {
                return;
            }
            if (engine_->history_size(pair.asset, venue) >= required) {
                continue;
            }
            LOG_INFO("Initializing price history for %s on %s", pair.asset.c_str(), venue.c_str());
            for (int i = 0; i < config.warmup_samples; ++i) {
                if (!engine_->sample_price(pair.asset, venue)) {
                    LOG_WARNING("Warm-up sample %d for %s on %s unavailable", i + 1, pair.asset.c_str(), venue.c_str());
                }
                if (i + 1 < config.warmup_samples && !app_state_->wait_for(interval)) {
                    return;
                }
            }
        }
    }
}

CycleResult HedgeRunner::run_once() {
    CycleResult result = engine_->run_cycle(pairs_);

    if (!balance_store_->save(result.snapshot)) {
        LOG_ERROR("Failed to persist ledger snapshot");
    }

    // Held assets outside the tracked pairs still count towards the portfolio.
    for (const auto& entry : result.snapshot.entries) {
        if (entry.account == CASH_ACCOUNT || entry.amount == 0.0 || result.quotes.count(entry.account)) {
            continue;
        }
        result.quotes[entry.account] = engine_->quote(entry.account);
    }

    size_t executed = std::count_if(result.outcomes.begin(), result.outcomes.end(),
                                    [](const AssetOutcome& o) { return o.state == HedgeState::EXECUTED; });
    LOG_INFO("Cycle complete: %zu of %zu assets hedged, %zu trade legs", executed, result.outcomes.size(), result.trades.size());
    LOG_INFO("Total Portfolio Value in USD: %.2f", portfolio_value(result));
    return result;
}

size_t HedgeRunner::run() {
    const auto interval = std::chrono::milliseconds(engine_->config().cycle_interval_ms);
    size_t cycles = 0;

    LOG_INFO("Starting hedge loop over %zu pairs", pairs_.size());
    while (app_state_->is_running()) {
        try {
            run_once();
            ++cycles;
        } catch (const InvalidAmountError& e) {
            LOG_CRITICAL("Ledger contract violation, stopping: %s", e.what());
            throw;
        } catch (const std::exception& e) {
            LOG_ERROR("Error in hedge cycle: %s", e.what());
        }

        if (!app_state_->wait_for(interval)) {
            break;
        }
    }
    LOG_INFO("Hedge loop stopped after %zu cycles", cycles);
    return cycles;
}

// Cash plus holdings valued at the best venue price seen this cycle; assets
// no venue could price are left out.
double HedgeRunner::portfolio_value(const CycleResult& result) {
    double total = 0.0;
    for (const auto& entry : result.snapshot.entries) {
        if (entry.account == CASH_ACCOUNT) {
            total += entry.amount;
            continue;
        }
        if (entry.amount == 0.0) {
            continue;
        }
        auto it = result.quotes.find(entry.account);
        if (it == result.quotes.end() || (!it->second.price_a && !it->second.price_b)) {
            LOG_DEBUG("No price for %s this cycle, excluded from portfolio value", entry.account.c_str());
            continue;
        }
        double best = std::max(it->second.price_a.value_or(0.0), it->second.price_b.value_or(0.0));
        total += entry.amount * best;
    }
    return total;
}

} // namespace xvh

#pragma once

#include <chrono>
#include <map>
#include <vector>
#include "types.hpp"
#include "app_state.hpp"
#include "hedge_engine.hpp"
#include "../data/storage.hpp"

namespace xvh {

// Drives the engine: one cycle, persist the ledger, wait, repeat. A stop
// request is honoured between cycles only.
class HedgeRunner {
public:
    HedgeRunner(HedgeEngine* engine, BalanceStore* balance_store, AppState* app_state,
                std::vector<TrackedPair> pairs);

    // Seeds each (asset, venue) history that is too short for a volatility estimate.
    void warm_up();
    CycleResult run_once();
    size_t run();

    static double portfolio_value(const CycleResult& result);

private:
    HedgeEngine* engine_;
    BalanceStore* balance_store_;
    AppState* app_state_;
    std::vector<TrackedPair> pairs_;
};

} // namespace xvh

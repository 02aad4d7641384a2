#include "types.hpp"
#include "exceptions.hpp"

namespace xvh {

double LedgerSnapshot::cash(const std::string& venue) const {
    return holding(venue, CASH_ACCOUNT);
}

double LedgerSnapshot::holding(const std::string& venue, const std::string& asset) const {
    for (const auto& entry : entries) {
        if (entry.venue == venue && entry.account == asset) {
            return entry.amount;
        }
    }
    return 0.0;
}

const AssetOutcome* CycleResult::find_outcome(const std::string& asset) const {
    for (const auto& outcome : outcomes) {
        if (outcome.asset == asset) {
            return &outcome;
        }
    }
    return nullptr;
}

std::string to_string(TradeType type) {
    return type == TradeType::BUY ? "buy" : "sell";
}

std::string to_string(HedgeState state) {
    switch (state) {
        case HedgeState::PRICED: return "PRICED";
        case HedgeState::SIZED: return "SIZED";
        case HedgeState::SKIPPED: return "SKIPPED";
        case HedgeState::EXECUTED: return "EXECUTED";
    }
    return "UNKNOWN";
}

TradeType trade_type_from_string(const std::string& value) {
    if (value == "buy") {
        return TradeType::BUY;
    }
    if (value == "sell") {
        return TradeType::SELL;
    }
    throw ValidationError("unknown trade type '" + value + "'");
}

long long to_micros(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::microseconds>(ts.time_since_epoch()).count();
}

Timestamp from_micros(long long micros) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::microseconds(micros)));
}

} // namespace xvh

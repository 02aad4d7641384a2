#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace xvh {

using Timestamp = std::chrono::system_clock::time_point;

// Account key used for the USD cash line of a venue in ledger snapshots.
inline const std::string CASH_ACCOUNT = "CASH";

enum class TradeType {
    BUY,
    SELL
};

enum class HedgeState {
    PRICED,
    SIZED,
    SKIPPED,
    EXECUTED
};

struct TrackedPair {
    std::string asset;
    std::string quote_currency = "USD";
};

struct PriceSample {
    Timestamp timestamp;
    double price;
};

struct LedgerEntry {
    std::string venue;
    std::string account; // CASH_ACCOUNT or an asset symbol
    double amount;
};

struct LedgerSnapshot {
    std::vector<LedgerEntry> entries;

    double cash(const std::string& venue) const;
    double holding(const std::string& venue, const std::string& asset) const;
};

struct TradeRecord {
    Timestamp timestamp;
    std::string asset;
    TradeType type;
    double amount;   // positive = bought, negative = sold
    double price;
    std::string venue;
    double notional; // |amount| * price
    double fee;
};

struct VenueQuotes {
    std::optional<double> price_a;
    std::optional<double> price_b;
};

struct AssetOutcome {
    std::string asset;
    HedgeState state = HedgeState::PRICED;
    std::string reason;
    double volatility = 0.0;
    double notional = 0.0;
    std::string funding_venue;
    std::string counter_venue;
};

struct CycleResult {
    LedgerSnapshot snapshot;
    std::vector<TradeRecord> trades;
    std::vector<AssetOutcome> outcomes;
    std::map<std::string, VenueQuotes> quotes; // tracked pairs, plus held assets priced for valuation

    const AssetOutcome* find_outcome(const std::string& asset) const;
};

std::string to_string(TradeType type);
std::string to_string(HedgeState state);
TradeType trade_type_from_string(const std::string& value);

long long to_micros(Timestamp ts);
Timestamp from_micros(long long micros);

} // namespace xvh

#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "types.hpp"

namespace xvh {

// Per-venue USD cash and asset holdings. The venue set is fixed at
// construction; amounts never go negative.
class HedgeLedger {
public:
    explicit HedgeLedger(const std::vector<std::string>& venues);
    HedgeLedger(const std::vector<std::string>& venues, const LedgerSnapshot& snapshot);

    void debit_cash(const std::string& venue, double amount);
    void credit_cash(const std::string& venue, double amount);
    void adjust_holding(const std::string& venue, const std::string& asset, double delta);

    double cash(const std::string& venue) const;
    double holding(const std::string& venue, const std::string& asset) const;
    std::vector<std::string> venues() const;
    bool has_venue(const std::string& venue) const;

    LedgerSnapshot snapshot() const;
    void restore(const LedgerSnapshot& snapshot);

private:
    struct VenueAccount {
        double cash_usd = 0.0;
        std::map<std::string, double> holdings;
    };

    VenueAccount& account(const std::string& venue);
    const VenueAccount& account(const std::string& venue) const;
    void load_locked(const LedgerSnapshot& snapshot);

    mutable std::mutex mutex_;
    std::map<std::string, VenueAccount> accounts_;
};

} // namespace xvh

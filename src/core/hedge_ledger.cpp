#include "hedge_ledger.hpp"
#include <cmath>
#include "exceptions.hpp"
#include "../utils/logger.hpp"

namespace xvh {

namespace {

void require_amount(double amount, const char* operation) {
    if (!std::isfinite(amount) || amount < 0.0) {
        throw InvalidAmountError(std::string(operation) + " called with " + std::to_string(amount));
    }
}

} // namespace

HedgeLedger::HedgeLedger(const std::vector<std::string>& venues) {
    if (venues.empty()) {
        throw InvalidAmountError("ledger needs at least one venue");
    }
    for (const auto& venue : venues) {
        accounts_[venue];
    }
}

HedgeLedger::HedgeLedger(const std::vector<std::string>& venues, const LedgerSnapshot& snapshot)
    : HedgeLedger(venues) {
    load_locked(snapshot);
}

void HedgeLedger::debit_cash(const std::string& venue, double amount) {
    require_amount(amount, "debit_cash");
    std::lock_guard<std::mutex> lock(mutex_);
    auto& acct = account(venue);
    if (amount > acct.cash_usd) {
        throw InsufficientFundsError(venue + " has " + std::to_string(acct.cash_usd) +
                                     " USD, needs " + std::to_string(amount));
    }
    acct.cash_usd -= amount;
}

void HedgeLedger::credit_cash(const std::string& venue, double amount) {
    require_amount(amount, "credit_cash");
    std::lock_guard<std::mutex> lock(mutex_);
    account(venue).cash_usd += amount;
}

void HedgeLedger::adjust_holding(const std::string& venue, const std::string& asset, double delta) {
    if (!std::isfinite(delta)) {
        throw InvalidAmountError("adjust_holding called with " + std::to_string(delta));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto& acct = account(venue);
    auto it = acct.holdings.find(asset);
    double current = it == acct.holdings.end() ? 0.0 : it->second;
    double updated = current + delta;
    if (updated < 0.0) {
        throw InsufficientHoldingError(venue + " holds " + std::to_string(current) + " " + asset +
                                       ", cannot apply " + std::to_string(delta));
    }
    acct.holdings[asset] = updated;
}

double HedgeLedger::cash(const std::string& venue) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return account(venue).cash_usd;
}

double HedgeLedger::holding(const std::string& venue, const std::string& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& holdings = account(venue).holdings;
    auto it = holdings.find(asset);
    return it == holdings.end() ? 0.0 : it->second;
}

std::vector<std::string> HedgeLedger::venues() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [venue, acct] : accounts_) {
        names.push_back(venue);
    }
    return names;
}

bool HedgeLedger::has_venue(const std::string& venue) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accounts_.count(venue) > 0;
}

LedgerSnapshot HedgeLedger::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    LedgerSnapshot snap;
    for (const auto& [venue, acct] : accounts_) {
        snap.entries.push_back(LedgerEntry{venue, CASH_ACCOUNT, acct.cash_usd});
        for (const auto& [asset, amount] : acct.holdings) {
            snap.entries.push_back(LedgerEntry{venue, asset, amount});
        }
    }
    return snap;
}

void HedgeLedger::restore(const LedgerSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    load_locked(snapshot);
}

HedgeLedger::VenueAccount& HedgeLedger::account(const std::string& venue) {
    auto it = accounts_.find(venue);
    if (it == accounts_.end()) {
        throw InvalidAmountError("unknown venue '" + venue + "'");
    }
    return it->second;
}

const HedgeLedger::VenueAccount& HedgeLedger::account(const std::string& venue) const {
    auto it = accounts_.find(venue);
    if (it == accounts_.end()) {
        throw InvalidAmountError("unknown venue '" + venue + "'");
    }
    return it->second;
}

// Validates the whole snapshot before touching state so a bad snapshot leaves
// the ledger unchanged.
void HedgeLedger::load_locked(const LedgerSnapshot& snapshot) {
    std::map<std::string, VenueAccount> loaded;
    for (const auto& [venue, acct] : accounts_) {
        loaded[venue];
    }
    for (const auto& entry : snapshot.entries) {
        auto it = loaded.find(entry.venue);
        if (it == loaded.end()) {
            throw InvalidAmountError("snapshot references unknown venue '" + entry.venue + "'");
        }
        require_amount(entry.amount, "snapshot entry");
        if (entry.account == CASH_ACCOUNT) {
            it->second.cash_usd = entry.amount;
        } else {
            it->second.holdings[entry.account] = entry.amount;
        }
    }
    accounts_ = std::move(loaded);
    LOG_DEBUG("Ledger loaded with %zu entries", snapshot.entries.size());
}

} // namespace xvh

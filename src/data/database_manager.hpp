#pragma once

#include <string>
#include <vector>
#include "storage.hpp"
#include "../core/types.hpp"

struct sqlite3;

namespace xvh {

// Ledger contents written on first load when nothing has been persisted yet.
struct BalanceDefaults {
    std::vector<std::string> venues;
    std::vector<double> starting_cash; // parallel to venues
    std::vector<std::string> assets;

    LedgerSnapshot to_snapshot() const;
};

// SQLite-backed price history, ledger snapshots and trade log.
class DatabaseManager : public HistoryStore, public BalanceStore, public TradeLog {
public:
    // busy_timeout_ms bounds how long a write waits on another connection's lock.
    DatabaseManager(const std::string& db_path, BalanceDefaults defaults, int busy_timeout_ms = 5000);
    ~DatabaseManager() override;

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool Open();
    void Close();
    bool IsOpen() const { return db_ != nullptr; }

    bool append_sample(const std::string& asset, const std::string& venue, const PriceSample& sample) override;
    std::vector<PriceSample> load_samples(const std::string& asset, const std::string& venue, int limit) override;

    LedgerSnapshot load() override;
    bool save(const LedgerSnapshot& snapshot) override;

    bool append_trade(const TradeRecord& record) override;
    std::vector<TradeRecord> GetTradeHistory(const std::string& asset, int limit = 100);

private:
    bool exec(const char* sql);
    void rollback();

    std::string db_path_;
    BalanceDefaults defaults_;
    int busy_timeout_ms_;
    sqlite3* db_;
};

} // namespace xvh

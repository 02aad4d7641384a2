#include "database_manager.hpp"
#include "../core/exceptions.hpp"
#include "../utils/logger.hpp"
#include <sqlite3.h>
#include <algorithm>

namespace xvh {

LedgerSnapshot BalanceDefaults::to_snapshot() const {
    LedgerSnapshot snapshot;
    for (size_t i = 0; i < venues.size(); ++i) {
        double cash = i < starting_cash.size() ? starting_cash[i] : 0.0;
        snapshot.entries.push_back(LedgerEntry{venues[i], CASH_ACCOUNT, cash});
        for (const auto& asset : assets) {
            snapshot.entries.push_back(LedgerEntry{venues[i], asset, 0.0});
        }
    }
    return snapshot;
}

DatabaseManager::DatabaseManager(const std::string& db_path, BalanceDefaults defaults, int busy_timeout_ms)
    : db_path_(db_path), defaults_(std::move(defaults)), busy_timeout_ms_(busy_timeout_ms), db_(nullptr) {}

DatabaseManager::~DatabaseManager() {
    Close();
}

bool DatabaseManager::Open() {
    if (db_) {
        return true;
    }
    if (sqlite3_open(db_path_.c_str(), &db_) != SQLITE_OK) {
        LOG_ERROR("Can't open database %s: %s", db_path_.c_str(), db_ ? sqlite3_errmsg(db_) : "out of memory");
        Close();
        return false;
    }
    LOG_INFO("Opened database %s", db_path_.c_str());
    sqlite3_busy_timeout(db_, busy_timeout_ms_);

    const char* schema =
        "CREATE TABLE IF NOT EXISTS price_history("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "asset TEXT NOT NULL,"
        "venue TEXT NOT NULL,"
        "timestamp_us INTEGER NOT NULL,"
        "price REAL NOT NULL);"
        "CREATE INDEX IF NOT EXISTS idx_price_history_key ON price_history(asset, venue, id);"
        "CREATE TABLE IF NOT EXISTS balances("
        "venue TEXT NOT NULL,"
        "account TEXT NOT NULL,"
        "amount REAL NOT NULL,"
        "PRIMARY KEY(venue, account));"
        "CREATE TABLE IF NOT EXISTS trades("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "timestamp_us INTEGER NOT NULL,"
        "asset TEXT NOT NULL,"
        "trade_type TEXT NOT NULL,"
        "amount REAL NOT NULL,"
        "price REAL NOT NULL,"
        "notional REAL NOT NULL,"
        "fee REAL NOT NULL,"
        "venue TEXT NOT NULL);";
    if (!exec(schema)) {
        Close();
        return false;
    }
    return true;
}

void DatabaseManager::Close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool DatabaseManager::exec(const char* sql) {
    char* zErrMsg = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &zErrMsg) != SQLITE_OK) {
        LOG_ERROR("SQL error: %s", zErrMsg ? zErrMsg : "unknown");
        sqlite3_free(zErrMsg);
        return false;
    }
    return true;
}

void DatabaseManager::rollback() {
    // SQLite may already have rolled back on its own.
    if (sqlite3_get_autocommit(db_)) {
        return;
    }
    if (!exec("ROLLBACK;")) {
        LOG_ERROR("Rollback failed on %s", db_path_.c_str());
    }
}

bool DatabaseManager::append_sample(const std::string& asset, const std::string& venue, const PriceSample& sample) {
    if (!db_) return false;

    const char* sql = "INSERT INTO price_history (asset,venue,timestamp_us,price) VALUES (?,?,?,?);";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("Failed to prepare statement: %s", sqlite3_errmsg(db_));
        return false;
    }

    sqlite3_bind_text(stmt, 1, asset.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, venue.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, to_micros(sample.timestamp));
    sqlite3_bind_double(stmt, 4, sample.price);

    bool ok = sqlite3_step(stmt) == SQLITE_DONE;
    if (!ok) {
        LOG_ERROR("Failed to store price sample: %s", sqlite3_errmsg(db_));
    }
    sqlite3_finalize(stmt);
    return ok;
}

std::vector<PriceSample> DatabaseManager::load_samples(const std::string& asset, const std::string& venue, int limit) {
    std::vector<PriceSample> samples;
    if (!db_) return samples;

    const char* sql = "SELECT timestamp_us, price FROM price_history WHERE asset = ? AND venue = ? "
                      "ORDER BY id DESC LIMIT ?;";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("Failed to prepare statement: %s", sqlite3_errmsg(db_));
        return samples;
    }

    sqlite3_bind_text(stmt, 1, asset.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, venue.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 3, limit);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        samples.push_back(PriceSample{from_micros(sqlite3_column_int64(stmt, 0)), sqlite3_column_double(stmt, 1)});
    }
    sqlite3_finalize(stmt);

    std::reverse(samples.begin(), samples.end());
    return samples;
}

LedgerSnapshot DatabaseManager::load() {
    if (!db_) {
        throw DatabaseError("database " + db_path_ + " is not open");
    }

    const char* sql = "SELECT venue, account, amount FROM balances ORDER BY venue, account;";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw DatabaseError(std::string("failed to read balances: ") + sqlite3_errmsg(db_));
    }

    LedgerSnapshot snapshot;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        LedgerEntry entry;
        entry.venue = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        entry.account = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        entry.amount = sqlite3_column_double(stmt, 2);
        snapshot.entries.push_back(entry);
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw DatabaseError(std::string("failed to read balances: ") + sqlite3_errmsg(db_));
    }

    if (snapshot.entries.empty()) {
        LOG_INFO("No stored balances, starting from defaults");
        snapshot = defaults_.to_snapshot();
        if (!save(snapshot)) {
            LOG_WARNING("Default balances could not be written to %s", db_path_.c_str());
        }
    }
    return snapshot;
}

bool DatabaseManager::save(const LedgerSnapshot& snapshot) {
    if (!db_) return false;

    if (!exec("BEGIN TRANSACTION;")) {
        return false;
    }
    if (!exec("DELETE FROM balances;")) {
        rollback();
        return false;
    }

    const char* sql = "INSERT INTO balances (venue,account,amount) VALUES (?,?,?);";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("Failed to prepare statement: %s", sqlite3_errmsg(db_));
        rollback();
        return false;
    }

    for (const auto& entry : snapshot.entries) {
        sqlite3_reset(stmt);
        sqlite3_bind_text(stmt, 1, entry.venue.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, entry.account.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(stmt, 3, entry.amount);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            LOG_ERROR("Failed to store balance %s/%s: %s", entry.venue.c_str(), entry.account.c_str(), sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            rollback();
            return false;
        }
    }
    sqlite3_finalize(stmt);
    if (!exec("COMMIT;")) {
        rollback();
        return false;
    }
    return true;
}

bool DatabaseManager::append_trade(const TradeRecord& record) {
    if (!db_) return false;

    const char* sql = "INSERT INTO trades (timestamp_us,asset,trade_type,amount,price,notional,fee,venue) "
                      "VALUES (?,?,?,?,?,?,?,?);";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("Failed to prepare statement: %s", sqlite3_errmsg(db_));
        return false;
    }

    std::string type = to_string(record.type);
    sqlite3_bind_int64(stmt, 1, to_micros(record.timestamp));
    sqlite3_bind_text(stmt, 2, record.asset.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, type.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 4, record.amount);
    sqlite3_bind_double(stmt, 5, record.price);
    sqlite3_bind_double(stmt, 6, record.notional);
    sqlite3_bind_double(stmt, 7, record.fee);
    sqlite3_bind_text(stmt, 8, record.venue.c_str(), -1, SQLITE_TRANSIENT);

    bool ok = sqlite3_step(stmt) == SQLITE_DONE;
    if (!ok) {
        LOG_ERROR("Failed to store trade: %s", sqlite3_errmsg(db_));
    }
    sqlite3_finalize(stmt);
    return ok;
}

std::vector<TradeRecord> DatabaseManager::GetTradeHistory(const std::string& asset, int limit) {
    std::vector<TradeRecord> trades;
    if (!db_) return trades;

    const char* sql = "SELECT timestamp_us,asset,trade_type,amount,price,notional,fee,venue FROM trades "
                      "WHERE asset = ? ORDER BY id DESC LIMIT ?;";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("Failed to prepare statement: %s", sqlite3_errmsg(db_));
        return trades;
    }

    sqlite3_bind_text(stmt, 1, asset.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, limit);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        TradeRecord trade;
        trade.timestamp = from_micros(sqlite3_column_int64(stmt, 0));
        trade.asset = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        std::string type = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
        try {
            trade.type = trade_type_from_string(type);
        } catch (const ValidationError& e) {
            LOG_WARNING("Skipping trade row: %s", e.what());
            continue;
        }
        trade.amount = sqlite3_column_double(stmt, 3);
        trade.price = sqlite3_column_double(stmt, 4);
        trade.notional = sqlite3_column_double(stmt, 5);
        trade.fee = sqlite3_column_double(stmt, 6);
        trade.venue = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 7));
        trades.push_back(trade);
    }

    sqlite3_finalize(stmt);
    return trades;
}

} // namespace xvh

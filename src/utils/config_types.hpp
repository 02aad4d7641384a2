#pragma once

#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>

namespace xvh {

struct AppConfig {
    std::string name = "xvhedge";
    std::string version = "1.0.0";
    std::string log_level = "INFO";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(AppConfig, name, version, log_level)

struct VenueConfig {
    std::string name;
    bool enabled = true;
    std::string base_url;
    long timeout_ms = 5000;
    double starting_cash = 2000.0;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(VenueConfig, enabled, base_url, timeout_ms, starting_cash)

struct TradingConfig {
    std::vector<std::string> pairs{"XTZ", "BONK", "DOT"};
    std::string quote_currency = "USD";
    std::vector<std::string> default_assets{"XTZ", "BTC", "LTC", "BONK", "DOT", "ADA"};
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(TradingConfig, pairs, quote_currency, default_assets)

struct HedgeConfig {
    std::string venue_a = "mexc";
    std::string venue_b = "coinbase";
    double taker_fee_rate = 0.001;
    double min_trade_usd = 5.0;
    double trade_size_factor = 500000.0;
    int volatility_period = 14;
    int history_capacity = 1024;
    int cycle_interval_ms = 15000;
    int warmup_samples = 15;
    int warmup_interval_ms = 1000;
    bool concurrent_fetch = true;
    int fetch_threads = 4;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(HedgeConfig, venue_a, venue_b, taker_fee_rate, min_trade_usd, trade_size_factor, volatility_period, history_capacity, cycle_interval_ms, warmup_samples, warmup_interval_ms, concurrent_fetch, fetch_threads)

struct DatabaseConfig {
    std::string path = "data/xvhedge.db";
    int history_load_limit = 1024;
    int busy_timeout_ms = 5000;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(DatabaseConfig, path, history_load_limit, busy_timeout_ms)

struct LoggingConfig {
    std::string file_path = "logs/xvhedge.log";
    bool console_output = true;
    bool file_output = false;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(LoggingConfig, file_path, console_output, file_output)

} // namespace xvh

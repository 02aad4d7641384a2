#pragma once

#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>
#include "config_types.hpp"

namespace xvh {

struct TrackedPair;

class ConfigManager {
public:
    bool load(const std::string& file_path);
    bool load_from_string(const std::string& content);

    AppConfig& get_app_config();
    std::map<std::string, VenueConfig>& get_venue_configs();
    TradingConfig& get_trading_config();
    HedgeConfig& get_hedge_config();
    DatabaseConfig& get_database_config();
    LoggingConfig& get_logging_config();

    std::vector<TrackedPair> get_tracked_pairs() const;

private:
    bool parse(const nlohmann::json& config_data);

    AppConfig app_config_;
    std::map<std::string, VenueConfig> venue_configs_;
    TradingConfig trading_config_;
    HedgeConfig hedge_config_;
    DatabaseConfig database_config_;
    LoggingConfig logging_config_;
};

} // namespace xvh

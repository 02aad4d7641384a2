#include "config_manager.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include "logger.hpp"
#include "../core/types.hpp"

namespace xvh {

bool ConfigManager::load(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        Logger::error("Failed to open config file: " + file_path);
        return false;
    }
    try {
        nlohmann::json config_data;
        file >> config_data;
        return parse(config_data);
    } catch (const nlohmann::json::exception& e) {
        Logger::error("Error parsing config file " + file_path + ": " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::load_from_string(const std::string& content) {
    try {
        return parse(nlohmann::json::parse(content));
    } catch (const nlohmann::json::exception& e) {
        Logger::error("Error parsing config: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::parse(const nlohmann::json& config_data) {
    try {
        if (config_data.contains("app")) {
            config_data["app"].get_to(app_config_);
        }
        if (config_data.contains("venues")) {
            venue_configs_.clear();
            for (auto& [name, config] : config_data["venues"].items()) {
                VenueConfig venue_cfg = config.get<VenueConfig>();
                venue_cfg.name = name;
                venue_configs_[name] = venue_cfg;
            }
        }
        if (config_data.contains("trading")) {
            config_data["trading"].get_to(trading_config_);
        }
        if (config_data.contains("hedge")) {
            config_data["hedge"].get_to(hedge_config_);
        }
        if (config_data.contains("database")) {
            config_data["database"].get_to(database_config_);
        }
        if (config_data.contains("logging")) {
            config_data["logging"].get_to(logging_config_);
        }
    } catch (const nlohmann::json::exception& e) {
        Logger::error("Error parsing config: " + std::string(e.what()));
        return false;
    }
    return true;
}

AppConfig& ConfigManager::get_app_config() {
    return app_config_;
}

std::map<std::string, VenueConfig>& ConfigManager::get_venue_configs() {
    return venue_configs_;
}

TradingConfig& ConfigManager::get_trading_config() {
    return trading_config_;
}

HedgeConfig& ConfigManager::get_hedge_config() {
    return hedge_config_;
}

DatabaseConfig& ConfigManager::get_database_config() {
    return database_config_;
}

LoggingConfig& ConfigManager::get_logging_config() {
    return logging_config_;
}

std::vector<TrackedPair> ConfigManager::get_tracked_pairs() const {
    std::vector<TrackedPair> pairs;
    for (const auto& asset : trading_config_.pairs) {
        pairs.push_back(TrackedPair{asset, trading_config_.quote_currency});
    }
    return pairs;
}

} // namespace xvh

#include "config_validator.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include "logger.hpp"

namespace xvh {

namespace {

bool is_asset_symbol(const std::string& asset) {
    if (asset.empty() || asset.size() > 16) {
        return false;
    }
    return std::all_of(asset.begin(), asset.end(), [](unsigned char c) {
        return std::isupper(c) || std::isdigit(c);
    });
}

} // namespace

ConfigValidator::ValidationResult ConfigValidator::validate(ConfigManager& config) {
    issues_.clear();

    validate_venues(config);
    validate_trading(config.get_trading_config());
    validate_hedge(config.get_hedge_config());
    validate_database(config.get_database_config());
    validate_logging(config.get_logging_config());

    if (!issues_.empty()) {
        for (const auto& issue : issues_) {
            LOG_ERROR("Invalid configuration %s: %s", issue.field.c_str(), issue.message.c_str());
        }
        const auto& first = issues_.front();
        return ValidationResult::error(ErrorCode::INVALID_CONFIG, first.field + ": " + first.message);
    }
    return ValidationResult::success(true);
}

void ConfigValidator::validate_venues(ConfigManager& config) {
    const auto& hedge = config.get_hedge_config();
    const auto& venues = config.get_venue_configs();

    if (hedge.venue_a == hedge.venue_b) {
        add_issue("hedge.venue_b", "must differ from hedge.venue_a");
    }
    for (const auto& name : {hedge.venue_a, hedge.venue_b}) {
        auto it = venues.find(name);
        if (it == venues.end()) {
            add_issue("venues." + name, "venue is not configured");
            continue;
        }
        const auto& venue = it->second;
        if (!venue.enabled) {
            add_issue("venues." + name + ".enabled", "hedge venue must be enabled");
        }
        if (venue.base_url.rfind("http://", 0) != 0 && venue.base_url.rfind("https://", 0) != 0) {
            add_issue("venues." + name + ".base_url", "must be an http(s) URL");
        }
        if (venue.timeout_ms <= 0) {
            add_issue("venues." + name + ".timeout_ms", "must be positive");
        }
        if (venue.starting_cash < 0.0) {
            add_issue("venues." + name + ".starting_cash", "must not be negative");
        }
    }
}

void ConfigValidator::validate_trading(const TradingConfig& trading) {
    if (trading.pairs.empty()) {
        add_issue("trading.pairs", "at least one pair is required");
    }
    std::set<std::string> seen;
    for (const auto& asset : trading.pairs) {
        if (!is_asset_symbol(asset)) {
            add_issue("trading.pairs", "invalid asset symbol '" + asset + "'");
        }
        if (!seen.insert(asset).second) {
            add_issue("trading.pairs", "duplicate pair '" + asset + "'");
        }
    }
    for (const auto& asset : trading.default_assets) {
        if (!is_asset_symbol(asset)) {
            add_issue("trading.default_assets", "invalid asset symbol '" + asset + "'");
        }
    }
    if (trading.quote_currency != "USD") {
        add_issue("trading.quote_currency", "only USD is supported");
    }
}

void ConfigValidator::validate_hedge(const HedgeConfig& hedge) {
    if (hedge.taker_fee_rate < 0.0 || hedge.taker_fee_rate >= 1.0) {
        add_issue("hedge.taker_fee_rate", "must be in [0, 1)");
    }
    if (hedge.min_trade_usd <= 0.0) {
        add_issue("hedge.min_trade_usd", "must be positive");
    }
    if (hedge.trade_size_factor <= 0.0) {
        add_issue("hedge.trade_size_factor", "must be positive");
    }
    if (hedge.volatility_period < 1) {
        add_issue("hedge.volatility_period", "must be at least 1");
    }
    if (hedge.history_capacity < 0 ||
        (hedge.history_capacity > 0 && hedge.history_capacity < hedge.volatility_period + 1)) {
        add_issue("hedge.history_capacity", "must be 0 (unbounded) or at least volatility_period + 1");
    }
    if (hedge.cycle_interval_ms < 0) {
        add_issue("hedge.cycle_interval_ms", "must not be negative");
    }
    if (hedge.warmup_samples < 0 || hedge.warmup_interval_ms < 0) {
        add_issue("hedge.warmup_samples", "warm-up settings must not be negative");
    }
    if (hedge.concurrent_fetch && hedge.fetch_threads < 1) {
        add_issue("hedge.fetch_threads", "must be at least 1 when concurrent_fetch is enabled");
    }
}

void ConfigValidator::validate_database(const DatabaseConfig& database) {
    if (database.path.empty()) {
        add_issue("database.path", "must not be empty");
    }
    if (database.history_load_limit < 0) {
        add_issue("database.history_load_limit", "must not be negative");
    }
    if (database.busy_timeout_ms < 0) {
        add_issue("database.busy_timeout_ms", "must not be negative");
    }
}

void ConfigValidator::validate_logging(const LoggingConfig& logging) {
    if (logging.file_output && logging.file_path.empty()) {
        add_issue("logging.file_path", "required when file_output is enabled");
    }
}

void ConfigValidator::add_issue(const std::string& field, const std::string& message) {
    issues_.push_back(ValidationIssue{field, message});
}

} // namespace xvh

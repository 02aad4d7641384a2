#include <iostream>
#include <map>
#include <string>
#include <memory>
#include <vector>
#include <csignal>

#include "utils/config_manager.hpp"
#include "utils/config_validator.hpp"
#include "utils/logger.hpp"
#include "utils/thread_pool.hpp"
#include "core/app_state.hpp"
#include "core/exceptions.hpp"
#include "core/hedge_engine.hpp"
#include "core/hedge_ledger.hpp"
#include "core/hedge_runner.hpp"
#include "core/price_history_buffer.hpp"
#include "data/database_manager.hpp"
#include "exchange/exchange_factory.hpp"
#include "exchange/venue_price_feed.hpp"
#include "network/rest_client.hpp"

// Global application state
xvh::AppState app_state;

// Signal handler for graceful shutdown
void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        app_state.shutdown();
    }
}

namespace {

void rehydrate_history(xvh::DatabaseManager& db, xvh::PriceHistoryBuffer& history,
                       const std::vector<xvh::TrackedPair>& pairs, const xvh::HedgeConfig& hedge, int limit) {
    for (const auto& pair : pairs) {
        for (const auto& venue : {hedge.venue_a, hedge.venue_b}) {
            size_t loaded = 0;
            for (const auto& sample : db.load_samples(pair.asset, venue, limit)) {
                try {
                    history.append(pair.asset, venue, sample);
                    ++loaded;
                } catch (const xvh::XvhException& e) {
                    LOG_WARNING("Skipping stored sample for %s on %s: %s", pair.asset.c_str(), venue.c_str(), e.what());
                }
            }
            LOG_INFO("Loaded %zu price samples for %s on %s", loaded, pair.asset.c_str(), venue.c_str());
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::string config_path = argc > 1 ? argv[1] : "config/settings.json";

    xvh::ConfigManager config_manager;
    if (!config_manager.load(config_path)) {
        xvh::Logger::error("Failed to load configuration. Exiting.");
        return 1;
    }

    xvh::Logger::init(config_manager.get_logging_config(),
                      xvh::parse_log_level(config_manager.get_app_config().log_level));

    xvh::ConfigValidator validator;
    auto validation = validator.validate(config_manager);
    if (validation.is_error()) {
        xvh::Logger::error("Invalid configuration: " + validation.error().message);
        return 1;
    }
    xvh::Logger::info("Starting " + config_manager.get_app_config().name + " " + config_manager.get_app_config().version);

    const auto& hedge_config = config_manager.get_hedge_config();
    const auto& venue_configs = config_manager.get_venue_configs();
    const auto pairs = config_manager.get_tracked_pairs();
    const std::vector<std::string> venues{hedge_config.venue_a, hedge_config.venue_b};

    try {
        xvh::BalanceDefaults defaults;
        defaults.venues = venues;
        for (const auto& venue : venues) {
            defaults.starting_cash.push_back(venue_configs.at(venue).starting_cash);
        }
        defaults.assets = config_manager.get_trading_config().default_assets;

        const auto& database_config = config_manager.get_database_config();
        xvh::DatabaseManager db_manager(database_config.path, defaults, database_config.busy_timeout_ms);
        if (!db_manager.Open()) {
            xvh::Logger::error("Failed to open database. Exiting.");
            return 1;
        }

        xvh::PriceHistoryBuffer history(static_cast<size_t>(hedge_config.history_capacity));
        rehydrate_history(db_manager, history, pairs, hedge_config,
                          config_manager.get_database_config().history_load_limit);

        xvh::HedgeLedger ledger(venues, db_manager.load());

        xvh::CurlGlobalGuard curl_guard;
        xvh::RestClient rest_client;
        rest_client.SetUserAgent(config_manager.get_app_config().name + "/" + config_manager.get_app_config().version);

        std::map<std::string, xvh::VenueConfig> hedge_venues;
        for (const auto& venue : venues) {
            hedge_venues[venue] = venue_configs.at(venue);
        }
        xvh::VenuePriceFeed price_feed(xvh::ExchangeFactory::create_clients(hedge_venues, &rest_client));
        for (const auto& venue : venues) {
            if (!price_feed.has_venue(venue)) {
                throw xvh::ConfigurationError("no price client for hedge venue " + venue);
            }
        }

        std::unique_ptr<xvh::ThreadPool> fetch_pool;
        if (hedge_config.concurrent_fetch) {
            fetch_pool = std::make_unique<xvh::ThreadPool>(static_cast<size_t>(hedge_config.fetch_threads));
            LOG_INFO("Fetching prices on %zu threads", fetch_pool->thread_count());
        }

        xvh::HedgeEngine engine(hedge_config, &price_feed, &history, &ledger);
        engine.set_trade_log(&db_manager);
        engine.set_history_store(&db_manager);
        engine.set_thread_pool(fetch_pool.get());

        xvh::HedgeRunner runner(&engine, &db_manager, &app_state, pairs);
        runner.warm_up();
        runner.run();

        if (!db_manager.save(ledger.snapshot())) {
            xvh::Logger::error("Failed to persist final ledger snapshot");
        }
        LOG_INFO("HTTP requests: %lld total, %lld failed",
                 rest_client.GetTotalRequests(), rest_client.GetFailedRequests());
    } catch (const xvh::InvalidAmountError& e) {
        LOG_CRITICAL("Fatal ledger contract violation: %s", e.what());
        xvh::Logger::shutdown();
        return 1;
    } catch (const std::exception& e) {
        LOG_CRITICAL("Fatal error during startup: %s", e.what());
        std::cerr << "FATAL: " << e.what() << std::endl;
        xvh::Logger::shutdown();
        return 1;
    }

    xvh::Logger::info("Shutdown complete");
    xvh::Logger::shutdown();
    return 0;
}

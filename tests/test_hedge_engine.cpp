#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cmath>
#include "core/hedge_engine.hpp"
#include "core/exceptions.hpp"
#include "utils/logger.hpp"
#include "utils/thread_pool.hpp"
#include "mocks/mock_price_feed.hpp"
#include "mocks/mock_storage.hpp"

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class HedgeEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        xvh::LoggingConfig logging_config;
        logging_config.console_output = false;
        xvh::Logger::init(logging_config, xvh::LogLevel::DEBUG);

        config.venue_a = "mexc";
        config.venue_b = "coinbase";
        config.taker_fee_rate = 0.001;
        config.min_trade_usd = 1000.0;
        config.trade_size_factor = 500000.0;
        config.volatility_period = 14;
        config.history_capacity = 64;

        ON_CALL(feed, current_price(_, _)).WillByDefault(Return(std::nullopt));
        set_cash(2000.0, 2000.0);
    }

    void set_cash(double mexc, double coinbase) {
        xvh::LedgerSnapshot snapshot;
        snapshot.entries = {{"mexc", xvh::CASH_ACCOUNT, mexc}, {"coinbase", xvh::CASH_ACCOUNT, coinbase}};
        ledger.restore(snapshot);
    }

    void quote(const std::string& asset, std::optional<double> mexc, std::optional<double> coinbase) {
        ON_CALL(feed, current_price(asset, "mexc")).WillByDefault(Return(mexc));
        ON_CALL(feed, current_price(asset, "coinbase")).WillByDefault(Return(coinbase));
    }

    std::unique_ptr<xvh::HedgeEngine> make_engine() {
        auto engine = std::make_unique<xvh::HedgeEngine>(config, &feed, &history, &ledger);
        engine->set_clock([this] { return now; });
        return engine;
    }

    static xvh::Timestamp at(int seconds) {
        return xvh::Timestamp(std::chrono::seconds(1700000000 + seconds));
    }

    xvh::HedgeConfig config;
    NiceMock<xvh::testing::MockPriceFeed> feed;
    xvh::PriceHistoryBuffer history{64};
    xvh::HedgeLedger ledger{std::vector<std::string>{"mexc", "coinbase"}};
    xvh::Timestamp now = at(1000);
};

TEST_F(HedgeEngineTest, BuysCheapVenueAndSellsDearVenue) {
    quote("XTZ", 100.0, 110.0);
    auto engine = make_engine();

    auto result = engine->run_cycle({{"XTZ"}});

    EXPECT_DOUBLE_EQ(ledger.cash("mexc"), 1001.0);
    EXPECT_DOUBLE_EQ(ledger.holding("mexc", "XTZ"), 10.0);
    EXPECT_DOUBLE_EQ(ledger.cash("coinbase"), 3100.0);
    EXPECT_DOUBLE_EQ(ledger.holding("coinbase", "XTZ"), 0.0);

    ASSERT_EQ(result.trades.size(), 2u);
    const auto& buy = result.trades[0];
    EXPECT_EQ(buy.type, xvh::TradeType::BUY);
    EXPECT_EQ(buy.venue, "mexc");
    EXPECT_EQ(buy.asset, "XTZ");
    EXPECT_DOUBLE_EQ(buy.amount, 10.0);
    EXPECT_DOUBLE_EQ(buy.price, 100.0);
    EXPECT_DOUBLE_EQ(buy.notional, 1000.0);
    EXPECT_DOUBLE_EQ(buy.fee, 1.0);

    const auto& sell = result.trades[1];
    EXPECT_EQ(sell.type, xvh::TradeType::SELL);
    EXPECT_EQ(sell.venue, "coinbase");
    EXPECT_DOUBLE_EQ(sell.amount, -10.0);
    EXPECT_DOUBLE_EQ(sell.price, 110.0);
    EXPECT_DOUBLE_EQ(sell.notional, 1100.0);
    EXPECT_DOUBLE_EQ(sell.fee, 0.0);

    const auto* outcome = result.find_outcome("XTZ");
    ASSERT_NE(outcome, nullptr);
    EXPECT_EQ(outcome->state, xvh::HedgeState::EXECUTED);
    EXPECT_EQ(outcome->funding_venue, "mexc");
    EXPECT_EQ(outcome->counter_venue, "coinbase");
    EXPECT_DOUBLE_EQ(result.snapshot.cash("mexc"), 1001.0);
}

TEST_F(HedgeEngineTest, FundsOnVenueBWhenItIsCheaper) {
    quote("DOT", 110.0, 100.0);
    auto engine = make_engine();

    auto result = engine->run_cycle({{"DOT"}});

    EXPECT_DOUBLE_EQ(ledger.cash("coinbase"), 1001.0);
    EXPECT_DOUBLE_EQ(ledger.holding("coinbase", "DOT"), 10.0);
    EXPECT_DOUBLE_EQ(ledger.cash("mexc"), 3100.0);
    EXPECT_DOUBLE_EQ(ledger.holding("mexc", "DOT"), 0.0);
    ASSERT_EQ(result.trades.size(), 2u);
    EXPECT_EQ(result.trades[0].venue, "coinbase");
    EXPECT_EQ(result.trades[1].venue, "mexc");
}

TEST_F(HedgeEngineTest, InsufficientHistoryFallsBackToZeroVolatility) {
    quote("XTZ", 100.0, 110.0);
    auto engine = make_engine();

    auto result = engine->run_cycle({{"XTZ"}});

    const auto* outcome = result.find_outcome("XTZ");
    ASSERT_NE(outcome, nullptr);
    EXPECT_DOUBLE_EQ(outcome->volatility, 0.0);
    EXPECT_EQ(outcome->notional, config.min_trade_usd);
    EXPECT_EQ(outcome->state, xvh::HedgeState::EXECUTED);
}

TEST_F(HedgeEngineTest, VolatilityFromVenueAHistorySizesTheTrade) {
    config.min_trade_usd = 5.0;
    set_cash(6000.0, 0.0);
    for (int i = 0; i < 14; ++i) {
        history.append("XTZ", "mexc", xvh::PriceSample{at(i), i % 2 == 0 ? 100.0 : 101.0});
        history.append("XTZ", "coinbase", xvh::PriceSample{at(i), i % 2 == 0 ? 50.0 : 150.0});
    }
    quote("XTZ", 100.0, 102.0);
    auto engine = make_engine();

    auto result = engine->run_cycle({{"XTZ"}});

    const auto* outcome = result.find_outcome("XTZ");
    ASSERT_NE(outcome, nullptr);
    EXPECT_DOUBLE_EQ(outcome->volatility, 1.0);
    EXPECT_DOUBLE_EQ(outcome->notional, 5000.0);
    EXPECT_EQ(outcome->state, xvh::HedgeState::EXECUTED);
    EXPECT_DOUBLE_EQ(ledger.cash("mexc"), 6000.0 - 4995.0);
    EXPECT_DOUBLE_EQ(ledger.holding("mexc", "XTZ"), 50.0);
    EXPECT_DOUBLE_EQ(ledger.cash("coinbase"), 5100.0);
}

TEST_F(HedgeEngineTest, UnavailablePriceSkipsOnlyThatAsset) {
    quote("XTZ", 100.0, 110.0);
    quote("DOT", 5.0, std::nullopt);
    quote("BONK", std::nullopt, 0.00002);
    auto engine = make_engine();

    auto result = engine->run_cycle({{"DOT"}, {"XTZ"}, {"BONK"}});

    ASSERT_EQ(result.outcomes.size(), 3u);
    EXPECT_EQ(result.find_outcome("DOT")->state, xvh::HedgeState::SKIPPED);
    EXPECT_EQ(result.find_outcome("BONK")->state, xvh::HedgeState::SKIPPED);
    EXPECT_EQ(result.find_outcome("XTZ")->state, xvh::HedgeState::EXECUTED);
    EXPECT_EQ(result.trades.size(), 2u);
    EXPECT_FALSE(result.quotes.at("DOT").price_b.has_value());
    EXPECT_DOUBLE_EQ(*result.quotes.at("DOT").price_a, 5.0);
    // The available side is still recorded.
    EXPECT_EQ(history.size("DOT", "mexc"), 1u);
    EXPECT_EQ(history.size("DOT", "coinbase"), 0u);
}

TEST_F(HedgeEngineTest, FeedExceptionIsIsolatedToItsAsset) {
    quote("XTZ", 100.0, 110.0);
    ON_CALL(feed, current_price("DOT", "mexc")).WillByDefault(Throw(std::runtime_error("connection reset")));
    ON_CALL(feed, current_price("DOT", "coinbase")).WillByDefault(Return(6.0));
    auto engine = make_engine();

    auto result = engine->run_cycle({{"DOT"}, {"XTZ"}});

    EXPECT_EQ(result.find_outcome("DOT")->state, xvh::HedgeState::SKIPPED);
    EXPECT_EQ(result.find_outcome("XTZ")->state, xvh::HedgeState::EXECUTED);
}

TEST_F(HedgeEngineTest, NonPositiveQuoteIsTreatedAsUnavailable) {
    quote("XTZ", 0.0, 110.0);
    auto engine = make_engine();

    auto result = engine->run_cycle({{"XTZ"}});

    EXPECT_EQ(result.find_outcome("XTZ")->state, xvh::HedgeState::SKIPPED);
    EXPECT_TRUE(result.trades.empty());
    EXPECT_EQ(history.size("XTZ", "mexc"), 0u);
}

TEST_F(HedgeEngineTest, FundingCashEqualToNotionalExecutes) {
    set_cash(1000.0, 0.0);
    quote("XTZ", 100.0, 110.0);
    auto engine = make_engine();

    auto result = engine->run_cycle({{"XTZ"}});

    EXPECT_EQ(result.find_outcome("XTZ")->state, xvh::HedgeState::EXECUTED);
    EXPECT_DOUBLE_EQ(ledger.cash("mexc"), 1.0);
    EXPECT_DOUBLE_EQ(ledger.cash("coinbase"), 1100.0);
}

TEST_F(HedgeEngineTest, ShortfallLeavesLedgerAndTradeLogUntouched) {
    set_cash(999.99, 5000.0);
    quote("XTZ", 100.0, 110.0);
    ::testing::StrictMock<xvh::testing::MockTradeLog> trade_log;
    auto engine = make_engine();
    engine->set_trade_log(&trade_log);

    auto before = ledger.snapshot();
    auto result = engine->run_cycle({{"XTZ"}});

    const auto* outcome = result.find_outcome("XTZ");
    EXPECT_EQ(outcome->state, xvh::HedgeState::SKIPPED);
    EXPECT_EQ(outcome->funding_venue, "mexc");
    EXPECT_TRUE(result.trades.empty());
    ASSERT_EQ(result.snapshot.entries.size(), before.entries.size());
    for (size_t i = 0; i < before.entries.size(); ++i) {
        EXPECT_EQ(result.snapshot.entries[i].amount, before.entries[i].amount);
    }
}

TEST_F(HedgeEngineTest, EqualPricesAreSkipped) {
    quote("XTZ", 100.0, 100.0);
    auto engine = make_engine();

    auto result = engine->run_cycle({{"XTZ"}});

    EXPECT_EQ(result.find_outcome("XTZ")->state, xvh::HedgeState::SKIPPED);
    EXPECT_TRUE(result.trades.empty());
    EXPECT_DOUBLE_EQ(ledger.cash("mexc"), 2000.0);
}

TEST_F(HedgeEngineTest, FeeChargedOnceOnFundingLeg) {
    config.taker_fee_rate = 0.0025;
    set_cash(10000.0, 10000.0);
    quote("XTZ", 100.0, 110.0);
    quote("DOT", 7.0, 6.5);
    auto engine = make_engine();

    auto before = ledger.snapshot();
    auto result = engine->run_cycle({{"XTZ"}, {"DOT"}});
    ASSERT_EQ(result.trades.size(), 4u);

    for (size_t i = 0; i < result.trades.size(); i += 2) {
        const auto& buy = result.trades[i];
        const auto& sell = result.trades[i + 1];
        EXPECT_EQ(buy.type, xvh::TradeType::BUY);
        EXPECT_DOUBLE_EQ(buy.fee + sell.fee, config.min_trade_usd * config.taker_fee_rate);
        EXPECT_EQ(sell.fee, 0.0);
        EXPECT_DOUBLE_EQ(buy.amount, -sell.amount);
    }

    // Cash deltas reconcile with the trade records.
    for (const auto& venue : {"mexc", "coinbase"}) {
        double expected = before.cash(venue);
        for (const auto& trade : result.trades) {
            if (trade.venue != venue) continue;
            expected += trade.type == xvh::TradeType::BUY ? -(trade.notional - trade.fee) : trade.notional;
        }
        EXPECT_NEAR(ledger.cash(venue), expected, 1e-9);
    }
}

TEST_F(HedgeEngineTest, PublishesTradesAndPersistsSamples) {
    quote("XTZ", 100.0, 110.0);
    NiceMock<xvh::testing::MockTradeLog> trade_log;
    NiceMock<xvh::testing::MockHistoryStore> history_store;
    EXPECT_CALL(trade_log, append_trade(_)).Times(2).WillRepeatedly(Return(true));
    EXPECT_CALL(history_store, append_sample("XTZ", "mexc", _)).WillOnce(Return(true));
    EXPECT_CALL(history_store, append_sample("XTZ", "coinbase", _)).WillOnce(Return(false));

    auto engine = make_engine();
    engine->set_trade_log(&trade_log);
    engine->set_history_store(&history_store);

    auto result = engine->run_cycle({{"XTZ"}});
    EXPECT_EQ(result.find_outcome("XTZ")->state, xvh::HedgeState::EXECUTED);
}

TEST_F(HedgeEngineTest, TradeLogFailureDoesNotUndoHedge) {
    quote("XTZ", 100.0, 110.0);
    NiceMock<xvh::testing::MockTradeLog> trade_log;
    ON_CALL(trade_log, append_trade(_)).WillByDefault(Throw(std::runtime_error("disk full")));
    auto engine = make_engine();
    engine->set_trade_log(&trade_log);

    auto result = engine->run_cycle({{"XTZ"}});

    EXPECT_EQ(result.trades.size(), 2u);
    EXPECT_DOUBLE_EQ(ledger.cash("mexc"), 1001.0);
}

TEST_F(HedgeEngineTest, ContractViolationIsFatalAndRollsBack) {
    config.taker_fee_rate = 1.5;
    quote("XTZ", 100.0, 110.0);
    auto engine = make_engine();

    EXPECT_THROW(engine->run_cycle({{"XTZ"}}), xvh::InvalidAmountError);
    EXPECT_DOUBLE_EQ(ledger.cash("mexc"), 2000.0);
    EXPECT_DOUBLE_EQ(ledger.cash("coinbase"), 2000.0);
    EXPECT_DOUBLE_EQ(ledger.holding("mexc", "XTZ"), 0.0);
}

TEST_F(HedgeEngineTest, ConcurrentFetchMatchesSequentialResults) {
    set_cash(100000.0, 100000.0);
    quote("XTZ", 100.0, 110.0);
    quote("DOT", 8.0, 7.0);
    quote("BONK", std::nullopt, 0.00002);
    xvh::ThreadPool pool(4);
    EXPECT_EQ(pool.thread_count(), 4u);
    auto engine = make_engine();
    engine->set_thread_pool(&pool);

    auto result = engine->run_cycle({{"XTZ"}, {"DOT"}, {"BONK"}});

    ASSERT_EQ(result.outcomes.size(), 3u);
    EXPECT_EQ(result.outcomes[0].asset, "XTZ");
    EXPECT_EQ(result.outcomes[0].state, xvh::HedgeState::EXECUTED);
    EXPECT_EQ(result.outcomes[1].asset, "DOT");
    EXPECT_EQ(result.outcomes[1].state, xvh::HedgeState::EXECUTED);
    EXPECT_EQ(result.outcomes[1].funding_venue, "coinbase");
    EXPECT_EQ(result.outcomes[2].state, xvh::HedgeState::SKIPPED);
    EXPECT_EQ(result.trades.size(), 4u);
}

TEST_F(HedgeEngineTest, BalancesStayNonNegativeAcrossManyCycles) {
    config.min_trade_usd = 5.0;
    config.volatility_period = 3;
    set_cash(50.0, 50.0);
    auto engine = make_engine();

    const double mexc_prices[] = {1.00, 1.05, 0.97, 1.10, 0.92, 1.01, 1.20, 0.85, 1.00, 1.03};
    const double coinbase_prices[] = {1.02, 1.00, 1.01, 1.00, 1.00, 0.99, 1.00, 0.95, 1.00, 1.08};
    for (int cycle = 0; cycle < 10; ++cycle) {
        now = at(2000 + cycle);
        quote("XTZ", mexc_prices[cycle], coinbase_prices[cycle]);
        auto result = engine->run_cycle({{"XTZ"}});
        for (const auto& entry : result.snapshot.entries) {
            EXPECT_GE(entry.amount, 0.0) << entry.venue << "/" << entry.account << " cycle " << cycle;
        }
    }
}

TEST_F(HedgeEngineTest, SamplePriceRecordsHistory) {
    quote("XTZ", 1.5, 1.6);
    auto engine = make_engine();

    auto price = engine->sample_price("XTZ", "coinbase");
    ASSERT_TRUE(price.has_value());
    EXPECT_DOUBLE_EQ(*price, 1.6);
    EXPECT_EQ(engine->history_size("XTZ", "coinbase"), 1u);
    EXPECT_FALSE(engine->sample_price("LTC", "mexc").has_value());
}

TEST_F(HedgeEngineTest, RequiresLedgerToHoldBothVenues) {
    config.venue_b = "kraken";
    EXPECT_THROW(xvh::HedgeEngine(config, &feed, &history, &ledger), xvh::ConfigurationError);
}

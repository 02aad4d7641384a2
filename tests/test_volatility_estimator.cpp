#include <gtest/gtest.h>
#include "core/volatility_estimator.hpp"
#include "core/exceptions.hpp"

class VolatilityEstimatorTest : public ::testing::Test {
protected:
    void append(const std::vector<double>& prices) {
        for (double price : prices) {
            buffer.append("XTZ", "mexc", xvh::PriceSample{xvh::Timestamp(std::chrono::seconds(++tick)), price});
        }
    }

    xvh::PriceHistoryBuffer buffer;
    xvh::VolatilityEstimator estimator{&buffer};
    int tick = 0;
};

TEST_F(VolatilityEstimatorTest, AveragesAbsoluteDeltasOverPeriod) {
    append({10.0, 11.0, 9.0, 12.0});

    auto result = estimator.true_range_average("XTZ", "mexc", 3);
    ASSERT_TRUE(result.is_success());
    // |11-10| + |9-11| + |12-9| = 6 over 3 changes
    EXPECT_DOUBLE_EQ(result.value(), 2.0);
}

TEST_F(VolatilityEstimatorTest, UsesOnlyMostRecentWindow) {
    append({100.0, 1.0, 2.0, 4.0, 7.0});

    auto result = estimator.true_range_average("XTZ", "mexc", 2);
    ASSERT_TRUE(result.is_success());
    // last three samples 2, 4, 7 -> deltas 2 and 3
    EXPECT_DOUBLE_EQ(result.value(), 2.5);
}

TEST_F(VolatilityEstimatorTest, FlatPricesGiveZero) {
    append({5.0, 5.0, 5.0});

    auto result = estimator.true_range_average("XTZ", "mexc", 2);
    ASSERT_TRUE(result.is_success());
    EXPECT_DOUBLE_EQ(result.value(), 0.0);
}

TEST_F(VolatilityEstimatorTest, InsufficientHistoryIsAnErrorResult) {
    append({10.0, 11.0, 12.0});

    auto result = estimator.true_range_average("XTZ", "mexc", 3);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error_code(), xvh::ErrorCode::INSUFFICIENT_HISTORY);
    EXPECT_DOUBLE_EQ(result.value_or(0.0), 0.0);

    auto empty = estimator.true_range_average("DOT", "mexc", 1);
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(empty.error_code(), xvh::ErrorCode::INSUFFICIENT_HISTORY);
}

TEST_F(VolatilityEstimatorTest, RepeatedCallsAreIdentical) {
    append({1.0, 1.5, 1.25, 2.0, 1.75});

    auto first = estimator.true_range_average("XTZ", "mexc", 4);
    auto second = estimator.true_range_average("XTZ", "mexc", 4);
    ASSERT_TRUE(first.is_success());
    ASSERT_TRUE(second.is_success());
    EXPECT_EQ(first.value(), second.value());
    EXPECT_EQ(buffer.size("XTZ", "mexc"), 5u);
}

TEST_F(VolatilityEstimatorTest, ZeroPeriodIsRejected) {
    append({1.0, 2.0});
    EXPECT_THROW(estimator.true_range_average("XTZ", "mexc", 0), xvh::ValidationError);
}

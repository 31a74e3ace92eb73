#include <gtest/gtest.h>
#include "quantcore/errors.hpp"
#include "quantcore/types.hpp"

#include <vector>

using namespace quantcore;

TEST(PriceSeries, FromClosesUsesBarIndices) {
    const auto s = PriceSeries::from_closes({10.0, 11.0, 12.0});
    ASSERT_EQ(s.size(), 3u);
    EXPECT_DOUBLE_EQ(s.timestamp_at(0), 0.0);
    EXPECT_DOUBLE_EQ(s.timestamp_at(2), 2.0);
    EXPECT_DOUBLE_EQ(s.close_at(1), 11.0);
}

TEST(PriceSeries, FromBarsKeepsCloses) {
    const std::vector<OHLCV> bars = {
        {.timestamp = 5.0, .open = 1.0, .high = 2.0, .low = 0.5, .close = 1.5, .volume = 10.0},
        {.timestamp = 7.0, .open = 1.5, .high = 2.5, .low = 1.0, .close = 2.0, .volume = 12.0},
    };
    const auto s = PriceSeries::from_bars(bars);
    EXPECT_DOUBLE_EQ(s.timestamp_at(1), 7.0);
    EXPECT_DOUBLE_EQ(s.close_at(0), 1.5);
}

TEST(PriceSeries, NonAscendingTimestamps_Throws) {
    EXPECT_THROW(PriceSeries({1.0, 1.0}, {10.0, 11.0}), InvalidParameterError);
    EXPECT_THROW(PriceSeries({2.0, 1.0}, {10.0, 11.0}), InvalidParameterError);
}

TEST(PriceSeries, LengthMismatch_Throws) {
    EXPECT_THROW(PriceSeries({1.0, 2.0}, {10.0}), InvalidParameterError);
}

TEST(PriceSeries, SliceClampsToEnd) {
    const auto s = PriceSeries::from_closes({1.0, 2.0, 3.0, 4.0, 5.0});
    const auto mid = s.slice(1, 3);
    ASSERT_EQ(mid.size(), 3u);
    EXPECT_DOUBLE_EQ(mid.close_at(0), 2.0);
    EXPECT_DOUBLE_EQ(mid.timestamp_at(2), 3.0);

    EXPECT_EQ(s.slice(3, 100).size(), 2u);
    EXPECT_TRUE(s.slice(10, 2).empty());
}

TEST(PriceSeries, OutOfRangeAccess_Throws) {
    const auto s = PriceSeries::from_closes({1.0});
    EXPECT_THROW((void)s.close_at(1), std::out_of_range);
}

TEST(QuantErrors, MessagesAndAccessors) {
    const InsufficientDataError data("sharpe", 2, 1);
    EXPECT_STREQ(data.what(), "sharpe: need at least 2 observations, got 1");
    EXPECT_EQ(data.required(), 2u);
    EXPECT_EQ(data.actual(), 1u);

    const OptimizationFailure fail("Iteration limit reached", 1000);
    EXPECT_STREQ(fail.what(),
                 "Optimization failed: Iteration limit reached (after 1000 iterations)");
    EXPECT_EQ(fail.iterations(), 1000);

    const QuantError& base = fail;
    EXPECT_NE(dynamic_cast<const OptimizationFailure*>(&base), nullptr);
}

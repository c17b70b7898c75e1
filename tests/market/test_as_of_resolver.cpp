#include <gtest/gtest.h>
#include "fomc_ngin/market/as_of_resolver.hpp"
#include "../test_utils.hpp"

using namespace fomc_ngin;
using fomc_ngin::testing::epoch;
using fomc_ngin::testing::make_tick;
using fomc_ngin::testing::utc;

class AsOfResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        series_ = PriceSeries::from_ticks({
            make_tick("ZQX3", utc(2023, 11, 1, 18, 19, 59), 100.00),
            make_tick("ZQX3", utc(2023, 11, 1, 18, 30, 0), 99.98),
            make_tick("ZQX3", utc(2023, 11, 1, 18, 40, 1), 99.95),
        });
        t0_ = epoch(2023, 11, 1, 18, 30, 0);
    }

    PriceSeries series_;
    EpochSeconds t0_{0};
};

TEST_F(AsOfResolverTest, ResolveReturnsPredecessor) {
    EXPECT_DOUBLE_EQ(AsOfResolver::resolve(series_, t0_).value(), 99.98);
    EXPECT_DOUBLE_EQ(AsOfResolver::resolve(series_, t0_ - 1).value(), 100.00);
    EXPECT_DOUBLE_EQ(AsOfResolver::resolve(series_, t0_ + 600).value(), 99.98);
    EXPECT_DOUBLE_EQ(AsOfResolver::resolve(series_, t0_ + 601).value(), 99.95);
    EXPECT_DOUBLE_EQ(AsOfResolver::resolve(series_, t0_ + 86400).value(), 99.95);
}

TEST_F(AsOfResolverTest, ResolveBeforeFirstObservation) {
    EXPECT_FALSE(AsOfResolver::resolve(series_, t0_ - 602).has_value());
    EXPECT_FALSE(AsOfResolver::resolve(PriceSeries(), t0_).has_value());
}

TEST_F(AsOfResolverTest, LastInWindowIsClosedOnBothEnds) {
    // Pre window [t0-600, t0-1]
    EXPECT_DOUBLE_EQ(AsOfResolver::last_in_window(series_, t0_ - 600, t0_ - 1).value(), 100.00);
    // Post window [t0, t0+600] sees the trade at t0 but not the one at t0+601
    EXPECT_DOUBLE_EQ(AsOfResolver::last_in_window(series_, t0_, t0_ + 600).value(), 99.98);
    EXPECT_DOUBLE_EQ(AsOfResolver::last_in_window(series_, t0_, t0_ + 601).value(), 99.95);
}

TEST_F(AsOfResolverTest, LastInWindowWithoutTrades) {
    EXPECT_FALSE(AsOfResolver::last_in_window(series_, t0_ + 1, t0_ + 600).has_value());
    EXPECT_FALSE(AsOfResolver::last_in_window(series_, t0_ - 599, t0_ - 2).has_value());
    EXPECT_FALSE(AsOfResolver::last_in_window(series_, t0_ + 10, t0_).has_value());
}

TEST_F(AsOfResolverTest, ExactWindowExcludesSubSecondPrintsPastTheEnd) {
    auto series = PriceSeries::from_ticks({
        make_tick("ZQX3", utc(2023, 11, 1, 18, 25, 0), 94.60),
        make_tick("ZQX3", utc(2023, 11, 1, 18, 40, 0, 400), 94.50),
    });
    EpochSeconds end = t0_ + 600;

    // The bucketed window still sees the 18:40:00.400 print
    EXPECT_DOUBLE_EQ(AsOfResolver::last_in_window(series, t0_, end).value(), 94.50);
    EXPECT_FALSE(AsOfResolver::last_in_exact_window(series, t0_, end).has_value());
    EXPECT_DOUBLE_EQ(AsOfResolver::last_in_exact_window(series, t0_ - 600, end).value(), 94.60);
    EXPECT_DOUBLE_EQ(AsOfResolver::last_in_exact_window(series, t0_, end + 1).value(), 94.50);
}

TEST_F(AsOfResolverTest, ExactWindowKeepsPrintOnTheEndSecond) {
    auto series = PriceSeries::from_ticks({
        make_tick("ZQX3", utc(2023, 11, 1, 18, 35, 0), 94.58),
        make_tick("ZQX3", utc(2023, 11, 1, 18, 40, 0, 0), 94.55),
        make_tick("ZQX3", utc(2023, 11, 1, 18, 40, 0, 400), 94.50),
    });

    EXPECT_DOUBLE_EQ(AsOfResolver::last_in_exact_window(series, t0_, t0_ + 600).value(), 94.55);
    EXPECT_DOUBLE_EQ(AsOfResolver::last_in_exact_window(series_, t0_, t0_ + 600).value(), 99.98);
    EXPECT_FALSE(AsOfResolver::last_in_exact_window(series_, t0_ + 1, t0_ + 600).has_value());
    EXPECT_FALSE(AsOfResolver::last_in_exact_window(series_, t0_ + 10, t0_).has_value());
}

TEST_F(AsOfResolverTest, Covers) {
    EXPECT_TRUE(AsOfResolver::covers(series_, t0_ + 601));
    EXPECT_FALSE(AsOfResolver::covers(series_, t0_ + 602));
    EXPECT_FALSE(AsOfResolver::covers(PriceSeries(), t0_));
}

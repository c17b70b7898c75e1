#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>
#include "fomc_ngin/market/price_series.hpp"
#include "../core/test_base.hpp"
#include "../test_utils.hpp"

using namespace fomc_ngin;
using fomc_ngin::testing::MockTickSource;
using fomc_ngin::testing::epoch;
using fomc_ngin::testing::make_tick;
using fomc_ngin::testing::utc;

class PriceSeriesTest : public fomc_ngin::testing::TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        source_ = std::make_shared<MockTickSource>();
    }

    const CalendarDate day_{2023, 11, 1};
    std::shared_ptr<MockTickSource> source_;
};

TEST_F(PriceSeriesTest, LastTickInSecondWins) {
    std::vector<Tick> ticks = {
        make_tick("ESZ3", utc(2023, 11, 1, 18, 30, 0, 900), 4200.50),
        make_tick("ESZ3", utc(2023, 11, 1, 18, 30, 0, 100), 4200.00),
        make_tick("ESZ3", utc(2023, 11, 1, 18, 30, 1, 0), 4201.00),
        make_tick("ESZ3", utc(2023, 11, 1, 18, 30, 0, 500), 4200.25),
    };

    auto series = PriceSeries::from_ticks(ticks);

    ASSERT_EQ(series.size(), 2u);
    EXPECT_EQ(series.times()[0], epoch(2023, 11, 1, 18, 30, 0));
    EXPECT_DOUBLE_EQ(series.prices()[0], 4200.50);
    EXPECT_EQ(series.times()[1], epoch(2023, 11, 1, 18, 30, 1));
    EXPECT_DOUBLE_EQ(series.prices()[1], 4201.00);
}

TEST_F(PriceSeriesTest, OnSecondPriceTracksTicksStampedOnTheSecond) {
    std::vector<Tick> ticks = {
        make_tick("ZQX3", utc(2023, 11, 1, 18, 40, 0, 400), 94.50),
        make_tick("ZQX3", utc(2023, 11, 1, 18, 40, 0, 0), 94.55),
        make_tick("ZQX3", utc(2023, 11, 1, 18, 40, 1, 250), 94.45),
    };

    auto series = PriceSeries::from_ticks(ticks);

    ASSERT_EQ(series.size(), 2u);
    ASSERT_EQ(series.on_second_prices().size(), 2u);
    EXPECT_DOUBLE_EQ(series.prices()[0], 94.50);
    ASSERT_TRUE(series.on_second_prices()[0].has_value());
    EXPECT_DOUBLE_EQ(*series.on_second_prices()[0], 94.55);
    EXPECT_FALSE(series.on_second_prices()[1].has_value());
}

TEST_F(PriceSeriesTest, ExactTiesKeepInputOrder) {
    Timestamp ts = utc(2023, 11, 1, 18, 30, 0, 250);
    std::vector<Tick> ticks = {make_tick("ZTZ3", ts, 101.0), make_tick("ZTZ3", ts, 102.0)};

    auto series = PriceSeries::from_ticks(ticks);
    ASSERT_EQ(series.size(), 1u);
    EXPECT_DOUBLE_EQ(series.prices()[0], 102.0);
}

TEST_F(PriceSeriesTest, PriceScaleApplied) {
    std::vector<Tick> ticks = {make_tick("ESZ3", utc(2023, 11, 1, 18, 0, 0), 420050.0)};
    auto series = PriceSeries::from_ticks(ticks, 0.01);
    ASSERT_EQ(series.size(), 1u);
    EXPECT_NEAR(series.prices()[0], 4200.50, 1e-9);
}

TEST_F(PriceSeriesTest, EmptyInputGivesEmptySeries) {
    auto series = PriceSeries::from_ticks({});
    EXPECT_TRUE(series.empty());
    EXPECT_EQ(series.size(), 0u);
}

TEST_F(PriceSeriesTest, SingleLegFilterRejectsSpreads) {
    auto filter = SingleLegFilter::create("ZQ");
    ASSERT_TRUE(filter.is_ok());

    EXPECT_TRUE(filter.value().matches("ZQX3"));
    EXPECT_TRUE(filter.value().matches("ZQF4"));
    EXPECT_FALSE(filter.value().matches("ZQ:BF F5-G5-J5"));
    EXPECT_FALSE(filter.value().matches("ZQX3-ZQZ3"));
    EXPECT_FALSE(filter.value().matches("ZQX23"));
    EXPECT_FALSE(filter.value().matches("ESZ3"));

    EXPECT_TRUE(SingleLegFilter::create("es").is_error());
    EXPECT_TRUE(SingleLegFilter::create("").is_error());
}

TEST_F(PriceSeriesTest, StoreFiltersMultiLegTicks) {
    source_->add_ticks("ES", day_,
                       {make_tick("ESZ3", utc(2023, 11, 1, 18, 30, 0), 4200.0),
                        make_tick("ESZ3-ESH4", utc(2023, 11, 1, 18, 30, 5), -45.0),
                        make_tick("ESH4", utc(2023, 11, 1, 18, 30, 10), 4245.0)});

    PriceSeriesStore store(source_, ContractFilter::ALL);
    auto result = store.get_root_series("2023-11-01", day_, {"ES", 1.0});
    ASSERT_TRUE(result.is_ok());

    const auto& series = *result.value();
    ASSERT_EQ(series.size(), 2u);
    EXPECT_DOUBLE_EQ(series.prices()[0], 4200.0);
    EXPECT_DOUBLE_EQ(series.prices()[1], 4245.0);
}

TEST_F(PriceSeriesTest, DominantFilterKeepsBusiestContract) {
    source_->add_ticks("ES", day_,
                       {make_tick("ESZ3", utc(2023, 11, 1, 18, 30, 0), 4200.0),
                        make_tick("ESZ3", utc(2023, 11, 1, 18, 30, 1), 4201.0),
                        make_tick("ESH4", utc(2023, 11, 1, 18, 30, 2), 4245.0)});

    PriceSeriesStore store(source_, ContractFilter::DOMINANT);
    auto result = store.get_root_series("2023-11-01", day_, {"ES", 1.0});
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value()->size(), 2u);
    EXPECT_DOUBLE_EQ(result.value()->prices().back(), 4201.0);
}

TEST_F(PriceSeriesTest, StoreCachesDaysAndSeries) {
    source_->add_ticks("ZQ", day_,
                       {make_tick("ZQX3", utc(2023, 11, 1, 18, 25, 0), 94.67),
                        make_tick("ZQZ3", utc(2023, 11, 1, 18, 25, 0), 94.60)});

    PriceSeriesStore store(source_, ContractFilter::ALL);
    auto first = store.get_contract_series("2023-11-01", day_, "ZQ", "ZQX3");
    auto second = store.get_contract_series("2023-11-01", day_, "ZQ", "ZQX3");
    auto other = store.get_contract_series("2023-11-01", day_, "ZQ", "ZQZ3");

    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    ASSERT_TRUE(other.is_ok());
    EXPECT_EQ(first.value().get(), second.value().get());
    EXPECT_DOUBLE_EQ(other.value()->prices()[0], 94.60);
    EXPECT_EQ(store.tick_loads(), 1u);
    EXPECT_EQ(source_->load_count(), 1u);
    EXPECT_EQ(store.cached_series_count(), 2u);
}

TEST_F(PriceSeriesTest, ConcurrentCallersShareOneBuild) {
    source_->add_ticks("ES", day_,
                       {make_tick("ESZ3", utc(2023, 11, 1, 18, 30, 0), 4200.0),
                        make_tick("ESZ3", utc(2023, 11, 1, 18, 31, 0), 4201.0)});
    source_->set_load_delay(std::chrono::milliseconds(50));
    PriceSeriesStore store(source_, ContractFilter::ALL);

    constexpr size_t kCallers = 8;
    std::vector<const PriceSeries*> seen(kCallers, nullptr);
    std::vector<std::thread> callers;
    for (size_t i = 0; i < kCallers; ++i) {
        callers.emplace_back([&, i]() {
            auto result = store.get_root_series("2023-11-01", day_, {"ES", 1.0});
            if (result.is_ok()) {
                seen[i] = result.value().get();
            }
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }

    ASSERT_NE(seen[0], nullptr);
    for (const auto* series : seen) {
        EXPECT_EQ(series, seen[0]);
    }
    EXPECT_EQ(source_->load_count(), 1u);
    EXPECT_EQ(store.tick_loads(), 1u);
    EXPECT_EQ(store.cached_series_count(), 1u);
}

TEST_F(PriceSeriesTest, WaitersRetryAfterFatalLoad) {
    source_->fail_with("ES", day_, ErrorCode::FILE_IO_ERROR);
    source_->set_load_delay(std::chrono::milliseconds(20));
    PriceSeriesStore store(source_, ContractFilter::ALL);

    std::vector<std::thread> callers;
    std::vector<ErrorCode> codes(3, ErrorCode::NONE);
    for (size_t i = 0; i < codes.size(); ++i) {
        callers.emplace_back([&, i]() {
            auto result = store.get_root_series("2023-11-01", day_, {"ES", 1.0});
            codes[i] = result.is_error() ? result.error()->code() : ErrorCode::NONE;
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }

    // Fatal errors are not cached, so each caller sees its own failed load
    for (auto code : codes) {
        EXPECT_EQ(code, ErrorCode::FILE_IO_ERROR);
    }
    EXPECT_EQ(source_->load_count(), 3u);
    EXPECT_EQ(store.cached_series_count(), 0u);
}

TEST_F(PriceSeriesTest, MissingDataIsUnavailableAndRemembered) {
    PriceSeriesStore store(source_, ContractFilter::ALL);

    auto first = store.get_root_series("2023-11-01", day_, {"ZT", 1.0});
    ASSERT_TRUE(first.is_error());
    EXPECT_EQ(first.error()->code(), ErrorCode::DATA_UNAVAILABLE);

    auto second = store.get_root_series("2023-11-01", day_, {"ZT", 1.0});
    ASSERT_TRUE(second.is_error());
    EXPECT_EQ(source_->load_count(), 1u);
}

TEST_F(PriceSeriesTest, UnknownContractIsUnavailable) {
    source_->add_ticks("ZQ", day_, {make_tick("ZQZ3", utc(2023, 11, 1, 18, 25, 0), 94.60)});
    PriceSeriesStore store(source_, ContractFilter::ALL);

    auto result = store.get_contract_series("2023-11-01", day_, "ZQ", "ZQX3");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::DATA_UNAVAILABLE);
}

TEST_F(PriceSeriesTest, FatalSourceErrorsPropagate) {
    source_->fail_with("ES", day_, ErrorCode::FILE_IO_ERROR);
    PriceSeriesStore store(source_, ContractFilter::ALL);

    auto result = store.get_root_series("2023-11-01", day_, {"ES", 1.0});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_IO_ERROR);
}

TEST_F(PriceSeriesTest, ContractFilterStrings) {
    EXPECT_EQ(contract_filter_from_string("all").value(), ContractFilter::ALL);
    EXPECT_EQ(contract_filter_from_string("dominant").value(), ContractFilter::DOMINANT);
    EXPECT_EQ(contract_filter_to_string(ContractFilter::DOMINANT), "dominant");
    EXPECT_TRUE(contract_filter_from_string("front").is_error());
}

#include <gtest/gtest.h>
#include <memory>
#include "fomc_ngin/analysis/event_study_runner.hpp"
#include "../core/test_base.hpp"
#include "../test_utils.hpp"

using namespace fomc_ngin;
using fomc_ngin::testing::MockTickSource;
using fomc_ngin::testing::epoch;
using fomc_ngin::testing::make_tick;
using fomc_ngin::testing::utc;

class EventStudyRunnerTest : public fomc_ngin::testing::TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        source_ = std::make_shared<MockTickSource>();

        config_.horizons = {0, 60};
        config_.winsor_sigma = 0.0;
        config_.instruments = {{"ES", 1.0}, {"ZT", 1.0}};
        config_.num_workers = 2;

        t0_ = epoch(2023, 11, 1, 18, 30, 0);
        source_->add_ticks("ES", day_,
                           {make_tick("ESZ3", utc(2023, 11, 1, 18, 28, 0), 4200.0),
                            make_tick("ESZ3", utc(2023, 11, 1, 18, 30, 0), 4201.0),
                            make_tick("ESZ3", utc(2023, 11, 1, 18, 30, 45), 4202.0),
                            make_tick("ESZ3", utc(2023, 11, 1, 18, 31, 30), 4203.0),
                            make_tick("ESZ3-ESH4", utc(2023, 11, 1, 18, 30, 10), -45.0)});
        source_->add_ticks("ZQ", day_,
                           {make_tick("ZQZ3", utc(2023, 11, 1, 18, 25, 0), 94.60),
                            make_tick("ZQZ3", utc(2023, 11, 1, 18, 35, 0), 94.55)});

        meetings_ = {{"2023-11-01", std::string("vid1")}, {"2023-11-01", std::nullopt}};
        segments_ = {segment("2023-11-01", 1, "Neutral", t0_, std::nullopt),
                     segment("2023-11-01", 2, "happy", std::nullopt, 30.7)};
    }

    SegmentRow segment(const std::string& meeting, std::int64_t id, const std::string& emotion,
                       std::optional<EpochSeconds> ts, std::optional<double> start) {
        SegmentRow row;
        row.meeting_id = meeting;
        row.segment_id = id;
        row.emotion = emotion;
        row.timestamp_utc = ts;
        row.segment_start_s = start;
        return row;
    }

    const CalendarDate day_{2023, 11, 1};
    std::shared_ptr<MockTickSource> source_;
    StudyConfig config_;
    EpochSeconds t0_{0};
    std::vector<MeetingRow> meetings_;
    std::vector<SegmentRow> segments_;
};

TEST_F(EventStudyRunnerTest, EndToEnd) {
    EventStudyRunner runner(config_, source_);
    auto result = runner.run(meetings_, segments_);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    const auto& study = result.value();

    ASSERT_EQ(study.anchors.size(), 1u);
    EXPECT_EQ(study.anchors[0].t0, t0_);

    ASSERT_EQ(study.surprises.size(), 1u);
    EXPECT_EQ(*study.surprises[0].symbol_used, "ZQZ3");
    EXPECT_NEAR(*study.surprises[0].target_surprise_bps, 5.0, 1e-6);

    // 2 segments x 2 instruments x 2 horizons
    ASSERT_EQ(study.forward_returns.size(), 8u);
    const auto& es_seg1_h60 = study.forward_returns[1];
    EXPECT_EQ(es_seg1_h60.instrument_symbol, "ES");
    EXPECT_EQ(es_seg1_h60.segment_id, 1);
    EXPECT_EQ(es_seg1_h60.horizon_seconds, 60);
    EXPECT_DOUBLE_EQ(*es_seg1_h60.price_delta, 1.0);

    // Segment 2 is anchored at t0 + floor(30.7)
    const auto& es_seg2_h60 = study.forward_returns[3];
    EXPECT_EQ(es_seg2_h60.segment_id, 2);
    EXPECT_EQ(es_seg2_h60.anchor_timestamp, t0_ + 30);
    EXPECT_DOUBLE_EQ(*es_seg2_h60.price_delta, 2.0);

    for (size_t i = 4; i < 8; ++i) {
        EXPECT_EQ(study.forward_returns[i].instrument_symbol, "ZT");
        EXPECT_EQ(study.forward_returns[i].status, ReturnStatus::UNAVAILABLE);
    }

    ASSERT_EQ(study.features.rows.size(), 4u);
    const auto& es_seg1 = study.features.rows[0];
    EXPECT_EQ(es_seg1.emotion, "neutral");
    EXPECT_DOUBLE_EQ(*es_seg1.pre_px, 4200.0);
    EXPECT_NEAR(*es_seg1.target_surprise_bps, 5.0, 1e-6);
    EXPECT_EQ(study.features.rows[1].is_non_neutral, 1);
    EXPECT_FALSE(study.features.rows[2].pre_px.has_value());

    const auto& diag = study.diagnostics;
    EXPECT_EQ(diag.meetings_total, 2u);
    EXPECT_EQ(diag.meetings_anchored, 1u);
    EXPECT_EQ(diag.surprises_resolved, 1u);
    EXPECT_EQ(diag.segments_used, 2u);
    EXPECT_EQ(diag.observed_rows, 4u);
    EXPECT_EQ(diag.unavailable_rows, 4u);
    EXPECT_EQ(diag.carried_forward_rows, 0u);
    EXPECT_EQ(diag.feature_rows, 4u);
    EXPECT_EQ(diag.skips.at("no_ticks_ZT"), 1u);
    EXPECT_EQ(diag.tick_loads, 3u);
    EXPECT_EQ(source_->load_count(), 3u);

    auto j = diag.to_json();
    EXPECT_EQ(j["forward_status"]["observed"].get<size_t>(), 4u);
    EXPECT_EQ(j["winsor_bounds"].size(), 2u);
}

TEST_F(EventStudyRunnerTest, SkipsAreCounted) {
    config_.instruments = {{"ES", 1.0}};
    meetings_.push_back({"not-a-date", std::nullopt});
    segments_.push_back(segment("2023-12-13", 1, "anxious", t0_, std::nullopt));
    segments_.push_back(segment("2023-11-01", 3, "surprise", std::nullopt, std::nullopt));

    EventStudyRunner runner(config_, source_);
    auto result = runner.run(meetings_, segments_);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    const auto& skips = result.value().diagnostics.skips;

    EXPECT_EQ(skips.at("malformed_meeting_id"), 1u);
    EXPECT_EQ(skips.at("segment_without_meeting"), 1u);
    EXPECT_EQ(skips.at("segment_without_timestamp"), 1u);
    EXPECT_EQ(result.value().diagnostics.segments_used, 2u);
    EXPECT_EQ(result.value().features.rows.size(), 2u);
}

TEST_F(EventStudyRunnerTest, MeetingWithoutFedFundsTicksKeepsEmptySurprise) {
    auto source = std::make_shared<MockTickSource>();
    source->add_ticks("ES", day_, {make_tick("ESZ3", utc(2023, 11, 1, 18, 30, 0), 4201.0)});
    config_.instruments = {{"ES", 1.0}};

    EventStudyRunner runner(config_, source);
    auto result = runner.run(meetings_, segments_);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const auto& study = result.value();
    ASSERT_EQ(study.surprises.size(), 1u);
    EXPECT_FALSE(study.surprises[0].symbol_used.has_value());
    EXPECT_FALSE(study.surprises[0].notes.empty());
    EXPECT_EQ(study.diagnostics.skips.at("surprise_no_window_trades"), 1u);
    EXPECT_FALSE(study.features.rows[0].target_surprise_bps.has_value());
}

TEST_F(EventStudyRunnerTest, AmbiguousAnchorSkipsMeeting) {
    config_.anchor_local_time = "01:30";
    meetings_ = {{"2023-11-05", std::nullopt}};

    EventStudyRunner runner(config_, source_);
    auto result = runner.run(meetings_, {});
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().anchors.empty());
    EXPECT_EQ(result.value().diagnostics.skips.at("ambiguous_anchor"), 1u);
}

TEST_F(EventStudyRunnerTest, FatalTickErrorAbortsRun) {
    source_->fail_with("ZT", day_, ErrorCode::FILE_IO_ERROR);

    EventStudyRunner runner(config_, source_);
    auto result = runner.run(meetings_, segments_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_IO_ERROR);
}

TEST_F(EventStudyRunnerTest, InvalidConfigurationRejected) {
    config_.missing_forward_policy = "guess";

    EventStudyRunner runner(config_, source_);
    auto result = runner.run(meetings_, segments_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONFIGURATION_ERROR);
}

TEST_F(EventStudyRunnerTest, ResultsIndependentOfWorkerCount) {
    config_.num_workers = 1;
    auto serial = EventStudyRunner(config_, source_).run(meetings_, segments_);
    config_.num_workers = 4;
    auto parallel = EventStudyRunner(config_, source_).run(meetings_, segments_);
    ASSERT_TRUE(serial.is_ok());
    ASSERT_TRUE(parallel.is_ok());

    const auto& a = serial.value().forward_returns;
    const auto& b = parallel.value().forward_returns;
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].instrument_symbol, b[i].instrument_symbol);
        EXPECT_EQ(a[i].segment_id, b[i].segment_id);
        EXPECT_EQ(a[i].horizon_seconds, b[i].horizon_seconds);
        EXPECT_EQ(a[i].price_delta, b[i].price_delta);
    }
}

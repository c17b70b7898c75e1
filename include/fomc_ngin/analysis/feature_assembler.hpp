// include/fomc_ngin/analysis/feature_assembler.hpp
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "fomc_ngin/analysis/forward_return_engine.hpp"
#include "fomc_ngin/core/error.hpp"
#include "fomc_ngin/core/types.hpp"
#include "fomc_ngin/market/price_series.hpp"
#include "fomc_ngin/statistics/winsorizer.hpp"

namespace fomc_ngin {

struct FeatureConfig {
    std::vector<std::string> emotion_labels{"neutral", "happy", "surprise", "anxious"};
    std::string baseline_label{"neutral"};
    double winsor_sigma{3.0};
    int pre_price_offset_s{60};
    std::vector<int> horizons;
};

/**
 * @brief Price level shortly before a segment, for one instrument
 */
struct PreEventLevel {
    std::string meeting_id;
    std::string instrument_symbol;
    std::int64_t segment_id{0};
    std::optional<Price> pre_px;
};

/**
 * @brief One (meeting, segment, instrument) row of the regression input
 */
struct FeatureRow {
    std::string meeting_id;
    std::int64_t segment_id{0};
    std::string instrument_symbol;
    EpochSeconds anchor_timestamp{0};
    std::string emotion;
    bool label_known{false};
    std::vector<int> indicators;  // one per non-baseline label
    int is_non_neutral{0};
    std::optional<Price> pre_px;
    std::optional<double> target_surprise_bps;
    std::vector<std::optional<double>> deltas;             // per horizon
    std::vector<std::optional<double>> winsorized_deltas;  // per horizon
};

struct FeatureTable {
    std::vector<std::string> indicator_labels;
    std::vector<int> horizons;
    std::vector<FeatureRow> rows;
    std::vector<statistics::WinsorBounds> bounds;  // per horizon
    size_t unknown_label_rows{0};
    size_t unlabeled_rows{0};
};

struct EmotionCount {
    std::string instrument_symbol;
    std::string label;
    size_t count{0};
};

/**
 * @brief Joins emotion labels, pre-event levels and surprises onto forward returns
 *
 * Return rows are pivoted to one row per (meeting, segment, instrument) with
 * one delta per horizon. Each horizon column is winsorized over the whole
 * table with bounds fitted once.
 */
class FeatureAssembler {
public:
    explicit FeatureAssembler(FeatureConfig config) : config_(std::move(config)) {}

    /**
     * @return CONFIGURATION_ERROR when the baseline is not one of the labels
     */
    Result<void> validate() const;

    /**
     * @brief Trim and lower-case an emotion label
     */
    static std::string normalize_label(const std::string& label);

    /**
     * @brief Normalize labels and keep the last row of each (meeting_id, segment_id)
     *
     * The result is ordered by (meeting_id, segment_id).
     */
    static std::vector<SegmentRow> deduplicate_segments(const std::vector<SegmentRow>& segments);

    /**
     * @brief As-of price at segment_time - pre_price_offset_s
     */
    std::optional<Price> pre_event_level(const PriceSeries& series,
                                         EpochSeconds segment_time) const;

    /**
     * @brief Build the wide feature table
     * @param segments Normalized, de-duplicated segments
     * @param returns Long forward return rows
     * @param pre_levels Pre-event levels per (meeting, segment, instrument)
     * @param surprises target_surprise_bps per meeting
     * @return INVALID_DATA for a return row whose horizon is not configured
     */
    Result<FeatureTable> assemble(
        const std::vector<SegmentRow>& segments, const std::vector<ForwardReturnRow>& returns,
        const std::vector<PreEventLevel>& pre_levels,
        const std::map<std::string, std::optional<double>>& surprises) const;

    /**
     * @brief Rows per (instrument, label); unknown labels are counted under "unknown"
     */
    std::vector<EmotionCount> count_emotions(const FeatureTable& table) const;

    const FeatureConfig& config() const {
        return config_;
    }

private:
    FeatureConfig config_;
};

}  // namespace fomc_ngin

// include/fomc_ngin/analysis/event_study_runner.hpp
#pragma once

#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "fomc_ngin/analysis/event_anchor.hpp"
#include "fomc_ngin/analysis/feature_assembler.hpp"
#include "fomc_ngin/analysis/forward_return_engine.hpp"
#include "fomc_ngin/analysis/surprise_calculator.hpp"
#include "fomc_ngin/analysis/config_loader.hpp"
#include "fomc_ngin/core/error.hpp"
#include "fomc_ngin/data/tick_source.hpp"
#include "fomc_ngin/market/price_series.hpp"

namespace fomc_ngin {

/**
 * @brief Row counts and skip reasons of one run
 */
struct RunDiagnostics {
    size_t meetings_total{0};
    size_t meetings_anchored{0};
    size_t segments_input{0};
    size_t segments_used{0};
    size_t surprise_rows{0};
    size_t surprises_resolved{0};
    size_t forward_rows{0};
    size_t observed_rows{0};
    size_t carried_forward_rows{0};
    size_t unavailable_rows{0};
    size_t feature_rows{0};
    size_t unknown_label_rows{0};
    size_t tick_loads{0};
    size_t series_built{0};
    std::vector<int> horizons;
    double winsor_sigma{0.0};
    std::vector<statistics::WinsorBounds> winsor_bounds;
    std::map<std::string, size_t> skips;  // reason -> count

    void add_skip(const std::string& reason, size_t count = 1) {
        skips[reason] += count;
    }

    nlohmann::json to_json() const;
};

struct StudyResult {
    std::vector<EventAnchor> anchors;
    std::vector<SurpriseRecord> surprises;
    std::vector<ForwardReturnRow> forward_returns;
    FeatureTable features;
    std::vector<EmotionCount> emotion_counts;
    RunDiagnostics diagnostics;
};

/**
 * @brief Runs the event study over a meeting list and a segment table
 *
 * Meetings (surprises) and (meeting, instrument) pairs (forward returns) are
 * independent tasks spread over num_workers threads. Missing data and
 * unresolvable anchors are counted and skipped; configuration and I/O errors
 * abort the run.
 */
class EventStudyRunner {
public:
    EventStudyRunner(StudyConfig config, std::shared_ptr<TickSource> source);

    Result<StudyResult> run(const std::vector<MeetingRow>& meetings,
                            const std::vector<SegmentRow>& segments);

    const StudyConfig& config() const {
        return config_;
    }

private:
    /**
     * @brief Anchor every meeting, skipping malformed ids and ambiguous anchors
     */
    Result<std::vector<EventAnchor>> compute_anchors(const std::vector<MeetingRow>& meetings,
                                                     const AnchorCalculator& calculator,
                                                     RunDiagnostics& diagnostics) const;

    StudyConfig config_;
    std::shared_ptr<TickSource> source_;
};

}  // namespace fomc_ngin

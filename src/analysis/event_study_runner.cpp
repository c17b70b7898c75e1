// src/analysis/event_study_runner.cpp

#include "fomc_ngin/analysis/event_study_runner.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <tuple>
#include "fomc_ngin/core/logger.hpp"
#include "fomc_ngin/core/parallel.hpp"

namespace fomc_ngin {

namespace {

// One (meeting, instrument) unit of forward-return work
struct PairTask {
    const EventAnchor* anchor{nullptr};
    const InstrumentSpec* instrument{nullptr};
    std::vector<std::pair<const SegmentRow*, EpochSeconds>> segments;
};

struct PairOutput {
    std::vector<ForwardReturnRow> rows;
    std::vector<PreEventLevel> levels;
    bool missing_series{false};
};

void throw_if_fatal(const FomcError* error) {
    if (error != nullptr && !is_recoverable(error->code())) {
        throw *error;
    }
}

}  // namespace

nlohmann::json RunDiagnostics::to_json() const {
    nlohmann::json j;
    j["meetings_total"] = meetings_total;
    j["meetings_anchored"] = meetings_anchored;
    j["segments_input"] = segments_input;
    j["segments_used"] = segments_used;
    j["surprise_rows"] = surprise_rows;
    j["surprises_resolved"] = surprises_resolved;
    j["forward_rows"] = forward_rows;
    j["forward_status"] = {{"observed", observed_rows},
                           {"carried_forward", carried_forward_rows},
                           {"unavailable", unavailable_rows}};
    j["feature_rows"] = feature_rows;
    j["unknown_label_rows"] = unknown_label_rows;
    j["tick_loads"] = tick_loads;
    j["series_built"] = series_built;
    j["horizons"] = horizons;
    j["winsor_sigma"] = winsor_sigma;

    nlohmann::json bounds = nlohmann::json::array();
    for (size_t i = 0; i < winsor_bounds.size(); ++i) {
        const auto& b = winsor_bounds[i];
        bounds.push_back({{"horizon_s", i < horizons.size() ? horizons[i] : -1},
                          {"active", b.active},
                          {"stddev", b.stddev},
                          {"lower", b.lower},
                          {"upper", b.upper},
                          {"observations", b.observations}});
    }
    j["winsor_bounds"] = bounds;
    j["skips"] = skips;
    return j;
}

EventStudyRunner::EventStudyRunner(StudyConfig config, std::shared_ptr<TickSource> source)
    : config_(std::move(config)), source_(std::move(source)) {}

Result<std::vector<EventAnchor>> EventStudyRunner::compute_anchors(
    const std::vector<MeetingRow>& meetings, const AnchorCalculator& calculator,
    RunDiagnostics& diagnostics) const {
    std::map<std::string, EventAnchor> unique;
    for (const auto& meeting : meetings) {
        if (unique.count(meeting.meeting_id) > 0) {
            continue;
        }
        auto anchor = calculator.compute(meeting.meeting_id);
        if (anchor.is_error()) {
            switch (anchor.error()->code()) {
                case ErrorCode::INVALID_DATA:
                    WARN("Skipping meeting with malformed id '" << meeting.meeting_id << "'");
                    diagnostics.add_skip("malformed_meeting_id");
                    continue;
                case ErrorCode::AMBIGUOUS_TIMESTAMP:
                    WARN("Skipping meeting " << meeting.meeting_id
                                             << ": " << anchor.error()->what());
                    diagnostics.add_skip("ambiguous_anchor");
                    continue;
                default:
                    return forward_error<std::vector<EventAnchor>>(anchor, "EventStudyRunner");
            }
        }
        unique.emplace(meeting.meeting_id, anchor.take_value());
    }

    std::vector<EventAnchor> anchors;
    anchors.reserve(unique.size());
    for (auto& entry : unique) {
        anchors.push_back(std::move(entry.second));
    }
    return anchors;
}

Result<StudyResult> EventStudyRunner::run(const std::vector<MeetingRow>& meetings,
                                          const std::vector<SegmentRow>& segments) {
    Logger::register_component("EventStudyRunner");

    auto valid = ConfigLoader::validate_config(config_);
    if (valid.is_error()) {
        return forward_error<StudyResult>(valid, "EventStudyRunner");
    }
    if (!source_) {
        return make_error<StudyResult>(ErrorCode::NOT_INITIALIZED, "No tick source configured",
                                       "EventStudyRunner");
    }

    // Validation above guarantees these conversions succeed
    auto anchor_config = config_.anchor_config();
    auto forward_config = config_.forward_return_config();
    auto contract_filter = config_.contract_filter_value();
    if (anchor_config.is_error() || forward_config.is_error() || contract_filter.is_error()) {
        return make_error<StudyResult>(ErrorCode::CONFIGURATION_ERROR,
                                       "Invalid component configuration", "EventStudyRunner");
    }

    AnchorCalculator anchor_calculator(anchor_config.value());
    SurpriseCalculator surprise_calculator(config_.surprise_config());
    ForwardReturnEngine forward_engine(forward_config.value());
    FeatureAssembler assembler(config_.feature_config());
    PriceSeriesStore store(source_, contract_filter.value());
    const size_t workers = static_cast<size_t>(config_.num_workers);

    StudyResult result;
    RunDiagnostics& diagnostics = result.diagnostics;
    diagnostics.meetings_total = meetings.size();
    diagnostics.segments_input = segments.size();
    diagnostics.horizons = config_.horizons;
    diagnostics.winsor_sigma = config_.winsor_sigma;

    auto anchors_result = compute_anchors(meetings, anchor_calculator, diagnostics);
    if (anchors_result.is_error()) {
        return forward_error<StudyResult>(anchors_result, "EventStudyRunner");
    }
    result.anchors = anchors_result.take_value();
    diagnostics.meetings_anchored = result.anchors.size();
    INFO("Anchored " << result.anchors.size() << " of " << meetings.size() << " meetings");

    try {
        // Surprises, one task per meeting
        result.surprises.resize(result.anchors.size());
        const std::string& root = surprise_calculator.config().root;
        core::parallel_for_each(result.anchors.size(), workers, [&](size_t i) {
            Logger::register_component("SurpriseCalculator");
            const EventAnchor& anchor = result.anchors[i];
            auto lookup = [&](const std::string& symbol) {
                return store.get_contract_series(anchor.meeting_id, anchor.date, root, symbol);
            };
            auto record = surprise_calculator.compute(anchor, lookup);
            throw_if_fatal(record.error());
            result.surprises[i] = record.take_value();
        });

        for (const auto& record : result.surprises) {
            if (record.symbol_used) {
                ++diagnostics.surprises_resolved;
            } else {
                WARN("No surprise for " << record.meeting_id << ": " << record.notes);
                diagnostics.add_skip("surprise_no_window_trades");
            }
        }
        diagnostics.surprise_rows = result.surprises.size();

        // Segments grouped by meeting, with resolved timestamps
        std::vector<SegmentRow> unique_segments = FeatureAssembler::deduplicate_segments(segments);
        std::map<std::string, const EventAnchor*> anchor_by_meeting;
        for (const auto& anchor : result.anchors) {
            anchor_by_meeting[anchor.meeting_id] = &anchor;
        }

        std::map<std::string, std::vector<std::pair<const SegmentRow*, EpochSeconds>>> by_meeting;
        for (const auto& segment : unique_segments) {
            auto anchor = anchor_by_meeting.find(segment.meeting_id);
            if (anchor == anchor_by_meeting.end()) {
                diagnostics.add_skip("segment_without_meeting");
                continue;
            }
            EpochSeconds ts = 0;
            if (segment.timestamp_utc) {
                ts = *segment.timestamp_utc;
            } else if (segment.segment_start_s) {
                ts = anchor->second->t0 +
                     static_cast<EpochSeconds>(std::floor(*segment.segment_start_s));
            } else {
                diagnostics.add_skip("segment_without_timestamp");
                continue;
            }
            by_meeting[segment.meeting_id].emplace_back(&segment, ts);
        }

        std::vector<PairTask> tasks;
        for (const auto& anchor : result.anchors) {
            auto it = by_meeting.find(anchor.meeting_id);
            if (it == by_meeting.end()) {
                continue;
            }
            diagnostics.segments_used += it->second.size();
            for (const auto& instrument : config_.instruments) {
                PairTask task;
                task.anchor = &anchor;
                task.instrument = &instrument;
                task.segments = it->second;
                tasks.push_back(std::move(task));
            }
        }
        INFO("Computing forward returns for " << tasks.size() << " (meeting, instrument) pairs");

        // Forward returns, one task per (meeting, instrument)
        std::vector<PairOutput> outputs(tasks.size());
        core::parallel_for_each(tasks.size(), workers, [&](size_t i) {
            Logger::register_component("ForwardReturnEngine");
            const PairTask& task = tasks[i];
            PairOutput& out = outputs[i];
            const std::string& symbol = task.instrument->root;

            auto series = store.get_root_series(task.anchor->meeting_id, task.anchor->date,
                                                *task.instrument);
            throw_if_fatal(series.error());
            out.missing_series = series.is_error();

            for (const auto& [segment, ts] : task.segments) {
                ReturnRequest request{task.anchor->meeting_id, symbol, segment->segment_id, ts};
                PreEventLevel level{task.anchor->meeting_id, symbol, segment->segment_id,
                                    std::nullopt};
                std::vector<ForwardReturnRow> rows;
                if (out.missing_series) {
                    rows = forward_engine.unavailable_rows(request);
                } else {
                    rows = forward_engine.compute_rows(request, *series.value());
                    level.pre_px = assembler.pre_event_level(*series.value(), ts);
                }
                out.rows.insert(out.rows.end(), std::make_move_iterator(rows.begin()),
                                std::make_move_iterator(rows.end()));
                out.levels.push_back(std::move(level));
            }
        });

        std::vector<PreEventLevel> levels;
        for (size_t i = 0; i < outputs.size(); ++i) {
            if (outputs[i].missing_series) {
                WARN("No " << tasks[i].instrument->root << " ticks for "
                           << tasks[i].anchor->meeting_id << "; forward returns unavailable");
                diagnostics.add_skip("no_ticks_" + tasks[i].instrument->root);
            }
            result.forward_returns.insert(result.forward_returns.end(),
                                          std::make_move_iterator(outputs[i].rows.begin()),
                                          std::make_move_iterator(outputs[i].rows.end()));
            levels.insert(levels.end(), std::make_move_iterator(outputs[i].levels.begin()),
                          std::make_move_iterator(outputs[i].levels.end()));
        }

        std::stable_sort(result.forward_returns.begin(), result.forward_returns.end(),
                         [](const ForwardReturnRow& a, const ForwardReturnRow& b) {
                             return std::tie(a.meeting_id, a.instrument_symbol, a.segment_id) <
                                    std::tie(b.meeting_id, b.instrument_symbol, b.segment_id);
                         });

        for (const auto& row : result.forward_returns) {
            switch (row.status) {
                case ReturnStatus::OBSERVED:
                    ++diagnostics.observed_rows;
                    break;
                case ReturnStatus::CARRIED_FORWARD:
                    ++diagnostics.carried_forward_rows;
                    break;
                case ReturnStatus::UNAVAILABLE:
                    ++diagnostics.unavailable_rows;
                    break;
            }
        }
        diagnostics.forward_rows = result.forward_returns.size();

        std::map<std::string, std::optional<double>> surprise_by_meeting;
        for (const auto& record : result.surprises) {
            surprise_by_meeting[record.meeting_id] = record.target_surprise_bps;
        }

        auto features =
            assembler.assemble(unique_segments, result.forward_returns, levels, surprise_by_meeting);
        if (features.is_error()) {
            return forward_error<StudyResult>(features, "EventStudyRunner");
        }
        result.features = features.take_value();
        result.emotion_counts = assembler.count_emotions(result.features);
    } catch (const FomcError& e) {
        ERROR("Event study aborted: " << e.to_string());
        return make_error<StudyResult>(e.code(), e.what(), "EventStudyRunner");
    }

    diagnostics.feature_rows = result.features.rows.size();
    diagnostics.unknown_label_rows = result.features.unknown_label_rows;
    diagnostics.winsor_bounds = result.features.bounds;
    diagnostics.tick_loads = store.tick_loads();
    diagnostics.series_built = store.cached_series_count();

    INFO("Event study complete: " << diagnostics.surprises_resolved << "/"
                                  << diagnostics.surprise_rows << " surprises, "
                                  << diagnostics.forward_rows << " forward rows, "
                                  << diagnostics.feature_rows << " feature rows");
    return result;
}

}  // namespace fomc_ngin

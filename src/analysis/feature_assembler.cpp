// src/analysis/feature_assembler.cpp

#include "fomc_ngin/analysis/feature_assembler.hpp"
#include <algorithm>
#include <cctype>
#include <tuple>
#include "fomc_ngin/core/logger.hpp"
#include "fomc_ngin/market/as_of_resolver.hpp"

namespace fomc_ngin {

namespace {

using RowKey = std::tuple<std::string, std::string, std::int64_t>;  // (meeting, instrument, segment)
using SegmentKey = std::pair<std::string, std::int64_t>;

const char* const kUnknownLabel = "unknown";

}  // namespace

Result<void> FeatureAssembler::validate() const {
    const auto& labels = config_.emotion_labels;
    if (labels.empty()) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR, "emotion_labels is empty",
                                "FeatureAssembler");
    }
    if (std::find(labels.begin(), labels.end(), config_.baseline_label) == labels.end()) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "Baseline label '" + config_.baseline_label +
                                    "' is not one of emotion_labels",
                                "FeatureAssembler");
    }
    return Result<void>();
}

std::string FeatureAssembler::normalize_label(const std::string& label) {
    size_t begin = 0;
    size_t end = label.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(label[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(label[end - 1])))
        --end;

    std::string out = label.substr(begin, end - begin);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<SegmentRow> FeatureAssembler::deduplicate_segments(
    const std::vector<SegmentRow>& segments) {
    std::map<SegmentKey, SegmentRow> latest;
    for (const auto& segment : segments) {
        SegmentRow row = segment;
        row.emotion = normalize_label(segment.emotion);
        latest[{row.meeting_id, row.segment_id}] = std::move(row);
    }

    std::vector<SegmentRow> out;
    out.reserve(latest.size());
    for (auto& entry : latest) {
        out.push_back(std::move(entry.second));
    }
    return out;
}

std::optional<Price> FeatureAssembler::pre_event_level(const PriceSeries& series,
                                                       EpochSeconds segment_time) const {
    return AsOfResolver::resolve(series, segment_time - config_.pre_price_offset_s);
}

Result<FeatureTable> FeatureAssembler::assemble(
    const std::vector<SegmentRow>& segments, const std::vector<ForwardReturnRow>& returns,
    const std::vector<PreEventLevel>& pre_levels,
    const std::map<std::string, std::optional<double>>& surprises) const {
    auto valid = validate();
    if (valid.is_error()) {
        return forward_error<FeatureTable>(valid, "FeatureAssembler");
    }

    FeatureTable table;
    table.horizons = config_.horizons;
    for (const auto& label : config_.emotion_labels) {
        if (label != config_.baseline_label)
            table.indicator_labels.push_back(label);
    }

    std::map<int, size_t> horizon_index;
    for (size_t i = 0; i < config_.horizons.size(); ++i) {
        horizon_index[config_.horizons[i]] = i;
    }

    std::map<SegmentKey, const SegmentRow*> labels;
    for (const auto& segment : segments) {
        labels[{segment.meeting_id, segment.segment_id}] = &segment;
    }

    std::map<RowKey, std::optional<Price>> levels;
    for (const auto& level : pre_levels) {
        levels[RowKey{level.meeting_id, level.instrument_symbol, level.segment_id}] = level.pre_px;
    }

    std::map<RowKey, FeatureRow> pivot;
    for (const auto& ret : returns) {
        auto h = horizon_index.find(ret.horizon_seconds);
        if (h == horizon_index.end()) {
            return make_error<FeatureTable>(ErrorCode::INVALID_DATA,
                                            "Return row with unconfigured horizon " +
                                                std::to_string(ret.horizon_seconds),
                                            "FeatureAssembler");
        }

        RowKey key{ret.meeting_id, ret.instrument_symbol, ret.segment_id};
        auto it = pivot.find(key);
        if (it == pivot.end()) {
            FeatureRow row;
            row.meeting_id = ret.meeting_id;
            row.segment_id = ret.segment_id;
            row.instrument_symbol = ret.instrument_symbol;
            row.anchor_timestamp = ret.anchor_timestamp;
            row.indicators.assign(table.indicator_labels.size(), 0);
            row.deltas.assign(config_.horizons.size(), std::nullopt);
            it = pivot.emplace(key, std::move(row)).first;
        }
        it->second.deltas[h->second] = ret.price_delta;
    }

    for (auto& entry : pivot) {
        FeatureRow& row = entry.second;

        auto label = labels.find({row.meeting_id, row.segment_id});
        if (label == labels.end()) {
            ++table.unlabeled_rows;
        } else {
            row.emotion = label->second->emotion;
            const auto& known = config_.emotion_labels;
            row.label_known = std::find(known.begin(), known.end(), row.emotion) != known.end();
            if (!row.label_known) {
                ++table.unknown_label_rows;
            }
            for (size_t i = 0; i < table.indicator_labels.size(); ++i) {
                row.indicators[i] = row.emotion == table.indicator_labels[i] ? 1 : 0;
            }
            row.is_non_neutral = row.emotion != config_.baseline_label ? 1 : 0;
        }

        auto level = levels.find(entry.first);
        if (level != levels.end()) {
            row.pre_px = level->second;
        }

        auto surprise = surprises.find(row.meeting_id);
        if (surprise != surprises.end()) {
            row.target_surprise_bps = surprise->second;
        }

        table.rows.push_back(std::move(row));
    }

    // Winsorize each horizon column over the full table
    for (auto& row : table.rows) {
        row.winsorized_deltas.assign(config_.horizons.size(), std::nullopt);
    }
    for (size_t h = 0; h < config_.horizons.size(); ++h) {
        statistics::NullableColumn column;
        column.reserve(table.rows.size());
        for (const auto& row : table.rows) {
            column.push_back(row.deltas[h]);
        }

        auto bounds = statistics::fit_winsor_bounds(column, config_.winsor_sigma);
        if (bounds.is_error()) {
            return forward_error<FeatureTable>(bounds, "FeatureAssembler");
        }
        auto capped = statistics::apply_winsor_bounds(column, bounds.value());
        for (size_t r = 0; r < table.rows.size(); ++r) {
            table.rows[r].winsorized_deltas[h] = capped[r];
        }
        table.bounds.push_back(bounds.value());
    }

    if (table.unknown_label_rows > 0) {
        WARN(table.unknown_label_rows << " feature rows carry a label outside emotion_labels");
    }
    if (table.unlabeled_rows > 0) {
        WARN(table.unlabeled_rows << " feature rows have no matching segment label");
    }
    return table;
}

std::vector<EmotionCount> FeatureAssembler::count_emotions(const FeatureTable& table) const {
    std::map<std::string, std::map<std::string, size_t>> counts;
    for (const auto& row : table.rows) {
        auto& per_label = counts[row.instrument_symbol];
        if (per_label.empty()) {
            for (const auto& label : config_.emotion_labels)
                per_label[label] = 0;
            per_label[kUnknownLabel] = 0;
        }
        ++per_label[row.label_known ? row.emotion : std::string(kUnknownLabel)];
    }

    std::vector<EmotionCount> out;
    for (const auto& instrument : counts) {
        for (const auto& label : config_.emotion_labels) {
            out.push_back({instrument.first, label, instrument.second.at(label)});
        }
        out.push_back({instrument.first, kUnknownLabel, instrument.second.at(kUnknownLabel)});
    }
    return out;
}

}  // namespace fomc_ngin

// src/analysis/surprise_calculator.cpp

#include "fomc_ngin/analysis/surprise_calculator.hpp"
#include "fomc_ngin/core/logger.hpp"
#include "fomc_ngin/market/as_of_resolver.hpp"

namespace fomc_ngin {

namespace {
constexpr double kPar = 100.0;
constexpr double kBpsPerPoint = 100.0;
}  // namespace

SurpriseCalculator::SurpriseCalculator(SurpriseConfig config)
    : config_(std::move(config)), selector_(config_.root) {}

int SurpriseCalculator::days_remaining(const CalendarDate& date) {
    return calendar::days_in_month(date.year, date.month) - date.day + 1;
}

std::optional<double> SurpriseCalculator::scaling_factor(const CalendarDate& date) {
    int remaining = days_remaining(date);
    if (remaining <= 0) {
        return std::nullopt;
    }
    return static_cast<double>(calendar::days_in_month(date.year, date.month)) / remaining;
}

Result<SurpriseRecord> SurpriseCalculator::compute(const EventAnchor& anchor,
                                                   const ContractSeriesLookup& lookup) const {
    auto candidates_result = selector_.candidates(anchor.date);
    if (candidates_result.is_error()) {
        return forward_error<SurpriseRecord>(candidates_result, "SurpriseCalculator");
    }
    const auto& candidates = candidates_result.value();

    SurpriseRecord record;
    record.meeting_id = anchor.meeting_id;
    record.t0_utc = anchor.t0_utc();
    record.primary_symbol = candidates.front();
    record.fallback_symbol = candidates.back();
    record.days_in_month = calendar::days_in_month(anchor.date.year, anchor.date.month);
    record.days_remaining_after_announcement = days_remaining(anchor.date);
    record.scaling_factor = scaling_factor(anchor.date);

    const EpochSeconds pre_start = anchor.t0 - config_.pre_window_s;
    const EpochSeconds pre_end = anchor.t0 - 1;
    const EpochSeconds post_end = anchor.t0 + config_.post_window_s;

    for (const auto& symbol : candidates) {
        auto series_result = lookup(symbol);
        if (series_result.is_error()) {
            if (!is_recoverable(series_result.error()->code())) {
                return forward_error<SurpriseRecord>(series_result, "SurpriseCalculator");
            }
            DEBUG(anchor.meeting_id << ": no series for " << symbol << " ("
                                    << series_result.error()->what() << ")");
            continue;
        }
        const PriceSeries& series = *series_result.value();

        auto pre = AsOfResolver::last_in_window(series, pre_start, pre_end);
        auto post = AsOfResolver::last_in_exact_window(series, anchor.t0, post_end);
        if (!pre || !post) {
            DEBUG(anchor.meeting_id << ": " << symbol << " missing "
                                    << (!pre ? "pre" : "post") << "-event trade");
            continue;
        }

        record.symbol_used = symbol;
        record.price_pre = *pre;
        record.price_post = *post;
        break;
    }

    if (!record.symbol_used) {
        record.notes = "no trades for meeting-month or next-month symbol in event window";
        return record;
    }

    record.implied_pre = kPar - *record.price_pre;
    record.implied_post = kPar - *record.price_post;
    record.delta_implied_bps = (*record.implied_post - *record.implied_pre) * kBpsPerPoint;

    if (record.scaling_factor) {
        record.target_surprise_bps = *record.delta_implied_bps * *record.scaling_factor;
    }
    return record;
}

}  // namespace fomc_ngin

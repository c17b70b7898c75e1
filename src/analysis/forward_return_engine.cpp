// src/analysis/forward_return_engine.cpp

#include "fomc_ngin/analysis/forward_return_engine.hpp"
#include "fomc_ngin/market/as_of_resolver.hpp"

namespace fomc_ngin {

std::string return_status_to_string(ReturnStatus status) {
    switch (status) {
        case ReturnStatus::OBSERVED:
            return "observed";
        case ReturnStatus::CARRIED_FORWARD:
            return "carried_forward";
        case ReturnStatus::UNAVAILABLE:
            return "unavailable";
        default:
            return "unknown";
    }
}

std::string missing_forward_policy_to_string(MissingForwardPolicy policy) {
    switch (policy) {
        case MissingForwardPolicy::CARRY_FORWARD:
            return "carry_forward";
        case MissingForwardPolicy::UNAVAILABLE:
            return "unavailable";
        default:
            return "unknown";
    }
}

Result<MissingForwardPolicy> missing_forward_policy_from_string(const std::string& text) {
    if (text == "carry_forward")
        return MissingForwardPolicy::CARRY_FORWARD;
    if (text == "unavailable")
        return MissingForwardPolicy::UNAVAILABLE;
    return make_error<MissingForwardPolicy>(ErrorCode::CONFIGURATION_ERROR,
                                            "Unknown missing_forward_policy: '" + text + "'",
                                            "ForwardReturnEngine");
}

ForwardReturnRow ForwardReturnEngine::make_row(const ReturnRequest& request, int horizon) const {
    ForwardReturnRow row;
    row.meeting_id = request.meeting_id;
    row.instrument_symbol = request.instrument_symbol;
    row.segment_id = request.segment_id;
    row.anchor_timestamp = request.anchor_timestamp;
    row.horizon_seconds = horizon;
    return row;
}

std::vector<ForwardReturnRow> ForwardReturnEngine::unavailable_rows(
    const ReturnRequest& request) const {
    std::vector<ForwardReturnRow> rows;
    rows.reserve(config_.horizons.size());
    for (int h : config_.horizons) {
        rows.push_back(make_row(request, h));
    }
    return rows;
}

std::vector<ForwardReturnRow> ForwardReturnEngine::compute_rows(const ReturnRequest& request,
                                                                const PriceSeries& series) const {
    const EpochSeconds t0 = request.anchor_timestamp;
    auto p0 = AsOfResolver::resolve(series, t0);
    if (!p0) {
        return unavailable_rows(request);
    }

    std::vector<ForwardReturnRow> rows;
    rows.reserve(config_.horizons.size());
    for (int h : config_.horizons) {
        ForwardReturnRow row = make_row(request, h);
        const EpochSeconds t1 = t0 + h;

        if (h == 0 || AsOfResolver::covers(series, t1)) {
            // p0 exists, so the as-of price at t1 >= t0 exists too
            auto p1 = AsOfResolver::resolve(series, t1);
            row.price_delta = *p1 - *p0;
            row.status = ReturnStatus::OBSERVED;
        } else if (config_.policy == MissingForwardPolicy::CARRY_FORWARD) {
            row.price_delta = 0.0;
            row.status = ReturnStatus::CARRIED_FORWARD;
        } else {
            row.status = ReturnStatus::UNAVAILABLE;
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

}  // namespace fomc_ngin

// src/analysis/event_anchor.cpp

#include "fomc_ngin/analysis/event_anchor.hpp"
#include "fomc_ngin/core/time_utils.hpp"

namespace fomc_ngin {

std::string EventAnchor::t0_utc() const {
    return core::format_utc(t0);
}

Result<EventAnchor> AnchorCalculator::compute(const std::string& meeting_id) const {
    auto date_result = CalendarDate::parse(meeting_id);
    if (date_result.is_error()) {
        return make_error<EventAnchor>(ErrorCode::INVALID_DATA,
                                       "Meeting id is not a date: " + meeting_id,
                                       "AnchorCalculator");
    }

    auto utc_result = config_.zone.to_utc(date_result.value(), config_.local_seconds_of_day);
    if (utc_result.is_error()) {
        return forward_error<EventAnchor>(utc_result, "AnchorCalculator");
    }

    EventAnchor anchor;
    anchor.meeting_id = meeting_id;
    anchor.date = date_result.value();
    anchor.t0 = utc_result.value();
    return anchor;
}

}  // namespace fomc_ngin

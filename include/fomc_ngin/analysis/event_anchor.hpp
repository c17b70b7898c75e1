// include/fomc_ngin/analysis/event_anchor.hpp
#pragma once

#include <string>
#include "fomc_ngin/core/calendar.hpp"
#include "fomc_ngin/core/error.hpp"
#include "fomc_ngin/core/types.hpp"

namespace fomc_ngin {

/**
 * @brief Local wall-clock time at which every meeting's event is anchored
 */
struct AnchorConfig {
    int local_seconds_of_day{14 * 3600 + 30 * 60};  // 14:30
    TimeZoneRule zone{"America/New_York", -5 * 3600, true};
};

/**
 * @brief Reference instant of one meeting
 */
struct EventAnchor {
    std::string meeting_id;
    CalendarDate date;
    EpochSeconds t0{0};

    std::string t0_utc() const;
};

class AnchorCalculator {
public:
    explicit AnchorCalculator(AnchorConfig config) : config_(std::move(config)) {}

    /**
     * @brief Anchor for a meeting identified by its YYYY-MM-DD date
     * @return INVALID_DATA for a malformed meeting id, AMBIGUOUS_TIMESTAMP when
     *         the local time cannot be mapped to a single UTC instant
     */
    Result<EventAnchor> compute(const std::string& meeting_id) const;

    const AnchorConfig& config() const {
        return config_;
    }

private:
    AnchorConfig config_;
};

}  // namespace fomc_ngin

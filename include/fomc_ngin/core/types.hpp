// include/fomc_ngin/core/types.hpp

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace fomc_ngin {

/**
 * @brief Timestamp type for consistent time representation
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Whole seconds since the Unix epoch, UTC
 */
using EpochSeconds = std::int64_t;

/**
 * @brief Truncate a timestamp to its epoch-second bucket (floor, also for pre-1970)
 */
inline EpochSeconds to_epoch_seconds(const Timestamp& ts) {
    return std::chrono::floor<std::chrono::seconds>(ts.time_since_epoch()).count();
}

inline Timestamp from_epoch_seconds(EpochSeconds secs) {
    return Timestamp(std::chrono::seconds(secs));
}

/**
 * @brief One observed trade
 */
struct Tick {
    std::string symbol;
    Timestamp event_time;
    Price price{0.0};

    Tick() = default;
    Tick(std::string sym, Timestamp ts, Price p)
        : symbol(std::move(sym)), event_time(ts), price(p) {}
};

/**
 * @brief Row of the meeting anchor list
 */
struct MeetingRow {
    std::string meeting_id;  // YYYY-MM-DD
    std::optional<std::string> video_id;
};

/**
 * @brief Row of the segment/emotion table
 *
 * A segment is anchored either by an absolute UTC timestamp or by an offset
 * from its meeting's event anchor.
 */
struct SegmentRow {
    std::string meeting_id;
    std::int64_t segment_id{0};
    std::string emotion;
    std::optional<EpochSeconds> timestamp_utc;
    std::optional<double> segment_start_s;
};

/**
 * @brief Futures root traded around the event, and the factor applied to raw prices
 */
struct InstrumentSpec {
    std::string root;
    double price_scale{1.0};
};

}  // namespace fomc_ngin

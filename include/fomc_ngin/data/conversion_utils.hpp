//include/fomc_ngin/data/conversion_utils.hpp
#pragma once

#include "fomc_ngin/core/types.hpp"
#include "fomc_ngin/core/error.hpp"
#include <arrow/api.h>
#include <arrow/type_traits.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fomc_ngin {

class DataConversionUtils {
public:
    /**
     * @brief Convert Arrow Table to vector of Ticks
     * @param table Arrow table with ts_event, symbol and price columns
     * @return Result containing vector of Ticks; rows with a null field are dropped
     */
    static Result<std::vector<Tick>> arrow_table_to_ticks(
        const std::shared_ptr<arrow::Table>& table);

    /**
     * @brief Convert Arrow Table to the meeting list
     * @param table Arrow table with a meeting_date or meeting_id column, optional video_id
     * @return Result containing meetings de-duplicated and sorted by id
     */
    static Result<std::vector<MeetingRow>> arrow_table_to_meetings(
        const std::shared_ptr<arrow::Table>& table);

    /**
     * @brief Convert Arrow Table to segment rows
     * @param table Arrow table with meeting_id, segment_id, emotion and optional
     *        timestamp_utc / segment_start_s columns
     * @return Result containing segments in table order
     */
    static Result<std::vector<SegmentRow>> arrow_table_to_segments(
        const std::shared_ptr<arrow::Table>& table);

private:
    /**
     * @brief Single-chunk view of a column, CONFIGURATION_ERROR when absent
     */
    static Result<std::shared_ptr<arrow::Array>> required_column(
        const std::shared_ptr<arrow::Table>& table,
        const std::string& name);

    /**
     * @brief Single-chunk view of a column, nullptr when absent
     */
    static Result<std::shared_ptr<arrow::Array>> optional_column(
        const std::shared_ptr<arrow::Table>& table,
        const std::string& name);

    /**
     * @brief Extract an event time; int64 values are nanoseconds since the epoch
     * @param array Arrow array of timestamps, int64 or ISO-8601 strings
     * @param index Row index
     * @return Result containing timestamp
     */
    static Result<Timestamp> extract_timestamp(
        const std::shared_ptr<arrow::Array>& array,
        int64_t index);

    /**
     * @brief Extract epoch seconds; int64 values are already seconds
     */
    static Result<EpochSeconds> extract_epoch_seconds(
        const std::shared_ptr<arrow::Array>& array,
        int64_t index);

    /**
     * @brief Extract double value from double, float, integer or decimal arrays
     * @param array Arrow array containing numbers
     * @param index Row index
     * @return Result containing double value
     */
    static Result<double> extract_double(
        const std::shared_ptr<arrow::Array>& array,
        int64_t index);

    static Result<int64_t> extract_int64(
        const std::shared_ptr<arrow::Array>& array,
        int64_t index);

    /**
     * @brief Extract string value; date32 values are rendered as YYYY-MM-DD
     * @param array Arrow array containing strings
     * @param index Row index
     * @return Result containing string value
     */
    static Result<std::string> extract_string(
        const std::shared_ptr<arrow::Array>& array,
        int64_t index);
};

} // namespace fomc_ngin

//src/data/conversion_utils.cpp
#include "fomc_ngin/data/conversion_utils.hpp"
#include <arrow/array/concatenate.h>
#include <arrow/type_traits.h>
#include <arrow/util/decimal.h>
#include <cmath>
#include <map>
#include "fomc_ngin/core/calendar.hpp"
#include "fomc_ngin/core/logger.hpp"

namespace fomc_ngin {

namespace {

Timestamp timestamp_from_unit(int64_t value, arrow::TimeUnit::type unit) {
    switch (unit) {
        case arrow::TimeUnit::SECOND:
            return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
                std::chrono::seconds(value)));
        case arrow::TimeUnit::MILLI:
            return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
                std::chrono::milliseconds(value)));
        case arrow::TimeUnit::MICRO:
            return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
                std::chrono::microseconds(value)));
        case arrow::TimeUnit::NANO:
        default:
            return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
                std::chrono::nanoseconds(value)));
    }
}

bool is_null_at(const std::shared_ptr<arrow::Array>& array, int64_t index) {
    return !array || array->IsNull(index);
}

} // namespace

Result<std::shared_ptr<arrow::Array>> DataConversionUtils::optional_column(
    const std::shared_ptr<arrow::Table>& table,
    const std::string& name) {

    auto column = table->GetColumnByName(name);
    if (column == nullptr) {
        return std::shared_ptr<arrow::Array>();
    }

    if (column->num_chunks() == 1) {
        return column->chunk(0);
    }
    if (column->num_chunks() == 0) {
        auto empty = arrow::MakeEmptyArray(column->type());
        if (!empty.ok()) {
            return make_error<std::shared_ptr<arrow::Array>>(
                ErrorCode::CONVERSION_ERROR,
                "Cannot materialize empty column " + name + ": " + empty.status().ToString(),
                "DataConversionUtils"
            );
        }
        return *empty;
    }

    auto combined = arrow::Concatenate(column->chunks());
    if (!combined.ok()) {
        return make_error<std::shared_ptr<arrow::Array>>(
            ErrorCode::CONVERSION_ERROR,
            "Cannot combine chunks of column " + name + ": " + combined.status().ToString(),
            "DataConversionUtils"
        );
    }
    return *combined;
}

Result<std::shared_ptr<arrow::Array>> DataConversionUtils::required_column(
    const std::shared_ptr<arrow::Table>& table,
    const std::string& name) {

    if (table->GetColumnByName(name) == nullptr) {
        return make_error<std::shared_ptr<arrow::Array>>(
            ErrorCode::CONFIGURATION_ERROR,
            "Missing required column: " + name,
            "DataConversionUtils"
        );
    }
    return optional_column(table, name);
}

Result<std::vector<Tick>> DataConversionUtils::arrow_table_to_ticks(
    const std::shared_ptr<arrow::Table>& table) {

    if (!table) {
        return make_error<std::vector<Tick>>(
            ErrorCode::INVALID_ARGUMENT,
            "Table pointer is null",
            "DataConversionUtils"
        );
    }

    auto ts_column = required_column(table, "ts_event");
    if (ts_column.is_error()) return forward_error<std::vector<Tick>>(ts_column, "DataConversionUtils");
    auto symbol_column = required_column(table, "symbol");
    if (symbol_column.is_error()) return forward_error<std::vector<Tick>>(symbol_column, "DataConversionUtils");
    auto price_column = required_column(table, "price");
    if (price_column.is_error()) return forward_error<std::vector<Tick>>(price_column, "DataConversionUtils");

    const auto& ts_array = ts_column.value();
    const auto& symbol_array = symbol_column.value();
    const auto& price_array = price_column.value();

    std::vector<Tick> ticks;
    ticks.reserve(table->num_rows());
    int64_t dropped = 0;

    for (int64_t i = 0; i < table->num_rows(); ++i) {
        if (is_null_at(ts_array, i) || is_null_at(symbol_array, i) || is_null_at(price_array, i)) {
            ++dropped;
            continue;
        }

        auto ts_result = extract_timestamp(ts_array, i);
        if (ts_result.is_error()) {
            return forward_error<std::vector<Tick>>(ts_result, "DataConversionUtils");
        }
        auto symbol_result = extract_string(symbol_array, i);
        if (symbol_result.is_error()) {
            return forward_error<std::vector<Tick>>(symbol_result, "DataConversionUtils");
        }
        auto price_result = extract_double(price_array, i);
        if (price_result.is_error()) {
            return forward_error<std::vector<Tick>>(price_result, "DataConversionUtils");
        }

        ticks.emplace_back(symbol_result.value(), ts_result.value(), price_result.value());
    }

    if (dropped > 0) {
        DEBUG("Dropped " << dropped << " tick rows with null fields");
    }
    return ticks;
}

Result<std::vector<MeetingRow>> DataConversionUtils::arrow_table_to_meetings(
    const std::shared_ptr<arrow::Table>& table) {

    if (!table) {
        return make_error<std::vector<MeetingRow>>(
            ErrorCode::INVALID_ARGUMENT,
            "Table pointer is null",
            "DataConversionUtils"
        );
    }

    const std::string id_name =
        table->GetColumnByName("meeting_date") != nullptr ? "meeting_date" : "meeting_id";
    auto id_column = required_column(table, id_name);
    if (id_column.is_error()) {
        return make_error<std::vector<MeetingRow>>(
            ErrorCode::CONFIGURATION_ERROR,
            "Meeting list needs a meeting_date or meeting_id column",
            "DataConversionUtils"
        );
    }
    auto video_column = optional_column(table, "video_id");
    if (video_column.is_error()) return forward_error<std::vector<MeetingRow>>(video_column, "DataConversionUtils");

    const auto& id_array = id_column.value();
    const auto& video_array = video_column.value();

    std::map<std::string, MeetingRow> unique;
    for (int64_t i = 0; i < table->num_rows(); ++i) {
        if (is_null_at(id_array, i)) continue;

        auto id_result = extract_string(id_array, i);
        if (id_result.is_error()) {
            return forward_error<std::vector<MeetingRow>>(id_result, "DataConversionUtils");
        }

        MeetingRow& row = unique[id_result.value()];
        row.meeting_id = id_result.value();
        if (!row.video_id && !is_null_at(video_array, i)) {
            auto video_result = extract_string(video_array, i);
            if (video_result.is_error()) {
                return forward_error<std::vector<MeetingRow>>(video_result, "DataConversionUtils");
            }
            row.video_id = video_result.value();
        }
    }

    std::vector<MeetingRow> meetings;
    meetings.reserve(unique.size());
    for (auto& entry : unique) {
        meetings.push_back(std::move(entry.second));
    }
    return meetings;
}

Result<std::vector<SegmentRow>> DataConversionUtils::arrow_table_to_segments(
    const std::shared_ptr<arrow::Table>& table) {

    if (!table) {
        return make_error<std::vector<SegmentRow>>(
            ErrorCode::INVALID_ARGUMENT,
            "Table pointer is null",
            "DataConversionUtils"
        );
    }

    auto meeting_column = required_column(table, "meeting_id");
    if (meeting_column.is_error()) return forward_error<std::vector<SegmentRow>>(meeting_column, "DataConversionUtils");
    auto segment_column = required_column(table, "segment_id");
    if (segment_column.is_error()) return forward_error<std::vector<SegmentRow>>(segment_column, "DataConversionUtils");
    auto emotion_column = required_column(table, "emotion");
    if (emotion_column.is_error()) return forward_error<std::vector<SegmentRow>>(emotion_column, "DataConversionUtils");
    auto ts_column = optional_column(table, "timestamp_utc");
    if (ts_column.is_error()) return forward_error<std::vector<SegmentRow>>(ts_column, "DataConversionUtils");
    auto start_column = optional_column(table, "segment_start_s");
    if (start_column.is_error()) return forward_error<std::vector<SegmentRow>>(start_column, "DataConversionUtils");

    if (!ts_column.value() && !start_column.value()) {
        return make_error<std::vector<SegmentRow>>(
            ErrorCode::CONFIGURATION_ERROR,
            "Segment table needs a timestamp_utc or segment_start_s column",
            "DataConversionUtils"
        );
    }

    std::vector<SegmentRow> segments;
    segments.reserve(table->num_rows());

    for (int64_t i = 0; i < table->num_rows(); ++i) {
        if (is_null_at(meeting_column.value(), i) || is_null_at(segment_column.value(), i)) {
            continue;
        }

        SegmentRow row;
        auto meeting_result = extract_string(meeting_column.value(), i);
        if (meeting_result.is_error()) {
            return forward_error<std::vector<SegmentRow>>(meeting_result, "DataConversionUtils");
        }
        row.meeting_id = meeting_result.value();

        auto segment_result = extract_int64(segment_column.value(), i);
        if (segment_result.is_error()) {
            return forward_error<std::vector<SegmentRow>>(segment_result, "DataConversionUtils");
        }
        row.segment_id = segment_result.value();

        if (!is_null_at(emotion_column.value(), i)) {
            auto emotion_result = extract_string(emotion_column.value(), i);
            if (emotion_result.is_error()) {
                return forward_error<std::vector<SegmentRow>>(emotion_result, "DataConversionUtils");
            }
            row.emotion = emotion_result.value();
        }

        if (!is_null_at(ts_column.value(), i)) {
            auto ts_result = extract_epoch_seconds(ts_column.value(), i);
            if (ts_result.is_error()) {
                return forward_error<std::vector<SegmentRow>>(ts_result, "DataConversionUtils");
            }
            row.timestamp_utc = ts_result.value();
        }

        if (!is_null_at(start_column.value(), i)) {
            auto start_result = extract_double(start_column.value(), i);
            if (start_result.is_error()) {
                return forward_error<std::vector<SegmentRow>>(start_result, "DataConversionUtils");
            }
            row.segment_start_s = start_result.value();
        }

        segments.push_back(std::move(row));
    }

    return segments;
}

Result<Timestamp> DataConversionUtils::extract_timestamp(
    const std::shared_ptr<arrow::Array>& array,
    int64_t index) {

    if (!array || index < 0 || index >= array->length()) {
        return make_error<Timestamp>(
            ErrorCode::INVALID_ARGUMENT,
            "Invalid array or index",
            "DataConversionUtils"
        );
    }

    if (array->IsNull(index)) {
        return make_error<Timestamp>(
            ErrorCode::INVALID_DATA,
            "Null timestamp value at index " + std::to_string(index),
            "DataConversionUtils"
        );
    }

    switch (array->type_id()) {
        case arrow::Type::TIMESTAMP: {
            auto ts_type = std::static_pointer_cast<arrow::TimestampType>(array->type());
            auto ts_array = std::static_pointer_cast<arrow::TimestampArray>(array);
            return timestamp_from_unit(ts_array->Value(index), ts_type->unit());
        }
        case arrow::Type::INT64: {
            auto int_array = std::static_pointer_cast<arrow::Int64Array>(array);
            return timestamp_from_unit(int_array->Value(index), arrow::TimeUnit::NANO);
        }
        case arrow::Type::STRING:
        case arrow::Type::LARGE_STRING: {
            auto text = extract_string(array, index);
            if (text.is_error()) return forward_error<Timestamp>(text, "DataConversionUtils");
            return calendar::parse_iso_timestamp(text.value());
        }
        default:
            return make_error<Timestamp>(
                ErrorCode::CONVERSION_ERROR,
                "Unsupported timestamp column type " + array->type()->ToString(),
                "DataConversionUtils"
            );
    }
}

Result<EpochSeconds> DataConversionUtils::extract_epoch_seconds(
    const std::shared_ptr<arrow::Array>& array,
    int64_t index) {

    if (!array || index < 0 || index >= array->length()) {
        return make_error<EpochSeconds>(
            ErrorCode::INVALID_ARGUMENT,
            "Invalid array or index",
            "DataConversionUtils"
        );
    }

    switch (array->type_id()) {
        case arrow::Type::INT64:
        case arrow::Type::INT32:
        case arrow::Type::DOUBLE:
        case arrow::Type::FLOAT: {
            auto value = extract_double(array, index);
            if (value.is_error()) return forward_error<EpochSeconds>(value, "DataConversionUtils");
            return static_cast<EpochSeconds>(std::floor(value.value()));
        }
        default: {
            auto ts = extract_timestamp(array, index);
            if (ts.is_error()) return forward_error<EpochSeconds>(ts, "DataConversionUtils");
            return to_epoch_seconds(ts.value());
        }
    }
}

Result<double> DataConversionUtils::extract_double(
    const std::shared_ptr<arrow::Array>& array,
    int64_t index) {

    if (!array || index < 0 || index >= array->length()) {
        return make_error<double>(
            ErrorCode::INVALID_ARGUMENT,
            "Invalid array or index",
            "DataConversionUtils"
        );
    }

    if (array->IsNull(index)) {
        return make_error<double>(
            ErrorCode::INVALID_DATA,
            "Null numeric value at index " + std::to_string(index),
            "DataConversionUtils"
        );
    }

    switch (array->type_id()) {
        case arrow::Type::DOUBLE:
            return std::static_pointer_cast<arrow::DoubleArray>(array)->Value(index);
        case arrow::Type::FLOAT:
            return static_cast<double>(
                std::static_pointer_cast<arrow::FloatArray>(array)->Value(index));
        case arrow::Type::INT64:
            return static_cast<double>(
                std::static_pointer_cast<arrow::Int64Array>(array)->Value(index));
        case arrow::Type::INT32:
            return static_cast<double>(
                std::static_pointer_cast<arrow::Int32Array>(array)->Value(index));
        case arrow::Type::DECIMAL128: {
            auto dec_type = std::static_pointer_cast<arrow::Decimal128Type>(array->type());
            auto dec_array = std::static_pointer_cast<arrow::Decimal128Array>(array);
            arrow::Decimal128 value(dec_array->GetValue(index));
            return value.ToDouble(dec_type->scale());
        }
        default:
            return make_error<double>(
                ErrorCode::CONVERSION_ERROR,
                "Unsupported numeric column type " + array->type()->ToString(),
                "DataConversionUtils"
            );
    }
}

Result<int64_t> DataConversionUtils::extract_int64(
    const std::shared_ptr<arrow::Array>& array,
    int64_t index) {

    if (!array || index < 0 || index >= array->length()) {
        return make_error<int64_t>(
            ErrorCode::INVALID_ARGUMENT,
            "Invalid array or index",
            "DataConversionUtils"
        );
    }

    switch (array->type_id()) {
        case arrow::Type::INT64:
            if (array->IsNull(index)) break;
            return std::static_pointer_cast<arrow::Int64Array>(array)->Value(index);
        case arrow::Type::INT32:
            if (array->IsNull(index)) break;
            return static_cast<int64_t>(
                std::static_pointer_cast<arrow::Int32Array>(array)->Value(index));
        case arrow::Type::STRING:
        case arrow::Type::LARGE_STRING: {
            auto text = extract_string(array, index);
            if (text.is_error()) return forward_error<int64_t>(text, "DataConversionUtils");
            try {
                size_t consumed = 0;
                int64_t value = std::stoll(text.value(), &consumed);
                if (consumed == text.value().size()) return value;
            } catch (const std::exception&) {
                // reported below
            }
            return make_error<int64_t>(
                ErrorCode::CONVERSION_ERROR,
                "Not an integer: '" + text.value() + "'",
                "DataConversionUtils"
            );
        }
        default: {
            auto value = extract_double(array, index);
            if (value.is_error()) return forward_error<int64_t>(value, "DataConversionUtils");
            if (std::floor(value.value()) != value.value()) {
                return make_error<int64_t>(
                    ErrorCode::CONVERSION_ERROR,
                    "Not an integer: " + std::to_string(value.value()),
                    "DataConversionUtils"
                );
            }
            return static_cast<int64_t>(value.value());
        }
    }

    return make_error<int64_t>(
        ErrorCode::INVALID_DATA,
        "Null integer value at index " + std::to_string(index),
        "DataConversionUtils"
    );
}

Result<std::string> DataConversionUtils::extract_string(
    const std::shared_ptr<arrow::Array>& array,
    int64_t index) {

    if (!array || index < 0 || index >= array->length()) {
        return make_error<std::string>(
            ErrorCode::INVALID_ARGUMENT,
            "Invalid array or index",
            "DataConversionUtils"
        );
    }

    if (array->IsNull(index)) {
        return make_error<std::string>(
            ErrorCode::INVALID_DATA,
            "Null string value at index " + std::to_string(index),
            "DataConversionUtils"
        );
    }

    switch (array->type_id()) {
        case arrow::Type::STRING:
            return std::static_pointer_cast<arrow::StringArray>(array)->GetString(index);
        case arrow::Type::LARGE_STRING:
            return std::static_pointer_cast<arrow::LargeStringArray>(array)->GetString(index);
        case arrow::Type::DATE32: {
            int32_t days = std::static_pointer_cast<arrow::Date32Array>(array)->Value(index);
            return calendar::civil_from_days(days).to_string();
        }
        case arrow::Type::INT64:
            return std::to_string(std::static_pointer_cast<arrow::Int64Array>(array)->Value(index));
        default:
            return make_error<std::string>(
                ErrorCode::CONVERSION_ERROR,
                "Unsupported string column type " + array->type()->ToString(),
                "DataConversionUtils"
            );
    }
}

} // namespace fomc_ngin

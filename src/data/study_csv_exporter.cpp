// src/data/study_csv_exporter.cpp
#include "fomc_ngin/data/study_csv_exporter.hpp"
#include "fomc_ngin/core/logger.hpp"
#include "fomc_ngin/core/time_utils.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace fomc_ngin {

StudyCsvExporter::StudyCsvExporter(const std::string& output_directory)
    : output_directory_(output_directory) {
}

std::string StudyCsvExporter::format_value(const std::optional<double>& value) {
    if (!value) {
        return "";
    }
    std::ostringstream ss;
    ss << std::setprecision(12) << *value;
    return ss.str();
}

std::string StudyCsvExporter::escape_field(const std::string& field) {
    if (field.find_first_of(",\"\n") == std::string::npos) {
        return field;
    }
    std::string escaped = "\"";
    for (char c : field) {
        if (c == '"') escaped += '"';
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

Result<void> StudyCsvExporter::open(const std::string& filename, std::ofstream& file) const {
    try {
        std::filesystem::create_directories(output_directory_);
    } catch (const std::exception& e) {
        return make_error<void>(
            ErrorCode::FILE_IO_ERROR,
            "Cannot create output directory " + output_directory_ + ": " + e.what(),
            "StudyCsvExporter"
        );
    }

    file.open(std::filesystem::path(output_directory_) / filename);
    if (!file.is_open()) {
        return make_error<void>(
            ErrorCode::FILE_IO_ERROR,
            "Failed to open " + filename + " for writing",
            "StudyCsvExporter"
        );
    }
    return Result<void>();
}

Result<void> StudyCsvExporter::write_surprises(
    const std::vector<SurpriseRecord>& surprises) const {

    std::ofstream file;
    auto opened = open("surprises.csv", file);
    if (opened.is_error()) return opened;

    file << "meeting_id,t0_utc,primary_symbol,fallback_symbol,symbol_used,price_pre,price_post,"
         << "implied_pre,implied_post,delta_implied_bps,days_in_month,"
         << "days_remaining_after_announcement,scaling_factor,target_surprise_bps,notes\n";

    for (const auto& r : surprises) {
        file << r.meeting_id << ","
             << r.t0_utc << ","
             << r.primary_symbol << ","
             << r.fallback_symbol << ","
             << r.symbol_used.value_or("") << ","
             << format_value(r.price_pre) << ","
             << format_value(r.price_post) << ","
             << format_value(r.implied_pre) << ","
             << format_value(r.implied_post) << ","
             << format_value(r.delta_implied_bps) << ","
             << r.days_in_month << ","
             << r.days_remaining_after_announcement << ","
             << format_value(r.scaling_factor) << ","
             << format_value(r.target_surprise_bps) << ","
             << escape_field(r.notes) << "\n";
    }

    if (!file) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing surprises.csv",
                                "StudyCsvExporter");
    }
    INFO("Wrote " << surprises.size() << " rows to surprises.csv");
    return Result<void>();
}

Result<void> StudyCsvExporter::write_surprise_summary(
    const std::vector<SurpriseRecord>& surprises) const {

    std::ofstream file;
    auto opened = open("surprises_summary.txt", file);
    if (opened.is_error()) return opened;

    size_t resolved = 0;
    for (const auto& r : surprises) {
        if (r.symbol_used) ++resolved;
    }

    file << "Fed funds futures surprises per meeting (bps)\n";
    file << "meetings: " << surprises.size() << ", resolved: " << resolved << "\n\n";
    file << "meeting_id,symbol_used,delta_implied_bps,target_surprise_bps\n";
    for (const auto& r : surprises) {
        file << r.meeting_id << ","
             << r.symbol_used.value_or("none") << ","
             << format_value(r.delta_implied_bps) << ","
             << format_value(r.target_surprise_bps) << "\n";
    }

    if (!file) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing surprises_summary.txt",
                                "StudyCsvExporter");
    }
    return Result<void>();
}

Result<void> StudyCsvExporter::write_forward_returns(
    const std::vector<ForwardReturnRow>& rows) const {

    std::ofstream file;
    auto opened = open("forward_returns.csv", file);
    if (opened.is_error()) return opened;

    file << "meeting_id,instrument_symbol,segment_id,anchor_timestamp,horizon_s,price_delta,status\n";
    for (const auto& row : rows) {
        file << row.meeting_id << ","
             << row.instrument_symbol << ","
             << row.segment_id << ","
             << core::format_utc(row.anchor_timestamp) << ","
             << row.horizon_seconds << ","
             << format_value(row.price_delta) << ","
             << return_status_to_string(row.status) << "\n";
    }

    if (!file) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing forward_returns.csv",
                                "StudyCsvExporter");
    }
    INFO("Wrote " << rows.size() << " rows to forward_returns.csv");
    return Result<void>();
}

Result<void> StudyCsvExporter::write_features(const FeatureTable& table) const {
    std::ofstream file;
    auto opened = open("features.csv", file);
    if (opened.is_error()) return opened;

    file << "meeting_id,segment_id,instrument_symbol,anchor_timestamp,emotion";
    for (const auto& label : table.indicator_labels) {
        file << ",emo_" << label;
    }
    file << ",is_non_neutral,pre_px,target_surprise_bps";
    for (int h : table.horizons) {
        file << ",d_px_" << h;
    }
    for (int h : table.horizons) {
        file << ",d_px_" << h << "_w";
    }
    file << "\n";

    for (const auto& row : table.rows) {
        file << row.meeting_id << ","
             << row.segment_id << ","
             << row.instrument_symbol << ","
             << core::format_utc(row.anchor_timestamp) << ","
             << escape_field(row.emotion);
        for (int indicator : row.indicators) {
            file << "," << indicator;
        }
        file << "," << row.is_non_neutral
             << "," << format_value(row.pre_px)
             << "," << format_value(row.target_surprise_bps);
        for (const auto& delta : row.deltas) {
            file << "," << format_value(delta);
        }
        for (const auto& delta : row.winsorized_deltas) {
            file << "," << format_value(delta);
        }
        file << "\n";
    }

    if (!file) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing features.csv",
                                "StudyCsvExporter");
    }
    INFO("Wrote " << table.rows.size() << " rows to features.csv");
    return Result<void>();
}

Result<void> StudyCsvExporter::write_emotion_counts(
    const std::vector<EmotionCount>& counts) const {

    std::ofstream file;
    auto opened = open("emotion_counts.csv", file);
    if (opened.is_error()) return opened;

    file << "instrument_symbol,emotion,count\n";
    for (const auto& c : counts) {
        file << c.instrument_symbol << "," << escape_field(c.label) << "," << c.count << "\n";
    }

    if (!file) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing emotion_counts.csv",
                                "StudyCsvExporter");
    }
    return Result<void>();
}

Result<void> StudyCsvExporter::write_diagnostics(const RunDiagnostics& diagnostics) const {
    std::ofstream file;
    auto opened = open("diagnostics.json", file);
    if (opened.is_error()) return opened;

    file << diagnostics.to_json().dump(2) << "\n";
    if (!file) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing diagnostics.json",
                                "StudyCsvExporter");
    }
    return Result<void>();
}

Result<void> StudyCsvExporter::write_all(const StudyResult& result) const {
    auto status = write_surprises(result.surprises);
    if (status.is_error()) return status;
    status = write_surprise_summary(result.surprises);
    if (status.is_error()) return status;
    status = write_forward_returns(result.forward_returns);
    if (status.is_error()) return status;
    status = write_features(result.features);
    if (status.is_error()) return status;
    status = write_emotion_counts(result.emotion_counts);
    if (status.is_error()) return status;
    return write_diagnostics(result.diagnostics);
}

} // namespace fomc_ngin

// include/fomc_ngin/data/study_csv_exporter.hpp
#pragma once

#include "fomc_ngin/analysis/event_study_runner.hpp"
#include "fomc_ngin/core/error.hpp"
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace fomc_ngin {

/**
 * @brief Writes run outputs to an output directory
 *
 * Unavailable values are written as empty fields.
 */
class StudyCsvExporter {
public:
    explicit StudyCsvExporter(const std::string& output_directory);

    /**
     * @brief Write every output file of a run
     */
    Result<void> write_all(const StudyResult& result) const;

    Result<void> write_surprises(const std::vector<SurpriseRecord>& surprises) const;
    Result<void> write_surprise_summary(const std::vector<SurpriseRecord>& surprises) const;
    Result<void> write_forward_returns(const std::vector<ForwardReturnRow>& rows) const;
    Result<void> write_features(const FeatureTable& table) const;
    Result<void> write_emotion_counts(const std::vector<EmotionCount>& counts) const;
    Result<void> write_diagnostics(const RunDiagnostics& diagnostics) const;

    static std::string format_value(const std::optional<double>& value);
    static std::string escape_field(const std::string& field);

private:
    Result<void> open(const std::string& filename, std::ofstream& file) const;

    std::string output_directory_;
};

} // namespace fomc_ngin

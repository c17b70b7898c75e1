// include/fomc_ngin/analysis/config_loader.hpp

#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "fomc_ngin/analysis/event_anchor.hpp"
#include "fomc_ngin/analysis/feature_assembler.hpp"
#include "fomc_ngin/analysis/forward_return_engine.hpp"
#include "fomc_ngin/analysis/surprise_calculator.hpp"
#include "fomc_ngin/core/config_base.hpp"
#include "fomc_ngin/core/error.hpp"
#include "fomc_ngin/core/logger.hpp"
#include "fomc_ngin/core/types.hpp"
#include "fomc_ngin/market/price_series.hpp"

namespace fomc_ngin {

/**
 * @brief Input and output locations
 */
struct IoConfig {
    // {root} and {date} are substituted; a directory resolves to its first .parquet file
    std::string tick_path_template{"data/ticks/{root}/date={date}"};
    std::string meetings_path{"data/meetings.csv"};
    std::string segments_path{"data/segments.csv"};
    std::string output_dir{"output"};
    int max_retries{3};

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["tick_path_template"] = tick_path_template;
        j["meetings_path"] = meetings_path;
        j["segments_path"] = segments_path;
        j["output_dir"] = output_dir;
        j["max_retries"] = max_retries;
        return j;
    }

    void from_json(const nlohmann::json& j) {
        if (j.contains("tick_path_template"))
            tick_path_template = j.at("tick_path_template").get<std::string>();
        if (j.contains("meetings_path"))
            meetings_path = j.at("meetings_path").get<std::string>();
        if (j.contains("segments_path"))
            segments_path = j.at("segments_path").get<std::string>();
        if (j.contains("output_dir"))
            output_dir = j.at("output_dir").get<std::string>();
        if (j.contains("max_retries"))
            max_retries = j.at("max_retries").get<int>();
    }
};

/**
 * @brief The single immutable configuration value of an event-study run
 *
 * Enumerated options are kept as their JSON strings and converted by the
 * component accessors, which fail with CONFIGURATION_ERROR on bad values.
 */
struct StudyConfig : public ConfigBase {
    std::vector<int> horizons = default_horizons();
    int pre_window_s{600};
    int post_window_s{600};
    double winsor_sigma{3.0};
    std::string anchor_local_time{"14:30"};
    std::string anchor_timezone{"America/New_York"};
    std::vector<InstrumentSpec> instruments{{"ES", 0.01}, {"ZT", 1.0}};
    std::string contract_filter{"all"};
    std::string surprise_root{"ZQ"};
    int pre_price_offset_s{60};
    std::vector<std::string> emotion_labels{"neutral", "happy", "surprise", "anxious"};
    std::string baseline_label{"neutral"};
    std::string missing_forward_policy{"carry_forward"};
    int num_workers{4};
    IoConfig io;
    LoggerConfig logging;

    /**
     * @brief 0 to 300 seconds in steps of 25
     */
    static std::vector<int> default_horizons();

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    Result<AnchorConfig> anchor_config() const;
    SurpriseConfig surprise_config() const;
    Result<ForwardReturnConfig> forward_return_config() const;
    FeatureConfig feature_config() const;
    Result<ContractFilter> contract_filter_value() const;
};

/**
 * @brief Loads a StudyConfig from a defaults file and an optional override file
 *
 * Values in the override file win; nested objects are merged key by key.
 */
class ConfigLoader {
public:
    /**
     * @brief Load, merge and validate configuration
     * @param defaults_path Path to the defaults file (e.g. config/defaults.json)
     * @param override_path Optional run-specific file; empty path for none
     * @return Result containing StudyConfig or error
     */
    static Result<StudyConfig> load(const std::filesystem::path& defaults_path,
                                    const std::filesystem::path& override_path = {});

    /**
     * @brief Extract and validate a StudyConfig from an already merged document
     */
    static Result<StudyConfig> from_json(const nlohmann::json& merged);

    /**
     * @brief Check every option against its allowed range
     * @return CONFIGURATION_ERROR describing the first violation
     */
    static Result<void> validate_config(const StudyConfig& config);

private:
    static Result<nlohmann::json> load_json_file(const std::filesystem::path& file_path);

    /**
     * @brief Recursively merge JSON objects
     *
     * For nested objects, performs deep merge. For other types, source overwrites target.
     */
    static void merge_json(nlohmann::json& target, const nlohmann::json& source);

    static void log_config_summary(const StudyConfig& config);
};

}  // namespace fomc_ngin

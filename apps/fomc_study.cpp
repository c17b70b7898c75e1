#include <iostream>
#include <memory>
#include <string>
#include "fomc_ngin/analysis/event_study_runner.hpp"
#include "fomc_ngin/analysis/config_loader.hpp"
#include "fomc_ngin/core/logger.hpp"
#include "fomc_ngin/data/conversion_utils.hpp"
#include "fomc_ngin/data/file_tick_source.hpp"
#include "fomc_ngin/data/study_csv_exporter.hpp"
#include "fomc_ngin/data/table_reader.hpp"

using namespace fomc_ngin;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [defaults.json] [override.json]\n"
              << "  defaults.json  base configuration (default: config/defaults.json)\n"
              << "  override.json  optional run-specific values merged over the defaults\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc > 3 || (argc > 1 && (std::string(argv[1]) == "-h" ||
                                  std::string(argv[1]) == "--help"))) {
        print_usage(argv[0]);
        return argc > 3 ? 1 : 0;
    }

    const std::string defaults_path = argc > 1 ? argv[1] : "config/defaults.json";
    const std::string override_path = argc > 2 ? argv[2] : "";

    try {
        Logger::reset_for_tests();

        auto config_result = ConfigLoader::load(defaults_path, override_path);
        if (config_result.is_error()) {
            std::cerr << "Failed to load configuration: " << config_result.error()->to_string()
                      << std::endl;
            return 1;
        }
        const StudyConfig& config = config_result.value();

        auto& logger = Logger::instance();
        logger.initialize(config.logging);
        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }
        INFO("Logger initialized successfully");

        // Inputs
        TableReader reader(config.io.max_retries);

        auto meetings_table = reader.read_table(config.io.meetings_path);
        if (meetings_table.is_error()) {
            ERROR("Failed to read meeting list: " << meetings_table.error()->to_string());
            return 1;
        }
        auto meetings = DataConversionUtils::arrow_table_to_meetings(meetings_table.value());
        if (meetings.is_error()) {
            ERROR("Invalid meeting list: " << meetings.error()->to_string());
            return 1;
        }

        auto segments_table = reader.read_table(config.io.segments_path);
        if (segments_table.is_error()) {
            ERROR("Failed to read segment table: " << segments_table.error()->to_string());
            return 1;
        }
        auto segments = DataConversionUtils::arrow_table_to_segments(segments_table.value());
        if (segments.is_error()) {
            ERROR("Invalid segment table: " << segments.error()->to_string());
            return 1;
        }
        INFO("Loaded " << meetings.value().size() << " meetings and "
                       << segments.value().size() << " segments");

        // Run
        auto source =
            std::make_shared<FileTickSource>(config.io.tick_path_template, config.io.max_retries);
        EventStudyRunner runner(config, source);
        auto result = runner.run(meetings.value(), segments.value());
        if (result.is_error()) {
            ERROR("Event study failed: " << result.error()->to_string());
            return 1;
        }

        // Outputs
        StudyCsvExporter exporter(config.io.output_dir);
        auto written = exporter.write_all(result.value());
        if (written.is_error()) {
            ERROR("Failed to write outputs: " << written.error()->to_string());
            return 1;
        }
        INFO("Outputs written to " << config.io.output_dir);

        const auto& diagnostics = result.value().diagnostics;
        for (const auto& [reason, count] : diagnostics.skips) {
            INFO("Skipped " << count << " x " << reason);
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}

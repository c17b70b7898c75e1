// src/analysis/config_loader.cpp

#include "fomc_ngin/analysis/config_loader.hpp"

#include <cmath>
#include <fstream>
#include <set>

#include "fomc_ngin/core/calendar.hpp"

namespace fomc_ngin {

std::vector<int> StudyConfig::default_horizons() {
    std::vector<int> horizons;
    for (int h = 0; h <= 300; h += 25) {
        horizons.push_back(h);
    }
    return horizons;
}

nlohmann::json StudyConfig::to_json() const {
    nlohmann::json j;
    j["horizons"] = horizons;
    j["pre_window_s"] = pre_window_s;
    j["post_window_s"] = post_window_s;
    j["winsor_sigma"] = winsor_sigma;
    j["anchor_local_time"] = anchor_local_time;
    j["anchor_timezone"] = anchor_timezone;

    nlohmann::json instruments_array = nlohmann::json::array();
    for (const auto& instrument : instruments) {
        instruments_array.push_back(
            {{"root", instrument.root}, {"price_scale", instrument.price_scale}});
    }
    j["instruments"] = instruments_array;

    j["contract_filter"] = contract_filter;
    j["surprise_root"] = surprise_root;
    j["pre_price_offset_s"] = pre_price_offset_s;
    j["emotion_labels"] = emotion_labels;
    j["baseline_label"] = baseline_label;
    j["missing_forward_policy"] = missing_forward_policy;
    j["num_workers"] = num_workers;
    j["io"] = io.to_json();
    j["logging"] = logging.to_json();
    return j;
}

void StudyConfig::from_json(const nlohmann::json& j) {
    if (j.contains("horizons"))
        horizons = j.at("horizons").get<std::vector<int>>();
    if (j.contains("pre_window_s"))
        pre_window_s = j.at("pre_window_s").get<int>();
    if (j.contains("post_window_s"))
        post_window_s = j.at("post_window_s").get<int>();
    if (j.contains("winsor_sigma"))
        winsor_sigma = j.at("winsor_sigma").get<double>();
    if (j.contains("anchor_local_time"))
        anchor_local_time = j.at("anchor_local_time").get<std::string>();
    if (j.contains("anchor_timezone"))
        anchor_timezone = j.at("anchor_timezone").get<std::string>();
    if (j.contains("instruments")) {
        instruments.clear();
        for (const auto& item : j.at("instruments")) {
            InstrumentSpec spec;
            spec.root = item.at("root").get<std::string>();
            if (item.contains("price_scale"))
                spec.price_scale = item.at("price_scale").get<double>();
            instruments.push_back(spec);
        }
    }
    if (j.contains("contract_filter"))
        contract_filter = j.at("contract_filter").get<std::string>();
    if (j.contains("surprise_root"))
        surprise_root = j.at("surprise_root").get<std::string>();
    if (j.contains("pre_price_offset_s"))
        pre_price_offset_s = j.at("pre_price_offset_s").get<int>();
    if (j.contains("emotion_labels")) {
        emotion_labels.clear();
        for (const auto& label : j.at("emotion_labels")) {
            emotion_labels.push_back(FeatureAssembler::normalize_label(label.get<std::string>()));
        }
    }
    if (j.contains("baseline_label"))
        baseline_label =
            FeatureAssembler::normalize_label(j.at("baseline_label").get<std::string>());
    if (j.contains("missing_forward_policy"))
        missing_forward_policy = j.at("missing_forward_policy").get<std::string>();
    if (j.contains("num_workers"))
        num_workers = j.at("num_workers").get<int>();
    if (j.contains("io"))
        io.from_json(j.at("io"));
    if (j.contains("logging"))
        logging.from_json(j.at("logging"));
}

Result<AnchorConfig> StudyConfig::anchor_config() const {
    auto seconds = calendar::parse_time_of_day(anchor_local_time);
    if (seconds.is_error()) {
        return make_error<AnchorConfig>(ErrorCode::CONFIGURATION_ERROR,
                                        "Invalid anchor_local_time '" + anchor_local_time +
                                            "': " + seconds.error()->what(),
                                        "StudyConfig");
    }
    auto zone = TimeZoneRule::lookup(anchor_timezone);
    if (zone.is_error()) {
        return forward_error<AnchorConfig>(zone, "StudyConfig");
    }

    AnchorConfig config;
    config.local_seconds_of_day = seconds.value();
    config.zone = zone.value();
    return config;
}

SurpriseConfig StudyConfig::surprise_config() const {
    SurpriseConfig config;
    config.root = surprise_root;
    config.pre_window_s = pre_window_s;
    config.post_window_s = post_window_s;
    return config;
}

Result<ForwardReturnConfig> StudyConfig::forward_return_config() const {
    auto policy = missing_forward_policy_from_string(missing_forward_policy);
    if (policy.is_error()) {
        return forward_error<ForwardReturnConfig>(policy, "StudyConfig");
    }
    ForwardReturnConfig config;
    config.horizons = horizons;
    config.policy = policy.value();
    return config;
}

FeatureConfig StudyConfig::feature_config() const {
    FeatureConfig config;
    config.emotion_labels = emotion_labels;
    config.baseline_label = baseline_label;
    config.winsor_sigma = winsor_sigma;
    config.pre_price_offset_s = pre_price_offset_s;
    config.horizons = horizons;
    return config;
}

Result<ContractFilter> StudyConfig::contract_filter_value() const {
    return contract_filter_from_string(contract_filter);
}

Result<nlohmann::json> ConfigLoader::load_json_file(const std::filesystem::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return make_error<nlohmann::json>(ErrorCode::FILE_NOT_FOUND,
                                          "Failed to open config file: " + file_path.string(),
                                          "ConfigLoader");
    }

    try {
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<nlohmann::json>(
            ErrorCode::JSON_PARSE_ERROR,
            "Failed to parse JSON file " + file_path.string() + ": " + e.what(), "ConfigLoader");
    } catch (const std::exception& e) {
        return make_error<nlohmann::json>(ErrorCode::FILE_IO_ERROR,
                                          "Error reading config file " + file_path.string() + ": " +
                                              e.what(),
                                          "ConfigLoader");
    }
}

void ConfigLoader::merge_json(nlohmann::json& target, const nlohmann::json& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        const auto& key = it.key();
        const auto& value = it.value();

        if (target.contains(key) && target[key].is_object() && value.is_object()) {
            merge_json(target[key], value);
        } else {
            target[key] = value;
        }
    }
}

Result<void> ConfigLoader::validate_config(const StudyConfig& config) {
    auto fail = [](const std::string& message) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR, message, "ConfigLoader");
    };

    if (config.horizons.empty()) {
        return fail("horizons must not be empty");
    }
    std::set<int> seen;
    for (int h : config.horizons) {
        if (h < 0) {
            return fail("horizons must be non-negative, got " + std::to_string(h));
        }
        if (!seen.insert(h).second) {
            return fail("duplicate horizon " + std::to_string(h));
        }
    }
    if (config.pre_window_s <= 0 || config.post_window_s <= 0) {
        return fail("pre_window_s and post_window_s must be positive");
    }
    if (!std::isfinite(config.winsor_sigma) || config.winsor_sigma < 0.0) {
        return fail("winsor_sigma must be >= 0");
    }
    if (config.pre_price_offset_s < 0) {
        return fail("pre_price_offset_s must be non-negative");
    }
    if (config.num_workers < 1) {
        return fail("num_workers must be at least 1");
    }
    if (config.io.max_retries < 0) {
        return fail("io.max_retries must be non-negative");
    }

    auto anchor = config.anchor_config();
    if (anchor.is_error()) {
        return fail(anchor.error()->what());
    }

    if (config.instruments.empty()) {
        return fail("instruments must not be empty");
    }
    std::set<std::string> roots;
    for (const auto& instrument : config.instruments) {
        auto filter = SingleLegFilter::create(instrument.root);
        if (filter.is_error()) {
            return fail(filter.error()->what());
        }
        if (!std::isfinite(instrument.price_scale) || instrument.price_scale <= 0.0) {
            return fail("price_scale of " + instrument.root + " must be positive");
        }
        if (!roots.insert(instrument.root).second) {
            return fail("duplicate instrument root " + instrument.root);
        }
    }

    auto surprise_filter = SingleLegFilter::create(config.surprise_root);
    if (surprise_filter.is_error()) {
        return fail(surprise_filter.error()->what());
    }

    auto contract_filter = config.contract_filter_value();
    if (contract_filter.is_error()) {
        return fail(contract_filter.error()->what());
    }
    auto forward = config.forward_return_config();
    if (forward.is_error()) {
        return fail(forward.error()->what());
    }

    FeatureAssembler assembler(config.feature_config());
    auto labels = assembler.validate();
    if (labels.is_error()) {
        return fail(labels.error()->what());
    }
    return Result<void>();
}

void ConfigLoader::log_config_summary(const StudyConfig& config) {
    auto& logger = Logger::instance();
    if (!logger.is_initialized()) {
        return;
    }
    INFO("Config summary: horizons=" << config.horizons.size() << " ("
                                     << config.horizons.front() << ".." << config.horizons.back()
                                     << "s), windows=" << config.pre_window_s << "/"
                                     << config.post_window_s << "s, winsor_sigma="
                                     << config.winsor_sigma);
    INFO("Config summary: anchor=" << config.anchor_local_time << " " << config.anchor_timezone
                                   << ", instruments=" << config.instruments.size()
                                   << ", surprise_root=" << config.surprise_root
                                   << ", contract_filter=" << config.contract_filter
                                   << ", workers=" << config.num_workers);
}

Result<StudyConfig> ConfigLoader::from_json(const nlohmann::json& merged) {
    StudyConfig config;
    try {
        config.from_json(merged);
    } catch (const std::exception& e) {
        return make_error<StudyConfig>(ErrorCode::CONFIGURATION_ERROR,
                                       "Failed to extract config: " + std::string(e.what()),
                                       "ConfigLoader");
    }

    auto validation_result = validate_config(config);
    if (validation_result.is_error()) {
        return forward_error<StudyConfig>(validation_result, "ConfigLoader");
    }
    return config;
}

Result<StudyConfig> ConfigLoader::load(const std::filesystem::path& defaults_path,
                                       const std::filesystem::path& override_path) {
    auto defaults_result = load_json_file(defaults_path);
    if (defaults_result.is_error()) {
        return make_error<StudyConfig>(defaults_result.error()->code(),
                                       "Failed to load defaults: " +
                                           std::string(defaults_result.error()->what()),
                                       "ConfigLoader");
    }
    nlohmann::json merged = defaults_result.value();

    if (!override_path.empty()) {
        auto override_result = load_json_file(override_path);
        if (override_result.is_error()) {
            return make_error<StudyConfig>(override_result.error()->code(),
                                           "Failed to load override: " +
                                               std::string(override_result.error()->what()),
                                           "ConfigLoader");
        }
        merge_json(merged, override_result.value());
    }

    auto config_result = from_json(merged);
    if (config_result.is_error()) {
        return config_result;
    }

    log_config_summary(config_result.value());
    return config_result;
}

}  // namespace fomc_ngin

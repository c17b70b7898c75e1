// src/data/file_tick_source.cpp
#include "fomc_ngin/data/file_tick_source.hpp"
#include <algorithm>
#include <filesystem>
#include "fomc_ngin/core/logger.hpp"
#include "fomc_ngin/data/conversion_utils.hpp"

namespace fomc_ngin {

namespace {

void replace_all(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

}  // namespace

FileTickSource::FileTickSource(std::string path_template, int max_retries)
    : path_template_(std::move(path_template)), reader_(max_retries) {}

std::string FileTickSource::expand_template(const std::string& path_template,
                                            const std::string& root, const CalendarDate& day) {
    std::string path = path_template;
    replace_all(path, "{root}", root);
    replace_all(path, "{date}", day.to_string());
    return path;
}

Result<std::string> FileTickSource::resolve_path(const std::string& root,
                                                 const CalendarDate& day) const {
    namespace fs = std::filesystem;
    const std::string path = expand_template(path_template_, root, day);

    std::error_code ec;
    if (fs::is_regular_file(path, ec)) {
        return path;
    }
    if (fs::is_directory(path, ec)) {
        std::vector<std::string> candidates;
        for (const auto& entry : fs::directory_iterator(path, ec)) {
            if (entry.is_regular_file() && entry.path().extension() == ".parquet") {
                candidates.push_back(entry.path().string());
            }
        }
        if (ec) {
            return make_error<std::string>(ErrorCode::FILE_IO_ERROR,
                                           "Cannot list " + path + ": " + ec.message(),
                                           "FileTickSource");
        }
        if (!candidates.empty()) {
            return *std::min_element(candidates.begin(), candidates.end());
        }
    }
    return make_error<std::string>(ErrorCode::DATA_UNAVAILABLE,
                                   "No ticks for " + root + " " + day.to_string() + " under " +
                                       path,
                                   "FileTickSource");
}

Result<std::vector<Tick>> FileTickSource::load_ticks(const std::string& root,
                                                     const CalendarDate& day) {
    auto path = resolve_path(root, day);
    if (path.is_error()) {
        return forward_error<std::vector<Tick>>(path, "FileTickSource");
    }

    auto table = reader_.read_table(path.value());
    if (table.is_error()) {
        if (table.error()->code() == ErrorCode::FILE_NOT_FOUND) {
            return make_error<std::vector<Tick>>(ErrorCode::DATA_UNAVAILABLE,
                                                 table.error()->what(), "FileTickSource");
        }
        return forward_error<std::vector<Tick>>(table, "FileTickSource");
    }

    auto ticks = DataConversionUtils::arrow_table_to_ticks(table.value());
    if (ticks.is_error()) {
        return make_error<std::vector<Tick>>(ticks.error()->code(),
                                             path.value() + ": " + ticks.error()->what(),
                                             "FileTickSource");
    }

    DEBUG("Loaded " << ticks.value().size() << " ticks for " << root << " " << day.to_string()
                    << " from " << path.value());
    return ticks;
}

}  // namespace fomc_ngin

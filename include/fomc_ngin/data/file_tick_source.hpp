// include/fomc_ngin/data/file_tick_source.hpp
#pragma once

#include <string>
#include <vector>
#include "fomc_ngin/data/table_reader.hpp"
#include "fomc_ngin/data/tick_source.hpp"

namespace fomc_ngin {

/**
 * @brief Tick source backed by per-(root, day) Parquet or CSV files
 *
 * The path template may contain {root} and {date} (YYYY-MM-DD). When the
 * expanded path is a directory, its first .parquet file in name order is read.
 */
class FileTickSource : public TickSource {
public:
    FileTickSource(std::string path_template, int max_retries = 3);

    Result<std::vector<Tick>> load_ticks(const std::string& root,
                                         const CalendarDate& day) override;

    /**
     * @brief Substitute {root} and {date} in a template
     */
    static std::string expand_template(const std::string& path_template, const std::string& root,
                                       const CalendarDate& day);

    /**
     * @brief File to read for a (root, day)
     * @return DATA_UNAVAILABLE when nothing exists at the expanded path
     */
    Result<std::string> resolve_path(const std::string& root, const CalendarDate& day) const;

private:
    std::string path_template_;
    TableReader reader_;
};

}  // namespace fomc_ngin

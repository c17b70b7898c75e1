// include/fomc_ngin/data/table_reader.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include "fomc_ngin/core/error.hpp"

namespace fomc_ngin {

/**
 * @brief Reads Parquet and CSV files into Arrow tables
 *
 * The format is chosen by extension (.parquet / .pq, .csv). Failed reads
 * are retried with exponential backoff.
 */
class TableReader {
public:
    explicit TableReader(int max_retries = 3) : max_retries_(max_retries) {}

    /**
     * @brief Read a table
     * @return FILE_NOT_FOUND when the path does not exist, FILE_IO_ERROR when the
     *         file cannot be read, INVALID_ARGUMENT for an unsupported extension
     */
    Result<std::shared_ptr<arrow::Table>> read_table(const std::string& path) const;

    static Result<std::shared_ptr<arrow::Table>> read_parquet(const std::string& path);
    static Result<std::shared_ptr<arrow::Table>> read_csv(const std::string& path);

private:
    int max_retries_;
};

}  // namespace fomc_ngin

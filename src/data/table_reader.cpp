// src/data/table_reader.cpp
#include "fomc_ngin/data/table_reader.hpp"
#include <algorithm>
#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <cctype>
#include <filesystem>
#include <parquet/arrow/reader.h>
#include "fomc_ngin/data/retry.hpp"

namespace fomc_ngin {

namespace {

std::string lower_extension(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

}  // namespace

Result<std::shared_ptr<arrow::Table>> TableReader::read_table(const std::string& path) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return make_error<std::shared_ptr<arrow::Table>>(ErrorCode::FILE_NOT_FOUND,
                                                         "No such file: " + path, "TableReader");
    }

    const std::string ext = lower_extension(path);
    if (ext == ".parquet" || ext == ".pq") {
        return utils::retry_with_backoff([&path]() { return read_parquet(path); }, max_retries_);
    }
    if (ext == ".csv") {
        return utils::retry_with_backoff([&path]() { return read_csv(path); }, max_retries_);
    }
    return make_error<std::shared_ptr<arrow::Table>>(
        ErrorCode::INVALID_ARGUMENT, "Unsupported table format '" + ext + "': " + path,
        "TableReader");
}

Result<std::shared_ptr<arrow::Table>> TableReader::read_parquet(const std::string& path) {
    auto infile = arrow::io::ReadableFile::Open(path);
    if (!infile.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::FILE_IO_ERROR, "Failed to open " + path + ": " + infile.status().ToString(),
            "TableReader");
    }

    parquet::arrow::FileReaderBuilder builder;
    arrow::Status status = builder.Open(*infile);
    if (!status.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::FILE_IO_ERROR, "Not a readable parquet file " + path + ": " + status.ToString(),
            "TableReader");
    }

    std::unique_ptr<parquet::arrow::FileReader> reader;
    status = builder.memory_pool(arrow::default_memory_pool())->Build(&reader);
    if (!status.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::FILE_IO_ERROR, "Failed to create parquet reader for " + path + ": " +
                                          status.ToString(),
            "TableReader");
    }

    std::shared_ptr<arrow::Table> table;
    status = reader->ReadTable(&table);
    if (!status.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::FILE_IO_ERROR, "Failed to read " + path + ": " + status.ToString(),
            "TableReader");
    }
    return table;
}

Result<std::shared_ptr<arrow::Table>> TableReader::read_csv(const std::string& path) {
    auto infile = arrow::io::ReadableFile::Open(path);
    if (!infile.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::FILE_IO_ERROR, "Failed to open " + path + ": " + infile.status().ToString(),
            "TableReader");
    }

    auto read_options = arrow::csv::ReadOptions::Defaults();
    auto parse_options = arrow::csv::ParseOptions::Defaults();
    auto convert_options = arrow::csv::ConvertOptions::Defaults();

    auto reader = arrow::csv::TableReader::Make(arrow::io::default_io_context(), *infile,
                                                read_options, parse_options, convert_options);
    if (!reader.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::FILE_IO_ERROR,
            "Failed to create CSV reader for " + path + ": " + reader.status().ToString(),
            "TableReader");
    }

    auto table = (*reader)->Read();
    if (!table.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::FILE_IO_ERROR, "Failed to read " + path + ": " + table.status().ToString(),
            "TableReader");
    }
    return *table;
}

}  // namespace fomc_ngin

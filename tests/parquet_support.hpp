#pragma once

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <memory>
#include <string>

namespace parcel_test {

inline auto tmp(const char* name) -> std::filesystem::path {
    return std::filesystem::temp_directory_path() / name;
}

/// Parquet file contents plus its row-group count.
struct ReadBack {
    std::shared_ptr<arrow::Table> table;
    int row_groups = 0;
};

inline auto read_back(const std::string& path) -> ReadBack {
    auto input_result = arrow::io::ReadableFile::Open(path);
    REQUIRE(input_result.ok());

    std::unique_ptr<parquet::arrow::FileReader> reader;
    auto st = parquet::arrow::OpenFile(input_result.ValueOrDie(), arrow::default_memory_pool(),
                                       &reader);
    REQUIRE(st.ok());

    ReadBack out;
    out.row_groups = reader->num_row_groups();
    st = reader->ReadTable(&out.table);
    REQUIRE(st.ok());
    return out;
}

}  // namespace parcel_test

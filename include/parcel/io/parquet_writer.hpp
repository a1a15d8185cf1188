#pragma once

#include <parcel/core/error.hpp>
#include <parcel/store/entity_store.hpp>

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#include <parquet/properties.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace parcel::io {

/// Default byte budget of an auto-derived file name.
inline constexpr std::size_t kDefaultNameBudget = 20;

enum class Compression : std::uint8_t {
    Uncompressed,
    Snappy,
    Gzip,
    Zstd,
    Lz4,
    Brotli,
};

[[nodiscard]] auto to_string(Compression compression) noexcept -> std::string_view;

/// Parse "snappy", "zstd", "none", ... (case-insensitive).
[[nodiscard]] auto parse_compression(std::string_view text) -> std::optional<Compression>;

/// Writer tuning.
struct WriterOptions {
    Compression compression = Compression::Snappy;
    std::optional<int> compression_level;
    bool dictionary = true;
    std::int64_t data_page_size = 1024 * 1024;
    bool write_statistics = true;
};

/// Parquet writer properties for `options`. Fails with WriteFailure when the
/// codec is not available in this Arrow build.
[[nodiscard]] auto writer_properties(const WriterOptions& options, std::int64_t row_group_length)
    -> Result<std::shared_ptr<parquet::WriterProperties>>;

/// Short names of `attributes` joined by '_', cut to at most `budget` bytes
/// (never inside a UTF-8 sequence).
[[nodiscard]] auto derive_file_name(const std::vector<store::AttributeKey>& attributes,
                                    std::size_t budget = kDefaultNameBudget) -> std::string;

/// "<output_path>_<name>.<extension>"
[[nodiscard]] auto output_file_path(std::string_view output_path, std::string_view name,
                                    std::string_view extension) -> std::string;

/// Assemble equal-length columns into a record batch. A column whose length
/// differs from the first one is a WriteFailure.
[[nodiscard]] auto make_batch(const std::shared_ptr<arrow::Schema>& schema,
                              const std::vector<std::shared_ptr<arrow::Array>>& columns)
    -> Result<std::shared_ptr<arrow::RecordBatch>>;

struct WrittenFile {
    std::string path;
    std::int64_t rows = 0;
    int columns = 0;
};

/// One Parquet file, opened with truncation.
class ParquetWriter {
   public:
    [[nodiscard]] static auto open(const std::string& path,
                                   const std::shared_ptr<arrow::Schema>& schema,
                                   std::shared_ptr<parquet::WriterProperties> properties)
        -> Result<ParquetWriter>;

    ParquetWriter(ParquetWriter&&) noexcept = default;
    auto operator=(ParquetWriter&&) noexcept -> ParquetWriter& = default;
    ParquetWriter(const ParquetWriter&) = delete;
    auto operator=(const ParquetWriter&) -> ParquetWriter& = delete;
    ~ParquetWriter();

    /// Write `batch` as exactly one row group.
    [[nodiscard]] auto write(const std::shared_ptr<arrow::RecordBatch>& batch) -> Result<void>;

    /// Write the footer and close the file.
    [[nodiscard]] auto close() -> Result<WrittenFile>;

   private:
    ParquetWriter(std::string path, std::shared_ptr<arrow::io::FileOutputStream> sink,
                  std::unique_ptr<parquet::arrow::FileWriter> writer);

    std::string path_;
    std::shared_ptr<arrow::io::FileOutputStream> sink_;
    std::unique_ptr<parquet::arrow::FileWriter> writer_;
    std::int64_t rows_ = 0;
    int columns_ = 0;
    bool closed_ = false;
};

/// Create/truncate `path` and write `batch` as a single row group.
[[nodiscard]] auto write_batch(const std::string& path,
                               const std::shared_ptr<arrow::RecordBatch>& batch,
                               const WriterOptions& options) -> Result<WrittenFile>;

}  // namespace parcel::io

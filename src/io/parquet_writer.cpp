#include <parcel/io/parquet_writer.hpp>

#include <parcel/core/value.hpp>

#include <arrow/util/compression.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <exception>

namespace parcel::io {

namespace {

auto to_arrow_compression(Compression compression) -> arrow::Compression::type {
    switch (compression) {
        case Compression::Uncompressed:
            return arrow::Compression::UNCOMPRESSED;
        case Compression::Snappy:
            return arrow::Compression::SNAPPY;
        case Compression::Gzip:
            return arrow::Compression::GZIP;
        case Compression::Zstd:
            return arrow::Compression::ZSTD;
        case Compression::Lz4:
            return arrow::Compression::LZ4;
        case Compression::Brotli:
            return arrow::Compression::BROTLI;
    }
    return arrow::Compression::UNCOMPRESSED;
}

auto lower(std::string_view text) -> std::string {
    std::string out(text);
    std::ranges::transform(out, out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

auto to_string(Compression compression) noexcept -> std::string_view {
    switch (compression) {
        case Compression::Uncompressed:
            return "uncompressed";
        case Compression::Snappy:
            return "snappy";
        case Compression::Gzip:
            return "gzip";
        case Compression::Zstd:
            return "zstd";
        case Compression::Lz4:
            return "lz4";
        case Compression::Brotli:
            return "brotli";
    }
    return "uncompressed";
}

auto parse_compression(std::string_view text) -> std::optional<Compression> {
    auto name = lower(text);
    if (name == "none" || name == "uncompressed") return Compression::Uncompressed;
    if (name == "snappy") return Compression::Snappy;
    if (name == "gzip") return Compression::Gzip;
    if (name == "zstd") return Compression::Zstd;
    if (name == "lz4") return Compression::Lz4;
    if (name == "brotli") return Compression::Brotli;
    return std::nullopt;
}

auto writer_properties(const WriterOptions& options, std::int64_t row_group_length)
    -> Result<std::shared_ptr<parquet::WriterProperties>> {
    auto codec = to_arrow_compression(options.compression);
    if (!arrow::util::Codec::IsAvailable(codec)) {
        return write_failure(fmt::format("compression '{}' is not available in this build",
                                         to_string(options.compression)));
    }

    parquet::WriterProperties::Builder builder;
    builder.compression(codec);
    if (options.compression_level) {
        builder.compression_level(*options.compression_level);
    }
    if (options.dictionary) {
        builder.enable_dictionary();
    } else {
        builder.disable_dictionary();
    }
    if (options.write_statistics) {
        builder.enable_statistics();
    } else {
        builder.disable_statistics();
    }
    builder.data_pagesize(options.data_page_size);
    // A batch is always flushed as one row group.
    builder.max_row_group_length(std::max<std::int64_t>(row_group_length, 1));
    return builder.build();
}

auto derive_file_name(const std::vector<store::AttributeKey>& attributes, std::size_t budget)
    -> std::string {
    std::string name;
    for (const auto& key : attributes) {
        if (!name.empty()) {
            name.push_back('_');
        }
        name.append(short_name(key.name));
    }
    if (name.size() <= budget) {
        return name;
    }
    std::size_t cut = budget;
    while (cut > 0 && (static_cast<unsigned char>(name[cut]) & 0xC0U) == 0x80U) {
        --cut;
    }
    name.resize(cut);
    return name;
}

auto output_file_path(std::string_view output_path, std::string_view name,
                      std::string_view extension) -> std::string {
    return fmt::format("{}_{}.{}", output_path, name, extension);
}

auto make_batch(const std::shared_ptr<arrow::Schema>& schema,
                const std::vector<std::shared_ptr<arrow::Array>>& columns)
    -> Result<std::shared_ptr<arrow::RecordBatch>> {
    if (static_cast<int>(columns.size()) != schema->num_fields()) {
        return write_failure(fmt::format("schema has {} fields but {} columns were built",
                                         schema->num_fields(), columns.size()));
    }
    std::int64_t rows = columns.empty() ? 0 : columns.front()->length();
    for (std::size_t i = 0; i < columns.size(); ++i) {
        const auto& field = schema->field(static_cast<int>(i));
        if (columns[i]->length() != rows) {
            return write_failure(fmt::format("column {} has {} rows, expected {}", field->name(),
                                             columns[i]->length(), rows));
        }
        if (!columns[i]->type()->Equals(*field->type())) {
            return write_failure(fmt::format("column {} has type {}, schema declares {}",
                                             field->name(), columns[i]->type()->ToString(),
                                             field->type()->ToString()));
        }
    }
    auto batch = arrow::RecordBatch::Make(schema, rows, columns);
    auto st = batch->Validate();
    if (!st.ok()) {
        return write_failure(fmt::format("invalid record batch: {}", st.ToString()));
    }
    return batch;
}

ParquetWriter::ParquetWriter(std::string path, std::shared_ptr<arrow::io::FileOutputStream> sink,
                             std::unique_ptr<parquet::arrow::FileWriter> writer)
    : path_(std::move(path)), sink_(std::move(sink)), writer_(std::move(writer)) {}

ParquetWriter::~ParquetWriter() {
    if (writer_ == nullptr || closed_) {
        return;
    }
    try {
        auto result = close();
        if (!result) {
            spdlog::warn("closing {} during cleanup failed: {}", path_, result.error());
        }
    } catch (const std::exception& e) {
        // Formatting the failure can itself throw.
        std::fprintf(stderr, "parcel: closing parquet writer failed: %s\n", e.what());
    }
}

auto ParquetWriter::open(const std::string& path, const std::shared_ptr<arrow::Schema>& schema,
                         std::shared_ptr<parquet::WriterProperties> properties)
    -> Result<ParquetWriter> {
    auto sink_result = arrow::io::FileOutputStream::Open(path);
    if (!sink_result.ok()) {
        return io_failure(fmt::format("cannot open {} for writing: {}", path,
                                      sink_result.status().ToString()));
    }
    auto sink = sink_result.ValueOrDie();

    // The stored Arrow schema lets readers restore types Parquet has no
    // native form for, such as fixed-size lists.
    auto arrow_properties = parquet::ArrowWriterProperties::Builder().store_schema()->build();
    auto writer_result = parquet::arrow::FileWriter::Open(*schema, arrow::default_memory_pool(),
                                                          sink, std::move(properties),
                                                          std::move(arrow_properties));
    if (!writer_result.ok()) {
        return write_failure(fmt::format("cannot create parquet writer for {}: {}", path,
                                         writer_result.status().ToString()));
    }
    return ParquetWriter(path, std::move(sink), std::move(writer_result).ValueOrDie());
}

auto ParquetWriter::write(const std::shared_ptr<arrow::RecordBatch>& batch) -> Result<void> {
    if (writer_ == nullptr || closed_) {
        return write_failure(fmt::format("{} is already closed", path_));
    }
    auto table_result = arrow::Table::FromRecordBatches({batch});
    if (!table_result.ok()) {
        return write_failure(fmt::format("cannot assemble table for {}: {}", path_,
                                         table_result.status().ToString()));
    }
    auto table = table_result.ValueOrDie();
    auto st = writer_->WriteTable(*table, std::max<std::int64_t>(table->num_rows(), 1));
    if (!st.ok()) {
        return write_failure(fmt::format("failed to write {}: {}", path_, st.ToString()));
    }
    rows_ += table->num_rows();
    columns_ = table->num_columns();
    return {};
}

auto ParquetWriter::close() -> Result<WrittenFile> {
    if (writer_ == nullptr || closed_) {
        return write_failure(fmt::format("{} is already closed", path_));
    }
    closed_ = true;
    auto st = writer_->Close();
    if (!st.ok()) {
        return write_failure(fmt::format("failed to finalize {}: {}", path_, st.ToString()));
    }
    st = sink_->Close();
    if (!st.ok()) {
        return io_failure(fmt::format("failed to close {}: {}", path_, st.ToString()));
    }
    return WrittenFile{.path = path_, .rows = rows_, .columns = columns_};
}

auto write_batch(const std::string& path, const std::shared_ptr<arrow::RecordBatch>& batch,
                 const WriterOptions& options) -> Result<WrittenFile> {
    auto properties = writer_properties(options, batch->num_rows());
    if (!properties) {
        return std::unexpected(properties.error());
    }
    auto writer = ParquetWriter::open(path, batch->schema(), std::move(properties.value()));
    if (!writer) {
        return std::unexpected(writer.error());
    }
    if (auto written = writer->write(batch); !written) {
        return std::unexpected(written.error());
    }
    return writer->close();
}

}  // namespace parcel::io

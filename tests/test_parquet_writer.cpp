#include <parcel/io/parquet_writer.hpp>

#include "parquet_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <arrow/api.h>

#include <filesystem>
#include <string>
#include <vector>

namespace {

using parcel_test::read_back;
using parcel_test::tmp;

auto key(const char* name, parcel::store::AttributeId id) -> parcel::store::AttributeKey {
    return parcel::store::AttributeKey{.name = name, .id = id};
}

auto int_column(std::initializer_list<std::int64_t> values) -> std::shared_ptr<arrow::Array> {
    arrow::Int64Builder builder;
    REQUIRE(builder.AppendValues(values.begin(), values.end()).ok());
    std::shared_ptr<arrow::Array> out;
    REQUIRE(builder.Finish(&out).ok());
    return out;
}

auto string_column(std::initializer_list<const char*> values) -> std::shared_ptr<arrow::Array> {
    arrow::StringBuilder builder;
    for (const char* v : values) {
        REQUIRE(builder.Append(v).ok());
    }
    std::shared_ptr<arrow::Array> out;
    REQUIRE(builder.Finish(&out).ok());
    return out;
}

auto two_column_schema() -> std::shared_ptr<arrow::Schema> {
    return arrow::schema(
        {arrow::field("Count", arrow::int64()), arrow::field("Label", arrow::utf8())});
}

}  // namespace

TEST_CASE("Derived file names", "[io][naming]") {
    using parcel::io::derive_file_name;

    SECTION("short names joined with underscores") {
        REQUIRE(derive_file_name({key("game::Health", 1), key("persist::Tag", 2)}) == "Health_Tag");
    }

    SECTION("truncated to the byte budget") {
        auto name = derive_file_name({key("game::physics::Position", 1),
                                      key("game::physics::Velocity", 2), key("persist::Tag", 3)});
        REQUIRE(name.size() == 20);
        REQUIRE(name == "Position_Velocity_Ta");
        REQUIRE(derive_file_name({key("a::Abcdef", 1)}, 3) == "Abc");
    }

    SECTION("never cuts a multi-byte character") {
        // "Größe" is 7 bytes; cutting at 3 would split "ö".
        auto name = derive_file_name({key("m::Gr\xC3\xB6\xC3\x9F" "e", 1)}, 3);
        REQUIRE(name == "Gr");
    }

    SECTION("output path format") {
        REQUIRE(parcel::io::output_file_path("./", "Health_Tag", "parquet") ==
                "./_Health_Tag.parquet");
        REQUIRE(parcel::io::output_file_path("/data/run1", "custom", "parquet") ==
                "/data/run1_custom.parquet");
    }
}

TEST_CASE("Compression names", "[io][compression]") {
    REQUIRE(parcel::io::parse_compression("SNAPPY") == parcel::io::Compression::Snappy);
    REQUIRE(parcel::io::parse_compression("none") == parcel::io::Compression::Uncompressed);
    REQUIRE(parcel::io::parse_compression("zstd") == parcel::io::Compression::Zstd);
    REQUIRE_FALSE(parcel::io::parse_compression("lzma").has_value());
    REQUIRE(parcel::io::to_string(parcel::io::Compression::Gzip) == "gzip");
}

TEST_CASE("make_batch validates columns against the schema", "[io][batch]") {
    auto schema = two_column_schema();

    SECTION("matching columns build a batch") {
        auto batch = parcel::io::make_batch(schema, {int_column({1, 2}), string_column({"a", "b"})});
        REQUIRE(batch.has_value());
        REQUIRE((*batch)->num_rows() == 2);
        REQUIRE((*batch)->num_columns() == 2);
    }

    SECTION("unequal lengths are a write failure") {
        auto batch = parcel::io::make_batch(schema, {int_column({1, 2, 3}), string_column({"a"})});
        REQUIRE_FALSE(batch.has_value());
        REQUIRE(batch.error().kind == parcel::ErrorKind::WriteFailure);
    }

    SECTION("column count mismatch is a write failure") {
        auto batch = parcel::io::make_batch(schema, {int_column({1})});
        REQUIRE_FALSE(batch.has_value());
        REQUIRE(batch.error().kind == parcel::ErrorKind::WriteFailure);
    }

    SECTION("column type mismatch is a write failure") {
        auto batch = parcel::io::make_batch(schema, {string_column({"x"}), string_column({"a"})});
        REQUIRE_FALSE(batch.has_value());
        REQUIRE(batch.error().kind == parcel::ErrorKind::WriteFailure);
    }
}

TEST_CASE("write_batch produces a single row group", "[io][parquet]") {
    auto path = tmp("parcel_test_writer.parquet").string();
    std::filesystem::remove(path);

    auto batch = parcel::io::make_batch(two_column_schema(),
                                        {int_column({10, 20, 30}), string_column({"a", "b", "c"})});
    REQUIRE(batch.has_value());

    auto written = parcel::io::write_batch(path, *batch, {});
    REQUIRE(written.has_value());
    REQUIRE(written->path == path);
    REQUIRE(written->rows == 3);
    REQUIRE(written->columns == 2);

    auto contents = read_back(path);
    REQUIRE(contents.row_groups == 1);
    REQUIRE(contents.table->num_rows() == 3);
    REQUIRE(contents.table->schema()->field(0)->name() == "Count");
    auto counts =
        std::static_pointer_cast<arrow::Int64Array>(contents.table->column(0)->chunk(0));
    REQUIRE(counts->Value(2) == 30);

    SECTION("rewriting truncates the previous file") {
        auto small = parcel::io::make_batch(two_column_schema(),
                                            {int_column({1}), string_column({"z"})});
        REQUIRE(small.has_value());
        REQUIRE(parcel::io::write_batch(path, *small, {}).has_value());
        REQUIRE(read_back(path).table->num_rows() == 1);
    }
}

TEST_CASE("Uncompressed and empty batches", "[io][parquet]") {
    auto path = tmp("parcel_test_empty.parquet").string();
    std::filesystem::remove(path);

    auto batch = parcel::io::make_batch(two_column_schema(), {int_column({}), string_column({})});
    REQUIRE(batch.has_value());

    parcel::io::WriterOptions options{.compression = parcel::io::Compression::Uncompressed};
    auto written = parcel::io::write_batch(path, *batch, options);
    REQUIRE(written.has_value());
    REQUIRE(written->rows == 0);
    REQUIRE(read_back(path).table->num_columns() == 2);
}

TEST_CASE("Unwritable destination is an io failure", "[io][parquet]") {
    auto path = (tmp("parcel_missing_dir") / "nested" / "out.parquet").string();
    auto batch = parcel::io::make_batch(two_column_schema(), {int_column({1}), string_column({"a"})});
    REQUIRE(batch.has_value());

    auto written = parcel::io::write_batch(path, *batch, {});
    REQUIRE_FALSE(written.has_value());
    REQUIRE(written.error().kind == parcel::ErrorKind::IoFailure);
}

TEST_CASE("ParquetWriter rejects use after close", "[io][parquet]") {
    auto path = tmp("parcel_test_closed.parquet").string();
    auto schema = two_column_schema();
    auto properties = parcel::io::writer_properties({}, 1);
    REQUIRE(properties.has_value());

    auto writer = parcel::io::ParquetWriter::open(path, schema, *properties);
    REQUIRE(writer.has_value());
    REQUIRE(writer->close().has_value());

    auto again = writer->close();
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().kind == parcel::ErrorKind::WriteFailure);
}

TEST_CASE("Dropping an unclosed writer still finalizes the file", "[io][parquet]") {
    auto path = tmp("parcel_test_dropped.parquet").string();
    std::filesystem::remove(path);
    auto batch = parcel::io::make_batch(two_column_schema(),
                                        {int_column({4, 5}), string_column({"d", "e"})});
    REQUIRE(batch.has_value());
    auto properties = parcel::io::writer_properties({}, (*batch)->num_rows());
    REQUIRE(properties.has_value());

    {
        auto writer = parcel::io::ParquetWriter::open(path, two_column_schema(), *properties);
        REQUIRE(writer.has_value());
        REQUIRE(writer->write(*batch).has_value());
    }

    auto contents = read_back(path);
    REQUIRE(contents.table->num_rows() == 2);
}

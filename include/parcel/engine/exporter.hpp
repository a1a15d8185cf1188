#pragma once

#include <parcel/core/error.hpp>
#include <parcel/core/type_registry.hpp>
#include <parcel/engine/cluster.hpp>
#include <parcel/io/parquet_writer.hpp>
#include <parcel/store/entity_store.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace parcel::engine {

/// Configuration of one export invocation.
struct ExportConfig {
    /// Prefix of every output file; files are named "<output_path>_<name>.<extension>".
    std::string output_path = "./";
    /// Literal file name replacing the derived one.
    std::optional<std::string> file_name;
    /// Manually specified clusters; bypasses detection when set.
    std::optional<std::vector<Cluster>> clusters;
    std::string extension = "parquet";
    /// Byte budget of derived file names.
    std::size_t name_budget = io::kDefaultNameBudget;
    ClusterOptions clustering;
    store::MarkerPolicy markers;
    io::WriterOptions writer;
};

struct ExportedFile {
    std::string path;
    std::int64_t rows = 0;
    int columns = 0;
    Cluster cluster;
    /// Values omitted across all columns because they failed to serialize.
    std::size_t skipped_values = 0;
};

struct ExportReport {
    /// Clusters that carried a marker and were exported, in processing order.
    std::vector<Cluster> clusters;
    /// Clusters discarded for lacking a marker attribute.
    std::size_t dropped_clusters = 0;
    std::vector<ExportedFile> files;
};

/// Export `store` into one Parquet file per marked cluster.
///
/// Clusters are processed in order on the calling thread. The first IO or
/// write failure is returned and later clusters are not attempted; files
/// already written stay on disk.
[[nodiscard]] auto export_store(const store::EntityStore& store, const TypeRegistry& registry,
                                const ExportConfig& config) -> Result<ExportReport>;

/// Export a single cluster. Returns std::nullopt when the cluster has no
/// non-marker attribute and therefore no file to write.
[[nodiscard]] auto export_cluster(const store::EntityStore& store, const TypeRegistry& registry,
                                  const Cluster& cluster, const ExportConfig& config)
    -> Result<std::optional<ExportedFile>>;

}  // namespace parcel::engine

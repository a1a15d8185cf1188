#include <parcel/engine/exporter.hpp>

#include <parcel/columnar/materializer.hpp>
#include <parcel/core/diagnostics.hpp>
#include <parcel/schema/schema_builder.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace parcel::engine {

auto export_cluster(const store::EntityStore& store, const TypeRegistry& registry,
                    const Cluster& cluster, const ExportConfig& config)
    -> Result<std::optional<ExportedFile>> {
    auto schema = diag::complain_msg(
        schema::build_schema(cluster.attributes, store, registry, config.markers),
        fmt::format("schema for cluster {}", describe(cluster)));
    if (!schema) {
        return std::unexpected(schema.error());
    }
    if (schema->fields.empty()) {
        spdlog::warn("cluster {} has no attribute besides markers; no file written",
                     describe(cluster));
        return std::nullopt;
    }
    spdlog::debug("schema for {}: {}", describe(cluster), schema->arrow_schema->ToString());

    auto entities = columnar::qualifying_entities(store, cluster.attributes);
    spdlog::info("cluster {}: {} qualifying entities", describe(cluster), entities.size());

    ExportedFile file{.cluster = cluster};
    std::vector<std::shared_ptr<arrow::Array>> columns;
    columns.reserve(schema->fields.size());
    for (const auto& field : schema->fields) {
        auto column = columnar::materialize_column(store, registry, entities, field);
        if (!column) {
            return std::unexpected(column.error());
        }
        file.skipped_values += column->skipped;
        columns.push_back(std::move(column->array));
    }

    auto batch = io::make_batch(schema->arrow_schema, columns);
    if (!batch) {
        return std::unexpected(batch.error());
    }

    auto name = config.file_name.value_or(
        io::derive_file_name(cluster.attributes, config.name_budget));
    auto path = io::output_file_path(config.output_path, name, config.extension);
    auto written = diag::relief_msg(io::write_batch(path, *batch, config.writer),
                                    fmt::format("wrote {}", path));
    if (!written) {
        return std::unexpected(written.error());
    }

    file.path = std::move(written->path);
    file.rows = written->rows;
    file.columns = written->columns;
    return file;
}

auto export_store(const store::EntityStore& store, const TypeRegistry& registry,
                  const ExportConfig& config) -> Result<ExportReport> {
    auto clusters = config.clusters ? *config.clusters
                                    : detect_clusters(store, registry, config.clustering);

    ExportReport report;
    for (auto& cluster : clusters) {
        if (has_marker(cluster, store, config.markers)) {
            report.clusters.push_back(std::move(cluster));
        } else {
            spdlog::debug("dropping unmarked cluster {}", describe(cluster));
            ++report.dropped_clusters;
        }
    }

    spdlog::info("cluster analysis: {} marked cluster(s), {} dropped", report.clusters.size(),
                 report.dropped_clusters);
    for (std::size_t i = 0; i < report.clusters.size(); ++i) {
        spdlog::info("cluster {}: {}", i, describe(report.clusters[i]));
    }
    if (config.file_name && report.clusters.size() > 1) {
        spdlog::warn("file name override '{}' is shared by {} clusters; later files replace "
                     "earlier ones",
                     *config.file_name, report.clusters.size());
    }

    for (const auto& cluster : report.clusters) {
        auto exported = export_cluster(store, registry, cluster, config);
        if (!exported) {
            spdlog::error("export of cluster {} failed: {}", describe(cluster), exported.error());
            return std::unexpected(exported.error());
        }
        if (exported->has_value()) {
            report.files.push_back(std::move(**exported));
        }
    }
    return report;
}

}  // namespace parcel::engine

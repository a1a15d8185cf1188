#include <parcel/schema/schema_builder.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace parcel::schema {

auto build_schema(const std::vector<store::AttributeKey>& attributes,
                  const store::EntityStore& store, const TypeRegistry& registry,
                  const store::MarkerPolicy& markers) -> Result<ClusterSchema> {
    ClusterSchema out;
    std::vector<std::shared_ptr<arrow::Field>> arrow_fields;

    for (const auto& key : attributes) {
        const auto* info = store.attribute_info(key.id);
        if (info == nullptr) {
            return serialization_failure(
                fmt::format("attribute {} (id {}) is not registered in the store", key.name,
                            key.id));
        }
        if (markers.is_marker(*info)) {
            continue;
        }

        auto plan = plan_for_type(info->type_id, registry);
        if (!info->type_id) {
            spdlog::debug("attribute {} has no reflected type; using string column", info->name);
        } else if (!registry.contains(*info->type_id)) {
            spdlog::debug("type {} of attribute {} is not registered; using string column",
                          *info->type_id, info->name);
        }

        FieldSpec field{.name = std::string(short_name(info->name)),
                        .attribute = key,
                        .plan = std::move(plan),
                        .nullable = true};
        arrow_fields.push_back(
            arrow::field(field.name, to_arrow_type(field.plan), field.nullable));
        spdlog::debug("schema field {}: {}", field.name, field.plan.describe());
        out.fields.push_back(std::move(field));
    }

    out.arrow_schema = arrow::schema(std::move(arrow_fields));
    return out;
}

}  // namespace parcel::schema

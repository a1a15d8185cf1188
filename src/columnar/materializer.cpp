#include <parcel/columnar/materializer.hpp>
#include <parcel/core/diagnostics.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace parcel::columnar {

auto qualifying_entities(const store::EntityStore& store,
                         const std::vector<store::AttributeKey>& attributes)
    -> std::vector<Entity> {
    std::vector<Entity> out;
    for (auto entity : store.entities()) {
        bool has_all = std::ranges::all_of(attributes, [&](const store::AttributeKey& key) {
            return store.contains(entity, key.id);
        });
        if (has_all) {
            out.push_back(entity);
        }
    }
    return out;
}

auto reflect_attribute(const store::EntityStore& store, const TypeRegistry& registry,
                       Entity entity, store::AttributeId id) -> Result<Value> {
    const auto* info = store.attribute_info(id);
    if (info == nullptr) {
        return serialization_failure(fmt::format("attribute id {} is not registered", id));
    }
    const auto* stored = store.get(entity, id);
    if (stored == nullptr) {
        return serialization_failure(
            fmt::format("entity {} has no {}", entity.to_string(), info->name));
    }
    if (!info->type_id) {
        return serialization_failure(fmt::format("missing type id for {}", info->name));
    }
    const auto* registration = registry.find(*info->type_id);
    if (registration == nullptr) {
        return serialization_failure(fmt::format("type id {} not found in registry for {}",
                                                 *info->type_id, info->name));
    }
    if (!registration->reflect) {
        return serialization_failure(fmt::format("no reflect capability for {}", info->name));
    }
    try {
        return registration->reflect(*stored);
    } catch (const std::exception& e) {
        return serialization_failure(fmt::format("failed to reflect {} on entity {}: {}",
                                                 info->name, entity.to_string(), e.what()));
    }
}

auto materialize_column(const store::EntityStore& store, const TypeRegistry& registry,
                        const std::vector<Entity>& entities, const schema::FieldSpec& field)
    -> Result<MaterializedColumn> {
    auto type = schema::to_arrow_type(field.plan);
    auto builder_result = arrow::MakeBuilder(type, arrow::default_memory_pool());
    if (!builder_result.ok()) {
        return write_failure(fmt::format("cannot create builder for {}: {}", field.name,
                                         builder_result.status().ToString()));
    }
    auto builder = std::move(builder_result).ValueOrDie();

    spdlog::debug("materializing {} ({}) over {} entities", field.attribute.name,
                  field.plan.describe(), entities.size());

    MaterializedColumn out;
    for (auto entity : entities) {
        auto context = fmt::format("skipping {} on entity {}", field.attribute.name,
                                   entity.to_string());
        auto reflected =
            diag::warn_msg(reflect_attribute(store, registry, entity, field.attribute.id), context);
        if (!reflected) {
            ++out.skipped;
            continue;
        }
        auto conformed = diag::warn_msg(schema::conform(field.plan, *reflected), context);
        if (!conformed) {
            ++out.skipped;
            continue;
        }
        auto st = schema::append_value(*builder, field.plan, *conformed);
        if (!st.ok()) {
            return write_failure(fmt::format("append to column {} failed: {}", field.name,
                                             st.ToString()));
        }
    }

    auto st = builder->Finish(&out.array);
    if (!st.ok()) {
        return write_failure(
            fmt::format("finish column {} failed: {}", field.name, st.ToString()));
    }
    diag::report_msg(out.array->length(), fmt::format("values in column {}", field.name));
    return out;
}

}  // namespace parcel::columnar

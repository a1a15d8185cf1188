#pragma once

#include <parcel/core/error.hpp>
#include <parcel/core/type_registry.hpp>
#include <parcel/schema/type_mapping.hpp>
#include <parcel/store/entity_store.hpp>

#include <arrow/api.h>

#include <memory>
#include <string>
#include <vector>

namespace parcel::schema {

/// One output column: the attribute it reads and how its values are mapped.
struct FieldSpec {
    /// Short name (type path without namespace).
    std::string name;
    store::AttributeKey attribute;
    ColumnPlan plan;
    bool nullable = true;
};

struct ClusterSchema {
    std::vector<FieldSpec> fields;
    std::shared_ptr<arrow::Schema> arrow_schema;

    [[nodiscard]] auto num_fields() const noexcept -> std::size_t { return fields.size(); }
};

/// Build the columnar schema of a cluster: one field per non-marker attribute,
/// in the order given.
///
/// Fails with SerializationFailure only when an attribute id is not declared
/// in the store at all; unresolvable types degrade to string columns.
[[nodiscard]] auto build_schema(const std::vector<store::AttributeKey>& attributes,
                                const store::EntityStore& store, const TypeRegistry& registry,
                                const store::MarkerPolicy& markers) -> Result<ClusterSchema>;

}  // namespace parcel::schema

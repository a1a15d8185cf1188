#pragma once

#include <parcel/core/error.hpp>
#include <parcel/core/type_registry.hpp>
#include <parcel/core/value.hpp>
#include <parcel/schema/schema_builder.hpp>
#include <parcel/store/entity_store.hpp>

#include <arrow/api.h>

#include <cstddef>
#include <memory>
#include <vector>

namespace parcel::columnar {

struct MaterializedColumn {
    std::shared_ptr<arrow::Array> array;
    /// Entities whose value could not be reflected or mapped and was omitted.
    std::size_t skipped = 0;
};

/// Entities holding every attribute in `attributes`, in store enumeration
/// order. Pass the whole cluster, markers included: a marker contributes no
/// column but still decides which entities are exported.
[[nodiscard]] auto qualifying_entities(const store::EntityStore& store,
                                       const std::vector<store::AttributeKey>& attributes)
    -> std::vector<Entity>;

/// Reflect one stored attribute value into a generic Value.
///
/// Fails with SerializationFailure when the value is absent, the attribute or
/// its type is unregistered, the type has no reflect capability, or
/// reflection itself fails.
[[nodiscard]] auto reflect_attribute(const store::EntityStore& store,
                                     const TypeRegistry& registry, Entity entity,
                                     store::AttributeId id) -> Result<Value>;

/// Build the column for `field` over `entities`.
///
/// Values that fail to reflect or to fit the field's plan are logged and
/// omitted, never replaced by nulls, so the array may be shorter than
/// `entities`. Only an Arrow builder error fails the whole column.
[[nodiscard]] auto materialize_column(const store::EntityStore& store,
                                      const TypeRegistry& registry,
                                      const std::vector<Entity>& entities,
                                      const schema::FieldSpec& field) -> Result<MaterializedColumn>;

}  // namespace parcel::columnar

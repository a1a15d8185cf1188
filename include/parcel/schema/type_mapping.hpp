#pragma once

#include <parcel/core/error.hpp>
#include <parcel/core/type_registry.hpp>
#include <parcel/core/value.hpp>

#include <arrow/api.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace parcel::schema {

enum class ScalarType : std::uint8_t {
    Boolean,
    Float32,
    Float64,
    Int32,
    Int64,
    UInt32,
    UInt64,
};

enum class PlanKind : std::uint8_t {
    /// Fixed-width scalar column.
    Scalar,
    /// struct<x: f32, y: f32, z: f32>.
    Vec3,
    /// Variable-length list of `child`.
    List,
    /// Fixed-size list of `child` with `list_size` elements.
    FixedSizeList,
    /// Project a struct through its `output` field, then apply `child`.
    Output,
    /// Debug-formatted string fallback.
    Text,
};

/// Per-kind column mapping shared by schema inference and materialization.
///
/// The schema path turns a plan into an Arrow type (to_arrow_type); the data
/// path pushes each value through the same plan (conform + append_value), so
/// a column's contents always match its declared type.
struct ColumnPlan {
    PlanKind kind = PlanKind::Text;
    ScalarType scalar = ScalarType::Boolean;
    std::shared_ptr<const ColumnPlan> child;
    std::int32_t list_size = 0;

    [[nodiscard]] static auto text() -> ColumnPlan { return ColumnPlan{}; }
    [[nodiscard]] static auto of_scalar(ScalarType type) -> ColumnPlan {
        return ColumnPlan{.kind = PlanKind::Scalar, .scalar = type};
    }

    /// Human-readable form, e.g. "list<f32>", "output<i32>".
    [[nodiscard]] auto describe() const -> std::string;
};

/// Scalar column type for a primitive type path ("f32", "u64", "entity", ...).
[[nodiscard]] auto scalar_for_path(std::string_view type_path) -> std::optional<ScalarType>;

/// Resolve the column plan of a type. Never fails: anything that cannot be
/// mapped, including an absent or unregistered type id, becomes Text.
///
///   numeric/bool primitive      → Scalar
///   struct {x, y, z: f32}       → Vec3
///   struct with `output` field  → Output(plan of the field's type)
///   other struct, tuple, map    → Text
///   enum                        → Text
///   list / array                → List / FixedSizeList of the item plan
[[nodiscard]] auto plan_for_type(std::optional<TypeId> type_id, const TypeRegistry& registry)
    -> ColumnPlan;

[[nodiscard]] auto to_arrow_type(const ColumnPlan& plan) -> std::shared_ptr<arrow::DataType>;

/// Text fallback policy for one value:
///   struct with `output` → debug text of that field, else of the whole struct
///   scalar               → debug text
///   tuple / tuple struct → debug text of the first field
///   list / array         → "[a, b, ...]"
///   anything else        → debug text of the whole value
[[nodiscard]] auto render_text(const Value& value) -> std::string;

/// Normalize `value` to the leaf shape `plan` expects (Output projections
/// applied, Text rendered to a string). Fails with SerializationFailure when
/// the value does not fit the plan.
[[nodiscard]] auto conform(const ColumnPlan& plan, const Value& value) -> Result<Value>;

/// Append a conformed value to a builder created for to_arrow_type(plan).
[[nodiscard]] auto append_value(arrow::ArrayBuilder& builder, const ColumnPlan& plan,
                                const Value& value) -> arrow::Status;

}  // namespace parcel::schema

#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace parcel {

/// Generic reflected view of one attribute value.
///
/// Values form a closed set of kinds so that every consumer (schema
/// inference, column materialization, debug rendering) dispatches over the
/// same alternatives.
struct Value;

/// A struct with named fields, in declaration order.
struct StructValue {
    std::string type_path;
    std::vector<std::string> names;
    std::vector<Value> fields;

    /// Field lookup by name; nullptr when the struct has no such field.
    [[nodiscard]] auto field(std::string_view name) const -> const Value*;
};

/// A tuple struct (non-empty type path) or an anonymous tuple.
struct TupleValue {
    std::string type_path;
    std::vector<Value> fields;
};

/// A growable list, or a fixed-size array when `fixed_size` is set.
struct ListValue {
    std::vector<Value> items;
    bool fixed_size = false;
};

struct EnumValue {
    std::string type_path;
    std::string variant;
    std::vector<Value> fields;
};

/// A value that only exposes a pre-rendered debug representation.
struct OpaqueValue {
    std::string type_path;
    std::string repr;
};

enum class ValueKind : std::uint8_t {
    Bool,
    Float32,
    Float64,
    Int32,
    Int64,
    UInt32,
    UInt64,
    String,
    Struct,
    Tuple,
    List,
    Enum,
    Opaque,
};

using ValueData = std::variant<bool, float, double, std::int32_t, std::int64_t, std::uint32_t,
                               std::uint64_t, std::string, StructValue, TupleValue, ListValue,
                               EnumValue, OpaqueValue>;

struct Value {
    ValueData data;

    [[nodiscard]] auto kind() const noexcept -> ValueKind {
        return static_cast<ValueKind>(data.index());
    }

    /// True for the fixed-width scalar alternatives and strings.
    [[nodiscard]] auto is_scalar() const noexcept -> bool {
        return data.index() <= static_cast<std::size_t>(ValueKind::String);
    }

    template <typename T>
    [[nodiscard]] auto get_if() const noexcept -> const T* {
        return std::get_if<T>(&data);
    }
};

// ─── Construction helpers ─────────────────────────────────────────────────────

[[nodiscard]] auto make_struct(std::string type_path,
                               std::initializer_list<std::pair<std::string, Value>> fields)
    -> Value;
[[nodiscard]] auto make_tuple(std::string type_path, std::vector<Value> fields) -> Value;
[[nodiscard]] auto make_list(std::vector<Value> items) -> Value;
[[nodiscard]] auto make_array(std::vector<Value> items) -> Value;
[[nodiscard]] auto make_enum(std::string type_path, std::string variant,
                             std::vector<Value> fields = {}) -> Value;
[[nodiscard]] auto make_string(std::string text) -> Value;

// ─── Rendering ────────────────────────────────────────────────────────────────

/// Debug representation of a value.
///
///   f32/f64     → shortest round-trip text, always with a decimal point ("1.0")
///   string      → quoted and escaped ("\"abc\"")
///   struct      → Name { a: 1, b: 2.5 }     (short type name)
///   tuple struct→ Name(1, 2)
///   tuple       → (1, 2)
///   list/array  → [1, 2]
///   enum        → Variant / Variant(1)
///   opaque      → its stored representation
[[nodiscard]] auto debug_format(const Value& value) -> std::string;

/// Debug text for a single float, e.g. 1 → "1.0", 0.1f → "0.1".
[[nodiscard]] auto format_float(double value, bool single_precision) -> std::string;

/// Type path with the namespace stripped: "game::stats::Health" → "Health".
[[nodiscard]] auto short_name(std::string_view type_path) -> std::string_view;

}  // namespace parcel

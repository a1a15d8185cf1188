#pragma once

#include <parcel/core/error.hpp>
#include <parcel/core/value.hpp>

#include <fmt/format.h>

#include <any>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace parcel {

/// Identifier of a registered type; stable only within one registry.
using TypeId = std::uint32_t;

enum class TypeKind : std::uint8_t {
    Value,
    Struct,
    TupleStruct,
    Tuple,
    List,
    Array,
    Map,
    Enum,
};

[[nodiscard]] auto to_string(TypeKind kind) noexcept -> std::string_view;

/// A named (struct) or positional (tuple) field of a composite type.
struct FieldDescriptor {
    std::string name;
    TypeId type = 0;
};

/// Runtime description of one registered type.
struct TypeDescriptor {
    TypeId id = 0;
    std::string type_path;
    TypeKind kind = TypeKind::Value;
    /// Struct, TupleStruct and Tuple members.
    std::vector<FieldDescriptor> fields;
    /// Element type of List and Array.
    std::optional<TypeId> item;
    /// Element count of Array.
    std::size_t length = 0;
    /// Variant names of Enum.
    std::vector<std::string> variants;

    [[nodiscard]] auto field(std::string_view name) const -> const FieldDescriptor*;
};

/// Produces the generic value view of a type-erased stored value.
using ReflectFn = std::function<Result<Value>(const std::any&)>;

struct TypeRegistration {
    TypeDescriptor descriptor;
    /// Empty when the type was registered without a reflect capability.
    ReflectFn reflect;
};

/// Immutable type-descriptor lookup.
///
/// Built once through TypeRegistry::Builder and passed by const reference to
/// every component that needs descriptors or reflection.
class TypeRegistry {
   public:
    class Builder;

    TypeRegistry() = default;

    [[nodiscard]] auto find(TypeId id) const -> const TypeRegistration*;
    [[nodiscard]] auto descriptor(TypeId id) const -> const TypeDescriptor*;
    [[nodiscard]] auto contains(TypeId id) const -> bool { return types_.contains(id); }
    [[nodiscard]] auto find_by_path(std::string_view type_path) const -> std::optional<TypeId>;

    /// All registered type ids in ascending order; the clustering allow-list.
    [[nodiscard]] auto known_types() const -> std::vector<TypeId>;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return types_.size(); }

   private:
    std::unordered_map<TypeId, TypeRegistration> types_;
    std::unordered_map<std::string, TypeId> by_path_;
};

/// Wrap a conversion `const T& -> Value` into a ReflectFn over std::any.
template <typename T, typename F>
[[nodiscard]] auto reflect_as(std::string type_path, F convert) -> ReflectFn {
    return [path = std::move(type_path), convert = std::move(convert)](
               const std::any& stored) -> Result<Value> {
        const auto* typed = std::any_cast<T>(&stored);
        if (typed == nullptr) {
            return serialization_failure(
                fmt::format("stored value does not hold a {}", path));
        }
        return Value{convert(*typed)};
    };
}

class TypeRegistry::Builder {
   public:
    Builder() = default;

    /// Register a type; the descriptor's id is assigned by the builder.
    /// Re-registering a type path returns the existing id.
    auto add(TypeDescriptor descriptor, ReflectFn reflect = {}) -> TypeId;

    /// Register f32, f64, i32, i64, u32, u64, bool, String and entity with
    /// reflect capabilities over the matching C++ types.
    auto add_primitives() -> Builder&;

    [[nodiscard]] auto find_by_path(std::string_view type_path) const -> std::optional<TypeId>;

    /// Id of a registered primitive by path; throws std::out_of_range if absent.
    [[nodiscard]] auto id_of(std::string_view type_path) const -> TypeId;

    [[nodiscard]] auto build() && -> TypeRegistry;

   private:
    TypeRegistry registry_;
    TypeId next_id_ = 1;
};

}  // namespace parcel

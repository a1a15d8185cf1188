#pragma once

#include <parcel/core/entity.hpp>
#include <parcel/core/type_registry.hpp>

#include <any>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace parcel::store {

/// Identifier of an attribute kind within one store.
using AttributeId = std::uint32_t;

/// Store-side metadata of an attribute kind.
struct AttributeInfo {
    AttributeId id = 0;
    /// Fully-qualified type path, e.g. "game::stats::Health".
    std::string name;
    /// Reflection type, when the attribute's type was registered.
    std::optional<TypeId> type_id;
    /// Filter-only marker: selects clusters for export, never becomes a column.
    bool marker = false;
};

/// (name, id) pair identifying an attribute inside a cluster signature.
struct AttributeKey {
    std::string name;
    AttributeId id = 0;

    auto operator<=>(const AttributeKey&) const = default;
};

/// Decides which attributes act as inclusion markers.
struct MarkerPolicy {
    /// Honour AttributeInfo::marker.
    bool use_flag = true;
    /// Legacy naming convention: attributes whose name contains this text are
    /// markers as well. Empty disables the check.
    std::string name_pattern;

    [[nodiscard]] auto is_marker(const AttributeInfo& info) const -> bool {
        if (use_flag && info.marker) {
            return true;
        }
        return !name_pattern.empty() && info.name.find(name_pattern) != std::string::npos;
    }
};

/// Read-only query capability over an entity/attribute store.
///
/// The export engine only ever reads through this interface. Implementations
/// must not be mutated for the duration of an export.
class EntityStore {
   public:
    EntityStore() = default;
    EntityStore(const EntityStore&) = default;
    EntityStore(EntityStore&&) = default;
    auto operator=(const EntityStore&) -> EntityStore& = default;
    auto operator=(EntityStore&&) -> EntityStore& = default;
    virtual ~EntityStore() = default;

    /// All live entities, in a stable enumeration order.
    [[nodiscard]] virtual auto entities() const -> std::vector<Entity> = 0;

    /// Attribute ids attached to `entity` (empty for unknown entities).
    [[nodiscard]] virtual auto attribute_ids(Entity entity) const -> std::vector<AttributeId> = 0;

    [[nodiscard]] virtual auto contains(Entity entity, AttributeId id) const -> bool = 0;

    /// Type-erased stored value, or nullptr when absent.
    [[nodiscard]] virtual auto get(Entity entity, AttributeId id) const -> const std::any* = 0;

    /// Metadata of an attribute kind, or nullptr when the id was never declared.
    [[nodiscard]] virtual auto attribute_info(AttributeId id) const -> const AttributeInfo* = 0;

    /// Key of a declared attribute.
    [[nodiscard]] auto key_of(AttributeId id) const -> std::optional<AttributeKey> {
        const auto* info = attribute_info(id);
        if (info == nullptr) {
            return std::nullopt;
        }
        return AttributeKey{.name = info->name, .id = info->id};
    }
};

}  // namespace parcel::store

#pragma once

#include <parcel/store/entity_store.hpp>

#include <any>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace parcel::store {

/// In-memory entity store.
///
/// Entities are slots addressed by index; a despawned slot is reused with a
/// bumped generation. Attribute values are held type-erased, so reflection is
/// only as good as the registered ReflectFn for the attribute's type.
class World final : public EntityStore {
   public:
    World() = default;

    /// Declare an attribute kind. `type_id` is empty for types that were
    /// never registered for reflection. Redeclaring a name with the same
    /// metadata returns the existing id; a different type id or marker flag
    /// throws std::invalid_argument.
    auto declare_attribute(std::string name, std::optional<TypeId> type_id, bool marker = false)
        -> AttributeId;

    [[nodiscard]] auto find_attribute(std::string_view name) const -> std::optional<AttributeId>;

    auto spawn() -> Entity;

    /// Remove an entity and all of its attributes. Returns false if not alive.
    auto despawn(Entity entity) -> bool;

    [[nodiscard]] auto alive(Entity entity) const -> bool;

    /// Attach (or replace) an attribute value.
    /// Throws std::invalid_argument for a dead entity or undeclared attribute.
    void insert(Entity entity, AttributeId id, std::any value);

    template <typename T>
    void insert_value(Entity entity, AttributeId id, T value) {
        insert(entity, id, std::any(std::move(value)));
    }

    auto remove(Entity entity, AttributeId id) -> bool;

    [[nodiscard]] auto entity_count() const noexcept -> std::size_t { return live_; }

    [[nodiscard]] auto entities() const -> std::vector<Entity> override;
    [[nodiscard]] auto attribute_ids(Entity entity) const -> std::vector<AttributeId> override;
    [[nodiscard]] auto contains(Entity entity, AttributeId id) const -> bool override;
    [[nodiscard]] auto get(Entity entity, AttributeId id) const -> const std::any* override;
    [[nodiscard]] auto attribute_info(AttributeId id) const -> const AttributeInfo* override;

   private:
    struct Slot {
        std::uint32_t generation = 0;
        bool alive = false;
        std::map<AttributeId, std::any> attributes;
    };

    [[nodiscard]] auto slot(Entity entity) const -> const Slot*;
    [[nodiscard]] auto slot(Entity entity) -> Slot*;

    std::vector<AttributeInfo> attributes_;
    std::vector<Slot> slots_;
    std::vector<std::uint32_t> free_list_;
    std::size_t live_ = 0;
};

}  // namespace parcel::store

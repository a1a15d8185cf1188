#include <parcel/store/world.hpp>

#include <stdexcept>
#include <utility>

namespace parcel::store {

auto World::declare_attribute(std::string name, std::optional<TypeId> type_id, bool marker)
    -> AttributeId {
    if (auto existing = find_attribute(name)) {
        const auto& info = attributes_[*existing - 1];
        if (info.type_id != type_id || info.marker != marker) {
            throw std::invalid_argument("declare_attribute: " + info.name +
                                        " was already declared with a different type or marker");
        }
        return *existing;
    }
    auto id = static_cast<AttributeId>(attributes_.size() + 1);
    attributes_.push_back(
        AttributeInfo{.id = id, .name = std::move(name), .type_id = type_id, .marker = marker});
    return id;
}

auto World::find_attribute(std::string_view name) const -> std::optional<AttributeId> {
    for (const auto& info : attributes_) {
        if (info.name == name) {
            return info.id;
        }
    }
    return std::nullopt;
}

auto World::spawn() -> Entity {
    std::uint32_t index = 0;
    if (!free_list_.empty()) {
        index = free_list_.back();
        free_list_.pop_back();
    } else {
        index = static_cast<std::uint32_t>(slots_.size());
        slots_.emplace_back();
    }
    auto& s = slots_[index];
    s.alive = true;
    ++live_;
    return Entity{.index = index, .generation = s.generation};
}

auto World::despawn(Entity entity) -> bool {
    auto* s = slot(entity);
    if (s == nullptr) {
        return false;
    }
    s->alive = false;
    s->attributes.clear();
    ++s->generation;
    free_list_.push_back(entity.index);
    --live_;
    return true;
}

auto World::alive(Entity entity) const -> bool { return slot(entity) != nullptr; }

void World::insert(Entity entity, AttributeId id, std::any value) {
    auto* s = slot(entity);
    if (s == nullptr) {
        throw std::invalid_argument("insert: entity " + entity.to_string() + " is not alive");
    }
    if (attribute_info(id) == nullptr) {
        throw std::invalid_argument("insert: attribute id " + std::to_string(id) +
                                    " was never declared");
    }
    s->attributes.insert_or_assign(id, std::move(value));
}

auto World::remove(Entity entity, AttributeId id) -> bool {
    auto* s = slot(entity);
    if (s == nullptr) {
        return false;
    }
    return s->attributes.erase(id) > 0;
}

auto World::entities() const -> std::vector<Entity> {
    std::vector<Entity> out;
    out.reserve(live_);
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i].alive) {
            out.push_back(
                Entity{.index = static_cast<std::uint32_t>(i), .generation = slots_[i].generation});
        }
    }
    return out;
}

auto World::attribute_ids(Entity entity) const -> std::vector<AttributeId> {
    std::vector<AttributeId> ids;
    if (const auto* s = slot(entity)) {
        ids.reserve(s->attributes.size());
        for (const auto& [id, value] : s->attributes) {
            ids.push_back(id);
        }
    }
    return ids;
}

auto World::contains(Entity entity, AttributeId id) const -> bool {
    const auto* s = slot(entity);
    return s != nullptr && s->attributes.contains(id);
}

auto World::get(Entity entity, AttributeId id) const -> const std::any* {
    const auto* s = slot(entity);
    if (s == nullptr) {
        return nullptr;
    }
    if (auto it = s->attributes.find(id); it != s->attributes.end()) {
        return &it->second;
    }
    return nullptr;
}

auto World::attribute_info(AttributeId id) const -> const AttributeInfo* {
    if (id == 0 || id > attributes_.size()) {
        return nullptr;
    }
    return &attributes_[id - 1];
}

auto World::slot(Entity entity) const -> const Slot* {
    if (entity.index >= slots_.size()) {
        return nullptr;
    }
    const auto& s = slots_[entity.index];
    if (!s.alive || s.generation != entity.generation) {
        return nullptr;
    }
    return &s;
}

auto World::slot(Entity entity) -> Slot* {
    return const_cast<Slot*>(std::as_const(*this).slot(entity));
}

}  // namespace parcel::store

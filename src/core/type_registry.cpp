#include <parcel/core/entity.hpp>
#include <parcel/core/type_registry.hpp>

#include <algorithm>
#include <stdexcept>

namespace parcel {

auto to_string(TypeKind kind) noexcept -> std::string_view {
    switch (kind) {
        case TypeKind::Value:
            return "value";
        case TypeKind::Struct:
            return "struct";
        case TypeKind::TupleStruct:
            return "tuple struct";
        case TypeKind::Tuple:
            return "tuple";
        case TypeKind::List:
            return "list";
        case TypeKind::Array:
            return "array";
        case TypeKind::Map:
            return "map";
        case TypeKind::Enum:
            return "enum";
    }
    return "unknown";
}

auto TypeDescriptor::field(std::string_view name) const -> const FieldDescriptor* {
    auto it = std::ranges::find(fields, name, &FieldDescriptor::name);
    return it == fields.end() ? nullptr : &*it;
}

auto TypeRegistry::find(TypeId id) const -> const TypeRegistration* {
    if (auto it = types_.find(id); it != types_.end()) {
        return &it->second;
    }
    return nullptr;
}

auto TypeRegistry::descriptor(TypeId id) const -> const TypeDescriptor* {
    const auto* registration = find(id);
    return registration == nullptr ? nullptr : &registration->descriptor;
}

auto TypeRegistry::find_by_path(std::string_view type_path) const -> std::optional<TypeId> {
    if (auto it = by_path_.find(std::string(type_path)); it != by_path_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto TypeRegistry::known_types() const -> std::vector<TypeId> {
    std::vector<TypeId> ids;
    ids.reserve(types_.size());
    for (const auto& [id, registration] : types_) {
        ids.push_back(id);
    }
    std::ranges::sort(ids);
    return ids;
}

auto TypeRegistry::Builder::add(TypeDescriptor descriptor, ReflectFn reflect) -> TypeId {
    if (auto existing = registry_.find_by_path(descriptor.type_path)) {
        return *existing;
    }
    TypeId id = next_id_++;
    descriptor.id = id;
    registry_.by_path_.emplace(descriptor.type_path, id);
    registry_.types_.emplace(
        id, TypeRegistration{.descriptor = std::move(descriptor), .reflect = std::move(reflect)});
    return id;
}

auto TypeRegistry::Builder::add_primitives() -> Builder& {
    auto primitive = [](std::string path) {
        return TypeDescriptor{.type_path = std::move(path), .kind = TypeKind::Value};
    };
    auto identity = [](const auto& v) { return v; };

    add(primitive("f32"), reflect_as<float>("f32", identity));
    add(primitive("f64"), reflect_as<double>("f64", identity));
    add(primitive("i32"), reflect_as<std::int32_t>("i32", identity));
    add(primitive("i64"), reflect_as<std::int64_t>("i64", identity));
    add(primitive("u32"), reflect_as<std::uint32_t>("u32", identity));
    add(primitive("u64"), reflect_as<std::uint64_t>("u64", identity));
    add(primitive("bool"), reflect_as<bool>("bool", identity));
    add(primitive("String"), reflect_as<std::string>("String", identity));
    add(primitive("entity"),
        reflect_as<Entity>("entity", [](const Entity& e) { return e.to_bits(); }));
    return *this;
}

auto TypeRegistry::Builder::find_by_path(std::string_view type_path) const
    -> std::optional<TypeId> {
    return registry_.find_by_path(type_path);
}

auto TypeRegistry::Builder::id_of(std::string_view type_path) const -> TypeId {
    if (auto id = registry_.find_by_path(type_path)) {
        return *id;
    }
    throw std::out_of_range("type not registered: " + std::string(type_path));
}

auto TypeRegistry::Builder::build() && -> TypeRegistry { return std::move(registry_); }

}  // namespace parcel

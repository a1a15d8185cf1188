#include "demo_world.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace parcel::demo {

namespace {

struct Position {
    float x = 0.0F;
    float y = 0.0F;
    float z = 0.0F;
};

struct Velocity {
    float x = 0.0F;
    float y = 0.0F;
};

struct Health {
    std::int32_t output = 0;
};

struct Name {
    std::string value;
};

struct Waypoints {
    std::vector<float> points;
};

enum class Faction : std::uint8_t { Red, Blue };

struct DontSerialize {
    bool inner = false;
};

struct PersistTag {};

}  // namespace

auto make_demo_world(std::size_t groups) -> DemoWorld {
    TypeRegistry::Builder types;
    types.add_primitives();
    auto f32 = types.id_of("f32");
    auto i32 = types.id_of("i32");
    auto string = types.id_of("String");

    auto position = types.add(
        TypeDescriptor{.type_path = "game::physics::Position",
                       .kind = TypeKind::Struct,
                       .fields = {{"x", f32}, {"y", f32}, {"z", f32}}},
        reflect_as<Position>("game::physics::Position", [](const Position& p) {
            return make_struct("game::physics::Position",
                               {{"x", Value{p.x}}, {"y", Value{p.y}}, {"z", Value{p.z}}});
        }));
    auto velocity = types.add(
        TypeDescriptor{.type_path = "game::physics::Velocity",
                       .kind = TypeKind::Struct,
                       .fields = {{"x", f32}, {"y", f32}}},
        reflect_as<Velocity>("game::physics::Velocity", [](const Velocity& v) {
            return make_struct("game::physics::Velocity", {{"x", Value{v.x}}, {"y", Value{v.y}}});
        }));
    auto health = types.add(
        TypeDescriptor{.type_path = "game::stats::Health",
                       .kind = TypeKind::Struct,
                       .fields = {{"output", i32}}},
        reflect_as<Health>("game::stats::Health", [](const Health& h) {
            return make_struct("game::stats::Health", {{"output", Value{h.output}}});
        }));
    auto name = types.add(
        TypeDescriptor{.type_path = "game::Name",
                       .kind = TypeKind::TupleStruct,
                       .fields = {{"0", string}}},
        reflect_as<Name>("game::Name", [](const Name& n) {
            return make_tuple("game::Name", {make_string(n.value)});
        }));
    auto waypoints = types.add(
        TypeDescriptor{.type_path = "game::ai::Waypoints", .kind = TypeKind::List, .item = f32},
        reflect_as<Waypoints>("game::ai::Waypoints", [](const Waypoints& w) {
            std::vector<Value> items;
            items.reserve(w.points.size());
            for (float p : w.points) {
                items.push_back(Value{p});
            }
            return make_list(std::move(items));
        }));
    auto faction = types.add(
        TypeDescriptor{.type_path = "game::Faction",
                       .kind = TypeKind::Enum,
                       .variants = {"Red", "Blue"}},
        reflect_as<Faction>("game::Faction", [](const Faction& f) {
            return make_enum("game::Faction", f == Faction::Red ? "Red" : "Blue");
        }));
    auto tag = types.add(
        TypeDescriptor{.type_path = "persist::PersistTag", .kind = TypeKind::Struct},
        reflect_as<PersistTag>("persist::PersistTag",
                               [](const PersistTag&) { return make_struct("persist::PersistTag", {}); }));

    DemoWorld out{.registry = std::move(types).build()};
    auto& world = out.world;

    auto a_position = world.declare_attribute("game::physics::Position", position);
    auto a_velocity = world.declare_attribute("game::physics::Velocity", velocity);
    auto a_health = world.declare_attribute("game::stats::Health", health);
    auto a_name = world.declare_attribute("game::Name", name);
    auto a_waypoints = world.declare_attribute("game::ai::Waypoints", waypoints);
    auto a_faction = world.declare_attribute("game::Faction", faction);
    auto a_unreflected = world.declare_attribute("game::DontSerialize", std::nullopt);
    auto a_tag = world.declare_attribute("persist::PersistTag", tag, /*marker=*/true);

    for (std::size_t g = 0; g < groups; ++g) {
        auto f = static_cast<float>(g);
        for (int i = 0; i < 3; ++i) {
            auto e = world.spawn();
            world.insert_value(e, a_position, Position{f, f + 1.0F, static_cast<float>(i)});
            world.insert_value(e, a_velocity, Velocity{0.5F * f, -1.0F});
            world.insert_value(e, a_health, Health{100 - i * 10});
            world.insert_value(e, a_name, Name{"unit-" + std::to_string(g * 3 + i)});
            world.insert_value(e, a_tag, PersistTag{});
        }
        for (int i = 0; i < 2; ++i) {
            auto e = world.spawn();
            world.insert_value(e, a_health, Health{50 + i});
            world.insert_value(e, a_unreflected, DontSerialize{true});
            world.insert_value(e, a_tag, PersistTag{});
        }
        for (int i = 0; i < 2; ++i) {
            auto e = world.spawn();
            world.insert_value(e, a_waypoints, Waypoints{{f, f + 0.5F, f + 1.0F}});
            world.insert_value(e, a_faction, i == 0 ? Faction::Red : Faction::Blue);
            world.insert_value(e, a_tag, PersistTag{});
        }
        for (int i = 0; i < 2; ++i) {
            auto e = world.spawn();
            world.insert_value(e, a_position, Position{-f, 0.0F, 0.0F});
            world.insert_value(e, a_velocity, Velocity{});
        }
    }
    return out;
}

}  // namespace parcel::demo

#pragma once

#include <parcel/core/type_registry.hpp>
#include <parcel/store/world.hpp>

#include <cstddef>

namespace parcel::demo {

/// A populated store plus the registry describing its attribute types.
struct DemoWorld {
    TypeRegistry registry;
    store::World world;
};

/// Build a world with `groups` copies of each entity archetype:
///   Position, Velocity, Health, Name, PersistTag   (exported)
///   Health, DontSerialize, PersistTag               (exported, one column)
///   Waypoints, Faction, PersistTag                  (exported)
///   Position, Velocity                              (unmarked, dropped)
[[nodiscard]] auto make_demo_world(std::size_t groups) -> DemoWorld;

}  // namespace parcel::demo

#include <parcel/store/world.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <any>
#include <stdexcept>
#include <string>

TEST_CASE("World attribute declarations", "[store][world]") {
    parcel::store::World world;
    auto health = world.declare_attribute("game::Health", 4);
    auto tag = world.declare_attribute("persist::Tag", 7, /*marker=*/true);
    auto opaque = world.declare_attribute("game::Opaque", std::nullopt);

    REQUIRE(health == 1);
    REQUIRE(tag == 2);
    REQUIRE(opaque == 3);

    SECTION("declaring a name twice returns the first id") {
        REQUIRE(world.declare_attribute("game::Health", 4) == health);
        REQUIRE(world.declare_attribute("persist::Tag", 7, true) == tag);
    }

    SECTION("redeclaring with different metadata throws") {
        REQUIRE_THROWS_AS(world.declare_attribute("game::Health", 9), std::invalid_argument);
        REQUIRE_THROWS_AS(world.declare_attribute("persist::Tag", 7), std::invalid_argument);
        REQUIRE_THROWS_AS(world.declare_attribute("game::Opaque", 1), std::invalid_argument);
        REQUIRE(world.attribute_info(health)->type_id == 4);
        REQUIRE(world.attribute_info(tag)->marker);
    }

    SECTION("metadata is exposed through the store interface") {
        const auto* info = world.attribute_info(tag);
        REQUIRE(info != nullptr);
        REQUIRE(info->name == "persist::Tag");
        REQUIRE(info->marker);
        REQUIRE_FALSE(world.attribute_info(opaque)->type_id.has_value());
        REQUIRE(world.attribute_info(0) == nullptr);
        REQUIRE(world.attribute_info(42) == nullptr);
        REQUIRE(world.key_of(health)->name == "game::Health");
        REQUIRE_FALSE(world.key_of(42).has_value());
    }

    SECTION("find_attribute by name") {
        REQUIRE(world.find_attribute("game::Opaque") == opaque);
        REQUIRE_FALSE(world.find_attribute("game::Missing").has_value());
    }
}

TEST_CASE("World entity lifecycle", "[store][world]") {
    parcel::store::World world;
    auto health = world.declare_attribute("game::Health", 1);

    auto a = world.spawn();
    auto b = world.spawn();
    REQUIRE(world.entity_count() == 2);
    REQUIRE(world.alive(a));

    world.insert_value(a, health, 10);
    REQUIRE(world.contains(a, health));
    REQUIRE_FALSE(world.contains(b, health));
    REQUIRE(std::any_cast<int>(*world.get(a, health)) == 10);

    SECTION("insert replaces an existing value") {
        world.insert_value(a, health, 20);
        REQUIRE(std::any_cast<int>(*world.get(a, health)) == 20);
        REQUIRE(world.attribute_ids(a).size() == 1);
    }

    SECTION("remove detaches one attribute") {
        REQUIRE(world.remove(a, health));
        REQUIRE_FALSE(world.remove(a, health));
        REQUIRE(world.get(a, health) == nullptr);
    }

    SECTION("despawned slots are reused with a new generation") {
        REQUIRE(world.despawn(a));
        REQUIRE_FALSE(world.alive(a));
        REQUIRE_FALSE(world.despawn(a));
        REQUIRE(world.get(a, health) == nullptr);
        REQUIRE(world.attribute_ids(a).empty());

        auto c = world.spawn();
        REQUIRE(c.index == a.index);
        REQUIRE(c.generation == a.generation + 1);
        REQUIRE_FALSE(world.contains(c, health));
        REQUIRE(world.entity_count() == 2);
    }

    SECTION("entities enumerates live entities in slot order") {
        world.despawn(a);
        auto live = world.entities();
        REQUIRE(live.size() == 1);
        REQUIRE(live.front() == b);
    }

    SECTION("invalid inserts throw") {
        REQUIRE_THROWS_AS(world.insert_value(a, 99, 1), std::invalid_argument);
        world.despawn(b);
        REQUIRE_THROWS_AS(world.insert_value(b, health, 1), std::invalid_argument);
    }
}

TEST_CASE("MarkerPolicy", "[store][marker]") {
    parcel::store::AttributeInfo flagged{.id = 1, .name = "persist::Tag", .marker = true};
    parcel::store::AttributeInfo named{.id = 2, .name = "game::PersistMe"};
    parcel::store::AttributeInfo plain{.id = 3, .name = "game::Health"};

    SECTION("flag only by default") {
        parcel::store::MarkerPolicy policy;
        REQUIRE(policy.is_marker(flagged));
        REQUIRE_FALSE(policy.is_marker(named));
        REQUIRE_FALSE(policy.is_marker(plain));
    }

    SECTION("name pattern adds legacy markers") {
        parcel::store::MarkerPolicy policy{.name_pattern = "Persist"};
        REQUIRE(policy.is_marker(flagged));
        REQUIRE(policy.is_marker(named));
        REQUIRE_FALSE(policy.is_marker(plain));
    }

    SECTION("flag can be ignored") {
        parcel::store::MarkerPolicy policy{.use_flag = false};
        REQUIRE_FALSE(policy.is_marker(flagged));
    }
}

#include <parcel/core/entity.hpp>
#include <parcel/core/type_registry.hpp>

#include <catch2/catch_test_macros.hpp>

#include <any>
#include <stdexcept>
#include <string>

namespace {

struct Point {
    float x = 0.0F;
    float y = 0.0F;
};

}  // namespace

TEST_CASE("Builder assigns stable ids", "[core][registry]") {
    parcel::TypeRegistry::Builder builder;
    builder.add_primitives();

    auto f32 = builder.id_of("f32");
    auto point = builder.add(parcel::TypeDescriptor{.type_path = "geo::Point",
                                                    .kind = parcel::TypeKind::Struct,
                                                    .fields = {{"x", f32}, {"y", f32}}});

    SECTION("re-adding a path returns the existing id") {
        auto again = builder.add(parcel::TypeDescriptor{.type_path = "geo::Point"});
        REQUIRE(again == point);
    }

    SECTION("unknown paths throw from id_of") {
        REQUIRE_THROWS_AS(builder.id_of("geo::Missing"), std::out_of_range);
        REQUIRE_FALSE(builder.find_by_path("geo::Missing").has_value());
    }

    SECTION("built registry exposes descriptors") {
        auto registry = std::move(builder).build();
        REQUIRE(registry.size() == 10);
        REQUIRE(registry.contains(point));
        const auto* desc = registry.descriptor(point);
        REQUIRE(desc != nullptr);
        REQUIRE(desc->id == point);
        REQUIRE(desc->kind == parcel::TypeKind::Struct);
        REQUIRE(desc->field("y") != nullptr);
        REQUIRE(desc->field("y")->type == f32);
        REQUIRE(desc->field("z") == nullptr);
        REQUIRE(registry.find_by_path("geo::Point") == point);
        REQUIRE(registry.descriptor(9999) == nullptr);
    }
}

TEST_CASE("known_types is sorted and complete", "[core][registry]") {
    parcel::TypeRegistry::Builder builder;
    builder.add_primitives();
    auto registry = std::move(builder).build();

    auto ids = registry.known_types();
    REQUIRE(ids.size() == registry.size());
    for (std::size_t i = 1; i < ids.size(); ++i) {
        REQUIRE(ids[i - 1] < ids[i]);
    }
}

TEST_CASE("Primitive reflection", "[core][registry]") {
    parcel::TypeRegistry::Builder builder;
    builder.add_primitives();
    auto registry = std::move(builder).build();

    SECTION("matching stored type reflects to the same scalar") {
        const auto* i32 = registry.find(*registry.find_by_path("i32"));
        REQUIRE(i32 != nullptr);
        auto value = i32->reflect(std::any(std::int32_t{12}));
        REQUIRE(value.has_value());
        REQUIRE(*value->get_if<std::int32_t>() == 12);
    }

    SECTION("entity reflects to its 64-bit representation") {
        const auto* entity = registry.find(*registry.find_by_path("entity"));
        parcel::Entity e{.index = 3, .generation = 1};
        auto value = entity->reflect(std::any(e));
        REQUIRE(value.has_value());
        REQUIRE(*value->get_if<std::uint64_t>() == e.to_bits());
        REQUIRE(parcel::Entity::from_bits(e.to_bits()) == e);
    }

    SECTION("mismatched stored type is a serialization failure") {
        const auto* f64 = registry.find(*registry.find_by_path("f64"));
        auto value = f64->reflect(std::any(std::string("nope")));
        REQUIRE_FALSE(value.has_value());
        REQUIRE(value.error().kind == parcel::ErrorKind::SerializationFailure);
    }
}

TEST_CASE("reflect_as wraps custom conversions", "[core][registry]") {
    auto reflect = parcel::reflect_as<Point>("geo::Point", [](const Point& p) {
        return parcel::make_struct("geo::Point", {{"x", parcel::Value{p.x}},
                                                  {"y", parcel::Value{p.y}}});
    });
    auto value = reflect(std::any(Point{1.0F, 2.0F}));
    REQUIRE(value.has_value());
    REQUIRE(parcel::debug_format(*value) == "Point { x: 1.0, y: 2.0 }");
}

TEST_CASE("Error formatting", "[core][error]") {
    parcel::Error err{.kind = parcel::ErrorKind::IoFailure, .message = "disk full"};
    REQUIRE(err.format() == "io failure: disk full");
    REQUIRE(fmt::format("{}", err) == "io failure: disk full");
    REQUIRE(parcel::to_string(parcel::ErrorKind::SerializationFailure) == "serialization failure");
    REQUIRE(parcel::write_failure("x").error().kind == parcel::ErrorKind::WriteFailure);
}

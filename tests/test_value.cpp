#include <parcel/core/value.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <cstdint>
#include <limits>

TEST_CASE("Value reports its kind", "[core][value]") {
    REQUIRE(parcel::Value{true}.kind() == parcel::ValueKind::Bool);
    REQUIRE(parcel::Value{1.5F}.kind() == parcel::ValueKind::Float32);
    REQUIRE(parcel::Value{1.5}.kind() == parcel::ValueKind::Float64);
    REQUIRE(parcel::Value{std::int32_t{3}}.kind() == parcel::ValueKind::Int32);
    REQUIRE(parcel::Value{std::uint64_t{3}}.kind() == parcel::ValueKind::UInt64);
    REQUIRE(parcel::make_string("x").kind() == parcel::ValueKind::String);
    REQUIRE(parcel::make_list({}).kind() == parcel::ValueKind::List);

    REQUIRE(parcel::make_string("x").is_scalar());
    REQUIRE_FALSE(parcel::make_tuple("", {}).is_scalar());
}

TEST_CASE("format_float always carries a decimal point", "[core][value]") {
    REQUIRE(parcel::format_float(1.0, false) == "1.0");
    REQUIRE(parcel::format_float(-3.0, true) == "-3.0");
    REQUIRE(parcel::format_float(0.1, true) == "0.1");
    REQUIRE(parcel::format_float(2.5, false) == "2.5");
    REQUIRE(parcel::format_float(1e300, false) == "1e300");
    REQUIRE(parcel::format_float(std::numeric_limits<double>::quiet_NaN(), false) == "NaN");
    REQUIRE(parcel::format_float(-std::numeric_limits<double>::infinity(), false) == "-inf");
}

TEST_CASE("debug_format renders scalars", "[core][value]") {
    REQUIRE(parcel::debug_format(parcel::Value{false}) == "false");
    REQUIRE(parcel::debug_format(parcel::Value{std::int64_t{-42}}) == "-42");
    REQUIRE(parcel::debug_format(parcel::Value{std::uint32_t{7}}) == "7");
    REQUIRE(parcel::debug_format(parcel::Value{4.0F}) == "4.0");
    REQUIRE(parcel::debug_format(parcel::make_string("say \"hi\"\n")) ==
            "\"say \\\"hi\\\"\\n\"");
}

TEST_CASE("debug_format renders composites", "[core][value]") {
    SECTION("struct uses the short type name") {
        auto v = parcel::make_struct("game::stats::Health",
                                     {{"output", parcel::Value{std::int32_t{100}}},
                                      {"max", parcel::Value{1.5F}}});
        REQUIRE(parcel::debug_format(v) == "Health { output: 100, max: 1.5 }");
    }

    SECTION("unit struct is just its name") {
        REQUIRE(parcel::debug_format(parcel::make_struct("persist::PersistTag", {})) ==
                "PersistTag");
    }

    SECTION("tuple struct and anonymous tuples") {
        REQUIRE(parcel::debug_format(parcel::make_tuple("game::Name", {parcel::make_string("a")})) ==
                "Name(\"a\")");
        REQUIRE(parcel::debug_format(parcel::make_tuple("", {parcel::Value{std::int32_t{1}}})) ==
                "(1,)");
        REQUIRE(parcel::debug_format(parcel::make_tuple(
                    "", {parcel::Value{std::int32_t{1}}, parcel::Value{std::int32_t{2}}})) ==
                "(1, 2)");
    }

    SECTION("lists, arrays and enums") {
        REQUIRE(parcel::debug_format(parcel::make_list({parcel::Value{1.0F}, parcel::Value{2.5F}})) ==
                "[1.0, 2.5]");
        REQUIRE(parcel::debug_format(parcel::make_array({})) == "[]");
        REQUIRE(parcel::debug_format(parcel::make_enum("game::Faction", "Red")) == "Red");
        REQUIRE(parcel::debug_format(parcel::make_enum("game::Shape", "Circle",
                                                       {parcel::Value{2.0}})) == "Circle(2.0)");
    }

    SECTION("opaque values keep their representation") {
        parcel::Value v{parcel::OpaqueValue{.type_path = "x::Handle", .repr = "Handle<7>"}};
        REQUIRE(parcel::debug_format(v) == "Handle<7>");
    }
}

TEST_CASE("StructValue field lookup", "[core][value]") {
    auto v = parcel::make_struct("a::B", {{"output", parcel::Value{std::int32_t{5}}}});
    const auto* s = v.get_if<parcel::StructValue>();
    REQUIRE(s != nullptr);
    REQUIRE(s->field("output") != nullptr);
    REQUIRE(*s->field("output")->get_if<std::int32_t>() == 5);
    REQUIRE(s->field("missing") == nullptr);
}

TEST_CASE("short_name strips the namespace", "[core][value]") {
    REQUIRE(parcel::short_name("game::stats::Health") == "Health");
    REQUIRE(parcel::short_name("Health") == "Health");
    REQUIRE(parcel::short_name("") == "");
}

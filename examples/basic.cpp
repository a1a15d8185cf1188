#include <parcel/parcel.hpp>

#include <fmt/core.h>

#include <cstdint>

namespace {

struct Health {
    std::int32_t output = 0;
};

struct Tag {};

}  // namespace

auto main() -> int {
    // Describe the attribute types once; the registry is immutable afterwards.
    parcel::TypeRegistry::Builder types;
    types.add_primitives();
    auto health_type = types.add(
        parcel::TypeDescriptor{.type_path = "example::Health",
                               .kind = parcel::TypeKind::Struct,
                               .fields = {{"output", types.id_of("i32")}}},
        parcel::reflect_as<Health>("example::Health", [](const Health& h) {
            return parcel::make_struct("example::Health", {{"output", parcel::Value{h.output}}});
        }));
    auto tag_type = types.add(parcel::TypeDescriptor{.type_path = "example::Tag",
                                                     .kind = parcel::TypeKind::Struct});
    auto registry = std::move(types).build();

    parcel::store::World world;
    auto health = world.declare_attribute("example::Health", health_type);
    auto tag = world.declare_attribute("example::Tag", tag_type, /*marker=*/true);

    for (std::int32_t hp : {100, 50, 75}) {
        auto e = world.spawn();
        world.insert_value(e, health, Health{hp});
        world.insert_value(e, tag, Tag{});
    }

    fmt::print("=== Cluster detection ===\n");
    for (const auto& cluster : parcel::engine::detect_clusters(world, registry)) {
        fmt::print("cluster: {}\n", parcel::engine::describe(cluster));
    }

    fmt::print("\n=== Export ===\n");
    parcel::engine::ExportConfig config;
    config.output_path = "./example";
    auto report = parcel::engine::export_store(world, registry, config);
    if (!report) {
        fmt::print("export failed: {}\n", report.error().format());
        return 1;
    }
    for (const auto& file : report->files) {
        fmt::print("{}: {} rows\n", file.path, file.rows);
    }
    return 0;
}

#pragma once

#include <parcel/core/type_registry.hpp>
#include <parcel/store/entity_store.hpp>

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace parcel::engine {

/// Attribute signature of one entity (or of a cluster), ordered by name then id.
using Signature = std::set<store::AttributeKey>;

struct EntitySignature {
    Entity entity;
    Signature signature;
};

/// A group of attributes shared by one or more entities; exported together.
struct Cluster {
    std::vector<store::AttributeKey> attributes;

    auto operator==(const Cluster&) const -> bool = default;
};

/// How the comparison base evolves while a seed scans the remaining entities.
enum class SeedNarrowing : std::uint8_t {
    /// The seed is narrowed to each accepted intersection immediately, so later
    /// candidates in the same pass compare against the narrowed signature.
    /// Result depends on entity order.
    Progressive,
    /// Candidates always compare against the seed entity's own signature; the
    /// emitted cluster is still the intersection of all accepted members.
    FixedSeed,
};

struct ClusterOptions {
    /// Candidates merge when Jaccard similarity is strictly greater than this.
    double similarity_threshold = 0.8;
    SeedNarrowing narrowing = SeedNarrowing::Progressive;
};

/// Per-entity signatures restricted to attributes whose type id is in
/// `registry.known_types()`. Entities left with an empty signature are
/// dropped. Order follows `store.entities()`.
[[nodiscard]] auto collect_signatures(const store::EntityStore& store,
                                      const TypeRegistry& registry)
    -> std::vector<EntitySignature>;

/// |a ∩ b| / |a ∪ b|; 0 when both are empty.
[[nodiscard]] auto jaccard(const Signature& a, const Signature& b) -> double;

/// Greedy single-pass grouping. Each entity joins at most one cluster (the
/// first seed that accepts it), so clusters are entity-disjoint. O(n²).
[[nodiscard]] auto detect_clusters(const std::vector<EntitySignature>& signatures,
                                   const ClusterOptions& options = {}) -> std::vector<Cluster>;

[[nodiscard]] auto detect_clusters(const store::EntityStore& store, const TypeRegistry& registry,
                                   const ClusterOptions& options = {}) -> std::vector<Cluster>;

/// Whether any attribute of `cluster` is a marker under `policy`.
[[nodiscard]] auto has_marker(const Cluster& cluster, const store::EntityStore& store,
                              const store::MarkerPolicy& policy) -> bool;

/// "[a::Pos, b::Tag]" for logs.
[[nodiscard]] auto describe(const Cluster& cluster) -> std::string;

}  // namespace parcel::engine

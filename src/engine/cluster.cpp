#include <parcel/engine/cluster.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <unordered_set>

namespace parcel::engine {

namespace {

auto intersect(const Signature& a, const Signature& b) -> Signature {
    Signature out;
    std::ranges::set_intersection(a, b, std::inserter(out, out.end()));
    return out;
}

}  // namespace

auto collect_signatures(const store::EntityStore& store, const TypeRegistry& registry)
    -> std::vector<EntitySignature> {
    auto known = registry.known_types();
    std::unordered_set<TypeId> allowed(known.begin(), known.end());

    std::vector<EntitySignature> out;
    for (auto entity : store.entities()) {
        Signature signature;
        for (auto id : store.attribute_ids(entity)) {
            const auto* info = store.attribute_info(id);
            if (info == nullptr || !info->type_id || !allowed.contains(*info->type_id)) {
                continue;
            }
            signature.insert(store::AttributeKey{.name = info->name, .id = info->id});
        }
        if (signature.empty()) {
            continue;
        }
        out.push_back(EntitySignature{.entity = entity, .signature = std::move(signature)});
    }
    return out;
}

auto jaccard(const Signature& a, const Signature& b) -> double {
    std::size_t common = 0;
    auto ia = a.begin();
    auto ib = b.begin();
    while (ia != a.end() && ib != b.end()) {
        if (*ia < *ib) {
            ++ia;
        } else if (*ib < *ia) {
            ++ib;
        } else {
            ++common;
            ++ia;
            ++ib;
        }
    }
    std::size_t total = a.size() + b.size() - common;
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(common) / static_cast<double>(total);
}

auto detect_clusters(const std::vector<EntitySignature>& signatures, const ClusterOptions& options)
    -> std::vector<Cluster> {
    std::vector<Cluster> clusters;
    std::vector<bool> assigned(signatures.size(), false);

    for (std::size_t i = 0; i < signatures.size(); ++i) {
        if (assigned[i]) {
            continue;
        }
        assigned[i] = true;
        const auto& seed = signatures[i].signature;
        Signature cluster = seed;
        std::size_t members = 1;

        for (std::size_t j = i + 1; j < signatures.size(); ++j) {
            if (assigned[j]) {
                continue;
            }
            const auto& other = signatures[j].signature;
            const auto& base = options.narrowing == SeedNarrowing::Progressive ? cluster : seed;
            if (jaccard(base, other) > options.similarity_threshold) {
                cluster = intersect(cluster, other);
                assigned[j] = true;
                ++members;
            }
        }

        if (cluster.empty()) {
            spdlog::debug("seed {} narrowed to an empty signature; no cluster emitted",
                          signatures[i].entity.to_string());
            continue;
        }
        Cluster out{.attributes = {cluster.begin(), cluster.end()}};
        spdlog::debug("cluster {} seeded by {} with {} member(s)", describe(out),
                      signatures[i].entity.to_string(), members);
        clusters.push_back(std::move(out));
    }
    return clusters;
}

auto detect_clusters(const store::EntityStore& store, const TypeRegistry& registry,
                     const ClusterOptions& options) -> std::vector<Cluster> {
    return detect_clusters(collect_signatures(store, registry), options);
}

auto has_marker(const Cluster& cluster, const store::EntityStore& store,
                const store::MarkerPolicy& policy) -> bool {
    return std::ranges::any_of(cluster.attributes, [&](const store::AttributeKey& key) {
        const auto* info = store.attribute_info(key.id);
        if (info != nullptr) {
            return policy.is_marker(*info);
        }
        // Undeclared ids can only be judged by name.
        return policy.is_marker(store::AttributeInfo{.id = key.id, .name = key.name});
    });
}

auto describe(const Cluster& cluster) -> std::string {
    std::string out = "[";
    for (std::size_t i = 0; i < cluster.attributes.size(); ++i) {
        if (i > 0) {
            out.append(", ");
        }
        out.append(cluster.attributes[i].name);
    }
    out.push_back(']');
    return out;
}

}  // namespace parcel::engine

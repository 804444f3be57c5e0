#include <graph_complex/graph_family.hpp>
#include <stdexcept>

namespace graph_complex {

namespace {

bool all_at_least(const std::vector<std::size_t>& deg, std::size_t begin, std::size_t end,
                  std::size_t minimum) {
    for (std::size_t v = begin; v < end; ++v) {
        if (deg[v] < minimum) return false;
    }
    return true;
}

long internal_edge_count(const GradingKey& key) {
    return static_cast<long>(key.loops()) + key.vertices() - 1;
}

} // namespace

std::size_t GraphFamily::work_estimate(const GradingKey& key) const {
    if (!is_valid(key)) return 0;
    std::size_t n = num_vertices(key);
    std::size_t m = num_edges(key);
    return n * m * m;
}

std::vector<SignedGraph> contract_edges(const Graph& g, const OrientationPolicy& orientation,
                                        std::size_t internal_vertices) {
    std::vector<SignedGraph> images;
    images.reserve(g.num_edges());
    for (const auto& e : g.edges()) {
        if (e.v >= internal_vertices) continue;

        Permutation to_front = permute_to_front(e.u, e.v, g.num_vertices());
        int sign = orientation.relabel_sign(g, to_front);
        auto merged = merge_first_two(g.relabeled(to_front));
        if (!merged) continue;  // would create a multiple edge

        sign *= orientation.merge_sign(merged->surviving_edges);
        images.push_back({std::move(merged->graph), sign});
    }
    return images;
}

std::vector<SignedGraph> delete_edges(const Graph& g, const OrientationPolicy& orientation) {
    if (!orientation.supports_deletion()) {
        throw std::invalid_argument("Orientation does not support edge deletion");
    }
    std::vector<SignedGraph> images;
    images.reserve(g.num_edges());
    for (std::size_t i = 0; i < g.num_edges(); ++i) {
        images.push_back({g.without_edge(i), orientation.deletion_sign(i)});
    }
    return images;
}

// ============================================================================
// Ordinary graphs
// ============================================================================

bool OrdinaryFamily::is_valid(const GradingKey& key) const {
    const long v = key.vertices();
    const long e = internal_edge_count(key);
    return v > 0 && key.loops() >= 0 && e >= 0 && 3 * v <= 2 * e && e <= v * (v - 1) / 2;
}

std::size_t OrdinaryFamily::num_vertices(const GradingKey& key) const {
    return key.vertices() > 0 ? static_cast<std::size_t>(key.vertices()) : 0;
}

std::size_t OrdinaryFamily::num_edges(const GradingKey& key) const {
    long e = internal_edge_count(key);
    return e > 0 ? static_cast<std::size_t>(e) : 0;
}

Partition OrdinaryFamily::partition(const GradingKey& key) const {
    std::vector<VertexId> all;
    for (std::size_t v = 0; v < num_vertices(key); ++v) all.push_back(static_cast<VertexId>(v));
    return Partition{all};
}

EnumerationRequest OrdinaryFamily::enumeration_request(const GradingKey& key) const {
    EnumerationRequest request;
    request.classes.push_back(ColourClass{num_vertices(key), 3, MAX_GRAPH_VERTICES});
    request.num_edges = num_edges(key);
    request.connected = true;
    return request;
}

bool OrdinaryFamily::is_admissible(const GradingKey& key, const Graph& g) const {
    if (!is_valid(key)) return false;
    if (g.num_vertices() != num_vertices(key) || g.num_edges() != num_edges(key)) return false;
    return all_at_least(g.degrees(), 0, g.num_vertices(), 3) && g.is_connected();
}

std::shared_ptr<const OrientationPolicy> OrdinaryFamily::orientation(const GradingKey& key) const {
    return make_orientation(key.edge_parity());
}

bool OrdinaryFamily::supports(OperatorKind kind, const GradingKey& key) const {
    switch (kind) {
        case OperatorKind::Contract: return true;
        case OperatorKind::Delete: return key.edge_parity() == EdgeParity::Odd;
    }
    return false;
}

GradingKey OrdinaryFamily::target_of(OperatorKind kind, const GradingKey& domain) const {
    if (kind == OperatorKind::Contract) return domain.with_vertices(domain.vertices() - 1);
    return domain.with_loops(domain.loops() - 1);
}

GradingKey OrdinaryFamily::source_of(OperatorKind kind, const GradingKey& target) const {
    if (kind == OperatorKind::Contract) return target.with_vertices(target.vertices() + 1);
    return target.with_loops(target.loops() + 1);
}

std::vector<SignedGraph> OrdinaryFamily::apply(OperatorKind kind, const GradingKey& domain,
                                               const Graph& g) const {
    if (!supports(kind, domain)) {
        throw std::invalid_argument(std::string(operator_name(kind)) + " is not defined on " +
                                    domain.to_string());
    }
    auto policy = orientation(domain);
    if (kind == OperatorKind::Contract) {
        return contract_edges(g, *policy, g.num_vertices());
    }
    return delete_edges(g, *policy);
}

// ============================================================================
// Hairy graphs
// ============================================================================

bool HairyFamily::is_valid(const GradingKey& key) const {
    const long v = key.vertices();
    const long e = internal_edge_count(key);
    return v > 0 && key.loops() >= 0 && key.hairs() >= 0 && e >= 0 &&
           3 * v <= 2 * e + key.hairs() && e <= v * (v - 1) / 2;
}

std::size_t HairyFamily::num_vertices(const GradingKey& key) const {
    long n = static_cast<long>(key.vertices()) + key.hairs();
    return n > 0 ? static_cast<std::size_t>(n) : 0;
}

std::size_t HairyFamily::num_edges(const GradingKey& key) const {
    long e = internal_edge_count(key) + key.hairs();
    return e > 0 ? static_cast<std::size_t>(e) : 0;
}

Partition HairyFamily::partition(const GradingKey& key) const {
    Partition p(2);
    for (int v = 0; v < key.vertices(); ++v) p[0].push_back(static_cast<VertexId>(v));
    for (int h = 0; h < key.hairs(); ++h) p[1].push_back(static_cast<VertexId>(key.vertices() + h));
    return p;
}

EnumerationRequest HairyFamily::enumeration_request(const GradingKey& key) const {
    EnumerationRequest request;
    request.classes.push_back(ColourClass{static_cast<std::size_t>(key.vertices()), 3, MAX_GRAPH_VERTICES});
    request.classes.push_back(ColourClass{static_cast<std::size_t>(key.hairs()), 1, 1});
    request.forbidden_class_pairs.emplace_back(1, 1);
    request.num_edges = num_edges(key);
    request.connected = true;
    return request;
}

bool HairyFamily::is_admissible(const GradingKey& key, const Graph& g) const {
    if (!is_valid(key)) return false;
    if (g.num_vertices() != num_vertices(key) || g.num_edges() != num_edges(key)) return false;
    const auto internal = static_cast<VertexId>(key.vertices());
    const auto deg = g.degrees();
    if (!all_at_least(deg, 0, internal, 3)) return false;
    for (std::size_t h = internal; h < g.num_vertices(); ++h) {
        if (deg[h] != 1) return false;
    }
    for (const auto& e : g.edges()) {
        if (e.u >= internal) return false;  // hair joined to a hair
    }
    return g.is_connected();
}

std::shared_ptr<const OrientationPolicy> HairyFamily::orientation(const GradingKey& key) const {
    return std::make_shared<HairOrientation>(make_orientation(key.edge_parity()),
                                             static_cast<std::size_t>(key.vertices()),
                                             key.hair_parity());
}

bool HairyFamily::supports(OperatorKind kind, const GradingKey&) const {
    return kind == OperatorKind::Contract;
}

GradingKey HairyFamily::target_of(OperatorKind kind, const GradingKey& domain) const {
    if (kind != OperatorKind::Contract) {
        throw std::invalid_argument("Hairy graphs only support contraction");
    }
    return domain.with_vertices(domain.vertices() - 1);
}

GradingKey HairyFamily::source_of(OperatorKind kind, const GradingKey& target) const {
    if (kind != OperatorKind::Contract) {
        throw std::invalid_argument("Hairy graphs only support contraction");
    }
    return target.with_vertices(target.vertices() + 1);
}

std::vector<SignedGraph> HairyFamily::apply(OperatorKind kind, const GradingKey& domain,
                                            const Graph& g) const {
    if (!supports(kind, domain)) {
        throw std::invalid_argument("Hairy graphs only support contraction");
    }
    auto policy = orientation(domain);
    return contract_edges(g, *policy, static_cast<std::size_t>(domain.vertices()));
}

std::shared_ptr<const GraphFamily> make_family(ComplexFamily family) {
    switch (family) {
        case ComplexFamily::Ordinary: return std::make_shared<OrdinaryFamily>();
        case ComplexFamily::Hairy: return std::make_shared<HairyFamily>();
    }
    throw std::invalid_argument("Unknown complex family");
}

} // namespace graph_complex

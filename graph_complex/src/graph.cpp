#include <graph_complex/graph.hpp>
#include <algorithm>
#include <stdexcept>

namespace graph_complex {

Graph::Graph(std::size_t num_vertices, std::vector<Edge> edges)
    : num_vertices_(num_vertices), edges_(std::move(edges)) {
    if (num_vertices_ > MAX_GRAPH_VERTICES) {
        throw std::invalid_argument("Graph has more than 62 vertices");
    }
    for (const auto& e : edges_) {
        if (e.u == e.v) {
            throw std::invalid_argument("Self loop at vertex " + std::to_string(e.u));
        }
        if (e.v >= num_vertices_) {
            throw std::invalid_argument("Edge endpoint " + std::to_string(e.v) + " out of range");
        }
    }
    std::sort(edges_.begin(), edges_.end());
    if (std::adjacent_find(edges_.begin(), edges_.end()) != edges_.end()) {
        throw std::invalid_argument("Duplicate edge");
    }
}

bool Graph::has_edge(VertexId a, VertexId b) const {
    return edge_index(a, b) < edges_.size();
}

std::size_t Graph::edge_index(VertexId a, VertexId b) const {
    Edge e(a, b);
    auto it = std::lower_bound(edges_.begin(), edges_.end(), e);
    if (it != edges_.end() && *it == e) {
        return static_cast<std::size_t>(it - edges_.begin());
    }
    return edges_.size();
}

std::vector<std::size_t> Graph::degrees() const {
    std::vector<std::size_t> deg(num_vertices_, 0);
    for (const auto& e : edges_) {
        ++deg[e.u];
        ++deg[e.v];
    }
    return deg;
}

std::vector<std::vector<VertexId>> Graph::adjacency() const {
    std::vector<std::vector<VertexId>> adj(num_vertices_);
    for (const auto& e : edges_) {
        adj[e.u].push_back(e.v);
        adj[e.v].push_back(e.u);
    }
    return adj;
}

bool Graph::is_connected() const {
    if (num_vertices_ <= 1) return true;
    auto adj = adjacency();
    std::vector<bool> seen(num_vertices_, false);
    std::vector<VertexId> stack{0};
    seen[0] = true;
    std::size_t reached = 1;
    while (!stack.empty()) {
        VertexId x = stack.back();
        stack.pop_back();
        for (VertexId y : adj[x]) {
            if (!seen[y]) {
                seen[y] = true;
                ++reached;
                stack.push_back(y);
            }
        }
    }
    return reached == num_vertices_;
}

Graph Graph::relabeled(const Permutation& p) const {
    if (!is_permutation(p, num_vertices_)) {
        throw std::invalid_argument("Relabeling is not a permutation of the vertex set");
    }
    Graph g(num_vertices_);
    g.edges_.reserve(edges_.size());
    for (const auto& e : edges_) {
        g.edges_.emplace_back(p[e.u], p[e.v]);
    }
    std::sort(g.edges_.begin(), g.edges_.end());
    return g;
}

Graph Graph::with_edge(VertexId a, VertexId b) const {
    if (a == b || a >= num_vertices_ || b >= num_vertices_) {
        throw std::invalid_argument("Invalid edge");
    }
    Graph g = *this;
    Edge e(a, b);
    auto it = std::lower_bound(g.edges_.begin(), g.edges_.end(), e);
    if (it != g.edges_.end() && *it == e) {
        throw std::invalid_argument("Edge already present");
    }
    g.edges_.insert(it, e);
    return g;
}

Graph Graph::without_edge(std::size_t index) const {
    if (index >= edges_.size()) {
        throw std::out_of_range("Edge index out of range");
    }
    Graph g = *this;
    g.edges_.erase(g.edges_.begin() + static_cast<std::ptrdiff_t>(index));
    return g;
}

// graph6: one byte n+63, then the upper triangle column by column
// (x(0,1), x(0,2), x(1,2), x(0,3), ...) packed six bits per byte, high bit first.
std::string Graph::to_g6() const {
    std::string result;
    result.push_back(static_cast<char>(num_vertices_ + 63));

    std::vector<bool> bits;
    bits.reserve(num_vertices_ * num_vertices_ / 2 + 6);
    for (std::size_t j = 1; j < num_vertices_; ++j) {
        for (std::size_t i = 0; i < j; ++i) {
            bits.push_back(has_edge(static_cast<VertexId>(i), static_cast<VertexId>(j)));
        }
    }
    while (bits.size() % 6 != 0) bits.push_back(false);

    for (std::size_t k = 0; k < bits.size(); k += 6) {
        int value = 0;
        for (std::size_t i = 0; i < 6; ++i) {
            if (bits[k + i]) value |= 1 << (5 - i);
        }
        result.push_back(static_cast<char>(value + 63));
    }
    return result;
}

Graph Graph::from_g6(const std::string& g6) {
    if (g6.empty()) {
        throw std::invalid_argument("Empty graph6 string");
    }
    int n = static_cast<int>(static_cast<unsigned char>(g6[0])) - 63;
    if (n < 0 || n > static_cast<int>(MAX_GRAPH_VERTICES)) {
        throw std::invalid_argument("Unsupported graph6 size byte in '" + g6 + "'");
    }
    std::size_t num_bits = static_cast<std::size_t>(n) * static_cast<std::size_t>(n > 0 ? n - 1 : 0) / 2;
    std::size_t expected_length = 1 + (num_bits + 5) / 6;
    if (g6.size() != expected_length) {
        throw std::invalid_argument("graph6 string '" + g6 + "' has wrong length");
    }

    std::vector<Edge> edges;
    std::size_t bit = 0;
    for (int j = 1; j < n; ++j) {
        for (int i = 0; i < j; ++i, ++bit) {
            int c = static_cast<int>(static_cast<unsigned char>(g6[1 + bit / 6])) - 63;
            if (c < 0 || c > 63) {
                throw std::invalid_argument("Invalid graph6 character in '" + g6 + "'");
            }
            if (c & (1 << (5 - bit % 6))) {
                edges.emplace_back(static_cast<VertexId>(i), static_cast<VertexId>(j));
            }
        }
    }
    return Graph(static_cast<std::size_t>(n), std::move(edges));
}

int permutation_sign(const Permutation& p) {
    std::vector<bool> visited(p.size(), false);
    std::size_t even_cycles = 0;
    for (std::size_t i = 0; i < p.size(); ++i) {
        if (visited[i]) continue;
        std::size_t length = 0;
        std::size_t j = i;
        while (!visited[j]) {
            visited[j] = true;
            j = p[j];
            ++length;
        }
        if (length % 2 == 0) ++even_cycles;
    }
    return (even_cycles % 2 == 0) ? 1 : -1;
}

int sequence_sign(const std::vector<std::size_t>& values) {
    std::size_t inversions = 0;
    for (std::size_t i = 0; i < values.size(); ++i) {
        for (std::size_t j = i + 1; j < values.size(); ++j) {
            if (values[i] > values[j]) ++inversions;
        }
    }
    return (inversions % 2 == 0) ? 1 : -1;
}

Permutation inverse_permutation(const Permutation& p) {
    Permutation inv(p.size());
    for (std::size_t i = 0; i < p.size(); ++i) {
        inv[p[i]] = static_cast<VertexId>(i);
    }
    return inv;
}

Permutation permute_to_front(VertexId u, VertexId v, std::size_t n) {
    if (u == v || u >= n || v >= n) {
        throw std::invalid_argument("permute_to_front needs two distinct vertices");
    }
    Permutation p(n);
    p[u] = 0;
    p[v] = 1;
    VertexId next = 2;
    for (std::size_t i = 0; i < n; ++i) {
        if (i != u && i != v) p[i] = next++;
    }
    return p;
}

bool is_permutation(const Permutation& p, std::size_t n) {
    if (p.size() != n) return false;
    std::vector<bool> seen(n, false);
    for (VertexId x : p) {
        if (x >= n || seen[x]) return false;
        seen[x] = true;
    }
    return true;
}

std::vector<std::size_t> induced_edge_order(const Graph& g, const Permutation& p) {
    struct Labeled {
        Edge edge;
        std::size_t label;
    };
    std::vector<Labeled> labeled;
    labeled.reserve(g.num_edges());
    for (std::size_t i = 0; i < g.num_edges(); ++i) {
        const auto& e = g.edges()[i];
        labeled.push_back({Edge(p[e.u], p[e.v]), i});
    }
    std::sort(labeled.begin(), labeled.end(),
              [](const Labeled& a, const Labeled& b) { return a.edge < b.edge; });

    std::vector<std::size_t> order;
    order.reserve(labeled.size());
    for (const auto& l : labeled) order.push_back(l.label);
    return order;
}

std::optional<MergeResult> merge_first_two(const Graph& g) {
    if (g.num_vertices() < 2 || !g.has_edge(0, 1)) {
        throw std::invalid_argument("merge_first_two requires the edge (0,1)");
    }
    auto shift = [](VertexId x) -> VertexId {
        if (x <= 1) return 0;
        return x - 1;
    };

    struct Labeled {
        Edge edge;
        std::size_t label;
    };
    std::vector<Labeled> merged;
    merged.reserve(g.num_edges());
    for (std::size_t i = 0; i < g.num_edges(); ++i) {
        const auto& e = g.edges()[i];
        if (e.u == 0 && e.v == 1) continue;
        merged.push_back({Edge(shift(e.u), shift(e.v)), i});
    }
    std::sort(merged.begin(), merged.end(),
              [](const Labeled& a, const Labeled& b) { return a.edge < b.edge; });
    for (std::size_t i = 1; i < merged.size(); ++i) {
        if (merged[i].edge == merged[i - 1].edge) {
            return std::nullopt;
        }
    }

    std::vector<Edge> edges;
    MergeResult result;
    edges.reserve(merged.size());
    result.surviving_edges.reserve(merged.size());
    for (const auto& m : merged) {
        edges.push_back(m.edge);
        result.surviving_edges.push_back(m.label);
    }
    result.graph = Graph(g.num_vertices() - 1, std::move(edges));
    return result;
}

} // namespace graph_complex

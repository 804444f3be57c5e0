#include <graph_complex/graph_oracle.hpp>
#include <graph_complex/errors.hpp>
#include <graph_complex/log.hpp>
#include <algorithm>
#include <map>
#include <stdexcept>
#include <string>

namespace graph_complex {

std::size_t EnumerationRequest::num_vertices() const {
    std::size_t n = 0;
    for (const auto& c : classes) n += c.size;
    return n;
}

Partition EnumerationRequest::partition() const {
    Partition p;
    VertexId next = 0;
    for (const auto& c : classes) {
        std::vector<VertexId> cell;
        for (std::size_t i = 0; i < c.size; ++i) cell.push_back(next++);
        p.push_back(std::move(cell));
    }
    return p;
}

std::vector<std::size_t> EnumerationRequest::class_of_vertices() const {
    std::vector<std::size_t> result;
    for (std::size_t c = 0; c < classes.size(); ++c) {
        result.insert(result.end(), classes[c].size, c);
    }
    return result;
}

bool EnumerationRequest::edge_allowed(std::size_t class_a, std::size_t class_b) const {
    for (const auto& pair : forbidden_class_pairs) {
        if ((pair.first == class_a && pair.second == class_b) ||
            (pair.first == class_b && pair.second == class_a)) {
            return false;
        }
    }
    return true;
}

RefinementOracle::RefinementOracle(std::size_t max_vertices)
    : max_vertices_(max_vertices) {
    if (max_vertices_ > MAX_GRAPH_VERTICES) {
        throw std::invalid_argument("Oracle vertex limit exceeds the graph6 range");
    }
}

CanonicalLabeling RefinementOracle::canonicalize(const Graph& g, const Partition& partition) const {
    return canonicalizer_.canonicalize(g, partition);
}

std::vector<Graph> RefinementOracle::enumerate(const EnumerationRequest& request) const {
    const std::size_t n = request.num_vertices();
    const std::size_t m = request.num_edges;
    if (n > max_vertices_) {
        throw GraphEnumerationError("requested " + std::to_string(n) +
                                    " vertices, supported maximum is " + std::to_string(max_vertices_));
    }
    for (const auto& c : request.classes) {
        if (c.min_degree > c.max_degree) {
            throw GraphEnumerationError("colour class with minimum degree above maximum degree");
        }
    }
    if (n == 0 || m > n * (n - 1) / 2) {
        return {};
    }

    const auto vertex_class = request.class_of_vertices();
    const auto partition = request.partition();
    std::vector<std::size_t> min_degree(n), max_degree(n);
    for (std::size_t v = 0; v < n; ++v) {
        min_degree[v] = request.classes[vertex_class[v]].min_degree;
        max_degree[v] = request.classes[vertex_class[v]].max_degree;
    }

    auto deficit_of = [&](const std::vector<std::size_t>& deg) {
        std::size_t deficit = 0;
        for (std::size_t v = 0; v < n; ++v) {
            if (deg[v] < min_degree[v]) deficit += min_degree[v] - deg[v];
        }
        return deficit;
    };

    std::map<std::string, Graph> level;
    {
        Graph empty(n);
        if (deficit_of(std::vector<std::size_t>(n, 0)) > 2 * m) {
            return {};
        }
        level.emplace(empty.to_g6(), empty);
    }

    for (std::size_t k = 0; k < m; ++k) {
        const std::size_t remaining_after = m - k - 1;
        std::map<std::string, Graph> next;
        for (const auto& entry : level) {
            const Graph& g = entry.second;
            const auto deg = g.degrees();
            const std::size_t deficit = deficit_of(deg);

            for (VertexId a = 0; a < n; ++a) {
                if (deg[a] >= max_degree[a]) continue;
                for (VertexId b = a + 1; b < n; ++b) {
                    if (deg[b] >= max_degree[b]) continue;
                    if (!request.edge_allowed(vertex_class[a], vertex_class[b])) continue;
                    if (g.has_edge(a, b)) continue;

                    std::size_t reduced = deficit;
                    if (deg[a] < min_degree[a]) --reduced;
                    if (deg[b] < min_degree[b]) --reduced;
                    if (reduced > 2 * remaining_after) continue;

                    auto labeling = canonicalizer_.canonicalize(g.with_edge(a, b), partition);
                    next.emplace(std::move(labeling.g6), std::move(labeling.canonical));
                }
            }
        }
        GC_DEBUG_LOG("enumerate n=%zu m=%zu: %zu classes with %zu edges", n, m, next.size(), k + 1);
        level = std::move(next);
        if (level.empty()) break;
    }

    std::vector<Graph> result;
    for (auto& entry : level) {
        const Graph& g = entry.second;
        if (g.num_edges() != m) continue;
        if (deficit_of(g.degrees()) != 0) continue;
        if (request.connected && !g.is_connected()) continue;
        result.push_back(g);
    }
    return result;
}

} // namespace graph_complex

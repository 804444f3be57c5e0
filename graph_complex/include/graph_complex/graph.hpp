#ifndef GRAPH_COMPLEX_GRAPH_HPP
#define GRAPH_COMPLEX_GRAPH_HPP

#include <graph_complex/types.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace graph_complex {

/**
 * Undirected edge, always stored with u < v.
 */
struct Edge {
    VertexId u;
    VertexId v;

    Edge() : u(0), v(0) {}
    Edge(VertexId a, VertexId b) : u(a < b ? a : b), v(a < b ? b : a) {}

    bool operator==(const Edge& other) const { return u == other.u && v == other.v; }
    bool operator!=(const Edge& other) const { return !(*this == other); }
    bool operator<(const Edge& other) const {
        return u < other.u || (u == other.u && v < other.v);
    }
};

/**
 * Simple undirected graph on vertices 0..n-1.
 *
 * Edges are kept sorted lexicographically; this order is the edge
 * numbering used by every orientation rule.
 */
class Graph {
private:
    std::size_t num_vertices_ = 0;
    std::vector<Edge> edges_;

public:
    Graph() = default;
    explicit Graph(std::size_t num_vertices) : num_vertices_(num_vertices) {}

    // Throws std::invalid_argument on self loops, duplicates or out-of-range vertices.
    Graph(std::size_t num_vertices, std::vector<Edge> edges);

    std::size_t num_vertices() const { return num_vertices_; }
    std::size_t num_edges() const { return edges_.size(); }
    const std::vector<Edge>& edges() const { return edges_; }

    bool has_edge(VertexId a, VertexId b) const;

    // Index of the edge in lexicographic order, or num_edges() if absent.
    std::size_t edge_index(VertexId a, VertexId b) const;

    std::vector<std::size_t> degrees() const;
    std::vector<std::vector<VertexId>> adjacency() const;
    bool is_connected() const;

    // Vertex v becomes p[v].
    Graph relabeled(const Permutation& p) const;

    Graph with_edge(VertexId a, VertexId b) const;
    Graph without_edge(std::size_t index) const;

    std::string to_g6() const;
    static Graph from_g6(const std::string& g6);

    bool operator==(const Graph& other) const {
        return num_vertices_ == other.num_vertices_ && edges_ == other.edges_;
    }
    bool operator!=(const Graph& other) const { return !(*this == other); }
};

// Sign of a permutation of 0..n-1.
int permutation_sign(const Permutation& p);

// Sign of the permutation sorting a sequence of distinct values.
int sequence_sign(const std::vector<std::size_t>& values);

Permutation inverse_permutation(const Permutation& p);

// Relabeling with p[u] = 0, p[v] = 1 and the remaining vertices in their original order.
Permutation permute_to_front(VertexId u, VertexId v, std::size_t n);

bool is_permutation(const Permutation& p, std::size_t n);

/**
 * Lexicographic indices of g's edges, listed in the lexicographic order
 * of the relabeled graph. Tracks how p permutes the edge numbering.
 */
std::vector<std::size_t> induced_edge_order(const Graph& g, const Permutation& p);

struct MergeResult {
    Graph graph;
    // Original edge indices of the surviving edges, in the new lexicographic order.
    std::vector<std::size_t> surviving_edges;
};

/**
 * Merge vertex 1 into vertex 0, shifting higher labels down by one.
 * Requires the edge (0,1). Returns nullopt if the merge would create a
 * multiple edge.
 */
std::optional<MergeResult> merge_first_two(const Graph& g);

} // namespace graph_complex

#endif // GRAPH_COMPLEX_GRAPH_HPP

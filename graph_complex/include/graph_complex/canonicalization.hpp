#ifndef GRAPH_COMPLEX_CANONICALIZATION_HPP
#define GRAPH_COMPLEX_CANONICALIZATION_HPP

#include <graph_complex/graph.hpp>
#include <graph_complex/types.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace graph_complex {

/**
 * Ordered partition of the vertex set into colour classes.
 * Canonical labelings and automorphisms never move a vertex to another class,
 * and classes receive consecutive labels in the given order.
 * An empty partition means a single class containing every vertex.
 */
using Partition = std::vector<std::vector<VertexId>>;

/**
 * Result of canonicalizing a graph.
 */
struct CanonicalLabeling {
    Graph canonical;                          // input relabeled by `labeling`
    std::string g6;                           // graph6 of `canonical`
    Permutation labeling;                     // vertex v of the input becomes labeling[v]
    std::vector<Permutation> automorphisms;   // generators of the input's automorphism group
};

/**
 * Canonical labeling by colour refinement and individualization.
 *
 * The search tree is built from an isomorphism-invariant refinement, so the
 * smallest adjacency certificate over all leaves is a canonical form. Leaves
 * reaching the same certificate differ by an automorphism. Branches on twin
 * vertices (same neighbourhood up to each other) are pruned; the twin
 * transposition is reported as a generator instead.
 */
class Canonicalizer {
private:
    using Cells = std::vector<std::vector<VertexId>>;
    using Certificate = std::vector<std::uint64_t>;

    struct SearchState {
        const std::vector<std::uint64_t>* adjacency = nullptr;
        Certificate best_certificate;
        Permutation best_labeling;
        std::vector<Permutation> equivalent_leaves;
        std::vector<Permutation> twin_generators;
        bool have_best = false;
    };

    void refine(const std::vector<std::uint64_t>& adjacency, Cells& cells) const;
    void search(SearchState& state, Cells cells) const;
    void visit_leaf(SearchState& state, const Cells& cells) const;

    static bool are_twins(const std::vector<std::uint64_t>& adjacency, VertexId a, VertexId b);

public:
    // Throws std::invalid_argument if `partition` is not a partition of the vertex set.
    CanonicalLabeling canonicalize(const Graph& g, const Partition& partition = {}) const;

    bool are_isomorphic(const Graph& a, const Graph& b, const Partition& partition = {}) const {
        return canonicalize(a, partition).canonical == canonicalize(b, partition).canonical;
    }
};

} // namespace graph_complex

#endif // GRAPH_COMPLEX_CANONICALIZATION_HPP

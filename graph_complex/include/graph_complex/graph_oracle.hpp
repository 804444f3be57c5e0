#ifndef GRAPH_COMPLEX_GRAPH_ORACLE_HPP
#define GRAPH_COMPLEX_GRAPH_ORACLE_HPP

#include <graph_complex/canonicalization.hpp>
#include <graph_complex/graph.hpp>
#include <cstddef>
#include <utility>
#include <vector>

namespace graph_complex {

/**
 * One colour class of an enumeration request. Classes occupy consecutive
 * vertex labels in request order.
 */
struct ColourClass {
    std::size_t size = 0;
    std::size_t min_degree = 0;
    std::size_t max_degree = MAX_GRAPH_VERTICES;
};

struct EnumerationRequest {
    std::vector<ColourClass> classes;
    std::size_t num_edges = 0;
    // Pairs of class indices that may not be joined by an edge (i == j forbids edges inside i).
    std::vector<std::pair<std::size_t, std::size_t>> forbidden_class_pairs;
    bool connected = true;

    std::size_t num_vertices() const;
    Partition partition() const;
    std::vector<std::size_t> class_of_vertices() const;
    bool edge_allowed(std::size_t class_a, std::size_t class_b) const;
};

/**
 * Isomorphism capability used by basis and operator construction.
 * Implementations must be free of side effects and safe to call concurrently.
 */
class GraphOracle {
public:
    virtual ~GraphOracle() = default;

    // All graphs matching the request up to colour-preserving isomorphism,
    // each in canonical form, sorted by graph6. Throws GraphEnumerationError.
    virtual std::vector<Graph> enumerate(const EnumerationRequest& request) const = 0;

    virtual CanonicalLabeling canonicalize(const Graph& g, const Partition& partition) const = 0;
};

/**
 * Built-in oracle: Canonicalizer for labelings, level-wise canonical edge
 * augmentation for enumeration. Augmentation keeps only graphs whose
 * remaining degree deficit can still be closed by the edges left to add.
 */
class RefinementOracle : public GraphOracle {
private:
    Canonicalizer canonicalizer_;
    std::size_t max_vertices_;

public:
    explicit RefinementOracle(std::size_t max_vertices = 12);

    std::size_t max_vertices() const { return max_vertices_; }

    std::vector<Graph> enumerate(const EnumerationRequest& request) const override;
    CanonicalLabeling canonicalize(const Graph& g, const Partition& partition) const override;
};

} // namespace graph_complex

#endif // GRAPH_COMPLEX_GRAPH_ORACLE_HPP

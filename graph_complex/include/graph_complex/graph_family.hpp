#ifndef GRAPH_COMPLEX_GRAPH_FAMILY_HPP
#define GRAPH_COMPLEX_GRAPH_FAMILY_HPP

#include <graph_complex/canonicalization.hpp>
#include <graph_complex/grading_key.hpp>
#include <graph_complex/graph.hpp>
#include <graph_complex/graph_oracle.hpp>
#include <graph_complex/orientation.hpp>
#include <memory>
#include <vector>

namespace graph_complex {

// Image of an operator applied to one oriented graph: `sign` times `graph`.
struct SignedGraph {
    Graph graph;
    int sign;
};

/**
 * Combinatorial description of one family of graph vector spaces and
 * the edge operations between its gradings.
 */
class GraphFamily {
public:
    virtual ~GraphFamily() = default;

    virtual ComplexFamily id() const = 0;

    // Whether the grading can contain graphs at all. Invalid gradings are zero spaces.
    virtual bool is_valid(const GradingKey& key) const = 0;

    virtual std::size_t num_vertices(const GradingKey& key) const = 0;
    virtual std::size_t num_edges(const GradingKey& key) const = 0;

    virtual Partition partition(const GradingKey& key) const = 0;
    virtual EnumerationRequest enumeration_request(const GradingKey& key) const = 0;

    // Whether a graph satisfies the structural constraints of the grading.
    virtual bool is_admissible(const GradingKey& key, const Graph& g) const = 0;

    virtual std::shared_ptr<const OrientationPolicy> orientation(const GradingKey& key) const = 0;

    virtual bool supports(OperatorKind kind, const GradingKey& key) const = 0;

    // Grading an operator maps `domain` into, and the grading mapping into `target`.
    virtual GradingKey target_of(OperatorKind kind, const GradingKey& domain) const = 0;
    virtual GradingKey source_of(OperatorKind kind, const GradingKey& target) const = 0;

    // Operator applied to one generator of `domain`, before canonicalization.
    virtual std::vector<SignedGraph> apply(OperatorKind kind, const GradingKey& domain,
                                           const Graph& g) const = 0;

    // Rough cost of building the basis, used to order work.
    virtual std::size_t work_estimate(const GradingKey& key) const;
};

/**
 * Connected simple graphs with all vertices at least trivalent,
 * edges = loops + vertices - 1.
 * Contraction lowers the vertex count; deletion (odd edges only) lowers the loop order.
 */
class OrdinaryFamily : public GraphFamily {
public:
    ComplexFamily id() const override { return ComplexFamily::Ordinary; }
    bool is_valid(const GradingKey& key) const override;
    std::size_t num_vertices(const GradingKey& key) const override;
    std::size_t num_edges(const GradingKey& key) const override;
    Partition partition(const GradingKey& key) const override;
    EnumerationRequest enumeration_request(const GradingKey& key) const override;
    bool is_admissible(const GradingKey& key, const Graph& g) const override;
    std::shared_ptr<const OrientationPolicy> orientation(const GradingKey& key) const override;
    bool supports(OperatorKind kind, const GradingKey& key) const override;
    GradingKey target_of(OperatorKind kind, const GradingKey& domain) const override;
    GradingKey source_of(OperatorKind kind, const GradingKey& target) const override;
    std::vector<SignedGraph> apply(OperatorKind kind, const GradingKey& domain,
                                   const Graph& g) const override;
};

/**
 * Ordinary internal graph plus univalent hair vertices of their own colour,
 * labeled after the internal vertices. Only internal edges are contracted.
 */
class HairyFamily : public GraphFamily {
public:
    ComplexFamily id() const override { return ComplexFamily::Hairy; }
    bool is_valid(const GradingKey& key) const override;
    std::size_t num_vertices(const GradingKey& key) const override;
    std::size_t num_edges(const GradingKey& key) const override;
    Partition partition(const GradingKey& key) const override;
    EnumerationRequest enumeration_request(const GradingKey& key) const override;
    bool is_admissible(const GradingKey& key, const Graph& g) const override;
    std::shared_ptr<const OrientationPolicy> orientation(const GradingKey& key) const override;
    bool supports(OperatorKind kind, const GradingKey& key) const override;
    GradingKey target_of(OperatorKind kind, const GradingKey& domain) const override;
    GradingKey source_of(OperatorKind kind, const GradingKey& target) const override;
    std::vector<SignedGraph> apply(OperatorKind kind, const GradingKey& domain,
                                   const Graph& g) const override;
};

std::shared_ptr<const GraphFamily> make_family(ComplexFamily family);

// Contraction of every edge whose endpoints are both below `internal_vertices`.
std::vector<SignedGraph> contract_edges(const Graph& g, const OrientationPolicy& orientation,
                                        std::size_t internal_vertices);

std::vector<SignedGraph> delete_edges(const Graph& g, const OrientationPolicy& orientation);

} // namespace graph_complex

#endif // GRAPH_COMPLEX_GRAPH_FAMILY_HPP

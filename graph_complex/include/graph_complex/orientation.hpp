#ifndef GRAPH_COMPLEX_ORIENTATION_HPP
#define GRAPH_COMPLEX_ORIENTATION_HPP

#include <graph_complex/graph.hpp>
#include <graph_complex/types.hpp>
#include <cstddef>
#include <memory>
#include <vector>

namespace graph_complex {

/**
 * Sign conventions of a graph vector space.
 *
 * An orientation of a graph is fixed by its vertex labels and its
 * lexicographic edge order. Each method returns the factor (+1 or -1)
 * by which an operation changes that orientation.
 */
class OrientationPolicy {
public:
    virtual ~OrientationPolicy() = default;

    virtual EdgeParity edge_parity() const = 0;

    // Relabeling vertex v to p[v].
    virtual int relabel_sign(const Graph& g, const Permutation& p) const = 0;

    // Contracting the edge (0,1); `surviving_edges` as produced by merge_first_two.
    virtual int merge_sign(const std::vector<std::size_t>& surviving_edges) const = 0;

    virtual bool supports_deletion() const = 0;

    // Deleting the edge at lexicographic position `edge_index`.
    virtual int deletion_sign(std::size_t edge_index) const = 0;
};

/**
 * Even edges: vertices are odd objects and each edge carries a direction,
 * from the larger label to the smaller. Relabeling contributes the vertex
 * permutation sign and -1 for every edge whose direction flips.
 */
class EvenEdgeOrientation : public OrientationPolicy {
public:
    EdgeParity edge_parity() const override { return EdgeParity::Even; }
    int relabel_sign(const Graph& g, const Permutation& p) const override;
    int merge_sign(const std::vector<std::size_t>&) const override { return 1; }
    bool supports_deletion() const override { return false; }
    int deletion_sign(std::size_t edge_index) const override;
};

/**
 * Odd edges: edges are odd objects. Relabeling contributes the sign of
 * the induced permutation of the lexicographic edge order.
 */
class OddEdgeOrientation : public OrientationPolicy {
public:
    EdgeParity edge_parity() const override { return EdgeParity::Odd; }
    int relabel_sign(const Graph& g, const Permutation& p) const override;
    int merge_sign(const std::vector<std::size_t>& surviving_edges) const override;
    bool supports_deletion() const override { return true; }
    int deletion_sign(std::size_t edge_index) const override {
        return (edge_index % 2 == 0) ? 1 : -1;
    }
};

/**
 * Hairs are the vertices labeled internal_vertices and above. When hair
 * parity equals edge parity, the permutation of the hairs contributes its
 * sign on top of the edge rule.
 */
class HairOrientation : public OrientationPolicy {
private:
    std::shared_ptr<const OrientationPolicy> base_;
    std::size_t internal_vertices_;
    bool hairs_signed_;

public:
    HairOrientation(std::shared_ptr<const OrientationPolicy> base,
                    std::size_t internal_vertices, EdgeParity hair_parity);

    EdgeParity edge_parity() const override { return base_->edge_parity(); }
    int relabel_sign(const Graph& g, const Permutation& p) const override;
    int merge_sign(const std::vector<std::size_t>& surviving_edges) const override {
        return base_->merge_sign(surviving_edges);
    }
    bool supports_deletion() const override { return false; }
    int deletion_sign(std::size_t edge_index) const override;
};

std::shared_ptr<const OrientationPolicy> make_orientation(EdgeParity edges);

} // namespace graph_complex

#endif // GRAPH_COMPLEX_ORIENTATION_HPP

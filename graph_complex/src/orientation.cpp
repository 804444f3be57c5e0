#include <graph_complex/orientation.hpp>
#include <stdexcept>

namespace graph_complex {

int EvenEdgeOrientation::relabel_sign(const Graph& g, const Permutation& p) const {
    int sign = permutation_sign(p);
    for (const auto& e : g.edges()) {
        if (p[e.u] > p[e.v]) sign = -sign;
    }
    return sign;
}

int EvenEdgeOrientation::deletion_sign(std::size_t) const {
    throw std::invalid_argument("Edge deletion is not a differential for even edges");
}

int OddEdgeOrientation::relabel_sign(const Graph& g, const Permutation& p) const {
    return sequence_sign(induced_edge_order(g, p));
}

int OddEdgeOrientation::merge_sign(const std::vector<std::size_t>& surviving_edges) const {
    return sequence_sign(surviving_edges);
}

HairOrientation::HairOrientation(std::shared_ptr<const OrientationPolicy> base,
                                 std::size_t internal_vertices, EdgeParity hair_parity)
    : base_(std::move(base)),
      internal_vertices_(internal_vertices),
      hairs_signed_(hair_parity == base_->edge_parity()) {}

int HairOrientation::relabel_sign(const Graph& g, const Permutation& p) const {
    int sign = base_->relabel_sign(g, p);
    if (hairs_signed_ && p.size() > internal_vertices_) {
        std::vector<std::size_t> hair_images;
        hair_images.reserve(p.size() - internal_vertices_);
        for (std::size_t v = internal_vertices_; v < p.size(); ++v) {
            hair_images.push_back(p[v]);
        }
        sign *= sequence_sign(hair_images);
    }
    return sign;
}

int HairOrientation::deletion_sign(std::size_t) const {
    throw std::invalid_argument("Edge deletion is not defined on hairy graphs");
}

std::shared_ptr<const OrientationPolicy> make_orientation(EdgeParity edges) {
    if (edges == EdgeParity::Even) {
        return std::make_shared<EvenEdgeOrientation>();
    }
    return std::make_shared<OddEdgeOrientation>();
}

} // namespace graph_complex

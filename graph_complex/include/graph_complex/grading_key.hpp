#ifndef GRAPH_COMPLEX_GRADING_KEY_HPP
#define GRAPH_COMPLEX_GRADING_KEY_HPP

#include <graph_complex/types.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <tuple>
#include <vector>

namespace graph_complex {

/**
 * Identifies one graded piece of a graph complex.
 *
 * Immutable value type. Equality, ordering and hashing are structural.
 * For families without hairs the hair count is 0 and the hair parity
 * is normalised to Even, so structurally equal keys compare equal.
 */
class GradingKey {
private:
    ComplexFamily family_ = ComplexFamily::Ordinary;
    int vertices_ = 0;
    int loops_ = 0;
    int hairs_ = 0;
    EdgeParity edge_parity_ = EdgeParity::Odd;
    EdgeParity hair_parity_ = EdgeParity::Even;

    GradingKey(ComplexFamily family, int vertices, int loops, int hairs,
               EdgeParity edge_parity, EdgeParity hair_parity)
        : family_(family), vertices_(vertices), loops_(loops), hairs_(hairs),
          edge_parity_(edge_parity), hair_parity_(hair_parity) {}

    auto tie() const {
        return std::tie(family_, vertices_, loops_, hairs_, edge_parity_, hair_parity_);
    }

public:
    GradingKey() = default;

    static GradingKey ordinary(int vertices, int loops, EdgeParity edges) {
        return GradingKey(ComplexFamily::Ordinary, vertices, loops, 0, edges, EdgeParity::Even);
    }

    static GradingKey hairy(int vertices, int loops, int hairs,
                            EdgeParity edges, EdgeParity hair_parity) {
        return GradingKey(ComplexFamily::Hairy, vertices, loops, hairs, edges, hair_parity);
    }

    ComplexFamily family() const { return family_; }
    int vertices() const { return vertices_; }
    int loops() const { return loops_; }
    int hairs() const { return hairs_; }
    EdgeParity edge_parity() const { return edge_parity_; }
    EdgeParity hair_parity() const { return hair_parity_; }
    bool has_hairs() const { return family_ == ComplexFamily::Hairy; }

    GradingKey with_vertices(int vertices) const {
        GradingKey k = *this;
        k.vertices_ = vertices;
        return k;
    }

    GradingKey with_loops(int loops) const {
        GradingKey k = *this;
        k.loops_ = loops;
        return k;
    }

    GradingKey with_hairs(int hairs) const {
        GradingKey k = *this;
        k.hairs_ = has_hairs() ? hairs : 0;
        return k;
    }

    // Directory name below the family: "odd_edges", "even_edges_odd_hairs", ...
    std::string sub_type() const;

    // "6_5" or, with hairs, "6_5_2"
    std::string params() const;

    // Human readable, e.g. "ordinary/odd_edges(v=6,l=5)"
    std::string to_string() const;

    // Stable across runs and machines.
    std::uint64_t content_hash() const;

    bool operator==(const GradingKey& other) const { return tie() == other.tie(); }
    bool operator!=(const GradingKey& other) const { return !(*this == other); }
    bool operator<(const GradingKey& other) const { return tie() < other.tie(); }
};

/**
 * Degree slice of the ordinary odd-edge bicomplex: the direct sum of the
 * gradings with vertices + loops = degree. Contraction and deletion both
 * lower the degree by one, so their sum is a differential on the slices.
 */
class DegreeSlice {
private:
    int degree_ = 0;

public:
    DegreeSlice() = default;
    explicit DegreeSlice(int degree) : degree_(degree) {}

    int degree() const { return degree_; }
    DegreeSlice below() const { return DegreeSlice(degree_ - 1); }
    DegreeSlice above() const { return DegreeSlice(degree_ + 1); }

    // (v, degree - v) for v = 0..degree, by increasing vertex count. Empty for negative degrees.
    std::vector<GradingKey> gradings() const;

    // "ordinary/odd_edges(deg=11)"
    std::string to_string() const;

    bool operator==(const DegreeSlice& other) const { return degree_ == other.degree_; }
    bool operator!=(const DegreeSlice& other) const { return degree_ != other.degree_; }
    bool operator<(const DegreeSlice& other) const { return degree_ < other.degree_; }
};

} // namespace graph_complex

namespace std {
    template<>
    struct hash<graph_complex::GradingKey> {
        std::size_t operator()(const graph_complex::GradingKey& key) const {
            return static_cast<std::size_t>(key.content_hash());
        }
    };
}

#endif // GRAPH_COMPLEX_GRADING_KEY_HPP

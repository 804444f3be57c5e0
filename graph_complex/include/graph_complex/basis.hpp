#ifndef GRAPH_COMPLEX_BASIS_HPP
#define GRAPH_COMPLEX_BASIS_HPP

#include <graph_complex/grading_key.hpp>
#include <graph_complex/graph.hpp>
#include <graph_complex/graph_family.hpp>
#include <graph_complex/graph_oracle.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace graph_complex {

/**
 * Basis element: a graph in canonical form. Its orientation is the
 * canonical vertex labeling together with the lexicographic edge order.
 */
struct GraphGenerator {
    Graph graph;
    std::string g6;

    bool operator==(const GraphGenerator& other) const { return g6 == other.g6; }
    bool operator!=(const GraphGenerator& other) const { return !(*this == other); }
};

/**
 * Isomorphism class equal to zero: `witness` is an automorphism acting
 * on the orientation by -1.
 */
struct Annihilated {
    std::string g6;
    Permutation witness;
};

using Classification = std::variant<GraphGenerator, Annihilated>;

/**
 * Ordered generators of one grading. Indices are matrix row/column indices.
 */
class Basis {
private:
    GradingKey key_;
    std::vector<GraphGenerator> generators_;
    std::unordered_map<std::string, std::size_t> index_;

public:
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    Basis() = default;

    // Throws BasisInconsistencyError if two generators share a graph6 string.
    Basis(GradingKey key, std::vector<GraphGenerator> generators);

    const GradingKey& key() const { return key_; }
    std::size_t size() const { return generators_.size(); }
    bool empty() const { return generators_.empty(); }
    const std::vector<GraphGenerator>& generators() const { return generators_; }
    const GraphGenerator& operator[](std::size_t i) const { return generators_[i]; }

    // Index of the generator with this canonical graph6, or npos.
    std::size_t index_of(const std::string& g6) const;

    bool operator==(const Basis& other) const {
        return key_ == other.key_ && generators_ == other.generators_;
    }
    bool operator!=(const Basis& other) const { return !(*this == other); }
};

class BasisBuilder {
private:
    std::shared_ptr<const GraphOracle> oracle_;
    std::shared_ptr<const GraphFamily> family_;

public:
    BasisBuilder(std::shared_ptr<const GraphOracle> oracle, std::shared_ptr<const GraphFamily> family);

    /**
     * Decide whether the isomorphism class of `g` survives the sign rule.
     * Throws BasisInconsistencyError if the oracle's automorphisms do not
     * preserve `g` or its canonical form changes the vertex or edge count.
     */
    Classification classify(const GradingKey& key, const Graph& g) const;

    /**
     * Generators sorted by canonical graph6. Invalid gradings give an empty
     * basis without consulting the oracle. Throws GraphEnumerationError and
     * BasisInconsistencyError.
     */
    Basis build(const GradingKey& key) const;

    const GraphFamily& family() const { return *family_; }
};

} // namespace graph_complex

#endif // GRAPH_COMPLEX_BASIS_HPP

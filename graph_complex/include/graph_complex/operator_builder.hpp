#ifndef GRAPH_COMPLEX_OPERATOR_BUILDER_HPP
#define GRAPH_COMPLEX_OPERATOR_BUILDER_HPP

#include <graph_complex/basis.hpp>
#include <graph_complex/grading_key.hpp>
#include <graph_complex/graph_family.hpp>
#include <graph_complex/graph_oracle.hpp>
#include <graph_complex/sparse_matrix.hpp>
#include <memory>
#include <string>
#include <tuple>

namespace graph_complex {

// One differential between two adjacent gradings.
struct OperatorId {
    OperatorKind kind = OperatorKind::Contract;
    GradingKey domain;
    GradingKey target;

    std::string to_string() const;

    bool operator==(const OperatorId& other) const {
        return kind == other.kind && domain == other.domain && target == other.target;
    }
    bool operator!=(const OperatorId& other) const { return !(*this == other); }
    bool operator<(const OperatorId& other) const {
        return std::tie(kind, domain, target) < std::tie(other.kind, other.domain, other.target);
    }
};

/**
 * Builds the matrix of an edge operation between two bases.
 *
 * Column j is the image of domain generator j. Every image graph is brought
 * to canonical form; the relabeling sign times the operation sign is
 * accumulated at the row of the matching target generator. Images that are
 * inadmissible in the target grading or annihilated by an odd automorphism
 * contribute nothing.
 */
class OperatorBuilder {
private:
    std::shared_ptr<const GraphOracle> oracle_;
    std::shared_ptr<const GraphFamily> family_;
    BasisBuilder classifier_;

public:
    OperatorBuilder(std::shared_ptr<const GraphOracle> oracle, std::shared_ptr<const GraphFamily> family);

    OperatorId operator_id(OperatorKind kind, const GradingKey& domain) const;

    /**
     * Throws OperatorConstructionError if an admissible, non-annihilated image
     * is missing from the target basis or cannot be canonicalized, and
     * std::invalid_argument if the bases are not adjacent under `kind`.
     */
    SparseMatrix build(OperatorKind kind, const Basis& domain, const Basis& target) const;
};

} // namespace graph_complex

#endif // GRAPH_COMPLEX_OPERATOR_BUILDER_HPP

#ifndef GRAPH_COMPLEX_COHOMOLOGY_HPP
#define GRAPH_COMPLEX_COHOMOLOGY_HPP

#include <graph_complex/grading_key.hpp>
#include <graph_complex/types.hpp>
#include <graph_complex/validator.hpp>
#include <cstddef>
#include <iosfwd>
#include <vector>

namespace graph_complex {

struct CohomologyEntry {
    GradingKey key;
    OperatorKind differential = OperatorKind::Contract;
    std::size_t basis_dimension = 0;
    std::size_t rank_out = 0;
    std::size_t rank_in = 0;
    std::size_t dimension = 0;

    bool operator==(const CohomologyEntry& other) const {
        return key == other.key && differential == other.differential &&
               basis_dimension == other.basis_dimension && rank_out == other.rank_out &&
               rank_in == other.rank_in && dimension == other.dimension;
    }
};

// Cohomology of the total complex at one degree slice.
struct TotalCohomologyEntry {
    DegreeSlice slice;
    std::size_t slice_dimension = 0;
    std::size_t rank_out = 0;
    std::size_t rank_in = 0;
    std::size_t dimension = 0;

    bool operator==(const TotalCohomologyEntry& other) const {
        return slice == other.slice && slice_dimension == other.slice_dimension &&
               rank_out == other.rank_out && rank_in == other.rank_in && dimension == other.dimension;
    }
};

class CohomologyAssembler {
public:
    /**
     * dim H = n - rank(d_out) - rank(d_in).
     * Throws CohomologyAssemblyError when the result would be negative.
     */
    CohomologyEntry assemble(const GradingKey& key, OperatorKind differential, std::size_t basis_dimension,
                             std::size_t rank_out, std::size_t rank_in) const;

    TotalCohomologyEntry assemble(const DegreeSlice& slice, std::size_t slice_dimension,
                                  std::size_t rank_out, std::size_t rank_in) const;
};

/**
 * Ordered results for one differential over a grading range.
 */
struct CohomologyTable {
    OperatorKind differential = OperatorKind::Contract;
    CoefficientDomain domain;
    std::vector<CohomologyEntry> entries;
    std::vector<ValidationFinding> findings;

    void sort();

    // Dimension at `key`, or -1 if the table has no entry for it.
    long dimension_at(const GradingKey& key) const;

    // Tab separated: family, sub_type, vertices, loops, hairs, dimension.
    void write_tsv(std::ostream& out) const;

    bool operator==(const CohomologyTable& other) const {
        return differential == other.differential && domain == other.domain && entries == other.entries;
    }
};

/**
 * Total complex cohomology by degree.
 */
struct TotalCohomologyTable {
    CoefficientDomain domain;
    std::vector<TotalCohomologyEntry> entries;

    // Dimension at `degree`, or -1 if the table has no entry for it.
    long dimension_at(int degree) const;

    // Tab separated: family, sub_type, degree, dimension.
    void write_tsv(std::ostream& out) const;
};

} // namespace graph_complex

#endif // GRAPH_COMPLEX_COHOMOLOGY_HPP

#include <graph_complex/cohomology.hpp>
#include <graph_complex/errors.hpp>
#include <algorithm>
#include <ostream>

namespace graph_complex {

CohomologyEntry CohomologyAssembler::assemble(const GradingKey& key, OperatorKind differential,
                                              std::size_t basis_dimension, std::size_t rank_out,
                                              std::size_t rank_in) const {
    if (rank_out > basis_dimension || rank_in > basis_dimension - rank_out) {
        throw CohomologyAssemblyError("negative dimension at " + key.to_string() + ": " +
                                      std::to_string(basis_dimension) + " - " + std::to_string(rank_out) +
                                      " - " + std::to_string(rank_in));
    }
    return CohomologyEntry{key, differential, basis_dimension, rank_out, rank_in,
                           basis_dimension - rank_out - rank_in};
}

TotalCohomologyEntry CohomologyAssembler::assemble(const DegreeSlice& slice, std::size_t slice_dimension,
                                                   std::size_t rank_out, std::size_t rank_in) const {
    if (rank_out > slice_dimension || rank_in > slice_dimension - rank_out) {
        throw CohomologyAssemblyError("negative dimension at " + slice.to_string() + ": " +
                                      std::to_string(slice_dimension) + " - " + std::to_string(rank_out) +
                                      " - " + std::to_string(rank_in));
    }
    return TotalCohomologyEntry{slice, slice_dimension, rank_out, rank_in, slice_dimension - rank_out - rank_in};
}

void CohomologyTable::sort() {
    std::sort(entries.begin(), entries.end(),
              [](const CohomologyEntry& a, const CohomologyEntry& b) { return a.key < b.key; });
}

long CohomologyTable::dimension_at(const GradingKey& key) const {
    for (const auto& entry : entries) {
        if (entry.key == key) return static_cast<long>(entry.dimension);
    }
    return -1;
}

void CohomologyTable::write_tsv(std::ostream& out) const {
    out << "family\tsub_type\tvertices\tloops\thairs\tdimension\n";
    for (const auto& e : entries) {
        out << family_name(e.key.family()) << "\t" << e.key.sub_type() << "\t" << e.key.vertices() << "\t"
            << e.key.loops() << "\t" << e.key.hairs() << "\t" << e.dimension << "\n";
    }
}

long TotalCohomologyTable::dimension_at(int degree) const {
    for (const auto& entry : entries) {
        if (entry.slice.degree() == degree) return static_cast<long>(entry.dimension);
    }
    return -1;
}

void TotalCohomologyTable::write_tsv(std::ostream& out) const {
    out << "family\tsub_type\tdegree\tdimension\n";
    for (const auto& e : entries) {
        out << family_name(ComplexFamily::Ordinary) << "\t" << parity_name(EdgeParity::Odd) << "_edges\t"
            << e.slice.degree() << "\t" << e.dimension << "\n";
    }
}

} // namespace graph_complex

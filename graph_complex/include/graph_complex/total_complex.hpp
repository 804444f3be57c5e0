#ifndef GRAPH_COMPLEX_TOTAL_COMPLEX_HPP
#define GRAPH_COMPLEX_TOTAL_COMPLEX_HPP

#include <graph_complex/cohomology.hpp>
#include <graph_complex/config.hpp>
#include <graph_complex/grading_key.hpp>
#include <graph_complex/graph_family.hpp>
#include <graph_complex/graph_oracle.hpp>
#include <graph_complex/rank_engine.hpp>
#include <graph_complex/scheduler.hpp>
#include <graph_complex/sparse_matrix.hpp>
#include <graph_complex/store.hpp>
#include <graph_complex/validator.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace graph_complex {

/**
 * Position of each component grading inside the basis of a degree slice.
 * Components follow DegreeSlice::gradings(); invalid gradings occupy no rows.
 */
struct SliceLayout {
    DegreeSlice slice;
    std::vector<GradingKey> components;
    std::vector<std::size_t> offsets;  // components.size() + 1 entries

    std::size_t dimension() const { return offsets.empty() ? 0 : offsets.back(); }
    std::size_t dimension_of(const GradingKey& key) const;

    // Throws std::invalid_argument if `key` is not a component.
    std::size_t offset_of(const GradingKey& key) const;

    static SliceLayout build(const DegreeSlice& slice,
                             const std::function<std::size_t(const GradingKey&)>& dimension_of);
};

// Matrix of `kind` out of `domain`, or nothing for a zero block.
using BlockLookup = std::function<std::optional<SparseMatrix>(OperatorKind kind, const GradingKey& domain)>;

/**
 * Total differential contract + delete from `domain` to `target`, one
 * block per component. Throws std::invalid_argument when the slices are not
 * adjacent or a block does not fit its components.
 */
SparseMatrix assemble_total_differential(const SliceLayout& domain, const SliceLayout& target,
                                         const GraphFamily& family, const BlockLookup& block);

// D∘D = 0 on one slice: the differential out of slice + 1 followed by the one out of slice.
struct TotalCheck {
    DegreeSlice slice;
    CheckOutcome outcome = CheckOutcome::Inconclusive;
    std::size_t residual_entries = 0;
    std::string message;
};

struct TotalComplexReport {
    TotalCohomologyTable table;
    std::vector<TotalCheck> checks;
    RunReport components;               // basis and operator cells of every slice involved
    std::vector<CellFailure> failures;  // total ranks and entries
    bool cancelled = false;

    const TotalCheck* check(int degree) const;

    bool ok() const;
};

/**
 * Cohomology of the total complex of the ordinary odd-edge bicomplex.
 *
 * Component bases and operator matrices are produced by a JobScheduler over
 * the same store; total ranks are stored per slice and reused like any
 * other rank.
 */
class TotalComplexRunner {
private:
    EngineConfig config_;
    std::shared_ptr<PersistentStore> store_;
    std::shared_ptr<const GraphOracle> oracle_;
    std::shared_ptr<const GraphFamily> family_;
    std::shared_ptr<const RankComputationEngine> engine_;
    CohomologyAssembler assembler_;

    Rank total_rank(const DegreeSlice& slice, const SparseMatrix& differential, const CancellationFlag* cancel);

public:
    TotalComplexRunner(EngineConfig config, std::shared_ptr<PersistentStore> store,
                       std::shared_ptr<const GraphOracle> oracle);

    TotalComplexRunner(EngineConfig config, std::shared_ptr<PersistentStore> store,
                       std::shared_ptr<const GraphOracle> oracle,
                       std::shared_ptr<const RankComputationEngine> engine);

    const EngineConfig& config() const { return config_; }

    /**
     * Cohomology at degrees min_degree..max_degree inclusive.
     * Throws std::invalid_argument for an empty range.
     */
    TotalComplexReport run(int min_degree, int max_degree, const CancellationFlag* cancel = nullptr);
};

} // namespace graph_complex

#endif // GRAPH_COMPLEX_TOTAL_COMPLEX_HPP

#ifndef GRAPH_COMPLEX_SCHEDULER_HPP
#define GRAPH_COMPLEX_SCHEDULER_HPP

#include <graph_complex/basis.hpp>
#include <graph_complex/cohomology.hpp>
#include <graph_complex/config.hpp>
#include <graph_complex/grading_key.hpp>
#include <graph_complex/graph_family.hpp>
#include <graph_complex/graph_oracle.hpp>
#include <graph_complex/operator_builder.hpp>
#include <graph_complex/rank_engine.hpp>
#include <graph_complex/store.hpp>
#include <graph_complex/types.hpp>
#include <graph_complex/validator.hpp>
#include <atomic>
#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace graph_complex {

/**
 * Rectangular block of gradings of one family and parity convention.
 * Bounds are inclusive.
 */
struct GradingRange {
    ComplexFamily family = ComplexFamily::Ordinary;
    EdgeParity edge_parity = EdgeParity::Odd;
    EdgeParity hair_parity = EdgeParity::Even;
    int min_vertices = 1;
    int max_vertices = 1;
    int min_loops = 0;
    int max_loops = 0;
    int min_hairs = 0;
    int max_hairs = 0;

    // Ordered by loops, then vertices, then hairs. Throws std::invalid_argument on empty bounds.
    std::vector<GradingKey> keys() const;
};

// Checks d1∘d2 ± d2∘d1 = 0 on every requested grading.
struct AntiCommuteRequest {
    OperatorKind first = OperatorKind::Contract;
    OperatorKind second = OperatorKind::Delete;
    bool commute = false;
};

struct ComputationRequest {
    std::vector<GradingKey> keys;
    std::vector<OperatorKind> differentials{OperatorKind::Contract};

    // Targets; the artifacts they depend on are produced as needed.
    std::set<Stage> stages{Stage::Basis, Stage::Operator, Stage::Rank, Stage::Validate, Stage::Cohomology};

    std::vector<AntiCommuteRequest> anti_commute;

    static ComputationRequest over(const GradingRange& range) {
        ComputationRequest request;
        request.keys = range.keys();
        return request;
    }
};

/**
 * Why a cell produced nothing. Skipped cells name the failed cell upstream.
 */
struct CellFailure {
    std::string cell;
    Stage stage = Stage::Basis;
    std::string category;
    std::string message;
    std::string upstream;
    bool skipped = false;
};

struct RunCounters {
    std::size_t computed = 0;
    std::size_t loaded = 0;
    std::size_t trivial = 0;   // zero maps on invalid gradings; never stored
    std::size_t failed = 0;
    std::size_t skipped = 0;
    std::size_t cancelled = 0;
    std::size_t recomputed_after_corruption = 0;

    std::size_t total() const { return computed + loaded + trivial + failed + skipped + cancelled; }
};

struct RunReport {
    std::vector<CohomologyTable> tables;    // one per differential, when cohomology was requested
    std::vector<ValidationFinding> findings;
    std::vector<CellFailure> failures;
    RunCounters counters;
    bool cancelled = false;

    const CohomologyTable* table(OperatorKind differential) const;

    // No failed or skipped cells and no failed validation.
    bool ok() const;
};

/**
 * Runs the dependency graph of (grading, stage) cells for one family on a
 * worker pool.
 *
 * Every cell first consults the store and only computes when the entry is
 * missing, corrupt, or ignore_existing is set. Computation of a cell holds
 * the store's lock for that cell, so schedulers sharing a store compute each
 * entry at most once. A failing cell is recorded and its dependents skipped;
 * the rest of the run continues.
 */
class JobScheduler {
private:
    EngineConfig config_;
    std::shared_ptr<PersistentStore> store_;
    std::shared_ptr<const GraphOracle> oracle_;
    std::shared_ptr<const GraphFamily> family_;
    std::shared_ptr<const RankComputationEngine> engine_;
    BasisBuilder basis_builder_;
    OperatorBuilder operator_builder_;
    CohomologyAssembler assembler_;
    CancellationFlag cancel_{false};

    struct Cell;
    struct RunState;

    void plan(RunState& state, const ComputationRequest& request) const;
    void execute(RunState& state, Cell& cell);
    void finish(RunState& state, Cell& cell);
    void run_cell(RunState& state, Cell& cell);

    void run_basis(RunState& state, Cell& cell);
    void run_operator(RunState& state, Cell& cell);
    void run_rank(RunState& state, Cell& cell);
    void run_validate(RunState& state, Cell& cell);
    void run_cohomology(RunState& state, Cell& cell);

    long priority_of(const Cell& cell) const;
    RunReport collect(RunState& state, const ComputationRequest& request) const;

public:
    JobScheduler(EngineConfig config, std::shared_ptr<PersistentStore> store,
                 std::shared_ptr<const GraphOracle> oracle, std::shared_ptr<const GraphFamily> family);

    JobScheduler(EngineConfig config, std::shared_ptr<PersistentStore> store,
                 std::shared_ptr<const GraphOracle> oracle, std::shared_ptr<const GraphFamily> family,
                 std::shared_ptr<const RankComputationEngine> engine);

    const EngineConfig& config() const { return config_; }
    const GraphFamily& family() const { return *family_; }

    /**
     * Throws std::invalid_argument for keys of another family or a
     * differential the family does not define on a requested key.
     * Per-cell errors never escape; they are listed in the report.
     * `external_cancel` is polled while waiting.
     */
    RunReport run(const ComputationRequest& request, const CancellationFlag* external_cancel = nullptr);

    // Cancels the run in progress, or the next run when none is: unstarted cells are
    // dropped, solver subprocesses killed. Cleared when run() returns.
    void cancel() { cancel_.store(true); }
    bool cancel_requested() const { return cancel_.load(); }
};

} // namespace graph_complex

#endif // GRAPH_COMPLEX_SCHEDULER_HPP

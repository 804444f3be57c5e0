#ifndef GRAPH_COMPLEX_RANK_ENGINE_HPP
#define GRAPH_COMPLEX_RANK_ENGINE_HPP

#include <graph_complex/config.hpp>
#include <graph_complex/rank_backend.hpp>
#include <graph_complex/sparse_matrix.hpp>
#include <memory>
#include <vector>

namespace graph_complex {

/**
 * Chooses how a rank is computed.
 *
 * Matrices within the in-process limits, or any matrix when no external
 * backend is configured, are eliminated in-process. Larger ones go to the
 * external backends in order: each backend is retried up to
 * attempts_per_backend times before falling back to the next one. When all
 * fail a RankSolverError (Exhausted) is raised; a rank is never guessed.
 */
class RankComputationEngine {
private:
    RankConfig config_;
    EliminationRankBackend in_process_;
    std::vector<std::shared_ptr<const RankBackend>> external_;

public:
    explicit RankComputationEngine(RankConfig config);
    RankComputationEngine(RankConfig config, std::vector<std::shared_ptr<const RankBackend>> external);

    const RankConfig& config() const { return config_; }
    const std::vector<std::shared_ptr<const RankBackend>>& external_backends() const { return external_; }

    bool runs_in_process(const SparseMatrix& m) const;

    Rank compute(const SparseMatrix& m, const CancellationFlag* cancel = nullptr) const;
    Rank compute(const SparseMatrix& m, CoefficientDomain domain, const CancellationFlag* cancel = nullptr) const;
};

} // namespace graph_complex

#endif // GRAPH_COMPLEX_RANK_ENGINE_HPP

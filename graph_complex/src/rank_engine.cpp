#include <graph_complex/rank_engine.hpp>
#include <graph_complex/errors.hpp>
#include <graph_complex/log.hpp>
#include <algorithm>

namespace graph_complex {

RankComputationEngine::RankComputationEngine(RankConfig config)
    : config_(std::move(config)) {
    for (const auto& backend : config_.backends) {
        external_.push_back(std::make_shared<SubprocessRankBackend>(backend, config_.scratch_dir));
    }
}

RankComputationEngine::RankComputationEngine(RankConfig config,
                                             std::vector<std::shared_ptr<const RankBackend>> external)
    : config_(std::move(config)), external_(std::move(external)) {}

bool RankComputationEngine::runs_in_process(const SparseMatrix& m) const {
    if (external_.empty()) return true;
    return m.nnz() <= config_.in_process_max_entries &&
           std::max(m.rows(), m.cols()) <= config_.in_process_max_dimension;
}

Rank RankComputationEngine::compute(const SparseMatrix& m, const CancellationFlag* cancel) const {
    return compute(m, config_.domain, cancel);
}

Rank RankComputationEngine::compute(const SparseMatrix& m, CoefficientDomain domain,
                                    const CancellationFlag* cancel) const {
    if (m.rows() == 0 || m.cols() == 0 || m.is_zero()) {
        return Rank{0, domain, "trivial"};
    }
    if (runs_in_process(m)) {
        return Rank{in_process_.compute(m, domain, cancel), domain, in_process_.name()};
    }

    const unsigned attempts = std::max(1u, config_.attempts_per_backend);
    std::string failures;
    for (std::size_t b = 0; b < external_.size(); ++b) {
        const auto& backend = external_[b];
        for (unsigned attempt = 1; attempt <= attempts; ++attempt) {
            try {
                std::size_t value = backend->compute(m, domain, cancel);
                return Rank{value, domain, backend->name()};
            } catch (const RankSolverError& e) {
                if (e.kind() == SolverFailure::Cancelled) throw;
                failures += "\n  " + backend->name() + " attempt " + std::to_string(attempt) + ": " + e.what();
                if (attempt < attempts) {
                    GC_LOG_WARN("%s failed (%s), retrying", backend->name().c_str(), e.what());
                } else if (b + 1 < external_.size()) {
                    GC_LOG_WARN("%s failed (%s), falling back to %s", backend->name().c_str(), e.what(),
                                external_[b + 1]->name().c_str());
                } else {
                    GC_LOG_WARN("%s failed (%s)", backend->name().c_str(), e.what());
                }
            }
        }
    }
    throw RankSolverError(SolverFailure::Exhausted, "no backend ranked the " + std::to_string(m.rows()) + "x" +
                          std::to_string(m.cols()) + " matrix" + failures);
}

} // namespace graph_complex

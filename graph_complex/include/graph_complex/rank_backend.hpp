#ifndef GRAPH_COMPLEX_RANK_BACKEND_HPP
#define GRAPH_COMPLEX_RANK_BACKEND_HPP

#include <graph_complex/config.hpp>
#include <graph_complex/sparse_matrix.hpp>
#include <graph_complex/types.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace graph_complex {

// Set to true to abandon running rank computations.
using CancellationFlag = std::atomic<bool>;

struct Rank {
    std::size_t value = 0;
    CoefficientDomain domain;
    std::string backend;

    bool operator==(const Rank& other) const {
        return value == other.value && domain == other.domain;
    }
    bool operator!=(const Rank& other) const { return !(*this == other); }
};

/**
 * Capability: exact rank of a sparse matrix over a coefficient domain.
 * Implementations throw RankSolverError and must be safe to call concurrently.
 */
class RankBackend {
public:
    virtual ~RankBackend() = default;

    virtual std::string name() const = 0;

    virtual std::size_t compute(const SparseMatrix& m, CoefficientDomain domain,
                                const CancellationFlag* cancel = nullptr) const = 0;
};

// Incremental sparse row echelon over GF(p). `cancel` is polled between rows.
std::size_t modular_rank(const SparseMatrix& m, std::uint64_t p, const CancellationFlag* cancel = nullptr);

// Row blocks echelonized on `threads` workers, then merged. Same result as modular_rank.
std::size_t parallel_modular_rank(const SparseMatrix& m, std::uint64_t p, std::size_t threads,
                                  const CancellationFlag* cancel = nullptr);

// Fraction-free sparse elimination over the integers with GMP.
std::size_t rational_rank(const SparseMatrix& m, const CancellationFlag* cancel = nullptr);

/**
 * In-process Gaussian elimination. More than one thread splits modular
 * ranks into row blocks; rational ranks always run on the calling thread.
 */
class EliminationRankBackend : public RankBackend {
private:
    std::size_t threads_ = 1;

public:
    explicit EliminationRankBackend(std::size_t threads = 1);

    std::size_t threads() const { return threads_; }
    std::string name() const override { return "elimination"; }
    std::size_t compute(const SparseMatrix& m, CoefficientDomain domain,
                        const CancellationFlag* cancel = nullptr) const override;
};

/**
 * Runs an external solver on the matrix written in SMS format.
 *
 * The child's address space is capped at the configured memory ceiling; it
 * is killed once the timeout elapses or `cancel` is raised. Exit code 0 and
 * a single integer on standard output are required.
 */
class SubprocessRankBackend : public RankBackend {
private:
    SolverBackendConfig config_;
    std::filesystem::path scratch_dir_;

    std::vector<std::string> command_line(const std::filesystem::path& matrix_path,
                                          CoefficientDomain domain) const;

public:
    SubprocessRankBackend(SolverBackendConfig config, std::filesystem::path scratch_dir);

    std::string name() const override { return config_.name; }
    const SolverBackendConfig& config() const { return config_; }

    std::size_t compute(const SparseMatrix& m, CoefficientDomain domain,
                        const CancellationFlag* cancel = nullptr) const override;
};

} // namespace graph_complex

#endif // GRAPH_COMPLEX_RANK_BACKEND_HPP

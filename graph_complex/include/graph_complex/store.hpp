#ifndef GRAPH_COMPLEX_STORE_HPP
#define GRAPH_COMPLEX_STORE_HPP

#include <graph_complex/basis.hpp>
#include <graph_complex/cohomology.hpp>
#include <graph_complex/operator_builder.hpp>
#include <graph_complex/rank_backend.hpp>
#include <graph_complex/sparse_matrix.hpp>
#include <graph_complex/validator.hpp>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace graph_complex {

/**
 * Write-once cache of computed artifacts.
 *
 * load_* returns nullopt when an entry is absent and throws
 * StoreCorruptionError when it exists but fails a structural check.
 * save_* publishes an entry atomically: readers see all of it or nothing.
 */
class PersistentStore {
private:
    struct CellMutex {
        std::mutex mutex;
        std::size_t holders = 0;  // owners plus waiters
    };

    mutable std::mutex locks_mutex_;
    std::unordered_map<std::string, CellMutex> cell_locks_;

    void release_cell(const std::string& cell_id);

public:
    /**
     * Exclusive hold on one cell id. The store forgets the id once the
     * last holder releases it, so idle ids cost nothing.
     */
    class CellLock {
    private:
        PersistentStore* store_ = nullptr;
        std::string cell_id_;
        std::unique_lock<std::mutex> lock_;

        CellLock(PersistentStore& store, std::string cell_id, std::mutex& mutex);
        friend class PersistentStore;

    public:
        CellLock(CellLock&& other) noexcept;
        CellLock(const CellLock&) = delete;
        CellLock& operator=(const CellLock&) = delete;
        CellLock& operator=(CellLock&&) = delete;
        ~CellLock();

        bool owns_lock() const { return lock_.owns_lock(); }
        const std::string& cell_id() const { return cell_id_; }
    };

    virtual ~PersistentStore() = default;

    virtual std::optional<Basis> load_basis(const GradingKey& key) const = 0;
    virtual void save_basis(const Basis& basis) = 0;

    virtual std::optional<SparseMatrix> load_matrix(const OperatorId& op) const = 0;
    virtual void save_matrix(const OperatorId& op, const SparseMatrix& matrix) = 0;

    virtual std::optional<Rank> load_rank(const OperatorId& op, CoefficientDomain domain) const = 0;
    virtual void save_rank(const OperatorId& op, const Rank& rank) = 0;

    virtual std::optional<ValidationFinding> load_finding(const CheckId& id, CoefficientDomain domain) const = 0;
    virtual void save_finding(const ValidationFinding& finding, CoefficientDomain domain) = 0;

    virtual std::optional<CohomologyEntry> load_cohomology(OperatorKind differential, const GradingKey& key,
                                                           CoefficientDomain domain) const = 0;
    virtual void save_cohomology(const CohomologyEntry& entry, CoefficientDomain domain) = 0;

    // Delimited report for the table's sub-type and domain, never read back as input.
    // Rows for gradings already in the report are replaced; the others are kept.
    virtual void export_table(const CohomologyTable& table) = 0;

    // Rank of the total differential out of `slice`.
    virtual std::optional<Rank> load_total_rank(const DegreeSlice& slice, CoefficientDomain domain) const = 0;
    virtual void save_total_rank(const DegreeSlice& slice, const Rank& rank) = 0;

    // Merged by degree like export_table.
    virtual void export_total_table(const TotalCohomologyTable& table) = 0;

    // Serializes computation of one cell across the workers sharing this store.
    CellLock lock_cell(const std::string& cell_id);

    // Ids currently held or waited for.
    std::size_t active_cell_locks() const;
};

/**
 * Directory layout:
 *
 *   <root>/<family>/<sub_type>/basis/gra<params>.g6
 *   <root>/<family>/<sub_type>/<operator>/D<params>.sms
 *   <root>/<family>/<sub_type>/<operator>/D<params>.rank.<domain>.txt
 *   <root>/<family>/<sub_type>/<operator>/checks/<check>_<params>.<domain>.txt
 *   <root>/<family>/<sub_type>/<operator>/cohomology/H<params>.<domain>.txt
 *   <root>/<family>/<sub_type>/<operator>/cohomology.<domain>.tsv
 *   <root>/ordinary/odd_edges/total/D<degree>.rank.<domain>.txt
 *   <root>/ordinary/odd_edges/total/cohomology.<domain>.tsv
 *
 * Operator files are named after the domain grading.
 */
class FileStore : public PersistentStore {
private:
    std::filesystem::path root_;

    std::filesystem::path family_dir(const GradingKey& key) const;

public:
    explicit FileStore(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }

    std::filesystem::path basis_path(const GradingKey& key) const;
    std::filesystem::path matrix_path(const OperatorId& op) const;
    std::filesystem::path rank_path(const OperatorId& op, CoefficientDomain domain) const;
    std::filesystem::path finding_path(const CheckId& id, CoefficientDomain domain) const;
    std::filesystem::path cohomology_path(OperatorKind differential, const GradingKey& key,
                                          CoefficientDomain domain) const;
    std::filesystem::path total_rank_path(const DegreeSlice& slice, CoefficientDomain domain) const;
    std::filesystem::path total_table_path(CoefficientDomain domain) const;
    std::filesystem::path table_path(OperatorKind differential, const GradingKey& sample,
                                     CoefficientDomain domain) const;

    std::optional<Basis> load_basis(const GradingKey& key) const override;
    void save_basis(const Basis& basis) override;

    std::optional<SparseMatrix> load_matrix(const OperatorId& op) const override;
    void save_matrix(const OperatorId& op, const SparseMatrix& matrix) override;

    std::optional<Rank> load_rank(const OperatorId& op, CoefficientDomain domain) const override;
    void save_rank(const OperatorId& op, const Rank& rank) override;

    std::optional<ValidationFinding> load_finding(const CheckId& id, CoefficientDomain domain) const override;
    void save_finding(const ValidationFinding& finding, CoefficientDomain domain) override;

    std::optional<CohomologyEntry> load_cohomology(OperatorKind differential, const GradingKey& key,
                                                   CoefficientDomain domain) const override;
    void save_cohomology(const CohomologyEntry& entry, CoefficientDomain domain) override;

    void export_table(const CohomologyTable& table) override;

    std::optional<Rank> load_total_rank(const DegreeSlice& slice, CoefficientDomain domain) const override;
    void save_total_rank(const DegreeSlice& slice, const Rank& rank) override;
    void export_total_table(const TotalCohomologyTable& table) override;
};

// Write to a temporary sibling and rename over `path`. Throws std::runtime_error.
void write_file_atomically(const std::filesystem::path& path, const std::string& content);

} // namespace graph_complex

#endif // GRAPH_COMPLEX_STORE_HPP

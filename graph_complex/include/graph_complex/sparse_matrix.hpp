#ifndef GRAPH_COMPLEX_SPARSE_MATRIX_HPP
#define GRAPH_COMPLEX_SPARSE_MATRIX_HPP

#include <graph_complex/types.hpp>
#include <cstddef>
#include <cstdint>
#include <map>
#include <utility>
#include <vector>

namespace graph_complex {

struct MatrixEntry {
    std::size_t row;
    std::size_t col;
    std::int64_t value;

    bool operator==(const MatrixEntry& other) const {
        return row == other.row && col == other.col && value == other.value;
    }
};

/**
 * Integer matrix holding only nonzero entries, ordered row-major.
 * Rows index the target basis, columns the source basis.
 */
class SparseMatrix {
private:
    std::size_t rows_ = 0;
    std::size_t cols_ = 0;
    std::map<std::pair<std::size_t, std::size_t>, std::int64_t> entries_;

    void check_index(std::size_t row, std::size_t col) const;

public:
    SparseMatrix() = default;
    SparseMatrix(std::size_t rows, std::size_t cols) : rows_(rows), cols_(cols) {}

    std::size_t rows() const { return rows_; }
    std::size_t cols() const { return cols_; }
    std::size_t nnz() const { return entries_.size(); }
    bool is_zero() const { return entries_.empty(); }

    // Accumulate into (row, col); an entry reaching zero is removed.
    // Throws std::out_of_range on bad indices, std::overflow_error on overflow.
    void add(std::size_t row, std::size_t col, std::int64_t value);

    // Overwrite (row, col); zero erases the entry.
    void set(std::size_t row, std::size_t col, std::int64_t value);

    std::int64_t at(std::size_t row, std::size_t col) const;

    std::vector<MatrixEntry> entries() const;

    const std::map<std::pair<std::size_t, std::size_t>, std::int64_t>& data() const { return entries_; }

    SparseMatrix transposed() const;

    bool operator==(const SparseMatrix& other) const {
        return rows_ == other.rows_ && cols_ == other.cols_ && entries_ == other.entries_;
    }
    bool operator!=(const SparseMatrix& other) const { return !(*this == other); }
};

// Entries reduced to [0, p) for a prime domain; unchanged for the rationals.
SparseMatrix reduce(const SparseMatrix& m, CoefficientDomain domain);

// a * b over the domain. Throws std::invalid_argument on a shape mismatch.
SparseMatrix multiply(const SparseMatrix& a, const SparseMatrix& b, CoefficientDomain domain);

// a + sign * b over the domain.
SparseMatrix combine(const SparseMatrix& a, const SparseMatrix& b, int sign, CoefficientDomain domain);

} // namespace graph_complex

#endif // GRAPH_COMPLEX_SPARSE_MATRIX_HPP

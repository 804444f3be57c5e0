#include <graph_complex/sparse_matrix.hpp>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace graph_complex {

namespace {

std::int64_t checked_add(std::int64_t a, std::int64_t b) {
    std::int64_t r;
    if (__builtin_add_overflow(a, b, &r)) {
        throw std::overflow_error("Matrix coefficient overflow");
    }
    return r;
}

std::int64_t checked_mul(std::int64_t a, std::int64_t b) {
    std::int64_t r;
    if (__builtin_mul_overflow(a, b, &r)) {
        throw std::overflow_error("Matrix coefficient overflow");
    }
    return r;
}

std::int64_t reduce_value(std::int64_t value, CoefficientDomain domain) {
    if (domain.is_rational()) return value;
    auto p = static_cast<std::int64_t>(domain.modulus);
    std::int64_t r = value % p;
    return r < 0 ? r + p : r;
}

} // namespace

void SparseMatrix::check_index(std::size_t row, std::size_t col) const {
    if (row >= rows_ || col >= cols_) {
        throw std::out_of_range("Matrix index (" + std::to_string(row) + ", " + std::to_string(col) +
                                ") outside " + std::to_string(rows_) + "x" + std::to_string(cols_));
    }
}

void SparseMatrix::add(std::size_t row, std::size_t col, std::int64_t value) {
    check_index(row, col);
    if (value == 0) return;
    auto key = std::make_pair(row, col);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        entries_.emplace(key, value);
        return;
    }
    it->second = checked_add(it->second, value);
    if (it->second == 0) entries_.erase(it);
}

void SparseMatrix::set(std::size_t row, std::size_t col, std::int64_t value) {
    check_index(row, col);
    auto key = std::make_pair(row, col);
    if (value == 0) {
        entries_.erase(key);
    } else {
        entries_[key] = value;
    }
}

std::int64_t SparseMatrix::at(std::size_t row, std::size_t col) const {
    check_index(row, col);
    auto it = entries_.find(std::make_pair(row, col));
    return it == entries_.end() ? 0 : it->second;
}

std::vector<MatrixEntry> SparseMatrix::entries() const {
    std::vector<MatrixEntry> result;
    result.reserve(entries_.size());
    for (const auto& [index, value] : entries_) {
        result.push_back({index.first, index.second, value});
    }
    return result;
}

SparseMatrix SparseMatrix::transposed() const {
    SparseMatrix t(cols_, rows_);
    for (const auto& [index, value] : entries_) {
        t.entries_.emplace(std::make_pair(index.second, index.first), value);
    }
    return t;
}

SparseMatrix reduce(const SparseMatrix& m, CoefficientDomain domain) {
    if (domain.is_rational()) return m;
    SparseMatrix r(m.rows(), m.cols());
    for (const auto& [index, value] : m.data()) {
        r.set(index.first, index.second, reduce_value(value, domain));
    }
    return r;
}

SparseMatrix multiply(const SparseMatrix& a, const SparseMatrix& b, CoefficientDomain domain) {
    if (a.cols() != b.rows()) {
        throw std::invalid_argument("Cannot multiply " + std::to_string(a.rows()) + "x" +
                                    std::to_string(a.cols()) + " by " + std::to_string(b.rows()) +
                                    "x" + std::to_string(b.cols()));
    }

    // Rows of b, keyed by row index.
    std::unordered_map<std::size_t, std::vector<std::pair<std::size_t, std::int64_t>>> b_rows;
    for (const auto& [index, value] : b.data()) {
        b_rows[index.first].emplace_back(index.second, reduce_value(value, domain));
    }

    SparseMatrix product(a.rows(), b.cols());
    for (const auto& [index, value] : a.data()) {
        auto it = b_rows.find(index.second);
        if (it == b_rows.end()) continue;
        std::int64_t left = reduce_value(value, domain);
        for (const auto& [col, right] : it->second) {
            std::int64_t term = reduce_value(checked_mul(left, right), domain);
            std::int64_t current = product.at(index.first, col);
            product.set(index.first, col, reduce_value(checked_add(current, term), domain));
        }
    }
    return product;
}

SparseMatrix combine(const SparseMatrix& a, const SparseMatrix& b, int sign, CoefficientDomain domain) {
    if (a.rows() != b.rows() || a.cols() != b.cols()) {
        throw std::invalid_argument("Cannot add matrices of different shapes");
    }
    SparseMatrix result = reduce(a, domain);
    for (const auto& [index, value] : b.data()) {
        std::int64_t current = result.at(index.first, index.second);
        std::int64_t term = reduce_value(checked_mul(value, sign), domain);
        result.set(index.first, index.second, reduce_value(checked_add(current, term), domain));
    }
    return result;
}

} // namespace graph_complex

#ifndef GRAPH_COMPLEX_SMS_FORMAT_HPP
#define GRAPH_COMPLEX_SMS_FORMAT_HPP

#include <graph_complex/sparse_matrix.hpp>
#include <iosfwd>
#include <string>

namespace graph_complex {

/**
 * Sparse coordinate text format shared by the store and the rank solvers:
 *
 *   rows cols M
 *   row col value      (1-based, one line per nonzero entry)
 *   ...
 *   0 0 0
 */
void write_sms(std::ostream& out, const SparseMatrix& m);

// Throws StoreCorruptionError naming `source` on any structural defect.
SparseMatrix read_sms(std::istream& in, const std::string& source);

} // namespace graph_complex

#endif // GRAPH_COMPLEX_SMS_FORMAT_HPP

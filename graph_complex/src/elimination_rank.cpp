#include <graph_complex/rank_backend.hpp>
#include <graph_complex/errors.hpp>
#include <gmpxx.h>
#include <job_system/job_system.hpp>
#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace graph_complex {

namespace {

template<typename Value>
using SparseRow = std::vector<std::pair<std::size_t, Value>>;

// Rows with the fewest entries first keeps fill-in low.
template<typename Value, typename Convert>
std::vector<SparseRow<Value>> collect_rows(const SparseMatrix& m, Convert convert) {
    std::vector<SparseRow<Value>> rows(m.rows());
    for (const auto& [index, value] : m.data()) {
        Value v = convert(value);
        if (v != 0) rows[index.first].emplace_back(index.second, std::move(v));
    }
    rows.erase(std::remove_if(rows.begin(), rows.end(), [](const SparseRow<Value>& r) { return r.empty(); }),
               rows.end());
    std::stable_sort(rows.begin(), rows.end(), [](const SparseRow<Value>& a, const SparseRow<Value>& b) {
        return a.size() < b.size();
    });
    return rows;
}

void check_cancel(const CancellationFlag* cancel) {
    if (cancel && cancel->load(std::memory_order_relaxed)) {
        throw RankSolverError(SolverFailure::Cancelled, "elimination interrupted");
    }
}

std::uint64_t mod_pow(std::uint64_t base, std::uint64_t exp, std::uint64_t p) {
    std::uint64_t result = 1;
    base %= p;
    while (exp > 0) {
        if (exp & 1) result = result * base % p;
        base = base * base % p;
        exp >>= 1;
    }
    return result;
}

// a - factor * b over GF(p); both rows sorted by column.
SparseRow<std::uint64_t> subtract_multiple(const SparseRow<std::uint64_t>& a, std::uint64_t factor,
                                           const SparseRow<std::uint64_t>& b, std::uint64_t p) {
    SparseRow<std::uint64_t> out;
    out.reserve(a.size() + b.size());
    std::size_t i = 0, j = 0;
    while (i < a.size() || j < b.size()) {
        if (j == b.size() || (i < a.size() && a[i].first < b[j].first)) {
            out.push_back(a[i++]);
        } else if (i == a.size() || b[j].first < a[i].first) {
            out.emplace_back(b[j].first, (p - factor * b[j].second % p) % p);
            ++j;
        } else {
            std::uint64_t v = (a[i].second + p - factor * b[j].second % p) % p;
            if (v != 0) out.emplace_back(a[i].first, v);
            ++i;
            ++j;
        }
    }
    return out;
}

// pivot_lead * a - a_lead * b, then divided by the content.
SparseRow<mpz_class> eliminate_lead(const SparseRow<mpz_class>& a, const SparseRow<mpz_class>& b) {
    const mpz_class& a_lead = a.front().second;
    const mpz_class& b_lead = b.front().second;
    SparseRow<mpz_class> out;
    out.reserve(a.size() + b.size());
    std::size_t i = 0, j = 0;
    while (i < a.size() || j < b.size()) {
        if (j == b.size() || (i < a.size() && a[i].first < b[j].first)) {
            out.emplace_back(a[i].first, b_lead * a[i].second);
            ++i;
        } else if (i == a.size() || b[j].first < a[i].first) {
            out.emplace_back(b[j].first, -a_lead * b[j].second);
            ++j;
        } else {
            mpz_class v = b_lead * a[i].second - a_lead * b[j].second;
            if (v != 0) out.emplace_back(a[i].first, std::move(v));
            ++i;
            ++j;
        }
    }

    mpz_class content = 0;
    for (const auto& entry : out) {
        mpz_gcd(content.get_mpz_t(), content.get_mpz_t(), entry.second.get_mpz_t());
        if (content == 1) break;
    }
    if (content > 1) {
        for (auto& entry : out) {
            mpz_divexact(entry.second.get_mpz_t(), entry.second.get_mpz_t(), content.get_mpz_t());
        }
    }
    return out;
}

using ModularPivots = std::unordered_map<std::size_t, SparseRow<std::uint64_t>>;

void check_modulus(std::uint64_t p) {
    if (p < 2 || p > MAX_PRIME_MODULUS) {
        throw std::invalid_argument("Modulus out of range for modular rank");
    }
}

std::vector<SparseRow<std::uint64_t>> modular_rows(const SparseMatrix& m, std::uint64_t p) {
    const auto signed_p = static_cast<std::int64_t>(p);
    return collect_rows<std::uint64_t>(m, [signed_p](std::int64_t v) {
        std::int64_t r = v % signed_p;
        return static_cast<std::uint64_t>(r < 0 ? r + signed_p : r);
    });
}

// Adds the rows to the monic echelon set `pivots`, stopping once it holds `limit` rows.
void reduce_into(std::vector<SparseRow<std::uint64_t>>& rows, std::uint64_t p, std::size_t limit,
                 ModularPivots& pivots, const CancellationFlag* cancel) {
    std::size_t processed = 0;
    for (auto& row : rows) {
        if (pivots.size() >= limit) break;
        if (++processed % 64 == 0) check_cancel(cancel);
        SparseRow<std::uint64_t> current = std::move(row);
        while (!current.empty()) {
            auto it = pivots.find(current.front().first);
            if (it == pivots.end()) {
                std::uint64_t inverse = mod_pow(current.front().second, p - 2, p);
                for (auto& entry : current) entry.second = entry.second * inverse % p;
                std::size_t lead = current.front().first;
                pivots.emplace(lead, std::move(current));
                break;
            }
            current = subtract_multiple(current, current.front().second, it->second, p);
        }
    }
}

} // namespace

std::size_t modular_rank(const SparseMatrix& m, std::uint64_t p, const CancellationFlag* cancel) {
    check_modulus(p);
    if (m.rows() == 0 || m.cols() == 0 || m.is_zero()) return 0;

    auto rows = modular_rows(m, p);
    ModularPivots pivots;
    reduce_into(rows, p, std::min(m.rows(), m.cols()), pivots, cancel);
    return pivots.size();
}

std::size_t parallel_modular_rank(const SparseMatrix& m, std::uint64_t p, std::size_t threads,
                                  const CancellationFlag* cancel) {
    check_modulus(p);
    if (threads == 0) {
        throw std::invalid_argument("Thread count must be positive");
    }
    if (m.rows() == 0 || m.cols() == 0 || m.is_zero()) return 0;

    auto rows = modular_rows(m, p);
    const std::size_t limit = std::min(m.rows(), m.cols());
    const std::size_t blocks = std::min(threads, rows.size() / 2);
    if (blocks < 2) {
        ModularPivots pivots;
        reduce_into(rows, p, limit, pivots, cancel);
        return pivots.size();
    }

    // Round-robin keeps the blocks balanced in row weight
    std::vector<std::vector<SparseRow<std::uint64_t>>> block_rows(blocks);
    for (std::size_t i = 0; i < rows.size(); ++i) {
        block_rows[i % blocks].push_back(std::move(rows[i]));
    }

    std::vector<ModularPivots> partial(blocks);
    job_system::JobSystem<int> jobs(blocks);
    jobs.start();
    for (std::size_t b = 0; b < blocks; ++b) {
        jobs.submit_function([&, b]() { reduce_into(block_rows[b], p, limit, partial[b], cancel); }, 0);
    }
    jobs.wait_for_completion();
    jobs.shutdown();
    if (jobs.has_error()) {
        check_cancel(cancel);
        throw std::runtime_error(std::string("Parallel elimination failed: ") + jobs.get_error_message());
    }

    // The blocks' echelon rows span the row space of the whole matrix
    std::vector<SparseRow<std::uint64_t>> merged;
    for (auto& pivots : partial) {
        for (auto& [lead, row] : pivots) merged.push_back(std::move(row));
    }
    std::stable_sort(merged.begin(), merged.end(),
                     [](const SparseRow<std::uint64_t>& a, const SparseRow<std::uint64_t>& b) {
                         return a.size() < b.size();
                     });
    ModularPivots pivots;
    reduce_into(merged, p, limit, pivots, cancel);
    return pivots.size();
}

std::size_t rational_rank(const SparseMatrix& m, const CancellationFlag* cancel) {
    if (m.rows() == 0 || m.cols() == 0 || m.is_zero()) return 0;

    auto rows = collect_rows<mpz_class>(m, [](std::int64_t v) {
        return mpz_class(static_cast<signed long>(v));
    });

    std::unordered_map<std::size_t, SparseRow<mpz_class>> pivots;
    std::size_t processed = 0;
    for (auto& row : rows) {
        if (++processed % 16 == 0) check_cancel(cancel);
        SparseRow<mpz_class> current = std::move(row);
        while (!current.empty()) {
            auto it = pivots.find(current.front().first);
            if (it == pivots.end()) {
                std::size_t lead = current.front().first;
                pivots.emplace(lead, std::move(current));
                break;
            }
            current = eliminate_lead(current, it->second);
        }
        if (pivots.size() == std::min(m.rows(), m.cols())) break;
    }
    return pivots.size();
}

EliminationRankBackend::EliminationRankBackend(std::size_t threads) : threads_(threads) {
    if (threads_ == 0) {
        throw std::invalid_argument("EliminationRankBackend needs at least one thread");
    }
}

std::size_t EliminationRankBackend::compute(const SparseMatrix& m, CoefficientDomain domain,
                                            const CancellationFlag* cancel) const {
    if (domain.is_rational()) return rational_rank(m, cancel);
    if (threads_ > 1) return parallel_modular_rank(m, domain.modulus, threads_, cancel);
    return modular_rank(m, domain.modulus, cancel);
}

} // namespace graph_complex

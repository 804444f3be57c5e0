#ifndef GRAPH_COMPLEX_VALIDATOR_HPP
#define GRAPH_COMPLEX_VALIDATOR_HPP

#include <graph_complex/grading_key.hpp>
#include <graph_complex/sparse_matrix.hpp>
#include <graph_complex/types.hpp>
#include <cstddef>
#include <string>

namespace graph_complex {

enum class CheckKind {
    SquareZero,
    AntiCommute,
    Commute
};

enum class CheckOutcome {
    Trivial,       // a factor is the zero map
    Passed,
    Failed,        // identity violated
    Inconclusive   // a factor is missing or shapes disagree
};

inline const char* check_name(CheckKind kind) {
    switch (kind) {
        case CheckKind::SquareZero: return "square_zero";
        case CheckKind::AntiCommute: return "anti_commute";
        case CheckKind::Commute: return "commute";
    }
    return "unknown";
}

inline const char* outcome_name(CheckOutcome outcome) {
    switch (outcome) {
        case CheckOutcome::Trivial: return "trivial";
        case CheckOutcome::Passed: return "passed";
        case CheckOutcome::Failed: return "failed";
        case CheckOutcome::Inconclusive: return "inconclusive";
    }
    return "unknown";
}

CheckOutcome parse_outcome(const std::string& text);

// Identifies one identity check: the checked grading and the differentials involved.
struct CheckId {
    CheckKind kind = CheckKind::SquareZero;
    OperatorKind first = OperatorKind::Contract;
    OperatorKind second = OperatorKind::Contract;
    GradingKey key;

    std::string to_string() const;

    bool operator==(const CheckId& other) const {
        return kind == other.kind && first == other.first && second == other.second && key == other.key;
    }
};

/**
 * Result of one identity check. A Failed finding is a validation
 * violation: recorded and reported, never fatal.
 */
struct ValidationFinding {
    CheckId id;
    CheckOutcome outcome = CheckOutcome::Inconclusive;
    std::size_t residual_entries = 0;  // nonzero entries of the composite
    std::string message;
};

/**
 * Checks d∘d = 0 and d∘d' ± d'∘d = 0 by explicit sparse products over
 * the coefficient domain used for ranks.
 */
class ComplexValidator {
private:
    CoefficientDomain domain_;

public:
    explicit ComplexValidator(CoefficientDomain domain) : domain_(domain) {}

    CoefficientDomain domain() const { return domain_; }

    // `first` maps out of `key`, `second` maps out of the target of `first`.
    ValidationFinding square_zero(OperatorKind kind, const GradingKey& key,
                                  const SparseMatrix& first, const SparseMatrix& second) const;

    /**
     * Path a: `a_first` (differential `d1`) then `a_second` (`d2`).
     * Path b: `b_first` (`d2`) then `b_second` (`d1`). Both start at `key`
     * and end in the same grading. Checks a + b = 0, or a - b = 0 when
     * `commute` is set.
     */
    ValidationFinding anti_commute(OperatorKind d1, OperatorKind d2, const GradingKey& key,
                                   const SparseMatrix& a_first, const SparseMatrix& a_second,
                                   const SparseMatrix& b_first, const SparseMatrix& b_second,
                                   bool commute = false) const;

    static ValidationFinding inconclusive(const CheckId& id, const std::string& reason);
};

} // namespace graph_complex

#endif // GRAPH_COMPLEX_VALIDATOR_HPP

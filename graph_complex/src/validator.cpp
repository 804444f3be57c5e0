#include <graph_complex/validator.hpp>
#include <graph_complex/log.hpp>
#include <stdexcept>

namespace graph_complex {

namespace {

bool is_zero_map(const SparseMatrix& m) {
    return m.rows() == 0 || m.cols() == 0 || m.is_zero();
}

std::string shape(const SparseMatrix& m) {
    return std::to_string(m.rows()) + "x" + std::to_string(m.cols());
}

void report(const ValidationFinding& finding) {
    if (finding.outcome == CheckOutcome::Failed) {
        GC_LOG_WARN("validation violation: %s has %zu nonzero entries", finding.id.to_string().c_str(),
                    finding.residual_entries);
    } else {
        GC_DEBUG_LOG("%s: %s", finding.id.to_string().c_str(), outcome_name(finding.outcome));
    }
}

} // namespace

CheckOutcome parse_outcome(const std::string& text) {
    for (CheckOutcome o : {CheckOutcome::Trivial, CheckOutcome::Passed, CheckOutcome::Failed,
                           CheckOutcome::Inconclusive}) {
        if (text == outcome_name(o)) return o;
    }
    throw std::invalid_argument("Unknown check outcome '" + text + "'");
}

std::string CheckId::to_string() const {
    std::string s = std::string(check_name(kind)) + "(" + operator_name(first);
    if (kind != CheckKind::SquareZero) {
        s += ",";
        s += operator_name(second);
    }
    return s + ") at " + key.to_string();
}

ValidationFinding ComplexValidator::inconclusive(const CheckId& id, const std::string& reason) {
    ValidationFinding finding;
    finding.id = id;
    finding.outcome = CheckOutcome::Inconclusive;
    finding.message = reason;
    report(finding);
    return finding;
}

ValidationFinding ComplexValidator::square_zero(OperatorKind kind, const GradingKey& key,
                                                const SparseMatrix& first, const SparseMatrix& second) const {
    CheckId id{CheckKind::SquareZero, kind, kind, key};
    if (second.cols() != first.rows()) {
        return inconclusive(id, "cannot compose " + shape(second) + " after " + shape(first));
    }

    ValidationFinding finding;
    finding.id = id;
    if (is_zero_map(first) || is_zero_map(second)) {
        finding.outcome = CheckOutcome::Trivial;
    } else {
        SparseMatrix product = multiply(second, first, domain_);
        finding.residual_entries = product.nnz();
        finding.outcome = product.is_zero() ? CheckOutcome::Passed : CheckOutcome::Failed;
    }
    report(finding);
    return finding;
}

ValidationFinding ComplexValidator::anti_commute(OperatorKind d1, OperatorKind d2, const GradingKey& key,
                                                 const SparseMatrix& a_first, const SparseMatrix& a_second,
                                                 const SparseMatrix& b_first, const SparseMatrix& b_second,
                                                 bool commute) const {
    CheckId id{commute ? CheckKind::Commute : CheckKind::AntiCommute, d1, d2, key};
    if (a_second.cols() != a_first.rows() || b_second.cols() != b_first.rows() ||
        a_first.cols() != b_first.cols() || a_second.rows() != b_second.rows()) {
        return inconclusive(id, "paths " + shape(a_second) + "*" + shape(a_first) + " and " +
                                shape(b_second) + "*" + shape(b_first) + " do not match");
    }

    ValidationFinding finding;
    finding.id = id;
    bool a_trivial = is_zero_map(a_first) || is_zero_map(a_second);
    bool b_trivial = is_zero_map(b_first) || is_zero_map(b_second);
    if (a_trivial && b_trivial) {
        finding.outcome = CheckOutcome::Trivial;
    } else {
        SparseMatrix a = multiply(a_second, a_first, domain_);
        SparseMatrix b = multiply(b_second, b_first, domain_);
        SparseMatrix sum = combine(a, b, commute ? -1 : 1, domain_);
        finding.residual_entries = sum.nnz();
        finding.outcome = sum.is_zero() ? CheckOutcome::Passed : CheckOutcome::Failed;
    }
    report(finding);
    return finding;
}

} // namespace graph_complex

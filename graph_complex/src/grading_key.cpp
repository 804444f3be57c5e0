#include <graph_complex/grading_key.hpp>
#include <sstream>
#include <stdexcept>

namespace graph_complex {

EdgeParity parse_parity(const std::string& text) {
    if (text == "even") return EdgeParity::Even;
    if (text == "odd") return EdgeParity::Odd;
    throw std::invalid_argument("Unknown parity '" + text + "'");
}

ComplexFamily parse_family(const std::string& text) {
    if (text == "ordinary") return ComplexFamily::Ordinary;
    if (text == "hairy") return ComplexFamily::Hairy;
    throw std::invalid_argument("Unknown complex family '" + text + "'");
}

OperatorKind parse_operator(const std::string& text) {
    if (text == "contract") return OperatorKind::Contract;
    if (text == "delete") return OperatorKind::Delete;
    throw std::invalid_argument("Unknown operator '" + text + "'");
}

Stage parse_stage(const std::string& text) {
    for (Stage s : {Stage::Basis, Stage::Operator, Stage::Rank, Stage::Validate, Stage::Cohomology}) {
        if (text == stage_name(s)) return s;
    }
    throw std::invalid_argument("Unknown stage '" + text + "'");
}

bool is_prime(std::uint64_t n) {
    if (n < 2) return false;
    if (n % 2 == 0) return n == 2;
    for (std::uint64_t d = 3; d * d <= n; d += 2) {
        if (n % d == 0) return false;
    }
    return true;
}

CoefficientDomain CoefficientDomain::prime(std::uint64_t p) {
    if (p > MAX_PRIME_MODULUS || !is_prime(p)) {
        throw std::invalid_argument("Modulus " + std::to_string(p) + " is not a supported prime");
    }
    return CoefficientDomain{p};
}

std::string CoefficientDomain::tag() const {
    return is_rational() ? std::string("Q") : "p" + std::to_string(modulus);
}

CoefficientDomain CoefficientDomain::from_tag(const std::string& tag) {
    if (tag == "Q") return rational();
    if (tag.size() > 1 && tag[0] == 'p') {
        std::uint64_t p = 0;
        for (std::size_t i = 1; i < tag.size(); ++i) {
            if (tag[i] < '0' || tag[i] > '9' || p > MAX_PRIME_MODULUS) {
                throw std::invalid_argument("Malformed domain tag '" + tag + "'");
            }
            p = p * 10 + static_cast<std::uint64_t>(tag[i] - '0');
        }
        return prime(p);
    }
    throw std::invalid_argument("Malformed domain tag '" + tag + "'");
}

std::string GradingKey::sub_type() const {
    std::string s = std::string(parity_name(edge_parity_)) + "_edges";
    if (has_hairs()) {
        s += "_";
        s += parity_name(hair_parity_);
        s += "_hairs";
    }
    return s;
}

std::string GradingKey::params() const {
    std::ostringstream oss;
    oss << vertices_ << "_" << loops_;
    if (has_hairs()) oss << "_" << hairs_;
    return oss.str();
}

std::string GradingKey::to_string() const {
    std::ostringstream oss;
    oss << family_name(family_) << "/" << sub_type() << "(v=" << vertices_ << ",l=" << loops_;
    if (has_hairs()) oss << ",h=" << hairs_;
    oss << ")";
    return oss.str();
}

std::uint64_t GradingKey::content_hash() const {
    std::uint64_t h = FNV64_OFFSET_BASIS;
    h = fnv1a_append(h, static_cast<std::int64_t>(family_));
    h = fnv1a_append(h, static_cast<std::int64_t>(vertices_));
    h = fnv1a_append(h, static_cast<std::int64_t>(loops_));
    h = fnv1a_append(h, static_cast<std::int64_t>(hairs_));
    h = fnv1a_append(h, static_cast<std::int64_t>(edge_parity_));
    h = fnv1a_append(h, static_cast<std::int64_t>(hair_parity_));
    return h;
}

std::vector<GradingKey> DegreeSlice::gradings() const {
    std::vector<GradingKey> keys;
    for (int v = 0; v <= degree_; ++v) {
        keys.push_back(GradingKey::ordinary(v, degree_ - v, EdgeParity::Odd));
    }
    return keys;
}

std::string DegreeSlice::to_string() const {
    return std::string(family_name(ComplexFamily::Ordinary)) + "/" + parity_name(EdgeParity::Odd) +
           "_edges(deg=" + std::to_string(degree_) + ")";
}

} // namespace graph_complex

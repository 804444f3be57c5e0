#ifndef GRAPH_COMPLEX_TYPES_HPP
#define GRAPH_COMPLEX_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace graph_complex {

using VertexId = std::uint32_t;

// p[v] is the new label of vertex v.
using Permutation = std::vector<VertexId>;

constexpr VertexId INVALID_VERTEX = std::numeric_limits<VertexId>::max();

// graph6 stores the vertex count in one byte.
constexpr std::size_t MAX_GRAPH_VERTICES = 62;

enum class EdgeParity {
    Even,
    Odd
};

enum class ComplexFamily {
    Ordinary,
    Hairy
};

enum class OperatorKind {
    Contract,
    Delete
};

enum class Stage {
    Basis,
    Operator,
    Rank,
    Validate,
    Cohomology
};

inline const char* parity_name(EdgeParity p) {
    switch (p) {
        case EdgeParity::Even: return "even";
        case EdgeParity::Odd: return "odd";
    }
    return "unknown";
}

inline const char* family_name(ComplexFamily f) {
    switch (f) {
        case ComplexFamily::Ordinary: return "ordinary";
        case ComplexFamily::Hairy: return "hairy";
    }
    return "unknown";
}

inline const char* operator_name(OperatorKind k) {
    switch (k) {
        case OperatorKind::Contract: return "contract";
        case OperatorKind::Delete: return "delete";
    }
    return "unknown";
}

inline const char* stage_name(Stage s) {
    switch (s) {
        case Stage::Basis: return "basis";
        case Stage::Operator: return "operator";
        case Stage::Rank: return "rank";
        case Stage::Validate: return "validate";
        case Stage::Cohomology: return "cohomology";
    }
    return "unknown";
}

// Throw std::invalid_argument on unknown names.
EdgeParity parse_parity(const std::string& text);
ComplexFamily parse_family(const std::string& text);
OperatorKind parse_operator(const std::string& text);
Stage parse_stage(const std::string& text);

/**
 * Field a rank or matrix product is computed over.
 * modulus == 0 means the rationals.
 */
struct CoefficientDomain {
    std::uint64_t modulus = 0;

    static CoefficientDomain rational() { return CoefficientDomain{0}; }
    static CoefficientDomain prime(std::uint64_t p);

    bool is_rational() const { return modulus == 0; }

    // "Q" or "p<modulus>"
    std::string tag() const;
    static CoefficientDomain from_tag(const std::string& tag);

    bool operator==(const CoefficientDomain& other) const { return modulus == other.modulus; }
    bool operator!=(const CoefficientDomain& other) const { return modulus != other.modulus; }
};

// Largest prime modulus accepted: products of two residues stay within 64 bits.
constexpr std::uint64_t MAX_PRIME_MODULUS = (std::uint64_t(1) << 31) - 1;

bool is_prime(std::uint64_t n);

// 64-bit FNV-1a over raw bytes, used for stable content hashes.
constexpr std::uint64_t FNV64_OFFSET_BASIS = 14695981039346656037ull;
constexpr std::uint64_t FNV64_PRIME = 1099511628211ull;

inline std::uint64_t fnv1a_append(std::uint64_t hash, const void* data, std::size_t size) {
    const auto* bytes = static_cast<const unsigned char*>(data);
    for (std::size_t i = 0; i < size; ++i) {
        hash ^= bytes[i];
        hash *= FNV64_PRIME;
    }
    return hash;
}

inline std::uint64_t fnv1a_append(std::uint64_t hash, std::int64_t value) {
    auto bits = static_cast<std::uint64_t>(value);
    for (int i = 0; i < 8; ++i) {
        hash ^= (bits >> (8 * i)) & 0xffu;
        hash *= FNV64_PRIME;
    }
    return hash;
}

} // namespace graph_complex

#endif // GRAPH_COMPLEX_TYPES_HPP

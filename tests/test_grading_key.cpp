#include <gtest/gtest.h>
#include <graph_complex/grading_key.hpp>
#include <set>
#include <stdexcept>
#include <unordered_set>

using namespace graph_complex;

// === IDENTITY ===

TEST(GradingKeyTest, StructuralEquality) {
    auto a = GradingKey::ordinary(6, 5, EdgeParity::Odd);
    auto b = GradingKey::ordinary(6, 5, EdgeParity::Odd);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.content_hash(), b.content_hash());
    EXPECT_NE(a, GradingKey::ordinary(6, 5, EdgeParity::Even));
    EXPECT_NE(a, GradingKey::ordinary(6, 4, EdgeParity::Odd));
    EXPECT_NE(a, GradingKey::hairy(6, 5, 0, EdgeParity::Odd, EdgeParity::Even));
}

TEST(GradingKeyTest, OrdinaryKeysIgnoreHairs) {
    auto key = GradingKey::ordinary(4, 3, EdgeParity::Odd);
    EXPECT_EQ(key.with_hairs(3), key);
    EXPECT_EQ(key.hairs(), 0);
    EXPECT_EQ(key.hair_parity(), EdgeParity::Even);
    EXPECT_FALSE(key.has_hairs());
}

TEST(GradingKeyTest, UsableInOrderedAndHashedContainers) {
    std::set<GradingKey> ordered;
    std::unordered_set<GradingKey> hashed;
    for (int v = 4; v <= 8; ++v) {
        for (auto p : {EdgeParity::Even, EdgeParity::Odd}) {
            ordered.insert(GradingKey::ordinary(v, 5, p));
            hashed.insert(GradingKey::ordinary(v, 5, p));
            hashed.insert(GradingKey::ordinary(v, 5, p));
        }
    }
    EXPECT_EQ(ordered.size(), 10u);
    EXPECT_EQ(hashed.size(), 10u);
}

TEST(GradingKeyTest, ContentHashSeparatesFields) {
    auto key = GradingKey::ordinary(6, 5, EdgeParity::Odd);
    EXPECT_EQ(key.content_hash(), GradingKey::ordinary(6, 5, EdgeParity::Odd).content_hash());
    EXPECT_NE(key.content_hash(), GradingKey::ordinary(5, 6, EdgeParity::Odd).content_hash());
}

// === NAMES ===

TEST(GradingKeyTest, Names) {
    auto odd = GradingKey::ordinary(6, 5, EdgeParity::Odd);
    EXPECT_EQ(odd.sub_type(), "odd_edges");
    EXPECT_EQ(odd.params(), "6_5");
    EXPECT_EQ(odd.to_string(), "ordinary/odd_edges(v=6,l=5)");

    auto hairy = GradingKey::hairy(2, 1, 3, EdgeParity::Even, EdgeParity::Odd);
    EXPECT_EQ(hairy.sub_type(), "even_edges_odd_hairs");
    EXPECT_EQ(hairy.params(), "2_1_3");
    EXPECT_EQ(hairy.to_string(), "hairy/even_edges_odd_hairs(v=2,l=1,h=3)");
}

TEST(GradingKeyTest, ParseNames) {
    EXPECT_EQ(parse_parity("odd"), EdgeParity::Odd);
    EXPECT_EQ(parse_family("hairy"), ComplexFamily::Hairy);
    EXPECT_EQ(parse_operator("delete"), OperatorKind::Delete);
    EXPECT_EQ(parse_stage("cohomology"), Stage::Cohomology);
    EXPECT_THROW(parse_parity("odd_edges"), std::invalid_argument);
    EXPECT_THROW(parse_stage("rank "), std::invalid_argument);
}

// === COEFFICIENT DOMAINS ===

TEST(CoefficientDomainTest, Tags) {
    EXPECT_EQ(CoefficientDomain::rational().tag(), "Q");
    EXPECT_EQ(CoefficientDomain::prime(32003).tag(), "p32003");
    EXPECT_EQ(CoefficientDomain::from_tag("p32003"), CoefficientDomain::prime(32003));
    EXPECT_TRUE(CoefficientDomain::from_tag("Q").is_rational());
}

TEST(CoefficientDomainTest, RejectsNonPrimes) {
    EXPECT_THROW(CoefficientDomain::prime(32004), std::invalid_argument);
    EXPECT_THROW(CoefficientDomain::prime(1), std::invalid_argument);
    EXPECT_THROW(CoefficientDomain::prime(MAX_PRIME_MODULUS + 2), std::invalid_argument);
    EXPECT_THROW(CoefficientDomain::from_tag("p"), std::invalid_argument);
    EXPECT_THROW(CoefficientDomain::from_tag("p12x"), std::invalid_argument);
    EXPECT_THROW(CoefficientDomain::from_tag("R"), std::invalid_argument);
    EXPECT_TRUE(is_prime(MAX_PRIME_MODULUS));
}

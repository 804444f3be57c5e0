#include <gtest/gtest.h>
#include <graph_complex/errors.hpp>
#include <graph_complex/operator_builder.hpp>
#include <graph_complex/rank_backend.hpp>
#include "test_helpers.hpp"
#include <algorithm>
#include <cstdlib>
#include <stdexcept>

using namespace graph_complex;

class OperatorBuilderTest : public ::testing::Test {
protected:
    std::shared_ptr<const GraphOracle> oracle = std::make_shared<RefinementOracle>();
    std::shared_ptr<const GraphFamily> family = make_family(ComplexFamily::Ordinary);
    BasisBuilder bases{oracle, family};
    OperatorBuilder builder{oracle, family};

    static GradingKey odd(int v, int l) { return GradingKey::ordinary(v, l, EdgeParity::Odd); }
    static GradingKey even(int v, int l) { return GradingKey::ordinary(v, l, EdgeParity::Even); }

    SparseMatrix contraction(const GradingKey& key) {
        return builder.build(OperatorKind::Contract, bases.build(key), bases.build(family->target_of(OperatorKind::Contract, key)));
    }

    static std::vector<std::int64_t> magnitudes(const SparseMatrix& m) {
        std::vector<std::int64_t> values;
        for (const auto& e : m.entries()) values.push_back(std::llabs(e.value));
        std::sort(values.begin(), values.end());
        return values;
    }
};

// === MATRICES ===

TEST_F(OperatorBuilderTest, OddLoopFiveContraction) {
    SparseMatrix d = contraction(odd(7, 5));
    EXPECT_EQ(d.rows(), 2u);
    EXPECT_EQ(d.cols(), 1u);
    EXPECT_EQ(magnitudes(d), (std::vector<std::int64_t>{1, 2}));
    EXPECT_EQ(modular_rank(d, 32003), 1u);
}

TEST_F(OperatorBuilderTest, EvenLoopFiveContraction) {
    SparseMatrix d = contraction(even(8, 5));
    EXPECT_EQ(d.rows(), 2u);
    EXPECT_EQ(d.cols(), 4u);
    EXPECT_EQ(magnitudes(d), (std::vector<std::int64_t>{1, 1, 2, 4, 12}));
    EXPECT_EQ(rational_rank(d), 2u);
}

TEST_F(OperatorBuilderTest, NoStoredZeros) {
    for (const auto& key : {odd(7, 5), even(8, 5), even(7, 5)}) {
        for (const auto& e : contraction(key).entries()) {
            EXPECT_NE(e.value, 0) << key.to_string();
        }
    }
}

TEST_F(OperatorBuilderTest, AnnihilatedImagesContributeNothing) {
    // every rung contraction of the prism lands on K5 minus a matching,
    // which has an odd symmetry for even edges
    SparseMatrix d = contraction(even(6, 4));
    EXPECT_EQ(d.rows(), 0u);
    EXPECT_EQ(d.cols(), 1u);
    EXPECT_TRUE(d.is_zero());
}

TEST_F(OperatorBuilderTest, InvalidTargetGivesZeroMap) {
    SparseMatrix d = contraction(odd(4, 3));
    EXPECT_EQ(d.rows(), 0u);
    EXPECT_EQ(d.cols(), 1u);
}

TEST_F(OperatorBuilderTest, BuildIsDeterministic) {
    EXPECT_EQ(contraction(even(8, 5)), contraction(even(8, 5)));
}

// === ERRORS ===

TEST_F(OperatorBuilderTest, MissingTargetGeneratorIsAnError) {
    Basis full = bases.build(odd(6, 5));
    ASSERT_EQ(full.size(), 2u);
    Basis partial(odd(6, 5), {full[0]});
    EXPECT_THROW(builder.build(OperatorKind::Contract, bases.build(odd(7, 5)), partial),
                 OperatorConstructionError);
}

TEST_F(OperatorBuilderTest, NonAdjacentBasesAreRejected) {
    EXPECT_THROW(builder.build(OperatorKind::Contract, bases.build(odd(7, 5)), bases.build(odd(5, 5))),
                 std::invalid_argument);
}

TEST_F(OperatorBuilderTest, DeletionRejectedForEvenEdges) {
    EXPECT_THROW(builder.build(OperatorKind::Delete, bases.build(even(6, 5)), bases.build(even(6, 4))),
                 std::invalid_argument);
}

TEST_F(OperatorBuilderTest, OperatorIdNamesTarget) {
    OperatorId id = builder.operator_id(OperatorKind::Delete, odd(6, 5));
    EXPECT_EQ(id.domain, odd(6, 5));
    EXPECT_EQ(id.target, odd(6, 4));
    EXPECT_NE(id.to_string().find("delete"), std::string::npos);
}

TEST_F(OperatorBuilderTest, DeletionIntoEmptyBasis) {
    SparseMatrix d = builder.build(OperatorKind::Delete, bases.build(odd(6, 5)), bases.build(odd(6, 4)));
    EXPECT_EQ(d.rows(), 0u);
    EXPECT_EQ(d.cols(), 2u);
}

#include <gtest/gtest.h>
#include <graph_complex/errors.hpp>
#include <graph_complex/graph_oracle.hpp>
#include "test_helpers.hpp"
#include <algorithm>
#include <set>

using namespace graph_complex;

class GraphOracleTest : public ::testing::Test {
protected:
    RefinementOracle oracle;

    // Connected graphs with n vertices of degree >= 3 and m edges.
    static EnumerationRequest trivalent(std::size_t n, std::size_t m) {
        EnumerationRequest request;
        request.classes.push_back(ColourClass{n, 3, MAX_GRAPH_VERTICES});
        request.num_edges = m;
        return request;
    }
};

// === ENUMERATION COUNTS ===

TEST_F(GraphOracleTest, TetrahedronIsTheOnlyGraphOnFourVertices) {
    auto graphs = oracle.enumerate(trivalent(4, 6));
    ASSERT_EQ(graphs.size(), 1u);
    EXPECT_EQ(graphs[0].to_g6(), test_utils::complete_graph(4).to_g6());
}

TEST_F(GraphOracleTest, FiveVertexCounts) {
    EXPECT_EQ(oracle.enumerate(trivalent(5, 8)).size(), 1u);   // K5 minus a matching
    EXPECT_EQ(oracle.enumerate(trivalent(5, 9)).size(), 1u);   // K5 minus an edge
    EXPECT_EQ(oracle.enumerate(trivalent(5, 10)).size(), 1u);  // K5
}

TEST_F(GraphOracleTest, CubicGraphsOnSixAndEightVertices) {
    auto six = oracle.enumerate(trivalent(6, 9));
    ASSERT_EQ(six.size(), 2u);
    Canonicalizer c;
    std::set<std::string> expected{c.canonicalize(test_utils::prism()).g6, c.canonicalize(test_utils::k33()).g6};
    std::set<std::string> found{six[0].to_g6(), six[1].to_g6()};
    EXPECT_EQ(found, expected);

    EXPECT_EQ(oracle.enumerate(trivalent(8, 12)).size(), 5u);
}

TEST_F(GraphOracleTest, LoopFiveCounts) {
    EXPECT_EQ(oracle.enumerate(trivalent(6, 10)).size(), 4u);
    EXPECT_EQ(oracle.enumerate(trivalent(7, 11)).size(), 4u);
}

TEST_F(GraphOracleTest, ImpossibleDegreeSequenceGivesNothing) {
    EXPECT_TRUE(oracle.enumerate(trivalent(4, 5)).empty());
    EXPECT_TRUE(oracle.enumerate(trivalent(4, 7)).empty());
}

// === OUTPUT FORM ===

TEST_F(GraphOracleTest, ResultsAreCanonicalSortedAndConstrained) {
    auto graphs = oracle.enumerate(trivalent(7, 11));
    Canonicalizer c;
    for (std::size_t i = 0; i < graphs.size(); ++i) {
        const Graph& g = graphs[i];
        EXPECT_EQ(c.canonicalize(g).g6, g.to_g6());
        EXPECT_EQ(g.num_edges(), 11u);
        EXPECT_TRUE(g.is_connected());
        auto deg = g.degrees();
        EXPECT_GE(*std::min_element(deg.begin(), deg.end()), 3u);
        if (i > 0) EXPECT_LT(graphs[i - 1].to_g6(), g.to_g6());
    }
}

TEST_F(GraphOracleTest, DisconnectedGraphsOnlyWhenAllowed) {
    // two disjoint K4
    auto request = trivalent(8, 12);
    request.classes[0].max_degree = 3;
    auto connected = oracle.enumerate(request);
    request.connected = false;
    auto all = oracle.enumerate(request);
    EXPECT_EQ(connected.size(), 5u);
    EXPECT_EQ(all.size(), 6u);
}

// === COLOURED REQUESTS ===

TEST_F(GraphOracleTest, HairyStarHasOneShape) {
    EnumerationRequest request;
    request.classes.push_back(ColourClass{1, 3, MAX_GRAPH_VERTICES});
    request.classes.push_back(ColourClass{3, 1, 1});
    request.forbidden_class_pairs.emplace_back(1, 1);
    request.num_edges = 3;
    auto graphs = oracle.enumerate(request);
    ASSERT_EQ(graphs.size(), 1u);
    EXPECT_EQ(graphs[0].to_g6(), "Cs");
}

TEST_F(GraphOracleTest, ForbiddenPairsAreRespected) {
    EnumerationRequest request;
    request.classes.push_back(ColourClass{2, 1, MAX_GRAPH_VERTICES});
    request.classes.push_back(ColourClass{2, 1, MAX_GRAPH_VERTICES});
    request.forbidden_class_pairs.emplace_back(0, 0);
    request.forbidden_class_pairs.emplace_back(1, 1);
    request.num_edges = 4;
    // only the bipartite 4-cycle remains
    auto graphs = oracle.enumerate(request);
    ASSERT_EQ(graphs.size(), 1u);
    for (const auto& e : graphs[0].edges()) {
        EXPECT_LT(e.u, 2u);
        EXPECT_GE(e.v, 2u);
    }
    EXPECT_TRUE(request.edge_allowed(0, 1));
    EXPECT_FALSE(request.edge_allowed(1, 1));
}

TEST_F(GraphOracleTest, RequestPartitionFollowsClassOrder) {
    EnumerationRequest request;
    request.classes.push_back(ColourClass{2, 3, 5});
    request.classes.push_back(ColourClass{3, 1, 1});
    EXPECT_EQ(request.num_vertices(), 5u);
    Partition expected{{0, 1}, {2, 3, 4}};
    EXPECT_EQ(request.partition(), expected);
    std::vector<std::size_t> classes{0, 0, 1, 1, 1};
    EXPECT_EQ(request.class_of_vertices(), classes);
}

// === LIMITS ===

TEST_F(GraphOracleTest, RequestAboveVertexLimitThrows) {
    RefinementOracle small(8);
    EXPECT_EQ(small.max_vertices(), 8u);
    EXPECT_THROW(small.enumerate(trivalent(9, 14)), GraphEnumerationError);
    EXPECT_THROW(RefinementOracle(MAX_GRAPH_VERTICES + 1), std::invalid_argument);
}

TEST_F(GraphOracleTest, ContradictoryDegreeBoundsThrow) {
    EnumerationRequest request;
    request.classes.push_back(ColourClass{4, 3, 2});
    request.num_edges = 6;
    EXPECT_THROW(oracle.enumerate(request), GraphEnumerationError);
}

#include <gtest/gtest.h>
#include <graph_complex/graph.hpp>
#include "test_helpers.hpp"
#include <stdexcept>

using namespace graph_complex;

class GraphTest : public ::testing::Test {
protected:
    // 4-cycle 0-1-2-3-0
    Graph square = Graph(4, {{0, 1}, {1, 2}, {2, 3}, {3, 0}});
};

// === CONSTRUCTION ===

TEST_F(GraphTest, EdgesAreNormalisedAndSorted) {
    Graph g(3, {{2, 0}, {1, 0}});
    ASSERT_EQ(g.num_edges(), 2u);
    EXPECT_EQ(g.edges()[0], Edge(0, 1));
    EXPECT_EQ(g.edges()[1], Edge(0, 2));
    EXPECT_TRUE(g.has_edge(2, 0));
    EXPECT_FALSE(g.has_edge(1, 2));
}

TEST_F(GraphTest, RejectsMalformedEdgeLists) {
    EXPECT_THROW(Graph(3, {{1, 1}}), std::invalid_argument);
    EXPECT_THROW(Graph(3, {{0, 1}, {1, 0}}), std::invalid_argument);
    EXPECT_THROW(Graph(3, {{0, 3}}), std::invalid_argument);
    EXPECT_THROW(Graph(MAX_GRAPH_VERTICES + 1, {}), std::invalid_argument);
}

TEST_F(GraphTest, EdgeIndexFollowsLexicographicOrder) {
    // (0,1) (0,3) (1,2) (2,3)
    EXPECT_EQ(square.edge_index(0, 1), 0u);
    EXPECT_EQ(square.edge_index(3, 0), 1u);
    EXPECT_EQ(square.edge_index(1, 2), 2u);
    EXPECT_EQ(square.edge_index(2, 3), 3u);
    EXPECT_EQ(square.edge_index(0, 2), square.num_edges());
}

TEST_F(GraphTest, DegreesAndConnectivity) {
    EXPECT_EQ(square.degrees(), (std::vector<std::size_t>{2, 2, 2, 2}));
    EXPECT_TRUE(square.is_connected());
    EXPECT_FALSE(Graph(4, {{0, 1}, {2, 3}}).is_connected());
}

TEST_F(GraphTest, EdgeInsertionAndRemoval) {
    Graph g = square.with_edge(0, 2);
    EXPECT_EQ(g.num_edges(), 5u);
    EXPECT_TRUE(g.has_edge(0, 2));
    EXPECT_THROW(g.with_edge(2, 0), std::invalid_argument);

    Graph h = square.without_edge(1);
    EXPECT_FALSE(h.has_edge(0, 3));
    EXPECT_EQ(h.num_edges(), 3u);
    EXPECT_THROW(square.without_edge(4), std::out_of_range);
}

TEST_F(GraphTest, RelabelingRequiresPermutation) {
    Graph g = square.relabeled({1, 2, 3, 0});
    EXPECT_TRUE(g.has_edge(1, 2));
    EXPECT_TRUE(g.has_edge(0, 1));
    EXPECT_THROW(square.relabeled({0, 0, 1, 2}), std::invalid_argument);
    EXPECT_THROW(square.relabeled({0, 1, 2}), std::invalid_argument);
}

// === GRAPH6 ===

TEST_F(GraphTest, Graph6OfKnownGraphs) {
    EXPECT_EQ(test_utils::complete_graph(4).to_g6(), "C~");
    EXPECT_EQ(Graph(4).to_g6(), "C?");
    // x(0,1)=1 x(0,2)=0 x(1,2)=1 x(0,3)=1 x(1,3)=0 x(2,3)=1 -> 101101
    EXPECT_EQ(square.to_g6(), std::string("C") + static_cast<char>(0b101101 + 63));
}

TEST_F(GraphTest, Graph6RoundTrip) {
    for (const Graph& g : {test_utils::prism(), test_utils::k33(), test_utils::wheel(5), square}) {
        EXPECT_EQ(Graph::from_g6(g.to_g6()), g);
    }
}

TEST_F(GraphTest, Graph6RejectsMalformedInput) {
    EXPECT_THROW(Graph::from_g6(""), std::invalid_argument);
    EXPECT_THROW(Graph::from_g6("C"), std::invalid_argument);
    EXPECT_THROW(Graph::from_g6("C~~"), std::invalid_argument);
    EXPECT_THROW(Graph::from_g6("C "), std::invalid_argument);
}

// === PERMUTATIONS ===

TEST_F(GraphTest, PermutationSigns) {
    EXPECT_EQ(permutation_sign({0, 1, 2, 3}), 1);
    EXPECT_EQ(permutation_sign({1, 0, 2, 3}), -1);
    EXPECT_EQ(permutation_sign({1, 2, 0, 3}), 1);
    EXPECT_EQ(permutation_sign({1, 2, 3, 0}), -1);

    EXPECT_EQ(sequence_sign({0, 1, 2}), 1);
    EXPECT_EQ(sequence_sign({1, 0}), -1);
    EXPECT_EQ(sequence_sign({2, 0, 1}), 1);
    EXPECT_EQ(sequence_sign({7, 3, 5}), 1);
}

TEST_F(GraphTest, PermutationHelpers) {
    Permutation p = permute_to_front(2, 0, 4);
    EXPECT_EQ(p, (Permutation{1, 2, 0, 3}));
    EXPECT_EQ(inverse_permutation(p), (Permutation{2, 0, 1, 3}));
    EXPECT_TRUE(is_permutation(p, 4));
    EXPECT_FALSE(is_permutation({0, 2}, 2));
    EXPECT_THROW(permute_to_front(1, 1, 3), std::invalid_argument);
}

TEST_F(GraphTest, InducedEdgeOrderTracksRelabeling) {
    Graph path(3, {{0, 1}, {1, 2}});
    EXPECT_EQ(induced_edge_order(path, {0, 1, 2}), (std::vector<std::size_t>{0, 1}));
    EXPECT_EQ(induced_edge_order(path, {2, 1, 0}), (std::vector<std::size_t>{1, 0}));
}

// === CONTRACTION ===

TEST_F(GraphTest, MergeFirstTwoShiftsLabels) {
    auto merged = merge_first_two(square);
    ASSERT_TRUE(merged.has_value());
    EXPECT_EQ(merged->graph, test_utils::complete_graph(3));
    // (1,2) -> (0,1), (0,3) -> (0,2), (2,3) -> (1,2)
    EXPECT_EQ(merged->surviving_edges, (std::vector<std::size_t>{2, 1, 3}));
}

TEST_F(GraphTest, MergeCreatingMultiEdgeIsRejected) {
    EXPECT_FALSE(merge_first_two(test_utils::complete_graph(4)).has_value());
    EXPECT_THROW(merge_first_two(Graph(3, {{0, 2}, {1, 2}})), std::invalid_argument);
}

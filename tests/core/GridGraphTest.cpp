#include <gtest/gtest.h>
#include <pathlayer/core/GridGraph.h>

#include <algorithm>

using namespace pathlayer;

TEST(GridGraphTest, DimensionsFollowWeightMatrix) {
    GridGraph graph(CostMatrix::Ones(3, 4));

    EXPECT_EQ(graph.height(), 3);
    EXPECT_EQ(graph.width(), 4);
    EXPECT_EQ(graph.vertexCount(), 12u);
    EXPECT_EQ(graph.connectivity(), Connectivity::Queen);
    EXPECT_EQ(graph.source(), 0u);
    EXPECT_EQ(graph.destination(), 11u);
}

TEST(GridGraphTest, EmptyWeightsThrow) {
    EXPECT_THROW({ GridGraph graph{CostMatrix(0, 0)}; }, std::invalid_argument);
}

TEST(GridGraphTest, VertexIndexIsRowMajor) {
    GridGraph graph(CostMatrix::Zero(3, 4));

    EXPECT_EQ(graph.vertexIndex({0, 0}), 0u);
    EXPECT_EQ(graph.vertexIndex({0, 3}), 3u);
    EXPECT_EQ(graph.vertexIndex({1, 0}), 4u);
    EXPECT_EQ(graph.vertexIndex({2, 3}), 11u);

    for (VertexId v = 0; v < graph.vertexCount(); ++v) {
        EXPECT_EQ(graph.vertexIndex(graph.coordinates(v)), v);
    }
}

TEST(GridGraphTest, OutOfGridAccessThrows) {
    GridGraph graph(CostMatrix::Zero(2, 2));

    EXPECT_THROW(graph.vertexIndex({2, 0}), std::out_of_range);
    EXPECT_THROW(graph.vertexIndex({0, -1}), std::out_of_range);
    EXPECT_THROW(graph.coordinates(4), std::out_of_range);
    EXPECT_THROW(graph.vertexWeight(INVALID_VERTEX), std::out_of_range);
}

TEST(GridGraphTest, VertexWeightReadsCell) {
    CostMatrix weights(2, 3);
    weights << 1, 2, 3,
               4, 5, 6;
    GridGraph graph(weights);

    EXPECT_DOUBLE_EQ(graph.vertexWeight(0), 1.0);
    EXPECT_DOUBLE_EQ(graph.vertexWeight(2), 3.0);
    EXPECT_DOUBLE_EQ(graph.vertexWeight(4), 5.0);
}

TEST(GridGraphTest, RookNeighbors) {
    GridGraph graph(CostMatrix::Zero(3, 3), Connectivity::Rook);

    EXPECT_EQ(graph.outNeighbors(0), (std::vector<VertexId>{1, 3}));
    EXPECT_EQ(graph.outNeighbors(4), (std::vector<VertexId>{1, 3, 5, 7}));
    EXPECT_EQ(graph.outNeighbors(8), (std::vector<VertexId>{5, 7}));
}

TEST(GridGraphTest, QueenNeighborsInRowMajorOrder) {
    GridGraph graph(CostMatrix::Zero(3, 3), Connectivity::Queen);

    EXPECT_EQ(graph.outNeighbors(0), (std::vector<VertexId>{1, 3, 4}));
    EXPECT_EQ(graph.outNeighbors(4), (std::vector<VertexId>{0, 1, 2, 3, 5, 6, 7, 8}));
    EXPECT_EQ(graph.outNeighbors(5), (std::vector<VertexId>{1, 2, 4, 7, 8}));
}

TEST(GridGraphTest, NoWraparound) {
    GridGraph graph(CostMatrix::Zero(3, 3), Connectivity::Queen);

    auto neighbors = graph.outNeighbors(2);
    EXPECT_EQ(std::count(neighbors.begin(), neighbors.end(), 3u), 0);
    EXPECT_FALSE(graph.areAdjacent(2, 3));
}

TEST(GridGraphTest, AdjacencyIsSymmetric) {
    GridGraph graph(CostMatrix::Zero(4, 5), Connectivity::Queen);

    for (VertexId u = 0; u < graph.vertexCount(); ++u) {
        for (VertexId v : graph.outNeighbors(u)) {
            EXPECT_TRUE(graph.areAdjacent(v, u));
        }
        EXPECT_FALSE(graph.areAdjacent(u, u));
    }
}

TEST(GridGraphTest, DiagonalsOnlyUnderQueen) {
    GridGraph rook(CostMatrix::Zero(2, 2), Connectivity::Rook);
    GridGraph queen(CostMatrix::Zero(2, 2), Connectivity::Queen);

    EXPECT_FALSE(rook.areAdjacent(0, 3));
    EXPECT_TRUE(queen.areAdjacent(0, 3));
    EXPECT_EQ(GridGraph::degree(Connectivity::Rook), 4);
    EXPECT_EQ(GridGraph::degree(Connectivity::Queen), 8);
}

TEST(GridGraphTest, ConnectivityNames) {
    EXPECT_EQ(connectivityToString(Connectivity::Rook), "rook");
    EXPECT_EQ(connectivityFromString("queen"), Connectivity::Queen);
    EXPECT_THROW(connectivityFromString("bishop"), std::invalid_argument);
}

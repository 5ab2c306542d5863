#include <gtest/gtest.h>
#include "adjacency_graph.hpp"
#include "test_helpers.hpp"

using namespace pixstitch;
using namespace pixstitch::test;

TEST(AdjacencyGraph, DirectionOrderRotation) {
    auto base = direction_order(0);
    EXPECT_EQ(base[0], Direction::NW);
    EXPECT_EQ(base[7], Direction::W);

    auto left2 = direction_order(2);
    EXPECT_EQ(left2[0], Direction::NE);
    EXPECT_EQ(left2[7], Direction::N);

    // Rotated left by 1, then reversed
    auto reversed = direction_order(-1);
    EXPECT_EQ(reversed[0], Direction::NW);
    EXPECT_EQ(reversed[1], Direction::W);
    EXPECT_EQ(reversed[7], Direction::N);

    EXPECT_THROW(direction_order(8), std::invalid_argument);
    EXPECT_THROW(direction_order(-9), std::invalid_argument);
}

TEST(AdjacencyGraph, OneGraphPerColor) {
    auto raster = raster_from_ascii({
        "RB",
        "BR",
    });
    auto graphs = AdjacencyGraphBuilder::build(raster);
    ASSERT_EQ(graphs.size(), 2u);
    EXPECT_EQ(graphs[0].color(), RED);
    EXPECT_EQ(graphs[1].color(), BLUE);

    // Diagonal neighbors are 8-connected
    const auto& red = graphs[0];
    EXPECT_EQ(red.size(), 2u);
    EXPECT_TRUE(red.are_adjacent({0, 0}, {1, 1}));
    EXPECT_TRUE(red.are_adjacent({1, 1}, {0, 0}));
    EXPECT_FALSE(red.contains({1, 0}));
}

TEST(AdjacencyGraph, NeighborsInDirectionOrder) {
    auto raster = raster_from_ascii({
        "RRR",
        "RRR",
        "RRR",
    });
    auto graphs = AdjacencyGraphBuilder::build(raster);
    ASSERT_EQ(graphs.size(), 1u);
    std::vector<Coord> expected = {
        {0, 0}, {1, 0}, {2, 0}, {2, 1}, {2, 2}, {1, 2}, {0, 2}, {0, 1}
    };
    EXPECT_EQ(graphs[0].neighbors({1, 1}), expected);

    // Corner only has in-bounds neighbors
    std::vector<Coord> corner = {{1, 0}, {1, 1}, {0, 1}};
    EXPECT_EQ(graphs[0].neighbors({0, 0}), corner);
}

TEST(AdjacencyGraph, SymmetricAndNoSelfLoops) {
    auto raster = raster_from_ascii({
        "RRB.G",
        ".RBBG",
        "GG.RR",
        "RBRR.",
    });
    for (const auto& graph : AdjacencyGraphBuilder::build(raster)) {
        EXPECT_TRUE(graph.is_symmetric()) << to_hex(graph.color());
        for (const auto& [node, neighbors] : graph.adjacency()) {
            EXPECT_TRUE(raster.in_bounds(node.x, node.y));
            for (const auto& n : neighbors) {
                EXPECT_TRUE(raster.in_bounds(n.x, n.y));
                EXPECT_EQ(raster.color_at(n), graph.color());
            }
        }
    }
}

TEST(AdjacencyGraph, EmptyPixelsExcluded) {
    auto raster = raster_from_ascii({
        "R.",
        "..",
    });
    auto graphs = AdjacencyGraphBuilder::build(raster);
    ASSERT_EQ(graphs.size(), 1u);
    EXPECT_EQ(graphs[0].size(), 1u);
    EXPECT_TRUE(graphs[0].neighbors({0, 0}).empty());
    EXPECT_THROW(graphs[0].neighbors({1, 0}), std::out_of_range);

    auto blank = raster_from_ascii({"..", ".."});
    EXPECT_TRUE(AdjacencyGraphBuilder::build(blank).empty());
}

TEST(AdjacencyGraph, ConnectedComponents) {
    auto raster = raster_from_ascii({
        "RR.R",
        "...R",
        "R...",
    });
    auto graphs = AdjacencyGraphBuilder::build(raster);
    ASSERT_EQ(graphs.size(), 1u);
    auto components = graphs[0].connected_components();
    ASSERT_EQ(components.size(), 3u);

    // Ordered by smallest member
    std::vector<Coord> first = {{0, 0}, {1, 0}};
    std::vector<Coord> second = {{0, 2}};
    std::vector<Coord> third = {{3, 0}, {3, 1}};
    EXPECT_EQ(components[0], first);
    EXPECT_EQ(components[1], second);
    EXPECT_EQ(components[2], third);

    // Every pixel in exactly one component
    size_t total = 0;
    for (const auto& c : components) {
        total += c.size();
    }
    EXPECT_EQ(total, graphs[0].size());
}

TEST(AdjacencyGraph, Subgraph) {
    auto raster = raster_from_ascii({"RRR"});
    auto graphs = AdjacencyGraphBuilder::build(raster);
    auto sub = graphs[0].subgraph({{0, 0}, {1, 0}});
    EXPECT_EQ(sub.size(), 2u);
    EXPECT_EQ(sub.color(), RED);
    std::vector<Coord> expected = {{0, 0}};
    EXPECT_EQ(sub.neighbors({1, 0}), expected);
    EXPECT_TRUE(sub.is_symmetric());
}

TEST(AdjacencyGraph, FindGraph) {
    auto raster = raster_from_ascii({"RG"});
    auto graphs = AdjacencyGraphBuilder::build(raster);
    ASSERT_NE(find_graph(graphs, GREEN), nullptr);
    EXPECT_EQ(find_graph(graphs, GREEN)->color(), GREEN);
    EXPECT_EQ(find_graph(graphs, BLUE), nullptr);
}

#include <gtest/gtest.h>
#include "grid_path_finder.hpp"
#include "test_helpers.hpp"
#include <cmath>

using namespace pixstitch;
using namespace pixstitch::test;

namespace {

// Red square outline with a hole in the middle
RasterGrid box_raster() {
    return raster_from_ascii({
        ".....",
        ".RRR.",
        ".R.R.",
        ".RRR.",
        ".....",
    });
}

}  // namespace

TEST(GridPathFinder, StraightRouteAlongTopEdge) {
    auto raster = box_raster();
    GridPathFinder finder(raster);

    auto path = finder.find_path(RED, {1, 1}, {4, 1}, false);
    ASSERT_TRUE(path.has_value());
    std::vector<Coord> expected = {{1, 1}, {2, 1}, {3, 1}, {4, 1}};
    EXPECT_EQ(*path, expected);
}

TEST(GridPathFinder, RouteGoesAroundMissingEdges) {
    auto raster = raster_from_ascii({
        ".....",
        ".R.R.",
        ".R.R.",
        ".RRR.",
        ".....",
    });
    GridPathFinder finder(raster);

    auto path = finder.find_path(RED, {1, 2}, {4, 2}, false);
    ASSERT_TRUE(path.has_value());
    EXPECT_GT(path->size(), 4u);
    EXPECT_EQ(path->front(), (Coord{1, 2}));
    EXPECT_EQ(path->back(), (Coord{4, 2}));

    // Every step is a single unit move along an existing edge
    auto graph = finder.vertex_graph(RED, false);
    for (size_t i = 1; i < path->size(); ++i) {
        Coord step = (*path)[i] - (*path)[i - 1];
        EXPECT_EQ(std::abs(step.x) + std::abs(step.y), 1);
        EXPECT_TRUE(graph->edge_weight((*path)[i - 1], (*path)[i]).has_value());
    }
}

TEST(GridPathFinder, MissingOrDisconnectedCornersGiveNoPath) {
    auto raster = raster_from_ascii({"R.R"});
    GridPathFinder finder(raster);

    // Corner (2,0) borders pixel (2,0), but nothing links it to (0,0)
    EXPECT_FALSE(finder.find_path(RED, {0, 0}, {2, 0}, false).has_value());
    EXPECT_FALSE(finder.find_pixel_route(RED, {0, 0}, {2, 0}, false).has_value());

    auto lonely = raster_from_ascii({"R."});
    GridPathFinder lonely_finder(lonely);
    EXPECT_FALSE(lonely_finder.find_path(RED, {0, 0}, {2, 0}, false).has_value());
}

TEST(GridPathFinder, TrimToPixelBounds) {
    std::vector<Coord> path = {{1, 1}, {2, 1}, {3, 1}};
    std::vector<Coord> expected = {{2, 1}, {3, 1}};
    EXPECT_EQ(GridPathFinder::trim_to_pixel_bounds(path), expected);

    // Adjacent pixels keep the shared edge
    std::vector<Coord> adjacent = {{0, 0}, {1, 0}};
    EXPECT_EQ(GridPathFinder::trim_to_pixel_bounds(adjacent), adjacent);

    std::vector<Coord> single = {{5, 5}};
    EXPECT_EQ(GridPathFinder::trim_to_pixel_bounds(single), single);
}

TEST(GridPathFinder, SimplifyKeepsEndpointsAndCorners) {
    std::vector<Coord> straight = {{1, 1}, {2, 1}, {3, 1}, {4, 1}};
    std::vector<Coord> straight_expected = {{1, 1}, {4, 1}};
    EXPECT_EQ(GridPathFinder::simplify(straight), straight_expected);

    std::vector<Coord> l_shape = {{1, 1}, {2, 1}, {2, 2}};
    EXPECT_EQ(GridPathFinder::simplify(l_shape), l_shape);

    std::vector<Coord> zigzag = {{0, 0}, {1, 0}, {2, 0}, {2, 1}, {2, 2}, {3, 2}};
    std::vector<Coord> zigzag_expected = {{0, 0}, {2, 0}, {2, 2}, {3, 2}};
    auto once = GridPathFinder::simplify(zigzag);
    EXPECT_EQ(once, zigzag_expected);
    EXPECT_EQ(GridPathFinder::simplify(once), once);
}

TEST(GridPathFinder, PixelRouteOnStrip) {
    auto raster = raster_from_ascii({"RRRR"});
    GridPathFinder finder(raster);

    auto corners = finder.find_path(RED, {0, 0}, {3, 0}, false);
    ASSERT_TRUE(corners.has_value());
    EXPECT_EQ(corners->size(), 4u);

    auto route = finder.find_pixel_route(RED, {0, 0}, {3, 0}, false);
    ASSERT_TRUE(route.has_value());
    ASSERT_EQ(route->size(), 2u);
    EXPECT_EQ(route->front(), Point(1, 0));
    EXPECT_EQ(route->back(), Point(3, 0));
}

TEST(GridPathFinder, GraphsAreCachedPerColorAndWeighting) {
    auto raster = box_raster();
    GridPathFinder finder(raster);
    EXPECT_EQ(finder.cached_graph_count(), 0u);

    auto first = finder.vertex_graph(RED, false);
    auto second = finder.vertex_graph(RED, false);
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(finder.cached_graph_count(), 1u);

    auto weighted = finder.vertex_graph(RED, true);
    EXPECT_NE(first.get(), weighted.get());
    EXPECT_EQ(finder.cached_graph_count(), 2u);
}

TEST(GridPathFinder, EdgesOnlyAlongSolidPixels) {
    auto raster = raster_from_ascii({"R."});
    auto graph = VertexGridGraph::build(raster, RED, false);
    EXPECT_EQ(graph.columns(), 3);
    EXPECT_EQ(graph.rows(), 2);
    // Four sides of the single pixel
    EXPECT_EQ(graph.edge_count(), 4u);
    EXPECT_TRUE(graph.contains({0, 0}));
    EXPECT_FALSE(graph.contains({2, 0}));
    EXPECT_FALSE(graph.contains({-1, 0}));
}

TEST(GridPathFinder, SameColorEdgeFilter) {
    auto raster = raster_from_ascii({"RB"});
    PathFinderConfig config;
    config.edge_filter = EdgeFilter::SameColor;
    auto same = VertexGridGraph::build(raster, RED, false, config);
    auto any = VertexGridGraph::build(raster, RED, false);
    EXPECT_EQ(same.edge_count(), 4u);
    EXPECT_EQ(any.edge_count(), 7u);
    EXPECT_FALSE(same.contains({2, 0}));
}

TEST(GridPathFinder, PerceptualWeights) {
    auto raster = raster_from_ascii({"RW"});
    auto graph = VertexGridGraph::build(raster, RED, true);

    // Bordered by red on one side
    auto near = graph.edge_weight({0, 0}, {1, 0});
    ASSERT_TRUE(near.has_value());
    EXPECT_DOUBLE_EQ(*near, 1.0);

    // Only white borders this edge
    auto far = graph.edge_weight({1, 0}, {2, 0});
    ASSERT_TRUE(far.has_value());
    EXPECT_GT(*far, 10.0);
    EXPECT_DOUBLE_EQ(*far, std::trunc(*far));

    PathFinderConfig exact;
    exact.weight_rounding = WeightRounding::Exact;
    auto exact_graph = VertexGridGraph::build(raster, RED, true, exact);
    double expected = 1.0 + 0.1 * std::pow(delta_e_2000(RED, WHITE), 2.0);
    EXPECT_NEAR(*exact_graph.edge_weight({1, 0}, {2, 0}), expected, 1e-9);
    EXPECT_GE(*exact_graph.edge_weight({1, 0}, {2, 0}), *far);
}

TEST(GridPathFinder, WeightedRouteAvoidsForeignColor) {
    auto raster = raster_from_ascii({
        "RWR",
        "RRR",
    });
    GridPathFinder finder(raster);

    // The direct edge only borders white
    auto unweighted = finder.find_path(RED, {1, 0}, {2, 0}, false);
    ASSERT_TRUE(unweighted.has_value());
    EXPECT_EQ(unweighted->size(), 2u);

    auto weighted = finder.find_path(RED, {1, 0}, {2, 0}, true);
    ASSERT_TRUE(weighted.has_value());
    std::vector<Coord> expected = {{1, 0}, {1, 1}, {2, 1}, {2, 0}};
    EXPECT_EQ(*weighted, expected);
}

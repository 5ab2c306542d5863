#ifndef PIXSTITCH_GRAPH_ADJACENCY_GRAPH_HPP
#define PIXSTITCH_GRAPH_ADJACENCY_GRAPH_HPP

#include "coord.hpp"
#include <math/color.hpp>
#include <raster/raster_grid.hpp>
#include <array>
#include <map>
#include <vector>

namespace pixstitch {

// The 8 neighbor directions, in their fixed default order
enum class Direction { NW, N, NE, E, SE, S, SW, W };

Coord direction_offset(Direction dir);

// Direction order used when building neighbor lists. The default order is
// rotated left by |rotation| and reversed when rotation is negative.
// Throws std::invalid_argument when rotation is outside [-8, 7].
std::array<Direction, 8> direction_order(int rotation);

struct AdjacencyConfig {
    // Where the first neighbor starts, see direction_order()
    int direction_rotation = 0;
};

// Pixel adjacency for a single color: pixel -> same-colored 8-connected
// neighbors, in direction order.
class AdjacencyGraph {
public:
    AdjacencyGraph() = default;
    explicit AdjacencyGraph(ColorKey color) : color_(color) {}

    ColorKey color() const { return color_; }

    void add_node(const Coord& node, std::vector<Coord> neighbors);

    bool contains(const Coord& node) const { return adjacency_.count(node) > 0; }

    // Throws std::out_of_range for unknown nodes
    const std::vector<Coord>& neighbors(const Coord& node) const;

    bool are_adjacent(const Coord& a, const Coord& b) const;

    size_t size() const { return adjacency_.size(); }
    bool empty() const { return adjacency_.empty(); }

    // All nodes, sorted
    std::vector<Coord> nodes() const;

    const std::map<Coord, std::vector<Coord>>& adjacency() const { return adjacency_; }

    // Maximal connected subsets. Ordered by smallest member, members sorted.
    std::vector<std::vector<Coord>> connected_components() const;

    // Restriction of this graph to the given nodes
    AdjacencyGraph subgraph(const std::vector<Coord>& nodes) const;

    // True when every edge has its reverse and there are no self-loops
    bool is_symmetric() const;

private:
    ColorKey color_ = EMPTY_COLOR;
    std::map<Coord, std::vector<Coord>> adjacency_;
};

// Groups same-colored, 8-connected pixels
class AdjacencyGraphBuilder {
public:
    // One graph per color, in RasterGrid::colors() order
    static std::vector<AdjacencyGraph> build(const RasterGrid& raster,
                                             const AdjacencyConfig& config = AdjacencyConfig{});
};

// nullptr when no graph has that color
const AdjacencyGraph* find_graph(const std::vector<AdjacencyGraph>& graphs, ColorKey color);

}  // namespace pixstitch

#endif // PIXSTITCH_GRAPH_ADJACENCY_GRAPH_HPP

#ifndef PIXSTITCH_PATH_FINDER_VERTEX_GRID_GRAPH_HPP
#define PIXSTITCH_PATH_FINDER_VERTEX_GRID_GRAPH_HPP

#include <graph/coord.hpp>
#include <math/color.hpp>
#include <raster/raster_grid.hpp>
#include <cstdint>
#include <limits>
#include <optional>
#include <vector>

namespace pixstitch {

// Which edges exist in a vertex grid graph
enum class EdgeFilter {
    AnySolid,   // a bordering pixel is non-empty
    SameColor   // a bordering pixel has the graph's color
};

// How the perceptual weight is turned into an edge weight
enum class WeightRounding {
    Truncate,   // integer truncation of 1 + f * dE^2
    Exact
};

struct PathFinderConfig {
    EdgeFilter edge_filter = EdgeFilter::AnySolid;
    WeightRounding weight_rounding = WeightRounding::Truncate;
    // f in w = 1 + f * deltaE2000^2
    double weight_factor = 0.1;
};

// Weight of an edge that only borders empty cells on the weighted side.
// Dominates any real route.
constexpr double BLOCKED_WEIGHT = std::numeric_limits<double>::max();

// Graph over pixel-grid corners (x in [0, width], y in [0, height]).
// Corners are connected along pixel edges.
class VertexGridGraph {
public:
    struct Edge {
        uint32_t to;
        double weight;
    };

    static VertexGridGraph build(const RasterGrid& raster, ColorKey color, bool use_weights,
                                 const PathFinderConfig& config = PathFinderConfig{});

    int columns() const { return columns_; }
    int rows() const { return rows_; }

    bool in_grid(const Coord& corner) const {
        return corner.x >= 0 && corner.x < columns_ && corner.y >= 0 && corner.y < rows_;
    }

    uint32_t index_of(const Coord& corner) const {
        return static_cast<uint32_t>(corner.y) * static_cast<uint32_t>(columns_) +
               static_cast<uint32_t>(corner.x);
    }

    Coord corner_at(uint32_t index) const {
        return {static_cast<int>(index % columns_), static_cast<int>(index / columns_)};
    }

    // A corner is part of the graph when it has at least one edge
    bool contains(const Coord& corner) const;

    // Sorted by target index
    const std::vector<Edge>& edges(const Coord& corner) const;

    std::optional<double> edge_weight(const Coord& a, const Coord& b) const;

    size_t edge_count() const { return edge_count_; }

    // Fewest edges. Ties resolve towards lower corner indices.
    std::optional<std::vector<Coord>> shortest_path_bfs(const Coord& start, const Coord& end) const;

    // Minimum total weight. Ties resolve towards lower corner indices.
    std::optional<std::vector<Coord>> shortest_path_dijkstra(const Coord& start, const Coord& end) const;

private:
    VertexGridGraph(int columns, int rows);

    void add_edge(const Coord& a, const Coord& b, double weight);
    std::vector<Coord> unwind(const std::vector<int64_t>& parent, uint32_t end) const;

    int columns_;
    int rows_;
    size_t edge_count_ = 0;
    std::vector<std::vector<Edge>> adjacency_;
};

}  // namespace pixstitch

#endif // PIXSTITCH_PATH_FINDER_VERTEX_GRID_GRAPH_HPP

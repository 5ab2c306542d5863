#ifndef PIXSTITCH_PATH_FINDER_GRID_PATH_FINDER_HPP
#define PIXSTITCH_PATH_FINDER_GRID_PATH_FINDER_HPP

#include "vertex_grid_graph.hpp"
#include <shape/shape.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace pixstitch {

// Routes connectors along pixel edges. Vertex grid graphs are built lazily,
// once per (color, weighting) pair, and shared between callers.
class GridPathFinder {
public:
    explicit GridPathFinder(const RasterGrid& raster,
                            const PathFinderConfig& config = PathFinderConfig{});

    const RasterGrid& raster() const { return raster_; }
    const PathFinderConfig& config() const { return config_; }

    // Thread safe, built on first request
    std::shared_ptr<const VertexGridGraph> vertex_graph(ColorKey color, bool use_weights) const;

    size_t cached_graph_count() const;

    // Corner-by-corner route, or nullopt when start/end are not part of the
    // graph or no route connects them. BFS when unweighted, Dijkstra otherwise.
    std::optional<std::vector<Coord>> find_path(ColorKey color, const Coord& start,
                                                const Coord& end, bool use_weights) const;

    // Connector from one pixel to another: routed between the pixels'
    // top-left corners, trimmed to the pixel bounds and simplified.
    std::optional<std::vector<Point>> find_pixel_route(ColorKey color, const Coord& from_pixel,
                                                       const Coord& to_pixel, bool use_weights) const;

    // Drops leading corners of the start pixel and trailing corners of the end
    // pixel, where path.front() / path.back() are the pixels' top-left corners.
    static std::vector<Coord> trim_to_pixel_bounds(const std::vector<Coord>& path);

    // Keeps the first, last and every direction-change corner
    static std::vector<Coord> simplify(const std::vector<Coord>& path);

private:
    struct CacheEntry {
        std::once_flag once;
        std::shared_ptr<const VertexGridGraph> graph;
    };

    const RasterGrid& raster_;
    PathFinderConfig config_;
    mutable std::mutex mutex_;
    mutable std::map<std::pair<ColorKey, bool>, std::shared_ptr<CacheEntry>> cache_;
};

}  // namespace pixstitch

#endif // PIXSTITCH_PATH_FINDER_GRID_PATH_FINDER_HPP

#include "grid_path_finder.hpp"
#include "logging.hpp"
#include <algorithm>
#include <array>

namespace pixstitch {

namespace {

std::array<Coord, 4> pixel_corners(const Coord& top_left) {
    return {top_left, top_left + Coord{1, 0}, top_left + Coord{0, 1}, top_left + Coord{1, 1}};
}

bool is_corner_of(const std::array<Coord, 4>& corners, const Coord& c) {
    return std::find(corners.begin(), corners.end(), c) != corners.end();
}

}  // namespace

GridPathFinder::GridPathFinder(const RasterGrid& raster, const PathFinderConfig& config)
    : raster_(raster), config_(config) {}

std::shared_ptr<const VertexGridGraph> GridPathFinder::vertex_graph(ColorKey color,
                                                                    bool use_weights) const {
    std::shared_ptr<CacheEntry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = cache_[{color, use_weights}];
        if (!slot) {
            slot = std::make_shared<CacheEntry>();
        }
        entry = slot;
    }

    std::call_once(entry->once, [&]() {
        auto log = logging::get_logger();
        entry->graph = std::make_shared<const VertexGridGraph>(
            VertexGridGraph::build(raster_, color, use_weights, config_));
        log->debug("Built vertex graph for {} ({}): {} edges", to_hex(color),
                   use_weights ? "weighted" : "unweighted", entry->graph->edge_count());
    });
    return entry->graph;
}

size_t GridPathFinder::cached_graph_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

std::optional<std::vector<Coord>> GridPathFinder::find_path(ColorKey color, const Coord& start,
                                                            const Coord& end,
                                                            bool use_weights) const {
    auto log = logging::get_logger();
    auto graph = vertex_graph(color, use_weights);

    if (!graph->contains(start) || !graph->contains(end)) {
        log->warn("Start or end corner not in vertex graph. Start: ({}, {}), End: ({}, {})",
                  start.x, start.y, end.x, end.y);
        return std::nullopt;
    }

    auto path = use_weights ? graph->shortest_path_dijkstra(start, end)
                            : graph->shortest_path_bfs(start, end);
    if (!path) {
        log->info("No path found between ({}, {}) and ({}, {})", start.x, start.y, end.x, end.y);
    }
    return path;
}

std::optional<std::vector<Point>> GridPathFinder::find_pixel_route(ColorKey color,
                                                                   const Coord& from_pixel,
                                                                   const Coord& to_pixel,
                                                                   bool use_weights) const {
    auto path = find_path(color, from_pixel, to_pixel, use_weights);
    if (!path) {
        return std::nullopt;
    }

    std::vector<Point> points;
    for (const Coord& c : simplify(trim_to_pixel_bounds(*path))) {
        points.emplace_back(c);
    }
    return points;
}

std::vector<Coord> GridPathFinder::trim_to_pixel_bounds(const std::vector<Coord>& path) {
    if (path.size() < 2) {
        return path;
    }

    const auto start_corners = pixel_corners(path.front());
    const auto end_corners = pixel_corners(path.back());

    // Last corner of the leading run on the start pixel: where the route exits it
    size_t start_idx = 0;
    for (size_t i = 0; i < path.size(); ++i) {
        if (!is_corner_of(start_corners, path[i])) {
            break;
        }
        start_idx = i;
    }

    // First corner of the trailing run on the end pixel: where the route enters it
    size_t end_idx = path.size() - 1;
    for (size_t i = path.size(); i-- > 0;) {
        if (!is_corner_of(end_corners, path[i])) {
            break;
        }
        end_idx = i;
    }

    // Adjacent or identical pixels
    if (start_idx >= end_idx) {
        if (path.front() == path.back()) {
            return {path.front()};
        }
        return path;
    }

    return std::vector<Coord>(path.begin() + static_cast<std::ptrdiff_t>(start_idx),
                              path.begin() + static_cast<std::ptrdiff_t>(end_idx) + 1);
}

std::vector<Coord> GridPathFinder::simplify(const std::vector<Coord>& path) {
    if (path.size() < 2) {
        return path;
    }

    std::vector<Coord> simplified = {path.front()};
    for (size_t i = 1; i + 1 < path.size(); ++i) {
        Coord incoming = path[i] - path[i - 1];
        Coord outgoing = path[i + 1] - path[i];
        if (incoming != outgoing) {
            simplified.push_back(path[i]);
        }
    }
    simplified.push_back(path.back());

    return simplified;
}

}  // namespace pixstitch

#include "vertex_grid_graph.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <queue>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace pixstitch {

namespace {

double saturating_add(double a, double b) {
    if (a >= BLOCKED_WEIGHT - b) {
        return BLOCKED_WEIGHT;
    }
    return a + b;
}

// Per-pixel weight relative to the graph color, memoized per pixel color
class PixelWeigher {
public:
    PixelWeigher(const RasterGrid& raster, ColorKey color, bool use_weights,
                 const PathFinderConfig& config)
        : raster_(raster), color_(color), use_weights_(use_weights), config_(config) {}

    double operator()(int x, int y) {
        if (!use_weights_) {
            return 1.0;
        }
        ColorKey other = raster_.color_at(x, y);
        if (other == EMPTY_COLOR) {
            return BLOCKED_WEIGHT;
        }
        auto it = cache_.find(other);
        if (it != cache_.end()) {
            return it->second;
        }
        double delta_e = delta_e_2000(color_, other);
        double w = 1.0 + config_.weight_factor * delta_e * delta_e;
        if (config_.weight_rounding == WeightRounding::Truncate) {
            w = std::trunc(w);
        }
        cache_.emplace(other, w);
        return w;
    }

private:
    const RasterGrid& raster_;
    ColorKey color_;
    bool use_weights_;
    const PathFinderConfig& config_;
    std::unordered_map<ColorKey, double> cache_;
};

}  // namespace

VertexGridGraph::VertexGridGraph(int columns, int rows)
    : columns_(columns), rows_(rows),
      adjacency_(static_cast<size_t>(columns) * static_cast<size_t>(rows)) {}

VertexGridGraph VertexGridGraph::build(const RasterGrid& raster, ColorKey color, bool use_weights,
                                       const PathFinderConfig& config) {
    VertexGridGraph graph(raster.width() + 1, raster.height() + 1);
    PixelWeigher weight(raster, color, use_weights, config);

    auto borders = [&](int px, int py) {
        if (config.edge_filter == EdgeFilter::SameColor) {
            return raster.color_at(px, py) == color;
        }
        return raster.is_solid(px, py);
    };

    for (int y = 0; y < graph.rows_; ++y) {
        for (int x = 0; x < graph.columns_; ++x) {
            // Horizontal edge, bordered by the pixels above and below it
            if (x + 1 < graph.columns_ && (borders(x, y - 1) || borders(x, y))) {
                graph.add_edge({x, y}, {x + 1, y}, std::min(weight(x, y - 1), weight(x, y)));
            }
            // Vertical edge, bordered by the pixels left and right of it
            if (y + 1 < graph.rows_ && (borders(x - 1, y) || borders(x, y))) {
                graph.add_edge({x, y}, {x, y + 1}, std::min(weight(x - 1, y), weight(x, y)));
            }
        }
    }

    for (auto& edges : graph.adjacency_) {
        std::sort(edges.begin(), edges.end(),
                  [](const Edge& a, const Edge& b) { return a.to < b.to; });
    }

    return graph;
}

void VertexGridGraph::add_edge(const Coord& a, const Coord& b, double weight) {
    uint32_t ia = index_of(a);
    uint32_t ib = index_of(b);
    adjacency_[ia].push_back({ib, weight});
    adjacency_[ib].push_back({ia, weight});
    ++edge_count_;
}

bool VertexGridGraph::contains(const Coord& corner) const {
    return in_grid(corner) && !adjacency_[index_of(corner)].empty();
}

const std::vector<VertexGridGraph::Edge>& VertexGridGraph::edges(const Coord& corner) const {
    if (!in_grid(corner)) {
        throw std::out_of_range("VertexGridGraph::edges: corner outside grid");
    }
    return adjacency_[index_of(corner)];
}

std::optional<double> VertexGridGraph::edge_weight(const Coord& a, const Coord& b) const {
    if (!in_grid(a) || !in_grid(b)) {
        return std::nullopt;
    }
    uint32_t target = index_of(b);
    for (const auto& edge : adjacency_[index_of(a)]) {
        if (edge.to == target) {
            return edge.weight;
        }
    }
    return std::nullopt;
}

std::vector<Coord> VertexGridGraph::unwind(const std::vector<int64_t>& parent, uint32_t end) const {
    std::vector<Coord> path;
    for (int64_t i = end; i >= 0; i = parent[static_cast<size_t>(i)]) {
        path.push_back(corner_at(static_cast<uint32_t>(i)));
    }
    std::reverse(path.begin(), path.end());
    return path;
}

std::optional<std::vector<Coord>> VertexGridGraph::shortest_path_bfs(const Coord& start,
                                                                     const Coord& end) const {
    if (!contains(start) || !contains(end)) {
        return std::nullopt;
    }

    uint32_t source = index_of(start);
    uint32_t target = index_of(end);
    std::vector<int64_t> parent(adjacency_.size(), -1);
    std::vector<bool> seen(adjacency_.size(), false);
    std::queue<uint32_t> queue;

    seen[source] = true;
    queue.push(source);
    while (!queue.empty()) {
        uint32_t current = queue.front();
        queue.pop();
        if (current == target) {
            return unwind(parent, target);
        }
        for (const auto& edge : adjacency_[current]) {
            if (!seen[edge.to]) {
                seen[edge.to] = true;
                parent[edge.to] = current;
                queue.push(edge.to);
            }
        }
    }

    return std::nullopt;
}

std::optional<std::vector<Coord>> VertexGridGraph::shortest_path_dijkstra(const Coord& start,
                                                                          const Coord& end) const {
    if (!contains(start) || !contains(end)) {
        return std::nullopt;
    }

    using Entry = std::pair<double, uint32_t>;
    constexpr double unreached = std::numeric_limits<double>::infinity();

    uint32_t source = index_of(start);
    uint32_t target = index_of(end);
    std::vector<double> dist(adjacency_.size(), unreached);
    std::vector<int64_t> parent(adjacency_.size(), -1);
    std::vector<bool> done(adjacency_.size(), false);
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> queue;

    dist[source] = 0.0;
    queue.push({0.0, source});
    while (!queue.empty()) {
        auto [d, current] = queue.top();
        queue.pop();
        if (done[current]) {
            continue;
        }
        done[current] = true;
        if (current == target) {
            return unwind(parent, target);
        }
        for (const auto& edge : adjacency_[current]) {
            if (done[edge.to]) {
                continue;
            }
            double candidate = saturating_add(d, edge.weight);
            if (candidate < dist[edge.to]) {
                dist[edge.to] = candidate;
                parent[edge.to] = current;
                queue.push({candidate, edge.to});
            }
        }
    }

    return std::nullopt;
}

}  // namespace pixstitch

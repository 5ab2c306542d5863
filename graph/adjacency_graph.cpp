#include "adjacency_graph.hpp"
#include "logging.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace pixstitch {

Coord direction_offset(Direction dir) {
    switch (dir) {
        case Direction::NW: return {-1, -1};
        case Direction::N: return {0, -1};
        case Direction::NE: return {1, -1};
        case Direction::E: return {1, 0};
        case Direction::SE: return {1, 1};
        case Direction::S: return {0, 1};
        case Direction::SW: return {-1, 1};
        case Direction::W: return {-1, 0};
    }
    throw std::invalid_argument("direction_offset: invalid direction");
}

std::array<Direction, 8> direction_order(int rotation) {
    if (rotation < -8 || rotation > 7) {
        throw std::invalid_argument("direction rotation must be in [-8, 7], got " +
                                    std::to_string(rotation));
    }
    std::array<Direction, 8> order = {
        Direction::NW, Direction::N, Direction::NE, Direction::E,
        Direction::SE, Direction::S, Direction::SW, Direction::W
    };
    std::rotate(order.begin(), order.begin() + (std::abs(rotation) % 8), order.end());
    if (rotation < 0) {
        std::reverse(order.begin(), order.end());
    }
    return order;
}

// === AdjacencyGraph ===

void AdjacencyGraph::add_node(const Coord& node, std::vector<Coord> neighbors) {
    adjacency_[node] = std::move(neighbors);
}

const std::vector<Coord>& AdjacencyGraph::neighbors(const Coord& node) const {
    auto it = adjacency_.find(node);
    if (it == adjacency_.end()) {
        throw std::out_of_range("AdjacencyGraph::neighbors: unknown node");
    }
    return it->second;
}

bool AdjacencyGraph::are_adjacent(const Coord& a, const Coord& b) const {
    auto it = adjacency_.find(a);
    if (it == adjacency_.end()) {
        return false;
    }
    return std::find(it->second.begin(), it->second.end(), b) != it->second.end();
}

std::vector<Coord> AdjacencyGraph::nodes() const {
    std::vector<Coord> result;
    result.reserve(adjacency_.size());
    for (const auto& [node, _] : adjacency_) {
        result.push_back(node);
    }
    return result;
}

std::vector<std::vector<Coord>> AdjacencyGraph::connected_components() const {
    std::vector<std::vector<Coord>> components;
    std::set<Coord> visited;

    for (const auto& [root, _] : adjacency_) {
        if (visited.count(root)) {
            continue;
        }

        std::vector<Coord> component;
        std::vector<Coord> stack = {root};
        visited.insert(root);
        while (!stack.empty()) {
            Coord node = stack.back();
            stack.pop_back();
            component.push_back(node);
            for (const Coord& neighbor : neighbors(node)) {
                if (visited.insert(neighbor).second) {
                    stack.push_back(neighbor);
                }
            }
        }

        std::sort(component.begin(), component.end());
        components.push_back(std::move(component));
    }

    return components;
}

AdjacencyGraph AdjacencyGraph::subgraph(const std::vector<Coord>& nodes) const {
    std::set<Coord> keep(nodes.begin(), nodes.end());
    AdjacencyGraph result(color_);
    for (const Coord& node : nodes) {
        auto it = adjacency_.find(node);
        if (it == adjacency_.end()) {
            continue;
        }
        std::vector<Coord> kept;
        for (const Coord& neighbor : it->second) {
            if (keep.count(neighbor)) {
                kept.push_back(neighbor);
            }
        }
        result.add_node(node, std::move(kept));
    }
    return result;
}

bool AdjacencyGraph::is_symmetric() const {
    for (const auto& [node, neighbors] : adjacency_) {
        for (const Coord& neighbor : neighbors) {
            if (neighbor == node || !are_adjacent(neighbor, node)) {
                return false;
            }
        }
    }
    return true;
}

// === AdjacencyGraphBuilder ===

std::vector<AdjacencyGraph> AdjacencyGraphBuilder::build(const RasterGrid& raster,
                                                         const AdjacencyConfig& config) {
    auto log = logging::get_logger();
    const auto directions = direction_order(config.direction_rotation);

    std::vector<AdjacencyGraph> graphs;
    std::unordered_map<ColorKey, size_t> index;
    for (ColorKey color : raster.colors()) {
        index[color] = graphs.size();
        graphs.emplace_back(color);
    }

    for (int x = 0; x < raster.width(); ++x) {
        for (int y = 0; y < raster.height(); ++y) {
            ColorKey color = raster.color_at(x, y);
            if (color == EMPTY_COLOR) {
                continue;
            }

            std::vector<Coord> neighbors;
            for (Direction dir : directions) {
                Coord n = Coord{x, y} + direction_offset(dir);
                // Out-of-bounds lookups are EMPTY_COLOR, never a match
                if (raster.color_at(n) != color) {
                    continue;
                }
                neighbors.push_back(n);
            }
            graphs[index[color]].add_node({x, y}, std::move(neighbors));
        }
    }

    log->debug("Built adjacency graphs for {} colors ({}x{} image)",
               graphs.size(), raster.width(), raster.height());
    return graphs;
}

const AdjacencyGraph* find_graph(const std::vector<AdjacencyGraph>& graphs, ColorKey color) {
    for (const auto& graph : graphs) {
        if (graph.color() == color) {
            return &graph;
        }
    }
    return nullptr;
}

}  // namespace pixstitch

#include "self_avoiding_walk.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>

namespace pixstitch {

SawResult self_avoiding_walk(const AdjacencyGraph& graph, const Coord& start,
                             uint64_t step_limit) {
    if (!graph.contains(start)) {
        throw std::invalid_argument("self_avoiding_walk: start node not in graph");
    }

    struct Frame {
        Coord node;
        size_t next = 0;
    };

    SawResult result;
    std::vector<Coord> path = {start};
    std::set<Coord> on_path = {start};
    std::vector<Frame> frames = {{start, 0}};
    result.longest = path;

    while (!frames.empty()) {
        if (path.size() == graph.size()) {
            result.walk = path;
            return result;
        }
        if (++result.steps > step_limit) {
            result.step_limit_reached = true;
            break;
        }

        Frame& frame = frames.back();
        const auto& neighbors = graph.neighbors(frame.node);
        bool advanced = false;
        while (frame.next < neighbors.size()) {
            const Coord candidate = neighbors[frame.next++];
            if (on_path.count(candidate)) {
                continue;
            }
            path.push_back(candidate);
            on_path.insert(candidate);
            if (path.size() > result.longest.size()) {
                result.longest = path;
            }
            frames.push_back({candidate, 0});
            advanced = true;
            break;
        }

        if (!advanced) {
            // Dead end: backtrack
            on_path.erase(frames.back().node);
            path.pop_back();
            frames.pop_back();
        }
    }

    return result;
}

std::vector<Coord> depth_first_order(const AdjacencyGraph& graph, const Coord& start,
                                     NeighborOrder order) {
    std::vector<Coord> result;
    std::set<Coord> visited;
    std::vector<Coord> stack = {start};

    while (!stack.empty()) {
        Coord node = stack.back();
        stack.pop_back();
        if (!visited.insert(node).second) {
            continue;
        }
        result.push_back(node);

        std::vector<Coord> neighbors = graph.neighbors(node);
        if (order == NeighborOrder::Descending) {
            std::sort(neighbors.begin(), neighbors.end(), std::greater<Coord>());
        }
        for (const Coord& neighbor : neighbors) {
            if (!visited.count(neighbor)) {
                stack.push_back(neighbor);
            }
        }
    }

    return result;
}

}  // namespace pixstitch

#ifndef PIXSTITCH_ORDERING_SELF_AVOIDING_WALK_HPP
#define PIXSTITCH_ORDERING_SELF_AVOIDING_WALK_HPP

#include <graph/adjacency_graph.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace pixstitch {

struct SawResult {
    // Walk covering every node exactly once, if one was found
    std::optional<std::vector<Coord>> walk;
    // Longest self-avoiding prefix seen while searching
    std::vector<Coord> longest;
    uint64_t steps = 0;
    bool step_limit_reached = false;
};

// Backtracking search for a single-stroke walk over a connected graph,
// trying neighbors in adjacency order. Worst-case exponential: callers gate
// it by component size, step_limit bounds the number of search steps.
SawResult self_avoiding_walk(const AdjacencyGraph& graph, const Coord& start,
                             uint64_t step_limit);

// Stack-based depth-first visiting order of everything reachable from start
enum class NeighborOrder {
    Descending,  // smallest coordinate visited first
    Adjacency    // as stored, last neighbor visited first
};

std::vector<Coord> depth_first_order(const AdjacencyGraph& graph, const Coord& start,
                                     NeighborOrder order);

}  // namespace pixstitch

#endif // PIXSTITCH_ORDERING_SELF_AVOIDING_WALK_HPP

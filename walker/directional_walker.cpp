#include "directional_walker.hpp"
#include "logging.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>

namespace pixstitch {

namespace {

constexpr std::array<Heading, 4> CLOCKWISE = {Heading::S, Heading::W, Heading::N, Heading::E};
constexpr std::array<Heading, 4> COUNTER_CLOCKWISE = {Heading::S, Heading::E, Heading::N,
                                                      Heading::W};

bool is_spiral(WalkMode mode) {
    return mode == WalkMode::SpiralCw || mode == WalkMode::SpiralCcw;
}

bool is_clockwise(WalkMode mode) {
    return mode == WalkMode::SpiralCw || mode == WalkMode::SnakeCw;
}

}  // namespace

WalkMode walk_mode_from_string(const std::string& name) {
    if (name == "spiral_cw") return WalkMode::SpiralCw;
    if (name == "spiral_ccw") return WalkMode::SpiralCcw;
    if (name == "snake_cw") return WalkMode::SnakeCw;
    if (name == "snake_ccw") return WalkMode::SnakeCcw;
    throw std::invalid_argument("Unknown walk mode: " + name);
}

std::string to_string(WalkMode mode) {
    switch (mode) {
        case WalkMode::SpiralCw: return "spiral_cw";
        case WalkMode::SpiralCcw: return "spiral_ccw";
        case WalkMode::SnakeCw: return "snake_cw";
        case WalkMode::SnakeCcw: return "snake_ccw";
    }
    return "unknown";
}

Coord heading_offset(Heading heading) {
    switch (heading) {
        case Heading::S: return {0, 1};
        case Heading::W: return {-1, 0};
        case Heading::N: return {0, -1};
        case Heading::E: return {1, 0};
    }
    return {0, 0};
}

std::array<Heading, 4> DirectionalWalker::priority(WalkMode mode, Heading heading) {
    std::array<Heading, 4> cycle = is_clockwise(mode) ? CLOCKWISE : COUNTER_CLOCKWISE;
    // Heading goes third, its opposite first
    while (cycle[2] != heading) {
        std::rotate(cycle.begin(), cycle.begin() + 1, cycle.end());
    }
    return cycle;
}

std::vector<Coord> DirectionalWalker::walk(const std::vector<Coord>& mask, const Coord& start,
                                           WalkMode mode) {
    const std::set<Coord> in_mask(mask.begin(), mask.end());
    if (!in_mask.count(start)) {
        throw std::invalid_argument("DirectionalWalker::walk: start pixel is not in the mask");
    }

    struct Node {
        Coord coord;
        Heading heading;
    };

    std::vector<Coord> result;
    result.reserve(in_mask.size());
    std::set<Coord> visited;
    std::vector<Node> stack = {{start, Heading::N}};

    while (!stack.empty()) {
        Node node = stack.back();
        stack.pop_back();
        if (!visited.insert(node.coord).second) {
            continue;
        }
        result.push_back(node.coord);

        std::vector<Node> neighbors;
        for (Heading heading : priority(mode, node.heading)) {
            Coord next = node.coord + heading_offset(heading);
            if (in_mask.count(next)) {
                neighbors.push_back({next, heading});
            }
        }
        // Last pushed is walked first
        if (is_spiral(mode)) {
            std::reverse(neighbors.begin(), neighbors.end());
        }
        for (const Node& neighbor : neighbors) {
            if (!visited.count(neighbor.coord)) {
                stack.push_back(neighbor);
            }
        }
    }

    size_t walked = result.size();
    for (const Coord& c : mask) {
        if (visited.insert(c).second) {
            result.push_back(c);
        }
    }

    auto log = logging::get_logger();
    log->debug("Walked {} of {} pixels from ({}, {}) in {} mode", walked, result.size(),
               start.x, start.y, to_string(mode));
    return result;
}

std::vector<Coord> DirectionalWalker::fill_from(const std::vector<Coord>& all,
                                                const std::vector<Coord>& selected,
                                                const Coord& start, WalkMode mode) {
    const std::set<Coord> already(selected.begin(), selected.end());

    std::vector<Coord> remaining;
    for (const Coord& c : all) {
        if (!already.count(c)) {
            remaining.push_back(c);
        }
    }

    std::vector<Coord> result = selected;
    if (remaining.empty()) {
        return result;
    }

    auto walked = walk(remaining, start, mode);
    result.insert(result.end(), walked.begin(), walked.end());
    return result;
}

}  // namespace pixstitch

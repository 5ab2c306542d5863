#include "partition_orderer.hpp"
#include "logging.hpp"
#include <exception>
#include <limits>
#include <algorithm>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace pixstitch {

void OrderingStats::merge(const OrderingStats& other) {
    partitions += other.partitions;
    pixels += other.pixels;
    jump_stitches += other.jump_stitches;
    saw_successes += other.saw_successes;
    saw_fallbacks += other.saw_fallbacks;
    longest_saw_partial = std::max(longest_saw_partial, other.longest_saw_partial);
    connectors += other.connectors;
    straight_connectors += other.straight_connectors;
}

PartitionOrderer::PartitionOrderer(const GridPathFinder& router, OrderingConfig config)
    : router_(router), config_(std::move(config)) {}

std::string PartitionOrderer::component_key(ColorKey color, size_t index) {
    return to_hex(color) + "_" + std::to_string(index);
}

Coord PartitionOrderer::starting_node(const AdjacencyGraph& component_graph,
                                      const std::string& key) const {
    auto log = logging::get_logger();

    auto it = config_.start_nodes.find(key);
    if (it != config_.start_nodes.end()) {
        if (component_graph.contains(it->second)) {
            return it->second;
        }
        log->warn("Start node ({}, {}) for {} is not part of the component, ignoring",
                  it->second.x, it->second.y, key);
    }

    // An end of a strand
    for (const auto& [node, neighbors] : component_graph.adjacency()) {
        if (neighbors.size() == 1) {
            return node;
        }
    }

    // Closest to the origin
    Coord best = component_graph.adjacency().begin()->first;
    long best_dist = std::numeric_limits<long>::max();
    for (const auto& [node, neighbors] : component_graph.adjacency()) {
        long dist = static_cast<long>(node.x) * node.x + static_cast<long>(node.y) * node.y;
        if (dist < best_dist) {
            best_dist = dist;
            best = node;
        }
    }
    return best;
}

std::vector<Coord> PartitionOrderer::order_component(const AdjacencyGraph& graph,
                                                     const std::vector<Coord>& component,
                                                     const std::string& key,
                                                     OrderingStats& stats) const {
    auto log = logging::get_logger();
    AdjacencyGraph component_graph = graph.subgraph(component);
    Coord start = starting_node(component_graph, key);

    if (component.size() > 1 && component.size() < config_.saw_threshold) {
        SawResult saw = self_avoiding_walk(component_graph, start, config_.saw_step_limit);
        if (saw.walk) {
            ++stats.saw_successes;
            log->debug("{}: {} pixels, self-avoiding walk in {} steps", key, component.size(),
                       saw.steps);
            return *saw.walk;
        }
        ++stats.saw_fallbacks;
        stats.longest_saw_partial = std::max(stats.longest_saw_partial, saw.longest.size());
        if (saw.step_limit_reached) {
            log->warn("{}: self-avoiding walk step limit ({}) reached, using DFS", key,
                      config_.saw_step_limit);
        } else {
            log->debug("{}: no self-avoiding walk (longest {} of {}), using DFS", key,
                       saw.longest.size(), component.size());
        }
    }

    log->debug("{}: {} pixels, depth-first order from ({}, {})", key, component.size(),
               start.x, start.y);
    return depth_first_order(component_graph, start, config_.neighbor_order);
}

Path PartitionOrderer::straight_connector(const Coord& from, const Coord& to) {
    if (from.x == to.x || from.y == to.y) {
        return Path{{Point(from), Point(to)}};
    }
    return Path{{Point(from), Point(to.x, from.y), Point(to)}};
}

Path PartitionOrderer::connector(ColorKey color, const Coord& from, const Coord& to,
                                 OrderingStats& stats) const {
    ++stats.connectors;
    auto route = router_.find_pixel_route(color, from, to, config_.connector_weights);
    if (route) {
        return Path{std::move(*route)};
    }
    ++stats.straight_connectors;
    return straight_connector(from, to);
}

std::vector<Shape> PartitionOrderer::rebuild_shapes(ColorKey color,
                                                    const std::vector<Coord>& order,
                                                    OrderingStats& stats) const {
    std::vector<Shape> shapes;
    shapes.reserve(order.size());
    for (size_t i = 0; i < order.size(); ++i) {
        shapes.push_back(Rect{order[i].x, order[i].y, std::nullopt});
        if (i + 1 < order.size() && chebyshev_distance(order[i], order[i + 1]) > 1) {
            shapes.push_back(connector(color, order[i], order[i + 1], stats));
        }
    }
    return shapes;
}

std::vector<Shape> PartitionOrderer::rebuild_shapes(ColorKey color,
                                                    const std::vector<Coord>& order) const {
    OrderingStats unused;
    return rebuild_shapes(color, order, unused);
}

std::vector<Partition> PartitionOrderer::order(const AdjacencyGraph& graph,
                                               OrderingStats& stats) const {
    auto log = logging::get_logger();
    std::vector<Partition> partitions;
    if (graph.empty()) {
        return partitions;
    }

    const auto components = graph.connected_components();
    std::vector<Coord> merged;

    for (size_t idx = 0; idx < components.size(); ++idx) {
        std::string key = component_key(graph.color(), idx);
        auto component_order = order_component(graph, components[idx], key, stats);

        if (config_.grouping == Grouping::PerComponent) {
            size_t jumps = count_jump_stitches(component_order);
            stats.jump_stitches += jumps;
            stats.pixels += component_order.size();
            partitions.emplace_back(rebuild_shapes(graph.color(), component_order, stats), key,
                                    graph.color());
            log->debug("Partition {}: {} pixels, {} jump stitches", key, component_order.size(),
                       jumps);
        } else {
            merged.insert(merged.end(), component_order.begin(), component_order.end());
        }
    }

    if (config_.grouping == Grouping::PerColor) {
        size_t jumps = count_jump_stitches(merged);
        stats.jump_stitches += jumps;
        stats.pixels += merged.size();
        std::string name = to_hex(graph.color());
        log->debug("Partition {}: {} pixels in {} components, {} jump stitches", name,
                   merged.size(), components.size(), jumps);
        partitions.emplace_back(rebuild_shapes(graph.color(), merged, stats), name,
                                graph.color());
    }

    stats.partitions += partitions.size();
    return partitions;
}

std::vector<Partition> PartitionOrderer::order_all(const std::vector<AdjacencyGraph>& graphs,
                                                   OrderingStats& stats) const {
    auto log = logging::get_logger();

    std::vector<std::vector<Partition>> per_graph(graphs.size());
    std::vector<OrderingStats> per_stats(graphs.size());
    std::vector<std::exception_ptr> errors(graphs.size());

    // Each color writes only its own slot
    #pragma omp parallel for schedule(dynamic) if(graphs.size() > 1)
    for (size_t i = 0; i < graphs.size(); ++i) {
        try {
            per_graph[i] = order(graphs[i], per_stats[i]);
        } catch (...) {
            errors[i] = std::current_exception();
        }
    }

    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }

    std::vector<Partition> partitions;
    for (size_t i = 0; i < graphs.size(); ++i) {
        stats.merge(per_stats[i]);
        for (auto& partition : per_graph[i]) {
            partitions.push_back(std::move(partition));
        }
    }

    log->info("Ordered {} pixels into {} partitions ({} jump stitches, {} connectors)",
              stats.pixels, stats.partitions, stats.jump_stitches, stats.connectors);
    return partitions;
}

}  // namespace pixstitch

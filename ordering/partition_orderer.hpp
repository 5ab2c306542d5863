#ifndef PIXSTITCH_ORDERING_PARTITION_ORDERER_HPP
#define PIXSTITCH_ORDERING_PARTITION_ORDERER_HPP

#include "self_avoiding_walk.hpp"
#include <graph/adjacency_graph.hpp>
#include <path_finder/grid_path_finder.hpp>
#include <shape/partition.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace pixstitch {

enum class Grouping {
    PerColor,      // one partition per color, all components merged
    PerComponent   // one partition per connected component
};

struct OrderingConfig {
    Grouping grouping = Grouping::PerColor;
    // SAW is tried for components with 1 < size < saw_threshold, 0 disables it
    size_t saw_threshold = 40;
    uint64_t saw_step_limit = 2'000'000;
    NeighborOrder neighbor_order = NeighborOrder::Descending;
    // Route connectors with Dijkstra over color-distance weights
    bool connector_weights = false;
    // Starting pixel per component, keyed "#rrggbb_<idx>"
    std::map<std::string, Coord> start_nodes;
};

struct OrderingStats {
    size_t partitions = 0;
    size_t pixels = 0;
    size_t jump_stitches = 0;
    size_t saw_successes = 0;
    size_t saw_fallbacks = 0;
    size_t longest_saw_partial = 0;
    size_t connectors = 0;
    size_t straight_connectors = 0;

    void merge(const OrderingStats& other);
};

// Turns per-color adjacency graphs into ordered Partitions
class PartitionOrderer {
public:
    PartitionOrderer(const GridPathFinder& router, OrderingConfig config = OrderingConfig{});

    const OrderingConfig& config() const { return config_; }

    // Partitions for one color, per the grouping mode
    std::vector<Partition> order(const AdjacencyGraph& graph, OrderingStats& stats) const;

    // Every color, in graph order. Colors are ordered in parallel when
    // OpenMP is available; the result does not depend on it.
    std::vector<Partition> order_all(const std::vector<AdjacencyGraph>& graphs,
                                     OrderingStats& stats) const;

    // Visiting order of one component
    std::vector<Coord> order_component(const AdjacencyGraph& graph,
                                       const std::vector<Coord>& component,
                                       const std::string& key, OrderingStats& stats) const;

    Coord starting_node(const AdjacencyGraph& component_graph, const std::string& key) const;

    // Rects for every pixel in order, bridged by Paths between pixels that
    // are not 8-connected
    std::vector<Shape> rebuild_shapes(ColorKey color, const std::vector<Coord>& order,
                                      OrderingStats& stats) const;
    std::vector<Shape> rebuild_shapes(ColorKey color, const std::vector<Coord>& order) const;

    // Right-angle connector between two pixels' top-left corners
    static Path straight_connector(const Coord& from, const Coord& to);

    static std::string component_key(ColorKey color, size_t index);

private:
    Path connector(ColorKey color, const Coord& from, const Coord& to,
                   OrderingStats& stats) const;

    const GridPathFinder& router_;
    OrderingConfig config_;
};

}  // namespace pixstitch

#endif // PIXSTITCH_ORDERING_PARTITION_ORDERER_HPP

#ifndef PIXSTITCH_CLI_PIPELINE_HPP
#define PIXSTITCH_CLI_PIPELINE_HPP

#include "cli_common.hpp"
#include <nlohmann/json.hpp>
#include <embroidery/layer.hpp>
#include <embroidery/svg_encoder.hpp>
#include <graph/adjacency_graph.hpp>
#include <ordering/partition_orderer.hpp>
#include <path_finder/grid_path_finder.hpp>
#include <raster/raster_grid.hpp>
#include <walker/directional_walker.hpp>
#include <string>
#include <vector>

namespace pixstitch::cli {

// All knobs of one image-to-SVG run
struct PipelineConfig {
    ExportConfig export_config;
    LayerProperties layer;
    EmbroideryParameters embroidery;
    OrderingConfig ordering;
    AdjacencyConfig adjacency;
    PathFinderConfig path_finder;
};

// Missing sections keep their defaults. The export fill mode presets the
// embroidery fill method and stitch length before "embroidery" is applied.
PipelineConfig pipeline_config_from_json(const nlohmann::json& j);
nlohmann::json pipeline_config_to_json(const PipelineConfig& config);
PipelineConfig load_pipeline_config(const std::string& path);

// Re-order one partition with the directional walker
struct WalkRequest {
    std::string partition;
    Coord start;
    WalkMode mode = WalkMode::SpiralCw;
};

// "<partition>:<x>,<y>[:<mode>]", throws std::invalid_argument
WalkRequest parse_walk_request(const std::string& text);

// Replaces the partition's order with a walk from request.start and
// re-emits its shapes. Throws std::invalid_argument for unknown partitions.
void apply_walk(Layer& layer, const PartitionOrderer& orderer, const WalkRequest& request);

struct PipelineResult {
    Layer layer;
    OrderingStats stats;
};

// Raster -> adjacency graphs -> ordered partitions -> layer
PipelineResult build_layer(const RasterGrid& raster, const PipelineConfig& config,
                           const std::vector<WalkRequest>& walks = {});

// The command line entry point, returns the process exit code
int run_export(const CommandContext& ctx);

void print_usage(const char* program_name);

}  // namespace pixstitch::cli

#endif // PIXSTITCH_CLI_PIPELINE_HPP

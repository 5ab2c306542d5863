#include "pipeline.hpp"
#include "logging.hpp"
#include <serialization/config_json.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/partition_json.hpp>
#include <iostream>
#include <stdexcept>

namespace pixstitch::cli {

PipelineConfig pipeline_config_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Configuration must be a JSON object");
    }

    PipelineConfig config;
    if (j.contains("export")) {
        from_json(j["export"], config.export_config);
    }
    config.embroidery.apply_fill_mode(config.export_config.fill_mode);
    if (j.contains("embroidery")) {
        from_json(j["embroidery"], config.embroidery);
    }
    if (j.contains("layer")) {
        from_json(j["layer"], config.layer);
    }
    if (j.contains("ordering")) {
        from_json(j["ordering"], config.ordering);
    }
    if (j.contains("adjacency")) {
        from_json(j["adjacency"], config.adjacency);
    }
    if (j.contains("path_finder")) {
        from_json(j["path_finder"], config.path_finder);
    }
    return config;
}

nlohmann::json pipeline_config_to_json(const PipelineConfig& config) {
    return {
        {"export", config.export_config},
        {"layer", config.layer},
        {"embroidery", config.embroidery},
        {"ordering", config.ordering},
        {"adjacency", config.adjacency},
        {"path_finder", config.path_finder}
    };
}

PipelineConfig load_pipeline_config(const std::string& path) {
    return pipeline_config_from_json(json::read_json_file(path));
}

WalkRequest parse_walk_request(const std::string& text) {
    size_t first = text.find(':');
    if (first == std::string::npos || first == 0) {
        throw std::invalid_argument("Walk must be <partition>:<x>,<y>[:<mode>], got: " + text);
    }

    WalkRequest request;
    request.partition = text.substr(0, first);

    std::string rest = text.substr(first + 1);
    size_t second = rest.find(':');
    std::string coord = rest.substr(0, second);
    if (second != std::string::npos) {
        request.mode = walk_mode_from_string(rest.substr(second + 1));
    }

    size_t comma = coord.find(',');
    if (comma == std::string::npos) {
        throw std::invalid_argument("Walk start must be <x>,<y>, got: " + coord);
    }
    try {
        size_t used_x = 0;
        size_t used_y = 0;
        request.start.x = std::stoi(coord.substr(0, comma), &used_x);
        request.start.y = std::stoi(coord.substr(comma + 1), &used_y);
        if (used_x != comma || used_y != coord.size() - comma - 1) {
            throw std::invalid_argument("trailing characters");
        }
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Walk start must be <x>,<y>, got: " + coord);
    }
    return request;
}

void apply_walk(Layer& layer, const PartitionOrderer& orderer, const WalkRequest& request) {
    auto log = logging::get_logger();

    Partition* partition = layer.find_partition(request.partition);
    if (!partition) {
        throw std::invalid_argument("No partition named " + request.partition);
    }

    auto order = DirectionalWalker::walk(partition->pixels(), request.start, request.mode);
    OrderingStats stats;
    partition->set_shapes(orderer.rebuild_shapes(partition->color(), order, stats));

    log->info("Re-walked partition {} from ({}, {}) in {} mode: {} jump stitches",
              request.partition, request.start.x, request.start.y, to_string(request.mode),
              count_jump_stitches(order));
}

PipelineResult build_layer(const RasterGrid& raster, const PipelineConfig& config,
                           const std::vector<WalkRequest>& walks) {
    auto log = logging::get_logger();

    log->debug("Stage 1: Building adjacency graphs");
    auto graphs = AdjacencyGraphBuilder::build(raster, config.adjacency);

    log->debug("Stage 2: Ordering partitions");
    GridPathFinder router(raster, config.path_finder);
    PartitionOrderer orderer(router, config.ordering);

    PipelineResult result{Layer::from_raster(raster, config.layer, config.embroidery), {}};
    result.layer.set_partitions(orderer.order_all(graphs, result.stats));
    log->debug("Built {} vertex graphs for connectors", router.cached_graph_count());

    for (const auto& walk : walks) {
        apply_walk(result.layer, orderer, walk);
    }
    if (!walks.empty()) {
        result.stats.jump_stitches = 0;
        for (const auto& partition : result.layer.partitions()) {
            result.stats.jump_stitches += partition.jump_stitches();
        }
    }

    return result;
}

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [options] <input.png>\n";
    std::cerr << "\n";
    std::cerr << "Converts pixel art into an Ink/Stitch annotated SVG.\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -o, --output <file>        Output SVG (default: input with .svg)\n";
    std::cerr << "  -c, --config <file>        JSON configuration\n";
    std::cerr << "  --fit                      Scale and center the image in the hoop\n";
    std::cerr << "  --align <mode>             left|center|right|top|middle|bottom\n";
    std::cerr << "  --walk <part>:<x>,<y>[:m]  Re-order a partition from a pixel,\n";
    std::cerr << "                             m = spiral_cw|spiral_ccw|snake_cw|snake_ccw\n";
    std::cerr << "  --partitions-json <file>   Also write the ordered partitions\n";
    std::cerr << "  -v, --verbose              Debug logging\n";
    std::cerr << "  -h, --help                 Show this help message\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  PIXSTITCH_LOG_LEVEL - Set log level (trace, debug, info, warn, error)\n";
}

int run_export(const CommandContext& ctx) {
    auto log = logging::get_logger();

    try {
        if (ctx.input_path.empty()) {
            throw std::invalid_argument("No input image given");
        }
        std::string output_path = resolve_output_path(ctx.input_path, ".svg", ctx.output_path);

        PipelineConfig config;
        if (ctx.config_path) {
            log->info("Loading configuration from {}", *ctx.config_path);
            config = load_pipeline_config(*ctx.config_path);
        } else {
            config.embroidery.apply_fill_mode(config.export_config.fill_mode);
        }

        std::vector<WalkRequest> walks;
        for (const auto& text : ctx.walks) {
            walks.push_back(parse_walk_request(text));
        }

        log->info("Input image: {}", ctx.input_path);
        RasterGrid raster = RasterGrid::load_png(ctx.input_path);
        log->info("Image {}x{}, {} solid pixels, {} colors", raster.width(), raster.height(),
                  raster.solid_count(), raster.colors().size());

        PipelineResult result = build_layer(raster, config, walks);

        if (ctx.fit) {
            result.layer.fit_to_hoop(config.export_config.hoop_size);
        }
        if (ctx.align) {
            result.layer.align(layer_align_from_string(*ctx.align), config.export_config.hoop_size);
        }

        std::vector<Layer> layers;
        layers.push_back(std::move(result.layer));

        SvgEncoder encoder(config.export_config);
        encoder.write_file(output_path, layers);

        if (ctx.partitions_json_path) {
            json::SerializedData data;
            data.step = "partitions";
            data.timestamp = json::get_timestamp();
            data.source_file = ctx.input_path;
            data.config = pipeline_config_to_json(config);
            data.stats = result.stats;
            data.data = partitions_to_json(layers.front().partitions());
            json::write_serialized(*ctx.partitions_json_path, data);
            log->info("Wrote partitions to {}", *ctx.partitions_json_path);
        }

        std::cerr << "Wrote " << output_path << " (" << result.stats.partitions
                  << " partitions, " << result.stats.pixels << " pixels, "
                  << result.stats.jump_stitches << " jump stitches)\n";
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace pixstitch::cli

#include <gtest/gtest.h>
#include "pipeline.hpp"
#include "test_helpers.hpp"
#include <string>
#include <vector>

using namespace pixstitch;
using namespace pixstitch::cli;
using namespace pixstitch::test;

namespace {

CommandContext parse(std::vector<std::string> args) {
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

TEST(Pipeline, BuildLayerFromRaster) {
    auto raster = raster_from_ascii({
        "RBR",
        "BBB",
        "BBB",
    });
    PipelineConfig config;
    config.layer.name = "art";
    PipelineResult result = build_layer(raster, config);

    EXPECT_EQ(result.layer.name(), "art");
    EXPECT_EQ(result.layer.image_width(), 3);
    ASSERT_EQ(result.layer.partitions().size(), 2u);
    EXPECT_NE(result.layer.find_partition("#ff0000"), nullptr);
    EXPECT_NE(result.layer.find_partition("#0000ff"), nullptr);
    EXPECT_EQ(result.stats.pixels, 9u);
    EXPECT_EQ(result.stats.jump_stitches, 1u);
}

TEST(Pipeline, BuildLayerWithWalk) {
    auto raster = raster_from_ascii({
        "RRR",
        "RRR",
        "RRR",
    });
    PipelineConfig config;
    PipelineResult result =
        build_layer(raster, config, {parse_walk_request("#ff0000:0,0:spiral_cw")});

    ASSERT_EQ(result.layer.partitions().size(), 1u);
    std::vector<Coord> expected = {
        {0, 0}, {0, 1}, {1, 1}, {1, 0}, {2, 0}, {2, 1}, {2, 2}, {1, 2}, {0, 2}
    };
    EXPECT_EQ(result.layer.partitions()[0].pixels(), expected);
    EXPECT_EQ(result.stats.jump_stitches, 0u);

    EXPECT_THROW(build_layer(raster, config, {parse_walk_request("#00ff00:0,0")}),
                 std::invalid_argument);
}

TEST(Pipeline, PerComponentGrouping) {
    auto raster = raster_from_ascii({"R.R"});
    PipelineConfig config;
    config.ordering.grouping = Grouping::PerComponent;
    PipelineResult result = build_layer(raster, config);
    ASSERT_EQ(result.layer.partitions().size(), 2u);
    EXPECT_EQ(result.layer.partitions()[1].name(), "#ff0000_1");
}

TEST(Pipeline, ParseWalkRequest) {
    WalkRequest plain = parse_walk_request("#ff0000:3,4");
    EXPECT_EQ(plain.partition, "#ff0000");
    EXPECT_EQ(plain.start, (Coord{3, 4}));
    EXPECT_EQ(plain.mode, WalkMode::SpiralCw);

    WalkRequest snake = parse_walk_request("#ff0000_2:0,11:snake_ccw");
    EXPECT_EQ(snake.partition, "#ff0000_2");
    EXPECT_EQ(snake.start, (Coord{0, 11}));
    EXPECT_EQ(snake.mode, WalkMode::SnakeCcw);

    for (const char* bad : {"nocoord", ":1,2", "a:1", "a:1,x", "a:1,2x", "a:1,2:bogus"}) {
        EXPECT_THROW(parse_walk_request(bad), std::invalid_argument) << bad;
    }
}

TEST(Pipeline, ConfigFromJson) {
    auto j = nlohmann::json::parse(R"({
        "export": {"hoop_size": [5, 7], "fill_mode": "auto"},
        "embroidery": {"pull_compensation_mm": 0.2},
        "ordering": {"grouping": "component"},
        "adjacency": {"direction_rotation": -1}
    })");
    PipelineConfig config = pipeline_config_from_json(j);

    EXPECT_DOUBLE_EQ(config.export_config.hoop_size.y, 7.0);
    EXPECT_EQ(config.export_config.fill_mode, FillMode::Auto);
    EXPECT_EQ(config.embroidery.fill_method, "auto_fill");
    EXPECT_DOUBLE_EQ(config.embroidery.max_stitch_length_mm, 3.0);
    EXPECT_DOUBLE_EQ(config.embroidery.pull_compensation_mm, 0.2);
    EXPECT_EQ(config.ordering.grouping, Grouping::PerComponent);
    EXPECT_EQ(config.adjacency.direction_rotation, -1);

    // Explicit embroidery keys win over the fill mode preset
    auto override_json = nlohmann::json::parse(R"({
        "export": {"fill_mode": "auto"},
        "embroidery": {"max_stitch_length_mm": 4.5}
    })");
    EXPECT_DOUBLE_EQ(pipeline_config_from_json(override_json).embroidery.max_stitch_length_mm, 4.5);

    EXPECT_THROW(pipeline_config_from_json(nlohmann::json::array()), std::invalid_argument);
}

TEST(Pipeline, ConfigToJsonReadsBack) {
    PipelineConfig config;
    config.layer.pixel_size = {3.0, 3.0};
    config.ordering.saw_threshold = 8;
    config.path_finder.edge_filter = EdgeFilter::SameColor;

    PipelineConfig restored = pipeline_config_from_json(pipeline_config_to_json(config));
    EXPECT_DOUBLE_EQ(restored.layer.pixel_size.x, 3.0);
    EXPECT_EQ(restored.ordering.saw_threshold, 8u);
    EXPECT_EQ(restored.path_finder.edge_filter, EdgeFilter::SameColor);
    EXPECT_EQ(restored.embroidery.fill_method, config.embroidery.fill_method);
}

TEST(Pipeline, LoadMissingConfigThrows) {
    EXPECT_THROW(load_pipeline_config("/nonexistent/pixstitch/config.json"), std::runtime_error);
}

TEST(CommandLine, ParseArgs) {
    CommandContext ctx = parse({"pixstitch", "-o", "out.svg", "--walk", "#ff0000:1,2", "--fit",
                                "--align", "center", "-c", "cfg.json", "art.png"});
    EXPECT_EQ(ctx.input_path, "art.png");
    EXPECT_EQ(ctx.output_path, "out.svg");
    ASSERT_TRUE(ctx.config_path.has_value());
    EXPECT_EQ(*ctx.config_path, "cfg.json");
    ASSERT_TRUE(ctx.align.has_value());
    EXPECT_EQ(*ctx.align, "center");
    ASSERT_EQ(ctx.walks.size(), 1u);
    EXPECT_EQ(ctx.walks[0], "#ff0000:1,2");
    EXPECT_TRUE(ctx.fit);
    EXPECT_FALSE(ctx.verbose);
    EXPECT_FALSE(ctx.partitions_json_path.has_value());
}

TEST(CommandLine, ParseArgsErrors) {
    EXPECT_THROW(parse({"pixstitch", "--bogus"}), std::runtime_error);
    EXPECT_THROW(parse({"pixstitch", "art.png", "-o"}), std::runtime_error);
    EXPECT_THROW(parse({"pixstitch", "a.png", "b.png"}), std::runtime_error);
    EXPECT_TRUE(parse({"pixstitch", "-h"}).help);
}

TEST(CommandLine, ResolveOutputPath) {
    EXPECT_EQ(resolve_output_path("images/cat.png", ".svg", ""), "images/cat.svg");
    EXPECT_EQ(resolve_output_path("dir.v2/cat", ".svg", ""), "dir.v2/cat.svg");
    EXPECT_EQ(resolve_output_path("cat.png", ".svg", "other.svg"), "other.svg");
}

TEST(CommandLine, RunExportReportsFailures) {
    CommandContext missing_input;
    EXPECT_EQ(run_export(missing_input), 1);

    CommandContext missing_file;
    missing_file.input_path = "/nonexistent/pixstitch/art.png";
    EXPECT_EQ(run_export(missing_file), 1);

    CommandContext bad_walk;
    bad_walk.input_path = "/nonexistent/pixstitch/art.png";
    bad_walk.walks = {"no-coordinates"};
    EXPECT_EQ(run_export(bad_walk), 1);
}

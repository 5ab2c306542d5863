#include <gtest/gtest.h>
#include "config_json.hpp"
#include "json_serialization.hpp"
#include "partition_json.hpp"
#include "test_helpers.hpp"
#include <filesystem>

using namespace pixstitch;
using namespace pixstitch::test;

TEST(PartitionJson, MixedShapes) {
    Partition partition({Rect{0, 0, {}}, Path{{Point(1, 0), Point(2, 0)}}, Rect{2, 0, 45}},
                        "#ff0000", RED);
    nlohmann::json j = partition_to_json(partition);

    EXPECT_EQ(j["name"], "#ff0000");
    EXPECT_EQ(j["color"], "#ff0000");
    EXPECT_EQ(j["size"], 2);
    ASSERT_EQ(j["path"].size(), 3u);
    EXPECT_EQ(j["path"][0]["type"], "rect");
    EXPECT_FALSE(j["path"][0].contains("angle"));
    EXPECT_EQ(j["path"][1]["type"], "path");
    EXPECT_EQ(j["path"][1]["points"], nlohmann::json::parse("[[1, 0], [2, 0]]"));
    EXPECT_EQ(j["path"][2]["angle"], 45);

    Partition restored = partition_from_json(j);
    EXPECT_EQ(restored.name(), partition.name());
    EXPECT_EQ(restored.color(), RED);
    EXPECT_EQ(restored.shapes(), partition.shapes());
}

TEST(PartitionJson, BarePairsAreRects) {
    auto j = nlohmann::json::parse(R"({"color": "#00ff00", "path": [[3, 4], [4, 4]]})");
    Partition partition = partition_from_json(j);
    EXPECT_EQ(partition.name(), "#00ff00");
    std::vector<Coord> expected = {{3, 4}, {4, 4}};
    EXPECT_EQ(partition.pixels(), expected);
}

TEST(PartitionJson, UnknownShapeTypeThrows) {
    auto j = nlohmann::json::parse(R"({"type": "circle", "x": 1, "y": 1})");
    EXPECT_THROW(shape_from_json(j), EncodingError);

    auto missing_color = nlohmann::json::parse(R"({"path": []})");
    EXPECT_THROW(partition_from_json(missing_color), nlohmann::json::exception);
}

TEST(PartitionJson, PartitionList) {
    std::vector<Partition> partitions = {
        Partition({Rect{0, 0, {}}}, "#ff0000", RED),
        Partition({Rect{1, 0, {}}}, "#0000ff_1", BLUE),
    };
    auto j = partitions_to_json(partitions);
    ASSERT_TRUE(j.is_array());
    auto restored = partitions_from_json(j);
    ASSERT_EQ(restored.size(), 2u);
    EXPECT_EQ(restored[1].name(), "#0000ff_1");
    EXPECT_EQ(restored[1].color(), BLUE);
}

TEST(ConfigJson, EmbroideryParametersKeepMissingKeys) {
    EmbroideryParameters params;
    params.pull_compensation_mm = 0.3;
    from_json(nlohmann::json::parse(R"({"fill_underlay": false, "lock_end": "none"})"), params);
    EXPECT_FALSE(params.fill_underlay);
    EXPECT_EQ(params.lock_end, "none");
    EXPECT_DOUBLE_EQ(params.pull_compensation_mm, 0.3);
    EXPECT_EQ(params.fill_method, "contour_fill");

    nlohmann::json j = params;
    EXPECT_EQ(j["lock_start"], "half_stitch");
    EXPECT_EQ(j["even_pixel_angle_degrees"], 90);
}

TEST(ConfigJson, OrderingConfig) {
    auto j = nlohmann::json::parse(R"({
        "grouping": "component",
        "saw_threshold": 12,
        "neighbor_order": "adjacency",
        "start_nodes": {"#ff0000_0": [1, 2]}
    })");
    OrderingConfig config = j.get<OrderingConfig>();
    EXPECT_EQ(config.grouping, Grouping::PerComponent);
    EXPECT_EQ(config.saw_threshold, 12u);
    EXPECT_EQ(config.saw_step_limit, 2'000'000u);
    EXPECT_EQ(config.neighbor_order, NeighborOrder::Adjacency);
    ASSERT_EQ(config.start_nodes.count("#ff0000_0"), 1u);
    EXPECT_EQ(config.start_nodes["#ff0000_0"], (Coord{1, 2}));

    nlohmann::json out = config;
    EXPECT_EQ(out["grouping"], "component");
    EXPECT_EQ(out["start_nodes"]["#ff0000_0"], nlohmann::json::parse("[1, 2]"));
}

TEST(ConfigJson, InvalidValuesThrow) {
    OrderingConfig ordering;
    EXPECT_THROW(from_json(nlohmann::json::parse(R"({"start_nodes": {"a": [1]}})"), ordering),
                 std::invalid_argument);

    AdjacencyConfig adjacency;
    EXPECT_THROW(from_json(nlohmann::json::parse(R"({"direction_rotation": 9})"), adjacency),
                 std::invalid_argument);

    ExportConfig export_config;
    EXPECT_THROW(from_json(nlohmann::json::parse(R"({"fill_mode": "tatami"})"), export_config),
                 std::invalid_argument);

    LayerProperties layer;
    EXPECT_THROW(from_json(nlohmann::json::parse(R"({"pixel_size": 2.5})"), layer),
                 std::invalid_argument);
}

TEST(ConfigJson, LayerAndPathFinder) {
    LayerProperties layer;
    from_json(nlohmann::json::parse(R"({"name": "front", "pixel_size": [2.0, 3.0], "rotation": 90})"),
              layer);
    EXPECT_EQ(layer.name, "front");
    EXPECT_DOUBLE_EQ(layer.pixel_size.y, 3.0);
    EXPECT_EQ(layer.rotation, 90);
    EXPECT_DOUBLE_EQ(layer.scale.x, 1.0);

    PathFinderConfig finder;
    from_json(nlohmann::json::parse(R"({"edge_filter": "same_color", "weight_rounding": "exact"})"),
              finder);
    EXPECT_EQ(finder.edge_filter, EdgeFilter::SameColor);
    EXPECT_EQ(finder.weight_rounding, WeightRounding::Exact);
    EXPECT_DOUBLE_EQ(finder.weight_factor, 0.1);
}

TEST(SerializedData, Envelope) {
    json::SerializedData data;
    data.step = "partitions";
    data.source_file = "cat.png";
    data.stats = OrderingStats{};
    data.data = nlohmann::json::array();

    nlohmann::json j = data.to_json();
    EXPECT_EQ(j["version"], json::SERIALIZATION_VERSION);
    EXPECT_EQ(j["step"], "partitions");
    EXPECT_FALSE(j.contains("timestamp"));
    EXPECT_FALSE(j.contains("config"));
    EXPECT_EQ(j["stats"]["jump_stitches"], 0);

    auto restored = json::SerializedData::from_json(j);
    EXPECT_EQ(restored.source_file, "cat.png");
    EXPECT_TRUE(restored.data.is_array());

    EXPECT_THROW(json::SerializedData::from_json(nlohmann::json::object()), std::runtime_error);
}

TEST(SerializedData, FileRoundTrip) {
    auto path = std::filesystem::temp_directory_path() / "pixstitch_serialized_test.json";

    json::SerializedData data;
    data.step = "partitions";
    data.timestamp = json::get_timestamp();
    data.data = partitions_to_json({Partition({Rect{5, 6, {}}}, "#ff0000", RED)});
    json::write_serialized(path.string(), data);

    auto restored = json::read_serialized(path.string());
    EXPECT_EQ(restored.step, "partitions");
    EXPECT_EQ(restored.timestamp, data.timestamp);
    auto partitions = partitions_from_json(restored.data);
    ASSERT_EQ(partitions.size(), 1u);
    EXPECT_EQ(partitions[0].pixels().front(), (Coord{5, 6}));

    std::filesystem::remove(path);
    EXPECT_THROW(json::read_serialized(path.string()), std::runtime_error);
}

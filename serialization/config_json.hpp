#ifndef PIXSTITCH_SERIALIZATION_CONFIG_JSON_HPP
#define PIXSTITCH_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <embroidery/embroidery_params.hpp>
#include <embroidery/layer.hpp>
#include <embroidery/svg_encoder.hpp>
#include <graph/adjacency_graph.hpp>
#include <math/vec2.hpp>
#include <ordering/partition_orderer.hpp>
#include <path_finder/vertex_grid_graph.hpp>

// Every from_json below starts from the object's current values, so keys
// missing from the JSON keep whatever the caller set before.

namespace pixstitch {

NLOHMANN_JSON_SERIALIZE_ENUM(Grouping, {
    {Grouping::PerColor, "color"},
    {Grouping::PerComponent, "component"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(NeighborOrder, {
    {NeighborOrder::Descending, "descending"},
    {NeighborOrder::Adjacency, "adjacency"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(EdgeFilter, {
    {EdgeFilter::AnySolid, "any_solid"},
    {EdgeFilter::SameColor, "same_color"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(WeightRounding, {
    {WeightRounding::Truncate, "truncate"},
    {WeightRounding::Exact, "exact"},
})

// Vec2 serialization
inline void to_json(nlohmann::json& j, const Vec2& v) {
    j = nlohmann::json::array({v.x, v.y});
}

inline void from_json(const nlohmann::json& j, Vec2& v) {
    if (!j.is_array() || j.size() != 2) {
        throw std::invalid_argument("Expected a [x, y] pair, got: " + j.dump());
    }
    v.x = j[0].get<double>();
    v.y = j[1].get<double>();
}

// Coord serialization
inline void to_json(nlohmann::json& j, const Coord& c) {
    j = nlohmann::json::array({c.x, c.y});
}

inline void from_json(const nlohmann::json& j, Coord& c) {
    if (!j.is_array() || j.size() != 2) {
        throw std::invalid_argument("Expected a [x, y] coordinate, got: " + j.dump());
    }
    c.x = j[0].get<int>();
    c.y = j[1].get<int>();
}

// EmbroideryParameters serialization
inline void to_json(nlohmann::json& j, const EmbroideryParameters& p) {
    j = {
        {"fill_method", p.fill_method},
        {"max_stitch_length_mm", p.max_stitch_length_mm},
        {"pull_compensation_mm", p.pull_compensation_mm},
        {"even_pixel_angle_degrees", p.even_pixel_angle_degrees},
        {"odd_pixel_angle_degrees", p.odd_pixel_angle_degrees},
        {"fill_underlay", p.fill_underlay},
        {"min_jump_stitch_length_mm", p.min_jump_stitch_length_mm},
        {"running_stitch_length_mm", p.running_stitch_length_mm},
        {"running_stitch_tolerance_mm", p.running_stitch_tolerance_mm},
        {"lock_start", p.lock_start},
        {"lock_end", p.lock_end}
    };
}

inline void from_json(const nlohmann::json& j, EmbroideryParameters& p) {
    p.fill_method = j.value("fill_method", p.fill_method);
    p.max_stitch_length_mm = j.value("max_stitch_length_mm", p.max_stitch_length_mm);
    p.pull_compensation_mm = j.value("pull_compensation_mm", p.pull_compensation_mm);
    p.even_pixel_angle_degrees = j.value("even_pixel_angle_degrees", p.even_pixel_angle_degrees);
    p.odd_pixel_angle_degrees = j.value("odd_pixel_angle_degrees", p.odd_pixel_angle_degrees);
    p.fill_underlay = j.value("fill_underlay", p.fill_underlay);
    p.min_jump_stitch_length_mm = j.value("min_jump_stitch_length_mm", p.min_jump_stitch_length_mm);
    p.running_stitch_length_mm = j.value("running_stitch_length_mm", p.running_stitch_length_mm);
    p.running_stitch_tolerance_mm =
        j.value("running_stitch_tolerance_mm", p.running_stitch_tolerance_mm);
    p.lock_start = j.value("lock_start", p.lock_start);
    p.lock_end = j.value("lock_end", p.lock_end);
}

// LayerProperties serialization
inline void to_json(nlohmann::json& j, const LayerProperties& props) {
    j = {
        {"name", props.name},
        {"position", props.position},
        {"rotation", props.rotation},
        {"pixel_size", props.pixel_size},
        {"scale", props.scale}
    };
}

inline void from_json(const nlohmann::json& j, LayerProperties& props) {
    props.name = j.value("name", props.name);
    if (j.contains("position")) {
        props.position = j["position"].get<Vec2>();
    }
    props.rotation = j.value("rotation", props.rotation);
    if (j.contains("pixel_size")) {
        props.pixel_size = j["pixel_size"].get<Vec2>();
    }
    if (j.contains("scale")) {
        props.scale = j["scale"].get<Vec2>();
    }
}

// ExportConfig serialization
inline void to_json(nlohmann::json& j, const ExportConfig& config) {
    j = {
        {"hoop_size", config.hoop_size},
        {"fill_mode", to_string(config.fill_mode)}
    };
}

inline void from_json(const nlohmann::json& j, ExportConfig& config) {
    if (j.contains("hoop_size")) {
        config.hoop_size = j["hoop_size"].get<Vec2>();
    }
    if (j.contains("fill_mode")) {
        config.fill_mode = fill_mode_from_string(j["fill_mode"].get<std::string>());
    }
}

// OrderingConfig serialization
inline void to_json(nlohmann::json& j, const OrderingConfig& config) {
    nlohmann::json start_nodes = nlohmann::json::object();
    for (const auto& [key, coord] : config.start_nodes) {
        start_nodes[key] = coord;
    }
    j = {
        {"grouping", config.grouping},
        {"saw_threshold", config.saw_threshold},
        {"saw_step_limit", config.saw_step_limit},
        {"neighbor_order", config.neighbor_order},
        {"connector_weights", config.connector_weights},
        {"start_nodes", start_nodes}
    };
}

inline void from_json(const nlohmann::json& j, OrderingConfig& config) {
    if (j.contains("grouping")) {
        config.grouping = j["grouping"].get<Grouping>();
    }
    config.saw_threshold = j.value("saw_threshold", config.saw_threshold);
    config.saw_step_limit = j.value("saw_step_limit", config.saw_step_limit);
    if (j.contains("neighbor_order")) {
        config.neighbor_order = j["neighbor_order"].get<NeighborOrder>();
    }
    config.connector_weights = j.value("connector_weights", config.connector_weights);
    if (j.contains("start_nodes")) {
        config.start_nodes.clear();
        for (const auto& [key, value] : j["start_nodes"].items()) {
            config.start_nodes[key] = value.get<Coord>();
        }
    }
}

// AdjacencyConfig serialization
inline void to_json(nlohmann::json& j, const AdjacencyConfig& config) {
    j = {
        {"direction_rotation", config.direction_rotation}
    };
}

inline void from_json(const nlohmann::json& j, AdjacencyConfig& config) {
    config.direction_rotation = j.value("direction_rotation", config.direction_rotation);
    if (config.direction_rotation < -8 || config.direction_rotation > 7) {
        throw std::invalid_argument("direction_rotation must be in [-8, 7], got " +
                                    std::to_string(config.direction_rotation));
    }
}

// PathFinderConfig serialization
inline void to_json(nlohmann::json& j, const PathFinderConfig& config) {
    j = {
        {"edge_filter", config.edge_filter},
        {"weight_rounding", config.weight_rounding},
        {"weight_factor", config.weight_factor}
    };
}

inline void from_json(const nlohmann::json& j, PathFinderConfig& config) {
    if (j.contains("edge_filter")) {
        config.edge_filter = j["edge_filter"].get<EdgeFilter>();
    }
    if (j.contains("weight_rounding")) {
        config.weight_rounding = j["weight_rounding"].get<WeightRounding>();
    }
    config.weight_factor = j.value("weight_factor", config.weight_factor);
}

}  // namespace pixstitch

#endif // PIXSTITCH_SERIALIZATION_CONFIG_JSON_HPP

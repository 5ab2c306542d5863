#ifndef PIXSTITCH_SERIALIZATION_PARTITION_JSON_HPP
#define PIXSTITCH_SERIALIZATION_PARTITION_JSON_HPP

#include <nlohmann/json.hpp>
#include <common/logging.hpp>
#include <math/color.hpp>
#include <ordering/partition_orderer.hpp>
#include <shape/partition.hpp>
#include <shape/shape.hpp>
#include <string>
#include <vector>

namespace pixstitch {

// Shape serialization
inline nlohmann::json shape_to_json(const Shape& shape) {
    if (const auto* rect = std::get_if<Rect>(&shape)) {
        nlohmann::json j = {{"type", "rect"}, {"x", rect->x}, {"y", rect->y}};
        if (rect->angle) {
            j["angle"] = *rect->angle;
        }
        return j;
    }
    if (const auto* path = std::get_if<Path>(&shape)) {
        nlohmann::json points = nlohmann::json::array();
        for (const Point& p : path->points) {
            points.push_back({p.x, p.y});
        }
        return {{"type", "path"}, {"points", points}};
    }
    throw EncodingError("Cannot serialize a shape that holds no value");
}

// A bare [x, y] pair is read as a Rect
inline Shape shape_from_json(const nlohmann::json& j) {
    if (j.is_array()) {
        return Rect{j.at(0).get<int>(), j.at(1).get<int>(), std::nullopt};
    }

    std::string type = j.value("type", "");
    if (type == "rect") {
        Rect rect{j.at("x").get<int>(), j.at("y").get<int>(), std::nullopt};
        if (j.contains("angle")) {
            rect.angle = j["angle"].get<int>();
        }
        return rect;
    }
    if (type == "path") {
        Path path;
        for (const auto& p : j.at("points")) {
            path.points.emplace_back(p.at(0).get<int>(), p.at(1).get<int>());
        }
        return path;
    }
    throw EncodingError("Unknown shape type: \"" + type + "\"");
}

// Partition serialization
inline nlohmann::json partition_to_json(const Partition& partition) {
    nlohmann::json shapes = nlohmann::json::array();
    for (const auto& shape : partition.shapes()) {
        shapes.push_back(shape_to_json(shape));
    }
    return {
        {"name", partition.name()},
        {"color", to_hex(partition.color())},
        {"size", partition.pixel_count()},
        {"path", shapes}
    };
}

inline Partition partition_from_json(const nlohmann::json& j) {
    std::vector<Shape> shapes;
    for (const auto& entry : j.at("path")) {
        shapes.push_back(shape_from_json(entry));
    }

    ColorKey color = from_hex(j.at("color").get<std::string>());
    std::string name = j.value("name", to_hex(color));
    Partition partition(std::move(shapes), name, color);

    if (j.contains("size") && j["size"].get<size_t>() != partition.pixel_count()) {
        auto log = logging::get_logger();
        log->warn("Unexpected size in partition {}. Wanted {}, got {}", name,
                  partition.pixel_count(), j["size"].get<size_t>());
    }
    return partition;
}

inline nlohmann::json partitions_to_json(const std::vector<Partition>& partitions) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& partition : partitions) {
        j.push_back(partition_to_json(partition));
    }
    return j;
}

inline std::vector<Partition> partitions_from_json(const nlohmann::json& j) {
    std::vector<Partition> partitions;
    for (const auto& entry : j) {
        partitions.push_back(partition_from_json(entry));
    }
    return partitions;
}

// OrderingStats serialization
inline void to_json(nlohmann::json& j, const OrderingStats& stats) {
    j = {
        {"partitions", stats.partitions},
        {"pixels", stats.pixels},
        {"jump_stitches", stats.jump_stitches},
        {"saw_successes", stats.saw_successes},
        {"saw_fallbacks", stats.saw_fallbacks},
        {"longest_saw_partial", stats.longest_saw_partial},
        {"connectors", stats.connectors},
        {"straight_connectors", stats.straight_connectors}
    };
}

}  // namespace pixstitch

#endif // PIXSTITCH_SERIALIZATION_PARTITION_JSON_HPP

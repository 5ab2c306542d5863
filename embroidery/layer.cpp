#include "layer.hpp"
#include "logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace pixstitch {

LayerAlign layer_align_from_string(const std::string& name) {
    if (name == "left") return LayerAlign::HorizontalLeft;
    if (name == "center") return LayerAlign::HorizontalCenter;
    if (name == "right") return LayerAlign::HorizontalRight;
    if (name == "top") return LayerAlign::VerticalTop;
    if (name == "middle") return LayerAlign::VerticalCenter;
    if (name == "bottom") return LayerAlign::VerticalBottom;
    throw std::invalid_argument("Unknown alignment: " + name);
}

LayerProperties LayerProperties::fit_to_hoop(int image_width, int image_height,
                                             const Vec2& hoop_inches) const {
    if (hoop_inches.x <= 0.0 || hoop_inches.y <= 0.0) {
        throw std::invalid_argument("LayerProperties::fit_to_hoop: hoop size must be positive");
    }
    const Vec2 hoop = hoop_inches * INCHES_TO_MM;

    Vec2 size = physical_size(image_width, image_height);
    Vec2 rotated = rotated_bounds(size.x, size.y, rotation);
    if (rotated.x == 0.0 || rotated.y == 0.0) {
        return *this;
    }

    double factor = std::min(hoop.x / rotated.x, hoop.y / rotated.y);

    LayerProperties fitted = *this;
    fitted.pixel_size = pixel_size * factor;

    // Center the rotated bounds. Position refers to the unrotated top-left.
    Vec2 new_size = fitted.physical_size(image_width, image_height);
    Vec2 new_rotated = rotated_bounds(new_size.x, new_size.y, rotation);
    Vec2 anchor_shift = (new_size - new_rotated) / 2.0;
    fitted.position = (hoop - new_rotated) / 2.0 - anchor_shift;
    return fitted;
}

Vec2 LayerProperties::position_for_align(LayerAlign mode, int image_width, int image_height,
                                         const Vec2& hoop_inches) const {
    const Vec2 hoop = hoop_inches * INCHES_TO_MM;
    Vec2 size = physical_size(image_width, image_height);
    Vec2 rotated = rotated_bounds(size.x, size.y, rotation);
    Vec2 anchor_shift = (size - rotated) / 2.0;

    switch (mode) {
        case LayerAlign::HorizontalLeft:
            return {-anchor_shift.x, position.y};
        case LayerAlign::HorizontalCenter:
            return {(hoop.x - rotated.x) / 2.0 - anchor_shift.x, position.y};
        case LayerAlign::HorizontalRight:
            return {hoop.x - rotated.x - anchor_shift.x, position.y};
        case LayerAlign::VerticalTop:
            return {position.x, -anchor_shift.y};
        case LayerAlign::VerticalCenter:
            return {position.x, (hoop.y - rotated.y) / 2.0 - anchor_shift.y};
        case LayerAlign::VerticalBottom:
            return {position.x, hoop.y - rotated.y - anchor_shift.y};
    }
    return position;
}

Layer::Layer(int image_width, int image_height, LayerProperties properties,
             EmbroideryParameters params)
    : image_width_(image_width), image_height_(image_height),
      properties_(std::move(properties)), params_(std::move(params)) {
    if (image_width <= 0 || image_height <= 0) {
        throw std::invalid_argument("Layer: image must have a positive size");
    }
    if (properties_.pixel_size.x <= 0.0 || properties_.pixel_size.y <= 0.0) {
        throw std::invalid_argument("Layer: pixel size must be positive");
    }
}

Layer Layer::from_raster(const RasterGrid& raster, LayerProperties properties,
                         EmbroideryParameters params) {
    return Layer(raster.width(), raster.height(), std::move(properties), std::move(params));
}

Partition* Layer::find_partition(const std::string& name) {
    auto it = std::find_if(partitions_.begin(), partitions_.end(),
                           [&](const Partition& p) { return p.name() == name; });
    return it == partitions_.end() ? nullptr : &*it;
}

const Partition* Layer::find_partition(const std::string& name) const {
    auto it = std::find_if(partitions_.begin(), partitions_.end(),
                           [&](const Partition& p) { return p.name() == name; });
    return it == partitions_.end() ? nullptr : &*it;
}

void Layer::fit_to_hoop(const Vec2& hoop_inches) {
    auto log = logging::get_logger();
    properties_ = properties_.fit_to_hoop(image_width_, image_height_, hoop_inches);
    log->debug("Layer {} fitted to hoop: pixel size {:.3f}x{:.3f} mm at ({:.3f}, {:.3f})",
               name(), properties_.pixel_size.x, properties_.pixel_size.y,
               properties_.position.x, properties_.position.y);
}

void Layer::align(LayerAlign mode, const Vec2& hoop_inches) {
    properties_.position =
        properties_.position_for_align(mode, image_width_, image_height_, hoop_inches);
}

}  // namespace pixstitch

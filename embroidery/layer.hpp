#ifndef PIXSTITCH_EMBROIDERY_LAYER_HPP
#define PIXSTITCH_EMBROIDERY_LAYER_HPP

#include "embroidery_params.hpp"
#include <math/vec2.hpp>
#include <raster/raster_grid.hpp>
#include <shape/partition.hpp>
#include <string>
#include <vector>

namespace pixstitch {

enum class LayerAlign {
    HorizontalLeft,
    HorizontalCenter,
    HorizontalRight,
    VerticalTop,
    VerticalCenter,
    VerticalBottom
};

// Throws std::invalid_argument for unknown names
LayerAlign layer_align_from_string(const std::string& name);

// Placement of a layer on the hoop, in millimetres
struct LayerProperties {
    std::string name = "layer";
    Vec2 position{0.0, 0.0};      // top-left of the unrotated image
    int rotation = 0;             // degrees, about the image center
    Vec2 pixel_size{2.5, 2.5};
    Vec2 scale{1.0, 1.0};

    // Unrotated image size
    Vec2 physical_size(int image_width, int image_height) const {
        return {image_width * pixel_size.x, image_height * pixel_size.y};
    }

    // Rotation anchor, relative to the layer origin
    Vec2 rotation_anchor(int image_width, int image_height) const {
        return physical_size(image_width, image_height) / 2.0;
    }

    // Pixel size scaled (aspect kept) so that the rotated image fits the hoop,
    // and centered in it. Throws std::invalid_argument for a non-positive hoop.
    LayerProperties fit_to_hoop(int image_width, int image_height, const Vec2& hoop_inches) const;

    // New position aligning the rotated image against the hoop on one axis
    Vec2 position_for_align(LayerAlign mode, int image_width, int image_height,
                            const Vec2& hoop_inches) const;
};

// An image placed on the hoop with its ordered partitions
class Layer {
public:
    Layer(int image_width, int image_height, LayerProperties properties = LayerProperties{},
          EmbroideryParameters params = EmbroideryParameters{});

    static Layer from_raster(const RasterGrid& raster, LayerProperties properties = LayerProperties{},
                             EmbroideryParameters params = EmbroideryParameters{});

    const std::string& name() const { return properties_.name; }
    int image_width() const { return image_width_; }
    int image_height() const { return image_height_; }

    const LayerProperties& properties() const { return properties_; }
    void set_properties(LayerProperties properties) { properties_ = std::move(properties); }

    const EmbroideryParameters& embroidery_params() const { return params_; }
    void set_embroidery_params(EmbroideryParameters params) { params_ = std::move(params); }

    const std::vector<Partition>& partitions() const { return partitions_; }
    std::vector<Partition>& partitions() { return partitions_; }
    void set_partitions(std::vector<Partition> partitions) { partitions_ = std::move(partitions); }

    // nullptr when no partition has that name
    Partition* find_partition(const std::string& name);
    const Partition* find_partition(const std::string& name) const;

    void fit_to_hoop(const Vec2& hoop_inches);
    void align(LayerAlign mode, const Vec2& hoop_inches);

private:
    int image_width_;
    int image_height_;
    LayerProperties properties_;
    EmbroideryParameters params_;
    std::vector<Partition> partitions_;
};

}  // namespace pixstitch

#endif // PIXSTITCH_EMBROIDERY_LAYER_HPP

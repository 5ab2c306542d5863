#ifndef PIXSTITCH_SHAPE_PARTITION_HPP
#define PIXSTITCH_SHAPE_PARTITION_HPP

#include "shape.hpp"
#include <math/color.hpp>
#include <string>
#include <vector>

namespace pixstitch {

// Ordered shape sequence forming one continuous stitch route for a color
// grouping. Rects are visited in order; Paths bridge consecutive Rects that
// are not adjacent.
class Partition {
public:
    Partition() = default;
    Partition(std::vector<Shape> shapes, std::string name, ColorKey color)
        : shapes_(std::move(shapes)), name_(std::move(name)), color_(color) {}

    const std::string& name() const { return name_; }
    void set_name(std::string name) { name_ = std::move(name); }

    ColorKey color() const { return color_; }

    const std::vector<Shape>& shapes() const { return shapes_; }
    void set_shapes(std::vector<Shape> shapes) { shapes_ = std::move(shapes); }

    // Rect coordinates in visiting order
    std::vector<Coord> pixels() const;

    size_t pixel_count() const;
    size_t connector_count() const;

    // Order-adjacent pixel pairs whose Chebyshev distance exceeds 1
    size_t jump_stitches() const;

private:
    std::vector<Shape> shapes_;
    std::string name_;
    ColorKey color_ = EMPTY_COLOR;
};

size_t count_jump_stitches(const std::vector<Coord>& order);

}  // namespace pixstitch

#endif // PIXSTITCH_SHAPE_PARTITION_HPP

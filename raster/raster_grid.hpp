#ifndef PIXSTITCH_RASTER_RASTER_GRID_HPP
#define PIXSTITCH_RASTER_RASTER_GRID_HPP

#include <math/color.hpp>
#include <graph/coord.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace pixstitch {

// Read-only 2D color lookup derived from an input image.
// Cells that were not fully opaque hold EMPTY_COLOR.
class RasterGrid {
public:
    // Throws std::invalid_argument on zero area or a size mismatch.
    RasterGrid(int width, int height, std::vector<ColorKey> cells);

    // Row-major RGBA8 buffer. Alpha != 255 -> empty.
    static RasterGrid from_rgba(int width, int height, const std::vector<uint8_t>& rgba);

    // Decode a PNG file. Throws std::runtime_error on I/O or decode failure.
    static RasterGrid load_png(const std::string& path);

    int width() const { return width_; }
    int height() const { return height_; }

    bool in_bounds(int x, int y) const {
        return x >= 0 && x < width_ && y >= 0 && y < height_;
    }

    // EMPTY_COLOR for transparent or out-of-bounds cells
    ColorKey color_at(int x, int y) const {
        if (!in_bounds(x, y)) {
            return EMPTY_COLOR;
        }
        return cells_[static_cast<size_t>(y) * width_ + x];
    }

    ColorKey color_at(const Coord& c) const { return color_at(c.x, c.y); }

    bool is_solid(int x, int y) const { return color_at(x, y) != EMPTY_COLOR; }

    // Distinct colors in first-appearance order of a column-major scan
    std::vector<ColorKey> colors() const;

    size_t solid_count() const;

private:
    int width_;
    int height_;
    std::vector<ColorKey> cells_;
};

}  // namespace pixstitch

#endif // PIXSTITCH_RASTER_RASTER_GRID_HPP

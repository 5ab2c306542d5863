#include "raster_grid.hpp"
#include <set>
#include <stdexcept>
#include <string>

namespace pixstitch {

RasterGrid::RasterGrid(int width, int height, std::vector<ColorKey> cells)
    : width_(width), height_(height), cells_(std::move(cells)) {
    if (width_ <= 0 || height_ <= 0) {
        throw std::invalid_argument("RasterGrid: image has zero area (" +
                                    std::to_string(width_) + "x" +
                                    std::to_string(height_) + ")");
    }
    if (cells_.size() != static_cast<size_t>(width_) * static_cast<size_t>(height_)) {
        throw std::invalid_argument("RasterGrid: cell count does not match dimensions");
    }
}

RasterGrid RasterGrid::from_rgba(int width, int height, const std::vector<uint8_t>& rgba) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("RasterGrid: image has zero area");
    }
    size_t pixel_count = static_cast<size_t>(width) * static_cast<size_t>(height);
    if (rgba.size() != pixel_count * 4) {
        throw std::invalid_argument("RasterGrid: RGBA buffer has " + std::to_string(rgba.size()) +
                                    " bytes, expected " + std::to_string(pixel_count * 4));
    }

    std::vector<ColorKey> cells(pixel_count, EMPTY_COLOR);
    for (size_t i = 0; i < pixel_count; ++i) {
        const uint8_t* px = &rgba[i * 4];
        if (px[3] != 255) {
            // Skip transparent pixels
            continue;
        }
        cells[i] = make_color(px[0], px[1], px[2]);
    }
    return RasterGrid(width, height, std::move(cells));
}

std::vector<ColorKey> RasterGrid::colors() const {
    std::vector<ColorKey> result;
    std::set<ColorKey> seen;
    for (int x = 0; x < width_; ++x) {
        for (int y = 0; y < height_; ++y) {
            ColorKey c = color_at(x, y);
            if (c != EMPTY_COLOR && seen.insert(c).second) {
                result.push_back(c);
            }
        }
    }
    return result;
}

size_t RasterGrid::solid_count() const {
    size_t count = 0;
    for (ColorKey c : cells_) {
        if (c != EMPTY_COLOR) {
            ++count;
        }
    }
    return count;
}

}  // namespace pixstitch

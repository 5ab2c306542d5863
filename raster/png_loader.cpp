#include "raster_grid.hpp"
#include "logging.hpp"
#include <png.h>
#include <cstdio>
#include <memory>
#include <stdexcept>

namespace pixstitch {

namespace {

using FilePtr = std::unique_ptr<FILE, decltype(&std::fclose)>;

}  // namespace

RasterGrid RasterGrid::load_png(const std::string& path) {
    auto log = logging::get_logger();

    // Everything that outlives a longjmp is declared before setjmp
    FilePtr fp(std::fopen(path.c_str(), "rb"), &std::fclose);
    if (!fp) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::vector<uint8_t> rgba;
    std::vector<png_bytep> rows;
    png_uint_32 width = 0;
    png_uint_32 height = 0;

    png_structp png_ptr = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png_ptr) {
        throw std::runtime_error("Cannot create PNG reader for: " + path);
    }
    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr) {
        png_destroy_read_struct(&png_ptr, nullptr, nullptr);
        throw std::runtime_error("Cannot create PNG info for: " + path);
    }
    if (setjmp(png_jmpbuf(png_ptr))) {
        png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
        throw std::runtime_error("Invalid PNG file: " + path);
    }

    png_init_io(png_ptr, fp.get());
    png_read_info(png_ptr, info_ptr);
    width = png_get_image_width(png_ptr, info_ptr);
    height = png_get_image_height(png_ptr, info_ptr);
    png_byte color_type = png_get_color_type(png_ptr, info_ptr);
    png_byte bit_depth = png_get_bit_depth(png_ptr, info_ptr);

    // Normalize every input to RGBA8
    if (bit_depth == 16) png_set_strip_16(png_ptr);
    if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(png_ptr);
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(png_ptr);
    bool has_trns = png_get_valid(png_ptr, info_ptr, PNG_INFO_tRNS) != 0;
    if (has_trns) png_set_tRNS_to_alpha(png_ptr);
    if (!has_trns && (color_type == PNG_COLOR_TYPE_RGB || color_type == PNG_COLOR_TYPE_GRAY ||
                      color_type == PNG_COLOR_TYPE_PALETTE)) {
        png_set_filler(png_ptr, 0xFF, PNG_FILLER_AFTER);
    }
    if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) {
        png_set_gray_to_rgb(png_ptr);
    }
    png_read_update_info(png_ptr, info_ptr);

    rgba.resize(static_cast<size_t>(width) * height * 4);
    rows.resize(height);
    for (png_uint_32 y = 0; y < height; ++y) {
        rows[y] = rgba.data() + static_cast<size_t>(y) * width * 4;
    }
    png_read_image(png_ptr, rows.data());
    png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);

    log->debug("Loaded {} ({}x{})", path, width, height);
    return from_rgba(static_cast<int>(width), static_cast<int>(height), rgba);
}

}  // namespace pixstitch

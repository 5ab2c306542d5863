#ifndef PIXSTITCH_MATH_COLOR_HPP
#define PIXSTITCH_MATH_COLOR_HPP

#include <cstdint>
#include <string>

namespace pixstitch {

// Canonical 24-bit RGB value (0xRRGGBB)
using ColorKey = uint32_t;

// Sentinel for transparent / invalid cells. Never a valid 24-bit color.
constexpr ColorKey EMPTY_COLOR = 0xFFFFFFFFu;

constexpr ColorKey make_color(uint8_t r, uint8_t g, uint8_t b) {
    return (static_cast<ColorKey>(r) << 16) | (static_cast<ColorKey>(g) << 8) | b;
}

constexpr uint8_t red(ColorKey c) { return static_cast<uint8_t>((c >> 16) & 0xFF); }
constexpr uint8_t green(ColorKey c) { return static_cast<uint8_t>((c >> 8) & 0xFF); }
constexpr uint8_t blue(ColorKey c) { return static_cast<uint8_t>(c & 0xFF); }

// "#rrggbb", lowercase
std::string to_hex(ColorKey color);

// Accepts "#rrggbb" or "rrggbb". Throws std::invalid_argument otherwise.
ColorKey from_hex(const std::string& hex);

// CIE L*a*b* (D50 reference white)
struct Lab {
    double l = 0.0;
    double a = 0.0;
    double b = 0.0;
};

Lab srgb_to_lab(ColorKey color);

// CIEDE2000 color difference (kL = kC = kH = 1)
double delta_e_2000(const Lab& lab1, const Lab& lab2);

inline double delta_e_2000(ColorKey c1, ColorKey c2) {
    return delta_e_2000(srgb_to_lab(c1), srgb_to_lab(c2));
}

}  // namespace pixstitch

#endif // PIXSTITCH_MATH_COLOR_HPP

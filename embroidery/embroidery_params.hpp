#ifndef PIXSTITCH_EMBROIDERY_EMBROIDERY_PARAMS_HPP
#define PIXSTITCH_EMBROIDERY_EMBROIDERY_PARAMS_HPP

#include <stdexcept>
#include <string>

namespace pixstitch {

// Machine fill style for whole pixels
enum class FillMode {
    Auto,     // auto_fill, short stitches
    Satin,    // contour_fill, one stitch spans a pixel
    Legacy    // legacy_fill
};

inline FillMode fill_mode_from_string(const std::string& name) {
    if (name == "auto") return FillMode::Auto;
    if (name == "satin") return FillMode::Satin;
    if (name == "legacy") return FillMode::Legacy;
    throw std::invalid_argument("Unknown fill mode: " + name);
}

inline std::string to_string(FillMode mode) {
    switch (mode) {
        case FillMode::Auto: return "auto";
        case FillMode::Satin: return "satin";
        case FillMode::Legacy: return "legacy";
    }
    return "unknown";
}

// Per-layer embroidery machine parameters, written as inkstitch attributes
struct EmbroideryParameters {
    // Fill (pixel rects)
    std::string fill_method = "contour_fill";
    double max_stitch_length_mm = 1000.0;
    double pull_compensation_mm = 0.0;
    int even_pixel_angle_degrees = 90;   // (x + y) even
    int odd_pixel_angle_degrees = 0;
    bool fill_underlay = true;
    double min_jump_stitch_length_mm = 0.0;  // omitted from output when <= 0

    // Running stitch (connector paths)
    double running_stitch_length_mm = 1.5;
    double running_stitch_tolerance_mm = 0.2;
    std::string lock_start = "half_stitch";
    std::string lock_end = "half_stitch";

    int angle_for(int x, int y) const {
        return (x + y) % 2 == 0 ? even_pixel_angle_degrees : odd_pixel_angle_degrees;
    }

    void apply_fill_mode(FillMode mode) {
        switch (mode) {
            case FillMode::Auto:
                fill_method = "auto_fill";
                max_stitch_length_mm = 3.0;
                break;
            case FillMode::Satin:
                fill_method = "contour_fill";
                max_stitch_length_mm = 1000.0;
                break;
            case FillMode::Legacy:
                fill_method = "legacy_fill";
                max_stitch_length_mm = 1000.0;
                break;
        }
    }

    static EmbroideryParameters for_fill_mode(FillMode mode) {
        EmbroideryParameters params;
        params.apply_fill_mode(mode);
        return params;
    }
};

}  // namespace pixstitch

#endif // PIXSTITCH_EMBROIDERY_EMBROIDERY_PARAMS_HPP

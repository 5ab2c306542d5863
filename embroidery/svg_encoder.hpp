#ifndef PIXSTITCH_EMBROIDERY_SVG_ENCODER_HPP
#define PIXSTITCH_EMBROIDERY_SVG_ENCODER_HPP

#include "embroidery_params.hpp"
#include "layer.hpp"
#include <math/vec2.hpp>
#include <shape/shape.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace pixstitch {

struct ExportConfig {
    Vec2 hoop_size{4.0, 4.0};  // inches
    FillMode fill_mode = FillMode::Satin;
};

// Writes layers of ordered partitions as an Ink/Stitch annotated SVG.
// Output is byte-stable: attribute order and number formatting never vary.
class SvgEncoder {
public:
    explicit SvgEncoder(ExportConfig config = ExportConfig{});

    const ExportConfig& config() const { return config_; }

    // Throws std::invalid_argument when layers is empty and EncodingError
    // for malformed shapes
    std::string encode(const std::vector<Layer>& layers, const std::string& title) const;

    void write(std::ostream& out, const std::vector<Layer>& layers,
               const std::string& title) const;

    // Writes <path>.tmp and renames it over path, title is the file name.
    // Nothing is left behind on failure.
    void write_file(const std::string& path, const std::vector<Layer>& layers) const;

    // Single elements, newline terminated
    static std::string rect_element(int layer_idx, const Rect& rect, const Vec2& pixel_size,
                                    const std::string& color, const EmbroideryParameters& params);
    static std::string path_element(int layer_idx, size_t partition_idx, size_t shape_idx,
                                    const Path& path, const Vec2& pixel_size,
                                    const std::string& color, const EmbroideryParameters& params);

    // Hoop size in whole millimetres
    static long hoop_mm(double inches);

private:
    void write_header(std::ostream& out, const std::vector<Layer>& layers,
                      const std::string& title) const;
    void write_layer(std::ostream& out, int layer_idx, const Layer& layer) const;

    ExportConfig config_;
};

}  // namespace pixstitch

#endif // PIXSTITCH_EMBROIDERY_SVG_ENCODER_HPP

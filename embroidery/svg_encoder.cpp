#include "svg_encoder.hpp"
#include "number_format.hpp"
#include "logging.hpp"
#include <serialization/config_json.hpp>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <variant>

namespace pixstitch {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::string xml_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c; break;
        }
    }
    return out;
}

// "--" may not appear inside an XML comment
std::string comment_safe(std::string text) {
    size_t pos = 0;
    while ((pos = text.find("--", pos)) != std::string::npos) {
        text.replace(pos, 2, "- -");
    }
    return text;
}

std::string strip_hash(std::string name) {
    name.erase(std::remove(name.begin(), name.end(), '#'), name.end());
    return name;
}

}  // namespace

SvgEncoder::SvgEncoder(ExportConfig config) : config_(config) {}

long SvgEncoder::hoop_mm(double inches) {
    return std::lround(inches * INCHES_TO_MM);
}

std::string SvgEncoder::rect_element(int layer_idx, const Rect& rect, const Vec2& pixel_size,
                                     const std::string& color,
                                     const EmbroideryParameters& params) {
    int angle = rect.angle ? *rect.angle : params.angle_for(rect.x, rect.y);

    std::ostringstream out;
    out << "<rect x=\"" << format_number(rect.x * pixel_size.x) << "\" y=\""
        << format_number(rect.y * pixel_size.y) << "\" "
        << "width=\"" << format_number(pixel_size.x) << "\" height=\""
        << format_number(pixel_size.y) << "\" "
        << "fill=\"" << color << "\" "
        << "id=\"pixel_" << layer_idx << "_" << rect.x << "_" << rect.y << "_" << angle << "\" "
        << "style=\"display:inline;stroke:none\" "
        << "inkstitch:fill_method=\"" << xml_escape(params.fill_method) << "\" "
        << "inkstitch:angle=\"" << angle << "\" "
        << "inkstitch:max_stitch_length_mm=\"" << format_number(params.max_stitch_length_mm)
        << "\" "
        << "inkstitch:pull_compensation_mm=\"" << format_number(params.pull_compensation_mm)
        << "\" "
        << "inkstitch:fill_underlay=\"" << format_bool(params.fill_underlay) << "\" ";
    if (params.min_jump_stitch_length_mm > 0.0) {
        out << "inkstitch:min_jump_stitch_length_mm=\""
            << format_number(params.min_jump_stitch_length_mm) << "\" ";
    }
    out << "/>\n";
    return out.str();
}

std::string SvgEncoder::path_element(int layer_idx, size_t partition_idx, size_t shape_idx,
                                     const Path& path, const Vec2& pixel_size,
                                     const std::string& color,
                                     const EmbroideryParameters& params) {
    if (path.points.empty()) {
        throw EncodingError("Path shape " + std::to_string(shape_idx) + " of partition " +
                            std::to_string(partition_idx) + " has no points");
    }

    std::ostringstream d;
    for (size_t i = 0; i < path.points.size(); ++i) {
        const Point& p = path.points[i];
        d << (i == 0 ? "M " : " L ") << format_number(p.x * pixel_size.x) << " "
          << format_number(p.y * pixel_size.y);
    }

    std::ostringstream out;
    out << "<path d=\"" << d.str() << "\" "
        << "id=\"path_" << layer_idx << "_" << partition_idx << "_" << shape_idx << "\" "
        << "style=\"fill:none;stroke:" << color << ";stroke-width:0.1\" "
        << "inkstitch:running_stitch_length_mm=\""
        << format_number(params.running_stitch_length_mm) << "\" "
        << "inkstitch:running_stitch_tolerance_mm=\""
        << format_number(params.running_stitch_tolerance_mm) << "\" "
        << "inkstitch:lock_start=\"" << xml_escape(params.lock_start) << "\" "
        << "inkstitch:lock_end=\"" << xml_escape(params.lock_end) << "\" "
        << "/>\n";
    return out.str();
}

void SvgEncoder::write_header(std::ostream& out, const std::vector<Layer>& layers,
                              const std::string& title) const {
    long width = hoop_mm(config_.hoop_size.x);
    long height = hoop_mm(config_.hoop_size.y);
    const Vec2& spacing = layers.front().properties().pixel_size;

    out << "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"no\"?>\n"
        << "<svg\n"
        << "  width=\"" << width << "mm\"\n"
        << "  height=\"" << height << "mm\"\n"
        << "  viewBox=\"0 0 " << width << " " << height << "\"\n"
        << "  version=\"1.1\"\n"
        << "  id=\"svg8\"\n"
        << "  xmlns=\"http://www.w3.org/2000/svg\"\n"
        << "  xmlns:svg=\"http://www.w3.org/2000/svg\"\n"
        << "  xmlns:inkscape=\"http://www.inkscape.org/namespaces/inkscape\"\n"
        << "  xmlns:sodipodi=\"http://sodipodi.sourceforge.net/DTD/sodipodi-0.dtd\"\n"
        << "  xmlns:inkstitch=\"http://inkstitch.org/namespace\"\n"
        << ">\n";
    out << "<title id=\"title1023\">" << xml_escape(title) << "</title>\n";
    out << "<sodipodi:namedview\n"
        << "  inkscape:document-units=\"mm\"\n"
        << "  inkscape:pagecheckerboard=\"true\"\n"
        << "  showgrid=\"true\"\n"
        << ">\n"
        << "<inkscape:grid\n"
        << "  id=\"grid1\"\n"
        << "  units=\"mm\"\n"
        << "  originx=\"0\"\n"
        << "  originy=\"0\"\n"
        << "  spacingx=\"" << format_number(spacing.x) << "\"\n"
        << "  spacingy=\"" << format_number(spacing.y) << "\"\n"
        << "  enabled=\"true\"\n"
        << "  visible=\"true\"\n"
        << "/>\n"
        << "</sodipodi:namedview>\n";
    out << "<defs\n"
        << "  id=\"defs1\"\n"
        << "/>\n";
}

void SvgEncoder::write_layer(std::ostream& out, int layer_idx, const Layer& layer) const {
    const LayerProperties& props = layer.properties();
    const EmbroideryParameters& params = layer.embroidery_params();
    const Vec2 anchor = props.rotation_anchor(layer.image_width(), layer.image_height());
    const std::string name = xml_escape(layer.name());

    nlohmann::json params_json = params;
    out << "<!--  layer: " << layer_idx << ", name: " << comment_safe(layer.name()) << " -->\n"
        << "<!-- layer embroidery params\n"
        << "  " << comment_safe(params_json.dump()) << "\n"
        << "-->\n";
    out << "<g id=\"" << name << "\" transform=\""
        << "translate(" << format_number(props.position.x) << " "
        << format_number(props.position.y) << ") "
        << "rotate(" << props.rotation << " " << format_number(anchor.x) << " "
        << format_number(anchor.y) << ") "
        << "scale(" << format_number(props.scale.x) << " " << format_number(props.scale.y)
        << ")\">\n";

    const auto& partitions = layer.partitions();
    for (size_t part_idx = 0; part_idx < partitions.size(); ++part_idx) {
        const Partition& partition = partitions[part_idx];
        const std::string color = to_hex(partition.color());

        out << "<g id=\"partition_" << layer_idx << "_" << xml_escape(strip_hash(partition.name()))
            << "\">\n";

        const auto& shapes = partition.shapes();
        for (size_t shape_idx = 0; shape_idx < shapes.size(); ++shape_idx) {
            const Shape& shape = shapes[shape_idx];
            if (shape.valueless_by_exception()) {
                throw EncodingError("Shape " + std::to_string(shape_idx) + " of partition " +
                                    partition.name() + " holds no value");
            }
            out << std::visit(
                overloaded{
                    [&](const Rect& rect) {
                        return rect_element(layer_idx, rect, props.pixel_size, color, params);
                    },
                    [&](const Path& path) {
                        return path_element(layer_idx, part_idx, shape_idx, path,
                                            props.pixel_size, color, params);
                    }},
                shape);
        }

        out << "</g>\n";
    }

    out << "</g>\n";
}

void SvgEncoder::write(std::ostream& out, const std::vector<Layer>& layers,
                       const std::string& title) const {
    if (layers.empty()) {
        throw std::invalid_argument("SvgEncoder: nothing to export, no layers given");
    }
    if (config_.hoop_size.x <= 0.0 || config_.hoop_size.y <= 0.0) {
        throw std::invalid_argument("SvgEncoder: hoop size must be positive");
    }

    write_header(out, layers, title);
    for (size_t i = 0; i < layers.size(); ++i) {
        write_layer(out, static_cast<int>(i), layers[i]);
    }
    out << "</svg>\n";
}

std::string SvgEncoder::encode(const std::vector<Layer>& layers, const std::string& title) const {
    std::ostringstream out;
    write(out, layers, title);
    return out.str();
}

void SvgEncoder::write_file(const std::string& path, const std::vector<Layer>& layers) const {
    auto log = logging::get_logger();

    // Encode fully before touching the filesystem
    std::string title = std::filesystem::path(path).filename().string();
    std::string document = encode(layers, title);

    std::string tmp_path = path + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Cannot write to file: " + tmp_path);
        }
        file << document;
        file.flush();
        if (!file) {
            file.close();
            std::error_code cleanup;
            std::filesystem::remove(tmp_path, cleanup);
            throw std::runtime_error("Cannot write to file: " + tmp_path);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        std::error_code cleanup;
        std::filesystem::remove(tmp_path, cleanup);
        throw std::runtime_error("Cannot write to file: " + path + " (" + ec.message() + ")");
    }

    log->info("Wrote SVG {} ({} layers, {} bytes)", path, layers.size(), document.size());
}

}  // namespace pixstitch

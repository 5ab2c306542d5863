#ifndef PIXSTITCH_SHAPE_SHAPE_HPP
#define PIXSTITCH_SHAPE_SHAPE_HPP

#include <graph/coord.hpp>
#include <compare>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace pixstitch {

// A shape could not be encoded or decoded
class EncodingError : public std::runtime_error {
public:
    explicit EncodingError(const std::string& what) : std::runtime_error(what) {}
};

// Grid corner in a connector path
struct Point {
    int x = 0;
    int y = 0;

    constexpr Point() = default;
    constexpr Point(int x_, int y_) : x(x_), y(y_) {}
    constexpr explicit Point(const Coord& c) : x(c.x), y(c.y) {}

    constexpr auto operator<=>(const Point&) const = default;
};

// One embroidery fill cell at a pixel coordinate
struct Rect {
    int x = 0;
    int y = 0;
    // Overrides the checkerboard stitch angle when set
    std::optional<int> angle;

    Coord coord() const { return {x, y}; }

    bool operator==(const Rect&) const = default;
};

// Connector (jump) segment as a polyline over grid corners
struct Path {
    std::vector<Point> points;

    bool operator==(const Path&) const = default;
};

using Shape = std::variant<Rect, Path>;

inline bool is_rect(const Shape& shape) { return std::holds_alternative<Rect>(shape); }
inline bool is_path(const Shape& shape) { return std::holds_alternative<Path>(shape); }

}  // namespace pixstitch

#endif // PIXSTITCH_SHAPE_SHAPE_HPP

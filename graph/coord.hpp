#ifndef PIXSTITCH_GRAPH_COORD_HPP
#define PIXSTITCH_GRAPH_COORD_HPP

#include <algorithm>
#include <compare>
#include <cstddef>
#include <cstdlib>
#include <functional>
#include <ostream>

namespace pixstitch {

// Integer grid position, origin top-left. Used both for pixels and for
// grid corners (the top-left corner of pixel (x, y) is corner (x, y)).
struct Coord {
    int x = 0;
    int y = 0;

    constexpr Coord() = default;
    constexpr Coord(int x_, int y_) : x(x_), y(y_) {}

    constexpr Coord operator+(const Coord& other) const {
        return {x + other.x, y + other.y};
    }

    constexpr Coord operator-(const Coord& other) const {
        return {x - other.x, y - other.y};
    }

    // Ordered by x, then y
    constexpr auto operator<=>(const Coord&) const = default;
};

inline int chebyshev_distance(const Coord& a, const Coord& b) {
    return std::max(std::abs(a.x - b.x), std::abs(a.y - b.y));
}

inline std::ostream& operator<<(std::ostream& os, const Coord& c) {
    return os << "(" << c.x << ", " << c.y << ")";
}

struct CoordHash {
    size_t operator()(const Coord& c) const noexcept {
        return std::hash<long long>()((static_cast<long long>(c.x) << 32) ^
                                      static_cast<unsigned int>(c.y));
    }
};

}  // namespace pixstitch

#endif // PIXSTITCH_GRAPH_COORD_HPP

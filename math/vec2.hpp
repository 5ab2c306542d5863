#ifndef PIXSTITCH_MATH_VEC2_HPP
#define PIXSTITCH_MATH_VEC2_HPP

#include <cmath>
#include <numbers>

namespace pixstitch {

// Millimetre positions, sizes and scale factors
struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    constexpr Vec2() = default;
    constexpr Vec2(double x_, double y_) : x(x_), y(y_) {}

    constexpr Vec2 operator+(const Vec2& other) const {
        return {x + other.x, y + other.y};
    }

    constexpr Vec2 operator-(const Vec2& other) const {
        return {x - other.x, y - other.y};
    }

    constexpr Vec2 operator*(double scalar) const {
        return {x * scalar, y * scalar};
    }

    constexpr Vec2 operator/(double scalar) const {
        return {x / scalar, y / scalar};
    }

    constexpr bool operator==(const Vec2&) const = default;
};

constexpr double INCHES_TO_MM = 25.4;

inline double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

// Axis-aligned bounding box of a w x h rectangle rotated about its center
inline Vec2 rotated_bounds(double width, double height, double degrees) {
    double rad = degrees_to_radians(degrees);
    double c = std::abs(std::cos(rad));
    double s = std::abs(std::sin(rad));
    return {width * c + height * s, width * s + height * c};
}

}  // namespace pixstitch

#endif // PIXSTITCH_MATH_VEC2_HPP

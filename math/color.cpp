#include "color.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <numbers>
#include <stdexcept>

namespace pixstitch {

namespace {

constexpr double DEG_TO_RAD = std::numbers::pi / 180.0;
constexpr double RAD_TO_DEG = 180.0 / std::numbers::pi;

// D50 reference white
constexpr double WHITE_X = 0.96422;
constexpr double WHITE_Y = 1.0;
constexpr double WHITE_Z = 0.82521;

double srgb_to_linear(uint8_t channel) {
    double c = channel / 255.0;
    if (c <= 0.04045) {
        return c / 12.92;
    }
    return std::pow((c + 0.055) / 1.055, 2.4);
}

double lab_f(double t) {
    constexpr double epsilon = 216.0 / 24389.0;
    constexpr double kappa = 24389.0 / 27.0;
    if (t > epsilon) {
        return std::cbrt(t);
    }
    return (kappa * t + 16.0) / 116.0;
}

// Hue angle in degrees, [0, 360)
double hue_degrees(double b, double a) {
    if (a == 0.0 && b == 0.0) {
        return 0.0;
    }
    double h = std::atan2(b, a) * RAD_TO_DEG;
    return h < 0.0 ? h + 360.0 : h;
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

}  // namespace

std::string to_hex(ColorKey color) {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "#%06x", color & 0xFFFFFFu);
    return buffer;
}

ColorKey from_hex(const std::string& hex) {
    size_t start = (!hex.empty() && hex[0] == '#') ? 1 : 0;
    if (hex.size() - start != 6) {
        throw std::invalid_argument("Invalid color: " + hex);
    }
    ColorKey value = 0;
    for (size_t i = start; i < hex.size(); ++i) {
        int digit = hex_digit(hex[i]);
        if (digit < 0) {
            throw std::invalid_argument("Invalid color: " + hex);
        }
        value = (value << 4) | static_cast<ColorKey>(digit);
    }
    return value;
}

Lab srgb_to_lab(ColorKey color) {
    double r = srgb_to_linear(red(color));
    double g = srgb_to_linear(green(color));
    double b = srgb_to_linear(blue(color));

    // linear sRGB -> XYZ, Bradford-adapted to D50
    double x = 0.4360747 * r + 0.3850649 * g + 0.1430804 * b;
    double y = 0.2225045 * r + 0.7168786 * g + 0.0606169 * b;
    double z = 0.0139322 * r + 0.0971045 * g + 0.7141733 * b;

    double fx = lab_f(x / WHITE_X);
    double fy = lab_f(y / WHITE_Y);
    double fz = lab_f(z / WHITE_Z);

    return Lab{116.0 * fy - 16.0, 500.0 * (fx - fy), 200.0 * (fy - fz)};
}

double delta_e_2000(const Lab& lab1, const Lab& lab2) {
    constexpr double pow25_7 = 6103515625.0;  // 25^7

    double c1 = std::hypot(lab1.a, lab1.b);
    double c2 = std::hypot(lab2.a, lab2.b);
    double c_bar = (c1 + c2) / 2.0;
    double c_bar7 = std::pow(c_bar, 7.0);
    double g = 0.5 * (1.0 - std::sqrt(c_bar7 / (c_bar7 + pow25_7)));

    double a1p = (1.0 + g) * lab1.a;
    double a2p = (1.0 + g) * lab2.a;
    double c1p = std::hypot(a1p, lab1.b);
    double c2p = std::hypot(a2p, lab2.b);
    double h1p = hue_degrees(lab1.b, a1p);
    double h2p = hue_degrees(lab2.b, a2p);

    double delta_lp = lab2.l - lab1.l;
    double delta_cp = c2p - c1p;

    double delta_hp = 0.0;
    if (c1p * c2p != 0.0) {
        double diff = h2p - h1p;
        if (diff > 180.0) {
            diff -= 360.0;
        } else if (diff < -180.0) {
            diff += 360.0;
        }
        delta_hp = diff;
    }
    double delta_big_hp = 2.0 * std::sqrt(c1p * c2p) * std::sin(delta_hp * DEG_TO_RAD / 2.0);

    double l_bar_p = (lab1.l + lab2.l) / 2.0;
    double c_bar_p = (c1p + c2p) / 2.0;

    double h_bar_p = h1p + h2p;
    if (c1p * c2p != 0.0) {
        if (std::abs(h1p - h2p) <= 180.0) {
            h_bar_p = (h1p + h2p) / 2.0;
        } else if (h1p + h2p < 360.0) {
            h_bar_p = (h1p + h2p + 360.0) / 2.0;
        } else {
            h_bar_p = (h1p + h2p - 360.0) / 2.0;
        }
    }

    double t = 1.0
        - 0.17 * std::cos((h_bar_p - 30.0) * DEG_TO_RAD)
        + 0.24 * std::cos((2.0 * h_bar_p) * DEG_TO_RAD)
        + 0.32 * std::cos((3.0 * h_bar_p + 6.0) * DEG_TO_RAD)
        - 0.20 * std::cos((4.0 * h_bar_p - 63.0) * DEG_TO_RAD);

    double delta_theta = 30.0 * std::exp(-std::pow((h_bar_p - 275.0) / 25.0, 2.0));
    double c_bar_p7 = std::pow(c_bar_p, 7.0);
    double r_c = 2.0 * std::sqrt(c_bar_p7 / (c_bar_p7 + pow25_7));
    double l_term = (l_bar_p - 50.0) * (l_bar_p - 50.0);
    double s_l = 1.0 + (0.015 * l_term) / std::sqrt(20.0 + l_term);
    double s_c = 1.0 + 0.045 * c_bar_p;
    double s_h = 1.0 + 0.015 * c_bar_p * t;
    double r_t = -std::sin(2.0 * delta_theta * DEG_TO_RAD) * r_c;

    double dl = delta_lp / s_l;
    double dc = delta_cp / s_c;
    double dh = delta_big_hp / s_h;

    return std::sqrt(dl * dl + dc * dc + dh * dh + r_t * dc * dh);
}

}  // namespace pixstitch

#ifndef PIXSTITCH_EMBROIDERY_NUMBER_FORMAT_HPP
#define PIXSTITCH_EMBROIDERY_NUMBER_FORMAT_HPP

#include <string>

namespace pixstitch {

// Shortest text that reads back to the same double, with ".0" appended to
// integral values: 20.0, 2.5, 0.1, 100000.0, 1e+16
std::string format_number(double value);

inline std::string format_number(int value) {
    return std::to_string(value);
}

inline std::string format_bool(bool value) {
    return value ? "true" : "false";
}

}  // namespace pixstitch

#endif // PIXSTITCH_EMBROIDERY_NUMBER_FORMAT_HPP

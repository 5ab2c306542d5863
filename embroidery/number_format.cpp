#include "number_format.hpp"
#include <charconv>
#include <cmath>
#include <stdexcept>
#include <system_error>

namespace pixstitch {

std::string format_number(double value) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument("format_number: value is not finite");
    }
    if (value == 0.0) {
        // Also folds -0.0
        return "0.0";
    }

    // Plain notation in [1e-4, 1e16), exponent notation outside
    double magnitude = std::abs(value);
    auto format = (magnitude >= 1e-4 && magnitude < 1e16) ? std::chars_format::fixed
                                                           : std::chars_format::scientific;

    char buffer[400];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value, format);
    if (ec != std::errc()) {
        throw std::runtime_error("format_number: conversion failed");
    }

    std::string text(buffer, end);
    if (text.find_first_of(".e") == std::string::npos) {
        text += ".0";
    }
    return text;
}

}  // namespace pixstitch

#include "partition.hpp"
#include <algorithm>

namespace pixstitch {

std::vector<Coord> Partition::pixels() const {
    std::vector<Coord> result;
    result.reserve(shapes_.size());
    for (const auto& shape : shapes_) {
        if (const auto* rect = std::get_if<Rect>(&shape)) {
            result.push_back(rect->coord());
        }
    }
    return result;
}

size_t Partition::pixel_count() const {
    return static_cast<size_t>(std::count_if(shapes_.begin(), shapes_.end(), is_rect));
}

size_t Partition::connector_count() const {
    return static_cast<size_t>(std::count_if(shapes_.begin(), shapes_.end(), is_path));
}

size_t Partition::jump_stitches() const {
    return count_jump_stitches(pixels());
}

size_t count_jump_stitches(const std::vector<Coord>& order) {
    size_t jumps = 0;
    for (size_t i = 1; i < order.size(); ++i) {
        if (chebyshev_distance(order[i - 1], order[i]) > 1) {
            ++jumps;
        }
    }
    return jumps;
}

}  // namespace pixstitch

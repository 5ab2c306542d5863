#ifndef PIXSTITCH_WALKER_DIRECTIONAL_WALKER_HPP
#define PIXSTITCH_WALKER_DIRECTIONAL_WALKER_HPP

#include <graph/coord.hpp>
#include <array>
#include <string>
#include <vector>

namespace pixstitch {

enum class WalkMode {
    SpiralCw,
    SpiralCcw,
    SnakeCw,
    SnakeCcw
};

// Throws std::invalid_argument for unknown names
WalkMode walk_mode_from_string(const std::string& name);
std::string to_string(WalkMode mode);

enum class Heading { S, W, N, E };

Coord heading_offset(Heading heading);

// Re-orders a known pixel set from a chosen start with a rotating
// 4-neighbor priority. The neighbor cycle is rotated so that the offset
// opposite the current heading comes first; spiral modes push neighbors in
// reverse priority, snake modes in priority order.
class DirectionalWalker {
public:
    // Neighbor cycle for a mode, rotated for the given heading
    static std::array<Heading, 4> priority(WalkMode mode, Heading heading);

    // Every coordinate of mask exactly once: the walk from start first, then
    // whatever the walk could not reach, in mask order.
    // Throws std::invalid_argument when start is not in mask.
    static std::vector<Coord> walk(const std::vector<Coord>& mask, const Coord& start,
                                   WalkMode mode);

    // Keeps selected as is and walks the rest of all from start:
    // selected + walk(all - selected), unreachable pixels last.
    static std::vector<Coord> fill_from(const std::vector<Coord>& all,
                                        const std::vector<Coord>& selected,
                                        const Coord& start, WalkMode mode);
};

}  // namespace pixstitch

#endif // PIXSTITCH_WALKER_DIRECTIONAL_WALKER_HPP

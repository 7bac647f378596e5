//
// HexLine.h - Cube rounding and discrete line drawing
//

#ifndef HEXNAV_HEXLINE_H
#define HEXNAV_HEXLINE_H

#include "HexCoord.h"
#include "../math.h"
#include <vector>

namespace HexLine
{
    // Nudge added to every interpolated sample so that no sample lands exactly
    // on an edge between two hexes. Sums to zero.
    inline constexpr FractionalHex LINE_NUDGE = FractionalHex(1e-6, 1e-6, -2e-6);

    [[nodiscard]] FractionalHex ToFractional(const HexCoord& hex);

    // Snap to the nearest valid hex. Each component is rounded on its own, then
    // the one with the largest rounding error is rebuilt from the other two.
    [[nodiscard]] HexCoord Round(const FractionalHex& frac);

    [[nodiscard]] FractionalHex Lerp(const FractionalHex& a, const FractionalHex& b, double t);

    // Distance(a, b) + 1 hexes from a to b inclusive.
    // Line(b, a) is exactly Line(a, b) reversed.
    [[nodiscard]] std::vector<HexCoord> Line(const HexCoord& a, const HexCoord& b);
}

#endif // HEXNAV_HEXLINE_H

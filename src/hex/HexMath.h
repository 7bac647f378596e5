//
// HexMath.h - Arithmetic, rotation, distance and neighborhood on cube coordinates
//

#ifndef HEXNAV_HEXMATH_H
#define HEXNAV_HEXMATH_H

#include "HexCoord.h"
#include <array>
#include <vector>

// 6 neighbor directions in cube coordinates.
// Starting from East (pointy-top) and turning counter-clockwise as drawn on a
// y-down screen.
// Direction d and (d + 3) % 6 are opposite.
inline constexpr std::array<HexCoord, 6> HEX_DIRECTIONS = {
    HexCoord(+1,  0),  // (+1,  0, -1) East
    HexCoord(+1, -1),  // (+1, -1,  0) Northeast
    HexCoord( 0, -1),  // ( 0, -1, +1) Northwest
    HexCoord(-1,  0),  // (-1,  0, +1) West
    HexCoord(-1, +1),  // (-1, +1,  0) Southwest
    HexCoord( 0, +1)   // ( 0, +1, -1) Southeast
};

// Offsets to the six hexes that share a corner but not an edge
inline constexpr std::array<HexCoord, 6> HEX_DIAGONALS = {
    HexCoord(+2, -1),
    HexCoord(+1, -2),
    HexCoord(-1, -1),
    HexCoord(-2, +1),
    HexCoord(-1, +2),
    HexCoord(+1, +1)
};

namespace HexMath
{
    [[nodiscard]] HexCoord Add(const HexCoord& a, const HexCoord& b);
    [[nodiscard]] HexCoord Subtract(const HexCoord& a, const HexCoord& b);

    // k must be non-negative
    [[nodiscard]] HexCoord Scale(const HexCoord& hex, int k);

    // 60 degrees about the origin. Left maps HEX_DIRECTIONS[d] onto
    // HEX_DIRECTIONS[(d + 5) % 6] (counter-clockwise in a y-up plane);
    // Right is its exact inverse.
    [[nodiscard]] HexCoord RotateLeft(const HexCoord& hex);
    [[nodiscard]] HexCoord RotateRight(const HexCoord& hex);

    // Rotate about an arbitrary center; positive steps turn left, negative turn right
    [[nodiscard]] HexCoord RotateAround(const HexCoord& hex, const HexCoord& center, int steps);

    // Distance between two hexes in steps
    [[nodiscard]] int Distance(const HexCoord& a, const HexCoord& b);

    // Distance from the origin
    [[nodiscard]] int Length(const HexCoord& hex);

    [[nodiscard]] int AxialDistance(const AxialCoord& a, const AxialCoord& b);

    // Each argument is interpreted under its own scheme
    [[nodiscard]] int OffsetDistance(const OffsetCoord& a, const OffsetCoord& b);

    [[nodiscard]] constexpr int OppositeDirection(int direction) { return (direction + 3) % 6; }

    [[nodiscard]] HexCoord Direction(int direction);
    [[nodiscard]] HexCoord Neighbor(const HexCoord& hex, int direction);
    [[nodiscard]] HexCoord DiagonalNeighbor(const HexCoord& hex, int direction);

    // All six neighbors, in direction order 0..5
    [[nodiscard]] std::array<HexCoord, 6> Neighbors(const HexCoord& hex);

    // Hexes at exactly `radius` steps, walked from center + Direction(4) * radius
    // through directions 0..5. 6 * radius hexes, or {center} for radius 0.
    [[nodiscard]] std::vector<HexCoord> Ring(const HexCoord& center, int radius);

    // Rings 0..radius in order; 3 * radius * (radius + 1) + 1 hexes
    [[nodiscard]] std::vector<HexCoord> Spiral(const HexCoord& center, int radius);

    // Same hexes as Spiral, ordered by q then r
    [[nodiscard]] std::vector<HexCoord> Range(const HexCoord& center, int radius);
}

#endif // HEXNAV_HEXMATH_H

//
// HexGeometry.h - Hex <-> pixel mapping and polygon corners
//

#ifndef HEXNAV_HEXGEOMETRY_H
#define HEXNAV_HEXGEOMETRY_H

#include "HexCoord.h"
#include "../math.h"
#include <array>

enum class HexLayout
{
    Pointy, // corner at the top, rows are horizontal
    Flat    // edge at the top, columns are vertical
};

// Forward (hex -> pixel) and inverse (pixel -> hex) basis matrices.
// startAngle is the angle of corner 0 in sixths of a full turn.
struct Orientation
{
    double f0, f1, f2, f3;
    double b0, b1, b2, b3;
    double startAngle;
};

inline constexpr Orientation ORIENTATION_POINTY = {
    SQRT3, SQRT3 / 2.0, 0.0, 3.0 / 2.0,
    SQRT3 / 3.0, -1.0 / 3.0, 0.0, 2.0 / 3.0,
    0.5
};

inline constexpr Orientation ORIENTATION_FLAT = {
    3.0 / 2.0, 0.0, SQRT3 / 2.0, SQRT3,
    2.0 / 3.0, 0.0, -1.0 / 3.0, SQRT3 / 3.0,
    0.0
};

namespace HexGeometry
{
    [[nodiscard]] const Orientation& GetOrientation(HexLayout layout);

    // Center of a hex in pixel space.
    // size = distance from center to corner (outer radius)
    [[nodiscard]] PixelPoint HexToPixel(const HexCoord& hex, double size, HexLayout layout);

    // Unrounded cube position of a pixel
    [[nodiscard]] FractionalHex PixelToFractional(const PixelPoint& point, double size, HexLayout layout);

    // Hex containing a pixel (rounded to nearest hex)
    [[nodiscard]] HexCoord PixelToHex(const PixelPoint& point, double size, HexLayout layout);

    // Offset of corner 0..5 from the hex center
    [[nodiscard]] PixelPoint CornerOffset(int corner, double size, HexLayout layout);

    // The 6 corner vertices of a hex in pixel space
    [[nodiscard]] std::array<PixelPoint, 6> PolygonCorners(const HexCoord& hex, double size, HexLayout layout);

    // Get inner radius (distance from center to edge midpoint)
    [[nodiscard]] double InnerRadius(double outerRadius);
}

#endif // HEXNAV_HEXGEOMETRY_H

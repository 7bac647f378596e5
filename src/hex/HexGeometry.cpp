//
// HexGeometry.cpp - Pixel mapping implementation
//

#include "HexGeometry.h"
#include "HexLine.h"
#include "HexValidation.h"

namespace HexGeometry
{
    const Orientation& GetOrientation(HexLayout layout)
    {
        return layout == HexLayout::Pointy ? ORIENTATION_POINTY : ORIENTATION_FLAT;
    }

    PixelPoint HexToPixel(const HexCoord& hex, double size, HexLayout layout)
    {
        HexValidation::RequireValid(hex, "HexGeometry::HexToPixel");
        HexValidation::RequirePositiveSize(size, "HexGeometry::HexToPixel");

        const Orientation& m = GetOrientation(layout);
        const double x = (m.f0 * hex.q + m.f1 * hex.r) * size;
        const double y = (m.f2 * hex.q + m.f3 * hex.r) * size;
        return {x, y};
    }

    FractionalHex PixelToFractional(const PixelPoint& point, double size, HexLayout layout)
    {
        HexValidation::RequirePositiveSize(size, "HexGeometry::PixelToFractional");
        HexValidation::RequireFinitePoint(point, "HexGeometry::PixelToFractional");

        const Orientation& m = GetOrientation(layout);
        const PixelPoint p = point / size;
        const double q = m.b0 * p.x + m.b1 * p.y;
        const double r = m.b2 * p.x + m.b3 * p.y;
        return {q, r, -q - r};
    }

    HexCoord PixelToHex(const PixelPoint& point, double size, HexLayout layout)
    {
        return HexLine::Round(PixelToFractional(point, size, layout));
    }

    PixelPoint CornerOffset(int corner, double size, HexLayout layout)
    {
        HexValidation::RequireDirection(corner, "HexGeometry::CornerOffset");
        HexValidation::RequirePositiveSize(size, "HexGeometry::CornerOffset");

        // Pointy-top: first corner at 30 degrees; flat-top: at 0 degrees
        const double angle = 2.0 * SDL_PI_D * (GetOrientation(layout).startAngle + corner) / 6.0;
        return {size * SDL_cos(angle), size * SDL_sin(angle)};
    }

    std::array<PixelPoint, 6> PolygonCorners(const HexCoord& hex, double size, HexLayout layout)
    {
        const PixelPoint center = HexToPixel(hex, size, layout);

        std::array<PixelPoint, 6> corners;
        for (int i = 0; i < 6; i++)
        {
            corners[i] = center + CornerOffset(i, size, layout);
        }
        return corners;
    }

    double InnerRadius(double outerRadius)
    {
        return outerRadius * SQRT3 / 2.0;
    }
}

//
// FieldOfView.cpp - Visibility implementation
//

#include "FieldOfView.h"
#include "HexLine.h"
#include "HexMath.h"
#include "HexValidation.h"

#include <tracy/Tracy.hpp>

HexSet FieldOfView::Compute(
    const HexCoord& center,
    int radius,
    const HexSet& obstacles)
{
    ZoneScoped;
    HexValidation::RequireValid(center, "FieldOfView::Compute");
    HexValidation::RequireNonNegative(radius, "radius", "FieldOfView::Compute");

    HexSet visible;
    for (const auto& candidate : HexMath::Spiral(center, radius))
    {
        if (HasLineOfSight(center, candidate, obstacles))
        {
            visible.insert(candidate);
        }
    }

    return visible;
}

bool FieldOfView::HasLineOfSight(
    const HexCoord& from,
    const HexCoord& to,
    const HexSet& obstacles)
{
    const std::vector<HexCoord> line = HexLine::Line(from, to);

    // Skip both endpoints
    for (size_t i = 1; i + 1 < line.size(); i++)
    {
        if (obstacles.count(line[i]))
        {
            return false;
        }
    }

    return true;
}

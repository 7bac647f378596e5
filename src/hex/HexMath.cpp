//
// HexMath.cpp - Cube coordinate arithmetic and enumeration
//

#include "HexMath.h"
#include "HexValidation.h"
#include <algorithm>
#include <cstdlib>

#include <tracy/Tracy.hpp>

namespace HexMath
{
    HexCoord Add(const HexCoord& a, const HexCoord& b)
    {
        HexValidation::RequireValid(a, "HexMath::Add");
        HexValidation::RequireValid(b, "HexMath::Add");
        return a + b;
    }

    HexCoord Subtract(const HexCoord& a, const HexCoord& b)
    {
        HexValidation::RequireValid(a, "HexMath::Subtract");
        HexValidation::RequireValid(b, "HexMath::Subtract");
        return a - b;
    }

    HexCoord Scale(const HexCoord& hex, int k)
    {
        HexValidation::RequireValid(hex, "HexMath::Scale");
        HexValidation::RequireNonNegative(k, "scale factor", "HexMath::Scale");
        return HexCoord(hex.q * k, hex.r * k);
    }

    HexCoord RotateLeft(const HexCoord& hex)
    {
        HexValidation::RequireValid(hex, "HexMath::RotateLeft");
        // (q, r, s) -> (-r, -s, -q)
        return HexCoord(-hex.r, -hex.s);
    }

    HexCoord RotateRight(const HexCoord& hex)
    {
        HexValidation::RequireValid(hex, "HexMath::RotateRight");
        // (q, r, s) -> (-s, -q, -r)
        return HexCoord(-hex.s, -hex.q);
    }

    HexCoord RotateAround(const HexCoord& hex, const HexCoord& center, int steps)
    {
        HexValidation::RequireValid(hex, "HexMath::RotateAround");
        HexValidation::RequireValid(center, "HexMath::RotateAround");

        // Six lefts are the identity, so a right turn is five lefts
        const int turns = ((steps % 6) + 6) % 6;
        HexCoord offset = hex - center;
        for (int i = 0; i < turns; i++)
        {
            offset = RotateLeft(offset);
        }
        return center + offset;
    }

    int Distance(const HexCoord& a, const HexCoord& b)
    {
        HexValidation::RequireValid(a, "HexMath::Distance");
        HexValidation::RequireValid(b, "HexMath::Distance");
        // Manhattan distance in cube coordinates, divided by 2
        return (std::abs(a.q - b.q) +
                std::abs(a.r - b.r) +
                std::abs(a.s - b.s)) / 2;
    }

    int Length(const HexCoord& hex)
    {
        return Distance(hex, HexCoord());
    }

    int AxialDistance(const AxialCoord& a, const AxialCoord& b)
    {
        return Distance(AxialToCube(a), AxialToCube(b));
    }

    int OffsetDistance(const OffsetCoord& a, const OffsetCoord& b)
    {
        return Distance(OffsetToCube(a), OffsetToCube(b));
    }

    HexCoord Direction(int direction)
    {
        HexValidation::RequireDirection(direction, "HexMath::Direction");
        return HEX_DIRECTIONS[direction];
    }

    HexCoord Neighbor(const HexCoord& hex, int direction)
    {
        HexValidation::RequireValid(hex, "HexMath::Neighbor");
        return hex + Direction(direction);
    }

    HexCoord DiagonalNeighbor(const HexCoord& hex, int direction)
    {
        HexValidation::RequireValid(hex, "HexMath::DiagonalNeighbor");
        HexValidation::RequireDirection(direction, "HexMath::DiagonalNeighbor");
        return hex + HEX_DIAGONALS[direction];
    }

    std::array<HexCoord, 6> Neighbors(const HexCoord& hex)
    {
        HexValidation::RequireValid(hex, "HexMath::Neighbors");

        std::array<HexCoord, 6> neighbors;
        for (int i = 0; i < 6; i++)
        {
            neighbors[i] = hex + HEX_DIRECTIONS[i];
        }
        return neighbors;
    }

    std::vector<HexCoord> Ring(const HexCoord& center, int radius)
    {
        ZoneScoped;
        HexValidation::RequireValid(center, "HexMath::Ring");
        HexValidation::RequireNonNegative(radius, "radius", "HexMath::Ring");

        if (radius == 0)
        {
            return {center};
        }

        std::vector<HexCoord> results;
        results.reserve(6 * static_cast<size_t>(radius));

        HexCoord hex = center + Scale(HEX_DIRECTIONS[4], radius);
        for (int side = 0; side < 6; side++)
        {
            for (int step = 0; step < radius; step++)
            {
                results.push_back(hex);
                hex += HEX_DIRECTIONS[side];
            }
        }

        return results;
    }

    std::vector<HexCoord> Spiral(const HexCoord& center, int radius)
    {
        ZoneScoped;
        HexValidation::RequireValid(center, "HexMath::Spiral");
        HexValidation::RequireNonNegative(radius, "radius", "HexMath::Spiral");

        std::vector<HexCoord> results;
        results.reserve(3 * static_cast<size_t>(radius) * (radius + 1) + 1);
        results.push_back(center);

        for (int k = 1; k <= radius; k++)
        {
            std::vector<HexCoord> ring = Ring(center, k);
            results.insert(results.end(), ring.begin(), ring.end());
        }

        return results;
    }

    std::vector<HexCoord> Range(const HexCoord& center, int radius)
    {
        ZoneScoped;
        HexValidation::RequireValid(center, "HexMath::Range");
        HexValidation::RequireNonNegative(radius, "radius", "HexMath::Range");

        std::vector<HexCoord> results;
        results.reserve(3 * static_cast<size_t>(radius) * (radius + 1) + 1);

        // A hex is in range if max(|dq|, |dr|, |ds|) <= radius, where dq + dr + ds = 0
        for (int dq = -radius; dq <= radius; dq++)
        {
            int dr1 = std::max(-radius, -dq - radius);
            int dr2 = std::min(radius, -dq + radius);
            for (int dr = dr1; dr <= dr2; dr++)
            {
                results.push_back(center + HexCoord(dq, dr));
            }
        }

        return results;
    }
}

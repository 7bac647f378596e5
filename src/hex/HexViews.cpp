//
// HexViews.cpp - Axial and offset front-ends implementation
//

#include "HexViews.h"
#include "FieldOfView.h"
#include "HexLine.h"
#include "HexMath.h"
#include "HexPathfinder.h"

namespace
{
    std::vector<AxialCoord> ToAxial(const std::vector<HexCoord>& hexes)
    {
        std::vector<AxialCoord> result;
        result.reserve(hexes.size());
        for (const auto& hex : hexes)
        {
            result.push_back(CubeToAxial(hex));
        }
        return result;
    }

    std::vector<OffsetCoord> ToOffset(const std::vector<HexCoord>& hexes, OffsetScheme scheme)
    {
        std::vector<OffsetCoord> result;
        result.reserve(hexes.size());
        for (const auto& hex : hexes)
        {
            result.push_back(CubeToOffset(hex, scheme));
        }
        return result;
    }

    HexSet ToCube(const AxialSet& hexes)
    {
        HexSet result;
        for (const auto& hex : hexes)
        {
            result.insert(AxialToCube(hex));
        }
        return result;
    }

    HexSet ToCube(const OffsetSet& hexes)
    {
        HexSet result;
        for (const auto& hex : hexes)
        {
            result.insert(OffsetToCube(hex));
        }
        return result;
    }
}

namespace AxialView
{
    int Distance(const AxialCoord& a, const AxialCoord& b)
    {
        return HexMath::AxialDistance(a, b);
    }

    AxialCoord Neighbor(const AxialCoord& hex, int direction)
    {
        return CubeToAxial(HexMath::Neighbor(AxialToCube(hex), direction));
    }

    std::array<AxialCoord, 6> Neighbors(const AxialCoord& hex)
    {
        const std::array<HexCoord, 6> cube = HexMath::Neighbors(AxialToCube(hex));
        std::array<AxialCoord, 6> result;
        for (size_t i = 0; i < cube.size(); i++)
        {
            result[i] = CubeToAxial(cube[i]);
        }
        return result;
    }

    std::vector<AxialCoord> Ring(const AxialCoord& center, int radius)
    {
        return ToAxial(HexMath::Ring(AxialToCube(center), radius));
    }

    std::vector<AxialCoord> Spiral(const AxialCoord& center, int radius)
    {
        return ToAxial(HexMath::Spiral(AxialToCube(center), radius));
    }

    std::vector<AxialCoord> Line(const AxialCoord& a, const AxialCoord& b)
    {
        return ToAxial(HexLine::Line(AxialToCube(a), AxialToCube(b)));
    }

    std::optional<std::vector<AxialCoord>> FindPath(
        const AxialCoord& start, const AxialCoord& goal, const AxialSet& obstacles)
    {
        auto path = HexPathfinder::FindPath(AxialToCube(start), AxialToCube(goal), ToCube(obstacles));
        if (!path) return std::nullopt;
        return ToAxial(*path);
    }

    AxialSet Visible(const AxialCoord& center, int radius, const AxialSet& obstacles)
    {
        AxialSet result;
        for (const auto& hex : FieldOfView::Compute(AxialToCube(center), radius, ToCube(obstacles)))
        {
            result.insert(CubeToAxial(hex));
        }
        return result;
    }
}

namespace OffsetView
{
    int Distance(const OffsetCoord& a, const OffsetCoord& b)
    {
        return HexMath::OffsetDistance(a, b);
    }

    OffsetCoord Neighbor(const OffsetCoord& hex, int direction)
    {
        return CubeToOffset(HexMath::Neighbor(OffsetToCube(hex), direction), hex.scheme);
    }

    std::array<OffsetCoord, 6> Neighbors(const OffsetCoord& hex)
    {
        const std::array<HexCoord, 6> cube = HexMath::Neighbors(OffsetToCube(hex));
        std::array<OffsetCoord, 6> result;
        for (size_t i = 0; i < cube.size(); i++)
        {
            result[i] = CubeToOffset(cube[i], hex.scheme);
        }
        return result;
    }

    std::vector<OffsetCoord> Ring(const OffsetCoord& center, int radius)
    {
        return ToOffset(HexMath::Ring(OffsetToCube(center), radius), center.scheme);
    }

    std::vector<OffsetCoord> Spiral(const OffsetCoord& center, int radius)
    {
        return ToOffset(HexMath::Spiral(OffsetToCube(center), radius), center.scheme);
    }

    std::vector<OffsetCoord> Line(const OffsetCoord& a, const OffsetCoord& b)
    {
        return ToOffset(HexLine::Line(OffsetToCube(a), OffsetToCube(b)), a.scheme);
    }

    std::optional<std::vector<OffsetCoord>> FindPath(
        const OffsetCoord& start, const OffsetCoord& goal, const OffsetSet& obstacles)
    {
        auto path = HexPathfinder::FindPath(OffsetToCube(start), OffsetToCube(goal), ToCube(obstacles));
        if (!path) return std::nullopt;
        return ToOffset(*path, start.scheme);
    }

    OffsetSet Visible(const OffsetCoord& center, int radius, const OffsetSet& obstacles)
    {
        OffsetSet result;
        for (const auto& hex : FieldOfView::Compute(OffsetToCube(center), radius, ToCube(obstacles)))
        {
            result.insert(CubeToOffset(hex, center.scheme));
        }
        return result;
    }
}

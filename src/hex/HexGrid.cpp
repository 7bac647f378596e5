//
// HexGrid.cpp - Finite hex map implementation
//

#include "HexGrid.h"
#include "FieldOfView.h"
#include "HexMath.h"
#include "HexValidation.h"
#include <algorithm>
#include <limits>

#include <SDL3/SDL_log.h>
#include <tracy/Tracy.hpp>

HexGrid::HexGrid(const HexGridConfig& config)
    : _config(config)
{
    ZoneScoped;
    HexValidation::RequirePositiveSize(_config.hexSize, "HexGrid");

    if (_config.shape == HexGridShape::Hexagon)
    {
        HexValidation::RequireNonNegative(_config.radius, "radius", "HexGrid");
        GenerateHexagonalGrid();
    }
    else
    {
        HexValidation::RequireNonNegative(_config.width, "width", "HexGrid");
        HexValidation::RequireNonNegative(_config.height, "height", "HexGrid");
        GenerateRectangularGrid();
    }

    CollectBorder();

    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "HexGrid: generated %zu hexes, %zu border hexes",
                 _coords.size(), _border.size());
}

void HexGrid::GenerateHexagonalGrid()
{
    _coords = HexMath::Range(HexCoord(), _config.radius);
    _validCoords = HexSet(_coords.begin(), _coords.end());
}

void HexGrid::GenerateRectangularGrid()
{
    _coords.clear();
    _validCoords.clear();
    _coords.reserve(static_cast<size_t>(_config.width) * _config.height);

    for (int col = 0; col < _config.width; col++)
    {
        for (int row = 0; row < _config.height; row++)
        {
            HexCoord coord = OffsetToCube({col, row, _config.scheme});
            _coords.push_back(coord);
            _validCoords.insert(coord);
        }
    }
}

void HexGrid::CollectBorder()
{
    _border.clear();
    for (const auto& coord : _coords)
    {
        for (const auto& neighbor : HexMath::Neighbors(coord))
        {
            if (!IsValid(neighbor))
            {
                _border.insert(neighbor);
            }
        }
    }
}

bool HexGrid::IsValid(const HexCoord& coord) const
{
    return _validCoords.find(coord) != _validCoords.end();
}

std::vector<HexCoord> HexGrid::GetNeighbors(const HexCoord& coord) const
{
    std::vector<HexCoord> neighbors;
    neighbors.reserve(6);

    for (const auto& neighbor : HexMath::Neighbors(coord))
    {
        if (IsValid(neighbor))
        {
            neighbors.push_back(neighbor);
        }
    }

    return neighbors;
}

PixelPoint HexGrid::HexToWorld(const HexCoord& coord) const
{
    return HexGeometry::HexToPixel(coord, _config.hexSize, _config.layout);
}

HexCoord HexGrid::WorldToHex(const PixelPoint& worldPos) const
{
    return HexGeometry::PixelToHex(worldPos, _config.hexSize, _config.layout);
}

HexSet HexGrid::WithBorder(const HexSet& obstacles) const
{
    HexSet blocked = obstacles;
    blocked.insert(_border.begin(), _border.end());
    return blocked;
}

std::optional<std::vector<HexCoord>> HexGrid::FindPath(
    const HexCoord& start,
    const HexCoord& goal,
    const HexSet& obstacles) const
{
    if (!IsValid(start) || !IsValid(goal))
    {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "HexGrid::FindPath: %s -> %s leaves the grid",
                     start.ToString().c_str(), goal.ToString().c_str());
        return std::nullopt;
    }

    return HexPathfinder::FindPath(start, goal, WithBorder(obstacles));
}

HexDistanceMap HexGrid::BreadthFirst(
    const HexCoord& start,
    const HexSet& goals,
    const HexSet& obstacles,
    const SearchLimits& limits) const
{
    if (!IsValid(start))
    {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "HexGrid::BreadthFirst: start %s is outside the grid",
                    start.ToString().c_str());
        return {};
    }

    return HexPathfinder::BreadthFirst(start, goals, WithBorder(obstacles), limits);
}

HexSet HexGrid::Visible(const HexCoord& center, int radius, const HexSet& obstacles) const
{
    HexSet visible = FieldOfView::Compute(center, radius, obstacles);
    for (auto it = visible.begin(); it != visible.end();)
    {
        if (IsValid(*it))
        {
            ++it;
        }
        else
        {
            it = visible.erase(it);
        }
    }
    return visible;
}

PixelPoint HexGrid::GetWorldMin() const
{
    if (_coords.empty()) return {0, 0};

    double minX = std::numeric_limits<double>::max();
    double minY = std::numeric_limits<double>::max();

    for (const auto& coord : _coords)
    {
        PixelPoint world = HexToWorld(coord);
        minX = std::min(minX, world.x);
        minY = std::min(minY, world.y);
    }

    // Subtract hex size to account for hex geometry
    return {minX - _config.hexSize, minY - _config.hexSize};
}

PixelPoint HexGrid::GetWorldMax() const
{
    if (_coords.empty()) return {0, 0};

    double maxX = std::numeric_limits<double>::lowest();
    double maxY = std::numeric_limits<double>::lowest();

    for (const auto& coord : _coords)
    {
        PixelPoint world = HexToWorld(coord);
        maxX = std::max(maxX, world.x);
        maxY = std::max(maxY, world.y);
    }

    // Add hex size to account for hex geometry
    return {maxX + _config.hexSize, maxY + _config.hexSize};
}

PixelPoint HexGrid::GetWorldCenter() const
{
    PixelPoint min = GetWorldMin();
    PixelPoint max = GetWorldMax();
    return {(min.x + max.x) / 2.0, (min.y + max.y) / 2.0};
}

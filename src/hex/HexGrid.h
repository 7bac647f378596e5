//
// HexGrid.h - Finite hex maps with bounded search and visibility
//

#ifndef HEXNAV_HEXGRID_H
#define HEXNAV_HEXGRID_H

#include "HexCoord.h"
#include "HexGeometry.h"
#include "HexPathfinder.h"
#include <optional>
#include <vector>

enum class HexGridShape
{
    Hexagon,   // every hex within `radius` of the origin
    Rectangle  // width x height offset cells under `scheme`
};

struct HexGridConfig {
    HexGridShape shape = HexGridShape::Hexagon;
    int radius = 10; // Hexagon shape only
    int width = 20; // Rectangle shape only (columns)
    int height = 15; // Rectangle shape only (rows)
    OffsetScheme scheme = OffsetScheme::OddR; // Rectangle shape only
    double hexSize = 32.0; // Outer radius of each hex in world units
    HexLayout layout = HexLayout::Pointy;
};

class HexGrid {
public:
    // Throws std::invalid_argument for negative dimensions or a non-positive size
    explicit HexGrid(const HexGridConfig &config);

    // Check if coordinate is within the grid
    [[nodiscard]] bool IsValid(const HexCoord &coord) const;

    // Get all valid neighbors of a coordinate, in direction order
    [[nodiscard]] std::vector<HexCoord> GetNeighbors(const HexCoord &coord) const;

    // Get all coordinates in the grid, in generation order
    [[nodiscard]] const std::vector<HexCoord> &GetAllCoords() const { return _coords; }

    // Get total number of hexes
    [[nodiscard]] size_t GetHexCount() const { return _coords.size(); }

    // Hexes just outside the grid that touch it
    [[nodiscard]] const HexSet &GetBorder() const { return _border; }

    // Coordinate conversions
    [[nodiscard]] PixelPoint HexToWorld(const HexCoord &coord) const;

    [[nodiscard]] HexCoord WorldToHex(const PixelPoint &worldPos) const;

    // Searches confined to the grid. Out-of-grid endpoints never connect.
    [[nodiscard]] std::optional<std::vector<HexCoord>> FindPath(
        const HexCoord &start,
        const HexCoord &goal,
        const HexSet &obstacles) const;

    [[nodiscard]] HexDistanceMap BreadthFirst(
        const HexCoord &start,
        const HexSet &goals,
        const HexSet &obstacles,
        const SearchLimits &limits = {}) const;

    [[nodiscard]] HexSet Visible(const HexCoord &center, int radius, const HexSet &obstacles) const;

    // Get world bounds
    [[nodiscard]] PixelPoint GetWorldMin() const;

    [[nodiscard]] PixelPoint GetWorldMax() const;

    [[nodiscard]] PixelPoint GetWorldCenter() const;

private:
    HexGridConfig _config;
    std::vector<HexCoord> _coords;
    HexSet _validCoords;
    HexSet _border;

    void GenerateHexagonalGrid();

    void GenerateRectangularGrid();

    void CollectBorder();

    // Caller obstacles plus the border, so searches cannot leave the grid
    [[nodiscard]] HexSet WithBorder(const HexSet &obstacles) const;
};

#endif // HEXNAV_HEXGRID_H

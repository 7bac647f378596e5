//
// HexViews.h - Axial and offset front-ends over the cube coordinate core
//

#ifndef HEXNAV_HEXVIEWS_H
#define HEXNAV_HEXVIEWS_H

#include "HexCoord.h"
#include <array>
#include <optional>
#include <unordered_set>
#include <vector>

using AxialSet = std::unordered_set<AxialCoord, AxialCoordHash>;
using OffsetSet = std::unordered_set<OffsetCoord, OffsetCoordHash>;

// Every call converts to cube, runs the cube operation and converts back.
namespace AxialView
{
    [[nodiscard]] int Distance(const AxialCoord& a, const AxialCoord& b);
    [[nodiscard]] AxialCoord Neighbor(const AxialCoord& hex, int direction);
    [[nodiscard]] std::array<AxialCoord, 6> Neighbors(const AxialCoord& hex);
    [[nodiscard]] std::vector<AxialCoord> Ring(const AxialCoord& center, int radius);
    [[nodiscard]] std::vector<AxialCoord> Spiral(const AxialCoord& center, int radius);
    [[nodiscard]] std::vector<AxialCoord> Line(const AxialCoord& a, const AxialCoord& b);
    [[nodiscard]] std::optional<std::vector<AxialCoord>> FindPath(
        const AxialCoord& start, const AxialCoord& goal, const AxialSet& obstacles);
    [[nodiscard]] AxialSet Visible(const AxialCoord& center, int radius, const AxialSet& obstacles);
}

// Each input is read under the scheme it carries. Results are reported in
// the scheme of the first coordinate argument (center, a or start).
namespace OffsetView
{
    [[nodiscard]] int Distance(const OffsetCoord& a, const OffsetCoord& b);
    [[nodiscard]] OffsetCoord Neighbor(const OffsetCoord& hex, int direction);
    [[nodiscard]] std::array<OffsetCoord, 6> Neighbors(const OffsetCoord& hex);
    [[nodiscard]] std::vector<OffsetCoord> Ring(const OffsetCoord& center, int radius);
    [[nodiscard]] std::vector<OffsetCoord> Spiral(const OffsetCoord& center, int radius);
    [[nodiscard]] std::vector<OffsetCoord> Line(const OffsetCoord& a, const OffsetCoord& b);
    [[nodiscard]] std::optional<std::vector<OffsetCoord>> FindPath(
        const OffsetCoord& start, const OffsetCoord& goal, const OffsetSet& obstacles);
    [[nodiscard]] OffsetSet Visible(const OffsetCoord& center, int radius, const OffsetSet& obstacles);
}

#endif // HEXNAV_HEXVIEWS_H

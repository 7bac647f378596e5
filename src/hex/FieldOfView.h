//
// FieldOfView.h - Line-of-sight visibility over a set of blocking hexes
//

#ifndef HEXNAV_FIELDOFVIEW_H
#define HEXNAV_FIELDOFVIEW_H

#include "HexCoord.h"

// Visibility is sampled along HexLine::Line, so it approximates true
// geometric line of sight and can disagree with it next to obstacle edges.
class FieldOfView
{
public:
    // Hexes within `radius` of center with no obstacle strictly between them
    // and the center. An obstacle can itself be seen but hides what is behind it.
    [[nodiscard]] static HexSet Compute(
        const HexCoord& center,
        int radius,
        const HexSet& obstacles
    );

    // True if no hex strictly between from and to is an obstacle
    [[nodiscard]] static bool HasLineOfSight(
        const HexCoord& from,
        const HexCoord& to,
        const HexSet& obstacles
    );
};

#endif // HEXNAV_FIELDOFVIEW_H

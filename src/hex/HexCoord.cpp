//
// HexCoord.cpp - Coordinate conversions
//

#include "HexCoord.h"
#include "HexValidation.h"

HexCoord HexCoord::FromCube(int q, int r, int s)
{
    HexCoord hex = Raw(q, r, s);
    HexValidation::RequireValid(hex, "HexCoord::FromCube");
    return hex;
}

std::string HexCoord::ToString() const
{
    return "(" + std::to_string(q) + ", " + std::to_string(r) + ", " + std::to_string(s) + ")";
}

const char* OffsetSchemeName(OffsetScheme scheme)
{
    switch (scheme)
    {
        case OffsetScheme::OddR: return "odd-r";
        case OffsetScheme::EvenR: return "even-r";
        case OffsetScheme::OddQ: return "odd-q";
        case OffsetScheme::EvenQ: return "even-q";
    }
    return "unknown";
}

AxialCoord CubeToAxial(const HexCoord& hex)
{
    HexValidation::RequireValid(hex, "CubeToAxial");
    return {hex.q, hex.r};
}

// The shifted term is always even, so the division is exact for negative
// rows and columns as well.

OffsetPair CubeToOddR(const HexCoord& hex)
{
    HexValidation::RequireValid(hex, "CubeToOddR");
    return {hex.q + (hex.r - (hex.r & 1)) / 2, hex.r};
}

HexCoord OddRToCube(const OffsetPair& hex)
{
    return HexCoord(hex.col - (hex.row - (hex.row & 1)) / 2, hex.row);
}

OffsetPair CubeToEvenR(const HexCoord& hex)
{
    HexValidation::RequireValid(hex, "CubeToEvenR");
    return {hex.q + (hex.r + (hex.r & 1)) / 2, hex.r};
}

HexCoord EvenRToCube(const OffsetPair& hex)
{
    return HexCoord(hex.col - (hex.row + (hex.row & 1)) / 2, hex.row);
}

OffsetPair CubeToOddQ(const HexCoord& hex)
{
    HexValidation::RequireValid(hex, "CubeToOddQ");
    return {hex.q, hex.r + (hex.q - (hex.q & 1)) / 2};
}

HexCoord OddQToCube(const OffsetPair& hex)
{
    return HexCoord(hex.col, hex.row - (hex.col - (hex.col & 1)) / 2);
}

OffsetPair CubeToEvenQ(const HexCoord& hex)
{
    HexValidation::RequireValid(hex, "CubeToEvenQ");
    return {hex.q, hex.r + (hex.q + (hex.q & 1)) / 2};
}

HexCoord EvenQToCube(const OffsetPair& hex)
{
    return HexCoord(hex.col, hex.row - (hex.col + (hex.col & 1)) / 2);
}

OffsetCoord CubeToOffset(const HexCoord& hex, OffsetScheme scheme)
{
    OffsetPair pair;
    switch (scheme)
    {
        case OffsetScheme::OddR: pair = CubeToOddR(hex); break;
        case OffsetScheme::EvenR: pair = CubeToEvenR(hex); break;
        case OffsetScheme::OddQ: pair = CubeToOddQ(hex); break;
        case OffsetScheme::EvenQ: pair = CubeToEvenQ(hex); break;
    }
    return {pair.col, pair.row, scheme};
}

HexCoord OffsetToCube(const OffsetCoord& hex)
{
    const OffsetPair pair{hex.col, hex.row};
    switch (hex.scheme)
    {
        case OffsetScheme::OddR: return OddRToCube(pair);
        case OffsetScheme::EvenR: return EvenRToCube(pair);
        case OffsetScheme::OddQ: return OddQToCube(pair);
        case OffsetScheme::EvenQ: return EvenQToCube(pair);
    }
    return OddRToCube(pair);
}

//
// HexCoord.h - Cube, axial and offset coordinate systems for hexagonal grids
//

#ifndef HEXNAV_HEXCOORD_H
#define HEXNAV_HEXCOORD_H

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <unordered_set>

// Cube coordinates (q, r, s) with q + r + s == 0.
// This is the canonical representation; axial and offset are views of it.
struct HexCoord
{
    int q = 0;
    int r = 0;
    int s = 0;

    HexCoord() = default;
    constexpr HexCoord(int q, int r) : q(q), r(r), s(-q - r) {}

    // Builds a hex from all three components. Throws std::invalid_argument
    // unless q + r + s == 0.
    [[nodiscard]] static HexCoord FromCube(int q, int r, int s);

    [[nodiscard]] constexpr bool IsValid() const { return q + r + s == 0; }

    [[nodiscard]] std::string ToString() const;

    [[nodiscard]] constexpr bool operator==(const HexCoord& other) const
    {
        return q == other.q && r == other.r && s == other.s;
    }

    [[nodiscard]] constexpr bool operator!=(const HexCoord& other) const
    {
        return !(*this == other);
    }

    [[nodiscard]] constexpr HexCoord operator+(const HexCoord& other) const
    {
        return Raw(q + other.q, r + other.r, s + other.s);
    }

    [[nodiscard]] constexpr HexCoord operator-(const HexCoord& other) const
    {
        return Raw(q - other.q, r - other.r, s - other.s);
    }

    HexCoord& operator+=(const HexCoord& other)
    {
        q += other.q;
        r += other.r;
        s += other.s;
        return *this;
    }

    // For ordered containers (std::map, std::set, priority queues)
    [[nodiscard]] constexpr bool operator<(const HexCoord& other) const
    {
        if (q != other.q) return q < other.q;
        if (r != other.r) return r < other.r;
        return s < other.s;
    }

private:
    // Componentwise results keep whatever sum the operands had
    [[nodiscard]] static constexpr HexCoord Raw(int q, int r, int s)
    {
        HexCoord h;
        h.q = q;
        h.r = r;
        h.s = s;
        return h;
    }
};

// Axial coordinates (q, r); s is implied as -q - r
struct AxialCoord
{
    int q = 0;
    int r = 0;

    [[nodiscard]] constexpr bool operator==(const AxialCoord& other) const
    {
        return q == other.q && r == other.r;
    }

    [[nodiscard]] constexpr bool operator!=(const AxialCoord& other) const
    {
        return !(*this == other);
    }
};

// Parity rule used to shove alternate rows (r) or columns (q) of a
// rectangular offset layout
enum class OffsetScheme
{
    OddR,   // pointy-top, odd rows shoved right
    EvenR,  // pointy-top, even rows shoved right
    OddQ,   // flat-top, odd columns shoved down
    EvenQ   // flat-top, even columns shoved down
};

// Bare (col, row) pair, only meaningful with a known scheme
struct OffsetPair
{
    int col = 0;
    int row = 0;

    [[nodiscard]] constexpr bool operator==(const OffsetPair& other) const
    {
        return col == other.col && row == other.row;
    }
};

// Offset coordinates tagged with the scheme they were produced under
struct OffsetCoord
{
    int col = 0;
    int row = 0;
    OffsetScheme scheme = OffsetScheme::OddR;

    [[nodiscard]] constexpr bool operator==(const OffsetCoord& other) const
    {
        return col == other.col && row == other.row && scheme == other.scheme;
    }

    [[nodiscard]] constexpr bool operator!=(const OffsetCoord& other) const
    {
        return !(*this == other);
    }
};

struct HexCoordHash
{
    std::size_t operator()(const HexCoord& coord) const noexcept
    {
        // s is redundant for valid coordinates
        std::size_t h1 = std::hash<int>{}(coord.q);
        std::size_t h2 = std::hash<int>{}(coord.r);
        return h1 ^ (h2 << 1);
    }
};

struct AxialCoordHash
{
    std::size_t operator()(const AxialCoord& coord) const noexcept
    {
        std::size_t h1 = std::hash<int>{}(coord.q);
        std::size_t h2 = std::hash<int>{}(coord.r);
        return h1 ^ (h2 << 1);
    }
};

struct OffsetCoordHash
{
    std::size_t operator()(const OffsetCoord& coord) const noexcept
    {
        std::size_t h1 = std::hash<int>{}(coord.col);
        std::size_t h2 = std::hash<int>{}(coord.row);
        std::size_t h3 = std::hash<int>{}(static_cast<int>(coord.scheme));
        return h1 ^ (h2 << 1) ^ (h3 << 2);
    }
};

// Obstacle and result sets used by search and visibility
using HexSet = std::unordered_set<HexCoord, HexCoordHash>;
using HexDistanceMap = std::unordered_map<HexCoord, int, HexCoordHash>;

[[nodiscard]] const char* OffsetSchemeName(OffsetScheme scheme);

// Axial <-> cube
[[nodiscard]] constexpr HexCoord AxialToCube(const AxialCoord& hex) { return HexCoord(hex.q, hex.r); }
[[nodiscard]] AxialCoord CubeToAxial(const HexCoord& hex);

// Per-scheme offset conversions on bare pairs.
// The caller is responsible for pairing each formula with the scheme the
// value was produced under; prefer CubeToOffset/OffsetToCube which carry it.
[[nodiscard]] OffsetPair CubeToOddR(const HexCoord& hex);
[[nodiscard]] HexCoord OddRToCube(const OffsetPair& hex);
[[nodiscard]] OffsetPair CubeToEvenR(const HexCoord& hex);
[[nodiscard]] HexCoord EvenRToCube(const OffsetPair& hex);
[[nodiscard]] OffsetPair CubeToOddQ(const HexCoord& hex);
[[nodiscard]] HexCoord OddQToCube(const OffsetPair& hex);
[[nodiscard]] OffsetPair CubeToEvenQ(const HexCoord& hex);
[[nodiscard]] HexCoord EvenQToCube(const OffsetPair& hex);

// Tagged offset conversions
[[nodiscard]] OffsetCoord CubeToOffset(const HexCoord& hex, OffsetScheme scheme);
[[nodiscard]] HexCoord OffsetToCube(const OffsetCoord& hex);

#endif // HEXNAV_HEXCOORD_H

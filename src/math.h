//
// math.h - Real-valued helpers shared by line drawing and pixel mapping
//

#ifndef HEXNAV_MATH_H
#define HEXNAV_MATH_H

#include <SDL3/SDL_stdinc.h>

constexpr double SQRT3 = 1.7320508075688772;

// A point in the continuous rendering plane
struct PixelPoint
{
    double x = 0, y = 0;

    [[nodiscard]] static double DistanceBetween(const PixelPoint& p1, const PixelPoint& p2)
    {
        const double dx = p2.x - p1.x;
        const double dy = p2.y - p1.y;
        return SDL_sqrt(dx * dx + dy * dy);
    }

    PixelPoint() = default;

    constexpr PixelPoint(const double x, const double y) : x(x), y(y)
    {
    }

    [[nodiscard]] double DistanceBetween(const PixelPoint& p2) const { return DistanceBetween(*this, p2); }

    [[nodiscard]] PixelPoint operator*(const double f) const { return {x * f, y * f}; }
    [[nodiscard]] PixelPoint operator/(const double f) const { return {x / f, y / f}; }
    [[nodiscard]] PixelPoint operator+(const PixelPoint& p) const { return {x + p.x, y + p.y}; }
    [[nodiscard]] PixelPoint operator-(const PixelPoint& p) const { return {x - p.x, y - p.y}; }

    [[nodiscard]] bool operator==(const PixelPoint& p) const { return x == p.x && y == p.y; }
    [[nodiscard]] bool operator!=(const PixelPoint& p) const { return !(*this == p); }
};

// Real-valued cube coordinate. Only meaningful as an intermediate before rounding.
struct FractionalHex
{
    double q = 0, r = 0, s = 0;

    FractionalHex() = default;

    constexpr FractionalHex(const double q, const double r, const double s) : q(q), r(r), s(s)
    {
    }

    [[nodiscard]] FractionalHex operator+(const FractionalHex& h) const { return {q + h.q, r + h.r, s + h.s}; }
    [[nodiscard]] FractionalHex operator-(const FractionalHex& h) const { return {q - h.q, r - h.r, s - h.s}; }
    [[nodiscard]] FractionalHex operator*(const double f) const { return {q * f, r * f, s * f}; }

    [[nodiscard]] static FractionalHex Lerp(const FractionalHex& a, const FractionalHex& b, const double t)
    {
        return a + (b - a) * t;
    }
};

#endif // HEXNAV_MATH_H

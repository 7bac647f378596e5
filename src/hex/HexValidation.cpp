//
// HexValidation.cpp - Input checks implementation
//

#define LogError(...) (SDL_LogError(SDL_LOG_CATEGORY_ERROR, __VA_ARGS__))

#include "HexValidation.h"

#include <cmath>
#include <stdexcept>
#include <string>
#include <SDL3/SDL_log.h>

namespace HexValidation
{
    void RequireValid(const HexCoord& hex, const char* operation)
    {
        if (hex.IsValid()) return;

        LogError("%s: invalid cube coordinate %s (q + r + s = %d)",
                 operation, hex.ToString().c_str(), hex.q + hex.r + hex.s);
        throw std::invalid_argument(std::string(operation) + ": invalid cube coordinate " + hex.ToString());
    }

    void RequireNonNegative(int value, const char* what, const char* operation)
    {
        if (value >= 0) return;

        LogError("%s: negative %s %d", operation, what, value);
        throw std::invalid_argument(std::string(operation) + ": negative " + what + " " + std::to_string(value));
    }

    void RequireDirection(int direction, const char* operation)
    {
        if (direction >= 0 && direction < 6) return;

        LogError("%s: direction %d outside 0..5", operation, direction);
        throw std::invalid_argument(std::string(operation) + ": direction " + std::to_string(direction) +
                                    " outside 0..5");
    }

    void RequirePositiveSize(double size, const char* operation)
    {
        if (std::isfinite(size) && size > 0.0) return;

        LogError("%s: hex size %f must be finite and positive", operation, size);
        throw std::invalid_argument(std::string(operation) + ": hex size must be finite and positive");
    }

    void RequireFinitePoint(const PixelPoint& point, const char* operation)
    {
        if (std::isfinite(point.x) && std::isfinite(point.y)) return;

        LogError("%s: non-finite point (%f, %f)", operation, point.x, point.y);
        throw std::invalid_argument(std::string(operation) + ": non-finite point");
    }

    void RequireRoundable(const FractionalHex& frac, const char* operation)
    {
        const auto inRange = [](double v) { return std::isfinite(v) && std::fabs(v) <= MAX_ROUNDABLE; };
        if (inRange(frac.q) && inRange(frac.r) && inRange(frac.s)) return;

        LogError("%s: fractional hex (%f, %f, %f) is outside the coordinate range",
                 operation, frac.q, frac.r, frac.s);
        throw std::invalid_argument(std::string(operation) + ": fractional hex outside the coordinate range");
    }
}

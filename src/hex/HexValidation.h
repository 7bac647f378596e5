//
// HexValidation.h - Input checks shared by every public hex operation
//

#ifndef HEXNAV_HEXVALIDATION_H
#define HEXNAV_HEXVALIDATION_H

#include "HexCoord.h"
#include "../math.h"

// Each check logs through SDL and throws std::invalid_argument on failure.
// `operation` names the public call being validated and prefixes the message.
namespace HexValidation
{
    void RequireValid(const HexCoord& hex, const char* operation);

    void RequireNonNegative(int value, const char* what, const char* operation);

    void RequireDirection(int direction, const char* operation);

    // Pixel sizes must be finite and strictly positive
    void RequirePositiveSize(double size, const char* operation);

    void RequireFinitePoint(const PixelPoint& point, const char* operation);

    // Largest component magnitude that rounds to a HexCoord without int overflow
    inline constexpr double MAX_ROUNDABLE = 1073741823.0;

    // Fractional components must be finite and within MAX_ROUNDABLE
    void RequireRoundable(const FractionalHex& frac, const char* operation);
}

#endif // HEXNAV_HEXVALIDATION_H

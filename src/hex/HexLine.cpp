//
// HexLine.cpp - Line drawing implementation
//

#include "HexLine.h"
#include "HexMath.h"
#include "HexValidation.h"
#include <cstdint>

#include <tracy/Tracy.hpp>

namespace HexLine
{
    FractionalHex ToFractional(const HexCoord& hex)
    {
        return {static_cast<double>(hex.q), static_cast<double>(hex.r), static_cast<double>(hex.s)};
    }

    HexCoord Round(const FractionalHex& frac)
    {
        HexValidation::RequireRoundable(frac, "HexLine::Round");

        int rq = static_cast<int>(SDL_round(frac.q));
        int rr = static_cast<int>(SDL_round(frac.r));
        int rs = static_cast<int>(SDL_round(frac.s));

        const double qDiff = SDL_fabs(static_cast<double>(rq) - frac.q);
        const double rDiff = SDL_fabs(static_cast<double>(rr) - frac.r);
        const double sDiff = SDL_fabs(static_cast<double>(rs) - frac.s);

        // Reset the coordinate with the largest rounding error
        if (qDiff > rDiff && qDiff > sDiff)
        {
            rq = -rr - rs;
        }
        else if (rDiff > sDiff)
        {
            rr = -rq - rs;
        }
        else
        {
            rs = -rq - rr;
        }

        return HexCoord::FromCube(rq, rr, rs);
    }

    FractionalHex Lerp(const FractionalHex& a, const FractionalHex& b, double t)
    {
        return FractionalHex::Lerp(a, b, t);
    }

    std::vector<HexCoord> Line(const HexCoord& a, const HexCoord& b)
    {
        ZoneScoped;
        const int n = HexMath::Distance(a, b);
        if (n == 0)
        {
            return {a};
        }

        std::vector<HexCoord> results;
        results.reserve(static_cast<size_t>(n) + 1);

        // Interpolate the integer endpoints as (a * (n - i) + b * i) / n, which
        // is exact in the numerator and symmetric in a and b, then apply the
        // nudge. Equivalent to nudging both endpoints before interpolating.
        // The numerator is 64-bit: coordinate times length overflows int.
        const double dn = static_cast<double>(n);
        for (int i = 0; i <= n; i++)
        {
            const int64_t wa = n - i;
            const int64_t wb = i;
            FractionalHex sample(
                static_cast<double>(a.q * wa + b.q * wb) / dn,
                static_cast<double>(a.r * wa + b.r * wb) / dn,
                static_cast<double>(a.s * wa + b.s * wb) / dn);
            results.push_back(Round(sample + LINE_NUDGE));
        }

        return results;
    }
}

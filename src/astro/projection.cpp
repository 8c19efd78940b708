/// @file projection.cpp
/// @brief Implementation of the orthographic chart projection.

#include "astro/projection.hpp"

#include <algorithm>
#include <cmath>

namespace skychart::astro
{

// -----------------------------------------------------------------
// Orthographic (SIN) projection
//
//   Δα = α - α0
//   l  = cos(δ) × sin(Δα)
//   m  = sin(δ) × cos(δ0) - cos(δ) × sin(δ0) × cos(Δα)
// -----------------------------------------------------------------

Vec2d Projection::radec_to_lm(const EquatorialCoord& pos, const EquatorialCoord& centre)
{
    const f64 delta_ra = pos.ra - centre.ra;

    const f64 sin_dec  = std::sin(pos.dec);
    const f64 cos_dec  = std::cos(pos.dec);
    const f64 sin_dec0 = std::sin(centre.dec);
    const f64 cos_dec0 = std::cos(centre.dec);

    const f64 l = cos_dec * std::sin(delta_ra);
    const f64 m = sin_dec * cos_dec0 - cos_dec * sin_dec0 * std::cos(delta_ra);

    return Vec2d{l, m};
}

// -----------------------------------------------------------------
// cos(c) = sin(δ1) × sin(δ2) + cos(δ1) × cos(δ2) × cos(Δα)
// -----------------------------------------------------------------

f64 Projection::angular_distance(const EquatorialCoord& a, const EquatorialCoord& b)
{
    const f64 cos_c = std::sin(a.dec) * std::sin(b.dec)
                    + std::cos(a.dec) * std::cos(b.dec) * std::cos(a.ra - b.ra);
    return std::acos(std::clamp(cos_c, -1.0, 1.0));
}

// -----------------------------------------------------------------
// Chart x = -l, y = m. Differentiating with respect to δ:
//
//   dx/dδ =  sin(δ) × sin(Δα)
//   dy/dδ =  cos(δ) × cos(δ0) + sin(δ) × sin(δ0) × cos(Δα)
//
// A counter-clockwise rotation of +y by θ gives (-sin θ, cos θ), so
//   θ = atan2(-dx/dδ, dy/dδ)
// -----------------------------------------------------------------

f64 Projection::direction_ddec(const EquatorialCoord& pos, const EquatorialCoord& centre)
{
    const f64 delta_ra = pos.ra - centre.ra;

    const f64 dx = std::sin(pos.dec) * std::sin(delta_ra);
    const f64 dy = std::cos(pos.dec) * std::cos(centre.dec)
                 + std::sin(pos.dec) * std::sin(centre.dec) * std::cos(delta_ra);

    return std::atan2(-dx, dy);
}

f64 Projection::normalize_radians(f64 angle)
{
    angle = std::fmod(angle, astro_constants::kTwoPi);
    if (angle < 0.0)
    {
        angle += astro_constants::kTwoPi;
    }
    return angle;
}

} // namespace skychart::astro

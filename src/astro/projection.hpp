#pragma once

/// @file projection.hpp
/// @brief Orthographic tangent-plane projection and spherical helpers for chart drawing.

#include "core/types.hpp"

namespace skychart::astro
{
    /// @brief Equatorial coordinate (J2000 epoch).
    struct EquatorialCoord
    {
        f64 ra;     ///< Right ascension (radians, 0..2π)
        f64 dec;    ///< Declination (radians, -π/2..+π/2)
    };

    /// @brief Static utility class for the sky-to-plane transforms used by the chart.
    ///
    /// All angular inputs and outputs are in radians. The tangent plane is the
    /// orthographic (SIN) projection about a field centre; (l, m) are
    /// dimensionless direction cosines with l growing eastwards and m northwards.
    class Projection
    {
    public:
        Projection() = delete;

        /// @brief Project an equatorial position onto the tangent plane at @p centre.
        /// @return (l, m); (0, 0) at the centre itself.
        [[nodiscard]] static Vec2d radec_to_lm(const EquatorialCoord& pos,
                                               const EquatorialCoord& centre);

        /// @brief Great-circle separation between two positions (radians, 0..π).
        [[nodiscard]] static f64 angular_distance(const EquatorialCoord& a,
                                                  const EquatorialCoord& b);

        /// @brief Direction of increasing declination at @p pos on the chart.
        ///
        /// Measured counter-clockwise from the chart's +y axis (north up,
        /// east left). Zero on the central meridian.
        [[nodiscard]] static f64 direction_ddec(const EquatorialCoord& pos,
                                                const EquatorialCoord& centre);

        /// @brief Normalize an angle to the range [0, 2π).
        [[nodiscard]] static f64 normalize_radians(f64 angle);
    };

} // namespace skychart::astro

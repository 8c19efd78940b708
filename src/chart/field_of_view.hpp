#pragma once

/// @file field_of_view.hpp
/// @brief Sky region of one chart and its mapping to map millimetres.

#include "astro/projection.hpp"
#include "core/types.hpp"

namespace skychart::chart
{
    /// @brief Field centre, angular radius and drawing scale of one render pass.
    ///
    /// Map coordinates are millimetres from the field centre with east to the
    /// left and north up.
    struct FieldOfView
    {
        /// Fraction of the half drawing width covered by the field radius.
        static constexpr f64 kBaseScale = 0.98;

        astro::EquatorialCoord centre{0.0, 0.0};
        f64 radius = 0.0;           ///< Angular radius (radians)
        f64 drawing_scale = 0.0;    ///< mm per radian of tangent plane

        /// @brief Field whose radius spans kBaseScale of half the drawing width.
        [[nodiscard]] static FieldOfView from_drawing_width(const astro::EquatorialCoord& centre,
                                                            f64 radius_rad,
                                                            f64 drawing_width_mm);

        /// @brief Half the side of the map square (mm).
        [[nodiscard]] f64 field_radius_mm() const;

        [[nodiscard]] bool contains(const astro::EquatorialCoord& pos) const;

        [[nodiscard]] Vec2d to_map(const astro::EquatorialCoord& pos) const;

        [[nodiscard]] Vec2d to_map(f64 ra, f64 dec) const
        {
            return to_map(astro::EquatorialCoord{ra, dec});
        }
    };

} // namespace skychart::chart

/// @file field_of_view.cpp
/// @brief FieldOfView implementation.

#include "chart/field_of_view.hpp"

#include <cmath>

namespace skychart::chart
{

FieldOfView FieldOfView::from_drawing_width(const astro::EquatorialCoord& centre,
                                            f64 radius_rad,
                                            f64 drawing_width_mm)
{
    return FieldOfView{
        .centre = centre,
        .radius = radius_rad,
        .drawing_scale = kBaseScale * drawing_width_mm / 2.0 / std::sin(radius_rad),
    };
}

f64 FieldOfView::field_radius_mm() const
{
    return drawing_scale * std::sin(radius);
}

bool FieldOfView::contains(const astro::EquatorialCoord& pos) const
{
    return astro::Projection::angular_distance(pos, centre) < radius;
}

Vec2d FieldOfView::to_map(const astro::EquatorialCoord& pos) const
{
    const Vec2d lm = astro::Projection::radec_to_lm(pos, centre);
    return Vec2d{-lm.x * drawing_scale, lm.y * drawing_scale};
}

} // namespace skychart::chart

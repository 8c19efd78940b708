/// @file symbol_shape.cpp
/// @brief Shape construction and per-shape candidate dispatch.

#include "chart/symbol_shape.hpp"

#include <cmath>

namespace skychart::chart
{

namespace
{

template <class... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

constexpr f64 kSqrt2 = 1.4142135623730951;

} // anonymous namespace

SymbolShape make_symbol_shape(catalog::DsoType type,
                              f64 rlong_mm,
                              f64 rshort_mm,
                              f64 angle,
                              f64 default_radius)
{
    using catalog::DsoType;

    const f64 r = rlong_mm > 0.0 ? rlong_mm : default_radius;

    switch (type)
    {
        case DsoType::Galaxy:
        {
            const f64 rshort = (rlong_mm > 0.0 && rshort_mm > 0.0) ? rshort_mm : r / 2.0;
            return EllipseShape{r, rshort, normalize_position_angle(angle)};
        }
        case DsoType::DiffuseNebula:
            return RectangleShape{r};
        case DsoType::OpenCluster:
            return CircleShape{CircleKind::OpenCluster, r};
        case DsoType::GlobularCluster:
            return CircleShape{CircleKind::GlobularCluster, r};
        case DsoType::PlanetaryNebula:
            return CircleShape{CircleKind::PlanetaryNebula, r};
        case DsoType::SupernovaRemnant:
            return CircleShape{CircleKind::SupernovaRemnant, r};
        case DsoType::Asterism:
            return DiamondShape{r};
        case DsoType::GalaxyCluster:
        case DsoType::Unknown:
            return CrossShape{r};
    }
    return CrossShape{r};
}

f64 frame_angle(const SymbolShape& shape)
{
    if (const auto* ellipse = std::get_if<EllipseShape>(&shape))
    {
        return ellipse->angle;
    }
    return 0.0;
}

CandidateList local_candidates(const SymbolShape& shape, f64 label_width, f64 font_size)
{
    return std::visit(Overloaded{
        [&](const EllipseShape& s)
        {
            return box_candidates(s.rlong, s.rshort, label_width, font_size);
        },
        [&](const RectangleShape& s)
        {
            return box_candidates(s.half_size, s.half_size, label_width, font_size);
        },
        [&](const CircleShape& s)
        {
            const f64 outer = s.kind == CircleKind::PlanetaryNebula ? 1.5 * s.radius : s.radius;
            return circle_candidates(outer, label_width, font_size);
        },
        [&](const DiamondShape& s)
        {
            return diamond_candidates(s.radius / kSqrt2, label_width, font_size);
        },
        [&](const CrossShape& s)
        {
            const f64 d = s.radius / kSqrt2;
            return box_candidates(d, d, label_width, font_size);
        },
    }, shape);
}

CandidateList map_candidates(const SymbolShape& shape, Vec2d centre, f64 label_width, f64 font_size)
{
    return transform_candidates(local_candidates(shape, label_width, font_size), centre, frame_angle(shape));
}

} // namespace skychart::chart

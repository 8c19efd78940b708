#pragma once

/// @file symbol_shape.hpp
/// @brief Closed set of deep-sky symbol outlines and their label candidates.

#include "catalog/deepsky_object.hpp"
#include "chart/label_candidates.hpp"
#include "core/types.hpp"

#include <variant>

namespace skychart::chart
{
    /// @brief Galaxy: ellipse with semi-axes rlong, rshort rotated by angle.
    struct EllipseShape
    {
        f64 rlong = 0.0;
        f64 rshort = 0.0;
        f64 angle = 0.0;    ///< In (-π/2, π/2]
    };

    /// @brief Diffuse nebula: axis-aligned square of half side half_size.
    struct RectangleShape
    {
        f64 half_size = 0.0;
    };

    enum class CircleKind : u8
    {
        OpenCluster,
        GlobularCluster,
        PlanetaryNebula,
        SupernovaRemnant,
    };

    /// @brief Circular symbols; kind selects the decoration.
    struct CircleShape
    {
        CircleKind kind = CircleKind::OpenCluster;
        f64 radius = 0.0;
    };

    /// @brief Asterism: dashed square standing on a corner.
    struct DiamondShape
    {
        f64 radius = 0.0;
    };

    /// @brief Unknown object or galaxy cluster: "X" with half-diagonal radius/√2.
    struct CrossShape
    {
        f64 radius = 0.0;
    };

    using SymbolShape = std::variant<EllipseShape, RectangleShape, CircleShape, DiamondShape, CrossShape>;

    /// @brief Shape for a deep-sky type with projected sizes (mm) and map orientation.
    ///
    /// A non-positive @p rlong_mm selects @p default_radius. A galaxy without
    /// a positive short axis gets half its long axis.
    [[nodiscard]] SymbolShape make_symbol_shape(catalog::DsoType type,
                                                f64 rlong_mm,
                                                f64 rshort_mm,
                                                f64 angle,
                                                f64 default_radius);

    /// @brief Rotation of the shape's own frame on the map (0 unless an ellipse).
    [[nodiscard]] f64 frame_angle(const SymbolShape& shape);

    /// @brief Candidates relative to the symbol centre, in the shape's own frame.
    [[nodiscard]] CandidateList local_candidates(const SymbolShape& shape, f64 label_width, f64 font_size);

    /// @brief Candidates in map coordinates for a symbol centred at @p centre.
    [[nodiscard]] CandidateList map_candidates(const SymbolShape& shape, Vec2d centre,
                                               f64 label_width, f64 font_size);

} // namespace skychart::chart

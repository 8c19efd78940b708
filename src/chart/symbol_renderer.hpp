#pragma once

/// @file symbol_renderer.hpp
/// @brief Draws deep-sky symbols, stars and their labels through a Painter.

#include "chart/chart_options.hpp"
#include "chart/label_candidates.hpp"
#include "chart/symbol_shape.hpp"
#include "core/types.hpp"
#include "graphics/painter.hpp"

#include <string>

namespace skychart::chart
{
    /// @brief Star disc radius (mm) for @p magnitude on a chart to @p limiting_magnitude.
    ///
    /// 0.15 · 1.33^(limiting_magnitude - magnitude). Strictly decreasing in
    /// magnitude; rounding to the drawing grid happens in draw_star().
    [[nodiscard]] f64 magnitude_to_radius(f64 magnitude, f64 limiting_magnitude);

    /// @brief Round a length to 0.01 mm.
    [[nodiscard]] f64 round_to_grid(f64 value);

    class SymbolRenderer
    {
    public:
        static constexpr f64 kDashOn = 0.6;     ///< mm
        static constexpr f64 kDashOff = 0.4;    ///< mm

        SymbolRenderer(graphics::Painter& painter, const LineWidths& widths);

        /// @brief Draw @p shape centred at @p centre without a label.
        void draw(const SymbolShape& shape, Vec2d centre);

        /// @brief Draw @p shape and @p label at candidate @p slot.
        void draw(const SymbolShape& shape, Vec2d centre, const std::string& label, LabelSlot slot);

        /// @brief Filled disc with border in the current pen, fill and line width.
        void draw_star(Vec2d centre, f64 radius);

        /// @brief Draw @p label at @p candidate in the painter's current frame and font.
        static void draw_label(graphics::Painter& painter, const LabelCandidate& candidate, const std::string& label);

    private:
        void draw_outline(const SymbolShape& shape);

        void draw_ellipse(const EllipseShape& shape);
        void draw_rectangle(const RectangleShape& shape);
        void draw_circle(const CircleShape& shape);
        void draw_diamond(const DiamondShape& shape);
        void draw_cross(const CrossShape& shape);

        graphics::Painter& m_painter;
        LineWidths m_widths;
    };

} // namespace skychart::chart

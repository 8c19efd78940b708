#pragma once

/// @file magnitude_scale.hpp
/// @brief Legend widget showing reference star discs for integer magnitudes.

#include "core/types.hpp"
#include "graphics/painter.hpp"

#include <string>
#include <vector>

namespace skychart::chart
{
    class SymbolRenderer;

    /// @brief Column of reference stars anchored at the lower-left corner of the map.
    class MagnitudeScaleWidget
    {
    public:
        static constexpr u32 kStarsInScale = 7;
        /// Row pitch as a multiple of the legend font size.
        static constexpr f64 kRowSpacing = 1.2;

        /// @param painter Used to measure the labels in the legend font.
        MagnitudeScaleWidget(graphics::Painter& painter,
                             f64 limiting_magnitude,
                             f64 legend_font_size,
                             f64 star_border_linewidth,
                             f64 legend_linewidth);

        /// @brief Magnitudes shown, faintest first.
        [[nodiscard]] const std::vector<i32>& magnitudes() const { return m_magnitudes; }

        /// @brief (2.5h + widest label, 7 · 1.2h) with h the legend font size.
        [[nodiscard]] Vec2d size() const { return m_size; }

        /// @brief Draw with the box's lower-left corner at (@p left, @p bottom).
        void draw(graphics::Painter& painter, SymbolRenderer& symbols, f64 left, f64 bottom) const;

    private:
        f64 m_limiting_magnitude;
        f64 m_font_size;
        f64 m_star_border_linewidth;
        f64 m_legend_linewidth;
        std::vector<i32> m_magnitudes;
        std::vector<std::string> m_labels;
        Vec2d m_size{0.0};
    };

} // namespace skychart::chart

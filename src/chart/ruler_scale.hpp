#pragma once

/// @file ruler_scale.hpp
/// @brief Map-scale ruler: choice of a round angular length and its legend widget.

#include "core/types.hpp"
#include "graphics/painter.hpp"

#include <string>

namespace skychart::chart
{
    /// @brief A ruler length chosen from the table of round angular lengths.
    struct RulerScale
    {
        f64 length_mm = 0.0;
        f64 arcminutes = 0.0;
        std::string label;
    };

    /// @brief Largest table entry (1' .. 20°) whose length at @p drawing_scale
    ///        (mm per radian) does not exceed @p max_length_mm.
    ///
    /// Falls back to the smallest entry when even 1' is too long.
    [[nodiscard]] RulerScale select_ruler_scale(f64 max_length_mm, f64 drawing_scale);

    /// @brief Ruler widget anchored at the lower-right corner of the map.
    class MapScaleWidget
    {
    public:
        /// Ruler text height as a fraction of the legend font size.
        static constexpr f64 kFontFraction = 0.66;

        MapScaleWidget(f64 drawing_scale, f64 max_length_mm, f64 legend_font_size, f64 legend_linewidth);

        [[nodiscard]] const RulerScale& ruler() const { return m_ruler; }

        /// @brief Box reserved in the corner: (ruler + 2h, 3h) with h = 0.66 · legend font size.
        [[nodiscard]] Vec2d size() const { return m_size; }

        /// @brief Draw with the box's lower-right corner at (@p right, @p bottom).
        void draw(graphics::Painter& painter, f64 right, f64 bottom) const;

    private:
        RulerScale m_ruler;
        f64 m_text_height;
        f64 m_linewidth;
        Vec2d m_size{0.0};
    };

} // namespace skychart::chart

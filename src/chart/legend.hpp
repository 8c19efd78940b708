#pragma once

/// @file legend.hpp
/// @brief Caption, field border, orientation, centre coordinates and symbol legend.

#include "astro/projection.hpp"
#include "chart/chart_options.hpp"
#include "chart/field_of_view.hpp"
#include "chart/language.hpp"
#include "graphics/painter.hpp"

#include <string>

namespace skychart::chart
{
    class SymbolRenderer;

    /// @brief "12h34m56s +12°34'56\"" with the unit letters of @p language.
    ///
    /// Seconds are rounded and carried into minutes, hours and degrees.
    [[nodiscard]] std::string format_coordinates(const astro::EquatorialCoord& position,
                                                 const LanguageTable& language);

    /// @brief Legend elements drawn around and over the map after the sky layers.
    ///
    /// All methods draw in the painter's current font unless stated otherwise
    /// and expect the mirror transform to be switched off.
    class Legend
    {
    public:
        /// Horizontal position of the symbol legend as a fraction of the drawing width.
        static constexpr f64 kSymbolColumn = 0.48;
        static constexpr f64 kSymbolTop = 0.49;
        static constexpr f64 kLegendMargin = 0.47;

        Legend(graphics::Painter& painter, const FieldOfView& fov, const ChartOptions& options);

        /// @brief Caption centred above the map at twice the legend font size.
        void draw_caption() const;

        /// @brief Square around the map.
        void draw_field_border() const;

        /// @brief Cross in the upper-left corner with the north and west captions.
        void draw_orientation() const;

        /// @brief Field centre coordinates in the upper-right corner.
        void draw_coordinates() const;

        /// @brief Symbol legend in the right margin, longest names first.
        void draw_dso_legend(SymbolRenderer& symbols) const;

    private:
        graphics::Painter& m_painter;
        const FieldOfView& m_fov;
        const ChartOptions& m_options;
        const LanguageTable& m_language;
    };

} // namespace skychart::chart

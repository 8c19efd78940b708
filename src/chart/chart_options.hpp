#pragma once

/// @file chart_options.hpp
/// @brief Read-only configuration of a render pass.

#include "chart/language.hpp"
#include "core/types.hpp"

#include <string>

namespace skychart::chart
{
    /// @brief Line widths per symbol class (mm).
    struct LineWidths
    {
        f64 star_border = 0.06;
        f64 open_cluster = 0.3;
        f64 dso = 0.2;
        f64 legend = 0.2;
        f64 constellation = 0.5;
    };

    struct ChartOptions
    {
        f64 drawing_width = 180.0;          ///< Width of the map square (mm)
        f64 font_size = 2.6;                ///< Default font size (mm)
        std::string font_family = "sans-serif";
        f64 limiting_magnitude = 13.8;      ///< Faintest star drawn
        f64 deepsky_label_limit = 15.0;     ///< Fainter deep-sky objects stay unlabelled
        f64 min_radius = 1.0;               ///< Smallest deep-sky symbol radius (mm)
        LineWidths line_widths{};
        bool mirror_x = false;
        bool mirror_y = false;
        bool invert_colors = false;
        bool show_dso_legend = false;
        std::string caption;
        Language language = Language::English;

        /// @brief Font size of the legend, scaled with the drawing width.
        [[nodiscard]] f64 legend_font_size() const { return font_size * drawing_width / 100.0; }

        /// @brief Symbol radius used when an object has no size of its own.
        [[nodiscard]] f64 default_symbol_radius() const { return drawing_width / 40.0; }
    };

} // namespace skychart::chart

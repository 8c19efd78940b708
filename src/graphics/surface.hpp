#pragma once

/// @file surface.hpp
/// @brief Abstract vector drawing backend.

#include "core/types.hpp"

#include <string>
#include <vector>

namespace skychart::graphics
{
    struct Rgb
    {
        f64 r = 0.0;
        f64 g = 0.0;
        f64 b = 0.0;
    };

    enum class DrawMode : u8
    {
        Stroke,
        Fill,
        StrokeAndFill,
    };

    /// @brief Which point of the text the anchor refers to, along the baseline.
    enum class TextAnchor : u8
    {
        Start,      ///< Text runs forward from the anchor
        Centre,     ///< Anchor is the middle of the baseline
        End,        ///< Text ends at the anchor
    };

    /// @brief Output device for charts.
    ///
    /// Coordinates are millimetres with y pointing up and the origin at the
    /// map centre. Implementations keep only the current style; the save and
    /// restore stack lives in Painter. Drawing errors are reported by throwing
    /// std::runtime_error; the style setters never throw.
    class Surface
    {
    public:
        virtual ~Surface() = default;

        /// @brief Start a page of @p width_mm × @p height_mm.
        /// @param origin_mm Position of the map origin measured from the lower-left page corner.
        virtual void begin(f64 width_mm, f64 height_mm, Vec2d origin_mm) = 0;

        /// @brief Complete the page and flush it to the output.
        virtual void finish() = 0;

        virtual void set_line_width(f64 width_mm) = 0;

        /// @brief Dash pattern in millimetres; @p on_mm <= 0 selects a solid line.
        virtual void set_dash(f64 on_mm, f64 off_mm) = 0;

        virtual void set_pen_color(const Rgb& color) = 0;
        virtual void set_fill_color(const Rgb& color) = 0;
        virtual void set_font(const std::string& family, f64 size_mm) = 0;

        virtual void line(Vec2d from, Vec2d to) = 0;
        virtual void circle(Vec2d centre, f64 radius, DrawMode mode) = 0;

        /// @brief Ellipse with semi-axes @p rx along @p angle and @p ry perpendicular to it.
        virtual void ellipse(Vec2d centre, f64 rx, f64 ry, f64 angle, DrawMode mode) = 0;

        virtual void polygon(const std::vector<Vec2d>& points, DrawMode mode) = 0;

        /// @brief Draw upright text whose baseline starts at @p baseline rotated by @p angle.
        virtual void text(Vec2d baseline, f64 angle, TextAnchor anchor, const std::string& text) = 0;

        /// @brief Advance width of @p text in the current font (millimetres).
        [[nodiscard]] virtual f64 text_width(const std::string& text) const = 0;

        virtual void clip_polygon(const std::vector<Vec2d>& points) = 0;
        virtual void reset_clip() = 0;
    };

} // namespace skychart::graphics

#pragma once

/// @file painter.hpp
/// @brief Stateful drawing front-end: transform stack, style stack, mirroring.

#include "core/types.hpp"
#include "graphics/surface.hpp"

#include <string>
#include <vector>

namespace skychart::graphics
{
    /// @brief Independent horizontal and vertical flips of the chart.
    struct MirrorTransform
    {
        bool x = false;     ///< Flip east-west (x -> -x)
        bool y = false;     ///< Flip north-south (y -> -y)

        [[nodiscard]] Mat3d matrix() const;
    };

    /// @brief The drawing API used by all chart code.
    ///
    /// Painter owns the save/restore stack (affine transform, line width, dash,
    /// pen, fill, font) and forwards primitives to a Surface in page
    /// coordinates. The mirror transform is applied last, to every point that
    /// leaves the painter, so geometry upstream never needs to know about it.
    /// Text is kept readable under mirroring: its anchor is mirrored and a
    /// reversed baseline swaps start and end anchoring.
    ///
    /// Text anchors follow chart conventions: text_right() places text to the
    /// right of the anchor, text_left() to the left of it, and the anchor's y is
    /// the baseline.
    class Painter
    {
    public:
        static constexpr f64 kDefaultFontSize = 2.6;    ///< mm
        static constexpr f64 kDefaultLineWidth = 0.2;   ///< mm

        explicit Painter(Surface& surface);

        Painter(const Painter&) = delete;
        Painter& operator=(const Painter&) = delete;

        /// @brief Start a page; the map origin is placed width/2 from the left and bottom edges.
        /// The page is painted with the background colour.
        void begin_page(f64 width_mm, f64 height_mm);
        void finish_page();

        void set_mirror(const MirrorTransform& mirror);
        [[nodiscard]] const MirrorTransform& mirror() const { return m_mirror; }

        /// @brief Invert every colour sent to the surface (white ink on black).
        void set_invert_colors(bool invert);

        // -----------------------------------------------------------------
        // State stack
        // -----------------------------------------------------------------
        void save();
        void restore();

        void translate(Vec2d offset);
        void rotate(f64 angle);

        // -----------------------------------------------------------------
        // Style
        // -----------------------------------------------------------------
        void set_linewidth(f64 width_mm);
        [[nodiscard]] f64 linewidth() const { return m_state.linewidth; }

        void set_dashed_line(f64 on_mm, f64 off_mm);
        void set_solid_line();

        void set_pen_rgb(const Rgb& color);
        void set_pen_gray(f64 gray);
        void set_fill_rgb(const Rgb& color);
        void set_fill_gray(f64 gray);
        void set_fill_background();

        void set_font(const std::string& family, f64 size_mm);
        void set_font_size(f64 size_mm);
        [[nodiscard]] f64 font_size() const { return m_state.font_size; }
        [[nodiscard]] const std::string& font_family() const { return m_state.font_family; }

        // -----------------------------------------------------------------
        // Primitives
        // -----------------------------------------------------------------
        void line(Vec2d from, Vec2d to);
        void circle(Vec2d centre, f64 radius, DrawMode mode = DrawMode::Stroke);
        void ellipse(Vec2d centre, f64 rlong, f64 rshort, f64 angle, DrawMode mode = DrawMode::Stroke);

        /// @brief Axis-aligned rectangle given its lower-left corner.
        void rectangle(Vec2d lower_left, f64 width, f64 height, DrawMode mode = DrawMode::Stroke);

        void text_left(Vec2d anchor, const std::string& text);
        void text_right(Vec2d anchor, const std::string& text);
        void text_centred(Vec2d anchor, const std::string& text);

        [[nodiscard]] f64 text_width(const std::string& text) const;

        /// @brief Restrict drawing to the polygon @p points (user coordinates).
        void clip_path(const std::vector<Vec2d>& points);
        void reset_clip();

    private:
        struct State
        {
            Mat3d transform{1.0};
            f64 linewidth = kDefaultLineWidth;
            f64 dash_on = 0.0;
            f64 dash_off = 0.0;
            Rgb pen{};
            Rgb fill{};
            std::string font_family = "sans-serif";
            f64 font_size = kDefaultFontSize;
        };

        [[nodiscard]] Vec2d map_point(Vec2d p) const;
        [[nodiscard]] Vec2d map_vector(Vec2d v) const;
        [[nodiscard]] f64 map_angle(f64 angle) const;
        [[nodiscard]] Rgb output_color(const Rgb& color) const;

        /// @brief Push the complete current style to the surface.
        void apply_style();

        void emit_text(Vec2d anchor, TextAnchor kind, const std::string& text);

        Surface& m_surface;
        MirrorTransform m_mirror{};
        Mat3d m_mirror_matrix{1.0};
        bool m_invert_colors = false;
        State m_state{};
        std::vector<State> m_stack;
    };

    /// @brief Scoped save/restore on a Painter; restores on unwind as well.
    class PainterStateGuard
    {
    public:
        explicit PainterStateGuard(Painter& painter)
            : m_painter{painter}
        {
            m_painter.save();
        }

        ~PainterStateGuard()
        {
            m_painter.restore();
        }

        PainterStateGuard(const PainterStateGuard&) = delete;
        PainterStateGuard& operator=(const PainterStateGuard&) = delete;

    private:
        Painter& m_painter;
    };

} // namespace skychart::graphics

#pragma once

/// @file recording_surface.hpp
/// @brief Surface that keeps every emitted primitive in memory.

#include "graphics/surface.hpp"

#include <string>
#include <vector>

namespace skychart::graphics
{
    enum class CommandKind : u8
    {
        Begin,
        Finish,
        Line,
        Circle,
        Ellipse,
        Polygon,
        Text,
        Clip,
        ResetClip,
    };

    /// @brief One recorded primitive together with the style it was drawn in.
    struct DrawCommand
    {
        CommandKind kind;
        std::vector<Vec2d> points;      ///< Endpoints, centre, polygon vertices or text baseline
        f64 radius = 0.0;               ///< Circle radius or ellipse rx
        f64 radius2 = 0.0;              ///< Ellipse ry
        f64 angle = 0.0;                ///< Ellipse or text baseline angle
        DrawMode mode = DrawMode::Stroke;
        TextAnchor anchor = TextAnchor::Start;
        std::string text;
        f64 line_width = 0.0;
        f64 dash_on = 0.0;
        Rgb pen{};
        Rgb fill{};
        f64 font_size = 0.0;
    };

    /// @brief In-memory Surface used for dry runs and tests.
    ///
    /// Text width is estimated as kGlyphWidthFactor × font size per code point.
    class RecordingSurface final : public Surface
    {
    public:
        static constexpr f64 kGlyphWidthFactor = 0.5;

        void begin(f64 width_mm, f64 height_mm, Vec2d origin_mm) override;
        void finish() override;

        void set_line_width(f64 width_mm) override;
        void set_dash(f64 on_mm, f64 off_mm) override;
        void set_pen_color(const Rgb& color) override;
        void set_fill_color(const Rgb& color) override;
        void set_font(const std::string& family, f64 size_mm) override;

        void line(Vec2d from, Vec2d to) override;
        void circle(Vec2d centre, f64 radius, DrawMode mode) override;
        void ellipse(Vec2d centre, f64 rx, f64 ry, f64 angle, DrawMode mode) override;
        void polygon(const std::vector<Vec2d>& points, DrawMode mode) override;
        void text(Vec2d baseline, f64 angle, TextAnchor anchor, const std::string& text) override;
        [[nodiscard]] f64 text_width(const std::string& text) const override;

        void clip_polygon(const std::vector<Vec2d>& points) override;
        void reset_clip() override;

        [[nodiscard]] const std::vector<DrawCommand>& commands() const { return m_commands; }

        /// @brief Recorded commands of one kind, in emission order.
        [[nodiscard]] std::vector<const DrawCommand*> commands_of(CommandKind kind) const;

        [[nodiscard]] Vec2d page_size() const { return m_page_size; }

        void clear();

    private:
        DrawCommand& record(CommandKind kind);

        std::vector<DrawCommand> m_commands;
        Vec2d m_page_size{0.0};
        f64 m_line_width = 0.0;
        f64 m_dash_on = 0.0;
        Rgb m_pen{};
        Rgb m_fill{};
        f64 m_font_size = 0.0;
    };

} // namespace skychart::graphics

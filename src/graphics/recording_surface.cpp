/// @file recording_surface.cpp

#include "graphics/recording_surface.hpp"

namespace skychart::graphics
{

namespace
{

/// Number of UTF-8 code points (continuation bytes are not counted).
std::size_t code_points(const std::string& text)
{
    std::size_t count = 0;
    for (const char c : text)
    {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80)
        {
            ++count;
        }
    }
    return count;
}

} // anonymous namespace

DrawCommand& RecordingSurface::record(CommandKind kind)
{
    DrawCommand& command = m_commands.emplace_back();
    command.kind = kind;
    command.line_width = m_line_width;
    command.dash_on = m_dash_on;
    command.pen = m_pen;
    command.fill = m_fill;
    command.font_size = m_font_size;
    return command;
}

void RecordingSurface::begin(f64 width_mm, f64 height_mm, Vec2d origin_mm)
{
    m_page_size = Vec2d{width_mm, height_mm};
    record(CommandKind::Begin).points = {origin_mm};
}

void RecordingSurface::finish()
{
    record(CommandKind::Finish);
}

void RecordingSurface::set_line_width(f64 width_mm)
{
    m_line_width = width_mm;
}

void RecordingSurface::set_dash(f64 on_mm, f64 /*off_mm*/)
{
    m_dash_on = on_mm;
}

void RecordingSurface::set_pen_color(const Rgb& color)
{
    m_pen = color;
}

void RecordingSurface::set_fill_color(const Rgb& color)
{
    m_fill = color;
}

void RecordingSurface::set_font(const std::string& /*family*/, f64 size_mm)
{
    m_font_size = size_mm;
}

void RecordingSurface::line(Vec2d from, Vec2d to)
{
    record(CommandKind::Line).points = {from, to};
}

void RecordingSurface::circle(Vec2d centre, f64 radius, DrawMode mode)
{
    DrawCommand& command = record(CommandKind::Circle);
    command.points = {centre};
    command.radius = radius;
    command.mode = mode;
}

void RecordingSurface::ellipse(Vec2d centre, f64 rx, f64 ry, f64 angle, DrawMode mode)
{
    DrawCommand& command = record(CommandKind::Ellipse);
    command.points = {centre};
    command.radius = rx;
    command.radius2 = ry;
    command.angle = angle;
    command.mode = mode;
}

void RecordingSurface::polygon(const std::vector<Vec2d>& points, DrawMode mode)
{
    DrawCommand& command = record(CommandKind::Polygon);
    command.points = points;
    command.mode = mode;
}

void RecordingSurface::text(Vec2d baseline, f64 angle, TextAnchor anchor, const std::string& text)
{
    DrawCommand& command = record(CommandKind::Text);
    command.points = {baseline};
    command.angle = angle;
    command.anchor = anchor;
    command.text = text;
}

f64 RecordingSurface::text_width(const std::string& text) const
{
    return static_cast<f64>(code_points(text)) * kGlyphWidthFactor * m_font_size;
}

void RecordingSurface::clip_polygon(const std::vector<Vec2d>& points)
{
    record(CommandKind::Clip).points = points;
}

void RecordingSurface::reset_clip()
{
    record(CommandKind::ResetClip);
}

std::vector<const DrawCommand*> RecordingSurface::commands_of(CommandKind kind) const
{
    std::vector<const DrawCommand*> result;
    for (const auto& command : m_commands)
    {
        if (command.kind == kind)
        {
            result.push_back(&command);
        }
    }
    return result;
}

void RecordingSurface::clear()
{
    m_commands.clear();
}

} // namespace skychart::graphics

/// @file cairo_surface.cpp
/// @brief Cairo backend. User space is millimetres, y up, origin at the map centre.

#include "graphics/cairo_surface.hpp"

#include "core/logger.hpp"

#include <cairo/cairo-pdf.h>
#include <cairo/cairo-svg.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace skychart::graphics
{

namespace
{

constexpr f64 kMmPerInch = 25.4;
constexpr f64 kPointsPerInch = 72.0;

[[noreturn]] void fail(const char* operation, cairo_status_t status)
{
    SKC_CORE_CRITICAL("Cairo error in {}: {}", operation, cairo_status_to_string(status));
    throw std::runtime_error(std::string("cairo: ") + operation + ": " + cairo_status_to_string(status));
}

} // anonymous namespace

CairoSurface::CairoSurface(std::filesystem::path path, OutputFormat format)
    : m_path{std::move(path)}
    , m_format{format}
{
}

CairoSurface::~CairoSurface()
{
    destroy();
}

std::optional<OutputFormat> CairoSurface::format_for(const std::filesystem::path& path)
{
    std::string extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (extension == ".pdf") return OutputFormat::Pdf;
    if (extension == ".svg") return OutputFormat::Svg;
    if (extension == ".png") return OutputFormat::Png;
    return std::nullopt;
}

// -----------------------------------------------------------------
// Page lifetime
// -----------------------------------------------------------------

void CairoSurface::begin(f64 width_mm, f64 height_mm, Vec2d origin_mm)
{
    destroy();

    f64 units_per_mm = kPointsPerInch / kMmPerInch;
    const std::string filename = m_path.string();

    switch (m_format)
    {
        case OutputFormat::Pdf:
            m_surface = cairo_pdf_surface_create(filename.c_str(),
                                                 width_mm * units_per_mm, height_mm * units_per_mm);
            break;
        case OutputFormat::Svg:
            m_surface = cairo_svg_surface_create(filename.c_str(),
                                                 width_mm * units_per_mm, height_mm * units_per_mm);
            break;
        case OutputFormat::Png:
            units_per_mm = kPngDotsPerInch / kMmPerInch;
            m_surface = cairo_image_surface_create(CAIRO_FORMAT_ARGB32,
                                                   static_cast<int>(std::ceil(width_mm * units_per_mm)),
                                                   static_cast<int>(std::ceil(height_mm * units_per_mm)));
            break;
    }

    const cairo_status_t surface_status = cairo_surface_status(m_surface);
    if (surface_status != CAIRO_STATUS_SUCCESS)
    {
        fail("surface create", surface_status);
    }

    m_cr = cairo_create(m_surface);
    check("cairo_create");

    // Page origin is top-left with y down; flip into chart millimetres.
    cairo_translate(m_cr, origin_mm.x * units_per_mm, (height_mm - origin_mm.y) * units_per_mm);
    cairo_scale(m_cr, units_per_mm, -units_per_mm);

    cairo_set_line_cap(m_cr, CAIRO_LINE_CAP_ROUND);
    cairo_set_line_join(m_cr, CAIRO_LINE_JOIN_ROUND);
    set_line_width(m_line_width);
    set_font(m_font_family, m_font_size);
    check("begin");

    SKC_CORE_INFO("CairoSurface: writing {} ({:.1f} x {:.1f} mm)", filename, width_mm, height_mm);
}

void CairoSurface::finish()
{
    require_context("finish");

    cairo_show_page(m_cr);
    check("show_page");

    if (m_format == OutputFormat::Png)
    {
        const cairo_status_t status = cairo_surface_write_to_png(m_surface, m_path.string().c_str());
        if (status != CAIRO_STATUS_SUCCESS)
        {
            fail("write_to_png", status);
        }
    }

    cairo_surface_finish(m_surface);
    check("surface_finish");

    destroy();
    SKC_CORE_INFO("CairoSurface: finished {}", m_path.string());
}

void CairoSurface::destroy()
{
    if (m_cr != nullptr)
    {
        cairo_destroy(m_cr);
        m_cr = nullptr;
    }
    if (m_surface != nullptr)
    {
        cairo_surface_destroy(m_surface);
        m_surface = nullptr;
    }
}

// -----------------------------------------------------------------
// Style (kept locally so it survives until begin())
// -----------------------------------------------------------------

void CairoSurface::set_line_width(f64 width_mm)
{
    m_line_width = width_mm;
    if (m_cr != nullptr)
    {
        cairo_set_line_width(m_cr, width_mm);
    }
}

void CairoSurface::set_dash(f64 on_mm, f64 off_mm)
{
    m_dash.clear();
    if (on_mm > 0.0)
    {
        m_dash = {on_mm, off_mm};
    }
    if (m_cr != nullptr)
    {
        cairo_set_dash(m_cr, m_dash.data(), static_cast<int>(m_dash.size()), 0.0);
    }
}

void CairoSurface::set_pen_color(const Rgb& color)
{
    m_pen = color;
}

void CairoSurface::set_fill_color(const Rgb& color)
{
    m_fill = color;
}

void CairoSurface::set_font(const std::string& family, f64 size_mm)
{
    m_font_family = family;
    m_font_size = size_mm;
    if (m_cr != nullptr)
    {
        cairo_select_font_face(m_cr, family.c_str(), CAIRO_FONT_SLANT_NORMAL, CAIRO_FONT_WEIGHT_NORMAL);
        cairo_set_font_size(m_cr, size_mm);
    }
}

// -----------------------------------------------------------------
// Primitives
// -----------------------------------------------------------------

void CairoSurface::paint_path(DrawMode mode)
{
    if (mode == DrawMode::Fill || mode == DrawMode::StrokeAndFill)
    {
        cairo_set_source_rgb(m_cr, m_fill.r, m_fill.g, m_fill.b);
        if (mode == DrawMode::StrokeAndFill)
        {
            cairo_fill_preserve(m_cr);
        }
        else
        {
            cairo_fill(m_cr);
        }
    }
    if (mode == DrawMode::Stroke || mode == DrawMode::StrokeAndFill)
    {
        cairo_set_source_rgb(m_cr, m_pen.r, m_pen.g, m_pen.b);
        cairo_stroke(m_cr);
    }
}

void CairoSurface::line(Vec2d from, Vec2d to)
{
    require_context("line");
    cairo_move_to(m_cr, from.x, from.y);
    cairo_line_to(m_cr, to.x, to.y);
    paint_path(DrawMode::Stroke);
    check("line");
}

void CairoSurface::circle(Vec2d centre, f64 radius, DrawMode mode)
{
    require_context("circle");
    cairo_new_sub_path(m_cr);
    cairo_arc(m_cr, centre.x, centre.y, std::max(radius, 0.0), 0.0, 2.0 * astro_constants::kPi);
    paint_path(mode);
    check("circle");
}

void CairoSurface::ellipse(Vec2d centre, f64 rx, f64 ry, f64 angle, DrawMode mode)
{
    require_context("ellipse");

    // A zero axis would make the path matrix singular; draw the remaining axis as a line.
    if (rx <= 0.0 || ry <= 0.0)
    {
        const f64 r = std::max(rx, ry);
        const Vec2d axis = (rx >= ry ? Vec2d{std::cos(angle), std::sin(angle)}
                                     : Vec2d{-std::sin(angle), std::cos(angle)}) * r;
        line(centre - axis, centre + axis);
        return;
    }

    cairo_save(m_cr);
    cairo_translate(m_cr, centre.x, centre.y);
    cairo_rotate(m_cr, angle);
    cairo_scale(m_cr, rx, ry);
    cairo_new_sub_path(m_cr);
    cairo_arc(m_cr, 0.0, 0.0, 1.0, 0.0, 2.0 * astro_constants::kPi);
    cairo_restore(m_cr);
    paint_path(mode);
    check("ellipse");
}

void CairoSurface::polygon(const std::vector<Vec2d>& points, DrawMode mode)
{
    require_context("polygon");
    if (points.empty())
    {
        return;
    }
    cairo_move_to(m_cr, points.front().x, points.front().y);
    for (std::size_t i = 1; i < points.size(); ++i)
    {
        cairo_line_to(m_cr, points[i].x, points[i].y);
    }
    cairo_close_path(m_cr);
    paint_path(mode);
    check("polygon");
}

void CairoSurface::text(Vec2d baseline, f64 angle, TextAnchor anchor, const std::string& text)
{
    require_context("text");

    const f64 width = text_width(text);
    f64 offset = 0.0;
    switch (anchor)
    {
        case TextAnchor::Start:  offset = 0.0;          break;
        case TextAnchor::Centre: offset = -width / 2.0; break;
        case TextAnchor::End:    offset = -width;       break;
    }

    cairo_save(m_cr);
    cairo_translate(m_cr, baseline.x, baseline.y);
    cairo_rotate(m_cr, angle);
    // Glyphs are defined y-down; undo the page flip locally.
    cairo_scale(m_cr, 1.0, -1.0);
    cairo_move_to(m_cr, offset, 0.0);
    cairo_set_source_rgb(m_cr, m_pen.r, m_pen.g, m_pen.b);
    cairo_show_text(m_cr, text.c_str());
    cairo_restore(m_cr);
    check("text");
}

f64 CairoSurface::text_width(const std::string& text) const
{
    require_context("text_width");
    cairo_text_extents_t extents;
    cairo_text_extents(m_cr, text.c_str(), &extents);
    check("text_extents");
    return std::abs(extents.x_advance);
}

void CairoSurface::clip_polygon(const std::vector<Vec2d>& points)
{
    require_context("clip");
    cairo_reset_clip(m_cr);
    if (points.empty())
    {
        return;
    }
    cairo_new_path(m_cr);
    cairo_move_to(m_cr, points.front().x, points.front().y);
    for (std::size_t i = 1; i < points.size(); ++i)
    {
        cairo_line_to(m_cr, points[i].x, points[i].y);
    }
    cairo_close_path(m_cr);
    cairo_clip(m_cr);
    check("clip");
}

void CairoSurface::reset_clip()
{
    require_context("reset_clip");
    cairo_reset_clip(m_cr);
    check("reset_clip");
}

// -----------------------------------------------------------------
// Error checks
// -----------------------------------------------------------------

void CairoSurface::check(const char* operation) const
{
    const cairo_status_t status = cairo_status(m_cr);
    if (status != CAIRO_STATUS_SUCCESS)
    {
        fail(operation, status);
    }
}

void CairoSurface::require_context(const char* operation) const
{
    if (m_cr == nullptr)
    {
        SKC_CORE_CRITICAL("CairoSurface: {} called outside begin()/finish()", operation);
        throw std::logic_error(std::string("cairo: ") + operation + " called without a page");
    }
}

} // namespace skychart::graphics

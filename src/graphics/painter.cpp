/// @file painter.cpp
/// @brief Painter implementation: affine transform stack and mirrored emission.

#include "graphics/painter.hpp"

#include "core/logger.hpp"

#include <cmath>
#include <utility>

namespace skychart::graphics
{

namespace
{

/// Baseline directions with |x| below this are treated as vertical.
constexpr f64 kVerticalTolerance = 1e-9;

/// Offset from the text baseline to its vertical middle, as a fraction of the font size.
constexpr f64 kTextMiddleFraction = 1.0 / 3.0;

TextAnchor reversed(TextAnchor anchor)
{
    switch (anchor)
    {
        case TextAnchor::Start:  return TextAnchor::End;
        case TextAnchor::End:    return TextAnchor::Start;
        case TextAnchor::Centre: return TextAnchor::Centre;
    }
    return anchor;
}

} // anonymous namespace

// -----------------------------------------------------------------
// MirrorTransform
// -----------------------------------------------------------------

Mat3d MirrorTransform::matrix() const
{
    Mat3d m{1.0};
    m[0][0] = x ? -1.0 : 1.0;
    m[1][1] = y ? -1.0 : 1.0;
    return m;
}

// -----------------------------------------------------------------
// Painter
// -----------------------------------------------------------------

Painter::Painter(Surface& surface)
    : m_surface{surface}
{
}

void Painter::begin_page(f64 width_mm, f64 height_mm)
{
    m_stack.clear();
    m_state = State{};

    const Vec2d origin{width_mm / 2.0, width_mm / 2.0};
    m_surface.begin(width_mm, height_mm, origin);
    apply_style();

    // Background covers the whole page in unmirrored page coordinates.
    m_surface.set_fill_color(output_color(Rgb{1.0, 1.0, 1.0}));
    m_surface.polygon({
        {-origin.x, -origin.y},
        {width_mm - origin.x, -origin.y},
        {width_mm - origin.x, height_mm - origin.y},
        {-origin.x, height_mm - origin.y},
    }, DrawMode::Fill);
    m_surface.set_fill_color(output_color(m_state.fill));

    SKC_CORE_TRACE("Painter: page {:.1f} x {:.1f} mm", width_mm, height_mm);
}

void Painter::finish_page()
{
    if (!m_stack.empty())
    {
        SKC_CORE_WARN("Painter: finishing page with {} unrestored states", m_stack.size());
    }
    m_surface.finish();
}

void Painter::set_mirror(const MirrorTransform& mirror)
{
    m_mirror = mirror;
    m_mirror_matrix = mirror.matrix();
}

void Painter::set_invert_colors(bool invert)
{
    m_invert_colors = invert;
    m_surface.set_pen_color(output_color(m_state.pen));
    m_surface.set_fill_color(output_color(m_state.fill));
}

// -----------------------------------------------------------------
// State stack
// -----------------------------------------------------------------

void Painter::save()
{
    m_stack.push_back(m_state);
}

void Painter::restore()
{
    if (m_stack.empty())
    {
        SKC_CORE_WARN("Painter: restore() without matching save()");
        return;
    }
    m_state = std::move(m_stack.back());
    m_stack.pop_back();
    apply_style();
}

void Painter::translate(Vec2d offset)
{
    Mat3d t{1.0};
    t[2] = Vec3d{offset.x, offset.y, 1.0};
    m_state.transform = m_state.transform * t;
}

void Painter::rotate(f64 angle)
{
    const f64 c = std::cos(angle);
    const f64 s = std::sin(angle);
    Mat3d r{1.0};
    r[0] = Vec3d{c, s, 0.0};
    r[1] = Vec3d{-s, c, 0.0};
    m_state.transform = m_state.transform * r;
}

// -----------------------------------------------------------------
// Style
// -----------------------------------------------------------------

void Painter::set_linewidth(f64 width_mm)
{
    m_state.linewidth = width_mm;
    m_surface.set_line_width(width_mm);
}

void Painter::set_dashed_line(f64 on_mm, f64 off_mm)
{
    m_state.dash_on = on_mm;
    m_state.dash_off = off_mm;
    m_surface.set_dash(on_mm, off_mm);
}

void Painter::set_solid_line()
{
    set_dashed_line(0.0, 0.0);
}

void Painter::set_pen_rgb(const Rgb& color)
{
    m_state.pen = color;
    m_surface.set_pen_color(output_color(color));
}

void Painter::set_pen_gray(f64 gray)
{
    set_pen_rgb(Rgb{gray, gray, gray});
}

void Painter::set_fill_rgb(const Rgb& color)
{
    m_state.fill = color;
    m_surface.set_fill_color(output_color(color));
}

void Painter::set_fill_gray(f64 gray)
{
    set_fill_rgb(Rgb{gray, gray, gray});
}

void Painter::set_fill_background()
{
    set_fill_gray(1.0);
}

void Painter::set_font(const std::string& family, f64 size_mm)
{
    m_state.font_family = family;
    m_state.font_size = size_mm;
    m_surface.set_font(family, size_mm);
}

void Painter::set_font_size(f64 size_mm)
{
    set_font(m_state.font_family, size_mm);
}

void Painter::apply_style()
{
    m_surface.set_line_width(m_state.linewidth);
    m_surface.set_dash(m_state.dash_on, m_state.dash_off);
    m_surface.set_pen_color(output_color(m_state.pen));
    m_surface.set_fill_color(output_color(m_state.fill));
    m_surface.set_font(m_state.font_family, m_state.font_size);
}

// -----------------------------------------------------------------
// Transform helpers: user -> (transform) -> (mirror) -> page
// -----------------------------------------------------------------

Vec2d Painter::map_point(Vec2d p) const
{
    const Vec3d r = m_mirror_matrix * (m_state.transform * Vec3d{p.x, p.y, 1.0});
    return Vec2d{r.x, r.y};
}

Vec2d Painter::map_vector(Vec2d v) const
{
    const Vec3d r = m_mirror_matrix * (m_state.transform * Vec3d{v.x, v.y, 0.0});
    return Vec2d{r.x, r.y};
}

f64 Painter::map_angle(f64 angle) const
{
    const Vec2d d = map_vector(Vec2d{std::cos(angle), std::sin(angle)});
    return std::atan2(d.y, d.x);
}

Rgb Painter::output_color(const Rgb& color) const
{
    if (!m_invert_colors)
    {
        return color;
    }
    return Rgb{1.0 - color.r, 1.0 - color.g, 1.0 - color.b};
}

// -----------------------------------------------------------------
// Primitives
// -----------------------------------------------------------------

void Painter::line(Vec2d from, Vec2d to)
{
    m_surface.line(map_point(from), map_point(to));
}

void Painter::circle(Vec2d centre, f64 radius, DrawMode mode)
{
    m_surface.circle(map_point(centre), radius, mode);
}

void Painter::ellipse(Vec2d centre, f64 rlong, f64 rshort, f64 angle, DrawMode mode)
{
    m_surface.ellipse(map_point(centre), rlong, rshort, map_angle(angle), mode);
}

void Painter::rectangle(Vec2d lower_left, f64 width, f64 height, DrawMode mode)
{
    m_surface.polygon({
        map_point(lower_left),
        map_point(lower_left + Vec2d{width, 0.0}),
        map_point(lower_left + Vec2d{width, height}),
        map_point(lower_left + Vec2d{0.0, height}),
    }, mode);
}

void Painter::text_left(Vec2d anchor, const std::string& text)
{
    emit_text(anchor, TextAnchor::End, text);
}

void Painter::text_right(Vec2d anchor, const std::string& text)
{
    emit_text(anchor, TextAnchor::Start, text);
}

void Painter::text_centred(Vec2d anchor, const std::string& text)
{
    emit_text(anchor, TextAnchor::Centre, text);
}

// The vertical middle of the text, not its baseline, follows the transform.
// A baseline that ends up pointing left (or straight down) is reversed and the
// anchor kind swapped, so mirrored labels stay upright and on the same side.
void Painter::emit_text(Vec2d anchor, TextAnchor kind, const std::string& text)
{
    if (text.empty())
    {
        return;
    }

    const f64 middle_offset = m_state.font_size * kTextMiddleFraction;
    const Vec2d middle = map_point(anchor + Vec2d{0.0, middle_offset});

    Vec2d direction = glm::normalize(map_vector(Vec2d{1.0, 0.0}));
    if (direction.x < -kVerticalTolerance ||
        (std::abs(direction.x) <= kVerticalTolerance && direction.y < 0.0))
    {
        direction = -direction;
        kind = reversed(kind);
    }

    const Vec2d up{-direction.y, direction.x};
    const Vec2d baseline = middle - up * middle_offset;

    m_surface.text(baseline, std::atan2(direction.y, direction.x), kind, text);
}

f64 Painter::text_width(const std::string& text) const
{
    if (text.empty())
    {
        return 0.0;
    }
    return m_surface.text_width(text);
}

void Painter::clip_path(const std::vector<Vec2d>& points)
{
    std::vector<Vec2d> mapped;
    mapped.reserve(points.size());
    for (const auto& p : points)
    {
        mapped.push_back(map_point(p));
    }
    m_surface.clip_polygon(mapped);
}

void Painter::reset_clip()
{
    m_surface.reset_clip();
}

} // namespace skychart::graphics

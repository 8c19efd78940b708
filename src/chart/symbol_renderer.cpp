/// @file symbol_renderer.cpp
/// @brief Symbol outlines. Every outline is drawn around the origin of a
///        frame translated to the symbol centre (and rotated for galaxies).

#include "chart/symbol_renderer.hpp"

#include <cmath>
#include <variant>

namespace skychart::chart
{

namespace
{

constexpr f64 kSqrt2 = 1.4142135623730951;
constexpr f64 kStarRadiusBase = 0.15;
constexpr f64 kStarRadiusRatio = 1.33;

template <class... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // anonymous namespace

f64 magnitude_to_radius(f64 magnitude, f64 limiting_magnitude)
{
    return kStarRadiusBase * std::pow(kStarRadiusRatio, limiting_magnitude - magnitude);
}

f64 round_to_grid(f64 value)
{
    return std::round(value * 100.0) / 100.0;
}

SymbolRenderer::SymbolRenderer(graphics::Painter& painter, const LineWidths& widths)
    : m_painter{painter}
    , m_widths{widths}
{
}

void SymbolRenderer::draw(const SymbolShape& shape, Vec2d centre)
{
    graphics::PainterStateGuard guard{m_painter};
    m_painter.translate(centre);
    m_painter.rotate(frame_angle(shape));
    draw_outline(shape);
}

void SymbolRenderer::draw(const SymbolShape& shape, Vec2d centre, const std::string& label, LabelSlot slot)
{
    graphics::PainterStateGuard guard{m_painter};
    m_painter.translate(centre);
    m_painter.rotate(frame_angle(shape));
    draw_outline(shape);

    if (label.empty())
    {
        return;
    }
    const f64 width = m_painter.text_width(label);
    const CandidateList candidates = local_candidates(shape, width, m_painter.font_size());
    // Style set by the outline (dashes, width) must not leak into the text.
    m_painter.set_solid_line();
    draw_label(m_painter, candidates[static_cast<std::size_t>(slot)], label);
}

void SymbolRenderer::draw_star(Vec2d centre, f64 radius)
{
    const Vec2d position{round_to_grid(centre.x), round_to_grid(centre.y)};
    const f64 r = round_to_grid(radius + m_painter.linewidth() / 2.0);
    m_painter.circle(position, r, graphics::DrawMode::StrokeAndFill);
}

void SymbolRenderer::draw_label(graphics::Painter& painter, const LabelCandidate& candidate, const std::string& label)
{
    const Vec2d to_baseline{0.0, -painter.font_size() / 3.0};
    switch (candidate.anchor)
    {
        case graphics::TextAnchor::Start:
            painter.text_right(candidate.start + to_baseline, label);
            break;
        case graphics::TextAnchor::End:
            painter.text_left(candidate.end + to_baseline, label);
            break;
        case graphics::TextAnchor::Centre:
            painter.text_centred(candidate.center + to_baseline, label);
            break;
    }
}

void SymbolRenderer::draw_outline(const SymbolShape& shape)
{
    std::visit(Overloaded{
        [this](const EllipseShape& s)   { draw_ellipse(s); },
        [this](const RectangleShape& s) { draw_rectangle(s); },
        [this](const CircleShape& s)    { draw_circle(s); },
        [this](const DiamondShape& s)   { draw_diamond(s); },
        [this](const CrossShape& s)     { draw_cross(s); },
    }, shape);
}

// -----------------------------------------------------------------
// Outlines
// -----------------------------------------------------------------

void SymbolRenderer::draw_ellipse(const EllipseShape& shape)
{
    m_painter.set_linewidth(m_widths.dso);
    m_painter.ellipse(Vec2d{0.0}, shape.rlong, shape.rshort, 0.0);
}

void SymbolRenderer::draw_rectangle(const RectangleShape& shape)
{
    m_painter.set_linewidth(m_widths.dso);
    const f64 d = shape.half_size;
    // Horizontal edges overshoot by half a line width to close the corners.
    const f64 d1 = d + m_painter.linewidth() / 2.0;
    m_painter.line(Vec2d{-d1, d}, Vec2d{d1, d});
    m_painter.line(Vec2d{d, d}, Vec2d{d, -d});
    m_painter.line(Vec2d{d1, -d}, Vec2d{-d1, -d});
    m_painter.line(Vec2d{-d, -d}, Vec2d{-d, d});
}

void SymbolRenderer::draw_circle(const CircleShape& shape)
{
    const f64 r = shape.radius;
    switch (shape.kind)
    {
        case CircleKind::OpenCluster:
            m_painter.set_linewidth(m_widths.open_cluster);
            m_painter.set_dashed_line(kDashOn, kDashOff);
            m_painter.circle(Vec2d{0.0}, r);
            break;

        case CircleKind::GlobularCluster:
            m_painter.set_linewidth(m_widths.dso);
            m_painter.circle(Vec2d{0.0}, r);
            m_painter.line(Vec2d{-r, 0.0}, Vec2d{r, 0.0});
            m_painter.line(Vec2d{0.0, -r}, Vec2d{0.0, r});
            break;

        case CircleKind::PlanetaryNebula:
        {
            m_painter.set_linewidth(m_widths.dso);
            const f64 inner = 0.75 * r;
            const f64 outer = 1.5 * r;
            m_painter.circle(Vec2d{0.0}, inner);
            m_painter.line(Vec2d{-inner, 0.0}, Vec2d{-outer, 0.0});
            m_painter.line(Vec2d{inner, 0.0}, Vec2d{outer, 0.0});
            m_painter.line(Vec2d{0.0, inner}, Vec2d{0.0, outer});
            m_painter.line(Vec2d{0.0, -inner}, Vec2d{0.0, -outer});
            break;
        }

        case CircleKind::SupernovaRemnant:
            m_painter.set_linewidth(m_widths.dso);
            m_painter.circle(Vec2d{0.0}, r - m_painter.linewidth() / 2.0);
            break;
    }
}

void SymbolRenderer::draw_diamond(const DiamondShape& shape)
{
    m_painter.set_linewidth(m_widths.open_cluster);
    m_painter.set_dashed_line(kDashOn, kDashOff);

    const f64 d = shape.radius / kSqrt2;
    // Two of the edges are extended so the dash pattern closes the corners.
    const f64 diff = m_painter.linewidth() / 2.0 / kSqrt2;
    m_painter.line(Vec2d{-diff, d + diff}, Vec2d{d + diff, -diff});
    m_painter.line(Vec2d{d, 0.0}, Vec2d{0.0, -d});
    m_painter.line(Vec2d{diff, -d - diff}, Vec2d{-d - diff, diff});
    m_painter.line(Vec2d{-d, 0.0}, Vec2d{0.0, d});
}

void SymbolRenderer::draw_cross(const CrossShape& shape)
{
    m_painter.set_linewidth(m_widths.dso);
    const f64 d = shape.radius / kSqrt2;
    m_painter.line(Vec2d{-d, d}, Vec2d{d, -d});
    m_painter.line(Vec2d{d, d}, Vec2d{-d, -d});
}

} // namespace skychart::chart

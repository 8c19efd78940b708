/// @file ruler_scale.cpp
/// @brief Ruler selection and drawing.

#include "chart/ruler_scale.hpp"

#include "core/logger.hpp"

#include <array>
#include <string_view>

namespace skychart::chart
{

namespace
{

struct RulerEntry
{
    f64 arcminutes;
    std::string_view label;
};

constexpr std::array<RulerEntry, 9> kRulerTable{{
    {1.0, "1'"},
    {5.0, "5'"},
    {10.0, "10'"},
    {30.0, "30'"},
    {60.0, "1°"},
    {120.0, "2°"},
    {300.0, "5°"},
    {600.0, "10°"},
    {1200.0, "20°"},
}};

} // anonymous namespace

RulerScale select_ruler_scale(f64 max_length_mm, f64 drawing_scale)
{
    for (auto it = kRulerTable.rbegin(); it != kRulerTable.rend(); ++it)
    {
        const f64 length = it->arcminutes * astro_constants::kArcMinToRad * drawing_scale;
        if (length <= max_length_mm)
        {
            return RulerScale{length, it->arcminutes, std::string(it->label)};
        }
    }

    const RulerEntry& smallest = kRulerTable.front();
    SKC_CORE_WARN("Map scale: {} does not fit in {:.2f} mm, using it anyway", smallest.label, max_length_mm);
    return RulerScale{smallest.arcminutes * astro_constants::kArcMinToRad * drawing_scale,
                      smallest.arcminutes,
                      std::string(smallest.label)};
}

MapScaleWidget::MapScaleWidget(f64 drawing_scale, f64 max_length_mm, f64 legend_font_size, f64 legend_linewidth)
    : m_ruler{select_ruler_scale(max_length_mm, drawing_scale)}
    , m_text_height{legend_font_size * kFontFraction}
    , m_linewidth{legend_linewidth}
{
    m_size = Vec2d{m_ruler.length_mm + 2.0 * m_text_height, 3.0 * m_text_height};
}

void MapScaleWidget::draw(graphics::Painter& painter, f64 right, f64 bottom) const
{
    const f64 fh = m_text_height;
    const f64 x = right - fh;
    const f64 y = bottom + 1.5 * fh;
    const f64 length = m_ruler.length_mm;

    graphics::PainterStateGuard guard{painter};
    painter.set_linewidth(m_linewidth);
    const f64 lw = painter.linewidth();

    painter.line(Vec2d{x, y}, Vec2d{x - length, y});
    painter.line(Vec2d{x - lw / 2.0, y - 0.5 * fh}, Vec2d{x - lw / 2.0, y + 0.5 * fh});
    painter.line(Vec2d{x - length + lw / 2.0, y - 0.5 * fh}, Vec2d{x - length + lw / 2.0, y + 0.5 * fh});

    painter.set_font_size(fh);
    painter.text_centred(Vec2d{x - length / 2.0, y + fh * 2.0 / 3.0}, m_ruler.label);

    const f64 left = right - m_size.x;
    const f64 top = bottom + m_size.y;
    painter.line(Vec2d{left, top}, Vec2d{right, top});
    painter.line(Vec2d{left, top}, Vec2d{left, bottom});
}

} // namespace skychart::chart

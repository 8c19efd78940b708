/// @file magnitude_scale.cpp
/// @brief Magnitude scale widget.

#include "chart/magnitude_scale.hpp"

#include "chart/symbol_renderer.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/fmt/fmt.h>

namespace skychart::chart
{

MagnitudeScaleWidget::MagnitudeScaleWidget(graphics::Painter& painter,
                                           f64 limiting_magnitude,
                                           f64 legend_font_size,
                                           f64 star_border_linewidth,
                                           f64 legend_linewidth)
    : m_limiting_magnitude{limiting_magnitude}
    , m_font_size{legend_font_size}
    , m_star_border_linewidth{star_border_linewidth}
    , m_legend_linewidth{legend_linewidth}
{
    const auto faintest = static_cast<i32>(std::floor(limiting_magnitude));

    graphics::PainterStateGuard guard{painter};
    painter.set_font_size(legend_font_size);

    f64 widest = 0.0;
    for (u32 i = 0; i < kStarsInScale; ++i)
    {
        const i32 magnitude = faintest - static_cast<i32>(i);
        m_magnitudes.push_back(magnitude);
        m_labels.push_back(fmt::format("{}", magnitude));
        widest = std::max(widest, painter.text_width(m_labels.back()));
    }

    const f64 h = legend_font_size;
    m_size = Vec2d{2.5 * h + widest, kStarsInScale * kRowSpacing * h};
}

void MagnitudeScaleWidget::draw(graphics::Painter& painter, SymbolRenderer& symbols, f64 left, f64 bottom) const
{
    const f64 h = m_font_size;

    graphics::PainterStateGuard guard{painter};
    painter.set_font_size(h);

    for (std::size_t i = 0; i < m_magnitudes.size(); ++i)
    {
        const f64 y = bottom + (static_cast<f64>(i) + 0.5) * kRowSpacing * h;

        painter.set_linewidth(m_star_border_linewidth);
        painter.set_pen_gray(1.0);
        painter.set_fill_gray(0.0);
        symbols.draw_star(Vec2d{left + h, y},
                          magnitude_to_radius(static_cast<f64>(m_magnitudes[i]), m_limiting_magnitude));

        painter.set_pen_gray(0.0);
        painter.text_right(Vec2d{left + 2.0 * h, y - h / 3.0}, m_labels[i]);
    }

    const f64 right = left + m_size.x;
    const f64 top = bottom + m_size.y;
    painter.set_linewidth(m_legend_linewidth);
    painter.line(Vec2d{left, top}, Vec2d{right, top});
    painter.line(Vec2d{right, top}, Vec2d{right, bottom});
}

} // namespace skychart::chart

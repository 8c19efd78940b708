/// @file legend.cpp
/// @brief Legend drawing.

#include "chart/legend.hpp"

#include "chart/symbol_renderer.hpp"
#include "chart/symbol_shape.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>

#include <spdlog/fmt/fmt.h>

namespace skychart::chart
{

namespace
{

struct LegendEntry
{
    LegendSymbol symbol;
    SymbolShape shape;
};

/// @brief Sort by translated name length, then reverse: longest names first,
///        equal lengths in reverse of the given order.
template <std::size_t N>
void order_by_name_length(std::array<LegendEntry, N>& entries, const LanguageTable& language)
{
    std::stable_sort(entries.begin(), entries.end(),
                     [&language](const LegendEntry& a, const LegendEntry& b)
                     {
                         return language.symbol_name(a.symbol).size() < language.symbol_name(b.symbol).size();
                     });
    std::reverse(entries.begin(), entries.end());
}

} // anonymous namespace

std::string format_coordinates(const astro::EquatorialCoord& position, const LanguageTable& language)
{
    const f64 hours = astro::Projection::normalize_radians(position.ra) * astro_constants::kRadToHour;
    auto rah = static_cast<i32>(hours);
    auto ram = static_cast<i32>((hours - rah) * 60.0);
    auto ras = static_cast<i32>(((hours - rah) * 60.0 - ram) * 60.0 + 0.5);
    if (ras == 60)
    {
        ++ram;
        ras = 0;
    }
    if (ram == 60)
    {
        ++rah;
        ram = 0;
    }
    if (rah == 24)
    {
        rah = 0;
    }

    const char sign = position.dec < 0.0 ? '-' : '+';
    const f64 degrees = std::abs(position.dec) * astro_constants::kRadToDeg;
    auto decd = static_cast<i32>(degrees);
    auto decm = static_cast<i32>((degrees - decd) * 60.0);
    auto decs = static_cast<i32>(((degrees - decd) * 60.0 - decm) * 60.0 + 0.5);
    if (decs == 60)
    {
        ++decm;
        decs = 0;
    }
    if (decm == 60)
    {
        ++decd;
        decm = 0;
    }

    return fmt::format("{:>2}{}{}{}{}{} {}{}°{}'{}\"",
                       rah, language.hour_unit, ram, language.minute_unit, ras, language.second_unit,
                       sign, decd, decm, decs);
}

Legend::Legend(graphics::Painter& painter, const FieldOfView& fov, const ChartOptions& options)
    : m_painter{painter}
    , m_fov{fov}
    , m_options{options}
    , m_language{language_table(options.language)}
{
}

void Legend::draw_caption() const
{
    if (m_options.caption.empty())
    {
        return;
    }
    const f64 font_size = m_options.legend_font_size();

    graphics::PainterStateGuard guard{m_painter};
    m_painter.set_font_size(2.0 * font_size);
    m_painter.text_centred(Vec2d{0.0, m_options.drawing_width / 2.0 * FieldOfView::kBaseScale + font_size},
                           m_options.caption);
}

void Legend::draw_field_border() const
{
    const f64 r = m_fov.field_radius_mm();
    m_painter.set_linewidth(m_options.line_widths.legend);
    m_painter.line(Vec2d{-r, -r}, Vec2d{-r, r});
    m_painter.line(Vec2d{-r, r}, Vec2d{r, r});
    m_painter.line(Vec2d{r, r}, Vec2d{r, -r});
    m_painter.line(Vec2d{r, -r}, Vec2d{-r, -r});
}

void Legend::draw_orientation() const
{
    const f64 font_size = m_painter.font_size();
    const f64 r = m_fov.field_radius_mm();
    const f64 dl = 0.02 * m_options.drawing_width;
    const f64 x = -r + dl + 0.2 * font_size;
    const f64 y = r - dl - 1.3 * font_size;

    // The legend itself is never mirrored, so the captions name what the flipped map shows.
    const char* y_caption = m_options.mirror_y ? "S" : "N";
    const char* x_caption = m_options.mirror_x ? "E" : "W";

    m_painter.text_centred(Vec2d{x, y + dl + 0.65 * font_size}, y_caption);
    m_painter.text_right(Vec2d{x + dl + font_size / 6.0, y - font_size / 3.0}, x_caption);

    m_painter.line(Vec2d{x - dl, y}, Vec2d{x + dl, y});
    m_painter.line(Vec2d{x, y - dl}, Vec2d{x, y + dl});
}

void Legend::draw_coordinates() const
{
    const f64 font_size = m_painter.font_size();
    const f64 r = m_fov.field_radius_mm();
    m_painter.text_left(Vec2d{r - font_size / 2.0, r - font_size},
                        format_coordinates(m_fov.centre, m_language));
}

void Legend::draw_dso_legend(SymbolRenderer& symbols) const
{
    const f64 fh = m_painter.font_size();
    const f64 r = fh / 3.0;
    const f64 text_offset = -2.5 * r;
    const f64 x = kSymbolColumn * m_options.drawing_width;

    std::array<LegendEntry, 4> top{{
        {LegendSymbol::OpenCluster, CircleShape{CircleKind::OpenCluster, r}},
        {LegendSymbol::Asterism, DiamondShape{r}},
        {LegendSymbol::Galaxy, EllipseShape{r, r / 2.0, 0.0}},
        {LegendSymbol::GlobularCluster, CircleShape{CircleKind::GlobularCluster, r}},
    }};
    std::array<LegendEntry, 4> bottom{{
        {LegendSymbol::SupernovaRemnant, CircleShape{CircleKind::SupernovaRemnant, r}},
        {LegendSymbol::DiffuseNebula, RectangleShape{r / 2.0}},
        {LegendSymbol::PlanetaryNebula, CircleShape{CircleKind::PlanetaryNebula, r}},
        {LegendSymbol::GalaxyPart, CrossShape{r}},
    }};
    order_by_name_length(top, m_language);
    order_by_name_length(bottom, m_language);

    const f64 top_y = kSymbolTop * m_options.drawing_width;
    for (std::size_t i = 0; i < top.size(); ++i)
    {
        const f64 y = top_y - static_cast<f64>(i + 1) * fh;
        symbols.draw(top[i].shape, Vec2d{x, y});
        m_painter.text_left(Vec2d{x + text_offset, y - fh / 3.0},
                            std::string(m_language.symbol_name(top[i].symbol)));
    }

    const f64 bottom_y = -kLegendMargin * m_options.drawing_width;
    for (std::size_t i = 0; i < bottom.size(); ++i)
    {
        const f64 y = bottom_y + static_cast<f64>(i) * fh;
        symbols.draw(bottom[i].shape, Vec2d{x, y});
        m_painter.text_left(Vec2d{x + text_offset, y - fh / 3.0},
                            std::string(m_language.symbol_name(bottom[i].symbol)));
    }
}

} // namespace skychart::chart

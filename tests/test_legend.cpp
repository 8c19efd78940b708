/// @file test_legend.cpp
/// @brief Coordinate formatting, translations and legend widgets.

#include <doctest/doctest.h>

#include "chart/chart_options.hpp"
#include "chart/field_of_view.hpp"
#include "chart/language.hpp"
#include "chart/legend.hpp"
#include "chart/magnitude_scale.hpp"
#include "chart/symbol_renderer.hpp"
#include "graphics/painter.hpp"
#include "graphics/recording_surface.hpp"

#include <string>

using namespace skychart;
using namespace skychart::chart;
using astro_constants::kDegToRad;
using astro_constants::kHourToRad;
using graphics::CommandKind;

namespace
{

std::vector<std::string> texts_of(const graphics::RecordingSurface& surface)
{
    std::vector<std::string> texts;
    for (const auto* command : surface.commands_of(CommandKind::Text))
    {
        texts.push_back(command->text);
    }
    return texts;
}

} // anonymous namespace

TEST_CASE("Centre coordinates are formatted with carries")
{
    const LanguageTable& en = language_table(Language::English);

    CHECK(format_coordinates({0.0, 0.0}, en) == " 0h0m0s +0°0'0\"");
    CHECK(format_coordinates({12.5 * kHourToRad, (41.0 + 16.0 / 60.0) * kDegToRad}, en) == "12h30m0s +41°16'0\"");

    SUBCASE("Seconds rounding up carries into minutes and hours")
    {
        const f64 hours = 1.0 + 59.0 / 60.0 + 59.8 / 3600.0;
        CHECK(format_coordinates({hours * kHourToRad, 0.0}, en) == " 2h0m0s +0°0'0\"");
    }

    SUBCASE("Negative declinations carry into degrees")
    {
        const f64 degrees = 10.0 + 59.0 / 60.0 + 59.9 / 3600.0;
        CHECK(format_coordinates({0.0, -degrees * kDegToRad}, en) == " 0h0m0s -11°0'0\"");
    }

    SUBCASE("23h59m59.9s wraps to 0h")
    {
        const f64 hours = 23.0 + 59.0 / 60.0 + 59.9 / 3600.0;
        CHECK(format_coordinates({hours * kHourToRad, 0.0}, en) == " 0h0m0s +0°0'0\"");
    }

    SUBCASE("Dutch hour unit")
    {
        CHECK(format_coordinates({12.5 * kHourToRad, 0.0}, language_table(Language::Dutch)) == "12u30m0s +0°0'0\"");
    }
}

TEST_CASE("Language codes")
{
    CHECK(parse_language("en") == Language::English);
    CHECK(parse_language("NL") == Language::Dutch);
    CHECK(parse_language("Nl") == Language::Dutch);
    CHECK_FALSE(parse_language("de").has_value());
    CHECK_FALSE(parse_language("").has_value());

    CHECK(language_table(Language::English).symbol_name(LegendSymbol::GlobularCluster) == "Globular cluster");
    CHECK(language_table(Language::Dutch).symbol_name(LegendSymbol::GlobularCluster) == "Bolhoop");
}

TEST_CASE("Bayer abbreviations map to Greek letters")
{
    CHECK(greek_letter("alp") == std::string_view{"α"});
    CHECK(greek_letter("sig") == std::string_view{"σ"});
    CHECK(greek_letter("ome") == std::string_view{"ω"});
    CHECK_FALSE(greek_letter("xyz").has_value());
    CHECK_FALSE(greek_letter("ALP").has_value());
}

TEST_CASE("Magnitude scale lists seven magnitudes from the limit down")
{
    graphics::RecordingSurface surface;
    graphics::Painter painter{surface};
    const f64 fs = 4.68;

    const MagnitudeScaleWidget widget{painter, 13.8, fs, 0.06, 0.2};

    REQUIRE(widget.magnitudes().size() == MagnitudeScaleWidget::kStarsInScale);
    CHECK(widget.magnitudes().front() == 13);
    CHECK(widget.magnitudes().back() == 7);

    const f64 widest = 2.0 * graphics::RecordingSurface::kGlyphWidthFactor * fs;
    CHECK(widget.size().x == doctest::Approx(2.5 * fs + widest));
    CHECK(widget.size().y == doctest::Approx(7.0 * 1.2 * fs));

    SUBCASE("Drawing")
    {
        SymbolRenderer symbols{painter, LineWidths{}};
        widget.draw(painter, symbols, -88.0, -88.0);

        const auto circles = surface.commands_of(CommandKind::Circle);
        REQUIRE(circles.size() == 7);
        // Faintest at the bottom, discs growing upwards.
        CHECK(circles[0]->points[0].y < circles[6]->points[0].y);
        CHECK(circles[0]->radius < circles[6]->radius);

        const auto texts = texts_of(surface);
        REQUIRE(texts.size() == 7);
        CHECK(texts.front() == "13");
        CHECK(texts.back() == "7");
        CHECK(surface.commands_of(CommandKind::Line).size() == 2);
    }
}

TEST_CASE("Legend elements")
{
    graphics::RecordingSurface surface;
    graphics::Painter painter{surface};
    ChartOptions options{};
    const FieldOfView fov = FieldOfView::from_drawing_width({0.0, 0.0}, 2.0 * kDegToRad, options.drawing_width);

    SUBCASE("Orientation follows the mirror")
    {
        options.mirror_y = true;
        const Legend legend{painter, fov, options};
        legend.draw_orientation();

        const auto texts = texts_of(surface);
        REQUIRE(texts.size() == 2);
        CHECK(texts[0] == "S");
        CHECK(texts[1] == "W");
        CHECK(surface.commands_of(CommandKind::Line).size() == 2);
    }

    SUBCASE("Field border is a square at the field radius")
    {
        const Legend legend{painter, fov, options};
        legend.draw_field_border();

        const auto lines = surface.commands_of(CommandKind::Line);
        REQUIRE(lines.size() == 4);
        CHECK(lines[0]->points[0].x == doctest::Approx(-fov.field_radius_mm()));
        CHECK(lines[1]->points[1].y == doctest::Approx(fov.field_radius_mm()));
    }

    SUBCASE("No caption, nothing drawn")
    {
        const Legend legend{painter, fov, options};
        legend.draw_caption();
        CHECK(surface.commands().empty());
    }

    SUBCASE("Symbol legend: longest names first in each column")
    {
        SymbolRenderer symbols{painter, options.line_widths};
        const Legend legend{painter, fov, options};
        legend.draw_dso_legend(symbols);

        const auto texts = texts_of(surface);
        REQUIRE(texts.size() == kLegendSymbolCount);
        CHECK(texts[0] == "Globular cluster");
        CHECK(texts[3] == "Galaxy");
        CHECK(texts[4] == "Part of external galaxy");
        CHECK(texts[7] == "Diffuse nebula");
    }
}

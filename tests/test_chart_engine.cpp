/// @file test_chart_engine.cpp
/// @brief End-to-end render passes onto a RecordingSurface.

#include <doctest/doctest.h>

#include "catalog/constellation.hpp"
#include "catalog/deepsky_catalog.hpp"
#include "catalog/star_catalog.hpp"
#include "chart/chart_engine.hpp"
#include "chart/chart_options.hpp"
#include "chart/field_of_view.hpp"
#include "chart/legend.hpp"
#include "graphics/recording_surface.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

using namespace skychart;
using namespace skychart::chart;
using astro_constants::kArcMinToRad;
using astro_constants::kDegToRad;
using graphics::CommandKind;
using graphics::DrawCommand;
using graphics::RecordingSurface;

namespace
{

const DrawCommand* find_text(const RecordingSurface& surface, const std::string& text)
{
    for (const auto* command : surface.commands_of(CommandKind::Text))
    {
        if (command->text == text)
        {
            return command;
        }
    }
    return nullptr;
}

catalog::DeepSkyObject make_object(f64 ra, f64 dec, catalog::DsoType type, f32 mag, u32 messier,
                                   std::vector<std::string> names)
{
    return catalog::DeepSkyObject{
        .ra       = ra,
        .dec      = dec,
        .type     = type,
        .rlong    = 5.0 * kArcMinToRad,
        .rshort   = 3.0 * kArcMinToRad,
        .mag      = mag,
        .messier  = messier,
        .cat      = "NGC",
        .names    = std::move(names),
    };
}

/// Field centre used by most cases: on the equator so offsets map simply.
const astro::EquatorialCoord kCentre{1.0, 0.0};

} // anonymous namespace

TEST_CASE("Andromeda galaxy at the field centre")
{
    const astro::EquatorialCoord m31_pos{10.6847 * kDegToRad, 41.2690 * kDegToRad};
    const catalog::DeepskyCatalog deepsky{{catalog::DeepSkyObject{
        .ra             = m31_pos.ra,
        .dec            = m31_pos.dec,
        .type           = catalog::DsoType::Galaxy,
        .rlong          = 95.3 * kArcMinToRad,
        .rshort         = 30.9 * kArcMinToRad,
        .position_angle = 35.0 * kDegToRad,
        .mag            = 3.4f,
        .messier        = 31,
        .cat            = "NGC",
        .names          = {"224"},
    }}};

    const ChartOptions options{};
    const FieldOfView fov = FieldOfView::from_drawing_width(m31_pos, 2.0 * kDegToRad, options.drawing_width);
    ChartCatalogs catalogs;
    catalogs.deepsky = &deepsky;

    RecordingSurface surface;
    const RenderReport report = render_chart(surface, fov, catalogs, options);

    CHECK(report.deepsky_objects == 1);
    REQUIRE(report.labels.size() == 1);
    CHECK(report.labels[0].text == "M 31");
    // Nothing else is near, so the first candidate wins.
    CHECK(report.labels[0].slot == LabelSlot::Below);
    CHECK(report.labels[0].symbol_position.x == doctest::Approx(0.0));
    CHECK(report.labels[0].symbol_position.y == doctest::Approx(0.0));

    const auto ellipses = surface.commands_of(CommandKind::Ellipse);
    REQUIRE(ellipses.size() == 1);
    CHECK(ellipses[0]->points[0].x == doctest::Approx(0.0));
    CHECK(ellipses[0]->points[0].y == doctest::Approx(0.0));
    CHECK(ellipses[0]->radius == doctest::Approx(95.3 * kArcMinToRad * fov.drawing_scale));
    CHECK(ellipses[0]->radius2 == doctest::Approx(30.9 * kArcMinToRad * fov.drawing_scale));
    CHECK(ellipses[0]->angle == doctest::Approx(normalize_position_angle(35.0 * kDegToRad + astro_constants::kHalfPi)));

    CHECK(find_text(surface, "M 31") != nullptr);
    CHECK(report.ruler_label == "1°");
}

TEST_CASE("Lone galaxy at the centre of a small field")
{
    const astro::EquatorialCoord centre{1.5, 1.0};
    const catalog::DeepskyCatalog deepsky{{catalog::DeepSkyObject{
        .ra             = centre.ra,
        .dec            = centre.dec,
        .type           = catalog::DsoType::Galaxy,
        .rlong          = 0.01,
        .rshort         = 0.005,
        .position_angle = 0.0,
        .mag            = 10.0f,
        .cat            = "NGC",
        .names          = {"1"},
    }}};

    const ChartOptions options{};
    const FieldOfView fov = FieldOfView::from_drawing_width(centre, 0.05, options.drawing_width);
    ChartCatalogs catalogs;
    catalogs.deepsky = &deepsky;

    RecordingSurface surface;
    const RenderReport report = render_chart(surface, fov, catalogs, options);

    const auto ellipses = surface.commands_of(CommandKind::Ellipse);
    REQUIRE(ellipses.size() == 1);
    CHECK(ellipses[0]->points[0].x == doctest::Approx(0.0));
    CHECK(ellipses[0]->points[0].y == doctest::Approx(0.0));
    CHECK(ellipses[0]->radius == doctest::Approx(0.01 * fov.drawing_scale));
    CHECK(ellipses[0]->radius2 == doctest::Approx(0.005 * fov.drawing_scale));
    // North is up at the field centre, so position angle 0 puts the long axis vertical.
    CHECK(ellipses[0]->angle == doctest::Approx(astro_constants::kHalfPi));

    REQUIRE(report.labels.size() == 1);
    CHECK(report.labels[0].text == "1");
    CHECK(report.labels[0].slot == LabelSlot::Below);
}

TEST_CASE("Brighter objects are labelled first")
{
    const catalog::DeepskyCatalog deepsky{{
        make_object(1.0 + 0.3 * kDegToRad, 0.2 * kDegToRad, catalog::DsoType::Galaxy, 9.0f, 0, {"7000"}),
        make_object(1.0 - 0.3 * kDegToRad, -0.4 * kDegToRad, catalog::DsoType::OpenCluster, 4.0f, 42, {"1976"}),
        make_object(1.0, 0.6 * kDegToRad, catalog::DsoType::Galaxy, 16.0f, 0, {"7001"}),
        make_object(1.0, 1.0 * kDegToRad, catalog::DsoType::PlanetaryNebula, 11.0f, 0, {"7293", "7009"}),
    }};

    const ChartOptions options{};
    const FieldOfView fov = FieldOfView::from_drawing_width(kCentre, 2.0 * kDegToRad, options.drawing_width);
    ChartCatalogs catalogs;
    catalogs.deepsky = &deepsky;

    RecordingSurface surface;
    const RenderReport report = render_chart(surface, fov, catalogs, options);

    CHECK(report.deepsky_objects == 4);
    // The magnitude 16 galaxy is beyond the label limit.
    REQUIRE(report.labels.size() == 3);
    CHECK(report.labels[0].text == "M 42");
    CHECK(report.labels[1].text == "7000");
    CHECK(report.labels[2].text == "7009-7293");
    CHECK(find_text(surface, "7001") == nullptr);
}

TEST_CASE("Labels avoid neighbouring symbols")
{
    const ChartOptions options{};
    const FieldOfView fov = FieldOfView::from_drawing_width(kCentre, 2.0 * kDegToRad, options.drawing_width);

    // B sits right where A's first candidate would go.
    const f64 below_offset_mm = options.min_radius / std::sqrt(2.0) + options.font_size / 2.0;
    ChartCatalogs catalogs;
    catalogs.extra_positions = {
        ExtraPosition{kCentre, "A", std::nullopt},
        ExtraPosition{{kCentre.ra, -below_offset_mm / fov.drawing_scale}, "B", std::nullopt},
    };

    RecordingSurface surface;
    const RenderReport report = render_chart(surface, fov, catalogs, options);

    CHECK(report.extra_positions == 2);
    REQUIRE(report.labels.size() == 2);
    CHECK(report.labels[0].text == "A");
    CHECK(report.labels[0].slot != LabelSlot::Below);
}

TEST_CASE("Extra positions")
{
    const ChartOptions options{};
    const FieldOfView fov = FieldOfView::from_drawing_width(kCentre, 2.0 * kDegToRad, options.drawing_width);

    ChartCatalogs catalogs;
    catalogs.extra_positions = {
        ExtraPosition{{kCentre.ra + 0.5 * kDegToRad, 0.0}, "X1", LabelSlot::Right},
        ExtraPosition{{kCentre.ra + 5.0 * kDegToRad, 0.0}, "Outside", std::nullopt},
        ExtraPosition{{kCentre.ra, 0.5 * kDegToRad}, "", std::nullopt},
    };

    SUBCASE("A fixed slot is honoured; positions outside the field are skipped")
    {
        RecordingSurface surface;
        const RenderReport report = render_chart(surface, fov, catalogs, options);

        CHECK(report.extra_positions == 2);
        REQUIRE(report.labels.size() == 1);
        CHECK(report.labels[0].slot == LabelSlot::Right);

        // East is to the left on an unmirrored chart.
        const DrawCommand* text = find_text(surface, "X1");
        REQUIRE(text != nullptr);
        CHECK(text->points[0].x < 0.0);
        CHECK(text->anchor == graphics::TextAnchor::Start);
        CHECK(find_text(surface, "Outside") == nullptr);
    }

    SUBCASE("Mirrored east-west")
    {
        ChartOptions mirrored = options;
        mirrored.mirror_x = true;

        RecordingSurface surface;
        const RenderReport report = render_chart(surface, fov, catalogs, mirrored);

        REQUIRE(report.labels.size() == 1);
        const DrawCommand* text = find_text(surface, "X1");
        REQUIRE(text != nullptr);
        CHECK(text->points[0].x > 0.0);
        CHECK(text->anchor == graphics::TextAnchor::End);
        // The legend is not mirrored.
        CHECK(find_text(surface, "E") != nullptr);
    }
}

TEST_CASE("Stars and constellations")
{
    const catalog::StarCatalog stars{{
        catalog::StarEntry{.ra = kCentre.ra, .dec = 0.0, .mag_v = 5.0f, .catalog_id = 1},
        catalog::StarEntry{.ra = kCentre.ra + 1.0 * kDegToRad, .dec = 0.5 * kDegToRad, .mag_v = 8.0f, .catalog_id = 2},
        catalog::StarEntry{.ra = kCentre.ra, .dec = 0.5 * kDegToRad, .mag_v = 14.0f, .catalog_id = 3},
        catalog::StarEntry{.ra = kCentre.ra + 10.0 * kDegToRad, .dec = 0.0, .mag_v = 1.0f, .catalog_id = 4},
    }};

    catalog::ConstellationCatalog constellations;
    constellations.bright_stars = {
        catalog::StarEntry{.ra = kCentre.ra + 0.5 * kDegToRad, .dec = 0.3 * kDegToRad, .mag_v = 2.0f,
                           .greek = "alp", .constellation = "Ori"},
        catalog::StarEntry{.ra = kCentre.ra - 0.5 * kDegToRad, .dec = -0.3 * kDegToRad, .mag_v = 3.0f,
                           .greek = "bet", .constellation = "Ori"},
        catalog::StarEntry{.ra = kCentre.ra + astro_constants::kPi, .dec = 0.0, .mag_v = 3.0f,
                           .greek = "gam", .constellation = "Ori"},
        catalog::StarEntry{.ra = kCentre.ra + 0.5 * kDegToRad, .dec = 0.3 * kDegToRad, .mag_v = 2.0f,
                           .greek = "alp", .constellation = "Ori"},
    };
    constellations.constellations = {
        catalog::Constellation{.abbreviation = "Ori", .lines = {{1, 2}, {2, 3}}},
    };

    const ChartOptions options{};
    const FieldOfView fov = FieldOfView::from_drawing_width(kCentre, 2.0 * kDegToRad, options.drawing_width);
    ChartCatalogs catalogs;
    catalogs.stars = &stars;
    catalogs.constellations = &constellations;

    RecordingSurface surface;
    const RenderReport report = render_chart(surface, fov, catalogs, options);

    CHECK(report.stars == 2);
    // The line to the far side of the sky is left out.
    CHECK(report.constellation_lines == 1);
    // Greek letters are printed once per constellation, and not on the far side.
    CHECK(report.greek_labels == 2);
    REQUIRE(find_text(surface, "α") != nullptr);
    // Greek letters sit at the lower right of their star.
    CHECK(find_text(surface, "α")->anchor == graphics::TextAnchor::Start);
    CHECK(find_text(surface, "β") != nullptr);
    CHECK(find_text(surface, "γ") == nullptr);

    const auto lines = surface.commands_of(CommandKind::Line);
    const bool has_constellation_colour = std::any_of(lines.begin(), lines.end(), [](const DrawCommand* c) {
        return c->pen.r == doctest::Approx(0.2) && c->pen.b == doctest::Approx(1.0);
    });
    CHECK(has_constellation_colour);
}

TEST_CASE("Page layout and legend")
{
    ChartOptions options{};
    const FieldOfView fov = FieldOfView::from_drawing_width(kCentre, 2.0 * kDegToRad, options.drawing_width);
    const ChartCatalogs catalogs{};

    SUBCASE("Square page without caption")
    {
        RecordingSurface surface;
        render_chart(surface, fov, catalogs, options);

        CHECK(surface.page_size().x == doctest::Approx(options.drawing_width));
        CHECK(surface.page_size().y == doctest::Approx(options.drawing_width));
        CHECK(surface.commands().front().kind == CommandKind::Begin);
        CHECK(surface.commands().back().kind == CommandKind::Finish);
        CHECK(surface.commands_of(CommandKind::Clip).size() == 1);
        CHECK(surface.commands_of(CommandKind::ResetClip).size() == 1);

        CHECK(find_text(surface, "N") != nullptr);
        CHECK(find_text(surface, "W") != nullptr);
        CHECK(find_text(surface, "1°") != nullptr);
        CHECK(find_text(surface, "13") != nullptr);
        CHECK(find_text(surface, format_coordinates(fov.centre, language_table(Language::English))) != nullptr);
        CHECK(find_text(surface, "Galaxy") == nullptr);
    }

    SUBCASE("Caption adds room above the map")
    {
        options.caption = "Orion";
        RecordingSurface surface;
        render_chart(surface, fov, catalogs, options);

        CHECK(surface.page_size().y == doctest::Approx(options.drawing_width + 2.0 * options.legend_font_size()));
        const DrawCommand* caption = find_text(surface, "Orion");
        REQUIRE(caption != nullptr);
        CHECK(caption->font_size == doctest::Approx(2.0 * options.legend_font_size()));
    }

    SUBCASE("Symbol legend in Dutch")
    {
        options.show_dso_legend = true;
        options.language = Language::Dutch;
        RecordingSurface surface;
        render_chart(surface, fov, catalogs, options);

        CHECK(find_text(surface, "Bolhoop") != nullptr);
        CHECK(find_text(surface, "Sterrenstelsel") != nullptr);
        CHECK(find_text(surface, format_coordinates(fov.centre, language_table(Language::Dutch))) != nullptr);
    }

    SUBCASE("Inverted colours paint a black background")
    {
        options.invert_colors = true;
        RecordingSurface surface;
        render_chart(surface, fov, catalogs, options);

        const auto polygons = surface.commands_of(CommandKind::Polygon);
        REQUIRE_FALSE(polygons.empty());
        CHECK(polygons[0]->fill.r == doctest::Approx(0.0));
    }
}

TEST_CASE("Render passes are deterministic")
{
    const catalog::DeepskyCatalog deepsky{{
        make_object(1.0 + 0.1 * kDegToRad, 0.1 * kDegToRad, catalog::DsoType::Galaxy, 9.0f, 0, {"1"}),
        make_object(1.0 - 0.1 * kDegToRad, 0.0, catalog::DsoType::GlobularCluster, 9.0f, 0, {"2"}),
        make_object(1.0, -0.1 * kDegToRad, catalog::DsoType::DiffuseNebula, 9.0f, 0, {"3"}),
        make_object(1.0, 0.05 * kDegToRad, catalog::DsoType::Asterism, 9.0f, 0, {"4"}),
    }};

    const ChartOptions options{};
    const FieldOfView fov = FieldOfView::from_drawing_width(kCentre, 1.0 * kDegToRad, options.drawing_width);
    ChartCatalogs catalogs;
    catalogs.deepsky = &deepsky;

    RecordingSurface first_surface;
    RecordingSurface second_surface;
    const RenderReport first = render_chart(first_surface, fov, catalogs, options);
    const RenderReport second = render_chart(second_surface, fov, catalogs, options);

    REQUIRE(first.labels.size() == 4);
    REQUIRE(second.labels.size() == first.labels.size());
    for (std::size_t i = 0; i < first.labels.size(); ++i)
    {
        CHECK(first.labels[i].text == second.labels[i].text);
        CHECK(first.labels[i].slot == second.labels[i].slot);
    }
    CHECK(first_surface.commands().size() == second_surface.commands().size());
}

/// @file chart_engine.cpp
/// @brief Render pass: widgets, clip, sky layers, legend.

#include "chart/chart_engine.hpp"

#include "chart/label_placer.hpp"
#include "chart/legend.hpp"
#include "chart/magnitude_scale.hpp"
#include "chart/projected_object.hpp"
#include "chart/repulsion_field.hpp"
#include "chart/ruler_scale.hpp"
#include "chart/symbol_renderer.hpp"
#include "chart/symbol_shape.hpp"
#include "core/logger.hpp"
#include "graphics/painter.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <utility>

namespace skychart::chart
{

namespace
{

constexpr graphics::Rgb kConstellationColor{0.2, 0.7, 1.0};
constexpr f64 kGreekFontScale = 1.3;

/// Drawing state shared by the layers of one pass.
struct PassContext
{
    graphics::Painter& painter;
    SymbolRenderer& symbols;
    const FieldOfView& fov;
    const ChartOptions& options;
    RenderReport& report;
};

/// An extra position inside the field, ready to draw.
struct ProjectedExtra
{
    const ExtraPosition* extra;
    Vec2d position;
    f64 label_width;
};

bool on_near_hemisphere(const catalog::StarEntry& star, const FieldOfView& fov)
{
    return astro::Projection::angular_distance(astro::EquatorialCoord{star.ra, star.dec}, fov.centre)
           <= astro_constants::kHalfPi;
}

// -----------------------------------------------------------------
// Projection (before anything is drawn)
// -----------------------------------------------------------------

std::vector<ProjectedObject> project_deepsky(PassContext& ctx, const catalog::DeepskyCatalog& catalog)
{
    std::vector<const catalog::DeepSkyObject*> selection = catalog.select(ctx.fov.centre, ctx.fov.radius);
    std::stable_sort(selection.begin(), selection.end(),
                     [](const catalog::DeepSkyObject* a, const catalog::DeepSkyObject* b)
                     {
                         return a->mag < b->mag;
                     });
    SKC_CORE_DEBUG("{} deep-sky objects in map", selection.size());

    std::vector<ProjectedObject> projected;
    projected.reserve(selection.size());
    for (const auto* object : selection)
    {
        ProjectedObject p = project_deepsky_object(*object, ctx.fov, ctx.options.min_radius);
        p.label = deepsky_label(*object, ctx.options.deepsky_label_limit);
        p.label_width = ctx.painter.text_width(p.label);
        projected.push_back(std::move(p));
    }
    return projected;
}

std::vector<ProjectedExtra> project_extras(PassContext& ctx, const std::vector<ExtraPosition>& extras)
{
    std::vector<ProjectedExtra> projected;
    for (const auto& extra : extras)
    {
        if (!ctx.fov.contains(extra.position))
        {
            SKC_CORE_TRACE("Extra position '{}' outside the field", extra.label);
            continue;
        }
        projected.push_back(ProjectedExtra{&extra, ctx.fov.to_map(extra.position),
                                           ctx.painter.text_width(extra.label)});
    }
    return projected;
}

// -----------------------------------------------------------------
// Layers
// -----------------------------------------------------------------

void draw_constellations(PassContext& ctx, const catalog::ConstellationCatalog& catalog)
{
    graphics::Painter& painter = ctx.painter;
    graphics::PainterStateGuard guard{painter};
    painter.set_linewidth(ctx.options.line_widths.constellation);

    {
        graphics::PainterStateGuard font_guard{painter};
        painter.set_font_size(kGreekFontScale * painter.font_size());
        const f64 fh = painter.font_size();

        std::map<std::string, std::set<std::string>> printed;
        for (const auto& star : catalog.bright_stars)
        {
            if (star.greek.empty() || !on_near_hemisphere(star, ctx.fov))
            {
                continue;
            }
            if (!printed[star.constellation].insert(star.greek).second)
            {
                continue;
            }

            const auto letter = greek_letter(star.greek);
            if (!letter)
            {
                SKC_CORE_WARN("Unknown Greek letter '{}' in {}", star.greek, star.constellation);
                continue;
            }

            const std::string text{*letter};
            const f64 r = magnitude_to_radius(star.mag_v, ctx.options.limiting_magnitude);
            const CandidateList candidates = transform_candidates(
                CandidateList{rim_candidate(r, painter.text_width(text), fh)},
                ctx.fov.to_map(star.ra, star.dec), 0.0);
            SymbolRenderer::draw_label(painter, candidates.front(), text);
            ++ctx.report.greek_labels;
        }
    }

    painter.set_pen_rgb(kConstellationColor);
    for (const auto& constellation : catalog.constellations)
    {
        for (const auto& [from, to] : constellation.lines)
        {
            const catalog::StarEntry* star1 = catalog.star_for_index(from);
            const catalog::StarEntry* star2 = catalog.star_for_index(to);
            if (star1 == nullptr || star2 == nullptr)
            {
                SKC_CORE_WARN("{}: line {}-{} references a missing star", constellation.abbreviation, from, to);
                continue;
            }
            // Far-side points would fold back onto the visible disc.
            if (!on_near_hemisphere(*star1, ctx.fov) || !on_near_hemisphere(*star2, ctx.fov))
            {
                continue;
            }
            painter.line(ctx.fov.to_map(star1->ra, star1->dec), ctx.fov.to_map(star2->ra, star2->dec));
            ++ctx.report.constellation_lines;
        }
    }
}

void draw_deepsky(PassContext& ctx, const std::vector<ProjectedObject>& objects, RepulsionField& field)
{
    const f64 fh = ctx.painter.font_size();

    for (std::size_t i = 0; i < objects.size(); ++i)
    {
        const ProjectedObject& object = objects[i];
        const SymbolShape shape = make_symbol_shape(object.object->type, object.rlong_mm, object.rshort_mm,
                                                    object.position_angle, ctx.options.default_symbol_radius());

        if (object.label.empty())
        {
            ctx.symbols.draw(shape, object.position);
            ++ctx.report.deepsky_objects;
            continue;
        }

        const CandidateList candidates = map_candidates(shape, object.position, object.label_width, fh);
        const std::size_t slot = place_label(field, candidates, object.label_width, i);

        ctx.symbols.draw(shape, object.position, object.label, static_cast<LabelSlot>(slot));
        ctx.report.labels.push_back(PlacedLabel{object.label, static_cast<LabelSlot>(slot),
                                                object.position, candidates[slot]});
        ++ctx.report.deepsky_objects;
    }
}

void draw_extras(PassContext& ctx, const std::vector<ProjectedExtra>& extras,
                 RepulsionField& field, std::size_t first_source)
{
    const f64 fh = ctx.painter.font_size();
    const SymbolShape shape = CrossShape{ctx.options.min_radius};

    for (std::size_t j = 0; j < extras.size(); ++j)
    {
        const ProjectedExtra& extra = extras[j];
        const std::string& label = extra.extra->label;

        if (label.empty())
        {
            ctx.symbols.draw(shape, extra.position);
            ++ctx.report.extra_positions;
            continue;
        }

        const CandidateList candidates = map_candidates(shape, extra.position, extra.label_width, fh);
        std::size_t slot = 0;
        if (extra.extra->slot)
        {
            slot = static_cast<std::size_t>(*extra.extra->slot);
            commit_candidate(field, candidates[slot], extra.label_width);
        }
        else
        {
            slot = place_label(field, candidates, extra.label_width, first_source + j);
        }

        ctx.symbols.draw(shape, extra.position, label, static_cast<LabelSlot>(slot));
        ctx.report.labels.push_back(PlacedLabel{label, static_cast<LabelSlot>(slot),
                                                extra.position, candidates[slot]});
        ++ctx.report.extra_positions;
    }
}

void draw_stars(PassContext& ctx, const catalog::StarCatalog& catalog)
{
    const f64 lm = ctx.options.limiting_magnitude;
    const auto selection = catalog.select(ctx.fov.centre, ctx.fov.radius, lm);
    SKC_CORE_DEBUG("{} stars in map", selection.size());

    graphics::Painter& painter = ctx.painter;
    graphics::PainterStateGuard guard{painter};
    painter.set_linewidth(ctx.options.line_widths.star_border);
    painter.set_pen_gray(1.0);
    painter.set_fill_gray(0.0);

    for (const auto* star : selection)
    {
        ctx.symbols.draw_star(ctx.fov.to_map(star->ra, star->dec), magnitude_to_radius(star->mag_v, lm));
        ++ctx.report.stars;
    }
}

/// @brief Map square minus the two legend widget boxes in the lower corners.
std::vector<Vec2d> map_clip_path(f64 r, Vec2d magnitude_scale_size, Vec2d map_scale_size)
{
    return {
        {r, r},
        {r, -r + map_scale_size.y},
        {r - map_scale_size.x, -r + map_scale_size.y},
        {r - map_scale_size.x, -r},
        {-r + magnitude_scale_size.x, -r},
        {-r + magnitude_scale_size.x, -r + magnitude_scale_size.y},
        {-r, -r + magnitude_scale_size.y},
        {-r, r},
    };
}

} // anonymous namespace

RenderReport render_chart(graphics::Surface& surface,
                          const FieldOfView& fov,
                          const ChartCatalogs& catalogs,
                          const ChartOptions& options)
{
    RenderReport report;

    const f64 width = options.drawing_width;
    const f64 legend_font_size = options.legend_font_size();
    const f64 height = options.caption.empty() ? width : width + 2.0 * legend_font_size;

    graphics::Painter painter{surface};
    painter.set_invert_colors(options.invert_colors);
    painter.begin_page(width, height);
    painter.set_pen_gray(0.0);
    painter.set_fill_gray(0.0);
    painter.set_font(options.font_family, options.font_size);
    painter.set_linewidth(options.line_widths.legend);

    SymbolRenderer symbols{painter, options.line_widths};
    PassContext ctx{painter, symbols, fov, options, report};

    const f64 r = fov.field_radius_mm();
    const MagnitudeScaleWidget magnitude_scale{painter, options.limiting_magnitude, legend_font_size,
                                               options.line_widths.star_border, options.line_widths.legend};
    const MapScaleWidget map_scale{fov.drawing_scale, width / 3.0, legend_font_size, options.line_widths.legend};
    report.ruler_label = map_scale.ruler().label;

    painter.clip_path(map_clip_path(r, magnitude_scale.size(), map_scale.size()));
    painter.set_mirror(graphics::MirrorTransform{options.mirror_x, options.mirror_y});

    // Everything that can carry a label is projected and seeded before drawing.
    std::vector<ProjectedObject> deepsky;
    if (catalogs.deepsky != nullptr)
    {
        deepsky = project_deepsky(ctx, *catalogs.deepsky);
    }
    const std::vector<ProjectedExtra> extras = project_extras(ctx, catalogs.extra_positions);

    std::vector<FieldSeed> seeds;
    seeds.reserve(deepsky.size() + extras.size());
    for (const auto& object : deepsky)
    {
        seeds.push_back(FieldSeed{object.position, object.seed_radius_mm});
    }
    for (const auto& extra : extras)
    {
        seeds.push_back(FieldSeed{extra.position, options.min_radius});
    }
    RepulsionField field{r, seeds};

    if (catalogs.constellations != nullptr)
    {
        SKC_CORE_DEBUG("Drawing constellations");
        draw_constellations(ctx, *catalogs.constellations);
    }
    if (!deepsky.empty())
    {
        SKC_CORE_DEBUG("Drawing deep-sky objects");
        draw_deepsky(ctx, deepsky, field);
    }
    if (!extras.empty())
    {
        SKC_CORE_DEBUG("Drawing {} extra positions", extras.size());
        draw_extras(ctx, extras, field, deepsky.size());
    }
    if (catalogs.stars != nullptr)
    {
        SKC_CORE_DEBUG("Drawing stars");
        draw_stars(ctx, *catalogs.stars);
    }

    painter.set_mirror(graphics::MirrorTransform{});
    painter.reset_clip();

    SKC_CORE_DEBUG("Drawing legend");
    const Legend legend{painter, fov, options};
    legend.draw_caption();
    {
        graphics::PainterStateGuard guard{painter};
        painter.set_font_size(legend_font_size);

        magnitude_scale.draw(painter, symbols, -r, -r);
        map_scale.draw(painter, r, -r);
        legend.draw_field_border();
        legend.draw_orientation();
        legend.draw_coordinates();
        if (options.show_dso_legend)
        {
            legend.draw_dso_legend(symbols);
        }
    }

    painter.finish_page();

    SKC_CORE_INFO("Chart done: {} stars, {} deep-sky objects, {} labels, ruler {}",
                  report.stars, report.deepsky_objects, report.labels.size(), report.ruler_label);
    return report;
}

} // namespace skychart::chart

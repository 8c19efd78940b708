#pragma once

/// @file chart_engine.hpp
/// @brief One complete chart render pass.

#include "astro/projection.hpp"
#include "catalog/constellation.hpp"
#include "catalog/deepsky_catalog.hpp"
#include "catalog/star_catalog.hpp"
#include "chart/chart_options.hpp"
#include "chart/field_of_view.hpp"
#include "chart/label_candidates.hpp"
#include "graphics/surface.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace skychart::chart
{
    /// @brief User-supplied marker drawn as an unknown-object cross.
    struct ExtraPosition
    {
        astro::EquatorialCoord position{0.0, 0.0};
        std::string label;
        std::optional<LabelSlot> slot;  ///< Fixed slot; chosen by the repulsion field when empty
    };

    /// @brief Data sources of a pass. Null catalogs skip their layer.
    struct ChartCatalogs
    {
        const catalog::StarCatalog* stars = nullptr;
        const catalog::DeepskyCatalog* deepsky = nullptr;
        const catalog::ConstellationCatalog* constellations = nullptr;
        std::vector<ExtraPosition> extra_positions;
    };

    struct PlacedLabel
    {
        std::string text;
        LabelSlot slot = LabelSlot::Below;
        Vec2d symbol_position{0.0};     ///< Map position of the labelled symbol (mm)
        LabelCandidate candidate;       ///< Chosen candidate in map coordinates
    };

    /// @brief What a render pass drew.
    struct RenderReport
    {
        std::size_t stars = 0;
        std::size_t deepsky_objects = 0;
        std::size_t extra_positions = 0;
        std::size_t constellation_lines = 0;
        std::size_t greek_labels = 0;
        std::vector<PlacedLabel> labels;    ///< In placement order
        std::string ruler_label;
    };

    /// @brief Render one chart of @p fov onto @p surface.
    ///
    /// Layers are drawn in order: constellations, deep-sky objects (brightest
    /// first, labels placed greedily against a repulsion field), extra
    /// positions, stars, then caption and legend. Surface errors propagate.
    RenderReport render_chart(graphics::Surface& surface,
                              const FieldOfView& fov,
                              const ChartCatalogs& catalogs,
                              const ChartOptions& options);

} // namespace skychart::chart

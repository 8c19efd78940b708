#pragma once

/// @file projected_object.hpp
/// @brief Deep-sky object mapped onto one chart, with its label text.

#include "catalog/deepsky_object.hpp"
#include "chart/field_of_view.hpp"
#include "core/types.hpp"

#include <string>

namespace skychart::chart
{
    /// @brief Per-pass projection of a DeepSkyObject. Discarded after the pass.
    struct ProjectedObject
    {
        const catalog::DeepSkyObject* object = nullptr;
        Vec2d position{0.0};            ///< Map position (mm)
        f64 rlong_mm = 0.0;             ///< Drawn long semi-axis (mm)
        f64 rshort_mm = 0.0;            ///< Drawn short semi-axis (mm)
        f64 position_angle = 0.0;       ///< Orientation on the map (radians)
        f64 seed_radius_mm = 0.0;       ///< Footprint in the repulsion field (mm)
        std::string label;
        f64 label_width = 0.0;          ///< mm, 0 when unlabelled
    };

    /// @brief Label text: "M <n>" for Messier objects, otherwise the names
    ///        joined with '-' (sorted and without prefix for NGC, prefixed by
    ///        the catalog code otherwise).
    ///
    /// Non-Messier objects fainter than @p label_limit get an empty label.
    [[nodiscard]] std::string deepsky_label(const catalog::DeepSkyObject& object, f64 label_limit);

    /// @brief Project @p object; the label and its width are left to the caller.
    ///
    /// Sizes below @p min_radius are scaled up to it (keeping the axis ratio);
    /// galaxy clusters are seeded at @p min_radius and drawn at a third of their
    /// long axis.
    [[nodiscard]] ProjectedObject project_deepsky_object(const catalog::DeepSkyObject& object,
                                                         const FieldOfView& fov,
                                                         f64 min_radius);

} // namespace skychart::chart

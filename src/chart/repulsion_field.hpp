#pragma once

/// @file repulsion_field.hpp
/// @brief Scalar crowdedness field used to rank label positions.

#include "core/types.hpp"

#include <cstddef>
#include <limits>
#include <vector>

namespace skychart::chart
{
    /// @brief A symbol already on the map: position and radius (mm).
    struct FieldSeed
    {
        Vec2d position{0.0};
        f64 radius_mm = 0.0;
    };

    /// @brief Sum of bell-shaped repulsion sources over the map.
    ///
    /// Each source contributes s² / (d² + s²), where d is the distance to the
    /// source and s its size (never below kMinSizeFraction of the field
    /// radius). A source therefore contributes 1 at its own position and
    /// decays towards 0 far away. Sources are only ever added; one field lives
    /// for exactly one render pass.
    class RepulsionField
    {
    public:
        /// Smallest source size as a fraction of the field radius.
        static constexpr f64 kMinSizeFraction = 0.002;

        /// Marker for potential() queries that exclude nothing.
        static constexpr std::size_t kNoSource = std::numeric_limits<std::size_t>::max();

        /// @brief Seed one source per drawn symbol; source i corresponds to seeds[i].
        RepulsionField(f64 field_radius_mm, const std::vector<FieldSeed>& seeds);

        /// @brief Potential at @p point (>= 0).
        [[nodiscard]] f64 potential(Vec2d point) const;

        /// @brief Potential at @p point ignoring source @p excluded_source.
        [[nodiscard]] f64 potential(Vec2d point, std::size_t excluded_source) const;

        /// @brief Record a committed label centred at @p centre spanning @p length_mm.
        void add_position(Vec2d centre, f64 length_mm);

        [[nodiscard]] std::size_t source_count() const { return m_sources.size(); }
        [[nodiscard]] f64 min_size() const { return m_min_size; }

    private:
        struct Source
        {
            Vec2d position;
            f64 size_sq;
        };

        void add_source(Vec2d position, f64 size);

        f64 m_min_size;
        std::vector<Source> m_sources;
    };

} // namespace skychart::chart

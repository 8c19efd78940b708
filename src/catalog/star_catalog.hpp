#pragma once

/// @file star_catalog.hpp
/// @brief In-memory field star catalog with a grid index over (RA, Dec).

#include "astro/projection.hpp"
#include "catalog/star_entry.hpp"
#include "core/types.hpp"

#include <unordered_map>
#include <utility>
#include <vector>

namespace skychart::catalog
{
    /// @brief Field stars indexed by 1°×1° cells for cone searches.
    class StarCatalog
    {
    public:
        /// Resolution of the spatial grid (degrees per cell)
        static constexpr f64 kGridResolutionDeg = 1.0;

        StarCatalog() = default;
        explicit StarCatalog(std::vector<StarEntry> stars);

        /// @brief Add a star to the catalog.
        void add_star(StarEntry star);

        /// @brief Retrieve all stars within a circular field of view.
        /// @param centre Field centre.
        /// @param radius_rad Search radius (radians).
        /// @param limiting_magnitude Faintest magnitude to return.
        /// @return Matching stars, brightest first.
        [[nodiscard]] std::vector<const StarEntry*> select(const astro::EquatorialCoord& centre,
                                                           f64 radius_rad,
                                                           f64 limiting_magnitude) const;

        [[nodiscard]] std::size_t size() const { return m_stars.size(); }

        [[nodiscard]] const std::vector<StarEntry>& stars() const { return m_stars; }

    private:
        using CellKey = u32;

        [[nodiscard]] static CellKey cell_key(i32 ra_cell, i32 dec_cell)
        {
            return (static_cast<u32>(ra_cell & 0xFFFF) << 16) | static_cast<u32>(dec_cell & 0xFFFF);
        }

        [[nodiscard]] static std::pair<i32, i32> cell_for_position(f64 ra, f64 dec);

        std::vector<StarEntry> m_stars;
        std::unordered_map<CellKey, std::vector<std::size_t>> m_grid;
    };

} // namespace skychart::catalog

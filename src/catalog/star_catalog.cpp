/// @file star_catalog.cpp
/// @brief Grid-indexed cone search over field stars.

#include "catalog/star_catalog.hpp"

#include <algorithm>
#include <cmath>

namespace skychart::catalog
{

namespace
{

constexpr i32 kRaCells  = static_cast<i32>(360.0 / StarCatalog::kGridResolutionDeg);
constexpr i32 kDecCells = static_cast<i32>(180.0 / StarCatalog::kGridResolutionDeg);

} // anonymous namespace

StarCatalog::StarCatalog(std::vector<StarEntry> stars)
{
    m_stars.reserve(stars.size());
    for (auto& star : stars)
    {
        add_star(std::move(star));
    }
}

void StarCatalog::add_star(StarEntry star)
{
    const std::size_t index = m_stars.size();
    m_stars.push_back(std::move(star));

    const auto [ra_cell, dec_cell] = cell_for_position(m_stars.back().ra, m_stars.back().dec);
    m_grid[cell_key(ra_cell, dec_cell)].push_back(index);
}

// -----------------------------------------------------------------
// Cone search: visit every cell overlapping the bounding box of the
// field, then filter by exact angular distance and magnitude.
// -----------------------------------------------------------------

std::vector<const StarEntry*> StarCatalog::select(const astro::EquatorialCoord& centre,
                                                  f64 radius_rad,
                                                  f64 limiting_magnitude) const
{
    std::vector<const StarEntry*> result;

    const f64 radius_deg = radius_rad * astro_constants::kRadToDeg;
    const i32 dec_span = static_cast<i32>(std::ceil(radius_deg / kGridResolutionDeg)) + 1;

    // RA cells shrink towards the poles; widen the RA span accordingly.
    const f64 cos_dec = std::cos(std::min(std::abs(centre.dec) + radius_rad, astro_constants::kHalfPi));
    i32 ra_span = kRaCells / 2;
    if (cos_dec > 1e-6)
    {
        ra_span = std::min(ra_span, static_cast<i32>(std::ceil(radius_deg / cos_dec / kGridResolutionDeg)) + 1);
    }

    const auto [centre_ra, centre_dec] = cell_for_position(centre.ra, centre.dec);

    for (i32 ddec = -dec_span; ddec <= dec_span; ++ddec)
    {
        const i32 dec_cell = centre_dec + ddec;
        if (dec_cell < 0 || dec_cell >= kDecCells)
        {
            continue;
        }

        for (i32 dra = -ra_span; dra <= ra_span; ++dra)
        {
            // Wrap RA around 360 degrees
            const i32 ra_cell = ((centre_ra + dra) % kRaCells + kRaCells) % kRaCells;

            const auto it = m_grid.find(cell_key(ra_cell, dec_cell));
            if (it == m_grid.end())
            {
                continue;
            }

            for (const std::size_t index : it->second)
            {
                const StarEntry& star = m_stars[index];
                if (star.mag_v > limiting_magnitude)
                {
                    continue;
                }
                if (astro::Projection::angular_distance({star.ra, star.dec}, centre) <= radius_rad)
                {
                    result.push_back(&star);
                }
            }
        }
    }

    // Wide RA spans near the poles can visit a cell twice.
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());

    // Sort brightest first
    std::stable_sort(result.begin(), result.end(),
                     [](const StarEntry* a, const StarEntry* b) {
                         return a->mag_v < b->mag_v;
                     });
    return result;
}

std::pair<i32, i32> StarCatalog::cell_for_position(f64 ra, f64 dec)
{
    const f64 ra_deg  = astro::Projection::normalize_radians(ra) * astro_constants::kRadToDeg;
    const f64 dec_deg = dec * astro_constants::kRadToDeg;

    const i32 ra_cell  = std::clamp(static_cast<i32>(std::floor(ra_deg / kGridResolutionDeg)), 0, kRaCells - 1);
    const i32 dec_cell = std::clamp(static_cast<i32>(std::floor((dec_deg + 90.0) / kGridResolutionDeg)),
                                    0, kDecCells - 1);
    return {ra_cell, dec_cell};
}

} // namespace skychart::catalog

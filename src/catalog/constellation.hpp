#pragma once

/// @file constellation.hpp
/// @brief Constellation figures and the bright stars they connect.

#include "catalog/star_entry.hpp"
#include "core/types.hpp"

#include <string>
#include <utility>
#include <vector>

namespace skychart::catalog
{
    /// @brief A constellation figure: line segments between bright stars.
    ///
    /// Each segment is a pair of 1-based indices into
    /// ConstellationCatalog::bright_stars.
    struct Constellation
    {
        std::string abbreviation;
        std::vector<std::pair<u32, u32>> lines;
    };

    struct ConstellationCatalog
    {
        std::vector<StarEntry> bright_stars;
        std::vector<Constellation> constellations;

        /// @brief Resolve a 1-based line index, or nullptr when out of range.
        [[nodiscard]] const StarEntry* star_for_index(u32 index) const
        {
            if (index == 0 || index > bright_stars.size())
            {
                return nullptr;
            }
            return &bright_stars[index - 1];
        }
    };

} // namespace skychart::catalog

#pragma once

/// @file star_entry.hpp
/// @brief Runtime star data structure for catalog entries.

#include "core/types.hpp"

#include <string>

namespace skychart::catalog
{
    /// @brief Runtime representation of a single star from the catalog.
    ///
    /// Coordinates are stored in radians (J2000 epoch). Constellation bright
    /// stars additionally carry their Bayer designation.
    struct StarEntry
    {
        f64 ra;             ///< Right ascension (radians, 0..2π)
        f64 dec;            ///< Declination (radians, -π/2..+π/2)
        f32 mag_v;          ///< Visual magnitude (V-band)
        f32 color_bv = 0.0f;        ///< B-V color index
        u32 catalog_id = 0;         ///< Source catalog ID (e.g., HIP number, or line index)
        std::string greek;          ///< Bayer abbreviation ("alp", "bet", ...), empty if none
        std::string constellation;  ///< Constellation abbreviation, empty if unknown
    };

} // namespace skychart::catalog

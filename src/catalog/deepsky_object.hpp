#pragma once

/// @file deepsky_object.hpp
/// @brief Deep-sky catalog record and object type classification.

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace skychart::catalog
{
    /// @brief Object class, which selects the chart symbol.
    enum class DsoType : u8
    {
        Galaxy,
        DiffuseNebula,
        PlanetaryNebula,
        OpenCluster,
        GlobularCluster,
        SupernovaRemnant,
        Asterism,
        GalaxyCluster,
        Unknown,
    };

    /// @brief Immutable deep-sky catalog record.
    ///
    /// Angular sizes are semi-axes in radians with rlong >= rshort >= 0.
    /// The position angle is measured from north through east.
    struct DeepSkyObject
    {
        f64 ra;                         ///< Right ascension (radians)
        f64 dec;                        ///< Declination (radians)
        DsoType type = DsoType::Unknown;
        f64 rlong = 0.0;                ///< Semi-major axis (radians)
        f64 rshort = 0.0;               ///< Semi-minor axis (radians)
        f64 position_angle = 0.0;       ///< Position angle (radians)
        f32 mag = 0.0f;                 ///< Visual magnitude
        u32 messier = 0;                ///< Messier number, 0 when not a Messier object
        std::string cat;                ///< Catalog code ("NGC", "IC", "Sh2", ...)
        std::vector<std::string> names; ///< Designations within the catalog
    };

    /// @brief Map a catalog type code to a DsoType.
    ///
    /// Accepted codes: G, N, PN, OC/OCL, GC/GCL, SNR, AST/STARS, GALCL.
    /// Any other code maps to DsoType::Unknown.
    [[nodiscard]] DsoType parse_dso_type(std::string_view code);

} // namespace skychart::catalog

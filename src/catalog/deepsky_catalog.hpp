#pragma once

/// @file deepsky_catalog.hpp
/// @brief In-memory deep-sky catalog with cone selection.

#include "astro/projection.hpp"
#include "catalog/deepsky_object.hpp"
#include "core/types.hpp"

#include <vector>

namespace skychart::catalog
{
    class DeepskyCatalog
    {
    public:
        DeepskyCatalog() = default;
        explicit DeepskyCatalog(std::vector<DeepSkyObject> objects);

        /// @brief Objects whose centre lies within @p radius_rad of @p centre.
        /// @return Matches in catalog order.
        [[nodiscard]] std::vector<const DeepSkyObject*> select(const astro::EquatorialCoord& centre,
                                                               f64 radius_rad) const;

        [[nodiscard]] std::size_t size() const { return m_objects.size(); }

        [[nodiscard]] const std::vector<DeepSkyObject>& objects() const { return m_objects; }

    private:
        std::vector<DeepSkyObject> m_objects;
    };

} // namespace skychart::catalog
